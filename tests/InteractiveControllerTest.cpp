#include "controller/InteractiveController.h"

#include "commands/ExportCommand.h"
#include "commands/LoadDrawingCommand.h"
#include "commands/SaveDrawingCommand.h"
#include "input/InputMapper.h"
#include "model/Model.h"

#include <cmath>
#include <iostream>
#include <string>

namespace
{

bool assertTrue(bool condition, const char *message)
{
    if (!condition)
    {
        std::cerr << message << '\n';
        return false;
    }
    return true;
}

ActionEvent press(ActionId id)
{
    ActionEvent event;
    event.id = id;
    event.pressed = true;
    return event;
}

ActionEvent click(int x, int y)
{
    ActionEvent event = press(ActionId::PlacePoint);
    event.pointer = PointerPayload{x, y};
    return event;
}

ActionBuffer::Frame frameWith(std::initializer_list<ActionEvent> events)
{
    ActionBuffer::Frame frame;
    frame.events.assign(events.begin(), events.end());
    return frame;
}

ActionEvent pan(bool pressed, int x, int y)
{
    ActionEvent event;
    event.id = ActionId::Pan;
    event.pressed = pressed;
    event.released = !pressed;
    event.pointer = PointerPayload{x, y};
    return event;
}

ActionBuffer::Frame pointerAt(int x, int y)
{
    ActionBuffer::Frame frame;
    frame.pointer.hasPosition = true;
    frame.pointer.x = x;
    frame.pointer.y = y;
    return frame;
}

const ScreenDimensions kScreen{1280, 720};

bool bindingNamesAreValidated()
{
    bool success = true;
    success &= assertTrue(InputMapper::isValidBinding("Ctrl+Q"), "Ctrl+Q must be a valid binding");
    success &= assertTrue(InputMapper::isValidBinding("Keypad 0"), "Keypad keys must be valid bindings");
    success &= assertTrue(InputMapper::isValidBinding("Escape"), "Escape must be a valid binding");
    success &= assertTrue(InputMapper::isValidBinding("MouseLeft"), "Mouse buttons must be valid bindings");
    success &= assertTrue(!InputMapper::isValidBinding("Ctrl+NoSuchKey"), "Unknown keys must be rejected");
    success &= assertTrue(!InputMapper::isValidBinding("Hyper+Q"), "Unknown modifiers must be rejected");
    success &= assertTrue(!InputMapper::isValidBinding(""), "Empty bindings must be rejected");
    success &= assertTrue(InputMapper::isValidBinding("MouseMiddle"), "The middle button must be a valid binding");
    success &= assertTrue(InputMapper::isValidBinding("Ctrl + R"), "Spaces around modifiers must be accepted");
    return success;
}

bool placesSnappedWalls()
{
    bool success = true;
    InteractiveController controller{AppConfig{}};
    Model model;
    CommandQueue commands;

    success &= assertTrue(controller.snap(Point{8, 14}) == (Point{6, 12}), "Points must snap to the six inch grid");

    controller.processFrame(frameWith({press(ActionId::DrawExteriorWall)}), model, kScreen, commands, 0);
    success &= assertTrue(controller.placementType() == LineType::ExteriorWall, "Exterior wall placement must begin");
    success &= assertTrue(!controller.centerText().top.empty(), "Placement must show a hint");

    controller.processFrame(frameWith({click(1, 2)}), model, kScreen, commands, 0);
    success &= assertTrue(model.lines().empty(), "The first click only sets the start point");
    success &= assertTrue(controller.placementPreview().has_value(), "A started placement must have a preview");

    controller.processFrame(frameWith({click(121, 4)}), model, kScreen, commands, 0);
    success &= assertTrue(model.lines().size() == 1, "The second click must add the wall");
    if (!model.lines().empty())
    {
        const Line &wall = model.lines().front();
        success &= assertTrue(wall.start == (Point{0, 0}) && wall.end == (Point{120, 6}), "Wall endpoints must be snapped");
        success &= assertTrue(wall.type == LineType::ExteriorWall, "Wall must have the chosen type");
    }

    controller.processFrame(frameWith({press(ActionId::CancelPlacement)}), model, kScreen, commands, 0);
    success &= assertTrue(!controller.placementType().has_value(), "Cancel must leave placement mode");
    success &= assertTrue(!controller.placementPreview().has_value(), "Cancel must drop the preview");
    success &= assertTrue(commands.empty(), "Placement must not queue commands");
    return success;
}

bool measurementShowsFeetAndInches()
{
    bool success = true;
    InteractiveController controller{AppConfig{}};
    Model model;
    CommandQueue commands;

    controller.processFrame(frameWith({press(ActionId::Measure), click(0, 0)}), model, kScreen, commands, 0);
    controller.processFrame(frameWith({click(0, 18)}), model, kScreen, commands, 0);
    success &= assertTrue(model.lines().size() == 1 && model.lines()[0].type == LineType::Measurement,
                          "Measurement must add a measurement line");
    success &= assertTrue(controller.centerText().bottom == "1 ft 6 in", "Measurement must be shown in feet and inches");
    return success;
}

bool saveAndExportAreThrottled()
{
    bool success = true;
    AppConfig config;
    config.saves.directory = "drawings";
    config.saves.exportFile = "plan.png";
    InteractiveController controller{config};
    Model model;
    CommandQueue commands;

    controller.processFrame(frameWith({press(ActionId::SaveDrawing)}), model, kScreen, commands, 10000);
    controller.processFrame(frameWith({press(ActionId::SaveDrawing)}), model, kScreen, commands, 10500);
    success &= assertTrue(commands.size() == 1, "A second save within one second must be ignored");
    controller.processFrame(frameWith({press(ActionId::SaveDrawing)}), model, kScreen, commands, 11000);
    success &= assertTrue(commands.size() == 2, "A save after one second must be queued");
    success &= assertTrue(dynamic_cast<SaveDrawingCommand *>(commands.back().get()) != nullptr, "Save must queue a save command");
    commands.clear();

    controller.processFrame(frameWith({press(ActionId::ExportDrawing)}), model, kScreen, commands, 20000);
    success &= assertTrue(commands.size() == 1, "Export must queue a command");
    const auto *exportCommand = dynamic_cast<ExportCommand *>(commands.front().get());
    success &= assertTrue(exportCommand != nullptr, "Export must queue an export command");
    const std::string expectedPath = (std::filesystem::path("drawings") / "plan.png").string();
    success &= assertTrue(controller.messageStack().latest() == "Exported drawing: " + expectedPath,
                          "Export must announce the output path");
    success &= assertTrue(controller.loading(), "Export must set the loading flag");

    controller.processFrame(frameWith({press(ActionId::ExportDrawing)}), model, kScreen, commands, 24999);
    success &= assertTrue(commands.size() == 1, "A second export within five seconds must be ignored");
    controller.processFrame(frameWith({press(ActionId::ExportDrawing)}), model, kScreen, commands, 25000);
    success &= assertTrue(commands.size() == 2, "An export after five seconds must be queued");
    return success;
}

bool dropsAndQuit()
{
    bool success = true;
    InteractiveController controller{AppConfig{}};
    Model model;
    CommandQueue commands;

    ActionBuffer::Frame drop;
    drop.droppedFiles = {"a.sav", "b.sav"};
    success &= assertTrue(controller.processFrame(drop, model, kScreen, commands, 0), "Dropping files must not quit");
    success &= assertTrue(commands.size() == 2, "Each dropped file must queue a load");
    const auto *load = dynamic_cast<LoadDrawingCommand *>(commands.front().get());
    success &= assertTrue(load && load->filename() == "a.sav", "Loads must keep drop order");

    const bool toggledFrom = controller.displayGrid();
    controller.processFrame(frameWith({press(ActionId::ToggleGrid)}), model, kScreen, commands, 0);
    success &= assertTrue(controller.displayGrid() != toggledFrom, "Toggle must flip the grid");

    success &= assertTrue(!controller.processFrame(frameWith({press(ActionId::Quit)}), model, kScreen, commands, 0),
                          "Quit binding must stop the loop");
    ActionBuffer::Frame closed;
    closed.quitRequested = true;
    success &= assertTrue(!controller.processFrame(closed, model, kScreen, commands, 0), "Window close must stop the loop");
    return success;
}

bool cameraPansAndZooms()
{
    bool success = true;
    InteractiveController controller{AppConfig{}};
    Model model;
    CommandQueue commands;

    ActionBuffer::Frame grab = pointerAt(100, 100);
    grab.events.push_back(pan(true, 100, 100));
    controller.processFrame(grab, model, kScreen, commands, 0);
    controller.processFrame(pointerAt(40, 70), model, kScreen, commands, 0);
    success &= assertTrue(controller.camera().x == 60.0 && controller.camera().y == 30.0,
                          "Dragging must move the camera by the pointer travel");

    ActionBuffer::Frame drop = pointerAt(40, 70);
    drop.events.push_back(pan(false, 40, 70));
    controller.processFrame(drop, model, kScreen, commands, 0);
    controller.processFrame(pointerAt(0, 0), model, kScreen, commands, 0);
    success &= assertTrue(controller.camera().x == 60.0, "Releasing the pan button must stop panning");

    controller.processFrame(frameWith({press(ActionId::DrawExteriorWall)}), model, kScreen, commands, 0);
    controller.processFrame(frameWith({click(0, 0)}), model, kScreen, commands, 0);
    controller.processFrame(frameWith({click(120, 0)}), model, kScreen, commands, 0);
    success &= assertTrue(!model.lines().empty() && model.lines()[0].start == (Point{60, 30}),
                          "Clicks must land in drawing coordinates under the camera");
    controller.processFrame(frameWith({press(ActionId::CancelPlacement)}), model, kScreen, commands, 0);

    ActionBuffer::Frame wheel = pointerAt(200, 100);
    wheel.wheel = 2;
    const Point before = controller.camera().toWorld(200, 100);
    controller.processFrame(wheel, model, kScreen, commands, 0);
    success &= assertTrue(std::abs(controller.camera().scale - 1.1) < 1e-9, "Each wheel notch must change the zoom by 0.05");
    success &= assertTrue(controller.camera().toWorld(200, 100) == before, "Zoom must keep the point under the pointer");

    ActionBuffer::Frame zoomOut = pointerAt(200, 100);
    zoomOut.wheel = -100;
    controller.processFrame(zoomOut, model, kScreen, commands, 0);
    success &= assertTrue(controller.camera().scale >= Camera::kMinScale, "Zoom must not drop below the minimum scale");

    controller.processFrame(frameWith({press(ActionId::ResetCamera)}), model, kScreen, commands, 0);
    success &= assertTrue(controller.camera().x == 0.0 && controller.camera().y == 0.0 && controller.camera().scale == 1.0,
                          "Reset must restore the default camera");
    return success;
}

bool placesTypedText()
{
    bool success = true;
    InteractiveController controller{AppConfig{}};
    Model model;
    CommandQueue commands;

    controller.processFrame(frameWith({press(ActionId::DrawExteriorWall)}), model, kScreen, commands, 0);
    controller.processFrame(frameWith({press(ActionId::AddText)}), model, kScreen, commands, 0);
    success &= assertTrue(controller.textEntry().has_value(), "Add text must start text entry");
    success &= assertTrue(!controller.placementType().has_value(), "Text entry must end line placement");

    ActionBuffer::Frame typed = pointerAt(31, 29);
    typed.text = "Kitchenn";
    controller.processFrame(typed, model, kScreen, commands, 0);
    controller.processFrame(frameWith({press(ActionId::EraseText), press(ActionId::DrawInteriorWall)}), model, kScreen,
                            commands, 0);
    success &= assertTrue(controller.textEntry() && *controller.textEntry() == "Kitchen", "Erase must drop the last character");
    success &= assertTrue(!controller.placementType().has_value(), "Drawing hotkeys must be ignored while typing");
    success &= assertTrue(controller.centerText().bottom == "Kitchen", "Typed text must be shown");

    controller.processFrame(frameWith({press(ActionId::ConfirmText)}), model, kScreen, commands, 0);
    success &= assertTrue(model.userText().size() == 1, "Confirm must add the text");
    if (!model.userText().empty())
    {
        success &= assertTrue(model.userText()[0].text == "Kitchen", "Text content must be kept");
        success &= assertTrue(model.userText()[0].position == (Point{30, 30}), "Text must sit at the snapped cursor");
    }
    success &= assertTrue(!controller.textEntry().has_value(), "Confirm must end text entry");

    controller.processFrame(frameWith({press(ActionId::AddText)}), model, kScreen, commands, 0);
    controller.processFrame(frameWith({press(ActionId::ConfirmText)}), model, kScreen, commands, 0);
    success &= assertTrue(model.userText().size() == 1, "Empty text must not be added");

    controller.processFrame(frameWith({press(ActionId::AddText)}), model, kScreen, commands, 0);
    ActionBuffer::Frame abandoned;
    abandoned.text = "Bath";
    abandoned.events.push_back(press(ActionId::CancelPlacement));
    controller.processFrame(abandoned, model, kScreen, commands, 0);
    success &= assertTrue(!controller.textEntry().has_value() && model.userText().size() == 1,
                          "Cancel must discard typed text");
    success &= assertTrue(commands.empty(), "Text entry must not queue commands");
    return success;
}

} // namespace

int main()
{
    bool success = true;
    success &= bindingNamesAreValidated();
    success &= placesSnappedWalls();
    success &= measurementShowsFeetAndInches();
    success &= saveAndExportAreThrottled();
    success &= dropsAndQuit();
    success &= cameraPansAndZooms();
    success &= placesTypedText();
    if (!success)
    {
        std::cerr << "InteractiveControllerTest failed\n";
        return 1;
    }
    return 0;
}
