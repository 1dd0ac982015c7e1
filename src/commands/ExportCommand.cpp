#include "commands/ExportCommand.h"

#include <utility>

#include "app/SketchApplication.h"
#include "app/View.h"
#include "controller/Controller.h"

ExportCommand::ExportCommand(std::filesystem::path path) : m_path(std::move(path)) {}

void ExportCommand::execute(SketchApplication &app)
{
    if (!app.view().exportDrawing(app.model(), m_path))
    {
        app.controller().messageStack().insert({"Error exporting drawing: " + m_path.string()});
    }
}
