#include "commands/LoadDrawingCommand.h"

#include <utility>

#include "app/SketchApplication.h"

LoadDrawingCommand::LoadDrawingCommand(std::string filename) : m_filename(std::move(filename)) {}

void LoadDrawingCommand::execute(SketchApplication &app)
{
    app.loadFromFile(m_filename);
}
