#include "commands/SaveDrawingCommand.h"

#include <iostream>
#include <utility>

#include "app/SketchApplication.h"
#include "controller/Controller.h"
#include "persistence/SaveFileWriter.h"
#include "services/ServiceLocator.h"
#include "telemetry/TelemetrySink.h"

SaveDrawingCommand::SaveDrawingCommand(std::filesystem::path path) : m_path(std::move(path)) {}

void SaveDrawingCommand::execute(SketchApplication &app)
{
    const SaveWriteResult result = SaveFileWriter().write(app.model(), m_path);
    const std::string filename = m_path.string();
    if (result.success)
    {
        app.controller().messageStack().insert({"Saved drawing: " + filename});
        recordTelemetry(ServiceLocator::instance().telemetrySink(), "app.save.succeeded",
                        TelemetrySink::Payload{{"file", filename}});
        return;
    }

    app.controller().messageStack().insert({"Error saving drawing: " + filename});
    std::cerr << "[save] " << filename << ": " << result.error << '\n';
    recordTelemetry(ServiceLocator::instance().telemetrySink(), "app.save.failed",
                    TelemetrySink::Payload{{"file", filename}, {"reason", result.error}});
}
