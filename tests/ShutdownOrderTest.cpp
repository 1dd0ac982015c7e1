#include "TestDoubles.h"

#include "background/BackgroundSignal.h"

#include <iostream>
#include <string>
#include <vector>

namespace
{

bool shutdownRunsViewExitThenNotifyThenJoin()
{
    bool success = true;
    AppHarness harness([](int frame, Model &model, CommandQueue &) {
        model.addLine(LineType::ExteriorWall, Point{0, 0}, Point{frame * 6 + 6, 0});
        return frame + 1 < 4;
    });
    const auto signal = harness.app->model().backgroundSignal();
    success &= assertTrue(harness.app->run(), "Run must succeed");

    const RecordingTelemetrySink &events = *harness.telemetry;
    const int started = events.indexOf("app.run.started");
    const int viewExit = events.indexOf("app.view.exit");
    const int notify = events.indexOf("app.background.notify");
    const int exited = events.indexOf("background.updater.exited");
    const int joined = events.indexOf("app.background.joined");
    const int finished = events.indexOf("app.run.finished");

    success &= assertTrue(started >= 0 && viewExit >= 0 && notify >= 0 && exited >= 0 && joined >= 0 && finished >= 0,
                          "All lifecycle events must be recorded");
    success &= assertTrue(started < viewExit, "Run must start before the view exits");
    success &= assertTrue(viewExit < notify, "View must exit before the background thread is notified");
    success &= assertTrue(notify < exited, "Background thread must exit only after the notification");
    success &= assertTrue(exited < joined, "Join must complete after the background thread exits");
    success &= assertTrue(joined < finished, "Run must finish after the join");

    success &= assertTrue(harness.view->exitCalls == 1, "View must be exited exactly once");
    success &= assertTrue(harness.log->entries.back() == "view.exit", "View exit must follow the last frame");
    success &= assertTrue(signal->shutdownRequested(), "Shutdown must be latched on the model's signal");
    success &= assertTrue(signal->waiterCount() == 0, "No thread may still wait on the signal");
    success &= assertTrue(signal->notificationCount() >= 4, "Every model mutation must notify the signal");
    success &= assertTrue(harness.app->model().lines().size() == 4, "Lines added during frames must be kept");
    return success;
}

bool destroyingAnUnrunApplicationIsClean()
{
    AppHarness harness(stopAfterFrames(1));
    harness.app.reset();
    return assertTrue(harness.telemetry->names().empty(), "An application that never ran must not record lifecycle events");
}

} // namespace

int main()
{
    bool success = true;
    success &= shutdownRunsViewExitThenNotifyThenJoin();
    success &= destroyingAnUnrunApplicationIsClean();
    if (!success)
    {
        std::cerr << "ShutdownOrderTest failed\n";
        return 1;
    }
    return 0;
}
