#include "app/SketchApplication.h"

#include <exception>
#include <functional>
#include <iostream>
#include <string>
#include <utility>

#include "app/View.h"
#include "background/BackgroundSignal.h"
#include "background/BackgroundUpdater.h"
#include "controller/Controller.h"
#include "model/Model.h"
#include "persistence/SaveFileLoader.h"
#include "services/ServiceLocator.h"
#include "telemetry/TelemetrySink.h"

namespace
{
constexpr double kBudgetWarningIntervalSeconds = 1.0;
constexpr double kFpsWindowSeconds = 1.0;
} // namespace

SketchApplication::SketchApplication(std::unique_ptr<View> view,
                                     std::unique_ptr<Controller> controller,
                                     const std::string &loadFilename)
    : m_model(std::make_unique<Model>()),
      m_loader(std::make_unique<SaveFileLoader>()),
      m_view(std::move(view)),
      m_controller(std::move(controller)),
      m_telemetry(ServiceLocator::instance().telemetrySink())
{
    const Uint64 frequency = SDL_GetPerformanceFrequency();
    m_frequency = frequency > 0 ? static_cast<double>(frequency) : 1.0;

    if (!loadFilename.empty())
    {
        loadFromFile(loadFilename);
    }
}

SketchApplication::~SketchApplication()
{
    m_running.store(false, std::memory_order_release);
    if (m_backgroundThread.joinable())
    {
        if (m_backgroundSignal)
        {
            m_backgroundSignal->notifyShutdown();
        }
        m_backgroundThread.join();
    }
}

void SketchApplication::setTelemetrySink(std::shared_ptr<TelemetrySink> sink)
{
    m_telemetry = sink ? std::move(sink) : ServiceLocator::instance().telemetrySink();
}

void SketchApplication::setSaveFileLoader(std::unique_ptr<SaveFileLoader> loader)
{
    if (loader)
    {
        m_loader = std::move(loader);
    }
}

void SketchApplication::setFramePacing(const FramePacingConfig &config)
{
    m_framePacer.setConfig(config);
}

void SketchApplication::setPerformanceBudget(const PerformanceBudgetConfig &budget)
{
    m_budgetMonitor.setBudget(budget);
}

void SketchApplication::requestQuit()
{
    m_quitRequested.store(true, std::memory_order_release);
    m_running.store(false, std::memory_order_release);
}

bool SketchApplication::run()
{
    LoopState expected = LoopState::Idle;
    if (!m_state.compare_exchange_strong(expected, LoopState::Starting, std::memory_order_acq_rel))
    {
        std::cerr << "[app] run() ignored: the application loop has already run\n";
        return false;
    }

    // requestQuit() may land at any point from here on; the loop re-checks the
    // latch every frame so a quit is never overwritten.
    m_running.store(true, std::memory_order_release);
    startBackgroundThread();
    recordTelemetry(m_telemetry, "app.run.started");
    m_state.store(LoopState::Running, std::memory_order_release);

    m_fpsWindowStart = SDL_GetPerformanceCounter();
    m_fpsWindowFrames = 0;
    while (keepRunning())
    {
        runFrame();
    }
    m_running.store(false, std::memory_order_release);

    m_state.store(LoopState::Stopping, std::memory_order_release);
    m_view->exit();
    recordTelemetry(m_telemetry, "app.view.exit");
    stopBackgroundThread();
    m_state.store(LoopState::Stopped, std::memory_order_release);

    recordTelemetry(m_telemetry, "app.run.finished",
                    TelemetrySink::Payload{{"frames", std::to_string(m_framePerf.frames)}});
    return true;
}

bool SketchApplication::keepRunning() const
{
    return m_running.load(std::memory_order_acquire) && !m_quitRequested.load(std::memory_order_acquire);
}

void SketchApplication::runFrame()
{
    const Uint64 frameStart = SDL_GetPerformanceCounter();

    const ScreenDimensions screen = m_view->screenDimensions();
    if (!m_controller->handleInput(*m_model, screen, m_commands))
    {
        m_running.store(false, std::memory_order_release);
    }
    const Uint64 afterInput = SDL_GetPerformanceCounter();

    m_view->update(*m_model, *m_controller);
    const Uint64 afterRender = SDL_GetPerformanceCounter();

    executeCommands();
    const Uint64 frameEnd = SDL_GetPerformanceCounter();

    telemetry::StageTimingSample sample;
    sample.inputMs = millisecondsBetween(frameStart, afterInput);
    sample.renderMs = millisecondsBetween(afterInput, afterRender);
    sample.commandMs = millisecondsBetween(afterRender, frameEnd);

    const double slept = m_framePacer.pace(millisecondsBetween(frameStart, frameEnd) / 1000.0);
    publishFrameTimings(sample, frameStart, frameEnd, slept);
}

void SketchApplication::executeCommands()
{
    for (const auto &command : m_commands)
    {
        if (command)
        {
            command->execute(*this);
        }
    }
    m_commands.clear();
    m_controller->setLoading(false);
}

bool SketchApplication::loadFromFile(const std::string &filename)
{
    SaveLoadResult result;
    try
    {
        result = m_loader->load(*m_model, filename);
    }
    catch (const std::exception &ex)
    {
        result.success = false;
        result.error = ex.what();
    }
    catch (...)
    {
        result.success = false;
        result.error = "unknown error";
    }

    if (result.success)
    {
        m_controller->messageStack().insert({"Loaded from save file: " + filename});
        recordTelemetry(m_telemetry, "app.load.succeeded",
                        TelemetrySink::Payload{{"file", filename}, {"entities", std::to_string(m_model->entityCount())}});
        return true;
    }

    m_controller->messageStack().insert({"Error loading save file: " + filename});
    std::cerr << "[load] " << filename << ": " << result.error << '\n';
    recordTelemetry(m_telemetry, "app.load.failed", TelemetrySink::Payload{{"file", filename}, {"reason", result.error}});
    resetModel();
    return false;
}

void SketchApplication::resetModel()
{
    std::shared_ptr<BackgroundSignal> signal = m_model->backgroundSignal();
    m_model = std::make_unique<Model>();
    m_model->bindBackgroundSignal(std::move(signal));
}

void SketchApplication::startBackgroundThread()
{
    m_backgroundSignal = m_model->backgroundSignal();
    m_backgroundThread = std::thread(runBackgroundUpdates, std::cref(m_running), m_backgroundSignal, m_telemetry);
}

void SketchApplication::stopBackgroundThread()
{
    if (m_backgroundSignal)
    {
        recordTelemetry(m_telemetry, "app.background.notify");
        m_backgroundSignal->notifyShutdown();
    }
    // No timeout: a stalled background update blocks shutdown here.
    if (m_backgroundThread.joinable())
    {
        m_backgroundThread.join();
        recordTelemetry(m_telemetry, "app.background.joined");
    }
}

void SketchApplication::publishFrameTimings(const telemetry::StageTimingSample &sample,
                                            Uint64 frameStart,
                                            Uint64 frameEnd,
                                            double slept)
{
    ++m_framePerf.frames;
    ++m_fpsWindowFrames;
    m_framePerf.msInput = static_cast<float>(sample.inputMs);
    m_framePerf.msRender = static_cast<float>(sample.renderMs);
    m_framePerf.msCommands = static_cast<float>(sample.commandMs);
    m_framePerf.msFrame = static_cast<float>(millisecondsBetween(frameStart, frameEnd));
    m_framePerf.msSlept = static_cast<float>(slept * 1000.0);

    const double windowSeconds = millisecondsBetween(m_fpsWindowStart, frameEnd) / 1000.0;
    if (windowSeconds >= kFpsWindowSeconds)
    {
        m_framePerf.fps = static_cast<float>(static_cast<double>(m_fpsWindowFrames) / windowSeconds);
        m_fpsWindowStart = frameEnd;
        m_fpsWindowFrames = 0;
    }

    const auto violation = m_budgetMonitor.evaluate(sample);
    m_framePerf.budgetExceeded = violation.has_value();
    if (violation)
    {
        m_framePerf.budgetStage = violation->stage;
        m_framePerf.budgetSampleMs = static_cast<float>(violation->sampleMs);
        m_framePerf.budgetTargetMs = static_cast<float>(violation->budgetMs);

        const bool firstWarning = m_lastBudgetWarning == 0;
        if (firstWarning || millisecondsBetween(m_lastBudgetWarning, frameEnd) / 1000.0 >= kBudgetWarningIntervalSeconds)
        {
            m_lastBudgetWarning = frameEnd;
            recordTelemetry(m_telemetry, "frame.budget_exceeded",
                            TelemetrySink::Payload{{"stage", violation->stage},
                                                   {"sample_ms", std::to_string(violation->sampleMs)},
                                                   {"budget_ms", std::to_string(violation->budgetMs)}});
        }
    }
    else
    {
        m_framePerf.budgetStage.clear();
        m_framePerf.budgetSampleMs = 0.0f;
        m_framePerf.budgetTargetMs = 0.0f;
    }

    m_controller->setFramePerf(m_framePerf);
}

double SketchApplication::millisecondsBetween(Uint64 from, Uint64 to) const
{
    if (to <= from)
    {
        return 0.0;
    }
    return static_cast<double>(to - from) * 1000.0 / m_frequency;
}
