#pragma once

#include <atomic>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <string>
#include <thread>

#include <SDL.h>

#include "app/FramePacer.h"
#include "app/FramePerf.h"
#include "commands/Command.h"
#include "config/AppConfig.h"
#include "telemetry/PerformanceBudgetMonitor.h"

class BackgroundSignal;
class Controller;
class Model;
class SaveFileLoader;
class TelemetrySink;
class View;

// Drives the sketching session: poll input, render, run queued commands, pace,
// until the controller or requestQuit() stops it. A background thread waits on
// the Model's BackgroundSignal for the lifetime of run().
class SketchApplication
{
  public:
    enum class LoopState
    {
        Idle,
        Starting,
        Running,
        Stopping,
        Stopped
    };

    SketchApplication(std::unique_ptr<View> view,
                      std::unique_ptr<Controller> controller,
                      const std::string &loadFilename = std::string());
    ~SketchApplication();

    SketchApplication(const SketchApplication &) = delete;
    SketchApplication &operator=(const SketchApplication &) = delete;

    // Runs the frame loop to completion. Returns false only when called again
    // on an application that has already run.
    bool run();

    // Stops the loop after the current frame. Never restarts it.
    void requestQuit();

    void executeCommands();

    // On failure the Model is replaced by an empty one.
    bool loadFromFile(const std::string &filename);

    Model &model() { return *m_model; }
    const Model &model() const { return *m_model; }
    View &view() { return *m_view; }
    Controller &controller() { return *m_controller; }
    const Controller &controller() const { return *m_controller; }

    LoopState state() const { return m_state.load(std::memory_order_acquire); }
    bool isRunning() const { return m_running.load(std::memory_order_acquire); }
    std::size_t pendingCommandCount() const { return m_commands.size(); }
    const FramePerf &framePerf() const { return m_framePerf; }

    void setTelemetrySink(std::shared_ptr<TelemetrySink> sink);
    // Replaces the loader used by loadFromFile(). Null is ignored.
    void setSaveFileLoader(std::unique_ptr<SaveFileLoader> loader);
    void setFramePacing(const FramePacingConfig &config);
    FramePacer &framePacer() { return m_framePacer; }
    void setPerformanceBudget(const PerformanceBudgetConfig &budget);

  private:
    bool keepRunning() const;
    void runFrame();
    void startBackgroundThread();
    void stopBackgroundThread();
    void resetModel();
    void publishFrameTimings(const telemetry::StageTimingSample &sample, Uint64 frameStart, Uint64 frameEnd, double slept);
    double millisecondsBetween(Uint64 from, Uint64 to) const;

    std::unique_ptr<Model> m_model;
    std::unique_ptr<SaveFileLoader> m_loader;
    std::unique_ptr<View> m_view;
    std::unique_ptr<Controller> m_controller;
    CommandQueue m_commands;

    std::atomic<bool> m_running{false};
    std::atomic<bool> m_quitRequested{false};
    std::atomic<LoopState> m_state{LoopState::Idle};

    std::thread m_backgroundThread;
    std::shared_ptr<BackgroundSignal> m_backgroundSignal;
    std::shared_ptr<TelemetrySink> m_telemetry;

    FramePacer m_framePacer;
    telemetry::PerformanceBudgetMonitor m_budgetMonitor;
    FramePerf m_framePerf;
    double m_frequency = 1.0;
    Uint64 m_fpsWindowStart = 0;
    std::uint64_t m_fpsWindowFrames = 0;
    Uint64 m_lastBudgetWarning = 0;
};
