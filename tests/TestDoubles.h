#pragma once

#include "app/SketchApplication.h"
#include "app/View.h"
#include "commands/Command.h"
#include "controller/Controller.h"
#include "model/Model.h"
#include "telemetry/TelemetrySink.h"

#include <algorithm>
#include <cstddef>
#include <filesystem>
#include <functional>
#include <iostream>
#include <memory>
#include <mutex>
#include <string>
#include <utility>
#include <vector>

// Ordered record of calls across doubles; survives the doubles being moved into
// the application.
struct CallLog
{
    std::vector<std::string> entries;

    std::size_t count(const std::string &entry) const
    {
        return static_cast<std::size_t>(std::count(entries.begin(), entries.end(), entry));
    }
};

class FakeView : public View
{
  public:
    explicit FakeView(std::shared_ptr<CallLog> log) : m_log(std::move(log)) {}

    ScreenDimensions screenDimensions() const override { return ScreenDimensions{1280, 720}; }

    void update(const Model &model, const Controller &) override
    {
        lastEntityCount = model.entityCount();
        m_log->entries.push_back("view.update");
    }

    void exit() override
    {
        ++exitCalls;
        m_log->entries.push_back("view.exit");
    }

    bool exportDrawing(const Model &, const std::filesystem::path &path) override
    {
        exportedPaths.push_back(path);
        return exportSucceeds;
    }

    int exitCalls = 0;
    std::size_t lastEntityCount = 0;
    bool exportSucceeds = true;
    std::vector<std::filesystem::path> exportedPaths;

  private:
    std::shared_ptr<CallLog> m_log;
};

// Runs |script| once per frame; the frame index starts at 0. The loop continues
// while the script returns true.
class ScriptedController : public Controller
{
  public:
    using Script = std::function<bool(int frame, Model &model, CommandQueue &commands)>;

    ScriptedController(std::shared_ptr<CallLog> log, Script script)
        : m_log(std::move(log)), m_script(std::move(script))
    {
    }

    bool handleInput(Model &model, ScreenDimensions, CommandQueue &commands) override
    {
        m_log->entries.push_back("controller.input");
        loadingSeenAtInput.push_back(loading());
        queueEmptyAtInput.push_back(commands.empty());
        return m_script ? m_script(m_frame++, model, commands) : false;
    }

    std::vector<bool> loadingSeenAtInput;
    std::vector<bool> queueEmptyAtInput;

  private:
    std::shared_ptr<CallLog> m_log;
    Script m_script;
    int m_frame = 0;
};

// Stops after |frames| frames.
inline ScriptedController::Script stopAfterFrames(int frames)
{
    return [frames](int frame, Model &, CommandQueue &) { return frame + 1 < frames; };
}

class RecordingCommand : public Command
{
  public:
    RecordingCommand(std::shared_ptr<CallLog> log, std::string name, std::function<void(SketchApplication &)> action = {})
        : m_log(std::move(log)), m_name(std::move(name)), m_action(std::move(action))
    {
    }

    void execute(SketchApplication &app) override
    {
        m_log->entries.push_back(m_name);
        if (m_action)
        {
            m_action(app);
        }
    }

  private:
    std::shared_ptr<CallLog> m_log;
    std::string m_name;
    std::function<void(SketchApplication &)> m_action;
};

// Thread-safe: the background updater records from its own thread.
class RecordingTelemetrySink : public TelemetrySink
{
  public:
    void recordEvent(std::string_view eventName, const Payload &payload) override
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_events.emplace_back(std::string(eventName), payload);
    }

    std::vector<std::string> names() const
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        std::vector<std::string> result;
        for (const auto &event : m_events)
        {
            result.push_back(event.first);
        }
        return result;
    }

    // Position of the first event named |name|, or -1.
    int indexOf(const std::string &name) const
    {
        const auto all = names();
        const auto it = std::find(all.begin(), all.end(), name);
        return it == all.end() ? -1 : static_cast<int>(it - all.begin());
    }

    std::size_t count(const std::string &name) const
    {
        const auto all = names();
        return static_cast<std::size_t>(std::count(all.begin(), all.end(), name));
    }

    Payload payloadOf(const std::string &name) const
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        for (const auto &event : m_events)
        {
            if (event.first == name)
            {
                return event.second;
            }
        }
        return {};
    }

  private:
    mutable std::mutex m_mutex;
    std::vector<std::pair<std::string, Payload>> m_events;
};

inline bool assertTrue(bool condition, const char *message)
{
    if (!condition)
    {
        std::cerr << message << '\n';
        return false;
    }
    return true;
}

// Builds an application over fakes with pacing sleeps disabled.
struct AppHarness
{
    std::shared_ptr<CallLog> log = std::make_shared<CallLog>();
    std::shared_ptr<RecordingTelemetrySink> telemetry = std::make_shared<RecordingTelemetrySink>();
    FakeView *view = nullptr;
    ScriptedController *controller = nullptr;
    std::vector<double> sleeps;
    std::unique_ptr<SketchApplication> app;

    AppHarness(const AppHarness &) = delete;
    AppHarness &operator=(const AppHarness &) = delete;

    explicit AppHarness(ScriptedController::Script script, const std::string &loadFilename = std::string())
    {
        auto fakeView = std::make_unique<FakeView>(log);
        auto fakeController = std::make_unique<ScriptedController>(log, std::move(script));
        view = fakeView.get();
        controller = fakeController.get();
        app = std::make_unique<SketchApplication>(std::move(fakeView), std::move(fakeController), loadFilename);
        app->setTelemetrySink(telemetry);
        app->framePacer().setSleeper([this](double seconds) { sleeps.push_back(seconds); });
    }
};
