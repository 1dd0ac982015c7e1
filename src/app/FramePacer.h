#pragma once

#include <functional>

#include "config/AppConfig.h"

// Coarse frame throttle: a frame shorter than the threshold is followed by a fixed
// sleep. There is no drift compensation and no sleep debt carried across frames.
class FramePacer
{
  public:
    using Sleeper = std::function<void(double seconds)>;

    FramePacer();
    explicit FramePacer(FramePacingConfig config);

    void setConfig(const FramePacingConfig &config);
    const FramePacingConfig &config() const { return m_config; }

    // Replaces the real sleep, e.g. to observe pacing without waiting.
    void setSleeper(Sleeper sleeper);

    double sleepDurationFor(double frameSeconds) const;

    // Sleeps as required for a frame of |frameSeconds| and returns the sleep requested.
    double pace(double frameSeconds);

  private:
    FramePacingConfig m_config;
    Sleeper m_sleeper;
};
