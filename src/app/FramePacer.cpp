#include "app/FramePacer.h"

#include <SDL.h>

#include <cmath>
#include <utility>

namespace
{
void sdlSleep(double seconds)
{
    const double ms = std::round(seconds * 1000.0);
    if (ms > 0.0)
    {
        SDL_Delay(static_cast<Uint32>(ms));
    }
}
} // namespace

FramePacer::FramePacer() : FramePacer(FramePacingConfig{}) {}

FramePacer::FramePacer(FramePacingConfig config) : m_config(config), m_sleeper(sdlSleep) {}

void FramePacer::setConfig(const FramePacingConfig &config)
{
    m_config = config;
}

void FramePacer::setSleeper(Sleeper sleeper)
{
    m_sleeper = sleeper ? std::move(sleeper) : Sleeper(sdlSleep);
}

double FramePacer::sleepDurationFor(double frameSeconds) const
{
    if (frameSeconds < m_config.thresholdSeconds)
    {
        return m_config.sleepSeconds;
    }
    return 0.0;
}

double FramePacer::pace(double frameSeconds)
{
    const double seconds = sleepDurationFor(frameSeconds);
    if (seconds > 0.0)
    {
        m_sleeper(seconds);
    }
    return seconds;
}
