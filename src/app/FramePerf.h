#pragma once

#include <cstdint>
#include <string>

struct FramePerf
{
    float fps = 0.0f;
    float msInput = 0.0f;
    float msRender = 0.0f;
    float msCommands = 0.0f;
    float msFrame = 0.0f;
    float msSlept = 0.0f;
    std::uint64_t frames = 0;
    bool budgetExceeded = false;
    std::string budgetStage;
    float budgetSampleMs = 0.0f;
    float budgetTargetMs = 0.0f;
};
