#pragma once

#include <cstddef>
#include <cstdint>
#include <string>

struct WindowConfig
{
    std::string title = "FloorSketch";
    int width = 1920;
    int height = 1080;
    int minWidth = 1280;
    int minHeight = 720;
};

struct FontConfig
{
    std::string uiPath = "assets/fonts/cour.ttf";
    int smallSize = 18;
    int largeSize = 24;
};

struct FramePacingConfig
{
    double thresholdSeconds = 0.016;
    double sleepSeconds = 0.008;
};

struct PerformanceBudgetConfig
{
    float inputMs = 4.0f;
    float renderMs = 10.0f;
    float commandMs = 4.0f;
    float toleranceMs = 1.0f;
};

struct TelemetryConfig
{
    std::string directory = "logs";
    std::uintmax_t rotationBytes = 4ull * 1024ull * 1024ull;
    std::size_t retentionFiles = 5;
    bool console = false;
};

struct SaveConfig
{
    std::string directory = ".";
    std::string exportFile = "export.png";
};

struct MessageConfig
{
    std::uint32_t durationMs = 5000;
};

struct InputBindings
{
    std::string quit = "Ctrl+Q";
    std::string save = "Ctrl+S";
    std::string exportDrawing = "Ctrl+E";
    std::string drawExteriorWall = "Keypad 0";
    std::string drawInteriorWall = "Keypad 1";
    std::string measure = "Ctrl+M";
    std::string cancel = "Escape";
    std::string toggleGrid = "Ctrl+G";
    std::string placePoint = "MouseLeft";
    std::string addText = "Ctrl+T";
    std::string confirmText = "Return";
    std::string eraseText = "Backspace";
    std::string resetCamera = "Ctrl+R";
    std::string pan = "MouseMiddle";
    int snapInterval = 6;
    int bufferFrames = 2;
    float bufferExpiryMs = 100.0f;
};

struct AppConfig
{
    WindowConfig window;
    FontConfig fonts;
    FramePacingConfig framePacing;
    PerformanceBudgetConfig performance;
    TelemetryConfig telemetry;
    SaveConfig saves;
    MessageConfig messages;
    InputBindings input;
};
