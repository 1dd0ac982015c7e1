#pragma once

#include <filesystem>

#include "app/ScreenDimensions.h"

class Controller;
class Model;

// Renders the Model and the Controller's overlay state, one frame per update().
class View
{
  public:
    virtual ~View() = default;

    virtual ScreenDimensions screenDimensions() const = 0;
    virtual void update(const Model &model, const Controller &controller) = 0;

    // Releases display resources. Safe to call more than once.
    virtual void exit() = 0;

    virtual bool exportDrawing(const Model &model, const std::filesystem::path &path) = 0;
};
