#pragma once

#include <memory>
#include <vector>

class SketchApplication;

// Deferred work queued during input handling and executed once, in order, after
// the frame has been rendered.
class Command
{
  public:
    virtual ~Command() = default;

    virtual void execute(SketchApplication &app) = 0;
};

using CommandQueue = std::vector<std::unique_ptr<Command>>;
