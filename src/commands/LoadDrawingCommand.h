#pragma once

#include <string>

#include "commands/Command.h"

// Replaces the drawing with a saved file, e.g. one dropped onto the window.
class LoadDrawingCommand : public Command
{
  public:
    explicit LoadDrawingCommand(std::string filename);

    void execute(SketchApplication &app) override;

    const std::string &filename() const { return m_filename; }

  private:
    std::string m_filename;
};
