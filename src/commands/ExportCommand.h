#pragma once

#include <filesystem>

#include "commands/Command.h"

// Renders the current drawing to a PNG through the View.
class ExportCommand : public Command
{
  public:
    explicit ExportCommand(std::filesystem::path path);

    void execute(SketchApplication &app) override;

    const std::filesystem::path &path() const { return m_path; }

  private:
    std::filesystem::path m_path;
};
