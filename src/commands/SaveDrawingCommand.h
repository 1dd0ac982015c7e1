#pragma once

#include <filesystem>

#include "commands/Command.h"

class SaveDrawingCommand : public Command
{
  public:
    explicit SaveDrawingCommand(std::filesystem::path path);

    void execute(SketchApplication &app) override;

    const std::filesystem::path &path() const { return m_path; }

  private:
    std::filesystem::path m_path;
};
