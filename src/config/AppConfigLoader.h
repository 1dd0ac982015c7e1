#pragma once

#include <filesystem>
#include <string>
#include <vector>

#include "config/AppConfig.h"

struct AppConfigLoadError
{
    std::string file;
    std::string message;
};

struct AppConfigLoadResult
{
    AppConfig config;
    bool success = false;
    std::vector<AppConfigLoadError> errors;
};

// Loads app.json and input.json from a config directory. Anything missing or
// invalid keeps its default and is reported in the result's error list.
class AppConfigLoader
{
  public:
    explicit AppConfigLoader(std::filesystem::path configRoot);

    AppConfigLoadResult load() const;

  private:
    std::filesystem::path m_configRoot;
};
