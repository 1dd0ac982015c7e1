#pragma once

#include <filesystem>
#include <string>

class Model;

struct SaveLoadResult
{
    bool success = false;
    std::string error;
};

// Populates a Model in place from a saved drawing. The Model is cleared before
// entities are added; a failure part way through leaves it partially populated.
class SaveFileLoader
{
  public:
    static constexpr int kSchemaVersion = 1;

    virtual ~SaveFileLoader() = default;

    virtual SaveLoadResult load(Model &model, const std::filesystem::path &path) const;
};
