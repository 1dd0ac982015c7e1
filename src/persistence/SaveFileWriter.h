#pragma once

#include <filesystem>
#include <string>

class Model;

struct SaveWriteResult
{
    bool success = false;
    std::string error;
};

class SaveFileWriter
{
  public:
    SaveWriteResult write(const Model &model, const std::filesystem::path &path) const;

    static std::string serialize(const Model &model);
};

// save<N+1>.sav, where N is the number of .sav files already in |directory|.
std::filesystem::path nextSaveFilename(const std::filesystem::path &directory);
