#pragma once

#include "mr/ai/capability_requirement.hpp"
#include "mr/ai/model_registry.hpp"

#include <filesystem>
#include <string>

namespace mr::ai
{
struct Config
{
    // Model catalog JSON; when the file does not exist the built-in catalog
    // is used.
    std::filesystem::path models_file;
    std::filesystem::path preferences_file;
    DefaultConflictPolicy default_conflict = DefaultConflictPolicy::Repair;
    // Requirement the command line tool starts from.
    CapabilityRequirement selection;
};

class ConfigLoader
{
public:
    static std::filesystem::path default_config_path();
    static std::filesystem::path default_data_directory();
    // A missing file yields the defaults. Throws ValidationError naming the
    // file, line and key for a value that does not parse; unknown keys are
    // ignored.
    static Config load_from_file(const std::filesystem::path &path);
    static Config load_or_default();
    static bool save(const Config &config, const std::filesystem::path &path,
                     std::string *error_message = nullptr);
};
} // namespace mr::ai
