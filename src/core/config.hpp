#pragma once

#include <string>
#include <filesystem>
#include "types.hpp"

namespace fs = std::filesystem;

class Config {
public:
    // Overlay the YAML file at `path` on top of `base`.
    static Result<Config> load_file(const fs::path& path, const Config& base = Config());

    // Load global config from ~/.devbox/config.yaml, then ./devbox.yaml.
    // Missing files are skipped; a malformed file is an error.
    static Result<Config> load(const fs::path& project_dir = fs::current_path(),
                               const fs::path& global_path = get_global_config_path());

    // Accessors
    const SessionDefaults& defaults() const { return defaults_; }
    const LaunchSettings& launch() const { return launch_; }

    static fs::path get_global_config_path();

public:
    Config() = default;

private:
    SessionDefaults defaults_;
    LaunchSettings launch_;
};

// Helper to check if the project config exists
bool project_config_exists(const fs::path& dir = fs::current_path());

// Get paths
fs::path get_global_config_dir();
fs::path get_project_config_path(const fs::path& dir = fs::current_path());
