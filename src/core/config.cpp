#include "config.hpp"
#include "constants.hpp"
#include "utils.hpp"
#include <platform/platform.hpp>
#include <yaml-cpp/yaml.h>

namespace fs = std::filesystem;

// Blank scalars leave the current value in place, so a half-written
// config never produces an empty session field.
static void overlay_string(const YAML::Node& node, const char* key, std::string& out) {
    if (!node[key] || !node[key].IsScalar()) return;
    std::string value = node[key].as<std::string>("");
    if (is_blank(value)) return;
    out = value;
}

static void parse_session_defaults(const YAML::Node& node, SessionDefaults& defaults) {
    overlay_string(node, "container", defaults.container_name);
    overlay_string(node, "image", defaults.image_name);
    overlay_string(node, "mount", defaults.mount_path);
}

static void parse_launch_settings(const YAML::Node& node, LaunchSettings& launch) {
    overlay_string(node, "runtime", launch.runtime);
    overlay_string(node, "workspace", launch.workspace);
    overlay_string(node, "env_file", launch.env_file);
    overlay_string(node, "shell", launch.shell);
    overlay_string(node, "gpus", launch.gpus);

    if (node["tick_ms"] && node["tick_ms"].IsScalar()) {
        int tick = safe_stoi(node["tick_ms"].as<std::string>(""), launch.tick_ms);
        launch.tick_ms = tick < MIN_MONITOR_TICK_MS ? MIN_MONITOR_TICK_MS : tick;
    }
}

bool project_config_exists(const fs::path& dir) {
    return fs::exists(get_project_config_path(dir));
}

fs::path get_global_config_dir() {
    return platform::home_dir() / GLOBAL_CONFIG_DIR;
}

fs::path Config::get_global_config_path() {
    return get_global_config_dir() / GLOBAL_CONFIG_FILE;
}

fs::path get_project_config_path(const fs::path& dir) {
    return dir / PROJECT_CONFIG_FILE;
}

Result<Config> Config::load_file(const fs::path& path, const Config& base) {
    if (!fs::exists(path)) {
        return Result<Config>::Err("Config not found at " + path.string());
    }

    try {
        YAML::Node root = YAML::LoadFile(path.string());

        Config config = base;
        if (root.IsNull()) {
            return Result<Config>::Ok(config);
        }
        if (!root.IsMap()) {
            return Result<Config>::Err("Failed to parse " + path.string() +
                                       ": top level must be a mapping");
        }

        parse_session_defaults(root, config.defaults_);
        parse_launch_settings(root, config.launch_);

        return Result<Config>::Ok(config);
    } catch (const std::exception& e) {
        return Result<Config>::Err("Failed to parse " + path.string() + ": " + e.what());
    }
}

Result<Config> Config::load(const fs::path& project_dir, const fs::path& global_path) {
    Config config;

    if (fs::exists(global_path)) {
        auto global_result = load_file(global_path, config);
        if (global_result.is_err()) {
            return global_result;
        }
        config = global_result.value;
    }

    // Project values win over global ones
    if (project_config_exists(project_dir)) {
        auto project_result = load_file(get_project_config_path(project_dir), config);
        if (project_result.is_err()) {
            return project_result;
        }
        config = project_result.value;
    }

    return Result<Config>::Ok(config);
}
