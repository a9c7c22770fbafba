#pragma once

#include <string>
#include <functional>
#include <utility>
#include "constants.hpp"

// Result type for operations that can fail
template <typename T>
struct Result {
    bool success;
    T value;
    std::string error;

    static Result<T> Ok(T val) {
        return {true, std::move(val), ""};
    }

    static Result<T> Err(const std::string& err) {
        return {false, T{}, err};
    }

    bool is_ok() const { return success; }
    bool is_err() const { return !success; }
};

// Specialization for void
template <>
struct Result<void> {
    bool success;
    std::string error;

    static Result<void> Ok() {
        return {true, ""};
    }

    static Result<void> Err(const std::string& err) {
        return {false, err};
    }

    bool is_ok() const { return success; }
    bool is_err() const { return !success; }
};

// Runtime client command result
struct CommandResult {
    int exit_code;
    std::string stdout_data;
    std::string stderr_data;

    bool success() const { return exit_code == 0; }
    bool failed() const { return exit_code != 0; }

    std::string get_output() const {
        return stdout_data.empty() ? stderr_data : stdout_data;
    }

    // Error text as the runtime printed it, falling back to stdout.
    std::string error_text() const {
        return stderr_data.empty() ? stdout_data : stderr_data;
    }
};

// Observed state of the named container. Never cached past one probe.
enum class ContainerStatus {
    kAbsent,
    kStopped,
    kRunning,
};

// The three operator-resolved fields. Immutable once resolved.
struct SessionConfig {
    std::string container_name;
    std::string image_name;
    std::string mount_path;
};

// Defaults the resolver falls back to on blank input.
struct SessionDefaults {
    std::string container_name = DEFAULT_CONTAINER_NAME;
    std::string image_name = DEFAULT_IMAGE_NAME;
    std::string mount_path = DEFAULT_MOUNT_DIR;
};

// Fixed launch parameters that the operator is not prompted for.
struct LaunchSettings {
    std::string runtime = DEFAULT_RUNTIME;      // runtime client binary
    std::string workspace = DEFAULT_WORKSPACE;  // in-container mount target
    std::string env_file = DEFAULT_ENV_FILE;    // looked up in the working directory
    std::string shell = DEFAULT_SHELL;          // initial process of a new container
    std::string gpus = DEFAULT_GPUS;            // value for --gpus
    int tick_ms = MONITOR_TICK_MS;              // session monitor wait tick
};

// Status callback for operations
using StatusCallback = std::function<void(const std::string&)>;
