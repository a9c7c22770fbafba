#include "launch_planner.hpp"
#include "devbox_log.hpp"
#include <fmt/format.h>

const char* to_string(LaunchAction action) {
    switch (action) {
        case LaunchAction::kAttach:           return "attach";
        case LaunchAction::kRestart:          return "restart";
        case LaunchAction::kCreateWithEnv:    return "create-with-env";
        case LaunchAction::kCreateWithoutEnv: return "create-without-env";
    }
    return "unknown";
}

LaunchAction plan_launch(bool exists, bool running, bool env_file_present) {
    if (running) return LaunchAction::kAttach;
    if (exists) return LaunchAction::kRestart;
    return env_file_present ? LaunchAction::kCreateWithEnv
                            : LaunchAction::kCreateWithoutEnv;
}

LaunchPlanner::LaunchPlanner(const SessionConfig& session,
                             const LaunchSettings& settings,
                             ContainerRuntime& runtime)
    : session_(session), settings_(settings), runtime_(runtime) {}

ProbeResult LaunchPlanner::probe() {
    auto result = runtime_.probe(session_.container_name);
    if (result.ok()) {
        devbox_log(fmt::format("probe {}: exists={} running={}",
                               session_.container_name,
                               result.exists(), result.running()));
    } else {
        devbox_log(fmt::format("probe {} failed (exit {})",
                               session_.container_name, result.command.exit_code));
    }
    return result;
}

bool LaunchPlanner::env_file_present(const fs::path& dir) const {
    std::error_code ec;
    return fs::is_regular_file(dir / settings_.env_file, ec);
}

CreateRequest LaunchPlanner::create_request(bool with_env_file) const {
    CreateRequest req;
    req.name = session_.container_name;
    req.image = session_.image_name;
    req.mount_path = session_.mount_path;
    req.workspace = settings_.workspace;
    req.gpus = settings_.gpus.empty() ? DEFAULT_GPUS : settings_.gpus;
    req.shell = settings_.shell;
    if (with_env_file) {
        req.env_file = settings_.env_file;
    }
    return req;
}

LaunchOutcome LaunchPlanner::launch(const ProbeResult& probe, bool env_file_present,
                                    StatusCallback cb) {
    auto notify = [&](const std::string& msg) {
        if (cb) cb(msg);
    };

    LaunchOutcome outcome{plan_launch(probe.exists(), probe.running(), env_file_present),
                          CommandResult{0, "", ""}};
    devbox_log(fmt::format("launch {}: {}", session_.container_name,
                           to_string(outcome.action)));

    switch (outcome.action) {
        case LaunchAction::kAttach:
            notify("Container " + session_.container_name + " is already running. Attaching.");
            break;

        case LaunchAction::kRestart:
            // Image, mount and env file were fixed when the container was created
            notify("Found stopped container " + session_.container_name + ". Starting it.");
            outcome.command = runtime_.start(session_.container_name);
            break;

        case LaunchAction::kCreateWithEnv:
            notify("Creating a new container in detached mode.");
            notify("Found " + settings_.env_file + ", loading it as environment.");
            outcome.command = runtime_.create(create_request(true));
            break;

        case LaunchAction::kCreateWithoutEnv:
            notify("Creating a new container in detached mode.");
            notify("No " + settings_.env_file + " found, starting without extra environment.");
            outcome.command = runtime_.create(create_request(false));
            break;
    }

    return outcome;
}
