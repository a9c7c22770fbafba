#include "docker_runtime.hpp"
#include <core/utils.hpp>
#include <managers/devbox_log.hpp>
#include <platform/process.hpp>
#include <fmt/format.h>
#include <sstream>

DockerRuntime::DockerRuntime(std::string binary)
    : binary_(std::move(binary)) {}

CommandResult DockerRuntime::exec(const std::string& label,
                                  const std::vector<std::string>& args) {
    auto result = platform::run_command(binary_, args);
    devbox_log_cmd(label, platform::format_command(binary_, args), result);
    return result;
}

ProbeResult DockerRuntime::probe(const std::string& name) {
    ProbeResult probe;
    probe.command = exec("probe", docker_probe_args(name));
    if (probe.ok()) {
        probe.status = parse_container_state(probe.command.stdout_data);
    }
    return probe;
}

CommandResult DockerRuntime::create(const CreateRequest& request) {
    return exec("create", docker_run_args(request));
}

CommandResult DockerRuntime::start(const std::string& name) {
    return exec("start", {"start", name});
}

CommandResult DockerRuntime::stop(const std::string& name) {
    return exec("stop", {"stop", name});
}

CommandResult DockerRuntime::remove(const std::string& name) {
    return exec("remove", {"rm", name});
}

std::string DockerRuntime::attach_command(const std::string& name,
                                          const std::string& shell) const {
    return platform::format_command(binary_, {"exec", "-it", name, shell});
}

std::string DockerRuntime::remove_command(const std::string& name) const {
    return platform::format_command(binary_, {"rm", name});
}

// ── Argument builders ────────────────────────────────────────

std::string anchored_name_filter(const std::string& name) {
    static const std::string kMeta = R"(\.+*?()|[]{}^$)";
    std::string escaped;
    escaped.reserve(name.size() + 4);
    for (char c : name) {
        if (kMeta.find(c) != std::string::npos) escaped += '\\';
        escaped += c;
    }
    return "^/" + escaped + "$";
}

std::vector<std::string> docker_probe_args(const std::string& name) {
    return {"ps", "-a",
            "--filter", "name=" + anchored_name_filter(name),
            "--format", "{{.State}}"};
}

std::vector<std::string> docker_run_args(const CreateRequest& request) {
    std::vector<std::string> args = {"run", "--gpus", request.gpus, "-d"};
    if (request.env_file) {
        args.push_back("--env-file");
        args.push_back(*request.env_file);
    }
    args.push_back("-v");
    args.push_back(fmt::format("{}:{}", request.mount_path, request.workspace));
    args.push_back("--name");
    args.push_back(request.name);
    args.push_back("-it");
    args.push_back(request.image);
    args.push_back(request.shell);
    return args;
}

ContainerStatus parse_container_state(const std::string& output) {
    std::istringstream in(output);
    std::string line;
    while (std::getline(in, line)) {
        trim(line);
        if (line.empty()) continue;

        // `ps` without -a lists these three; treat them all as live
        if (line == "running" || line == "paused" || line == "restarting") {
            return ContainerStatus::kRunning;
        }
        return ContainerStatus::kStopped;
    }
    return ContainerStatus::kAbsent;
}
