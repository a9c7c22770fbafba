#include "devbox_cli.hpp"
#include "theme.hpp"
#include <core/utils.hpp>
#include <managers/devbox_log.hpp>
#include <managers/launch_planner.hpp>
#include <managers/shutdown_handler.hpp>
#include <platform/interrupt.hpp>
#include <fmt/format.h>

// A failed runtime call ends the process with the runtime's own code.
static int fatal_exit_code(const CommandResult& r) {
    return r.exit_code > 0 ? r.exit_code : 1;
}

DevboxCLI::DevboxCLI(const Config& config, ContainerRuntime& runtime,
                     LineReader reader, std::ostream& out)
    : config_(config), runtime_(runtime), reader_(std::move(reader)), out_(out),
      work_dir_(std::filesystem::current_path()),
      stop_(platform::interrupt_requested) {}

int DevboxCLI::run_session() {
    out_ << theme::banner();
    devbox_log(fmt::format("session start {}", now_iso()));

    // Configuration
    out_ << theme::section("Configuration");
    out_.flush();
    const SessionConfig session = resolve_session_config(reader_, config_.defaults());
    out_ << "\n";
    out_ << theme::kv("container", session.container_name);
    out_ << theme::kv("image", session.image_name);
    out_ << theme::kv("mount", session.mount_path + " -> " + config_.launch().workspace);
    devbox_log(fmt::format("session: container={} image={} mount={}",
                           session.container_name, session.image_name,
                           session.mount_path));

    // Probe
    out_ << theme::section("Container");
    LaunchPlanner planner(session, config_.launch(), runtime_);
    auto probe = planner.probe();
    if (!probe.ok()) {
        out_ << theme::fail("Could not query the container runtime:")
             << theme::verbatim(probe.command.error_text());
        out_.flush();
        return fatal_exit_code(probe.command);
    }

    // Launch
    auto status = [this](const std::string& msg) {
        out_ << theme::step(msg);
        out_.flush();
    };
    bool env_present = planner.env_file_present(work_dir_);
    auto outcome = planner.launch(probe, env_present, status);
    if (!outcome.ok()) {
        out_ << theme::fail(fmt::format("Runtime {} failed:", to_string(outcome.action)))
             << theme::verbatim(outcome.command.error_text());
        out_.flush();
        return fatal_exit_code(outcome.command);
    }
    if (!outcome.command.stdout_data.empty()) {
        std::string printed = outcome.command.stdout_data;
        trim(printed);
        out_ << theme::log(printed);
    }

    // Wait for Ctrl+C
    if (install_handler_) {
        platform::install_interrupt_handler();
    }
    SessionMonitor monitor(session, config_.launch(), runtime_, out_);
    monitor.print_guidance();
    monitor.wait(stop_);

    // Teardown
    ShutdownHandler teardown(session, runtime_, reader_, out_);
    int code = teardown.run();
    devbox_log(fmt::format("session end, exit {}", code));
    return code;
}
