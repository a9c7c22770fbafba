#include "session_monitor.hpp"
#include "devbox_log.hpp"
#include <cli/theme.hpp>
#include <platform/platform.hpp>

SessionMonitor::SessionMonitor(const SessionConfig& session,
                               const LaunchSettings& settings,
                               const ContainerRuntime& runtime,
                               std::ostream& out)
    : session_(session), settings_(settings), runtime_(runtime), out_(out) {}

void SessionMonitor::print_guidance() const {
    out_ << theme::section("Session");
    out_ << theme::ok("Container " + session_.container_name + " is running in detached mode.");
    out_ << theme::info("Open a shell inside it from another terminal:");
    out_ << "      " << theme::blue(runtime_.attach_command(session_.container_name,
                                                            settings_.shell))
         << "\n\n";
    out_ << theme::dim("    Detach from an attached shell with Ctrl+P, Ctrl+Q.") << "\n";
    out_ << theme::dim("    Press Ctrl+C here to stop the container.") << "\n";
    out_.flush();
}

long SessionMonitor::wait(const StopPredicate& stop_requested) {
    devbox_log("monitor: waiting for interrupt");
    long ticks = 0;
    while (!stop_requested()) {
        platform::sleep_ms(settings_.tick_ms);
        ++ticks;
    }
    devbox_log(fmt::format("monitor: interrupted after {} ticks", ticks));
    return ticks;
}
