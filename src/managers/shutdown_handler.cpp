#include "shutdown_handler.hpp"
#include "devbox_log.hpp"
#include <cli/theme.hpp>

bool is_removal_confirmed(const std::optional<std::string>& answer) {
    return answer && (*answer == "y" || *answer == "Y");
}

ShutdownHandler::ShutdownHandler(const SessionConfig& session,
                                 ContainerRuntime& runtime,
                                 ConfirmReader confirm,
                                 std::ostream& out)
    : session_(session), runtime_(runtime), confirm_(std::move(confirm)), out_(out) {}

void ShutdownHandler::print_manual_removal() const {
    out_ << theme::info("Container " + session_.container_name + " was not removed.");
    out_ << theme::step("Remove it later with: " + runtime_.remove_command(session_.container_name));
}

int ShutdownHandler::run() {
    if (terminating_) {
        devbox_log("shutdown: already terminating, ignoring");
        return 0;
    }
    terminating_ = true;

    const std::string& name = session_.container_name;
    out_ << "\n" << theme::section("Shutting down");
    out_ << theme::step("Stopping container " + name + "...");
    out_.flush();

    auto stop = runtime_.stop(name);
    if (stop.failed()) {
        out_ << theme::fail("Failed to stop " + name + ":") << theme::verbatim(stop.error_text());
        print_manual_removal();
        out_.flush();
        devbox_log("shutdown: stop failed, removal skipped");
        return 0;
    }
    out_ << theme::ok("Container stopped.");
    out_.flush();

    std::optional<std::string> answer;
    if (confirm_) answer = confirm_("    Remove the container? (y/n): ");
    devbox_log(fmt::format("shutdown: removal answer '{}'", answer.value_or("<eof>")));

    if (!is_removal_confirmed(answer)) {
        print_manual_removal();
        out_.flush();
        return 0;
    }

    out_ << theme::step("Removing container " + name + "...");
    out_.flush();
    auto rm = runtime_.remove(name);
    if (rm.failed()) {
        out_ << theme::fail("Failed to remove " + name + ":") << theme::verbatim(rm.error_text());
    } else {
        out_ << theme::ok("Container removed.");
    }
    out_.flush();
    return 0;
}
