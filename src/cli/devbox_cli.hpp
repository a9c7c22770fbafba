#pragma once

#include <string>
#include <ostream>
#include <filesystem>
#include <core/config.hpp>
#include <runtime/container_runtime.hpp>
#include <managers/session_monitor.hpp>
#include "prompts.hpp"

// One interactive session:
//   resolve config -> probe -> launch -> wait -> (interrupt) -> shutdown
class DevboxCLI {
public:
    DevboxCLI(const Config& config, ContainerRuntime& runtime,
              LineReader reader, std::ostream& out);

    // Returns the process exit code: 0 after a graceful shutdown, the
    // runtime's exit code when probing or launching fails.
    int run_session();

    // Where the env file is looked up (defaults to the working directory).
    void set_work_dir(const std::filesystem::path& dir) { work_dir_ = dir; }

    // What ends the wait (defaults to the SIGINT latch).
    void set_stop_predicate(SessionMonitor::StopPredicate stop) { stop_ = std::move(stop); }

    // Skip installing the process SIGINT handler (tests drive the stop predicate).
    void set_install_signal_handler(bool install) { install_handler_ = install; }

private:
    const Config& config_;
    ContainerRuntime& runtime_;
    LineReader reader_;
    std::ostream& out_;
    std::filesystem::path work_dir_;
    SessionMonitor::StopPredicate stop_;
    bool install_handler_ = true;
};
