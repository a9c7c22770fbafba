#pragma once

#include <string>
#include <optional>
#include <functional>
#include <ostream>
#include <core/types.hpp>
#include <runtime/container_runtime.hpp>

// Only an exact "y" or "Y" confirms removal.
bool is_removal_confirmed(const std::optional<std::string>& answer);

// Teardown after the operator interrupts the session.
//
//   Idle ──run()──▶ Terminating: stop, ask, maybe remove, return 0
//
// run() does its work at most once; later calls return immediately.
// The container is always stopped before the removal question is asked,
// and removal is skipped if the stop failed.
class ShutdownHandler {
public:
    // Returns one line of operator input, or nullopt at end of input.
    using ConfirmReader = std::function<std::optional<std::string>(const std::string& prompt)>;

    ShutdownHandler(const SessionConfig& session, ContainerRuntime& runtime,
                    ConfirmReader confirm, std::ostream& out);

    // Exit code for the process (always 0).
    int run();

    bool terminating() const { return terminating_; }

private:
    void print_manual_removal() const;

    const SessionConfig& session_;
    ContainerRuntime& runtime_;
    ConfirmReader confirm_;
    std::ostream& out_;
    bool terminating_ = false;
};
