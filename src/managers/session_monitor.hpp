#pragma once

#include <functional>
#include <ostream>
#include <core/types.hpp>
#include <runtime/container_runtime.hpp>

// Keeps devbox alive as the point of control after launch.
//
// The container is detached and does not depend on this process, so the
// monitor never re-probes it. It only waits for the stop predicate (the
// SIGINT latch in production) to fire.
class SessionMonitor {
public:
    using StopPredicate = std::function<bool()>;

    SessionMonitor(const SessionConfig& session, const LaunchSettings& settings,
                   const ContainerRuntime& runtime, std::ostream& out);

    // How to open a second shell in the container, detach, and quit.
    void print_guidance() const;

    // Block in tick_ms steps until stop_requested() returns true.
    // Returns the number of ticks slept.
    long wait(const StopPredicate& stop_requested);

private:
    const SessionConfig& session_;
    const LaunchSettings& settings_;
    const ContainerRuntime& runtime_;
    std::ostream& out_;
};
