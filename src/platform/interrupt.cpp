#include "interrupt.hpp"

#include <signal.h>

namespace platform {

static volatile sig_atomic_t g_interrupt_flag = 0;
static struct sigaction g_old_sa;
static bool g_installed = false;

static void sigint_handler(int) {
    g_interrupt_flag = 1;
}

void install_interrupt_handler() {
    if (g_installed) return;
    g_interrupt_flag = 0;

    struct sigaction sa;
    sa.sa_handler = sigint_handler;
    sigemptyset(&sa.sa_mask);
    // Restart interrupted reads so a second Ctrl+C at the removal
    // prompt does not turn into an EOF.
    sa.sa_flags = SA_RESTART;
    sigaction(SIGINT, &sa, &g_old_sa);
    g_installed = true;
}

void remove_interrupt_handler() {
    if (!g_installed) return;
    sigaction(SIGINT, &g_old_sa, nullptr);
    g_installed = false;
}

bool interrupt_requested() {
    return g_interrupt_flag != 0;
}

void reset_interrupt() {
    g_interrupt_flag = 0;
}

} // namespace platform
