#pragma once

namespace platform {

// Process-wide latch for the operator interrupt (SIGINT).
//
// install_interrupt_handler() replaces the default SIGINT action with a
// handler that only sets a flag. Once installed, repeated Ctrl+C presses are
// absorbed instead of killing the process, so teardown can run to completion.
// Every other signal keeps its default disposition.
void install_interrupt_handler();

// Restore the SIGINT action that was active before install.
void remove_interrupt_handler();

// True once SIGINT has been received since install (or the last reset).
bool interrupt_requested();

// Clear the latch. Used by tests.
void reset_interrupt();

} // namespace platform
