#pragma once

#include <string>
#include <optional>
#include <functional>
#include <core/types.hpp>

// Returns one line of operator input without its newline, or nullopt at
// end of input.
using LineReader = std::function<std::optional<std::string>(const std::string& prompt)>;

// Blank (empty or whitespace-only) input falls back to the default.
// Anything else is returned verbatim, surrounding whitespace included.
std::string resolve_field(const std::string& raw, const std::string& fallback);

// Show `label [default]: `, read one line, resolve it.
std::string prompt_field(const LineReader& reader, const std::string& label,
                         const std::string& fallback);

// Ask for container name, image name and mount path, in that order.
SessionConfig resolve_session_config(const LineReader& reader,
                                     const SessionDefaults& defaults);

// LineReader backed by GNU readline. Colors in the prompt are wrapped so
// readline measures its visible width correctly.
LineReader readline_reader();
