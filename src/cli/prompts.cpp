#include "prompts.hpp"
#include "theme.hpp"
#include <core/utils.hpp>
#include <cstdio>
#include <cstdlib>
#include <readline/readline.h>

std::string resolve_field(const std::string& raw, const std::string& fallback) {
    if (is_blank(raw)) return fallback;
    return raw;
}

std::string prompt_field(const LineReader& reader, const std::string& label,
                         const std::string& fallback) {
    std::string prompt = "    " + label + " [" + fallback + "]: ";
    auto answer = reader(prompt);
    if (!answer) return fallback;
    return resolve_field(*answer, fallback);
}

SessionConfig resolve_session_config(const LineReader& reader,
                                     const SessionDefaults& defaults) {
    SessionConfig session;
    session.container_name = prompt_field(reader, "Container name", defaults.container_name);
    session.image_name = prompt_field(reader, "Image name", defaults.image_name);
    session.mount_path = prompt_field(reader, "Host directory to mount", defaults.mount_path);
    return session;
}

LineReader readline_reader() {
    return [](const std::string& prompt) -> std::optional<std::string> {
        // Readline uses \001 and \002 to wrap non-printing chars so it can
        // compute the visible prompt width correctly for cursor positioning.
        auto rl_esc = [](const std::string& code) {
            return std::string("\001") + code + std::string("\002");
        };
        std::string styled = rl_esc(theme::color::AMBER) + prompt + rl_esc(theme::color::RESET);

        char* line = readline(styled.c_str());
        if (!line) {
            std::printf("\n");
            return std::nullopt;
        }
        std::string result(line);
        std::free(line);
        return result;
    };
}
