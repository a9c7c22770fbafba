#include <iostream>
#include <string>
#include "cli/devbox_cli.hpp"
#include "cli/prompts.hpp"
#include "cli/theme.hpp"
#include "core/config.hpp"
#include "core/constants.hpp"
#include "runtime/docker_runtime.hpp"

void print_usage() {
    std::cout << theme::banner();
    std::cout << theme::section("Usage");
    std::cout << theme::color::BLUE << "    devbox"
              << theme::color::RESET << theme::color::DIM
              << "                Start or reuse the workspace container" << theme::color::RESET << "\n";
    std::cout << "\n";
    std::cout << theme::color::DIM
              << "    devbox --version       Show version\n"
              << "    devbox --help          Show this help"
              << theme::color::RESET << "\n";
    std::cout << theme::section("Config");
    std::cout << theme::color::DIM
              << "    ~/.devbox/config.yaml, then ./devbox.yaml\n"
              << "    keys: container, image, mount, runtime, workspace,\n"
              << "          env_file, shell, gpus, tick_ms"
              << theme::color::RESET << "\n\n";
}

int main(int argc, char** argv) {
    try {
        if (argc > 1) {
            std::string cmd = argv[1];

            if (cmd == "--version") {
                std::cout << theme::color::AMBER << theme::color::BOLD << "devbox"
                          << theme::color::RESET << theme::color::DIM
                          << " version " << DEVBOX_VERSION << theme::color::RESET << "\n";
                return 0;
            } else if (cmd == "--help") {
                print_usage();
                return 0;
            } else {
                std::cout << theme::fail("Unknown command: " + cmd);
                print_usage();
                return 1;
            }
        }

        auto config_result = Config::load();
        if (config_result.is_err()) {
            std::cout << theme::fail(config_result.error);
            return 1;
        }
        const Config config = config_result.value;

        DockerRuntime runtime(config.launch().runtime);
        DevboxCLI cli(config, runtime, readline_reader(), std::cout);
        return cli.run_session();
    } catch (const std::exception& e) {
        std::cout << theme::fail(std::string(e.what()));
        return 1;
    }
}
