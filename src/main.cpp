#include <iostream>
#include <optional>
#include <string>
#include "cli/console_cli.hpp"
#include "cli/theme.hpp"
#include <core/config.hpp>
#include <core/constants.hpp>
#include <core/log.hpp>

void print_usage() {
    std::cout << theme::banner(RTERM_VERSION);
    std::cout << theme::section("Usage");
    std::cout << theme::color::BLUE << "    rterm"
              << theme::color::RESET << theme::color::DIM
              << "                     Start the console" << theme::color::RESET << "\n";
    std::cout << theme::color::BLUE << "    rterm "
              << theme::color::RESET << theme::color::BROWN << "user@host[:port]"
              << theme::color::RESET << theme::color::DIM
              << "    Start and connect" << theme::color::RESET << "\n";
    std::cout << theme::color::BLUE << "    rterm --config "
              << theme::color::RESET << theme::color::BROWN << "<file>"
              << theme::color::RESET << theme::color::DIM
              << "     Use another config file" << theme::color::RESET << "\n";
    std::cout << "\n";
    std::cout << theme::color::DIM
              << "    rterm --init-config       Write ~/.rterm/config.yaml\n"
              << "    rterm --version           Show version\n"
              << "    rterm --help              Show this help"
              << theme::color::RESET << "\n\n";
}

int main(int argc, char** argv) {
    try {
        std::optional<std::string> target;
        std::optional<std::string> config_path;

        for (int i = 1; i < argc; i++) {
            std::string arg = argv[i];

            if (arg == "--version") {
                std::cout << theme::color::BROWN << theme::color::BOLD << "rterm"
                          << theme::color::RESET << theme::color::DIM
                          << " version " << RTERM_VERSION << theme::color::RESET << "\n";
                return 0;
            } else if (arg == "--help") {
                print_usage();
                return 0;
            } else if (arg == "--init-config") {
                auto created = create_default_global_config();
                if (created.is_err()) {
                    std::cout << theme::fail(created.error);
                    return 1;
                }
                std::cout << theme::ok("Config at " + get_global_config_path().string());
                return 0;
            } else if (arg == "--config") {
                if (i + 1 >= argc) {
                    std::cout << theme::fail("Missing file after --config.");
                    return 1;
                }
                config_path = argv[++i];
            } else if (!arg.empty() && arg[0] == '-') {
                std::cout << theme::fail("Unknown option: " + arg);
                print_usage();
                return 1;
            } else if (!target) {
                target = arg;
            } else {
                std::cout << theme::fail("Unexpected argument: " + arg);
                print_usage();
                return 1;
            }
        }

        auto config = config_path ? Config::load_file(*config_path) : Config::load();
        if (config.is_err()) {
            std::cout << theme::fail(config.error);
            return 1;
        }

        configure_log(config.value.log());
        rterm_log("rterm starting");

        ConsoleCLI cli(config.value);
        return cli.run(target);
    } catch (const std::exception& e) {
        std::cout << theme::fail(std::string(e.what()));
        return 1;
    }
}
