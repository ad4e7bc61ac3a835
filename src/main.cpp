#include <iostream>
#include <vector>
#include <string>
#include <stdexcept>
#include "cli/chat_cli.hpp"
#include "cli/theme.hpp"
#include "core/config.hpp"

static const char* QBRIDGE_VERSION = "0.1.0";

void print_usage() {
    std::cout << theme::banner(QBRIDGE_VERSION);
    std::cout << theme::section("Usage");
    std::cout << theme::color::ORANGE << "    qbridge"
              << theme::color::RESET << theme::color::DIM
              << "                    Start q chat and enter the REPL" << theme::color::RESET << "\n";
    std::cout << "\n";
    std::cout << theme::color::DIM
              << "    --trust-write           Trust fs_write for this session\n"
              << "    --trust-bash            Trust execute_bash for this session\n"
              << "    --log-level <level>     Q_LOG_LEVEL for the child (error|warn|info|debug|trace)\n"
              << "    --cwd <dir>             Working directory (default ~/amazon-q)\n"
              << "    --q <path>              q executable to run\n"
              << "    --debug                 Write a timestamped debug log\n"
              << "    --version               Show version\n"
              << "    --help                  Show this help"
              << theme::color::RESET << "\n\n";
}

int main(int argc, char** argv) {
    try {
        auto loaded = Config::load();
        if (loaded.is_err()) {
            std::cout << theme::fail(loaded.error);
            return 1;
        }
        SessionConfig config = loaded.value.session();

        std::vector<std::string> args(argv + 1, argv + argc);
        for (size_t i = 0; i < args.size(); ++i) {
            const std::string& arg = args[i];
            auto need_value = [&](const std::string& flag) -> std::string {
                if (i + 1 >= args.size()) {
                    throw std::invalid_argument("Missing value for " + flag);
                }
                return args[++i];
            };

            if (arg == "--version") {
                std::cout << theme::color::ORANGE << theme::color::BOLD << "qbridge"
                          << theme::color::RESET << theme::color::DIM
                          << " version " << QBRIDGE_VERSION << theme::color::RESET << "\n";
                return 0;
            } else if (arg == "--help") {
                print_usage();
                return 0;
            } else if (arg == "--trust-write") {
                config.trust_fs_write = true;
            } else if (arg == "--trust-bash") {
                config.trust_execute_bash = true;
            } else if (arg == "--debug") {
                config.debug = true;
            } else if (arg == "--log-level") {
                config.log_level = need_value(arg);
                if (!is_valid_log_level(config.log_level)) {
                    std::cout << theme::fail("Invalid log level: " + config.log_level);
                    std::cout << theme::step("Use one of: error, warn, info, debug, trace");
                    return 1;
                }
            } else if (arg == "--cwd") {
                config.working_dir = need_value(arg);
            } else if (arg == "--q") {
                config.executable = need_value(arg);
            } else {
                std::cout << theme::fail("Unknown option: " + arg);
                print_usage();
                return 1;
            }
        }

        std::cout << theme::banner(QBRIDGE_VERSION);
        ChatCLI cli(config);
        return cli.run_repl();
    } catch (const std::exception& e) {
        std::cout << theme::fail(std::string(e.what()));
        return 1;
    }
}
