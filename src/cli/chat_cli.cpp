#include "chat_cli.hpp"
#include "theme.hpp"
#include <core/config.hpp>
#include <core/debug_log.hpp>
#include <core/utils.hpp>
#include <fmt/format.h>
#include <iostream>
#include <sstream>
#include <cstdlib>
#include <readline/readline.h>
#include <readline/history.h>

ChatCLI::ChatCLI(SessionConfig config) : config_(std::move(config)) {
    register_commands();
}

ChatCLI::~ChatCLI() {
    stop_session();
}

void ChatCLI::add_command(const std::string& name,
                          CommandHandler handler,
                          const std::string& help) {
    commands_[name] = {handler, help};
}

void ChatCLI::register_commands() {
    add_command("/help", [](ChatCLI& cli, const std::string&) {
        cli.print_help();
    }, "Show this help message");

    add_command("/quit", [](ChatCLI& cli, const std::string&) {
        std::cout << theme::dim("    Closing q chat...") << "\n";
        cli.quit_ = true;
    }, "Close the session and exit");

    add_command("/restart", [](ChatCLI& cli, const std::string&) {
        cli.stop_session();
        cli.start_session();
    }, "Close the session and start a fresh one");

    add_command("/status", [](ChatCLI& cli, const std::string&) {
        cli.print_status();
    }, "Show session settings and liveness");
}

// ── Session lifecycle ─────────────────────────────────────────

bool ChatCLI::start_session() {
    std::unique_ptr<DebugLog> log;
    if (config_.debug) {
        auto opened = DebugLog::open(default_log_path(config_.log_dir));
        if (opened.is_ok()) {
            log = std::move(opened.value);
        } else {
            std::cout << theme::fail(opened.error);
        }
    }

    session_ = std::make_unique<Session>(config_, std::move(log));
    std::cout << theme::info(fmt::format("Starting {} {} in {}", config_.executable,
                                         config_.chat_subcommand,
                                         resolve_working_dir(config_).string()));

    auto banner = session_->start();
    if (banner.is_err()) {
        std::cout << theme::fail(banner.error);
        session_.reset();
        return false;
    }

    std::string text = trimmed(banner.value);
    if (!text.empty()) std::cout << "\n" << text << "\n\n";
    std::cout << theme::ok(fmt::format("q chat ready (pid {})", session_->pid()));
    if (!session_->log_path().empty()) {
        std::cout << theme::dim("    Log: " + session_->log_path()) << "\n";
    }
    return true;
}

void ChatCLI::stop_session() {
    if (session_) {
        session_->close();
        session_.reset();
    }
}

// ── Turns ─────────────────────────────────────────────────────

void ChatCLI::chat(const std::string& message) {
    if (!session_ || !session_->is_alive()) {
        std::cout << theme::fail("q chat is not running.");
        std::cout << theme::step("Run /restart to start a new session.");
        return;
    }
    print_turn(session_->send_and_stream(message));
}

void ChatCLI::print_turn(TurnStream turn) {
    while (true) {
        std::optional<PermissionRequest> request;
        while (auto ev = turn.next()) {
            if (auto* text = std::get_if<TextFragment>(&*ev)) {
                std::cout << text->text << std::flush;
            } else if (auto* req = std::get_if<PermissionRequest>(&*ev)) {
                request = *req;
            }
        }
        if (!request) break;

        PermissionDecision decision = ask_permission(request->prompt);
        auto answered = session_->answer_permission(decision);
        if (answered.is_err()) {
            std::cout << theme::fail("Could not send answer: " + answered.error);
        }
        turn = session_->resume_streaming();
    }

    if (session_->turn_state() == TurnState::TimedOut) {
        std::cout << "\n" << theme::info("No further reply from q chat (turn timed out).");
    }
    std::cout << "\n";
}

PermissionDecision ChatCLI::ask_permission(const std::string& prompt) {
    std::cout << "\n" << theme::yellow(prompt) << "\n";
    while (true) {
        char* raw = readline("  allow? [y/n/t] ");
        if (!raw) return PermissionDecision::Deny;  // EOF: refuse
        std::string answer = raw;
        free(raw);

        auto decision = parse_decision(answer);
        if (decision) return *decision;
        std::cout << theme::dim("    y = allow once, n = deny, t = trust for this session") << "\n";
    }
}

// ── Commands ──────────────────────────────────────────────────

void ChatCLI::execute_command(const std::string& command, const std::string& args) {
    auto it = commands_.find(command);
    if (it == commands_.end()) {
        std::cout << theme::fail("Unknown command: " + command);
        std::cout << theme::step("Type /help for available commands.");
        return;
    }

    try {
        it->second.first(*this, args);
    } catch (const std::exception& e) {
        std::cout << theme::fail(std::string(e.what()));
    }
}

void ChatCLI::print_help() const {
    std::cout << theme::section("Commands");
    for (const auto& [name, entry] : commands_) {
        std::cout << theme::color::ORANGE
                  << fmt::format("    {:<12}", name)
                  << theme::color::RESET
                  << theme::color::DIM
                  << entry.second
                  << theme::color::RESET << "\n";
    }
    std::cout << theme::dim("    Anything else is sent to q chat.") << "\n\n";
}

void ChatCLI::print_status() const {
    std::string tools;
    for (const auto& t : config_.trusted_tools()) tools += (tools.empty() ? "" : ", ") + t;

    std::cout << theme::section("Session");
    std::cout << theme::kv("program", config_.executable + " " + config_.chat_subcommand);
    std::cout << theme::kv("trusted", tools);
    std::cout << theme::kv("log level", config_.log_level);
    std::cout << theme::kv("cwd", resolve_working_dir(config_).string());
    if (session_) {
        std::cout << theme::kv("pid", std::to_string(session_->pid()));
        std::cout << theme::kv("alive", session_->is_alive() ? "yes" : "no");
        std::cout << theme::kv("last turn", turn_state_name(session_->turn_state()));
        if (!session_->log_path().empty()) std::cout << theme::kv("log", session_->log_path());
    } else {
        std::cout << theme::kv("alive", "no session");
    }
    std::cout << "\n";
}

std::string ChatCLI::prompt_string() const {
    // Readline uses \001 and \002 to wrap non-printing chars so it can
    // compute the visible prompt width correctly for cursor positioning.
    auto rl_esc = [](const std::string& code) {
        return std::string("\001") + code + std::string("\002");
    };
    return rl_esc(theme::color::ORANGE) + "you" + rl_esc(theme::color::RESET) + "> ";
}

// ── REPL ──────────────────────────────────────────────────────

int ChatCLI::run_repl() {
    if (!start_session()) return 1;

    std::string line;
    while (!quit_) {
        char* raw = readline(prompt_string().c_str());
        if (!raw) break;  // EOF / Ctrl-D

        line = raw;
        free(raw);
        trim(line);
        if (line.empty()) continue;

        add_history(line.c_str());

        if (line[0] == '/') {
            std::istringstream iss(line);
            std::string command;
            iss >> command;

            // Slash commands we don't own (e.g. /model) belong to q chat
            if (commands_.count(command)) {
                std::string args;
                std::getline(iss, args);
                trim(args);
                execute_command(command, args);
                continue;
            }
        }

        try {
            chat(line);
        } catch (const std::exception& e) {
            std::cout << theme::fail(std::string(e.what()));
        }
    }

    stop_session();
    return 0;
}
