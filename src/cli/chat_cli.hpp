#pragma once

#include <functional>
#include <map>
#include <memory>
#include <string>
#include <core/types.hpp>
#include <chat/session.hpp>

// Interactive front-end: a readline REPL that forwards each line to a
// Session and prints the reply as it streams. Registered slash commands
// are handled locally; every other line goes to q chat.
class ChatCLI {
public:
    explicit ChatCLI(SessionConfig config);
    ~ChatCLI();

    using CommandHandler = std::function<void(ChatCLI&, const std::string&)>;

    void add_command(const std::string& name,
                     CommandHandler handler,
                     const std::string& help);

    // Start the session and read lines until /quit or EOF. Returns the
    // process exit code.
    int run_repl();

private:
    SessionConfig config_;
    std::unique_ptr<Session> session_;
    std::map<std::string, std::pair<CommandHandler, std::string>> commands_;
    bool quit_ = false;

    void register_commands();
    bool start_session();
    void stop_session();

    void chat(const std::string& message);
    void print_turn(TurnStream turn);
    PermissionDecision ask_permission(const std::string& prompt);

    void execute_command(const std::string& command, const std::string& args);
    void print_help() const;
    void print_status() const;
    std::string prompt_string() const;
};
