#pragma once

#include <string>
#include <vector>
#include <chrono>
#include <utility>

// Result type for operations that can fail
template <typename T>
struct Result {
    bool success;
    T value;
    std::string error;

    static Result<T> Ok(T val) {
        return {true, std::move(val), ""};
    }

    static Result<T> Err(const std::string& err) {
        return {false, T{}, err};
    }

    bool is_ok() const { return success; }
    bool is_err() const { return !success; }
};

// Specialization for void
template <>
struct Result<void> {
    bool success;
    std::string error;

    static Result<void> Ok() {
        return {true, ""};
    }

    static Result<void> Err(const std::string& err) {
        return {false, err};
    }

    bool is_ok() const { return success; }
    bool is_err() const { return !success; }
};

// Timing knobs for the turn protocol. All of these are heuristics tuned
// against a live `q chat`; tests shrink them to keep runs short.
struct TurnTimings {
    std::chrono::milliseconds poll_interval{1000};     // queue wait per turn step
    std::chrono::milliseconds prompt_quiet{500};       // silence after idle prompt => done
    std::chrono::milliseconds silence_done{5000};      // silence after real output => done
    std::chrono::milliseconds kick_after{3000};        // silence before any output => send newline
    std::chrono::milliseconds turn_deadline{60000};    // hard wall clock per turn
    std::chrono::milliseconds startup_poll{500};
    std::chrono::milliseconds startup_quiet{700};      // silence after first prompt => ready
    std::chrono::milliseconds startup_deadline{20000};
    std::chrono::milliseconds shutdown_wait{2000};     // per escalation step in close()
};

// Everything needed to launch one chat session. Identity of a session is
// (trust flags, log level, working dir); changing any of them means a new
// Session.
struct SessionConfig {
    std::string executable = "q";
    std::string chat_subcommand = "chat";
    bool trust_fs_write = false;
    bool trust_execute_bash = false;
    std::string log_level = "info";     // exported as Q_LOG_LEVEL
    std::string working_dir;            // empty = ~/amazon-q
    bool debug = false;
    std::string log_dir = "logs";       // where the CLI opens debug logs
    TurnTimings timings;

    // fs_read is always trusted; fs_write / execute_bash are opt-in.
    std::vector<std::string> trusted_tools() const {
        std::vector<std::string> tools = {"fs_read"};
        if (trust_fs_write) tools.push_back("fs_write");
        if (trust_execute_bash) tools.push_back("execute_bash");
        return tools;
    }
};
