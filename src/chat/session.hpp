#pragma once

#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>
#include <core/types.hpp>
#include <platform/process.hpp>
#include "output_relay.hpp"
#include "turn_engine.hpp"

class DebugLog;
class Session;

// Lazy event sequence for one send or resume. Pull with next() until it
// returns nullopt; then Session::turn_state() says how the turn ended.
// Only valid while its Session is alive and no other turn has begun.
class TurnStream {
public:
    explicit TurnStream(TurnEngine& engine) : engine_(&engine) {}

    std::optional<TurnEvent> next() { return engine_->next(); }

private:
    TurnEngine* engine_;
};

// Session: one live `q chat` child process driven as a request/response API.
//
//   Session s(config, std::move(log));
//   auto banner = s.start();
//   auto turn = s.send_and_stream("hello");
//   while (auto ev = turn.next()) {
//       if (auto* text = std::get_if<TextFragment>(&*ev)) { ... }
//       else { s.answer_permission(PermissionDecision::ApproveOnce);
//              turn = s.resume_streaming(); }
//   }
//   s.close();
//
// A Session serves one turn at a time and is single-use: after close() it
// cannot be started again. Operations other than start()/close() throw
// std::logic_error when the session is not running.
class Session {
public:
    // log is only kept when config.debug is set.
    explicit Session(SessionConfig config, std::unique_ptr<DebugLog> log = nullptr);
    ~Session();

    Session(const Session&) = delete;
    Session& operator=(const Session&) = delete;

    // Spawn the child and wait for its first idle prompt (or the startup
    // deadline). Returns the control-stripped startup banner. Fails if the
    // working directory cannot be created or the program cannot be run.
    Result<std::string> start();

    TurnStream send_and_stream(const std::string& message);
    Result<void> answer_permission(PermissionDecision decision);
    TurnStream resume_streaming();

    // Quit, then SIGTERM, then SIGKILL. Never throws; idempotent.
    void close();

    bool started() const { return started_; }
    bool closed() const { return closed_; }
    bool is_alive() const;
    int pid() const;
    TurnState turn_state() const;
    std::string log_path() const;

    const SessionConfig& config() const { return config_; }

    // Arguments after the executable: chat --trust-tools=fs_read[,...]
    std::vector<std::string> build_arguments() const;

    // Environment overrides for the child. Q_LOG_LEVEL always; TERM, LANG
    // and LC_ALL only where our own environment lacks them.
    std::map<std::string, std::string> build_environment() const;

private:
    SessionConfig config_;
    std::unique_ptr<DebugLog> log_;
    platform::ProcessHandle process_;
    RawOutputQueue queue_;
    std::unique_ptr<OutputRelay> relay_;
    std::unique_ptr<TurnEngine> engine_;
    bool started_ = false;
    bool closed_ = false;

    std::string warm_up();
    void require_running(const char* operation) const;
    void log(const std::string& tag, const std::string& detail);
};
