#include "session.hpp"
#include "patterns.hpp"
#include "text_sanitizer.hpp"
#include <core/config.hpp>
#include <core/constants.hpp>
#include <core/debug_log.hpp>
#include <platform/platform.hpp>
#include <fmt/format.h>
#include <chrono>
#include <filesystem>
#include <stdexcept>

namespace fs = std::filesystem;

// ── Lifecycle ──────────────────────────────────────────────────

Session::Session(SessionConfig config, std::unique_ptr<DebugLog> log)
    : config_(std::move(config)) {
    if (config_.debug) log_ = std::move(log);
}

Session::~Session() {
    close();
}

std::vector<std::string> Session::build_arguments() const {
    std::string tools;
    for (const auto& tool : config_.trusted_tools()) {
        if (!tools.empty()) tools += ",";
        tools += tool;
    }
    return {config_.chat_subcommand, std::string(TRUST_TOOLS_FLAG) + tools};
}

std::map<std::string, std::string> Session::build_environment() const {
    std::map<std::string, std::string> env;
    if (!config_.log_level.empty()) env[ENV_LOG_LEVEL] = config_.log_level;

    auto default_if_absent = [&env](const char* key, const char* value) {
        if (!platform::env_value(key)) env[key] = value;
    };
    default_if_absent("TERM", DEFAULT_TERM);
    default_if_absent("LANG", DEFAULT_LOCALE);
    default_if_absent("LC_ALL", DEFAULT_LOCALE);
    return env;
}

Result<std::string> Session::start() {
    if (closed_) throw std::logic_error("start: session was closed; create a new Session");
    if (started_) throw std::logic_error("start: session already started");

    fs::path cwd = resolve_working_dir(config_);
    auto made = platform::ensure_directory(cwd);
    if (made.is_err()) {
        log("ERROR", made.error);
        return Result<std::string>::Err(made.error);
    }

    auto args = build_arguments();
    auto env = build_environment();

    platform::SpawnOptions opts;
    opts.working_dir = cwd.string();
    opts.env = env;
    opts.merge_stderr = true;

    auto spawned = platform::spawn(config_.executable, args, opts);
    if (spawned.is_err()) {
        log("ERROR", spawned.error);
        return Result<std::string>::Err(spawned.error);
    }
    process_ = std::move(spawned.value);

    relay_ = std::make_unique<OutputRelay>(process_.output_fd(), queue_, log_.get());
    relay_->start();
    engine_ = std::make_unique<TurnEngine>(
        queue_,
        [this](const std::string& data) { return process_.write_input(data); },
        config_.timings, log_.get());
    started_ = true;

    std::string cmdline = config_.executable;
    for (const auto& a : args) cmdline += " " + a;
    log("SPAWN", fmt::format("cmd='{}' cwd='{}' pid={}", cmdline, cwd.string(), process_.native_handle()));

    auto effective = [&env](const char* key) {
        auto it = env.find(key);
        if (it != env.end()) return it->second;
        return platform::env_value(key).value_or("<unset>");
    };
    log("ENV", fmt::format("{}={} TERM={} LANG={} LC_ALL={}", ENV_LOG_LEVEL,
                           effective(ENV_LOG_LEVEL), effective("TERM"),
                           effective("LANG"), effective("LC_ALL")));

    return Result<std::string>::Ok(warm_up());
}

// Gather the banner until the first idle prompt has been followed by a
// short quiet spell. Without a prompt we still hand back what arrived.
std::string Session::warm_up() {
    using Clock = std::chrono::steady_clock;
    const auto& t = config_.timings;

    std::string banner;
    bool saw_prompt = false;
    bool notice_answered = false;
    bool legacy_answered = false;

    auto answer_interstitial = [this](const char* what) {
        auto w = process_.write_input("\n");
        if (w.is_ok()) {
            log("STATE", fmt::format("answered {} with newline", what));
        } else {
            log("ERROR", fmt::format("could not answer {}: {}", what, w.error));
        }
    };

    auto deadline = Clock::now() + t.startup_deadline;
    auto last_any = Clock::now();

    while (Clock::now() < deadline) {
        auto chunk = queue_.pop(t.startup_poll);
        auto now = Clock::now();

        if (chunk) {
            banner += *chunk;
            last_any = now;
            std::string cleaned = strip_terminal_control(banner);
            if (!saw_prompt && find_idle_prompt(cleaned).matched) {
                saw_prompt = true;
                log("STATE", "idle prompt seen during startup");
            }
            if (!notice_answered && is_start_chatting_notice(cleaned)) {
                notice_answered = true;
                answer_interstitial("start-chatting notice");
            }
            if (!legacy_answered && is_legacy_profile_question(cleaned)) {
                legacy_answered = true;
                answer_interstitial("legacy profile question");
            }
            continue;
        }

        if (saw_prompt && now - last_any > t.startup_quiet) break;
        if (!relay_->running() && queue_.size() == 0) {
            log("ERROR", "child output closed during startup");
            break;
        }
    }

    if (saw_prompt) {
        log("STATE", "ready (prompt reached)");
    } else {
        log("STATE", fmt::format("no prompt within {}ms; continuing with what arrived",
                                 t.startup_deadline.count()));
    }
    return strip_terminal_control(banner);
}

void Session::close() {
    if (closed_) return;
    closed_ = true;
    if (!started_) return;

    try {
        if (process_.input_open()) {
            auto w = process_.write_input(QUIT_DIRECTIVE);
            if (w.is_err()) log("CLOSE", "quit directive not delivered: " + w.error);
            process_.close_input();
        }

        int wait_ms = static_cast<int>(config_.timings.shutdown_wait.count());
        process_.wait(wait_ms);
        if (process_.running()) {
            log("CLOSE", "still running after quit, sending SIGTERM");
            process_.terminate();
            process_.wait(wait_ms);
        }
        if (process_.running()) {
            log("CLOSE", "still running after SIGTERM, sending SIGKILL");
            process_.kill();
        }

        if (relay_) relay_->stop();
        process_.close_output();
        log("CLOSE", "session closed");
    } catch (const std::exception& e) {
        log("ERROR", std::string("close: ") + e.what());
    }
}

// ── Turns ──────────────────────────────────────────────────────

void Session::require_running(const char* operation) const {
    if (!started_ || closed_) {
        throw std::logic_error(fmt::format("{}: chat session not started", operation));
    }
}

TurnStream Session::send_and_stream(const std::string& message) {
    require_running("send_and_stream");
    engine_->begin_turn(message);
    return TurnStream(*engine_);
}

Result<void> Session::answer_permission(PermissionDecision decision) {
    require_running("answer_permission");
    return engine_->answer(decision);
}

TurnStream Session::resume_streaming() {
    require_running("resume_streaming");
    engine_->begin_resume();
    return TurnStream(*engine_);
}

// ── Queries ────────────────────────────────────────────────────

bool Session::is_alive() const {
    return started_ && !closed_ && process_.running();
}

int Session::pid() const {
    return process_.native_handle();
}

TurnState Session::turn_state() const {
    return engine_ ? engine_->state() : TurnState::Idle;
}

std::string Session::log_path() const {
    return log_ ? log_->path().string() : std::string();
}

void Session::log(const std::string& tag, const std::string& detail) {
    if (log_) log_->event(tag, detail);
}
