#pragma once

#include <chrono>
#include <deque>
#include <functional>
#include <optional>
#include <string>
#include <variant>
#include <core/types.hpp>

class DebugLog;
class RawOutputQueue;

// ── Turn events ────────────────────────────────────────────────

struct TextFragment {
    std::string text;
};

// The program paused for a yes/no/trust decision. prompt is the
// confirmation text from the start of the matched idiom onward.
struct PermissionRequest {
    std::string prompt;
};

using TurnEvent = std::variant<TextFragment, PermissionRequest>;

enum class PermissionDecision {
    ApproveOnce,        // y
    Deny,               // n
    ApproveAndTrust,    // t
};

char decision_token(PermissionDecision decision);

// "y"/"yes", "n"/"no", "t"/"trust", any case. nullopt otherwise.
std::optional<PermissionDecision> parse_decision(const std::string& answer);

enum class TurnState {
    Idle,           // no turn yet
    Sending,
    Streaming,
    Suspended,      // waiting on a permission decision
    Done,
    TimedOut,
    Errored,
};

const char* turn_state_name(TurnState state);

// Writes to the child's stdin.
using InputWriter = std::function<Result<void>(const std::string&)>;

// TurnEngine: per-session protocol state machine.
//
//   SENDING -> STREAMING -> { SUSPENDED | DONE | TIMED_OUT | ERRORED }
//
// begin_turn() drains stale output and writes the message; begin_resume()
// continues a suspended turn where its buffer left off. next() then pulls
// events one at a time, polling the queue with short timeouts until an
// event is ready or the turn ends. Everything runs on the caller's thread.
//
// Buffer offsets are in sanitized (control-stripped) coordinates; each
// pass re-sanitizes the whole turn buffer and emits only what grew.
// Idle prompts are looked for past the emitted offset only. Permission
// questions are looked for from the last suspend point, and a lone
// "Allow this action?" is held back until the rest of it shows up.
class TurnEngine {
public:
    TurnEngine(RawOutputQueue& queue, InputWriter writer,
               const TurnTimings& timings, DebugLog* log = nullptr);

    void begin_turn(const std::string& message);
    void begin_resume();

    // Write the decision token plus newline. Reads nothing. A failed write
    // is also reported by the following resume as a final fragment.
    Result<void> answer(PermissionDecision decision);

    // Next event of the current turn, or nullopt once the turn has ended
    // or suspended.
    std::optional<TurnEvent> next();

    TurnState state() const { return state_; }
    bool active() const;

private:
    using Clock = std::chrono::steady_clock;

    RawOutputQueue& queue_;
    InputWriter writer_;
    TurnTimings timings_;
    DebugLog* log_;

    TurnState state_ = TurnState::Idle;
    std::deque<TurnEvent> pending_;

    // Turn buffer, kept across suspend/resume
    std::string message_;
    std::string raw_buf_;
    std::string cleaned_;
    size_t emitted_ = 0;
    size_t end_ = 0;            // emit limit: idle prompt line or end of buffer
    size_t region_start_ = 0;   // first offset not covered by an answered question
    bool strip_echo_ = false;
    bool first_emit_ = true;
    bool saw_output_ = false;
    bool kick_sent_ = false;
    bool prompt_seen_ = false;
    bool skip_prompt_ = false;  // resumed, and the redrawn prompt not yet passed
    std::optional<std::string> answer_error_;

    Clock::time_point deadline_;
    Clock::time_point last_any_;
    Clock::time_point last_output_;

    void start_clock();
    void step();
    void on_chunk(const std::string& chunk, Clock::time_point now);
    void skip_input_echo(Clock::time_point now);
    size_t hold_point() const;
    void emit_until(size_t to, Clock::time_point now);
    void release_held(Clock::time_point now);
    void on_quiet(Clock::time_point now);
    void finish(TurnState state, const std::string& detail);
    void fail(const std::string& fragment, const std::string& detail);
    void log(const std::string& tag, const std::string& detail);
};
