#include "turn_engine.hpp"
#include "output_relay.hpp"
#include "patterns.hpp"
#include "text_sanitizer.hpp"
#include <core/constants.hpp>
#include <core/debug_log.hpp>
#include <core/utils.hpp>
#include <fmt/format.h>
#include <algorithm>
#include <cctype>

using std::chrono::duration_cast;
using std::chrono::milliseconds;

// ── Decisions / states ─────────────────────────────────────────

char decision_token(PermissionDecision decision) {
    switch (decision) {
        case PermissionDecision::ApproveOnce:     return 'y';
        case PermissionDecision::Deny:            return 'n';
        case PermissionDecision::ApproveAndTrust: return 't';
    }
    return 'n';
}

std::optional<PermissionDecision> parse_decision(const std::string& answer) {
    std::string a = trimmed(answer);
    std::transform(a.begin(), a.end(), a.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    if (a == "y" || a == "yes") return PermissionDecision::ApproveOnce;
    if (a == "n" || a == "no") return PermissionDecision::Deny;
    if (a == "t" || a == "trust") return PermissionDecision::ApproveAndTrust;
    return std::nullopt;
}

const char* turn_state_name(TurnState state) {
    switch (state) {
        case TurnState::Idle:      return "idle";
        case TurnState::Sending:   return "sending";
        case TurnState::Streaming: return "streaming";
        case TurnState::Suspended: return "suspended";
        case TurnState::Done:      return "done";
        case TurnState::TimedOut:  return "timed_out";
        case TurnState::Errored:   return "errored";
    }
    return "unknown";
}

// ── TurnEngine ─────────────────────────────────────────────────

TurnEngine::TurnEngine(RawOutputQueue& queue, InputWriter writer,
                       const TurnTimings& timings, DebugLog* log)
    : queue_(queue), writer_(std::move(writer)), timings_(timings), log_(log) {}

bool TurnEngine::active() const {
    return state_ == TurnState::Sending || state_ == TurnState::Streaming;
}

void TurnEngine::begin_turn(const std::string& message) {
    pending_.clear();
    message_ = message;
    raw_buf_.clear();
    cleaned_.clear();
    emitted_ = 0;
    end_ = 0;
    region_start_ = 0;
    skip_prompt_ = false;
    strip_echo_ = true;
    first_emit_ = true;
    saw_output_ = false;
    kick_sent_ = false;
    prompt_seen_ = false;
    answer_error_.reset();
    state_ = TurnState::Sending;

    // Leftovers from the previous exchange must not be read as this reply
    size_t stale = queue_.drain();
    if (stale > 0) log("STATE", fmt::format("dropped {} stale chunk(s) before send", stale));

    auto w = writer_(message + "\n");
    if (w.is_err()) {
        fail(fmt::format("\n[Error writing to q chat stdin: {}]\n", w.error),
             "stdin write failed: " + w.error);
        return;
    }
    log("SEND", "'" + truncate_preview(message, LOG_SEND_PREVIEW_CHARS) + "'");

    start_clock();
    state_ = TurnState::Streaming;
}

void TurnEngine::begin_resume() {
    pending_.clear();
    strip_echo_ = false;        // nothing new was sent, so nothing to echo
    saw_output_ = false;
    prompt_seen_ = false;
    skip_prompt_ = true;

    if (answer_error_) {
        std::string err = *answer_error_;
        answer_error_.reset();
        fail(fmt::format("\n[Error writing to q chat stdin: {}]\n", err),
             "permission answer was not delivered: " + err);
        return;
    }

    log("STATE", fmt::format("resume at offset {}", emitted_));
    start_clock();
    state_ = TurnState::Streaming;
}

Result<void> TurnEngine::answer(PermissionDecision decision) {
    std::string token(1, decision_token(decision));
    auto w = writer_(token + "\n");
    if (w.is_err()) {
        answer_error_ = w.error;
        log("ERROR", "permission answer write failed: " + w.error);
        return w;
    }
    answer_error_.reset();
    log("ANSWER", token);
    return w;
}

std::optional<TurnEvent> TurnEngine::next() {
    while (true) {
        if (!pending_.empty()) {
            TurnEvent ev = std::move(pending_.front());
            pending_.pop_front();
            return ev;
        }
        if (!active()) return std::nullopt;

        try {
            step();
        } catch (const std::exception& e) {
            fail(fmt::format("\n[Error while reading output: {}]\n", e.what()),
                 std::string("turn step threw: ") + e.what());
        }
    }
}

void TurnEngine::start_clock() {
    auto now = Clock::now();
    deadline_ = now + timings_.turn_deadline;
    last_any_ = now;
    last_output_ = now;
}

void TurnEngine::step() {
    auto wait = timings_.poll_interval;
    if (prompt_seen_) wait = std::min(wait, timings_.prompt_quiet);

    auto chunk = queue_.pop(wait);
    auto now = Clock::now();

    if (chunk) on_chunk(*chunk, now);
    if (!active()) return;

    if (now >= deadline_) {
        release_held(now);
        finish(TurnState::TimedOut,
               fmt::format("turn deadline of {}ms elapsed", timings_.turn_deadline.count()));
        return;
    }
    if (!chunk) on_quiet(now);
}

void TurnEngine::on_chunk(const std::string& chunk, Clock::time_point now) {
    auto quiet = now - last_any_;
    raw_buf_ += chunk;
    last_any_ = now;

    cleaned_ = strip_terminal_control(raw_buf_);
    emitted_ = std::min(emitted_, cleaned_.size());
    region_start_ = std::min(region_start_, cleaned_.size());

    if (skip_prompt_) {
        // q chat redraws its input prompt under a permission question. That
        // prompt took the answer, so it is not the end of the resumed reply.
        // The relay may hand it over joined to the first line of output.
        PatternMatch lead = find_leading_prompt(cleaned_.substr(emitted_));
        if (lead.matched) {
            emitted_ += lead.position + lead.matched_text.size();
            region_start_ = std::max(region_start_, emitted_);
            skip_prompt_ = false;
            log("STATE", "skipped input prompt left from the permission question");
        }
    }

    PatternMatch prompt = find_idle_prompt(cleaned_, emitted_);
    end_ = prompt.matched ? prompt.position : cleaned_.size();
    prompt_seen_ = prompt.matched;

    if (strip_echo_ && first_emit_) skip_input_echo(now);

    // A question can arrive over several chunks, so the whole unanswered
    // region is searched. Matches already emitted in full are stale.
    size_t from = region_start_;
    while (end_ > from) {
        PatternMatch perm = find_permission_prompt(cleaned_.substr(from, end_ - from));
        if (!perm.matched) break;
        size_t at = from + perm.position;
        size_t stop = at + perm.matched_text.size();
        if (stop > emitted_) {
            emit_until(at, now);
            std::string request = trimmed(cleaned_.substr(at, end_ - at));
            pending_.push_back(PermissionRequest{request});
            emitted_ = end_;
            region_start_ = end_;
            finish(TurnState::Suspended, "'" + truncate_preview(request, LOG_SEND_PREVIEW_CHARS) + "'");
            return;
        }
        from = stop;
    }

    size_t limit = hold_point();
    emit_until(limit, now);
    if (limit < end_ && has_visible_text(strip_terminal_control(chunk))) {
        saw_output_ = true;
        last_output_ = now;
    }

    if (prompt_seen_ && quiet >= timings_.prompt_quiet) {
        release_held(now);
        finish(TurnState::Done, "idle prompt after quiet period");
    }
}

void TurnEngine::skip_input_echo(Clock::time_point now) {
    if (end_ <= emitted_) return;
    std::string span = cleaned_.substr(emitted_, end_ - emitted_);
    if (!has_visible_text(span)) return;
    first_emit_ = false;

    PatternMatch echo = find_input_echo(span, message_);
    if (!echo.matched) return;
    size_t at = emitted_ + echo.position;
    emit_until(at, now);
    emitted_ = at + echo.matched_text.size();
    region_start_ = std::max(region_start_, emitted_);
}

size_t TurnEngine::hold_point() const {
    if (end_ <= emitted_) return end_;
    PatternMatch opening = find_narrative_opening(cleaned_.substr(emitted_, end_ - emitted_));
    if (!opening.matched) return end_;

    size_t at = emitted_ + opening.position;
    auto lines = std::count(cleaned_.begin() + at, cleaned_.begin() + end_, '\n');
    return lines < NARRATIVE_HOLD_LINES ? at : end_;
}

void TurnEngine::emit_until(size_t to, Clock::time_point now) {
    if (to <= emitted_) return;
    std::string text = filter_transient_status(cleaned_.substr(emitted_, to - emitted_));
    emitted_ = to;
    if (text.empty()) return;

    if (has_visible_text(text)) {
        saw_output_ = true;
        last_output_ = now;
        skip_prompt_ = false;
    } else if (skip_prompt_) {
        return;     // blank lines ahead of a redrawn prompt
    }
    pending_.push_back(TextFragment{std::move(text)});
}

void TurnEngine::release_held(Clock::time_point now) {
    emit_until(end_, now);
}

void TurnEngine::on_quiet(Clock::time_point now) {
    if (prompt_seen_ && now - last_any_ >= timings_.prompt_quiet) {
        release_held(now);
        finish(TurnState::Done, "idle prompt reached");
        return;
    }
    if (saw_output_ && now - last_output_ >= timings_.silence_done) {
        release_held(now);
        finish(TurnState::Done, fmt::format("no output for {}ms after reply",
                                            duration_cast<milliseconds>(now - last_output_).count()));
        return;
    }
    if (!saw_output_ && !kick_sent_ && now - last_any_ >= timings_.kick_after) {
        kick_sent_ = true;
        auto w = writer_("\n");
        if (w.is_ok()) {
            log("KICK", fmt::format("sent extra newline after {}ms of silence",
                                    duration_cast<milliseconds>(now - last_any_).count()));
        } else {
            log("KICK", "failed to send extra newline: " + w.error);
        }
    }
}

void TurnEngine::finish(TurnState state, const std::string& detail) {
    state_ = state;
    switch (state) {
        case TurnState::Suspended: log("PERMISSION", detail); break;
        case TurnState::TimedOut:  log("TIMEOUT", detail); break;
        case TurnState::Errored:   log("ERROR", detail); break;
        default: log("STATE", fmt::format("{} ({})", turn_state_name(state), detail)); break;
    }
}

void TurnEngine::fail(const std::string& fragment, const std::string& detail) {
    pending_.push_back(TextFragment{fragment});
    finish(TurnState::Errored, detail);
}

void TurnEngine::log(const std::string& tag, const std::string& detail) {
    if (log_) log_->event(tag, detail);
}
