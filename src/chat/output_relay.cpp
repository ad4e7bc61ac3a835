#include "output_relay.hpp"
#include <core/constants.hpp>
#include <core/debug_log.hpp>
#include <poll.h>
#include <unistd.h>
#include <cerrno>

// ── RawOutputQueue ─────────────────────────────────────────────

void RawOutputQueue::push(std::string chunk) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        chunks_.push_back(std::move(chunk));
    }
    cv_.notify_one();
}

std::optional<std::string> RawOutputQueue::pop(std::chrono::milliseconds timeout) {
    std::unique_lock<std::mutex> lock(mutex_);
    if (!cv_.wait_for(lock, timeout, [this] { return !chunks_.empty(); })) {
        return std::nullopt;
    }
    std::string chunk = std::move(chunks_.front());
    chunks_.pop_front();
    return chunk;
}

size_t RawOutputQueue::drain() {
    std::lock_guard<std::mutex> lock(mutex_);
    size_t n = chunks_.size();
    chunks_.clear();
    return n;
}

size_t RawOutputQueue::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return chunks_.size();
}

// ── OutputRelay ────────────────────────────────────────────────

OutputRelay::OutputRelay(int fd, RawOutputQueue& queue, DebugLog* log)
    : fd_(fd), queue_(queue), log_(log) {}

OutputRelay::~OutputRelay() {
    stop();
}

void OutputRelay::start() {
    if (thread_.joinable()) return;
    stop_ = false;
    running_ = true;
    thread_ = std::thread(&OutputRelay::reader_loop, this);
}

void OutputRelay::stop() {
    stop_ = true;
    if (thread_.joinable()) thread_.join();
}

void OutputRelay::forward(std::string chunk) {
    if (log_) log_->raw(chunk);
    queue_.push(std::move(chunk));
}

void OutputRelay::reader_loop() {
    char buf[RELAY_READ_BUF_SIZE];
    std::string pending;  // bytes after the last newline

    while (!stop_) {
        struct pollfd pfd = {fd_, POLLIN, 0};
        int rc = poll(&pfd, 1, RELAY_PARTIAL_FLUSH_MS);
        if (rc < 0) {
            if (errno == EINTR) continue;
            break;
        }
        if (rc == 0) {
            // Quiet pipe: hand over a trailing partial line (e.g. "> ")
            if (!pending.empty()) {
                forward(std::move(pending));
                pending.clear();
            }
            continue;
        }

        ssize_t n = ::read(fd_, buf, sizeof(buf));
        if (n < 0) {
            if (errno == EINTR || errno == EAGAIN) continue;
            break;
        }
        if (n == 0) break;  // EOF

        pending.append(buf, static_cast<size_t>(n));
        size_t nl;
        while ((nl = pending.find('\n')) != std::string::npos) {
            forward(pending.substr(0, nl + 1));
            pending.erase(0, nl + 1);
        }
    }

    if (!pending.empty()) forward(std::move(pending));
    running_ = false;
}
