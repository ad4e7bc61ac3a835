#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <deque>
#include <mutex>
#include <optional>
#include <string>
#include <thread>

class DebugLog;

// RawOutputQueue: ordered chunks of child output, written only by the
// OutputRelay thread and drained only by the TurnEngine.
class RawOutputQueue {
public:
    void push(std::string chunk);

    // Wait up to timeout for the next chunk. nullopt on timeout.
    std::optional<std::string> pop(std::chrono::milliseconds timeout);

    // Discard everything queued. Returns the number of chunks dropped.
    size_t drain();

    size_t size() const;

private:
    mutable std::mutex mutex_;
    std::condition_variable cv_;
    std::deque<std::string> chunks_;
};

// OutputRelay: a thread doing blocking reads on the child's output pipe,
// one line per chunk, forwarding each chunk (after mirroring it to the
// debug log) into a RawOutputQueue. An unterminated line is forwarded as
// its own chunk once the pipe has been quiet briefly, so prompts that do
// not end in a newline still reach the queue.
//
// End of stream just ends the thread; nothing is pushed for it.
class OutputRelay {
public:
    OutputRelay(int fd, RawOutputQueue& queue, DebugLog* log = nullptr);
    ~OutputRelay();

    OutputRelay(const OutputRelay&) = delete;
    OutputRelay& operator=(const OutputRelay&) = delete;

    void start();

    // Stop reading and join. Safe to call multiple times.
    void stop();

    // False once the thread has hit end of stream or a read error.
    bool running() const { return running_; }

private:
    int fd_;
    RawOutputQueue& queue_;
    DebugLog* log_;
    std::thread thread_;
    std::atomic<bool> stop_{false};
    std::atomic<bool> running_{false};

    void reader_loop();
    void forward(std::string chunk);
};
