#pragma once

#include <map>
#include <string>
#include <vector>
#include <core/types.hpp>

namespace platform {

struct SpawnOptions {
    std::string working_dir;                    // empty = inherit ours
    std::map<std::string, std::string> env;     // applied on top of our environment
    bool merge_stderr = true;                   // child's stderr shares the stdout pipe
};

// Handle to a spawned child process with its stdin/stdout wired as pipes.
class ProcessHandle {
public:
    ProcessHandle();
    ~ProcessHandle();

    ProcessHandle(ProcessHandle&& other) noexcept;
    ProcessHandle& operator=(ProcessHandle&& other) noexcept;
    ProcessHandle(const ProcessHandle&) = delete;
    ProcessHandle& operator=(const ProcessHandle&) = delete;

    // True if the process handle is valid (was successfully spawned).
    bool valid() const;

    // True if the process is still running. Reaps it once it has exited.
    bool running() const;

    // Wait for the process to exit. Returns exit code, or -1 on timeout
    // or abnormal exit. timeout_ms = -1 means indefinite wait.
    int wait(int timeout_ms = -1);

    // Ask the process to exit (SIGTERM). Does not wait.
    void terminate();

    // Force-kill the process (SIGKILL) and reap it.
    void kill();

    // Write all of data to the child's stdin.
    Result<void> write_input(const std::string& data);

    // Close our end of the child's stdin. Safe to call repeatedly.
    void close_input();
    bool input_open() const { return stdin_fd_ >= 0; }

    // Read end of the child's stdout (and stderr when merged). -1 if closed.
    int output_fd() const { return stdout_fd_; }
    void close_output();

    int native_handle() const { return pid_; }

private:
    int pid_ = -1;
    int stdin_fd_ = -1;
    int stdout_fd_ = -1;
    mutable bool reaped_ = false;
    mutable int exit_code_ = -1;

    void reset() noexcept;

    friend Result<ProcessHandle> spawn(const std::string& program,
                                       const std::vector<std::string>& args,
                                       const SpawnOptions& options);
};

// Spawn program (looked up on PATH) with args. Fails if the pipes cannot be
// created, the working directory cannot be entered, or exec fails.
Result<ProcessHandle> spawn(const std::string& program,
                            const std::vector<std::string>& args,
                            const SpawnOptions& options = {});

} // namespace platform
