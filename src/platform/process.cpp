#include "process.hpp"
#include "platform.hpp"
#include <fmt/format.h>

#include <unistd.h>
#include <sys/wait.h>
#include <signal.h>
#include <fcntl.h>
#include <cerrno>
#include <cstring>

extern char** environ;

namespace platform {

// ── ProcessHandle ────────────────────────────────────────────

ProcessHandle::ProcessHandle() = default;

ProcessHandle::~ProcessHandle() {
    close_input();
    close_output();
    running();  // reap if it already exited
}

ProcessHandle::ProcessHandle(ProcessHandle&& other) noexcept {
    pid_ = other.pid_;
    stdin_fd_ = other.stdin_fd_;
    stdout_fd_ = other.stdout_fd_;
    reaped_ = other.reaped_;
    exit_code_ = other.exit_code_;
    other.reset();
}

ProcessHandle& ProcessHandle::operator=(ProcessHandle&& other) noexcept {
    if (this != &other) {
        close_input();
        close_output();
        pid_ = other.pid_;
        stdin_fd_ = other.stdin_fd_;
        stdout_fd_ = other.stdout_fd_;
        reaped_ = other.reaped_;
        exit_code_ = other.exit_code_;
        other.reset();
    }
    return *this;
}

void ProcessHandle::reset() noexcept {
    pid_ = -1;
    stdin_fd_ = -1;
    stdout_fd_ = -1;
    reaped_ = false;
    exit_code_ = -1;
}

bool ProcessHandle::valid() const {
    return pid_ > 0;
}

bool ProcessHandle::running() const {
    if (pid_ <= 0 || reaped_) return false;
    int status;
    pid_t ret = waitpid(pid_, &status, WNOHANG);
    if (ret == 0) return true;  // 0 means still running
    reaped_ = true;
    if (ret == pid_) {
        exit_code_ = WIFEXITED(status) ? WEXITSTATUS(status) : -1;
    }
    return false;
}

int ProcessHandle::wait(int timeout_ms) {
    if (pid_ <= 0) return -1;
    if (reaped_) return exit_code_;
    if (timeout_ms < 0) {
        int status;
        if (waitpid(pid_, &status, 0) == pid_) {
            exit_code_ = WIFEXITED(status) ? WEXITSTATUS(status) : -1;
        }
        reaped_ = true;
        return exit_code_;
    }
    // Poll with timeout
    int elapsed = 0;
    while (elapsed < timeout_ms) {
        if (!running()) return exit_code_;
        sleep_ms(20);
        elapsed += 20;
    }
    return running() ? -1 : exit_code_;
}

void ProcessHandle::terminate() {
    if (running()) ::kill(pid_, SIGTERM);
}

void ProcessHandle::kill() {
    if (!running()) return;
    ::kill(pid_, SIGKILL);
    int status;
    if (waitpid(pid_, &status, 0) == pid_) {
        exit_code_ = WIFEXITED(status) ? WEXITSTATUS(status) : -1;
    }
    reaped_ = true;
}

Result<void> ProcessHandle::write_input(const std::string& data) {
    if (stdin_fd_ < 0) {
        return Result<void>::Err("input pipe is closed");
    }
    size_t sent = 0;
    while (sent < data.size()) {
        ssize_t w = ::write(stdin_fd_, data.data() + sent, data.size() - sent);
        if (w < 0) {
            if (errno == EINTR) continue;
            return Result<void>::Err(std::strerror(errno));
        }
        sent += static_cast<size_t>(w);
    }
    return Result<void>::Ok();
}

void ProcessHandle::close_input() {
    if (stdin_fd_ >= 0) {
        ::close(stdin_fd_);
        stdin_fd_ = -1;
    }
}

void ProcessHandle::close_output() {
    if (stdout_fd_ >= 0) {
        ::close(stdout_fd_);
        stdout_fd_ = -1;
    }
}

// ── spawn ────────────────────────────────────────────────────

static std::vector<std::string> build_environment(const std::map<std::string, std::string>& overrides) {
    std::map<std::string, std::string> merged;
    for (char** e = environ; e && *e; ++e) {
        std::string entry(*e);
        auto eq = entry.find('=');
        if (eq == std::string::npos) continue;
        merged[entry.substr(0, eq)] = entry.substr(eq + 1);
    }
    for (const auto& [key, value] : overrides) merged[key] = value;

    std::vector<std::string> out;
    out.reserve(merged.size());
    for (const auto& [key, value] : merged) out.push_back(key + "=" + value);
    return out;
}

static void close_pair(int fds[2]) {
    if (fds[0] >= 0) ::close(fds[0]);
    if (fds[1] >= 0) ::close(fds[1]);
}

Result<ProcessHandle> spawn(const std::string& program,
                            const std::vector<std::string>& args,
                            const SpawnOptions& options) {
    // A child that exits early must not take us down when we write to it.
    static const bool sigpipe_ignored = [] { signal(SIGPIPE, SIG_IGN); return true; }();
    (void)sigpipe_ignored;

    int in_pipe[2] = {-1, -1};
    int out_pipe[2] = {-1, -1};
    int status_pipe[2] = {-1, -1};  // carries errno from a failed exec
    if (pipe2(in_pipe, O_CLOEXEC) != 0 || pipe2(out_pipe, O_CLOEXEC) != 0 ||
        pipe2(status_pipe, O_CLOEXEC) != 0) {
        int err = errno;
        close_pair(in_pipe);
        close_pair(out_pipe);
        close_pair(status_pipe);
        return Result<ProcessHandle>::Err(fmt::format("pipe() failed: {}", std::strerror(err)));
    }

    // Everything the child needs is built before fork()
    std::vector<const char*> argv;
    argv.push_back(program.c_str());
    for (const auto& a : args) argv.push_back(a.c_str());
    argv.push_back(nullptr);

    std::vector<std::string> env_strings = build_environment(options.env);
    std::vector<char*> envp;
    for (auto& s : env_strings) envp.push_back(s.data());
    envp.push_back(nullptr);

    pid_t pid = fork();
    if (pid < 0) {
        int err = errno;
        close_pair(in_pipe);
        close_pair(out_pipe);
        close_pair(status_pipe);
        return Result<ProcessHandle>::Err(fmt::format("fork() failed: {}", std::strerror(err)));
    }

    if (pid == 0) {
        // Child process
        signal(SIGPIPE, SIG_DFL);
        dup2(in_pipe[0], STDIN_FILENO);
        dup2(out_pipe[1], STDOUT_FILENO);
        if (options.merge_stderr) dup2(out_pipe[1], STDERR_FILENO);

        int err = 0;
        if (!options.working_dir.empty() && chdir(options.working_dir.c_str()) != 0) {
            err = errno;
        } else {
            environ = envp.data();
            execvp(program.c_str(), const_cast<char* const*>(argv.data()));
            err = errno;
        }
        ssize_t ignored = ::write(status_pipe[1], &err, sizeof(err));
        (void)ignored;
        _exit(127);  // exec failed
    }

    // Parent
    ::close(in_pipe[0]);
    ::close(out_pipe[1]);
    ::close(status_pipe[1]);

    int child_errno = 0;
    ssize_t n;
    do {
        n = ::read(status_pipe[0], &child_errno, sizeof(child_errno));
    } while (n < 0 && errno == EINTR);
    ::close(status_pipe[0]);

    if (n == static_cast<ssize_t>(sizeof(child_errno))) {
        // exec (or chdir) failed; the pipe closed by CLOEXEC otherwise
        ::close(in_pipe[1]);
        ::close(out_pipe[0]);
        waitpid(pid, nullptr, 0);
        return Result<ProcessHandle>::Err(
            fmt::format("Failed to start {}: {}", program, std::strerror(child_errno)));
    }

    ProcessHandle handle;
    handle.pid_ = pid;
    handle.stdin_fd_ = in_pipe[1];
    handle.stdout_fd_ = out_pipe[0];
    return Result<ProcessHandle>::Ok(std::move(handle));
}

} // namespace platform
