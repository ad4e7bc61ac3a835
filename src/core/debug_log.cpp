#include "debug_log.hpp"
#include "constants.hpp"
#include "utils.hpp"
#include <platform/platform.hpp>
#include <fmt/format.h>
#include <fstream>

namespace fs = std::filesystem;

DebugLog::DebugLog(std::unique_ptr<std::ostream> out, fs::path path)
    : out_(std::move(out)), path_(std::move(path)) {}

Result<std::unique_ptr<DebugLog>> DebugLog::open(const fs::path& path) {
    if (path.has_parent_path()) {
        auto made = platform::ensure_directory(path.parent_path());
        if (made.is_err()) return Result<std::unique_ptr<DebugLog>>::Err(made.error);
    }

    auto file = std::make_unique<std::ofstream>(path, std::ios::app);
    if (!*file) {
        return Result<std::unique_ptr<DebugLog>>::Err(
            fmt::format("Cannot open log file {}", path.string()));
    }
    return Result<std::unique_ptr<DebugLog>>::Ok(
        std::make_unique<DebugLog>(std::move(file), path));
}

void DebugLog::event(const std::string& tag, const std::string& detail) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!out_ || !*out_) return;
    *out_ << fmt::format("[{}] {}: {}\n", now_clock_ms(), tag, detail);
    out_->flush();
}

void DebugLog::raw(const std::string& chunk) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!out_ || !*out_) return;
    *out_ << chunk;
    out_->flush();
}

fs::path default_log_path(const fs::path& dir) {
    return dir / fmt::format("{}{}.log", LOG_FILE_PREFIX, now_file_stamp());
}
