#pragma once

#include <filesystem>
#include <memory>
#include <mutex>
#include <ostream>
#include <string>
#include "types.hpp"

// Append-only diagnostic sink for one chat session.
//
// Line format:  [HH:MM:SS.mmm] TAG: detail
// Raw child output is mirrored verbatim between event lines, so the file
// reads as an interleaved transcript of what the protocol saw and did.
//
// The caller decides where the file lives; the session only decides
// whether and what to write. Writes come from both the caller's thread
// and the output relay thread, hence the mutex.
class DebugLog {
public:
    explicit DebugLog(std::unique_ptr<std::ostream> out,
                      std::filesystem::path path = {});

    // Open (append) a log file, creating its parent directory.
    static Result<std::unique_ptr<DebugLog>> open(const std::filesystem::path& path);

    void event(const std::string& tag, const std::string& detail);
    void raw(const std::string& chunk);

    const std::filesystem::path& path() const { return path_; }

private:
    std::unique_ptr<std::ostream> out_;
    std::filesystem::path path_;
    std::mutex mutex_;
};

// <dir>/qchat_YYYYmmdd_HHMMSS.log
std::filesystem::path default_log_path(const std::filesystem::path& dir);
