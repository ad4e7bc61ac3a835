#include "platform.hpp"
#include <fmt/format.h>
#include <chrono>
#include <cstdlib>
#include <thread>
#include <vector>
#include <pwd.h>
#include <unistd.h>

namespace fs = std::filesystem;

namespace platform {

static std::optional<fs::path> passwd_home() {
    long size = sysconf(_SC_GETPW_R_SIZE_MAX);
    std::vector<char> buf(size > 0 ? static_cast<size_t>(size) : 16384);
    struct passwd pw;
    struct passwd* result = nullptr;
    if (getpwuid_r(getuid(), &pw, buf.data(), buf.size(), &result) != 0 || !result) {
        return std::nullopt;
    }
    if (!result->pw_dir || !*result->pw_dir) return std::nullopt;
    return fs::path(result->pw_dir);
}

fs::path home_dir() {
    if (auto home = env_value("HOME"); home && !home->empty()) {
        return fs::path(*home);
    }
    if (auto home = passwd_home()) return *home;
    return fs::temp_directory_path();
}

fs::path expand_user(const std::string& path) {
    if (path == "~") return home_dir();
    if (path.rfind("~/", 0) == 0) return home_dir() / path.substr(2);
    return fs::path(path);
}

Result<void> ensure_directory(const fs::path& dir) {
    std::error_code ec;
    fs::create_directories(dir, ec);
    if (ec) {
        return Result<void>::Err(fmt::format("Cannot create directory {}: {}",
                                             dir.string(), ec.message()));
    }
    return Result<void>::Ok();
}

std::optional<std::string> env_value(const char* name) {
    const char* v = std::getenv(name);
    if (!v) return std::nullopt;
    return std::string(v);
}

void sleep_ms(int ms) {
    std::this_thread::sleep_for(std::chrono::milliseconds(ms));
}

} // namespace platform
