#pragma once

#include <filesystem>
#include <optional>
#include <string>
#include <core/types.hpp>

namespace platform {

// $HOME, else the passwd entry for the current user, else the temp dir.
std::filesystem::path home_dir();

// "~" and "~/x" expand against home_dir(). Other paths pass through.
std::filesystem::path expand_user(const std::string& path);

// create_directories with the failure reported instead of thrown.
Result<void> ensure_directory(const std::filesystem::path& dir);

// Value of an environment variable, nullopt when unset.
std::optional<std::string> env_value(const char* name);

void sleep_ms(int ms);

} // namespace platform
