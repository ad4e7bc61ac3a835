#pragma once

#include <string>
#include <filesystem>
#include "types.hpp"

namespace fs = std::filesystem;

class Config {
public:
    // Load global config from ~/.qbridge/config.yaml (defaults if absent)
    static Result<Config> load_global();

    // Overlay ./qbridge.yaml on top of an existing config
    static Result<Config> load_project(const Config& base, const fs::path& dir = fs::current_path());

    // Load both and combine (prefer project overrides)
    static Result<Config> load(const fs::path& project_dir = fs::current_path());

    // Parse YAML text on top of base. Keys absent from the text keep base values.
    static Result<Config> parse(const std::string& yaml_text, const Config& base = Config());

    const SessionConfig& session() const { return session_; }
    SessionConfig& session() { return session_; }

public:
    Config() = default;

private:
    SessionConfig session_;
};

// Helper to check if configs exist
bool global_config_exists();
bool project_config_exists(const fs::path& dir = fs::current_path());

// Get paths
fs::path get_global_config_dir();
fs::path get_global_config_path();
fs::path get_project_config_path(const fs::path& dir = fs::current_path());

// Create default global config
Result<void> create_default_global_config();

// True for error/warn/info/debug/trace
bool is_valid_log_level(const std::string& level);

// Working directory a session runs in: the configured one with ~ expanded,
// or ~/amazon-q when unset.
fs::path resolve_working_dir(const SessionConfig& config);
