#include "config.hpp"
#include "constants.hpp"
#include <platform/platform.hpp>
#include <yaml-cpp/yaml.h>
#include <fstream>
#include <algorithm>

namespace fs = std::filesystem;

static const char* const LOG_LEVELS[] = {"error", "warn", "info", "debug", "trace"};

bool is_valid_log_level(const std::string& level) {
    return std::find(std::begin(LOG_LEVELS), std::end(LOG_LEVELS), level) != std::end(LOG_LEVELS);
}

bool global_config_exists() {
    return fs::exists(get_global_config_path());
}

bool project_config_exists(const fs::path& dir) {
    return fs::exists(get_project_config_path(dir));
}

fs::path get_global_config_dir() {
    return platform::home_dir() / GLOBAL_CONFIG_DIR;
}

fs::path get_global_config_path() {
    return get_global_config_dir() / CONFIG_FILE_NAME;
}

fs::path get_project_config_path(const fs::path& dir) {
    return dir / PROJECT_CONFIG_NAME;
}

fs::path resolve_working_dir(const SessionConfig& config) {
    if (config.working_dir.empty()) {
        return platform::home_dir() / DEFAULT_WORKDIR_NAME;
    }
    return platform::expand_user(config.working_dir);
}

Result<void> create_default_global_config() {
    fs::path config_path = get_global_config_path();

    // Don't overwrite existing config
    if (fs::exists(config_path)) {
        return Result<void>::Ok();
    }

    std::error_code ec;
    fs::create_directories(config_path.parent_path(), ec);
    if (ec) {
        return Result<void>::Err("Failed to create " + config_path.parent_path().string() +
                                 ": " + ec.message());
    }

    const char* default_config = R"(# qbridge configuration
# Project-local overrides go in ./qbridge.yaml

executable: "q"                    # chat program (resolved via PATH)
log_level: "info"                  # error | warn | info | debug | trace
working_dir: "~/amazon-q"          # created if missing
debug: false                       # write a diagnostic log per session
log_dir: "logs"

# fs_read is always trusted
trust:
  fs_write: false
  execute_bash: false

# Turn protocol heuristics (milliseconds)
timings:
  poll: 1000
  prompt_quiet: 500
  silence_done: 5000
  kick_after: 3000
  turn_deadline: 60000
  startup_poll: 500
  startup_quiet: 700
  startup_deadline: 20000
  shutdown_wait: 2000
)";

    try {
        std::ofstream out(config_path);
        if (!out) {
            return Result<void>::Err("Failed to create config file at " + config_path.string());
        }
        out << default_config;
        out.close();
        return Result<void>::Ok();
    } catch (const std::exception& e) {
        return Result<void>::Err("Failed to write config file: " + std::string(e.what()));
    }
}

static void overlay_ms(const YAML::Node& node, const char* key, std::chrono::milliseconds& out) {
    if (node[key] && node[key].IsScalar()) {
        out = std::chrono::milliseconds(node[key].as<long>());
    }
}

static void overlay_timings(const YAML::Node& node, TurnTimings& t) {
    overlay_ms(node, "poll", t.poll_interval);
    overlay_ms(node, "prompt_quiet", t.prompt_quiet);
    overlay_ms(node, "silence_done", t.silence_done);
    overlay_ms(node, "kick_after", t.kick_after);
    overlay_ms(node, "turn_deadline", t.turn_deadline);
    overlay_ms(node, "startup_poll", t.startup_poll);
    overlay_ms(node, "startup_quiet", t.startup_quiet);
    overlay_ms(node, "startup_deadline", t.startup_deadline);
    overlay_ms(node, "shutdown_wait", t.shutdown_wait);
}

static void overlay_session(const YAML::Node& root, SessionConfig& s) {
    s.executable = root["executable"].as<std::string>(s.executable);
    s.chat_subcommand = root["subcommand"].as<std::string>(s.chat_subcommand);
    s.log_level = root["log_level"].as<std::string>(s.log_level);
    s.working_dir = root["working_dir"].as<std::string>(s.working_dir);
    s.debug = root["debug"].as<bool>(s.debug);
    s.log_dir = root["log_dir"].as<std::string>(s.log_dir);

    if (root["trust"] && root["trust"].IsMap()) {
        const auto& trust = root["trust"];
        s.trust_fs_write = trust["fs_write"].as<bool>(s.trust_fs_write);
        s.trust_execute_bash = trust["execute_bash"].as<bool>(s.trust_execute_bash);
    }

    if (root["timings"] && root["timings"].IsMap()) {
        overlay_timings(root["timings"], s.timings);
    }
}

static Result<Config> overlay_node(const YAML::Node& root, const Config& base) {
    Config config = base;
    if (root.IsNull()) {
        return Result<Config>::Ok(config);
    }
    if (!root.IsMap()) {
        return Result<Config>::Err("Config root must be a mapping");
    }

    overlay_session(root, config.session());

    if (!is_valid_log_level(config.session().log_level)) {
        return Result<Config>::Err("Invalid log_level '" + config.session().log_level +
                                   "' (expected error, warn, info, debug or trace)");
    }
    return Result<Config>::Ok(config);
}

Result<Config> Config::parse(const std::string& yaml_text, const Config& base) {
    try {
        return overlay_node(YAML::Load(yaml_text), base);
    } catch (const std::exception& e) {
        return Result<Config>::Err(std::string("Failed to parse config: ") + e.what());
    }
}

Result<Config> Config::load_global() {
    if (!global_config_exists()) {
        return Result<Config>::Ok(Config());
    }

    try {
        YAML::Node root = YAML::LoadFile(get_global_config_path().string());
        return overlay_node(root, Config());
    } catch (const std::exception& e) {
        return Result<Config>::Err(std::string("Failed to parse global config: ") + e.what());
    }
}

Result<Config> Config::load_project(const Config& base, const fs::path& dir) {
    if (!project_config_exists(dir)) {
        return Result<Config>::Ok(base);
    }

    try {
        YAML::Node root = YAML::LoadFile(get_project_config_path(dir).string());
        return overlay_node(root, base);
    } catch (const std::exception& e) {
        return Result<Config>::Err(std::string("Failed to parse project config: ") + e.what());
    }
}

Result<Config> Config::load(const fs::path& project_dir) {
    auto global_result = load_global();
    if (!global_result.is_ok()) {
        return global_result;
    }
    return load_project(global_result.value, project_dir);
}
