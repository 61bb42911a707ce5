#include "config.hpp"
#include "constants.hpp"
#include <platform/platform.hpp>
#include <yaml-cpp/yaml.h>
#include <fstream>
#include <sstream>

namespace fs = std::filesystem;

bool global_config_exists() {
    return fs::exists(get_global_config_path());
}

fs::path get_global_config_dir() {
    return platform::home_dir() / CONFIG_DIR_NAME;
}

fs::path get_global_config_path() {
    return get_global_config_dir() / CONFIG_FILE_NAME;
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

    const char* default_config = R"(# rterm configuration

# Defaults for :connect (can be overridden on the command line)
connection:
  host: ""
  port: 22
  user: ""
  timeout: 10                      # TCP connect / SSH handshake timeout (seconds)

session:
  connect_timeout: 15              # Give up waiting for the connection after N seconds
  merge_messages: true             # Merge consecutive remote output into one record

# Optional: extra regexes that mark a line as a password prompt
prompts:
  extra_patterns: []

log:
  enabled: true
  # path: "/tmp/rterm_debug.log"
)";

    std::ofstream out(config_path);
    if (!out) {
        return Result<void>::Err("Failed to create config file at " + config_path.string());
    }
    out << default_config;
    return Result<void>::Ok();
}

static ConnectionConfig parse_connection_config(const YAML::Node& node) {
    ConnectionConfig conn;
    conn.host = node["host"].as<std::string>("");
    conn.port = node["port"].as<int>(DEFAULT_SSH_PORT);
    conn.user = node["user"].as<std::string>("");
    conn.timeout = node["timeout"].as<int>(SSH_CONNECT_TIMEOUT_SECS);
    return conn;
}

static SessionConfig parse_session_config(const YAML::Node& node) {
    SessionConfig session;
    session.connect_timeout = node["connect_timeout"].as<int>(CONNECT_WATCHDOG_SECS);
    session.merge_messages = node["merge_messages"].as<bool>(true);
    if (session.connect_timeout <= 0) {
        session.connect_timeout = CONNECT_WATCHDOG_SECS;
    }
    return session;
}

static PromptConfig parse_prompt_config(const YAML::Node& node) {
    PromptConfig prompts;
    auto patterns = node["extra_patterns"];
    if (patterns && patterns.IsSequence()) {
        prompts.extra_patterns = patterns.as<std::vector<std::string>>(std::vector<std::string>());
    } else if (patterns && patterns.IsScalar()) {
        prompts.extra_patterns.push_back(patterns.as<std::string>());
    }
    return prompts;
}

static LogConfig parse_log_config(const YAML::Node& node) {
    LogConfig log;
    log.enabled = node["enabled"].as<bool>(true);
    log.path = node["path"].as<std::string>("");
    return log;
}

Result<Config> Config::parse(const std::string& yaml_text) {
    try {
        YAML::Node root = YAML::Load(yaml_text);
        if (root && !root.IsNull() && !root.IsMap()) {
            return Result<Config>::Err("Config root must be a mapping");
        }

        Config config;
        config.connection_ = parse_connection_config(
            root["connection"] ? root["connection"] : YAML::Node());
        config.session_ = parse_session_config(
            root["session"] ? root["session"] : YAML::Node());
        config.prompts_ = parse_prompt_config(
            root["prompts"] ? root["prompts"] : YAML::Node());
        config.log_ = parse_log_config(
            root["log"] ? root["log"] : YAML::Node());

        return Result<Config>::Ok(config);
    } catch (const std::exception& e) {
        return Result<Config>::Err(std::string("Failed to parse config: ") + e.what());
    }
}

Result<Config> Config::load_file(const fs::path& path) {
    std::ifstream in(path);
    if (!in) {
        return Result<Config>::Err("Config not found at " + path.string());
    }
    std::stringstream ss;
    ss << in.rdbuf();

    auto result = parse(ss.str());
    if (result.is_err()) {
        result.error += " (" + path.string() + ")";
    }
    return result;
}

Result<Config> Config::load_global() {
    if (!global_config_exists()) {
        return Result<Config>::Err("Global config not found at " + get_global_config_path().string());
    }
    return load_file(get_global_config_path());
}

Result<Config> Config::load() {
    if (!global_config_exists()) {
        return Result<Config>::Ok(Config());
    }
    return load_global();
}
