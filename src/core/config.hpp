#pragma once

#include <string>
#include <filesystem>
#include "types.hpp"

namespace fs = std::filesystem;

class Config {
public:
    // Load global config from ~/.rterm/config.yaml
    static Result<Config> load_global();

    // Load config from an explicit file
    static Result<Config> load_file(const fs::path& path);

    // Parse config from YAML text (used by load_file and tests)
    static Result<Config> parse(const std::string& yaml_text);

    // Global config if present, defaults otherwise
    static Result<Config> load();

    // Accessors
    const ConnectionConfig& connection() const { return connection_; }
    const SessionConfig& session() const { return session_; }
    const PromptConfig& prompts() const { return prompts_; }
    const LogConfig& log() const { return log_; }

public:
    Config() = default;

private:
    ConnectionConfig connection_;
    SessionConfig session_;
    PromptConfig prompts_;
    LogConfig log_;
};

// Helper to check if the global config exists
bool global_config_exists();

// Get paths
fs::path get_global_config_dir();
fs::path get_global_config_path();

// Create default global config
Result<void> create_default_global_config();
