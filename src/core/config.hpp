#pragma once

#include <string>
#include <vector>
#include <map>
#include <chrono>
#include <optional>
#include <filesystem>
#include "types.hpp"
#include "constants.hpp"

namespace fs = std::filesystem;

enum class Transport {
    kPty,        // local ssh/telnet client on a pseudo terminal
    kLibssh2,    // in-process ssh for the first hop
};

// Tunables of one connection. Defaults match the built-in constants.
struct Settings {
    std::chrono::milliseconds connect_timeout{CONNECT_TIMEOUT_SECS * 1000};
    std::chrono::milliseconds command_timeout{COMMAND_TIMEOUT_SECS * 1000};
    std::chrono::milliseconds discovery_timeout{DISCOVERY_TIMEOUT_SECS * 1000};
    std::chrono::milliseconds reload_timeout{RELOAD_TIMEOUT_SECS * 1000};
    std::chrono::milliseconds exit_timeout{EXIT_TIMEOUT_SECS * 1000};
    std::chrono::milliseconds enable_timeout{ENABLE_TIMEOUT_SECS * 1000};
    int password_retries = PASSWORD_RETRIES;
    int login_nudges = LOGIN_NUDGES;
    int reconnect_attempts = RECONNECT_MAX_ATTEMPTS;
    std::chrono::milliseconds reconnect_backoff{RECONNECT_BACKOFF_MS};
    int max_transitions = FSM_MAX_TRANSITIONS;
    Transport transport = Transport::kPty;
    std::string log_path;        // empty: default debug log location
    std::string log_level = "info";
    std::string session_log;     // raw device output; empty: not recorded
};

// Named device from the config file.
struct DeviceEntry {
    std::string url;
    std::vector<std::string> jumphosts;
};

class Config {
public:
    Config() = default;

    // Load global config from ~/.termhop/config.yaml
    static Result<Config> load_global();

    // Load global, then overlay ./termhop.yaml. Missing files give defaults.
    static Result<Config> load(const fs::path& project_dir = fs::current_path());

    // Parse YAML text on top of `base`.
    static Result<Config> parse(const std::string& yaml_text, const Config& base = Config());
    static Result<Config> load_file(const fs::path& path, const Config& base = Config());

    const Settings& settings() const { return settings_; }
    Settings& mutable_settings() { return settings_; }
    const std::map<std::string, DeviceEntry>& devices() const { return devices_; }
    std::optional<DeviceEntry> device(const std::string& name) const;

private:
    Settings settings_;
    std::map<std::string, DeviceEntry> devices_;

    friend class ConfigBuilder;
};

bool global_config_exists();
bool project_config_exists(const fs::path& dir = fs::current_path());

fs::path get_global_config_dir();
fs::path get_global_config_path();
fs::path get_project_config_path(const fs::path& dir = fs::current_path());

Result<void> create_default_global_config();

const char* transport_name(Transport transport);
