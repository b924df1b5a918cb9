#pragma once

#include <string>
#include <map>
#include <mutex>
#include <atomic>
#include <chrono>
#include <optional>
#include <core/types.hpp>
#include <core/hop_info.hpp>
#include <core/config.hpp>
#include <core/credentials.hpp>
#include <core/log.hpp>
#include "discovery.hpp"
#include "fsm.hpp"
#include "platform_profile.hpp"
#include "stream.hpp"

enum class ConnectionState {
    kDisconnected,
    kConnecting,
    kConnected,
    kExecuting,
    kDisconnecting,
};

const char* connection_state_name(ConnectionState state);

// One device reached through a chain of hops. Calls on one instance are
// serialized; separate instances share nothing but the profile registry.
class Connection {
public:
    Connection(std::string name, ConnectionTarget target, CredentialResolver& resolver,
               Settings settings = Settings(), LogSink sink = nullptr,
               StreamFactory factory = nullptr);
    ~Connection();

    Connection(const Connection&) = delete;
    Connection& operator=(const Connection&) = delete;

    // Connect, identify the device and disconnect again.
    Result<void> discovery();

    // Open the whole chain and keep it open. No-op when already connected.
    Result<void> connect();

    // Drop the chain and connect again, with exponential backoff between
    // attempts. max_attempts <= 0 uses the configured count.
    Result<void> reconnect(int max_attempts = 0);

    // Run a command on the target and return its output.
    Result<std::string> send(const std::string& command,
                             std::optional<std::chrono::milliseconds> timeout = std::nullopt,
                             const std::string& wait_for = "");

    // Like send(), but syntax errors and timeouts come back as a status
    // instead of an error.
    Result<CommandResult> run(const std::string& command,
                              std::optional<std::chrono::milliseconds> timeout = std::nullopt);

    // Send `command` and drive the target with a caller-built rule table.
    // The outcome reports how the run ended. An error means the device was
    // not connected or the session was lost, and the chain is closed.
    Result<FsmOutcome> run_fsm(const std::string& name, const std::string& command,
                               std::vector<Rule> rules, std::chrono::milliseconds timeout);

    // Enter privileged mode. Empty password: url, resolver, login password.
    Result<void> enable(const std::string& enable_password = "");

    // Reload the device. The session ends when the device goes down.
    Result<void> reload(bool save_config = true);

    // Close every hop, last first. Idempotent.
    void disconnect();

    void store_property(const std::string& key, const std::string& value);
    std::optional<std::string> get_property(const std::string& key) const;

    ConnectionState state() const { return state_.load(); }
    bool is_connected() const { return state_.load() == ConnectionState::kConnected; }
    const std::string& name() const { return name_; }
    const ConnectionTarget& target() const { return target_; }
    DeviceInfo device_info() const;
    std::string profile_name() const;

private:
    std::string name_;
    ConnectionTarget target_;
    CredentialResolver& resolver_;
    Settings settings_;
    Logger log_;
    StreamFactory factory_;

    mutable std::mutex mutex_;
    std::atomic<ConnectionState> state_{ConnectionState::kDisconnected};
    HopChain chain_;
    DeviceInfo info_;
    const PlatformProfile* profile_ = nullptr;
    std::string prompt_regex_;
    std::vector<std::string> jump_prompts_;
    std::map<std::string, std::string> properties_;

    Result<void> connect_locked();
    void teardown_locked();
    Result<std::string> execute_locked(const std::string& command,
                                       std::chrono::milliseconds timeout,
                                       const std::string& wait_for);
    HopSession& target_session() { return *chain_.back(); }
};

// Default transport for the configured settings.
StreamFactory make_stream_factory(const Settings& settings, CredentialResolver& resolver);
