#include "connection.hpp"
#include "auth.hpp"
#include "command.hpp"
#include "fsm.hpp"
#include "pty_stream.hpp"
#include "ssh_stream.hpp"
#include "transcript.hpp"
#include <core/utils.hpp>
#include <platform/platform.hpp>
#include <fmt/format.h>

const char* connection_state_name(ConnectionState state) {
    switch (state) {
    case ConnectionState::kDisconnected:  return "disconnected";
    case ConnectionState::kConnecting:    return "connecting";
    case ConnectionState::kConnected:     return "connected";
    case ConnectionState::kExecuting:     return "executing";
    case ConnectionState::kDisconnecting: return "disconnecting";
    }
    return "unknown";
}

StreamFactory make_stream_factory(const Settings& settings, CredentialResolver& resolver) {
    if (settings.transport == Transport::kLibssh2) {
        PasswordLookup lookup = [&resolver](const Hop& hop) {
            if (hop.password) return Result<std::string>::Ok(*hop.password);
            return resolver.resolve(hop.username.value_or(""), hop.host);
        };
        return ssh_stream_factory(lookup, static_cast<int>(settings.connect_timeout.count()));
    }
    return pty_stream_factory();
}

Connection::Connection(std::string name, ConnectionTarget target, CredentialResolver& resolver,
                       Settings settings, LogSink sink, StreamFactory factory)
    : name_(std::move(name)), target_(std::move(target)), resolver_(resolver),
      settings_(std::move(settings)),
      log_(sink ? std::move(sink) : null_log_sink(), target_.empty() ? name_ : target_.destination().host),
      factory_(factory ? std::move(factory) : make_stream_factory(settings_, resolver)) {
    if (!settings_.session_log.empty()) {
        factory_ = with_transcript(std::move(factory_), file_transcript_sink(settings_.session_log));
    }
}

Connection::~Connection() {
    disconnect();
}

// ── Connect / disconnect ─────────────────────────────────────

Result<void> Connection::connect() {
    std::lock_guard<std::mutex> lock(mutex_);
    return connect_locked();
}

Result<void> Connection::connect_locked() {
    if (state_ == ConnectionState::kConnected && !chain_.empty() && target_session().alive()) {
        return Result<void>::Ok();
    }
    teardown_locked();

    auto valid = validate_target(target_);
    if (valid.is_err()) {
        log_.error("connect-failed", valid.error.describe());
        return valid;
    }

    state_ = ConnectionState::kConnecting;
    log_.info("connect", fmt::format("{} via {}", name_, target_.display()));

    DiscoveryController controller(target_, resolver_, settings_, factory_, log_);
    auto found = controller.run();
    if (found.is_err()) {
        state_ = ConnectionState::kDisconnected;
        return Result<void>::Err(found.error);
    }

    chain_ = std::move(found.value.chain);
    info_ = found.value.info;
    profile_ = found.value.profile;
    prompt_regex_ = found.value.prompt_regex;
    jump_prompts_ = found.value.jump_prompt_regexes;
    state_ = ConnectionState::kConnected;
    log_.info("connect-success", fmt::format("{} connected, {} {} {}", name_, info_.hostname,
                                             info_.os_type, info_.os_version));
    return Result<void>::Ok();
}

Result<void> Connection::discovery() {
    std::lock_guard<std::mutex> lock(mutex_);
    bool was_connected = state_ == ConnectionState::kConnected;
    auto r = connect_locked();
    if (r.is_err()) return r;
    if (!was_connected) {
        teardown_locked();
    }
    log_.info("discovery", fmt::format("{}: {} {} {} {}", name_, info_.hostname, info_.family,
                                       info_.platform, info_.os_version));
    return Result<void>::Ok();
}

Result<void> Connection::reconnect(int max_attempts) {
    std::lock_guard<std::mutex> lock(mutex_);
    int attempts = max_attempts > 0 ? max_attempts : settings_.reconnect_attempts;
    auto backoff = settings_.reconnect_backoff;

    teardown_locked();
    Error last = make_error(ErrorKind::kConnectionTimeout, "No attempt made", target_.empty() ? "" : target_.destination().host);
    for (int attempt = 1; attempt <= attempts; ++attempt) {
        log_.info("connect", fmt::format("reconnect attempt {}/{}", attempt, attempts));
        auto r = connect_locked();
        if (r.is_ok()) return r;

        last = r.error;
        if (last.kind == ErrorKind::kInvalidHopInfo ||
            last.kind == ErrorKind::kConnectionAuthentication) {
            return r;
        }
        log_.warning("connect-failed", fmt::format("attempt {}: {}", attempt, last.describe()));
        if (attempt < attempts) {
            platform::sleep_ms(static_cast<int>(backoff.count()));
            backoff *= 2;
        }
    }

    Error err = make_error(ErrorKind::kConnectionTimeout,
                           fmt::format("Unable to reconnect after {} attempts: {}", attempts, last.message),
                           last.host, last.hop);
    return Result<void>::Err(err);
}

void Connection::disconnect() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (state_ == ConnectionState::kDisconnected && chain_.empty()) return;
    teardown_locked();
    log_.info("disconnect", name_ + " disconnected");
}

void Connection::teardown_locked() {
    if (chain_.empty()) {
        state_ = ConnectionState::kDisconnected;
        return;
    }
    state_ = ConnectionState::kDisconnecting;
    close_chain(chain_, settings_.exit_timeout);
    chain_.clear();
    state_ = ConnectionState::kDisconnected;
}

// ── Commands ─────────────────────────────────────────────────

Result<std::string> Connection::execute_locked(const std::string& command,
                                               std::chrono::milliseconds timeout,
                                               const std::string& wait_for) {
    if (state_ != ConnectionState::kConnected || chain_.empty()) {
        return Result<std::string>::Err(make_command_error(ErrorKind::kConnection,
                                                           "Device not connected", command, log_.host()));
    }

    state_ = ConnectionState::kExecuting;
    HopSession& session = target_session();
    CommandExecutor exec(session.io(), *profile_, prompt_regex_, jump_prompts_, log_, session.index());
    CommandRequest req;
    req.command = command;
    req.timeout = timeout;
    req.wait_for = wait_for;
    auto r = exec.execute(req);

    if (r.is_ok()) {
        state_ = ConnectionState::kConnected;
        log_.info("command-result", fmt::format("'{}': {} bytes", command, r.value.size()), session.index());
        return r;
    }

    if (is_command_error(r.error.kind)) {
        state_ = ConnectionState::kConnected;
        log_.warning("command-result", r.error.describe(), session.index());
        return r;
    }

    log_.error("command-result", r.error.describe(), session.index());
    r.error.command = command;
    teardown_locked();
    return r;
}

Result<std::string> Connection::send(const std::string& command,
                                     std::optional<std::chrono::milliseconds> timeout,
                                     const std::string& wait_for) {
    std::lock_guard<std::mutex> lock(mutex_);
    return execute_locked(command, timeout.value_or(settings_.command_timeout), wait_for);
}

Result<CommandResult> Connection::run(const std::string& command,
                                      std::optional<std::chrono::milliseconds> timeout) {
    auto r = send(command, timeout);
    CommandResult result;
    if (r.is_ok()) {
        result.output = r.value;
        return Result<CommandResult>::Ok(result);
    }
    switch (r.error.kind) {
    case ErrorKind::kCommandSyntax:
        result.status = CommandStatus::kSyntaxError;
        return Result<CommandResult>::Ok(result);
    case ErrorKind::kCommandTimeout:
        result.status = CommandStatus::kTimeout;
        return Result<CommandResult>::Ok(result);
    default:
        return Result<CommandResult>::Err(r.error);
    }
}

Result<FsmOutcome> Connection::run_fsm(const std::string& name, const std::string& command,
                                       std::vector<Rule> rules, std::chrono::milliseconds timeout) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (state_ != ConnectionState::kConnected || chain_.empty()) {
        return Result<FsmOutcome>::Err(make_command_error(ErrorKind::kConnection,
                                                          "Device not connected", command, log_.host()));
    }

    state_ = ConnectionState::kExecuting;
    HopSession& session = target_session();
    std::string stale = session.io().drain();
    if (!stale.empty()) log_.debug("drain", printable(stale), session.index());

    log_.info("fsm", fmt::format("{}: '{}'", name, command), session.index());
    if (!session.io().send(command + "\n")) {
        teardown_locked();
        Error err = make_error(ErrorKind::kConnection, "Unable to write to the session",
                               log_.host(), session.index());
        err.command = command;
        return Result<FsmOutcome>::Err(err);
    }

    Fsm fsm(name, session.io(), std::move(rules), timeout);
    fsm.set_logger(&log_, session.index());
    FsmOutcome outcome = fsm.run();

    if (outcome.status == FsmStatus::kStreamClosed || !session.alive()) {
        Error err = outcome.error && outcome.status != FsmStatus::kStreamClosed
            ? *outcome.error
            : make_error(ErrorKind::kConnection, "Unexpected device disconnect");
        err.host = log_.host();
        err.hop = session.index();
        err.command = command;
        log_.error("fsm", err.describe(), session.index());
        teardown_locked();
        return Result<FsmOutcome>::Err(err);
    }

    state_ = ConnectionState::kConnected;
    log_.debug("fsm", fmt::format("{}: {}", name, fsm_status_name(outcome.status)), session.index());
    return Result<FsmOutcome>::Ok(outcome);
}

Result<void> Connection::enable(const std::string& enable_password) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (state_ != ConnectionState::kConnected || chain_.empty()) {
        return Result<void>::Err(make_error(ErrorKind::kConnection, "Device not connected", log_.host()));
    }
    if (!profile_->supports_enable) {
        log_.info("enable", fmt::format("privileged mode not supported on {}", profile_->name));
        return Result<void>::Ok();
    }
    std::string prompt = trimmed(info_.prompt);
    if (!prompt.empty() && prompt.back() == '#') return Result<void>::Ok();

    HopSession& session = target_session();
    const Hop& hop = session.hop();
    std::string password = enable_password;
    if (password.empty()) {
        if (hop.enable_password) {
            password = *hop.enable_password;
        } else {
            auto pw = resolver_.resolve_enable(hop.username.value_or(""), hop.host);
            if (pw.is_ok()) {
                password = pw.value;
            } else if (hop.password) {
                password = *hop.password;
            }
        }
    }

    state_ = ConnectionState::kExecuting;
    auto reached = negotiate_enable(session.io(), prompt, password, settings_.enable_timeout,
                                    log_, session.index());
    if (reached.is_err()) {
        if (reached.error.kind == ErrorKind::kConnection) {
            teardown_locked();
        } else {
            state_ = ConnectionState::kConnected;
        }
        return Result<void>::Err(reached.error);
    }
    info_.prompt = reached.value;
    info_.mode = mode_from_prompt(info_.prompt);
    session.set_prompt(info_.prompt, prompt_regex_);
    state_ = ConnectionState::kConnected;
    return Result<void>::Ok();
}

Result<void> Connection::reload(bool save_config) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (state_ != ConnectionState::kConnected || chain_.empty()) {
        return Result<void>::Err(make_error(ErrorKind::kConnection, "Device not connected", log_.host()));
    }
    if (profile_->reload_command.empty()) {
        return Result<void>::Err(make_command_error(ErrorKind::kCommand,
                                                    "Reload not supported on this platform",
                                                    "reload", log_.host()));
    }

    enum { kAsked = 0, kReloading = 1 };
    const std::string& cmd = profile_->reload_command;
    HopSession& session = target_session();

    std::vector<Rule> rules;
    rules.push_back(on_pattern("System configuration has been modified\\. Save\\? ?\\[yes/no\\]:? ?",
                               send_line(save_config ? "yes" : "no")));
    rules.push_back(on_pattern("Proceed with reload\\? ?\\[confirm\\]|\\[confirm\\]", send_line(""))
                        .then(kReloading));
    rules.push_back(on_pattern("This command will reboot[^\\r\\n]*\\(y/n\\)\\? ?(?:\\[n\\])? ?|\\(y/n\\)\\? ?(?:\\[n\\])? ?$",
                               send_line("y"))
                        .then(kReloading));
    rules.push_back(on_pattern("\\[no,yes\\]:? ?", send_line("yes")).then(kReloading));
    std::string errors = profile_->command_error_pattern();
    if (!errors.empty()) {
        rules.push_back(on_pattern(errors, fail_with(ErrorKind::kCommandSyntax, "Reload rejected"))
                            .in({kAsked}));
    }
    rules.push_back(on_pattern("Connection closed by foreign host|Connection to \\S+ closed", done()));
    rules.push_back(on_pattern("Press RETURN to get started|System Bootstrap|rommon", done())
                        .in({kReloading}));
    for (const auto& jump : jump_prompts_) {
        rules.push_back(on_pattern(jump, done()));
    }
    rules.push_back(on_pattern(prompt_regex_, fail_with(ErrorKind::kCommand, "Reload did not start"))
                        .in({kAsked}));
    rules.push_back(on_closed(done()));
    rules.push_back(on_timeout(fail_with(ErrorKind::kCommandTimeout, "Timeout waiting for the reload")));

    state_ = ConnectionState::kExecuting;
    session.io().drain();
    log_.info("reload", fmt::format("'{}' (save: {})", cmd, save_config ? "yes" : "no"), session.index());
    if (!session.io().send(cmd + "\n")) {
        teardown_locked();
        return Result<void>::Err(make_error(ErrorKind::kConnection, "Unable to write to the session",
                                            log_.host(), session.index()));
    }

    Fsm fsm("reload", session.io(), std::move(rules), settings_.reload_timeout);
    fsm.set_logger(&log_, session.index());
    FsmOutcome outcome = fsm.run();

    if (!outcome.ok()) {
        Error err = outcome.error ? *outcome.error
                                  : make_error(ErrorKind::kCommandTimeout, "Timeout waiting for the reload");
        err.host = log_.host();
        err.command = cmd;
        log_.error("reload", err.describe(), session.index());
        if (is_connection_error(err.kind)) {
            teardown_locked();
        } else {
            state_ = ConnectionState::kConnected;
        }
        return Result<void>::Err(err);
    }

    // The device dropped the session; whatever is left of the chain goes too.
    log_.info("reload", "device is reloading", session.index());
    teardown_locked();
    return Result<void>::Ok();
}

// ── Properties and facts ─────────────────────────────────────

void Connection::store_property(const std::string& key, const std::string& value) {
    std::lock_guard<std::mutex> lock(mutex_);
    properties_[key] = value;
}

std::optional<std::string> Connection::get_property(const std::string& key) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = properties_.find(key);
    if (it == properties_.end()) return std::nullopt;
    return it->second;
}

DeviceInfo Connection::device_info() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return info_;
}

std::string Connection::profile_name() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return profile_ ? profile_->name : "";
}
