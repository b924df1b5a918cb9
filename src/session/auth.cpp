#include "auth.hpp"
#include "fsm.hpp"
#include "platform_profile.hpp"
#include <core/utils.hpp>
#include <fmt/format.h>

const char* const kDevicePromptPattern =
    "(?:^|[\\r\\n])([\\w\\-\\.\\/:@]+(?:\\([^()\\r\\n]*\\))?[#>]) ?$";
const char* const kShellPromptPattern =
    "(?:^|[\\r\\n])([^\\r\\n]*[\\w\\]~\\)][\\$#>%]) ?$";

namespace {

const char* const kHostKey = "Are you sure you want to continue connecting[^\\r\\n]*\\?";
const char* const kHostKeyFailed =
    "Host key verification failed|REMOTE HOST IDENTIFICATION HAS CHANGED";
const char* const kUnableToConnect =
    "Connection refused|No route to host|Network is unreachable|Host is unreachable|"
    "Connection timed out|Operation timed out|Could not resolve hostname|"
    "Name or service not known|[Uu]nknown host|nodename nor servname|"
    "Connection reset by peer|Unable to connect to remote host|"
    "% Destination unreachable|% Connection refused by remote host|"
    "% Unknown command or computer name|% Bad IP address or host name|"
    "% Invalid input detected";
const char* const kStandby = "Standby console disabled|This \\(D?RP\\) Node is not ready or active";
const char* const kTelnetEscape = "Escape character is[^\\r\\n]*";
const char* const kPressReturn = "Press RETURN to get started";
const char* const kMore = "--More--";
const char* const kUsername = "(?:^|[\\r\\n])\\s*(?:[Uu]sername|[Ll]ogin|[Uu]ser [Nn]ame|[Uu]ser): ?$";
const char* const kPassword = "[Pp]ass(?:word|code|phrase)[^\\r\\n:]*: ?$";
const char* const kKeyRejected = "Permission denied \\(|Too many authentication failures";
const char* const kAuthFailed =
    "Permission denied(?!, please try again)|% Authentication failed|Authentication failed|"
    "% Login invalid|Login incorrect|% Bad passwords|Access denied|not authorized";
const char* const kClosed = "Connection closed by foreign host|Connection to \\S+ closed";

std::string last_line(const std::string& text) {
    auto lines = split_lines(text);
    for (auto it = lines.rbegin(); it != lines.rend(); ++it) {
        std::string t = trimmed(*it);
        if (!t.empty()) return t;
    }
    return "";
}

} // namespace

const char* login_stage_name(LoginStage stage) {
    switch (stage) {
    case LoginStage::kAwaitingBanner:       return "AwaitingBanner";
    case LoginStage::kNegotiatingLogin:     return "NegotiatingLogin";
    case LoginStage::kAwaitingPrompt:       return "AwaitingPrompt";
    case LoginStage::kPrivilegeNegotiation: return "PrivilegeNegotiation";
    case LoginStage::kReady:                return "Ready";
    }
    return "unknown";
}

LoginNegotiator::LoginNegotiator(HopSession& session, CredentialResolver& resolver,
                                 const Settings& settings, const Logger& log)
    : session_(session), resolver_(resolver), settings_(settings), log_(log) {}

Result<std::string> LoginNegotiator::password() {
    const Hop& hop = session_.hop();
    if (hop.password) return Result<std::string>::Ok(*hop.password);
    return resolver_.resolve(hop.username.value_or(""), hop.host);
}

Result<LoginOutcome> LoginNegotiator::negotiate() {
    const Hop& hop = session_.hop();
    const int index = session_.index();
    const int kBanner = static_cast<int>(LoginStage::kAwaitingBanner);
    const int kLogin = static_cast<int>(LoginStage::kNegotiatingLogin);

    LoginOutcome outcome;
    int nudges_left = settings_.login_nudges;
    std::string reached_line;

    auto fail = [&hop, index](FsmContext& ctx, ErrorKind kind, const std::string& message) {
        return ctx.fail(make_error(kind, message, hop.host, index));
    };

    std::vector<Rule> rules;
    rules.push_back(on_pattern(kHostKey, send_line("yes")).named("host-key"));
    rules.push_back(on_pattern(kHostKeyFailed, [&](FsmContext& ctx) {
        return fail(ctx, ErrorKind::kConnection, "Host key verification failed");
    }).named("host-key-failed"));
    rules.push_back(on_pattern(kUnableToConnect, [&](FsmContext& ctx) {
        return fail(ctx, ErrorKind::kConnection, "Unable to connect: " + trimmed(ctx.matched));
    }).in({kBanner}).named("unable-to-connect"));
    rules.push_back(on_pattern(kStandby, [&](FsmContext& ctx) {
        return fail(ctx, ErrorKind::kConnection, "Standby console, connect to the active one");
    }).named("standby"));
    rules.push_back(on_pattern(kTelnetEscape).in({kBanner}).named("telnet-escape"));
    rules.push_back(on_pattern(kPressReturn, send_line("")).named("press-return"));
    rules.push_back(on_pattern(kMore, [](FsmContext& ctx) {
        ctx.send("q");
        return Signal::kContinue;
    }).in({kBanner}).named("more"));
    rules.push_back(on_pattern(kUsername, [&](FsmContext& ctx) {
        if (outcome.passwords_sent >= settings_.password_retries) {
            return fail(ctx, ErrorKind::kConnectionAuthentication,
                        fmt::format("Authentication failed after {} attempts", outcome.passwords_sent));
        }
        if (!hop.username || hop.username->empty()) {
            return fail(ctx, ErrorKind::kConnectionAuthentication, "Username not provided");
        }
        log_.debug("login", "sending username", index);
        outcome.credentials_sent = true;
        ctx.send_line(*hop.username);
        return Signal::kContinue;
    }).then(kLogin).named("username"));
    rules.push_back(on_pattern(kPassword, [&](FsmContext& ctx) {
        if (outcome.passwords_sent >= settings_.password_retries) {
            return fail(ctx, ErrorKind::kConnectionAuthentication,
                        fmt::format("Authentication failed after {} attempts", outcome.passwords_sent));
        }
        auto pw = password();
        if (pw.is_err()) {
            Error err = pw.error;
            err.kind = ErrorKind::kConnectionAuthentication;
            return fail(ctx, err.kind, err.message);
        }
        outcome.passwords_sent++;
        outcome.credentials_sent = true;
        log_.debug("login", fmt::format("sending password (attempt {})", outcome.passwords_sent), index);
        ctx.send_line(pw.value);
        return Signal::kContinue;
    }).then(kLogin).named("password"));
    rules.push_back(on_pattern(kKeyRejected, [&](FsmContext& ctx) {
        return fail(ctx, ErrorKind::kConnectionAuthentication,
                    "Authentication failed: " + trimmed(ctx.matched));
    }).named("key-rejected"));
    rules.push_back(on_pattern(kAuthFailed, [&](FsmContext& ctx) {
        return fail(ctx, ErrorKind::kConnectionAuthentication,
                    "Authentication failed: " + trimmed(ctx.matched));
    }).in({kLogin}).named("auth-failed"));
    rules.push_back(on_pattern(kClosed, [&](FsmContext& ctx) {
        return fail(ctx, ErrorKind::kConnection, "Session closed: " + trimmed(ctx.matched));
    }).named("closed-text"));
    for (const auto& prev : previous_prompts_) {
        rules.push_back(on_pattern(prev, [&](FsmContext& ctx) {
            std::string why = last_line(ctx.before);
            return fail(ctx, ErrorKind::kConnection,
                        why.empty() ? "Received the previous hop prompt"
                                    : "Received the previous hop prompt after: " + why);
        }).named("previous-prompt"));
    }

    auto reached = [&](FsmContext& ctx) {
        reached_line = ctx.groups.empty() ? trimmed(ctx.matched) : trimmed(ctx.groups[0]);
        return Signal::kDone;
    };
    if (is_target_) rules.push_back(on_pattern(kDevicePromptPattern, reached).named("device-prompt"));
    rules.push_back(on_pattern(kShellPromptPattern, reached).named("shell-prompt"));

    rules.push_back(on_timeout([&](FsmContext& ctx) {
        if (nudges_left > 0) {
            nudges_left--;
            log_.debug("login", "no response, sending newline", index);
            ctx.send_line("");
            return Signal::kContinue;
        }
        return fail(ctx, ErrorKind::kConnectionTimeout,
                    fmt::format("Timeout in stage {}", login_stage_name(static_cast<LoginStage>(ctx.state))));
    }));
    rules.push_back(on_closed([&](FsmContext& ctx) {
        std::string why = last_line(ctx.before);
        return fail(ctx, ErrorKind::kConnection,
                    why.empty() ? "Session closed unexpectedly" : "Session closed: " + why);
    }));

    Fsm fsm("login", session_.io(), std::move(rules), settings_.connect_timeout);
    fsm.set_max_transitions(settings_.max_transitions);
    fsm.set_logger(&log_, index);
    if (deadline_) fsm.set_deadline(*deadline_);

    FsmOutcome result = fsm.run();
    if (!result.ok()) {
        Error err;
        if (result.error) {
            err = *result.error;
        } else if (result.status == FsmStatus::kTimeout) {
            err = make_error(ErrorKind::kConnectionTimeout, "Discovery timeout reached");
        } else {
            err = make_error(ErrorKind::kConnection, fsm_status_name(result.status));
        }
        err.host = hop.host;
        err.hop = index;
        return Result<LoginOutcome>::Err(err);
    }

    outcome.prompt = reached_line;
    outcome.banner = result.text;
    outcome.console = !outcome.credentials_sent && !session_.io().stream().authenticated();
    return Result<LoginOutcome>::Ok(outcome);
}

// ── Privileged mode ──────────────────────────────────────────

Result<std::string> negotiate_enable(ExpectMatcher& io, const std::string& prompt,
                                     const std::string& enable_password,
                                     std::chrono::milliseconds timeout,
                                     const Logger& log, int hop) {
    enum { kSent = 0, kPasswordSent = 1 };

    std::string base = trimmed(prompt);
    if (!base.empty() && (base.back() == '>' || base.back() == '#')) base.pop_back();
    std::string privileged = "(?:^|[\\r\\n])(" + regex_escape(base) + "#) ?$";
    std::string unprivileged = "(?:^|[\\r\\n])(" + regex_escape(base) + ">) ?$";
    std::string reached;

    std::vector<Rule> rules;
    rules.push_back(on_pattern(kPassword, send_line(enable_password)).in({kSent}).then(kPasswordSent));
    rules.push_back(on_pattern(kPassword, fail_with(ErrorKind::kConnectionAuthentication,
                                                    "Incorrect enable password"))
                        .in({kPasswordSent}));
    rules.push_back(on_pattern("% ?(?:Access denied|Bad secrets|No password set|Error in authentication)",
                               fail_with(ErrorKind::kConnectionAuthentication,
                                         "Unable to get privileged mode")));
    rules.push_back(on_pattern(privileged, [&reached](FsmContext& ctx) {
        reached = ctx.groups.empty() ? trimmed(ctx.matched) : ctx.groups[0];
        return Signal::kDone;
    }));
    rules.push_back(on_pattern(unprivileged, fail_with(ErrorKind::kConnectionAuthentication,
                                                       "Unable to get privileged mode")));
    rules.push_back(on_timeout(fail_with(ErrorKind::kConnectionAuthentication,
                                         "Unable to get privileged mode")));
    rules.push_back(on_closed(fail_with(ErrorKind::kConnection, "Device disconnected")));

    std::string stale = io.drain();
    if (!stale.empty()) log.debug("drain", printable(stale), hop);
    if (!io.send("enable\n")) {
        return Result<std::string>::Err(make_error(ErrorKind::kConnection,
                                                   "Unable to write to the session", log.host(), hop));
    }

    Fsm fsm("enable", io, std::move(rules), timeout);
    fsm.set_logger(&log, hop);
    FsmOutcome result = fsm.run();
    if (!result.ok()) {
        Error err = result.error ? *result.error
                                 : make_error(ErrorKind::kConnectionAuthentication,
                                              "Unable to get privileged mode");
        err.host = log.host();
        err.hop = hop;
        return Result<std::string>::Err(err);
    }
    log.info("enable", "privileged mode reached", hop);
    return Result<std::string>::Ok(reached);
}
