#include "command.hpp"
#include "fsm.hpp"
#include <core/utils.hpp>
#include <fmt/format.h>
#include <regex>

namespace {

enum CommandState {
    kWaiting = 0,
    kErrorSeen = 1,
};

} // namespace

CommandExecutor::CommandExecutor(ExpectMatcher& io, const PlatformProfile& profile,
                                 std::string prompt_regex, std::vector<std::string> jump_prompt_regexes,
                                 Logger log, int hop)
    : io_(io), profile_(profile), prompt_regex_(std::move(prompt_regex)),
      jump_prompts_(std::move(jump_prompt_regexes)), log_(std::move(log)), hop_(hop) {}

Result<std::string> CommandExecutor::execute(const CommandRequest& request) {
    const std::string& cmd = request.command;
    const std::string host = log_.host();

    std::string stale = io_.drain();
    if (!stale.empty()) log_.debug("drain", printable(stale), hop_);

    std::vector<Rule> rules;
    if (!request.wait_for.empty()) {
        rules.push_back(on_pattern(request.wait_for, done()).in({kWaiting}));
    }
    std::string errors = profile_.command_error_pattern();
    if (!errors.empty()) {
        rules.push_back(on_pattern(errors).in({kWaiting}).then(kErrorSeen));
    }
    rules.push_back(on_pattern("Connection closed by foreign host|Connection to \\S+ closed",
                               fail_with(ErrorKind::kConnection, "Device disconnected")));
    if (!profile_.more.empty()) {
        rules.push_back(on_pattern(profile_.more, [](FsmContext& ctx) {
            ctx.send(" ");
            return Signal::kContinue;
        }));
    }
    rules.push_back(on_pattern("Press RETURN to get started",
                               fail_with(ErrorKind::kConnection, "Session reset by the device")));
    rules.push_back(on_pattern(prompt_regex_, done()).in({kWaiting}));
    rules.push_back(on_pattern(prompt_regex_,
                               fail_with(ErrorKind::kCommandSyntax, "Command syntax error"))
                        .in({kErrorSeen}));
    for (const auto& jump : jump_prompts_) {
        rules.push_back(on_pattern(jump, fail_with(ErrorKind::kConnection,
                                                   "Received the jump host prompt")));
    }
    rules.push_back(on_timeout(fail_with(ErrorKind::kCommandTimeout, "Timeout waiting for prompt"))
                        .in({kWaiting}));
    rules.push_back(on_timeout(fail_with(ErrorKind::kCommandSyntax, "Command syntax error"))
                        .in({kErrorSeen}));
    rules.push_back(on_closed(fail_with(ErrorKind::kConnection, "Unexpected device disconnect")));

    log_.debug("command", cmd, hop_);
    if (!io_.send(cmd + "\n")) {
        return Result<std::string>::Err(make_error(ErrorKind::kConnection,
                                                   "Unable to write to the session", host, hop_));
    }

    Fsm fsm("command", io_, std::move(rules), request.timeout);
    // Every answered pager is a transition, so long output must not hit a bound.
    fsm.set_max_transitions(0);
    fsm.set_logger(&log_, hop_);
    if (deadline_) fsm.set_deadline(*deadline_);
    FsmOutcome outcome = fsm.run();

    if (outcome.ok()) {
        return Result<std::string>::Ok(clean_output(outcome.text, cmd, profile_.more));
    }

    Error err;
    switch (outcome.status) {
    case FsmStatus::kTimeout:
        err = outcome.state == kErrorSeen
            ? make_error(ErrorKind::kCommandSyntax, "Command syntax error")
            : make_error(ErrorKind::kCommandTimeout, "Timeout waiting for prompt");
        break;
    case FsmStatus::kStreamClosed:
        err = make_error(ErrorKind::kConnection, "Unexpected device disconnect");
        break;
    case FsmStatus::kLooped:
        err = make_error(ErrorKind::kCommand, "Too many transitions");
        break;
    default:
        err = outcome.error ? *outcome.error
                            : make_error(ErrorKind::kConnection, fsm_status_name(outcome.status));
        break;
    }
    err.host = host;
    if (is_command_error(err.kind)) {
        err.command = cmd;
    } else {
        err.hop = hop_;
    }
    log_.debug("command", fmt::format("'{}' failed: {}", cmd, err.message), hop_);
    return Result<std::string>::Err(err);
}

std::string clean_output(const std::string& raw, const std::string& command,
                         const std::string& more_pattern) {
    std::string text = erase_all(raw, "\r");
    if (!more_pattern.empty()) {
        text = std::regex_replace(text, std::regex(" ?(?:" + more_pattern + ") ?"), "");
    }
    // Pager leftovers: backspaces and the blanks written over the marker
    text = std::regex_replace(text, std::regex("\\x08+ *\\x08*"), "");

    // Echo of the command is the first line
    size_t nl = text.find('\n');
    std::string first = nl == std::string::npos ? text : text.substr(0, nl);
    std::string bare = trimmed(first);
    if (bare.empty() || (!command.empty() && bare.size() >= trimmed(command).size() &&
                         bare.compare(bare.size() - trimmed(command).size(),
                                      std::string::npos, trimmed(command)) == 0)) {
        text = nl == std::string::npos ? std::string() : text.substr(nl + 1);
    }

    while (!text.empty() && text.back() == '\n') text.pop_back();
    return text;
}
