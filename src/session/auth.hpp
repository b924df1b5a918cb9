#pragma once

#include <string>
#include <vector>
#include <chrono>
#include <optional>
#include <core/types.hpp>
#include <core/config.hpp>
#include <core/credentials.hpp>
#include <core/log.hpp>
#include "hop_session.hpp"

// Login stages of one hop, in the order they are reached.
enum class LoginStage {
    kAwaitingBanner = 0,
    kNegotiatingLogin = 1,
    kAwaitingPrompt = 2,
    kPrivilegeNegotiation = 3,
    kReady = 4,
};

const char* login_stage_name(LoginStage stage);

struct LoginOutcome {
    std::string prompt;          // prompt line as printed, without trailing blanks
    std::string banner;          // everything the hop printed before the prompt
    int passwords_sent = 0;
    bool credentials_sent = false;
    bool console = false;        // prompt came without any credential exchange
};

// Drives one hop from "connect command sent" to its first prompt: answers
// host key questions, username and password prompts, and recognises the
// failure texts of ssh, telnet and Cisco clients.
class LoginNegotiator {
public:
    LoginNegotiator(HopSession& session, CredentialResolver& resolver,
                    const Settings& settings, const Logger& log);

    // Prompts of the hops already logged in. Seeing one means this hop failed
    // and the client fell back to the previous shell.
    void set_previous_prompts(std::vector<std::string> regexes) { previous_prompts_ = std::move(regexes); }
    void set_target(bool is_target) { is_target_ = is_target; }
    void set_deadline(std::chrono::steady_clock::time_point deadline) { deadline_ = deadline; }

    Result<LoginOutcome> negotiate();

private:
    HopSession& session_;
    CredentialResolver& resolver_;
    const Settings& settings_;
    const Logger& log_;
    std::vector<std::string> previous_prompts_;
    bool is_target_ = false;
    std::optional<std::chrono::steady_clock::time_point> deadline_;

    Result<std::string> password();
};

// "enable" on a device sitting at an unprivileged '>' prompt. Returns the
// privileged prompt. A second password prompt means the enable password was
// wrong.
Result<std::string> negotiate_enable(ExpectMatcher& io, const std::string& prompt,
                                     const std::string& enable_password,
                                     std::chrono::milliseconds timeout,
                                     const Logger& log, int hop);

// Prompt patterns used while logging in. Group 1 is the prompt text.
extern const char* const kDevicePromptPattern;
extern const char* const kShellPromptPattern;
