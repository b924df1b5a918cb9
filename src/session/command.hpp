#pragma once

#include <string>
#include <vector>
#include <chrono>
#include <optional>
#include <core/types.hpp>
#include <core/log.hpp>
#include "expect.hpp"
#include "platform_profile.hpp"

struct CommandRequest {
    std::string command;
    std::chrono::milliseconds timeout{60000};
    std::string wait_for;      // optional regex that ends the command instead of the prompt
};

// Runs one command on the device at the end of a chain and collects the
// output up to the next prompt.
class CommandExecutor {
public:
    CommandExecutor(ExpectMatcher& io, const PlatformProfile& profile,
                    std::string prompt_regex, std::vector<std::string> jump_prompt_regexes,
                    Logger log, int hop);

    void set_deadline(std::chrono::steady_clock::time_point deadline) { deadline_ = deadline; }

    // Ok: output without the echoed command line and the final prompt.
    // CommandSyntaxError / CommandTimeoutError leave the session usable;
    // ConnectionError means the chain is gone.
    Result<std::string> execute(const CommandRequest& request);

private:
    ExpectMatcher& io_;
    const PlatformProfile& profile_;
    std::string prompt_regex_;
    std::vector<std::string> jump_prompts_;
    Logger log_;
    int hop_;
    std::optional<std::chrono::steady_clock::time_point> deadline_;
};

// Drop the echoed command line, carriage returns, pager markers and the
// trailing blank line before the prompt.
std::string clean_output(const std::string& raw, const std::string& command,
                         const std::string& more_pattern);
