#pragma once

#include <string>
#include <vector>
#include <memory>
#include <chrono>
#include <core/types.hpp>
#include <core/hop_info.hpp>
#include <core/config.hpp>
#include <core/credentials.hpp>
#include <core/log.hpp>
#include "hop_session.hpp"
#include "platform_profile.hpp"
#include "stream.hpp"

using HopChain = std::vector<std::unique_ptr<HopSession>>;

struct DiscoveryResult {
    HopChain chain;
    DeviceInfo info;
    const PlatformProfile* profile = nullptr;
    std::string prompt_regex;                  // target prompt
    std::vector<std::string> jump_prompt_regexes;
};

// Opens every hop of a target in order and identifies the device at the
// end. On failure every hop opened so far is closed in reverse order and
// the error names the failing hop.
class DiscoveryController {
public:
    DiscoveryController(const ConnectionTarget& target, CredentialResolver& resolver,
                        const Settings& settings, StreamFactory factory, const Logger& log);

    Result<DiscoveryResult> run();

private:
    const ConnectionTarget& target_;
    CredentialResolver& resolver_;
    const Settings& settings_;
    StreamFactory factory_;
    const Logger& log_;
    std::chrono::steady_clock::time_point deadline_;

    // Privilege, paging and identity on the target.
    Result<void> prepare_target(HopSession& session, DiscoveryResult& result,
                                const std::string& banner);

    Result<std::string> run_command(HopSession& session, const DiscoveryResult& result,
                                    const std::string& command);

    Result<std::string> enable_password(const Hop& hop);
};

// Close hops last to first. Idempotent.
void close_chain(HopChain& chain, std::chrono::milliseconds timeout);
