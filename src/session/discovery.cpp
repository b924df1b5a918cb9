#include "discovery.hpp"
#include "auth.hpp"
#include "command.hpp"
#include <core/utils.hpp>
#include <fmt/format.h>

void close_chain(HopChain& chain, std::chrono::milliseconds timeout) {
    for (auto it = chain.rbegin(); it != chain.rend(); ++it) {
        (*it)->close(timeout);
    }
}

DiscoveryController::DiscoveryController(const ConnectionTarget& target, CredentialResolver& resolver,
                                         const Settings& settings, StreamFactory factory,
                                         const Logger& log)
    : target_(target), resolver_(resolver), settings_(settings),
      factory_(std::move(factory)), log_(log) {}

Result<DiscoveryResult> DiscoveryController::run() {
    auto valid = validate_target(target_);
    if (valid.is_err()) return Result<DiscoveryResult>::Err(valid.error);

    deadline_ = std::chrono::steady_clock::now() + settings_.discovery_timeout;
    DiscoveryResult result;

    auto give_up = [&](Error err, int index) {
        const Hop& hop = target_.hops[static_cast<size_t>(index - 1)];
        if (err.hop == 0) err.hop = index;
        if (err.host.empty()) err.host = hop.host;
        log_.error("connect-failed", err.describe(), index);
        close_chain(result.chain, settings_.exit_timeout);
        result.chain.clear();
        return Result<DiscoveryResult>::Err(err);
    };

    for (size_t i = 0; i < target_.hops.size(); ++i) {
        const Hop& hop = target_.hops[i];
        const int index = static_cast<int>(i) + 1;
        const bool is_target = i + 1 == target_.hops.size();

        log_.info("connect", fmt::format("connecting to {}", hop.display()), index);

        auto session = std::make_unique<HopSession>(hop, index, factory_, log_);
        HopSession* parent = result.chain.empty() ? nullptr : result.chain.back().get();
        auto opened = session->open(parent);
        if (opened.is_err()) return give_up(opened.error, index);
        result.chain.push_back(std::move(session));
        HopSession& current = *result.chain.back();

        LoginNegotiator login(current, resolver_, settings_, log_);
        login.set_target(is_target);
        login.set_previous_prompts(result.jump_prompt_regexes);
        login.set_deadline(deadline_);
        auto logged_in = login.negotiate();
        if (logged_in.is_err()) return give_up(logged_in.error, index);

        const LoginOutcome& outcome = logged_in.value;
        log_.debug("login", fmt::format("stage {}: prompt '{}'", login_stage_name(LoginStage::kAwaitingPrompt),
                                        printable(outcome.prompt)), index);

        if (!is_target) {
            std::string regex = exact_prompt_regex(outcome.prompt);
            current.set_prompt(outcome.prompt, regex);
            result.jump_prompt_regexes.push_back(regex);
            log_.info("connect-success", fmt::format("jump host ready, prompt '{}'", outcome.prompt), index);
            continue;
        }

        result.info.prompt = outcome.prompt;
        result.info.is_console = outcome.console;
        result.prompt_regex = prompt_regex_for(outcome.prompt);
        current.set_prompt(outcome.prompt, result.prompt_regex);
        result.profile = &ProfileRegistry::builtin().match(outcome.banner, outcome.prompt);

        auto prepared = prepare_target(current, result, outcome.banner);
        if (prepared.is_err()) return give_up(prepared.error, index);

        log_.info("connect-success",
                  fmt::format("{} ({}) prompt '{}'{}", result.info.hostname, result.profile->name,
                              result.info.prompt, result.info.is_console ? ", console" : ""),
                  index);
    }

    return Result<DiscoveryResult>::Ok(std::move(result));
}

Result<std::string> DiscoveryController::enable_password(const Hop& hop) {
    if (hop.enable_password) return Result<std::string>::Ok(*hop.enable_password);
    auto pw = resolver_.resolve_enable(hop.username.value_or(""), hop.host);
    if (pw.is_ok()) return pw;
    if (hop.password) return Result<std::string>::Ok(*hop.password);
    return pw;
}

Result<std::string> DiscoveryController::run_command(HopSession& session,
                                                     const DiscoveryResult& result,
                                                     const std::string& command) {
    CommandExecutor exec(session.io(), *result.profile, result.prompt_regex,
                         result.jump_prompt_regexes, log_, session.index());
    exec.set_deadline(deadline_);
    CommandRequest req;
    req.command = command;
    req.timeout = settings_.command_timeout;
    return exec.execute(req);
}

Result<void> DiscoveryController::prepare_target(HopSession& session, DiscoveryResult& result,
                                                 const std::string& banner) {
    const Hop& hop = session.hop();
    const int index = session.index();
    DeviceInfo& info = result.info;

    // Privilege
    std::string prompt = trimmed(info.prompt);
    if (result.profile->supports_enable && !prompt.empty() && prompt.back() == '>') {
        auto pw = enable_password(hop);
        if (pw.is_err()) return Result<void>::Err(pw.error);
        log_.debug("login", fmt::format("stage {}", login_stage_name(LoginStage::kPrivilegeNegotiation)), index);
        auto reached = negotiate_enable(session.io(), prompt, pw.value, settings_.enable_timeout, log_, index);
        if (reached.is_err()) return Result<void>::Err(reached.error);
        info.prompt = reached.value;
        session.set_prompt(info.prompt, result.prompt_regex);
    }

    info.hostname = hostname_from_prompt(info.prompt);
    info.mode = mode_from_prompt(info.prompt);
    info.profile = result.profile->name;
    info.os_type = result.profile->os_type;

    auto disable_paging = [&](const PlatformProfile& profile) -> Result<void> {
        for (const auto& cmd : profile.paging_disable) {
            auto r = run_command(session, result, cmd);
            if (r.is_ok()) continue;
            if (is_command_error(r.error.kind)) {
                log_.warning("terminal", fmt::format("'{}' rejected: {}", cmd, r.error.message), index);
                continue;
            }
            return Result<void>::Err(r.error);
        }
        return Result<void>::Ok();
    };

    auto paged = disable_paging(*result.profile);
    if (paged.is_err()) return paged;

    if (!result.profile->identity) {
        log_.info("discovery", "unknown platform, identity limited to the prompt", index);
        return Result<void>::Ok();
    }

    auto version = run_command(session, result, result.profile->version_command);
    if (version.is_err()) {
        if (version.error.kind == ErrorKind::kCommandTimeout) {
            Error err = version.error;
            err.kind = ErrorKind::kConnectionTimeout;
            err.message = "Timeout while reading the device version";
            return Result<void>::Err(err);
        }
        if (!is_command_error(version.error.kind)) return Result<void>::Err(version.error);
        log_.warning("discovery", "show version rejected: " + version.error.message, index);
    } else {
        const PlatformProfile* refined = &ProfileRegistry::builtin().match(
            banner + "\n" + version.value, info.prompt);
        if (refined != result.profile && refined->identity) {
            log_.info("discovery", fmt::format("platform is {} not {}", refined->name,
                                               result.profile->name), index);
            bool same_paging = refined->paging_disable == result.profile->paging_disable;
            result.profile = refined;
            info.profile = refined->name;
            info.os_type = refined->os_type;
            if (!same_paging) {
                auto again = disable_paging(*refined);
                if (again.is_err()) return again;
            }
        }
        if (auto v = parse_os_version(version.value, *result.profile)) info.os_version = *v;
        if (auto model = lookup_model(version.value)) {
            info.platform = model->platform;
            info.family = model->family;
        }
    }

    auto inventory = run_command(session, result, result.profile->inventory_command);
    if (inventory.is_ok()) {
        if (auto chassis = parse_inventory(inventory.value)) {
            info.product_id = chassis->pid;
            info.vendor_id = chassis->vid;
            info.serial_number = chassis->sn;
            info.description = chassis->description;
            if (auto model = lookup_model(chassis->pid + " " + chassis->description)) {
                info.platform = model->platform;
                if (!model->family.empty()) info.family = model->family;
            } else if (info.platform.empty()) {
                info.platform = chassis->pid;
            }
        }
    } else if (!is_command_error(inventory.error.kind)) {
        return Result<void>::Err(inventory.error);
    } else {
        log_.warning("discovery", "show inventory failed: " + inventory.error.message, index);
    }

    if (info.family.empty()) info.family = result.profile->family;
    return Result<void>::Ok();
}
