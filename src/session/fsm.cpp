#include "fsm.hpp"
#include <core/constants.hpp>
#include <core/utils.hpp>
#include <algorithm>
#include <fmt/format.h>

bool Rule::applies(int state) const {
    return states.empty() || std::find(states.begin(), states.end(), state) != states.end();
}

Rule on_pattern(const std::string& regex, Action action) {
    Rule r;
    r.trigger = Trigger::kPattern;
    r.pattern = std::make_shared<const Pattern>(regex);
    r.action = std::move(action);
    r.name = regex;
    return r;
}

Rule on_timeout(Action action) {
    Rule r;
    r.trigger = Trigger::kTimeout;
    r.action = std::move(action);
    r.name = "<timeout>";
    return r;
}

Rule on_closed(Action action) {
    Rule r;
    r.trigger = Trigger::kClosed;
    r.action = std::move(action);
    r.name = "<closed>";
    return r;
}

Action done() {
    return [](FsmContext&) { return Signal::kDone; };
}

Action fail_with(ErrorKind kind, const std::string& message) {
    return [kind, message](FsmContext& ctx) {
        return ctx.fail(make_error(kind, message));
    };
}

Action send_line(const std::string& text, Signal signal) {
    return [text, signal](FsmContext& ctx) {
        if (!ctx.send_line(text)) {
            return ctx.fail(make_error(ErrorKind::kConnection, "Unable to write to the session"));
        }
        return signal;
    };
}

const char* fsm_status_name(FsmStatus status) {
    switch (status) {
    case FsmStatus::kDone:         return "done";
    case FsmStatus::kFailed:       return "failed";
    case FsmStatus::kTimeout:      return "timeout";
    case FsmStatus::kStreamClosed: return "stream-closed";
    case FsmStatus::kLooped:       return "looped";
    }
    return "unknown";
}

// ── Fsm ──────────────────────────────────────────────────────

Fsm::Fsm(std::string name, ExpectMatcher& io, std::vector<Rule> rules,
         std::chrono::milliseconds timeout)
    : name_(std::move(name)), io_(io), rules_(std::move(rules)), timeout_(timeout),
      max_transitions_(FSM_MAX_TRANSITIONS) {}

void Fsm::trace(const std::string& message) const {
    if (log_) log_->debug("fsm", fmt::format("{}: {}", name_, message), hop_);
}

FsmOutcome Fsm::run() {
    FsmContext ctx(io_, name_);
    ctx.state = initial_state_;
    FsmOutcome outcome;
    std::string history;
    auto step_timeout = timeout_;
    const auto started = Clock::now();

    auto finish = [&](FsmStatus status) {
        outcome.status = status;
        outcome.state = ctx.state;
        outcome.matched = ctx.matched;
        outcome.groups = ctx.groups;
        outcome.error = ctx.error;
        if (status == FsmStatus::kDone || status == FsmStatus::kFailed) {
            outcome.text = history.substr(0, history.size() - ctx.matched.size());
        } else {
            outcome.text = history + io_.get_buffer();
        }
        trace(fmt::format("finished in state {} ({})", ctx.state, fsm_status_name(status)));
        return outcome;
    };

    if (rules_.empty() || timeout_.count() <= 0) {
        ctx.error = make_error(ErrorKind::kConnection,
                               fmt::format("{}: {}", name_, rules_.empty() ? "no rules to run"
                                                                           : "timeout must be positive"));
        trace(ctx.error->message);
        return finish(FsmStatus::kFailed);
    }

    while (max_transitions_ <= 0 || ctx.transitions < max_transitions_) {
        std::vector<const Rule*> active;
        std::vector<const Pattern*> patterns;
        for (const auto& rule : rules_) {
            if (rule.trigger == Trigger::kPattern && rule.applies(ctx.state)) {
                active.push_back(&rule);
                patterns.push_back(rule.pattern.get());
            }
        }

        auto wait = step_timeout;
        bool deadline_bound = false;
        if (deadline_) {
            auto left = std::chrono::duration_cast<std::chrono::milliseconds>(*deadline_ - Clock::now());
            if (left.count() < 0) left = std::chrono::milliseconds(0);
            if (left < wait) {
                wait = left;
                deadline_bound = true;
            }
        }

        MatchResult m = io_.expect(patterns, wait);

        const Rule* fired = nullptr;
        if (m.status == ExpectStatus::kMatched) {
            fired = active[m.pattern_index];
            history += m.before_text + m.matched_text;
            ctx.before = m.before_text;
            ctx.matched = m.matched_text;
            ctx.groups = m.groups;
        } else {
            Trigger want = m.status == ExpectStatus::kTimeout ? Trigger::kTimeout : Trigger::kClosed;
            ctx.before = m.before_text;
            ctx.matched.clear();
            ctx.groups.clear();
            if (want == Trigger::kTimeout && deadline_bound) {
                trace("deadline reached");
                return finish(FsmStatus::kTimeout);
            }
            for (const auto& rule : rules_) {
                if (rule.trigger == want && rule.applies(ctx.state)) {
                    fired = &rule;
                    break;
                }
            }
            if (!fired) {
                trace(fmt::format("{} in state {}, buffer '{}'",
                                  want == Trigger::kTimeout ? "timeout" : "stream closed",
                                  ctx.state, printable(m.before_text)));
                return finish(want == Trigger::kTimeout ? FsmStatus::kTimeout
                                                        : FsmStatus::kStreamClosed);
            }
        }

        ctx.transitions++;
        int from = ctx.state;
        size_t rule_index = static_cast<size_t>(fired - rules_.data());
        Signal signal = fired->action ? fired->action(ctx) : Signal::kContinue;
        if (fired->next_state != kSameState) ctx.state = fired->next_state;
        if (fired->timeout.count() > 0) step_timeout = fired->timeout;

        trace(fmt::format("rule {} '{}' matched '{}': state {} -> {} after {} ms", rule_index,
                          printable(fired->name, 80), printable(ctx.matched, 80), from, ctx.state,
                          std::chrono::duration_cast<std::chrono::milliseconds>(Clock::now() - started).count()));

        switch (signal) {
        case Signal::kContinue:
            break;
        case Signal::kDone:
            return finish(FsmStatus::kDone);
        case Signal::kFail:
            if (!ctx.error) ctx.error = make_error(ErrorKind::kConnection, "Unexpected session state");
            return finish(FsmStatus::kFailed);
        case Signal::kRestart:
            rules_ = std::move(ctx.staged_rules);
            ctx.staged_rules.clear();
            ctx.state = ctx.staged_state;
            trace(fmt::format("restarted in state {}", ctx.state));
            break;
        }
    }

    ctx.error = make_error(ErrorKind::kConnection,
                           fmt::format("{}: too many transitions", name_));
    return finish(FsmStatus::kLooped);
}
