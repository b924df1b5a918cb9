#pragma once

#include <string>
#include <vector>
#include <memory>
#include <optional>
#include <chrono>
#include <functional>
#include <core/types.hpp>
#include <core/log.hpp>
#include "expect.hpp"

// What an action tells the engine to do next.
enum class Signal {
    kContinue,   // keep reading in the (possibly new) state
    kDone,       // finished successfully
    kRestart,    // swap in the rule table staged with FsmContext::restart()
    kFail,       // finished with the error staged with FsmContext::fail()
};

// Which stream event fires a rule.
enum class Trigger {
    kPattern,
    kTimeout,
    kClosed,
};

struct FsmContext;
using Action = std::function<Signal(FsmContext&)>;

constexpr int kSameState = -1;

// One row of the transition table. `states` empty means the rule applies
// in every state.
struct Rule {
    Trigger trigger = Trigger::kPattern;
    std::shared_ptr<const Pattern> pattern;
    std::vector<int> states;
    Action action;
    int next_state = kSameState;
    std::chrono::milliseconds timeout{0};   // 0 keeps the current step timeout
    std::string name;

    Rule& in(std::vector<int> s) { states = std::move(s); return *this; }
    Rule& then(int state) { next_state = state; return *this; }
    Rule& wait(std::chrono::milliseconds t) { timeout = t; return *this; }
    Rule& named(std::string n) { name = std::move(n); return *this; }

    bool applies(int state) const;
};

// Builders. An empty action continues.
Rule on_pattern(const std::string& regex, Action action = nullptr);
Rule on_timeout(Action action = nullptr);
Rule on_closed(Action action = nullptr);

// Common actions
Action done();
Action fail_with(ErrorKind kind, const std::string& message);
Action send_line(const std::string& text, Signal signal = Signal::kContinue);

// State shared with actions during one run.
struct FsmContext {
    ExpectMatcher& io;
    std::string name;
    int state = 0;
    int transitions = 0;
    std::string matched;                 // text of the last match
    std::string before;                  // text read before it
    std::vector<std::string> groups;
    std::optional<Error> error;
    std::vector<Rule> staged_rules;
    int staged_state = 0;

    FsmContext(ExpectMatcher& matcher, std::string fsm_name)
        : io(matcher), name(std::move(fsm_name)) {}

    bool send(const std::string& data) { return io.send(data); }
    bool send_line(const std::string& line) { return io.send(line + "\n"); }

    Signal fail(Error e) {
        error = std::move(e);
        return Signal::kFail;
    }

    Signal restart(std::vector<Rule> rules, int state = 0) {
        staged_rules = std::move(rules);
        staged_state = state;
        return Signal::kRestart;
    }
};

enum class FsmStatus {
    kDone,
    kFailed,        // an action failed; see error
    kTimeout,       // no rule for the timeout, or the deadline passed
    kStreamClosed,  // no rule for the close
    kLooped,        // transition budget exhausted
};

const char* fsm_status_name(FsmStatus status);

struct FsmOutcome {
    FsmStatus status = FsmStatus::kTimeout;
    int state = 0;
    std::string matched;
    std::vector<std::string> groups;
    std::string text;       // everything consumed, minus the final match
    std::optional<Error> error;

    bool ok() const { return status == FsmStatus::kDone; }
};

// Pattern-action engine. Every step waits for the first applicable rule
// whose trigger fires, runs its action and applies the transition.
class Fsm {
public:
    using Clock = std::chrono::steady_clock;

    Fsm(std::string name, ExpectMatcher& io, std::vector<Rule> rules,
        std::chrono::milliseconds timeout);

    void set_initial_state(int state) { initial_state_ = state; }
    // n <= 0 removes the bound; the step timeout still ends a stuck run.
    void set_max_transitions(int n) { max_transitions_ = n; }
    // Absolute bound on the whole run, on top of the per-step timeout.
    void set_deadline(Clock::time_point deadline) { deadline_ = deadline; }
    void set_logger(const Logger* log, int hop) { log_ = log; hop_ = hop; }

    // An empty rule table or a timeout <= 0 fails without reading.
    FsmOutcome run();

private:
    std::string name_;
    ExpectMatcher& io_;
    std::vector<Rule> rules_;
    std::chrono::milliseconds timeout_;
    int initial_state_ = 0;
    int max_transitions_;
    std::optional<Clock::time_point> deadline_;
    const Logger* log_ = nullptr;
    int hop_ = 0;

    void trace(const std::string& message) const;
};
