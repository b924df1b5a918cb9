#pragma once

#include <string>
#include <memory>
#include <chrono>
#include <core/types.hpp>
#include <core/hop_info.hpp>
#include <core/log.hpp>
#include "stream.hpp"
#include "expect.hpp"

enum class HopState {
    kUnopened,
    kOpen,
    kClosed,
};

const char* hop_state_name(HopState state);

// One stage of a connection chain. The first hop opens the transport; every
// later hop is reached by typing its connect command into the same stream.
class HopSession {
public:
    HopSession(Hop hop, int index, StreamFactory factory, Logger log);
    ~HopSession();

    HopSession(const HopSession&) = delete;
    HopSession& operator=(const HopSession&) = delete;

    // parent == nullptr opens the transport; otherwise the connect command is
    // typed into the parent's stream. Fails with a ConnectionError when the
    // transport cannot be spawned.
    Result<void> open(HopSession* parent);

    bool send(const std::string& text);       // appends the line terminator
    bool send_raw(const std::string& text);
    ReadResult read_nonblocking(std::chrono::milliseconds timeout);

    // Idempotent. A nested hop sends "exit" and waits briefly for the parent
    // prompt; the first hop also terminates the transport.
    void close(std::chrono::milliseconds timeout);

    ExpectMatcher& io() { return *io_; }
    const Hop& hop() const { return hop_; }
    int index() const { return index_; }
    HopState state() const { return state_; }
    bool is_open() const { return state_ == HopState::kOpen; }
    bool alive();

    // Prompt detected on this hop and the regex that finds it again.
    void set_prompt(const std::string& prompt, const std::string& regex);
    const std::string& prompt() const { return prompt_; }
    const std::string& prompt_regex() const { return prompt_regex_; }

private:
    Hop hop_;
    int index_;
    StreamFactory factory_;
    Logger log_;
    HopState state_ = HopState::kUnopened;
    HopSession* parent_ = nullptr;
    std::shared_ptr<ExpectMatcher> io_;
    std::string prompt_;
    std::string prompt_regex_;
};
