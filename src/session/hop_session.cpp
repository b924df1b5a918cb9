#include "hop_session.hpp"
#include <core/utils.hpp>
#include <fmt/format.h>

const char* hop_state_name(HopState state) {
    switch (state) {
    case HopState::kUnopened: return "unopened";
    case HopState::kOpen:     return "open";
    case HopState::kClosed:   return "closed";
    }
    return "unknown";
}

HopSession::HopSession(Hop hop, int index, StreamFactory factory, Logger log)
    : hop_(std::move(hop)), index_(index), factory_(std::move(factory)), log_(std::move(log)) {}

HopSession::~HopSession() {
    // The chain owner closes hops in order; only make sure the transport dies.
    if (state_ == HopState::kOpen && !parent_ && io_) {
        io_->stream().close();
    }
}

Result<void> HopSession::open(HopSession* parent) {
    if (state_ != HopState::kUnopened) {
        return Result<void>::Err(make_error(ErrorKind::kConnection,
                                            "Hop session already used", hop_.host, index_));
    }

    if (!parent) {
        if (!factory_) {
            return Result<void>::Err(make_error(ErrorKind::kConnection,
                                                "No transport for the first hop", hop_.host, index_));
        }
        log_.debug("spawn", hop_.connect_command(), index_);
        auto stream = factory_(hop_);
        if (stream.is_err()) {
            Error err = stream.error;
            if (err.host.empty()) err.host = hop_.host;
            err.hop = index_;
            return Result<void>::Err(err);
        }
        io_ = std::make_shared<ExpectMatcher>(stream.value);
    } else {
        if (!parent->is_open()) {
            return Result<void>::Err(make_error(ErrorKind::kConnection,
                                                "Previous hop is not open", hop_.host, index_));
        }
        parent_ = parent;
        io_ = parent->io_;
        std::string stale = io_->drain();
        if (!stale.empty()) log_.debug("drain", printable(stale), index_);
        log_.debug("send", hop_.connect_command(), index_);
        if (!send(hop_.connect_command())) {
            return Result<void>::Err(make_error(ErrorKind::kConnection,
                                                "Unable to write to the session", hop_.host, index_));
        }
    }

    state_ = HopState::kOpen;
    return Result<void>::Ok();
}

bool HopSession::send(const std::string& text) {
    return send_raw(text + "\n");
}

bool HopSession::send_raw(const std::string& text) {
    if (!io_) return false;
    return io_->send(text);
}

ReadResult HopSession::read_nonblocking(std::chrono::milliseconds timeout) {
    if (!io_) {
        ReadResult r;
        r.closed = true;
        return r;
    }
    return io_->read_nonblocking(timeout);
}

bool HopSession::alive() {
    return state_ == HopState::kOpen && io_ && io_->stream().alive();
}

void HopSession::set_prompt(const std::string& prompt, const std::string& regex) {
    prompt_ = prompt;
    prompt_regex_ = regex;
}

void HopSession::close(std::chrono::milliseconds timeout) {
    if (state_ != HopState::kOpen) {
        state_ = HopState::kClosed;
        return;
    }
    state_ = HopState::kClosed;

    io_->drain();
    if (!io_->send("exit\n")) {
        log_.debug("disconnect", "stream already gone", index_);
    }

    std::vector<Pattern> patterns;
    if (parent_ && !parent_->prompt_regex().empty()) {
        patterns.emplace_back(parent_->prompt_regex());
    }
    patterns.emplace_back("Connection to \\S+ closed|Connection closed by foreign host");

    MatchResult m = io_->expect(patterns, timeout);
    if (m.status == ExpectStatus::kTimeout && hop_.protocol == Protocol::kTelnet) {
        // Console lines keep the session open after exit; leave the client.
        io_->send("\x1d");
        io_->expect(std::vector<Pattern>{Pattern("telnet> ?$")}, timeout);
        io_->send("quit\n");
        m = io_->expect(patterns, timeout);
    }
    log_.debug("disconnect", fmt::format("exit {}", m.status == ExpectStatus::kMatched ? "confirmed"
                                         : m.status == ExpectStatus::kClosed ? "closed the stream"
                                         : "not confirmed"), index_);

    if (!parent_) {
        io_->stream().close();
    }
}
