#pragma once

#include <chrono>
#include <memory>
#include <string>
#include <functional>
#include <core/types.hpp>
#include <core/hop_info.hpp>

// Result of one read. Empty data with closed == false means the wait
// timed out with nothing to read.
struct ReadResult {
    std::string data;
    bool closed = false;
};

// Byte stream to an interactive terminal. Every hop of a chain shares the
// stream of the first hop: later hops are reached by typing into it.
class Stream {
public:
    virtual ~Stream() = default;

    // Write all of `data`. Never waits for an acknowledgement.
    virtual bool write(const std::string& data) = 0;

    // Wait up to `timeout` for output and return what is available.
    virtual ReadResult read(std::chrono::milliseconds timeout) = 0;

    virtual bool alive() = 0;

    // Terminate the transport. Idempotent.
    virtual void close() = 0;

    // True when the transport already authenticated the user (libssh2),
    // so no credential prompt is expected on the first hop.
    virtual bool authenticated() const { return false; }

    virtual std::string describe() const = 0;
};

using StreamPtr = std::shared_ptr<Stream>;

// Opens the transport for the first hop of a chain.
using StreamFactory = std::function<Result<StreamPtr>(const Hop& hop)>;
