#pragma once

#include "stream.hpp"
#include <platform/process.hpp>
#include <vector>

// Local ssh/telnet client running on a pseudo terminal.
class PtyStream : public Stream {
public:
    ~PtyStream() override;

    // Spawn `argv[0] argv[1..]` on a new pty.
    static Result<StreamPtr> spawn(const std::vector<std::string>& argv);

    bool write(const std::string& data) override;
    ReadResult read(std::chrono::milliseconds timeout) override;
    bool alive() override;
    void close() override;
    std::string describe() const override { return description_; }

    int pid() const { return child_.process.native_handle(); }

private:
    PtyStream() = default;

    platform::PtyChild child_;
    std::string description_;
    bool eof_ = false;
};

// Factory spawning the hop's ssh or telnet command locally.
StreamFactory pty_stream_factory();
