#pragma once

#include <string>
#include <functional>
#include "stream.hpp"

// Receives raw terminal output exactly as the device printed it.
using TranscriptSink = std::function<void(const std::string& text)>;

// Appends to `path`. Each transport opened through with_transcript() starts
// with a "--- <time> <hop> ---" line.
TranscriptSink file_transcript_sink(const std::string& path);

// Copies everything read from the wrapped stream into a sink. Writes are not
// recorded, so typed passwords never reach the transcript.
class TranscriptStream : public Stream {
public:
    TranscriptStream(StreamPtr inner, TranscriptSink sink);

    bool write(const std::string& data) override { return inner_->write(data); }
    ReadResult read(std::chrono::milliseconds timeout) override;
    bool alive() override { return inner_->alive(); }
    void close() override { inner_->close(); }
    bool authenticated() const override { return inner_->authenticated(); }
    std::string describe() const override { return inner_->describe(); }

private:
    StreamPtr inner_;
    TranscriptSink sink_;
};

// Wrap every stream `inner` opens.
StreamFactory with_transcript(StreamFactory inner, TranscriptSink sink);
