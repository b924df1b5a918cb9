#include "transcript.hpp"
#include <core/utils.hpp>
#include <fmt/format.h>
#include <fstream>
#include <memory>
#include <mutex>

TranscriptSink file_transcript_sink(const std::string& path) {
    // Connections in several threads may log into the same file.
    auto mtx = std::make_shared<std::mutex>();
    return [path, mtx](const std::string& text) {
        std::lock_guard<std::mutex> lock(*mtx);
        std::ofstream out(path, std::ios::app | std::ios::binary);
        if (!out) return;
        out << text;
    };
}

TranscriptStream::TranscriptStream(StreamPtr inner, TranscriptSink sink)
    : inner_(std::move(inner)), sink_(std::move(sink)) {}

ReadResult TranscriptStream::read(std::chrono::milliseconds timeout) {
    ReadResult r = inner_->read(timeout);
    if (!r.data.empty()) sink_(r.data);
    return r;
}

StreamFactory with_transcript(StreamFactory inner, TranscriptSink sink) {
    return [inner, sink](const Hop& hop) -> Result<StreamPtr> {
        sink(fmt::format("\n--- {} {} ---\n", now_clock_ms(), hop.display()));
        auto opened = inner(hop);
        if (opened.is_err()) return opened;
        return Result<StreamPtr>::Ok(std::make_shared<TranscriptStream>(opened.value, sink));
    };
}
