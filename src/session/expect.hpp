#pragma once

#include <string>
#include <vector>
#include <regex>
#include <chrono>
#include "stream.hpp"

struct Pattern {
    std::regex regex;
    std::string raw;

    // ECMAScript syntax. A pattern that does not compile is matched literally.
    Pattern(const std::string& pattern);
};

enum class ExpectStatus {
    kMatched,
    kTimeout,
    kClosed,
};

struct MatchResult {
    ExpectStatus status = ExpectStatus::kTimeout;
    size_t pattern_index = 0;
    std::string matched_text;
    std::string before_text;
    std::vector<std::string> groups;   // capture groups 1..n of the match

    bool matched() const { return status == ExpectStatus::kMatched; }
};

// Buffered reader over a Stream. Patterns are tried in list order against
// everything read so far; the first one that matches wins, and the buffer is
// consumed through the end of that match. Within one expect() call, text
// already searched is only revisited through a short look-back window.
class ExpectMatcher {
public:
    explicit ExpectMatcher(StreamPtr stream);

    MatchResult expect(const std::vector<const Pattern*>& patterns,
                       std::chrono::milliseconds timeout);
    MatchResult expect(const std::vector<Pattern>& patterns,
                       std::chrono::milliseconds timeout);

    bool send(const std::string& data);

    // One read of at most `timeout`. Data is appended to the buffer.
    ReadResult read_nonblocking(std::chrono::milliseconds timeout);

    // Read and drop whatever the device printed that nobody waited for.
    std::string drain(std::chrono::milliseconds quiet = std::chrono::milliseconds(0));

    void clear_buffer() { buffer_.clear(); }
    const std::string& get_buffer() const { return buffer_; }

    Stream& stream() { return *stream_; }

private:
    StreamPtr stream_;
    std::string buffer_;
    bool closed_ = false;

    // Where a re-search starts once `scanned` bytes found no match.
    size_t rescan_from(size_t scanned) const;
    bool check_patterns(const std::vector<const Pattern*>& patterns, size_t from,
                        MatchResult& result);
};
