#include "expect.hpp"
#include <core/constants.hpp>
#include <core/utils.hpp>
#include <cstddef>

Pattern::Pattern(const std::string& pattern) : raw(pattern) {
    try {
        regex = std::regex(pattern, std::regex::ECMAScript);
    } catch (const std::regex_error&) {
        regex = std::regex(regex_escape(pattern), std::regex::ECMAScript);
    }
}

ExpectMatcher::ExpectMatcher(StreamPtr stream) : stream_(std::move(stream)) {}

MatchResult ExpectMatcher::expect(const std::vector<Pattern>& patterns,
                                  std::chrono::milliseconds timeout) {
    std::vector<const Pattern*> ptrs;
    ptrs.reserve(patterns.size());
    for (const auto& p : patterns) ptrs.push_back(&p);
    return expect(ptrs, timeout);
}

MatchResult ExpectMatcher::expect(const std::vector<const Pattern*>& patterns,
                                  std::chrono::milliseconds timeout) {
    auto start = std::chrono::steady_clock::now();
    MatchResult result;
    size_t scanned = 0;   // buffer_ bytes already searched by this call

    while (true) {
        if (check_patterns(patterns, rescan_from(scanned), result)) {
            return result;
        }
        scanned = buffer_.size();

        if (closed_) {
            result.status = ExpectStatus::kClosed;
            result.before_text = buffer_;
            return result;
        }

        auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
            std::chrono::steady_clock::now() - start);
        if (elapsed >= timeout) {
            result.status = ExpectStatus::kTimeout;
            result.before_text = buffer_;
            return result;
        }

        read_nonblocking(timeout - elapsed);
    }
}

bool ExpectMatcher::send(const std::string& data) {
    if (closed_) return false;
    return stream_->write(data);
}

ReadResult ExpectMatcher::read_nonblocking(std::chrono::milliseconds timeout) {
    ReadResult r;
    if (closed_) {
        r.closed = true;
        return r;
    }
    r = stream_->read(timeout);
    buffer_ += r.data;
    if (r.closed) closed_ = true;
    return r;
}

std::string ExpectMatcher::drain(std::chrono::milliseconds quiet) {
    while (!closed_) {
        auto r = read_nonblocking(quiet);
        if (r.data.empty()) break;
    }
    std::string dropped;
    dropped.swap(buffer_);
    return dropped;
}

size_t ExpectMatcher::rescan_from(size_t scanned) const {
    if (scanned <= EXPECT_LOOKBACK) return 0;
    size_t from = scanned - EXPECT_LOOKBACK;
    // Start at a line boundary so line-shaped patterns see the whole line
    size_t nl = buffer_.rfind('\n', from);
    if (nl != std::string::npos && from - nl <= EXPECT_LOOKBACK) return nl + 1;
    return from;
}

bool ExpectMatcher::check_patterns(const std::vector<const Pattern*>& patterns, size_t from,
                                   MatchResult& result) {
    auto begin = buffer_.cbegin() + static_cast<std::ptrdiff_t>(from);
    auto flags = from > 0 ? std::regex_constants::match_prev_avail
                          : std::regex_constants::match_default;
    for (size_t i = 0; i < patterns.size(); ++i) {
        std::smatch match;
        if (std::regex_search(begin, buffer_.cend(), match, patterns[i]->regex, flags)) {
            size_t pos = static_cast<size_t>(match[0].first - buffer_.cbegin());
            size_t end = pos + static_cast<size_t>(match.length(0));
            result.status = ExpectStatus::kMatched;
            result.pattern_index = i;
            result.matched_text = match[0];
            result.groups.clear();
            for (size_t g = 1; g < match.size(); ++g) {
                result.groups.push_back(match[g].matched ? match[g].str() : std::string());
            }
            // Hand the consumed text to the caller instead of copying it
            std::string rest = buffer_.substr(end);
            buffer_.resize(pos);
            result.before_text.swap(buffer_);
            buffer_.swap(rest);
            return true;
        }
    }
    return false;
}
