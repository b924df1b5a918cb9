#include <gtest/gtest.h>
#include <session/expect.hpp>
#include "support/fake_device.hpp"
#include <algorithm>
#include <deque>
#include <thread>

using std::chrono::milliseconds;

namespace {

// Hands out one queued chunk per read, like a device writing in bursts.
class ChunkedStream : public Stream {
public:
    explicit ChunkedStream(std::vector<std::string> chunks)
        : chunks_(chunks.begin(), chunks.end()) {}

    bool write(const std::string&) override { return true; }

    ReadResult read(milliseconds timeout) override {
        ReadResult r;
        if (chunks_.empty()) {
            std::this_thread::sleep_for(std::min(timeout, milliseconds(5)));
            return r;
        }
        r.data = chunks_.front();
        chunks_.pop_front();
        return r;
    }

    bool alive() override { return true; }
    void close() override {}
    std::string describe() const override { return "chunked"; }

private:
    std::deque<std::string> chunks_;
};

} // namespace

TEST(Expect, FirstPatternInListOrderWins) {
    auto stream = std::make_shared<FakeStream>();
    stream->emit("login ok\r\nR1#");
    ExpectMatcher io(stream);
    auto m = io.expect(std::vector<Pattern>{Pattern("R1#$"), Pattern("ok")}, milliseconds(100));
    ASSERT_TRUE(m.matched());
    EXPECT_EQ(m.pattern_index, 0u);
    EXPECT_EQ(m.before_text, "login ok\r\n");
    EXPECT_EQ(io.get_buffer(), "");
}

TEST(Expect, ConsumesThroughMatchOnly) {
    auto stream = std::make_shared<FakeStream>();
    stream->emit("one two three");
    ExpectMatcher io(stream);
    auto m = io.expect(std::vector<Pattern>{Pattern("two")}, milliseconds(100));
    ASSERT_TRUE(m.matched());
    EXPECT_EQ(io.get_buffer(), " three");
}

TEST(Expect, CaptureGroups) {
    auto stream = std::make_shared<FakeStream>();
    stream->emit("\r\nRP/0/RSP0/CPU0:pe1#");
    ExpectMatcher io(stream);
    auto m = io.expect(std::vector<Pattern>{Pattern("(?:^|[\\r\\n])([\\w/:]+#)$")}, milliseconds(100));
    ASSERT_TRUE(m.matched());
    ASSERT_EQ(m.groups.size(), 1u);
    EXPECT_EQ(m.groups[0], "RP/0/RSP0/CPU0:pe1#");
}

TEST(Expect, TimeoutKeepsBuffer) {
    auto stream = std::make_shared<FakeStream>();
    stream->emit("partial");
    ExpectMatcher io(stream);
    auto m = io.expect(std::vector<Pattern>{Pattern("never")}, milliseconds(50));
    EXPECT_EQ(m.status, ExpectStatus::kTimeout);
    EXPECT_EQ(m.before_text, "partial");
    EXPECT_EQ(io.get_buffer(), "partial");
}

TEST(Expect, ClosedAfterLastCheck) {
    auto stream = std::make_shared<FakeStream>();
    stream->emit("bye R1#");
    stream->close_remote();
    ExpectMatcher io(stream);
    auto m = io.expect(std::vector<Pattern>{Pattern("R1#")}, milliseconds(50));
    EXPECT_TRUE(m.matched());
    m = io.expect(std::vector<Pattern>{Pattern("R1#")}, milliseconds(50));
    EXPECT_EQ(m.status, ExpectStatus::kClosed);
}

TEST(Expect, InvalidRegexMatchesLiterally) {
    Pattern p("[unterminated");
    EXPECT_TRUE(std::regex_search(std::string("x [unterminated y"), p.regex));
}

TEST(Expect, DrainDropsPendingOutput) {
    auto stream = std::make_shared<FakeStream>();
    stream->emit("stale output");
    ExpectMatcher io(stream);
    EXPECT_EQ(io.drain(), "stale output");
    EXPECT_EQ(io.get_buffer(), "");
}

TEST(Expect, LargeOutputInSmallReads) {
    std::string line = "interface GigabitEthernet0/0/0/1 description uplink to core\r\n";
    std::string body;
    while (body.size() < 1024 * 1024) body += line;

    std::vector<std::string> chunks;
    for (size_t pos = 0; pos < body.size(); pos += 4096) chunks.push_back(body.substr(pos, 4096));
    chunks.push_back("RP/0/RSP0/CPU0:pe1#");

    ExpectMatcher io(std::make_shared<ChunkedStream>(chunks));
    auto started = std::chrono::steady_clock::now();
    auto m = io.expect(std::vector<Pattern>{Pattern(" --More-- $"),
                                            Pattern("(?:^|[\\r\\n])RP/0/RSP0/CPU0:pe1#$")},
                       milliseconds(20000));
    auto took = std::chrono::duration_cast<milliseconds>(std::chrono::steady_clock::now() - started);

    ASSERT_TRUE(m.matched());
    EXPECT_EQ(m.pattern_index, 1u);
    EXPECT_EQ(m.before_text.size() + 1, body.size());   // the last \n belongs to the match
    EXPECT_LT(took.count(), 10000);
}

TEST(Expect, MatchSpanningReadsAfterLongOutput) {
    std::vector<std::string> chunks{std::string(3000, 'x') + "\r\n", "Proceed with re", "load? [confirm]"};
    ExpectMatcher io(std::make_shared<ChunkedStream>(chunks));
    auto m = io.expect(std::vector<Pattern>{Pattern("Proceed with reload\\? \\[confirm\\]")},
                       milliseconds(1000));
    ASSERT_TRUE(m.matched());
    EXPECT_EQ(m.before_text, std::string(3000, 'x') + "\r\n");
    EXPECT_EQ(io.get_buffer(), "");
}

TEST(Expect, LineStartIsNotInventedMidLine) {
    std::vector<std::string> chunks{std::string(2000, 'a'), "b#"};
    ExpectMatcher io(std::make_shared<ChunkedStream>(chunks));
    auto m = io.expect(std::vector<Pattern>{Pattern("^b#$")}, milliseconds(100));
    EXPECT_EQ(m.status, ExpectStatus::kTimeout);
    EXPECT_EQ(io.get_buffer(), std::string(2000, 'a') + "b#");
}
