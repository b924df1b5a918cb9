#include <gtest/gtest.h>
#include <session/command.hpp>
#include "support/fake_device.hpp"

using std::chrono::milliseconds;

namespace {

const PlatformProfile& ios() { return *ProfileRegistry::builtin().find("IOS"); }

CommandRequest request(const std::string& command, int timeout_ms = 200) {
    CommandRequest r;
    r.command = command;
    r.timeout = milliseconds(timeout_ms);
    return r;
}

// A device already logged in and sitting at its prompt.
struct ReadyDevice {
    FakeHostPtr host = fake_host("r1", "R1#");
    std::unique_ptr<FakeNetwork> net;
    std::unique_ptr<ExpectMatcher> io;

    ReadyDevice() {
        host->ask_password = false;
        host->commands["show clock"] = "*12:00:01.123 UTC Mon Jan 1 2024";
        host->commands["show users"] = "    Line       User       Host(s)\r\n*  2 vty 0     cisco      idle";
        host->paged["show running-config"] = {"hostname R1\r\n!", "\r\ninterface Loopback0\r\n!", "\r\nend"};
        host->hang.insert("show tech-support");
        net.reset(new FakeNetwork(host));
        io.reset(new ExpectMatcher(net->stream()));
        auto m = io->expect(std::vector<Pattern>{Pattern(prompt_regex_for("R1#"))}, milliseconds(200));
        EXPECT_TRUE(m.matched());
    }

    CommandExecutor executor(std::vector<std::string> jumps = {}) {
        return CommandExecutor(*io, ios(), prompt_regex_for("R1#"), std::move(jumps), Logger(), 1);
    }
};

} // namespace

TEST(Command, OutputWithoutEchoAndPrompt) {
    ReadyDevice dev;
    auto exec = dev.executor();
    auto out = exec.execute(request("show clock"));
    ASSERT_TRUE(out.is_ok()) << out.error.describe();
    EXPECT_EQ(out.value, "*12:00:01.123 UTC Mon Jan 1 2024");

    out = exec.execute(request("show users"));
    ASSERT_TRUE(out.is_ok());
    EXPECT_EQ(out.value, "    Line       User       Host(s)\n*  2 vty 0     cisco      idle");
}

TEST(Command, SyntaxErrorKeepsSessionUsable) {
    ReadyDevice dev;
    auto exec = dev.executor();
    auto bad = exec.execute(request("show foo"));
    ASSERT_TRUE(bad.is_err());
    EXPECT_EQ(bad.error.kind, ErrorKind::kCommandSyntax);
    EXPECT_EQ(bad.error.command, "show foo");

    auto good = exec.execute(request("show clock"));
    ASSERT_TRUE(good.is_ok());
    EXPECT_EQ(good.value, "*12:00:01.123 UTC Mon Jan 1 2024");
}

TEST(Command, TimeoutWhenPromptNeverReturns) {
    ReadyDevice dev;
    auto exec = dev.executor();
    auto out = exec.execute(request("show tech-support", 100));
    ASSERT_TRUE(out.is_err());
    EXPECT_EQ(out.error.kind, ErrorKind::kCommandTimeout);
    EXPECT_EQ(out.error.command, "show tech-support");
}

TEST(Command, PagerIsAnswered) {
    ReadyDevice dev;
    auto exec = dev.executor();
    auto out = exec.execute(request("show running-config"));
    ASSERT_TRUE(out.is_ok()) << out.error.describe();
    EXPECT_EQ(out.value, "hostname R1\n!\ninterface Loopback0\n!\nend");
    EXPECT_EQ(dev.net->stream()->written(), "show running-config\n  ");
}

TEST(Command, WaitForEndsCommandEarly) {
    ReadyDevice dev;
    dev.host->commands["copy running-config startup-config"] = "Destination filename [startup-config]?";
    auto exec = dev.executor();
    auto req = request("copy running-config startup-config");
    req.wait_for = "Destination filename \\[\\S+\\]\\?";
    EXPECT_TRUE(exec.execute(req).is_ok());
}

TEST(Command, DisconnectIsConnectionError) {
    auto stream = std::make_shared<FakeStream>([](FakeStream& s, const std::string& in) {
        if (in == "clear line 2\n") {
            s.emit("clear line 2\r\n");
            s.close_remote();
        }
    });
    ExpectMatcher io(stream);
    CommandExecutor exec(io, ios(), prompt_regex_for("R1#"), {}, Logger(), 2);
    auto out = exec.execute(request("clear line 2"));
    ASSERT_TRUE(out.is_err());
    EXPECT_EQ(out.error.kind, ErrorKind::kConnection);
    EXPECT_EQ(out.error.hop, 2);
    EXPECT_TRUE(out.error.command.empty());
}

TEST(Command, JumpHostPromptMeansTargetIsGone) {
    auto stream = std::make_shared<FakeStream>([](FakeStream& s, const std::string& in) {
        if (in == "show clock\n") s.emit("show clock\r\nConnection to r1 closed\r\n");
    });
    ExpectMatcher io(stream);
    CommandExecutor exec(io, ios(), prompt_regex_for("R1#"),
                         {exact_prompt_regex("[admin@jump1 ~]$")}, Logger(), 2);
    auto out = exec.execute(request("show clock"));
    ASSERT_TRUE(out.is_err());
    EXPECT_EQ(out.error.kind, ErrorKind::kConnection);

    auto stream2 = std::make_shared<FakeStream>([](FakeStream& s, const std::string& in) {
        if (in == "show clock\n") s.emit("show clock\r\n[admin@jump1 ~]$ ");
    });
    ExpectMatcher io2(stream2);
    CommandExecutor exec2(io2, ios(), prompt_regex_for("R1#"),
                          {exact_prompt_regex("[admin@jump1 ~]$")}, Logger(), 2);
    out = exec2.execute(request("show clock"));
    ASSERT_TRUE(out.is_err());
    EXPECT_EQ(out.error.kind, ErrorKind::kConnection);
    EXPECT_EQ(out.error.message, "Received the jump host prompt");
}

TEST(Command, CleanOutput) {
    EXPECT_EQ(clean_output("show ver\r\nline\r\n\r\n", "show ver", "--More--"), "line");
    EXPECT_EQ(clean_output("\r\nline", "show ver", "--More--"), "line");
    EXPECT_EQ(clean_output("R1#show ver\r\na --More-- \b\b\b\b\b\b\b\b\b\b          \b\b\b\b\b\b\b\b\b\b\r\nb",
                           "show ver", "--More--"),
              "a\nb");
    EXPECT_EQ(clean_output("no echo here\nsecond", "show ver", "--More--"), "no echo here\nsecond");
}
