#include <gtest/gtest.h>
#include <cli/termhop_cli.hpp>

TEST(CliArgs, HostJumpsAndCommand) {
    auto opts = parse_cli_args({"-H", "telnet://r1", "-J", "ssh://j1", "--jumphost", "ssh://j2",
                                "show", "version"});
    ASSERT_TRUE(opts.is_ok());
    EXPECT_EQ(opts.value.host_url, "telnet://r1");
    ASSERT_EQ(opts.value.jump_urls.size(), 2u);
    EXPECT_EQ(opts.value.jump_urls[0], "ssh://j1");
    EXPECT_EQ(opts.value.command, "show version");
}

TEST(CliArgs, FlagsAfterCommandBelongToCommand) {
    auto opts = parse_cli_args({"-H", "ssh://r1", "show", "run", "-d"});
    ASSERT_TRUE(opts.is_ok());
    EXPECT_EQ(opts.value.command, "show run -d");
    EXPECT_EQ(opts.value.debug_level, 0);
}

TEST(CliArgs, ModesAndDebug) {
    auto opts = parse_cli_args({"--device", "pe1", "--discover", "-d", "5"});
    ASSERT_TRUE(opts.is_ok());
    EXPECT_EQ(opts.value.device, "pe1");
    EXPECT_TRUE(opts.value.discover);
    EXPECT_EQ(opts.value.debug_level, 5);

    auto shell = parse_cli_args({"-H", "ssh://r1", "--shell"});
    ASSERT_TRUE(shell.is_ok());
    EXPECT_TRUE(shell.value.shell);
    EXPECT_TRUE(parse_cli_args({"--help"}).value.help);
    EXPECT_TRUE(parse_cli_args({"--version"}).value.version);
}

TEST(CliArgs, SessionLog) {
    auto opts = parse_cli_args({"-H", "ssh://r1", "--session-log", "/tmp/r1.log", "show", "clock"});
    ASSERT_TRUE(opts.is_ok());
    EXPECT_EQ(opts.value.session_log, "/tmp/r1.log");
    EXPECT_EQ(opts.value.command, "show clock");
    EXPECT_TRUE(parse_cli_args({"--session-log"}).is_err());
}

TEST(CliArgs, Errors) {
    EXPECT_EQ(parse_cli_args({"-H"}).error.kind, ErrorKind::kInvalidHopInfo);
    EXPECT_TRUE(parse_cli_args({"-d", "9"}).is_err());
    EXPECT_TRUE(parse_cli_args({"-d", "x"}).is_err());
    EXPECT_TRUE(parse_cli_args({"--bogus"}).is_err());
}

TEST(CliErrors, CategoryPrefixes) {
    EXPECT_EQ(cli_error_text(make_error(ErrorKind::kConnectionAuthentication, "denied", "r1", 1)),
              "Authentication error: r1: denied (hop 1)");
    EXPECT_EQ(cli_error_text(make_command_error(ErrorKind::kCommandSyntax, "Command syntax error",
                                                "show foo", "r1")),
              "Unknown command error: r1: Command syntax error: 'show foo'");
    EXPECT_EQ(cli_error_text(make_error(ErrorKind::kCommand, "no reload")).rfind("Command error: ", 0), 0u);
    EXPECT_EQ(cli_error_text(make_error(ErrorKind::kInvalidHopInfo, "bad")).rfind("Invalid hop: ", 0), 0u);
    EXPECT_EQ(cli_error_text(make_error(ErrorKind::kConnectionTimeout, "slow")).rfind("Connection timeout: ", 0), 0u);
    EXPECT_EQ(cli_error_text(make_error(ErrorKind::kCommandTimeout, "slow")).rfind("Command timeout: ", 0), 0u);
}
