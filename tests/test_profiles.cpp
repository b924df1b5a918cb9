#include <gtest/gtest.h>
#include <session/platform_profile.hpp>

TEST(Profiles, BuiltinOrderIsMostSpecificFirst) {
    const auto& profiles = ProfileRegistry::builtin().profiles();
    ASSERT_GE(profiles.size(), 6u);
    EXPECT_EQ(profiles[0].name, "Calvados");
    EXPECT_EQ(profiles[1].name, "eXR");
    EXPECT_EQ(profiles[2].name, "XR");
    EXPECT_EQ(profiles.back().name, "IOS");
}

TEST(Profiles, MatchByPrompt) {
    const auto& reg = ProfileRegistry::builtin();
    EXPECT_EQ(reg.match("", "RP/0/RSP0/CPU0:pe1#").name, "XR");
    EXPECT_EQ(reg.match("", "sysadmin-vm:0_RP0#").name, "Calvados");
    EXPECT_EQ(reg.match("", "R1#").name, "IOS");
    EXPECT_EQ(reg.match("", "R1(config-if)#").name, "IOS");
}

TEST(Profiles, BannerWinsOverPrompt) {
    const auto& reg = ProfileRegistry::builtin();
    EXPECT_EQ(reg.match("Cisco Nexus Operating System (NX-OS) Software", "n9k#").name, "NX-OS");
    EXPECT_EQ(reg.match("Cisco IOS XE Software, Version 16.9.4", "r1#").name, "IOS-XE");
    EXPECT_EQ(reg.match("Cisco IOS XR Software, Version 6.5.3\r\nBuild Information:", "x#").name, "eXR");
    EXPECT_EQ(reg.match("Cisco IOS XR Software, Version 5.3.3", "x#").name, "XR");
}

TEST(Profiles, UnknownFallback) {
    const auto& reg = ProfileRegistry::builtin();
    const auto& p = reg.match("Welcome", "[admin@linux ~]$");
    EXPECT_EQ(p.name, "unknown");
    EXPECT_FALSE(p.identity);
    EXPECT_TRUE(p.reload_command.empty());
}

TEST(Profiles, FindByName) {
    const auto& reg = ProfileRegistry::builtin();
    ASSERT_NE(reg.find("NX-OS"), nullptr);
    EXPECT_EQ(reg.find("NX-OS")->paging_disable.back(), "terminal width 511");
    EXPECT_EQ(reg.find("nope"), nullptr);
}

TEST(Profiles, OnlyIosFamiliesNegotiateEnable) {
    const auto& reg = ProfileRegistry::builtin();
    EXPECT_TRUE(reg.find("IOS")->supports_enable);
    EXPECT_TRUE(reg.find("IOS-XE")->supports_enable);
    EXPECT_FALSE(reg.find("XR")->supports_enable);
    EXPECT_FALSE(reg.find("NX-OS")->supports_enable);
}

TEST(Profiles, CommandErrorPatternJoinsAll) {
    const auto* ios = ProfileRegistry::builtin().find("IOS");
    std::regex re(ios->command_error_pattern());
    EXPECT_TRUE(std::regex_search(std::string("% Invalid input detected at '^' marker."), re));
    EXPECT_TRUE(std::regex_search(std::string("% Ambiguous command:  \"sh\""), re));
    EXPECT_TRUE(std::regex_search(std::string("% Incomplete command."), re));
    EXPECT_TRUE(ProfileRegistry::builtin().unknown().command_error_pattern().empty());
}

TEST(Profiles, ReloadCommands) {
    const auto& reg = ProfileRegistry::builtin();
    EXPECT_EQ(reg.find("XR")->reload_command, "admin reload location all");
    EXPECT_EQ(reg.find("eXR")->reload_command, "admin hw-module location all reload");
    EXPECT_EQ(reg.find("IOS")->reload_command, "reload");
}
