#include <gtest/gtest.h>
#include <session/platform_profile.hpp>
#include "support/fake_device.hpp"

TEST(Identity, ModelTable) {
    auto ios = lookup_model(kIosVersion);
    ASSERT_TRUE(ios.has_value());
    EXPECT_EQ(ios->platform, "ASR-903");
    EXPECT_EQ(ios->family, "ASR900");

    auto xr = lookup_model(kXrVersion);
    ASSERT_TRUE(xr.has_value());
    EXPECT_EQ(xr->family, "ASR9K");

    auto ncs = lookup_model("cisco NCS-5501-SE (Intel) processor");
    ASSERT_TRUE(ncs.has_value());
    EXPECT_EQ(ncs->platform, "NCS-5501");
    EXPECT_EQ(ncs->family, "NCS5500");

    auto asr1k = lookup_model("cisco ASR1006 (RP2) processor");
    ASSERT_TRUE(asr1k.has_value());
    EXPECT_EQ(asr1k->family, "ASR1K");
}

TEST(Identity, ProcessorLineFallback) {
    auto m = lookup_model("cisco CSR1000V (VXE) processor (revision VXE) with 2190795K/3075K bytes");
    ASSERT_TRUE(m.has_value());
    EXPECT_EQ(m->platform, "CSR1000V");
    EXPECT_FALSE(lookup_model("nothing useful here").has_value());
}

TEST(Identity, InventoryPrefersChassis) {
    auto entries = parse_inventory_entries(kIosInventory);
    ASSERT_EQ(entries.size(), 2u);
    EXPECT_EQ(entries[1].pid, "A900-PWR550-A");

    auto chassis = parse_inventory(kIosInventory);
    ASSERT_TRUE(chassis.has_value());
    EXPECT_EQ(chassis->pid, "ASR-903");
    EXPECT_EQ(chassis->vid, "V01");
    EXPECT_EQ(chassis->sn, "FOX1717P569");
    EXPECT_EQ(chassis->description, "ASR 903 Series Router Chassis");

    auto xr = parse_inventory(kXrInventory);
    ASSERT_TRUE(xr.has_value());
    EXPECT_EQ(xr->pid, "ASR-9006-AC");
    EXPECT_EQ(xr->sn, "FOX1523H7HA");

    EXPECT_FALSE(parse_inventory("% Invalid input detected").has_value());
}

TEST(Identity, OsVersion) {
    const auto& reg = ProfileRegistry::builtin();
    EXPECT_EQ(*parse_os_version(kIosVersion, *reg.find("IOS")), "15.5(3)S1");
    EXPECT_EQ(*parse_os_version(kXrVersion, *reg.find("XR")), "6.1.2");
    EXPECT_EQ(*parse_os_version(kNxosVersion, *reg.find("NX-OS")), "7.0(3)I7(2)");
    EXPECT_FALSE(parse_os_version("no version", *reg.find("XR")).has_value());
}

TEST(Identity, HostnameFromPrompt) {
    EXPECT_EQ(hostname_from_prompt("R1#"), "R1");
    EXPECT_EQ(hostname_from_prompt("R1(config-if)#"), "R1");
    EXPECT_EQ(hostname_from_prompt("RP/0/RSP0/CPU0:pe1#"), "pe1");
    EXPECT_EQ(hostname_from_prompt("switch>"), "switch");
    EXPECT_EQ(hostname_from_prompt("[admin@jump1 ~]$"), "jump1");
}

TEST(Identity, ModeFromPrompt) {
    EXPECT_EQ(mode_from_prompt("R1#"), "global");
    EXPECT_EQ(mode_from_prompt("R1(config)#"), "config");
    EXPECT_EQ(mode_from_prompt("RP/0/RSP0/CPU0:pe1(admin)#"), "admin");
    EXPECT_EQ(mode_from_prompt("sysadmin-vm:0_RP0#"), "admin");
}

TEST(Identity, PromptRegexFollowsModes) {
    std::regex re(prompt_regex_for("R1#"));
    EXPECT_TRUE(std::regex_search(std::string("output\r\nR1#"), re));
    EXPECT_TRUE(std::regex_search(std::string("\r\nR1(config)#"), re));
    EXPECT_TRUE(std::regex_search(std::string("\r\nR1>"), re));
    EXPECT_FALSE(std::regex_search(std::string("\r\nR10#"), re));
    EXPECT_FALSE(std::regex_search(std::string("R1# show run"), re));

    std::regex xr(prompt_regex_for("RP/0/RSP0/CPU0:pe1#"));
    EXPECT_TRUE(std::regex_search(std::string("\nRP/0/RSP0/CPU0:pe1(config)#"), xr));
}

TEST(Identity, ExactPromptForJumpHosts) {
    std::regex re(exact_prompt_regex("[admin@jump1 ~]$ "));
    EXPECT_TRUE(std::regex_search(std::string("bye\r\n[admin@jump1 ~]$ "), re));
    EXPECT_FALSE(std::regex_search(std::string("\r\n[admin@jump2 ~]$ "), re));
}
