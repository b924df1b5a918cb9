#pragma once

#include <string>
#include <vector>
#include <regex>
#include <optional>

// Static description of one device OS. Profiles are immutable and shared by
// every connection.
struct PlatformProfile {
    std::string name;               // IOS, IOS-XE, XR, eXR, NX-OS, Calvados, unknown
    std::string os_type;
    std::string family;             // used when the model table has no entry
    std::string banner;             // regex searched in banner / show version text
    std::string prompt;             // regex searched in the detected prompt

    std::vector<std::string> paging_disable;
    std::string syntax_error;
    std::string ambiguous_command;
    std::string incomplete_command;
    std::string more = "--More--|<--- More --->";

    std::string version_command = "show version";
    std::string version_pattern;    // group 1 = OS version
    std::string inventory_command = "show inventory";

    std::string reload_command = "reload";
    bool supports_enable = false;
    bool identity = true;           // false: nothing beyond the raw prompt

    // syntax | ambiguous | incomplete, empty when the profile has none
    std::string command_error_pattern() const;
};

class ProfileRegistry {
public:
    // Built-in profiles, ordered from most to least specific.
    static const ProfileRegistry& builtin();

    explicit ProfileRegistry(std::vector<PlatformProfile> profiles);

    // First profile whose banner regex matches `banner` or whose prompt
    // regex matches `prompt`. Falls back to the generic unknown profile.
    const PlatformProfile& match(const std::string& banner, const std::string& prompt) const;

    const PlatformProfile* find(const std::string& name) const;
    const PlatformProfile& unknown() const { return unknown_; }
    const std::vector<PlatformProfile>& profiles() const { return profiles_; }

private:
    struct Matcher {
        std::optional<std::regex> banner;
        std::optional<std::regex> prompt;
    };

    std::vector<PlatformProfile> profiles_;
    std::vector<Matcher> matchers_;
    PlatformProfile unknown_;
};

// ── Device identity ──────────────────────────────────────────

struct ModelInfo {
    std::string platform;
    std::string family;
};

// Hardware model and family found in show version / inventory text.
std::optional<ModelInfo> lookup_model(const std::string& text);

struct InventoryEntry {
    std::string name;
    std::string description;
    std::string pid;
    std::string vid;
    std::string sn;
};

// All NAME/DESCR + PID/VID/SN records of a show inventory listing.
std::vector<InventoryEntry> parse_inventory_entries(const std::string& text);

// The chassis record (or the first record when none is named chassis).
std::optional<InventoryEntry> parse_inventory(const std::string& text);

std::optional<std::string> parse_os_version(const std::string& text, const PlatformProfile& profile);

// "RP/0/RSP0/CPU0:pe1(config)#" -> "pe1"
std::string hostname_from_prompt(const std::string& prompt);

// global, config or admin
std::string mode_from_prompt(const std::string& prompt);

// Regex matching the device prompt again in any mode: the hostname part
// stays fixed, the mode suffix and #/> may change. Anchored to the end of
// the buffer and to a line start.
std::string prompt_regex_for(const std::string& prompt);

// Regex matching exactly this prompt line, for jump hosts.
std::string exact_prompt_regex(const std::string& prompt);
