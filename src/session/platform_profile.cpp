#include "platform_profile.hpp"
#include <core/utils.hpp>

std::string PlatformProfile::command_error_pattern() const {
    std::string out;
    for (const auto* p : {&syntax_error, &ambiguous_command, &incomplete_command}) {
        if (p->empty()) continue;
        if (!out.empty()) out += '|';
        out += *p;
    }
    return out;
}

namespace {

const char* const kIosSyntax =
    "% Invalid input detected|% Unknown command or computer name|% Bad IP address or host name";
const char* const kXrPrompt = "^RP/\\d+/RS?P[0-1]/CPU[0-3]:";

std::vector<PlatformProfile> builtin_profiles() {
    std::vector<PlatformProfile> v;

    PlatformProfile calvados;
    calvados.name = "Calvados";
    calvados.os_type = "Calvados";
    calvados.family = "NCS6K";
    calvados.prompt = "^sysadmin-vm:[0-3]_RS?P[0-1]";
    calvados.paging_disable = {"terminal length 0", "terminal width 0"};
    calvados.syntax_error = "% Invalid input detected|syntax error: ";
    calvados.ambiguous_command = "% Ambiguous command";
    calvados.incomplete_command = "% Incomplete command";
    calvados.version_pattern = "Version\\s*:?\\s*([\\d\\.]+\\w*)";
    calvados.inventory_command = "show inventory chassis";
    calvados.reload_command = "hw-module location all reload";
    v.push_back(calvados);

    PlatformProfile exr;
    exr.name = "eXR";
    exr.os_type = "eXR";
    exr.family = "ASR9K";
    exr.banner = "IOS XR[\\s\\S]*Build Information";
    exr.paging_disable = {"terminal exec prompt no-timestamp", "terminal length 0", "terminal width 0"};
    exr.syntax_error = "% Invalid input detected|Error: input buffer overflow";
    exr.ambiguous_command = "% Ambiguous command";
    exr.incomplete_command = "% Incomplete command";
    exr.version_pattern = "Version ([\\d\\.]+\\w*)";
    exr.reload_command = "admin hw-module location all reload";
    v.push_back(exr);

    PlatformProfile xr;
    xr.name = "XR";
    xr.os_type = "XR";
    xr.family = "ASR9K";
    xr.banner = "Cisco IOS XR Software|IOS XR";
    xr.prompt = kXrPrompt;
    xr.paging_disable = exr.paging_disable;
    xr.syntax_error = exr.syntax_error;
    xr.ambiguous_command = exr.ambiguous_command;
    xr.incomplete_command = exr.incomplete_command;
    xr.version_pattern = exr.version_pattern;
    xr.reload_command = "admin reload location all";
    v.push_back(xr);

    PlatformProfile nxos;
    nxos.name = "NX-OS";
    nxos.os_type = "NX-OS";
    nxos.family = "N9K";
    nxos.banner = "Cisco Nexus Operating System|NX-OS";
    nxos.paging_disable = {"terminal length 0", "terminal width 511"};
    nxos.syntax_error = "% Invalid command at '\\^' marker|% Invalid parameter detected";
    nxos.ambiguous_command = "% Ambiguous command";
    nxos.incomplete_command = "% Incomplete command";
    nxos.version_pattern = "(?:system|NXOS):\\s+version\\s+(\\S+)";
    v.push_back(nxos);

    PlatformProfile xe;
    xe.name = "IOS-XE";
    xe.os_type = "XE";
    xe.family = "ASR1K";
    xe.banner = "IOS-XE|IOS XE";
    xe.paging_disable = {"terminal length 0", "terminal width 0"};
    xe.syntax_error = kIosSyntax;
    xe.ambiguous_command = "% Ambiguous command";
    xe.incomplete_command = "% Incomplete command";
    xe.version_pattern = "Version ([^\\s,]+)";
    xe.supports_enable = true;
    v.push_back(xe);

    PlatformProfile ios = xe;
    ios.name = "IOS";
    ios.os_type = "IOS";
    ios.family = "IOS";
    ios.banner = "Cisco IOS Software|Internetwork Operating System";
    ios.prompt = "^[\\w\\-\\.]+(\\([^()]*\\))?[#>]$";
    v.push_back(ios);

    return v;
}

PlatformProfile unknown_profile() {
    PlatformProfile p;
    p.name = "unknown";
    p.os_type = "unknown";
    p.identity = false;
    p.reload_command.clear();
    return p;
}

std::optional<std::regex> compile(const std::string& pattern) {
    if (pattern.empty()) return std::nullopt;
    return std::regex(pattern, std::regex::ECMAScript);
}

struct ModelRule {
    std::regex pattern;
    std::string platform;    // empty: use the matched text
    std::string family;
};

const std::vector<ModelRule>& model_table() {
    static const std::vector<ModelRule> table = [] {
        std::vector<ModelRule> t;
        auto add = [&t](const char* re, const char* platform, const char* family) {
            t.push_back({std::regex(re, std::regex::ECMAScript), platform, family});
        };
        add("ASR-9904", "ASR-9904", "ASR9K");
        add("ASR[- ]9006", "ASR-9006", "ASR9K");
        add("ASR[- ]9010", "ASR-9010", "ASR9K");
        add("ASR[- ]9922", "ASR-9922", "ASR9K");
        add("ASR-9001", "ASR-9001", "ASR9K");
        add("ASR[- ]?9000|ASR9K|ASR-9K", "ASR-9000", "ASR9K");
        add("NCS[- ]6008", "NCS-6008", "NCS6K");
        add("NCS-6000|NCS6K", "NCS-6000", "NCS6K");
        add("NCS-4016|NCS-4009|NCS-4000|NCS4K", "NCS-4000", "NCS4K");
        add("NCS-55\\d\\d", "", "NCS5500");
        add("NCS-5\\d\\d\\d", "", "NCS5K");
        add("NCS-1002|NCS1K", "NCS-1002", "NCS1K");
        add("ASR-903", "ASR-903", "ASR900");
        add("ASR-901", "ASR-901", "ASR900");
        add("ASR-920", "ASR-920", "ASR900");
        add("ASR100\\d", "", "ASR1K");
        add("CRS-16", "CRS-16", "CRS");
        add("CRS-8", "CRS-8", "CRS");
        add("N9K-C\\w+|Nexus ?9\\d{3}", "", "N9K");
        add("N7K-C\\w+|Nexus ?7\\d{3}", "", "N7K");
        add("ISR4\\d{3}", "", "ISR");
        add("WS-C\\d{4}\\S*", "", "CAT");
        return t;
    }();
    return table;
}

} // namespace

// ── ProfileRegistry ──────────────────────────────────────────

const ProfileRegistry& ProfileRegistry::builtin() {
    static const ProfileRegistry registry(builtin_profiles());
    return registry;
}

ProfileRegistry::ProfileRegistry(std::vector<PlatformProfile> profiles)
    : profiles_(std::move(profiles)), unknown_(unknown_profile()) {
    for (const auto& p : profiles_) {
        matchers_.push_back({compile(p.banner), compile(p.prompt)});
    }
}

const PlatformProfile& ProfileRegistry::match(const std::string& banner,
                                              const std::string& prompt) const {
    std::string bare = trimmed(prompt);
    for (size_t i = 0; i < profiles_.size(); ++i) {
        const auto& m = matchers_[i];
        if (m.banner && !banner.empty() && std::regex_search(banner, *m.banner)) return profiles_[i];
        if (m.prompt && !bare.empty() && std::regex_search(bare, *m.prompt)) return profiles_[i];
    }
    return unknown_;
}

const PlatformProfile* ProfileRegistry::find(const std::string& name) const {
    for (const auto& p : profiles_) {
        if (p.name == name) return &p;
    }
    return name == unknown_.name ? &unknown_ : nullptr;
}

// ── Identity parsing ─────────────────────────────────────────

std::optional<ModelInfo> lookup_model(const std::string& text) {
    for (const auto& rule : model_table()) {
        std::smatch m;
        if (std::regex_search(text, m, rule.pattern)) {
            return ModelInfo{rule.platform.empty() ? m[0].str() : rule.platform, rule.family};
        }
    }
    static const std::regex processor("[Cc]isco (\\S+) \\([^)]*\\) processor");
    std::smatch m;
    if (std::regex_search(text, m, processor)) {
        return ModelInfo{m[1].str(), ""};
    }
    return std::nullopt;
}

std::vector<InventoryEntry> parse_inventory_entries(const std::string& text) {
    static const std::regex name_re("NAME:\\s*\"([^\"]*)\"\\s*,\\s*DESCR:\\s*\"([^\"]*)\"");
    static const std::regex pid_re("PID:\\s*([^,\\s]*)\\s*,\\s*VID:\\s*([^,\\s]*)\\s*,\\s*SN:\\s*(\\S*)");

    std::vector<InventoryEntry> entries;
    for (const auto& line : split_lines(text)) {
        std::smatch m;
        if (std::regex_search(line, m, name_re)) {
            InventoryEntry e;
            e.name = trimmed(m[1].str());
            e.description = trimmed(m[2].str());
            entries.push_back(e);
        } else if (!entries.empty() && std::regex_search(line, m, pid_re)) {
            auto& e = entries.back();
            e.pid = m[1].str();
            e.vid = m[2].str();
            e.sn = m[3].str();
        }
    }
    return entries;
}

std::optional<InventoryEntry> parse_inventory(const std::string& text) {
    auto entries = parse_inventory_entries(text);
    if (entries.empty()) return std::nullopt;
    static const std::regex chassis("[Cc]hassis");
    for (const auto& e : entries) {
        if (std::regex_search(e.name, chassis) || std::regex_search(e.description, chassis)) {
            return e;
        }
    }
    return entries.front();
}

std::optional<std::string> parse_os_version(const std::string& text, const PlatformProfile& profile) {
    if (profile.version_pattern.empty()) return std::nullopt;
    std::regex re(profile.version_pattern, std::regex::ECMAScript);
    std::smatch m;
    if (std::regex_search(text, m, re) && m.size() > 1) {
        std::string v = m[1].str();
        while (!v.empty() && (v.back() == ',' || v.back() == '.')) v.pop_back();
        return v;
    }
    return std::nullopt;
}

namespace {

// Prompt without the trailing #/>/$ and any "(config...)" mode suffix.
std::string prompt_base(const std::string& prompt) {
    std::string p = trimmed(prompt);
    while (!p.empty() && (p.back() == '#' || p.back() == '>' || p.back() == '$' || p.back() == '%')) {
        p.pop_back();
    }
    if (!p.empty() && p.back() == ')') {
        size_t open = p.rfind('(');
        if (open != std::string::npos && open > 0) p.erase(open);
    }
    return p;
}

} // namespace

std::string hostname_from_prompt(const std::string& prompt) {
    std::string base = prompt_base(prompt);

    // [user@host ~]  or  user@host:~
    size_t at = base.find('@');
    if (at != std::string::npos) {
        std::string rest = base.substr(at + 1);
        size_t end = rest.find_first_of(" :]");
        return end == std::string::npos ? rest : rest.substr(0, end);
    }

    if (base.compare(0, 3, "RP/") == 0 || base.compare(0, 12, "sysadmin-vm:") == 0) {
        size_t colon = base.rfind(':');
        size_t first = base.find(':');
        if (base.compare(0, 3, "RP/") == 0 || colon != first) {
            return base.substr(colon + 1);
        }
    }
    return base;
}

std::string mode_from_prompt(const std::string& prompt) {
    std::string p = trimmed(prompt);
    if (p.find("(config") != std::string::npos) return "config";
    if (p.find("(admin") != std::string::npos || p.compare(0, 12, "sysadmin-vm:") == 0) return "admin";
    return "global";
}

std::string prompt_regex_for(const std::string& prompt) {
    std::string p = trimmed(prompt);
    if (p.empty()) return "";
    char last = p.back();
    if (last != '#' && last != '>') return exact_prompt_regex(prompt);
    return "(?:^|[\\r\\n])(" + regex_escape(prompt_base(p)) + "(?:\\([^()\\r\\n]*\\))?[#>]) ?$";
}

std::string exact_prompt_regex(const std::string& prompt) {
    std::string p = trimmed(prompt);
    return "(?:^|[\\r\\n])(" + regex_escape(p) + ") ?$";
}
