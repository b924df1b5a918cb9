#include "hop_info.hpp"
#include <sstream>
#include "constants.hpp"
#include "utils.hpp"
#include <fmt/format.h>
#include <cctype>

const char* protocol_name(Protocol protocol) {
    return protocol == Protocol::kTelnet ? "telnet" : "ssh";
}

std::vector<std::string> Hop::connect_argv() const {
    std::vector<std::string> argv;
    if (protocol == Protocol::kTelnet) {
        argv = {TELNET_PROGRAM, host, std::to_string(port)};
        return argv;
    }
    argv.push_back(SSH_PROGRAM);
    std::istringstream opts(SSH_OPTS);
    std::string word;
    while (opts >> word) argv.push_back(word);
    argv.push_back("-p");
    argv.push_back(std::to_string(port));
    if (username && !username->empty()) {
        argv.push_back(*username + "@" + host);
    } else {
        argv.push_back(host);
    }
    return argv;
}

std::string Hop::connect_command() const {
    std::string out;
    for (const auto& arg : connect_argv()) {
        if (!out.empty()) out += ' ';
        out += arg;
    }
    return out;
}

std::string Hop::display() const {
    std::string user = (username && !username->empty()) ? *username + "@" : "";
    return fmt::format("{}://{}{}:{}", protocol_name(protocol), user, host, port);
}

bool Hop::is_valid() const {
    if (host.empty() || port <= 0 || port > 65535) return false;
    for (char c : host) {
        if (std::isspace(static_cast<unsigned char>(c))) return false;
    }
    return true;
}

std::string ConnectionTarget::display() const {
    std::string out;
    for (const auto& hop : hops) {
        if (!out.empty()) out += "->";
        out += hop.host;
    }
    return out;
}

// ── URL parsing ─────────────────────────────────────────────

static std::string percent_decode(const std::string& s) {
    std::string out;
    out.reserve(s.size());
    for (size_t i = 0; i < s.size(); ++i) {
        if (s[i] == '%' && i + 2 < s.size() &&
            std::isxdigit(static_cast<unsigned char>(s[i + 1])) &&
            std::isxdigit(static_cast<unsigned char>(s[i + 2]))) {
            out += static_cast<char>(std::stoi(s.substr(i + 1, 2), nullptr, 16));
            i += 2;
        } else {
            out += s[i];
        }
    }
    return out;
}

static Result<Hop> invalid(const std::string& url, const std::string& why) {
    return Result<Hop>::Err(make_error(ErrorKind::kInvalidHopInfo,
                                       fmt::format("Invalid url '{}': {}", url, why)));
}

Result<Hop> parse_hop_url(const std::string& url) {
    Hop hop;

    auto scheme_end = url.find("://");
    if (scheme_end == std::string::npos) {
        return invalid(url, "missing protocol");
    }

    std::string scheme = url.substr(0, scheme_end);
    for (auto& c : scheme) c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    if (scheme == "ssh") {
        hop.protocol = Protocol::kSsh;
        hop.port = DEFAULT_SSH_PORT;
    } else if (scheme == "telnet") {
        hop.protocol = Protocol::kTelnet;
        hop.port = DEFAULT_TELNET_PORT;
    } else {
        return invalid(url, "unsupported protocol '" + scheme + "'");
    }

    std::string rest = url.substr(scheme_end + 3);

    // Path part carries the enable password
    auto slash = rest.find('/');
    if (slash != std::string::npos) {
        std::string enable = rest.substr(slash + 1);
        if (!enable.empty()) hop.enable_password = percent_decode(enable);
        rest = rest.substr(0, slash);
    }

    // Userinfo: the last '@' separates it from the host so passwords may
    // contain '@' when not escaped
    auto at = rest.rfind('@');
    if (at != std::string::npos) {
        std::string userinfo = rest.substr(0, at);
        rest = rest.substr(at + 1);
        auto colon = userinfo.find(':');
        if (colon != std::string::npos) {
            hop.username = percent_decode(userinfo.substr(0, colon));
            hop.password = percent_decode(userinfo.substr(colon + 1));
        } else {
            hop.username = percent_decode(userinfo);
        }
    }

    std::string port_str;
    if (!rest.empty() && rest[0] == '[') {
        auto close = rest.find(']');
        if (close == std::string::npos) {
            return invalid(url, "unterminated IPv6 address");
        }
        hop.host = rest.substr(1, close - 1);
        std::string tail = rest.substr(close + 1);
        if (!tail.empty()) {
            if (tail[0] != ':') return invalid(url, "garbage after host");
            port_str = tail.substr(1);
        }
    } else {
        auto colon = rest.rfind(':');
        if (colon != std::string::npos) {
            hop.host = rest.substr(0, colon);
            port_str = rest.substr(colon + 1);
        } else {
            hop.host = rest;
        }
    }

    if (!port_str.empty()) {
        for (char c : port_str) {
            if (!std::isdigit(static_cast<unsigned char>(c))) {
                return invalid(url, "port is not a number");
            }
        }
        hop.port = safe_stoi(port_str, -1);
    }

    if (hop.host.empty()) {
        return invalid(url, "missing host");
    }
    if (!hop.is_valid()) {
        return invalid(url, "bad host or port");
    }

    return Result<Hop>::Ok(hop);
}

Result<ConnectionTarget> make_target(const std::vector<std::string>& jumphost_urls,
                                     const std::string& destination_url) {
    ConnectionTarget target;

    if (destination_url.empty()) {
        return Result<ConnectionTarget>::Err(
            make_error(ErrorKind::kInvalidHopInfo, "Missing destination url"));
    }

    std::vector<std::string> urls = jumphost_urls;
    urls.push_back(destination_url);

    for (size_t i = 0; i < urls.size(); ++i) {
        auto hop = parse_hop_url(urls[i]);
        if (hop.is_err()) {
            hop.error.hop = static_cast<int>(i + 1);
            return Result<ConnectionTarget>::Err(hop.error);
        }
        target.hops.push_back(hop.value);
    }

    return Result<ConnectionTarget>::Ok(target);
}

Result<void> validate_target(const ConnectionTarget& target) {
    if (target.empty()) {
        return Result<void>::Err(make_error(ErrorKind::kInvalidHopInfo,
                                            "Connection target has no hops"));
    }
    for (size_t i = 0; i < target.hops.size(); ++i) {
        if (!target.hops[i].is_valid()) {
            return Result<void>::Err(make_error(ErrorKind::kInvalidHopInfo,
                                                "Invalid hop " + target.hops[i].display(),
                                                target.hops[i].host,
                                                static_cast<int>(i + 1)));
        }
    }
    return Result<void>::Ok();
}
