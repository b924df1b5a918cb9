#include "credentials.hpp"
#include <platform/platform.hpp>
#include <platform/terminal.hpp>
#include <fmt/format.h>
#include <fstream>
#include <sys/stat.h>

namespace fs = std::filesystem;

// ── NoCredentialResolver ─────────────────────────────────────

Result<std::string> NoCredentialResolver::resolve(const CredentialRequest& request) {
    return Result<std::string>::Err(make_error(
        ErrorKind::kConnectionAuthentication,
        fmt::format("No {}password available for {}@{}", request.enable ? "enable " : "",
                    request.username, request.host),
        request.host));
}

// ── FileCredentialStore ──────────────────────────────────────

FileCredentialStore::FileCredentialStore()
    : path_(platform::home_dir() / ".termhop" / "credentials") {}

FileCredentialStore::FileCredentialStore(fs::path path) : path_(std::move(path)) {}

std::string FileCredentialStore::key_for(const CredentialRequest& request) {
    std::string key = request.username.empty() ? request.host
                                               : request.username + "@" + request.host;
    return request.enable ? "enable:" + key : key;
}

std::map<std::string, std::string> FileCredentialStore::read_all() const {
    std::map<std::string, std::string> m;
    std::ifstream f(path_);
    if (!f) return m;

    std::string line;
    while (std::getline(f, line)) {
        auto eq = line.find('=');
        if (eq != std::string::npos) {
            m[line.substr(0, eq)] = line.substr(eq + 1);
        }
    }
    return m;
}

bool FileCredentialStore::write_all(const std::map<std::string, std::string>& entries) const {
    std::error_code ec;
    fs::create_directories(path_.parent_path(), ec);
    if (ec) return false;

    std::ofstream f(path_, std::ios::trunc);
    if (!f) return false;
    for (const auto& [k, v] : entries) {
        f << k << "=" << v << "\n";
    }
    f.close();

    return chmod(path_.c_str(), 0600) == 0;
}

Result<std::string> FileCredentialStore::get(const std::string& key) const {
    auto m = read_all();
    auto it = m.find(key);
    if (it == m.end()) {
        return Result<std::string>::Err(make_error(ErrorKind::kConnectionAuthentication,
                                                   "Credential not found: " + key));
    }
    return Result<std::string>::Ok(it->second);
}

Result<void> FileCredentialStore::set(const std::string& key, const std::string& value) {
    if (key.empty() || key.find('=') != std::string::npos || key.find('\n') != std::string::npos ||
        value.find('\n') != std::string::npos) {
        return Result<void>::Err(make_error(ErrorKind::kConnection, "Invalid credential entry"));
    }
    auto m = read_all();
    m[key] = value;
    if (!write_all(m)) {
        return Result<void>::Err(make_error(ErrorKind::kConnection,
                                            "Failed to write credentials file " + path_.string()));
    }
    return Result<void>::Ok();
}

Result<void> FileCredentialStore::remove(const std::string& key) {
    auto m = read_all();
    if (m.erase(key) == 0) {
        return Result<void>::Err(make_error(ErrorKind::kConnection, "Credential not found: " + key));
    }
    if (!write_all(m)) {
        return Result<void>::Err(make_error(ErrorKind::kConnection,
                                            "Failed to write credentials file " + path_.string()));
    }
    return Result<void>::Ok();
}

std::vector<CredentialInfo> FileCredentialStore::list() const {
    std::vector<CredentialInfo> out;
    for (const auto& [k, v] : read_all()) {
        out.push_back({k, !v.empty()});
    }
    return out;
}

// ── InteractiveCredentialResolver ────────────────────────────

InteractiveCredentialResolver::InteractiveCredentialResolver(FileCredentialStore* store,
                                                             bool remember, Prompt prompt)
    : store_(store), remember_(remember), prompt_(std::move(prompt)), terminal_(!prompt_) {
    if (terminal_) {
        prompt_ = [](const std::string& text) { return platform::read_secret(text); };
    }
}

Result<std::string> InteractiveCredentialResolver::resolve(const CredentialRequest& request) {
    std::string key = FileCredentialStore::key_for(request);
    if (store_) {
        auto stored = store_->get(key);
        if (stored.is_ok()) return stored;
    }

    if (terminal_ && !platform::stdin_is_tty()) {
        return Result<std::string>::Err(make_error(ErrorKind::kConnectionAuthentication,
                                                   "No password for " + key, request.host));
    }

    std::string text = request.enable
        ? fmt::format("Enable password for {}: ", request.host)
        : fmt::format("Password for {}: ", key);
    std::string secret = prompt_(text);

    if (store_ && remember_ && !secret.empty()) {
        auto saved = store_->set(key, secret);
        if (saved.is_err()) save_error_ = saved.error;
    }
    return Result<std::string>::Ok(secret);
}
