#pragma once

#include <string>
#include <vector>
#include <map>
#include <optional>
#include <functional>
#include <filesystem>
#include "types.hpp"

struct CredentialRequest {
    std::string username;
    std::string host;
    bool enable = false;      // asking for the privileged-mode password
};

// Supplies secrets the target urls do not carry. Injected into every
// connection; nothing is looked up through globals.
class CredentialResolver {
public:
    virtual ~CredentialResolver() = default;

    virtual Result<std::string> resolve(const CredentialRequest& request) = 0;

    Result<std::string> resolve(const std::string& username, const std::string& host) {
        return resolve(CredentialRequest{username, host, false});
    }
    Result<std::string> resolve_enable(const std::string& username, const std::string& host) {
        return resolve(CredentialRequest{username, host, true});
    }
};

// Never has a secret. Used when every hop carries its own password.
class NoCredentialResolver : public CredentialResolver {
public:
    using CredentialResolver::resolve;
    Result<std::string> resolve(const CredentialRequest& request) override;
};

// Adapts a callable, mostly for tests and embedding.
class CallbackCredentialResolver : public CredentialResolver {
public:
    using Callback = std::function<Result<std::string>(const CredentialRequest&)>;
    explicit CallbackCredentialResolver(Callback cb) : cb_(std::move(cb)) {}

    using CredentialResolver::resolve;

    Result<std::string> resolve(const CredentialRequest& request) override { return cb_(request); }

private:
    Callback cb_;
};

struct CredentialInfo {
    std::string key;
    bool has_value;
};

// key=value lines in ~/.termhop/credentials, chmod 600.
// Keys are "user@host" and "enable:user@host".
class FileCredentialStore {
public:
    FileCredentialStore();
    explicit FileCredentialStore(std::filesystem::path path);

    Result<std::string> get(const std::string& key) const;
    Result<void> set(const std::string& key, const std::string& value);
    Result<void> remove(const std::string& key);
    std::vector<CredentialInfo> list() const;

    const std::filesystem::path& path() const { return path_; }

    static std::string key_for(const CredentialRequest& request);

private:
    std::filesystem::path path_;

    std::map<std::string, std::string> read_all() const;
    bool write_all(const std::map<std::string, std::string>& entries) const;
};

// Store first, then ask on the terminal. Answers typed by the user are
// saved back when `remember` is set.
class InteractiveCredentialResolver : public CredentialResolver {
public:
    using Prompt = std::function<std::string(const std::string& prompt)>;

    explicit InteractiveCredentialResolver(FileCredentialStore* store = nullptr,
                                           bool remember = false, Prompt prompt = nullptr);

    using CredentialResolver::resolve;

    Result<std::string> resolve(const CredentialRequest& request) override;

    // Set when a typed answer could not be saved; the login itself goes on.
    const std::optional<Error>& save_error() const { return save_error_; }

private:
    FileCredentialStore* store_;
    bool remember_;
    Prompt prompt_;
    bool terminal_;
    std::optional<Error> save_error_;
};
