#pragma once

#include <string>
#include <vector>
#include <memory>
#include <core/config.hpp>
#include <core/credentials.hpp>
#include <session/connection.hpp>

struct CliOptions {
    std::string host_url;
    std::vector<std::string> jump_urls;
    std::string device;
    std::string session_log;
    int debug_level = 0;
    bool discover = false;
    bool shell = false;
    bool version = false;
    bool help = false;
    std::string command;
};

// Parse argv. Unknown flags and missing values are errors.
Result<CliOptions> parse_cli_args(const std::vector<std::string>& args);

// Error text printed for a failed operation, prefixed by its category.
std::string cli_error_text(const Error& error);

class TermhopCLI {
public:
    explicit TermhopCLI(CliOptions options);

    // Returns the process exit status.
    int run();

    static void print_usage();

private:
    CliOptions options_;
    Config config_;
    FileCredentialStore store_;
    std::unique_ptr<InteractiveCredentialResolver> resolver_;
    std::unique_ptr<Connection> connection_;

    Result<ConnectionTarget> build_target() const;
    LogSink build_log_sink() const;

    int run_discover();
    int run_command();
    int run_shell();
    int report(const Error& error) const;
    void print_device_info() const;
};
