#pragma once

#include <filesystem>
#include <string>
#include <vector>

struct CommandResult {
    std::vector<std::string> command; // argv, program first
    int exit_status;
    std::filesystem::path stdout_log;
    std::filesystem::path stderr_log;
};

// Runs programs without a shell, teeing stdout/stderr of every invocation
// into a fresh pair of log files under log_dir. A non-zero exit status is
// raised as ExternalToolError carrying the CommandResult.
class CommandRunner {
    std::filesystem::path log_dir;
    bool verbose;
    unsigned int sequence = 0;
public:
    CommandRunner(const std::filesystem::path& log_dir, bool verbose = false)
        : log_dir(log_dir), verbose(verbose) {}
    CommandRunner(const CommandRunner&) = delete;
    CommandRunner& operator=(const CommandRunner&) = delete;

    CommandResult run(const std::string& cmd, const std::vector<std::string>& args = {});
    const std::filesystem::path& logs() const { return log_dir; }
};

std::string read_output(const CommandResult& result);

// Renders argv the way `printf %q` does, for diagnostics only.
std::string shell_quote(const std::vector<std::string>& argv);
