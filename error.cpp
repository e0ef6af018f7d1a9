#include <string.h>

#include "error.h"

ExternalToolError::ExternalToolError(const CommandResult& result)
    : std::runtime_error(result.command.front() + " failed with exit status "
        + std::to_string(result.exit_status) + " (stderr: " + result.stderr_log.string() + ")"),
      command_result(result)
{
}

Interrupted::Interrupted(int signal)
    : std::runtime_error(std::string("Interrupted by signal ") + strsignal(signal)), signo(signal)
{
}
