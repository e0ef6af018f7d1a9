#pragma once

#include <stdexcept>
#include <string>

#include "command.h"

// Workspace, loop device, partition node or mount could not be acquired.
class ResourceAcquisitionError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

class ExternalToolError : public std::runtime_error {
    CommandResult command_result;
public:
    explicit ExternalToolError(const CommandResult& result);
    const CommandResult& result() const { return command_result; }
};

class NetworkFetchError : public std::runtime_error {
    std::string failed_url;
public:
    NetworkFetchError(const std::string& url, const std::string& reason)
        : std::runtime_error("Failed to download " + url + ": " + reason), failed_url(url) {}
    const std::string& url() const { return failed_url; }
};

class Interrupted : public std::runtime_error {
    int signo;
public:
    explicit Interrupted(int signal);
    int signal() const { return signo; }
};
