#pragma once

#include <sys/mount.h>

#include <filesystem>
#include <optional>
#include <string>

void mount_filesystem(const std::filesystem::path& device, const std::filesystem::path& target,
    const std::string& fstype = "auto", int flags = MS_RELATIME, const std::string& data = "");

// Unmounts target and everything mounted below it, deepest first.
// Returns false if target is not a mount point.
bool unmount_recursive(const std::filesystem::path& target);

struct FilesystemInfo {
    std::optional<std::string> type;
    std::optional<std::string> uuid;
};

FilesystemInfo probe_filesystem(const std::filesystem::path& device);
