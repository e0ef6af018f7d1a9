#pragma once

#include <filesystem>

// Per-build temporary directory, always a fresh ./tmpdir.linuximage.XXXXXX
// below the given base directory.
class Workspace {
    std::filesystem::path tmpdir;
    explicit Workspace(const std::filesystem::path& root) : tmpdir(root) {}
public:
    static Workspace create(const std::filesystem::path& base = std::filesystem::current_path());

    const std::filesystem::path& root() const { return tmpdir; }
    std::filesystem::path log_dir() const { return tmpdir / "cmd_logs"; }
    std::filesystem::path mount_point() const { return tmpdir / "mnt/p1"; }
    std::filesystem::path image() const { return tmpdir / "linux.img"; }

    // returns false (and leaves the tree as is) on failure
    bool remove() const;
};
