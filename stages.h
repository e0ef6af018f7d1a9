#pragma once

#include <sys/stat.h>

#include <filesystem>
#include <memory>
#include <string>
#include <vector>

#include "command.h"
#include "options.h"
#include "resources.h"
#include "workspace.h"

enum class PipelineState { Init, Partitioned, Populated, BootInstalled, Finalized, Failed };

const char* to_string(PipelineState state);

struct BuildContext {
    const BuildOptions& options;
    const Workspace& workspace;
    CommandRunner& runner;
    ResourceTracker& resources;
};

class Stage {
public:
    virtual ~Stage() = default;
    virtual std::string description() const = 0;
    // state the pipeline is in once this stage has completed
    virtual PipelineState completes() const = 0;
    virtual void run(BuildContext& ctx) = 0;
};

// Sparse raw image in the workspace, bound to a loop device.
class DiskInitStage : public Stage {
public:
    std::string description() const override { return "Creating base disk image"; }
    PipelineState completes() const override { return PipelineState::Init; }
    void run(BuildContext& ctx) override;
};

// MBR label, one bootable primary partition from 1MiB to the end, ext4.
class PartitionFormatStage : public Stage {
public:
    std::string description() const override { return "Disk partitionning and formatting"; }
    PipelineState completes() const override { return PipelineState::Partitioned; }
    void run(BuildContext& ctx) override;
};

class FilesystemInstallStage : public Stage {
public:
    std::string description() const override { return "Installing filesystem"; }
    PipelineState completes() const override { return PipelineState::Populated; }
    void run(BuildContext& ctx) override;
};

class BootInstallStage : public Stage {
public:
    std::string description() const override { return "Installing kernel, init, and bootloader"; }
    PipelineState completes() const override { return PipelineState::BootInstalled; }
    void run(BuildContext& ctx) override;
};

std::vector<std::unique_ptr<Stage>> default_stages();

// grub.cfg with a single menu entry booting /boot/vmlinuz with /init
std::string grub_config();
std::string init_script();

// `busybox --list-full` output to relative link paths
std::vector<std::string> parse_utility_list(const std::string& output);

struct LinkFailure {
    std::string name;
    std::string reason;
};

// Creates root/<name> -> target for every name using up to max_workers
// threads (0: one per CPU). Failures don't stop the other links.
std::vector<LinkFailure> create_utility_links(const std::filesystem::path& root,
    const std::vector<std::string>& names, const std::filesystem::path& target, unsigned int max_workers = 0);

void write_file(const std::filesystem::path& path, const std::string& content, mode_t mode = 0644);

void fetch(CommandRunner& runner, const std::string& url, const std::filesystem::path& dest);
