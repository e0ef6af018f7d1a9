#include <fstream>
#include <sstream>
#include <algorithm>
#include <atomic>
#include <mutex>
#include <thread>

#include "error.h"
#include "log.h"
#include "mount.h"
#include "stages.h"

static const std::filesystem::path busybox_path("/usr/bin/busybox");

static std::string trim(const std::string& str)
{
    auto begin = str.find_first_not_of(" \t\r\n");
    if (begin == std::string::npos) return "";
    //else
    auto end = str.find_last_not_of(" \t\r\n");
    return str.substr(begin, end - begin + 1);
}

static const BlockDeviceBinding& require_loop(const BuildContext& ctx)
{
    const auto& loop = ctx.resources.loop();
    if (!loop) throw std::logic_error("No loop device bound");
    return *loop;
}

static const MountBinding& require_mount(const BuildContext& ctx)
{
    const auto& mount = ctx.resources.mount();
    if (!mount) throw std::logic_error("Primary partition is not mounted");
    return *mount;
}

const char* to_string(PipelineState state)
{
    switch (state) {
    case PipelineState::Init: return "Init";
    case PipelineState::Partitioned: return "Partitioned";
    case PipelineState::Populated: return "Populated";
    case PipelineState::BootInstalled: return "BootInstalled";
    case PipelineState::Finalized: return "Finalized";
    case PipelineState::Failed: return "Failed";
    }
    return "Unknown";
}

void write_file(const std::filesystem::path& path, const std::string& content, mode_t mode)
{
    std::ofstream f(path, std::ios::trunc);
    if (!f) throw std::runtime_error("Unable to open " + path.string() + " for writing");
    //else
    f << content;
    f.close();
    if (!f) throw std::runtime_error("Failed to write " + path.string());
    std::filesystem::permissions(path, static_cast<std::filesystem::perms>(mode));
}

void fetch(CommandRunner& runner, const std::string& url, const std::filesystem::path& dest)
{
    try {
        runner.run("wget", {url, "-O", dest.string()});
    }
    catch (const ExternalToolError& ex) {
        throw NetworkFetchError(url, ex.what());
    }
}

std::string grub_config()
{
    return
        "set timeout=2\n"
        "set default=0\n"
        "\n"
        "menuentry \"BusyBox Linux\" {\n"
        "    linux /boot/vmlinuz root=/dev/sda1 rw init=/init quiet console=ttyS0\n"
        "}\n";
}

std::string init_script()
{
    return
        "#!/bin/sh\n"
        "mount -t proc proc /proc\n"
        "mount -t sysfs sysfs /sys\n"
        "echo \"Booted into BusyBox, use \\`poweroff -f\\` to shutdown\"\n"
        "echo \"hello world\"\n"
        "\n"
        "# Stop errors about no job control\n"
        "setsid  cttyhack sh\n"
        "\n"
        "exec /bin/sh\n";
}

std::vector<std::string> parse_utility_list(const std::string& output)
{
    std::vector<std::string> names;
    std::istringstream in(output);
    std::string line;
    while (std::getline(in, line)) {
        auto name = trim(line);
        while (!name.empty() && name.front() == '/') name.erase(0, 1);
        if (name.empty()) continue;
        //else
        std::filesystem::path path(name);
        if (std::find(path.begin(), path.end(), std::filesystem::path("..")) != path.end()) {
            warn("Ignoring utility path " + name);
            continue;
        }
        names.push_back(name);
    }
    return names;
}

std::vector<LinkFailure> create_utility_links(const std::filesystem::path& root,
    const std::vector<std::string>& names, const std::filesystem::path& target, unsigned int max_workers)
{
    if (max_workers == 0) max_workers = std::max(1u, std::thread::hardware_concurrency());
    const auto workers = std::min<size_t>(max_workers, names.size());

    std::atomic<size_t> next{0};
    std::mutex mutex;
    std::vector<LinkFailure> failures;
    auto work = [&]() {
        for (size_t i = next++; i < names.size(); i = next++) {
            std::error_code ec;
            std::filesystem::create_symlink(target, root / names[i], ec);
            if (!ec) continue;
            //else
            std::lock_guard<std::mutex> lock(mutex);
            failures.push_back({names[i], ec.message()});
        }
    };

    std::vector<std::thread> threads;
    try {
        for (size_t i = 0; i < workers; i++) {
            threads.emplace_back(work);
        }
    }
    catch (const std::system_error&) {
        next = names.size(); // let the running workers finish early
        for (auto& t:threads) t.join();
        throw;
    }
    for (auto& t:threads) t.join();

    std::sort(failures.begin(), failures.end(),
        [](const LinkFailure& a, const LinkFailure& b) { return a.name < b.name; });
    return failures;
}

void DiskInitStage::run(BuildContext& ctx)
{
    const auto image = ctx.workspace.image();
    ctx.runner.run("qemu-img", {"create", "-f", "raw", image.string(), ctx.options.disk_size});

    auto result = ctx.runner.run("losetup", {"--find", "--show", "--partscan", image.string()});
    auto device = trim(read_output(result));
    if (device.empty()) throw ResourceAcquisitionError("losetup did not report a loop device");
    //else
    ctx.resources.bind_loop({device, image});
    debug_print("Using loop device: " + device);
}

void PartitionFormatStage::run(BuildContext& ctx)
{
    const auto& loop = require_loop(ctx);
    ctx.runner.run("parted", {"--script", loop.device.string(),
        "mklabel msdos", "mkpart primary ext4 1MiB 100%", "set 1 boot on"});
    try {
        ctx.runner.run("udevadm", {"settle"});
    }
    catch (const ExternalToolError& ex) {
        warn(ex.what());
    }

    const auto partition = partition_path(loop);
    if (!std::filesystem::exists(partition)) {
        throw ResourceAcquisitionError("Partition " + partition.string() + " did not appear");
    }
    //else
    ctx.runner.run("mkfs.ext4", {"-F", partition.string()});

    auto fs = probe_filesystem(partition);
    if (fs.type != "ext4") throw ResourceAcquisitionError("No ext4 filesystem found on " + partition.string());
    //else
    debug_print("ext4 filesystem " + fs.uuid.value_or("(no UUID)") + " created on " + partition.string());
}

void FilesystemInstallStage::run(BuildContext& ctx)
{
    const auto partition = partition_path(require_loop(ctx));
    const auto root = ctx.workspace.mount_point();
    std::filesystem::create_directories(root);
    // recorded first: a mount that fails half way is still unmounted by cleanup
    ctx.resources.bind_mount({root, partition});
    mount_filesystem(partition, root, "ext4", MS_NOATIME | MS_NODIRATIME);
    debug_print("Primary partition mounted at: " + root.string());

    for (auto dir:{"dev", "proc", "sys", "bin", "sbin", "usr/bin", "usr/sbin"}) {
        std::filesystem::create_directories(root / dir);
    }

    const auto busybox = root / busybox_path.relative_path();
    fetch(ctx.runner, ctx.options.busybox_url, busybox);
    std::filesystem::permissions(busybox, static_cast<std::filesystem::perms>(0755));

    debug_print("Creating symlinks for BusyBox utilities");
    auto utilities = parse_utility_list(read_output(ctx.runner.run(busybox.string(), {"--list-full"})));
    auto failures = create_utility_links(root, utilities, busybox_path);
    for (const auto& failure:failures) {
        warn("Unable to link " + failure.name + ": " + failure.reason);
    }
    if (!failures.empty()) {
        warn(std::to_string(failures.size()) + " of " + std::to_string(utilities.size())
            + " utility links could not be created");
    }
    debug_print(std::to_string(utilities.size() - failures.size()) + " utility links created");
}

void BootInstallStage::run(BuildContext& ctx)
{
    const auto& loop = require_loop(ctx);
    const auto root = require_mount(ctx).mount_point;

    debug_print("Creating GRUB configuration");
    std::filesystem::create_directories(root / "boot/grub");
    write_file(root / "boot/grub/grub.cfg", grub_config());

    debug_print("Downloading and installing kernel");
    const auto package = ctx.workspace.root() / "kernel.deb";
    const auto extracted = ctx.workspace.root() / "kernel";
    fetch(ctx.runner, ctx.options.kernel_url, package);
    ctx.runner.run("dpkg-deb", {"-x", package.string(), extracted.string()});
    const auto kernel = extracted / ctx.options.kernel_image;
    if (!std::filesystem::is_regular_file(kernel)) {
        throw std::runtime_error("Kernel package doesn't contain " + ctx.options.kernel_image.string());
    }
    //else
    std::filesystem::copy_file(kernel, root / "boot/vmlinuz", std::filesystem::copy_options::overwrite_existing);

    debug_print("Creating init script");
    write_file(root / "init", init_script(), 0755);

    debug_print("Installing GRUB");
    ctx.runner.run("grub-install", {
        "--target=i386-pc",
        "--boot-directory=" + (root / "boot").string(),
        "--no-floppy",
        "--modules=part_msdos",
        "--root-directory=" + root.string(),
        "--force",
        loop.device.string(),
    });
}

std::vector<std::unique_ptr<Stage>> default_stages()
{
    std::vector<std::unique_ptr<Stage>> stages;
    stages.push_back(std::make_unique<DiskInitStage>());
    stages.push_back(std::make_unique<PartitionFormatStage>());
    stages.push_back(std::make_unique<FilesystemInstallStage>());
    stages.push_back(std::make_unique<BootInstallStage>());
    return stages;
}
