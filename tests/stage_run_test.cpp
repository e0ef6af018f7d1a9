#include <stdlib.h>
#include <sys/stat.h>

#include <fstream>
#include <optional>

#include "error.h"
#include "stages.h"
#include "test_util.h"

// Runs the real stages against stand-in tools placed first on PATH. Every
// stand-in records its arguments, one per line, in calls/<tool>.
class StageRunTest : public TempDirTest {
protected:
    std::string saved_path;
    BuildOptions options;
    std::optional<Workspace> workspace;
    std::optional<CommandRunner> runner;
    ResourceTracker resources;

    void SetUp() override {
        TempDirTest::SetUp();
        std::filesystem::create_directories(dir / "bin");
        std::filesystem::create_directories(dir / "calls");
        const char* path = getenv("PATH");
        saved_path = path? path : "/usr/bin:/bin";
        setenv("PATH", ((dir / "bin").string() + ":" + saved_path).c_str(), 1);

        workspace = Workspace::create(dir);
        runner.emplace(workspace->log_dir());
        options.disk_size = "64M";
        options.busybox_url = "http://example.invalid/busybox";
        options.kernel_url = "http://example.invalid/kernel.deb";
        options.kernel_image = "boot/vmlinuz-test";
    }
    void TearDown() override {
        setenv("PATH", saved_path.c_str(), 1);
        TempDirTest::TearDown();
    }

    void tool(const std::string& name, const std::string& body = "") {
        auto script = dir / "bin" / name;
        std::ofstream f(script);
        f << "#!/bin/sh\n"
          << "for arg in \"$@\"; do printf '%s\\n' \"$arg\"; done > " << (dir / "calls" / name).string() << "\n"
          << body << "\n";
        f.close();
        std::filesystem::permissions(script, static_cast<std::filesystem::perms>(0755));
    }

    bool called(const std::string& name) const {
        return std::filesystem::exists(dir / "calls" / name);
    }

    std::vector<std::string> args(const std::string& name) const {
        std::vector<std::string> lines;
        std::ifstream f(dir / "calls" / name);
        std::string line;
        while (std::getline(f, line)) lines.push_back(line);
        return lines;
    }

    BuildContext context() {
        return BuildContext { options, *workspace, *runner, resources };
    }

    // boot stage prerequisites: a loop device and a plain directory standing in for the mount
    std::filesystem::path bind_fake_mount() {
        auto root = dir / "root";
        std::filesystem::create_directories(root);
        resources.bind_loop({"/dev/loop42", workspace->image()});
        resources.bind_mount({root, "/dev/loop42p1"});
        return root;
    }
};

TEST_F(StageRunTest, DiskInitCreatesImageAndBindsLoopDevice) {
    tool("qemu-img", ": > \"$4\"");
    tool("losetup", "echo /dev/loop42");
    auto ctx = context();
    DiskInitStage().run(ctx);

    const auto image = workspace->image().string();
    EXPECT_EQ(args("qemu-img"), (std::vector<std::string>{"create", "-f", "raw", image, "64M"}));
    EXPECT_EQ(args("losetup"), (std::vector<std::string>{"--find", "--show", "--partscan", image}));
    ASSERT_TRUE(resources.loop());
    EXPECT_EQ(resources.loop()->device, "/dev/loop42");
    EXPECT_EQ(resources.loop()->backing_file, workspace->image());
}

TEST_F(StageRunTest, DiskInitWithoutReportedDeviceFails) {
    tool("qemu-img", ": > \"$4\"");
    tool("losetup");
    auto ctx = context();
    EXPECT_THROW(DiskInitStage().run(ctx), ResourceAcquisitionError);
    EXPECT_TRUE(resources.empty());
}

TEST_F(StageRunTest, DiskInitImageCreationFailureBindsNothing) {
    tool("qemu-img", "exit 1");
    tool("losetup", "echo /dev/loop42");
    auto ctx = context();
    EXPECT_THROW(DiskInitStage().run(ctx), ExternalToolError);
    EXPECT_FALSE(called("losetup"));
    EXPECT_TRUE(resources.empty());
}

TEST_F(StageRunTest, PartitionFormatNeedsPartitionNode) {
    tool("parted");
    tool("udevadm");
    tool("mkfs.ext4");
    resources.bind_loop({dir / "loop42", workspace->image()});
    auto ctx = context();
    EXPECT_THROW(PartitionFormatStage().run(ctx), ResourceAcquisitionError);

    EXPECT_EQ(args("parted"), (std::vector<std::string>{"--script", (dir / "loop42").string(),
        "mklabel msdos", "mkpart primary ext4 1MiB 100%", "set 1 boot on"}));
    EXPECT_EQ(args("udevadm"), std::vector<std::string>{"settle"});
    EXPECT_FALSE(called("mkfs.ext4"));
}

TEST_F(StageRunTest, PartitionFormatToleratesSettleFailureAndChecksFilesystem) {
    tool("parted");
    tool("udevadm", "exit 2");
    tool("mkfs.ext4");
    resources.bind_loop({dir / "loop42", workspace->image()});
    spit(dir / "loop42p1", "");
    auto ctx = context();
    // mkfs.ext4 here writes nothing, so no ext4 filesystem is found afterwards
    EXPECT_THROW(PartitionFormatStage().run(ctx), std::runtime_error);
    EXPECT_EQ(args("mkfs.ext4"), (std::vector<std::string>{"-F", (dir / "loop42p1").string()}));
}

TEST_F(StageRunTest, FailedMountIsStillRecordedForCleanup) {
    tool("wget");
    resources.bind_loop({dir / "loop42", workspace->image()});
    auto ctx = context();
    EXPECT_THROW(FilesystemInstallStage().run(ctx), ResourceAcquisitionError);

    ASSERT_TRUE(resources.mount());
    EXPECT_EQ(resources.mount()->mount_point, workspace->mount_point());
    EXPECT_EQ(resources.mount()->device, (dir / "loop42p1"));
    EXPECT_FALSE(called("wget"));
}

TEST_F(StageRunTest, BootInstallWritesFilesAndInstallsGrub) {
    tool("wget", "while [ $# -gt 0 ]; do [ \"$1\" = -O ] && out=\"$2\"; shift; done; echo deb > \"$out\"");
    tool("dpkg-deb", "mkdir -p \"$3/boot\" && echo KERNEL > \"$3/boot/vmlinuz-test\"");
    tool("grub-install");
    auto root = bind_fake_mount();
    auto ctx = context();
    BootInstallStage().run(ctx);

    EXPECT_EQ(slurp(root / "boot/grub/grub.cfg"), grub_config());
    EXPECT_EQ(slurp(root / "boot/vmlinuz"), "KERNEL\n");
    EXPECT_EQ(slurp(root / "init"), init_script());
    struct stat st;
    ASSERT_EQ(stat((root / "init").c_str(), &st), 0);
    EXPECT_EQ(st.st_mode & 0777, 0755u);

    const auto package = (workspace->root() / "kernel.deb").string();
    EXPECT_EQ(args("wget"), (std::vector<std::string>{options.kernel_url, "-O", package}));
    EXPECT_EQ(args("dpkg-deb"), (std::vector<std::string>{"-x", package, (workspace->root() / "kernel").string()}));
    EXPECT_EQ(args("grub-install"), (std::vector<std::string>{
        "--target=i386-pc",
        "--boot-directory=" + (root / "boot").string(),
        "--no-floppy",
        "--modules=part_msdos",
        "--root-directory=" + root.string(),
        "--force",
        "/dev/loop42"}));
}

TEST_F(StageRunTest, KernelDownloadFailureIsNetworkFetchError) {
    tool("wget", "exit 8");
    tool("dpkg-deb");
    tool("grub-install");
    bind_fake_mount();
    auto ctx = context();
    try {
        BootInstallStage().run(ctx);
        FAIL() << "NetworkFetchError expected";
    }
    catch (const NetworkFetchError& ex) {
        EXPECT_EQ(ex.url(), options.kernel_url);
    }
    EXPECT_FALSE(called("dpkg-deb"));
    EXPECT_FALSE(called("grub-install"));
}

TEST_F(StageRunTest, KernelPackageWithoutImageFails) {
    tool("wget");
    tool("dpkg-deb", "mkdir -p \"$3\"");
    tool("grub-install");
    auto root = bind_fake_mount();
    auto ctx = context();
    try {
        BootInstallStage().run(ctx);
        FAIL() << "std::runtime_error expected";
    }
    catch (const std::runtime_error& ex) {
        EXPECT_EQ(std::string(ex.what()), "Kernel package doesn't contain boot/vmlinuz-test");
    }
    EXPECT_FALSE(std::filesystem::exists(root / "boot/vmlinuz"));
    EXPECT_FALSE(called("grub-install"));
}
