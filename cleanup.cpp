#include "command.h"
#include "interrupt.h"
#include "log.h"
#include "mount.h"
#include "cleanup.h"

void SystemReleaser::unmount(const MountBinding& binding)
{
    if (!unmount_recursive(binding.mount_point)) {
        debug_print(binding.mount_point.string() + " is not mounted");
    }
}

void SystemReleaser::detach(const BlockDeviceBinding& binding)
{
    runner.run("losetup", {"-d", binding.device.string()});
}

CleanupHandler::~CleanupHandler()
{
    run();
}

bool CleanupHandler::release_resources() noexcept
{
    if (auto mount = resources.take_mount()) {
        try {
            releaser.unmount(*mount);
        }
        catch (const std::exception& ex) {
            mount_leaked = true;
            warn("Unable to unmount " + mount->mount_point.string() + ": " + ex.what());
        }
    }
    bool loop_leaked = false;
    if (auto loop = resources.take_loop()) {
        try {
            releaser.detach(*loop);
        }
        catch (const std::exception& ex) {
            loop_leaked = true;
            warn("Unable to detach " + loop->device.string() + ": " + ex.what());
        }
    }
    return !mount_leaked && !loop_leaked;
}

void CleanupHandler::run() noexcept
{
    if (finished) return;
    //else
    finished = true;

    section_start("Cleaning up temporary resources");
    if (auto sig = pending_signal()) debug_print("Interrupted by signal " + std::to_string(sig));

    release_resources();

    if (keep_tmp) {
        debug_print("Keeping temporary files in " + workspace.root().string());
    } else if (mount_leaked) {
        // removing recursively would descend into the still mounted filesystem
        warn("Not removing " + workspace.root().string() + " since it still contains a mount");
    } else {
        workspace.remove();
    }

    section_end();
}
