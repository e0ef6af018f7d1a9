#pragma once

#include <filesystem>
#include <optional>

struct BlockDeviceBinding {
    std::filesystem::path device;
    std::filesystem::path backing_file;
};

struct MountBinding {
    std::filesystem::path mount_point;
    std::filesystem::path device;
};

// First partition of a loop device, e.g. /dev/loop3 -> /dev/loop3p1
std::filesystem::path partition_path(const BlockDeviceBinding& binding, int number = 1);

// OS resources currently held by the build. At most one of each kind.
class ResourceTracker {
    std::optional<BlockDeviceBinding> loop_binding;
    std::optional<MountBinding> mount_binding;
public:
    void bind_loop(const BlockDeviceBinding& binding);
    void bind_mount(const MountBinding& binding);

    const std::optional<BlockDeviceBinding>& loop() const { return loop_binding; }
    const std::optional<MountBinding>& mount() const { return mount_binding; }

    // hand the record over to whoever releases it
    std::optional<BlockDeviceBinding> take_loop();
    std::optional<MountBinding> take_mount();

    bool empty() const { return !loop_binding && !mount_binding; }
};
