#include <stdexcept>

#include "resources.h"

std::filesystem::path partition_path(const BlockDeviceBinding& binding, int number)
{
    return binding.device.string() + "p" + std::to_string(number);
}

void ResourceTracker::bind_loop(const BlockDeviceBinding& binding)
{
    if (loop_binding) throw std::logic_error("Loop device " + loop_binding->device.string() + " is already bound");
    loop_binding = binding;
}

void ResourceTracker::bind_mount(const MountBinding& binding)
{
    if (mount_binding) throw std::logic_error(mount_binding->mount_point.string() + " is already mounted");
    mount_binding = binding;
}

std::optional<BlockDeviceBinding> ResourceTracker::take_loop()
{
    auto binding = std::move(loop_binding);
    loop_binding.reset();
    return binding;
}

std::optional<MountBinding> ResourceTracker::take_mount()
{
    auto binding = std::move(mount_binding);
    mount_binding.reset();
    return binding;
}
