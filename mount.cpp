#include <errno.h>
#include <stdlib.h>
#include <string.h>

#include <memory>
#include <vector>

#include <libmount/libmount.h>
#include <blkid/blkid.h>

#include "error.h"
#include "log.h"
#include "mount.h"

void mount_filesystem(const std::filesystem::path& device, const std::filesystem::path& target,
    const std::string& fstype, int flags, const std::string& data)
{
    std::shared_ptr<libmnt_context> ctx(mnt_new_context(), mnt_free_context);
    if (!ctx) throw std::runtime_error("mnt_new_context() failed");
    mnt_context_set_source(ctx.get(), device.c_str());
    mnt_context_set_target(ctx.get(), target.c_str());
    mnt_context_set_fstype(ctx.get(), fstype.c_str());
    mnt_context_set_mflags(ctx.get(), flags);
    mnt_context_set_options(ctx.get(), data.c_str());

    auto rst = mnt_context_mount(ctx.get());
    auto mounted = mnt_context_get_status(ctx.get()) == 1;
    if (rst != 0 && mounted) {
        // the mount syscall went through but libmount failed afterwards
        if (umount2(target.c_str(), 0) != 0) {
            warn("Unable to undo mount on " + target.string() + ": " + strerror(errno));
        }
    }
    if (rst != 0) {
        throw ResourceAcquisitionError("Unable to mount " + device.string() + " on " + target.string());
    }
    if (!mounted) {
        throw ResourceAcquisitionError("Bad mount status for " + device.string() + " on " + target.string());
    }
}

static void collect_children(libmnt_table* tb, libmnt_fs* parent, std::vector<std::string>& targets)
{
    std::shared_ptr<libmnt_iter> itr(mnt_new_iter(MNT_ITER_FORWARD), mnt_free_iter);
    if (!itr) throw std::runtime_error("mnt_new_iter() failed");
    libmnt_fs* child;
    while (mnt_table_next_child_fs(tb, itr.get(), parent, &child) == 0) {
        collect_children(tb, child, targets);
        targets.push_back(mnt_fs_get_target(child));
    }
}

bool unmount_recursive(const std::filesystem::path& target)
{
    std::shared_ptr<libmnt_table> tb(mnt_new_table_from_file("/proc/self/mountinfo"), mnt_unref_table);
    if (!tb) throw std::runtime_error("Unable to read /proc/self/mountinfo");
    auto fs = mnt_table_find_target(tb.get(), target.c_str(), MNT_ITER_BACKWARD);
    if (!fs) return false;
    //else
    std::vector<std::string> targets;
    collect_children(tb.get(), fs, targets);
    targets.push_back(mnt_fs_get_target(fs));

    for (const auto& t:targets) {
        debug_print("Unmounting " + t);
        if (umount2(t.c_str(), 0) == 0) continue;
        //else
        if (errno != EBUSY) throw std::runtime_error("umount(" + t + ") failed: " + strerror(errno));
        warn(t + " is busy, detaching lazily");
        if (umount2(t.c_str(), MNT_DETACH) < 0) {
            throw std::runtime_error("umount(" + t + ", MNT_DETACH) failed: " + strerror(errno));
        }
    }
    return true;
}

FilesystemInfo probe_filesystem(const std::filesystem::path& device)
{
    blkid_cache cache;
    if (blkid_get_cache(&cache, "/dev/null") != 0) throw std::runtime_error("blkid_get_cache() failed");
    if (blkid_probe_all(cache) != 0) {
        blkid_put_cache(cache);
        throw std::runtime_error("blkid_probe_all() failed");
    }
    auto get_tag = [&cache, &device](const char* tag) -> std::optional<std::string> {
        auto value = blkid_get_tag_value(cache, tag, device.c_str());
        if (!value) return std::nullopt;
        //else
        std::string str(value);
        free(value);
        return str;
    };
    FilesystemInfo info { get_tag("TYPE"), get_tag("UUID") };
    blkid_put_cache(cache);
    return info;
}
