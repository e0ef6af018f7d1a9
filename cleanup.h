#pragma once

#include "resources.h"
#include "workspace.h"

class CommandRunner;

class ResourceReleaser {
public:
    virtual ~ResourceReleaser() = default;
    virtual void unmount(const MountBinding& binding) = 0;
    virtual void detach(const BlockDeviceBinding& binding) = 0;
};

// Recursive unmount through libmount, loop detach through `losetup -d`.
class SystemReleaser : public ResourceReleaser {
    CommandRunner& runner;
public:
    explicit SystemReleaser(CommandRunner& runner) : runner(runner) {}
    void unmount(const MountBinding& binding) override;
    void detach(const BlockDeviceBinding& binding) override;
};

// Releases everything the tracker holds and removes the workspace, once.
// Constructed before the first resource is acquired; the destructor runs it
// so that every way out of the build scope goes through it.
class CleanupHandler {
    const Workspace& workspace;
    ResourceTracker& resources;
    ResourceReleaser& releaser;
    bool keep_tmp;
    bool finished = false;
    bool mount_leaked = false;
public:
    CleanupHandler(const Workspace& workspace, ResourceTracker& resources, ResourceReleaser& releaser, bool keep_tmp)
        : workspace(workspace), resources(resources), releaser(releaser), keep_tmp(keep_tmp) {}
    CleanupHandler(const CleanupHandler&) = delete;
    CleanupHandler& operator=(const CleanupHandler&) = delete;
    ~CleanupHandler();

    // unmount, then detach. Returns true if nothing is left held.
    bool release_resources() noexcept;
    void run() noexcept;
    bool done() const { return finished; }
};
