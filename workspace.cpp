#include <stdlib.h>
#include <string.h>

#include "error.h"
#include "log.h"
#include "workspace.h"

Workspace Workspace::create(const std::filesystem::path& base)
{
    std::string tmpl = (base / "tmpdir.linuximage.XXXXXX").string();
    if (!mkdtemp(tmpl.data())) {
        throw ResourceAcquisitionError("mkdtemp() failed in " + base.string() + ": " + strerror(errno));
    }
    //else
    Workspace workspace(std::filesystem::canonical(tmpl));
    std::error_code ec;
    std::filesystem::create_directories(workspace.log_dir(), ec);
    if (ec) {
        workspace.remove();
        throw ResourceAcquisitionError("Unable to create " + workspace.log_dir().string() + ": " + ec.message());
    }
    return workspace;
}

bool Workspace::remove() const
{
    std::error_code ec;
    std::filesystem::remove_all(tmpdir, ec);
    if (ec) {
        warn("Unable to remove " + tmpdir.string() + ": " + ec.message());
        return false;
    }
    return true;
}
