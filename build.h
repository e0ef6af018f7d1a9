#pragma once

#include <filesystem>
#include <functional>
#include <memory>
#include <vector>

#include "cleanup.h"
#include "stages.h"

using ReleaserFactory = std::function<std::unique_ptr<ResourceReleaser>(CommandRunner&)>;

// One complete build in a fresh workspace below base: runs the stages,
// publishes the image, reports the outcome and, unless prepare_only is set,
// hands the process over to the emulator.
// Returns the exit status: 0 on success, 128 + signal when interrupted,
// 1 on any other failure.
int run_build(const BuildOptions& options, const std::vector<std::unique_ptr<Stage>>& stages,
    const std::filesystem::path& base = std::filesystem::current_path(),
    const ReleaserFactory& make_releaser = nullptr);
