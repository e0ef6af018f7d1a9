#pragma once

#include <filesystem>
#include <memory>
#include <string>
#include <vector>

#include "cleanup.h"
#include "stages.h"

// Runs the stages in order, then publishes the image and cleans up.
// Any stage error leaves the pipeline Failed and propagates; the output
// file is never touched in that case.
class Pipeline {
    BuildContext& ctx;
    CleanupHandler& cleanup;
    PipelineState current_state = PipelineState::Init;
    void finalize();
public:
    Pipeline(BuildContext& ctx, CleanupHandler& cleanup) : ctx(ctx), cleanup(cleanup) {}
    void run(const std::vector<std::unique_ptr<Stage>>& stages);
    PipelineState state() const { return current_state; }
};

// Full copy for when image and dest are on different filesystems. A partly
// written dest is removed before the error propagates.
void copy_image(const std::filesystem::path& image, const std::filesystem::path& dest);

// Atomically places image at output, replacing any existing file there.
void publish_image(const std::filesystem::path& image, const std::filesystem::path& output);

std::vector<std::string> emulator_command(const BuildOptions& options);

// replaces the current process; only returns by throwing
[[noreturn]] void exec_emulator(const std::vector<std::string>& command);
