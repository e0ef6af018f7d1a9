#include <unistd.h>
#include <string.h>

#include <iostream>

#include "error.h"
#include "interrupt.h"
#include "log.h"
#include "pipeline.h"

void Pipeline::run(const std::vector<std::unique_ptr<Stage>>& stages)
{
    try {
        for (const auto& stage:stages) {
            check_interrupted();
            section_start(stage->description());
            stage->run(ctx);
            section_end();
            if (stage->completes() < current_state) {
                throw std::logic_error(std::string("Stage would move pipeline back to ") + to_string(stage->completes()));
            }
            current_state = stage->completes();
            debug_print(std::string("Pipeline state: ") + to_string(current_state));
        }
        check_interrupted();
        finalize();
    }
    catch (const std::exception&) {
        current_state = PipelineState::Failed;
        throw;
    }
}

void Pipeline::finalize()
{
    sync();
    if (!cleanup.release_resources()) {
        throw std::runtime_error("Image resources could not be released, not publishing " + ctx.workspace.image().string());
    }
    //else
    check_interrupted();
    publish_image(ctx.workspace.image(), ctx.options.output_file);
    current_state = PipelineState::Finalized;
    cleanup.run();
}

void copy_image(const std::filesystem::path& image, const std::filesystem::path& dest)
{
    try {
        std::filesystem::copy_file(image, dest, std::filesystem::copy_options::overwrite_existing);
    }
    catch (const std::filesystem::filesystem_error&) {
        std::error_code ec;
        std::filesystem::remove(dest, ec);
        throw;
    }
}

void publish_image(const std::filesystem::path& image, const std::filesystem::path& output)
{
    auto staging = output;
    staging += ".partial." + std::to_string(getpid());

    std::error_code ec;
    std::filesystem::create_hard_link(image, staging, ec);
    if (ec == std::errc::cross_device_link) {
        copy_image(image, staging);
    } else if (ec) {
        throw std::filesystem::filesystem_error("Unable to link image", image, staging, ec);
    }
    //else
    try {
        std::filesystem::rename(staging, output);
    }
    catch (const std::filesystem::filesystem_error&) {
        std::filesystem::remove(staging, ec);
        throw;
    }
}

std::vector<std::string> emulator_command(const BuildOptions& options)
{
    return {
        "qemu-system-x86_64",
        "-drive", "file=" + options.output_file.string() + ",format=raw",
        "-m", options.memory,
        "-smp", std::to_string(options.cpus),
        "-nographic",
        "-serial", "mon:stdio",
    };
}

void exec_emulator(const std::vector<std::string>& command)
{
    std::vector<char*> argv;
    for (auto& arg:command) {
        argv.push_back(const_cast<char*>(arg.c_str()));
    }
    argv.push_back(nullptr);
    std::cout.flush();
    std::cerr.flush();
    execvp(argv[0], argv.data());
    throw std::runtime_error("Unable to execute " + command.front() + ": " + strerror(errno));
}
