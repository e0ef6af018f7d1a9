#include <iostream>
#include <optional>

#include "command.h"
#include "interrupt.h"
#include "log.h"
#include "pipeline.h"
#include "workspace.h"
#include "build.h"

int run_build(const BuildOptions& options, const std::vector<std::unique_ptr<Stage>>& stages,
    const std::filesystem::path& base, const ReleaserFactory& make_releaser)
{
    std::optional<Workspace> workspace;
    bool built = false;
    try {
        workspace = Workspace::create(base);
        debug_print("Temporary directory: " + workspace->root().string());
        debug_print("");

        CommandRunner runner(workspace->log_dir(), options.verbose);
        ResourceTracker resources;
        std::unique_ptr<ResourceReleaser> releaser;
        if (make_releaser) releaser = make_releaser(runner);
        else releaser = std::make_unique<SystemReleaser>(runner);
        {
            CleanupHandler cleanup(*workspace, resources, *releaser, options.keep_tmp);
            BuildContext ctx { options, *workspace, runner, resources };
            Pipeline pipeline(ctx, cleanup);
            pipeline.run(stages);
        }
        built = true;

        std::cout << "Success" << std::endl;
        if (debug_enabled()) std::cout << dashed_line << std::endl;
        std::cout << "  Image created at: " << options.output_file.string() << std::endl;

        if (options.prepare_only) return 0;
        //else
        auto qemu = emulator_command(options);
        std::cout << "  Launching with qemu:" << std::endl;
        std::cout << "     " << shell_quote(qemu) << std::endl;
        exec_emulator(qemu);
    }
    catch (const std::exception& ex) {
        std::cerr << ex.what() << std::endl;
    }

    if (workspace && !built) {
        if (options.keep_tmp) {
            std::cerr << "Command logs kept in " << workspace->log_dir().string() << std::endl;
        } else if (!options.verbose) {
            std::cerr << "Re-run with -v -k to see and keep command logs" << std::endl;
        }
    }
    if (auto sig = pending_signal()) return 128 + sig;
    //else
    return 1;
}
