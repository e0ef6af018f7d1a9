#include <unistd.h>

#include <iostream>

#include <argparse/argparse.hpp>

#include "build.h"
#include "interrupt.h"
#include "log.h"
#include "options.h"

void show_examples(const std::string& progname)
{
    std::cout << "Example:" << std::endl;
    std::cout << ' ' << progname << ' ' << "[-o <output image>] [-v] [-k] [-p]" << std::endl;
    std::cout << "or" << std::endl;
    std::cout << ' ' << progname << ' ' << "--kernel-url=<.deb url> --kernel-image=<path in package>" << std::endl;
}

int main(int argc, char** argv)
{
    const std::string progname = "busybox-image";
    argparse::ArgumentParser program(progname);
    program.add_argument("-o", "--output").help("Specify the output filename").default_value(default_output_file.string());
    program.add_argument("-v", "--verbose").help("Enable debug mode").default_value(false).implicit_value(true);
    program.add_argument("-k", "--keep").help("Keep temporary logs and files").default_value(false).implicit_value(true);
    program.add_argument("-p", "--prepare-only").help("Prepare image, do NOT boot qemu").default_value(false).implicit_value(true);
    program.add_argument("--size").help("Disk image size").default_value(default_disk_size);
    program.add_argument("--busybox-url").help("Statically linked BusyBox binary to install").default_value(default_busybox_url);
    program.add_argument("--kernel-url").help("Kernel package (.deb) to install").default_value(default_kernel_url);
    program.add_argument("--kernel-image").help("Kernel image path inside the kernel package").default_value(default_kernel_image.string());

    try {
        program.parse_args(argc, argv);
    }
    catch (const std::runtime_error& ex) {
        std::cerr << ex.what() << std::endl;
        std::cout << program << std::endl;
        show_examples(progname);
        return 1;
    }

    const BuildOptions options {
        .output_file = program.get<std::string>("--output"),
        .verbose = program.get<bool>("--verbose"),
        .keep_tmp = program.get<bool>("--keep"),
        .prepare_only = program.get<bool>("--prepare-only"),
        .disk_size = program.get<std::string>("--size"),
        .busybox_url = program.get<std::string>("--busybox-url"),
        .kernel_url = program.get<std::string>("--kernel-url"),
        .kernel_image = program.get<std::string>("--kernel-image"),
    };
    set_debug(options.verbose);

    if (geteuid() != 0) {
        std::cerr << "You must be root" << std::endl;
        return 1;
    }
    //else
    install_signal_handlers();
    return run_build(options, default_stages());
}
