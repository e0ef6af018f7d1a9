#pragma once

#include <filesystem>
#include <string>

inline const std::filesystem::path default_output_file("linux.img");
inline const std::string default_disk_size("50M");
inline const std::string default_busybox_url(
    "https://www.busybox.net/downloads/binaries/1.31.0-defconfig-multiarch-musl/busybox-x86_64");
inline const std::string default_kernel_url(
    "http://archive.ubuntu.com/ubuntu/pool/main/l/linux-signed/linux-image-5.15.0-117-generic_5.15.0-117.127_amd64.deb");
inline const std::filesystem::path default_kernel_image("boot/vmlinuz-5.15.0-117-generic");

struct BuildOptions {
    std::filesystem::path output_file = default_output_file;
    bool verbose = false;
    bool keep_tmp = false;
    bool prepare_only = false;
    std::string disk_size = default_disk_size;
    std::string busybox_url = default_busybox_url;
    std::string kernel_url = default_kernel_url;
    std::filesystem::path kernel_image = default_kernel_image; // path inside the kernel package
    std::string memory = "512m";
    int cpus = 2;
};
