/*
 * Emulator Launch Configuration
 *
 * Everything needed to build the QEMU command line for one machine.
 * Copied into ProcessManager at construction and not changed afterwards.
 */

#ifndef LAUNCH_CONFIG_H
#define LAUNCH_CONFIG_H

#include <string>
#include <vector>

namespace emulator {

struct LaunchConfig {
    // Executables (empty = search PATH)
    std::string emulator_path;   // qemu-system-x86_64 / kvm / qemu-kvm
    std::string qemu_img_path;   // Used to create the disk image

    // Media
    std::string iso_path;        // Boot CD image, skipped if it doesn't exist
    std::string disk_path;       // Persistent disk, created if absent
    std::string disk_size = "20G";

    // Hardware
    std::string memory = "4096"; // MiB, passed to -m as-is
    int cpus = 2;
    int display_width = 1920;
    int display_height = 1080;
    bool enable_kvm = true;      // Only applied if /dev/kvm is usable
    std::string audio_backend = "pa";  // Empty = no audio devices

    // Sockets (both bound on host)
    std::string host = "localhost";
    int qmp_port = 4444;
    int vnc_port = 5900;         // VNC display number = vnc_port - 5900

    std::vector<std::string> extra_args;

    // Timing
    int startup_grace_ms = 2000; // Process must survive this long to count as started
    int stop_timeout_ms = 10000; // Wait after SIGTERM before SIGKILL

    bool debug = false;          // Log full command line and stderr as it arrives
};

} // namespace emulator

#endif // LAUNCH_CONFIG_H
