/*
 * vmdeck Configuration
 *
 * One config object for the machine, both protocol clients and the
 * frame stream. Filled in order: defaults, JSON file (--config),
 * VMDECK_DEBUG_* environment variables, command line.
 */

#ifndef VM_CONFIG_H
#define VM_CONFIG_H

#include "emulator/launch_config.h"
#include "qmp/qmp_client.h"
#include "vnc/vnc_client.h"
#include <string>

namespace config {

struct VMConfig {
    // Machine (QEMU command line and process timing)
    emulator::LaunchConfig launch;
    bool auto_start = true;

    // Control channel (QMP)
    int qmp_retries = 5;
    int qmp_retry_delay_ms = 1000;
    int qmp_reply_timeout_ms = 10000;

    // Display channel (VNC)
    int vnc_retries = 10;
    int vnc_retry_delay_ms = 1000;
    int vnc_connect_timeout_ms = 5000;
    int vnc_update_timeout_ms = 500;
    int vnc_read_timeout_ms = 5000;

    // Frame stream
    int fps = 30;
    int output_width = 0;       // 0 = same as the display
    int output_height = 0;
    int quality = 80;
    std::string frame_output;   // Latest frame written here; empty = don't write

    std::string config_path;
    std::string save_path;      // --save-config: write effective config and exit

    // Debug flags
    bool debug_qmp = false;       // Every QMP request/reply
    bool debug_vnc = false;       // RFB handshake and rectangles
    bool debug_frames = false;    // Encoder stats
    bool debug_emulator = false;  // Full command line, stderr as it arrives

    /**
     * Parse command-line arguments
     * Exits on --help or an unknown option.
     */
    void parse_command_line(int argc, char* argv[]);

    /**
     * Load configuration from environment variables
     * Checks VMDECK_DEBUG_* variables
     */
    void load_from_env();

    /**
     * Check ranges (ports, fps, sizes)
     * @return false with a message in error
     */
    bool validate(std::string& error) const;

    void print_summary() const;

    int effective_output_width() const;
    int effective_output_height() const;

    // Options for each component, debug flags included
    qmp::QMPClientOptions qmp_options() const;
    vnc::VNCClientOptions vnc_options() const;

private:
    void print_usage(const char* program_name) const;
};

/**
 * Find --config/-c on the command line without consuming it
 * @return The path, or empty string
 */
std::string find_config_arg(int argc, char* argv[]);

/**
 * Parse "WIDTHxHEIGHT"
 * @return false if malformed or non-positive
 */
bool parse_resolution(const std::string& str, int& width, int& height);

} // namespace config

#endif // VM_CONFIG_H
