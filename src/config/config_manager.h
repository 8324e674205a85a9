/*
 * Config Manager Module
 *
 * Reads and writes the vmdeck JSON config file:
 *
 *   {
 *     "machine": { "emulator", "qemu_img", "iso", "disk", "disk_size",
 *                  "memory", "cpus", "kvm", "audio", "host", "extra_args",
 *                  "startup_grace_ms", "stop_timeout_ms", "auto_start" },
 *     "display": { "width", "height", "vnc_port", "retries", "retry_delay_ms",
 *                  "connect_timeout_ms", "update_timeout_ms", "read_timeout_ms" },
 *     "control": { "qmp_port", "retries", "retry_delay_ms", "reply_timeout_ms" },
 *     "stream":  { "fps", "output_width", "output_height", "quality", "frame_output" }
 *   }
 *
 * Every key is optional; missing keys keep their current value.
 */

#ifndef CONFIG_MANAGER_H
#define CONFIG_MANAGER_H

#include "vm_config.h"
#include <string>

namespace config {

/**
 * Load config from JSON file on top of the values already in cfg
 * @param path Path to the config file
 * @return false on invalid JSON or a value of the wrong type; a missing
 *         file is not an error (cfg is left unchanged)
 */
bool load_config(const std::string& path, VMConfig& cfg);

/**
 * Save config to JSON file (2-space indent)
 * @return true if successful
 */
bool save_config(const std::string& path, const VMConfig& cfg);

} // namespace config

#endif // CONFIG_MANAGER_H
