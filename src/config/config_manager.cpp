/*
 * Config Manager Implementation
 */

#include "config_manager.h"
#include "utils/json_utils.h"
#include <fstream>
#include <stdexcept>
#include <cstdio>

namespace config {

using json = nlohmann::json;

// Typed readers: absent keys are fine, present keys must have the right type
static void read_string(const json& section, const char* key, std::string& out) {
    if (!section.contains(key)) return;
    const json& v = section[key];
    if (!v.is_string()) {
        throw std::runtime_error(std::string("'") + key + "' must be a string");
    }
    out = v.get<std::string>();
}

static void read_int(const json& section, const char* key, int& out) {
    if (!section.contains(key)) return;
    bool ok = true;
    int v = json_utils::get_int(section, key, out, &ok);
    if (!ok) {
        throw std::runtime_error(std::string("'") + key + "' must be an integer");
    }
    out = v;
}

static void read_bool(const json& section, const char* key, bool& out) {
    if (!section.contains(key)) return;
    if (!section[key].is_boolean()) {
        throw std::runtime_error(std::string("'") + key + "' must be true or false");
    }
    out = section[key].get<bool>();
}

static const json* section_of(const json& root, const char* name) {
    if (!root.contains(name)) return nullptr;
    const json& s = root[name];
    if (!s.is_object()) {
        throw std::runtime_error(std::string("section '") + name + "' must be an object");
    }
    return &s;
}

bool load_config(const std::string& path, VMConfig& cfg) {
    std::ifstream file(path);
    if (!file) {
        fprintf(stderr, "Config: No config file at %s, using defaults\n", path.c_str());
        return true;
    }

    // Work on a copy so a bad file leaves cfg untouched
    VMConfig loaded = cfg;

    try {
        json j = json_utils::parse_file(path);
        if (!j.is_object()) {
            throw std::runtime_error("top level must be an object");
        }

        if (const json* machine = section_of(j, "machine")) {
            emulator::LaunchConfig& l = loaded.launch;
            read_string(*machine, "emulator", l.emulator_path);
            read_string(*machine, "qemu_img", l.qemu_img_path);
            read_string(*machine, "iso", l.iso_path);
            read_string(*machine, "disk", l.disk_path);
            read_string(*machine, "disk_size", l.disk_size);

            // Memory may be written as a number or a string
            if (machine->contains("memory") && (*machine)["memory"].is_number_integer()) {
                l.memory = std::to_string((*machine)["memory"].get<int>());
            } else {
                read_string(*machine, "memory", l.memory);
            }

            read_int(*machine, "cpus", l.cpus);
            read_bool(*machine, "kvm", l.enable_kvm);
            read_string(*machine, "audio", l.audio_backend);
            read_string(*machine, "host", l.host);
            if (machine->contains("extra_args")) {
                if (!(*machine)["extra_args"].is_array()) {
                    throw std::runtime_error("'extra_args' must be an array");
                }
                l.extra_args = json_utils::get_string_array(*machine, "extra_args");
            }
            read_int(*machine, "startup_grace_ms", l.startup_grace_ms);
            read_int(*machine, "stop_timeout_ms", l.stop_timeout_ms);
            read_bool(*machine, "auto_start", loaded.auto_start);
        }

        if (const json* display = section_of(j, "display")) {
            read_int(*display, "width", loaded.launch.display_width);
            read_int(*display, "height", loaded.launch.display_height);
            read_int(*display, "vnc_port", loaded.launch.vnc_port);
            read_int(*display, "retries", loaded.vnc_retries);
            read_int(*display, "retry_delay_ms", loaded.vnc_retry_delay_ms);
            read_int(*display, "connect_timeout_ms", loaded.vnc_connect_timeout_ms);
            read_int(*display, "update_timeout_ms", loaded.vnc_update_timeout_ms);
            read_int(*display, "read_timeout_ms", loaded.vnc_read_timeout_ms);
        }

        if (const json* control = section_of(j, "control")) {
            read_int(*control, "qmp_port", loaded.launch.qmp_port);
            read_int(*control, "retries", loaded.qmp_retries);
            read_int(*control, "retry_delay_ms", loaded.qmp_retry_delay_ms);
            read_int(*control, "reply_timeout_ms", loaded.qmp_reply_timeout_ms);
        }

        if (const json* stream = section_of(j, "stream")) {
            read_int(*stream, "fps", loaded.fps);
            read_int(*stream, "output_width", loaded.output_width);
            read_int(*stream, "output_height", loaded.output_height);
            read_int(*stream, "quality", loaded.quality);
            read_string(*stream, "frame_output", loaded.frame_output);
        }

    } catch (const std::exception& e) {
        fprintf(stderr, "Config: Failed to load %s: %s\n", path.c_str(), e.what());
        return false;
    }

    loaded.config_path = path;
    cfg = loaded;
    fprintf(stderr, "Config: Loaded from %s\n", path.c_str());
    return true;
}

bool save_config(const std::string& path, const VMConfig& cfg) {
    try {
        json j;
        const emulator::LaunchConfig& l = cfg.launch;

        j["machine"]["emulator"] = l.emulator_path;
        j["machine"]["qemu_img"] = l.qemu_img_path;
        j["machine"]["iso"] = l.iso_path;
        j["machine"]["disk"] = l.disk_path;
        j["machine"]["disk_size"] = l.disk_size;
        j["machine"]["memory"] = l.memory;
        j["machine"]["cpus"] = l.cpus;
        j["machine"]["kvm"] = l.enable_kvm;
        j["machine"]["audio"] = l.audio_backend;
        j["machine"]["host"] = l.host;
        j["machine"]["extra_args"] = l.extra_args;
        j["machine"]["startup_grace_ms"] = l.startup_grace_ms;
        j["machine"]["stop_timeout_ms"] = l.stop_timeout_ms;
        j["machine"]["auto_start"] = cfg.auto_start;

        j["display"]["width"] = l.display_width;
        j["display"]["height"] = l.display_height;
        j["display"]["vnc_port"] = l.vnc_port;
        j["display"]["retries"] = cfg.vnc_retries;
        j["display"]["retry_delay_ms"] = cfg.vnc_retry_delay_ms;
        j["display"]["connect_timeout_ms"] = cfg.vnc_connect_timeout_ms;
        j["display"]["update_timeout_ms"] = cfg.vnc_update_timeout_ms;
        j["display"]["read_timeout_ms"] = cfg.vnc_read_timeout_ms;

        j["control"]["qmp_port"] = l.qmp_port;
        j["control"]["retries"] = cfg.qmp_retries;
        j["control"]["retry_delay_ms"] = cfg.qmp_retry_delay_ms;
        j["control"]["reply_timeout_ms"] = cfg.qmp_reply_timeout_ms;

        j["stream"]["fps"] = cfg.fps;
        j["stream"]["output_width"] = cfg.output_width;
        j["stream"]["output_height"] = cfg.output_height;
        j["stream"]["quality"] = cfg.quality;
        j["stream"]["frame_output"] = cfg.frame_output;

        // Write to file with nice formatting
        std::ofstream file(path);
        if (!file) {
            fprintf(stderr, "Config: Failed to open %s for writing\n", path.c_str());
            return false;
        }

        file << j.dump(2) << "\n";
        file.close();
        if (!file) {
            fprintf(stderr, "Config: Failed to write %s\n", path.c_str());
            return false;
        }

        fprintf(stderr, "Config: Saved to %s\n", path.c_str());
        return true;

    } catch (const std::exception& e) {
        fprintf(stderr, "Config: Failed to save: %s\n", e.what());
        return false;
    }
}

} // namespace config
