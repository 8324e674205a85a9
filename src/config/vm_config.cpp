/*
 * vmdeck Configuration Implementation
 */

#include "vm_config.h"
#include <cstdlib>
#include <cstring>
#include <cstdio>
#include <getopt.h>

namespace config {

static bool env_flag(const char* name) {
    const char* value = getenv(name);
    return value && *value && strcmp(value, "0") != 0;
}

bool parse_resolution(const std::string& str, int& width, int& height) {
    int w = 0, h = 0;
    char extra = 0;
    if (sscanf(str.c_str(), "%dx%d%c", &w, &h, &extra) != 2 || w <= 0 || h <= 0) {
        return false;
    }
    width = w;
    height = h;
    return true;
}

std::string find_config_arg(int argc, char* argv[]) {
    for (int i = 1; i < argc; i++) {
        const char* arg = argv[i];
        if ((strcmp(arg, "--config") == 0 || strcmp(arg, "-c") == 0) && i + 1 < argc) {
            return argv[i + 1];
        }
        if (strncmp(arg, "--config=", 9) == 0) {
            return arg + 9;
        }
        if (strcmp(arg, "--") == 0) {
            break;
        }
    }
    return "";
}

void VMConfig::parse_command_line(int argc, char* argv[]) {
    static struct option long_options[] = {
        {"help",            no_argument,       0, 'h'},
        {"config",          required_argument, 0, 'c'},
        {"emulator",        required_argument, 0, 'e'},
        {"iso",             required_argument, 0, 'i'},
        {"disk",            required_argument, 0, 'd'},
        {"memory",          required_argument, 0, 'm'},
        {"frame-output",    required_argument, 0, 'o'},
        {"no-auto-start",   no_argument,       0, 'n'},
        {"qemu-img",        required_argument, 0,  0 },
        {"disk-size",       required_argument, 0,  0 },
        {"cpus",            required_argument, 0,  0 },
        {"resolution",      required_argument, 0,  0 },
        {"no-kvm",          no_argument,       0,  0 },
        {"audio",           required_argument, 0,  0 },
        {"host",            required_argument, 0,  0 },
        {"qmp-port",        required_argument, 0,  0 },
        {"vnc-port",        required_argument, 0,  0 },
        {"fps",             required_argument, 0,  0 },
        {"output-size",     required_argument, 0,  0 },
        {"quality",         required_argument, 0,  0 },
        {"extra-arg",       required_argument, 0,  0 },
        {"save-config",     required_argument, 0,  0 },
        {"debug",           no_argument,       0,  0 },
        {0, 0, 0, 0}
    };

    // Full rescan (glibc), so the parser can run more than once per process
    optind = 0;

    int option_index = 0;
    int c;

    while ((c = getopt_long(argc, argv, "hc:e:i:d:m:o:n", long_options, &option_index)) != -1) {
        switch (c) {
            case 0: {
                // Long option
                const char* name = long_options[option_index].name;
                if (strcmp(name, "qemu-img") == 0) {
                    launch.qemu_img_path = optarg;
                } else if (strcmp(name, "disk-size") == 0) {
                    launch.disk_size = optarg;
                } else if (strcmp(name, "cpus") == 0) {
                    launch.cpus = atoi(optarg);
                } else if (strcmp(name, "resolution") == 0) {
                    if (!parse_resolution(optarg, launch.display_width, launch.display_height)) {
                        fprintf(stderr, "Invalid resolution '%s' (expected WIDTHxHEIGHT)\n", optarg);
                        exit(1);
                    }
                } else if (strcmp(name, "no-kvm") == 0) {
                    launch.enable_kvm = false;
                } else if (strcmp(name, "audio") == 0) {
                    launch.audio_backend = strcmp(optarg, "none") == 0 ? "" : optarg;
                } else if (strcmp(name, "host") == 0) {
                    launch.host = optarg;
                } else if (strcmp(name, "qmp-port") == 0) {
                    launch.qmp_port = atoi(optarg);
                } else if (strcmp(name, "vnc-port") == 0) {
                    launch.vnc_port = atoi(optarg);
                } else if (strcmp(name, "fps") == 0) {
                    fps = atoi(optarg);
                } else if (strcmp(name, "output-size") == 0) {
                    if (!parse_resolution(optarg, output_width, output_height)) {
                        fprintf(stderr, "Invalid output size '%s' (expected WIDTHxHEIGHT)\n", optarg);
                        exit(1);
                    }
                } else if (strcmp(name, "quality") == 0) {
                    quality = atoi(optarg);
                } else if (strcmp(name, "extra-arg") == 0) {
                    launch.extra_args.push_back(optarg);
                } else if (strcmp(name, "save-config") == 0) {
                    save_path = optarg;
                } else if (strcmp(name, "debug") == 0) {
                    debug_qmp = debug_vnc = debug_frames = debug_emulator = true;
                }
                break;
            }

            case 'h':
                print_usage(argv[0]);
                exit(0);

            case 'c':
                config_path = optarg;
                break;

            case 'e':
                launch.emulator_path = optarg;
                break;

            case 'i':
                launch.iso_path = optarg;
                break;

            case 'd':
                launch.disk_path = optarg;
                break;

            case 'm':
                launch.memory = optarg;
                break;

            case 'o':
                frame_output = optarg;
                break;

            case 'n':
                auto_start = false;
                break;

            case '?':
                // Error message already printed by getopt_long
                exit(1);

            default:
                fprintf(stderr, "Unknown option\n");
                exit(1);
        }
    }

    launch.debug = debug_emulator;
}

void VMConfig::load_from_env() {
    if (env_flag("VMDECK_DEBUG_QMP")) {
        debug_qmp = true;
    }
    if (env_flag("VMDECK_DEBUG_VNC")) {
        debug_vnc = true;
    }
    if (env_flag("VMDECK_DEBUG_FRAMES")) {
        debug_frames = true;
    }
    if (env_flag("VMDECK_DEBUG_EMULATOR")) {
        debug_emulator = true;
    }
    launch.debug = debug_emulator;
}

bool VMConfig::validate(std::string& error) const {
    if (launch.vnc_port < 5900 || launch.vnc_port > 65535) {
        error = "VNC port must be between 5900 and 65535";
        return false;
    }
    if (launch.qmp_port <= 0 || launch.qmp_port > 65535) {
        error = "QMP port must be between 1 and 65535";
        return false;
    }
    if (launch.qmp_port == launch.vnc_port) {
        error = "QMP and VNC ports must differ";
        return false;
    }
    if (launch.cpus <= 0) {
        error = "CPU count must be positive";
        return false;
    }
    if (launch.display_width <= 0 || launch.display_height <= 0) {
        error = "Display size must be positive";
        return false;
    }
    if (fps <= 0 || fps > 240) {
        error = "fps must be between 1 and 240";
        return false;
    }
    if (output_width < 0 || output_height < 0) {
        error = "Output size must not be negative";
        return false;
    }
    if (quality < 0 || quality > 100) {
        error = "Quality must be between 0 and 100";
        return false;
    }
    return true;
}

int VMConfig::effective_output_width() const {
    return output_width > 0 ? output_width : launch.display_width;
}

int VMConfig::effective_output_height() const {
    return output_height > 0 ? output_height : launch.display_height;
}

qmp::QMPClientOptions VMConfig::qmp_options() const {
    qmp::QMPClientOptions opts;
    opts.host = launch.host;
    opts.port = launch.qmp_port;
    opts.reply_timeout_ms = qmp_reply_timeout_ms;
    opts.debug = debug_qmp;
    return opts;
}

vnc::VNCClientOptions VMConfig::vnc_options() const {
    vnc::VNCClientOptions opts;
    opts.host = launch.host;
    opts.port = launch.vnc_port;
    opts.fps = fps;
    opts.output_width = effective_output_width();
    opts.output_height = effective_output_height();
    opts.quality = quality;
    opts.connect_timeout_ms = vnc_connect_timeout_ms;
    opts.update_timeout_ms = vnc_update_timeout_ms;
    opts.read_timeout_ms = vnc_read_timeout_ms;
    opts.debug = debug_vnc;
    opts.debug_frames = debug_frames;
    return opts;
}

void VMConfig::print_summary() const {
    fprintf(stderr, "\n=== vmdeck ===\n");
    if (!config_path.empty()) {
        fprintf(stderr, "Config file:      %s\n", config_path.c_str());
    }

    fprintf(stderr, "\nMachine:\n");
    fprintf(stderr, "  Auto-start:     %s\n", auto_start ? "yes" : "no");
    fprintf(stderr, "  Emulator:       %s\n",
            launch.emulator_path.empty() ? "(search PATH)" : launch.emulator_path.c_str());
    fprintf(stderr, "  Memory:         %s MiB\n", launch.memory.c_str());
    fprintf(stderr, "  CPUs:           %d\n", launch.cpus);
    fprintf(stderr, "  Display:        %dx%d\n", launch.display_width, launch.display_height);
    fprintf(stderr, "  KVM:            %s\n", launch.enable_kvm ? "if available" : "disabled");
    fprintf(stderr, "  Audio:          %s\n",
            launch.audio_backend.empty() ? "none" : launch.audio_backend.c_str());
    if (!launch.iso_path.empty()) {
        fprintf(stderr, "  ISO:            %s\n", launch.iso_path.c_str());
    }
    if (!launch.disk_path.empty()) {
        fprintf(stderr, "  Disk:           %s (%s)\n", launch.disk_path.c_str(), launch.disk_size.c_str());
    }
    for (const auto& arg : launch.extra_args) {
        fprintf(stderr, "  Extra arg:      %s\n", arg.c_str());
    }

    fprintf(stderr, "\nControl (QMP):    %s:%d (%d retries, reply timeout %dms)\n",
            launch.host.c_str(), launch.qmp_port, qmp_retries, qmp_reply_timeout_ms);
    fprintf(stderr, "Display (VNC):    %s:%d (%d retries)\n",
            launch.host.c_str(), launch.vnc_port, vnc_retries);

    fprintf(stderr, "\nStream:\n");
    fprintf(stderr, "  Rate:           %d fps\n", fps);
    fprintf(stderr, "  Output size:    %dx%d\n", effective_output_width(), effective_output_height());
    fprintf(stderr, "  WebP quality:   %d\n", quality);
    if (!frame_output.empty()) {
        fprintf(stderr, "  Frame file:     %s\n", frame_output.c_str());
    }

    // Show active debug flags
    bool any_debug = debug_qmp || debug_vnc || debug_frames || debug_emulator;
    if (any_debug) {
        fprintf(stderr, "\nDebug flags:\n");
        if (debug_qmp)       fprintf(stderr, "  - QMP requests/replies\n");
        if (debug_vnc)       fprintf(stderr, "  - VNC protocol\n");
        if (debug_frames)    fprintf(stderr, "  - Frame encoding stats\n");
        if (debug_emulator)  fprintf(stderr, "  - Emulator command line and stderr\n");
    }

    fprintf(stderr, "\n");
}

void VMConfig::print_usage(const char* program_name) const {
    fprintf(stderr, "Usage: %s [options]\n\n", program_name);
    fprintf(stderr, "Options:\n");
    fprintf(stderr, "  -h, --help               Show this help\n");
    fprintf(stderr, "  -c, --config FILE        JSON config file\n");
    fprintf(stderr, "  -e, --emulator PATH      QEMU executable (default: search PATH)\n");
    fprintf(stderr, "  -i, --iso PATH           Boot CD image\n");
    fprintf(stderr, "  -d, --disk PATH          Disk image (created if missing)\n");
    fprintf(stderr, "  -m, --memory MB          Guest memory (default: %s)\n", launch.memory.c_str());
    fprintf(stderr, "  -o, --frame-output PATH  Write the latest WebP frame to PATH\n");
    fprintf(stderr, "  -n, --no-auto-start      Connect to an already running QEMU\n");
    fprintf(stderr, "      --qemu-img PATH      qemu-img executable\n");
    fprintf(stderr, "      --disk-size SIZE     Size for a new disk (default: %s)\n", launch.disk_size.c_str());
    fprintf(stderr, "      --cpus N             Guest CPUs (default: %d)\n", launch.cpus);
    fprintf(stderr, "      --resolution WxH     Guest display (default: %dx%d)\n",
            launch.display_width, launch.display_height);
    fprintf(stderr, "      --no-kvm             Don't use KVM acceleration\n");
    fprintf(stderr, "      --audio BACKEND      Audio backend, 'none' to disable (default: %s)\n",
            launch.audio_backend.c_str());
    fprintf(stderr, "      --host HOST          QMP/VNC bind address (default: %s)\n", launch.host.c_str());
    fprintf(stderr, "      --qmp-port PORT      QMP port (default: %d)\n", launch.qmp_port);
    fprintf(stderr, "      --vnc-port PORT      VNC port, >= 5900 (default: %d)\n", launch.vnc_port);
    fprintf(stderr, "      --fps N              Frame rate (default: %d)\n", fps);
    fprintf(stderr, "      --output-size WxH    Scale frames to this size\n");
    fprintf(stderr, "      --quality N          WebP quality 0-100 (default: %d)\n", quality);
    fprintf(stderr, "      --extra-arg ARG      Append ARG to the QEMU command line (repeatable)\n");
    fprintf(stderr, "      --save-config FILE   Write the effective config to FILE and exit\n");
    fprintf(stderr, "      --debug              Enable all debug logs\n");
    fprintf(stderr, "\nEnvironment variables:\n");
    fprintf(stderr, "  VMDECK_DEBUG_QMP        Log QMP requests and replies\n");
    fprintf(stderr, "  VMDECK_DEBUG_VNC        Log VNC handshake and updates\n");
    fprintf(stderr, "  VMDECK_DEBUG_FRAMES     Log frame encoding stats\n");
    fprintf(stderr, "  VMDECK_DEBUG_EMULATOR   Log QEMU command line and stderr\n");
    fprintf(stderr, "\nStdin: one JSON input command per line, e.g.\n");
    fprintf(stderr, "  {\"name\": \"mouse_click\", \"button\": \"left\"}\n");
    fprintf(stderr, "\n");
}

} // namespace config
