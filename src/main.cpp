/*
 * vmdeck - drive a QEMU virtual machine from a pipe
 *
 * Starts QEMU with QMP and VNC bound to local ports, streams WebP frames
 * of the guest screen to a file, and executes JSON input commands read
 * from stdin (one per line), answering each with one JSON line on
 * stdout. All diagnostics go to stderr.
 */

#include "config/config_manager.h"
#include "config/vm_config.h"
#include "emulator/process_manager.h"
#include "qmp/input_command.h"
#include "qmp/qmp_client.h"
#include "utils/json_utils.h"
#include "vnc/vnc_client.h"

#include <atomic>
#include <cerrno>
#include <csignal>
#include <cstdio>
#include <cstring>
#include <string>
#include <poll.h>
#include <unistd.h>

static std::atomic<bool> g_running(true);

static void signal_handler(int sig) {
    (void)sig;
    g_running = false;
}

/**
 * Replace path with data atomically (write temp file, then rename)
 * Readers never see a partially written frame.
 */
static bool write_file_atomic(const std::string& path, const std::vector<uint8_t>& data) {
    std::string tmp = path + ".tmp";
    FILE* f = fopen(tmp.c_str(), "wb");
    if (!f) {
        return false;
    }
    size_t written = fwrite(data.data(), 1, data.size(), f);
    bool ok = written == data.size();
    if (fclose(f) != 0) {
        ok = false;
    }
    if (!ok || rename(tmp.c_str(), path.c_str()) != 0) {
        unlink(tmp.c_str());
        return false;
    }
    return true;
}

static void reply(const nlohmann::json& response) {
    std::string line = response.dump();
    fprintf(stdout, "%s\n", line.c_str());
    fflush(stdout);
}

static void reply_error(const std::string& error) {
    nlohmann::json response;
    response["ok"] = false;
    response["error"] = error;
    reply(response);
}

static void handle_command_line(qmp::QMPClient& qmp_client, const std::string& line) {
    nlohmann::json request;
    try {
        request = json_utils::parse(line);
    } catch (const std::exception& e) {
        reply_error(std::string("Invalid JSON: ") + e.what());
        return;
    }

    qmp::InputCommand cmd;
    std::string error;
    if (!qmp::parse_input_command(request, cmd, error)) {
        reply_error(error);
        return;
    }

    if (!qmp_client.is_connected()) {
        reply_error("QMP not connected");
        return;
    }

    try {
        std::string result = qmp::dispatch(qmp_client, cmd);

        nlohmann::json response;
        response["ok"] = true;
        response["result"] = result.empty() ? nlohmann::json() : nlohmann::json(result);
        reply(response);
    } catch (const qmp::CommandError& e) {
        fprintf(stderr, "vmdeck: %s failed: %s\n", qmp::command_name(cmd), e.what());
        reply_error(e.what());
    } catch (const qmp::ConnectionError& e) {
        fprintf(stderr, "vmdeck: %s failed, QMP connection lost: %s\n",
                qmp::command_name(cmd), e.what());
        reply_error(std::string("QMP connection lost: ") + e.what());
    }
}

/**
 * Read commands from stdin until EOF, a signal, or the emulator exits
 */
static void command_loop(qmp::QMPClient& qmp_client, emulator::ProcessManager& process) {
    std::string pending;

    while (g_running) {
        if (process.is_running()) {
            int status = process.check_status();
            if (!process.is_running()) {
                fprintf(stderr, "vmdeck: Emulator exited (status %d)\n", status);
                break;
            }
        }

        struct pollfd pfd;
        pfd.fd = STDIN_FILENO;
        pfd.events = POLLIN;
        pfd.revents = 0;

        int ready = poll(&pfd, 1, 100);
        if (ready < 0) {
            if (errno == EINTR) continue;
            fprintf(stderr, "vmdeck: poll on stdin failed: %s\n", strerror(errno));
            break;
        }
        if (ready == 0) {
            continue;
        }

        char buf[4096];
        ssize_t n = read(STDIN_FILENO, buf, sizeof(buf));
        if (n < 0) {
            if (errno == EINTR || errno == EAGAIN) continue;
            fprintf(stderr, "vmdeck: read on stdin failed: %s\n", strerror(errno));
            break;
        }
        if (n == 0) {
            // Run a final unterminated line before leaving
            if (!pending.empty()) {
                handle_command_line(qmp_client, pending);
            }
            fprintf(stderr, "vmdeck: End of input\n");
            break;
        }

        pending.append(buf, static_cast<size_t>(n));

        size_t nl;
        while ((nl = pending.find('\n')) != std::string::npos) {
            std::string line = pending.substr(0, nl);
            pending.erase(0, nl + 1);
            if (!line.empty() && line.back() == '\r') {
                line.pop_back();
            }
            if (line.find_first_not_of(" \t") == std::string::npos) {
                continue;
            }
            handle_command_line(qmp_client, line);
        }
    }
}

int main(int argc, char* argv[]) {
    // Defaults -> config file -> environment -> command line
    config::VMConfig cfg;
    std::string config_path = config::find_config_arg(argc, argv);
    if (!config_path.empty() && !config::load_config(config_path, cfg)) {
        return 1;
    }
    cfg.load_from_env();
    cfg.parse_command_line(argc, argv);

    std::string error;
    if (!cfg.validate(error)) {
        fprintf(stderr, "vmdeck: Invalid configuration: %s\n", error.c_str());
        return 1;
    }

    if (!cfg.save_path.empty()) {
        return config::save_config(cfg.save_path, cfg) ? 0 : 1;
    }

    // Set up signal handlers for graceful shutdown
    signal(SIGINT, signal_handler);
    signal(SIGTERM, signal_handler);
    signal(SIGPIPE, SIG_IGN);

    cfg.print_summary();

    emulator::ProcessManager process(cfg.launch);
    if (cfg.auto_start) {
        if (!process.start()) {
            fprintf(stderr, "vmdeck: Failed to start emulator: %s\n", process.last_error().c_str());
            return 1;
        }
    } else {
        fprintf(stderr, "vmdeck: Auto-start disabled, connecting to %s and %s\n",
                process.control_address().c_str(), process.display_address().c_str());
    }

    qmp::QMPClient qmp_client(cfg.qmp_options());
    qmp_client.set_event_callback([](const nlohmann::json& event) {
        fprintf(stderr, "vmdeck: QMP event %s\n",
                json_utils::get_string(event, "event", "?").c_str());
    });
    if (!qmp_client.connect(cfg.qmp_retries, cfg.qmp_retry_delay_ms)) {
        fprintf(stderr, "vmdeck: Could not connect to QMP: %s\n", qmp_client.last_error().c_str());
        process.stop();
        return 1;
    }

    vnc::VNCClient vnc_client(cfg.vnc_options());
    if (!vnc_client.connect(cfg.vnc_retries, cfg.vnc_retry_delay_ms)) {
        fprintf(stderr, "vmdeck: Could not connect to VNC: %s\n", vnc_client.last_error().c_str());
        qmp_client.disconnect();
        process.stop();
        return 1;
    }

    // Pointer coordinates are in guest pixels
    int screen_w = vnc_client.width() > 0 ? vnc_client.width() : cfg.launch.display_width;
    int screen_h = vnc_client.height() > 0 ? vnc_client.height() : cfg.launch.display_height;
    qmp_client.set_screen_size(screen_w, screen_h);
    vnc_client.set_resize_callback([&qmp_client](int width, int height) {
        fprintf(stderr, "vmdeck: Guest screen is now %dx%d\n", width, height);
        qmp_client.set_screen_size(width, height);
    });

    if (!cfg.frame_output.empty()) {
        std::string frame_path = cfg.frame_output;
        bool debug_frames = cfg.debug_frames;
        vnc_client.set_frame_callback([frame_path, debug_frames](const EncodedFrame& frame) {
            static uint64_t last_written = 0;
            if (frame.sequence == last_written) {
                return;
            }
            if (!write_file_atomic(frame_path, frame.data)) {
                fprintf(stderr, "vmdeck: Failed to write frame to %s: %s\n",
                        frame_path.c_str(), strerror(errno));
                return;
            }
            last_written = frame.sequence;
            if (debug_frames) {
                fprintf(stderr, "vmdeck: Frame %llu %dx%d (%zu bytes)\n",
                        static_cast<unsigned long long>(frame.sequence),
                        frame.width, frame.height, frame.data.size());
            }
        });
    }

    if (!vnc_client.start_streaming()) {
        fprintf(stderr, "vmdeck: Failed to start streaming: %s\n", vnc_client.last_error().c_str());
    }

    fprintf(stderr, "vmdeck: Ready, reading commands from stdin\n");
    command_loop(qmp_client, process);

    fprintf(stderr, "vmdeck: Shutting down...\n");
    vnc_client.stop_streaming();
    vnc_client.disconnect();
    qmp_client.disconnect();
    process.stop();

    fprintf(stderr, "vmdeck: Shutdown complete (%llu frames captured)\n",
            static_cast<unsigned long long>(vnc_client.frames_captured()));
    return 0;
}
