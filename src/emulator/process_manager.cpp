/*
 * Emulator Process Manager Implementation
 */

#include "process_manager.h"
#include <algorithm>
#include <chrono>
#include <cstdio>
#include <cstring>
#include <cstdlib>
#include <cerrno>
#include <unistd.h>
#include <fcntl.h>
#include <poll.h>
#include <signal.h>
#include <sys/stat.h>
#include <sys/wait.h>

namespace emulator {

// Keep this much of the emulator's stderr for diagnostics
static const size_t STDERR_TAIL_MAX = 8192;

// Poll interval while waiting on the child
static const int WAIT_STEP_MS = 100;

static bool is_executable(const std::string& path) {
    struct stat st;
    return access(path.c_str(), X_OK) == 0 &&
           stat(path.c_str(), &st) == 0 && S_ISREG(st.st_mode);
}

// Resolve a program name the way a shell would
static std::string search_path(const std::string& name) {
    if (name.find('/') != std::string::npos) {
        return is_executable(name) ? name : "";
    }

    const char* path_env = getenv("PATH");
    std::string path = path_env ? path_env : "/usr/local/bin:/usr/bin:/bin";

    size_t start = 0;
    while (start <= path.size()) {
        size_t end = path.find(':', start);
        if (end == std::string::npos) end = path.size();

        std::string dir = path.substr(start, end - start);
        if (dir.empty()) dir = ".";

        std::string candidate = dir + "/" + name;
        if (is_executable(candidate)) {
            return candidate;
        }
        start = end + 1;
    }

    return "";
}

static std::string join_args(const std::vector<std::string>& args) {
    std::string out;
    for (const auto& a : args) {
        if (!out.empty()) out += ' ';
        out += a;
    }
    return out;
}

ProcessManager::ProcessManager(const LaunchConfig& config)
    : config_(config)
    , started_pid_(-1)
    , stderr_stop_(false)
{
}

ProcessManager::~ProcessManager() {
    stop();
}

std::string ProcessManager::find_emulator() const {
    // If path explicitly set, use it
    if (!config_.emulator_path.empty()) {
        std::string path = search_path(config_.emulator_path);
        if (path.empty()) {
            fprintf(stderr, "Emulator: Specified path not executable: %s\n",
                    config_.emulator_path.c_str());
        }
        return path;
    }

    const char* candidates[] = {
        "qemu-system-x86_64",
        "kvm",
        "qemu-kvm",
        nullptr
    };

    for (int i = 0; candidates[i]; i++) {
        std::string path = search_path(candidates[i]);
        if (!path.empty()) {
            return path;
        }
    }

    return "";
}

std::string ProcessManager::find_qemu_img() const {
    if (!config_.qemu_img_path.empty()) {
        return search_path(config_.qemu_img_path);
    }
    return search_path("qemu-img");
}

std::vector<std::string> ProcessManager::build_command(const std::string& emulator_path) const {
    const LaunchConfig& cfg = config_;
    std::vector<std::string> cmd;
    cmd.push_back(emulator_path);

    if (cfg.enable_kvm && access("/dev/kvm", R_OK | W_OK) == 0) {
        cmd.push_back("-enable-kvm");
    }

    cmd.push_back("-m");
    cmd.push_back(cfg.memory);
    cmd.push_back("-smp");
    cmd.push_back(std::to_string(cfg.cpus));

    if (!cfg.disk_path.empty()) {
        cmd.push_back("-hda");
        cmd.push_back(cfg.disk_path);
    }

    if (!cfg.iso_path.empty() && access(cfg.iso_path.c_str(), R_OK) == 0) {
        cmd.push_back("-cdrom");
        cmd.push_back(cfg.iso_path);
        if (cfg.disk_path.empty()) {
            cmd.push_back("-boot");
            cmd.push_back("d");
        }
    }

    // VNC takes a display number, not a port
    cmd.push_back("-vnc");
    cmd.push_back(cfg.host + ":" + std::to_string(cfg.vnc_port - 5900));

    cmd.push_back("-qmp");
    cmd.push_back("tcp:" + cfg.host + ":" + std::to_string(cfg.qmp_port) + ",server,nowait");

    // Display and input devices
    cmd.push_back("-device");
    cmd.push_back("virtio-vga,xres=" + std::to_string(cfg.display_width) +
                  ",yres=" + std::to_string(cfg.display_height));
    cmd.push_back("-device");
    cmd.push_back("virtio-keyboard-pci");
    cmd.push_back("-device");
    cmd.push_back("virtio-mouse-pci");
    cmd.push_back("-device");
    cmd.push_back("virtio-net-pci,netdev=net0");
    cmd.push_back("-netdev");
    cmd.push_back("user,id=net0");
    cmd.push_back("-usb");
    cmd.push_back("-device");
    cmd.push_back("usb-tablet");

    if (!cfg.audio_backend.empty()) {
        cmd.push_back("-audiodev");
        cmd.push_back(cfg.audio_backend + ",id=audio0");
        cmd.push_back("-device");
        cmd.push_back("intel-hda");
        cmd.push_back("-device");
        cmd.push_back("hda-duplex,audiodev=audio0");
    }

    cmd.insert(cmd.end(), cfg.extra_args.begin(), cfg.extra_args.end());
    return cmd;
}

bool ProcessManager::create_disk() {
    if (config_.disk_path.empty() || access(config_.disk_path.c_str(), F_OK) == 0) {
        return true;
    }

    std::string qemu_img = find_qemu_img();
    if (qemu_img.empty()) {
        last_error_ = "qemu-img not found, can't create disk " + config_.disk_path;
        fprintf(stderr, "Emulator: %s\n", last_error_.c_str());
        return false;
    }

    std::vector<std::string> args = {
        qemu_img, "create", "-f", "qcow2", config_.disk_path, config_.disk_size
    };
    std::vector<char*> argv;
    for (auto& a : args) argv.push_back(const_cast<char*>(a.c_str()));
    argv.push_back(nullptr);

    pid_t pid = fork();
    if (pid < 0) {
        last_error_ = std::string("Fork failed: ") + strerror(errno);
        fprintf(stderr, "Emulator: %s\n", last_error_.c_str());
        return false;
    }

    if (pid == 0) {
        int devnull = open("/dev/null", O_RDWR);
        if (devnull >= 0) {
            dup2(devnull, STDIN_FILENO);
            dup2(devnull, STDOUT_FILENO);
        }
        execv(argv[0], argv.data());
        _exit(127);
    }

    int status = 0;
    while (waitpid(pid, &status, 0) < 0) {
        if (errno != EINTR) {
            last_error_ = std::string("waitpid failed: ") + strerror(errno);
            return false;
        }
    }

    if (!WIFEXITED(status) || WEXITSTATUS(status) != 0) {
        last_error_ = "qemu-img failed to create " + config_.disk_path;
        fprintf(stderr, "Emulator: %s\n", last_error_.c_str());
        return false;
    }

    fprintf(stderr, "Emulator: Created disk image %s (%s)\n",
            config_.disk_path.c_str(), config_.disk_size.c_str());
    return true;
}

bool ProcessManager::start() {
    if (started_pid_ > 0) {
        // Already started one, check if still alive
        int status;
        pid_t result = waitpid(started_pid_, &status, WNOHANG);
        if (result == 0) {
            fprintf(stderr, "Emulator: Already running (PID %d)\n", started_pid_);
            return true;
        }
        // Exited behind our back
        started_pid_ = -1;
        stop_stderr_drain();
    }

    last_error_.clear();

    std::string emu_path = find_emulator();
    if (emu_path.empty()) {
        last_error_ = "QEMU not found. Install qemu-system-x86_64 or set the emulator path";
        fprintf(stderr, "Emulator: %s\n", last_error_.c_str());
        return false;
    }

    if (!create_disk()) {
        return false;
    }

    std::vector<std::string> args = build_command(emu_path);
    fprintf(stderr, "Emulator: Starting %s\n",
            config_.debug ? join_args(args).c_str() : emu_path.c_str());

    // argv must be ready before fork; the child may only exec
    std::vector<char*> argv;
    for (auto& a : args) argv.push_back(const_cast<char*>(a.c_str()));
    argv.push_back(nullptr);

    int err_pipe[2];
    if (pipe(err_pipe) < 0) {
        last_error_ = std::string("pipe failed: ") + strerror(errno);
        fprintf(stderr, "Emulator: %s\n", last_error_.c_str());
        return false;
    }

    pid_t pid = fork();
    if (pid < 0) {
        last_error_ = std::string("Fork failed: ") + strerror(errno);
        fprintf(stderr, "Emulator: %s\n", last_error_.c_str());
        close(err_pipe[0]);
        close(err_pipe[1]);
        return false;
    }

    if (pid == 0) {
        // Child process
        int devnull = open("/dev/null", O_RDWR);
        if (devnull >= 0) {
            dup2(devnull, STDIN_FILENO);
            dup2(devnull, STDOUT_FILENO);
        }
        dup2(err_pipe[1], STDERR_FILENO);

        // Close everything else we inherited (sockets, pipes)
        for (int fd = 3; fd < 1024; fd++) {
            close(fd);
        }

        execv(argv[0], argv.data());

        static const char msg[] = "Emulator: exec failed\n";
        ssize_t ignored = write(STDERR_FILENO, msg, sizeof(msg) - 1);
        (void)ignored;
        _exit(127);
    }

    // Parent process
    close(err_pipe[1]);
    started_pid_ = pid;
    {
        std::lock_guard<std::mutex> lock(stderr_mutex_);
        stderr_tail_.clear();
    }
    start_stderr_drain(err_pipe[0]);

    // Liveness window: a bad argument or busy port kills QEMU right away
    for (int waited = 0; waited < config_.startup_grace_ms; waited += WAIT_STEP_MS) {
        int status;
        pid_t result = waitpid(pid, &status, WNOHANG);
        if (result == pid) {
            started_pid_ = -1;
            stop_stderr_drain();

            int code = WIFEXITED(status) ? WEXITSTATUS(status) : -1;
            last_error_ = "QEMU exited during startup (code " + std::to_string(code) + ")";
            std::string tail = stderr_tail();
            if (!tail.empty()) {
                last_error_ += ": " + tail;
            }
            fprintf(stderr, "Emulator: %s\n", last_error_.c_str());
            return false;
        }
        int step = std::min(WAIT_STEP_MS, config_.startup_grace_ms - waited);
        std::this_thread::sleep_for(std::chrono::milliseconds(step));
    }

    fprintf(stderr, "Emulator: Started with PID %d (QMP %s, VNC %s)\n",
            pid, control_address().c_str(), display_address().c_str());
    return true;
}

void ProcessManager::stop(bool force) {
    if (started_pid_ <= 0) return;

    fprintf(stderr, "Emulator: Stopping PID %d%s\n", started_pid_, force ? " (forced)" : "");

    kill(started_pid_, force ? SIGKILL : SIGTERM);

    bool exited = false;
    for (int waited = 0; waited < config_.stop_timeout_ms; waited += WAIT_STEP_MS) {
        int status;
        pid_t result = waitpid(started_pid_, &status, WNOHANG);
        if (result != 0) {
            exited = true;
            break;
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(WAIT_STEP_MS));
    }

    if (!exited) {
        fprintf(stderr, "Emulator: Force killing\n");
        kill(started_pid_, SIGKILL);
        while (waitpid(started_pid_, nullptr, 0) < 0 && errno == EINTR) {
        }
    }

    started_pid_ = -1;
    stop_stderr_drain();
    fprintf(stderr, "Emulator: Stopped\n");
}

int ProcessManager::check_status() {
    if (started_pid_ <= 0) return -1;

    int status;
    pid_t result = waitpid(started_pid_, &status, WNOHANG);
    if (result > 0) {
        int exit_code = -1;
        if (WIFEXITED(status)) {
            exit_code = WEXITSTATUS(status);
            fprintf(stderr, "Emulator: Exited with code %d\n", exit_code);
        } else if (WIFSIGNALED(status)) {
            fprintf(stderr, "Emulator: Killed by signal %d\n", WTERMSIG(status));
        }
        started_pid_ = -1;
        stop_stderr_drain();
        return exit_code;
    }

    return 0;  // Still running
}

std::string ProcessManager::control_address() const {
    return config_.host + ":" + std::to_string(config_.qmp_port);
}

std::string ProcessManager::display_address() const {
    return config_.host + ":" + std::to_string(config_.vnc_port);
}

std::string ProcessManager::stderr_tail() const {
    std::lock_guard<std::mutex> lock(stderr_mutex_);
    return stderr_tail_;
}

void ProcessManager::append_stderr(const char* data, size_t len) {
    std::lock_guard<std::mutex> lock(stderr_mutex_);
    stderr_tail_.append(data, len);
    if (stderr_tail_.size() > STDERR_TAIL_MAX) {
        stderr_tail_.erase(0, stderr_tail_.size() - STDERR_TAIL_MAX);
    }
}

void ProcessManager::start_stderr_drain(int fd) {
    stderr_stop_ = false;
    stderr_thread_ = std::thread([this, fd]() {
        char buf[4096];
        while (true) {
            struct pollfd pfd;
            pfd.fd = fd;
            pfd.events = POLLIN;
            pfd.revents = 0;

            int ready = poll(&pfd, 1, WAIT_STEP_MS);
            if (ready < 0 && errno != EINTR) break;
            if (ready <= 0) {
                // Grandchildren can hold the pipe open after QEMU is reaped
                if (stderr_stop_) break;
                continue;
            }

            ssize_t n = read(fd, buf, sizeof(buf));
            if (n < 0 && errno == EINTR) continue;
            if (n <= 0) break;

            append_stderr(buf, static_cast<size_t>(n));
            if (config_.debug) {
                fprintf(stderr, "Emulator: [stderr] %.*s", static_cast<int>(n), buf);
            }
        }
        close(fd);
    });
}

void ProcessManager::stop_stderr_drain() {
    stderr_stop_ = true;
    if (stderr_thread_.joinable()) {
        stderr_thread_.join();
    }
}

} // namespace emulator
