/*
 * Emulator Process Manager
 *
 * Manages the lifecycle of the QEMU process backing a vmdeck session:
 * locating the binary, creating the disk image, launching with the
 * QMP and VNC sockets bound, and graceful-then-forced shutdown.
 *
 * An unexpected exit is not watched for here; the QMP and VNC clients
 * notice it as a dropped connection. Hosts that want to reap earlier
 * can call check_status().
 */

#ifndef PROCESS_MANAGER_H
#define PROCESS_MANAGER_H

#include "launch_config.h"
#include <atomic>
#include <mutex>
#include <string>
#include <thread>
#include <vector>
#include <sys/types.h>

namespace emulator {

/**
 * Emulator Process Manager
 * Exactly one child process per instance
 */
class ProcessManager {
public:
    explicit ProcessManager(const LaunchConfig& config);
    ~ProcessManager();

    ProcessManager(const ProcessManager&) = delete;
    ProcessManager& operator=(const ProcessManager&) = delete;

    /**
     * Find emulator executable
     * @return Path to emulator, or empty string if not found
     */
    std::string find_emulator() const;

    /**
     * Find qemu-img
     * @return Path to qemu-img, or empty string if not found
     */
    std::string find_qemu_img() const;

    /**
     * Build the full argument vector (argv[0] is the emulator path)
     */
    std::vector<std::string> build_command(const std::string& emulator_path) const;

    /**
     * Create the qcow2 disk image if a disk is configured and missing
     * @return true if the disk exists afterwards (or none is configured)
     */
    bool create_disk();

    /**
     * Start the emulator process
     * Succeeds immediately if already running. Fails if the executable
     * is missing, the disk can't be created, or the process exits during
     * the startup grace period (stderr is kept in last_error()).
     * @return true if started successfully
     */
    bool start();

    /**
     * Stop the emulator process
     * SIGTERM (or SIGKILL if force), SIGKILL after stop_timeout_ms,
     * then always reaps. The process is gone when this returns.
     */
    void stop(bool force = false);

    /**
     * Check emulator status without blocking
     * @return 0 if still running, -1 if not running, otherwise exit code.
     *         A clean exit also returns 0; is_running() is false afterwards.
     */
    int check_status();

    bool is_running() const { return started_pid_ > 0; }

    /**
     * Get PID of started emulator
     * @return PID or -1 if not started
     */
    pid_t get_pid() const { return started_pid_; }

    // "host:port" of the QMP and VNC sockets
    std::string control_address() const;
    std::string display_address() const;

    // Most recent stderr output (bounded)
    std::string stderr_tail() const;

    const std::string& last_error() const { return last_error_; }
    const LaunchConfig& config() const { return config_; }

private:
    void start_stderr_drain(int fd);
    void stop_stderr_drain();
    void append_stderr(const char* data, size_t len);

    const LaunchConfig config_;
    pid_t started_pid_;
    std::string last_error_;

    // stderr capture
    std::thread stderr_thread_;
    std::atomic<bool> stderr_stop_;
    mutable std::mutex stderr_mutex_;
    std::string stderr_tail_;
};

} // namespace emulator

#endif // PROCESS_MANAGER_H
