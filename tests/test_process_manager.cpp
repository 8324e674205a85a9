/**
 * @file test_process_manager.cpp
 * @brief Emulator process lifecycle, using shell scripts in place of QEMU.
 */

#include <gtest/gtest.h>
#include "emulator/process_manager.h"

#include <algorithm>
#include <chrono>
#include <cstdio>
#include <cstdlib>
#include <fstream>
#include <signal.h>
#include <sys/stat.h>
#include <thread>
#include <unistd.h>

using emulator::LaunchConfig;
using emulator::ProcessManager;

namespace {

class TempDir {
public:
    TempDir() {
        char tmpl[] = "/tmp/vmdeck-test-XXXXXX";
        char* p = mkdtemp(tmpl);
        path_ = p ? p : "";
    }

    ~TempDir() {
        for (const auto& f : files_) {
            unlink(f.c_str());
        }
        if (!path_.empty()) {
            rmdir(path_.c_str());
        }
    }

    const std::string& path() const { return path_; }

    std::string file(const std::string& name) {
        std::string full = path_ + "/" + name;
        files_.push_back(full);
        return full;
    }

    std::string script(const std::string& name, const std::string& body) {
        std::string full = file(name);
        std::ofstream out(full);
        out << "#!/bin/sh\n" << body << "\n";
        out.close();
        chmod(full.c_str(), 0755);
        return full;
    }

private:
    std::string path_;
    std::vector<std::string> files_;
};

LaunchConfig base_config() {
    LaunchConfig cfg;
    cfg.enable_kvm = false;
    cfg.host = "127.0.0.1";
    cfg.qmp_port = 4445;
    cfg.vnc_port = 5901;
    cfg.startup_grace_ms = 300;
    cfg.stop_timeout_ms = 500;
    return cfg;
}

bool contains(const std::vector<std::string>& v, const std::string& s) {
    return std::find(v.begin(), v.end(), s) != v.end();
}

// Value following a flag, empty if absent
std::string arg_after(const std::vector<std::string>& v, const std::string& flag) {
    auto it = std::find(v.begin(), v.end(), flag);
    if (it == v.end() || it + 1 == v.end()) return "";
    return *(it + 1);
}

bool file_exists(const std::string& path) {
    return access(path.c_str(), F_OK) == 0;
}

} // namespace

// ─────────────────────────────────────────────────────────────────────────────
// Command line
// ─────────────────────────────────────────────────────────────────────────────

TEST(ProcessManagerCommandTest, BuildsQemuArguments) {
    LaunchConfig cfg = base_config();
    cfg.memory = "2048";
    cfg.cpus = 4;
    cfg.disk_path = "/var/lib/vmdeck/disk.qcow2";
    cfg.display_width = 1280;
    cfg.display_height = 800;
    cfg.audio_backend = "pa";

    ProcessManager pm(cfg);
    std::vector<std::string> cmd = pm.build_command("/usr/bin/qemu-system-x86_64");

    ASSERT_FALSE(cmd.empty());
    EXPECT_EQ(cmd[0], "/usr/bin/qemu-system-x86_64");
    EXPECT_EQ(arg_after(cmd, "-m"), "2048");
    EXPECT_EQ(arg_after(cmd, "-smp"), "4");
    EXPECT_EQ(arg_after(cmd, "-hda"), "/var/lib/vmdeck/disk.qcow2");
    EXPECT_EQ(arg_after(cmd, "-vnc"), "127.0.0.1:1");
    EXPECT_EQ(arg_after(cmd, "-qmp"), "tcp:127.0.0.1:4445,server,nowait");
    EXPECT_EQ(arg_after(cmd, "-audiodev"), "pa,id=audio0");
    EXPECT_TRUE(contains(cmd, "virtio-vga,xres=1280,yres=800"));
    EXPECT_TRUE(contains(cmd, "usb-tablet"));
    EXPECT_TRUE(contains(cmd, "hda-duplex,audiodev=audio0"));
    EXPECT_FALSE(contains(cmd, "-enable-kvm"));
    EXPECT_FALSE(contains(cmd, "-cdrom"));
}

TEST(ProcessManagerCommandTest, NoAudioDevicesWhenBackendEmpty) {
    LaunchConfig cfg = base_config();
    cfg.audio_backend.clear();

    ProcessManager pm(cfg);
    std::vector<std::string> cmd = pm.build_command("qemu");
    EXPECT_FALSE(contains(cmd, "-audiodev"));
    EXPECT_FALSE(contains(cmd, "intel-hda"));
}

TEST(ProcessManagerCommandTest, CdromOnlyWhenIsoExists) {
    TempDir dir;
    std::string iso = dir.file("install.iso");
    std::ofstream(iso) << "iso";

    LaunchConfig cfg = base_config();
    cfg.iso_path = iso;
    ProcessManager with_iso(cfg);
    std::vector<std::string> cmd = with_iso.build_command("qemu");
    EXPECT_EQ(arg_after(cmd, "-cdrom"), iso);
    EXPECT_EQ(arg_after(cmd, "-boot"), "d");

    cfg.disk_path = dir.path() + "/disk.qcow2";
    ProcessManager with_disk(cfg);
    cmd = with_disk.build_command("qemu");
    EXPECT_EQ(arg_after(cmd, "-cdrom"), iso);
    EXPECT_FALSE(contains(cmd, "-boot"));

    cfg.iso_path = dir.path() + "/missing.iso";
    ProcessManager missing(cfg);
    cmd = missing.build_command("qemu");
    EXPECT_FALSE(contains(cmd, "-cdrom"));
}

TEST(ProcessManagerCommandTest, ExtraArgsComeLast) {
    LaunchConfig cfg = base_config();
    cfg.extra_args = {"-snapshot", "-name", "vmdeck"};

    ProcessManager pm(cfg);
    std::vector<std::string> cmd = pm.build_command("qemu");
    ASSERT_GE(cmd.size(), 3u);
    EXPECT_EQ(cmd[cmd.size() - 3], "-snapshot");
    EXPECT_EQ(cmd[cmd.size() - 2], "-name");
    EXPECT_EQ(cmd[cmd.size() - 1], "vmdeck");
}

TEST(ProcessManagerCommandTest, Addresses) {
    ProcessManager pm(base_config());
    EXPECT_EQ(pm.control_address(), "127.0.0.1:4445");
    EXPECT_EQ(pm.display_address(), "127.0.0.1:5901");
}

// ─────────────────────────────────────────────────────────────────────────────
// Lifecycle
// ─────────────────────────────────────────────────────────────────────────────

TEST(ProcessManagerTest, FailsWhenEmulatorMissing) {
    TempDir dir;
    LaunchConfig cfg = base_config();
    cfg.emulator_path = dir.path() + "/no-such-qemu";

    ProcessManager pm(cfg);
    EXPECT_EQ(pm.find_emulator(), "");
    EXPECT_FALSE(pm.start());
    EXPECT_FALSE(pm.is_running());
    EXPECT_NE(pm.last_error().find("QEMU not found"), std::string::npos);
    EXPECT_EQ(pm.get_pid(), -1);
}

TEST(ProcessManagerTest, StartsAndStops) {
    TempDir dir;
    LaunchConfig cfg = base_config();
    cfg.emulator_path = dir.script("qemu", "exec sleep 30");

    ProcessManager pm(cfg);
    ASSERT_TRUE(pm.start()) << pm.last_error();
    EXPECT_TRUE(pm.is_running());
    pid_t pid = pm.get_pid();
    EXPECT_GT(pid, 0);
    EXPECT_EQ(pm.check_status(), 0);

    // Second start is a no-op
    EXPECT_TRUE(pm.start());
    EXPECT_EQ(pm.get_pid(), pid);

    pm.stop();
    EXPECT_FALSE(pm.is_running());
    EXPECT_EQ(pm.get_pid(), -1);
    EXPECT_EQ(kill(pid, 0), -1);
    EXPECT_EQ(pm.check_status(), -1);

    // Idempotent
    pm.stop();
}

TEST(ProcessManagerTest, StopKillsProcessIgnoringTerm) {
    TempDir dir;
    LaunchConfig cfg = base_config();
    cfg.emulator_path = dir.script("qemu", "trap '' TERM\nwhile true; do sleep 0.1; done");

    ProcessManager pm(cfg);
    ASSERT_TRUE(pm.start()) << pm.last_error();
    pid_t pid = pm.get_pid();

    auto begin = std::chrono::steady_clock::now();
    pm.stop();
    auto elapsed = std::chrono::steady_clock::now() - begin;

    EXPECT_FALSE(pm.is_running());
    EXPECT_EQ(kill(pid, 0), -1);
    EXPECT_GE(std::chrono::duration_cast<std::chrono::milliseconds>(elapsed).count(), 400);
}

TEST(ProcessManagerTest, ForcedStopIsImmediate) {
    TempDir dir;
    LaunchConfig cfg = base_config();
    cfg.stop_timeout_ms = 5000;
    cfg.emulator_path = dir.script("qemu", "trap '' TERM\nwhile true; do sleep 0.1; done");

    ProcessManager pm(cfg);
    ASSERT_TRUE(pm.start()) << pm.last_error();

    auto begin = std::chrono::steady_clock::now();
    pm.stop(true);
    auto elapsed = std::chrono::steady_clock::now() - begin;

    EXPECT_FALSE(pm.is_running());
    EXPECT_LT(std::chrono::duration_cast<std::chrono::milliseconds>(elapsed).count(), 2000);
}

TEST(ProcessManagerTest, EarlyExitReportsStderr) {
    TempDir dir;
    LaunchConfig cfg = base_config();
    cfg.emulator_path = dir.script("qemu",
        "echo 'qemu: -vnc 127.0.0.1:1: Failed to bind socket: Address already in use' >&2\nexit 1");

    ProcessManager pm(cfg);
    EXPECT_FALSE(pm.start());
    EXPECT_FALSE(pm.is_running());
    EXPECT_NE(pm.last_error().find("code 1"), std::string::npos);
    EXPECT_NE(pm.last_error().find("Address already in use"), std::string::npos);
    EXPECT_NE(pm.stderr_tail().find("Failed to bind socket"), std::string::npos);
}

TEST(ProcessManagerTest, CheckStatusReportsExitCode) {
    TempDir dir;
    LaunchConfig cfg = base_config();
    cfg.startup_grace_ms = 100;
    cfg.emulator_path = dir.script("qemu", "sleep 0.5\nexit 4");

    ProcessManager pm(cfg);
    ASSERT_TRUE(pm.start()) << pm.last_error();

    int code = 0;
    auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(5);
    while (pm.is_running() && std::chrono::steady_clock::now() < deadline) {
        code = pm.check_status();
        std::this_thread::sleep_for(std::chrono::milliseconds(50));
    }

    EXPECT_FALSE(pm.is_running());
    EXPECT_EQ(code, 4);
}

TEST(ProcessManagerTest, CleanExitLeavesNotRunning) {
    TempDir dir;
    LaunchConfig cfg = base_config();
    cfg.startup_grace_ms = 100;
    cfg.emulator_path = dir.script("qemu", "sleep 0.3\nexit 0");

    ProcessManager pm(cfg);
    ASSERT_TRUE(pm.start()) << pm.last_error();

    auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(5);
    while (pm.is_running() && std::chrono::steady_clock::now() < deadline) {
        EXPECT_EQ(pm.check_status(), 0);
        std::this_thread::sleep_for(std::chrono::milliseconds(50));
    }
    EXPECT_FALSE(pm.is_running());
    EXPECT_EQ(pm.check_status(), -1);
}

// ─────────────────────────────────────────────────────────────────────────────
// Disk image
// ─────────────────────────────────────────────────────────────────────────────

TEST(ProcessManagerDiskTest, CreatesMissingDisk) {
    TempDir dir;
    LaunchConfig cfg = base_config();
    cfg.disk_path = dir.file("disk.qcow2");
    cfg.disk_size = "1G";
    std::string log = dir.file("qemu-img.log");
    // qemu-img create -f qcow2 <path> <size>
    cfg.qemu_img_path = dir.script("qemu-img", "echo \"$@\" > " + log + "\n: > \"$4\"");

    ProcessManager pm(cfg);
    ASSERT_TRUE(pm.create_disk()) << pm.last_error();
    EXPECT_TRUE(file_exists(cfg.disk_path));

    std::ifstream in(log);
    std::string line;
    std::getline(in, line);
    EXPECT_EQ(line, "create -f qcow2 " + cfg.disk_path + " 1G");
}

TEST(ProcessManagerDiskTest, ExistingDiskIsLeftAlone) {
    TempDir dir;
    LaunchConfig cfg = base_config();
    cfg.disk_path = dir.file("disk.qcow2");
    std::ofstream(cfg.disk_path) << "existing";
    cfg.qemu_img_path = dir.script("qemu-img", "exit 1");

    ProcessManager pm(cfg);
    EXPECT_TRUE(pm.create_disk());
}

TEST(ProcessManagerDiskTest, NoDiskConfigured) {
    LaunchConfig cfg = base_config();
    ProcessManager pm(cfg);
    EXPECT_TRUE(pm.create_disk());
}

TEST(ProcessManagerDiskTest, StartFailsWhenDiskCannotBeCreated) {
    TempDir dir;
    LaunchConfig cfg = base_config();
    cfg.emulator_path = dir.script("qemu", "exec sleep 30");
    cfg.disk_path = dir.file("disk.qcow2");
    cfg.qemu_img_path = dir.script("qemu-img", "exit 1");

    ProcessManager pm(cfg);
    EXPECT_FALSE(pm.start());
    EXPECT_FALSE(pm.is_running());
    EXPECT_NE(pm.last_error().find("qemu-img failed"), std::string::npos);
}

TEST(ProcessManagerDiskTest, StartFailsWhenQemuImgMissing) {
    TempDir dir;
    LaunchConfig cfg = base_config();
    cfg.emulator_path = dir.script("qemu", "exec sleep 30");
    cfg.disk_path = dir.file("disk.qcow2");
    cfg.qemu_img_path = dir.path() + "/no-such-qemu-img";

    ProcessManager pm(cfg);
    EXPECT_FALSE(pm.start());
    EXPECT_NE(pm.last_error().find("qemu-img not found"), std::string::npos);
}
