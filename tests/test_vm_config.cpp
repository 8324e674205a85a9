/**
 * @file test_vm_config.cpp
 * @brief Config layering: defaults, JSON file, environment, command line.
 */

#include <gtest/gtest.h>
#include "config/config_manager.h"
#include "config/vm_config.h"
#include "utils/json_utils.h"

#include <cstdlib>
#include <fstream>
#include <string>
#include <unistd.h>
#include <vector>

using config::VMConfig;

namespace {

// Mutable argv for getopt_long
class Argv {
public:
    Argv(std::initializer_list<std::string> args) : storage_(args) {
        for (auto& s : storage_) {
            ptrs_.push_back(&s[0]);
        }
        ptrs_.push_back(nullptr);
    }

    int argc() const { return static_cast<int>(storage_.size()); }
    char** argv() { return ptrs_.data(); }

private:
    std::vector<std::string> storage_;
    std::vector<char*> ptrs_;
};

class TempFile {
public:
    TempFile() {
        char tmpl[] = "/tmp/vmdeck-config-XXXXXX";
        int fd = mkstemp(tmpl);
        if (fd >= 0) {
            close(fd);
            path_ = tmpl;
        }
    }

    ~TempFile() {
        if (!path_.empty()) unlink(path_.c_str());
    }

    void write(const std::string& content) {
        std::ofstream out(path_);
        out << content;
    }

    const std::string& path() const { return path_; }

private:
    std::string path_;
};

} // namespace

// ─────────────────────────────────────────────────────────────────────────────
// Config file
// ─────────────────────────────────────────────────────────────────────────────

TEST(ConfigFileTest, MissingFileKeepsDefaults) {
    VMConfig cfg;
    EXPECT_TRUE(config::load_config("/tmp/vmdeck-definitely-missing.json", cfg));
    EXPECT_EQ(cfg.fps, 30);
    EXPECT_EQ(cfg.launch.qmp_port, 4444);
    EXPECT_TRUE(cfg.config_path.empty());
}

TEST(ConfigFileTest, FileOverridesDefaults) {
    TempFile file;
    file.write(R"({
        "machine": {"memory": 2048, "cpus": 1, "kvm": false, "audio": "",
                    "iso": "/isos/debian.iso", "extra_args": ["-snapshot"], "auto_start": false},
        "display": {"width": 1024, "height": 768, "vnc_port": 5905, "retries": 3},
        "control": {"qmp_port": 4500, "reply_timeout_ms": 2000},
        "stream": {"fps": 10, "quality": 60, "output_width": 640, "output_height": 480,
                   "frame_output": "/tmp/frame.webp"}
    })");

    VMConfig cfg;
    ASSERT_TRUE(config::load_config(file.path(), cfg));

    EXPECT_EQ(cfg.launch.memory, "2048");
    EXPECT_EQ(cfg.launch.cpus, 1);
    EXPECT_FALSE(cfg.launch.enable_kvm);
    EXPECT_EQ(cfg.launch.audio_backend, "");
    EXPECT_EQ(cfg.launch.iso_path, "/isos/debian.iso");
    ASSERT_EQ(cfg.launch.extra_args.size(), 1u);
    EXPECT_EQ(cfg.launch.extra_args[0], "-snapshot");
    EXPECT_FALSE(cfg.auto_start);
    EXPECT_EQ(cfg.launch.display_width, 1024);
    EXPECT_EQ(cfg.launch.display_height, 768);
    EXPECT_EQ(cfg.launch.vnc_port, 5905);
    EXPECT_EQ(cfg.vnc_retries, 3);
    EXPECT_EQ(cfg.launch.qmp_port, 4500);
    EXPECT_EQ(cfg.qmp_reply_timeout_ms, 2000);
    EXPECT_EQ(cfg.fps, 10);
    EXPECT_EQ(cfg.quality, 60);
    EXPECT_EQ(cfg.output_width, 640);
    EXPECT_EQ(cfg.output_height, 480);
    EXPECT_EQ(cfg.frame_output, "/tmp/frame.webp");
    EXPECT_EQ(cfg.config_path, file.path());

    // Untouched keys keep their defaults
    EXPECT_EQ(cfg.launch.disk_size, "20G");
    EXPECT_EQ(cfg.qmp_retries, 5);
}

TEST(ConfigFileTest, WrongTypeFailsAndLeavesConfigAlone) {
    TempFile file;
    file.write(R"({"stream": {"fps": 15}, "display": {"width": "wide"}})");

    VMConfig cfg;
    EXPECT_FALSE(config::load_config(file.path(), cfg));
    EXPECT_EQ(cfg.fps, 30);
    EXPECT_EQ(cfg.launch.display_width, 1920);
}

TEST(ConfigFileTest, SectionMustBeObject) {
    TempFile file;
    file.write(R"({"machine": [1, 2, 3]})");

    VMConfig cfg;
    EXPECT_FALSE(config::load_config(file.path(), cfg));
}

TEST(ConfigFileTest, MalformedJsonFails) {
    TempFile file;
    file.write("{ not json");

    VMConfig cfg;
    EXPECT_FALSE(config::load_config(file.path(), cfg));
}

TEST(ConfigFileTest, SaveThenLoad) {
    TempFile file;

    VMConfig original;
    original.launch.disk_path = "/vm/disk.qcow2";
    original.launch.memory = "8192";
    original.launch.extra_args = {"-name", "test"};
    original.launch.qmp_port = 4450;
    original.fps = 12;
    original.quality = 42;
    original.vnc_retries = 7;
    ASSERT_TRUE(config::save_config(file.path(), original));

    // Saved file is plain, sectioned JSON
    nlohmann::json j = json_utils::parse_file(file.path());
    EXPECT_EQ(j["machine"]["memory"], "8192");
    EXPECT_EQ(j["stream"]["fps"], 12);

    VMConfig loaded;
    ASSERT_TRUE(config::load_config(file.path(), loaded));
    EXPECT_EQ(loaded.launch.disk_path, "/vm/disk.qcow2");
    EXPECT_EQ(loaded.launch.memory, "8192");
    EXPECT_EQ(loaded.launch.extra_args, original.launch.extra_args);
    EXPECT_EQ(loaded.launch.qmp_port, 4450);
    EXPECT_EQ(loaded.fps, 12);
    EXPECT_EQ(loaded.quality, 42);
    EXPECT_EQ(loaded.vnc_retries, 7);
}

TEST(ConfigFileTest, SaveToUnwritablePathFails) {
    VMConfig cfg;
    EXPECT_FALSE(config::save_config("/nonexistent-dir/vmdeck.json", cfg));
}

// ─────────────────────────────────────────────────────────────────────────────
// Command line and environment
// ─────────────────────────────────────────────────────────────────────────────

TEST(CommandLineTest, OverridesFileValues) {
    TempFile file;
    file.write(R"({"stream": {"fps": 10}, "machine": {"cpus": 8}})");

    Argv args({"vmdeck", "--config", file.path(), "--fps", "25", "-m", "1024",
               "--resolution", "800x600", "--no-kvm", "--audio", "none",
               "--extra-arg", "-snapshot", "--extra-arg", "-S", "-n"});

    VMConfig cfg;
    std::string path = config::find_config_arg(args.argc(), args.argv());
    ASSERT_EQ(path, file.path());
    ASSERT_TRUE(config::load_config(path, cfg));
    cfg.parse_command_line(args.argc(), args.argv());

    EXPECT_EQ(cfg.fps, 25);
    EXPECT_EQ(cfg.launch.cpus, 8);
    EXPECT_EQ(cfg.launch.memory, "1024");
    EXPECT_EQ(cfg.launch.display_width, 800);
    EXPECT_EQ(cfg.launch.display_height, 600);
    EXPECT_FALSE(cfg.launch.enable_kvm);
    EXPECT_EQ(cfg.launch.audio_backend, "");
    std::vector<std::string> extra = {"-snapshot", "-S"};
    EXPECT_EQ(cfg.launch.extra_args, extra);
    EXPECT_FALSE(cfg.auto_start);
}

TEST(CommandLineTest, PortsAndPaths) {
    Argv args({"vmdeck", "-e", "/opt/qemu/bin/qemu-system-x86_64", "-i", "/isos/a.iso",
               "-d", "/vm/a.qcow2", "--disk-size", "40G", "--qemu-img", "/opt/qemu/bin/qemu-img",
               "--host", "0.0.0.0", "--qmp-port", "5000", "--vnc-port", "5902",
               "--output-size", "640x360", "--quality", "90", "-o", "/tmp/out.webp",
               "--save-config", "/tmp/saved.json"});

    VMConfig cfg;
    cfg.parse_command_line(args.argc(), args.argv());

    EXPECT_EQ(cfg.launch.emulator_path, "/opt/qemu/bin/qemu-system-x86_64");
    EXPECT_EQ(cfg.launch.iso_path, "/isos/a.iso");
    EXPECT_EQ(cfg.launch.disk_path, "/vm/a.qcow2");
    EXPECT_EQ(cfg.launch.disk_size, "40G");
    EXPECT_EQ(cfg.launch.qemu_img_path, "/opt/qemu/bin/qemu-img");
    EXPECT_EQ(cfg.launch.host, "0.0.0.0");
    EXPECT_EQ(cfg.launch.qmp_port, 5000);
    EXPECT_EQ(cfg.launch.vnc_port, 5902);
    EXPECT_EQ(cfg.output_width, 640);
    EXPECT_EQ(cfg.output_height, 360);
    EXPECT_EQ(cfg.quality, 90);
    EXPECT_EQ(cfg.frame_output, "/tmp/out.webp");
    EXPECT_EQ(cfg.save_path, "/tmp/saved.json");

    qmp::QMPClientOptions q = cfg.qmp_options();
    EXPECT_EQ(q.host, "0.0.0.0");
    EXPECT_EQ(q.port, 5000);

    vnc::VNCClientOptions v = cfg.vnc_options();
    EXPECT_EQ(v.port, 5902);
    EXPECT_EQ(v.output_width, 640);
    EXPECT_EQ(v.output_height, 360);
    EXPECT_EQ(v.quality, 90);
}

TEST(CommandLineTest, DebugEnablesEveryFlag) {
    Argv args({"vmdeck", "--debug"});
    VMConfig cfg;
    cfg.parse_command_line(args.argc(), args.argv());

    EXPECT_TRUE(cfg.debug_qmp);
    EXPECT_TRUE(cfg.debug_vnc);
    EXPECT_TRUE(cfg.debug_frames);
    EXPECT_TRUE(cfg.debug_emulator);
    EXPECT_TRUE(cfg.launch.debug);
    EXPECT_TRUE(cfg.qmp_options().debug);
    EXPECT_TRUE(cfg.vnc_options().debug_frames);
}

TEST(CommandLineTest, FindConfigArgForms) {
    Argv short_form({"vmdeck", "-c", "/a.json"});
    EXPECT_EQ(config::find_config_arg(short_form.argc(), short_form.argv()), "/a.json");

    Argv equals_form({"vmdeck", "--fps", "5", "--config=/b.json"});
    EXPECT_EQ(config::find_config_arg(equals_form.argc(), equals_form.argv()), "/b.json");

    Argv none({"vmdeck", "--fps", "5"});
    EXPECT_EQ(config::find_config_arg(none.argc(), none.argv()), "");
}

TEST(CommandLineTest, HelpExits) {
    Argv args({"vmdeck", "--help"});
    VMConfig cfg;
    EXPECT_EXIT(cfg.parse_command_line(args.argc(), args.argv()),
                ::testing::ExitedWithCode(0), "Usage:");
}

TEST(CommandLineTest, BadResolutionExits) {
    Argv args({"vmdeck", "--resolution", "big"});
    VMConfig cfg;
    EXPECT_EXIT(cfg.parse_command_line(args.argc(), args.argv()),
                ::testing::ExitedWithCode(1), "Invalid resolution");
}

TEST(EnvironmentTest, DebugFlags) {
    setenv("VMDECK_DEBUG_VNC", "1", 1);
    setenv("VMDECK_DEBUG_EMULATOR", "yes", 1);
    setenv("VMDECK_DEBUG_QMP", "0", 1);
    unsetenv("VMDECK_DEBUG_FRAMES");

    VMConfig cfg;
    cfg.load_from_env();

    EXPECT_TRUE(cfg.debug_vnc);
    EXPECT_TRUE(cfg.debug_emulator);
    EXPECT_TRUE(cfg.launch.debug);
    EXPECT_FALSE(cfg.debug_qmp);
    EXPECT_FALSE(cfg.debug_frames);

    unsetenv("VMDECK_DEBUG_VNC");
    unsetenv("VMDECK_DEBUG_EMULATOR");
    unsetenv("VMDECK_DEBUG_QMP");
}

// ─────────────────────────────────────────────────────────────────────────────
// Validation and helpers
// ─────────────────────────────────────────────────────────────────────────────

TEST(ValidateTest, DefaultsAreValid) {
    VMConfig cfg;
    std::string error;
    EXPECT_TRUE(cfg.validate(error)) << error;
}

TEST(ValidateTest, RejectsBadValues) {
    std::string error;

    VMConfig low_vnc;
    low_vnc.launch.vnc_port = 5899;
    EXPECT_FALSE(low_vnc.validate(error));
    EXPECT_NE(error.find("VNC port"), std::string::npos);

    VMConfig same_ports;
    same_ports.launch.qmp_port = 5900;
    EXPECT_FALSE(same_ports.validate(error));
    EXPECT_NE(error.find("must differ"), std::string::npos);

    VMConfig bad_qmp;
    bad_qmp.launch.qmp_port = 70000;
    EXPECT_FALSE(bad_qmp.validate(error));

    VMConfig zero_fps;
    zero_fps.fps = 0;
    EXPECT_FALSE(zero_fps.validate(error));
    EXPECT_NE(error.find("fps"), std::string::npos);

    VMConfig bad_quality;
    bad_quality.quality = 101;
    EXPECT_FALSE(bad_quality.validate(error));

    VMConfig no_cpus;
    no_cpus.launch.cpus = 0;
    EXPECT_FALSE(no_cpus.validate(error));

    VMConfig negative_output;
    negative_output.output_width = -1;
    EXPECT_FALSE(negative_output.validate(error));
}

TEST(ValidateTest, EffectiveOutputSizeFallsBackToDisplay) {
    VMConfig cfg;
    cfg.launch.display_width = 1280;
    cfg.launch.display_height = 720;
    EXPECT_EQ(cfg.effective_output_width(), 1280);
    EXPECT_EQ(cfg.effective_output_height(), 720);

    cfg.output_width = 640;
    cfg.output_height = 360;
    EXPECT_EQ(cfg.effective_output_width(), 640);
    EXPECT_EQ(cfg.effective_output_height(), 360);
}

TEST(ParseResolutionTest, Formats) {
    int w = 0, h = 0;
    EXPECT_TRUE(config::parse_resolution("1920x1080", w, h));
    EXPECT_EQ(w, 1920);
    EXPECT_EQ(h, 1080);

    EXPECT_FALSE(config::parse_resolution("1920", w, h));
    EXPECT_FALSE(config::parse_resolution("0x10", w, h));
    EXPECT_FALSE(config::parse_resolution("10x-5", w, h));
    EXPECT_FALSE(config::parse_resolution("10x10px", w, h));
    EXPECT_EQ(w, 1920);
}
