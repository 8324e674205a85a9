/**
 * @file test_input_command.cpp
 * @brief Tool-style JSON commands: parsing and dispatch.
 */

#include <gtest/gtest.h>
#include "fake_servers.h"
#include "qmp/input_command.h"

#include <memory>

using namespace qmp;

namespace {

InputCommand parse_ok(const json& j) {
    InputCommand cmd;
    std::string error;
    EXPECT_TRUE(parse_input_command(j, cmd, error)) << error;
    return cmd;
}

std::string parse_error(const json& j) {
    InputCommand cmd;
    std::string error;
    EXPECT_FALSE(parse_input_command(j, cmd, error));
    return error;
}

} // namespace

// ─────────────────────────────────────────────────────────────────────────────
// Parsing
// ─────────────────────────────────────────────────────────────────────────────

TEST(InputCommandParseTest, MouseMove) {
    InputCommand cmd = parse_ok({{"name", "mouse_move"}, {"x", 500}, {"y", 300}});
    ASSERT_TRUE(std::holds_alternative<MouseMove>(cmd));
    EXPECT_EQ(std::get<MouseMove>(cmd).x, 500);
    EXPECT_EQ(std::get<MouseMove>(cmd).y, 300);
    EXPECT_STREQ(command_name(cmd), "mouse_move");
}

TEST(InputCommandParseTest, NumbersMayBeStrings) {
    InputCommand cmd = parse_ok({{"name", "mouse_move"}, {"x", "12"}, {"y", "-3"}});
    ASSERT_TRUE(std::holds_alternative<MouseMove>(cmd));
    EXPECT_EQ(std::get<MouseMove>(cmd).x, 12);
    EXPECT_EQ(std::get<MouseMove>(cmd).y, -3);
}

TEST(InputCommandParseTest, MouseClickDefaultsToLeft) {
    InputCommand cmd = parse_ok({{"name", "mouse_click"}});
    ASSERT_TRUE(std::holds_alternative<MouseClick>(cmd));
    EXPECT_EQ(std::get<MouseClick>(cmd).button, MouseButton::Left);

    cmd = parse_ok({{"name", "mouse_click"}, {"button", "right"}});
    EXPECT_EQ(std::get<MouseClick>(cmd).button, MouseButton::Right);
}

TEST(InputCommandParseTest, MouseDoubleClick) {
    InputCommand cmd = parse_ok({{"name", "mouse_double_click"}, {"button", "middle"}});
    ASSERT_TRUE(std::holds_alternative<MouseDoubleClick>(cmd));
    EXPECT_EQ(std::get<MouseDoubleClick>(cmd).button, MouseButton::Middle);
    EXPECT_STREQ(command_name(cmd), "mouse_double_click");
}

TEST(InputCommandParseTest, MouseDrag) {
    InputCommand cmd = parse_ok({{"name", "mouse_drag"}, {"start_x", 1}, {"start_y", 2},
                                 {"end_x", 30}, {"end_y", 40}});
    ASSERT_TRUE(std::holds_alternative<MouseDrag>(cmd));
    const MouseDrag& d = std::get<MouseDrag>(cmd);
    EXPECT_EQ(d.start_x, 1);
    EXPECT_EQ(d.start_y, 2);
    EXPECT_EQ(d.end_x, 30);
    EXPECT_EQ(d.end_y, 40);
}

TEST(InputCommandParseTest, KeyPress) {
    InputCommand cmd = parse_ok({{"name", "key_press"}, {"key", "enter"}});
    ASSERT_TRUE(std::holds_alternative<KeyPress>(cmd));
    EXPECT_EQ(std::get<KeyPress>(cmd).key, "enter");
}

TEST(InputCommandParseTest, KeyComboFromString) {
    InputCommand cmd = parse_ok({{"name", "key_combo"}, {"keys", "ctrl+alt+delete"}});
    ASSERT_TRUE(std::holds_alternative<KeyCombo>(cmd));
    std::vector<std::string> expected = {"ctrl", "alt", "delete"};
    EXPECT_EQ(std::get<KeyCombo>(cmd).keys, expected);
}

TEST(InputCommandParseTest, KeyComboFromArray) {
    InputCommand cmd = parse_ok({{"name", "key_combo"}, {"keys", {"ctrl", "c"}}});
    ASSERT_TRUE(std::holds_alternative<KeyCombo>(cmd));
    std::vector<std::string> expected = {"ctrl", "c"};
    EXPECT_EQ(std::get<KeyCombo>(cmd).keys, expected);
}

TEST(InputCommandParseTest, TypeTextKeepsWhitespace) {
    InputCommand cmd = parse_ok({{"name", "type_text"}, {"text", "Hello World\n"}});
    ASSERT_TRUE(std::holds_alternative<TypeText>(cmd));
    EXPECT_EQ(std::get<TypeText>(cmd).text, "Hello World\n");
}

TEST(InputCommandParseTest, ScreenshotDefaultFilename) {
    InputCommand cmd = parse_ok({{"name", "screenshot"}});
    ASSERT_TRUE(std::holds_alternative<Screenshot>(cmd));
    EXPECT_EQ(std::get<Screenshot>(cmd).filename, "/tmp/screenshot.ppm");

    cmd = parse_ok({{"name", "screenshot"}, {"filename", "/tmp/a.ppm"}});
    EXPECT_EQ(std::get<Screenshot>(cmd).filename, "/tmp/a.ppm");
}

TEST(InputCommandParseTest, Errors) {
    EXPECT_EQ(parse_error(json::array({1, 2})), "Command must be a JSON object");
    EXPECT_EQ(parse_error({{"x", 1}}), "Missing command name");
    EXPECT_EQ(parse_error({{"name", "reboot"}}), "Unknown command 'reboot'");
    EXPECT_EQ(parse_error({{"name", "mouse_move"}, {"x", 1}}), "Missing parameter 'y'");
    EXPECT_EQ(parse_error({{"name", "mouse_move"}, {"x", "left"}, {"y", 1}}),
              "Parameter 'x' must be an integer");
    EXPECT_EQ(parse_error({{"name", "mouse_move"}, {"x", 1.5}, {"y", 1}}),
              "Parameter 'x' must be an integer");
    EXPECT_EQ(parse_error({{"name", "mouse_drag"}, {"start_x", 1}, {"start_y", 2}, {"end_x", 3}}),
              "Missing parameter 'end_y'");
    EXPECT_EQ(parse_error({{"name", "key_press"}}), "Missing string parameter 'key'");
    EXPECT_EQ(parse_error({{"name", "key_press"}, {"key", 13}}), "Missing string parameter 'key'");
    EXPECT_EQ(parse_error({{"name", "key_press"}, {"key", ""}}), "Parameter 'key' is empty");
    EXPECT_EQ(parse_error({{"name", "key_combo"}, {"keys", "+"}}), "Parameter 'keys' is empty");
    EXPECT_EQ(parse_error({{"name", "key_combo"}, {"keys", json::array()}}),
              "Parameter 'keys' is empty");
    EXPECT_EQ(parse_error({{"name", "key_combo"}}),
              "Parameter 'keys' must be a string or an array");
    EXPECT_EQ(parse_error({{"name", "type_text"}}), "Missing string parameter 'text'");
}

// ─────────────────────────────────────────────────────────────────────────────
// Dispatch
// ─────────────────────────────────────────────────────────────────────────────

class InputCommandDispatchTest : public ::testing::Test {
protected:
    void SetUp() override {
        ASSERT_TRUE(server.start());

        QMPClientOptions opts;
        opts.host = "127.0.0.1";
        opts.port = server.port();
        opts.reply_timeout_ms = 1000;
        client.reset(new QMPClient(opts));

        InputTiming timing;
        timing.type_delay_ms = 0;
        timing.click_release_ms = 0;
        timing.double_click_gap_ms = 0;
        timing.drag_settle_ms = 0;
        timing.drag_step_ms = 0;
        timing.drag_steps = 2;
        client->set_timing(timing);
        ASSERT_TRUE(client->connect(1, 10)) << client->last_error();
    }

    std::string run(const json& j) {
        InputCommand cmd;
        std::string error;
        EXPECT_TRUE(parse_input_command(j, cmd, error)) << error;
        return dispatch(*client, cmd);
    }

    fake::QMPServer server;
    std::unique_ptr<QMPClient> client;
};

TEST_F(InputCommandDispatchTest, MouseCommands) {
    EXPECT_EQ(run({{"name", "mouse_move"}, {"x", 10}, {"y", 20}}), "");
    run({{"name", "mouse_click"}, {"button", "right"}});
    run({{"name", "mouse_double_click"}});
    run({{"name", "mouse_drag"}, {"start_x", 0}, {"start_y", 0}, {"end_x", 10}, {"end_y", 10}});

    // 1 move + 2 click + 4 double click + (move, press, 2 steps, release)
    std::vector<json> requests = server.requests_named("input-send-event");
    ASSERT_EQ(requests.size(), 12u);
    EXPECT_EQ(requests[0]["arguments"]["events"][0]["data"]["value"], 10);
    EXPECT_EQ(requests[1]["arguments"]["events"][0]["data"]["button"], "right");
    EXPECT_EQ(requests[3]["arguments"]["events"][0]["data"]["button"], "left");
    EXPECT_EQ(requests[10]["arguments"]["events"][0]["data"]["value"], 10);
}

TEST_F(InputCommandDispatchTest, KeyboardCommands) {
    run({{"name", "key_press"}, {"key", "esc"}});
    run({{"name", "key_combo"}, {"keys", {"ctrl", "alt", "f2"}}});
    run({{"name", "type_text"}, {"text", "ok"}});

    std::vector<json> requests = server.requests_named("send-key");
    ASSERT_EQ(requests.size(), 4u);
    EXPECT_EQ(requests[0]["arguments"]["keys"][0]["data"], "esc");
    EXPECT_EQ(requests[1]["arguments"]["keys"].size(), 3u);
    EXPECT_EQ(requests[1]["arguments"]["keys"][2]["data"], "f2");
    EXPECT_EQ(requests[2]["arguments"]["keys"][0]["data"], "o");
    EXPECT_EQ(requests[3]["arguments"]["keys"][0]["data"], "k");
}

TEST_F(InputCommandDispatchTest, ScreenshotReturnsFilename) {
    EXPECT_EQ(run({{"name", "screenshot"}, {"filename", "/tmp/dispatch.ppm"}}),
              "/tmp/dispatch.ppm");

    std::vector<json> requests = server.requests_named("screendump");
    ASSERT_EQ(requests.size(), 1u);
    EXPECT_EQ(requests[0]["arguments"]["filename"], "/tmp/dispatch.ppm");
}

TEST_F(InputCommandDispatchTest, ServerErrorPropagates) {
    server.set_responder([](const json&) {
        return json{{"error", {{"class", "DeviceNotFound"}, {"desc", "no keyboard"}}}};
    });

    InputCommand cmd = KeyPress{"a"};
    EXPECT_THROW(dispatch(*client, cmd), CommandError);
}
