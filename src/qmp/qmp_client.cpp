/*
 * QMP Client Implementation
 */

#include "qmp_client.h"
#include "utils/json_utils.h"
#include "utils/keyboard_map.h"

#include <algorithm>
#include <cctype>
#include <chrono>
#include <cstdio>
#include <thread>

namespace qmp {

// QEMU's absolute pointer range (INPUT_EVENT_ABS_MAX)
static const int ABS_AXIS_MAX = 32767;

static void sleep_ms(int ms) {
    if (ms > 0) {
        std::this_thread::sleep_for(std::chrono::milliseconds(ms));
    }
}

// Rounds toward negative infinity so drags to the left/up step evenly
static int floor_div(int a, int b) {
    int q = a / b;
    if ((a % b != 0) && ((a < 0) != (b < 0))) {
        q--;
    }
    return q;
}

const char* state_name(ConnectionState state) {
    switch (state) {
        case ConnectionState::Disconnected: return "disconnected";
        case ConnectionState::Connecting:   return "connecting";
        case ConnectionState::Connected:    return "connected";
    }
    return "unknown";
}

MouseButton mouse_button_from_name(const std::string& name) {
    std::string lower(name);
    for (auto& ch : lower) {
        ch = static_cast<char>(tolower(static_cast<unsigned char>(ch)));
    }
    if (lower == "middle") return MouseButton::Middle;
    if (lower == "right") return MouseButton::Right;
    return MouseButton::Left;
}

const char* mouse_button_name(MouseButton button) {
    switch (button) {
        case MouseButton::Left:   return "left";
        case MouseButton::Middle: return "middle";
        case MouseButton::Right:  return "right";
    }
    return "left";
}

QMPClient::QMPClient(const QMPClientOptions& options)
    : options_(options)
    , state_(ConnectionState::Disconnected)
    , request_id_(0)
    , screen_width_(0)
    , screen_height_(0)
{
}

QMPClient::~QMPClient() {
    disconnect();
}

void QMPClient::set_error(const std::string& error) {
    std::lock_guard<std::mutex> lock(error_mutex_);
    last_error_ = error;
}

std::string QMPClient::last_error() const {
    std::lock_guard<std::mutex> lock(error_mutex_);
    return last_error_;
}

void QMPClient::set_event_callback(EventCallback callback) {
    std::lock_guard<std::mutex> lock(callback_mutex_);
    event_callback_ = std::move(callback);
}

void QMPClient::set_screen_size(int width, int height) {
    screen_width_ = std::max(0, width);
    screen_height_ = std::max(0, height);
}

// ============================================================================
// Connection
// ============================================================================

bool QMPClient::connect(int max_retries, int retry_delay_ms) {
    if (is_connected()) {
        return true;
    }

    int attempts = std::max(1, max_retries);
    for (int attempt = 1; attempt <= attempts; attempt++) {
        AttemptResult result;
        {
            std::lock_guard<std::mutex> lock(execute_mutex_);
            result = attempt_connect();
        }

        if (result == AttemptResult::Ok) {
            fprintf(stderr, "QMP: Connected to %s:%d\n", options_.host.c_str(), options_.port);
            return true;
        }
        if (result == AttemptResult::Fatal) {
            fprintf(stderr, "QMP: Connection failed: %s\n", last_error().c_str());
            return false;
        }

        if (attempt < attempts) {
            if (options_.debug) {
                fprintf(stderr, "QMP: Attempt %d/%d failed (%s), retrying in %dms\n",
                        attempt, attempts, last_error().c_str(), retry_delay_ms);
            }
            sleep_ms(retry_delay_ms);
        }
    }

    fprintf(stderr, "QMP: Giving up on %s:%d after %d attempts: %s\n",
            options_.host.c_str(), options_.port, attempts, last_error().c_str());
    return false;
}

QMPClient::AttemptResult QMPClient::attempt_connect() {
    state_ = ConnectionState::Connecting;

    net::ConnectResult cr = socket_.connect_to(options_.host, options_.port,
                                               options_.connect_timeout_ms);
    if (cr != net::ConnectResult::Ok) {
        set_error(socket_.last_error());
        state_ = ConnectionState::Disconnected;
        if (cr == net::ConnectResult::Refused || cr == net::ConnectResult::Timeout) {
            return AttemptResult::Retry;
        }
        return AttemptResult::Fatal;
    }

    std::string line;
    if (!socket_.read_line(line, options_.reply_timeout_ms)) {
        set_error("Failed to read greeting: " + socket_.last_error());
        socket_.close();
        state_ = ConnectionState::Disconnected;
        return AttemptResult::Fatal;
    }

    json greeting;
    try {
        greeting = json_utils::parse(line);
    } catch (const std::exception& e) {
        set_error(std::string("Malformed greeting: ") + e.what());
        socket_.close();
        state_ = ConnectionState::Disconnected;
        return AttemptResult::Fatal;
    }

    if (!greeting.is_object() || !greeting.contains("QMP")) {
        set_error("Malformed greeting: " + line);
        socket_.close();
        state_ = ConnectionState::Disconnected;
        return AttemptResult::Fatal;
    }

    if (options_.debug) {
        fprintf(stderr, "QMP: <- %s\n", line.c_str());
    }

    // Leave negotiation mode; transact() throws and closes on failure
    try {
        transact("qmp_capabilities", json());
    } catch (const QMPError& e) {
        set_error(std::string("Capabilities negotiation failed: ") + e.what());
        socket_.close();
        state_ = ConnectionState::Disconnected;
        return AttemptResult::Fatal;
    }

    state_ = ConnectionState::Connected;
    return AttemptResult::Ok;
}

void QMPClient::disconnect() {
    bool was_connected = state_.load() != ConnectionState::Disconnected;

    // Wake a reader blocked in execute() so the mutex frees up
    socket_.shutdown();
    {
        std::lock_guard<std::mutex> lock(execute_mutex_);
        socket_.close();
        state_ = ConnectionState::Disconnected;
    }

    if (was_connected) {
        fprintf(stderr, "QMP: Disconnected\n");
    }
}

// ============================================================================
// Commands
// ============================================================================

json QMPClient::execute(const std::string& command, const json& arguments) {
    std::lock_guard<std::mutex> lock(execute_mutex_);
    if (state_.load() != ConnectionState::Connected) {
        throw ConnectionError("Not connected");
    }
    return transact(command, arguments);
}

void QMPClient::fail(const std::string& reason) {
    set_error(reason);
    socket_.close();
    if (state_.exchange(ConnectionState::Disconnected) == ConnectionState::Connected) {
        fprintf(stderr, "QMP: Connection lost: %s\n", reason.c_str());
    }
    throw ConnectionError(reason);
}

json QMPClient::transact(const std::string& command, const json& arguments) {
    uint64_t id = ++request_id_;

    json request;
    request["execute"] = command;
    if (!arguments.is_null() && !arguments.empty()) {
        request["arguments"] = arguments;
    }
    request["id"] = id;

    std::string line = request.dump();
    if (options_.debug) {
        fprintf(stderr, "QMP: -> %s\n", line.c_str());
    }

    line += "\n";
    if (!socket_.write_all(line)) {
        fail("Failed to send command: " + socket_.last_error());
    }

    return read_reply();
}

json QMPClient::read_reply() {
    while (true) {
        std::string line;
        if (!socket_.read_line(line, options_.reply_timeout_ms)) {
            fail(socket_.timed_out() ? "Timed out waiting for reply" : socket_.last_error());
        }
        if (line.empty()) {
            continue;
        }

        if (options_.debug) {
            fprintf(stderr, "QMP: <- %s\n", line.c_str());
        }

        json reply;
        try {
            reply = json_utils::parse(line);
        } catch (const std::exception& e) {
            fail(std::string("Malformed reply: ") + e.what());
        }

        if (!reply.is_object()) {
            fail("Malformed reply: " + line);
        }

        if (reply.contains("event")) {
            EventCallback callback;
            {
                std::lock_guard<std::mutex> lock(callback_mutex_);
                callback = event_callback_;
            }
            if (callback) {
                callback(reply);
            }
            continue;
        }

        if (reply.contains("error")) {
            const json& err = reply["error"];
            std::string error_class = json_utils::get_string(err, "class", "GenericError");
            std::string desc = json_utils::get_string(err, "desc");
            if (options_.debug) {
                fprintf(stderr, "QMP: Command failed: %s: %s\n", error_class.c_str(), desc.c_str());
            }
            throw CommandError(error_class, desc);
        }

        if (reply.contains("return")) {
            return reply["return"];
        }

        fail("Unexpected reply: " + line);
    }
}

// ============================================================================
// Input primitives
// ============================================================================

int QMPClient::scale_axis(int value, int extent) const {
    if (extent <= 1) {
        return value;
    }
    long long scaled = static_cast<long long>(value) * ABS_AXIS_MAX / (extent - 1);
    return static_cast<int>(std::min<long long>(std::max<long long>(scaled, 0), ABS_AXIS_MAX));
}

void QMPClient::mouse_move(int x, int y) {
    int width = screen_width_.load();
    int height = screen_height_.load();
    if (width > 0 && height > 0) {
        x = scale_axis(x, width);
        y = scale_axis(y, height);
    }

    json ev_x;
    ev_x["type"] = "abs";
    ev_x["data"]["axis"] = "x";
    ev_x["data"]["value"] = x;

    json ev_y;
    ev_y["type"] = "abs";
    ev_y["data"]["axis"] = "y";
    ev_y["data"]["value"] = y;

    json args;
    args["events"] = json::array({ev_x, ev_y});
    execute("input-send-event", args);
}

void QMPClient::send_button(MouseButton button, bool down) {
    json ev;
    ev["type"] = "btn";
    ev["data"]["down"] = down;
    ev["data"]["button"] = mouse_button_name(button);

    json args;
    args["events"] = json::array({ev});
    execute("input-send-event", args);
}

void QMPClient::mouse_click(const std::string& button) {
    MouseButton btn = mouse_button_from_name(button);
    send_button(btn, true);
    sleep_ms(timing_.click_release_ms);
    send_button(btn, false);
}

void QMPClient::mouse_double_click(const std::string& button) {
    mouse_click(button);
    sleep_ms(timing_.double_click_gap_ms);
    mouse_click(button);
}

void QMPClient::mouse_drag(int start_x, int start_y, int end_x, int end_y) {
    int steps = std::max(1, timing_.drag_steps);

    mouse_move(start_x, start_y);
    sleep_ms(timing_.drag_settle_ms);
    send_button(MouseButton::Left, true);

    for (int i = 1; i <= steps; i++) {
        int x = start_x + floor_div((end_x - start_x) * i, steps);
        int y = start_y + floor_div((end_y - start_y) * i, steps);
        mouse_move(x, y);
        sleep_ms(timing_.drag_step_ms);
    }

    send_button(MouseButton::Left, false);
}

void QMPClient::send_keys(const std::vector<std::string>& keys, int hold_ms) {
    json qcodes = json::array();
    for (const auto& key : keys) {
        json k;
        k["type"] = "qcode";
        k["data"] = keyboard_map::to_qcode(key);
        qcodes.push_back(k);
    }

    json args;
    args["keys"] = qcodes;
    args["hold-time"] = hold_ms;
    execute("send-key", args);
}

void QMPClient::key_press(const std::string& key) {
    send_keys({key}, timing_.key_hold_ms);
}

void QMPClient::key_combo(const std::vector<std::string>& keys) {
    send_keys(keys, timing_.combo_hold_ms);
}

void QMPClient::key_combo(const std::string& combo) {
    std::vector<std::string> keys = keyboard_map::split_combo(combo);
    if (keys.empty()) {
        throw QMPError("Empty key combination");
    }
    key_combo(keys);
}

void QMPClient::type_text(const std::string& text) {
    for (char c : text) {
        std::string base;
        if (c == ' ') {
            key_press("space");
        } else if (c == '\n') {
            key_press("enter");
        } else if (c == '\t') {
            key_press("tab");
        } else if (keyboard_map::needs_shift(c, base)) {
            key_combo(std::vector<std::string>{"shift", base});
        } else {
            key_press(std::string(1, c));
        }
        sleep_ms(timing_.type_delay_ms);
    }
}

std::string QMPClient::screenshot(const std::string& filename) {
    json args;
    args["filename"] = filename;
    execute("screendump", args);
    return filename;
}

} // namespace qmp
