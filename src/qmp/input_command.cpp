/*
 * Input Commands Implementation
 */

#include "input_command.h"
#include "utils/json_utils.h"
#include "utils/keyboard_map.h"

namespace qmp {

// Required integer parameter
static bool require_int(const nlohmann::json& j, const std::string& key, int& value,
                        std::string& error) {
    if (!j.contains(key)) {
        error = "Missing parameter '" + key + "'";
        return false;
    }
    bool ok = true;
    value = json_utils::get_int(j, key, 0, &ok);
    if (!ok) {
        error = "Parameter '" + key + "' must be an integer";
        return false;
    }
    return true;
}

static bool require_string(const nlohmann::json& j, const std::string& key, std::string& value,
                           std::string& error) {
    auto it = j.find(key);
    if (it == j.end() || !it->is_string()) {
        error = "Missing string parameter '" + key + "'";
        return false;
    }
    value = it->get<std::string>();
    return true;
}

bool parse_input_command(const nlohmann::json& j, InputCommand& cmd, std::string& error) {
    if (!j.is_object()) {
        error = "Command must be a JSON object";
        return false;
    }

    std::string name = json_utils::get_string(j, "name");
    if (name.empty()) {
        error = "Missing command name";
        return false;
    }

    if (name == "mouse_move") {
        MouseMove c;
        if (!require_int(j, "x", c.x, error) || !require_int(j, "y", c.y, error)) return false;
        cmd = c;
    } else if (name == "mouse_click") {
        MouseClick c;
        c.button = mouse_button_from_name(json_utils::get_string(j, "button", "left"));
        cmd = c;
    } else if (name == "mouse_double_click") {
        MouseDoubleClick c;
        c.button = mouse_button_from_name(json_utils::get_string(j, "button", "left"));
        cmd = c;
    } else if (name == "mouse_drag") {
        MouseDrag c;
        if (!require_int(j, "start_x", c.start_x, error) ||
            !require_int(j, "start_y", c.start_y, error) ||
            !require_int(j, "end_x", c.end_x, error) ||
            !require_int(j, "end_y", c.end_y, error)) {
            return false;
        }
        cmd = c;
    } else if (name == "key_press") {
        KeyPress c;
        if (!require_string(j, "key", c.key, error)) return false;
        if (c.key.empty()) {
            error = "Parameter 'key' is empty";
            return false;
        }
        cmd = c;
    } else if (name == "key_combo") {
        KeyCombo c;
        auto it = j.find("keys");
        if (it != j.end() && it->is_array()) {
            c.keys = json_utils::get_string_array(j, "keys");
        } else if (it != j.end() && it->is_string()) {
            c.keys = keyboard_map::split_combo(it->get<std::string>());
        } else {
            error = "Parameter 'keys' must be a string or an array";
            return false;
        }
        if (c.keys.empty()) {
            error = "Parameter 'keys' is empty";
            return false;
        }
        cmd = c;
    } else if (name == "type_text") {
        TypeText c;
        if (!require_string(j, "text", c.text, error)) return false;
        cmd = c;
    } else if (name == "screenshot") {
        Screenshot c;
        c.filename = json_utils::get_string(j, "filename", c.filename);
        cmd = c;
    } else {
        error = "Unknown command '" + name + "'";
        return false;
    }

    return true;
}

namespace {

struct NameVisitor {
    const char* operator()(const MouseMove&) const { return "mouse_move"; }
    const char* operator()(const MouseClick&) const { return "mouse_click"; }
    const char* operator()(const MouseDoubleClick&) const { return "mouse_double_click"; }
    const char* operator()(const MouseDrag&) const { return "mouse_drag"; }
    const char* operator()(const KeyPress&) const { return "key_press"; }
    const char* operator()(const KeyCombo&) const { return "key_combo"; }
    const char* operator()(const TypeText&) const { return "type_text"; }
    const char* operator()(const Screenshot&) const { return "screenshot"; }
};

struct DispatchVisitor {
    QMPClient& client;

    std::string operator()(const MouseMove& c) const {
        client.mouse_move(c.x, c.y);
        return std::string();
    }
    std::string operator()(const MouseClick& c) const {
        client.mouse_click(mouse_button_name(c.button));
        return std::string();
    }
    std::string operator()(const MouseDoubleClick& c) const {
        client.mouse_double_click(mouse_button_name(c.button));
        return std::string();
    }
    std::string operator()(const MouseDrag& c) const {
        client.mouse_drag(c.start_x, c.start_y, c.end_x, c.end_y);
        return std::string();
    }
    std::string operator()(const KeyPress& c) const {
        client.key_press(c.key);
        return std::string();
    }
    std::string operator()(const KeyCombo& c) const {
        client.key_combo(c.keys);
        return std::string();
    }
    std::string operator()(const TypeText& c) const {
        client.type_text(c.text);
        return std::string();
    }
    std::string operator()(const Screenshot& c) const {
        return client.screenshot(c.filename);
    }
};

} // namespace

const char* command_name(const InputCommand& cmd) {
    return std::visit(NameVisitor{}, cmd);
}

std::string dispatch(QMPClient& client, const InputCommand& cmd) {
    return std::visit(DispatchVisitor{client}, cmd);
}

} // namespace qmp
