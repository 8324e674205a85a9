/*
 * Input Commands
 *
 * Typed form of the tool-style JSON commands accepted on vmdeck's stdin:
 *
 *   {"name": "mouse_move", "x": 500, "y": 300}
 *   {"name": "mouse_click", "button": "right"}
 *   {"name": "mouse_double_click"}
 *   {"name": "mouse_drag", "start_x": 10, "start_y": 10, "end_x": 200, "end_y": 80}
 *   {"name": "key_press", "key": "enter"}
 *   {"name": "key_combo", "keys": "ctrl+alt+delete"}   (or an array)
 *   {"name": "type_text", "text": "Hello World"}
 *   {"name": "screenshot", "filename": "/tmp/shot.ppm"}
 *
 * Numbers may also be given as decimal strings ("500").
 */

#ifndef INPUT_COMMAND_H
#define INPUT_COMMAND_H

#include "qmp_client.h"
#include <nlohmann/json.hpp>
#include <string>
#include <variant>
#include <vector>

namespace qmp {

struct MouseMove {
    int x = 0;
    int y = 0;
};

struct MouseClick {
    MouseButton button = MouseButton::Left;
};

struct MouseDoubleClick {
    MouseButton button = MouseButton::Left;
};

struct MouseDrag {
    int start_x = 0;
    int start_y = 0;
    int end_x = 0;
    int end_y = 0;
};

struct KeyPress {
    std::string key;
};

struct KeyCombo {
    std::vector<std::string> keys;
};

struct TypeText {
    std::string text;
};

struct Screenshot {
    std::string filename = "/tmp/screenshot.ppm";
};

using InputCommand = std::variant<MouseMove, MouseClick, MouseDoubleClick, MouseDrag,
                                  KeyPress, KeyCombo, TypeText, Screenshot>;

/**
 * Convert a tool-style JSON object into a command
 * @param cmd Receives the command on success
 * @param error Receives a message on failure
 * @return false on unknown name or missing/invalid parameters
 */
bool parse_input_command(const nlohmann::json& j, InputCommand& cmd, std::string& error);

// Command name as used in the JSON form
const char* command_name(const InputCommand& cmd);

/**
 * Run a command against a connected client
 * @return The screenshot file name for Screenshot, empty otherwise
 * @throws QMPError as QMPClient::execute()
 */
std::string dispatch(QMPClient& client, const InputCommand& cmd);

} // namespace qmp

#endif // INPUT_COMMAND_H
