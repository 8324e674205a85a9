/*
 * Key Name to QEMU QKeyCode Conversion
 */

#include "keyboard_map.h"
#include <cctype>
#include <map>

namespace keyboard_map {

static const std::map<std::string, std::string>& named_keys() {
    static const std::map<std::string, std::string> table = {
        {"enter", "ret"},       {"return", "ret"},
        {"esc", "esc"},         {"escape", "esc"},
        {"tab", "tab"},
        {"space", "spc"},
        {"backspace", "backspace"},
        {"delete", "delete"},
        {"insert", "insert"},
        {"home", "home"},
        {"end", "end"},
        {"pageup", "pgup"},     {"pagedown", "pgdn"},
        {"up", "up"},           {"down", "down"},
        {"left", "left"},       {"right", "right"},
        {"f1", "f1"},   {"f2", "f2"},   {"f3", "f3"},   {"f4", "f4"},
        {"f5", "f5"},   {"f6", "f6"},   {"f7", "f7"},   {"f8", "f8"},
        {"f9", "f9"},   {"f10", "f10"}, {"f11", "f11"}, {"f12", "f12"},
        {"ctrl", "ctrl"},
        {"alt", "alt"},
        {"shift", "shift"},
        {"super", "meta_l"},    {"win", "meta_l"},      {"meta", "meta_l"},
        {"capslock", "caps_lock"},
    };
    return table;
}

// Unshifted US punctuation -> qcode
static const char* punctuation_qcode(char c) {
    switch (c) {
        case ' ':  return "spc";
        case '-':  return "minus";
        case '=':  return "equal";
        case '[':  return "bracket_left";
        case ']':  return "bracket_right";
        case '\\': return "backslash";
        case ';':  return "semicolon";
        case '\'': return "apostrophe";
        case '`':  return "grave_accent";
        case ',':  return "comma";
        case '.':  return "dot";
        case '/':  return "slash";
        default:   return nullptr;
    }
}

// Shifted US symbol -> unshifted key
static char shifted_symbol_base(char c) {
    switch (c) {
        case '!': return '1';
        case '@': return '2';
        case '#': return '3';
        case '$': return '4';
        case '%': return '5';
        case '^': return '6';
        case '&': return '7';
        case '*': return '8';
        case '(': return '9';
        case ')': return '0';
        case '_': return '-';
        case '+': return '=';
        case '{': return '[';
        case '}': return ']';
        case '|': return '\\';
        case ':': return ';';
        case '"': return '\'';
        case '~': return '`';
        case '<': return ',';
        case '>': return '.';
        case '?': return '/';
        default:  return 0;
    }
}

static std::string lower(const std::string& s) {
    std::string out(s);
    for (auto& ch : out) {
        ch = static_cast<char>(tolower(static_cast<unsigned char>(ch)));
    }
    return out;
}

std::string to_qcode(const std::string& name) {
    std::string key = lower(name);

    auto it = named_keys().find(key);
    if (it != named_keys().end()) {
        return it->second;
    }

    if (key.size() == 1) {
        const char* punct = punctuation_qcode(key[0]);
        if (punct) {
            return punct;
        }
    }

    // Letters, digits and unknown names pass through lower-cased
    return key;
}

bool needs_shift(char c, std::string& base) {
    if (isupper(static_cast<unsigned char>(c))) {
        base = std::string(1, static_cast<char>(tolower(static_cast<unsigned char>(c))));
        return true;
    }

    char unshifted = shifted_symbol_base(c);
    if (unshifted) {
        base = std::string(1, unshifted);
        return true;
    }

    return false;
}

std::vector<std::string> split_combo(const std::string& combo) {
    std::vector<std::string> keys;
    size_t start = 0;
    while (start <= combo.size()) {
        size_t plus = combo.find('+', start);
        if (plus == std::string::npos) plus = combo.size();

        std::string part = combo.substr(start, plus - start);
        size_t first = part.find_first_not_of(" \t");
        size_t last = part.find_last_not_of(" \t");
        if (first != std::string::npos) {
            keys.push_back(part.substr(first, last - first + 1));
        }
        start = plus + 1;
    }
    return keys;
}

} // namespace keyboard_map
