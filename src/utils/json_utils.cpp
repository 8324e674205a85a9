/*
 * JSON Utilities Implementation
 */

#include "json_utils.h"
#include <cerrno>
#include <cmath>
#include <climits>
#include <cstdlib>
#include <fstream>
#include <stdexcept>

namespace json_utils {

json parse(const std::string& str) {
    return json::parse(str);
}

json parse_file(const std::string& path) {
    std::ifstream file(path);
    if (!file) {
        throw std::runtime_error("Failed to open file: " + path);
    }

    json j;
    file >> j;
    return j;
}

std::string get_string(const json& j, const std::string& key,
                       const std::string& default_val) {
    if (!j.is_object()) {
        return default_val;
    }

    auto it = j.find(key);
    if (it == j.end() || !it->is_string()) {
        return default_val;
    }

    return it->get<std::string>();
}

int get_int(const json& j, const std::string& key, int default_val, bool* ok) {
    if (ok) *ok = true;

    if (!j.is_object()) {
        return default_val;
    }

    auto it = j.find(key);
    if (it == j.end() || it->is_null()) {
        return default_val;
    }

    if (it->is_number_integer()) {
        return it->get<int>();
    }

    if (it->is_number_float()) {
        double d = it->get<double>();
        if (std::floor(d) == d && d >= INT_MIN && d <= INT_MAX) {
            return static_cast<int>(d);
        }
    } else if (it->is_string()) {
        const std::string& s = it->get_ref<const std::string&>();
        if (!s.empty()) {
            char* end = nullptr;
            errno = 0;
            long v = strtol(s.c_str(), &end, 10);
            if (errno == 0 && *end == '\0' && v >= INT_MIN && v <= INT_MAX) {
                return static_cast<int>(v);
            }
        }
    }

    if (ok) *ok = false;
    return default_val;
}

bool get_bool(const json& j, const std::string& key, bool default_val) {
    if (!j.is_object()) {
        return default_val;
    }

    auto it = j.find(key);
    if (it == j.end() || !it->is_boolean()) {
        return default_val;
    }

    return it->get<bool>();
}

std::vector<std::string> get_string_array(const json& j, const std::string& key) {
    std::vector<std::string> result;

    if (!j.is_object()) {
        return result;
    }

    auto it = j.find(key);
    if (it == j.end() || !it->is_array()) {
        return result;
    }

    for (const auto& elem : *it) {
        if (elem.is_string()) {
            result.push_back(elem.get<std::string>());
        }
    }

    return result;
}

} // namespace json_utils
