/*
 * JSON Utilities
 *
 * Thin helpers over nlohmann/json for reading loosely typed objects:
 * QMP replies, tool-style input commands and the vmdeck config file.
 */

#ifndef JSON_UTILS_H
#define JSON_UTILS_H

#include <nlohmann/json.hpp>
#include <string>
#include <vector>

namespace json_utils {

using json = nlohmann::json;

/**
 * Parse one JSON document
 * @throws nlohmann::json::parse_error on invalid JSON
 */
json parse(const std::string& str);

/**
 * Parse JSON file
 * @throws std::runtime_error if the file can't be opened, parse_error if invalid
 */
json parse_file(const std::string& path);

/**
 * Get string value from JSON object with default
 * Numbers are not converted; a non-string value yields the default.
 */
std::string get_string(const json& j, const std::string& key,
                       const std::string& default_val = "");

/**
 * Get integer value from JSON object with default
 * Accepts integers, integral floats and decimal strings ("120"), since
 * tool-style commands carry every parameter as a string.
 * @param ok Set to false when the key exists but can't be read as an integer
 */
int get_int(const json& j, const std::string& key, int default_val = 0, bool* ok = nullptr);

/**
 * Get boolean value from JSON object with default
 */
bool get_bool(const json& j, const std::string& key, bool default_val = false);

/**
 * Get string array from JSON object
 * @return Strings in order, non-string elements skipped; empty if missing
 */
std::vector<std::string> get_string_array(const json& j, const std::string& key);

} // namespace json_utils

#endif // JSON_UTILS_H
