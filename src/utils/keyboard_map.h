/*
 * Key Name to QEMU QKeyCode Conversion
 *
 * Converts human-readable key names ("enter", "pagedown", "F5", ",")
 * into the qcode strings accepted by QMP send-key.
 */

#ifndef KEYBOARD_MAP_H
#define KEYBOARD_MAP_H

#include <string>
#include <vector>

namespace keyboard_map {

/**
 * Convert a key name to a QEMU qcode
 *
 * Lookup is case-insensitive. Named keys come from a fixed table;
 * single letters and digits map to themselves in lower case and US
 * punctuation maps to its qcode name. Anything else is returned
 * lower-cased unchanged: unknown names are passed through rather than
 * rejected, and QEMU reports them if they are invalid.
 *
 * @param name Key name or single character
 * @return qcode string
 */
std::string to_qcode(const std::string& name);

/**
 * Check whether a character needs Shift on a US keyboard
 *
 * @param c Character to type
 * @param base Receives the unshifted key name ('A' -> "a", '!' -> "1")
 * @return true if c is an uppercase letter or a shifted symbol
 */
bool needs_shift(char c, std::string& base);

/**
 * Split a chord such as "ctrl+alt+delete" into key names
 * Whitespace around names is trimmed and empty names are dropped.
 */
std::vector<std::string> split_combo(const std::string& combo);

} // namespace keyboard_map

#endif // KEYBOARD_MAP_H
