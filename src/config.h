#pragma once

#include <map>
#include <string>

#include "keycode.h"

// Parsed representation of a keyboard context INI file:
//
//   [keyboard]           protocol, layers, macros, tap_dances, midi
//   [features]           feature = true/false
//   [custom_keycodes]    N = NAME, Title, Short
//
// Custom keycodes are kept by index until validated.
struct ContextConfig {
    KeyboardContext              context;
    std::map<int, CustomKeycode> custom_keycodes;
};

// Parse an INI context file from disk.
// Throws std::runtime_error ("path:line: ...") if the file cannot be read
// or has syntax errors.
ContextConfig parse_context_file(const std::string& path);

// Throws std::runtime_error if any value is out of range.
void validate_context(const ContextConfig& cfg);

// Validate and flatten into the context the registry is built from.
KeyboardContext to_keyboard_context(const ContextConfig& cfg);

// Convenience wrapper: parse, validate and flatten.
KeyboardContext load_context_file(const std::string& path);

// "true", "yes", "on", "1" / "false", "no", "off", "0".
// Returns false for anything else.
bool parse_flag(const std::string& value, bool& out);
