#pragma once

#include <cstdint>
#include <set>
#include <string>
#include <vector>

// -----------------------------------------------------------------------
// Keycode categories
//
// Order matches the order in which the registry lays descriptors out.
// -----------------------------------------------------------------------
enum class KeycodeCategory : uint8_t {
    Special,
    Basic,
    Shifted,
    Iso,
    Layers,
    Boot,
    Modifiers,
    Quantum,
    Backlight,
    Media,
    TapDance,
    Macro,
    User,
    Hidden,
    Midi,
};

// Lower-case name used by the CLI ("tap_dance", "midi", ...)
const char* category_name(KeycodeCategory c);

// Returns false if the name is not a known category.
bool parse_category(const std::string& name, KeycodeCategory& out);

// All categories in layout order.
const std::vector<KeycodeCategory>& all_categories();

// -----------------------------------------------------------------------
// Keycode descriptor
// -----------------------------------------------------------------------
struct Keycode {
    std::string id;                    // canonical text, e.g. "KC_A", "LT2(kc)"
    std::string label;                 // may contain '\n'
    std::string tooltip;
    bool        masked    = false;     // wrapper consuming an inner keycode
    std::string printable;             // single character, may be empty
    std::vector<std::string> aliases;  // aliases[0] == id
    std::vector<std::string> recorder_aliases;
    KeycodeCategory category = KeycodeCategory::Special;
    bool        hidden    = false;
    std::string requires_feature;      // empty = always supported

    bool is_supported_by(const std::set<std::string>& features) const;
};

// -----------------------------------------------------------------------
// Device capability context
//
// Reported by the keyboard during the handshake, or loaded from an INI
// file (see config.h).
// -----------------------------------------------------------------------
struct CustomKeycode {
    std::string name;        // alias usable in expressions
    std::string title;       // tooltip
    std::string short_name;  // label
};

struct KeyboardContext {
    int protocol        = 5;   // 5 or 6, anything else is treated as 5
    int layers          = 4;
    int macro_count     = 0;
    int tap_dance_count = 0;
    std::vector<CustomKeycode> custom_keycodes;
    std::string midi;          // "", "basic" or "advanced"
    std::set<std::string> supported_features;
};

// -----------------------------------------------------------------------
// Masked keycode text
//
// "LSFT(KC_A)" splits into wrapper "LSFT" and inner "KC_A".  Text
// without a trailing parenthesised argument has an empty inner part.
// -----------------------------------------------------------------------
struct MaskedId {
    std::string wrapper;
    std::string inner;
};

MaskedId parse_masked_id(const std::string& text);

// Joins the parts back, "LT2" + "KC_A" -> "LT2(KC_A)".
std::string render_masked_id(const MaskedId& m);
