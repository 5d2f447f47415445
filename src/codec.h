#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include "keycode.h"
#include "registry.h"

// -----------------------------------------------------------------------
// Keycode codec
//
// Converts between 16-bit firmware keycodes and their text form for the
// active protocol and keyboard.  Starts out with protocol 5 and a default
// context.  Descriptor pointers handed out are valid until the next
// rebuild (set_protocol() or one of the recreate_* calls).
// -----------------------------------------------------------------------
class Keycodes {
public:
    Keycodes();

    // --- Protocol and rebuilds ------------------------------------------

    void set_protocol(int protocol);
    int  protocol() const { return _registry.protocol(); }

    // Rebuild with the default context under the active protocol.
    void recreate_keycodes();

    // Rebuild from a keyboard context and adopt its protocol.
    void recreate_keyboard_keycodes(const KeyboardContext& context);

    // Incremented on every rebuild.
    unsigned revision() const { return _revision; }

    const KeycodeRegistry& registry() const { return _registry; }

    // --- Conversion -------------------------------------------------------

    // Never fails: unknown values come back as "0x...." hex text.
    std::string serialize(uint32_t value) const;

    // Unresolvable text returns 0 (KC_NO).
    uint32_t deserialize(const std::string& text) const;
    uint32_t deserialize(uint32_t value) const { return value; }

    std::string normalize(const std::string& text) const;

    // Like serialize() but emits hex for keycodes that QMK's keymap.c
    // cannot compile.
    std::string serialize_for_c_export(uint32_t value) const;

    // --- Lookups ------------------------------------------------------------

    const Keycode* find_keycode(const std::string& id) const;
    const Keycode* find_by_qmk_id(const std::string& id) const;
    const Keycode* find_by_recorder_alias(const std::string& alias) const;
    const Keycode* find_outer_keycode(const std::string& id) const;
    const Keycode* find_inner_keycode(const std::string& id) const;

    std::string                keycode_label(const std::string& id) const;
    std::optional<std::string> keycode_tooltip(const std::string& id) const;
    std::string                code_to_label(uint32_t value) const;

    // --- Predicates and helpers ---------------------------------------------

    bool is_mask(const std::string& id) const;
    bool is_basic(const std::string& id) const;

    bool is_tap_dance_keycode(uint32_t value) const;
    int  tap_dance_index(uint32_t value) const;  // -1 if not a tap dance

    bool is_macro_keycode(uint32_t value) const;
    int  macro_index(uint32_t value) const;      // -1 if not a macro slot

    bool is_reset_keycode(uint32_t value) const;

    // Layer-mod, LM(layer, mods)
    bool     is_lm_keycode(uint32_t value) const;
    int      lm_layer(uint32_t value) const;
    uint32_t lm_mod(uint32_t value) const;
    uint32_t build_lm_keycode(int layer, uint32_t mod) const;
    std::vector<const Keycode*> available_lm_mods() const;

    // Modifier mask, e.g. LCTL(KC_A)
    bool     is_mod_mask_keycode(uint32_t value) const;
    bool     is_modifiable_keycode(uint32_t value) const;
    uint32_t extract_mod_mask(uint32_t value) const;
    uint32_t extract_basic_key(uint32_t value) const;
    uint32_t build_mod_mask_keycode(uint32_t mod_mask, uint32_t basic_key) const;

    // Mod-tap, e.g. LCTL_T(KC_A)
    bool     is_mod_tap_keycode(uint32_t value) const;
    uint32_t build_mod_tap_keycode(uint32_t mod_mask, uint32_t basic_key) const;

    // Layer-tap, LT(layer, kc)
    bool     is_lt_keycode(uint32_t value) const;
    int      lt_layer(uint32_t value) const;
    uint32_t build_lt_keycode(int layer, uint32_t basic_key) const;

    // Swap-hands tap, SH_T(kc)
    bool     is_sht_keycode(uint32_t value) const;
    uint32_t build_sht_keycode(uint32_t basic_key) const;

private:
    void rebuild(const KeyboardContext& context);

    bool serialize_lm(uint32_t value, std::string& out) const;

    KeycodeRegistry _registry;
    unsigned        _revision = 0;
};
