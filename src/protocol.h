#pragma once

#include <cstdint>
#include <map>
#include <set>
#include <string>
#include <vector>

// -----------------------------------------------------------------------
// Keycode protocol tables
//
// Vial firmware changed its keycode layout between protocol 5 (QMK
// before 0.19) and protocol 6.  Both layouts are described here as plain
// name -> value tables.  Composite keycodes are 16 bits wide on the
// wire:
//
//  Range (v6)      | Meaning
//  ----------------|---------------------------------------------------
//   0x0000-0x00FF  | basic HID usage
//   0x0100-0x1FFF  | modifier mask (bits 8-12) + basic key
//   0x2000-0x3FFF  | mod-tap: mods in bits 8-12, tap key in bits 0-7
//   0x4000-0x4FFF  | layer-tap: layer in bits 8-11
//   0x5000-0x51FF  | layer-mod: layer in bits 5-8, mods in bits 0-4
//   0x5200-0x52FF  | TO / MO / DF / TG / OSL / OSM / TT / PDF
//   0x5600-0x56FF  | swap hands
//   0x5700-0x57FF  | tap dance
//   0x7000-0x7FFF  | quantum, lighting, audio, MIDI, macros, user
//
// Protocol 5 has no codes for several newer features.  Those names get
// placeholder values above 0xFFFF so they never collide with a value a
// device can store.
// -----------------------------------------------------------------------

static constexpr int KCODEC_PROTOCOL_V5 = 5;
static constexpr int KCODEC_PROTOCOL_V6 = 6;

// Values above this never leave the host.
static constexpr uint32_t KCODEC_MAX_DEVICE_VALUE = 0xFFFF;

// Five-bit modifier set used by OSM(), MT() and LM().  Bit 4 switches the
// low four bits to the right-hand modifiers.
static constexpr uint8_t MOD_BIT_LCTL = 0x01;
static constexpr uint8_t MOD_BIT_LSFT = 0x02;
static constexpr uint8_t MOD_BIT_LALT = 0x04;
static constexpr uint8_t MOD_BIT_LGUI = 0x08;
static constexpr uint8_t MOD_BIT_RIGHT = 0x10;

// A modifier combination with its mask wrapper ("C_S" -> C_S(kc)), its
// mod-tap wrapper ("C_S_T") and its one-shot spelling
// ("MOD_LCTL|MOD_LSFT").
struct ModCombo {
    const char* wrap;
    const char* tap;
    const char* osm;
    uint8_t     mods;
};

const std::vector<ModCombo>& mod_combos();

// Layer-mod bit layout of the active protocol.
struct LayerModLayout {
    uint32_t base;
    uint32_t shift;     // position of the 4-bit layer field
    uint32_t mod_mask;  // 0x0f in v5, 0x1f in v6
    uint32_t max_code;  // base | (0x0f << shift) | mod_mask
};

class KeycodeTable {
public:
    int protocol() const { return _protocol; }

    // Returns false if the table has no such name.
    bool lookup(const std::string& name, uint32_t& out) const;

    // Like lookup() but throws std::runtime_error for unknown names.
    uint32_t resolve(const std::string& name) const;

    bool contains(const std::string& name) const { return _values.count(name) != 0; }

    // name is the full template id, e.g. "LSFT(kc)"
    bool is_masked(const std::string& name) const { return _masked.count(name) != 0; }

    // Wrapper name without the "(kc)" suffix, e.g. "LSFT"
    bool is_masked_wrapper(const std::string& wrapper) const {
        return _masked.count(wrapper + "(kc)") != 0;
    }

    // True if value is the outer part of a masked template.
    bool is_masked_value(uint32_t value) const { return _masked_values.count(value) != 0; }

    LayerModLayout layer_mod_layout() const;

    const std::map<std::string, uint32_t>& values() const { return _values; }
    const std::set<std::string>&           masked() const { return _masked; }

private:
    friend KeycodeTable make_keycode_table(int protocol);

    void add(const std::string& name, uint32_t value);
    void add_masked(const std::string& name, uint32_t value);

    int                             _protocol = KCODEC_PROTOCOL_V5;
    std::map<std::string, uint32_t> _values;
    std::set<std::string>           _masked;
    std::set<uint32_t>              _masked_values;
};

// Build the table for a protocol revision.  Anything other than 6 selects
// the protocol 5 layout.  Each call returns a fresh table.
KeycodeTable make_keycode_table(int protocol);
