#pragma once

#include <string>
#include <vector>

// -----------------------------------------------------------------------
// Static keycode catalog
//
// Definitions carry only presentation data and aliases.  Numeric values
// come from the protocol table (protocol.h) so the same catalog serves
// both firmware revisions.  An id ending in "(kc)" is a wrapper template.
// -----------------------------------------------------------------------
struct KeycodeDef {
    std::string id;
    std::string label;
    std::string tooltip;
    std::vector<std::string> aliases;           // in addition to id
    std::vector<std::string> recorder_aliases;  // keystroke recorder names
    std::string printable;
    std::string requires_feature;
};

enum class CatalogGroup {
    Special,
    Basic,
    Shifted,
    Iso,
    Boot,
    Modifiers,
    Quantum,
    Backlight,
    Media,
    MacroBase,
    MidiBasic,
    MidiAdvanced,
    Hidden,       // TD(0)..TD(255), resolvable but never offered
    LayerModMods, // MOD_* entries shown inside LM keycodes
};

const std::vector<KeycodeDef>& catalog(CatalogGroup group);

// Per-layer families (MO, DF, ...).  One keycode per layer is generated
// from each row when the registry is rebuilt.
struct LayerFamilyDef {
    const char* prefix;
    const char* tooltip;
    const char* requires_feature;  // nullptr = always supported
};

const std::vector<LayerFamilyDef>& layer_families();

// Shifted symbols that serialize as LSFT(<base>) rather than by name.
struct ShiftedSymbol {
    const char* id;    // "KC_EXLM"
    const char* base;  // "KC_1"
};

const std::vector<ShiftedSymbol>& shifted_symbols();
