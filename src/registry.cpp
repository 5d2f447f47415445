#include "registry.h"

#include <algorithm>
#include <cstdio>
#include <iostream>
#include <stdexcept>

// -----------------------------------------------------------------------
// Helpers
// -----------------------------------------------------------------------

static std::string strip_template(const std::string& id) {
    static const std::string suffix = "(kc)";
    size_t pos = id.find(suffix);
    if (pos == std::string::npos) return id;
    return id.substr(0, pos) + id.substr(pos + suffix.size());
}

static std::string user_id(int n) {
    char buf[16];
    std::snprintf(buf, sizeof(buf), "USER%02d", n);
    return buf;
}

// -----------------------------------------------------------------------
// Construction
// -----------------------------------------------------------------------

KeycodeRegistry::KeycodeRegistry(const KeyboardContext& context)
    : _table(make_keycode_table(context.protocol)), _context(context) {
    _context.protocol = _table.protocol();

    append_defs(catalog(CatalogGroup::Special), KeycodeCategory::Special);
    append_defs(catalog(CatalogGroup::Basic),   KeycodeCategory::Basic);
    append_defs(catalog(CatalogGroup::Shifted), KeycodeCategory::Shifted);
    append_defs(catalog(CatalogGroup::Iso),     KeycodeCategory::Iso);
    add_layers();
    append_defs(catalog(CatalogGroup::Boot),      KeycodeCategory::Boot);
    append_defs(catalog(CatalogGroup::Modifiers), KeycodeCategory::Modifiers);
    append_defs(catalog(CatalogGroup::Quantum),   KeycodeCategory::Quantum);
    append_defs(catalog(CatalogGroup::Backlight), KeycodeCategory::Backlight);
    append_defs(catalog(CatalogGroup::Media),     KeycodeCategory::Media);
    add_tap_dances();
    add_macros();
    add_user_keycodes();
    append_defs(catalog(CatalogGroup::Hidden), KeycodeCategory::Hidden);
    add_midi();

    for (auto& def : catalog(CatalogGroup::LayerModMods)) {
        auto kc = std::make_unique<Keycode>();
        kc->id       = def.id;
        kc->label    = def.label;
        kc->tooltip  = def.tooltip;
        kc->aliases  = {def.id};
        kc->category = KeycodeCategory::Modifiers;
        require_value(def.id);
        _lm_mods.push_back(std::move(kc));
    }

    apply_hidden();
    build_indexes();
}

void KeycodeRegistry::require_value(const std::string& id) const {
    if (!_table.contains(id))
        throw std::runtime_error("unable to resolve qmk_id=" + id);
}

Keycode& KeycodeRegistry::append(const std::string& id, const std::string& label,
                                 const std::string& tooltip, KeycodeCategory category) {
    // Every descriptor must have a value in the active table
    require_value(id);

    auto kc = std::make_unique<Keycode>();
    kc->id       = id;
    kc->label    = label;
    kc->tooltip  = tooltip;
    kc->masked   = _table.is_masked(id);
    kc->aliases  = {id};
    kc->category = category;
    _keycodes.push_back(std::move(kc));
    return *_keycodes.back();
}

void KeycodeRegistry::append_defs(const std::vector<KeycodeDef>& defs, KeycodeCategory category) {
    for (auto& def : defs) {
        Keycode& kc = append(def.id, def.label, def.tooltip, category);
        kc.aliases.insert(kc.aliases.end(), def.aliases.begin(), def.aliases.end());
        kc.recorder_aliases = def.recorder_aliases;
        kc.printable        = def.printable;
        kc.requires_feature = def.requires_feature;
    }
}

// -----------------------------------------------------------------------
// Families sized by the context
// -----------------------------------------------------------------------

void KeycodeRegistry::add_layers() {
    const int layers = _context.layers;

    Keycode& lock = append("QK_LAYER_LOCK", "Layer\nLock", "Locks the current layer",
                           KeycodeCategory::Layers);
    lock.aliases.push_back("QK_LLCK");
    lock.requires_feature = "layer_lock";

    if (layers >= 4) {
        append("FN_MO13", "Fn1\n(Fn3)", "", KeycodeCategory::Layers);
        append("FN_MO23", "Fn2\n(Fn3)", "", KeycodeCategory::Layers);
    }

    for (auto& family : layer_families()) {
        for (int layer = 0; layer < layers; ++layer) {
            std::string id = std::string(family.prefix) + "(" + std::to_string(layer) + ")";
            if (!_table.contains(id)) {
                std::cerr << "Warning: " << family.prefix << " keycodes stop at layer "
                          << layer << " in protocol " << protocol() << "\n";
                break;
            }
            Keycode& kc = append(id, id, family.tooltip, KeycodeCategory::Layers);
            if (family.requires_feature) kc.requires_feature = family.requires_feature;
        }
    }

    const int tap_layers = std::min(layers, 16);
    for (int x = 0; x < tap_layers; ++x) {
        std::string n = std::to_string(x);
        append("LT" + n + "(kc)", "LT " + n + "\n(kc)",
               "kc on tap, switch to layer " + n + " while held", KeycodeCategory::Layers);
    }
    for (int x = 0; x < tap_layers; ++x) {
        std::string n = std::to_string(x);
        append("LM" + n + "(kc)", "LM " + n + "\n(kc)",
               "Momentarily activates layer " + n + " with modifier", KeycodeCategory::Layers);
    }
}

void KeycodeRegistry::add_tap_dances() {
    for (int x = 0; x < _context.tap_dance_count; ++x) {
        std::string id = "TD(" + std::to_string(x) + ")";
        if (!_table.contains(id)) {
            std::cerr << "Warning: only " << x << " tap dance slots available\n";
            break;
        }
        append(id, id, "Tap dance keycode", KeycodeCategory::TapDance);
    }
}

void KeycodeRegistry::add_macros() {
    _macro_count = 0;
    for (int x = 0; x < _context.macro_count; ++x) {
        std::string id = "M" + std::to_string(x);
        if (!_table.contains(id)) {
            std::cerr << "Warning: protocol " << protocol() << " has room for " << x
                      << " macros, ignoring the remaining "
                      << (_context.macro_count - x) << "\n";
            break;
        }
        append(id, id, "", KeycodeCategory::Macro);
        ++_macro_count;
    }
    append_defs(catalog(CatalogGroup::MacroBase), KeycodeCategory::Macro);
}

void KeycodeRegistry::add_user_keycodes() {
    const auto& custom = _context.custom_keycodes;
    for (size_t x = 0; x < custom.size(); ++x) {
        std::string id = user_id(static_cast<int>(x));
        if (!_table.contains(id)) {
            std::cerr << "Warning: keyboard reports " << custom.size()
                      << " custom keycodes, only " << x << " are supported\n";
            break;
        }
        const CustomKeycode& c = custom[x];
        Keycode& kc = append(id, c.short_name.empty() ? id : c.short_name,
                             c.title.empty() ? id : c.title, KeycodeCategory::User);
        if (!c.name.empty() && c.name != id) kc.aliases.push_back(c.name);
    }
}

void KeycodeRegistry::add_midi() {
    if (_context.midi == "basic" || _context.midi == "advanced")
        append_defs(catalog(CatalogGroup::MidiBasic), KeycodeCategory::Midi);
    if (_context.midi == "advanced")
        append_defs(catalog(CatalogGroup::MidiAdvanced), KeycodeCategory::Midi);
}

// -----------------------------------------------------------------------
// Visibility and indexes
// -----------------------------------------------------------------------

void KeycodeRegistry::apply_hidden() {
    for (auto& kc : _keycodes) {
        const uint32_t value = _table.resolve(kc->id);
        kc->hidden = kc->category == KeycodeCategory::Hidden ||
                     !kc->is_supported_by(_context.supported_features) ||
                     value > KCODEC_MAX_DEVICE_VALUE;
    }
}

void KeycodeRegistry::build_indexes() {
    for (auto& p : _keycodes) {
        const Keycode* kc = p.get();

        _by_id.emplace(strip_template(kc->id), kc);
        _by_qmk_id.emplace(kc->id, kc);
        for (auto& alias : kc->aliases) _by_alias.emplace(alias, kc);

        for (auto& alias : kc->recorder_aliases) {
            if (!_by_recorder_alias.emplace(alias, kc).second)
                throw std::runtime_error("duplicate recorder alias '" + alias + "' on " + kc->id);
        }

        // MOD_* values overlap basic keys and stay out of the reverse index
        uint32_t value;
        if (value_of(*kc, value)) _by_value.emplace(value, kc);
    }

    for (auto& p : _lm_mods) _by_id.emplace(p->id, p.get());
}

std::vector<const Keycode*> KeycodeRegistry::category(KeycodeCategory c) const {
    std::vector<const Keycode*> out;
    for (auto& kc : _keycodes) {
        if (kc->category == c && !kc->hidden) out.push_back(kc.get());
    }
    return out;
}

template <typename Map, typename Key>
static const Keycode* find_in(const Map& map, const Key& key) {
    auto it = map.find(key);
    return it == map.end() ? nullptr : it->second;
}

const Keycode* KeycodeRegistry::find_id(const std::string& id) const {
    return find_in(_by_id, id);
}

const Keycode* KeycodeRegistry::find_qmk_id(const std::string& id) const {
    return find_in(_by_qmk_id, id);
}

const Keycode* KeycodeRegistry::find_alias(const std::string& alias) const {
    return find_in(_by_alias, alias);
}

const Keycode* KeycodeRegistry::find_recorder_alias(const std::string& alias) const {
    return find_in(_by_recorder_alias, alias);
}

const Keycode* KeycodeRegistry::find_value(uint32_t value) const {
    return find_in(_by_value, value);
}
