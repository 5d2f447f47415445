#include "codec.h"
#include "expression.h"

#include <cstdio>
#include <regex>
#include <set>

// -----------------------------------------------------------------------
// Helpers
// -----------------------------------------------------------------------

// Lower case, at least four digits: 0x0004, 0xffff, 0x99100
static std::string to_hex(uint32_t value) {
    char buf[16];
    std::snprintf(buf, sizeof(buf), "0x%04x", value);
    return buf;
}

// "LSFT(kc)" + "KC_1" -> "LSFT(KC_1)"
static std::string wrap_inner(const std::string& templ, const std::string& inner) {
    MaskedId m = parse_masked_id(templ);
    m.inner = inner;
    return render_masked_id(m);
}

// Wrappers that only exist in the desktop keycode set; keymap.c has no
// macro for them.
static const std::set<std::string>& c_export_hex_masks() {
    static const std::set<std::string> masks = {
        "LCSG(kc)", "LSAG(kc)",
        "RCS(kc)", "RCA(kc)", "RSA(kc)", "RMEH(kc)", "RSG(kc)",
        "RCSG(kc)", "RAG(kc)", "RCAG(kc)", "RSAG(kc)", "RHYPR(kc)",
        "LCSG_T(kc)", "LSAG_T(kc)",
        "RCS_T(kc)", "RCA_T(kc)", "RSA_T(kc)", "RAG_T(kc)", "RSG_T(kc)",
        "RCSG_T(kc)", "RSAG_T(kc)", "RMEH_T(kc)", "RALL_T(kc)",
        "SH_T(kc)",
    };
    return masks;
}

static bool c_export_hex_prefix(const std::string& id) {
    static const char* prefixes[] = {"SH_", "SQ_", "LM_", "JS_", "PB_", "QK_KEY_OVERRIDE_"};
    for (const char* p : prefixes) {
        if (id.compare(0, std::char_traits<char>::length(p), p) == 0) return true;
    }
    return false;
}

// -----------------------------------------------------------------------
// Protocol and rebuilds
// -----------------------------------------------------------------------

Keycodes::Keycodes() : _registry(KeyboardContext{}) {}

void Keycodes::rebuild(const KeyboardContext& context) {
    // Build completely before replacing the active registry
    KeycodeRegistry fresh(context);
    _registry = std::move(fresh);
    ++_revision;
}

void Keycodes::set_protocol(int protocol) {
    KeyboardContext ctx = _registry.context();
    ctx.protocol = protocol;
    rebuild(ctx);
}

void Keycodes::recreate_keycodes() {
    KeyboardContext ctx;
    ctx.protocol = protocol();
    rebuild(ctx);
}

void Keycodes::recreate_keyboard_keycodes(const KeyboardContext& context) {
    rebuild(context);
}

// -----------------------------------------------------------------------
// Serialize / deserialize
// -----------------------------------------------------------------------

bool Keycodes::serialize_lm(uint32_t value, std::string& out) const {
    if (!is_lm_keycode(value)) return false;

    const uint32_t mod = lm_mod(value);
    std::string mod_name;
    for (const Keycode* kc : available_lm_mods()) {
        uint32_t v;
        if (_registry.value_of(*kc, v) && v == mod) {
            mod_name = kc->id;
            break;
        }
    }
    if (mod_name.empty()) {
        char buf[16];
        std::snprintf(buf, sizeof(buf), "0x%x", mod);
        mod_name = buf;
    }
    out = "LM" + std::to_string(lm_layer(value)) + "(" + mod_name + ")";
    return true;
}

std::string Keycodes::serialize(uint32_t value) const {
    std::string lm;
    if (serialize_lm(value, lm)) return lm;

    const KeycodeTable& t = _registry.table();
    const uint32_t outer_value = value & ~0xFFu;
    const uint32_t inner_value = value & 0xFFu;

    // SH_T only covers tap keys below 0xF0, the rest are swap-hands actions
    bool masked = t.is_masked_value(outer_value);
    if (masked && outer_value == t.resolve("SH_T(kc)") && inner_value > 0xEF) masked = false;

    if (masked) {
        const Keycode* outer = _registry.find_value(outer_value);
        const Keycode* inner = _registry.find_value(inner_value);
        if (outer && outer->masked && inner) return wrap_inner(outer->id, inner->id);

        if (const Keycode* kc = _registry.find_value(value)) return kc->id;

        if (outer && outer->masked) {
            char buf[8];
            std::snprintf(buf, sizeof(buf), "0x%02x", inner_value);
            return wrap_inner(outer->id, buf);
        }
    } else if (const Keycode* kc = _registry.find_value(value)) {
        return kc->id;
    }
    return to_hex(value);
}

uint32_t Keycodes::deserialize(const std::string& text) const {
    uint32_t value;
    if (parse_literal(text, value)) return value;

    if (const Keycode* kc = _registry.find_qmk_id(text)) {
        if (_registry.value_of(*kc, value)) return value;
    }
    if (const Keycode* kc = _registry.find_alias(text)) {
        if (_registry.value_of(*kc, value)) return value;
    }
    if (evaluate(text, _registry, value)) return value;
    return 0;
}

std::string Keycodes::normalize(const std::string& text) const {
    return serialize(deserialize(text));
}

std::string Keycodes::serialize_for_c_export(uint32_t value) const {
    if (is_lm_keycode(value)) return to_hex(value);

    const KeycodeTable& t = _registry.table();
    const uint32_t outer_value = value & ~0xFFu;
    if (t.is_masked_value(outer_value)) {
        const Keycode* outer = _registry.find_value(outer_value);
        if (outer && c_export_hex_masks().count(outer->id)) return to_hex(value);
    } else {
        const Keycode* kc = _registry.find_value(value);
        if (kc && c_export_hex_prefix(kc->id)) return to_hex(value);
    }
    return serialize(value);
}

// -----------------------------------------------------------------------
// Lookups
// -----------------------------------------------------------------------

const Keycode* Keycodes::find_keycode(const std::string& id) const {
    return _registry.find_id(id == "kc" ? "KC_NO" : id);
}

const Keycode* Keycodes::find_by_qmk_id(const std::string& id) const {
    return _registry.find_qmk_id(id);
}

const Keycode* Keycodes::find_by_recorder_alias(const std::string& alias) const {
    return _registry.find_recorder_alias(alias);
}

const Keycode* Keycodes::find_outer_keycode(const std::string& id) const {
    if (!is_mask(id)) return find_keycode(id);
    return find_keycode(parse_masked_id(id).wrapper);
}

const Keycode* Keycodes::find_inner_keycode(const std::string& id) const {
    if (!is_mask(id)) return find_keycode(id);
    return find_keycode(parse_masked_id(id).inner);
}

std::string Keycodes::keycode_label(const std::string& id) const {
    const Keycode* kc = find_outer_keycode(id);
    return kc ? kc->label : id;
}

std::optional<std::string> Keycodes::keycode_tooltip(const std::string& id) const {
    const Keycode* kc = find_outer_keycode(id);
    if (!kc) return std::nullopt;
    if (kc->tooltip.empty()) return kc->id;
    return kc->id + ": " + kc->tooltip;
}

std::string Keycodes::code_to_label(uint32_t value) const {
    static const std::regex re_prefix("KC_|QK_|RGB_|BL_");

    const std::string id = serialize(value);
    if (is_mask(id)) return std::regex_replace(id, re_prefix, "");

    std::string label = keycode_label(id);
    for (auto& c : label) {
        if (c == '\n') c = ' ';
    }
    return label;
}

// -----------------------------------------------------------------------
// Predicates
// -----------------------------------------------------------------------

bool Keycodes::is_mask(const std::string& id) const {
    size_t paren = id.find('(');
    if (paren == std::string::npos) return false;
    return _registry.table().is_masked_wrapper(id.substr(0, paren));
}

bool Keycodes::is_basic(const std::string& id) const {
    return deserialize(id) < 0xFF;
}

bool Keycodes::is_tap_dance_keycode(uint32_t value) const {
    return (value & 0xFF00) == _registry.table().resolve("QK_TAP_DANCE");
}

int Keycodes::tap_dance_index(uint32_t value) const {
    return is_tap_dance_keycode(value) ? static_cast<int>(value & 0xFF) : -1;
}

bool Keycodes::is_macro_keycode(uint32_t value) const {
    return macro_index(value) >= 0;
}

int Keycodes::macro_index(uint32_t value) const {
    const uint32_t base = _registry.table().resolve("QK_MACRO");
    if (value < base) return -1;
    const uint32_t index = value - base;
    if (index >= static_cast<uint32_t>(_registry.macro_count())) return -1;
    return static_cast<int>(index);
}

bool Keycodes::is_reset_keycode(uint32_t value) const {
    return serialize(value) == "QK_BOOT";
}

// --- layer-mod -------------------------------------------------------------

bool Keycodes::is_lm_keycode(uint32_t value) const {
    const LayerModLayout lm = _registry.table().layer_mod_layout();
    return value >= lm.base && value <= lm.max_code;
}

int Keycodes::lm_layer(uint32_t value) const {
    const LayerModLayout lm = _registry.table().layer_mod_layout();
    return static_cast<int>((value >> lm.shift) & 0x0F);
}

uint32_t Keycodes::lm_mod(uint32_t value) const {
    return value & _registry.table().layer_mod_layout().mod_mask;
}

uint32_t Keycodes::build_lm_keycode(int layer, uint32_t mod) const {
    const LayerModLayout lm = _registry.table().layer_mod_layout();
    return lm.base | ((static_cast<uint32_t>(layer) & 0x0F) << lm.shift) | (mod & lm.mod_mask);
}

std::vector<const Keycode*> Keycodes::available_lm_mods() const {
    const uint32_t mask = _registry.table().layer_mod_layout().mod_mask;
    std::vector<const Keycode*> out;
    for (auto& kc : _registry.lm_mods()) {
        uint32_t v;
        if (_registry.value_of(*kc, v) && (v & ~mask) == 0) out.push_back(kc.get());
    }
    return out;
}

// --- modifier mask ---------------------------------------------------------

bool Keycodes::is_mod_mask_keycode(uint32_t value) const {
    return value >= 0x0100 && value <= 0x1FFF;
}

bool Keycodes::is_modifiable_keycode(uint32_t value) const {
    return value <= 0x1FFF;
}

uint32_t Keycodes::extract_mod_mask(uint32_t value) const {
    return (value >> 8) & 0x1F;
}

uint32_t Keycodes::extract_basic_key(uint32_t value) const {
    return value & 0xFF;
}

uint32_t Keycodes::build_mod_mask_keycode(uint32_t mod_mask, uint32_t basic_key) const {
    if (mod_mask == 0) return basic_key & 0xFF;
    return ((mod_mask & 0x1F) << 8) | (basic_key & 0xFF);
}

// --- mod-tap ---------------------------------------------------------------

bool Keycodes::is_mod_tap_keycode(uint32_t value) const {
    const uint32_t base = _registry.table().resolve("QK_MOD_TAP");
    return value >= base && value < base + 0x2000;
}

uint32_t Keycodes::build_mod_tap_keycode(uint32_t mod_mask, uint32_t basic_key) const {
    if (mod_mask == 0) return basic_key & 0xFF;
    return _registry.table().resolve("QK_MOD_TAP") | ((mod_mask & 0x1F) << 8) | (basic_key & 0xFF);
}

// --- layer-tap -------------------------------------------------------------

bool Keycodes::is_lt_keycode(uint32_t value) const {
    const uint32_t base = _registry.table().resolve("QK_LAYER_TAP");
    return value >= base && value < base + 0x1000;
}

int Keycodes::lt_layer(uint32_t value) const {
    return static_cast<int>((value >> 8) & 0x0F);
}

uint32_t Keycodes::build_lt_keycode(int layer, uint32_t basic_key) const {
    return _registry.table().resolve("QK_LAYER_TAP") |
           ((static_cast<uint32_t>(layer) & 0x0F) << 8) | (basic_key & 0xFF);
}

// --- swap hands ------------------------------------------------------------

bool Keycodes::is_sht_keycode(uint32_t value) const {
    const uint32_t base = _registry.table().resolve("SH_T(kc)");
    return value >= base && value <= base + 0xEF;
}

uint32_t Keycodes::build_sht_keycode(uint32_t basic_key) const {
    return _registry.table().resolve("SH_T(kc)") | (basic_key & 0xFF);
}
