#include "protocol.h"
#include "data.h"

#include <cstdio>
#include <stdexcept>
#include <utility>

// -----------------------------------------------------------------------
// Table building blocks
// -----------------------------------------------------------------------

struct NamedValue {
    const char* name;
    uint32_t    value;
};

// Consecutive names starting at an address.  nullptr skips a slot.
struct AddressRun {
    uint32_t                 start;
    std::vector<const char*> names;
};

enum class Packing : uint8_t {
    Add,       // base + n
    ToLayer,   // base | (ON_PRESS << 4) | n
    LayerTap,  // base | (n << 8)
    LayerMod,  // base | (n << QMK_LM_SHIFT)
};

// One generated family such as MO(0)..MO(31).  The format takes the
// member index as its only argument.
struct FamilyDescriptor {
    const char* format;
    const char* base;
    int         v5_count;
    int         v6_count;
    Packing     packing;
    bool        masked;
};

// -----------------------------------------------------------------------
// Shared by both protocols
// -----------------------------------------------------------------------

static const NamedValue shared_values[] = {
    {"QK_LCTL", 0x0100}, {"QK_LSFT", 0x0200}, {"QK_LALT", 0x0400}, {"QK_LGUI", 0x0800},
    {"QK_RCTL", 0x1100}, {"QK_RSFT", 0x1200}, {"QK_RALT", 0x1400}, {"QK_RGUI", 0x1800},

    {"MOD_LCTL", 0x01}, {"MOD_LSFT", 0x02}, {"MOD_LALT", 0x04}, {"MOD_LGUI", 0x08},
    {"MOD_RCTL", 0x11}, {"MOD_RSFT", 0x12}, {"MOD_RALT", 0x14}, {"MOD_RGUI", 0x18},
    {"MOD_MEH",  0x07}, {"MOD_HYPR", 0x0F},
};

// HID keyboard/keypad usage page
static const std::vector<AddressRun> hid_runs = {
    {0x00, {"KC_NO", "KC_TRNS"}},
    {0x04, {
        "KC_A", "KC_B", "KC_C", "KC_D", "KC_E", "KC_F", "KC_G", "KC_H", "KC_I",
        "KC_J", "KC_K", "KC_L", "KC_M", "KC_N", "KC_O", "KC_P", "KC_Q", "KC_R",
        "KC_S", "KC_T", "KC_U", "KC_V", "KC_W", "KC_X", "KC_Y", "KC_Z",
        "KC_1", "KC_2", "KC_3", "KC_4", "KC_5", "KC_6", "KC_7", "KC_8", "KC_9", "KC_0",
        "KC_ENTER", "KC_ESCAPE", "KC_BSPACE", "KC_TAB", "KC_SPACE",
        "KC_MINUS", "KC_EQUAL", "KC_LBRACKET", "KC_RBRACKET", "KC_BSLASH",
        "KC_NONUS_HASH", "KC_SCOLON", "KC_QUOTE", "KC_GRAVE", "KC_COMMA",
        "KC_DOT", "KC_SLASH", "KC_CAPSLOCK",
        "KC_F1", "KC_F2", "KC_F3", "KC_F4", "KC_F5", "KC_F6",
        "KC_F7", "KC_F8", "KC_F9", "KC_F10", "KC_F11", "KC_F12",
        "KC_PSCREEN", "KC_SCROLLLOCK", "KC_PAUSE", "KC_INSERT", "KC_HOME",
        "KC_PGUP", "KC_DELETE", "KC_END", "KC_PGDOWN",
        "KC_RIGHT", "KC_LEFT", "KC_DOWN", "KC_UP", "KC_NUMLOCK",
        "KC_KP_SLASH", "KC_KP_ASTERISK", "KC_KP_MINUS", "KC_KP_PLUS", "KC_KP_ENTER",
        "KC_KP_1", "KC_KP_2", "KC_KP_3", "KC_KP_4", "KC_KP_5",
        "KC_KP_6", "KC_KP_7", "KC_KP_8", "KC_KP_9", "KC_KP_0", "KC_KP_DOT",
        "KC_NONUS_BSLASH", "KC_APPLICATION", "KC_POWER", "KC_KP_EQUAL",
        "KC_F13", "KC_F14", "KC_F15", "KC_F16", "KC_F17", "KC_F18",
        "KC_F19", "KC_F20", "KC_F21", "KC_F22", "KC_F23", "KC_F24",
        "KC_EXEC", "KC_HELP", "KC_MENU", "KC_SLCT", "KC_STOP", "KC_AGIN",
        "KC_UNDO", "KC_CUT", "KC_COPY", "KC_PSTE", "KC_FIND",
        "KC__MUTE", "KC__VOLUP", "KC__VOLDOWN",
        "KC_LCAP", "KC_LNUM", "KC_LSCR",
        "KC_KP_COMMA", "KC_KP_EQUAL_AS400",
        "KC_RO", "KC_KANA", "KC_JYEN", "KC_HENK", "KC_MHEN",
        "KC_INT6", "KC_INT7", "KC_INT8", "KC_INT9",
        "KC_LANG1", "KC_LANG2",
    }},
    // consumer and system controls
    {0xA5, {
        "KC_PWR", "KC_SLEP", "KC_WAKE",
        "KC_MUTE", "KC_VOLU", "KC_VOLD",
        "KC_MNXT", "KC_MPRV", "KC_MSTP", "KC_MPLY", "KC_MSEL", "KC_EJCT",
        "KC_MAIL", "KC_CALC", "KC_MYCM",
        "KC_WSCH", "KC_WHOM", "KC_WBAK", "KC_WFWD", "KC_WSTP", "KC_WREF", "KC_WFAV",
        "KC_MFFD", "KC_MRWD", "KC_BRIU", "KC_BRID",
    }},
    {0xE0, {
        "KC_LCTRL", "KC_LSHIFT", "KC_LALT", "KC_LGUI",
        "KC_RCTRL", "KC_RSHIFT", "KC_RALT", "KC_RGUI",
    }},
};

// MIDI block, identical in shape in both protocols.  Returned names are
// laid out from MI_ON onwards.
static std::vector<std::string> midi_sequence() {
    static const char* notes[] = {"C", "Cs", "D", "Ds", "E", "F", "Fs", "G", "Gs", "A", "As", "B"};

    std::vector<std::string> seq = {"MI_ON", "MI_OFF", "MI_TOG"};
    for (auto n : notes) seq.push_back(std::string("MI_") + n);
    for (int oct = 1; oct <= 5; ++oct)
        for (auto n : notes) seq.push_back(std::string("MI_") + n + "_" + std::to_string(oct));
    for (int oct = -2; oct <= 7; ++oct)
        seq.push_back("MI_OCT_" + (oct < 0 ? "N" + std::to_string(-oct) : std::to_string(oct)));
    seq.push_back("MI_OCTD");
    seq.push_back("MI_OCTU");
    for (int n = -6; n <= 6; ++n)
        seq.push_back("MI_TRNS_" + (n < 0 ? "N" + std::to_string(-n) : std::to_string(n)));
    seq.push_back("MI_TRNSD");
    seq.push_back("MI_TRNSU");
    for (int v = 0; v <= 10; ++v) seq.push_back("MI_VEL_" + std::to_string(v));
    seq.push_back("MI_VELD");
    seq.push_back("MI_VELU");
    for (int ch = 1; ch <= 16; ++ch) seq.push_back("MI_CH" + std::to_string(ch));
    for (auto n : {"MI_CHD", "MI_CHU", "MI_ALLOFF", "MI_SUS", "MI_PORT", "MI_SOST",
                   "MI_SOFT", "MI_LEG", "MI_MOD", "MI_MODSD", "MI_MODSU", "MI_BENDD", "MI_BENDU"})
        seq.push_back(n);
    return seq;
}

// Protocol 5 macros past M109 share values with the vial user range (0x5F80)
// and the mod-tap range; the registry reverse index keeps the first one laid out.
static const FamilyDescriptor families[] = {
    {"MO(%d)",   "QK_MOMENTARY",            32,  32,  Packing::Add,      false},
    {"DF(%d)",   "QK_DEF_LAYER",            32,  32,  Packing::Add,      false},
    {"PDF(%d)",  "QK_PERSISTENT_DEF_LAYER", 32,  32,  Packing::Add,      false},
    {"TG(%d)",   "QK_TOGGLE_LAYER",         32,  32,  Packing::Add,      false},
    {"TT(%d)",   "QK_LAYER_TAP_TOGGLE",     32,  32,  Packing::Add,      false},
    {"OSL(%d)",  "QK_ONE_SHOT_LAYER",       32,  32,  Packing::Add,      false},
    {"TO(%d)",   "QK_TO",                   32,  32,  Packing::ToLayer,  false},
    {"TD(%d)",   "QK_TAP_DANCE",            256, 256, Packing::Add,      false},
    {"M%d",      "QK_MACRO",                256, 256, Packing::Add,      false},
    {"USER%02d", "QK_KB",                   64,  64,  Packing::Add,      false},
    {"JS_%d",    "QK_JOYSTICK",             32,  32,  Packing::Add,      false},
    {"LT%d(kc)", "QK_LAYER_TAP",            16,  16,  Packing::LayerTap, true },
    {"LM%d(kc)", "QK_LAYER_MOD",            16,  16,  Packing::LayerMod, true },
};

// -----------------------------------------------------------------------
// Protocol 5 (vial-qmk before the QMK 0.19 keycode overhaul)
// -----------------------------------------------------------------------

static const std::vector<NamedValue> v5_values = {
    {"QK_LAYER_TAP",        0x4000},
    {"QK_TO",               0x5000},
    {"QK_MOMENTARY",        0x5100},
    {"QK_DEF_LAYER",        0x5200},
    {"QK_TOGGLE_LAYER",     0x5300},
    {"QK_ONE_SHOT_LAYER",   0x5400},
    {"QK_ONE_SHOT_MOD",     0x5500},
    {"QK_TAP_DANCE",        0x5700},
    {"QK_LAYER_TAP_TOGGLE", 0x5800},
    {"QK_LAYER_MOD",        0x5900},
    {"QK_MOD_TAP",          0x6000},
    {"ON_PRESS",            1},
    {"QMK_LM_SHIFT",        4},
    {"QMK_LM_MASK",         0x0F},

    // vial user range
    {"FN_MO13",             0x5F10},
    {"FN_MO23",             0x5F11},
    {"QK_MACRO",            0x5F12},
    {"QK_KB",               0x5F80},

    // placeholders, see below
    {"QK_JOYSTICK",             0x99400},
    {"QK_SWAP_HANDS",           0x99500},
    {"QK_PERSISTENT_DEF_LAYER", 0x99600},
};

static const std::vector<AddressRun> v5_runs = {
    {0x5C00, {
        "QK_BOOT", "DEBUG",
        "MAGIC_SWAP_CONTROL_CAPSLOCK", "MAGIC_CAPSLOCK_TO_CONTROL",
        "MAGIC_SWAP_LALT_LGUI", "MAGIC_SWAP_RALT_RGUI", "MAGIC_NO_GUI",
        "MAGIC_SWAP_GRAVE_ESC", "MAGIC_SWAP_BACKSLASH_BACKSPACE", "MAGIC_HOST_NKRO",
        "MAGIC_SWAP_ALT_GUI", "MAGIC_UNSWAP_CONTROL_CAPSLOCK", "MAGIC_UNCAPSLOCK_TO_CONTROL",
        "MAGIC_UNSWAP_LALT_LGUI", "MAGIC_UNSWAP_RALT_RGUI", "MAGIC_UNNO_GUI",
        "MAGIC_UNSWAP_GRAVE_ESC", "MAGIC_UNSWAP_BACKSLASH_BACKSPACE", "MAGIC_UNHOST_NKRO",
        "MAGIC_UNSWAP_ALT_GUI", "MAGIC_TOGGLE_NKRO", "MAGIC_TOGGLE_ALT_GUI",
        "KC_GESC",
        "KC_ASUP", "KC_ASDN", "KC_ASRP", "KC_ASTG", "KC_ASON", "KC_ASOFF",
        "AU_ON", "AU_OFF", "AU_TOG",
        "CLICKY_TOGGLE", "CLICKY_ENABLE", "CLICKY_DISABLE",
        "CLICKY_UP", "CLICKY_DOWN", "CLICKY_RESET",
        "MU_ON", "MU_OFF", "MU_TOG", "MU_MOD", "MUV_IN", "MUV_DE",
    }},
    // MIDI occupies 0x5C2C..0x5CBB
    {0x5CBC, {
        "BL_ON", "BL_OFF", "BL_DEC", "BL_INC", "BL_TOGG", "BL_STEP", "BL_BRTG",
        "RGB_TOG", "RGB_MOD", "RGB_RMOD", "RGB_HUI", "RGB_HUD", "RGB_SAI", "RGB_SAD",
        "RGB_VAI", "RGB_VAD", "RGB_SPI", "RGB_SPD",
        "RGB_M_P", "RGB_M_B", "RGB_M_R", "RGB_M_SW", "RGB_M_SN",
        "RGB_M_K", "RGB_M_X", "RGB_M_G", "RGB_M_T",
        "VLK_TOG",
        "KC_LSPO", "KC_RSPC", "KC_SFTENT",
        "OUT_AUTO", "OUT_USB", "OUT_BT",
        "UC_MOD", "UC_RMOD", "UC_M_MA", "UC_M_LN", "UC_M_WI", "UC_M_BS", "UC_M_WC",
        "HPT_ON", "HPT_OFF", "HPT_TOG", "HPT_RST", "HPT_FBK", "HPT_BUZ", "HPT_MODI",
        "HPT_MODD", "HPT_CONT", "HPT_CONI", "HPT_COND", "HPT_DWLI", "HPT_DWLD",
        "KC_LCPO", "KC_RCPC", "KC_LAPO", "KC_RAPC",
        "CMB_ON", "CMB_OFF", "CMB_TOG",
        "MAGIC_SWAP_LCTL_LGUI", "MAGIC_SWAP_RCTL_RGUI",
        "MAGIC_UNSWAP_LCTL_LGUI", "MAGIC_UNSWAP_RCTL_RGUI",
        "MAGIC_SWAP_CTL_GUI", "MAGIC_UNSWAP_CTL_GUI", "MAGIC_TOGGLE_CTL_GUI",
        "MAGIC_EE_HANDS_LEFT", "MAGIC_EE_HANDS_RIGHT",
        "DYN_REC_START1", "DYN_REC_START2", "DYN_REC_STOP",
        "DYN_MACRO_PLAY1", "DYN_MACRO_PLAY2",
    }},
    // mouse keys
    {0xF0, {
        "KC_MS_U", "KC_MS_D", "KC_MS_L", "KC_MS_R",
        "KC_BTN1", "KC_BTN2", "KC_BTN3", "KC_BTN4", "KC_BTN5",
        "KC_WH_U", "KC_WH_D", "KC_WH_L", "KC_WH_R",
        "KC_ACL0", "KC_ACL1", "KC_ACL2",
    }},

    // Placeholders for features protocol 5 cannot encode.  Each block is
    // 0x100 aligned above 0xFFFF.
    {0x99100, {
        "RM_ON", "RM_OFF", "RM_TOGG", "RM_NEXT", "RM_PREV", "RM_HUEU", "RM_HUED",
        "RM_SATU", "RM_SATD", "RM_VALU", "RM_VALD", "RM_SPDU", "RM_SPDD",
    }},
    {0x99200, {
        "LM_ON", "LM_OFF", "LM_TOGG", "LM_NEXT", "LM_PREV",
        "LM_BRIU", "LM_BRID", "LM_SPDU", "LM_SPDD",
    }},
    {0x99300, {
        "SQ_ON", "SQ_OFF", "SQ_TOGG", "SQ_TMPD", "SQ_TMPU",
        "SQ_RESD", "SQ_RESU", "SQ_SALL", "SQ_SCLR",
    }},
    {0x995F0, {"SH_TOGG", "SH_TT", "SH_MON", "SH_MOFF", "SH_OFF", "SH_ON", "SH_OS"}},
    {0x99700, {
        "QK_REBOOT", "QK_CLEAR_EEPROM", "MAGIC_TOGGLE_GUI",
        "QK_CAPS_WORD_TOGGLE", "QK_REPEAT_KEY", "QK_ALT_REPEAT_KEY", "QK_LAYER_LOCK",
        "QK_KEY_OVERRIDE_TOGGLE", "QK_KEY_OVERRIDE_ON", "QK_KEY_OVERRIDE_OFF",
    }},
};

static constexpr uint32_t V5_MIDI_START = 0x5C2C;

// -----------------------------------------------------------------------
// Protocol 6 (QMK 0.19 and later)
// -----------------------------------------------------------------------

static const std::vector<NamedValue> v6_values = {
    {"QK_MOD_TAP",              0x2000},
    {"QK_LAYER_TAP",            0x4000},
    {"QK_LAYER_MOD",            0x5000},
    {"QK_TO",                   0x5200},
    {"QK_MOMENTARY",            0x5220},
    {"QK_DEF_LAYER",            0x5240},
    {"QK_TOGGLE_LAYER",         0x5260},
    {"QK_ONE_SHOT_LAYER",       0x5280},
    {"QK_ONE_SHOT_MOD",         0x52A0},
    {"QK_LAYER_TAP_TOGGLE",     0x52C0},
    {"QK_PERSISTENT_DEF_LAYER", 0x52E0},
    {"QK_SWAP_HANDS",           0x5600},
    {"QK_TAP_DANCE",            0x5700},
    {"QK_JOYSTICK",             0x7400},
    {"QK_MACRO",                0x7700},
    {"QK_KB",                   0x7E00},
    {"ON_PRESS",                0},
    {"QMK_LM_SHIFT",            5},
    {"QMK_LM_MASK",             0x1F},
};

static const std::vector<AddressRun> v6_runs = {
    {0x56F0, {"SH_TOGG", "SH_TT", "SH_MON", "SH_MOFF", "SH_OFF", "SH_ON", "SH_OS"}},
    {0x7000, {
        "MAGIC_SWAP_CONTROL_CAPSLOCK", "MAGIC_UNSWAP_CONTROL_CAPSLOCK",
        "MAGIC_TOGGLE_CONTROL_CAPSLOCK",
        "MAGIC_UNCAPSLOCK_TO_CONTROL", "MAGIC_CAPSLOCK_TO_CONTROL",
        "MAGIC_SWAP_LALT_LGUI", "MAGIC_UNSWAP_LALT_LGUI",
        "MAGIC_SWAP_RALT_RGUI", "MAGIC_UNSWAP_RALT_RGUI",
        "MAGIC_UNNO_GUI", "MAGIC_NO_GUI", "MAGIC_TOGGLE_GUI",
        "MAGIC_SWAP_GRAVE_ESC", "MAGIC_UNSWAP_GRAVE_ESC",
        "MAGIC_SWAP_BACKSLASH_BACKSPACE", "MAGIC_UNSWAP_BACKSLASH_BACKSPACE",
        "MAGIC_TOGGLE_BACKSLASH_BACKSPACE",
        "MAGIC_HOST_NKRO", "MAGIC_UNHOST_NKRO", "MAGIC_TOGGLE_NKRO",
        "MAGIC_SWAP_ALT_GUI", "MAGIC_UNSWAP_ALT_GUI", "MAGIC_TOGGLE_ALT_GUI",
        "MAGIC_SWAP_LCTL_LGUI", "MAGIC_UNSWAP_LCTL_LGUI",
        "MAGIC_SWAP_RCTL_RGUI", "MAGIC_UNSWAP_RCTL_RGUI",
        "MAGIC_SWAP_CTL_GUI", "MAGIC_UNSWAP_CTL_GUI", "MAGIC_TOGGLE_CTL_GUI",
        "MAGIC_EE_HANDS_LEFT", "MAGIC_EE_HANDS_RIGHT",
    }},
    // MIDI occupies 0x7100..0x718F
    {0x7200, {
        "SQ_ON", "SQ_OFF", "SQ_TOGG", "SQ_TMPD", "SQ_TMPU",
        "SQ_RESD", "SQ_RESU", "SQ_SALL", "SQ_SCLR",
    }},
    {0x7480, {
        "AU_ON", "AU_OFF", "AU_TOG",
        nullptr, nullptr, nullptr, nullptr, nullptr, nullptr, nullptr,
        "CLICKY_TOGGLE", "CLICKY_ENABLE", "CLICKY_DISABLE",
        "CLICKY_UP", "CLICKY_DOWN", "CLICKY_RESET",
        "MU_ON", "MU_OFF", "MU_TOG", "MU_MOD",
    }},
    {0x7800, {"BL_ON", "BL_OFF", "BL_TOGG", "BL_DEC", "BL_INC", "BL_STEP", "BL_BRTG"}},
    {0x7810, {
        "LM_ON", "LM_OFF", "LM_TOGG", "LM_NEXT", "LM_PREV",
        "LM_BRIU", "LM_BRID", "LM_SPDU", "LM_SPDD",
    }},
    {0x7820, {
        "RGB_TOG", "RGB_MOD", "RGB_RMOD", "RGB_HUI", "RGB_HUD", "RGB_SAI", "RGB_SAD",
        "RGB_VAI", "RGB_VAD", "RGB_SPI", "RGB_SPD",
        "RGB_M_P", "RGB_M_B", "RGB_M_R", "RGB_M_SW", "RGB_M_SN",
        "RGB_M_K", "RGB_M_X", "RGB_M_G", "RGB_M_T",
    }},
    {0x7840, {
        "RM_ON", "RM_OFF", "RM_TOGG", "RM_NEXT", "RM_PREV", "RM_HUEU", "RM_HUED",
        "RM_SATU", "RM_SATD", "RM_VALU", "RM_VALD", "RM_SPDU", "RM_SPDD",
    }},
    {0x7C00, {"QK_BOOT", "QK_REBOOT", "DEBUG", "QK_CLEAR_EEPROM"}},
    {0x7C10, {
        "KC_ASDN", "KC_ASUP", "KC_ASRP", "KC_ASON", "KC_ASOFF", "KC_ASTG",
        "KC_GESC", "VLK_TOG",
        "KC_LCPO", "KC_RCPC", "KC_LSPO", "KC_RSPC", "KC_LAPO", "KC_RAPC", "KC_SFTENT",
    }},
    {0x7C20, {"OUT_AUTO", "OUT_USB", "OUT_BT"}},
    {0x7C40, {
        "HPT_ON", "HPT_OFF", "HPT_TOG", "HPT_RST", "HPT_FBK", "HPT_BUZ", "HPT_MODI",
        "HPT_MODD", "HPT_CONT", "HPT_CONI", "HPT_COND", "HPT_DWLI", "HPT_DWLD",
    }},
    {0x7C50, {
        "CMB_ON", "CMB_OFF", "CMB_TOG",
        "DYN_REC_START1", "DYN_REC_START2", "DYN_REC_STOP",
        "DYN_MACRO_PLAY1", "DYN_MACRO_PLAY2",
        "QK_LEADER", "QK_LOCK", nullptr, nullptr, nullptr,
        "QK_KEY_OVERRIDE_TOGGLE", "QK_KEY_OVERRIDE_ON", "QK_KEY_OVERRIDE_OFF",
    }},
    {0x7C73, {"QK_CAPS_WORD_TOGGLE"}},
    {0x7C77, {"FN_MO13", "FN_MO23", "QK_REPEAT_KEY", "QK_ALT_REPEAT_KEY", "QK_LAYER_LOCK"}},
    // mouse keys
    {0xCD, {
        "KC_MS_U", "KC_MS_D", "KC_MS_L", "KC_MS_R",
        "KC_BTN1", "KC_BTN2", "KC_BTN3", "KC_BTN4", "KC_BTN5",
        "KC_BTN6", "KC_BTN7", "KC_BTN8",
        "KC_WH_U", "KC_WH_D", "KC_WH_L", "KC_WH_R",
        "KC_ACL0", "KC_ACL1", "KC_ACL2",
    }},
};

static constexpr uint32_t V6_MIDI_START = 0x7100;

// -----------------------------------------------------------------------
// Modifier combinations
// -----------------------------------------------------------------------

const std::vector<ModCombo>& mod_combos() {
    static const std::vector<ModCombo> combos = {
        {"LCTL",  "LCTL_T", "MOD_LCTL",                            0x01},
        {"LSFT",  "LSFT_T", "MOD_LSFT",                            0x02},
        {"LALT",  "LALT_T", "MOD_LALT",                            0x04},
        {"LGUI",  "LGUI_T", "MOD_LGUI",                            0x08},
        {"C_S",   "C_S_T",  "MOD_LCTL|MOD_LSFT",                   0x03},
        {"LCA",   "LCA_T",  "MOD_LCTL|MOD_LALT",                   0x05},
        {"LCG",   "LCG_T",  "MOD_LCTL|MOD_LGUI",                   0x09},
        {"LSA",   "LSA_T",  "MOD_LSFT|MOD_LALT",                   0x06},
        {"LAG",   "LAG_T",  "MOD_LALT|MOD_LGUI",                   0x0C},
        {"SGUI",  "SGUI_T", "MOD_LSFT|MOD_LGUI",                   0x0A},
        {"MEH",   "MEH_T",  "MOD_MEH",                             0x07},
        {"LCSG",  "LCSG_T", "MOD_LCTL|MOD_LSFT|MOD_LGUI",          0x0B},
        {"LCAG",  "LCAG_T", "MOD_LCTL|MOD_LALT|MOD_LGUI",          0x0D},
        {"LSAG",  "LSAG_T", "MOD_LSFT|MOD_LALT|MOD_LGUI",          0x0E},
        {"HYPR",  "ALL_T",  "MOD_HYPR",                            0x0F},
        {"RCTL",  "RCTL_T", "MOD_RCTL",                            0x11},
        {"RSFT",  "RSFT_T", "MOD_RSFT",                            0x12},
        {"RALT",  "RALT_T", "MOD_RALT",                            0x14},
        {"RGUI",  "RGUI_T", "MOD_RGUI",                            0x18},
        {"RCS",   "RCS_T",  "MOD_RCTL|MOD_RSFT",                   0x13},
        {"RCA",   "RCA_T",  "MOD_RCTL|MOD_RALT",                   0x15},
        {"RCG",   "RCG_T",  "MOD_RCTL|MOD_RGUI",                   0x19},
        {"RSA",   "RSA_T",  "MOD_RSFT|MOD_RALT",                   0x16},
        {"RAG",   "RAG_T",  "MOD_RALT|MOD_RGUI",                   0x1C},
        {"RSG",   "RSG_T",  "MOD_RSFT|MOD_RGUI",                   0x1A},
        {"RMEH",  "RMEH_T", "MOD_RCTL|MOD_RSFT|MOD_RALT",          0x17},
        {"RCSG",  "RCSG_T", "MOD_RCTL|MOD_RSFT|MOD_RGUI",          0x1B},
        {"RCAG",  "RCAG_T", "MOD_RCTL|MOD_RALT|MOD_RGUI",          0x1D},
        {"RSAG",  "RSAG_T", "MOD_RSFT|MOD_RALT|MOD_RGUI",          0x1E},
        {"RHYPR", "RALL_T", "MOD_RCTL|MOD_RSFT|MOD_RALT|MOD_RGUI", 0x1F},
    };
    return combos;
}

// -----------------------------------------------------------------------
// KeycodeTable
// -----------------------------------------------------------------------

bool KeycodeTable::lookup(const std::string& name, uint32_t& out) const {
    auto it = _values.find(name);
    if (it == _values.end()) return false;
    out = it->second;
    return true;
}

uint32_t KeycodeTable::resolve(const std::string& name) const {
    uint32_t v;
    if (!lookup(name, v))
        throw std::runtime_error("unable to resolve qmk_id=" + name);
    return v;
}

LayerModLayout KeycodeTable::layer_mod_layout() const {
    LayerModLayout l;
    l.base     = resolve("QK_LAYER_MOD");
    l.shift    = resolve("QMK_LM_SHIFT");
    l.mod_mask = resolve("QMK_LM_MASK");
    l.max_code = l.base | (0x0Fu << l.shift) | l.mod_mask;
    return l;
}

void KeycodeTable::add(const std::string& name, uint32_t value) {
    if (!_values.emplace(name, value).second)
        throw std::runtime_error("duplicate keycode name " + name);
}

void KeycodeTable::add_masked(const std::string& name, uint32_t value) {
    add(name, value);
    _masked.insert(name);
    _masked_values.insert(value);
}

// -----------------------------------------------------------------------
// Generator
// -----------------------------------------------------------------------

static std::vector<std::pair<std::string, uint32_t>> expand_runs(const std::vector<AddressRun>& runs) {
    std::vector<std::pair<std::string, uint32_t>> out;
    for (auto& run : runs) {
        uint32_t addr = run.start;
        for (const char* name : run.names) {
            if (name) out.emplace_back(name, addr);
            ++addr;
        }
    }
    return out;
}

static uint32_t pack_member(const KeycodeTable& t, Packing packing, uint32_t base, uint32_t n) {
    switch (packing) {
    case Packing::Add:      return base + n;
    case Packing::ToLayer:  return base | (t.resolve("ON_PRESS") << 4) | n;
    case Packing::LayerTap: return base | ((n & 0x0F) << 8);
    case Packing::LayerMod: return base | ((n & 0x0F) << t.resolve("QMK_LM_SHIFT"));
    }
    return base;
}

KeycodeTable make_keycode_table(int protocol) {
    KeycodeTable t;
    t._protocol = protocol == KCODEC_PROTOCOL_V6 ? KCODEC_PROTOCOL_V6 : KCODEC_PROTOCOL_V5;
    const bool v6 = t._protocol == KCODEC_PROTOCOL_V6;

    for (auto& nv : shared_values) t.add(nv.name, nv.value);
    for (auto& nv : (v6 ? v6_values : v5_values))
        t.add(nv.name, nv.value);

    for (auto& [name, value] : expand_runs(hid_runs)) t.add(name, value);
    for (auto& [name, value] : expand_runs(v6 ? v6_runs : v5_runs)) t.add(name, value);

    uint32_t addr = v6 ? V6_MIDI_START : V5_MIDI_START;
    for (auto& name : midi_sequence()) t.add(name, addr++);

    // Shifted symbols are plain LSFT() combinations
    const uint32_t lsft = t.resolve("QK_LSFT");
    for (auto& s : shifted_symbols()) t.add(s.id, lsft | t.resolve(s.base));

    const uint32_t mod_tap = t.resolve("QK_MOD_TAP");
    const uint32_t osm     = t.resolve("QK_ONE_SHOT_MOD");
    for (auto& c : mod_combos()) {
        uint32_t mods = c.mods;
        t.add_masked(std::string(c.wrap) + "(kc)", mods << 8);
        t.add_masked(std::string(c.tap) + "(kc)", mod_tap | (mods << 8));
        t.add("OSM(" + std::string(c.osm) + ")", osm | mods);
    }
    t.add_masked("SH_T(kc)", t.resolve("QK_SWAP_HANDS"));

    char name[32];
    for (auto& f : families) {
        const uint32_t base  = t.resolve(f.base);
        const int      count = v6 ? f.v6_count : f.v5_count;
        for (int n = 0; n < count; ++n) {
            std::snprintf(name, sizeof(name), f.format, n);
            uint32_t value = pack_member(t, f.packing, base, static_cast<uint32_t>(n));
            if (f.masked) t.add_masked(name, value);
            else          t.add(name, value);
        }
    }

    return t;
}
