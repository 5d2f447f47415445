#include "data.h"

#include <string>
#include <utility>

// -----------------------------------------------------------------------
// Special and basic keys
// -----------------------------------------------------------------------

static const std::vector<KeycodeDef> special_keys = {
    {"KC_NO", ""},
    {"KC_TRNS", "▽", "", {"KC_TRANSPARENT"}},
};

static const std::vector<KeycodeDef> basic_keys = {
    {"KC_A", "A", "", {}, {"a"}, "a"},
    {"KC_B", "B", "", {}, {"b"}, "b"},
    {"KC_C", "C", "", {}, {"c"}, "c"},
    {"KC_D", "D", "", {}, {"d"}, "d"},
    {"KC_E", "E", "", {}, {"e"}, "e"},
    {"KC_F", "F", "", {}, {"f"}, "f"},
    {"KC_G", "G", "", {}, {"g"}, "g"},
    {"KC_H", "H", "", {}, {"h"}, "h"},
    {"KC_I", "I", "", {}, {"i"}, "i"},
    {"KC_J", "J", "", {}, {"j"}, "j"},
    {"KC_K", "K", "", {}, {"k"}, "k"},
    {"KC_L", "L", "", {}, {"l"}, "l"},
    {"KC_M", "M", "", {}, {"m"}, "m"},
    {"KC_N", "N", "", {}, {"n"}, "n"},
    {"KC_O", "O", "", {}, {"o"}, "o"},
    {"KC_P", "P", "", {}, {"p"}, "p"},
    {"KC_Q", "Q", "", {}, {"q"}, "q"},
    {"KC_R", "R", "", {}, {"r"}, "r"},
    {"KC_S", "S", "", {}, {"s"}, "s"},
    {"KC_T", "T", "", {}, {"t"}, "t"},
    {"KC_U", "U", "", {}, {"u"}, "u"},
    {"KC_V", "V", "", {}, {"v"}, "v"},
    {"KC_W", "W", "", {}, {"w"}, "w"},
    {"KC_X", "X", "", {}, {"x"}, "x"},
    {"KC_Y", "Y", "", {}, {"y"}, "y"},
    {"KC_Z", "Z", "", {}, {"z"}, "z"},
    {"KC_1", "!\n1", "", {}, {"1"}, "1"},
    {"KC_2", "@\n2", "", {}, {"2"}, "2"},
    {"KC_3", "#\n3", "", {}, {"3"}, "3"},
    {"KC_4", "$\n4", "", {}, {"4"}, "4"},
    {"KC_5", "%\n5", "", {}, {"5"}, "5"},
    {"KC_6", "^\n6", "", {}, {"6"}, "6"},
    {"KC_7", "&\n7", "", {}, {"7"}, "7"},
    {"KC_8", "*\n8", "", {}, {"8"}, "8"},
    {"KC_9", "(\n9", "", {}, {"9"}, "9"},
    {"KC_0", ")\n0", "", {}, {"0"}, "0"},
    {"KC_MINUS", "_\n-", "", {"KC_MINS"}, {"-"}, "-"},
    {"KC_EQUAL", "+\n=", "", {"KC_EQL"}, {"="}, "="},
    {"KC_LBRACKET", "{\n[", "", {"KC_LBRC"}, {"["}, "["},
    {"KC_RBRACKET", "}\n]", "", {"KC_RBRC"}, {"]"}, "]"},
    {"KC_BSLASH", "|\n\\", "", {"KC_BSLS"}, {"\\"}, "\\"},
    {"KC_SCOLON", ":\n;", "", {"KC_SCLN"}, {";"}, ";"},
    {"KC_QUOTE", "\"\n'", "", {"KC_QUOT"}, {"'"}, "'"},
    {"KC_GRAVE", "~\n`", "", {"KC_GRV", "KC_ZKHK"}, {"`"}, "`"},
    {"KC_COMMA", "<\n,", "", {"KC_COMM"}, {","}, ","},
    {"KC_DOT", ">\n.", "", {}, {"."}, "."},
    {"KC_SLASH", "?\n/", "", {"KC_SLSH"}, {"/"}, "/"},
    // editing
    {"KC_ENTER", "Enter", "", {"KC_ENT"}, {"enter"}},
    {"KC_SPACE", "Space", "", {"KC_SPC"}, {"space"}},
    {"KC_TAB", "Tab", "", {}, {"tab"}},
    {"KC_BSPACE", "Bksp", "", {"KC_BSPC"}, {"backspace"}},
    {"KC_ESCAPE", "Esc", "", {"KC_ESC"}, {"esc"}},
    // modifiers
    {"KC_LSHIFT", "LShift", "", {"KC_LSFT"}, {"left shift", "shift"}},
    {"KC_RSHIFT", "RShift", "", {"KC_RSFT"}, {"right shift"}},
    {"KC_LCTRL", "LCtrl", "", {"KC_LCTL"}, {"left ctrl", "ctrl"}},
    {"KC_RCTRL", "RCtrl", "", {"KC_RCTL"}, {"right ctrl"}},
    {"KC_LALT", "LAlt", "", {"KC_LOPT"}, {"alt"}},
    {"KC_RALT", "RAlt", "", {"KC_ALGR", "KC_ROPT"}},
    {"KC_LGUI", "LGui", "", {"KC_LCMD", "KC_LWIN"}, {"left windows", "windows"}},
    {"KC_RGUI", "RGui", "", {"KC_RCMD", "KC_RWIN"}, {"right windows"}},
    {"KC_APPLICATION", "Menu", "", {"KC_APP"}, {"menu", "left menu", "right menu"}},
    // navigation
    {"KC_UP", "Up", "", {}, {"up"}},
    {"KC_DOWN", "Down", "", {}, {"down"}},
    {"KC_LEFT", "Left", "", {}, {"left"}},
    {"KC_RIGHT", "Right", "", {"KC_RGHT"}, {"right"}},
    {"KC_HOME", "Home", "", {}, {"home"}},
    {"KC_END", "End", "", {}, {"end"}},
    {"KC_PGUP", "Page\nUp", "", {}, {"page up"}},
    {"KC_PGDOWN", "Page\nDown", "", {"KC_PGDN"}, {"page down"}},
    {"KC_INSERT", "Insert", "", {"KC_INS"}, {"insert"}},
    {"KC_DELETE", "Del", "", {"KC_DEL"}, {"delete"}},
    {"KC_F1", "F1", "", {}, {"f1"}},
    {"KC_F2", "F2", "", {}, {"f2"}},
    {"KC_F3", "F3", "", {}, {"f3"}},
    {"KC_F4", "F4", "", {}, {"f4"}},
    {"KC_F5", "F5", "", {}, {"f5"}},
    {"KC_F6", "F6", "", {}, {"f6"}},
    {"KC_F7", "F7", "", {}, {"f7"}},
    {"KC_F8", "F8", "", {}, {"f8"}},
    {"KC_F9", "F9", "", {}, {"f9"}},
    {"KC_F10", "F10", "", {}, {"f10"}},
    {"KC_F11", "F11", "", {}, {"f11"}},
    {"KC_F12", "F12", "", {}, {"f12"}},
    {"KC_CAPSLOCK", "Caps\nLock", "", {"KC_CLCK", "KC_CAPS"}, {"caps lock"}},
    {"KC_NUMLOCK", "Num\nLock", "", {"KC_NLCK"}, {"num lock"}},
    {"KC_SCROLLLOCK", "Scroll\nLock", "", {"KC_SLCK", "KC_BRMD"}, {"scroll lock"}},
    // keypad
    {"KC_KP_1", "1", "", {"KC_P1"}},
    {"KC_KP_2", "2", "", {"KC_P2"}},
    {"KC_KP_3", "3", "", {"KC_P3"}},
    {"KC_KP_4", "4", "", {"KC_P4"}},
    {"KC_KP_5", "5", "", {"KC_P5"}},
    {"KC_KP_6", "6", "", {"KC_P6"}},
    {"KC_KP_7", "7", "", {"KC_P7"}},
    {"KC_KP_8", "8", "", {"KC_P8"}},
    {"KC_KP_9", "9", "", {"KC_P9"}},
    {"KC_KP_0", "0", "", {"KC_P0"}},
    {"KC_KP_DOT", ".", "", {"KC_PDOT"}},
    {"KC_KP_PLUS", "+", "", {"KC_PPLS"}},
    {"KC_KP_MINUS", "-", "", {"KC_PMNS"}},
    {"KC_KP_ASTERISK", "*", "", {"KC_PAST"}},
    {"KC_KP_SLASH", "/", "", {"KC_PSLS"}},
    {"KC_KP_EQUAL", "=", "", {"KC_PEQL"}},
    {"KC_KP_COMMA", ",", "", {"KC_PCMM"}},
    {"KC_KP_ENTER", "Num\nEnter", "", {"KC_PENT"}},
    {"KC_PSCREEN", "Print\nScreen", "", {"KC_PSCR"}},
    {"KC_PAUSE", "Pause", "", {"KC_PAUS", "KC_BRK", "KC_BRMU"}, {"pause", "break"}},
};

static const std::vector<KeycodeDef> shifted_keys = {
    {"KC_TILD", "~"},
    {"KC_EXLM", "!"},
    {"KC_AT", "@"},
    {"KC_HASH", "#"},
    {"KC_DLR", "$"},
    {"KC_PERC", "%"},
    {"KC_CIRC", "^"},
    {"KC_AMPR", "&"},
    {"KC_ASTR", "*"},
    {"KC_LPRN", "("},
    {"KC_RPRN", ")"},
    {"KC_UNDS", "_"},
    {"KC_PLUS", "+"},
    {"KC_LCBR", "{"},
    {"KC_RCBR", "}"},
    {"KC_LT", "<"},
    {"KC_GT", ">"},
    {"KC_COLN", ":"},
    {"KC_PIPE", "|"},
    {"KC_QUES", "?"},
    {"KC_DQUO", "\""},
};

static const std::vector<KeycodeDef> iso_keys = {
    {"KC_NONUS_HASH", "~\n#", "Non-US # and ~", {"KC_NUHS"}},
    {"KC_NONUS_BSLASH", "|\n\\", "Non-US \\ and |", {"KC_NUBS"}},
    {"KC_RO", "_\n\\", "JIS \\ and _", {"KC_INT1"}},
    {"KC_KANA", "カタカナ\nひらがな", "JIS Katakana/Hiragana", {"KC_INT2"}},
    {"KC_JYEN", "|\n¥", "", {"KC_INT3"}},
    {"KC_HENK", "変換", "JIS Henkan", {"KC_INT4"}},
    {"KC_MHEN", "無変換", "JIS Muhenkan", {"KC_INT5"}},
    {"KC_LANG1", "한영\nかな", "Korean Han/Yeong / JP Mac Kana", {"KC_HAEN"}},
    {"KC_LANG2", "漢字\n英数", "Korean Hanja / JP Mac Eisu", {"KC_HANJ"}},
};

static const std::vector<KeycodeDef> boot_keys = {
    {"QK_BOOT", "Boot-\nloader", "Put the keyboard into bootloader mode for flashing", {"RESET"}},
    {"QK_REBOOT", "Reboot", "Reboots the keyboard. Does not load the bootloader"},
    {"QK_CLEAR_EEPROM", "Clear\nEEPROM", "Reinitializes the keyboard's EEPROM (persistent memory)", {"EE_CLR"}},
};

// -----------------------------------------------------------------------
// Modifiers: one-shot, masks, mod-tap and space cadet
// -----------------------------------------------------------------------

static const std::vector<KeycodeDef> modifier_keys = {
    {"OSM(MOD_LSFT)", "OSM\nLSft", "Enable Left Shift for one keypress"},
    {"OSM(MOD_LCTL)", "OSM\nLCtl", "Enable Left Control for one keypress"},
    {"OSM(MOD_LALT)", "OSM\nLAlt", "Enable Left Alt for one keypress"},
    {"OSM(MOD_LGUI)", "OSM\nLGUI", "Enable Left GUI for one keypress"},
    {"OSM(MOD_LCTL|MOD_LSFT)", "OSM\nLCS", "Enable Left Control and Shift for one keypress"},
    {"OSM(MOD_LCTL|MOD_LALT)", "OSM\nLCA", "Enable Left Control and Alt for one keypress"},
    {"OSM(MOD_LCTL|MOD_LGUI)", "OSM\nLCG", "Enable Left Control and GUI for one keypress"},
    {"OSM(MOD_LSFT|MOD_LALT)", "OSM\nLSA", "Enable Left Shift and Alt for one keypress"},
    {"OSM(MOD_LALT|MOD_LGUI)", "OSM\nLAG", "Enable Left Alt and GUI for one keypress"},
    {"OSM(MOD_LSFT|MOD_LGUI)", "OSM\nLSG", "Enable Left Shift and GUI for one keypress"},
    {"OSM(MOD_MEH)", "OSM\nMeh", "Enable Left Control, Shift, and Alt for one keypress"},
    {"OSM(MOD_LCTL|MOD_LSFT|MOD_LGUI)", "OSM\nLCSG", "Enable Left Control, Shift, and GUI for one keypress"},
    {"OSM(MOD_LCTL|MOD_LALT|MOD_LGUI)", "OSM\nLCAG", "Enable Left Control, Alt, and GUI for one keypress"},
    {"OSM(MOD_LSFT|MOD_LALT|MOD_LGUI)", "OSM\nLSAG", "Enable Left Shift, Alt, and GUI for one keypress"},
    {"OSM(MOD_HYPR)", "OSM\nHyper", "Enable Left Control, Shift, Alt, and GUI for one keypress"},
    {"OSM(MOD_RSFT)", "OSM\nRSft", "Enable Right Shift for one keypress"},
    {"OSM(MOD_RCTL)", "OSM\nRCtl", "Enable Right Control for one keypress"},
    {"OSM(MOD_RALT)", "OSM\nRAlt", "Enable Right Alt for one keypress"},
    {"OSM(MOD_RGUI)", "OSM\nRGUI", "Enable Right GUI for one keypress"},
    {"OSM(MOD_RCTL|MOD_RSFT)", "OSM\nRCS", "Enable Right Control and Shift for one keypress"},
    {"OSM(MOD_RCTL|MOD_RALT)", "OSM\nRCA", "Enable Right Control and Alt for one keypress"},
    {"OSM(MOD_RCTL|MOD_RGUI)", "OSM\nRCG", "Enable Right Control and GUI for one keypress"},
    {"OSM(MOD_RSFT|MOD_RALT)", "OSM\nRSA", "Enable Right Shift and Alt for one keypress"},
    {"OSM(MOD_RALT|MOD_RGUI)", "OSM\nRAG", "Enable Right Alt and GUI for one keypress"},
    {"OSM(MOD_RSFT|MOD_RGUI)", "OSM\nRSG", "Enable Right Shift and GUI for one keypress"},
    {"OSM(MOD_RCTL|MOD_RSFT|MOD_RALT)", "OSM\nRMeh", "Enable Right Control, Shift, and Alt for one keypress"},
    {"OSM(MOD_RCTL|MOD_RSFT|MOD_RGUI)", "OSM\nRCSG", "Enable Right Control, Shift, and GUI for one keypress"},
    {"OSM(MOD_RCTL|MOD_RALT|MOD_RGUI)", "OSM\nRCAG", "Enable Right Control, Alt, and GUI for one keypress"},
    {"OSM(MOD_RSFT|MOD_RALT|MOD_RGUI)", "OSM\nRSAG", "Enable Right Shift, Alt, and GUI for one keypress"},
    {"OSM(MOD_RCTL|MOD_RSFT|MOD_RALT|MOD_RGUI)", "OSM\nRHyper", "Enable Right Control, Shift, Alt, and GUI for one keypress"},

    {"LSFT(kc)", "LSft\n(kc)"},
    {"LCTL(kc)", "LCtl\n(kc)"},
    {"LALT(kc)", "LAlt\n(kc)"},
    {"LGUI(kc)", "LGui\n(kc)"},
    {"C_S(kc)", "LCS\n(kc)", "LCTL + LSFT", {"LCS(kc)"}},
    {"LCA(kc)", "LCA\n(kc)", "LCTL + LALT"},
    {"LCG(kc)", "LCG\n(kc)", "LCTL + LGUI"},
    {"LSA(kc)", "LSA\n(kc)", "LSFT + LALT"},
    {"LAG(kc)", "LAG\n(kc)", "LALT + LGUI"},
    {"SGUI(kc)", "LSG\n(kc)", "LGUI + LSFT", {"LSG(kc)"}},
    {"MEH(kc)", "Meh\n(kc)", "LCTL + LSFT + LALT"},
    {"LCSG(kc)", "LCSG\n(kc)", "LCTL + LSFT + LGUI"},
    {"LCAG(kc)", "LCAG\n(kc)", "LCTL + LALT + LGUI"},
    {"LSAG(kc)", "LSAG\n(kc)", "LSFT + LALT + LGUI"},
    {"HYPR(kc)", "Hyper\n(kc)", "LCTL + LSFT + LALT + LGUI"},
    {"RSFT(kc)", "RSft\n(kc)"},
    {"RCTL(kc)", "RCtl\n(kc)"},
    {"RALT(kc)", "RAlt\n(kc)"},
    {"RGUI(kc)", "RGui\n(kc)"},
    {"RCS(kc)", "RCS\n(kc)", "RCTL + RSFT"},
    {"RCA(kc)", "RCA\n(kc)", "RCTL + RALT"},
    {"RSA(kc)", "RSA\n(kc)", "RSFT + RALT"},
    {"RCG(kc)", "RCG\n(kc)", "RCTL + RGUI"},
    {"RSG(kc)", "RSG\n(kc)", "RSFT + RGUI"},
    {"RAG(kc)", "RAG\n(kc)", "RALT + RGUI"},
    {"RMEH(kc)", "RMeh\n(kc)", "RCTL + RSFT + RALT"},
    {"RCSG(kc)", "RCSG\n(kc)", "RCTL + RSFT + RGUI"},
    {"RCAG(kc)", "RCAG\n(kc)", "RCTL + RALT + RGUI"},
    {"RSAG(kc)", "RSAG\n(kc)", "RSFT + RALT + RGUI"},
    {"RHYPR(kc)", "RHyper\n(kc)", "RCTL + RSFT + RALT + RGUI"},

    {"LSFT_T(kc)", "LSft_T\n(kc)", "Left Shift when held, kc when tapped"},
    {"LCTL_T(kc)", "LCtl_T\n(kc)", "Left Control when held, kc when tapped"},
    {"LALT_T(kc)", "LAlt_T\n(kc)", "Left Alt when held, kc when tapped"},
    {"LGUI_T(kc)", "LGui_T\n(kc)", "Left GUI when held, kc when tapped"},
    {"C_S_T(kc)", "LCS_T\n(kc)", "Left Control + Left Shift when held, kc when tapped", {"LCS_T(kc)"}},
    {"LCA_T(kc)", "LCA_T\n(kc)", "LCTL + LALT when held, kc when tapped"},
    {"LCG_T(kc)", "LCG_T\n(kc)", "LCTL + LGUI when held, kc when tapped"},
    {"LSA_T(kc)", "LSA_T\n(kc)", "LSFT + LALT when held, kc when tapped"},
    {"LAG_T(kc)", "LAG_T\n(kc)", "LALT + LGUI when held, kc when tapped"},
    {"SGUI_T(kc)", "LSG_T\n(kc)", "LGUI + LSFT when held, kc when tapped", {"LSG_T(kc)"}},
    {"MEH_T(kc)", "Meh_T\n(kc)", "LCTL + LSFT + LALT when held, kc when tapped"},
    {"LCSG_T(kc)", "LCSG_T\n(kc)", "LCTL + LSFT + LGUI when held, kc when tapped"},
    {"LCAG_T(kc)", "LCAG_T\n(kc)", "LCTL + LALT + LGUI when held, kc when tapped"},
    {"LSAG_T(kc)", "LSAG_T\n(kc)", "LSFT + LALT + LGUI when held, kc when tapped"},
    {"ALL_T(kc)", "ALL_T\n(kc)", "LCTL + LSFT + LALT + LGUI when held, kc when tapped", {"HYPR_T(kc)"}},
    {"RSFT_T(kc)", "RSft_T\n(kc)", "Right Shift when held, kc when tapped"},
    {"RCTL_T(kc)", "RCtl_T\n(kc)", "Right Control when held, kc when tapped"},
    {"RALT_T(kc)", "RAlt_T\n(kc)", "Right Alt when held, kc when tapped"},
    {"RGUI_T(kc)", "RGui_T\n(kc)", "Right GUI when held, kc when tapped"},
    {"RCS_T(kc)", "RCS_T\n(kc)", "RCTL + RSFT when held, kc when tapped"},
    {"RCA_T(kc)", "RCA_T\n(kc)", "RCTL + RALT when held, kc when tapped"},
    {"RCG_T(kc)", "RCG_T\n(kc)", "RCTL + RGUI when held, kc when tapped"},
    {"RSA_T(kc)", "RSA_T\n(kc)", "RSFT + RALT when held, kc when tapped"},
    {"RAG_T(kc)", "RAG_T\n(kc)", "RALT + RGUI when held, kc when tapped"},
    {"RSG_T(kc)", "RSG_T\n(kc)", "RSFT + RGUI when held, kc when tapped"},
    {"RCSG_T(kc)", "RCSG_T\n(kc)", "RCTL + RSFT + RGUI when held, kc when tapped"},
    {"RCAG_T(kc)", "RCAG_T\n(kc)", "RCTL + RALT + RGUI when held, kc when tapped"},
    {"RSAG_T(kc)", "RSAG_T\n(kc)", "RSFT + RALT + RGUI when held, kc when tapped"},
    {"RMEH_T(kc)", "RMeh_T\n(kc)", "RCTL + RSFT + RALT when held, kc when tapped"},
    {"RALL_T(kc)", "RALL_T\n(kc)", "RCTL + RSFT + RALT + RGUI when held, kc when tapped"},

    {"KC_GESC", "~\nEsc", "Esc normally, but ~ when Shift or GUI is pressed"},
    {"KC_LSPO", "LS\n(", "Left Shift when held, ( when tapped"},
    {"KC_RSPC", "RS\n)", "Right Shift when held, ) when tapped"},
    {"KC_LCPO", "LC\n(", "Left Control when held, ( when tapped"},
    {"KC_RCPC", "RC\n)", "Right Control when held, ) when tapped"},
    {"KC_LAPO", "LA\n(", "Left Alt when held, ( when tapped"},
    {"KC_RAPC", "RA\n)", "Right Alt when held, ) when tapped"},
    {"KC_SFTENT", "RS\nEnter", "Right Shift when held, Enter when tapped"},
};

static const std::vector<KeycodeDef> lm_mod_keys = {
    {"MOD_LCTL", "LCtl", "Left Control"},
    {"MOD_LSFT", "LSft", "Left Shift"},
    {"MOD_LALT", "LAlt", "Left Alt"},
    {"MOD_LGUI", "LGui", "Left GUI"},
    {"MOD_RCTL", "RCtl", "Right Control"},
    {"MOD_RSFT", "RSft", "Right Shift"},
    {"MOD_RALT", "RAlt", "Right Alt"},
    {"MOD_RGUI", "RGui", "Right GUI"},
    {"MOD_MEH",  "Meh",  "Meh (LCTL+LSFT+LALT)"},
    {"MOD_HYPR", "Hypr", "Hyper (LCTL+LSFT+LALT+LGUI)"},
};

// -----------------------------------------------------------------------
// Quantum features
// -----------------------------------------------------------------------

static const std::vector<KeycodeDef> quantum_keys = {
    // magic
    {"MAGIC_SWAP_CONTROL_CAPSLOCK", "Swap\nCtrl\nCaps", "Swap Caps Lock and Left Control", {"CL_SWAP"}},
    {"MAGIC_UNSWAP_CONTROL_CAPSLOCK", "Unswap\nCtrl\nCaps", "Unswap Caps Lock and Left Control", {"CL_NORM"}},
    {"MAGIC_CAPSLOCK_TO_CONTROL", "Caps\nto\nCtrl", "Treat Caps Lock as Control", {"CL_CTRL"}},
    {"MAGIC_UNCAPSLOCK_TO_CONTROL", "Caps\nnot to\nCtrl", "Stop treating Caps Lock as Control", {"CL_CAPS"}},
    {"MAGIC_SWAP_LCTL_LGUI", "Swap\nLCtl\nLGui", "Swap Left Control and GUI", {"LCG_SWP"}},
    {"MAGIC_UNSWAP_LCTL_LGUI", "Unswap\nLCtl\nLGui", "Unswap Left Control and GUI", {"LCG_NRM"}},
    {"MAGIC_SWAP_RCTL_RGUI", "Swap\nRCtl\nRGui", "Swap Right Control and GUI", {"RCG_SWP"}},
    {"MAGIC_UNSWAP_RCTL_RGUI", "Unswap\nRCtl\nRGui", "Unswap Right Control and GUI", {"RCG_NRM"}},
    {"MAGIC_SWAP_CTL_GUI", "Swap\nCtl\nGui", "Swap Control and GUI on both sides", {"CG_SWAP"}},
    {"MAGIC_UNSWAP_CTL_GUI", "Unswap\nCtl\nGui", "Unswap Control and GUI on both sides", {"CG_NORM"}},
    {"MAGIC_TOGGLE_CTL_GUI", "Toggle\nCtl\nGui", "Toggle Control and GUI swap on both sides", {"CG_TOGG"}},
    {"MAGIC_SWAP_LALT_LGUI", "Swap\nLAlt\nLGui", "Swap Left Alt and GUI", {"LAG_SWP"}},
    {"MAGIC_UNSWAP_LALT_LGUI", "Unswap\nLAlt\nLGui", "Unswap Left Alt and GUI", {"LAG_NRM"}},
    {"MAGIC_SWAP_RALT_RGUI", "Swap\nRAlt\nRGui", "Swap Right Alt and GUI", {"RAG_SWP"}},
    {"MAGIC_UNSWAP_RALT_RGUI", "Unswap\nRAlt\nRGui", "Unswap Right Alt and GUI", {"RAG_NRM"}},
    {"MAGIC_SWAP_ALT_GUI", "Swap\nAlt\nGui", "Swap Alt and GUI on both sides", {"AG_SWAP"}},
    {"MAGIC_UNSWAP_ALT_GUI", "Unswap\nAlt\nGui", "Unswap Alt and GUI on both sides", {"AG_NORM"}},
    {"MAGIC_TOGGLE_ALT_GUI", "Toggle\nAlt\nGui", "Toggle Alt and GUI swap on both sides", {"AG_TOGG"}},
    {"MAGIC_NO_GUI", "GUI\nOff", "Disable the GUI keys", {"GUI_OFF"}},
    {"MAGIC_UNNO_GUI", "GUI\nOn", "Enable the GUI keys", {"GUI_ON"}},
    {"MAGIC_TOGGLE_GUI", "GUI\nToggle", "Toggle the GUI keys on and off", {"GUI_TOGG"}},
    {"MAGIC_SWAP_GRAVE_ESC", "Swap\n`\nEsc", "Swap ` and Escape", {"GE_SWAP"}},
    {"MAGIC_UNSWAP_GRAVE_ESC", "Unswap\n`\nEsc", "Unswap ` and Escape", {"GE_NORM"}},
    {"MAGIC_SWAP_BACKSLASH_BACKSPACE", "Swap\n\\\nBS", "Swap \\ and Backspace", {"BS_SWAP"}},
    {"MAGIC_UNSWAP_BACKSLASH_BACKSPACE", "Unswap\n\\\nBS", "Unswap \\ and Backspace", {"BS_NORM"}},
    {"MAGIC_HOST_NKRO", "NKRO\nOn", "Enable N-key rollover", {"NK_ON"}},
    {"MAGIC_UNHOST_NKRO", "NKRO\nOff", "Disable N-key rollover", {"NK_OFF"}},
    {"MAGIC_TOGGLE_NKRO", "NKRO\nToggle", "Toggle N-key rollover", {"NK_TOGG"}},
    {"MAGIC_EE_HANDS_LEFT", "EEH\nLeft", "Set the master half of a split keyboard as the left hand (for EE_HANDS)", {"EH_LEFT"}},
    {"MAGIC_EE_HANDS_RIGHT", "EEH\nRight", "Set the master half of a split keyboard as the right hand (for EE_HANDS)", {"EH_RGHT"}},
    // audio
    {"AU_ON", "Audio\nON", "Audio mode on"},
    {"AU_OFF", "Audio\nOFF", "Audio mode off"},
    {"AU_TOG", "Audio\nToggle", "Toggles Audio mode"},
    {"CLICKY_TOGGLE", "Clicky\nToggle", "Toggles Audio clicky mode", {"CK_TOGG"}},
    {"CLICKY_UP", "Clicky\nUp", "Increases frequency of the clicks", {"CK_UP"}},
    {"CLICKY_DOWN", "Clicky\nDown", "Decreases frequency of the clicks", {"CK_DOWN"}},
    {"CLICKY_RESET", "Clicky\nReset", "Resets frequency to default", {"CK_RST"}},
    {"MU_ON", "Music\nOn", "Turns on Music Mode"},
    {"MU_OFF", "Music\nOff", "Turns off Music Mode"},
    {"MU_TOG", "Music\nToggle", "Toggles Music Mode"},
    {"MU_MOD", "Music\nCycle", "Cycles through the music modes"},
    // haptic
    {"HPT_ON", "Haptic\nOn", "Turn haptic feedback on"},
    {"HPT_OFF", "Haptic\nOff", "Turn haptic feedback off"},
    {"HPT_TOG", "Haptic\nToggle", "Toggle haptic feedback on/off"},
    {"HPT_RST", "Haptic\nReset", "Reset haptic feedback config to default"},
    {"HPT_FBK", "Haptic\nFeed\nback", "Toggle feedback to occur on keypress, release or both"},
    {"HPT_BUZ", "Haptic\nBuzz", "Toggle solenoid buzz on/off"},
    {"HPT_MODI", "Haptic\nNext", "Go to next DRV2605L waveform"},
    {"HPT_MODD", "Haptic\nPrev", "Go to previous DRV2605L waveform"},
    {"HPT_CONT", "Haptic\nCont.", "Toggle continuous haptic mode on/off"},
    {"HPT_CONI", "Haptic\n+", "Increase DRV2605L continous haptic strength"},
    {"HPT_COND", "Haptic\n-", "Decrease DRV2605L continous haptic strength"},
    {"HPT_DWLI", "Haptic\nDwell+", "Increase Solenoid dwell time"},
    {"HPT_DWLD", "Haptic\nDwell-", "Decrease Solenoid dwell time"},
    {"KC_ASDN", "Auto-\nshift\nDown", "Lower the Auto Shift timeout variable (down)"},
    {"KC_ASUP", "Auto-\nshift\nUp", "Raise the Auto Shift timeout variable (up)"},
    {"KC_ASRP", "Auto-\nshift\nReport", "Report your current Auto Shift timeout value"},
    {"KC_ASON", "Auto-\nshift\nOn", "Turns on the Auto Shift Function"},
    {"KC_ASOFF", "Auto-\nshift\nOff", "Turns off the Auto Shift Function"},
    {"KC_ASTG", "Auto-\nshift\nToggle", "Toggles the state of the Auto Shift feature"},
    {"CMB_ON", "Combo\nOn", "Turns on Combo feature"},
    {"CMB_OFF", "Combo\nOff", "Turns off Combo feature"},
    {"CMB_TOG", "Combo\nToggle", "Toggles Combo feature on and off"},
    {"QK_KEY_OVERRIDE_TOGGLE", "Key\nOverride\nToggle", "Toggle key overrides", {"KO_TOGG"}},
    {"QK_KEY_OVERRIDE_ON", "Key\nOverride\nOn", "Turn on key overrides", {"KO_ON"}},
    {"QK_KEY_OVERRIDE_OFF", "Key\nOverride\nOff", "Turn off key overrides", {"KO_OFF"}},
    {"QK_CAPS_WORD_TOGGLE", "Caps\nWord", "Capitalizes until end of current word", {"CW_TOGG"}, {}, "", "caps_word"},
    {"QK_REPEAT_KEY", "Repeat", "Repeats the last pressed key", {"QK_REP"}, {}, "", "repeat_key"},
    {"QK_ALT_REPEAT_KEY", "Alt\nRepeat", "Alt repeats the last pressed key", {"QK_AREP"}, {}, "", "repeat_key"},
    // swap hands
    {"SH_TOGG", "SH\nToggle", "Toggle swap hands"},
    {"SH_TT", "SH\nTT", "Momentary swap when held, toggle when tapped"},
    {"SH_MON", "SH\nMOn", "Momentary swap hands on"},
    {"SH_MOFF", "SH\nMOff", "Momentary swap hands off"},
    {"SH_OFF", "SH\nOff", "Turn off swap hands"},
    {"SH_ON", "SH\nOn", "Turn on swap hands"},
    {"SH_OS", "SH\nOS", "One-shot swap hands"},
    {"SH_T(kc)", "SH_T\n(kc)", "Swap hands when held, kc when tapped"},
};

// -----------------------------------------------------------------------
// Lighting
// -----------------------------------------------------------------------

static const std::vector<KeycodeDef> backlight_keys = {
    {"BL_TOGG", "BL\nToggle", "Turn the backlight on or off"},
    {"BL_STEP", "BL\nCycle", "Cycle through backlight levels"},
    {"BL_BRTG", "BL\nBreath", "Toggle backlight breathing"},
    {"BL_ON", "BL On", "Set the backlight to max brightness"},
    {"BL_OFF", "BL Off", "Turn the backlight off"},
    {"BL_INC", "BL +", "Increase the backlight level"},
    {"BL_DEC", "BL - ", "Decrease the backlight level"},
    // RGB underglow
    {"RGB_TOG", "RGB\nToggle", "Toggle RGB lighting on or off"},
    {"RGB_MOD", "RGB\nMode +", "Next RGB mode"},
    {"RGB_RMOD", "RGB\nMode -", "Previous RGB mode"},
    {"RGB_HUI", "Hue +", "Increase hue"},
    {"RGB_HUD", "Hue -", "Decrease hue"},
    {"RGB_SAI", "Sat +", "Increase saturation"},
    {"RGB_SAD", "Sat -", "Decrease saturation"},
    {"RGB_VAI", "Bright +", "Increase value"},
    {"RGB_VAD", "Bright -", "Decrease value"},
    {"RGB_SPI", "Effect +", "Increase RGB effect speed"},
    {"RGB_SPD", "Effect -", "Decrease RGB effect speed"},
    {"RGB_M_P", "RGB\nMode P", "RGB Mode: Plain"},
    {"RGB_M_B", "RGB\nMode B", "RGB Mode: Breathe"},
    {"RGB_M_R", "RGB\nMode R", "RGB Mode: Rainbow"},
    {"RGB_M_SW", "RGB\nMode SW", "RGB Mode: Swirl"},
    {"RGB_M_SN", "RGB\nMode SN", "RGB Mode: Snake"},
    {"RGB_M_K", "RGB\nMode K", "RGB Mode: Knight Rider"},
    {"RGB_M_X", "RGB\nMode X", "RGB Mode: Christmas"},
    {"RGB_M_G", "RGB\nMode G", "RGB Mode: Gradient"},
    {"RGB_M_T", "RGB\nMode T", "RGB Mode: Test"},
    // RGB matrix
    {"RM_ON", "RGBM\nOn", "Turn on RGB Matrix"},
    {"RM_OFF", "RGBM\nOff", "Turn off RGB Matrix"},
    {"RM_TOGG", "RGBM\nTogg", "Toggle RGB Matrix on or off"},
    {"RM_NEXT", "RGBM\nNext", "Cycle through animations"},
    {"RM_PREV", "RGBM\nPrev", "Cycle through animations in reverse"},
    {"RM_HUEU", "RGBM\nHue +", "Cycle through hue"},
    {"RM_HUED", "RGBM\nHue -", "Cycle through hue in reverse"},
    {"RM_SATU", "RGBM\nSat +", "Increase the saturation"},
    {"RM_SATD", "RGBM\nSat -", "Decrease the saturation"},
    {"RM_VALU", "RGBM\nBright +", "Increase the brightness level"},
    {"RM_VALD", "RGBM\nBright -", "Decrease the brightness level"},
    {"RM_SPDU", "RGBM\nSpeed +", "Increase the animation speed"},
    {"RM_SPDD", "RGBM\nSpeed -", "Decrease the animation speed"},
    // LED matrix
    {"LM_ON", "LED\nOn", "Turn on LED Matrix"},
    {"LM_OFF", "LED\nOff", "Turn off LED Matrix"},
    {"LM_TOGG", "LED\nTogg", "Toggle LED Matrix on or off"},
    {"LM_NEXT", "LED\nNext", "Cycle through LED Matrix animations"},
    {"LM_PREV", "LED\nPrev", "Cycle through LED Matrix animations in reverse"},
    {"LM_BRIU", "LED\nBright +", "Increase LED Matrix brightness"},
    {"LM_BRID", "LED\nBright -", "Decrease LED Matrix brightness"},
    {"LM_SPDU", "LED\nSpeed +", "Increase LED Matrix animation speed"},
    {"LM_SPDD", "LED\nSpeed -", "Decrease LED Matrix animation speed"},
};

// -----------------------------------------------------------------------
// Media, system and mouse
// -----------------------------------------------------------------------

static const std::vector<KeycodeDef> media_static_keys = {
    {"KC_F13", "F13"},
    {"KC_F14", "F14"},
    {"KC_F15", "F15"},
    {"KC_F16", "F16"},
    {"KC_F17", "F17"},
    {"KC_F18", "F18"},
    {"KC_F19", "F19"},
    {"KC_F20", "F20"},
    {"KC_F21", "F21"},
    {"KC_F22", "F22"},
    {"KC_F23", "F23"},
    {"KC_F24", "F24"},
    {"KC_PWR", "Power", "System Power Down", {"KC_SYSTEM_POWER"}},
    {"KC_SLEP", "Sleep", "System Sleep", {"KC_SYSTEM_SLEEP"}},
    {"KC_WAKE", "Wake", "System Wake", {"KC_SYSTEM_WAKE"}},
    {"KC_EXEC", "Exec", "Execute", {"KC_EXECUTE"}},
    {"KC_HELP", "Help"},
    {"KC_SLCT", "Select", "", {"KC_SELECT"}},
    {"KC_STOP", "Stop"},
    {"KC_AGIN", "Again", "", {"KC_AGAIN"}},
    {"KC_UNDO", "Undo"},
    {"KC_CUT", "Cut"},
    {"KC_COPY", "Copy"},
    {"KC_PSTE", "Paste", "", {"KC_PASTE"}},
    {"KC_FIND", "Find"},
    {"KC_CALC", "Calc", "Launch Calculator (Windows)", {"KC_CALCULATOR"}},
    {"KC_MAIL", "Mail", "Launch Mail (Windows)"},
    {"KC_MSEL", "Media\nPlayer", "Launch Media Player (Windows)", {"KC_MEDIA_SELECT"}},
    {"KC_MYCM", "My\nPC", "Launch My Computer (Windows)", {"KC_MY_COMPUTER"}},
    {"KC_WSCH", "Browser\nSearch", "Browser Search (Windows)", {"KC_WWW_SEARCH"}},
    {"KC_WHOM", "Browser\nHome", "Browser Home (Windows)", {"KC_WWW_HOME"}},
    {"KC_WBAK", "Browser\nBack", "Browser Back (Windows)", {"KC_WWW_BACK"}},
    {"KC_WFWD", "Browser\nForward", "Browser Forward (Windows)", {"KC_WWW_FORWARD"}},
    {"KC_WSTP", "Browser\nStop", "Browser Stop (Windows)", {"KC_WWW_STOP"}},
    {"KC_WREF", "Browser\nRefresh", "Browser Refresh (Windows)", {"KC_WWW_REFRESH"}},
    {"KC_WFAV", "Browser\nFav.", "Browser Favorites (Windows)", {"KC_WWW_FAVORITES"}},
    {"KC_BRIU", "Bright.\nUp", "Increase the brightness of screen (Laptop)", {"KC_BRIGHTNESS_UP"}},
    {"KC_BRID", "Bright.\nDown", "Decrease the brightness of screen (Laptop)", {"KC_BRIGHTNESS_DOWN"}},
    {"KC_MPRV", "Media\nPrev", "Previous Track", {"KC_MEDIA_PREV_TRACK"}},
    {"KC_MNXT", "Media\nNext", "Next Track", {"KC_MEDIA_NEXT_TRACK"}},
    {"KC_MUTE", "Mute", "Mute Audio", {"KC_AUDIO_MUTE"}},
    {"KC_VOLD", "Vol -", "Volume Down", {"KC_AUDIO_VOL_DOWN"}},
    {"KC_VOLU", "Vol +", "Volume Up", {"KC_AUDIO_VOL_UP"}},
    {"KC__VOLDOWN", "Vol -\nAlt", "Volume Down Alternate"},
    {"KC__VOLUP", "Vol +\nAlt", "Volume Up Alternate"},
    {"KC_MSTP", "Media\nStop", "", {"KC_MEDIA_STOP"}},
    {"KC_MPLY", "Media\nPlay", "Play/Pause", {"KC_MEDIA_PLAY_PAUSE"}},
    {"KC_MRWD", "Prev\nTrack\n(macOS)", "Previous Track / Rewind (macOS)", {"KC_MEDIA_REWIND"}},
    {"KC_MFFD", "Next\nTrack\n(macOS)", "Next Track / Fast Forward (macOS)", {"KC_MEDIA_FAST_FORWARD"}},
    {"KC_EJCT", "Eject", "Eject (macOS)", {"KC_MEDIA_EJECT"}},
    // mouse keys
    {"KC_MS_U", "Mouse\nUp", "Mouse Cursor Up", {"KC_MS_UP"}},
    {"KC_MS_D", "Mouse\nDown", "Mouse Cursor Down", {"KC_MS_DOWN"}},
    {"KC_MS_L", "Mouse\nLeft", "Mouse Cursor Left", {"KC_MS_LEFT"}},
    {"KC_MS_R", "Mouse\nRight", "Mouse Cursor Right", {"KC_MS_RIGHT"}},
    {"KC_BTN1", "Mouse\n1", "Mouse Button 1", {"KC_MS_BTN1"}},
    {"KC_BTN2", "Mouse\n2", "Mouse Button 2", {"KC_MS_BTN2"}},
    {"KC_BTN3", "Mouse\n3", "Mouse Button 3", {"KC_MS_BTN3"}},
    {"KC_BTN4", "Mouse\n4", "Mouse Button 4", {"KC_MS_BTN4"}},
    {"KC_BTN5", "Mouse\n5", "Mouse Button 5", {"KC_MS_BTN5"}},
    {"KC_WH_U", "Mouse\nWheel\nUp", "", {"KC_MS_WH_UP"}},
    {"KC_WH_D", "Mouse\nWheel\nDown", "", {"KC_MS_WH_DOWN"}},
    {"KC_WH_L", "Mouse\nWheel\nLeft", "", {"KC_MS_WH_LEFT"}},
    {"KC_WH_R", "Mouse\nWheel\nRight", "", {"KC_MS_WH_RIGHT"}},
    {"KC_ACL0", "Mouse\nAccel\n0", "Set mouse acceleration to 0", {"KC_MS_ACCEL0"}},
    {"KC_ACL1", "Mouse\nAccel\n1", "Set mouse acceleration to 1", {"KC_MS_ACCEL1"}},
    {"KC_ACL2", "Mouse\nAccel\n2", "Set mouse acceleration to 2", {"KC_MS_ACCEL2"}},
    {"KC_LCAP", "Locking\nCaps", "Locking Caps Lock", {"KC_LOCKING_CAPS"}},
    {"KC_LNUM", "Locking\nNum", "Locking Num Lock", {"KC_LOCKING_NUM"}},
    {"KC_LSCR", "Locking\nScroll", "Locking Scroll Lock", {"KC_LOCKING_SCROLL"}},
};

static std::vector<KeycodeDef> make_media_keys() {
    std::vector<KeycodeDef> v = media_static_keys;
    for (int i = 0; i < 32; ++i) {
        std::string n = std::to_string(i);
        v.push_back({"JS_" + n, "JS\n" + n, "Joystick button " + n});
    }
    return v;
}

// -----------------------------------------------------------------------
// Dynamic macros
// -----------------------------------------------------------------------

static const std::vector<KeycodeDef> macro_base_keys = {
    {"DYN_REC_START1", "DM1\nRec", "Dynamic Macro 1 Rec Start", {"DM_REC1"}},
    {"DYN_REC_START2", "DM2\nRec", "Dynamic Macro 2 Rec Start", {"DM_REC2"}},
    {"DYN_REC_STOP", "DM Rec\nStop", "Dynamic Macro Rec Stop", {"DM_RSTP"}},
    {"DYN_MACRO_PLAY1", "DM1\nPlay", "Dynamic Macro 1 Play", {"DM_PLY1"}},
    {"DYN_MACRO_PLAY2", "DM2\nPlay", "Dynamic Macro 2 Play", {"DM_PLY2"}},
};

// -----------------------------------------------------------------------
// MIDI
// -----------------------------------------------------------------------

// Note suffixes in id order, with the display name used in labels
static const std::vector<std::pair<std::string, std::string>> midi_notes = {
    {"C", "C"}, {"Cs", "C#/Db"}, {"D", "D"}, {"Ds", "D#/Eb"}, {"E", "E"},
    {"F", "F"}, {"Fs", "F#/Gb"}, {"G", "G"}, {"Gs", "G#/Ab"}, {"A", "A"},
    {"As", "A#/Bb"}, {"B", "B"},
};

static std::vector<KeycodeDef> make_midi_basic_keys() {
    std::vector<KeycodeDef> v;
    for (auto& [suffix, name] : midi_notes) {
        KeycodeDef d{"MI_" + suffix, "MI\n" + name, "Midi send note " + name};
        // flat spelling of the sharps, "MI_Cs" -> "MI_Db"
        if (name.size() > 1) d.aliases.push_back("MI_" + name.substr(3, 1) + "b");
        v.push_back(d);
    }
    for (int oct = 1; oct <= 5; ++oct) {
        std::string o = std::to_string(oct);
        for (auto& note : midi_notes) {
            const std::string& s = note.first;
            v.push_back({"MI_" + s + "_" + o, "MI\n" + s + o, "Midi send note " + s + o});
        }
    }
    v.push_back({"MI_ALLOFF", "MI\nNotesOff", "Midi send all notes OFF"});
    return v;
}

static const std::vector<KeycodeDef> midi_octave_keys = {
    {"MI_OCT_N2", "MI\nOct-2", "Midi set octave to -2"},
    {"MI_OCT_N1", "MI\nOct-1", "Midi set octave to -1"},
    {"MI_OCT_0", "MI\nOct0", "Midi set octave to 0"},
    {"MI_OCT_1", "MI\nOct+1", "Midi set octave to 1"},
    {"MI_OCT_2", "MI\nOct+2", "Midi set octave to 2"},
    {"MI_OCT_3", "MI\nOct+3", "Midi set octave to 3"},
    {"MI_OCT_4", "MI\nOct+4", "Midi set octave to 4"},
    {"MI_OCT_5", "MI\nOct+5", "Midi set octave to 5"},
    {"MI_OCT_6", "MI\nOct+6", "Midi set octave to 6"},
    {"MI_OCT_7", "MI\nOct+7", "Midi set octave to 7"},
    {"MI_OCTD", "MI\nOctDN", "Midi move down an octave"},
    {"MI_OCTU", "MI\nOctUP", "Midi move up an octave"},
};

static const std::vector<KeycodeDef> midi_control_keys = {
    {"MI_SUS", "MI\nSust", "Midi Sustain"},
    {"MI_PORT", "MI\nPort", "Midi Portmento"},
    {"MI_SOST", "MI\nSost", "Midi Sostenuto"},
    {"MI_SOFT", "MI\nSPedal", "Midi Soft Pedal"},
    {"MI_LEG", "MI\nLegat", "Midi Legato"},
    {"MI_MOD", "MI\nModul", "Midi Modulation"},
    {"MI_MODSD", "MI\nModulDN", "Midi decrease modulation speed"},
    {"MI_MODSU", "MI\nModulUP", "Midi increase modulation speed"},
    {"MI_BENDD", "MI\nBendDN", "Midi bend pitch down"},
    {"MI_BENDU", "MI\nBendUP", "Midi bend pitch up"},
};

static const std::vector<KeycodeDef> midi_sequencer_keys = {
    {"SQ_ON", "SQ\nOn", "Sequencer on"},
    {"SQ_OFF", "SQ\nOff", "Sequencer off"},
    {"SQ_TOGG", "SQ\nToggle", "Toggle sequencer"},
    {"SQ_TMPD", "SQ\nTempo-", "Decrease sequencer tempo"},
    {"SQ_TMPU", "SQ\nTempo+", "Increase sequencer tempo"},
    {"SQ_RESD", "SQ\nRes-", "Decrease sequencer resolution"},
    {"SQ_RESU", "SQ\nRes+", "Increase sequencer resolution"},
    {"SQ_SALL", "SQ\nAll", "Select all sequencer steps"},
    {"SQ_SCLR", "SQ\nClear", "Clear all sequencer steps"},
};

static std::vector<KeycodeDef> make_midi_advanced_keys() {
    std::vector<KeycodeDef> v = midi_octave_keys;
    for (int n = -6; n <= 6; ++n) {
        std::string id   = n < 0 ? "N" + std::to_string(-n) : std::to_string(n);
        std::string sign = n > 0 ? "+" : "";
        v.push_back({"MI_TRNS_" + id, "MI\nTrans" + sign + std::to_string(n),
                     "Midi set transposition to " + std::to_string(n) + " semitones"});
    }
    for (int n = 1; n <= 10; ++n) {
        std::string s = std::to_string(n);
        v.push_back({"MI_VEL_" + s, "MI\nVel" + s, "Midi set velocity to " + s});
    }
    for (int n = 1; n <= 16; ++n) {
        std::string s = std::to_string(n);
        v.push_back({"MI_CH" + s, "MI\nCH" + s, "Midi set channel to " + s});
    }
    v.insert(v.end(), midi_control_keys.begin(), midi_control_keys.end());
    v.insert(v.end(), midi_sequencer_keys.begin(), midi_sequencer_keys.end());
    return v;
}

// -----------------------------------------------------------------------
// Hidden range
// -----------------------------------------------------------------------

static std::vector<KeycodeDef> make_hidden_keys() {
    std::vector<KeycodeDef> v;
    for (int x = 0; x < 256; ++x) {
        std::string id = "TD(" + std::to_string(x) + ")";
        v.push_back({id, id});
    }
    return v;
}

// -----------------------------------------------------------------------
// Lookup
// -----------------------------------------------------------------------

const std::vector<KeycodeDef>& catalog(CatalogGroup group) {
    static const std::vector<KeycodeDef> media         = make_media_keys();
    static const std::vector<KeycodeDef> midi_basic    = make_midi_basic_keys();
    static const std::vector<KeycodeDef> midi_advanced = make_midi_advanced_keys();
    static const std::vector<KeycodeDef> hidden        = make_hidden_keys();

    switch (group) {
    case CatalogGroup::Special:      return special_keys;
    case CatalogGroup::Basic:        return basic_keys;
    case CatalogGroup::Shifted:      return shifted_keys;
    case CatalogGroup::Iso:          return iso_keys;
    case CatalogGroup::Boot:         return boot_keys;
    case CatalogGroup::Modifiers:    return modifier_keys;
    case CatalogGroup::Quantum:      return quantum_keys;
    case CatalogGroup::Backlight:    return backlight_keys;
    case CatalogGroup::Media:        return media;
    case CatalogGroup::MacroBase:    return macro_base_keys;
    case CatalogGroup::MidiBasic:    return midi_basic;
    case CatalogGroup::MidiAdvanced: return midi_advanced;
    case CatalogGroup::Hidden:       return hidden;
    case CatalogGroup::LayerModMods: return lm_mod_keys;
    }
    return special_keys;
}

const std::vector<LayerFamilyDef>& layer_families() {
    static const std::vector<LayerFamilyDef> families = {
        {"MO",  "Momentarily turn on layer when pressed (requires KC_TRNS on destination layer)", nullptr},
        {"DF",  "Set the base (default) layer", nullptr},
        {"PDF", "Persistently set the base (default) layer", "persistent_default_layer"},
        {"TG",  "Toggle layer on or off", nullptr},
        {"TT",  "Normally acts like MO unless it's tapped multiple times, which toggles layer on", nullptr},
        {"OSL", "Momentarily activates layer until a key is pressed", nullptr},
        {"TO",  "Turns on layer and turns off all other layers, except the default layer", nullptr},
    };
    return families;
}

const std::vector<ShiftedSymbol>& shifted_symbols() {
    static const std::vector<ShiftedSymbol> table = {
        {"KC_TILD", "KC_GRAVE"},    {"KC_EXLM", "KC_1"},        {"KC_AT",   "KC_2"},
        {"KC_HASH", "KC_3"},        {"KC_DLR",  "KC_4"},        {"KC_PERC", "KC_5"},
        {"KC_CIRC", "KC_6"},        {"KC_AMPR", "KC_7"},        {"KC_ASTR", "KC_8"},
        {"KC_LPRN", "KC_9"},        {"KC_RPRN", "KC_0"},        {"KC_UNDS", "KC_MINUS"},
        {"KC_PLUS", "KC_EQUAL"},    {"KC_LCBR", "KC_LBRACKET"}, {"KC_RCBR", "KC_RBRACKET"},
        {"KC_LT",   "KC_COMMA"},    {"KC_GT",   "KC_DOT"},      {"KC_COLN", "KC_SCOLON"},
        {"KC_PIPE", "KC_BSLASH"},   {"KC_QUES", "KC_SLASH"},    {"KC_DQUO", "KC_QUOTE"},
    };
    return table;
}
