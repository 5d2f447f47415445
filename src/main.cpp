#include <getopt.h>
#include <iomanip>
#include <iostream>
#include <sstream>
#include <stdexcept>
#include <string>
#include <vector>

#include "codec.h"
#include "config.h"
#include "expression.h"
#include "keymap.h"

// -----------------------------------------------------------------------
// Version
// -----------------------------------------------------------------------
static constexpr const char* VERSION = "1.0.0";

// -----------------------------------------------------------------------
// Help text
// -----------------------------------------------------------------------
static void print_help(const char* prog) {
    std::cout <<
R"(Usage: )" << prog << R"HELP( [OPTIONS]

Convert QMK/Vial keycodes between their 16-bit firmware value and text.

Options:
  -c, --config FILE        Load the keyboard context (protocol, layers,
                           macros, tap dances, features, custom keycodes)
                           from an INI file
  -p, --protocol 5|6       Vial protocol to use (default: 5, or the
                           protocol named by --config)

  -s, --serialize VALUE    Print the text form of a keycode value
                           (decimal or 0x hex)
  -d, --deserialize TEXT   Print the value of a keycode expression,
                           e.g. "LT(2, KC_A)" or "MOD_LCTL | MOD_LSFT"
  -n, --normalize TEXT     Print the canonical text form of TEXT
  --label TEXT             Print the display label of a keycode
  --tooltip TEXT           Print the tooltip of a keycode
  --c-export VALUE         Print text usable in a QMK keymap.c

  --list[=CATEGORY]        List keycodes offered to the user, optionally
                           only one category (basic, layers, media, ...)

  --keymap "TEXT,TEXT,..." Encode keycodes into a keymap buffer (two bytes
                           per key, big-endian) and hexdump it
  --decode-keymap HEX      Decode a keymap buffer ("00 04 7c 00") back to
                           text

  -h, --help               Show this help and exit
  -V, --version            Show the version and exit

Conversions run in the order given on the command line.

Examples:
  kcodec-ctl -s 0x7c00 -p 6
  kcodec-ctl -d "LT(2, KC_A)" -d "LCTL_T(KC_ESC)"
  kcodec-ctl -n KC_EXLM
  kcodec-ctl --config examples/keyboard.ini --list=layers
  kcodec-ctl -p 6 --keymap "KC_ESC,KC_Q,LT(1,KC_SPC),QK_BOOT"
  kcodec-ctl -p 6 --decode-keymap "00 29 00 14 41 2c 7c 00"
)HELP";
}

// -----------------------------------------------------------------------
// Operations
// -----------------------------------------------------------------------

enum class Op {
    Serialize,
    Deserialize,
    Normalize,
    Label,
    Tooltip,
    CExport,
    List,
    Keymap,
    DecodeKeymap,
};

struct Request {
    Op          op;
    std::string arg;
};

static std::string one_line(std::string s) {
    for (auto& c : s) {
        if (c == '\n') c = ' ';
    }
    return s;
}

static std::string hex16(uint32_t v) {
    std::ostringstream ss;
    ss << "0x" << std::hex << std::setw(4) << std::setfill('0') << v;
    return ss.str();
}

static uint32_t parse_value_arg(const std::string& arg, const char* option) {
    uint32_t v;
    if (!parse_literal(arg, v))
        throw std::runtime_error(std::string("invalid value '") + arg + "' for " + option +
                                 " (expect decimal or 0x hex)");
    return v;
}

// deserialize() maps bad text to 0; tell that apart from a real KC_NO
static void warn_if_unresolved(const Keycodes& kc, const std::string& text, uint32_t value) {
    if (value != 0) return;
    uint32_t v;
    if (parse_literal(text, v) || kc.registry().find_alias(text) ||
        evaluate(text, kc.registry(), v))
        return;
    std::cerr << "Warning: '" << text << "' does not name a keycode, using KC_NO\n";
}

// Split on commas outside parentheses: "KC_A, LT(1,KC_SPC)" -> 2 items
static std::vector<std::string> split_keymap_list(const std::string& s) {
    std::vector<std::string> items;
    std::string cur;
    int depth = 0;
    auto flush = [&]() {
        size_t b = cur.find_first_not_of(" \t");
        size_t e = cur.find_last_not_of(" \t");
        if (b != std::string::npos) items.push_back(cur.substr(b, e - b + 1));
        cur.clear();
    };
    for (char c : s) {
        if (c == '(') ++depth;
        if (c == ')') --depth;
        if (c == ',' && depth <= 0) flush();
        else cur += c;
    }
    flush();
    return items;
}

static void list_category(const Keycodes& kc, KeycodeCategory c) {
    auto keycodes = kc.registry().category(c);
    if (keycodes.empty()) return;

    std::cout << "[" << category_name(c) << "]\n";
    for (const Keycode* k : keycodes) {
        uint32_t value = 0;
        if (!kc.registry().value_of(*k, value)) continue;
        std::cout << "  " << std::left << std::setw(28) << k->id << std::right
                  << hex16(value) << "  " << one_line(k->label) << "\n";
    }
}

static void run(const Keycodes& kc, const Request& r) {
    switch (r.op) {
    case Op::Serialize: {
        uint32_t v = parse_value_arg(r.arg, "--serialize");
        std::cout << hex16(v) << " -> " << kc.serialize(v) << "\n";
        break;
    }
    case Op::Deserialize: {
        uint32_t v = kc.deserialize(r.arg);
        warn_if_unresolved(kc, r.arg, v);
        std::cout << r.arg << " -> " << hex16(v) << "\n";
        break;
    }
    case Op::Normalize: {
        uint32_t v = kc.deserialize(r.arg);
        warn_if_unresolved(kc, r.arg, v);
        std::cout << r.arg << " -> " << kc.serialize(v) << "\n";
        break;
    }
    case Op::Label:
        std::cout << one_line(kc.keycode_label(r.arg)) << "\n";
        break;
    case Op::Tooltip: {
        auto tip = kc.keycode_tooltip(r.arg);
        if (!tip) throw std::runtime_error("unknown keycode '" + r.arg + "'");
        std::cout << *tip << "\n";
        break;
    }
    case Op::CExport: {
        uint32_t v = parse_value_arg(r.arg, "--c-export");
        std::cout << kc.serialize_for_c_export(v) << "\n";
        break;
    }
    case Op::List: {
        if (r.arg.empty()) {
            for (auto c : all_categories()) list_category(kc, c);
            break;
        }
        KeycodeCategory c;
        if (!parse_category(r.arg, c))
            throw std::runtime_error("unknown category '" + r.arg + "'");
        list_category(kc, c);
        break;
    }
    case Op::Keymap: {
        std::vector<uint32_t> values;
        for (auto& text : split_keymap_list(r.arg)) {
            uint32_t v = kc.deserialize(text);
            warn_if_unresolved(kc, text, v);
            values.push_back(v);
        }
        hexdump_keymap(encode_keymap(values),
                       "Keymap (" + std::to_string(values.size()) + " keys):");
        break;
    }
    case Op::DecodeKeymap: {
        std::vector<uint8_t> bytes;
        if (!parse_hex_bytes(r.arg, bytes))
            throw std::runtime_error("invalid hex bytes in --decode-keymap");
        std::vector<uint32_t> values;
        if (!decode_keymap(bytes, values))
            throw std::runtime_error("keymap buffer has an odd number of bytes (" +
                                     std::to_string(bytes.size()) + ")");
        for (size_t i = 0; i < values.size(); ++i)
            std::cout << std::setw(4) << i << ": " << kc.serialize(values[i]) << "\n";
        break;
    }
    }
}

// -----------------------------------------------------------------------
// main
// -----------------------------------------------------------------------
int main(int argc, char* argv[]) {
    if (argc < 2) {
        print_help(argv[0]);
        return 0;
    }

    // ---- option definitions ----
    struct option long_opts[] = {
        {"help",          no_argument,       nullptr, 'h'},
        {"version",       no_argument,       nullptr, 'V'},
        {"config",        required_argument, nullptr, 'c'},
        {"protocol",      required_argument, nullptr, 'p'},
        {"serialize",     required_argument, nullptr, 's'},
        {"deserialize",   required_argument, nullptr, 'd'},
        {"normalize",     required_argument, nullptr, 'n'},
        {"label",         required_argument, nullptr, 1001},
        {"tooltip",       required_argument, nullptr, 1002},
        {"list",          optional_argument, nullptr, 1003},
        {"keymap",        required_argument, nullptr, 1004},
        {"decode-keymap", required_argument, nullptr, 1005},
        {"c-export",      required_argument, nullptr, 1006},
        {nullptr, 0, nullptr, 0}
    };

    // ---- collect requested operations ----
    std::string          config_file;
    int                  protocol = 0;  // 0 = not set
    std::vector<Request> requests;

    int opt;
    while ((opt = getopt_long(argc, argv, "hVc:p:s:d:n:", long_opts, nullptr)) != -1) {
        switch (opt) {
        case 'h':
            print_help(argv[0]);
            return 0;

        case 'V':
            std::cout << "kcodec-ctl " << VERSION << "\n";
            return 0;

        case 'c':
            config_file = optarg;
            break;

        case 'p': {
            std::string arg = optarg;
            if (arg == "5")      protocol = KCODEC_PROTOCOL_V5;
            else if (arg == "6") protocol = KCODEC_PROTOCOL_V6;
            else {
                std::cerr << "Error: --protocol must be 5 or 6\n";
                return 1;
            }
            break;
        }

        case 's':  requests.push_back({Op::Serialize, optarg});   break;
        case 'd':  requests.push_back({Op::Deserialize, optarg}); break;
        case 'n':  requests.push_back({Op::Normalize, optarg});   break;
        case 1001: requests.push_back({Op::Label, optarg});       break;
        case 1002: requests.push_back({Op::Tooltip, optarg});     break;
        case 1003: requests.push_back({Op::List, optarg ? optarg : ""}); break;
        case 1004: requests.push_back({Op::Keymap, optarg});      break;
        case 1005: requests.push_back({Op::DecodeKeymap, optarg}); break;
        case 1006: requests.push_back({Op::CExport, optarg});     break;

        default:
            std::cerr << "Use --help for usage.\n";
            return 1;
        }
    }

    if (optind < argc) {
        std::cerr << "Error: unexpected argument '" << argv[optind] << "'\n";
        return 1;
    }

    if (requests.empty()) {
        print_help(argv[0]);
        return 0;
    }

    try {
        Keycodes kc;

        if (!config_file.empty())
            kc.recreate_keyboard_keycodes(load_context_file(config_file));
        if (protocol != 0)
            kc.set_protocol(protocol);

        for (auto& r : requests) run(kc, r);

    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }

    return 0;
}
