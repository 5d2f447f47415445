#include "config.h"

#include <cctype>
#include <fstream>
#include <regex>
#include <stdexcept>
#include <string>
#include <vector>

// -----------------------------------------------------------------------
// Helpers
// -----------------------------------------------------------------------

static std::string trim(const std::string& s) {
    const char* ws = " \t\r\n";
    size_t start = s.find_first_not_of(ws);
    if (start == std::string::npos) return "";
    size_t end = s.find_last_not_of(ws);
    return s.substr(start, end - start + 1);
}

static std::string to_lower(std::string s) {
    for (auto& c : s) c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    return s;
}

static bool parse_int(const std::string& s, int& out) {
    static const std::regex re_int(R"(^-?[0-9]+$)");
    if (!std::regex_match(s, re_int) || s.size() > 9) return false;
    out = std::stoi(s);
    return true;
}

// "NAME, Title, Short" -> up to three trimmed fields
static std::vector<std::string> split_fields(const std::string& s) {
    std::vector<std::string> fields;
    size_t start = 0;
    while (fields.size() < 2) {
        size_t comma = s.find(',', start);
        if (comma == std::string::npos) break;
        fields.push_back(trim(s.substr(start, comma - start)));
        start = comma + 1;
    }
    fields.push_back(trim(s.substr(start)));
    return fields;
}

bool parse_flag(const std::string& value, bool& out) {
    std::string v = to_lower(value);
    if (v == "true" || v == "yes" || v == "on" || v == "1")   { out = true;  return true; }
    if (v == "false" || v == "no" || v == "off" || v == "0")  { out = false; return true; }
    return false;
}

// -----------------------------------------------------------------------
// INI parser
// -----------------------------------------------------------------------

ContextConfig parse_context_file(const std::string& path) {
    std::ifstream f(path);
    if (!f.is_open())
        throw std::runtime_error("Cannot open context file: " + path);

    ContextConfig cfg;
    KeyboardContext& ctx = cfg.context;
    std::string section;
    int lineno = 0;

    auto fail = [&](const std::string& msg) {
        throw std::runtime_error(path + ":" + std::to_string(lineno) + ": " + msg);
    };

    std::regex re_section(R"(^\[([^\]]+)\]$)");
    std::regex re_kv(R"(^([^=]+)=(.*)$)");

    std::string line;
    while (std::getline(f, line)) {
        ++lineno;
        line = trim(line);

        // Skip blank lines and comments
        if (line.empty() || line[0] == '#' || line[0] == ';')
            continue;

        std::smatch m;

        if (std::regex_match(line, m, re_section)) {
            section = to_lower(trim(m[1].str()));
            if (section != "keyboard" && section != "features" && section != "custom_keycodes")
                fail("unknown section [" + section + "]");
            continue;
        }

        if (!std::regex_match(line, m, re_kv))
            fail("expected key = value, got '" + line + "'");

        std::string key   = to_lower(trim(m[1].str()));
        std::string value = trim(m[2].str());

        if (section.empty())
            fail("'" + key + "' appears before any section");

        if (section == "keyboard") {
            if (key == "midi") {
                ctx.midi = to_lower(value);
                continue;
            }

            int n = 0;
            if (!parse_int(value, n))
                fail("invalid number '" + value + "' for " + key);

            if (key == "protocol")        ctx.protocol = n;
            else if (key == "layers")     ctx.layers = n;
            else if (key == "macros")     ctx.macro_count = n;
            else if (key == "tap_dances") ctx.tap_dance_count = n;
            else fail("unknown key '" + key + "' in [keyboard]");

        } else if (section == "features") {
            bool on = false;
            if (!parse_flag(value, on))
                fail("invalid flag '" + value + "' for feature " + key);
            if (on) ctx.supported_features.insert(key);
            else    ctx.supported_features.erase(key);

        } else if (section == "custom_keycodes") {
            int index = -1;
            if (!parse_int(key, index) || index < 0)
                fail("custom keycode index must be a non-negative number, got '" + key + "'");

            auto fields = split_fields(value);
            CustomKeycode kc;
            kc.name = fields[0];
            if (fields.size() > 1) kc.title      = fields[1];
            if (fields.size() > 2) kc.short_name = fields[2];

            if (!cfg.custom_keycodes.emplace(index, kc).second)
                fail("duplicate custom keycode index " + key);
        }
    }

    return cfg;
}

// -----------------------------------------------------------------------
// Validation
// -----------------------------------------------------------------------

void validate_context(const ContextConfig& cfg) {
    const KeyboardContext& ctx = cfg.context;

    if (ctx.protocol != 5 && ctx.protocol != 6)
        throw std::runtime_error("protocol must be 5 or 6 (got " +
                                 std::to_string(ctx.protocol) + ")");

    if (ctx.layers < 0 || ctx.layers > 32)
        throw std::runtime_error("layers must be 0-32 (got " + std::to_string(ctx.layers) + ")");

    if (ctx.macro_count < 0 || ctx.macro_count > 256)
        throw std::runtime_error("macros must be 0-256 (got " +
                                 std::to_string(ctx.macro_count) + ")");

    if (ctx.tap_dance_count < 0 || ctx.tap_dance_count > 256)
        throw std::runtime_error("tap_dances must be 0-256 (got " +
                                 std::to_string(ctx.tap_dance_count) + ")");

    if (!ctx.midi.empty() && ctx.midi != "basic" && ctx.midi != "advanced")
        throw std::runtime_error("midi must be basic or advanced (got '" + ctx.midi + "')");

    int expected = 0;
    for (auto& [index, kc] : cfg.custom_keycodes) {
        if (index != expected)
            throw std::runtime_error("custom keycode " + std::to_string(expected) +
                                     " is missing (next defined is " +
                                     std::to_string(index) + ")");
        ++expected;
    }
}

KeyboardContext to_keyboard_context(const ContextConfig& cfg) {
    validate_context(cfg);

    KeyboardContext ctx = cfg.context;
    ctx.custom_keycodes.clear();
    for (auto& [index, kc] : cfg.custom_keycodes) ctx.custom_keycodes.push_back(kc);
    return ctx;
}

KeyboardContext load_context_file(const std::string& path) {
    return to_keyboard_context(parse_context_file(path));
}
