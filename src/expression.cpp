#include "expression.h"

#include <map>
#include <regex>
#include <stdexcept>
#include <utility>
#include <vector>

// -----------------------------------------------------------------------
// Wrapper names
// -----------------------------------------------------------------------

static std::map<std::string, Wrapper> build_wrappers() {
    std::map<std::string, Wrapper> w;

    for (auto& c : mod_combos()) {
        w[c.wrap] = {WrapperKind::ModWrap, 1, static_cast<uint32_t>(c.mods) << 8};
        w[c.tap]  = {WrapperKind::ModTap, 1, c.mods};
    }

    static const std::pair<const char*, const char*> aliases[] = {
        {"LOPT", "LALT"}, {"LCMD", "LGUI"}, {"LWIN", "LGUI"},
        {"ALGR", "RALT"}, {"ROPT", "RALT"}, {"RCMD", "RGUI"}, {"RWIN", "RGUI"},
        {"C", "LCTL"}, {"S", "LSFT"}, {"A", "LALT"}, {"G", "LGUI"},
        {"SCMD", "SGUI"}, {"SWIN", "SGUI"}, {"LSG", "SGUI"},
        {"SAGR", "RSA"}, {"LCS", "C_S"},

        {"CTL_T", "LCTL_T"}, {"SFT_T", "LSFT_T"},
        {"ALT_T", "LALT_T"}, {"OPT_T", "LALT_T"}, {"LOPT_T", "LALT_T"},
        {"ROPT_T", "RALT_T"}, {"ALGR_T", "RALT_T"},
        {"GUI_T", "LGUI_T"}, {"CMD_T", "LGUI_T"}, {"WIN_T", "LGUI_T"},
        {"LCMD_T", "LGUI_T"}, {"LWIN_T", "LGUI_T"},
        {"RCMD_T", "RGUI_T"}, {"RWIN_T", "RGUI_T"},
        {"HYPR_T", "ALL_T"},
        {"SCMD_T", "SGUI_T"}, {"SWIN_T", "SGUI_T"}, {"LSG_T", "SGUI_T"},
        {"SAGR_T", "RSA_T"}, {"LCS_T", "C_S_T"},
    };
    for (auto& [alias, target] : aliases) w[alias] = w.at(target);

    w["LT"]   = {WrapperKind::LayerTap,               2, 0};
    w["LM"]   = {WrapperKind::LayerMod,               2, 0};
    w["MT"]   = {WrapperKind::ModTap,                 2, 0};
    w["TO"]   = {WrapperKind::ToLayer,                1, 0};
    w["MO"]   = {WrapperKind::Momentary,              1, 0};
    w["DF"]   = {WrapperKind::DefaultLayer,           1, 0};
    w["PDF"]  = {WrapperKind::PersistentDefaultLayer, 1, 0};
    w["TG"]   = {WrapperKind::ToggleLayer,            1, 0};
    w["OSL"]  = {WrapperKind::OneShotLayer,           1, 0};
    w["TT"]   = {WrapperKind::LayerTapToggle,         1, 0};
    w["TD"]   = {WrapperKind::TapDance,               1, 0};
    w["OSM"]  = {WrapperKind::OneShotMod,             1, 0};
    w["SH_T"] = {WrapperKind::SwapHandsTap,           1, 0};

    for (uint32_t layer = 0; layer < 16; ++layer) {
        w["LT" + std::to_string(layer)] = {WrapperKind::LayerTap, 1, layer};
        w["LM" + std::to_string(layer)] = {WrapperKind::LayerMod, 1, layer};
    }
    return w;
}

bool lookup_wrapper(const std::string& name, Wrapper& out) {
    static const std::map<std::string, Wrapper> wrappers = build_wrappers();
    auto it = wrappers.find(name);
    if (it == wrappers.end()) return false;
    out = it->second;
    return true;
}

static uint32_t apply_wrapper(const KeycodeTable& t, const Wrapper& w,
                              const std::vector<uint32_t>& args) {
    // Two-argument forms carry the bound value as their first argument
    const uint32_t bound = w.arity == 2 ? args[0] : w.fixed;
    const uint32_t arg   = args.back();

    switch (w.kind) {
    case WrapperKind::ModWrap:
        return w.fixed | arg;
    case WrapperKind::LayerTap:
        return t.resolve("QK_LAYER_TAP") | ((bound & 0x0F) << 8) | (arg & 0xFF);
    case WrapperKind::ToLayer:
        return t.resolve("QK_TO") | (t.resolve("ON_PRESS") << 4) | (arg & 0xFF);
    case WrapperKind::Momentary:
        return t.resolve("QK_MOMENTARY") | (arg & 0xFF);
    case WrapperKind::DefaultLayer:
        return t.resolve("QK_DEF_LAYER") | (arg & 0xFF);
    case WrapperKind::PersistentDefaultLayer:
        return t.resolve("QK_PERSISTENT_DEF_LAYER") | (arg & 0xFF);
    case WrapperKind::ToggleLayer:
        return t.resolve("QK_TOGGLE_LAYER") | (arg & 0xFF);
    case WrapperKind::OneShotLayer:
        return t.resolve("QK_ONE_SHOT_LAYER") | (arg & 0xFF);
    case WrapperKind::LayerTapToggle:
        return t.resolve("QK_LAYER_TAP_TOGGLE") | (arg & 0xFF);
    case WrapperKind::TapDance:
        return t.resolve("QK_TAP_DANCE") | (arg & 0xFF);
    case WrapperKind::LayerMod: {
        const LayerModLayout lm = t.layer_mod_layout();
        return lm.base | ((bound & 0x0F) << lm.shift) | (arg & lm.mod_mask);
    }
    case WrapperKind::OneShotMod:
        return t.resolve("QK_ONE_SHOT_MOD") | (arg & 0xFF);
    case WrapperKind::ModTap:
        return t.resolve("QK_MOD_TAP") | ((bound & 0x1F) << 8) | (arg & 0xFF);
    case WrapperKind::SwapHandsTap:
        return t.resolve("SH_T(kc)") | (arg & 0xFF);
    }
    throw std::logic_error("unhandled wrapper kind");
}

// -----------------------------------------------------------------------
// Literals
// -----------------------------------------------------------------------

bool parse_literal(const std::string& text, uint32_t& out) {
    if (text.empty()) return false;

    int    base  = 10;
    size_t start = 0;
    if (text.size() > 2 && text[0] == '0' && (text[1] == 'x' || text[1] == 'X')) {
        base  = 16;
        start = 2;
    }

    uint64_t value = 0;
    for (size_t i = start; i < text.size(); ++i) {
        char c = text[i];
        int  digit;
        if (c >= '0' && c <= '9')                   digit = c - '0';
        else if (base == 16 && c >= 'a' && c <= 'f') digit = c - 'a' + 10;
        else if (base == 16 && c >= 'A' && c <= 'F') digit = c - 'A' + 10;
        else return false;

        value = value * base + digit;
        if (value > 0xFFFFFFFFull) return false;
    }
    out = static_cast<uint32_t>(value);
    return true;
}

// -----------------------------------------------------------------------
// Tokenizer
// -----------------------------------------------------------------------

struct ParseError : std::runtime_error {
    using std::runtime_error::runtime_error;
};

static bool is_blank(const std::string& s) {
    return s.find_first_not_of(" \t\r\n") == std::string::npos;
}

// Calls keep their opening parenthesis, "LT(" is a single token
static std::vector<std::string> tokenize(const std::string& text) {
    static const std::regex re_token(
        R"(([A-Za-z_][A-Za-z0-9_]*)\s*\(|(0[xX][0-9a-fA-F]+|\d+)|([A-Za-z_][A-Za-z0-9_]*)|(<<|>>)|\s*([,|&^+\-()])\s*)");

    std::vector<std::string> tokens;
    size_t last = 0;
    for (auto it = std::sregex_iterator(text.begin(), text.end(), re_token);
         it != std::sregex_iterator(); ++it) {
        const std::smatch& m = *it;
        if (!is_blank(text.substr(last, m.position() - last)))
            throw ParseError("invalid character in expression: " + text);
        last = m.position() + m.length();

        if (m[1].matched)      tokens.push_back(m[1].str() + "(");
        else if (m[2].matched) tokens.push_back(m[2].str());
        else if (m[3].matched) tokens.push_back(m[3].str());
        else if (m[4].matched) tokens.push_back(m[4].str());
        else if (m[5].matched) tokens.push_back(m[5].str());
    }
    if (!is_blank(text.substr(last)))
        throw ParseError("invalid character in expression: " + text);
    return tokens;
}

// -----------------------------------------------------------------------
// Recursive descent parser
// -----------------------------------------------------------------------

class Parser {
public:
    Parser(std::vector<std::string> tokens, const KeycodeRegistry& registry)
        : _tokens(std::move(tokens)), _registry(registry) {}

    int64_t parse() {
        int64_t value = parse_or();
        if (_pos < _tokens.size())
            throw ParseError("unexpected token '" + _tokens[_pos] + "'");
        return value;
    }

private:
    bool at(const char* tok) const { return _pos < _tokens.size() && _tokens[_pos] == tok; }

    void expect(const char* tok) {
        if (!at(tok)) throw ParseError(std::string("expected '") + tok + "'");
        ++_pos;
    }

    int64_t parse_or() {
        int64_t left = parse_xor();
        while (at("|")) {
            ++_pos;
            left |= parse_xor();
        }
        return left;
    }

    int64_t parse_xor() {
        int64_t left = parse_and();
        while (at("^")) {
            ++_pos;
            left ^= parse_and();
        }
        return left;
    }

    int64_t parse_and() {
        int64_t left = parse_add();
        while (at("&")) {
            ++_pos;
            left &= parse_add();
        }
        return left;
    }

    int64_t parse_add() {
        int64_t left = parse_shift();
        while (at("+") || at("-")) {
            bool add = at("+");
            ++_pos;
            int64_t right = parse_shift();
            left = add ? left + right : left - right;
            check_range(left);
        }
        return left;
    }

    int64_t parse_shift() {
        int64_t left = parse_unary();
        while (at("<<") || at(">>")) {
            bool shl = at("<<");
            ++_pos;
            int64_t right = parse_unary();
            if (right < 0 || right > 31) throw ParseError("shift count out of range");
            const uint32_t bits = static_cast<uint32_t>(left);
            left = shl ? static_cast<int64_t>(static_cast<uint64_t>(bits) << right)
                       : static_cast<int64_t>(bits >> right);
            check_range(left);
        }
        return left;
    }

    int64_t parse_unary() {
        if (at("-")) {
            ++_pos;
            return -parse_unary();
        }
        if (at("+")) {
            ++_pos;
            return parse_unary();
        }
        return parse_primary();
    }

    int64_t parse_primary() {
        if (_pos >= _tokens.size()) throw ParseError("unexpected end of expression");
        const std::string tok = _tokens[_pos];

        if (tok == "(") {
            ++_pos;
            int64_t value = parse_or();
            expect(")");
            return value;
        }

        if (tok.size() > 1 && tok.back() == '(') return parse_call(tok.substr(0, tok.size() - 1));

        uint32_t value;
        if (parse_literal(tok, value)) {
            ++_pos;
            return value;
        }

        if (resolve_name(tok, value)) {
            ++_pos;
            return value;
        }
        throw ParseError("unknown identifier '" + tok + "'");
    }

    int64_t parse_call(const std::string& name) {
        Wrapper w;
        if (!lookup_wrapper(name, w)) throw ParseError("unknown function '" + name + "'");
        ++_pos;

        std::vector<uint32_t> args;
        if (!at(")")) {
            args.push_back(static_cast<uint32_t>(parse_or()));
            while (at(",")) {
                ++_pos;
                args.push_back(static_cast<uint32_t>(parse_or()));
            }
        }
        expect(")");

        if (static_cast<int>(args.size()) != w.arity)
            throw ParseError(name + " takes " + std::to_string(w.arity) + " argument(s)");
        return apply_wrapper(_registry.table(), w, args);
    }

    bool resolve_name(const std::string& name, uint32_t& out) const {
        if (const Keycode* kc = _registry.find_alias(name))
            return _registry.value_of(*kc, out);
        if (name.compare(0, 4, "MOD_") == 0)
            return _registry.table().lookup(name, out);
        return false;
    }

    // Keeps intermediate values well inside int64_t
    static void check_range(int64_t v) {
        if (v > 0xFFFFFFFFll || v < -0xFFFFFFFFll) throw ParseError("value out of range");
    }

    std::vector<std::string> _tokens;
    size_t                   _pos = 0;
    const KeycodeRegistry&   _registry;
};

// -----------------------------------------------------------------------
// Entry point
// -----------------------------------------------------------------------

bool evaluate(const std::string& text, const KeycodeRegistry& registry, uint32_t& out) {
    try {
        Parser parser(tokenize(text), registry);
        int64_t value = parser.parse();
        if (value < 0 || value > 0xFFFFFFFFll) return false;
        out = static_cast<uint32_t>(value);
        return true;
    } catch (const ParseError&) {
        return false;
    }
}
