#pragma once

#include <cstdint>
#include <string>

#include "registry.h"

// -----------------------------------------------------------------------
// Keycode expressions
//
// Text such as "LT(2, KC_A)", "LCTL_T(KC_ESC)" or "MOD_LCTL | MOD_LSFT"
// is evaluated against the active registry.  Grammar, lowest precedence
// first:
//
//   or      := xor ('|' xor)*
//   xor     := and ('^' and)*
//   and     := add ('&' add)*
//   add     := shift (('+' | '-') shift)*
//   shift   := unary (('<<' | '>>') unary)*
//   unary   := ('-' | '+') unary | primary
//   primary := '(' or ')' | literal | IDENT | IDENT '(' or (',' or)? ')'
// -----------------------------------------------------------------------

// Packing rule behind a call such as LT(...) or LCTL_T(...).
enum class WrapperKind : uint8_t {
    ModWrap,                 // mods << 8 | kc
    LayerTap,                // QK_LAYER_TAP | layer << 8 | kc
    ToLayer,                 // QK_TO | ON_PRESS << 4 | layer
    Momentary,
    DefaultLayer,
    PersistentDefaultLayer,
    ToggleLayer,
    OneShotLayer,
    LayerTapToggle,
    TapDance,
    LayerMod,                // QK_LAYER_MOD | layer << shift | mods
    OneShotMod,
    ModTap,                  // QK_MOD_TAP | mods << 8 | kc
    SwapHandsTap,
};

struct Wrapper {
    WrapperKind kind;
    int         arity;  // 1 or 2
    uint32_t    fixed;  // mods or layer bound by the name, e.g. LCTL_T, LT3
};

// Returns false if name is not a callable wrapper.
bool lookup_wrapper(const std::string& name, Wrapper& out);

// Parse a hex ("0x1f") or decimal literal.  The whole string must be the
// literal and the value must fit in 32 bits.
bool parse_literal(const std::string& text, uint32_t& out);

// Evaluate an expression.  Returns false for malformed input, unknown
// names, wrong argument counts, trailing tokens or a negative result.
bool evaluate(const std::string& text, const KeycodeRegistry& registry, uint32_t& out);
