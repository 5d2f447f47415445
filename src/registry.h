#pragma once

#include <cstdint>
#include <map>
#include <memory>
#include <string>
#include <vector>

#include "data.h"
#include "keycode.h"
#include "protocol.h"

// -----------------------------------------------------------------------
// Keycode registry
//
// All descriptors offered for one keyboard, built from the protocol table
// and the capability context.  A registry is never modified after
// construction; a context change builds a new one.  Descriptor pointers
// stay valid for the lifetime of the registry, including across moves.
// -----------------------------------------------------------------------
class KeycodeRegistry {
public:
    explicit KeycodeRegistry(const KeyboardContext& context);

    KeycodeRegistry(const KeycodeRegistry&)            = delete;
    KeycodeRegistry& operator=(const KeycodeRegistry&) = delete;
    KeycodeRegistry(KeycodeRegistry&&)                 = default;
    KeycodeRegistry& operator=(KeycodeRegistry&&)      = default;

    const KeycodeTable&    table() const { return _table; }
    const KeyboardContext& context() const { return _context; }
    int                    protocol() const { return _table.protocol(); }

    // Number of macro slots actually generated (context value capped by the
    // table capacity).
    int macro_count() const { return _macro_count; }

    // Every descriptor in layout order, hidden ones included.
    const std::vector<std::unique_ptr<Keycode>>& keycodes() const { return _keycodes; }

    // Descriptors of one category that are offered to the user.
    std::vector<const Keycode*> category(KeycodeCategory c) const;

    // MOD_* descriptors used inside LM() keycodes.
    const std::vector<std::unique_ptr<Keycode>>& lm_mods() const { return _lm_mods; }

    // Lookups return nullptr on a miss.
    const Keycode* find_id(const std::string& id) const;       // "(kc)" stripped
    const Keycode* find_qmk_id(const std::string& id) const;   // exact id
    const Keycode* find_alias(const std::string& alias) const;
    const Keycode* find_recorder_alias(const std::string& alias) const;
    const Keycode* find_value(uint32_t value) const;

    // Numeric value of a descriptor.  False for an id the table lacks.
    bool value_of(const Keycode& kc, uint32_t& out) const { return _table.lookup(kc.id, out); }

private:
    Keycode& append(const std::string& id, const std::string& label, const std::string& tooltip,
                    KeycodeCategory category);
    void require_value(const std::string& id) const;
    void append_defs(const std::vector<KeycodeDef>& defs, KeycodeCategory category);
    void add_layers();
    void add_macros();
    void add_tap_dances();
    void add_user_keycodes();
    void add_midi();
    void apply_hidden();
    void build_indexes();

    KeycodeTable    _table;
    KeyboardContext _context;
    int             _macro_count = 0;

    std::vector<std::unique_ptr<Keycode>> _keycodes;
    std::vector<std::unique_ptr<Keycode>> _lm_mods;

    std::map<std::string, const Keycode*> _by_id;
    std::map<std::string, const Keycode*> _by_qmk_id;
    std::map<std::string, const Keycode*> _by_alias;
    std::map<std::string, const Keycode*> _by_recorder_alias;
    std::map<uint32_t, const Keycode*>    _by_value;
};
