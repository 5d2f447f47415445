#include "keycode.h"

#include <map>

// -----------------------------------------------------------------------
// Category names
// -----------------------------------------------------------------------

static const std::map<KeycodeCategory, const char*> category_names = {
    {KeycodeCategory::Special,   "special"  },
    {KeycodeCategory::Basic,     "basic"    },
    {KeycodeCategory::Shifted,   "shifted"  },
    {KeycodeCategory::Iso,       "iso"      },
    {KeycodeCategory::Layers,    "layers"   },
    {KeycodeCategory::Boot,      "boot"     },
    {KeycodeCategory::Modifiers, "modifiers"},
    {KeycodeCategory::Quantum,   "quantum"  },
    {KeycodeCategory::Backlight, "backlight"},
    {KeycodeCategory::Media,     "media"    },
    {KeycodeCategory::TapDance,  "tap_dance"},
    {KeycodeCategory::Macro,     "macro"    },
    {KeycodeCategory::User,      "user"     },
    {KeycodeCategory::Hidden,    "hidden"   },
    {KeycodeCategory::Midi,      "midi"     },
};

const char* category_name(KeycodeCategory c) {
    auto it = category_names.find(c);
    return it == category_names.end() ? "unknown" : it->second;
}

bool parse_category(const std::string& name, KeycodeCategory& out) {
    for (auto& [cat, cname] : category_names) {
        if (name == cname) {
            out = cat;
            return true;
        }
    }
    // "tapdance" and "tap-dance" are accepted too
    if (name == "tapdance" || name == "tap-dance") {
        out = KeycodeCategory::TapDance;
        return true;
    }
    return false;
}

const std::vector<KeycodeCategory>& all_categories() {
    static const std::vector<KeycodeCategory> cats = [] {
        std::vector<KeycodeCategory> v;
        for (auto& entry : category_names) v.push_back(entry.first);
        return v;
    }();
    return cats;
}

// -----------------------------------------------------------------------
// Keycode
// -----------------------------------------------------------------------

bool Keycode::is_supported_by(const std::set<std::string>& features) const {
    if (requires_feature.empty()) return true;
    return features.count(requires_feature) != 0;
}

// -----------------------------------------------------------------------
// Masked ids
// -----------------------------------------------------------------------

MaskedId parse_masked_id(const std::string& text) {
    MaskedId m;
    size_t open = text.find('(');
    if (open == std::string::npos || text.empty() || text.back() != ')') {
        m.wrapper = text;
        return m;
    }
    m.wrapper = text.substr(0, open);
    m.inner   = text.substr(open + 1, text.size() - open - 2);
    return m;
}

std::string render_masked_id(const MaskedId& m) {
    if (m.inner.empty()) return m.wrapper;
    return m.wrapper + "(" + m.inner + ")";
}
