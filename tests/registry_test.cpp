/**
 * @file registry_test.cpp
 * @brief Unit tests for KeycodeRegistry
 *
 * Coverage: context-driven family sizing, custom keycodes, feature and
 * protocol visibility, lookup indexes, pointer stability.
 */

#include "registry.h"
#include "gtest/gtest.h"

#include <string>
#include <utility>

namespace {

class KeycodeRegistryTest : public ::testing::Test {
 protected:
  static KeyboardContext context(int protocol, int layers = 4) {
    KeyboardContext ctx;
    ctx.protocol = protocol;
    ctx.layers = layers;
    return ctx;
  }

  static bool visible(const KeycodeRegistry& r, const std::string& id) {
    const Keycode* kc = r.find_qmk_id(id);
    return kc != nullptr && !kc->hidden;
  }
};

}  // namespace

// ============================================================================
// LAYER FAMILIES
// ============================================================================

TEST_F(KeycodeRegistryTest, LayerFamiliesFollowLayerCount) {
  KeycodeRegistry r(context(KCODEC_PROTOCOL_V6, 4));

  EXPECT_NE(nullptr, r.find_qmk_id("MO(3)"));
  EXPECT_EQ(nullptr, r.find_qmk_id("MO(4)"));
  EXPECT_NE(nullptr, r.find_qmk_id("TO(3)"));
  EXPECT_EQ(nullptr, r.find_qmk_id("OSL(4)"));

  EXPECT_NE(nullptr, r.find_qmk_id("LT3(kc)"));
  EXPECT_EQ(nullptr, r.find_qmk_id("LT4(kc)"));
  EXPECT_NE(nullptr, r.find_qmk_id("LM3(kc)"));
  EXPECT_EQ(nullptr, r.find_qmk_id("LM4(kc)"));
}

TEST_F(KeycodeRegistryTest, LayerTapStopsAtSixteenLayers) {
  KeycodeRegistry r(context(KCODEC_PROTOCOL_V6, 32));

  EXPECT_NE(nullptr, r.find_qmk_id("MO(31)"));
  EXPECT_NE(nullptr, r.find_qmk_id("LT15(kc)"));
  EXPECT_EQ(nullptr, r.find_qmk_id("LT16(kc)"));
  EXPECT_EQ(nullptr, r.find_qmk_id("LM16(kc)"));
}

TEST_F(KeycodeRegistryTest, FnLayerKeysNeedFourLayers) {
  KeycodeRegistry three(context(KCODEC_PROTOCOL_V6, 3));
  KeycodeRegistry four(context(KCODEC_PROTOCOL_V6, 4));

  EXPECT_EQ(nullptr, three.find_qmk_id("FN_MO13"));
  EXPECT_EQ(nullptr, three.find_qmk_id("FN_MO23"));
  EXPECT_NE(nullptr, four.find_qmk_id("FN_MO13"));
  EXPECT_NE(nullptr, four.find_qmk_id("FN_MO23"));
}

TEST_F(KeycodeRegistryTest, NoLayersLeavesOnlyLayerLock) {
  KeyboardContext ctx = context(KCODEC_PROTOCOL_V6, 0);
  ctx.supported_features.insert("layer_lock");
  KeycodeRegistry r(ctx);

  auto layers = r.category(KeycodeCategory::Layers);
  ASSERT_EQ(1u, layers.size());
  EXPECT_EQ("QK_LAYER_LOCK", layers[0]->id);
}

TEST_F(KeycodeRegistryTest, LayersCategoryStartsWithLayerLock) {
  KeyboardContext ctx = context(KCODEC_PROTOCOL_V6, 4);
  ctx.supported_features.insert("layer_lock");
  KeycodeRegistry r(ctx);

  auto layers = r.category(KeycodeCategory::Layers);
  ASSERT_GE(layers.size(), 4u);
  EXPECT_EQ("QK_LAYER_LOCK", layers[0]->id);
  EXPECT_EQ("FN_MO13", layers[1]->id);
  EXPECT_EQ("FN_MO23", layers[2]->id);
  EXPECT_EQ("MO(0)", layers[3]->id);
}

// ============================================================================
// TAP DANCE AND MACROS
// ============================================================================

TEST_F(KeycodeRegistryTest, TapDanceSlotsFollowContext) {
  KeyboardContext ctx = context(KCODEC_PROTOCOL_V6);
  ctx.tap_dance_count = 3;
  KeycodeRegistry r(ctx);

  auto tds = r.category(KeycodeCategory::TapDance);
  ASSERT_EQ(3u, tds.size());
  EXPECT_EQ("TD(0)", tds[0]->id);
  EXPECT_EQ("TD(2)", tds[2]->id);
  EXPECT_EQ("Tap dance keycode", tds[0]->tooltip);
}

TEST_F(KeycodeRegistryTest, UnusedTapDanceSlotsStayResolvableButHidden) {
  KeyboardContext ctx = context(KCODEC_PROTOCOL_V6);
  ctx.tap_dance_count = 1;
  KeycodeRegistry r(ctx);

  EXPECT_TRUE(visible(r, "TD(0)"));

  const Keycode* td = r.find_qmk_id("TD(200)");
  ASSERT_NE(nullptr, td);
  EXPECT_TRUE(td->hidden);
  EXPECT_EQ(KeycodeCategory::Hidden, td->category);
  EXPECT_EQ(td, r.find_value(0x57C8));
}

TEST_F(KeycodeRegistryTest, MacroSlotsFollowContext) {
  KeyboardContext ctx = context(KCODEC_PROTOCOL_V6);
  ctx.macro_count = 4;
  KeycodeRegistry r(ctx);

  EXPECT_EQ(4, r.macro_count());
  EXPECT_NE(nullptr, r.find_qmk_id("M3"));
  EXPECT_EQ(nullptr, r.find_qmk_id("M4"));

  // Four slots followed by the dynamic macro keys
  auto macros = r.category(KeycodeCategory::Macro);
  ASSERT_EQ(9u, macros.size());
  EXPECT_EQ("M0", macros[0]->id);
  EXPECT_EQ("DYN_REC_START1", macros[4]->id);
}

TEST_F(KeycodeRegistryTest, Protocol5TakesEveryReportedMacro) {
  KeyboardContext ctx = context(KCODEC_PROTOCOL_V5);
  ctx.macro_count = 128;
  ctx.custom_keycodes = {{"CK_A", "", ""}};

  testing::internal::CaptureStderr();
  KeycodeRegistry r(ctx);
  std::string err = testing::internal::GetCapturedStderr();

  EXPECT_EQ(128, r.macro_count());
  EXPECT_TRUE(err.empty());
  ASSERT_NE(nullptr, r.find_qmk_id("M127"));
  EXPECT_EQ(nullptr, r.find_qmk_id("M128"));

  // 128 slots followed by the dynamic macro keys
  auto macros = r.category(KeycodeCategory::Macro);
  ASSERT_EQ(133u, macros.size());
  EXPECT_EQ("M127", macros[127]->id);

  // M110 and USER00 share 0x5F80; the macro is laid out first
  ASSERT_NE(nullptr, r.find_qmk_id("USER00"));
  uint32_t user_value = 0;
  ASSERT_TRUE(r.value_of(*r.find_qmk_id("USER00"), user_value));
  EXPECT_EQ(0x5F80u, user_value);
  EXPECT_EQ("M110", r.find_value(0x5F80)->id);
}

TEST_F(KeycodeRegistryTest, MacroCountBeyondTableIsCapped) {
  KeyboardContext ctx = context(KCODEC_PROTOCOL_V6);
  ctx.macro_count = 300;

  testing::internal::CaptureStderr();
  KeycodeRegistry r(ctx);
  std::string err = testing::internal::GetCapturedStderr();

  EXPECT_EQ(256, r.macro_count());
  EXPECT_NE(nullptr, r.find_qmk_id("M255"));
  EXPECT_NE(std::string::npos, err.find("Warning:"));
}

// ============================================================================
// CUSTOM KEYCODES
// ============================================================================

TEST_F(KeycodeRegistryTest, CustomKeycodesUseReportedNames) {
  KeyboardContext ctx = context(KCODEC_PROTOCOL_V6);
  ctx.custom_keycodes = {{"CK_RGBT", "Toggle RGB underglow", "RGB Tog"}, {}};
  KeycodeRegistry r(ctx);

  auto user = r.category(KeycodeCategory::User);
  ASSERT_EQ(2u, user.size());

  EXPECT_EQ("USER00", user[0]->id);
  EXPECT_EQ("RGB Tog", user[0]->label);
  EXPECT_EQ("Toggle RGB underglow", user[0]->tooltip);
  EXPECT_EQ(user[0], r.find_alias("CK_RGBT"));

  // Empty fields fall back to the slot id
  EXPECT_EQ("USER01", user[1]->id);
  EXPECT_EQ("USER01", user[1]->label);
  EXPECT_EQ("USER01", user[1]->tooltip);
  EXPECT_EQ(1u, user[1]->aliases.size());
}

TEST_F(KeycodeRegistryTest, NoCustomKeycodesMeansNoUserCategory) {
  KeycodeRegistry r(context(KCODEC_PROTOCOL_V6));
  EXPECT_TRUE(r.category(KeycodeCategory::User).empty());
  EXPECT_EQ(nullptr, r.find_qmk_id("USER00"));
}

TEST_F(KeycodeRegistryTest, CustomKeycodesAreCappedAtSixtyFour) {
  KeyboardContext ctx = context(KCODEC_PROTOCOL_V6);
  ctx.custom_keycodes.resize(70);

  testing::internal::CaptureStderr();
  KeycodeRegistry r(ctx);
  std::string err = testing::internal::GetCapturedStderr();

  EXPECT_EQ(64u, r.category(KeycodeCategory::User).size());
  EXPECT_NE(nullptr, r.find_qmk_id("USER63"));
  EXPECT_NE(std::string::npos, err.find("only 64"));
}

// ============================================================================
// VISIBILITY
// ============================================================================

TEST_F(KeycodeRegistryTest, FeatureGatedKeycodesNeedTheFeature) {
  KeycodeRegistry plain(context(KCODEC_PROTOCOL_V6));
  EXPECT_FALSE(visible(plain, "QK_CAPS_WORD_TOGGLE"));
  EXPECT_FALSE(visible(plain, "QK_REPEAT_KEY"));
  EXPECT_FALSE(visible(plain, "QK_LAYER_LOCK"));
  EXPECT_FALSE(visible(plain, "PDF(0)"));

  KeyboardContext ctx = context(KCODEC_PROTOCOL_V6);
  ctx.supported_features = {"caps_word", "repeat_key", "persistent_default_layer"};
  KeycodeRegistry featured(ctx);
  EXPECT_TRUE(visible(featured, "QK_CAPS_WORD_TOGGLE"));
  EXPECT_TRUE(visible(featured, "QK_REPEAT_KEY"));
  EXPECT_TRUE(visible(featured, "QK_ALT_REPEAT_KEY"));
  EXPECT_TRUE(visible(featured, "PDF(0)"));
  EXPECT_FALSE(visible(featured, "QK_LAYER_LOCK"));
}

TEST_F(KeycodeRegistryTest, Protocol5HidesKeycodesItCannotEncode) {
  KeyboardContext ctx = context(KCODEC_PROTOCOL_V5);
  ctx.supported_features = {"caps_word"};
  KeycodeRegistry v5(ctx);

  EXPECT_FALSE(visible(v5, "RM_ON"));
  EXPECT_FALSE(visible(v5, "SH_TOGG"));
  EXPECT_FALSE(visible(v5, "QK_CAPS_WORD_TOGGLE"));
  EXPECT_TRUE(visible(v5, "RGB_TOG"));
  EXPECT_TRUE(visible(v5, "QK_BOOT"));

  ctx.protocol = KCODEC_PROTOCOL_V6;
  KeycodeRegistry v6(ctx);
  EXPECT_TRUE(visible(v6, "RM_ON"));
  EXPECT_TRUE(visible(v6, "SH_TOGG"));
  EXPECT_TRUE(visible(v6, "QK_CAPS_WORD_TOGGLE"));
}

TEST_F(KeycodeRegistryTest, CategoryListsOnlyVisibleKeycodes) {
  KeycodeRegistry r(context(KCODEC_PROTOCOL_V5));
  for (KeycodeCategory c : all_categories()) {
    for (const Keycode* kc : r.category(c)) {
      EXPECT_FALSE(kc->hidden) << kc->id;
      EXPECT_EQ(c, kc->category) << kc->id;
    }
  }
  EXPECT_TRUE(r.category(KeycodeCategory::Hidden).empty());
}

// ============================================================================
// MIDI
// ============================================================================

TEST_F(KeycodeRegistryTest, MidiLevels) {
  KeyboardContext ctx = context(KCODEC_PROTOCOL_V6);
  KeycodeRegistry none(ctx);
  EXPECT_TRUE(none.category(KeycodeCategory::Midi).empty());

  ctx.midi = "basic";
  KeycodeRegistry basic(ctx);
  EXPECT_EQ(73u, basic.category(KeycodeCategory::Midi).size());
  EXPECT_NE(nullptr, basic.find_qmk_id("MI_C"));
  EXPECT_NE(nullptr, basic.find_alias("MI_Db"));
  EXPECT_EQ(nullptr, basic.find_qmk_id("MI_OCT_0"));

  ctx.midi = "advanced";
  KeycodeRegistry advanced(ctx);
  EXPECT_GT(advanced.category(KeycodeCategory::Midi).size(), 73u);
  EXPECT_NE(nullptr, advanced.find_qmk_id("MI_OCT_0"));
  EXPECT_NE(nullptr, advanced.find_qmk_id("MI_CH16"));
  EXPECT_NE(nullptr, advanced.find_qmk_id("SQ_ON"));
}

// ============================================================================
// INDEXES
// ============================================================================

TEST_F(KeycodeRegistryTest, EveryDescriptorIsConsistent) {
  KeyboardContext ctx = context(KCODEC_PROTOCOL_V6, 8);
  ctx.macro_count = 8;
  ctx.tap_dance_count = 8;
  ctx.midi = "advanced";
  KeycodeRegistry r(ctx);

  for (auto& kc : r.keycodes()) {
    ASSERT_FALSE(kc->aliases.empty()) << kc->id;
    EXPECT_EQ(kc->id, kc->aliases[0]);
    EXPECT_EQ(r.table().is_masked(kc->id), kc->masked) << kc->id;

    uint32_t value = 0;
    EXPECT_TRUE(r.value_of(*kc, value)) << kc->id;
  }
}

TEST_F(KeycodeRegistryTest, LookupsByIdAliasAndValue) {
  KeycodeRegistry r(context(KCODEC_PROTOCOL_V6));

  const Keycode* esc = r.find_qmk_id("KC_ESCAPE");
  ASSERT_NE(nullptr, esc);
  EXPECT_EQ(esc, r.find_alias("KC_ESC"));
  EXPECT_EQ(esc, r.find_value(0x29));
  EXPECT_EQ(esc, r.find_recorder_alias("esc"));
  EXPECT_EQ(nullptr, r.find_qmk_id("KC_ESC"));

  EXPECT_EQ(r.find_qmk_id("KC_A"), r.find_recorder_alias("a"));
}

TEST_F(KeycodeRegistryTest, FindIdStripsTemplateSuffix) {
  KeycodeRegistry r(context(KCODEC_PROTOCOL_V6));

  const Keycode* lt = r.find_id("LT2");
  ASSERT_NE(nullptr, lt);
  EXPECT_EQ("LT2(kc)", lt->id);
  EXPECT_TRUE(lt->masked);
  EXPECT_EQ(lt, r.find_value(0x4200));
}

TEST_F(KeycodeRegistryTest, LayerModModifiersStayOutOfValueIndex) {
  KeycodeRegistry r(context(KCODEC_PROTOCOL_V6));

  ASSERT_EQ(10u, r.lm_mods().size());
  EXPECT_NE(nullptr, r.find_id("MOD_LSFT"));
  EXPECT_EQ(nullptr, r.find_alias("MOD_LSFT"));
  EXPECT_EQ(nullptr, r.find_value(0x02));
  EXPECT_EQ("KC_TRNS", r.find_value(0x01)->id);
}

TEST_F(KeycodeRegistryTest, ShiftedSymbolsShareValueWithWrapperForm) {
  KeycodeRegistry r(context(KCODEC_PROTOCOL_V6));

  const Keycode* exlm = r.find_qmk_id("KC_EXLM");
  ASSERT_NE(nullptr, exlm);
  EXPECT_EQ(KeycodeCategory::Shifted, exlm->category);
  EXPECT_EQ(exlm, r.find_value(0x21E));
}

// ============================================================================
// LIFETIME
// ============================================================================

TEST_F(KeycodeRegistryTest, DescriptorsSurviveMove) {
  KeycodeRegistry a(context(KCODEC_PROTOCOL_V6));
  const Keycode* kc_a = a.find_qmk_id("KC_A");
  ASSERT_NE(nullptr, kc_a);

  KeycodeRegistry b(std::move(a));
  EXPECT_EQ(kc_a, b.find_qmk_id("KC_A"));
  EXPECT_EQ(kc_a, b.find_value(0x04));
}

TEST_F(KeycodeRegistryTest, UnknownProtocolFallsBackToVersion5) {
  KeycodeRegistry r(context(7));
  EXPECT_EQ(KCODEC_PROTOCOL_V5, r.protocol());
  EXPECT_EQ(KCODEC_PROTOCOL_V5, r.context().protocol);
}
