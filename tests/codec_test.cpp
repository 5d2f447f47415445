/**
 * @file codec_test.cpp
 * @brief Unit tests for the Keycodes codec
 *
 * Coverage: serialize/deserialize for both protocols, value round trips,
 * layer-mod text, C export, labels and tooltips, keycode predicates and
 * builders, rebuilds.
 */

#include "codec.h"
#include "gtest/gtest.h"

#include <string>

namespace {

class KeycodesTest : public ::testing::Test {
 protected:
  void SetUp() override { v6_.set_protocol(KCODEC_PROTOCOL_V6); }

  // A board with most features switched on
  static KeyboardContext rich_context(int protocol) {
    KeyboardContext ctx;
    ctx.protocol = protocol;
    ctx.layers = 16;
    ctx.macro_count = 16;
    ctx.tap_dance_count = 16;
    ctx.midi = "advanced";
    ctx.custom_keycodes = {{"CK_ONE", "First", "One"}, {"CK_TWO", "", ""}};
    ctx.supported_features = {"caps_word", "repeat_key", "layer_lock",
                              "persistent_default_layer"};
    return ctx;
  }

  // Every 16-bit value must survive serialize -> deserialize unchanged
  static void expect_round_trip(const Keycodes& kc) {
    int failures = 0;
    for (uint32_t v = 0; v <= 0xFFFF && failures < 10; ++v) {
      const std::string text = kc.serialize(v);
      if (kc.deserialize(text) != v) {
        ADD_FAILURE() << "protocol " << kc.protocol() << ": 0x" << std::hex << v
                      << " -> " << text;
        ++failures;
      }
    }
  }

  Keycodes v5_;
  Keycodes v6_;
};

}  // namespace

// ============================================================================
// SERIALIZE
// ============================================================================

TEST_F(KeycodesTest, DefaultsToProtocol5) {
  Keycodes kc;
  EXPECT_EQ(KCODEC_PROTOCOL_V5, kc.protocol());
  EXPECT_EQ(0u, kc.revision());
}

TEST_F(KeycodesTest, SerializePlainKeycodes) {
  EXPECT_EQ("KC_NO", v6_.serialize(0x0000));
  EXPECT_EQ("KC_TRNS", v6_.serialize(0x0001));
  EXPECT_EQ("KC_A", v6_.serialize(0x0004));
  EXPECT_EQ("KC_ESCAPE", v6_.serialize(0x0029));
  EXPECT_EQ("QK_BOOT", v6_.serialize(0x7C00));
  EXPECT_EQ("QK_BOOT", v5_.serialize(0x5C00));
  EXPECT_EQ("MO(2)", v6_.serialize(0x5222));
  EXPECT_EQ("MO(2)", v5_.serialize(0x5102));
}

TEST_F(KeycodesTest, SerializeUnknownValueAsHex) {
  EXPECT_EQ("0xffff", v6_.serialize(0xFFFF));
  EXPECT_EQ("0x0003", v6_.serialize(0x0003));
  EXPECT_EQ("0x1004", v6_.serialize(0x1004));
}

TEST_F(KeycodesTest, SerializeShiftedSymbolAsWrapper) {
  EXPECT_EQ("LSFT(KC_1)", v6_.serialize(0x021E));
  EXPECT_EQ("LSFT(KC_1)", v5_.serialize(0x021E));
}

TEST_F(KeycodesTest, SerializeMaskedKeycodes) {
  EXPECT_EQ("LSFT(KC_A)", v6_.serialize(0x0204));
  EXPECT_EQ("RALT(KC_ESCAPE)", v6_.serialize(0x1429));
  EXPECT_EQ("LCTL_T(KC_ESCAPE)", v6_.serialize(0x2129));
  EXPECT_EQ("LCTL_T(KC_ESCAPE)", v5_.serialize(0x6129));
  EXPECT_EQ("LT2(KC_A)", v6_.serialize(0x4204));
  EXPECT_EQ("SH_T(KC_A)", v6_.serialize(0x5604));
}

TEST_F(KeycodesTest, SerializeMaskedWithUnknownInner) {
  EXPECT_EQ("LSFT(0xff)", v6_.serialize(0x02FF));
}

TEST_F(KeycodesTest, MaskedIdSplitsAndJoins) {
  MaskedId m = parse_masked_id("LT2(KC_A)");
  EXPECT_EQ("LT2", m.wrapper);
  EXPECT_EQ("KC_A", m.inner);
  EXPECT_EQ("LT2(KC_A)", render_masked_id(m));

  MaskedId plain = parse_masked_id("KC_B");
  EXPECT_EQ("KC_B", plain.wrapper);
  EXPECT_TRUE(plain.inner.empty());
  EXPECT_EQ("KC_B", render_masked_id(plain));
}

TEST_F(KeycodesTest, LayerTapBeyondLayerCountIsHex) {
  // Default context has four layers
  EXPECT_EQ("0x4504", v6_.serialize(0x4504));
}

TEST_F(KeycodesTest, SwapHandsActionsAreNotTapKeys) {
  EXPECT_EQ("SH_TOGG", v6_.serialize(0x56F0));
  EXPECT_EQ("SH_OS", v6_.serialize(0x56F6));
  EXPECT_EQ("SH_TOGG", v5_.serialize(0x995F0));
}

TEST_F(KeycodesTest, SerializeLayerMod) {
  EXPECT_EQ("LM3(MOD_RALT)", v6_.serialize(0x5074));
  EXPECT_EQ("LM3(MOD_LALT)", v5_.serialize(0x5934));
  EXPECT_EQ("LM0(MOD_LCTL)", v6_.serialize(0x5001));
  EXPECT_EQ("LM3(0x13)", v6_.serialize(0x5073));
  EXPECT_EQ("LM15(MOD_HYPR)", v6_.serialize(0x51EF));
}

TEST_F(KeycodesTest, SerializeProtocol5Placeholders) {
  EXPECT_EQ("RM_ON", v5_.serialize(0x99100));
  EXPECT_EQ("QK_REBOOT", v5_.serialize(0x99700));
  EXPECT_EQ("JS_0", v5_.serialize(0x99400));
  EXPECT_EQ("0x99420", v5_.serialize(0x99420));
}

// ============================================================================
// DESERIALIZE
// ============================================================================

TEST_F(KeycodesTest, DeserializeNamesAndAliases) {
  EXPECT_EQ(0x04u, v6_.deserialize("KC_A"));
  EXPECT_EQ(0x29u, v6_.deserialize("KC_ESC"));
  EXPECT_EQ(0x21Eu, v6_.deserialize("KC_EXLM"));
  EXPECT_EQ(0x52A2u, v6_.deserialize("OSM(MOD_LSFT)"));
  EXPECT_EQ(0x5502u, v5_.deserialize("OSM(MOD_LSFT)"));
}

TEST_F(KeycodesTest, DeserializeLiterals) {
  EXPECT_EQ(0x7C00u, v6_.deserialize("0x7c00"));
  EXPECT_EQ(42u, v6_.deserialize("42"));
  EXPECT_EQ(0x1234u, v6_.deserialize(0x1234u));
}

TEST_F(KeycodesTest, DeserializeExpressions) {
  EXPECT_EQ(0x4204u, v6_.deserialize("LT(2, KC_A)"));
  EXPECT_EQ(0x2129u, v6_.deserialize("LCTL_T(KC_ESC)"));
  EXPECT_EQ(0x5074u, v6_.deserialize("LM3(MOD_RALT)"));
  EXPECT_EQ(0x03u, v6_.deserialize("MOD_LCTL | MOD_LSFT"));
}

TEST_F(KeycodesTest, DeserializeFailureIsKcNo) {
  EXPECT_EQ(0u, v6_.deserialize("KC_NOT_A_KEY"));
  EXPECT_EQ(0u, v6_.deserialize("LT(1)"));
  EXPECT_EQ(0u, v6_.deserialize("-1"));
  EXPECT_EQ(0u, v6_.deserialize(""));
}

TEST_F(KeycodesTest, NormalizePicksCanonicalText) {
  EXPECT_EQ("LSFT(KC_1)", v6_.normalize("KC_EXLM"));
  EXPECT_EQ("KC_ESCAPE", v6_.normalize("KC_ESC"));
  EXPECT_EQ("LT1(KC_SPACE)", v6_.normalize("LT(1, KC_SPC)"));
  EXPECT_EQ("QK_BOOT", v6_.normalize("RESET"));
  EXPECT_EQ("KC_NO", v6_.normalize("garbage"));
}

// ============================================================================
// ROUND TRIPS
// ============================================================================

TEST_F(KeycodesTest, RoundTripAllValuesDefaultContext) {
  expect_round_trip(v5_);
  expect_round_trip(v6_);
}

TEST_F(KeycodesTest, RoundTripAllValuesRichContext) {
  for (int protocol : {KCODEC_PROTOCOL_V5, KCODEC_PROTOCOL_V6}) {
    Keycodes kc;
    kc.recreate_keyboard_keycodes(rich_context(protocol));
    expect_round_trip(kc);
  }
}

TEST_F(KeycodesTest, RoundTripTableValues) {
  for (const Keycodes* kc : {&v5_, &v6_}) {
    for (auto& [name, value] : kc->registry().table().values()) {
      EXPECT_EQ(value, kc->deserialize(kc->serialize(value))) << name;
    }
  }
}

TEST_F(KeycodesTest, NormalizeIsIdempotent) {
  for (const char* text : {"KC_EXLM", "LT(2, KC_A)", "LCTL_T(KC_ESC)", "LM(1, MOD_LSFT)",
                           "0x02ff", "SH_T(KC_B)", "TD(7)", "garbage", "QK_BOOT"}) {
    const std::string once = v6_.normalize(text);
    EXPECT_EQ(once, v6_.normalize(once)) << text;
  }
}

// ============================================================================
// C EXPORT
// ============================================================================

TEST_F(KeycodesTest, CExportKeepsNamesQmkUnderstands) {
  EXPECT_EQ("KC_A", v6_.serialize_for_c_export(0x0004));
  EXPECT_EQ("LSFT(KC_A)", v6_.serialize_for_c_export(0x0204));
  EXPECT_EQ("QK_BOOT", v6_.serialize_for_c_export(0x7C00));
}

TEST_F(KeycodesTest, CExportUsesHexForDesktopOnlyNames) {
  EXPECT_EQ("0x5074", v6_.serialize_for_c_export(0x5074));    // LM
  EXPECT_EQ("0x1304", v6_.serialize_for_c_export(0x1304));    // RCS(KC_A)
  EXPECT_EQ("0x5604", v6_.serialize_for_c_export(0x5604));    // SH_T(KC_A)
  EXPECT_EQ("0x7c5d", v6_.serialize_for_c_export(0x7C5D));    // QK_KEY_OVERRIDE_TOGGLE
  EXPECT_EQ("0x7810", v6_.serialize_for_c_export(0x7810));    // LM_ON
}

// ============================================================================
// LOOKUPS, LABELS AND TOOLTIPS
// ============================================================================

TEST_F(KeycodesTest, FindKeycodes) {
  ASSERT_NE(nullptr, v6_.find_keycode("kc"));
  EXPECT_EQ("KC_NO", v6_.find_keycode("kc")->id);
  EXPECT_EQ("LT2(kc)", v6_.find_keycode("LT2")->id);
  EXPECT_EQ(nullptr, v6_.find_by_qmk_id("KC_ESC"));
  EXPECT_EQ("KC_A", v6_.find_by_recorder_alias("a")->id);

  ASSERT_NE(nullptr, v6_.find_outer_keycode("LSFT(KC_A)"));
  EXPECT_EQ("LSFT(kc)", v6_.find_outer_keycode("LSFT(KC_A)")->id);
  EXPECT_EQ("KC_A", v6_.find_inner_keycode("LSFT(KC_A)")->id);
  EXPECT_EQ("KC_B", v6_.find_outer_keycode("KC_B")->id);
}

TEST_F(KeycodesTest, Labels) {
  EXPECT_EQ("A", v6_.keycode_label("KC_A"));
  EXPECT_EQ("LT 2\n(kc)", v6_.keycode_label("LT2(KC_A)"));
  EXPECT_EQ("KC_UNKNOWN", v6_.keycode_label("KC_UNKNOWN"));
}

TEST_F(KeycodesTest, Tooltips) {
  auto boot = v6_.keycode_tooltip("QK_BOOT");
  ASSERT_TRUE(boot.has_value());
  EXPECT_EQ("QK_BOOT: Put the keyboard into bootloader mode for flashing", *boot);

  auto a = v6_.keycode_tooltip("KC_A");
  ASSERT_TRUE(a.has_value());
  EXPECT_EQ("KC_A", *a);

  EXPECT_FALSE(v6_.keycode_tooltip("KC_UNKNOWN").has_value());
}

TEST_F(KeycodesTest, CodeToLabel) {
  EXPECT_EQ("A", v6_.code_to_label(0x0004));
  EXPECT_EQ("LSFT(A)", v6_.code_to_label(0x0204));
  EXPECT_EQ("LT2(A)", v6_.code_to_label(0x4204));
  EXPECT_EQ("Boot- loader", v6_.code_to_label(0x7C00));
}

// ============================================================================
// PREDICATES AND BUILDERS
// ============================================================================

TEST_F(KeycodesTest, MaskAndBasicPredicates) {
  EXPECT_TRUE(v6_.is_mask("LSFT(KC_A)"));
  EXPECT_TRUE(v6_.is_mask("LT2(KC_A)"));
  EXPECT_FALSE(v6_.is_mask("MO(2)"));
  EXPECT_FALSE(v6_.is_mask("KC_A"));

  EXPECT_TRUE(v6_.is_basic("KC_A"));
  EXPECT_FALSE(v6_.is_basic("QK_BOOT"));
  EXPECT_FALSE(v6_.is_basic("LSFT(KC_A)"));
}

TEST_F(KeycodesTest, TapDanceAndMacroIndexes) {
  EXPECT_TRUE(v6_.is_tap_dance_keycode(0x5705));
  EXPECT_EQ(5, v6_.tap_dance_index(0x5705));
  EXPECT_EQ(-1, v6_.tap_dance_index(0x5805));

  KeyboardContext ctx;
  ctx.protocol = KCODEC_PROTOCOL_V6;
  ctx.macro_count = 4;
  Keycodes kc;
  kc.recreate_keyboard_keycodes(ctx);

  EXPECT_TRUE(kc.is_macro_keycode(0x7703));
  EXPECT_EQ(3, kc.macro_index(0x7703));
  EXPECT_FALSE(kc.is_macro_keycode(0x7704));
  EXPECT_EQ(-1, kc.macro_index(0x76FF));
  EXPECT_FALSE(v6_.is_macro_keycode(0x7700));
}

TEST_F(KeycodesTest, Protocol5MacrosPastUserRange) {
  KeyboardContext ctx;
  ctx.protocol = KCODEC_PROTOCOL_V5;
  ctx.macro_count = 128;
  Keycodes kc;
  kc.recreate_keyboard_keycodes(ctx);

  EXPECT_EQ(128, kc.registry().macro_count());
  EXPECT_EQ(0x5F8Au, kc.deserialize("M120"));
  EXPECT_EQ("M120", kc.serialize(0x5F8A));
  EXPECT_EQ(120, kc.macro_index(0x5F8A));
  EXPECT_EQ(-1, kc.macro_index(0x5F92));
}

TEST_F(KeycodesTest, ResetKeycode) {
  EXPECT_TRUE(v6_.is_reset_keycode(0x7C00));
  EXPECT_TRUE(v5_.is_reset_keycode(0x5C00));
  EXPECT_FALSE(v6_.is_reset_keycode(0x5C00));
}

TEST_F(KeycodesTest, LayerModHelpers) {
  EXPECT_TRUE(v6_.is_lm_keycode(0x5074));
  EXPECT_FALSE(v6_.is_lm_keycode(0x5200));
  EXPECT_EQ(3, v6_.lm_layer(0x5074));
  EXPECT_EQ(0x14u, v6_.lm_mod(0x5074));
  EXPECT_EQ(0x5074u, v6_.build_lm_keycode(3, 0x14));

  EXPECT_TRUE(v5_.is_lm_keycode(0x5934));
  EXPECT_EQ(3, v5_.lm_layer(0x5934));
  EXPECT_EQ(0x4u, v5_.lm_mod(0x5934));
  // Right-hand bit is dropped in protocol 5
  EXPECT_EQ(0x5934u, v5_.build_lm_keycode(3, 0x14));

  EXPECT_EQ(10u, v6_.available_lm_mods().size());
  EXPECT_EQ(6u, v5_.available_lm_mods().size());
}

TEST_F(KeycodesTest, ModMaskHelpers) {
  EXPECT_TRUE(v6_.is_mod_mask_keycode(0x0204));
  EXPECT_FALSE(v6_.is_mod_mask_keycode(0x0004));
  EXPECT_TRUE(v6_.is_modifiable_keycode(0x0004));
  EXPECT_FALSE(v6_.is_modifiable_keycode(0x2004));

  EXPECT_EQ(0x12u, v6_.extract_mod_mask(0x1204));
  EXPECT_EQ(0x04u, v6_.extract_basic_key(0x1204));
  EXPECT_EQ(0x0204u, v6_.build_mod_mask_keycode(0x02, 0x04));
  EXPECT_EQ(0x0004u, v6_.build_mod_mask_keycode(0x00, 0x04));
}

TEST_F(KeycodesTest, ModTapHelpers) {
  EXPECT_TRUE(v6_.is_mod_tap_keycode(0x2129));
  EXPECT_FALSE(v6_.is_mod_tap_keycode(0x4000));
  EXPECT_TRUE(v5_.is_mod_tap_keycode(0x6129));
  EXPECT_EQ(0x2129u, v6_.build_mod_tap_keycode(0x01, 0x29));
  EXPECT_EQ(0x6129u, v5_.build_mod_tap_keycode(0x01, 0x29));
  EXPECT_EQ(0x0029u, v6_.build_mod_tap_keycode(0x00, 0x29));
}

TEST_F(KeycodesTest, LayerTapHelpers) {
  EXPECT_TRUE(v6_.is_lt_keycode(0x4204));
  EXPECT_FALSE(v6_.is_lt_keycode(0x5204));
  EXPECT_EQ(2, v6_.lt_layer(0x4204));
  EXPECT_EQ(0x4204u, v6_.build_lt_keycode(2, 0x04));
}

TEST_F(KeycodesTest, SwapHandsTapHelpers) {
  EXPECT_TRUE(v6_.is_sht_keycode(0x5604));
  EXPECT_FALSE(v6_.is_sht_keycode(0x56F0));
  EXPECT_EQ(0x5604u, v6_.build_sht_keycode(0x04));
  EXPECT_EQ(0x99504u, v5_.build_sht_keycode(0x04));
}

// ============================================================================
// REBUILDS
// ============================================================================

TEST_F(KeycodesTest, EveryRebuildBumpsRevision) {
  Keycodes kc;
  kc.set_protocol(KCODEC_PROTOCOL_V6);
  EXPECT_EQ(1u, kc.revision());
  kc.recreate_keycodes();
  EXPECT_EQ(2u, kc.revision());
  kc.recreate_keyboard_keycodes(KeyboardContext{});
  EXPECT_EQ(3u, kc.revision());
}

TEST_F(KeycodesTest, SetProtocolSwitchesTables) {
  Keycodes kc;
  EXPECT_EQ(0x5C00u, kc.deserialize("QK_BOOT"));
  kc.set_protocol(KCODEC_PROTOCOL_V6);
  EXPECT_EQ(KCODEC_PROTOCOL_V6, kc.protocol());
  EXPECT_EQ(0x7C00u, kc.deserialize("QK_BOOT"));
  kc.set_protocol(4);
  EXPECT_EQ(KCODEC_PROTOCOL_V5, kc.protocol());
}

TEST_F(KeycodesTest, SetProtocolKeepsKeyboardContext) {
  KeyboardContext ctx;
  ctx.macro_count = 4;
  Keycodes kc;
  kc.recreate_keyboard_keycodes(ctx);
  kc.set_protocol(KCODEC_PROTOCOL_V6);
  EXPECT_EQ(4, kc.registry().macro_count());
}

TEST_F(KeycodesTest, RecreateKeycodesDropsKeyboardContext) {
  KeyboardContext ctx;
  ctx.protocol = KCODEC_PROTOCOL_V6;
  ctx.custom_keycodes = {{"CK_ONE", "", ""}};
  Keycodes kc;
  kc.recreate_keyboard_keycodes(ctx);
  EXPECT_EQ(0x7E00u, kc.deserialize("CK_ONE"));

  kc.recreate_keycodes();
  EXPECT_EQ(KCODEC_PROTOCOL_V6, kc.protocol());
  EXPECT_EQ(0u, kc.deserialize("CK_ONE"));
}
