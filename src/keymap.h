#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

// -----------------------------------------------------------------------
// Keymap buffer
//
// Vial reads and writes the dynamic keymap as a flat byte buffer, one
// 16-bit keycode per key in layer/row/column order:
//
//  Offset | Content
//  -------|-------------------------------------------
//   2n    | keycode n, high byte
//   2n+1  | keycode n, low byte
//
// There is no header or checksum.
// -----------------------------------------------------------------------

static constexpr size_t KCODEC_KEYCODE_BYTES = 2;

// Pack keycodes big-endian.  Throws std::runtime_error for a value that
// does not fit in 16 bits (a host-only placeholder).
std::vector<uint8_t> encode_keymap(const std::vector<uint32_t>& keycodes);

// Returns false if the buffer length is odd.
bool decode_keymap(const std::vector<uint8_t>& bytes, std::vector<uint32_t>& out);

// Print a buffer as hex, 16 bytes per line.
void hexdump_keymap(const std::vector<uint8_t>& bytes, const std::string& label = "");

// Parse space or comma separated hex bytes ("00 04 7c 00").
// Returns false on any token that is not a byte.
bool parse_hex_bytes(const std::string& text, std::vector<uint8_t>& out);
