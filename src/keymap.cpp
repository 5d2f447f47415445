#include "keymap.h"
#include "protocol.h"

#include <iomanip>
#include <iostream>
#include <sstream>
#include <stdexcept>

std::vector<uint8_t> encode_keymap(const std::vector<uint32_t>& keycodes) {
    std::vector<uint8_t> out;
    out.reserve(keycodes.size() * KCODEC_KEYCODE_BYTES);
    for (size_t i = 0; i < keycodes.size(); ++i) {
        uint32_t kc = keycodes[i];
        if (kc > KCODEC_MAX_DEVICE_VALUE) {
            std::ostringstream msg;
            msg << "keycode 0x" << std::hex << kc << " at position " << std::dec << i
                << " cannot be stored on the device";
            throw std::runtime_error(msg.str());
        }
        out.push_back(static_cast<uint8_t>(kc >> 8));
        out.push_back(static_cast<uint8_t>(kc & 0xFF));
    }
    return out;
}

bool decode_keymap(const std::vector<uint8_t>& bytes, std::vector<uint32_t>& out) {
    if (bytes.size() % KCODEC_KEYCODE_BYTES != 0) return false;
    out.clear();
    for (size_t i = 0; i < bytes.size(); i += KCODEC_KEYCODE_BYTES)
        out.push_back((static_cast<uint32_t>(bytes[i]) << 8) | bytes[i + 1]);
    return true;
}

void hexdump_keymap(const std::vector<uint8_t>& bytes, const std::string& label) {
    if (!label.empty())
        std::cout << label << "\n";

    std::cout << std::hex << std::setfill('0');
    for (size_t i = 0; i < bytes.size(); ++i) {
        if (i % 16 == 0) std::cout << std::setw(4) << i << ": ";
        std::cout << std::setw(2) << static_cast<int>(bytes[i]);
        if (i % 16 == 15 || i == bytes.size() - 1) std::cout << "\n";
        else std::cout << " ";
    }
    std::cout << std::dec << std::setfill(' ');
}

bool parse_hex_bytes(const std::string& text, std::vector<uint8_t>& out) {
    std::string spaced = text;
    for (auto& c : spaced) {
        if (c == ',') c = ' ';
    }

    out.clear();
    std::istringstream iss(spaced);
    std::string token;
    while (iss >> token) {
        if (token.size() > 2 && token[0] == '0' && (token[1] == 'x' || token[1] == 'X'))
            token = token.substr(2);
        if (token.empty() || token.size() > 2) return false;
        if (token.find_first_not_of("0123456789abcdefABCDEF") != std::string::npos) return false;
        out.push_back(static_cast<uint8_t>(std::stoul(token, nullptr, 16)));
    }
    return true;
}
