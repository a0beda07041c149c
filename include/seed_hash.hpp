//
//  seed_hash.hpp
//  NarrateForge
//
//  Created by Till Toenshoff on 1/15/26.
//  Copyright © 2026 Till Toenshoff. All rights reserved.
//

#pragma once

#include <array>
#include <cstdint>
#include <string_view>

// CRC-32 (IEEE 802.3, reflected 0xEDB88320) helpers; matches zlib's crc32().
inline constexpr std::array<uint32_t, 256> make_crc32_table() {
    std::array<uint32_t, 256> table{};
    for (uint32_t i = 0; i < 256; ++i) {
        uint32_t c = i;
        for (int k = 0; k < 8; ++k) {
            c = (c & 1) ? (0xEDB88320u ^ (c >> 1)) : (c >> 1);
        }
        table[i] = c;
    }
    return table;
}

inline constexpr std::array<uint32_t, 256> kCrc32Table = make_crc32_table();

inline constexpr uint32_t crc32_update(uint32_t crc, std::string_view data) {
    crc = ~crc;
    for (char ch : data) {
        crc = kCrc32Table[(crc ^ static_cast<uint8_t>(ch)) & 0xFF] ^ (crc >> 8);
    }
    return ~crc;
}

inline constexpr uint32_t crc32(std::string_view data) { return crc32_update(0, data); }

// Seeds are kept to 31 bits so engines taking a signed 32-bit seed accept them unchanged.
inline constexpr uint32_t to_seed(uint32_t hash) { return hash & 0x7FFFFFFFu; }
