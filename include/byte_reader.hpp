//
//  byte_reader.hpp
//  EbuStl
//
//  Created by the EbuStl authors on 10/16/26.
//  Copyright © 2026 EbuStl contributors. All rights reserved.
//

#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace ebustl {

// ------------- Fixed-offset field helpers ------------------------------------
// Callers guarantee that [offset, offset + len) lies inside the record.

// Utility: read little-endian 16-bit value (TTI subtitle number).
inline uint16_t read_u16_le(const uint8_t *p) {
    return static_cast<uint16_t>(uint16_t(p[0]) | (uint16_t(p[1]) << 8));
}

inline std::vector<uint8_t> field_bytes(const uint8_t *record, size_t offset, size_t len) {
    return std::vector<uint8_t>(record + offset, record + offset + len);
}

// Raw field as a byte-for-byte string (no character decoding).
inline std::string field_ascii(const uint8_t *record, size_t offset, size_t len) {
    return std::string(reinterpret_cast<const char *>(record + offset), len);
}

inline bool is_blank(const std::string &s) {
    for (char c : s) {
        if (c != ' ' && c != '\0') {
            return false;
        }
    }
    return true;
}

// Parse a fixed-width ASCII-digit field. Leading/trailing spaces are tolerated; an entirely
// blank field yields `blank_default`. Returns nullopt when any other non-digit is present.
inline std::optional<uint32_t> parse_ascii_number(const std::string &field,
                                                  uint32_t blank_default = 0) {
    if (is_blank(field)) {
        return blank_default;
    }
    size_t begin = 0;
    size_t end = field.size();
    while (begin < end && (field[begin] == ' ' || field[begin] == '\0')) {
        ++begin;
    }
    while (end > begin && (field[end - 1] == ' ' || field[end - 1] == '\0')) {
        --end;
    }
    uint32_t value = 0;
    for (size_t i = begin; i < end; ++i) {
        const char c = field[i];
        if (c < '0' || c > '9') {
            return std::nullopt;
        }
        value = value * 10 + static_cast<uint32_t>(c - '0');
    }
    return value;
}

}  // namespace ebustl
