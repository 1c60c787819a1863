//
//  control_codes.hpp
//  EbuStl
//
//  Created by the EbuStl authors on 10/16/26.
//  Copyright © 2026 EbuStl contributors. All rights reserved.
//

#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <utility>
#include <vector>

#include "character_tables.hpp"

namespace ebustl {

inline constexpr uint8_t kItalicsOn = 0x80;
inline constexpr uint8_t kItalicsOff = 0x81;
inline constexpr uint8_t kUnderlineOn = 0x82;
inline constexpr uint8_t kUnderlineOff = 0x83;
inline constexpr uint8_t kBoxingOn = 0x84;
inline constexpr uint8_t kBoxingOff = 0x85;
inline constexpr uint8_t kRowBreak = 0x8A;     // CR/LF
inline constexpr uint8_t kFillByte = 0x8F;     // unused space, pads the text field
inline constexpr uint8_t kTeletextEndBox = 0x0A;
inline constexpr uint8_t kTeletextStartBox = 0x0B;

/// @ingroup api
enum class FragmentKind : uint8_t {
    Text,
    RowBreak,
    ItalicsOn,
    ItalicsOff,
    UnderlineOn,
    UnderlineOff,
    BoxingOn,
    BoxingOff,
    NormalHeight,
    DoubleHeight,
    DoubleWidth,
    DoubleSize,
    Foreground,  ///< teletext alpha colour; `raw` holds 0x00..0x07
    Flash,
    Steady,
    Conceal,
    BlackBackground,
    NewBackground,
    Unsupported,  ///< reserved/mosaic/unknown code; `raw` holds the byte
};

/// @ingroup api
enum class TeletextColour : uint8_t { Black, Red, Green, Yellow, Blue, Magenta, Cyan, White };

/**
 * @brief One decoded unit of a text field: a run of UTF-8 text or a typed marker.
 *
 * Markers keep the control byte they were decoded from in `raw`.
 */
struct TextFragment {
    FragmentKind kind = FragmentKind::Text;
    std::string text;
    uint8_t raw = 0;

    static TextFragment make_text(std::string t) {
        return TextFragment{FragmentKind::Text, std::move(t), 0};
    }
    static TextFragment make_marker(FragmentKind k, uint8_t byte) {
        return TextFragment{k, {}, byte};
    }

    TeletextColour colour() const { return static_cast<TeletextColour>(raw & 0x07); }

    bool operator==(const TextFragment &) const = default;
};

using FragmentList = std::vector<TextFragment>;

// True for bytes claimed by the interpreter (0x00..0x1F, 0x80..0x9F); everything else is text.
bool is_control_byte(uint8_t byte);

// Scan one TTI text field. Stops at the first fill byte. Every style code becomes a marker,
// including toggles that do not change the style within this block.
FragmentList scan_text_field(const uint8_t *data, size_t size, CharacterTable table);
FragmentList scan_text_field(const std::vector<uint8_t> &field, CharacterTable table);

// Join text runs; row breaks become '\n'. Markers are dropped.
std::string plain_text(const FragmentList &fragments);

const char *to_string(FragmentKind kind);
const char *to_string(TeletextColour colour);

}  // namespace ebustl
