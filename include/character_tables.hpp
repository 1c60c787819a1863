//
//  character_tables.hpp
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

namespace ebustl {

/// @ingroup api
/// GSI code page numbers (CPN), used for the header's text fields.
enum class CodePage : uint16_t {
    UnitedStates = 437,
    Multilingual = 850,
    Portugal = 860,
    CanadaFrench = 863,
    Nordic = 865,
};

/// @ingroup api
/// TTI character code tables (CCT), used for the subtitle text fields.
enum class CharacterTable : uint8_t {
    Latin = 0,     // ISO 6937
    Cyrillic = 1,  // ISO 8859-5
    Arabic = 2,    // ISO 8859-6
    Greek = 3,     // ISO 8859-7
    Hebrew = 4,    // ISO 8859-8
};

inline constexpr char32_t kReplacementChar = 0xFFFD;
inline constexpr CodePage kDefaultCodePage = CodePage::Multilingual;

std::optional<CodePage> code_page_from_number(uint32_t number);
std::optional<CharacterTable> character_table_from_number(uint32_t number);

// UTF-8 encode one scalar value. Surrogates and out-of-range values become U+FFFD.
void append_utf8(std::string &out, char32_t cp);

// Single-byte lookup in a header code page. Bytes below 0x80 are ASCII.
char32_t decode_code_page_byte(CodePage page, uint8_t byte);
std::string decode_code_page(CodePage page, const uint8_t *data, size_t size);
std::string decode_code_page(CodePage page, const std::string &raw);

// Single-byte lookup in a TTI character table; unmapped bytes yield U+FFFD. ISO 6937
// non-spacing diacritics return their combining mark (U+0300 block).
char32_t decode_table_byte(CharacterTable table, uint8_t byte);

// True for the ISO 6937 non-spacing diacritical marks 0xC1..0xCF that prefix a base letter.
bool is_iso6937_diacritic(uint8_t byte);

// Decode a run of text bytes (no control codes) to UTF-8. For the Latin table a diacritic
// followed by a base letter is composed into one code point where Unicode has one, otherwise
// emitted as base letter + combining mark.
std::string decode_text(CharacterTable table, const uint8_t *data, size_t size);

}  // namespace ebustl
