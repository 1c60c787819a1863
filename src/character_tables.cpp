//
//  character_tables.cpp
//  EbuStl
//
//  Created by the EbuStl authors on 10/16/26.
//  Copyright © 2026 EbuStl contributors. All rights reserved.
//

#include "character_tables.hpp"

#include <string_view>

namespace ebustl {

namespace {

// Upper halves (0x80..0xFF) of the DOS code pages allowed in the GSI.
constexpr char32_t kCp437High[128] = {
    0x00C7, 0x00FC, 0x00E9, 0x00E2, 0x00E4, 0x00E0, 0x00E5, 0x00E7,  // 0x80
    0x00EA, 0x00EB, 0x00E8, 0x00EF, 0x00EE, 0x00EC, 0x00C4, 0x00C5,
    0x00C9, 0x00E6, 0x00C6, 0x00F4, 0x00F6, 0x00F2, 0x00FB, 0x00F9,  // 0x90
    0x00FF, 0x00D6, 0x00DC, 0x00A2, 0x00A3, 0x00A5, 0x20A7, 0x0192,
    0x00E1, 0x00ED, 0x00F3, 0x00FA, 0x00F1, 0x00D1, 0x00AA, 0x00BA,  // 0xA0
    0x00BF, 0x2310, 0x00AC, 0x00BD, 0x00BC, 0x00A1, 0x00AB, 0x00BB,
    0x2591, 0x2592, 0x2593, 0x2502, 0x2524, 0x2561, 0x2562, 0x2556,  // 0xB0
    0x2555, 0x2563, 0x2551, 0x2557, 0x255D, 0x255C, 0x255B, 0x2510,
    0x2514, 0x2534, 0x252C, 0x251C, 0x2500, 0x253C, 0x255E, 0x255F,  // 0xC0
    0x255A, 0x2554, 0x2569, 0x2566, 0x2560, 0x2550, 0x256C, 0x2567,
    0x2568, 0x2564, 0x2565, 0x2559, 0x2558, 0x2552, 0x2553, 0x256B,  // 0xD0
    0x256A, 0x2518, 0x250C, 0x2588, 0x2584, 0x258C, 0x2590, 0x2580,
    0x03B1, 0x00DF, 0x0393, 0x03C0, 0x03A3, 0x03C3, 0x00B5, 0x03C4,  // 0xE0
    0x03A6, 0x0398, 0x03A9, 0x03B4, 0x221E, 0x03C6, 0x03B5, 0x2229,
    0x2261, 0x00B1, 0x2265, 0x2264, 0x2320, 0x2321, 0x00F7, 0x2248,  // 0xF0
    0x00B0, 0x2219, 0x00B7, 0x221A, 0x207F, 0x00B2, 0x25A0, 0x00A0,
};

constexpr char32_t kCp850High[128] = {
    0x00C7, 0x00FC, 0x00E9, 0x00E2, 0x00E4, 0x00E0, 0x00E5, 0x00E7,  // 0x80
    0x00EA, 0x00EB, 0x00E8, 0x00EF, 0x00EE, 0x00EC, 0x00C4, 0x00C5,
    0x00C9, 0x00E6, 0x00C6, 0x00F4, 0x00F6, 0x00F2, 0x00FB, 0x00F9,  // 0x90
    0x00FF, 0x00D6, 0x00DC, 0x00F8, 0x00A3, 0x00D8, 0x00D7, 0x0192,
    0x00E1, 0x00ED, 0x00F3, 0x00FA, 0x00F1, 0x00D1, 0x00AA, 0x00BA,  // 0xA0
    0x00BF, 0x00AE, 0x00AC, 0x00BD, 0x00BC, 0x00A1, 0x00AB, 0x00BB,
    0x2591, 0x2592, 0x2593, 0x2502, 0x2524, 0x00C1, 0x00C2, 0x00C0,  // 0xB0
    0x00A9, 0x2563, 0x2551, 0x2557, 0x255D, 0x00A2, 0x00A5, 0x2510,
    0x2514, 0x2534, 0x252C, 0x251C, 0x2500, 0x253C, 0x00E3, 0x00C3,  // 0xC0
    0x255A, 0x2554, 0x2569, 0x2566, 0x2560, 0x2550, 0x256C, 0x00A4,
    0x00F0, 0x00D0, 0x00CA, 0x00CB, 0x00C8, 0x0131, 0x00CD, 0x00CE,  // 0xD0
    0x00CF, 0x2518, 0x250C, 0x2588, 0x2584, 0x00A6, 0x00CC, 0x2580,
    0x00D3, 0x00DF, 0x00D4, 0x00D2, 0x00F5, 0x00D5, 0x00B5, 0x00FE,  // 0xE0
    0x00DE, 0x00DA, 0x00DB, 0x00D9, 0x00FD, 0x00DD, 0x00AF, 0x00B4,
    0x00AD, 0x00B1, 0x2017, 0x00BE, 0x00B6, 0x00A7, 0x00F7, 0x00B8,  // 0xF0
    0x00B0, 0x00A8, 0x00B7, 0x00B9, 0x00B3, 0x00B2, 0x25A0, 0x00A0,
};

struct ByteOverride {
    uint8_t byte;
    char32_t cp;
};

// 860, 863 and 865 are 437 with a handful of national replacements.
constexpr ByteOverride kCp860Overrides[] = {
    {0x84, 0x00E3}, {0x86, 0x00C1}, {0x89, 0x00CA}, {0x8B, 0x00CD}, {0x8C, 0x00D4},
    {0x8E, 0x00C3}, {0x8F, 0x00C2}, {0x91, 0x00C0}, {0x92, 0x00C8}, {0x94, 0x00F5},
    {0x96, 0x00DA}, {0x98, 0x00CC}, {0x99, 0x00D5}, {0x9D, 0x00D9}, {0x9F, 0x00D3},
    {0xA9, 0x00D2},
};

constexpr ByteOverride kCp863Overrides[] = {
    {0x84, 0x00C2}, {0x86, 0x00B6}, {0x8D, 0x2017}, {0x8E, 0x00C0}, {0x8F, 0x00A7},
    {0x91, 0x00C8}, {0x92, 0x00CA}, {0x94, 0x00CB}, {0x95, 0x00CF}, {0x98, 0x00A4},
    {0x99, 0x00D4}, {0x9D, 0x00D9}, {0x9E, 0x00DB}, {0xA0, 0x00A6}, {0xA1, 0x00B4},
    {0xA4, 0x00A8}, {0xA5, 0x00B8}, {0xA6, 0x00B3}, {0xA7, 0x00AF}, {0xA8, 0x00CE},
    {0xAD, 0x00BE},
};

constexpr ByteOverride kCp865Overrides[] = {
    {0x9B, 0x00F8},
    {0x9D, 0x00D8},
    {0xAF, 0x00A4},
};

template <size_t N>
char32_t lookup_override(const ByteOverride (&table)[N], uint8_t byte) {
    for (const auto &o : table) {
        if (o.byte == byte) {
            return o.cp;
        }
    }
    return kCp437High[byte - 0x80];
}

// ISO 6937 upper half (0xA0..0xFF). Zero marks an unassigned position. 0xC1..0xCF hold the
// combining marks of the non-spacing diacritics.
constexpr char32_t kIso6937High[96] = {
    0x00A0, 0x00A1, 0x00A2, 0x00A3, 0x0024, 0x00A5, 0x0023, 0x00A7,  // 0xA0
    0x00A4, 0x2018, 0x201C, 0x00AB, 0x2190, 0x2191, 0x2192, 0x2193,
    0x00B0, 0x00B1, 0x00B2, 0x00B3, 0x00D7, 0x00B5, 0x00B6, 0x00B7,  // 0xB0
    0x00F7, 0x2019, 0x201D, 0x00BB, 0x00BC, 0x00BD, 0x00BE, 0x00BF,
    0x0000, 0x0300, 0x0301, 0x0302, 0x0303, 0x0304, 0x0306, 0x0307,  // 0xC0
    0x0308, 0x0308, 0x030A, 0x0327, 0x0332, 0x030B, 0x0328, 0x030C,
    0x2015, 0x00B9, 0x00AE, 0x00A9, 0x2122, 0x266A, 0x00AC, 0x00A6,  // 0xD0
    0x0000, 0x0000, 0x0000, 0x0000, 0x215B, 0x215C, 0x215D, 0x215E,
    0x2126, 0x00C6, 0x0110, 0x00AA, 0x0126, 0x0000, 0x0132, 0x013F,  // 0xE0
    0x0141, 0x00D8, 0x0152, 0x00BA, 0x00DE, 0x0166, 0x014A, 0x0149,
    0x0138, 0x00E6, 0x0111, 0x00F0, 0x0127, 0x0131, 0x0133, 0x0140,  // 0xF0
    0x0142, 0x00F8, 0x0153, 0x00DF, 0x00FE, 0x0167, 0x014B, 0x00AD,
};

constexpr char32_t kIso8859_7High[32] = {
    0x00A0, 0x2018, 0x2019, 0x00A3, 0x20AC, 0x20AF, 0x00A6, 0x00A7,  // 0xA0
    0x00A8, 0x00A9, 0x037A, 0x00AB, 0x00AC, 0x00AD, 0x0000, 0x2015,
    0x00B0, 0x00B1, 0x00B2, 0x00B3, 0x0384, 0x0385, 0x0386, 0x00B7,  // 0xB0
    0x0388, 0x0389, 0x038A, 0x00BB, 0x038C, 0x00BD, 0x038E, 0x038F,
};

struct Composition {
    uint8_t diacritic;
    char32_t spacing;  // form used when the diacritic precedes a space
    std::u32string_view bases;
    std::u32string_view composed;
};

constexpr Composition kCompositions[] = {
    {0xC1, 0x0060, U"AEIOUaeiou", U"ÀÈÌÒÙàèìòù"},
    {0xC2, 0x00B4, U"ACEILNORSUYZaceilnorsuyz", U"ÁĆÉÍĹŃÓŔŚÚÝŹáćéíĺńóŕśúýź"},
    {0xC3, 0x005E, U"ACEGHIJOSUWYaceghijosuwy", U"ÂĈÊĜĤÎĴÔŜÛŴŶâĉêĝĥîĵôŝûŵŷ"},
    {0xC4, 0x007E, U"AINOUainou", U"ÃĨÑÕŨãĩñõũ"},
    {0xC5, 0x00AF, U"AEIOUaeiou", U"ĀĒĪŌŪāēīōū"},
    {0xC6, 0x02D8, U"AGUagu", U"ĂĞŬăğŭ"},
    {0xC7, 0x02D9, U"CEGIZcegz", U"ĊĖĠİŻċėġż"},
    {0xC8, 0x00A8, U"AEIOUYaeiouy", U"ÄËÏÖÜŸäëïöüÿ"},
    {0xC9, 0x00A8, U"AEIOUYaeiouy", U"ÄËÏÖÜŸäëïöüÿ"},
    {0xCA, 0x02DA, U"AUau", U"ÅŮåů"},
    {0xCB, 0x00B8, U"CGKLNRSTcklnrst", U"ÇĢĶĻŅŖŞŢçķļņŗşţ"},
    {0xCC, 0x005F, U"", U""},
    {0xCD, 0x02DD, U"OUou", U"ŐŰőű"},
    {0xCE, 0x02DB, U"AEIUaeiu", U"ĄĘĮŲąęįų"},
    {0xCF, 0x02C7, U"CDELNRSTZcdelnrstz", U"ČĎĚĽŇŘŠŤŽčďěľňřšťž"},
};

const Composition *find_composition(uint8_t diacritic) {
    for (const auto &c : kCompositions) {
        if (c.diacritic == diacritic) {
            return &c;
        }
    }
    return nullptr;
}

char32_t decode_latin(uint8_t byte) {
    if (byte >= 0xA0) {
        const char32_t cp = kIso6937High[byte - 0xA0];
        return cp ? cp : kReplacementChar;
    }
    return kReplacementChar;
}

char32_t decode_cyrillic(uint8_t byte) {
    if (byte == 0xA0) return 0x00A0;
    if (byte == 0xAD) return 0x00AD;
    if (byte == 0xF0) return 0x2116;
    if (byte == 0xFD) return 0x00A7;
    if (byte >= 0xA1) {
        // The rest of the upper half runs parallel to U+0400..U+045F.
        return 0x0400 + (byte - 0xA0);
    }
    return kReplacementChar;
}

char32_t decode_arabic(uint8_t byte) {
    switch (byte) {
        case 0xA0:
            return 0x00A0;
        case 0xA4:
            return 0x00A4;
        case 0xAC:
            return 0x060C;
        case 0xAD:
            return 0x00AD;
        case 0xBB:
            return 0x061B;
        case 0xBF:
            return 0x061F;
        default:
            break;
    }
    if (byte >= 0xC1 && byte <= 0xDA) {
        return 0x0621 + (byte - 0xC1);
    }
    if (byte >= 0xE0 && byte <= 0xF2) {
        return 0x0640 + (byte - 0xE0);
    }
    return kReplacementChar;
}

char32_t decode_greek(uint8_t byte) {
    if (byte >= 0xA0 && byte <= 0xBF) {
        const char32_t cp = kIso8859_7High[byte - 0xA0];
        return cp ? cp : kReplacementChar;
    }
    if (byte >= 0xC0 && byte <= 0xFE && byte != 0xD2) {
        return 0x0390 + (byte - 0xC0);
    }
    return kReplacementChar;
}

char32_t decode_hebrew(uint8_t byte) {
    if (byte == 0xA0) return 0x00A0;
    if (byte == 0xAA) return 0x00D7;
    if (byte == 0xBA) return 0x00F7;
    if (byte == 0xDF) return 0x2017;
    if (byte == 0xFD) return 0x200E;
    if (byte == 0xFE) return 0x200F;
    if ((byte >= 0xA2 && byte <= 0xA9) || (byte >= 0xAB && byte <= 0xB9) ||
        (byte >= 0xBB && byte <= 0xBE)) {
        return byte;  // identical to Latin-1
    }
    if (byte >= 0xE0 && byte <= 0xFA) {
        return 0x05D0 + (byte - 0xE0);
    }
    return kReplacementChar;
}

}  // namespace

std::optional<CodePage> code_page_from_number(uint32_t number) {
    switch (number) {
        case 437:
            return CodePage::UnitedStates;
        case 850:
            return CodePage::Multilingual;
        case 860:
            return CodePage::Portugal;
        case 863:
            return CodePage::CanadaFrench;
        case 865:
            return CodePage::Nordic;
        default:
            return std::nullopt;
    }
}

std::optional<CharacterTable> character_table_from_number(uint32_t number) {
    if (number <= static_cast<uint32_t>(CharacterTable::Hebrew)) {
        return static_cast<CharacterTable>(number);
    }
    return std::nullopt;
}

void append_utf8(std::string &out, char32_t cp) {
    if (cp > 0x10FFFF || (cp >= 0xD800 && cp <= 0xDFFF)) {
        cp = kReplacementChar;
    }
    if (cp < 0x80) {
        out.push_back(static_cast<char>(cp));
    } else if (cp < 0x800) {
        out.push_back(static_cast<char>(0xC0 | (cp >> 6)));
        out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
    } else if (cp < 0x10000) {
        out.push_back(static_cast<char>(0xE0 | (cp >> 12)));
        out.push_back(static_cast<char>(0x80 | ((cp >> 6) & 0x3F)));
        out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
    } else {
        out.push_back(static_cast<char>(0xF0 | (cp >> 18)));
        out.push_back(static_cast<char>(0x80 | ((cp >> 12) & 0x3F)));
        out.push_back(static_cast<char>(0x80 | ((cp >> 6) & 0x3F)));
        out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
    }
}

char32_t decode_code_page_byte(CodePage page, uint8_t byte) {
    if (byte < 0x80) {
        return byte;
    }
    switch (page) {
        case CodePage::UnitedStates:
            return kCp437High[byte - 0x80];
        case CodePage::Multilingual:
            return kCp850High[byte - 0x80];
        case CodePage::Portugal:
            return lookup_override(kCp860Overrides, byte);
        case CodePage::CanadaFrench:
            return lookup_override(kCp863Overrides, byte);
        case CodePage::Nordic:
            return lookup_override(kCp865Overrides, byte);
    }
    return kReplacementChar;
}

std::string decode_code_page(CodePage page, const uint8_t *data, size_t size) {
    std::string out;
    out.reserve(size);
    for (size_t i = 0; i < size; ++i) {
        append_utf8(out, decode_code_page_byte(page, data[i]));
    }
    return out;
}

std::string decode_code_page(CodePage page, const std::string &raw) {
    return decode_code_page(page, reinterpret_cast<const uint8_t *>(raw.data()), raw.size());
}

char32_t decode_table_byte(CharacterTable table, uint8_t byte) {
    if (byte >= 0x20 && byte < 0x7F) {
        return byte;
    }
    switch (table) {
        case CharacterTable::Latin:
            return decode_latin(byte);
        case CharacterTable::Cyrillic:
            return decode_cyrillic(byte);
        case CharacterTable::Arabic:
            return decode_arabic(byte);
        case CharacterTable::Greek:
            return decode_greek(byte);
        case CharacterTable::Hebrew:
            return decode_hebrew(byte);
    }
    return kReplacementChar;
}

bool is_iso6937_diacritic(uint8_t byte) { return byte >= 0xC1 && byte <= 0xCF; }

std::string decode_text(CharacterTable table, const uint8_t *data, size_t size) {
    std::string out;
    out.reserve(size);
    size_t i = 0;
    while (i < size) {
        const uint8_t b = data[i];
        if (table != CharacterTable::Latin || !is_iso6937_diacritic(b)) {
            append_utf8(out, decode_table_byte(table, b));
            ++i;
            continue;
        }

        const char32_t mark = decode_table_byte(table, b);
        if (i + 1 >= size) {
            // Dangling diacritic at the end of the run.
            append_utf8(out, mark);
            ++i;
            continue;
        }
        const uint8_t base_byte = data[i + 1];
        const Composition *comp = find_composition(b);
        if (base_byte == 0x20 && comp) {
            append_utf8(out, comp->spacing);
            i += 2;
            continue;
        }
        const char32_t base = decode_table_byte(table, base_byte);
        size_t pos = comp ? comp->bases.find(base) : std::u32string_view::npos;
        if (pos != std::u32string_view::npos) {
            append_utf8(out, comp->composed[pos]);
        } else {
            append_utf8(out, base);
            append_utf8(out, mark);
        }
        i += 2;
    }
    return out;
}

}  // namespace ebustl
