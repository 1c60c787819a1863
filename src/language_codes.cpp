//
//  language_codes.cpp
//  EbuStl
//
//  Created by the EbuStl authors on 10/16/26.
//  Copyright © 2026 EbuStl contributors. All rights reserved.
//

#include "language_codes.hpp"

namespace ebustl {

namespace {

// European languages, 0x01..0x2B.
const char *const kEuropean[] = {
    "Albanian",   "Breton",     "Catalan",  "Croatian",  "Welsh",        "Czech",
    "Danish",     "German",     "English",  "Spanish",   "Esperanto",    "Estonian",
    "Basque",     "Faroese",    "French",   "Frisian",   "Irish",        "Gaelic",
    "Galician",   "Icelandic",  "Italian",  "Lappish",   "Latin",        "Latvian",
    "Luxembourgian", "Lithuanian", "Hungarian", "Maltese", "Dutch",      "Norwegian",
    "Occitan",    "Polish",     "Portuguese", "Romanian", "Romansh",     "Serbian",
    "Slovak",     "Slovenian",  "Finnish",  "Swedish",   "Turkish",      "Flemish",
    "Wallon",
};

// Other languages, allocated downwards from 0x7F to 0x45.
const char *const kOther[] = {
    "Amharic",   "Arabic",     "Armenian",   "Assamese", "Azerbaijani", "Bambora",
    "Bielorussian", "Bengali", "Bulgarian",  "Burmese",  "Chinese",     "Churash",
    "Dari",      "Fulani",     "Georgian",   "Greek",    "Gujurati",    "Gurani",
    "Hausa",     "Hebrew",     "Hindi",      "Indonesian", "Japanese",  "Kannada",
    "Kazakh",    "Khmer",      "Korean",     "Laotian",  "Macedonian",  "Malagasay",
    "Malaysian", "Moldavian",  "Marathi",    "Ndebele",  "Nepali",      "Oriya",
    "Papamiento", "Persian",   "Punjabi",    "Pushtu",   "Quechua",     "Russian",
    "Ruthenian", "Serbo-croat", "Shona",     "Sinhalese", "Somali",     "Sranan Tongo",
    "Swahili",   "Tadzhik",    "Tamil",      "Tatar",    "Telugu",      "Thai",
    "Ukrainian", "Urdu",       "Uzbek",      "Vietnamese", "Zulu",
};

constexpr size_t kEuropeanCount = sizeof(kEuropean) / sizeof(kEuropean[0]);
constexpr size_t kOtherCount = sizeof(kOther) / sizeof(kOther[0]);

int hex_value(char c) {
    if (c >= '0' && c <= '9') return c - '0';
    if (c >= 'A' && c <= 'F') return c - 'A' + 10;
    if (c >= 'a' && c <= 'f') return c - 'a' + 10;
    return -1;
}

}  // namespace

std::optional<uint8_t> parse_language_code(const std::string &field) {
    if (field.size() != 2) {
        return std::nullopt;
    }
    const int hi = hex_value(field[0]);
    const int lo = hex_value(field[1]);
    if (hi < 0 || lo < 0) {
        return std::nullopt;
    }
    return static_cast<uint8_t>(hi * 16 + lo);
}

std::string language_name(uint8_t code) {
    if (code >= 0x01 && code < 0x01 + kEuropeanCount) {
        return kEuropean[code - 0x01];
    }
    if (code <= 0x7F && code > 0x7F - kOtherCount) {
        return kOther[0x7F - code];
    }
    return {};
}

}  // namespace ebustl
