//
//  gsi_block.hpp
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

#include "character_tables.hpp"
#include "parse_options.hpp"
#include "parse_status.hpp"
#include "timecode.hpp"

namespace ebustl {

inline constexpr size_t kGsiBlockSize = 1024;

/// @ingroup api
enum class DisplayStandard : uint8_t {
    Undefined,       // ' '
    OpenSubtitling,  // '0'
    TeletextLevel1,  // '1'
    TeletextLevel2,  // '2'
    Unknown,
};

/// @ingroup api
enum class TimeCodeStatus : uint8_t { NotIntendedForUse, IntendedForUse, Unknown };

/// @ingroup api
/// YYMMDD date field. `valid` is false when the text is blank or not a calendar date.
struct StlDate {
    std::string raw;
    bool valid = false;
    uint16_t year = 0;
    uint8_t month = 0;
    uint8_t day = 0;

    bool operator==(const StlDate &) const = default;
};

/**
 * @brief Decoded General Subtitle Information block (the 1024 byte file header).
 *
 * Every enumerated field keeps its raw value so unknown values survive decoding. Text fields
 * are UTF-8.
 */
struct GeneralBlock {
    std::string code_page_raw;            ///< CPN, three ASCII digits
    uint32_t code_page_number = 850;
    std::optional<CodePage> code_page;    ///< empty when the number is not a known page
    std::string disk_format_code;         ///< DFC, e.g. "STL25.01"
    uint32_t frame_rate = 25;
    uint8_t display_standard_raw = ' ';
    DisplayStandard display_standard = DisplayStandard::Undefined;
    std::string character_table_raw;      ///< CCT, two ASCII digits
    std::optional<CharacterTable> character_table;
    std::string language_code;            ///< LC, two hex digits, decoded like the other header text

    std::string original_programme_title;
    std::string original_episode_title;
    std::string translated_programme_title;
    std::string translated_episode_title;
    std::string translator_name;
    std::string translator_contact;
    std::string subtitle_list_reference;

    StlDate creation_date;
    StlDate revision_date;
    uint32_t revision_number = 0;

    uint32_t total_tti_blocks = 0;
    uint32_t total_subtitles = 0;
    uint32_t total_subtitle_groups = 0;
    uint32_t max_chars_per_row = 0;
    uint32_t max_rows = 0;

    uint8_t time_code_status_raw = '1';
    TimeCodeStatus time_code_status = TimeCodeStatus::IntendedForUse;
    std::string start_of_programme_raw;   ///< TCP, HHMMSSFF
    std::optional<Timecode> start_of_programme;
    std::string first_in_cue_raw;         ///< TCF, HHMMSSFF
    std::optional<Timecode> first_in_cue;

    uint32_t total_disks = 1;
    uint32_t disk_sequence_number = 1;
    std::string country_of_origin;
    std::string publisher;
    std::string editor_name;
    std::string editor_contact;

    std::vector<uint8_t> spare;               ///< bytes 373..447, opaque
    std::vector<uint8_t> user_defined_area;   ///< bytes 448..1023, opaque

    // Table used for TTI text fields; Latin when the CCT value is unknown.
    CharacterTable text_table() const { return character_table.value_or(CharacterTable::Latin); }

    bool operator==(const GeneralBlock &) const = default;
};

// Decode the GSI block from the start of `data`. Non-fatal findings are appended to
// `diagnostics`. Fails with TruncatedInput when fewer than kGsiBlockSize bytes are available.
ParseStatus read_gsi_block(const uint8_t *data, size_t size, const ParseOptions &options,
                           GeneralBlock &out, std::vector<Diagnostic> &diagnostics);

// Frame rate carried by a disk format code ("STL25.01" -> 25). nullopt when the code does not
// have the STLnn.xx shape or nn is zero.
std::optional<uint32_t> frame_rate_from_disk_format(const std::string &dfc);

#ifdef EBUSTL_TESTING
namespace testing {
// Test-only access to the YYMMDD date decoder.
StlDate parse_date_for_test(const std::string &raw);
}  // namespace testing
#endif

const char *to_string(DisplayStandard dsc);
const char *to_string(TimeCodeStatus tcs);

}  // namespace ebustl
