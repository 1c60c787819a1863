//
//  subtitle_assembler.hpp
//  EbuStl
//
//  Created by the EbuStl authors on 10/16/26.
//  Copyright © 2026 EbuStl contributors. All rights reserved.
//

#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

#include "control_codes.hpp"
#include "parse_status.hpp"
#include "timecode.hpp"
#include "tti_block.hpp"

namespace ebustl {

/**
 * @brief One logical subtitle, merged from one or more TTI blocks.
 *
 * Timing, position and justification come from the first block except time-code-out, which
 * comes from the last. Fragments of consecutive blocks are separated by a row break.
 */
struct Subtitle {
    uint8_t subtitle_group = 0;
    uint16_t subtitle_number = 0;
    Timecode time_code_in;
    Timecode time_code_out;
    uint8_t vertical_position = 0;
    Justification justification = Justification::Unchanged;
    uint8_t justification_raw = 0;
    CumulativeStatus cumulative_status = CumulativeStatus::NotCumulative;
    bool comment = false;
    size_t first_record_index = 0;
    size_t block_count = 0;
    FragmentList fragments;

    std::string text() const { return plain_text(fragments); }

    bool operator==(const Subtitle &) const = default;
};

/// A TTI block together with the fragments decoded from its text field.
struct DecodedBlock {
    TtiBlock block;
    FragmentList fragments;
};

// Group blocks into subtitles in arrival order. Extension 0 opens a subtitle, 1..0xEF
// continue it, 0xFF closes it (or stands alone). User data blocks (0xFE) are collected into
// `user_data`; reserved numbers are skipped with a diagnostic.
ParseStatus assemble_subtitles(const std::vector<DecodedBlock> &blocks, uint32_t frame_rate,
                               std::vector<Subtitle> &out,
                               std::vector<std::vector<uint8_t>> &user_data,
                               std::vector<Diagnostic> &diagnostics);

}  // namespace ebustl
