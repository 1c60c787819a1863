//
//  document.hpp
//  EbuStl
//
//  Created by the EbuStl authors on 10/16/26.
//  Copyright © 2026 EbuStl contributors. All rights reserved.
//

#pragma once

#include <cstddef>
#include <cstdint>
#include <vector>

#include "gsi_block.hpp"
#include "parse_status.hpp"
#include "subtitle_assembler.hpp"

namespace ebustl {

/**
 * @brief Parsed EBU STL file: header, subtitles in file order, and non-fatal findings.
 *
 * Owns all decoded data; nothing refers back into the input buffer.
 */
struct Document {
    GeneralBlock general;
    std::vector<Subtitle> subtitles;
    std::vector<std::vector<uint8_t>> user_data;  ///< text fields of EBN 0xFE blocks
    std::vector<Diagnostic> diagnostics;

    uint32_t frame_rate() const { return general.frame_rate; }

    bool operator==(const Document &) const = default;
};

// Aggregate the parsed parts. `tti_block_count` is the number of records read and is only used
// to flag a disagreement with the header's TNB field.
Document make_document(GeneralBlock general, std::vector<Subtitle> subtitles,
                       std::vector<std::vector<uint8_t>> user_data,
                       std::vector<Diagnostic> diagnostics, size_t tti_block_count);

}  // namespace ebustl
