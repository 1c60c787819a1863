//
//  tti_block.hpp
//  EbuStl
//
//  Created by the EbuStl authors on 10/16/26.
//  Copyright © 2026 EbuStl contributors. All rights reserved.
//

#pragma once

#include <cstddef>
#include <cstdint>
#include <vector>

#include "parse_status.hpp"
#include "timecode.hpp"

namespace ebustl {

inline constexpr size_t kTtiBlockSize = 128;
inline constexpr size_t kTextFieldOffset = 16;
inline constexpr size_t kTextFieldSize = kTtiBlockSize - kTextFieldOffset;  // 112

inline constexpr uint8_t kMaxExtensionNumber = 0xEF;
inline constexpr uint8_t kUserDataBlock = 0xFE;
inline constexpr uint8_t kLastExtensionBlock = 0xFF;

/// @ingroup api
enum class CumulativeStatus : uint8_t {
    NotCumulative = 0,
    First = 1,
    Intermediate = 2,
    Last = 3,
    Unknown = 0xFF,
};

/// @ingroup api
enum class Justification : uint8_t {
    Unchanged = 0,  ///< no justification; the text keeps its own spacing
    Left = 1,
    Centred = 2,
    Right = 3,
    Unknown = 0xFF,
};

/// @ingroup api
/// One 128 byte Text and Timing Information record, undecoded text included.
struct TtiBlock {
    size_t record_index = 0;   ///< ordinal among TTI blocks
    size_t byte_offset = 0;    ///< absolute offset of the record in the file

    uint8_t subtitle_group = 0;
    uint16_t subtitle_number = 0;
    uint8_t extension_block = kLastExtensionBlock;
    uint8_t cumulative_status_raw = 0;
    CumulativeStatus cumulative_status = CumulativeStatus::NotCumulative;
    Timecode time_code_in;
    Timecode time_code_out;
    uint8_t vertical_position = 0;
    uint8_t justification_raw = 0;
    Justification justification = Justification::Unchanged;
    bool comment = false;
    std::vector<uint8_t> text_field;  ///< kTextFieldSize bytes, fill byte padded

    bool is_user_data() const { return extension_block == kUserDataBlock; }
    bool is_reserved() const {
        return extension_block > kMaxExtensionNumber && extension_block < kUserDataBlock;
    }

    bool operator==(const TtiBlock &) const = default;
};

// Decode one record. `record` must point at kTtiBlockSize bytes. Timecodes are validated
// against frame_rate except for user data blocks.
ParseStatus read_tti_block(const uint8_t *record, size_t record_index, size_t byte_offset,
                           uint32_t frame_rate, TtiBlock &out,
                           std::vector<Diagnostic> &diagnostics);

// Decode records until `size` is exhausted. `base_offset` is the absolute file offset of
// `data`. A trailing partial record fails with TruncatedInput.
ParseStatus read_tti_blocks(const uint8_t *data, size_t size, size_t base_offset,
                            uint32_t frame_rate, std::vector<TtiBlock> &out,
                            std::vector<Diagnostic> &diagnostics);

const char *to_string(CumulativeStatus cs);
const char *to_string(Justification jc);

}  // namespace ebustl
