//
//  timecode.hpp
//  EbuStl
//
//  Created by the EbuStl authors on 10/16/26.
//  Copyright © 2026 EbuStl contributors. All rights reserved.
//

#pragma once

#include <cstdint>
#include <optional>
#include <string>

namespace ebustl {

/// @ingroup api
/// Frame-based timecode as stored in TTI blocks (binary) and the GSI (ASCII HHMMSSFF).
struct Timecode {
    uint8_t hours = 0;
    uint8_t minutes = 0;
    uint8_t seconds = 0;
    uint8_t frames = 0;

    bool operator==(const Timecode &) const = default;
};

// True when every component is inside its range for the given frame rate.
bool is_valid_timecode(const Timecode &tc, uint32_t frame_rate);

// Total frame count since 00:00:00:00.
uint64_t to_frames(const Timecode &tc, uint32_t frame_rate);

// Wall-clock milliseconds, rounded down. Returns 0 when frame_rate is 0.
uint64_t to_milliseconds(const Timecode &tc, uint32_t frame_rate);

// Parse an 8 character "HHMMSSFF" field (GSI TCP/TCF). Blank or malformed -> nullopt.
std::optional<Timecode> parse_timecode_field(const std::string &field);

// "HH:MM:SS:FF".
std::string format_timecode(const Timecode &tc);

}  // namespace ebustl
