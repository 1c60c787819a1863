//
//  timecode.cpp
//  EbuStl
//
//  Created by the EbuStl authors on 10/16/26.
//  Copyright © 2026 EbuStl contributors. All rights reserved.
//

#include "timecode.hpp"

#include <cstdio>

#include "byte_reader.hpp"

namespace ebustl {

bool is_valid_timecode(const Timecode &tc, uint32_t frame_rate) {
    return tc.hours < 24 && tc.minutes < 60 && tc.seconds < 60 && tc.frames < frame_rate;
}

uint64_t to_frames(const Timecode &tc, uint32_t frame_rate) {
    const uint64_t secs = uint64_t(tc.hours) * 3600 + uint64_t(tc.minutes) * 60 + tc.seconds;
    return secs * frame_rate + tc.frames;
}

uint64_t to_milliseconds(const Timecode &tc, uint32_t frame_rate) {
    if (frame_rate == 0) {
        return 0;
    }
    const uint64_t secs = uint64_t(tc.hours) * 3600 + uint64_t(tc.minutes) * 60 + tc.seconds;
    return secs * 1000 + uint64_t(tc.frames) * 1000 / frame_rate;
}

std::optional<Timecode> parse_timecode_field(const std::string &field) {
    if (field.size() != 8 || is_blank(field)) {
        return std::nullopt;
    }
    uint8_t parts[4] = {};
    for (size_t i = 0; i < 4; ++i) {
        auto v = parse_ascii_number(field.substr(i * 2, 2));
        if (!v || *v > 99) {
            return std::nullopt;
        }
        parts[i] = static_cast<uint8_t>(*v);
    }
    return Timecode{parts[0], parts[1], parts[2], parts[3]};
}

std::string format_timecode(const Timecode &tc) {
    char buf[16];
    std::snprintf(buf, sizeof(buf), "%02u:%02u:%02u:%02u", static_cast<unsigned>(tc.hours),
                  static_cast<unsigned>(tc.minutes), static_cast<unsigned>(tc.seconds),
                  static_cast<unsigned>(tc.frames));
    return buf;
}

}  // namespace ebustl
