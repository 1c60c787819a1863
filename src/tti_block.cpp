//
//  tti_block.cpp
//  EbuStl
//
//  Created by the EbuStl authors on 10/16/26.
//  Copyright © 2026 EbuStl contributors. All rights reserved.
//

#include "tti_block.hpp"

#include <string>
#include <utility>

#include "byte_reader.hpp"
#include "logging.hpp"

namespace {

constexpr size_t kSgnOffset = 0;
constexpr size_t kSnOffset = 1;
constexpr size_t kEbnOffset = 3;
constexpr size_t kCsOffset = 4;
constexpr size_t kTciOffset = 5;
constexpr size_t kTcoOffset = 9;
constexpr size_t kVpOffset = 13;
constexpr size_t kJcOffset = 14;
constexpr size_t kCfOffset = 15;

}  // namespace

namespace ebustl {

namespace {

Timecode read_timecode(const uint8_t *p) { return Timecode{p[0], p[1], p[2], p[3]}; }

void add_diagnostic(std::vector<Diagnostic> &diagnostics, DiagnosticCode code,
                    const std::string &message, size_t record_index, uint8_t raw) {
    ES_LOG("warn", message);
    Diagnostic d;
    d.code = code;
    d.message = message;
    d.record_index = record_index;
    d.raw_value = std::to_string(raw);
    diagnostics.push_back(std::move(d));
}

}  // namespace

ParseStatus read_tti_block(const uint8_t *record, size_t record_index, size_t byte_offset,
                           uint32_t frame_rate, TtiBlock &out,
                           std::vector<Diagnostic> &diagnostics) {
    TtiBlock block;
    block.record_index = record_index;
    block.byte_offset = byte_offset;
    block.subtitle_group = record[kSgnOffset];
    block.subtitle_number = read_u16_le(record + kSnOffset);
    block.extension_block = record[kEbnOffset];

    block.cumulative_status_raw = record[kCsOffset];
    if (block.cumulative_status_raw <= static_cast<uint8_t>(CumulativeStatus::Last)) {
        block.cumulative_status = static_cast<CumulativeStatus>(block.cumulative_status_raw);
    } else {
        block.cumulative_status = CumulativeStatus::Unknown;
        add_diagnostic(diagnostics, DiagnosticCode::UnknownCumulativeStatus,
                       "unknown cumulative status", record_index, block.cumulative_status_raw);
    }

    block.time_code_in = read_timecode(record + kTciOffset);
    block.time_code_out = read_timecode(record + kTcoOffset);
    // User data and reserved blocks carry no timing; the assembler skips them.
    if (!block.is_user_data() && !block.is_reserved()) {
        const struct {
            const Timecode &tc;
            const char *name;
            size_t offset;
        } checks[] = {{block.time_code_in, "time code in", kTciOffset},
                      {block.time_code_out, "time code out", kTcoOffset}};
        for (const auto &c : checks) {
            if (!is_valid_timecode(c.tc, frame_rate)) {
                std::string msg = std::string(c.name) + " " + format_timecode(c.tc) +
                                  " of block " + std::to_string(record_index) +
                                  " is out of range at " + std::to_string(frame_rate) + " fps";
                ES_LOG("error", msg);
                return make_error(ParseError::InvalidTimecode, msg, record_index,
                                  byte_offset + c.offset, format_timecode(c.tc));
            }
        }
    }

    block.vertical_position = record[kVpOffset];
    block.justification_raw = record[kJcOffset];
    if (block.justification_raw <= static_cast<uint8_t>(Justification::Right)) {
        block.justification = static_cast<Justification>(block.justification_raw);
    } else {
        block.justification = Justification::Unknown;
        add_diagnostic(diagnostics, DiagnosticCode::UnknownJustification,
                       "unknown justification code", record_index, block.justification_raw);
    }
    // 0x00 subtitle data, 0x01 comment; anything non-zero is treated as a comment.
    block.comment = record[kCfOffset] != 0;
    block.text_field = field_bytes(record, kTextFieldOffset, kTextFieldSize);

    ES_LOG("tti", "sgn=" << static_cast<int>(block.subtitle_group)
                      << " sn=" << block.subtitle_number
                      << " ebn=" << static_cast<int>(block.extension_block)
                      << " tci=" << format_timecode(block.time_code_in)
                      << " tco=" << format_timecode(block.time_code_out)
                      << " tf=" << hex_prefix(block.text_field));
    out = std::move(block);
    return make_ok();
}

ParseStatus read_tti_blocks(const uint8_t *data, size_t size, size_t base_offset,
                            uint32_t frame_rate, std::vector<TtiBlock> &out,
                            std::vector<Diagnostic> &diagnostics) {
    out.reserve(out.size() + size / kTtiBlockSize);
    size_t pos = 0;
    size_t index = 0;
    while (pos < size) {
        const size_t remain = size - pos;
        if (remain < kTtiBlockSize) {
            std::string msg = "trailing TTI record has " + std::to_string(remain) + " of " +
                              std::to_string(kTtiBlockSize) + " bytes";
            ES_LOG("error", msg);
            return make_error(ParseError::TruncatedInput, msg, index, base_offset + pos);
        }
        LogBlockScope scope(index);
        TtiBlock block;
        auto st = read_tti_block(data + pos, index, base_offset + pos, frame_rate, block,
                                 diagnostics);
        if (!st.ok) {
            return st;
        }
        out.push_back(std::move(block));
        pos += kTtiBlockSize;
        ++index;
    }
    return make_ok();
}

const char *to_string(CumulativeStatus cs) {
    switch (cs) {
        case CumulativeStatus::NotCumulative:
            return "none";
        case CumulativeStatus::First:
            return "first";
        case CumulativeStatus::Intermediate:
            return "intermediate";
        case CumulativeStatus::Last:
            return "last";
        case CumulativeStatus::Unknown:
            return "unknown";
    }
    return "unknown";
}

const char *to_string(Justification jc) {
    switch (jc) {
        case Justification::Unchanged:
            return "unchanged";
        case Justification::Left:
            return "left";
        case Justification::Centred:
            return "centred";
        case Justification::Right:
            return "right";
        case Justification::Unknown:
            return "unknown";
    }
    return "unknown";
}

}  // namespace ebustl
