//
//  subtitle_assembler.cpp
//  EbuStl
//
//  Created by the EbuStl authors on 10/16/26.
//  Copyright © 2026 EbuStl contributors. All rights reserved.
//

#include "subtitle_assembler.hpp"

#include <optional>
#include <utility>

#include "logging.hpp"

namespace ebustl {

namespace {

struct OpenSubtitle {
    Subtitle subtitle;
    uint8_t last_extension = 0;
    const TtiBlock *last_block = nullptr;
};

Subtitle start_subtitle(const DecodedBlock &db) {
    const TtiBlock &b = db.block;
    Subtitle s;
    s.subtitle_group = b.subtitle_group;
    s.subtitle_number = b.subtitle_number;
    s.time_code_in = b.time_code_in;
    s.time_code_out = b.time_code_out;
    s.vertical_position = b.vertical_position;
    s.justification = b.justification;
    s.justification_raw = b.justification_raw;
    s.cumulative_status = b.cumulative_status;
    s.comment = b.comment;
    s.first_record_index = b.record_index;
    s.block_count = 1;
    s.fragments = db.fragments;
    return s;
}

void append_block(Subtitle &s, const DecodedBlock &db) {
    if (!s.fragments.empty() && s.fragments.back().kind != FragmentKind::RowBreak) {
        s.fragments.push_back(TextFragment::make_marker(FragmentKind::RowBreak, kRowBreak));
    }
    s.fragments.insert(s.fragments.end(), db.fragments.begin(), db.fragments.end());
    s.time_code_out = db.block.time_code_out;
    ++s.block_count;
}

ParseStatus close_subtitle(std::optional<OpenSubtitle> &open, uint32_t frame_rate,
                           std::vector<Subtitle> &out) {
    if (!open) {
        return make_ok();
    }
    Subtitle &s = open->subtitle;
    if (to_frames(s.time_code_out, frame_rate) < to_frames(s.time_code_in, frame_rate)) {
        const TtiBlock *last = open->last_block;
        std::string msg = "subtitle " + std::to_string(s.subtitle_number) + " ends at " +
                          format_timecode(s.time_code_out) + " before it starts at " +
                          format_timecode(s.time_code_in);
        ES_LOG("error", msg);
        return make_error(ParseError::InvalidTimeRange, msg, last->record_index,
                          last->byte_offset,
                          format_timecode(s.time_code_in) + "-" +
                              format_timecode(s.time_code_out));
    }
    ES_LOG("assemble", "subtitle sn=" << s.subtitle_number << " blocks=" << s.block_count
                                      << " fragments=" << s.fragments.size());
    out.push_back(std::move(s));
    open.reset();
    return make_ok();
}

ParseStatus broken_sequence(const TtiBlock &b, const std::string &why) {
    std::string msg = "block " + std::to_string(b.record_index) + " (sn=" +
                      std::to_string(b.subtitle_number) +
                      " ebn=" + std::to_string(b.extension_block) + ") " + why;
    ES_LOG("error", msg);
    return make_error(ParseError::BrokenExtensionSequence, msg, b.record_index, b.byte_offset,
                      std::to_string(b.extension_block));
}

}  // namespace

ParseStatus assemble_subtitles(const std::vector<DecodedBlock> &blocks, uint32_t frame_rate,
                               std::vector<Subtitle> &out,
                               std::vector<std::vector<uint8_t>> &user_data,
                               std::vector<Diagnostic> &diagnostics) {
    std::optional<OpenSubtitle> open;

    for (const auto &db : blocks) {
        const TtiBlock &b = db.block;
        const uint8_t ebn = b.extension_block;
        LogBlockScope scope(b.record_index);

        if (b.is_user_data()) {
            user_data.push_back(b.text_field);
            continue;
        }
        if (b.is_reserved()) {
            ES_LOG("warn", "skipping block with reserved extension " << static_cast<int>(ebn));
            Diagnostic d;
            d.code = DiagnosticCode::ReservedExtensionBlock;
            d.message = "reserved extension block number, block skipped";
            d.record_index = b.record_index;
            d.raw_value = std::to_string(ebn);
            diagnostics.push_back(std::move(d));
            continue;
        }

        const bool continues_open = open &&
                                    open->subtitle.subtitle_number == b.subtitle_number &&
                                    open->subtitle.subtitle_group == b.subtitle_group;

        if (ebn == 0) {
            auto st = close_subtitle(open, frame_rate, out);
            if (!st.ok) {
                return st;
            }
            open = OpenSubtitle{start_subtitle(db), 0, &b};
            continue;
        }

        if (ebn == kLastExtensionBlock) {
            if (continues_open) {
                append_block(open->subtitle, db);
                open->last_block = &b;
            } else {
                auto st = close_subtitle(open, frame_rate, out);
                if (!st.ok) {
                    return st;
                }
                open = OpenSubtitle{start_subtitle(db), ebn, &b};
            }
            auto st = close_subtitle(open, frame_rate, out);
            if (!st.ok) {
                return st;
            }
            continue;
        }

        // Continuation block 1..0xEF.
        if (!open) {
            return broken_sequence(b, "continues no open subtitle");
        }
        if (!continues_open) {
            return broken_sequence(b, "does not match open subtitle " +
                                          std::to_string(open->subtitle.subtitle_number));
        }
        if (ebn != open->last_extension + 1) {
            return broken_sequence(b, "follows extension " +
                                          std::to_string(open->last_extension));
        }
        append_block(open->subtitle, db);
        open->last_extension = ebn;
        open->last_block = &b;
    }
    return close_subtitle(open, frame_rate, out);
}

}  // namespace ebustl
