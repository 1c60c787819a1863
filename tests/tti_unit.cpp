// Unit coverage for the TTI record reader: field layout, little-endian subtitle numbers,
// timecode validation and truncated trailing records.
#include <cstdint>
#include <iostream>
#include <string>
#include <vector>

#include "tti_block.hpp"
#include "stl_test_utils.hpp"

namespace {

using ebustl::DiagnosticCode;
using ebustl::ParseError;
using ebustl::TtiBlock;
using stl_test_utils::make_tti;
using stl_test_utils::TtiFields;

bool check(bool cond, const std::string &msg) {
    if (!cond) {
        std::cerr << "[tti_unit] FAIL: " << msg << "\n";
    }
    return cond;
}

bool test_fields() {
    TtiFields f;
    f.sgn = 3;
    f.sn = 0x0102;
    f.ebn = 0x00;
    f.cs = 2;
    f.vp = 22;
    f.jc = 3;
    f.cf = 1;
    f.text = stl_test_utils::text_bytes("Hello");
    auto rec = make_tti(f);

    TtiBlock block;
    std::vector<ebustl::Diagnostic> diags;
    auto st = ebustl::read_tti_block(rec.data(), 7, 1024 + 7 * 128, 25, block, diags);
    bool ok = check(st.ok, "record parses: " + st.message);
    ok &= check(diags.empty(), "record has no diagnostics");
    ok &= check(block.record_index == 7 && block.byte_offset == 1024 + 7 * 128, "position");
    ok &= check(block.subtitle_group == 3, "SGN");
    ok &= check(block.subtitle_number == 0x0102, "SN is little-endian");
    ok &= check(block.extension_block == 0 && !block.is_user_data() && !block.is_reserved(),
                "EBN 0");
    ok &= check(block.cumulative_status == ebustl::CumulativeStatus::Intermediate, "CS");
    ok &= check(block.time_code_in == ebustl::Timecode{10, 0, 1, 0}, "TCI");
    ok &= check(block.time_code_out == ebustl::Timecode{10, 0, 3, 12}, "TCO");
    ok &= check(block.vertical_position == 22, "VP");
    ok &= check(block.justification == ebustl::Justification::Right, "JC");
    ok &= check(block.comment, "CF 1 marks a comment");
    ok &= check(block.text_field.size() == ebustl::kTextFieldSize, "text field is 112 bytes");
    ok &= check(block.text_field[0] == 'H' && block.text_field[5] == 0x8F,
                "text field is copied verbatim");
    return ok;
}

bool test_invalid_timecode() {
    TtiFields f;
    f.tco[3] = 25;  // frame 25 does not exist at 25 fps
    auto rec = make_tti(f);
    TtiBlock block;
    std::vector<ebustl::Diagnostic> diags;
    auto st = ebustl::read_tti_block(rec.data(), 4, 1536, 25, block, diags);
    bool ok = check(!st.ok && st.error == ParseError::InvalidTimecode, "frames >= fps fails");
    ok &= check(st.record_index == size_t{4}, "error identifies the block");
    ok &= check(st.byte_offset == size_t{1536 + 9}, "error points at the TCO field");
    ok &= check(st.raw_value == "10:00:03:25", "offending timecode is reported");

    // Same record is fine at 30 fps.
    st = ebustl::read_tti_block(rec.data(), 4, 1536, 30, block, diags);
    ok &= check(st.ok, "frame 25 is valid at 30 fps");

    TtiFields minutes;
    minutes.tci[1] = 60;
    rec = make_tti(minutes);
    st = ebustl::read_tti_block(rec.data(), 0, 1024, 25, block, diags);
    ok &= check(!st.ok && st.error == ParseError::InvalidTimecode, "minutes 60 fails");

    // User data blocks carry no timing.
    TtiFields user;
    user.ebn = ebustl::kUserDataBlock;
    user.tci[3] = 0xFF;
    rec = make_tti(user);
    st = ebustl::read_tti_block(rec.data(), 0, 1024, 25, block, diags);
    ok &= check(st.ok && block.is_user_data(), "user data timecodes are not validated");

    TtiFields reserved;
    reserved.ebn = 0xF3;
    reserved.tci[0] = 99;
    reserved.tco[3] = 0xFF;
    rec = make_tti(reserved);
    st = ebustl::read_tti_block(rec.data(), 5, 1664, 25, block, diags);
    ok &= check(st.ok && block.is_reserved(), "reserved block timecodes are not validated");
    return ok;
}

bool test_unknown_codes() {
    TtiFields f;
    f.cs = 9;
    f.jc = 7;
    auto rec = make_tti(f);
    TtiBlock block;
    std::vector<ebustl::Diagnostic> diags;
    auto st = ebustl::read_tti_block(rec.data(), 2, 1280, 25, block, diags);
    bool ok = check(st.ok, "unknown CS/JC are not fatal");
    ok &= check(block.cumulative_status == ebustl::CumulativeStatus::Unknown &&
                    block.cumulative_status_raw == 9,
                "CS raw kept");
    ok &= check(block.justification == ebustl::Justification::Unknown &&
                    block.justification_raw == 7,
                "JC raw kept");
    ok &= check(diags.size() == 2, "two diagnostics");
    if (diags.size() == 2) {
        ok &= check(diags[0].code == DiagnosticCode::UnknownCumulativeStatus &&
                        diags[0].record_index == size_t{2},
                    "CS diagnostic names the block");
        ok &= check(diags[1].code == DiagnosticCode::UnknownJustification, "JC diagnostic");
    }
    TtiFields reserved;
    reserved.ebn = 0xF5;
    rec = make_tti(reserved);
    st = ebustl::read_tti_block(rec.data(), 0, 1024, 25, block, diags);
    ok &= check(st.ok && block.is_reserved(), "EBN 0xF5 is reserved");
    return ok;
}

bool test_block_sequence() {
    std::vector<uint8_t> data;
    for (uint16_t sn = 1; sn <= 3; ++sn) {
        TtiFields f;
        f.sn = sn;
        auto rec = make_tti(f);
        data.insert(data.end(), rec.begin(), rec.end());
    }
    std::vector<TtiBlock> blocks;
    std::vector<ebustl::Diagnostic> diags;
    auto st = ebustl::read_tti_blocks(data.data(), data.size(), 1024, 25, blocks, diags);
    bool ok = check(st.ok && blocks.size() == 3, "three records read");
    if (blocks.size() == 3) {
        ok &= check(blocks[2].subtitle_number == 3 && blocks[2].record_index == 2 &&
                        blocks[2].byte_offset == 1024 + 256,
                    "third record position");
    }

    data.resize(data.size() + 5, 0x8F);
    blocks.clear();
    st = ebustl::read_tti_blocks(data.data(), data.size(), 1024, 25, blocks, diags);
    ok &= check(!st.ok && st.error == ParseError::TruncatedInput, "short trailing record fails");
    ok &= check(st.record_index == size_t{3} && st.byte_offset == size_t{1024 + 384},
                "truncation points at the partial record");

    blocks.clear();
    st = ebustl::read_tti_blocks(data.data(), 0, 1024, 25, blocks, diags);
    ok &= check(st.ok && blocks.empty(), "no records is fine");
    return ok;
}

}  // namespace

int main() {
    bool ok = true;
    ok &= test_fields();
    ok &= test_invalid_timecode();
    ok &= test_unknown_codes();
    ok &= test_block_sequence();
    return ok ? 0 : 1;
}
