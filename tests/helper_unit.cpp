// Unit coverage for small helpers: timecode math, fixed-width field readers, language names,
// status helpers and hex preview.
#include <cstdint>
#include <iostream>
#include <optional>
#include <string>
#include <vector>

#include "byte_reader.hpp"
#include "language_codes.hpp"
#include "logging.hpp"
#include "parse_status.hpp"
#include "timecode.hpp"

namespace {

bool check(bool cond, const std::string &msg) {
    if (!cond) {
        std::cerr << "[helper_unit] FAIL: " << msg << "\n";
    }
    return cond;
}

bool test_timecodes() {
    using ebustl::Timecode;
    const Timecode tc{1, 2, 3, 12};
    bool ok = check(ebustl::to_frames(tc, 25) == (3723ULL * 25 + 12), "to_frames at 25 fps");
    ok &= check(ebustl::to_milliseconds(tc, 25) == 3723480, "to_milliseconds at 25 fps");
    ok &= check(ebustl::to_milliseconds(tc, 30) == 3723400, "to_milliseconds at 30 fps");
    ok &= check(ebustl::to_milliseconds(tc, 0) == 0, "zero frame rate yields 0 ms");
    ok &= check(ebustl::is_valid_timecode(Timecode{23, 59, 59, 24}, 25), "last frame of day");
    ok &= check(!ebustl::is_valid_timecode(Timecode{24, 0, 0, 0}, 25), "hour 24 is invalid");
    ok &= check(!ebustl::is_valid_timecode(Timecode{0, 0, 60, 0}, 25), "second 60 is invalid");
    ok &= check(ebustl::format_timecode(tc) == "01:02:03:12", "format_timecode");

    ok &= check(ebustl::parse_timecode_field("10000000") == Timecode{10, 0, 0, 0},
                "parse HHMMSSFF");
    ok &= check(!ebustl::parse_timecode_field("        "), "blank timecode field");
    ok &= check(!ebustl::parse_timecode_field("10:00:00"), "malformed timecode field");
    ok &= check(!ebustl::parse_timecode_field("1000"), "short timecode field");
    return ok;
}

bool test_field_readers() {
    const uint8_t le[] = {0x34, 0x12};
    bool ok = check(ebustl::read_u16_le(le) == 0x1234, "read_u16_le little-endian decode");
    ok &= check(ebustl::parse_ascii_number("00042") == 42u, "zero padded number");
    ok &= check(ebustl::parse_ascii_number(" 7 ") == 7u, "space padded number");
    ok &= check(ebustl::parse_ascii_number("   ", 1) == 1u, "blank uses the default");
    ok &= check(!ebustl::parse_ascii_number("4 2"), "embedded space is malformed");
    ok &= check(!ebustl::parse_ascii_number("0x1"), "non-digit is malformed");
    ok &= check(ebustl::is_blank(std::string("  \0 ", 4)), "spaces and NULs are blank");
    return ok;
}

bool test_language_codes() {
    bool ok = check(ebustl::parse_language_code("09") == uint8_t{0x09}, "LC 09 parses");
    ok &= check(ebustl::parse_language_code("7f") == uint8_t{0x7F}, "lowercase hex parses");
    ok &= check(!ebustl::parse_language_code("G1"), "non-hex LC rejected");
    ok &= check(ebustl::language_name(0x09) == "English", "0x09 is English");
    ok &= check(ebustl::language_name(0x0F) == "French", "0x0F is French");
    ok &= check(ebustl::language_name(0x01) == "Albanian", "first European code");
    ok &= check(ebustl::language_name(0x2B) == "Wallon", "last European code");
    ok &= check(ebustl::language_name(0x7F) == "Amharic", "first other code");
    ok &= check(ebustl::language_name(0x56) == "Russian", "0x56 is Russian");
    ok &= check(ebustl::language_name(0x45) == "Zulu", "last other code");
    ok &= check(ebustl::language_name(0x00).empty(), "0x00 has no name");
    ok &= check(ebustl::language_name(0x30).empty(), "unassigned code has no name");
    return ok;
}

bool test_status_helpers() {
    auto ok_status = ebustl::make_ok();
    bool ok = check(ok_status.ok && ok_status.error == ebustl::ParseError::None &&
                        ok_status.message.empty(),
                    "make_ok");
    auto err = ebustl::make_error(ebustl::ParseError::InvalidTimecode, "bad", 3, 1408, "x");
    ok &= check(!err.ok && err.record_index == size_t{3} && err.byte_offset == size_t{1408} &&
                    err.raw_value == "x",
                "make_error carries context");
    ok &= check(std::string(ebustl::to_string(ebustl::ParseError::BrokenExtensionSequence)) ==
                    "BrokenExtensionSequence",
                "ParseError names");
    ok &= check(std::string(ebustl::to_string(ebustl::DiagnosticCode::BlockCountMismatch)) ==
                    "BlockCountMismatch",
                "DiagnosticCode names");
    return ok;
}

bool test_hex_prefix() {
    using ebustl::hex_prefix;
    bool ok = check(hex_prefix({}) == "", "hex_prefix empty");
    std::vector<uint8_t> data = {0x00, 0x11, 0xAB, 0xCD, 0x8F};
    ok &= check(hex_prefix(data, 4) == "00 11 ab cd", "hex_prefix truncates to max_len");
    ok &= check(hex_prefix(data) == "00 11 ab cd 8f", "hex_prefix default prints all up to limit");
    return ok;
}

bool test_log_verbosity() {
    const auto saved = ebustl::get_log_verbosity();
    ebustl::set_log_verbosity(ebustl::LogVerbosity::Warn);
    bool ok = check(es_should_log("error") && es_should_log("warn"), "warn shows errors");
    ok &= check(!es_should_log("info") && !es_should_log("tti"), "warn hides info and tags");
    ebustl::set_log_verbosity(ebustl::LogVerbosity::Debug);
    ok &= check(es_should_log("gsi"), "debug shows component tags");
    ebustl::set_log_verbosity(saved);
    return ok;
}

bool test_log_block_context() {
    bool ok = check(!ebustl::current_log_block(), "no block context by default");
    ok &= check(es_format_log_line("warn", "plain", "f.cpp", 1, "fn") == "[EbuStl][warn] plain",
                "line without context");
    {
        ebustl::LogBlockScope outer(4);
        ok &= check(es_format_log_line("tti", "sn=1", "f.cpp", 1, "fn") ==
                        "[EbuStl][tti][tti #4] sn=1",
                    "block context prefix");
        {
            ebustl::LogBlockScope inner(9);
            ok &= check(ebustl::current_log_block() == size_t{9}, "inner scope wins");
        }
        ok &= check(ebustl::current_log_block() == size_t{4}, "outer scope restored");
        ok &= check(es_format_log_line("error", "bad", "f.cpp", 12, "fn") ==
                        "[EbuStl][error][tti #4][f.cpp:12 fn] bad",
                    "errors add the source location");
    }
    ok &= check(!ebustl::current_log_block(), "context cleared after scope");
    return ok;
}

}  // namespace

int main() {
    bool ok = true;
    ok &= test_timecodes();
    ok &= test_field_readers();
    ok &= test_language_codes();
    ok &= test_status_helpers();
    ok &= test_hex_prefix();
    ok &= test_log_verbosity();
    ok &= test_log_block_context();
    return ok ? 0 : 1;
}
