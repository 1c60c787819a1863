// Unit coverage for the text field scanner: control byte classification, fill padding,
// unpaired toggles and teletext attributes.
#include <cstdint>
#include <iostream>
#include <string>
#include <vector>

#include "control_codes.hpp"

namespace {

using ebustl::CharacterTable;
using ebustl::FragmentKind;
using ebustl::FragmentList;
using ebustl::TextFragment;

bool check(bool cond, const std::string &msg) {
    if (!cond) {
        std::cerr << "[control_code_unit] FAIL: " << msg << "\n";
    }
    return cond;
}

std::vector<uint8_t> padded(std::vector<uint8_t> bytes, size_t size = 112) {
    bytes.resize(size, ebustl::kFillByte);
    return bytes;
}

FragmentList scan(const std::vector<uint8_t> &field) {
    return ebustl::scan_text_field(field, CharacterTable::Latin);
}

bool test_mixed_payload() {
    const std::vector<uint8_t> payload = {0x8A, 'H', 'i', 0x80, 't', 'h', 'e', 'r', 'e', 0x81};
    const FragmentList expected = {
        TextFragment::make_marker(FragmentKind::RowBreak, 0x8A),
        TextFragment::make_text("Hi"),
        TextFragment::make_marker(FragmentKind::ItalicsOn, 0x80),
        TextFragment::make_text("there"),
        TextFragment::make_marker(FragmentKind::ItalicsOff, 0x81),
    };
    bool ok = check(scan(payload) == expected, "unpadded payload fragments");
    ok &= check(scan(padded(payload)) == expected, "fill padding does not change fragments");
    ok &= check(ebustl::plain_text(expected) == "\nHithere", "plain text joins runs");
    return ok;
}

bool test_fill_stops_scan() {
    std::vector<uint8_t> field = {'A', 0x8F, 'B', 0x80, 'C'};
    auto frags = scan(field);
    bool ok = check(frags.size() == 1, "scan stops at first fill byte");
    ok &= check(!frags.empty() && frags[0].text == "A", "text before fill is kept");
    ok &= check(scan(padded({})).empty(), "all-fill field yields no fragments");
    return ok;
}

bool test_unpaired_toggles() {
    // Off without on, then on twice: every code is kept, text runs stay whole.
    auto frags = scan({0x81, 'a', 0x80, 0x80, 'b', 0x85});
    const std::vector<FragmentKind> kinds = {FragmentKind::ItalicsOff, FragmentKind::Text,
                                             FragmentKind::ItalicsOn,  FragmentKind::ItalicsOn,
                                             FragmentKind::Text,       FragmentKind::BoxingOff};
    bool ok = check(frags.size() == kinds.size(), "every toggle yields a marker");
    for (size_t i = 0; ok && i < kinds.size(); ++i) {
        ok &= check(frags[i].kind == kinds[i], "toggle order at " + std::to_string(i));
    }
    if (frags.size() == kinds.size()) {
        ok &= check(frags[0].raw == 0x81 && frags[5].raw == 0x85, "raw bytes are kept");
        ok &= check(frags[1].text == "a" && frags[4].text == "b", "text runs");
    }
    // A closing code with no opener in this block keeps the following run in one piece.
    auto closing = scan({'d', 'e', 'f', 0x81, 'g'});
    ok &= check(closing.size() == 3 && closing[1].kind == FragmentKind::ItalicsOff,
                "leading italics off is emitted");
    auto boxed = scan({0x0B, 0x0B, 'x', 0x85, 0x0A});
    ok &= check(boxed.size() == 5, "teletext box codes are all emitted");
    if (boxed.size() == 5) {
        ok &= check(boxed[0].kind == FragmentKind::BoxingOn && boxed[0].raw == 0x0B,
                    "start box keeps its raw byte");
        ok &= check(boxed[3].kind == FragmentKind::BoxingOff && boxed[3].raw == 0x85 &&
                        boxed[4].kind == FragmentKind::BoxingOff && boxed[4].raw == 0x0A,
                    "both end box codes are kept");
    }
    return ok;
}

bool test_teletext_attributes() {
    auto frags = scan({0x01, 0x0D, 0x08, 'R', 0x1D, 0x09, 0x0C, 0x18, 0x1C, 0x0E, 0x0F});
    const std::vector<FragmentKind> kinds = {
        FragmentKind::Foreground,   FragmentKind::DoubleHeight,  FragmentKind::Flash,
        FragmentKind::Text,         FragmentKind::NewBackground, FragmentKind::Steady,
        FragmentKind::NormalHeight, FragmentKind::Conceal,       FragmentKind::BlackBackground,
        FragmentKind::DoubleWidth,  FragmentKind::DoubleSize,
    };
    bool ok = check(frags.size() == kinds.size(), "teletext attribute count");
    for (size_t i = 0; i < frags.size() && i < kinds.size(); ++i) {
        ok &= check(frags[i].kind == kinds[i],
                    std::string("teletext attribute ") + std::to_string(i) + " is " +
                        ebustl::to_string(kinds[i]));
    }
    if (!frags.empty()) {
        ok &= check(frags[0].colour() == ebustl::TeletextColour::Red, "0x01 is red");
    }
    return ok;
}

bool test_unsupported_codes() {
    auto frags = scan({0x86, 'a', 0x1A, 0x95});
    bool ok = check(frags.size() == 4, "unsupported codes become markers");
    if (frags.size() == 4) {
        ok &= check(frags[0].kind == FragmentKind::Unsupported && frags[0].raw == 0x86,
                    "0x86 is unsupported");
        ok &= check(frags[2].kind == FragmentKind::Unsupported && frags[2].raw == 0x1A,
                    "mosaic 0x1A is unsupported");
        ok &= check(frags[3].kind == FragmentKind::Unsupported && frags[3].raw == 0x95,
                    "0x95 is unsupported");
    }
    ok &= check(ebustl::is_control_byte(0x00) && ebustl::is_control_byte(0x9F) &&
                    !ebustl::is_control_byte(0x20) && !ebustl::is_control_byte(0xA0),
                "control byte ranges");
    return ok;
}

bool test_text_runs_use_table() {
    auto frags = ebustl::scan_text_field(std::vector<uint8_t>{0xC2, 'e', 0x8A, 0xCF, 'z'},
                                         CharacterTable::Latin);
    bool ok = check(frags.size() == 3, "row break splits runs");
    if (frags.size() == 3) {
        ok &= check(frags[0].text == "é" && frags[2].text == "ž",
                    "runs are decoded with diacritic composition");
    }
    return ok;
}

}  // namespace

int main() {
    bool ok = true;
    ok &= test_mixed_payload();
    ok &= test_fill_stops_scan();
    ok &= test_unpaired_toggles();
    ok &= test_teletext_attributes();
    ok &= test_unsupported_codes();
    ok &= test_text_runs_use_table();
    return ok ? 0 : 1;
}
