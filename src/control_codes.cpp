//
//  control_codes.cpp
//  EbuStl
//
//  Created by the EbuStl authors on 10/16/26.
//  Copyright © 2026 EbuStl contributors. All rights reserved.
//

#include "control_codes.hpp"

#include "logging.hpp"

namespace ebustl {

namespace {

struct StyleState {
    bool italics = false;
    bool underline = false;
    bool boxing = false;
};

// Classify a control byte (caller has checked is_control_byte and excluded the fill byte).
FragmentKind control_kind(uint8_t b) {
    if (b <= 0x07) {
        return FragmentKind::Foreground;
    }
    switch (b) {
        // Teletext spacing attributes.
        case 0x08:
            return FragmentKind::Flash;
        case 0x09:
            return FragmentKind::Steady;
        case kTeletextEndBox:
            return FragmentKind::BoxingOff;
        case kTeletextStartBox:
            return FragmentKind::BoxingOn;
        case 0x0C:
            return FragmentKind::NormalHeight;
        case 0x0D:
            return FragmentKind::DoubleHeight;
        case 0x0E:
            return FragmentKind::DoubleWidth;
        case 0x0F:
            return FragmentKind::DoubleSize;
        case 0x18:
            return FragmentKind::Conceal;
        case 0x1C:
            return FragmentKind::BlackBackground;
        case 0x1D:
            return FragmentKind::NewBackground;

        // Open subtitling codes.
        case kItalicsOn:
            return FragmentKind::ItalicsOn;
        case kItalicsOff:
            return FragmentKind::ItalicsOff;
        case kUnderlineOn:
            return FragmentKind::UnderlineOn;
        case kUnderlineOff:
            return FragmentKind::UnderlineOff;
        case kBoxingOn:
            return FragmentKind::BoxingOn;
        case kBoxingOff:
            return FragmentKind::BoxingOff;
        case kRowBreak:
            return FragmentKind::RowBreak;
        default:
            // Mosaic attributes, 0x86..0x89, 0x8B..0x8E, 0x90..0x9F.
            return FragmentKind::Unsupported;
    }
}

// Apply a toggle to the tracked state; false when it would not change anything. The marker is
// emitted either way: a style may have been opened in an earlier extension block.
bool apply_toggle(StyleState &state, FragmentKind kind) {
    bool *flag = nullptr;
    bool target = false;
    switch (kind) {
        case FragmentKind::ItalicsOn:
        case FragmentKind::ItalicsOff:
            flag = &state.italics;
            target = kind == FragmentKind::ItalicsOn;
            break;
        case FragmentKind::UnderlineOn:
        case FragmentKind::UnderlineOff:
            flag = &state.underline;
            target = kind == FragmentKind::UnderlineOn;
            break;
        case FragmentKind::BoxingOn:
        case FragmentKind::BoxingOff:
            flag = &state.boxing;
            target = kind == FragmentKind::BoxingOn;
            break;
        default:
            return true;
    }
    if (*flag == target) {
        return false;
    }
    *flag = target;
    return true;
}

}  // namespace

bool is_control_byte(uint8_t byte) { return byte < 0x20 || (byte >= 0x80 && byte <= 0x9F); }

FragmentList scan_text_field(const uint8_t *data, size_t size, CharacterTable table) {
    FragmentList out;
    StyleState state;
    size_t run_start = 0;
    size_t run_len = 0;

    auto flush_text = [&]() {
        if (run_len == 0) {
            return;
        }
        out.push_back(TextFragment::make_text(decode_text(table, data + run_start, run_len)));
        run_len = 0;
    };

    for (size_t i = 0; i < size; ++i) {
        const uint8_t b = data[i];
        if (!is_control_byte(b)) {
            if (run_len == 0) {
                run_start = i;
            }
            ++run_len;
            continue;
        }
        flush_text();
        if (b == kFillByte) {
            // Everything after the first unused-space byte is padding.
            break;
        }
        const FragmentKind kind = control_kind(b);
        if (!apply_toggle(state, kind)) {
            ES_LOG("text", to_string(kind) << " does not change the style in this block at " << i);
        } else if (kind == FragmentKind::Unsupported) {
            ES_LOG("text", "unsupported control code 0x" << std::hex << static_cast<int>(b)
                                                         << std::dec << " at " << i);
        }
        out.push_back(TextFragment::make_marker(kind, b));
    }
    flush_text();
    return out;
}

FragmentList scan_text_field(const std::vector<uint8_t> &field, CharacterTable table) {
    return scan_text_field(field.data(), field.size(), table);
}

std::string plain_text(const FragmentList &fragments) {
    std::string out;
    for (const auto &f : fragments) {
        if (f.kind == FragmentKind::Text) {
            out += f.text;
        } else if (f.kind == FragmentKind::RowBreak) {
            out.push_back('\n');
        }
    }
    return out;
}

const char *to_string(FragmentKind kind) {
    switch (kind) {
        case FragmentKind::Text:
            return "Text";
        case FragmentKind::RowBreak:
            return "RowBreak";
        case FragmentKind::ItalicsOn:
            return "ItalicsOn";
        case FragmentKind::ItalicsOff:
            return "ItalicsOff";
        case FragmentKind::UnderlineOn:
            return "UnderlineOn";
        case FragmentKind::UnderlineOff:
            return "UnderlineOff";
        case FragmentKind::BoxingOn:
            return "BoxingOn";
        case FragmentKind::BoxingOff:
            return "BoxingOff";
        case FragmentKind::NormalHeight:
            return "NormalHeight";
        case FragmentKind::DoubleHeight:
            return "DoubleHeight";
        case FragmentKind::DoubleWidth:
            return "DoubleWidth";
        case FragmentKind::DoubleSize:
            return "DoubleSize";
        case FragmentKind::Foreground:
            return "Foreground";
        case FragmentKind::Flash:
            return "Flash";
        case FragmentKind::Steady:
            return "Steady";
        case FragmentKind::Conceal:
            return "Conceal";
        case FragmentKind::BlackBackground:
            return "BlackBackground";
        case FragmentKind::NewBackground:
            return "NewBackground";
        case FragmentKind::Unsupported:
            return "Unsupported";
    }
    return "Unknown";
}

const char *to_string(TeletextColour colour) {
    switch (colour) {
        case TeletextColour::Black:
            return "black";
        case TeletextColour::Red:
            return "red";
        case TeletextColour::Green:
            return "green";
        case TeletextColour::Yellow:
            return "yellow";
        case TeletextColour::Blue:
            return "blue";
        case TeletextColour::Magenta:
            return "magenta";
        case TeletextColour::Cyan:
            return "cyan";
        case TeletextColour::White:
            return "white";
    }
    return "unknown";
}

}  // namespace ebustl
