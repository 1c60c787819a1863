//
//  parse_status.cpp
//  EbuStl
//
//  Created by the EbuStl authors on 10/16/26.
//  Copyright © 2026 EbuStl contributors. All rights reserved.
//

#include "parse_status.hpp"

namespace ebustl {

const char *to_string(ParseError error) {
    switch (error) {
        case ParseError::None:
            return "None";
        case ParseError::IoError:
            return "IoError";
        case ParseError::TruncatedInput:
            return "TruncatedInput";
        case ParseError::InvalidTimecode:
            return "InvalidTimecode";
        case ParseError::InvalidTimeRange:
            return "InvalidTimeRange";
        case ParseError::BrokenExtensionSequence:
            return "BrokenExtensionSequence";
        case ParseError::UnrecognizedCodePage:
            return "UnrecognizedCodePage";
        case ParseError::UnrecognizedFrameRate:
            return "UnrecognizedFrameRate";
    }
    return "Unknown";
}

const char *to_string(DiagnosticCode code) {
    switch (code) {
        case DiagnosticCode::UnknownCodePage:
            return "UnknownCodePage";
        case DiagnosticCode::UnknownFrameRate:
            return "UnknownFrameRate";
        case DiagnosticCode::UnknownDisplayStandard:
            return "UnknownDisplayStandard";
        case DiagnosticCode::UnknownCharacterTable:
            return "UnknownCharacterTable";
        case DiagnosticCode::UnknownTimeCodeStatus:
            return "UnknownTimeCodeStatus";
        case DiagnosticCode::MalformedNumericField:
            return "MalformedNumericField";
        case DiagnosticCode::UnknownCumulativeStatus:
            return "UnknownCumulativeStatus";
        case DiagnosticCode::UnknownJustification:
            return "UnknownJustification";
        case DiagnosticCode::ReservedExtensionBlock:
            return "ReservedExtensionBlock";
        case DiagnosticCode::BlockCountMismatch:
            return "BlockCountMismatch";
    }
    return "Unknown";
}

}  // namespace ebustl
