//
//  parse_status.hpp
//  EbuStl
//
//  Created by the EbuStl authors on 10/16/26.
//  Copyright © 2026 EbuStl contributors. All rights reserved.
//

#pragma once

#include <cstddef>
#include <optional>
#include <string>
#include <utility>

namespace ebustl {

/// @ingroup api
/// Fatal error classes. Any of these aborts the whole parse.
enum class ParseError {
    None = 0,
    IoError,                  ///< parse_from_path could not read the file
    TruncatedInput,           ///< fewer bytes than a fixed-size record requires
    InvalidTimecode,          ///< a timecode component is out of range
    InvalidTimeRange,         ///< time-code-out precedes time-code-in
    BrokenExtensionSequence,  ///< extension block numbers are not contiguous
    UnrecognizedCodePage,     ///< CPN field is not a three digit number
    UnrecognizedFrameRate,    ///< DFC field does not carry a frame rate
};

/// @ingroup api
/// Non-fatal findings; the offending value is preserved in the document.
enum class DiagnosticCode {
    UnknownCodePage,
    UnknownFrameRate,
    UnknownDisplayStandard,
    UnknownCharacterTable,
    UnknownTimeCodeStatus,
    MalformedNumericField,
    UnknownCumulativeStatus,
    UnknownJustification,
    ReservedExtensionBlock,
    BlockCountMismatch,
};

/**
 * @brief Result object with success flag, error class and context.
 *
 * When `ok == true`, `error` is `ParseError::None` and `message` is empty. On failure the
 * record index (TTI ordinal, zero based) and absolute byte offset locate the fault when known;
 * `raw_value` carries the offending field text for diagnostics.
 */
struct ParseStatus {
    bool ok{true};
    ParseError error{ParseError::None};
    std::string message;
    std::optional<size_t> record_index;
    std::optional<size_t> byte_offset;
    std::string raw_value;

    bool operator==(const ParseStatus &) const = default;
};

struct Diagnostic {
    DiagnosticCode code{DiagnosticCode::UnknownCodePage};
    std::string message;
    std::optional<size_t> record_index;
    std::string raw_value;

    bool operator==(const Diagnostic &) const = default;
};

inline ParseStatus make_ok() { return ParseStatus{}; }

inline ParseStatus make_error(ParseError error, std::string message,
                              std::optional<size_t> record_index = std::nullopt,
                              std::optional<size_t> byte_offset = std::nullopt,
                              std::string raw_value = {}) {
    ParseStatus st;
    st.ok = false;
    st.error = error;
    st.message = std::move(message);
    st.record_index = record_index;
    st.byte_offset = byte_offset;
    st.raw_value = std::move(raw_value);
    return st;
}

// Stable names used by logs and the JSON dump.
const char *to_string(ParseError error);
const char *to_string(DiagnosticCode code);

}  // namespace ebustl
