//
//  gsi_block.cpp
//  EbuStl
//
//  Created by the EbuStl authors on 10/16/26.
//  Copyright © 2026 EbuStl contributors. All rights reserved.
//

#include "gsi_block.hpp"

#include <utility>

#include "byte_reader.hpp"
#include "logging.hpp"

namespace {

// Field layout: {offset, length}.
struct Field {
    size_t offset;
    size_t length;
    const char *name;
};

constexpr Field kCpn{0, 3, "CPN"};
constexpr Field kDfc{3, 8, "DFC"};
constexpr Field kDsc{11, 1, "DSC"};
constexpr Field kCct{12, 2, "CCT"};
constexpr Field kLc{14, 2, "LC"};
constexpr Field kOpt{16, 32, "OPT"};
constexpr Field kOet{48, 32, "OET"};
constexpr Field kTpt{80, 32, "TPT"};
constexpr Field kTet{112, 32, "TET"};
constexpr Field kTn{144, 32, "TN"};
constexpr Field kTcd{176, 32, "TCD"};
constexpr Field kSlr{208, 16, "SLR"};
constexpr Field kCd{224, 6, "CD"};
constexpr Field kRd{230, 6, "RD"};
constexpr Field kRn{236, 2, "RN"};
constexpr Field kTnb{238, 5, "TNB"};
constexpr Field kTns{243, 5, "TNS"};
constexpr Field kTng{248, 3, "TNG"};
constexpr Field kMnc{251, 2, "MNC"};
constexpr Field kMnr{253, 2, "MNR"};
constexpr Field kTcs{255, 1, "TCS"};
constexpr Field kTcp{256, 8, "TCP"};
constexpr Field kTcf{264, 8, "TCF"};
constexpr Field kTnd{272, 1, "TND"};
constexpr Field kDsn{273, 1, "DSN"};
constexpr Field kCo{274, 3, "CO"};
constexpr Field kPub{277, 32, "PUB"};
constexpr Field kEn{309, 32, "EN"};
constexpr Field kEcd{341, 32, "ECD"};
constexpr Field kSpare{373, 75, "spare"};
constexpr Field kUda{448, 576, "UDA"};

constexpr uint32_t kTwoDigitYearPivot = 80;  // YY < 80 -> 20YY

}  // namespace

namespace ebustl {

namespace {

std::string raw_field(const uint8_t *data, const Field &f) {
    return field_ascii(data, f.offset, f.length);
}

void add_diagnostic(std::vector<Diagnostic> &diagnostics, DiagnosticCode code,
                    const std::string &message, const std::string &raw) {
    ES_LOG("warn", "gsi: " << message << " (raw='" << raw << "')");
    Diagnostic d;
    d.code = code;
    d.message = message;
    d.raw_value = raw;
    diagnostics.push_back(std::move(d));
}

uint32_t read_number(const uint8_t *data, const Field &f, uint32_t blank_default,
                     std::vector<Diagnostic> &diagnostics) {
    const std::string raw = raw_field(data, f);
    auto value = parse_ascii_number(raw, blank_default);
    if (!value) {
        add_diagnostic(diagnostics, DiagnosticCode::MalformedNumericField,
                       std::string(f.name) + " is not numeric", raw);
        return 0;
    }
    return *value;
}

StlDate parse_date(const std::string &raw, const char *name) {
    StlDate date;
    date.raw = raw;
    if (date.raw.size() != 6 || is_blank(date.raw)) {
        return date;
    }
    auto yy = parse_ascii_number(date.raw.substr(0, 2));
    auto mm = parse_ascii_number(date.raw.substr(2, 2));
    auto dd = parse_ascii_number(date.raw.substr(4, 2));
    if (!yy || !mm || !dd || *mm < 1 || *mm > 12 || *dd < 1 || *dd > 31) {
        ES_LOG("gsi", name << " is not a date: '" << date.raw << "'");
        return date;
    }
    date.valid = true;
    date.year = static_cast<uint16_t>(*yy < kTwoDigitYearPivot ? 2000 + *yy : 1900 + *yy);
    date.month = static_cast<uint8_t>(*mm);
    date.day = static_cast<uint8_t>(*dd);
    return date;
}

StlDate read_date(const uint8_t *data, const Field &f) {
    return parse_date(raw_field(data, f), f.name);
}

}  // namespace

std::optional<uint32_t> frame_rate_from_disk_format(const std::string &dfc) {
    if (dfc.size() != 8 || dfc.compare(0, 3, "STL") != 0 || dfc[5] != '.') {
        return std::nullopt;
    }
    auto rate = parse_ascii_number(dfc.substr(3, 2));
    if (!rate || *rate == 0 || dfc[3] == ' ' || dfc[4] == ' ') {
        return std::nullopt;
    }
    return rate;
}

ParseStatus read_gsi_block(const uint8_t *data, size_t size, const ParseOptions &options,
                           GeneralBlock &out, std::vector<Diagnostic> &diagnostics) {
    if (size < kGsiBlockSize) {
        std::string msg = "GSI block needs " + std::to_string(kGsiBlockSize) +
                          " bytes, input has " + std::to_string(size);
        ES_LOG("error", msg);
        return make_error(ParseError::TruncatedInput, msg, std::nullopt, 0);
    }
    GeneralBlock gsi;

    // Code page number.
    gsi.code_page_raw = raw_field(data, kCpn);
    if (is_blank(gsi.code_page_raw)) {
        add_diagnostic(diagnostics, DiagnosticCode::UnknownCodePage,
                       "code page number is blank, assuming 850", gsi.code_page_raw);
        gsi.code_page_number = 850;
        gsi.code_page = kDefaultCodePage;
    } else {
        auto cpn = parse_ascii_number(gsi.code_page_raw);
        if (!cpn) {
            std::string msg = "code page number '" + gsi.code_page_raw + "' is not numeric";
            ES_LOG("error", msg);
            return make_error(ParseError::UnrecognizedCodePage, msg, std::nullopt, kCpn.offset,
                              gsi.code_page_raw);
        }
        gsi.code_page_number = *cpn;
        gsi.code_page = code_page_from_number(*cpn);
        if (!gsi.code_page) {
            add_diagnostic(diagnostics, DiagnosticCode::UnknownCodePage,
                           "code page " + std::to_string(*cpn) + " is not supported",
                           gsi.code_page_raw);
        }
    }
    CodePage text_page = kDefaultCodePage;
    if (options.header_text == HeaderTextDecoding::DeclaredCodePage && gsi.code_page) {
        text_page = *gsi.code_page;
    }
    auto text_field = [&](const Field &f) {
        return decode_code_page(text_page, data + f.offset, f.length);
    };

    // Disk format code carries the frame rate.
    gsi.disk_format_code = raw_field(data, kDfc);
    auto rate = frame_rate_from_disk_format(gsi.disk_format_code);
    if (!rate) {
        if (!options.fallback_frame_rate || *options.fallback_frame_rate == 0) {
            std::string msg = "disk format code '" + gsi.disk_format_code +
                              "' does not carry a frame rate";
            ES_LOG("error", msg);
            return make_error(ParseError::UnrecognizedFrameRate, msg, std::nullopt,
                              kDfc.offset, gsi.disk_format_code);
        }
        add_diagnostic(diagnostics, DiagnosticCode::UnknownFrameRate,
                       "disk format code carries no frame rate, using " +
                           std::to_string(*options.fallback_frame_rate),
                       gsi.disk_format_code);
        gsi.frame_rate = *options.fallback_frame_rate;
    } else {
        gsi.frame_rate = *rate;
        if (*rate != 25 && *rate != 30) {
            add_diagnostic(diagnostics, DiagnosticCode::UnknownFrameRate,
                           "non-standard frame rate " + std::to_string(*rate),
                           gsi.disk_format_code);
        }
    }

    gsi.display_standard_raw = data[kDsc.offset];
    switch (gsi.display_standard_raw) {
        case ' ':
            gsi.display_standard = DisplayStandard::Undefined;
            break;
        case '0':
            gsi.display_standard = DisplayStandard::OpenSubtitling;
            break;
        case '1':
            gsi.display_standard = DisplayStandard::TeletextLevel1;
            break;
        case '2':
            gsi.display_standard = DisplayStandard::TeletextLevel2;
            break;
        default:
            gsi.display_standard = DisplayStandard::Unknown;
            add_diagnostic(diagnostics, DiagnosticCode::UnknownDisplayStandard,
                           "unknown display standard code", raw_field(data, kDsc));
            break;
    }

    gsi.character_table_raw = raw_field(data, kCct);
    if (auto cct = parse_ascii_number(gsi.character_table_raw);
        cct && !is_blank(gsi.character_table_raw)) {
        gsi.character_table = character_table_from_number(*cct);
    }
    if (!gsi.character_table) {
        add_diagnostic(diagnostics, DiagnosticCode::UnknownCharacterTable,
                       "unknown character code table, decoding text as Latin",
                       gsi.character_table_raw);
    }

    gsi.language_code = text_field(kLc);
    gsi.original_programme_title = text_field(kOpt);
    gsi.original_episode_title = text_field(kOet);
    gsi.translated_programme_title = text_field(kTpt);
    gsi.translated_episode_title = text_field(kTet);
    gsi.translator_name = text_field(kTn);
    gsi.translator_contact = text_field(kTcd);
    gsi.subtitle_list_reference = text_field(kSlr);
    gsi.creation_date = read_date(data, kCd);
    gsi.revision_date = read_date(data, kRd);
    gsi.revision_number = read_number(data, kRn, 0, diagnostics);

    gsi.total_tti_blocks = read_number(data, kTnb, 0, diagnostics);
    gsi.total_subtitles = read_number(data, kTns, 0, diagnostics);
    gsi.total_subtitle_groups = read_number(data, kTng, 0, diagnostics);
    gsi.max_chars_per_row = read_number(data, kMnc, 0, diagnostics);
    gsi.max_rows = read_number(data, kMnr, 0, diagnostics);

    gsi.time_code_status_raw = data[kTcs.offset];
    if (gsi.time_code_status_raw == '0') {
        gsi.time_code_status = TimeCodeStatus::NotIntendedForUse;
    } else if (gsi.time_code_status_raw == '1') {
        gsi.time_code_status = TimeCodeStatus::IntendedForUse;
    } else {
        gsi.time_code_status = TimeCodeStatus::Unknown;
        add_diagnostic(diagnostics, DiagnosticCode::UnknownTimeCodeStatus,
                       "unknown time code status", raw_field(data, kTcs));
    }
    gsi.start_of_programme_raw = raw_field(data, kTcp);
    gsi.start_of_programme = parse_timecode_field(gsi.start_of_programme_raw);
    gsi.first_in_cue_raw = raw_field(data, kTcf);
    gsi.first_in_cue = parse_timecode_field(gsi.first_in_cue_raw);

    gsi.total_disks = read_number(data, kTnd, 1, diagnostics);
    gsi.disk_sequence_number = read_number(data, kDsn, 1, diagnostics);
    gsi.country_of_origin = text_field(kCo);
    gsi.publisher = text_field(kPub);
    gsi.editor_name = text_field(kEn);
    gsi.editor_contact = text_field(kEcd);
    gsi.spare = field_bytes(data, kSpare.offset, kSpare.length);
    gsi.user_defined_area = field_bytes(data, kUda.offset, kUda.length);

    ES_LOG("gsi", "cpn=" << gsi.code_page_number << " dfc=" << gsi.disk_format_code
                         << " fps=" << gsi.frame_rate << " cct=" << gsi.character_table_raw
                         << " tnb=" << gsi.total_tti_blocks << " tns=" << gsi.total_subtitles);
    out = std::move(gsi);
    return make_ok();
}

#ifdef EBUSTL_TESTING
namespace testing {
StlDate parse_date_for_test(const std::string &raw) { return parse_date(raw, "date"); }
}  // namespace testing
#endif

const char *to_string(DisplayStandard dsc) {
    switch (dsc) {
        case DisplayStandard::Undefined:
            return "undefined";
        case DisplayStandard::OpenSubtitling:
            return "open";
        case DisplayStandard::TeletextLevel1:
            return "teletext-level-1";
        case DisplayStandard::TeletextLevel2:
            return "teletext-level-2";
        case DisplayStandard::Unknown:
            return "unknown";
    }
    return "unknown";
}

const char *to_string(TimeCodeStatus tcs) {
    switch (tcs) {
        case TimeCodeStatus::NotIntendedForUse:
            return "not-intended";
        case TimeCodeStatus::IntendedForUse:
            return "intended";
        case TimeCodeStatus::Unknown:
            return "unknown";
    }
    return "unknown";
}

}  // namespace ebustl
