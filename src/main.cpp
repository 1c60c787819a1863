//
//  main.cpp
//  EbuStl
//
//  Created by the EbuStl authors on 10/16/26.
//  Copyright © 2026 EbuStl contributors. All rights reserved.
//

#include <cstdio>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <stdexcept>
#include <string>
#include <system_error>
#include <utility>
#include <vector>

#include "ebustl.hpp"
#include "ebustl_version.hpp"
#include "language_codes.hpp"
#include "logging.hpp"
#include <nlohmann/json.hpp>

ebustl::LogVerbosity parse_level(const std::string &s) {
    if (s == "debug") return ebustl::LogVerbosity::Debug;
    if (s == "info") return ebustl::LogVerbosity::Info;
    if (s == "warn" || s == "warning") return ebustl::LogVerbosity::Warn;
    return ebustl::LogVerbosity::Error;
}

bool write_bytes(const std::filesystem::path &p, const std::vector<uint8_t> &data) {
    if (data.empty()) return false;
    std::ofstream out(p, std::ios::binary);
    if (!out.is_open()) return false;
    out.write(reinterpret_cast<const char *>(data.data()),
              static_cast<std::streamsize>(data.size()));
    return out.good();
}

// Header text fields are space padded on disk.
std::string trimmed(const std::string &s) {
    size_t end = s.size();
    while (end > 0 && (s[end - 1] == ' ' || s[end - 1] == '\0')) {
        --end;
    }
    return s.substr(0, end);
}

nlohmann::json timecode_json(const ebustl::Timecode &tc) {
    return ebustl::format_timecode(tc);
}

nlohmann::json date_json(const ebustl::StlDate &d) {
    if (!d.valid) {
        return nullptr;
    }
    char buf[11];
    std::snprintf(buf, sizeof(buf), "%04u-%02u-%02u", static_cast<unsigned>(d.year),
                  static_cast<unsigned>(d.month), static_cast<unsigned>(d.day));
    return std::string(buf);
}

nlohmann::json general_json(const ebustl::GeneralBlock &g) {
    nlohmann::json j;
    j["code_page"] = g.code_page_number;
    j["disk_format_code"] = g.disk_format_code;
    j["frame_rate"] = g.frame_rate;
    j["display_standard"] = ebustl::to_string(g.display_standard);
    if (g.character_table) {
        j["character_table"] = static_cast<int>(*g.character_table);
    } else {
        j["character_table"] = nullptr;
    }
    j["language_code"] = g.language_code;
    if (auto lc = ebustl::parse_language_code(g.language_code)) {
        auto name = ebustl::language_name(*lc);
        if (!name.empty()) {
            j["language"] = name;
        }
    }
    j["original_programme_title"] = trimmed(g.original_programme_title);
    j["original_episode_title"] = trimmed(g.original_episode_title);
    j["translated_programme_title"] = trimmed(g.translated_programme_title);
    j["translated_episode_title"] = trimmed(g.translated_episode_title);
    j["translator_name"] = trimmed(g.translator_name);
    j["translator_contact"] = trimmed(g.translator_contact);
    j["subtitle_list_reference"] = trimmed(g.subtitle_list_reference);
    j["creation_date"] = date_json(g.creation_date);
    j["revision_date"] = date_json(g.revision_date);
    j["revision_number"] = g.revision_number;
    j["total_tti_blocks"] = g.total_tti_blocks;
    j["total_subtitles"] = g.total_subtitles;
    j["total_subtitle_groups"] = g.total_subtitle_groups;
    j["max_chars_per_row"] = g.max_chars_per_row;
    j["max_rows"] = g.max_rows;
    j["time_code_status"] = ebustl::to_string(g.time_code_status);
    j["start_of_programme"] =
        g.start_of_programme ? timecode_json(*g.start_of_programme) : nlohmann::json(nullptr);
    j["first_in_cue"] = g.first_in_cue ? timecode_json(*g.first_in_cue) : nlohmann::json(nullptr);
    j["total_disks"] = g.total_disks;
    j["disk_sequence_number"] = g.disk_sequence_number;
    j["country_of_origin"] = trimmed(g.country_of_origin);
    j["publisher"] = trimmed(g.publisher);
    j["editor_name"] = trimmed(g.editor_name);
    j["editor_contact"] = trimmed(g.editor_contact);
    return j;
}

nlohmann::json fragment_json(const ebustl::TextFragment &f) {
    nlohmann::json j;
    j["kind"] = ebustl::to_string(f.kind);
    if (f.kind == ebustl::FragmentKind::Text) {
        j["text"] = f.text;
    } else if (f.kind == ebustl::FragmentKind::Foreground) {
        j["colour"] = ebustl::to_string(f.colour());
    } else if (f.kind == ebustl::FragmentKind::Unsupported) {
        j["raw"] = f.raw;
    }
    return j;
}

bool emit_json(const ebustl::Document &doc, const std::filesystem::path &user_data_dir) {
    nlohmann::json j;
    j["general"] = general_json(doc.general);

    const uint32_t fps = doc.frame_rate();
    nlohmann::json subtitles = nlohmann::json::array();
    for (const auto &s : doc.subtitles) {
        nlohmann::json c;
        c["group"] = s.subtitle_group;
        c["number"] = s.subtitle_number;
        c["time_code_in"] = timecode_json(s.time_code_in);
        c["time_code_out"] = timecode_json(s.time_code_out);
        c["start_ms"] = ebustl::to_milliseconds(s.time_code_in, fps);
        c["end_ms"] = ebustl::to_milliseconds(s.time_code_out, fps);
        c["vertical_position"] = s.vertical_position;
        c["justification"] = ebustl::to_string(s.justification);
        c["cumulative_status"] = ebustl::to_string(s.cumulative_status);
        // Only flag comments; regular subtitles are the common case.
        if (s.comment) {
            c["comment"] = true;
        }
        c["blocks"] = s.block_count;
        c["text"] = s.text();
        nlohmann::json fragments = nlohmann::json::array();
        for (const auto &f : s.fragments) {
            fragments.push_back(fragment_json(f));
        }
        c["fragments"] = fragments;
        subtitles.push_back(c);
    }
    j["subtitles"] = subtitles;

    // User data blocks are opaque; export them when asked, otherwise report sizes only.
    nlohmann::json user_data = nlohmann::json::array();
    if (!user_data_dir.empty() && !doc.user_data.empty()) {
        std::error_code ec;
        std::filesystem::create_directories(user_data_dir, ec);
        if (ec) {
            ES_LOG("error", "stldump: cannot create " << user_data_dir.string() << ": "
                                                      << ec.message());
            return false;
        }
    }
    for (size_t i = 0; i < doc.user_data.size(); ++i) {
        nlohmann::json u;
        u["size"] = doc.user_data[i].size();
        if (!user_data_dir.empty()) {
            auto path = user_data_dir / ("user_data" + std::to_string(i + 1) + ".bin");
            if (!write_bytes(path, doc.user_data[i])) {
                ES_LOG("error", "stldump: failed to write " << path.string());
                return false;
            }
            u["path"] = path.string();
        }
        user_data.push_back(u);
    }
    j["user_data"] = user_data;

    nlohmann::json diagnostics = nlohmann::json::array();
    for (const auto &d : doc.diagnostics) {
        nlohmann::json e;
        e["code"] = ebustl::to_string(d.code);
        e["message"] = d.message;
        if (d.record_index) {
            e["record_index"] = *d.record_index;
        }
        e["raw"] = d.raw_value;
        diagnostics.push_back(e);
    }
    j["diagnostics"] = diagnostics;

    // Raw header fields are copied byte for byte and may not be valid UTF-8.
    std::cout << j.dump(2, ' ', false, nlohmann::json::error_handler_t::replace) << "\n";
    return true;
}

void emit_text(const ebustl::Document &doc) {
    for (const auto &s : doc.subtitles) {
        std::cout << ebustl::format_timecode(s.time_code_in) << " --> "
                  << ebustl::format_timecode(s.time_code_out) << "\n"
                  << s.text() << "\n\n";
    }
}

int main(int argc, char **argv) {
    if (argc == 2 && (std::string(argv[1]) == "--version" || std::string(argv[1]) == "-v")) {
        std::cout << "stldump " << EBUSTL_VERSION_DISPLAY << "\n";
        return 0;
    }

    // Gather positional arguments (non-option).
    std::vector<std::string> positional;
    std::filesystem::path user_data_dir;
    ebustl::ParseOptions options;
    bool text_only = false;
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "--text") {
            text_only = true;
        } else if (arg == "--header-codepage") {
            options.header_text = ebustl::HeaderTextDecoding::DeclaredCodePage;
        } else if (arg == "--no-comments") {
            options.include_comments = false;
        } else if (arg == "--fallback-fps" && i + 1 < argc) {
            const std::string value = argv[++i];
            unsigned long fps = 0;
            try {
                fps = std::stoul(value);
            } catch (const std::logic_error &) {
                fps = 0;
            }
            if (fps == 0 || fps > 1000) {
                std::cerr << "Invalid frame rate: " << value << "\n";
                return 2;
            }
            options.fallback_frame_rate = static_cast<uint32_t>(fps);
        } else if (arg == "--log-level" && i + 1 < argc) {
            ebustl::set_log_verbosity(parse_level(argv[i + 1]));
            ++i;
        } else if (arg == "--export-user-data" && i + 1 < argc) {
            user_data_dir = argv[++i];
        } else if (!arg.empty() && arg[0] == '-') {
            std::cerr << "Unknown option: " << arg << "\n";
            return 2;
        } else {
            positional.emplace_back(std::move(arg));
        }
    }

    if (positional.size() != 1) {
        std::cerr << "stldump " << EBUSTL_VERSION_DISPLAY << "\n"
                  << "Copyright (c) 2026 EbuStl contributors\n\n"
                  << "usage:\n"
                  << "  stldump <input.stl> [--text] [--header-codepage] [--no-comments]\n"
                  << "          [--fallback-fps N] [--export-user-data DIR] "
                  << "[--log-level warn|info|debug]\n"
                  << "Options:\n"
                  << "  --text                  Print subtitle timing and text instead of JSON.\n"
                  << "  --header-codepage       Decode header text with the declared code page\n"
                  << "                          instead of code page 850.\n"
                  << "  --no-comments           Leave out comment subtitles.\n"
                  << "  --fallback-fps N        Frame rate to use when the disk format code\n"
                  << "                          does not carry one.\n"
                  << "  --export-user-data DIR  Write user data blocks (EBN 0xFE) to DIR.\n"
                  << "  --log-level LEVEL       Set logging verbosity (default: info).\n";
        return 2;
    }

    const std::string input_path = positional[0];
    auto res = ebustl::parse_from_path(input_path, options);
    if (!res.status.ok) {
        std::cerr << "stldump: " << ebustl::to_string(res.status.error) << ": "
                  << res.status.message;
        if (res.status.byte_offset) {
            std::cerr << " (offset " << *res.status.byte_offset << ")";
        }
        std::cerr << "\n";
        return 1;
    }
    if (text_only) {
        emit_text(res.document);
        return 0;
    }
    if (!emit_json(res.document, user_data_dir)) {
        ES_LOG("error", "stldump: failed to emit JSON or export user data");
        return 1;
    }
    return 0;
}
