//
//  ebustl.cpp
//  EbuStl
//
//  Created by the EbuStl authors on 10/16/26.
//  Copyright © 2026 EbuStl contributors. All rights reserved.
//
#include "ebustl.hpp"
#include "ebustl_version.hpp"

#include <cerrno>
#include <chrono>
#include <fstream>
#include <system_error>
#include <utility>

#include "control_codes.hpp"
#include "gsi_block.hpp"
#include "logging.hpp"
#include "subtitle_assembler.hpp"
#include "tti_block.hpp"

namespace ebustl {

std::string version_string() { return EBUSTL_VERSION_DISPLAY; }

}  // namespace ebustl

namespace {

bool read_file(const std::string &path, std::vector<uint8_t> &out) {
    std::ifstream f(path, std::ios::binary);
    if (!f.is_open()) {
        ES_LOG("error", "open failed for " << path << " errno=" << errno << " ("
                                           << std::generic_category().message(errno) << ")");
        return false;
    }
    f.seekg(0, std::ios::end);
    const std::streamoff len = f.tellg();
    if (len < 0) {
        ES_LOG("error", "cannot determine size of " << path);
        return false;
    }
    f.seekg(0, std::ios::beg);
    out.resize(static_cast<size_t>(len));
    f.read(reinterpret_cast<char *>(out.data()), static_cast<std::streamsize>(len));
    if (f.gcount() != len) {
        ES_LOG("error", "short read for " << path << " (" << f.gcount() << " of " << len << ")");
        return false;
    }
    return true;
}

}  // namespace

namespace ebustl {

namespace {
ParseResult make_failure(ParseStatus status) { return ParseResult{std::move(status), {}}; }
}  // namespace

ParseResult parse(const uint8_t *data, size_t size, const ParseOptions &options) {
    const auto t0 = std::chrono::steady_clock::now();
    ES_LOG("debug", "parse size=" << size);
    std::vector<Diagnostic> diagnostics;

    GeneralBlock gsi;
    auto st = read_gsi_block(data, size, options, gsi, diagnostics);
    if (!st.ok) {
        return make_failure(std::move(st));
    }

    std::vector<TtiBlock> blocks;
    st = read_tti_blocks(data + kGsiBlockSize, size - kGsiBlockSize, kGsiBlockSize,
                         gsi.frame_rate, blocks, diagnostics);
    if (!st.ok) {
        return make_failure(std::move(st));
    }
    const size_t block_count = blocks.size();

    // Text decoding happens per block; user data blocks keep their raw field only.
    const CharacterTable table = gsi.text_table();
    std::vector<DecodedBlock> decoded;
    decoded.reserve(block_count);
    for (auto &b : blocks) {
        LogBlockScope scope(b.record_index);
        DecodedBlock db;
        if (!b.is_user_data() && !b.is_reserved()) {
            db.fragments = scan_text_field(b.text_field, table);
        }
        db.block = std::move(b);
        decoded.push_back(std::move(db));
    }

    std::vector<Subtitle> subtitles;
    std::vector<std::vector<uint8_t>> user_data;
    st = assemble_subtitles(decoded, gsi.frame_rate, subtitles, user_data, diagnostics);
    if (!st.ok) {
        return make_failure(std::move(st));
    }
    if (!options.include_comments) {
        std::erase_if(subtitles, [](const Subtitle &s) { return s.comment; });
    }

    ParseResult result;
    result.document = make_document(std::move(gsi), std::move(subtitles), std::move(user_data),
                                    std::move(diagnostics), block_count);
    const auto t1 = std::chrono::steady_clock::now();
    ES_LOG("debug", "parse done blocks=" << block_count
                                         << " subtitles=" << result.document.subtitles.size()
                                         << " diagnostics="
                                         << result.document.diagnostics.size() << " timings_ms="
                                         << std::chrono::duration_cast<std::chrono::milliseconds>(
                                                t1 - t0)
                                                .count());
    return result;
}

ParseResult parse(const std::vector<uint8_t> &bytes, const ParseOptions &options) {
    return parse(bytes.data(), bytes.size(), options);
}

ParseResult parse_from_path(const std::string &path, const ParseOptions &options) {
    ES_LOG("debug", "parse_from_path path=" << path);
    std::vector<uint8_t> bytes;
    if (!read_file(path, bytes)) {
        return make_failure(make_error(ParseError::IoError, "Failed to read " + path));
    }
    return parse(bytes, options);
}

}  // namespace ebustl
