//
//  document.cpp
//  EbuStl
//
//  Created by the EbuStl authors on 10/16/26.
//  Copyright © 2026 EbuStl contributors. All rights reserved.
//

#include "document.hpp"

#include <string>
#include <utility>

#include "logging.hpp"

namespace ebustl {

Document make_document(GeneralBlock general, std::vector<Subtitle> subtitles,
                       std::vector<std::vector<uint8_t>> user_data,
                       std::vector<Diagnostic> diagnostics, size_t tti_block_count) {
    if (general.total_tti_blocks != tti_block_count) {
        ES_LOG("warn", "header declares " << general.total_tti_blocks << " TTI blocks, file has "
                                          << tti_block_count);
        Diagnostic d;
        d.code = DiagnosticCode::BlockCountMismatch;
        d.message = "TNB does not match the number of TTI blocks (" +
                    std::to_string(tti_block_count) + ")";
        d.raw_value = std::to_string(general.total_tti_blocks);
        diagnostics.push_back(std::move(d));
    }
    Document doc;
    doc.general = std::move(general);
    doc.subtitles = std::move(subtitles);
    doc.user_data = std::move(user_data);
    doc.diagnostics = std::move(diagnostics);
    return doc;
}

}  // namespace ebustl
