//
//  parse_options.hpp
//  EbuStl
//
//  Created by the EbuStl authors on 10/16/26.
//  Copyright © 2026 EbuStl contributors. All rights reserved.
//

#pragma once

#include <cstdint>
#include <optional>

namespace ebustl {

/// @ingroup api
/// Table used for the GSI's textual fields (titles, names, publisher, ...).
enum class HeaderTextDecoding {
    DefaultTable,     ///< always code page 850, whatever the CPN field says
    DeclaredCodePage  ///< the CPN field's code page when it is one we know
};

/**
 * @brief Knobs for `parse`. Defaults follow EBU Tech 3264 strictly.
 */
struct ParseOptions {
    HeaderTextDecoding header_text = HeaderTextDecoding::DefaultTable;
    /// Used instead of failing when the disk format code carries no frame rate.
    std::optional<uint32_t> fallback_frame_rate;
    /// When false, subtitles whose comment flag is set are left out of the document.
    bool include_comments = true;
};

}  // namespace ebustl
