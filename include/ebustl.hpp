//
//  ebustl.hpp
//  EbuStl
//
//  Created by the EbuStl authors on 10/16/26.
//  Copyright © 2026 EbuStl contributors. All rights reserved.
//

#pragma once
#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

#include "document.hpp"
#include "parse_options.hpp"
#include "parse_status.hpp"

namespace ebustl {

/// @defgroup api EbuStl Public API
/// Public, supported C++ interfaces for decoding EBU Tech 3264 subtitle files.
/// @{

/**
 * @brief Parse outcome: status plus the decoded document.
 *
 * When `status.ok == false` the document is left default-constructed.
 */
struct ParseResult {
    ParseStatus status;
    Document document;
};

/**
 * @brief Return the EbuStl library version string.
 *
 * Follows the same formatting as the CLI banner (e.g. `v0.3` or `v0.3+abcd123`).
 */
std::string version_string();  ///< @ingroup api

/**
 * @brief Decode an in-memory EBU STL file.
 *
 * @param data First byte of the file; borrowed for the duration of the call only.
 * @param size Number of bytes available.
 * @param options Decoding knobs; defaults follow EBU Tech 3264.
 */
ParseResult parse(const uint8_t *data, size_t size,
                  const ParseOptions &options = {});  ///< @ingroup api

/// @overload
ParseResult parse(const std::vector<uint8_t> &bytes,
                  const ParseOptions &options = {});  ///< @ingroup api

/// Read a whole file and hand it to `parse`. An unreadable file yields ParseError::IoError.
ParseResult parse_from_path(const std::string &path,
                            const ParseOptions &options = {});  ///< @ingroup api

/// @}

}  // namespace ebustl
