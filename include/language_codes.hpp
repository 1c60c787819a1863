//
//  language_codes.hpp
//  EbuStl
//
//  Created by the EbuStl authors on 10/16/26.
//  Copyright © 2026 EbuStl contributors. All rights reserved.
//

#pragma once

#include <cstdint>
#include <optional>
#include <string>

namespace ebustl {

// GSI language code (LC): two hexadecimal ASCII digits, e.g. "09" for English.
std::optional<uint8_t> parse_language_code(const std::string &field);

// English name for an EBU language code, or an empty string when the code is unassigned.
// Code 0x00 is "unknown or not applicable" and also returns an empty string.
std::string language_name(uint8_t code);

}  // namespace ebustl
