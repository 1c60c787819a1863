//
//  logging.hpp
//  EbuStl
//
//  Created by the EbuStl authors on 10/16/26.
//  Copyright © 2026 EbuStl contributors. All rights reserved.
//

#pragma once

#include <algorithm>
#include <atomic>
#include <cstdint>
#include <iomanip>
#include <optional>
#include <sstream>
#include <string>
#include <string_view>
#include <vector>

namespace ebustl {

enum class LogVerbosity { Error = 0, Warn = 1, Info = 2, Debug = 3 };

// Set/get global logging verbosity.
void set_log_verbosity(LogVerbosity level);
LogVerbosity get_log_verbosity();

// Record index of the TTI block currently being read or assembled on this thread. Log lines
// written while it is set carry a "[tti #N]" prefix.
std::optional<size_t> current_log_block();

// Sets the block context for the lifetime of the scope, restoring the previous one on exit.
class LogBlockScope {
  public:
    explicit LogBlockScope(size_t record_index);
    ~LogBlockScope();
    LogBlockScope(const LogBlockScope &) = delete;
    LogBlockScope &operator=(const LogBlockScope &) = delete;

  private:
    std::optional<size_t> previous_;
};

// Hex-preview helper used in debug logs to dump a short prefix of a record or text field.
inline constexpr size_t kHexPreviewBytes = 16;
inline std::string hex_prefix(const uint8_t *data, size_t size,
                              size_t max_len = kHexPreviewBytes) {
    std::ostringstream oss;
    oss << std::hex << std::setfill('0');
    const size_t limit = std::min(max_len, size);
    for (size_t i = 0; i < limit; ++i) {
        oss << std::setw(2) << static_cast<unsigned int>(data[i]);
        if (i + 1 != limit) {
            oss << ' ';
        }
    }
    return oss.str();
}

inline std::string hex_prefix(const std::vector<uint8_t> &data,
                              size_t max_len = kHexPreviewBytes) {
    return hex_prefix(data.data(), data.size(), max_len);
}

}  // namespace ebustl

inline constexpr ebustl::LogVerbosity es_severity_for_tag(std::string_view tag) {
    if (tag == "error") {
        return ebustl::LogVerbosity::Error;
    }
    if (tag == "warn" || tag == "warning") {
        return ebustl::LogVerbosity::Warn;
    }
    if (tag == "info") {
        return ebustl::LogVerbosity::Info;
    }
    // Everything else (gsi/tti/text/etc.) treated as debug-level.
    return ebustl::LogVerbosity::Debug;
}

inline bool es_should_log(const char *level) {
    const auto current = ebustl::get_log_verbosity();
    const auto sev = es_severity_for_tag(level ? level : "");
    return static_cast<int>(sev) <= static_cast<int>(current);
}

// Builds the full log line; errors also name their source location.
std::string es_format_log_line(const char *level, const std::string &msg, const char *file,
                               int line, const char *func);

void es_log_impl(const char *level, const std::string &msg, const char *file, int line,
                 const char *func);

#define ES_LOG(level, message)                                              \
    do {                                                                    \
        if (es_should_log(level)) {                                         \
            std::ostringstream _es_log_ss;                                  \
            _es_log_ss << message;                                          \
            es_log_impl(level, _es_log_ss.str(), __FILE__, __LINE__,        \
                        __func__);                                          \
        }                                                                   \
    } while (0)
