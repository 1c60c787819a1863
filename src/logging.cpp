//
//  logging.cpp
//  EbuStl
//
//  Created by the EbuStl authors on 10/16/26.
//  Copyright © 2026 EbuStl contributors. All rights reserved.
//

#include "logging.hpp"

#include <iostream>

namespace ebustl {

static std::atomic<int> g_log_level{static_cast<int>(LogVerbosity::Info)};
static thread_local std::optional<size_t> t_log_block;

void set_log_verbosity(LogVerbosity level) {
    g_log_level.store(static_cast<int>(level), std::memory_order_relaxed);
}

LogVerbosity get_log_verbosity() {
    return static_cast<LogVerbosity>(g_log_level.load(std::memory_order_relaxed));
}

std::optional<size_t> current_log_block() { return t_log_block; }

LogBlockScope::LogBlockScope(size_t record_index) : previous_(t_log_block) {
    t_log_block = record_index;
}

LogBlockScope::~LogBlockScope() { t_log_block = previous_; }

}  // namespace ebustl

std::string es_format_log_line(const char *level, const std::string &msg, const char *file,
                               int line, const char *func) {
    const std::string lvl(level ? level : "");
    std::ostringstream oss;
    oss << "[EbuStl][" << lvl << "]";
    if (auto block = ebustl::current_log_block()) {
        oss << "[tti #" << *block << "]";
    }
    if (lvl == "error") {
        oss << "[" << file << ":" << line << " " << func << "]";
    }
    oss << " " << msg;
    return oss.str();
}

void es_log_impl(const char *level, const std::string &msg, const char *file, int line,
                 const char *func) {
    std::cerr << es_format_log_line(level, msg, file, line, func) << std::endl;
}
