/*
 * Copyright 2024 Redpanda Data, Inc.
 *
 * Use of this software is governed by the Business Source License
 * included in the file licenses/BSL.md
 *
 * As of the Change Date specified in that file, in accordance with
 * the Business Source License, use of this software will be governed
 * by the Apache License, Version 2.0
 */
#pragma once
#include <fmt/format.h>

#include <cstdint>
#include <ostream>
#include <source_location>

namespace plog {
namespace detail {
consteval const char* basename_of(
  const char* const path, const int32_t index = 0, const int32_t last = -1) {
    // NOLINTNEXTLINE
    const char c = path[index];
    if (c == '\0') {
        // NOLINTNEXTLINE
        return &path[last + 1];
    }
    if (c == '/') {
        return basename_of(path, index + 1, index);
    }
    return basename_of(path, index + 1, last);
}
} // namespace detail

// Source file name (directory stripped) and line of a log statement.
struct file_line {
    const char* filename;
    unsigned line;

    consteval static file_line
    current(const std::source_location src = std::source_location::current()) {
        return {
          .filename = detail::basename_of(src.file_name()),
          .line = src.line()};
    }

    friend std::ostream& operator<<(std::ostream& o, const file_line& fl) {
        return o << fl.filename << ":" << fl.line;
    }
};

} // namespace plog

template<>
struct fmt::formatter<plog::file_line> : fmt::formatter<std::string_view> {
    template<typename FormatContext>
    auto format(const plog::file_line& fl, FormatContext& ctx) const {
        return fmt::format_to(ctx.out(), "{}:{}", fl.filename, fl.line);
    }
};
