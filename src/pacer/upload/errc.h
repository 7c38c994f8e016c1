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

#include <cstdint>
#include <string>
#include <system_error>

namespace upload {

enum class errc : int16_t {
    success,
    shutting_down,    // Umbrella shutdown error
    ledger_not_found, // Nothing persisted for the queue yet
    ledger_corrupted, // Persisted ledger can't be parsed
    ledger_io_error,  // Filesystem failure while reading or writing
};

struct errc_category final : public std::error_category {
    const char* name() const noexcept final { return "upload::errc"; }

    std::string message(int c) const final {
        switch (static_cast<errc>(c)) {
        case errc::success:
            return "OK";
        case errc::shutting_down:
            return "shutting_down";
        case errc::ledger_not_found:
            return "ledger_not_found";
        case errc::ledger_corrupted:
            return "ledger_corrupted";
        case errc::ledger_io_error:
            return "ledger_io_error";
        }
        return "unknown";
    }
};

inline const std::error_category& error_category() noexcept {
    static errc_category e;
    return e;
}

inline std::error_code make_error_code(errc e) noexcept {
    return {static_cast<int>(e), error_category()};
}

} // namespace upload

namespace std {
template<>
struct is_error_code_enum<upload::errc> : true_type {};
} // namespace std
