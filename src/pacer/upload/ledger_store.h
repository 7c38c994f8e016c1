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

#include "base/outcome.h"
#include "base/seastarx.h"
#include "upload/progress_ledger.h"

#include <seastar/core/future.hh>
#include <seastar/core/sstring.hh>

#include <chrono>
#include <filesystem>
#include <optional>
#include <system_error>

namespace upload {

/// Persistence boundary of the orchestrator: per queue progress ledgers and
/// the account cooldown deadline.
class ledger_api {
public:
    using wall_time_point = std::chrono::system_clock::time_point;

    ledger_api() = default;
    ledger_api(const ledger_api&) = delete;
    ledger_api(ledger_api&&) noexcept = delete;
    ledger_api& operator=(const ledger_api&) = delete;
    ledger_api& operator=(ledger_api&&) noexcept = delete;
    virtual ~ledger_api() = default;

    virtual ss::future<std::error_code>
    save(const ss::sstring& queue_id, const progress_ledger& ledger) = 0;

    /// errc::ledger_not_found if nothing was saved for the queue.
    virtual ss::future<result<progress_ledger>>
    load(const ss::sstring& queue_id) = 0;

    virtual ss::future<std::error_code> remove(const ss::sstring& queue_id)
      = 0;

    /// Persist the cooldown deadline, std::nullopt clears it.
    virtual ss::future<std::error_code>
    save_cooldown(std::optional<wall_time_point> deadline) = 0;

    /// errc::ledger_not_found if there is no active deadline on record.
    virtual ss::future<result<wall_time_point>> load_cooldown() = 0;
};

/// One JSON document per queue (`<queue_id>.ledger.json`) plus
/// `cooldown.json`, all in a single directory.
class file_ledger_store final : public ledger_api {
public:
    explicit file_ledger_store(std::filesystem::path dir);

    /// Creates the directory if it doesn't exist.
    ss::future<> start();

    ss::future<std::error_code>
    save(const ss::sstring& queue_id, const progress_ledger& ledger) override;

    ss::future<result<progress_ledger>>
    load(const ss::sstring& queue_id) override;

    ss::future<std::error_code> remove(const ss::sstring& queue_id) override;

    ss::future<std::error_code>
    save_cooldown(std::optional<wall_time_point> deadline) override;

    ss::future<result<wall_time_point>> load_cooldown() override;

    std::filesystem::path ledger_path(const ss::sstring& queue_id) const;
    std::filesystem::path cooldown_path() const;

private:
    ss::future<result<ss::sstring>> read(std::filesystem::path p);
    ss::future<std::error_code> write(std::filesystem::path p, ss::sstring s);

    std::filesystem::path _dir;
};

} // namespace upload
