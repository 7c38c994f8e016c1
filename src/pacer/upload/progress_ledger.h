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

#include "base/fmt.h"
#include "base/outcome.h"
#include "base/seastarx.h"

#include <seastar/core/sstring.hh>

#include <cstddef>
#include <iosfwd>
#include <optional>
#include <string_view>

namespace upload {

/// The state needed to resume a queue exactly where it stopped.
struct progress_ledger {
    // Items [0, current_index) are completed
    size_t current_index{0};
    size_t total{0};
    // Automatic retries since the last successful archive, across items
    int consecutive_auto_retries{0};
    // Where the next run has to start. Set whenever a run stops before
    // the archive step of an item completed.
    std::optional<size_t> resume_index;
    bool is_paused{false};

    bool operator==(const progress_ledger&) const = default;
    friend std::ostream& operator<<(std::ostream&, const progress_ledger&);
};

/// JSON document of a ledger, see ledger_from_json for the schema.
ss::sstring ledger_to_json(const progress_ledger& ledger);

/// Parses the output of ledger_to_json. Returns errc::ledger_corrupted on
/// malformed input or an unknown version.
result<progress_ledger> ledger_from_json(std::string_view doc);

} // namespace upload

PACER_OSTREAM_FMT(upload::progress_ledger)
