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
#include "base/seastarx.h"

#include <seastar/core/sstring.hh>

#include <cstdint>
#include <iosfwd>
#include <optional>
#include <string_view>

namespace model {

enum class item_status : int8_t {
    pending,
    uploading,
    // Remote handle assigned, archive still outstanding
    uploaded,
    archiving,
    completed,
    failed,
};

std::ostream& operator<<(std::ostream&, item_status);

/// Aggregate status of the queue as seen by its owner.
enum class queue_status : int8_t {
    ready,
    uploading,
    paused,
    error,
    completed,
};

std::ostream& operator<<(std::ostream&, queue_status);

// last_error of an item the user chose to skip
inline constexpr std::string_view skipped_by_user = "Skipped by user";
// last_error prefix of an item the remote service refused
inline constexpr std::string_view rejected_prefix = "Item rejected: ";

/// One upload+archive unit of work.
struct queue_item {
    ss::sstring id;
    // Opaque reference handed to the remote client
    ss::sstring payload;
    // Set once the upload succeeded
    std::optional<ss::sstring> remote_handle;
    item_status status{item_status::pending};
    std::optional<ss::sstring> last_error;

    /// Uploaded and archived; must never be processed again.
    bool is_done() const {
        return remote_handle.has_value() && status == item_status::completed;
    }

    /// Skipped on request, never retried.
    bool is_abandoned() const {
        return status == item_status::failed && last_error.has_value()
               && std::string_view(*last_error) == skipped_by_user;
    }

    /// Refused by the remote service, waiting for skip or replace.
    bool is_rejected() const {
        return status == item_status::failed && last_error.has_value()
               && std::string_view(*last_error).starts_with(rejected_prefix);
    }

    bool operator==(const queue_item&) const = default;
    friend std::ostream& operator<<(std::ostream&, const queue_item&);
};

} // namespace model

PACER_OSTREAM_FMT(model::item_status)
PACER_OSTREAM_FMT(model::queue_status)
PACER_OSTREAM_FMT(model::queue_item)
