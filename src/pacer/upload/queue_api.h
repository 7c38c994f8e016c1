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

#include "base/seastarx.h"
#include "model/phase.h"
#include "model/queue_item.h"

#include <seastar/core/future.hh>
#include <seastar/core/sstring.hh>

#include <vector>

namespace upload {

/// Owner of the item queue: storage of items and their statuses, and the
/// display side that watches the orchestrator.
class queue_api {
public:
    queue_api() = default;
    queue_api(const queue_api&) = delete;
    queue_api(queue_api&&) noexcept = delete;
    queue_api& operator=(const queue_api&) = delete;
    queue_api& operator=(queue_api&&) noexcept = delete;
    virtual ~queue_api() = default;

    /// Stable identifier, used as the ledger key.
    virtual ss::sstring queue_id() const = 0;

    /// All items in processing order. The order must not change between
    /// runs, resume indices refer to it.
    virtual std::vector<model::queue_item> items() const = 0;

    virtual ss::future<> update_item(size_t index, model::queue_item item) = 0;

    virtual ss::future<> set_status(model::queue_status status) = 0;

    /// Called on every phase change, countdown ticks included.
    virtual void on_phase_change(const model::orchestration_phase& phase) = 0;
};

} // namespace upload
