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

#include <seastar/core/future.hh>
#include <seastar/core/sstring.hh>

namespace upload {

/// Client of the remote media service.
///
/// Failures are reported as exceptional futures. The orchestrator
/// classifies them by message and error code (see error_classifier.h), so
/// implementations should keep the service's own error text.
class remote_api {
public:
    remote_api() = default;
    remote_api(const remote_api&) = delete;
    remote_api(remote_api&&) noexcept = delete;
    remote_api& operator=(const remote_api&) = delete;
    remote_api& operator=(remote_api&&) noexcept = delete;
    virtual ~remote_api() = default;

    /// Upload the payload, returns the handle assigned by the service.
    virtual ss::future<ss::sstring> upload(const ss::sstring& payload) = 0;

    /// Archive a previously uploaded object. False means the service
    /// accepted the request but did not archive.
    virtual ss::future<bool> archive(const ss::sstring& remote_handle) = 0;

    /// Fails while the connection is unstable or has just changed.
    virtual ss::future<> probe_network_stability() = 0;

    /// Account level automation flag, independent of any run.
    virtual ss::future<bool> is_account_locked_out() = 0;
};

} // namespace upload
