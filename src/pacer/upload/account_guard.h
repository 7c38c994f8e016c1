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
#include "upload/error_classifier.h"
#include "upload/remote_api.h"

#include <seastar/core/lowres_clock.hh>

#include <chrono>
#include <iosfwd>
#include <optional>

namespace upload {

struct account_guard_config {
    std::chrono::seconds bot_lockout{900};
    // Consecutive failed calls that trigger a precautionary lockout
    int failure_threshold{3};
    std::chrono::seconds failure_lockout{300};

    friend std::ostream&
    operator<<(std::ostream&, const account_guard_config&);
};

/// In-process view of the account's lockout state.
///
/// A bot flag from the remote service locks the account for
/// `bot_lockout`. A streak of `failure_threshold` failed calls of any
/// other kind except connectivity problems locks it for `failure_lockout`
/// as a precaution. A successful call ends the streak.
template<class Clock = ss::lowres_clock>
class account_guard {
public:
    explicit account_guard(account_guard_config cfg);

    bool is_locked_out();
    /// Zero when not locked out.
    std::chrono::seconds remaining();

    void lock_for(std::chrono::seconds d);
    void record_failure(error_kind kind);
    void record_success();

    int consecutive_failures() const { return _consecutive_failures; }

private:
    account_guard_config _cfg;
    std::optional<typename Clock::time_point> _locked_until;
    int _consecutive_failures{0};
};

/// remote_api decorator that feeds call outcomes into an account_guard and
/// refuses writes while the account is locked out.
template<class Clock = ss::lowres_clock>
class guarded_remote final : public remote_api {
public:
    guarded_remote(remote_api& inner, account_guard<Clock>& guard);

    ss::future<ss::sstring> upload(const ss::sstring& payload) override;
    ss::future<bool> archive(const ss::sstring& remote_handle) override;
    ss::future<> probe_network_stability() override;
    ss::future<bool> is_account_locked_out() override;

private:
    remote_api& _inner;
    account_guard<Clock>& _guard;
};

} // namespace upload

PACER_OSTREAM_FMT(upload::account_guard_config)
