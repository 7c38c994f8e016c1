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

#include "upload/account_guard.h"

#include "base/plog.h"
#include "ssx/future-util.h"
#include "upload/logger.h"

#include <seastar/core/coroutine.hh>
#include <seastar/core/manual_clock.hh>
#include <seastar/coroutine/as_future.hh>

#include <fmt/chrono.h>
#include <fmt/ostream.h>

#include <ostream>
#include <stdexcept>

namespace upload {

std::ostream& operator<<(std::ostream& o, const account_guard_config& cfg) {
    fmt::print(
      o,
      "{{bot_lockout: {}, failure_threshold: {}, failure_lockout: {}}}",
      cfg.bot_lockout,
      cfg.failure_threshold,
      cfg.failure_lockout);
    return o;
}

template<class Clock>
account_guard<Clock>::account_guard(account_guard_config cfg)
  : _cfg(cfg) {}

template<class Clock>
bool account_guard<Clock>::is_locked_out() {
    return remaining() > std::chrono::seconds(0);
}

template<class Clock>
std::chrono::seconds account_guard<Clock>::remaining() {
    if (!_locked_until.has_value()) {
        return std::chrono::seconds(0);
    }
    auto now = Clock::now();
    if (now >= _locked_until.value()) {
        plog(upload_log.info, "Account lockout is over");
        _locked_until.reset();
        return std::chrono::seconds(0);
    }
    return std::chrono::ceil<std::chrono::seconds>(_locked_until.value() - now);
}

template<class Clock>
void account_guard<Clock>::lock_for(std::chrono::seconds d) {
    auto until = Clock::now()
                 + std::chrono::duration_cast<typename Clock::duration>(d);
    if (!_locked_until.has_value() || _locked_until.value() < until) {
        _locked_until = until;
    }
}

template<class Clock>
void account_guard<Clock>::record_failure(error_kind kind) {
    if (kind == error_kind::bot_detected) {
        plog(
          upload_log.warn,
          "Remote service flagged the account, locking for {}",
          _cfg.bot_lockout);
        lock_for(_cfg.bot_lockout);
        _consecutive_failures = 0;
        return;
    }
    if (kind == error_kind::network_transient) {
        // says nothing about the account
        return;
    }
    ++_consecutive_failures;
    if (_consecutive_failures >= _cfg.failure_threshold) {
        plog(
          upload_log.warn,
          "{} consecutive failed calls, precautionary lockout for {}",
          _consecutive_failures,
          _cfg.failure_lockout);
        lock_for(_cfg.failure_lockout);
        _consecutive_failures = 0;
    }
}

template<class Clock>
void account_guard<Clock>::record_success() {
    _consecutive_failures = 0;
}

template<class Clock>
guarded_remote<Clock>::guarded_remote(
  remote_api& inner, account_guard<Clock>& guard)
  : _inner(inner)
  , _guard(guard) {}

namespace {
std::runtime_error locked_out_error(std::chrono::seconds remaining) {
    // worded so that it classifies as bot_detected
    return std::runtime_error(fmt::format(
      "account locked out by bot protection, {} left", remaining));
}
} // namespace

template<class Clock>
ss::future<ss::sstring>
guarded_remote<Clock>::upload(const ss::sstring& payload) {
    if (_guard.is_locked_out()) {
        throw locked_out_error(_guard.remaining());
    }
    auto fut = co_await ss::coroutine::as_future(_inner.upload(payload));
    if (fut.failed()) {
        auto e = fut.get_exception();
        if (!ssx::is_shutdown_exception(e)) {
            _guard.record_failure(classify(e).kind);
        }
        std::rethrow_exception(e);
    }
    _guard.record_success();
    co_return fut.get();
}

template<class Clock>
ss::future<bool>
guarded_remote<Clock>::archive(const ss::sstring& remote_handle) {
    if (_guard.is_locked_out()) {
        throw locked_out_error(_guard.remaining());
    }
    auto fut = co_await ss::coroutine::as_future(_inner.archive(remote_handle));
    if (fut.failed()) {
        auto e = fut.get_exception();
        if (!ssx::is_shutdown_exception(e)) {
            _guard.record_failure(classify(e).kind);
        }
        std::rethrow_exception(e);
    }
    auto archived = fut.get();
    if (archived) {
        _guard.record_success();
    } else {
        _guard.record_failure(error_kind::generic_transient);
    }
    co_return archived;
}

template<class Clock>
ss::future<> guarded_remote<Clock>::probe_network_stability() {
    return _inner.probe_network_stability();
}

template<class Clock>
ss::future<bool> guarded_remote<Clock>::is_account_locked_out() {
    if (_guard.is_locked_out()) {
        co_return true;
    }
    co_return co_await _inner.is_account_locked_out();
}

template class account_guard<ss::lowres_clock>;
template class account_guard<ss::manual_clock>;
template class guarded_remote<ss::lowres_clock>;
template class guarded_remote<ss::manual_clock>;

} // namespace upload
