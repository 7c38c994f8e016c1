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

#include <seastar/core/abort_source.hh>
#include <seastar/core/gate.hh>
#include <seastar/core/sleep.hh>

#include <exception>

namespace ssx {

/// True for the exception types seastar raises while a service is being
/// stopped (abort sources, gates, abortable sleeps). Such failures are never
/// classified as remote errors.
inline bool is_shutdown_exception(const std::exception_ptr& e) {
    try {
        std::rethrow_exception(e);
    } catch (const ss::abort_requested_exception&) {
        return true;
    } catch (const ss::sleep_aborted&) {
        return true;
    } catch (const ss::gate_closed_exception&) {
        return true;
    } catch (...) {
        return false;
    }
}

} // namespace ssx
