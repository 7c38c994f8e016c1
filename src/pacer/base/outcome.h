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

#include <boost/outcome/basic_result.hpp>
#include <boost/outcome/iostream_support.hpp>
#include <boost/outcome/policy/base.hpp>
#include <boost/outcome/std_result.hpp>

#include <system_error>

namespace outcome = boost::outcome_v2;

/// The error side is always an std::error_code unless stated otherwise.
/// Callers check `has_error()` and propagate `error()`; `value()` on an
/// errored result throws std::system_error.
template<
  class R,
  class S = std::error_code,
  class NoValuePolicy = outcome::policy::default_policy<R, S, void>>
using result = outcome::basic_result<R, S, NoValuePolicy>;
