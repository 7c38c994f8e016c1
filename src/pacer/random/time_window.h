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

#include <absl/random/distributions.h>
#include <absl/random/random.h>

#include <chrono>

namespace random_generators {

/// Uniformly distributed duration in the closed interval [min, max].
///
/// Used wherever pacing has to look human: pre-archive delays, gaps between
/// items, retry jitter. A degenerate window (max <= min) always yields min.
template<typename DurationType = std::chrono::seconds>
class time_window {
public:
    using rep = typename DurationType::rep;

    time_window(DurationType min, DurationType max) noexcept
      : _min(min)
      , _max(max) {}

    DurationType min() const { return _min; }
    DurationType max() const { return _max; }

    DurationType next() {
        if (_max <= _min) {
            return _min;
        }
        return DurationType(absl::Uniform<rep>(
          absl::IntervalClosedClosed, _rng, _min.count(), _max.count()));
    }

    DurationType operator()() { return next(); }

private:
    DurationType _min;
    DurationType _max;
    absl::InsecureBitGen _rng;
};

} // namespace random_generators
