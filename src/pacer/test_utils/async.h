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
#include <seastar/core/idle_cpu_handler.hh>
#include <seastar/core/manual_clock.hh>
#include <seastar/core/reactor.hh>
#include <seastar/core/smp.hh>

#include <chrono>
#include <optional>

namespace tests {

/// Resolves once the reactor ran out of ready tasks, i.e. every
/// continuation made runnable so far (timers fired by
/// ss::manual_clock::advance included) has been executed.
inline ss::future<> drain_task_queue() {
    return ss::smp::invoke_on_all([] {
        std::optional<ss::promise<>> p;
        p.emplace();
        auto fut = p->get_future();
        ss::set_idle_cpu_handler(
          [p = std::move(p)](ss::work_waiting_on_reactor) mutable {
              if (!p) {
                  return ss::idle_cpu_handler_result::no_more_work;
              }
              p->set_value();
              p.reset();
              return ss::idle_cpu_handler_result::
                interrupted_by_higher_priority_task;
          });
        return fut;
    });
}

/// Step the manual clock one second at a time until `fut` is ready or
/// `limit` of simulated time has passed. Returns the simulated time spent.
template<typename T>
ss::future<std::chrono::seconds> advance_until_ready(
  ss::future<T>& fut,
  std::chrono::seconds limit = std::chrono::hours(24)) {
    using namespace std::chrono_literals;
    auto spent = 0s;
    co_await drain_task_queue();
    while (!fut.available() && spent < limit) {
        ss::manual_clock::advance(1s);
        spent += 1s;
        co_await drain_task_queue();
    }
    co_return spent;
}

} // namespace tests
