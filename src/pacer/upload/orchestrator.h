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
#include "model/phase.h"
#include "model/queue_item.h"
#include "random/time_window.h"
#include "ssx/countdown.h"
#include "upload/cooldown_coordinator.h"
#include "upload/error_classifier.h"
#include "upload/ledger_store.h"
#include "upload/progress_ledger.h"
#include "upload/queue_api.h"
#include "upload/remote_api.h"
#include "upload/retry_policy.h"
#include "upload/types.h"

#include <seastar/core/abort_source.hh>
#include <seastar/core/future.hh>
#include <seastar/core/gate.hh>
#include <seastar/core/lowres_clock.hh>
#include <seastar/util/noncopyable_function.hh>

#include <chrono>
#include <cstdint>
#include <exception>
#include <iosfwd>
#include <optional>
#include <string_view>
#include <vector>

namespace upload {

/// Why a run returned.
enum class run_outcome : int8_t {
    completed,
    // Stopped on request or after an escalation pause, resumable
    paused,
    session_expired,
    locked_out,
    // Waiting for skip_rejected() or replace_rejected()
    item_rejected,
    network_unavailable,
    shutting_down,
};

std::ostream& operator<<(std::ostream&, run_outcome);

/// Drives one queue through upload and archive, one item at a time, with
/// human-like pacing between remote calls.
///
/// The orchestrator is the only writer of the progress ledger. Everybody
/// else talks to it through request_pause() and the skip/replace decisions
/// for a rejected item. All waits are countdowns with one second checkpoints
/// so a pause request takes effect within a second and shutdown aborts any
/// wait immediately. A remote call in flight is never interrupted.
template<class Clock = ss::lowres_clock>
class orchestrator {
public:
    orchestrator(
      remote_api& remote,
      queue_api& queue,
      ledger_api& store,
      cooldown_coordinator<Clock>& cooldown,
      orchestrator_config cfg);

    orchestrator(const orchestrator&) = delete;
    orchestrator(orchestrator&&) = delete;
    orchestrator& operator=(const orchestrator&) = delete;
    orchestrator& operator=(orchestrator&&) = delete;
    ~orchestrator() = default;

    /// Load the persisted ledger of the queue and the account cooldown.
    ss::future<> start();
    /// Abort pending waits and wait for the running loop to exit.
    ss::future<> stop();

    /// Process the queue starting at `start_index`. Only one run can be
    /// active at a time.
    ss::future<run_outcome> run(size_t start_index = 0);
    /// Continue where the last run stopped.
    ss::future<run_outcome> resume();
    /// Abandon the rejected item and continue with the next one.
    ss::future<run_outcome> skip_rejected();
    /// Retry the rejected item with a different payload.
    ss::future<run_outcome> replace_rejected(ss::sstring payload);

    /// Stop at the next checkpoint.
    void request_pause() { _pause_requested = true; }

    const model::orchestration_phase& current_phase() const { return _phase; }
    const progress_ledger& ledger() const { return _ledger; }
    bool is_running() const { return _running; }

private:
    using phase_fn = ss::noncopyable_function<model::orchestration_phase(
      std::chrono::seconds)>;

    enum class network_wait : int8_t { stable, unstable, interrupted };

    struct attempt_result {
        enum class kind : int8_t { archived, paused, locked_out, failed };
        kind type;
        std::optional<classified_error> error;
    };

    static attempt_result failure(std::exception_ptr e);

    /// Index of the rejected item a skip or replace applies to. Throws
    /// std::logic_error unless the last run halted on a rejected item.
    size_t rejected_index(
      std::string_view action,
      const std::vector<model::queue_item>& items) const;

    ss::future<run_outcome> do_run(size_t start, bool check_cooldown);
    ss::future<run_outcome> run_loop(size_t start, bool check_cooldown);

    /// Upload (unless a handle is already known) and archive item `i`.
    ss::future<attempt_result> attempt_item(size_t i, model::queue_item& item);

    /// Decide and carry out the reaction to a failed attempt. Returns the
    /// outcome if the run has to stop.
    ss::future<std::optional<run_outcome>> handle_failure(
      size_t i, model::queue_item& item, const classified_error& err);

    ss::future<network_wait> wait_for_network(int attempt, bool settle);

    ss::future<ssx::countdown_result>
    wait(std::chrono::seconds d, phase_fn make_phase, bool pausable = true);

    /// Stop with phase paused and resume index `i`.
    ss::future<run_outcome>
    halt_paused(size_t i, run_outcome outcome = run_outcome::paused);

    ss::future<> update_item(size_t i, const model::queue_item& item);
    void publish(model::orchestration_phase p);
    ss::future<> persist();
    ss::future<> persist_cooldown();
    ss::future<bool> account_locked_out();

    remote_api& _remote;
    queue_api& _queue;
    ledger_api& _store;
    cooldown_coordinator<Clock>& _cooldown;
    orchestrator_config _cfg;
    retry_policy _policy;
    random_generators::time_window<std::chrono::seconds> _pre_archive_delay;
    random_generators::time_window<std::chrono::seconds> _inter_item_delay;
    random_generators::time_window<std::chrono::seconds> _cooldown_jitter;

    ss::abort_source _as;
    ss::gate _gate;
    bool _pause_requested{false};
    bool _running{false};
    // Automatic retries of the item being processed
    int _attempt{0};
    model::orchestration_phase _phase;
    progress_ledger _ledger;
};

} // namespace upload

PACER_OSTREAM_FMT(upload::run_outcome)
