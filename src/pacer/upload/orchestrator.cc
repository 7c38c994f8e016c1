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

#include "upload/orchestrator.h"

#include "base/plog.h"
#include "ssx/future-util.h"
#include "upload/errc.h"
#include "upload/logger.h"

#include <seastar/core/coroutine.hh>
#include <seastar/core/manual_clock.hh>
#include <seastar/coroutine/as_future.hh>
#include <seastar/util/defer.hh>

#include <fmt/chrono.h>
#include <fmt/ostream.h>

#include <algorithm>
#include <exception>
#include <ostream>
#include <stdexcept>
#include <string_view>
#include <vector>

/*
 * Per item state transitions of a run:
 *
 *           +---------+   locked out    +--------+
 *  start -->|  check  |---------------->| paused |<----------------+
 *           +---------+                 +--------+                 |
 *                |                          ^  ^                   |
 *                | cooldown?                |  | pause requested   |
 *                v                          |  | at any checkpoint |
 *           +----------+                    |  |                   |
 *           | cooldown |--------------------+  |                   |
 *           +----------+                       |                   |
 *                |                             |                   |
 *                v                             |                   |
 *     +--> +-----------+   +-----------+       |   +-----------------+
 *     |    | uploading |-->| archiving |-------+   | escalated_pause |
 *     |    +-----------+   +-----------+           +-----------------+
 *     |         |  failure       |   |                     ^
 *     |         +-------+--------+   | success             | attempts
 *     |                 v            v                     | exhausted
 *     |        +---------------+  +-------------------+    |
 *     +--------| retry policy  |  | waiting_next_item |    |
 *     | retry  +---------------+  +-------------------+    |
 *     |          |   |   |   |           |                 |
 *     |          |   |   |   +-----------+-----------------+
 *     |          |   |   |               v
 *     |          |   |   |         next item or completed
 *     |          |   |   v
 *     |          |   |  halt: session_expired, item_rejected,
 *     |          |   |  locked_out (countdown, then paused)
 *     |          |   v
 *     +----------+ auto_retrying / waiting_network
 */

namespace upload {

std::ostream& operator<<(std::ostream& o, run_outcome r) {
    switch (r) {
    case run_outcome::completed:
        return o << "completed";
    case run_outcome::paused:
        return o << "paused";
    case run_outcome::session_expired:
        return o << "session_expired";
    case run_outcome::locked_out:
        return o << "locked_out";
    case run_outcome::item_rejected:
        return o << "item_rejected";
    case run_outcome::network_unavailable:
        return o << "network_unavailable";
    case run_outcome::shutting_down:
        return o << "shutting_down";
    }
    return o << "unknown";
}

template<class Clock>
orchestrator<Clock>::orchestrator(
  remote_api& remote,
  queue_api& queue,
  ledger_api& store,
  cooldown_coordinator<Clock>& cooldown,
  orchestrator_config cfg)
  : _remote(remote)
  , _queue(queue)
  , _store(store)
  , _cooldown(cooldown)
  , _cfg(cfg)
  , _policy(cfg.retry)
  , _pre_archive_delay(cfg.pre_archive_delay_min, cfg.pre_archive_delay_max)
  , _inter_item_delay(cfg.inter_item_delay_min, cfg.inter_item_delay_max)
  , _cooldown_jitter(cfg.cooldown_jitter_min, cfg.cooldown_jitter_max) {}

template<class Clock>
ss::future<> orchestrator<Clock>::start() {
    auto holder = _gate.hold();
    const auto id = _queue.queue_id();
    auto loaded = co_await _store.load(id);
    if (loaded.has_value()) {
        _ledger = loaded.value();
        plog(upload_log.info, "Loaded ledger of queue {}: {}", id, _ledger);
    } else if (loaded.error() == errc::ledger_not_found) {
        plog(upload_log.debug, "No ledger on record for queue {}", id);
    } else {
        plog(
          upload_log.warn,
          "Can't load ledger of queue {}: {}, starting from scratch",
          id,
          loaded.error().message());
    }

    // The coordinator is shared, another queue may have restored it already
    if (_cooldown.is_on_cooldown().active) {
        co_return;
    }
    auto deadline = co_await _store.load_cooldown();
    if (deadline.has_value()) {
        _cooldown.restore(deadline.value());
    } else if (deadline.error() != errc::ledger_not_found) {
        plog(
          upload_log.warn,
          "Can't load account cooldown: {}",
          deadline.error().message());
    }
}

template<class Clock>
ss::future<> orchestrator<Clock>::stop() {
    plog(
      upload_log.debug, "Stopping orchestrator of queue {}", _queue.queue_id());
    _as.request_abort();
    co_await _gate.close();
}

template<class Clock>
ss::future<run_outcome> orchestrator<Clock>::run(size_t start_index) {
    return do_run(start_index, start_index == 0);
}

template<class Clock>
ss::future<run_outcome> orchestrator<Clock>::resume() {
    return do_run(_ledger.resume_index.value_or(0), true);
}

template<class Clock>
ss::future<run_outcome> orchestrator<Clock>::skip_rejected() {
    auto items = _queue.items();
    auto i = rejected_index("skip", items);
    auto& item = items[i];
    plog(upload_log.info, "Skipping item {} ({}) on request", i, item.id);
    item.status = model::item_status::failed;
    item.last_error = ss::sstring(
      model::skipped_by_user.data(), model::skipped_by_user.size());
    co_await update_item(i, item);
    co_return co_await do_run(i + 1, true);
}

template<class Clock>
ss::future<run_outcome>
orchestrator<Clock>::replace_rejected(ss::sstring payload) {
    auto items = _queue.items();
    auto i = rejected_index("replace", items);
    auto& item = items[i];
    plog(upload_log.info, "Replacing payload of item {} ({})", i, item.id);
    item.payload = std::move(payload);
    item.remote_handle.reset();
    item.last_error.reset();
    item.status = model::item_status::pending;
    co_await update_item(i, item);
    co_return co_await do_run(i, true);
}

template<class Clock>
size_t orchestrator<Clock>::rejected_index(
  std::string_view action, const std::vector<model::queue_item>& items) const {
    const auto id = _queue.queue_id();
    if (_running || !_ledger.resume_index.has_value()) {
        throw std::logic_error(
          fmt::format("queue {} has no rejected item to {}", id, action));
    }
    auto i = _ledger.resume_index.value();
    if (i >= items.size()) {
        throw std::out_of_range(fmt::format(
          "resume index {} is out of range, queue has {} items",
          i,
          items.size()));
    }
    if (!items[i].is_rejected()) {
        throw std::logic_error(fmt::format(
          "can't {} item {} ({}) of queue {}, it was not rejected: {}",
          action,
          i,
          items[i].id,
          id,
          items[i]));
    }
    return i;
}

template<class Clock>
ss::future<run_outcome>
orchestrator<Clock>::do_run(size_t start, bool check_cooldown) {
    const auto id = _queue.queue_id();
    if (_running) {
        throw std::logic_error(
          fmt::format("queue {} is already being processed", id));
    }
    auto holder = _gate.hold();
    _running = true;
    auto reset_running = ss::defer([this]() noexcept { _running = false; });
    _pause_requested = false;

    std::exception_ptr err;
    auto outcome = run_outcome::shutting_down;
    try {
        outcome = co_await run_loop(start, check_cooldown);
    } catch (...) {
        err = std::current_exception();
    }
    if (err) {
        if (!ssx::is_shutdown_exception(err)) {
            plog(upload_log.error, "Run of queue {} failed: {}", id, err);
            std::rethrow_exception(err);
        }
        plog(
          upload_log.info,
          "Run of queue {} stopped by shutdown, ledger: {}",
          id,
          _ledger);
        co_await persist();
    }
    plog(upload_log.info, "Run of queue {} finished: {}", id, outcome);
    co_return outcome;
}

template<class Clock>
ss::future<run_outcome>
orchestrator<Clock>::run_loop(size_t start, bool check_cooldown) {
    const auto id = _queue.queue_id();
    auto items = _queue.items();
    _ledger.total = items.size();
    _ledger.current_index = std::min(start, items.size());
    _ledger.resume_index = start;
    plog(
      upload_log.info,
      "Starting queue {} at item {} of {}",
      id,
      start,
      items.size());

    if (co_await account_locked_out()) {
        plog(
          upload_log.warn, "Account is locked out, queue {} not started", id);
        co_return co_await halt_paused(start, run_outcome::locked_out);
    }

    if (check_cooldown) {
        auto cd = _cooldown.is_on_cooldown();
        if (cd.active) {
            plog(
              upload_log.info,
              "Account cooldown active, queue {} waits {}",
              id,
              cd.remaining);
            auto r = co_await wait(cd.remaining, [](std::chrono::seconds rem) {
                return model::phase::cooldown{rem};
            });
            if (r == ssx::countdown_result::interrupted) {
                co_return co_await halt_paused(start);
            }
        }
    }

    co_await _queue.set_status(model::queue_status::uploading);
    _ledger.consecutive_auto_retries = 0;
    _ledger.is_paused = false;
    co_await persist();

    auto net = co_await wait_for_network(0, false);
    if (net == network_wait::interrupted) {
        co_return co_await halt_paused(start);
    }
    if (net == network_wait::unstable) {
        plog(
          upload_log.warn,
          "Network did not stabilize within {}, queue {} not started",
          _cfg.network_probe_ceiling,
          id);
        _ledger.resume_index = start;
        _ledger.is_paused = true;
        publish(model::phase::paused{});
        co_await _queue.set_status(model::queue_status::error);
        co_await persist();
        co_return run_outcome::network_unavailable;
    }

    _attempt = 0;
    size_t i = start;
    while (i < items.size()) {
        if (_pause_requested) {
            co_return co_await halt_paused(i);
        }
        _ledger.resume_index = i;
        auto& item = items[i];
        if (item.is_done() || item.is_abandoned()) {
            plog(
              upload_log.debug,
              "Item {} ({}) is {}, skipping",
              i,
              item.id,
              item.status);
            ++i;
            continue;
        }

        auto res = co_await attempt_item(i, item);
        switch (res.type) {
        case attempt_result::kind::paused:
            co_return co_await halt_paused(i);
        case attempt_result::kind::locked_out:
            plog(
              upload_log.warn,
              "Account got locked out, queue {} stops at item {}",
              id,
              i);
            co_return co_await halt_paused(i, run_outcome::locked_out);
        case attempt_result::kind::failed: {
            auto stop = co_await handle_failure(i, item, res.error.value());
            if (stop.has_value()) {
                co_return stop.value();
            }
            continue;
        }
        case attempt_result::kind::archived:
            break;
        }

        _attempt = 0;
        _ledger.consecutive_auto_retries = 0;
        _ledger.current_index = i + 1;
        _ledger.resume_index = i + 1;
        auto write_cooldown = _cooldown.record_write();
        plog(
          upload_log.info,
          "Item {} ({}) archived, account cooldown {}",
          i,
          item.id,
          write_cooldown);
        co_await persist();
        co_await persist_cooldown();

        if (i + 1 < items.size()) {
            auto cd = _cooldown.is_on_cooldown();
            auto delay = cd.active ? cd.remaining + _cooldown_jitter.next()
                                   : _inter_item_delay.next();
            const int next = static_cast<int>(i) + 2;
            auto r = co_await wait(delay, [next](std::chrono::seconds rem) {
                return model::phase::waiting_next_item{next, rem};
            });
            if (r == ssx::countdown_result::interrupted) {
                co_return co_await halt_paused(i + 1);
            }
        }
        ++i;
    }

    plog(upload_log.info, "Queue {} completed", id);
    _ledger.current_index = items.size();
    _ledger.resume_index.reset();
    _ledger.is_paused = false;
    publish(model::phase::completed{});
    co_await _queue.set_status(model::queue_status::completed);
    co_await persist();
    co_return run_outcome::completed;
}

template<class Clock>
typename orchestrator<Clock>::attempt_result
orchestrator<Clock>::failure(std::exception_ptr e) {
    if (ssx::is_shutdown_exception(e)) {
        std::rethrow_exception(e);
    }
    return {.type = attempt_result::kind::failed, .error = classify(e)};
}

template<class Clock>
ss::future<typename orchestrator<Clock>::attempt_result>
orchestrator<Clock>::attempt_item(size_t i, model::queue_item& item) {
    if (co_await account_locked_out()) {
        co_return attempt_result{.type = attempt_result::kind::locked_out};
    }
    const int ordinal = static_cast<int>(i) + 1;

    if (!item.remote_handle.has_value()) {
        publish(model::phase::uploading{ordinal});
        item.status = model::item_status::uploading;
        co_await update_item(i, item);
        auto fut = co_await ss::coroutine::as_future(
          _remote.upload(item.payload));
        if (fut.failed()) {
            co_return failure(fut.get_exception());
        }
        auto handle = fut.get();
        if (handle.empty()) {
            co_return attempt_result{
              .type = attempt_result::kind::failed,
              .error = classified_error{
                error_kind::generic_transient,
                "upload returned an empty remote handle"}};
        }
        plog(
          upload_log.debug,
          "Item {} ({}) uploaded as {}",
          i,
          item.id,
          handle);
        item.remote_handle = std::move(handle);
        item.status = model::item_status::uploaded;
        co_await update_item(i, item);

        auto r = co_await wait(
          _pre_archive_delay.next(),
          [ordinal](std::chrono::seconds) {
              return model::phase::uploading{ordinal};
          });
        if (r == ssx::countdown_result::interrupted) {
            co_return attempt_result{.type = attempt_result::kind::paused};
        }
    }
    if (_pause_requested) {
        co_return attempt_result{.type = attempt_result::kind::paused};
    }

    publish(model::phase::archiving{ordinal});
    item.status = model::item_status::archiving;
    co_await update_item(i, item);
    auto fut = co_await ss::coroutine::as_future(
      _remote.archive(item.remote_handle.value()));
    if (fut.failed()) {
        co_return failure(fut.get_exception());
    }
    if (!fut.get()) {
        co_return attempt_result{
          .type = attempt_result::kind::failed,
          .error = classified_error{
            error_kind::generic_transient,
            "archive was not confirmed by the remote service"}};
    }
    item.status = model::item_status::completed;
    item.last_error.reset();
    co_await update_item(i, item);
    co_return attempt_result{.type = attempt_result::kind::archived};
}

template<class Clock>
ss::future<std::optional<run_outcome>> orchestrator<Clock>::handle_failure(
  size_t i, model::queue_item& item, const classified_error& err) {
    auto action = _policy.decide(
      err.kind, _attempt, _ledger.consecutive_auto_retries, err.message);
    plog(
      upload_log.warn,
      "Item {} ({}) failed with {} after {} retries: {}, next step: {}",
      i,
      item.id,
      err.kind,
      _attempt,
      err.message,
      action);
    item.last_error = err.message;
    _ledger.resume_index = i;

    if (err.kind == error_kind::cooldown_active) {
        _cooldown.extend(
          parse_cooldown_seconds(err.message, _cfg.retry.cooldown_floor));
        co_await persist_cooldown();
    }

    const int ordinal = static_cast<int>(i) + 1;
    const auto restored_status = item.remote_handle.has_value()
                                   ? model::item_status::uploaded
                                   : model::item_status::pending;
    switch (action.type) {
    case retry_action::kind::halt: {
        item.status = model::item_status::failed;
        switch (action.reason.value()) {
        case halt_reason::session_expired:
            item.last_error = ss::sstring(
              fmt::format("Session expired: {}", err.message));
            co_await update_item(i, item);
            publish(model::phase::session_expired{});
            co_await _queue.set_status(model::queue_status::error);
            co_await persist();
            co_return run_outcome::session_expired;
        case halt_reason::locked_out:
            item.last_error = ss::sstring(
              fmt::format("Bot detected: {}", err.message));
            co_await update_item(i, item);
            co_await _queue.set_status(model::queue_status::error);
            co_await persist();
            co_await wait(
              _cfg.bot_lockout,
              [](std::chrono::seconds rem) {
                  return model::phase::locked_out{rem};
              },
              false);
            co_return co_await halt_paused(i, run_outcome::locked_out);
        case halt_reason::item_rejected:
            item.last_error = ss::sstring(
              fmt::format("{}{}", model::rejected_prefix, err.message));
            co_await update_item(i, item);
            _ledger.is_paused = true;
            publish(model::phase::item_rejected{ordinal});
            co_await _queue.set_status(model::queue_status::paused);
            co_await persist();
            co_return run_outcome::item_rejected;
        }
        break;
    }
    case retry_action::kind::escalate:
        item.status = model::item_status::failed;
        co_await update_item(i, item);
        co_await persist();
        co_await wait(
          _cfg.escalation_pause,
          [](std::chrono::seconds rem) {
              return model::phase::escalated_pause{rem};
          },
          false);
        co_return co_await halt_paused(i);
    case retry_action::kind::retry_after: {
        item.status = restored_status;
        co_await update_item(i, item);
        const int next_attempt = _attempt + 1;
        auto r = co_await wait(
          action.wait, [next_attempt](std::chrono::seconds rem) {
              return model::phase::auto_retrying{rem, next_attempt};
          });
        if (r == ssx::countdown_result::interrupted) {
            co_return co_await halt_paused(i);
        }
        break;
    }
    case retry_action::kind::retry_when_network_recovers: {
        item.status = restored_status;
        co_await update_item(i, item);
        auto net = co_await wait_for_network(_attempt + 1, true);
        if (net == network_wait::interrupted) {
            co_return co_await halt_paused(i);
        }
        break;
    }
    }

    ++_attempt;
    ++_ledger.consecutive_auto_retries;
    co_await persist();
    co_return std::nullopt;
}

template<class Clock>
ss::future<typename orchestrator<Clock>::network_wait>
orchestrator<Clock>::wait_for_network(int attempt, bool settle) {
    auto phase = [attempt](std::chrono::seconds) {
        return model::phase::waiting_network{attempt};
    };
    publish(phase(std::chrono::seconds(0)));
    using duration = typename Clock::duration;
    const auto deadline
      = Clock::now()
        + std::chrono::duration_cast<duration>(_cfg.network_probe_ceiling);
    const auto interval = std::chrono::duration_cast<duration>(
      _cfg.network_probe_interval);
    bool recovered = false;
    while (true) {
        if (_pause_requested) {
            co_return network_wait::interrupted;
        }
        auto fut = co_await ss::coroutine::as_future(
          _remote.probe_network_stability());
        if (!fut.failed()) {
            fut.get();
            break;
        }
        auto e = fut.get_exception();
        if (ssx::is_shutdown_exception(e)) {
            std::rethrow_exception(e);
        }
        recovered = true;
        plog(upload_log.debug, "Network is not stable yet: {}", e);
        if (Clock::now() + interval > deadline) {
            if (settle) {
                auto r = co_await wait(_cfg.network_settle, phase);
                if (r == ssx::countdown_result::interrupted) {
                    co_return network_wait::interrupted;
                }
            }
            co_return network_wait::unstable;
        }
        auto r = co_await wait(_cfg.network_probe_interval, phase);
        if (r == ssx::countdown_result::interrupted) {
            co_return network_wait::interrupted;
        }
    }
    if (settle || recovered) {
        auto r = co_await wait(_cfg.network_settle, phase);
        if (r == ssx::countdown_result::interrupted) {
            co_return network_wait::interrupted;
        }
    }
    co_return network_wait::stable;
}

template<class Clock>
ss::future<ssx::countdown_result> orchestrator<Clock>::wait(
  std::chrono::seconds d, phase_fn make_phase, bool pausable) {
    auto r = co_await ssx::countdown<Clock>(
      d, _as, [this, &make_phase, pausable](std::chrono::seconds rem) {
          if (pausable && _pause_requested) {
              return ss::stop_iteration::yes;
          }
          publish(make_phase(rem));
          return ss::stop_iteration::no;
      });
    if (r == ssx::countdown_result::elapsed) {
        publish(make_phase(std::chrono::seconds(0)));
    }
    co_return r;
}

template<class Clock>
ss::future<run_outcome>
orchestrator<Clock>::halt_paused(size_t i, run_outcome outcome) {
    plog(
      upload_log.info,
      "Queue {} paused at item {} ({})",
      _queue.queue_id(),
      i,
      outcome);
    _pause_requested = false;
    _ledger.resume_index = i;
    _ledger.is_paused = true;
    publish(model::phase::paused{});
    co_await _queue.set_status(model::queue_status::paused);
    co_await persist();
    co_return outcome;
}

template<class Clock>
ss::future<>
orchestrator<Clock>::update_item(size_t i, const model::queue_item& item) {
    return _queue.update_item(i, item);
}

template<class Clock>
void orchestrator<Clock>::publish(model::orchestration_phase p) {
    if (p == _phase) {
        return;
    }
    _phase = std::move(p);
    plog(upload_log.trace, "Queue {} phase {}", _queue.queue_id(), _phase);
    _queue.on_phase_change(_phase);
}

template<class Clock>
ss::future<> orchestrator<Clock>::persist() {
    const auto id = _queue.queue_id();
    auto ec = co_await _store.save(id, _ledger);
    if (ec) {
        plog(
          upload_log.warn,
          "Failed to persist ledger of queue {}: {}",
          id,
          ec.message());
    }
}

template<class Clock>
ss::future<> orchestrator<Clock>::persist_cooldown() {
    auto ec = co_await _store.save_cooldown(_cooldown.wall_deadline());
    if (ec) {
        plog(
          upload_log.warn,
          "Failed to persist account cooldown: {}",
          ec.message());
    }
}

template<class Clock>
ss::future<bool> orchestrator<Clock>::account_locked_out() {
    auto fut = co_await ss::coroutine::as_future(
      _remote.is_account_locked_out());
    if (fut.failed()) {
        auto e = fut.get_exception();
        if (ssx::is_shutdown_exception(e)) {
            std::rethrow_exception(e);
        }
        // the next remote call reports whatever is wrong
        plog(
          upload_log.warn,
          "Can't query the account lockout state: {}, assuming unlocked",
          e);
        co_return false;
    }
    co_return fut.get();
}

template class orchestrator<ss::lowres_clock>;
template class orchestrator<ss::manual_clock>;

} // namespace upload
