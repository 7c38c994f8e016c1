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

#include "upload/ledger_store.h"

#include "base/plog.h"
#include "json/json.h"
#include "upload/errc.h"
#include "upload/logger.h"
#include "utils/file_io.h"

#include <seastar/core/coroutine.hh>
#include <seastar/core/seastar.hh>

#include <fmt/format.h>

#include <exception>

namespace upload {

namespace {
constexpr const char* deadline_key = "deadline_ms";

ss::sstring cooldown_to_json(
  std::optional<ledger_api::wall_time_point> deadline) {
    json::StringBuffer buf;
    json::Writer<json::StringBuffer> w(buf);
    w.StartObject();
    w.Key(deadline_key);
    if (deadline.has_value()) {
        auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
          deadline->time_since_epoch());
        json::rjson_serialize(w, int64_t(ms.count()));
    } else {
        w.Null();
    }
    w.EndObject();
    return json::to_sstring(buf);
}
} // namespace

file_ledger_store::file_ledger_store(std::filesystem::path dir)
  : _dir(std::move(dir)) {}

ss::future<> file_ledger_store::start() {
    plog(upload_log.debug, "Using ledger directory {}", _dir.native());
    co_await ss::recursive_touch_directory(_dir.string());
}

std::filesystem::path
file_ledger_store::ledger_path(const ss::sstring& queue_id) const {
    return _dir / fmt::format("{}.ledger.json", queue_id);
}

std::filesystem::path file_ledger_store::cooldown_path() const {
    return _dir / "cooldown.json";
}

ss::future<result<ss::sstring>>
file_ledger_store::read(std::filesystem::path p) {
    if (!co_await ss::file_exists(p.string())) {
        co_return errc::ledger_not_found;
    }
    try {
        co_return co_await read_fully_to_string(p);
    } catch (const std::system_error& e) {
        plog(
          upload_log.error, "Failed to read {}: {}", p.native(), e.what());
    }
    co_return errc::ledger_io_error;
}

ss::future<std::error_code>
file_ledger_store::write(std::filesystem::path p, ss::sstring s) {
    try {
        co_await replace_file(p, std::move(s));
        co_return errc::success;
    } catch (const std::system_error& e) {
        plog(
          upload_log.error, "Failed to write {}: {}", p.native(), e.what());
    }
    co_return errc::ledger_io_error;
}

ss::future<std::error_code> file_ledger_store::save(
  const ss::sstring& queue_id, const progress_ledger& ledger) {
    plog(upload_log.trace, "Saving ledger of {}: {}", queue_id, ledger);
    return write(ledger_path(queue_id), ledger_to_json(ledger));
}

ss::future<result<progress_ledger>>
file_ledger_store::load(const ss::sstring& queue_id) {
    auto doc = co_await read(ledger_path(queue_id));
    if (doc.has_error()) {
        co_return doc.error();
    }
    co_return ledger_from_json(doc.value());
}

ss::future<std::error_code>
file_ledger_store::remove(const ss::sstring& queue_id) {
    auto p = ledger_path(queue_id);
    if (!co_await ss::file_exists(p.string())) {
        co_return errc::success;
    }
    try {
        co_await ss::remove_file(p.string());
        co_return errc::success;
    } catch (const std::system_error& e) {
        plog(
          upload_log.error, "Failed to remove {}: {}", p.native(), e.what());
    }
    co_return errc::ledger_io_error;
}

ss::future<std::error_code> file_ledger_store::save_cooldown(
  std::optional<wall_time_point> deadline) {
    return write(cooldown_path(), cooldown_to_json(deadline));
}

ss::future<result<ledger_api::wall_time_point>>
file_ledger_store::load_cooldown() {
    auto doc = co_await read(cooldown_path());
    if (doc.has_error()) {
        co_return doc.error();
    }
    json::Document d;
    d.Parse(doc.value().data(), doc.value().size());
    if (d.HasParseError() || !d.IsObject() || !d.HasMember(deadline_key)) {
        plog(upload_log.warn, "Malformed {}", cooldown_path().native());
        co_return errc::ledger_corrupted;
    }
    const auto& v = d[deadline_key];
    if (v.IsNull()) {
        co_return errc::ledger_not_found;
    }
    if (!v.IsInt64()) {
        co_return errc::ledger_corrupted;
    }
    co_return wall_time_point(
      std::chrono::duration_cast<wall_time_point::duration>(
        std::chrono::milliseconds(v.GetInt64())));
}

} // namespace upload
