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

#include "upload/progress_ledger.h"

#include "base/plog.h"
#include "json/json.h"
#include "upload/errc.h"
#include "upload/logger.h"

#include <fmt/ostream.h>

#include <ostream>

namespace upload {

namespace {
constexpr int ledger_version = 1;

constexpr const char* version_key = "version";
constexpr const char* current_index_key = "current_index";
constexpr const char* total_key = "total";
constexpr const char* consecutive_key = "consecutive_auto_retries";
constexpr const char* resume_index_key = "resume_index";
constexpr const char* is_paused_key = "is_paused";
} // namespace

std::ostream& operator<<(std::ostream& o, const progress_ledger& l) {
    fmt::print(
      o,
      "{{current_index: {}, total: {}, consecutive_auto_retries: {}, "
      "resume_index: {}, is_paused: {}}}",
      l.current_index,
      l.total,
      l.consecutive_auto_retries,
      l.resume_index.has_value() ? fmt::to_string(l.resume_index.value())
                                 : "none",
      l.is_paused);
    return o;
}

ss::sstring ledger_to_json(const progress_ledger& ledger) {
    json::StringBuffer buf;
    json::Writer<json::StringBuffer> w(buf);
    w.StartObject();
    w.Key(version_key);
    json::rjson_serialize(w, ledger_version);
    w.Key(current_index_key);
    json::rjson_serialize(w, uint64_t(ledger.current_index));
    w.Key(total_key);
    json::rjson_serialize(w, uint64_t(ledger.total));
    w.Key(consecutive_key);
    json::rjson_serialize(w, ledger.consecutive_auto_retries);
    w.Key(resume_index_key);
    if (ledger.resume_index.has_value()) {
        json::rjson_serialize(w, uint64_t(ledger.resume_index.value()));
    } else {
        w.Null();
    }
    w.Key(is_paused_key);
    json::rjson_serialize(w, ledger.is_paused);
    w.EndObject();
    return json::to_sstring(buf);
}

result<progress_ledger> ledger_from_json(std::string_view doc) {
    json::Document d;
    d.Parse(doc.data(), doc.size());
    if (d.HasParseError() || !d.IsObject()) {
        plog(upload_log.warn, "Ledger is not a JSON object");
        return errc::ledger_corrupted;
    }

    auto uint_field = [&d](const char* key) -> std::optional<uint64_t> {
        auto it = d.FindMember(key);
        if (it == d.MemberEnd() || !it->value.IsUint64()) {
            return std::nullopt;
        }
        return it->value.GetUint64();
    };

    auto version = uint_field(version_key);
    if (!version.has_value() || version.value() != ledger_version) {
        plog(upload_log.warn, "Unsupported ledger version");
        return errc::ledger_corrupted;
    }

    auto current = uint_field(current_index_key);
    auto total = uint_field(total_key);
    auto consecutive = uint_field(consecutive_key);
    auto paused = d.FindMember(is_paused_key);
    auto resume = d.FindMember(resume_index_key);
    if (
      !current || !total || !consecutive || paused == d.MemberEnd()
      || !paused->value.IsBool() || resume == d.MemberEnd()
      || !(resume->value.IsNull() || resume->value.IsUint64())) {
        plog(upload_log.warn, "Ledger is missing fields");
        return errc::ledger_corrupted;
    }

    progress_ledger ledger{
      .current_index = current.value(),
      .total = total.value(),
      .consecutive_auto_retries = static_cast<int>(consecutive.value()),
      .is_paused = paused->value.GetBool(),
    };
    if (!resume->value.IsNull()) {
        ledger.resume_index = resume->value.GetUint64();
    }
    return ledger;
}

} // namespace upload
