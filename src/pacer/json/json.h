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

#include <seastar/core/sstring.hh>

#include <rapidjson/document.h>
#include <rapidjson/stringbuffer.h>
#include <rapidjson/writer.h>

#include <chrono>
#include <cstdint>
#include <optional>
#include <string_view>

namespace json {

using StringBuffer = rapidjson::StringBuffer;
template<typename OutputStream = StringBuffer>
using Writer = rapidjson::Writer<OutputStream>;
using Document = rapidjson::Document;
using Value = rapidjson::Value;

void rjson_serialize(json::Writer<json::StringBuffer>& w, bool v);
void rjson_serialize(json::Writer<json::StringBuffer>& w, int v);
void rjson_serialize(json::Writer<json::StringBuffer>& w, int64_t v);
void rjson_serialize(json::Writer<json::StringBuffer>& w, uint64_t v);
void rjson_serialize(json::Writer<json::StringBuffer>& w, std::string_view v);
void rjson_serialize(json::Writer<json::StringBuffer>& w, const ss::sstring& v);

/// Durations are written as an integer number of seconds.
void rjson_serialize(
  json::Writer<json::StringBuffer>& w, const std::chrono::seconds& v);

template<typename T>
void rjson_serialize(
  json::Writer<json::StringBuffer>& w, const std::optional<T>& v) {
    if (v.has_value()) {
        rjson_serialize(w, v.value());
    } else {
        w.Null();
    }
}

/// Render a finished writer buffer as a string.
ss::sstring to_sstring(const json::StringBuffer& buf);

} // namespace json
