// Copyright 2024 Redpanda Data, Inc.
//
// Use of this software is governed by the Business Source License
// included in the file licenses/BSL.md
//
// As of the Change Date specified in that file, in accordance with
// the Business Source License, use of this software will be governed
// by the Apache License, Version 2.0

#include "json/json.h"

namespace json {

void rjson_serialize(json::Writer<json::StringBuffer>& w, bool v) {
    w.Bool(v);
}

void rjson_serialize(json::Writer<json::StringBuffer>& w, int v) { w.Int(v); }

void rjson_serialize(json::Writer<json::StringBuffer>& w, int64_t v) {
    w.Int64(v);
}

void rjson_serialize(json::Writer<json::StringBuffer>& w, uint64_t v) {
    w.Uint64(v);
}

void rjson_serialize(json::Writer<json::StringBuffer>& w, std::string_view v) {
    w.String(v.data(), v.size());
}

void rjson_serialize(
  json::Writer<json::StringBuffer>& w, const ss::sstring& v) {
    w.String(v.data(), v.size());
}

void rjson_serialize(
  json::Writer<json::StringBuffer>& w, const std::chrono::seconds& v) {
    w.Int64(v.count());
}

ss::sstring to_sstring(const json::StringBuffer& buf) {
    return {buf.GetString(), buf.GetSize()};
}

} // namespace json
