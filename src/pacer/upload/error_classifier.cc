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

#include "upload/error_classifier.h"

#include <seastar/core/timed_out_error.hh>

#include <absl/algorithm/container.h>
#include <absl/strings/ascii.h>
#include <absl/strings/match.h>
#include <absl/strings/numbers.h>
#include <absl/strings/str_split.h>
#include <absl/strings/strip.h>

#include <algorithm>
#include <array>
#include <cerrno>
#include <ostream>
#include <string>

namespace upload {

namespace {

constexpr std::array session_markers{
  std::string_view{"session expired"},
  std::string_view{"session invalid"},
  std::string_view{"please login again"},
};

constexpr std::array bot_markers{
  std::string_view{"challenge"},
  std::string_view{"spam"},
  std::string_view{"login_required"},
  std::string_view{"checkpoint"},
  std::string_view{"bot"},
};

constexpr std::array rejection_markers{
  std::string_view{"aspect ratio"},
  std::string_view{"invalid image"},
  std::string_view{"file format"},
};

constexpr std::array cooldown_context_markers{
  std::string_view{"before uploading"},
  std::string_view{"before upload"},
  std::string_view{"uploading another"},
};

constexpr std::array network_markers{
  std::string_view{"timeout"},
  std::string_view{"timed out"},
  std::string_view{"network"},
  std::string_view{"connection"},
  std::string_view{"offline"},
  std::string_view{"no internet"},
  std::string_view{"unreachable"},
  std::string_view{"could not resolve"},
};

template<size_t N>
bool contains_any(
  std::string_view haystack, const std::array<std::string_view, N>& needles) {
    return absl::c_any_of(needles, [haystack](std::string_view n) {
        return absl::StrContains(haystack, n);
    });
}

bool is_cooldown_message(std::string_view lowered) {
    return absl::StrContains(lowered, "please wait")
           && contains_any(lowered, cooldown_context_markers);
}

} // namespace

std::ostream& operator<<(std::ostream& o, error_kind k) {
    switch (k) {
        using enum error_kind;
    case session_expired:
        return o << "session_expired";
    case bot_detected:
        return o << "bot_detected";
    case item_rejected:
        return o << "item_rejected";
    case cooldown_active:
        return o << "cooldown_active";
    case network_transient:
        return o << "network_transient";
    case generic_transient:
        return o << "generic_transient";
    }
    return o << "unknown";
}

bool is_transport_error(const std::error_code& ec) {
    if (!ec) {
        return false;
    }
    if (
      ec.category() != std::system_category()
      && ec.category() != std::generic_category()) {
        return false;
    }
    switch (ec.value()) {
    case ECONNREFUSED:
    case ENETUNREACH:
    case ENETDOWN:
    case ETIMEDOUT:
    case ECONNRESET:
    case ENOTCONN:
    case ECONNABORTED:
    case EPIPE:
    case EHOSTUNREACH:
    case EHOSTDOWN:
    case ENETRESET:
        return true;
    default:
        return false;
    }
}

error_kind classify(std::string_view message, std::error_code ec) {
    const std::string lowered = absl::AsciiStrToLower(message);
    if (contains_any(lowered, session_markers)) {
        return error_kind::session_expired;
    }
    if (contains_any(lowered, bot_markers)) {
        return error_kind::bot_detected;
    }
    if (contains_any(lowered, rejection_markers)) {
        return error_kind::item_rejected;
    }
    if (is_cooldown_message(lowered)) {
        return error_kind::cooldown_active;
    }
    if (contains_any(lowered, network_markers) || is_transport_error(ec)) {
        return error_kind::network_transient;
    }
    return error_kind::generic_transient;
}

classified_error classify(const std::exception_ptr& e) {
    try {
        std::rethrow_exception(e);
    } catch (const std::system_error& err) {
        return {classify(err.what(), err.code()), err.what()};
    } catch (const ss::timed_out_error& err) {
        return {error_kind::network_transient, err.what()};
    } catch (const std::exception& err) {
        return {classify(err.what()), err.what()};
    } catch (...) {
        return {error_kind::generic_transient, "unknown remote failure"};
    }
}

std::chrono::seconds
parse_cooldown_seconds(std::string_view message, std::chrono::seconds floor) {
    int64_t total = 0;
    for (std::string_view token :
         absl::StrSplit(message, absl::ByAnyChar(" \t\n"), absl::SkipEmpty())) {
        while (!token.empty() && absl::ascii_ispunct(token.back())) {
            token.remove_suffix(1);
        }
        int64_t n = 0;
        if (absl::ConsumeSuffix(&token, "m")) {
            if (absl::SimpleAtoi(token, &n) && n >= 0) {
                total += n * 60;
            }
        } else if (absl::ConsumeSuffix(&token, "s")) {
            if (absl::SimpleAtoi(token, &n) && n >= 0) {
                total += n;
            }
        }
    }
    return std::max(std::chrono::seconds(total), floor);
}

} // namespace upload
