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

#include "base/plog.h"
#include "base/seastarx.h"

#include <seastar/core/coroutine.hh>
#include <seastar/util/log.hh>
#include <seastar/util/tmp_file.hh>

#include <filesystem>

namespace details {
inline ss::logger tmpdir_log("tmpdir");
} // namespace details

/// Scratch directory for tests, created on construction. Call remove()
/// before the object goes away; the destructor does not block.
class temporary_dir {
public:
    static ss::future<temporary_dir> create(const char* test_name) {
        auto path = std::filesystem::temp_directory_path()
                    / fmt::format("{}-XXXX", test_name);
        plog(details::tmpdir_log.debug, "Creating {}", path.native());
        auto dir = co_await ss::make_tmp_dir(path);
        co_return temporary_dir(std::move(dir));
    }

    temporary_dir(temporary_dir&&) noexcept = default;
    temporary_dir& operator=(temporary_dir&&) noexcept = default;
    temporary_dir(const temporary_dir&) = delete;
    temporary_dir& operator=(const temporary_dir&) = delete;
    ~temporary_dir() = default;

    std::filesystem::path get_path() const { return _dir.get_path(); }

    ss::future<> remove() {
        if (_dir.has_path()) {
            plog(
              details::tmpdir_log.debug, "Removing {}", get_path().native());
            co_await _dir.remove();
        }
    }

private:
    explicit temporary_dir(ss::tmp_dir dir)
      : _dir(std::move(dir)) {}

    ss::tmp_dir _dir;
};
