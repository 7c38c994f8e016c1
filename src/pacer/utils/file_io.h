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
#include <seastar/core/sstring.hh>
#include <seastar/core/temporary_buffer.hh>

#include <filesystem>

/// \brief Read an entire file into a ss::temporary_buffer
ss::future<ss::temporary_buffer<char>>
read_fully_tmpbuf(const std::filesystem::path&);

/// \brief Read an entire file into a ss::sstring
ss::future<ss::sstring> read_fully_to_string(const std::filesystem::path&);

/// \brief Replace the file at `path` with `contents`.
///
/// The data goes to a sibling temporary file which is flushed and renamed
/// over `path`, so readers see either the old or the new contents. The
/// parent directory must exist.
ss::future<>
replace_file(const std::filesystem::path& path, ss::sstring contents);
