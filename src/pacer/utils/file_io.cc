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

#include "utils/file_io.h"

#include <seastar/core/coroutine.hh>
#include <seastar/core/file.hh>
#include <seastar/core/fstream.hh>
#include <seastar/core/seastar.hh>

#include <exception>

ss::future<ss::temporary_buffer<char>>
read_fully_tmpbuf(const std::filesystem::path& name) {
    return ss::with_file(
      ss::open_file_dma(name.string(), ss::open_flags::ro), [](ss::file f) {
          return f.size().then([f](uint64_t size) mutable {
              return f.dma_read_bulk<char>(0, size);
          });
      });
}

ss::future<ss::sstring>
read_fully_to_string(const std::filesystem::path& name) {
    auto buf = co_await read_fully_tmpbuf(name);
    co_return ss::sstring(buf.get(), buf.size());
}

ss::future<>
replace_file(const std::filesystem::path& path, ss::sstring contents) {
    static constexpr size_t buf_size = 4096;
    auto tmp = path;
    tmp += ".tmp";
    auto flags = ss::open_flags::wo | ss::open_flags::create
                 | ss::open_flags::truncate;

    auto f = co_await ss::open_file_dma(tmp.string(), flags);
    auto out = co_await ss::make_file_output_stream(std::move(f), buf_size);
    std::exception_ptr err;
    try {
        co_await out.write(contents.data(), contents.size());
        co_await out.flush();
    } catch (...) {
        err = std::current_exception();
    }
    // the stream owns the file, closing it closes both
    co_await out.close();
    if (err) {
        std::rethrow_exception(err);
    }

    co_await ss::rename_file(tmp.string(), path.string());
    co_await ss::sync_directory(path.parent_path().string());
}
