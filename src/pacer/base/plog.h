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

#include "base/source_location.h"

// Prefixes every log line with the basename and line of the call site:
//   plog(upload_log.info, "item {} archived", idx);

// NOLINTNEXTLINE
#define plog_with_ctx(method, fmt, args...)                                    \
    method("{} - " fmt, plog::file_line::current(), ##args)

// NOLINTNEXTLINE
#define plog(method, fmt, args...) plog_with_ctx(method, fmt, ##args)

// NOLINTNEXTLINE
#define plogl(logger, level, fmt, args...)                                     \
    logger.log(level, "{} - " fmt, plog::file_line::current(), ##args)
