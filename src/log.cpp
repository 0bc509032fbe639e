// Unless explicitly stated otherwise all files in this repository are
// dual-licensed under the Apache-2.0 License or BSD-3-Clause License.
//
// This product includes software developed at Datadog (https://www.datadoghq.com/).
// Copyright 2021 Datadog, Inc.

#include <cstdio>
#include <string_view>

#include "log.hpp"
#include "utils.hpp"

namespace sqlsan {

sqlsan_log_cb logger::cb = nullptr;
SQLSAN_LOG_LEVEL logger::min_level = SQLSAN_LOG_OFF;

void logger::init(sqlsan_log_cb cb, SQLSAN_LOG_LEVEL min_level)
{
    logger::cb = cb;
    logger::min_level = min_level;
}

void logger::log(SQLSAN_LOG_LEVEL level, const char *function, const char *file, unsigned line,
    const char *message, size_t length)
{
    logger::cb(level, function, file, line, message, length);
}

SQLSAN_LOG_LEVEL log_level_from_str(std::string_view str)
{
    if (string_iequals_literal(str, "trace")) {
        return SQLSAN_LOG_TRACE;
    }

    if (string_iequals_literal(str, "debug")) {
        return SQLSAN_LOG_DEBUG;
    }

    if (string_iequals_literal(str, "info")) {
        return SQLSAN_LOG_INFO;
    }

    if (string_iequals_literal(str, "warn")) {
        return SQLSAN_LOG_WARN;
    }

    if (string_iequals_literal(str, "error")) {
        return SQLSAN_LOG_ERROR;
    }

    return SQLSAN_LOG_OFF;
}

} // namespace sqlsan
