// Unless explicitly stated otherwise all files in this repository are
// dual-licensed under the Apache-2.0 License or BSD-3-Clause License.
//
// This product includes software developed at Datadog (https://www.datadoghq.com/).
// Copyright 2021 Datadog, Inc.

#pragma once

#include <cstddef>
#include <cstdint>
#include <string_view>

#include <fmt/core.h> // IWYU pragma: keep

#include "sqlsan.h"

// NOLINTBEGIN(cppcoreguidelines-macro-usage)
constexpr const char *base_name(const char *path)
{
    const char *base = path;
    while (*path != '\0') {
#ifdef _WIN32
        char separator = '\\';
#else
        const char separator = '/';
#endif
        if (*path++ == separator) {
            base = path;
        }
    }
    return base;
}

#define SQLSAN_LOG_HELPER(level, function, file, line, fmt_str, ...)                               \
    {                                                                                              \
        if (sqlsan::logger::valid(level)) {                                                        \
            try {                                                                                  \
                constexpr const char *filename = base_name(file);                                  \
                auto message = fmt::format(fmt_str, ##__VA_ARGS__);                                \
                sqlsan::logger::log(                                                               \
                    level, function, filename, line, message.c_str(), message.size());             \
            } catch (...) {}                                                                       \
        }                                                                                          \
    }

#define SQLSAN_LOG(level, fmt, ...)                                                                \
    SQLSAN_LOG_HELPER(level, __func__, __FILE__, __LINE__, fmt, ##__VA_ARGS__)

#define SQLSAN_TRACE(fmt, ...) SQLSAN_LOG(SQLSAN_LOG_TRACE, fmt, ##__VA_ARGS__)
#define SQLSAN_DEBUG(fmt, ...) SQLSAN_LOG(SQLSAN_LOG_DEBUG, fmt, ##__VA_ARGS__)
#define SQLSAN_INFO(fmt, ...) SQLSAN_LOG(SQLSAN_LOG_INFO, fmt, ##__VA_ARGS__)
#define SQLSAN_WARN(fmt, ...) SQLSAN_LOG(SQLSAN_LOG_WARN, fmt, ##__VA_ARGS__)
#define SQLSAN_ERROR(fmt, ...) SQLSAN_LOG(SQLSAN_LOG_ERROR, fmt, ##__VA_ARGS__)
// NOLINTEND(cppcoreguidelines-macro-usage)

namespace sqlsan {

inline std::string_view log_level_to_str(SQLSAN_LOG_LEVEL level)
{
    switch (level) {
    case SQLSAN_LOG_TRACE:
        return "trace";
    case SQLSAN_LOG_DEBUG:
        return "debug";
    case SQLSAN_LOG_ERROR:
        return "error";
    case SQLSAN_LOG_WARN:
        return "warn";
    case SQLSAN_LOG_INFO:
        return "info";
    case SQLSAN_LOG_OFF:
        break;
    }

    return "off";
}

SQLSAN_LOG_LEVEL log_level_from_str(std::string_view str);

class logger {
public:
    static void init(sqlsan_log_cb cb, SQLSAN_LOG_LEVEL min_level);
    static bool valid(SQLSAN_LOG_LEVEL level) { return cb != nullptr && level >= min_level; }
    static void log(SQLSAN_LOG_LEVEL level, const char *function, const char *file, unsigned line,
        const char *message, size_t length);

private:
    static sqlsan_log_cb cb;
    static SQLSAN_LOG_LEVEL min_level;
};

} // namespace sqlsan
