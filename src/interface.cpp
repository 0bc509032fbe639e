// Unless explicitly stated otherwise all files in this repository are
// dual-licensed under the Apache-2.0 License or BSD-3-Clause License.
//
// This product includes software developed at Datadog (https://www.datadoghq.com/).
// Copyright 2021 Datadog, Inc.

#include <cstddef>
#include <cstdlib>
#include <cstring>
#include <exception>
#include <string>
#include <string_view>

#include "config.hpp"
#include "log.hpp"
#include "pipeline.hpp"
#include "sqlsan.h"
#include "version.hpp"

using namespace sqlsan;

extern "C" {

char *sqlsan_sanitize(
    const char *query, size_t length, const sqlsan_config *config, size_t *output_length)
{
    if (query == nullptr) {
        SQLSAN_WARN("Tried to sanitize a null query");
        return nullptr;
    }

    try {
        auto sanitized =
            sanitize_text(std::string_view{query, length}, sanitizer_config::from_c_config(config));

        // NOLINTNEXTLINE(cppcoreguidelines-no-malloc,hicpp-no-malloc)
        auto *output = static_cast<char *>(malloc(sanitized.size() + 1));
        if (output == nullptr) {
            SQLSAN_ERROR("Failed to allocate {} bytes for the sanitized query",
                sanitized.size() + 1);
            return nullptr;
        }

        memcpy(output, sanitized.data(), sanitized.size());
        output[sanitized.size()] = '\0';

        if (output_length != nullptr) {
            *output_length = sanitized.size();
        }
        return output;
    } catch (const std::exception &e) {
        SQLSAN_ERROR("{}", e.what());
    } catch (...) {
        SQLSAN_ERROR("unknown exception");
    }

    return nullptr;
}

// NOLINTNEXTLINE(cppcoreguidelines-no-malloc,hicpp-no-malloc)
void sqlsan_free(char *sanitized) { free(sanitized); }

const char *sqlsan_get_version() { return sqlsan::current_version; }

bool sqlsan_set_log_cb(sqlsan_log_cb cb, SQLSAN_LOG_LEVEL min_level)
{
    sqlsan::logger::init(cb, min_level);
    SQLSAN_INFO("Sending log messages to binding, min level {}", log_level_to_str(min_level));
    return true;
}
}
