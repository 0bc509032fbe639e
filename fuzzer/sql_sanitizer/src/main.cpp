// Unless explicitly stated otherwise all files in this repository are
// dual-licensed under the Apache-2.0 License or BSD-3-Clause License.
//
// This product includes software developed at Datadog (https://www.datadoghq.com/).
// Copyright 2025 Datadog, Inc.

#include <cstddef>
#include <cstdint>
#include <cstdlib>
#include <string>
#include <utility>

#include "common/utils.hpp"
#include "config.hpp"
#include "sanitizer.hpp"
#include "tokenizer/sql_lexer.hpp"
#include "writer.hpp"

using namespace sqlsan_fuzz;

extern "C" int LLVMFuzzerTestOneInput(const uint8_t *data, size_t size)
{
    if (size == 0) {
        return 0;
    }

    // The first byte selects the configuration, the rest is the query
    sqlsan::sanitizer_config config;
    config.keep_comments = (data[0] & 0x01) != 0;
    config.keep_insert_rows = (data[0] & 0x02) != 0;

    std::string query{bytes_to_string_view(data + 1, size - 1)};

    auto tokenized = sqlsan::lex(query);
    if (sqlsan::render(tokenized) != query) {
        // Rendering an unsanitized query must reproduce it exactly
        abort();
    }

    auto sanitized = sqlsan::render(sqlsan::sanitize(std::move(tokenized), config));
    prevent_optimization(sanitized);

    return 0;
}
