// Unless explicitly stated otherwise all files in this repository are
// dual-licensed under the Apache-2.0 License or BSD-3-Clause License.
//
// This product includes software developed at Datadog (https://www.datadoghq.com/).
// Copyright 2026 Datadog, Inc.

#pragma once

#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "buffer_slice.hpp"
#include "tokenizer/sql_token.hpp"

namespace sqlsan {

// Owns the query buffer and the tokens referencing it. The buffer is never
// modified after construction, the sanitizer only rewrites the tokens.
class tokenized_sql {
public:
    tokenized_sql() = default;
    tokenized_sql(std::string buffer, std::vector<sql_token> tokens)
        : buffer_(std::move(buffer)), tokens_(std::move(tokens))
    {}

    [[nodiscard]] std::string_view buffer() const noexcept { return buffer_; }

    // Empty for inverted or out-of-range slices
    [[nodiscard]] std::string_view buffer_content(buffer_slice slice) const noexcept
    {
        if (slice.start > slice.end || slice.end > buffer_.size()) {
            return {};
        }
        return std::string_view{buffer_}.substr(slice.start, slice.end - slice.start);
    }

    [[nodiscard]] std::vector<sql_token> &tokens() noexcept { return tokens_; }
    [[nodiscard]] const std::vector<sql_token> &tokens() const noexcept { return tokens_; }

protected:
    std::string buffer_;
    std::vector<sql_token> tokens_;
};

inline std::string_view buffer_content(const tokenized_sql &sql, buffer_slice slice) noexcept
{
    return sql.buffer_content(slice);
}

} // namespace sqlsan
