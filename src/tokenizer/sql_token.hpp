// Unless explicitly stated otherwise all files in this repository are
// dual-licensed under the Apache-2.0 License or BSD-3-Clause License.
//
// This product includes software developed at Datadog (https://www.datadoghq.com/).
// Copyright 2021 Datadog, Inc.

#pragma once

#include <cstdint>
#include <fmt/format.h>
#include <optional>
#include <ostream>
#include <string_view>

#include "buffer_slice.hpp"

namespace sqlsan {

enum class sql_token_type : uint8_t {
    unknown,
    // Deleted by the sanitizer, renders nothing
    tombstone,
    space,
    newline,
    dot,
    comma,
    parenthesis_open,
    parenthesis_close,
    square_bracket_open,
    square_bracket_close,
    colon,
    semicolon,
    wildcard,
    placeholder,
    numbered_placeholder,
    ellipsis,
    backticked,
    double_quoted,
    single_quoted,
    numeric,
    comment,
    null_literal,
    true_literal,
    false_literal,
    keyword,
    op,
    literal_type_indicator,
};

enum class sql_keyword : uint8_t {
    select,
    from,
    where,
    logical_and,
    logical_or,
    update,
    set,
    insert,
    into,
    values,
    inner,
    join,
    on,
    limit,
    offset,
    between,
    array,
    other,
};

enum class operator_category : uint8_t { arithmetic, logical, comparison, bitwise, json };

enum class sql_operator : uint8_t {
    // Arithmetic
    multiply,
    divide,
    modulo,
    plus,
    minus,
    // Logical
    in,
    logical_not,
    like,
    ilike,
    rlike,
    glob,
    match,
    regexp,
    then,
    logical_else,
    // Comparison
    equal,
    double_equal,
    null_safe_equal,
    greater_than_or_equal,
    less_than_or_equal,
    equal_or_greater_than,
    equal_or_less_than,
    not_equal_arrows,
    not_equal,
    greater_than,
    less_than,
    // Bitwise
    left_shift,
    right_shift,
    bitwise_and,
    bitwise_or,
    // JSON
    json_path,
    json_path_text,
};

enum class literal_indicator : uint8_t {
    binary,
    date,
    time,
    timestamp,
    x,
    zero_x,
    b,
    zero_b,
    n,
    charset,
};

struct sql_token {
    sql_token_type type{sql_token_type::unknown};
    // Content of the token, quotes and the charset underscore excluded
    buffer_slice slice{};
    // Complete text the token was lexed from, empty for synthetic tokens
    buffer_slice source{};
    // Only meaningful for keyword, op and literal_type_indicator tokens
    sql_keyword keyword{sql_keyword::other};
    sql_operator op{sql_operator::equal};
    literal_indicator indicator{literal_indicator::binary};

    [[nodiscard]] bool is(sql_token_type t) const noexcept { return type == t; }
    [[nodiscard]] bool is(sql_keyword kw) const noexcept
    {
        return type == sql_token_type::keyword && keyword == kw;
    }
    [[nodiscard]] bool is(sql_operator o) const noexcept
    {
        return type == sql_token_type::op && op == o;
    }
    [[nodiscard]] bool is(literal_indicator i) const noexcept
    {
        return type == sql_token_type::literal_type_indicator && indicator == i;
    }

    bool operator==(const sql_token &other) const noexcept = default;
};

operator_category category_of(sql_operator op);

// Case-insensitive lookups in the fixed tables, the string must match exactly
std::optional<sql_keyword> keyword_from_string(std::string_view str);
std::optional<sql_operator> logical_operator_from_string(std::string_view str);
std::optional<sql_operator> symbolic_operator_from_string(std::string_view str);
std::optional<literal_indicator> literal_indicator_from_string(std::string_view str);

std::string_view sql_token_type_to_string(sql_token_type type);
std::string_view sql_keyword_to_string(sql_keyword kw);
std::string_view sql_operator_to_string(sql_operator op);
std::string_view literal_indicator_to_string(literal_indicator indicator);

std::ostream &operator<<(std::ostream &os, sql_token_type type);
std::ostream &operator<<(std::ostream &os, sql_keyword kw);
std::ostream &operator<<(std::ostream &os, sql_operator op);
std::ostream &operator<<(std::ostream &os, literal_indicator indicator);

} // namespace sqlsan

template <> struct fmt::formatter<sqlsan::sql_token_type> : fmt::formatter<std::string_view> {
    // Use the parse method from the base class formatter
    template <typename FormatContext>
    auto format(sqlsan::sql_token_type type, FormatContext &ctx) const
    {
        return fmt::formatter<std::string_view>::format(
            sqlsan::sql_token_type_to_string(type), ctx);
    }
};
