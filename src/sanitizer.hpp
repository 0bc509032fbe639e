// Unless explicitly stated otherwise all files in this repository are
// dual-licensed under the Apache-2.0 License or BSD-3-Clause License.
//
// This product includes software developed at Datadog (https://www.datadoghq.com/).
// Copyright 2021 Datadog, Inc.

#pragma once

#include <cstdint>
#include <ostream>
#include <string_view>

#include <fmt/format.h>

#include "config.hpp"
#include "tokenizer/sql_token.hpp"
#include "tokenizer/tokenized_sql.hpp"

namespace sqlsan {

enum class sanitizer_state : uint8_t {
    default_state,
    after_operator,
    scope_opened,
    insert_values,
    insert_row_closed,
    join_on_clause,
    offset_clause,
    between_clause,
    keyword_scope,
    keyword_scope_opened,
    array_clause,
    array_scope_opened,
    literal_type_indicator,
};

enum class sanitizer_action : uint8_t {
    none,
    placeholder,
    // Double quoted tokens next to a dot are identifiers
    placeholder_unless_qualified,
    // Replace the list with a single placeholder up to its closing token
    collapse_list,
    // Replace the row with an ellipsis, merging consecutive rows
    collapse_row,
    strip_comment,
};

struct transition {
    sanitizer_action action{sanitizer_action::none};
    sanitizer_state state{sanitizer_state::default_state};

    bool operator==(const transition &other) const noexcept = default;
};

// Pure decision for a single live token, the caller applies the action
transition next_transition(
    sanitizer_state state, const sql_token &token, const sanitizer_config &config = {});

// Rewrites the tokens in place, the buffer is left untouched
tokenized_sql sanitize(tokenized_sql sql, const sanitizer_config &config = {});

std::string_view sanitizer_state_to_string(sanitizer_state state);
std::string_view sanitizer_action_to_string(sanitizer_action action);

std::ostream &operator<<(std::ostream &os, sanitizer_state state);
std::ostream &operator<<(std::ostream &os, sanitizer_action action);

} // namespace sqlsan

template <> struct fmt::formatter<sqlsan::sanitizer_state> : fmt::formatter<std::string_view> {
    template <typename FormatContext>
    auto format(sqlsan::sanitizer_state state, FormatContext &ctx) const
    {
        return fmt::formatter<std::string_view>::format(
            sqlsan::sanitizer_state_to_string(state), ctx);
    }
};
