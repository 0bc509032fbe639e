// Unless explicitly stated otherwise all files in this repository are
// dual-licensed under the Apache-2.0 License or BSD-3-Clause License.
//
// This product includes software developed at Datadog (https://www.datadoghq.com/).
// Copyright 2021 Datadog, Inc.

#include <cstddef>
#include <optional>
#include <ostream>
#include <string_view>
#include <utility>
#include <vector>

#include "log.hpp"
#include "sanitizer.hpp"

namespace sqlsan {
namespace {

using state = sanitizer_state;
using action = sanitizer_action;

bool is_sensitive_literal(const sql_token &token)
{
    switch (token.type) {
    case sql_token_type::single_quoted:
    case sql_token_type::double_quoted:
    case sql_token_type::numeric:
    case sql_token_type::null_literal:
    case sql_token_type::true_literal:
    case sql_token_type::false_literal:
        return true;
    default:
        break;
    }
    return false;
}

transition literal_transition(state current, const sql_token &token)
{
    switch (current) {
    case state::after_operator:
    case state::insert_values:
    case state::offset_clause:
    case state::keyword_scope_opened:
    case state::between_clause:
    case state::literal_type_indicator:
        if (token.is(sql_token_type::double_quoted)) {
            return {action::placeholder_unless_qualified, current};
        }
        return {action::placeholder, current};
    case state::scope_opened:
    case state::array_scope_opened:
        return {action::collapse_list, current};
    default:
        break;
    }
    return {action::none, current};
}

sql_token synthetic_token(sql_token_type type)
{
    sql_token token;
    token.type = type;
    return token;
}

bool is_row_separator(const sql_token &token)
{
    return token.is(sql_token_type::comma) || token.is(sql_token_type::space) ||
           token.is(sql_token_type::newline);
}

class token_rewriter {
public:
    explicit token_rewriter(std::vector<sql_token> &tokens) : tokens_(tokens) {}

    [[nodiscard]] std::optional<std::size_t> previous_live(std::size_t pos) const
    {
        while (pos > 0) {
            --pos;
            if (!tokens_[pos].is(sql_token_type::tombstone)) {
                return pos;
            }
        }
        return std::nullopt;
    }

    [[nodiscard]] std::optional<std::size_t> next_live(std::size_t pos) const
    {
        for (++pos; pos < tokens_.size(); ++pos) {
            if (!tokens_[pos].is(sql_token_type::tombstone)) {
                return pos;
            }
        }
        return std::nullopt;
    }

    void tombstone(std::size_t pos) { tokens_[pos] = synthetic_token(sql_token_type::tombstone); }

    void placeholder(std::size_t pos)
    {
        tokens_[pos] = synthetic_token(sql_token_type::placeholder);
        ++replaced;
    }

    void placeholder_unless_qualified(std::size_t pos)
    {
        auto is_dot = [this](std::optional<std::size_t> idx) {
            return idx.has_value() && tokens_[*idx].is(sql_token_type::dot);
        };

        if (is_dot(previous_live(pos)) || is_dot(next_live(pos))) {
            return;
        }
        placeholder(pos);
    }

    // Returns the index of the closing token, which is left untouched
    std::size_t collapse_list(std::size_t pos)
    {
        std::size_t depth = 0;
        std::size_t i = pos + 1;
        for (; i < tokens_.size(); ++i) {
            const auto &token = tokens_[i];
            if (token.is(sql_token_type::parenthesis_open) ||
                token.is(sql_token_type::square_bracket_open)) {
                ++depth;
            } else if (token.is(sql_token_type::parenthesis_close) ||
                       token.is(sql_token_type::square_bracket_close)) {
                if (depth == 0) {
                    break;
                }
                --depth;
            }
            tombstone(i);
        }

        placeholder(pos);
        ++lists_collapsed;
        return i;
    }

    // Returns the index of the last token of the row
    std::size_t collapse_row(std::size_t pos)
    {
        std::size_t depth = 0;
        std::size_t end = pos;
        for (; end < tokens_.size(); ++end) {
            const auto &token = tokens_[end];
            if (token.is(sql_token_type::parenthesis_open)) {
                ++depth;
            } else if (token.is(sql_token_type::parenthesis_close)) {
                if (--depth == 0) {
                    break;
                }
            }
        }

        if (end == tokens_.size()) {
            end = tokens_.size() - 1;
        }

        // Find the token preceding the separators between this row and the previous one
        auto prev = previous_live(pos);
        while (prev.has_value() && is_row_separator(tokens_[*prev])) {
            prev = previous_live(*prev);
        }

        if (prev.has_value() && tokens_[*prev].is(sql_token_type::ellipsis)) {
            for (std::size_t i = *prev + 1; i <= end; ++i) { tombstone(i); }
        } else {
            tokens_[pos] = synthetic_token(sql_token_type::ellipsis);
            for (std::size_t i = pos + 1; i <= end; ++i) { tombstone(i); }
        }

        ++rows_collapsed;
        return end;
    }

    void strip_comment(std::size_t pos)
    {
        tombstone(pos);
        auto prev = previous_live(pos);
        if (prev.has_value() && tokens_[*prev].is(sql_token_type::space)) {
            tombstone(*prev);
        }
        ++comments_stripped;
    }

    std::size_t replaced{0};
    std::size_t lists_collapsed{0};
    std::size_t rows_collapsed{0};
    std::size_t comments_stripped{0};

protected:
    std::vector<sql_token> &tokens_;
};

} // namespace

transition next_transition(state current, const sql_token &token, const sanitizer_config &config)
{
    if (token.is(sql_token_type::tombstone)) {
        return {action::none, current};
    }

    if (token.is(sql_token_type::op)) {
        if (current != state::join_on_clause) {
            return {action::none, state::after_operator};
        }
        // Operators within an ON clause fall through to the last rule
    } else if (token.is(sql_token_type::keyword)) {
        switch (token.keyword) {
        case sql_keyword::values:
            return {action::none, state::insert_values};
        case sql_keyword::on:
            return {action::none, state::join_on_clause};
        case sql_keyword::offset:
            return {action::none, state::offset_clause};
        case sql_keyword::between:
            return {action::none, state::between_clause};
        case sql_keyword::array:
            return {action::none, state::array_clause};
        case sql_keyword::logical_and:
            if (current == state::between_clause) {
                return {action::none, current};
            }
            [[fallthrough]];
        case sql_keyword::logical_or:
            if (current == state::keyword_scope) {
                return {action::none, state::keyword_scope_opened};
            }
            break;
        case sql_keyword::insert:
        case sql_keyword::into:
            return {action::none, current};
        default:
            break;
        }

        if (current == state::keyword_scope_opened) {
            return {action::none, current};
        }
        return {action::none, state::keyword_scope};
    }

    switch (token.type) {
    case sql_token_type::literal_type_indicator:
        return {action::none, state::literal_type_indicator};
    case sql_token_type::parenthesis_open:
        if (current == state::after_operator) {
            return {action::none, state::scope_opened};
        }
        if (current == state::keyword_scope) {
            return {action::none, state::keyword_scope_opened};
        }
        if (current == state::insert_values) {
            return {action::none, current};
        }
        if (current == state::insert_row_closed) {
            if (config.keep_insert_rows) {
                return {action::none, state::insert_values};
            }
            return {action::collapse_row, state::insert_row_closed};
        }
        break;
    case sql_token_type::square_bracket_open:
        if (current == state::array_clause) {
            return {action::none, state::array_scope_opened};
        }
        break;
    case sql_token_type::parenthesis_close:
        if (current == state::insert_values) {
            return {action::none, state::insert_row_closed};
        }
        return {action::none, state::default_state};
    case sql_token_type::square_bracket_close:
        return {action::none, state::default_state};
    case sql_token_type::comma:
        if (current == state::insert_row_closed) {
            return {action::none, current};
        }
        break;
    case sql_token_type::dot:
        if (current == state::join_on_clause) {
            return {action::none, current};
        }
        break;
    case sql_token_type::comment:
        if (config.keep_comments) {
            return {action::none, current};
        }
        return {action::strip_comment, current};
    case sql_token_type::space:
        return {action::none, current};
    default:
        if (is_sensitive_literal(token)) {
            return literal_transition(current, token);
        }
        break;
    }

    if (current == state::insert_values || current == state::keyword_scope_opened) {
        return {action::none, current};
    }
    return {action::none, state::default_state};
}

tokenized_sql sanitize(tokenized_sql sql, const sanitizer_config &config)
{
    auto &tokens = sql.tokens();
    token_rewriter rewriter{tokens};

    auto current = state::default_state;
    for (std::size_t pos = 0; pos < tokens.size(); ++pos) {
        auto [act, next] = next_transition(current, tokens[pos], config);
        current = next;

        switch (act) {
        case action::none:
            break;
        case action::placeholder:
            rewriter.placeholder(pos);
            break;
        case action::placeholder_unless_qualified:
            rewriter.placeholder_unless_qualified(pos);
            break;
        case action::collapse_list:
            // Resume on the closing token so that it resets the state
            pos = rewriter.collapse_list(pos) - 1;
            break;
        case action::collapse_row:
            pos = rewriter.collapse_row(pos);
            break;
        case action::strip_comment:
            rewriter.strip_comment(pos);
            break;
        }
    }

    SQLSAN_TRACE("Sanitized {} tokens: {} replaced, {} lists collapsed, {} rows collapsed, {} "
                 "comments stripped",
        tokens.size(), rewriter.replaced, rewriter.lists_collapsed, rewriter.rows_collapsed,
        rewriter.comments_stripped);

    return sql;
}

std::string_view sanitizer_state_to_string(sanitizer_state value)
{
    switch (value) {
    case state::after_operator:
        return "after_operator";
    case state::scope_opened:
        return "scope_opened";
    case state::insert_values:
        return "insert_values";
    case state::insert_row_closed:
        return "insert_row_closed";
    case state::join_on_clause:
        return "join_on_clause";
    case state::offset_clause:
        return "offset_clause";
    case state::between_clause:
        return "between_clause";
    case state::keyword_scope:
        return "keyword_scope";
    case state::keyword_scope_opened:
        return "keyword_scope_opened";
    case state::array_clause:
        return "array_clause";
    case state::array_scope_opened:
        return "array_scope_opened";
    case state::literal_type_indicator:
        return "literal_type_indicator";
    case state::default_state:
        break;
    }
    return "default";
}

std::string_view sanitizer_action_to_string(sanitizer_action value)
{
    switch (value) {
    case action::placeholder:
        return "placeholder";
    case action::placeholder_unless_qualified:
        return "placeholder_unless_qualified";
    case action::collapse_list:
        return "collapse_list";
    case action::collapse_row:
        return "collapse_row";
    case action::strip_comment:
        return "strip_comment";
    case action::none:
        break;
    }
    return "none";
}

std::ostream &operator<<(std::ostream &os, sanitizer_state value)
{
    return os << sanitizer_state_to_string(value);
}

std::ostream &operator<<(std::ostream &os, sanitizer_action value)
{
    return os << sanitizer_action_to_string(value);
}

} // namespace sqlsan
