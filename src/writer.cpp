// Unless explicitly stated otherwise all files in this repository are
// dual-licensed under the Apache-2.0 License or BSD-3-Clause License.
//
// This product includes software developed at Datadog (https://www.datadoghq.com/).
// Copyright 2021 Datadog, Inc.

#include <string>
#include <string_view>

#include "writer.hpp"

namespace sqlsan {
namespace {

void render_quoted(
    const tokenized_sql &sql, const sql_token &token, char delimiter, std::string &output)
{
    output.append(1, delimiter);
    output.append(sql.buffer_content(token.slice));
    // Unterminated quotes end with their content
    if (token.source.end > token.slice.end) {
        output.append(1, delimiter);
    }
}

} // namespace

void render_token(const tokenized_sql &sql, const sql_token &token, std::string &output)
{
    switch (token.type) {
    case sql_token_type::tombstone:
        break;
    case sql_token_type::placeholder:
        // Placeholders lexed from the input keep their source text
        if (token.source.empty()) {
            output.append(1, '?');
        } else {
            output.append(sql.buffer_content(token.source));
        }
        break;
    case sql_token_type::ellipsis:
        output.append("...");
        break;
    case sql_token_type::backticked:
        render_quoted(sql, token, '`', output);
        break;
    case sql_token_type::double_quoted:
        render_quoted(sql, token, '"', output);
        break;
    case sql_token_type::single_quoted:
        render_quoted(sql, token, '\'', output);
        break;
    case sql_token_type::literal_type_indicator:
        if (token.indicator == literal_indicator::charset) {
            output.append(1, '_');
            output.append(sql.buffer_content(token.slice));
            break;
        }
        output.append(sql.buffer_content(token.source));
        break;
    case sql_token_type::unknown:
    case sql_token_type::space:
    case sql_token_type::newline:
    case sql_token_type::dot:
    case sql_token_type::comma:
    case sql_token_type::parenthesis_open:
    case sql_token_type::parenthesis_close:
    case sql_token_type::square_bracket_open:
    case sql_token_type::square_bracket_close:
    case sql_token_type::colon:
    case sql_token_type::semicolon:
    case sql_token_type::wildcard:
    case sql_token_type::numbered_placeholder:
    case sql_token_type::numeric:
    case sql_token_type::comment:
    case sql_token_type::null_literal:
    case sql_token_type::true_literal:
    case sql_token_type::false_literal:
    case sql_token_type::keyword:
    case sql_token_type::op:
        output.append(sql.buffer_content(token.source));
        break;
    }
}

std::string render(const tokenized_sql &sql)
{
    std::string output;
    output.reserve(sql.buffer().size());

    for (const auto &token : sql.tokens()) { render_token(sql, token, output); }

    return output;
}

} // namespace sqlsan
