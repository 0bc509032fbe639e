// Unless explicitly stated otherwise all files in this repository are
// dual-licensed under the Apache-2.0 License or BSD-3-Clause License.
//
// This product includes software developed at Datadog (https://www.datadoghq.com/).
// Copyright 2021 Datadog, Inc.

#include <cstddef>
#include <cstdint>
#include <memory>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "log.hpp"
#include "regex_utils.hpp"
#include "tokenizer/sql_lexer.hpp"
#include "utf8.hpp"
#include "utils.hpp"

namespace sqlsan {
namespace {

// Words are matched in full, the captured group decides which table to
// look the word up in.
constexpr std::string_view word_regex_str =
    R"((?P<keyword>SELECT|FROM|WHERE|AND|OR|UPDATE|SET|INSERT|INTO|VALUES|INNER|JOIN|ON|LIMIT|OFFSET|BETWEEN|ARRAY)|(?P<logical_operator>IN|NOT|THEN|ELSE|LIKE|ILIKE|RLIKE|GLOB|MATCH|REGEXP)|(?P<indicator>BINARY|DATE|TIME|TIMESTAMP|X|B|N)|(?P<literal>NULL|TRUE|FALSE))";

const re2::RE2 &word_regex()
{
    static const std::unique_ptr<re2::RE2> regex = regex_init(word_regex_str);
    return *regex;
}

bool is_ascii(uint32_t cp) { return cp < 0x80; }

bool is_char(uint32_t cp, char c) { return cp == static_cast<unsigned char>(c); }

// Every valid non-ASCII code point is treated as a letter
bool is_alpha(uint32_t cp)
{
    if (is_ascii(cp)) {
        return isalpha(static_cast<char>(cp));
    }
    return cp != utf8::invalid && cp != utf8::eof;
}

bool is_digit(uint32_t cp) { return is_ascii(cp) && isdigit(static_cast<char>(cp)); }

bool is_newline(uint32_t cp) { return is_char(cp, '\n') || is_char(cp, '\r'); }

bool is_operator_continuation(uint32_t cp)
{
    return is_char(cp, '=') || is_char(cp, '!') || is_char(cp, '>') || is_char(cp, '<');
}

bool is_word_continuation(uint32_t cp)
{
    return is_alpha(cp) || is_digit(cp) || is_char(cp, '_') || is_char(cp, '-');
}

bool is_number_continuation(uint32_t cp)
{
    return is_digit(cp) || is_char(cp, '.') || is_char(cp, 'x') || is_char(cp, 'X') ||
           is_char(cp, 'b') || is_char(cp, 'B');
}

} // namespace

sql_lexer::sql_lexer(std::string_view str) : base_tokenizer(str)
{
    // Compile eagerly so that an invalid expression is reported on construction
    word_regex();
}

std::vector<sql_token> sql_lexer::tokenize()
{
    while (!eof()) {
        const auto c = peek();
        const auto start = index();

        if (!is_ascii(c)) {
            if (is_alpha(c)) {
                tokenize_word();
            } else {
                add_unknown();
            }
            continue;
        }

        switch (static_cast<char>(c)) {
        case '`':
            tokenize_quoted(sql_token_type::backticked, '`');
            break;
        case '\'':
            tokenize_quoted(sql_token_type::single_quoted, '\'');
            break;
        case '"':
            tokenize_quoted(sql_token_type::double_quoted, '"');
            break;
        case '#':
            if (is_char(next(), '>')) {
                tokenize_operator();
            } else {
                tokenize_single_line_comment();
            }
            break;
        case '-': {
            auto n = next();
            if (is_char(n, '-')) {
                tokenize_single_line_comment();
            } else if (is_digit(n)) {
                tokenize_number();
            } else {
                advance();
                add_operator(sql_operator::minus, start);
            }
            break;
        }
        case '/':
            if (is_char(next(), '*')) {
                tokenize_multi_line_comment();
            } else {
                advance();
                add_operator(sql_operator::divide, start);
            }
            break;
        case ' ':
            advance();
            add_token(sql_token_type::space, start);
            break;
        case '\n':
        case '\r':
            advance();
            add_token(sql_token_type::newline, start);
            break;
        case '.':
            advance();
            add_token(sql_token_type::dot, start);
            break;
        case ',':
            advance();
            add_token(sql_token_type::comma, start);
            break;
        case '(':
            advance();
            add_token(sql_token_type::parenthesis_open, start);
            break;
        case ')':
            advance();
            add_token(sql_token_type::parenthesis_close, start);
            break;
        case '[':
            advance();
            add_token(sql_token_type::square_bracket_open, start);
            break;
        case ']':
            advance();
            add_token(sql_token_type::square_bracket_close, start);
            break;
        case ':':
            advance();
            add_token(sql_token_type::colon, start);
            break;
        case ';':
            advance();
            add_token(sql_token_type::semicolon, start);
            break;
        case '?':
            advance();
            add_token(sql_token_type::placeholder, start);
            break;
        case '$':
            if (is_digit(next())) {
                tokenize_numbered_placeholder();
            } else {
                add_unknown();
            }
            break;
        case '*':
            advance();
            if (past_select_) {
                add_token(sql_token_type::wildcard, start);
            } else {
                add_operator(sql_operator::multiply, start);
            }
            break;
        case '%':
            advance();
            add_operator(sql_operator::modulo, start);
            break;
        case '+':
            advance();
            add_operator(sql_operator::plus, start);
            break;
        case '=':
        case '!':
        case '>':
        case '<':
        case '&':
        case '|':
            tokenize_operator();
            break;
        case '_':
            if (is_alpha(next()) || is_digit(next())) {
                tokenize_charset();
            } else {
                add_unknown();
            }
            break;
        default:
            if (is_alpha(c)) {
                tokenize_word();
            } else if (is_digit(c)) {
                tokenize_number();
            } else {
                add_unknown();
            }
            break;
        }
    }

    return std::move(tokens_);
}

void sql_lexer::tokenize_quoted(sql_token_type type, char delimiter)
{
    sql_token token;
    token.type = type;
    token.source.start = index();

    advance();
    token.slice.start = index();

    // A delimiter preceded by an odd number of backslashes is escaped
    std::size_t escape_count = 0;
    bool terminated = false;
    while (!eof()) {
        auto c = peek();
        if (is_char(c, delimiter) && (escape_count % 2) == 0) {
            token.slice.end = index();
            advance();
            terminated = true;
            break;
        }

        if (is_char(c, '\\')) {
            ++escape_count;
        } else {
            escape_count = 0;
        }
        advance();
    }

    if (!terminated) {
        token.slice.end = index();
    }
    token.source.end = index();

    emplace_token(token);
}

void sql_lexer::tokenize_single_line_comment()
{
    const auto start = index();
    while (advance() && !is_newline(peek())) {}
    add_token(sql_token_type::comment, start);
}

void sql_lexer::tokenize_multi_line_comment()
{
    const auto start = index();
    // Skip the opening sequence, its star can't be part of the terminator
    advance();
    advance();

    uint32_t last = 0;
    while (!eof()) {
        auto c = peek();
        advance();
        if (is_char(last, '*') && is_char(c, '/')) {
            break;
        }
        last = c;
    }
    add_token(sql_token_type::comment, start);
}

void sql_lexer::tokenize_numbered_placeholder()
{
    const auto start = index();
    while (advance() && is_digit(peek())) {}
    add_token(sql_token_type::numbered_placeholder, start);
}

void sql_lexer::tokenize_operator()
{
    const auto start = index();
    while (advance() && is_operator_continuation(peek())) {}

    auto str = substr(start, index());
    auto op = symbolic_operator_from_string(str);
    if (op.has_value()) {
        add_operator(*op, start);
        return;
    }

    SQLSAN_DEBUG("Unresolvable operator sequence '{}' at index {}", str, start);

    // The sequence only contains ASCII characters
    for (std::size_t i = start; i < index(); ++i) {
        sql_token token;
        token.type = sql_token_type::unknown;
        token.slice = token.source = {i, i + 1};
        emplace_token(token);
    }
}

void sql_lexer::tokenize_charset()
{
    sql_token token;
    token.type = sql_token_type::literal_type_indicator;
    token.indicator = literal_indicator::charset;
    token.source.start = index();

    advance();
    token.slice.start = index();
    while (!eof() && (is_alpha(peek()) || is_digit(peek()))) { advance(); }
    token.slice.end = token.source.end = index();

    emplace_token(token);
}

void sql_lexer::tokenize_word()
{
    const auto start = index();
    while (advance() && is_word_continuation(peek())) {}

    sql_token token;
    token.type = sql_token_type::keyword;
    token.keyword = sql_keyword::other;
    token.slice = token.source = {start, index()};

    auto str = substr(start, index());
    const re2::StringPiece ref(str.data(), str.size());

    re2::StringPiece keyword;
    re2::StringPiece logical_op;
    re2::StringPiece indicator;
    re2::StringPiece literal;
    if (re2::RE2::FullMatch(ref, word_regex(), &keyword, &logical_op, &indicator, &literal)) {
        // The lookups are ASCII-only, a Unicode case folding match is
        // left as an unrecognised word
        if (!keyword.empty()) {
            auto kw = keyword_from_string(str);
            if (kw.has_value()) {
                token.keyword = *kw;
                if (*kw == sql_keyword::select) {
                    past_select_ = true;
                } else if (*kw == sql_keyword::from) {
                    past_select_ = false;
                }
            }
        } else if (!logical_op.empty()) {
            auto op = logical_operator_from_string(str);
            if (op.has_value()) {
                token.type = sql_token_type::op;
                token.op = *op;
            }
        } else if (!indicator.empty()) {
            auto ind = literal_indicator_from_string(str);
            if (ind.has_value()) {
                token.type = sql_token_type::literal_type_indicator;
                token.indicator = *ind;
            }
        } else if (string_iequals_literal(str, "null")) {
            token.type = sql_token_type::null_literal;
        } else if (string_iequals_literal(str, "true")) {
            token.type = sql_token_type::true_literal;
        } else if (string_iequals_literal(str, "false")) {
            token.type = sql_token_type::false_literal;
        }
    }

    emplace_token(token);
}

void sql_lexer::tokenize_number()
{
    const auto start = index();
    while (advance() && is_number_continuation(peek())) {}

    auto str = substr(start, index());
    if (str == "0x" || str == "0X" || str == "0b" || str == "0B") {
        sql_token token;
        token.type = sql_token_type::literal_type_indicator;
        token.indicator =
            (str[1] == 'x' || str[1] == 'X') ? literal_indicator::zero_x : literal_indicator::zero_b;
        token.slice = token.source = {start, index()};
        emplace_token(token);
        return;
    }

    add_token(sql_token_type::numeric, start);
}

void sql_lexer::add_operator(sql_operator op, std::size_t start)
{
    sql_token token;
    token.type = sql_token_type::op;
    token.op = op;
    token.slice = token.source = {start, index()};
    emplace_token(token);
}

void sql_lexer::add_unknown()
{
    const auto start = index();
    advance();
    add_token(sql_token_type::unknown, start);
}

tokenized_sql lex(std::string text)
{
    std::vector<sql_token> tokens;
    {
        sql_lexer lexer(text);
        tokens = lexer.tokenize();
    }

    SQLSAN_TRACE("Tokenized {} bytes into {} tokens", text.size(), tokens.size());

    // Tokens only store offsets, they remain valid once the buffer is moved
    return tokenized_sql{std::move(text), std::move(tokens)};
}

} // namespace sqlsan
