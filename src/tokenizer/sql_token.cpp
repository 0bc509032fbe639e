// Unless explicitly stated otherwise all files in this repository are
// dual-licensed under the Apache-2.0 License or BSD-3-Clause License.
//
// This product includes software developed at Datadog (https://www.datadoghq.com/).
// Copyright 2021 Datadog, Inc.

#include <array>
#include <optional>
#include <ostream>
#include <string_view>
#include <utility>

#include "tokenizer/sql_token.hpp"
#include "utils.hpp"

using namespace std::literals;

namespace sqlsan {
namespace {

template <typename T, std::size_t N>
using lookup_table = std::array<std::pair<std::string_view, T>, N>;

constexpr lookup_table<sql_keyword, 17> keywords{{
    {"SELECT"sv, sql_keyword::select},
    {"FROM"sv, sql_keyword::from},
    {"WHERE"sv, sql_keyword::where},
    {"AND"sv, sql_keyword::logical_and},
    {"OR"sv, sql_keyword::logical_or},
    {"UPDATE"sv, sql_keyword::update},
    {"SET"sv, sql_keyword::set},
    {"INSERT"sv, sql_keyword::insert},
    {"INTO"sv, sql_keyword::into},
    {"VALUES"sv, sql_keyword::values},
    {"INNER"sv, sql_keyword::inner},
    {"JOIN"sv, sql_keyword::join},
    {"ON"sv, sql_keyword::on},
    {"LIMIT"sv, sql_keyword::limit},
    {"OFFSET"sv, sql_keyword::offset},
    {"BETWEEN"sv, sql_keyword::between},
    {"ARRAY"sv, sql_keyword::array},
}};

constexpr lookup_table<sql_operator, 10> logical_operators{{
    {"IN"sv, sql_operator::in},
    {"NOT"sv, sql_operator::logical_not},
    {"THEN"sv, sql_operator::then},
    {"ELSE"sv, sql_operator::logical_else},
    {"LIKE"sv, sql_operator::like},
    {"ILIKE"sv, sql_operator::ilike},
    {"RLIKE"sv, sql_operator::rlike},
    {"GLOB"sv, sql_operator::glob},
    {"MATCH"sv, sql_operator::match},
    {"REGEXP"sv, sql_operator::regexp},
}};

constexpr lookup_table<sql_operator, 17> symbolic_operators{{
    // Comparison
    {"<=>"sv, sql_operator::null_safe_equal},
    {">="sv, sql_operator::greater_than_or_equal},
    {"<="sv, sql_operator::less_than_or_equal},
    {"=>"sv, sql_operator::equal_or_greater_than},
    {"=<"sv, sql_operator::equal_or_less_than},
    {"<>"sv, sql_operator::not_equal_arrows},
    {"!="sv, sql_operator::not_equal},
    {"=="sv, sql_operator::double_equal},
    {"="sv, sql_operator::equal},
    {">"sv, sql_operator::greater_than},
    {"<"sv, sql_operator::less_than},
    // Bitwise
    {"<<"sv, sql_operator::left_shift},
    {">>"sv, sql_operator::right_shift},
    {"&"sv, sql_operator::bitwise_and},
    {"|"sv, sql_operator::bitwise_or},
    // JSON
    {"#>"sv, sql_operator::json_path},
    {"#>>"sv, sql_operator::json_path_text},
}};

constexpr lookup_table<literal_indicator, 7> literal_indicators{{
    {"BINARY"sv, literal_indicator::binary},
    {"DATE"sv, literal_indicator::date},
    {"TIME"sv, literal_indicator::time},
    {"TIMESTAMP"sv, literal_indicator::timestamp},
    {"X"sv, literal_indicator::x},
    {"B"sv, literal_indicator::b},
    {"N"sv, literal_indicator::n},
}};

template <typename T, std::size_t N>
std::optional<T> find_ignore_case(const lookup_table<T, N> &table, std::string_view str)
{
    for (const auto &[name, value] : table) {
        if (string_iequals(name, str)) {
            return value;
        }
    }
    return std::nullopt;
}

} // namespace

operator_category category_of(sql_operator op)
{
    switch (op) {
    case sql_operator::multiply:
    case sql_operator::divide:
    case sql_operator::modulo:
    case sql_operator::plus:
    case sql_operator::minus:
        return operator_category::arithmetic;
    case sql_operator::in:
    case sql_operator::logical_not:
    case sql_operator::like:
    case sql_operator::ilike:
    case sql_operator::rlike:
    case sql_operator::glob:
    case sql_operator::match:
    case sql_operator::regexp:
    case sql_operator::then:
    case sql_operator::logical_else:
        return operator_category::logical;
    case sql_operator::left_shift:
    case sql_operator::right_shift:
    case sql_operator::bitwise_and:
    case sql_operator::bitwise_or:
        return operator_category::bitwise;
    case sql_operator::json_path:
    case sql_operator::json_path_text:
        return operator_category::json;
    case sql_operator::equal:
    case sql_operator::double_equal:
    case sql_operator::null_safe_equal:
    case sql_operator::greater_than_or_equal:
    case sql_operator::less_than_or_equal:
    case sql_operator::equal_or_greater_than:
    case sql_operator::equal_or_less_than:
    case sql_operator::not_equal_arrows:
    case sql_operator::not_equal:
    case sql_operator::greater_than:
    case sql_operator::less_than:
        break;
    }
    return operator_category::comparison;
}

std::optional<sql_keyword> keyword_from_string(std::string_view str)
{
    return find_ignore_case(keywords, str);
}

std::optional<sql_operator> logical_operator_from_string(std::string_view str)
{
    return find_ignore_case(logical_operators, str);
}

std::optional<sql_operator> symbolic_operator_from_string(std::string_view str)
{
    for (const auto &[name, value] : symbolic_operators) {
        if (name == str) {
            return value;
        }
    }
    return std::nullopt;
}

std::optional<literal_indicator> literal_indicator_from_string(std::string_view str)
{
    return find_ignore_case(literal_indicators, str);
}

std::string_view sql_token_type_to_string(sql_token_type type)
{
    switch (type) {
    case sql_token_type::tombstone:
        return "tombstone";
    case sql_token_type::space:
        return "space";
    case sql_token_type::newline:
        return "newline";
    case sql_token_type::dot:
        return "dot";
    case sql_token_type::comma:
        return "comma";
    case sql_token_type::parenthesis_open:
        return "parenthesis_open";
    case sql_token_type::parenthesis_close:
        return "parenthesis_close";
    case sql_token_type::square_bracket_open:
        return "square_bracket_open";
    case sql_token_type::square_bracket_close:
        return "square_bracket_close";
    case sql_token_type::colon:
        return "colon";
    case sql_token_type::semicolon:
        return "semicolon";
    case sql_token_type::wildcard:
        return "wildcard";
    case sql_token_type::placeholder:
        return "placeholder";
    case sql_token_type::numbered_placeholder:
        return "numbered_placeholder";
    case sql_token_type::ellipsis:
        return "ellipsis";
    case sql_token_type::backticked:
        return "backticked";
    case sql_token_type::double_quoted:
        return "double_quoted";
    case sql_token_type::single_quoted:
        return "single_quoted";
    case sql_token_type::numeric:
        return "numeric";
    case sql_token_type::comment:
        return "comment";
    case sql_token_type::null_literal:
        return "null_literal";
    case sql_token_type::true_literal:
        return "true_literal";
    case sql_token_type::false_literal:
        return "false_literal";
    case sql_token_type::keyword:
        return "keyword";
    case sql_token_type::op:
        return "operator";
    case sql_token_type::literal_type_indicator:
        return "literal_type_indicator";
    case sql_token_type::unknown:
        break;
    }
    return "unknown";
}

std::string_view sql_keyword_to_string(sql_keyword kw)
{
    for (const auto &[name, value] : keywords) {
        if (value == kw) {
            return name;
        }
    }
    return "other";
}

std::string_view sql_operator_to_string(sql_operator op)
{
    switch (op) {
    case sql_operator::multiply:
        return "*";
    case sql_operator::divide:
        return "/";
    case sql_operator::modulo:
        return "%";
    case sql_operator::plus:
        return "+";
    case sql_operator::minus:
        return "-";
    case sql_operator::in:
        return "IN";
    case sql_operator::logical_not:
        return "NOT";
    case sql_operator::then:
        return "THEN";
    case sql_operator::logical_else:
        return "ELSE";
    case sql_operator::like:
        return "LIKE";
    case sql_operator::ilike:
        return "ILIKE";
    case sql_operator::rlike:
        return "RLIKE";
    case sql_operator::glob:
        return "GLOB";
    case sql_operator::match:
        return "MATCH";
    case sql_operator::regexp:
        return "REGEXP";
    case sql_operator::null_safe_equal:
        return "<=>";
    case sql_operator::greater_than_or_equal:
        return ">=";
    case sql_operator::less_than_or_equal:
        return "<=";
    case sql_operator::equal_or_greater_than:
        return "=>";
    case sql_operator::equal_or_less_than:
        return "=<";
    case sql_operator::not_equal_arrows:
        return "<>";
    case sql_operator::not_equal:
        return "!=";
    case sql_operator::double_equal:
        return "==";
    case sql_operator::equal:
        return "=";
    case sql_operator::greater_than:
        return ">";
    case sql_operator::less_than:
        return "<";
    case sql_operator::left_shift:
        return "<<";
    case sql_operator::right_shift:
        return ">>";
    case sql_operator::bitwise_and:
        return "&";
    case sql_operator::bitwise_or:
        return "|";
    case sql_operator::json_path:
        return "#>";
    case sql_operator::json_path_text:
        break;
    }
    return "#>>";
}

std::string_view literal_indicator_to_string(literal_indicator indicator)
{
    switch (indicator) {
    case literal_indicator::zero_x:
        return "0X";
    case literal_indicator::zero_b:
        return "0B";
    case literal_indicator::charset:
        return "charset";
    default:
        break;
    }

    for (const auto &[name, value] : literal_indicators) {
        if (value == indicator) {
            return name;
        }
    }
    return "";
}

std::ostream &operator<<(std::ostream &os, sql_token_type type)
{
    return os << sql_token_type_to_string(type);
}

std::ostream &operator<<(std::ostream &os, sql_keyword kw)
{
    return os << sql_keyword_to_string(kw);
}

std::ostream &operator<<(std::ostream &os, sql_operator op)
{
    return os << sql_operator_to_string(op);
}

std::ostream &operator<<(std::ostream &os, literal_indicator indicator)
{
    return os << literal_indicator_to_string(indicator);
}

} // namespace sqlsan
