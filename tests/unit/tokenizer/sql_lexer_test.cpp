// Unless explicitly stated otherwise all files in this repository are
// dual-licensed under the Apache-2.0 License or BSD-3-Clause License.
//
// This product includes software developed at Datadog (https://www.datadoghq.com/).
// Copyright 2021 Datadog, Inc.

#include <string>
#include <tuple>
#include <utility>
#include <vector>

#include "common/gtest_utils.hpp"
#include "tokenizer/sql_lexer.hpp"
#include "utils.hpp"

using namespace sqlsan;
using namespace sqlsan::test;
using namespace std::literals;

namespace {
using stt = sql_token_type;

std::string str_to_lower(const std::string &str)
{
    std::string lower;
    lower.reserve(str.size());
    for (auto c : str) { lower.push_back(sqlsan::tolower(c)); }
    return lower;
}

TEST(TestSqlLexer, EmptyInput)
{
    auto sql = lex("");
    EXPECT_TRUE(sql.tokens().empty());
    EXPECT_TRUE(sql.buffer().empty());
}

TEST(TestSqlLexer, SingleCharacterTokens)
{
    std::vector<std::pair<std::string, stt>> samples{{" ", stt::space}, {"\n", stt::newline},
        {"\r", stt::newline}, {".", stt::dot}, {",", stt::comma}, {"(", stt::parenthesis_open},
        {")", stt::parenthesis_close}, {"[", stt::square_bracket_open},
        {"]", stt::square_bracket_close}, {":", stt::colon}, {";", stt::semicolon},
        {"?", stt::placeholder}};

    for (const auto &[statement, expected] : samples) {
        auto sql = lex(statement);
        ASSERT_EQ(sql.tokens().size(), 1) << statement;

        const auto &token = sql.tokens()[0];
        EXPECT_EQ(token.type, expected) << statement;
        EXPECT_EQ(token.slice, (buffer_slice{0, 1})) << statement;
        EXPECT_EQ(token.source, (buffer_slice{0, 1})) << statement;
    }
}

TEST(TestSqlLexer, Keywords)
{
    std::vector<std::pair<std::string, sql_keyword>> samples{{"SELECT", sql_keyword::select},
        {"FROM", sql_keyword::from}, {"WHERE", sql_keyword::where},
        {"AND", sql_keyword::logical_and}, {"OR", sql_keyword::logical_or},
        {"UPDATE", sql_keyword::update}, {"SET", sql_keyword::set},
        {"INSERT", sql_keyword::insert}, {"INTO", sql_keyword::into},
        {"VALUES", sql_keyword::values}, {"INNER", sql_keyword::inner},
        {"JOIN", sql_keyword::join}, {"ON", sql_keyword::on}, {"LIMIT", sql_keyword::limit},
        {"OFFSET", sql_keyword::offset}, {"BETWEEN", sql_keyword::between},
        {"ARRAY", sql_keyword::array}};

    for (const auto &[statement, expected] : samples) {
        {
            auto sql = lex(statement);
            ASSERT_EQ(sql.tokens().size(), 1) << statement;
            EXPECT_TRUE(sql.tokens()[0].is(expected)) << statement;
            EXPECT_STR(sql.buffer_content(sql.tokens()[0].source), statement);
        }

        {
            auto lc_statement = str_to_lower(statement);
            auto sql = lex(lc_statement);
            ASSERT_EQ(sql.tokens().size(), 1) << lc_statement;
            EXPECT_TRUE(sql.tokens()[0].is(expected)) << lc_statement;
            EXPECT_STR(sql.buffer_content(sql.tokens()[0].source), lc_statement);
        }
    }
}

TEST(TestSqlLexer, OtherWords)
{
    std::vector<std::string> samples{"table_name", "users", "SELECTED", "a-b", "col1",
        "Ω_a091", "hæld", "UPPERCASE", "jsonb_extract_path", "a-1"};

    for (const auto &statement : samples) {
        auto sql = lex(statement);
        ASSERT_EQ(sql.tokens().size(), 1) << statement;

        const auto &token = sql.tokens()[0];
        EXPECT_TRUE(token.is(sql_keyword::other)) << statement;
        EXPECT_STR(sql.buffer_content(token.slice), statement);
    }
}

TEST(TestSqlLexer, LogicalOperators)
{
    std::vector<std::pair<std::string, sql_operator>> samples{{"IN", sql_operator::in},
        {"NOT", sql_operator::logical_not}, {"THEN", sql_operator::then},
        {"ELSE", sql_operator::logical_else}, {"LIKE", sql_operator::like},
        {"ILIKE", sql_operator::ilike}, {"RLIKE", sql_operator::rlike},
        {"GLOB", sql_operator::glob}, {"MATCH", sql_operator::match},
        {"REGEXP", sql_operator::regexp}};

    for (const auto &[statement, expected] : samples) {
        for (const auto &variant : {statement, str_to_lower(statement)}) {
            auto sql = lex(variant);
            ASSERT_EQ(sql.tokens().size(), 1) << variant;
            EXPECT_TRUE(sql.tokens()[0].is(expected)) << variant;
            EXPECT_EQ(category_of(sql.tokens()[0].op), operator_category::logical) << variant;
        }
    }
}

TEST(TestSqlLexer, SymbolicOperators)
{
    std::vector<std::pair<std::string, sql_operator>> samples{{"+", sql_operator::plus},
        {"-", sql_operator::minus}, {"/", sql_operator::divide}, {"%", sql_operator::modulo},
        {"*", sql_operator::multiply}, {"=", sql_operator::equal},
        {"==", sql_operator::double_equal}, {"<=>", sql_operator::null_safe_equal},
        {">=", sql_operator::greater_than_or_equal}, {"<=", sql_operator::less_than_or_equal},
        {"=>", sql_operator::equal_or_greater_than}, {"=<", sql_operator::equal_or_less_than},
        {"<>", sql_operator::not_equal_arrows}, {"!=", sql_operator::not_equal},
        {">", sql_operator::greater_than}, {"<", sql_operator::less_than},
        {"<<", sql_operator::left_shift}, {">>", sql_operator::right_shift},
        {"&", sql_operator::bitwise_and}, {"|", sql_operator::bitwise_or},
        {"#>", sql_operator::json_path}, {"#>>", sql_operator::json_path_text}};

    for (const auto &[statement, expected] : samples) {
        auto sql = lex(statement);
        ASSERT_EQ(sql.tokens().size(), 1) << statement;
        EXPECT_TRUE(sql.tokens()[0].is(expected)) << statement;
        EXPECT_STR(sql.buffer_content(sql.tokens()[0].source), statement);
    }
}

TEST(TestSqlLexer, UnresolvableOperatorSequence)
{
    std::vector<std::pair<std::string, std::vector<stt>>> samples{
        {"!", {stt::unknown}},
        {"!>", {stt::unknown, stt::unknown}},
        {">>=", {stt::unknown, stt::unknown, stt::unknown}},
        {"a !! c", {stt::keyword, stt::space, stt::unknown, stt::unknown, stt::space, stt::keyword}},
        {"a !! b", {stt::keyword, stt::space, stt::unknown, stt::unknown, stt::space,
                       stt::literal_type_indicator}},
        {"||", {stt::op, stt::op}},
        {"=-", {stt::op, stt::op}},
    };

    for (const auto &[statement, expected] : samples) {
        auto sql = lex(statement);
        EXPECT_EQ(live_token_types(sql), expected) << statement;
    }
}

TEST(TestSqlLexer, WildcardAfterSelect)
{
    {
        auto sql = lex("SELECT * FROM t WHERE a * 2");
        auto types = live_token_types(sql);
        ASSERT_EQ(types.size(), 15);
        EXPECT_EQ(types[2], stt::wildcard);
        EXPECT_TRUE(sql.tokens()[12].is(sql_operator::multiply));
    }

    {
        auto sql = lex("SELECT COUNT(*) FROM t");
        ASSERT_GT(sql.tokens().size(), 4);
        EXPECT_EQ(sql.tokens()[4].type, stt::wildcard);
    }

    {
        auto sql = lex("a * 2");
        ASSERT_EQ(sql.tokens().size(), 5);
        EXPECT_TRUE(sql.tokens()[2].is(sql_operator::multiply));
    }
}

TEST(TestSqlLexer, QuotedTokens)
{
    std::vector<std::tuple<std::string, stt, std::string>> samples{
        {"'secret'", stt::single_quoted, "secret"},
        {R"("name")", stt::double_quoted, "name"},
        {"`table`", stt::backticked, "table"},
        {"''", stt::single_quoted, ""},
        {R"('it\'s')", stt::single_quoted, R"(it\'s)"},
        {R"('a\\')", stt::single_quoted, R"(a\\)"},
        {R"('a\\\'b')", stt::single_quoted, R"(a\\\'b)"},
        {R"("a'b")", stt::double_quoted, "a'b"},
        {"'{obj1,obj2}'", stt::single_quoted, "{obj1,obj2}"},
    };

    for (const auto &[statement, type, content] : samples) {
        auto sql = lex(statement);
        ASSERT_EQ(sql.tokens().size(), 1) << statement;

        const auto &token = sql.tokens()[0];
        EXPECT_EQ(token.type, type) << statement;
        EXPECT_STR(sql.buffer_content(token.slice), content);
        EXPECT_EQ(token.source, (buffer_slice{0, statement.size()})) << statement;
        EXPECT_EQ(token.source.end, token.slice.end + 1) << statement;
    }
}

TEST(TestSqlLexer, UnterminatedQuote)
{
    std::vector<std::pair<std::string, std::string>> samples{{"'secret", "secret"},
        {R"("name)", "name"}, {"`table", "table"}, {"'", ""}, {R"('escaped\')", R"(escaped\')"}};

    for (const auto &[statement, content] : samples) {
        auto sql = lex(statement);
        ASSERT_EQ(sql.tokens().size(), 1) << statement;

        const auto &token = sql.tokens()[0];
        EXPECT_STR(sql.buffer_content(token.slice), content);
        EXPECT_EQ(token.source.end, statement.size()) << statement;
        EXPECT_EQ(token.source.end, token.slice.end) << statement;
    }
}

TEST(TestSqlLexer, Comments)
{
    std::vector<std::string> samples{"# comment", "#", "-- comment", "--", "/* comment */",
        "/* unterminated", "/**/", "/*/ still a comment */", "/* multi\nline */"};

    for (const auto &statement : samples) {
        auto sql = lex(statement);
        ASSERT_EQ(sql.tokens().size(), 1) << statement;

        const auto &token = sql.tokens()[0];
        EXPECT_EQ(token.type, stt::comment) << statement;
        EXPECT_STR(sql.buffer_content(token.slice), statement);
    }
}

TEST(TestSqlLexer, CommentBoundaries)
{
    std::vector<std::pair<std::string, std::vector<stt>>> samples{
        {"-- a\nc", {stt::comment, stt::newline, stt::keyword}},
        {"-- a\nb", {stt::comment, stt::newline, stt::literal_type_indicator}},
        {"# a\r\nc", {stt::comment, stt::newline, stt::newline, stt::keyword}},
        {"/* a */c", {stt::comment, stt::keyword}},
        {"a -- b", {stt::keyword, stt::space, stt::comment}},
        {"a#>c", {stt::keyword, stt::op, stt::keyword}},
        {"a/c", {stt::keyword, stt::op, stt::keyword}},
    };

    for (const auto &[statement, expected] : samples) {
        auto sql = lex(statement);
        EXPECT_EQ(live_token_types(sql), expected) << statement;
    }
}

TEST(TestSqlLexer, NumberedPlaceholder)
{
    {
        auto sql = lex("$1");
        ASSERT_EQ(sql.tokens().size(), 1);
        EXPECT_EQ(sql.tokens()[0].type, stt::numbered_placeholder);
        EXPECT_STR(sql.buffer_content(sql.tokens()[0].slice), "$1");
    }

    {
        auto sql = lex("$123 ");
        ASSERT_EQ(sql.tokens().size(), 2);
        EXPECT_EQ(sql.tokens()[0].type, stt::numbered_placeholder);
        EXPECT_STR(sql.buffer_content(sql.tokens()[0].slice), "$123");
    }

    {
        auto sql = lex("$");
        ASSERT_EQ(sql.tokens().size(), 1);
        EXPECT_EQ(sql.tokens()[0].type, stt::unknown);
    }

    {
        auto sql = lex("$a");
        EXPECT_EQ(live_token_types(sql), (std::vector<stt>{stt::unknown, stt::keyword}));
    }
}

TEST(TestSqlLexer, Numbers)
{
    std::vector<std::string> samples{
        "0", "42", "1.5", "-1", "-1.0", "1.2.3", "0x12", "0b101", "10.", "-0"};

    for (const auto &statement : samples) {
        auto sql = lex(statement);
        ASSERT_EQ(sql.tokens().size(), 1) << statement;

        const auto &token = sql.tokens()[0];
        EXPECT_EQ(token.type, stt::numeric) << statement;
        EXPECT_STR(sql.buffer_content(token.slice), statement);
    }
}

TEST(TestSqlLexer, NegativeNumberLookahead)
{
    std::vector<std::pair<std::string, std::vector<stt>>> samples{
        {"5-1", {stt::numeric, stt::numeric}},
        {"(a)-1", {stt::parenthesis_open, stt::keyword, stt::parenthesis_close, stt::numeric}},
        {"a - 1", {stt::keyword, stt::space, stt::op, stt::space, stt::numeric}},
        {"a -1", {stt::keyword, stt::space, stt::numeric}},
        {"a-1", {stt::keyword}},
        {"-a", {stt::op, stt::keyword}},
    };

    for (const auto &[statement, expected] : samples) {
        auto sql = lex(statement);
        EXPECT_EQ(live_token_types(sql), expected) << statement;
    }

    auto sql = lex("5-1");
    ASSERT_EQ(sql.tokens().size(), 2);
    EXPECT_STR(sql.buffer_content(sql.tokens()[1].slice), "-1");
}

TEST(TestSqlLexer, LiteralTypeIndicators)
{
    std::vector<std::pair<std::string, literal_indicator>> samples{
        {"BINARY", literal_indicator::binary}, {"DATE", literal_indicator::date},
        {"TIME", literal_indicator::time}, {"TIMESTAMP", literal_indicator::timestamp},
        {"X", literal_indicator::x}, {"B", literal_indicator::b}, {"N", literal_indicator::n},
        {"0x", literal_indicator::zero_x}, {"0X", literal_indicator::zero_x},
        {"0b", literal_indicator::zero_b}, {"0B", literal_indicator::zero_b}};

    for (const auto &[statement, expected] : samples) {
        for (const auto &variant : {statement, str_to_lower(statement)}) {
            auto sql = lex(variant);
            ASSERT_EQ(sql.tokens().size(), 1) << variant;
            EXPECT_TRUE(sql.tokens()[0].is(expected)) << variant;
        }
    }
}

TEST(TestSqlLexer, IndicatorFollowedByLiteral)
{
    std::vector<std::pair<std::string, std::vector<stt>>> samples{
        {"x'42'", {stt::literal_type_indicator, stt::single_quoted}},
        {"0x'42'", {stt::literal_type_indicator, stt::single_quoted}},
        {"n'str'", {stt::literal_type_indicator, stt::single_quoted}},
        {"DATE 'str'", {stt::literal_type_indicator, stt::space, stt::single_quoted}},
        {"_utf8'str'", {stt::literal_type_indicator, stt::single_quoted}},
    };

    for (const auto &[statement, expected] : samples) {
        auto sql = lex(statement);
        EXPECT_EQ(live_token_types(sql), expected) << statement;
    }
}

TEST(TestSqlLexer, Charset)
{
    {
        auto sql = lex("_utf8mb4");
        ASSERT_EQ(sql.tokens().size(), 1);

        const auto &token = sql.tokens()[0];
        EXPECT_TRUE(token.is(literal_indicator::charset));
        EXPECT_STR(sql.buffer_content(token.slice), "utf8mb4");
        EXPECT_STR(sql.buffer_content(token.source), "_utf8mb4");
    }

    {
        auto sql = lex("_");
        ASSERT_EQ(sql.tokens().size(), 1);
        EXPECT_EQ(sql.tokens()[0].type, stt::unknown);
    }

    {
        auto sql = lex("_ a");
        EXPECT_EQ(live_token_types(sql), (std::vector<stt>{stt::unknown, stt::space, stt::keyword}));
    }
}

TEST(TestSqlLexer, Literals)
{
    std::vector<std::pair<std::string, stt>> samples{{"NULL", stt::null_literal},
        {"null", stt::null_literal}, {"TRUE", stt::true_literal}, {"true", stt::true_literal},
        {"FALSE", stt::false_literal}, {"False", stt::false_literal}};

    for (const auto &[statement, expected] : samples) {
        auto sql = lex(statement);
        ASSERT_EQ(sql.tokens().size(), 1) << statement;
        EXPECT_EQ(sql.tokens()[0].type, expected) << statement;
    }
}

TEST(TestSqlLexer, UnknownCharacters)
{
    std::vector<std::string> samples{"@", "\t", "{", "}", "^", "~", "\\"};

    for (const auto &statement : samples) {
        auto sql = lex(statement);
        ASSERT_EQ(sql.tokens().size(), 1) << statement;
        EXPECT_EQ(sql.tokens()[0].type, stt::unknown) << statement;
        EXPECT_EQ(sql.tokens()[0].source, (buffer_slice{0, 1})) << statement;
    }
}

TEST(TestSqlLexer, InvalidUtf8)
{
    {
        auto sql = lex("\xff");
        ASSERT_EQ(sql.tokens().size(), 1);
        EXPECT_EQ(sql.tokens()[0].type, stt::unknown);
        EXPECT_EQ(sql.tokens()[0].source, (buffer_slice{0, 1}));
    }

    {
        auto sql = lex("a\xff\xfe c");
        EXPECT_EQ(live_token_types(sql), (std::vector<stt>{stt::keyword, stt::unknown,
                                              stt::unknown, stt::space, stt::keyword}));
    }

    {
        // Truncated multi-byte sequence
        auto sql = lex("'\xc3'");
        ASSERT_EQ(sql.tokens().size(), 1);
        EXPECT_EQ(sql.tokens()[0].type, stt::single_quoted);
        EXPECT_EQ(sql.tokens()[0].slice.size(), 1);
    }
}

TEST(TestSqlLexer, MultiByteCharacters)
{
    {
        auto sql = lex(R"("hæld")");
        ASSERT_EQ(sql.tokens().size(), 1);

        const auto &token = sql.tokens()[0];
        EXPECT_EQ(token.type, stt::double_quoted);
        // Four characters, five bytes
        EXPECT_EQ(token.slice.size(), 5);
        EXPECT_STR(sql.buffer_content(token.slice), "hæld");
    }

    {
        auto sql = lex("'日本' = ñ");
        EXPECT_EQ(live_token_types(sql), (std::vector<stt>{stt::single_quoted, stt::space,
                                              stt::op, stt::space, stt::keyword}));
        EXPECT_EQ(sql.tokens()[0].slice.size(), 6);
        EXPECT_STR(sql.buffer_content(sql.tokens()[4].slice), "ñ");
    }
}

TEST(TestSqlLexer, Statement)
{
    auto sql = lex("SELECT * FROM t WHERE id = 'x';");
    EXPECT_EQ(live_token_types(sql),
        (std::vector<stt>{stt::keyword, stt::space, stt::wildcard, stt::space, stt::keyword,
            stt::space, stt::keyword, stt::space, stt::keyword, stt::space, stt::keyword,
            stt::space, stt::op, stt::space, stt::single_quoted, stt::semicolon}));
}

TEST(TestSqlLexer, SourcesCoverInput)
{
    std::vector<std::string> samples{"SELECT * FROM t WHERE id = 'x';",
        "INSERT INTO t (a) VALUES (1), (2);", "a -- comment\r\nb /* c */ #d", "'unterminated",
        "x'42' _utf8'a' $1 ? <=> !! \xff\xfe hæld", ""};

    for (const auto &statement : samples) {
        auto sql = lex(statement);

        std::size_t expected_start = 0;
        for (const auto &token : sql.tokens()) {
            EXPECT_EQ(token.source.start, expected_start) << statement;
            EXPECT_FALSE(token.source.empty()) << statement;
            expected_start = token.source.end;
        }
        EXPECT_EQ(expected_start, statement.size()) << statement;
    }
}

} // namespace
