// Unless explicitly stated otherwise all files in this repository are
// dual-licensed under the Apache-2.0 License or BSD-3-Clause License.
//
// This product includes software developed at Datadog (https://www.datadoghq.com/).
// Copyright 2021 Datadog, Inc.

#pragma once

#include <cstddef>
#include <string>
#include <string_view>
#include <vector>

#include "tokenizer/base.hpp"
#include "tokenizer/sql_token.hpp"
#include "tokenizer/tokenized_sql.hpp"

namespace sqlsan {

class sql_lexer : protected base_tokenizer {
public:
    explicit sql_lexer(std::string_view str);

    std::vector<sql_token> tokenize();

protected:
    void tokenize_quoted(sql_token_type type, char delimiter);
    void tokenize_single_line_comment();
    void tokenize_multi_line_comment();
    void tokenize_numbered_placeholder();
    void tokenize_operator();
    void tokenize_charset();
    void tokenize_word();
    void tokenize_number();

    void add_operator(sql_operator op, std::size_t start);
    void add_unknown();

    // Decides whether `*` is a wildcard or a multiplication
    bool past_select_{false};
};

// Tokenizes the text and takes ownership of it, never fails
tokenized_sql lex(std::string text);

} // namespace sqlsan
