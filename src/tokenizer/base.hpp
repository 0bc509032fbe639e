// Unless explicitly stated otherwise all files in this repository are
// dual-licensed under the Apache-2.0 License or BSD-3-Clause License.
//
// This product includes software developed at Datadog (https://www.datadoghq.com/).
// Copyright 2021 Datadog, Inc.

#pragma once

#include <cstdint>
#include <string_view>
#include <vector>

#include "tokenizer/sql_token.hpp"
#include "utf8.hpp"

namespace sqlsan {

// Cursor over the code points of a UTF-8 buffer. Malformed bytes are returned
// one at a time as utf8::invalid so that a cursor never stalls.
class base_tokenizer {
public:
    explicit base_tokenizer(std::string_view str) : buffer_(str) { decode(); }

protected:
    [[nodiscard]] uint32_t peek() const { return current_; }

    [[nodiscard]] uint32_t next() const
    {
        uint64_t position = next_idx_;
        return utf8::fetch_next_codepoint(buffer_.data(), position, buffer_.size());
    }

    bool advance()
    {
        if (idx_ < buffer_.size()) {
            idx_ = next_idx_;
            decode();
        }
        return idx_ < buffer_.size();
    }

    [[nodiscard]] bool eof() const { return idx_ >= buffer_.size(); }

    [[nodiscard]] std::size_t index() const { return idx_; }

    [[nodiscard]] std::string_view substr(std::size_t start, std::size_t end) const
    {
        return buffer_.substr(start, end - start);
    }

    // Adds a token spanning from start to the current index
    void add_token(sql_token_type type, std::size_t start)
    {
        sql_token token;
        token.type = type;
        token.slice = token.source = {start, index()};
        emplace_token(token);
    }

    void emplace_token(const sql_token &token) { tokens_.emplace_back(token); }

    std::string_view buffer_;
    std::vector<sql_token> tokens_{};

private:
    void decode()
    {
        uint64_t position = idx_;
        current_ = utf8::fetch_next_codepoint(buffer_.data(), position, buffer_.size());
        next_idx_ = position;
    }

    std::size_t idx_{0};
    std::size_t next_idx_{0};
    uint32_t current_{utf8::eof};
};

} // namespace sqlsan
