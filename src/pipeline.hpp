// Unless explicitly stated otherwise all files in this repository are
// dual-licensed under the Apache-2.0 License or BSD-3-Clause License.
//
// This product includes software developed at Datadog (https://www.datadoghq.com/).
// Copyright 2021 Datadog, Inc.

#pragma once

#include <string>
#include <string_view>

#include "config.hpp"
#include "sanitizer.hpp"
#include "tokenizer/sql_lexer.hpp"
#include "tokenizer/tokenized_sql.hpp"
#include "writer.hpp"

namespace sqlsan {

// render(sanitize(lex(text)))
std::string sanitize_text(std::string_view text, const sanitizer_config &config = {});

} // namespace sqlsan
