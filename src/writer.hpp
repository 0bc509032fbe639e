// Unless explicitly stated otherwise all files in this repository are
// dual-licensed under the Apache-2.0 License or BSD-3-Clause License.
//
// This product includes software developed at Datadog (https://www.datadoghq.com/).
// Copyright 2021 Datadog, Inc.

#pragma once

#include <string>

#include "tokenizer/sql_token.hpp"
#include "tokenizer/tokenized_sql.hpp"

namespace sqlsan {

// Serialises a single token, appending it to the output
void render_token(const tokenized_sql &sql, const sql_token &token, std::string &output);

std::string render(const tokenized_sql &sql);

} // namespace sqlsan
