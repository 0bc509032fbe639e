// Unless explicitly stated otherwise all files in this repository are
// dual-licensed under the Apache-2.0 License or BSD-3-Clause License.
//
// This product includes software developed at Datadog (https://www.datadoghq.com/).
// Copyright 2021 Datadog, Inc.

#pragma once

#include <cstdint>
#include <string>
#include <string_view>
#include <yaml-cpp/yaml.h>

#include "sqlsan.h"
#include "tokenizer/tokenized_sql.hpp"

const char *level_to_str(SQLSAN_LOG_LEVEL level);

void log_cb(SQLSAN_LOG_LEVEL level, const char *function, const char *file, unsigned line,
    const char *message, uint64_t length);

std::string read_file(std::string_view filename);

// Sequence of {type, text} maps, tombstones are omitted
YAML::Node tokens_to_yaml(const sqlsan::tokenized_sql &sql);
