// Unless explicitly stated otherwise all files in this repository are
// dual-licensed under the Apache-2.0 License or BSD-3-Clause License.
//
// This product includes software developed at Datadog (https://www.datadoghq.com/).
// Copyright 2021 Datadog, Inc.

#include <cerrno>
#include <fstream>
#include <iostream>
#include <string>
#include <string_view>
#include <system_error>
#include <yaml-cpp/yaml.h>

#include "sqlsan.h"
#include "utils.hpp"
#include "writer.hpp"

const char *level_to_str(SQLSAN_LOG_LEVEL level)
{
    switch (level) {
    case SQLSAN_LOG_TRACE:
        return "trace";
    case SQLSAN_LOG_DEBUG:
        return "debug";
    case SQLSAN_LOG_ERROR:
        return "error";
    case SQLSAN_LOG_WARN:
        return "warn";
    case SQLSAN_LOG_INFO:
        return "info";
    case SQLSAN_LOG_OFF:
        break;
    }

    return "off";
}

void log_cb(SQLSAN_LOG_LEVEL level, const char *function, const char *file, unsigned line,
    const char *message, uint64_t /*length*/)
{
    std::cerr << "[" << level_to_str(level) << "][" << file << ":" << function << ":" << line
              << "]: " << message << '\n';
}

std::string read_file(std::string_view filename)
{
    std::ifstream query_file(filename.data(), std::ios::in | std::ios::binary);
    if (!query_file) {
        throw std::system_error(errno, std::generic_category());
    }

    // Create a buffer equal to the file size
    std::string buffer;
    query_file.seekg(0, std::ios::end);
    buffer.resize(query_file.tellg());
    query_file.seekg(0, std::ios::beg);

    query_file.read(buffer.data(), static_cast<std::streamsize>(buffer.size()));
    query_file.close();
    return buffer;
}

YAML::Node tokens_to_yaml(const sqlsan::tokenized_sql &sql)
{
    YAML::Node output = YAML::Load("[]");
    for (const auto &token : sql.tokens()) {
        if (token.is(sqlsan::sql_token_type::tombstone)) {
            continue;
        }

        std::string text;
        sqlsan::render_token(sql, token, text);

        YAML::Node node;
        node["type"] = std::string{sqlsan::sql_token_type_to_string(token.type)};
        node["text"] = text;
        output.push_back(node);
    }
    return output;
}
