// Unless explicitly stated otherwise all files in this repository are
// dual-licensed under the Apache-2.0 License or BSD-3-Clause License.
//
// This product includes software developed at Datadog (https://www.datadoghq.com/).
// Copyright 2021 Datadog, Inc.

#include <cstdlib>
#include <exception>
#include <functional>
#include <iostream>
#include <map>
#include <string>
#include <string_view>
#include <system_error>
#include <unordered_map>
#include <utility>
#include <vector>
#include <yaml-cpp/emitter.h>
#include <yaml-cpp/yaml.h>

#include "common/utils.hpp"
#include "config.hpp"
#include "log.hpp"
#include "sanitizer.hpp"
#include "sqlsan.h"
#include "tokenizer/sql_lexer.hpp"
#include "writer.hpp"

namespace {
auto parse_args(int argc, char *argv[])
{
    const std::map<std::string, std::string, std::less<>> arg_mapping{{"-f", "--file"},
        {"--file", "--file"}, {"-t", "--tokens"}, {"--tokens", "--tokens"},
        {"--keep-comments", "--keep-comments"}, {"--keep-rows", "--keep-rows"},
        {"-l", "--log-level"}, {"--log-level", "--log-level"}};

    std::unordered_map<std::string, std::vector<std::string>> args;
    auto last_arg = args.end();
    for (int i = 1; i < argc; i++) {
        std::string_view arg = argv[i];
        if (arg.starts_with('-')) {
            if (auto long_arg = arg_mapping.find(arg); long_arg != arg_mapping.end()) {
                arg = long_arg->second;
            } else {
                continue; // Unknown option
            }

            auto [it, res] = args.emplace(arg, std::vector<std::string>{});
            last_arg = it;
        } else if (last_arg != args.end() && last_arg->second.empty() &&
                   (last_arg->first == "--file" || last_arg->first == "--log-level")) {
            last_arg->second.emplace_back(arg);
        } else {
            args["query"].emplace_back(arg);
        }
    }
    return args;
}

void usage(const char *program)
{
    std::cerr << "Usage: " << program
              << " [--tokens] [--keep-comments] [--keep-rows] [--log-level <level>]"
              << " (--file <path> | <query>)\n";
}

} // namespace

int main(int argc, char *argv[])
{
    auto args = parse_args(argc, argv);

    auto level = SQLSAN_LOG_OFF;
    if (auto it = args.find("--log-level"); it != args.end() && !it->second.empty()) {
        level = sqlsan::log_level_from_str(it->second[0]);
    }
    sqlsan_set_log_cb(log_cb, level);

    std::string query;
    if (auto it = args.find("--file"); it != args.end()) {
        if (it->second.empty()) {
            usage(argv[0]);
            return EXIT_FAILURE;
        }

        try {
            query = read_file(it->second[0]);
        } catch (const std::system_error &e) {
            std::cerr << "Failed to read " << it->second[0] << ": " << e.what() << '\n';
            return EXIT_FAILURE;
        }
    } else if (auto it = args.find("query"); it != args.end() && it->second.size() == 1) {
        query = it->second[0];
    } else {
        usage(argv[0]);
        return EXIT_FAILURE;
    }

    sqlsan::sanitizer_config config;
    config.keep_comments = args.contains("--keep-comments");
    config.keep_insert_rows = args.contains("--keep-rows");

    try {
        auto sanitized = sqlsan::sanitize(sqlsan::lex(std::move(query)), config);
        if (args.contains("--tokens")) {
            YAML::Emitter out;
            out << tokens_to_yaml(sanitized);
            std::cout << out.c_str() << '\n';
        } else {
            std::cout << sqlsan::render(sanitized) << '\n';
        }
    } catch (const std::exception &e) {
        std::cerr << "Failed to sanitize query: " << e.what() << '\n';
        return EXIT_FAILURE;
    }

    return EXIT_SUCCESS;
}
