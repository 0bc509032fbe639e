// Unless explicitly stated otherwise all files in this repository are
// dual-licensed under the Apache-2.0 License or BSD-3-Clause License.
//
// This product includes software developed at Datadog (https://www.datadoghq.com/).
// Copyright 2021 Datadog, Inc.

#pragma once

#include "sqlsan.h"

namespace sqlsan {

struct sanitizer_config {
    // Leave comments untouched instead of stripping them
    bool keep_comments{false};
    // Leave the second and later rows of INSERT ... VALUES untouched
    bool keep_insert_rows{false};

    static sanitizer_config from_c_config(const sqlsan_config *config)
    {
        if (config == nullptr) {
            return {};
        }
        return {config->keep_comments, config->keep_insert_rows};
    }
};

} // namespace sqlsan
