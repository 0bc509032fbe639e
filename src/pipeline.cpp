// Unless explicitly stated otherwise all files in this repository are
// dual-licensed under the Apache-2.0 License or BSD-3-Clause License.
//
// This product includes software developed at Datadog (https://www.datadoghq.com/).
// Copyright 2021 Datadog, Inc.

#include <string>
#include <string_view>

#include "pipeline.hpp"

namespace sqlsan {

std::string sanitize_text(std::string_view text, const sanitizer_config &config)
{
    return render(sanitize(lex(std::string{text}), config));
}

} // namespace sqlsan
