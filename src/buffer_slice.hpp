// Unless explicitly stated otherwise all files in this repository are
// dual-licensed under the Apache-2.0 License or BSD-3-Clause License.
//
// This product includes software developed at Datadog (https://www.datadoghq.com/).
// Copyright 2026 Datadog, Inc.

#pragma once

#include <cstddef>

namespace sqlsan {

// Half-open byte range [start, end) into the buffer owned by a tokenized_sql
struct buffer_slice {
    std::size_t start{0};
    std::size_t end{0};

    [[nodiscard]] bool empty() const noexcept { return end <= start; }
    [[nodiscard]] std::size_t size() const noexcept { return empty() ? 0 : end - start; }

    bool operator==(const buffer_slice &other) const noexcept = default;
};

} // namespace sqlsan
