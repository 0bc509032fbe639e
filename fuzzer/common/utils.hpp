// Unless explicitly stated otherwise all files in this repository are
// dual-licensed under the Apache-2.0 License or BSD-3-Clause License.
//
// This product includes software developed at Datadog (https://www.datadoghq.com/).
// Copyright 2025 Datadog, Inc.

#pragma once

#include <cstddef>
#include <cstdint>
#include <string_view>

namespace sqlsan_fuzz {

inline std::string_view bytes_to_string_view(const uint8_t *data, size_t size)
{
    // NOLINTNEXTLINE(cppcoreguidelines-pro-type-reinterpret-cast)
    return std::string_view{reinterpret_cast<const char *>(data), size};
}

template <typename T> inline void prevent_optimization(T &value)
{
    asm volatile("" : "+m"(value) : : "memory");
}

} // namespace sqlsan_fuzz
