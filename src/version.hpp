// Unless explicitly stated otherwise all files in this repository are
// dual-licensed under the Apache-2.0 License or BSD-3-Clause License.
//
// This product includes software developed at Datadog (https://www.datadoghq.com/).
// Copyright 2021 Datadog, Inc.

#pragma once

#include <string_view>

#ifndef SQLSAN_VERSION
#  define SQLSAN_VERSION "0.0.0"
#endif

namespace sqlsan {

constexpr const char *current_version = SQLSAN_VERSION;

} // namespace sqlsan
