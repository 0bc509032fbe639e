// Unless explicitly stated otherwise all files in this repository are
// dual-licensed under the Apache-2.0 License or BSD-3-Clause License.
//
// This product includes software developed at Datadog (https://www.datadoghq.com/).
// Copyright 2022 Datadog, Inc.

#pragma once

#include <cstdint>

namespace sqlsan::utf8 {

constexpr uint32_t max_codepoint = 0x10FFFF;
constexpr uint32_t invalid = 0xFFFFFFFF;
constexpr uint32_t eof = 0xFFFFFFFE;

// Returns the length of the code unit sequence starting at the beginning of the
// buffer, 0 if the buffer is empty or -1 if the sequence is not valid UTF-8.
int8_t find_next_code_unit_sequence_length(const char *utf8_buffer, uint64_t length_left);

// Decodes the codepoint at the given position and moves the position past it.
// Invalid sequences consume a single byte and return utf8::invalid.
uint32_t fetch_next_codepoint(const char *utf8_buffer, uint64_t &position, uint64_t length);

} // namespace sqlsan::utf8
