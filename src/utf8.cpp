// Unless explicitly stated otherwise all files in this repository are
// dual-licensed under the Apache-2.0 License or BSD-3-Clause License.
//
// This product includes software developed at Datadog (https://www.datadoghq.com/).
// Copyright 2022 Datadog, Inc.

#include <cstdint>

#include "utf8.hpp"

// NOLINTBEGIN(cppcoreguidelines-avoid-magic-numbers,readability-magic-numbers)
// NOLINTBEGIN(cppcoreguidelines-pro-bounds-pointer-arithmetic)
namespace sqlsan::utf8 {

int8_t find_next_code_unit_sequence_length(const char *utf8_buffer, uint64_t length_left)
{
    if (length_left == 0) {
        return 0;
    }

    // Valid UTF8 has a specific binary format.
    //  If it's a single byte UTF8 character, then it is always of form '0xxxxxxx', where 'x' is any
    //  binary digit. If it's a two byte UTF8 character, then it's always of form '110xxxxx
    //  10xxxxxx'. Similarly for three and four byte UTF8 characters it starts with '1110xxxx' and
    //  '11110xxx' followed by '10xxxxxx' one less times as there are bytes.
    const auto first_byte = static_cast<uint8_t>(utf8_buffer[0]);
    int8_t expected_length = -1;

    // Looking for 0xxxxxxx
    if ((first_byte & 0x80) == 0) {
        return 1;
    }

    if ((first_byte >> 5) == 0x6) {
        // Looking for 110xxxxx
        expected_length = 2;
    } else if ((first_byte >> 4) == 0xe) {
        // Looking for 1110xxxx
        expected_length = 3;
    } else if ((first_byte >> 3) == 0x1e) {
        // Looking for 11110xxx
        expected_length = 4;
    }

    // If we found a valid prefix, we check that it makes sense based on the length left
    if (expected_length < 0 || static_cast<uint64_t>(expected_length) > length_left) {
        return -1;
    }

    for (int8_t i = 1; i < expected_length; ++i) {
        // Every byte in the sequence must be prefixed by 10xxxxxx
        if ((static_cast<uint8_t>(utf8_buffer[i]) >> 6) != 0x2) {
            return -1;
        }
    }

    return expected_length;
}

uint32_t fetch_next_codepoint(const char *utf8_buffer, uint64_t &position, uint64_t length)
{
    if (position >= length) {
        return eof;
    }

    const int8_t next_length =
        find_next_code_unit_sequence_length(&utf8_buffer[position], length - position);
    if (next_length < 0) {
        position += 1;
        return invalid;
    }

    if (next_length == 1) {
        return static_cast<uint8_t>(utf8_buffer[position++]);
    }

    //  NGL = 2, buf = 110xxxxx -> buf & 00011111
    //  NGL = 3, buf = 1110xxxx -> buf & 00001111
    //  NGL = 4, buf = 11110xxx -> buf & 00000111
    uint32_t codepoint =
        static_cast<uint8_t>(utf8_buffer[position]) & (0xFFU >> (next_length + 1));

    // The bytes after the header are formatted like 10xxxxxx, only the last
    // six bits are appended to the codepoint
    for (int8_t i = 1; i < next_length; ++i) {
        codepoint <<= 6;
        codepoint |= static_cast<uint8_t>(utf8_buffer[position + i]) & 0x3FU;
    }

    if (codepoint > max_codepoint) {
        position += 1;
        return invalid;
    }

    position += next_length;
    return codepoint;
}

} // namespace sqlsan::utf8
// NOLINTEND(cppcoreguidelines-pro-bounds-pointer-arithmetic)
// NOLINTEND(cppcoreguidelines-avoid-magic-numbers,readability-magic-numbers)
