/*******************************************************************************
 * tests/common/string_test.cpp
 *
 * Part of Project Polarity
 *
 * Copyright (C) 2015 Timo Bingmann <tb@panthema.net>
 *
 * All rights reserved. Published under the BSD-2 license in the LICENSE file.
 ******************************************************************************/

#include <polarity/common/math.hpp>
#include <polarity/common/string.hpp>
#include <gtest/gtest.h>

#include <string>

using namespace polarity::common;

TEST(String, FormatFixed2) {
    ASSERT_EQ("0.00", FormatFixed2(0.0));
    ASSERT_EQ("1.00", FormatFixed2(1.0));
    ASSERT_EQ("33.33", FormatFixed2(33.33));
    ASSERT_EQ("50.00", FormatFixed2(50.0));
    ASSERT_EQ("-100.00", FormatFixed2(-100.0));
    ASSERT_EQ("1.67", FormatFixed2(1.67));
}

TEST(String, str_snprintf) {
    ASSERT_EQ("abc 42", str_snprintf(32, "%s %d", "abc", 42));
    // truncated to max_size
    ASSERT_EQ("abcd", str_snprintf(4, "%s", "abcdefgh"));
}

TEST(String, IsValidUtf8) {
    ASSERT_TRUE(IsValidUtf8(std::string()));
    ASSERT_TRUE(IsValidUtf8("good\nbad\n"));
    ASSERT_TRUE(IsValidUtf8("caf\xc3\xa9"));
    ASSERT_TRUE(IsValidUtf8("\xe2\x82\xac"));         // euro sign
    ASSERT_TRUE(IsValidUtf8("\xf0\x9f\x98\x80"));     // emoji

    // lone continuation byte
    ASSERT_FALSE(IsValidUtf8("\x80"));
    // truncated sequence
    ASSERT_FALSE(IsValidUtf8("caf\xc3"));
    // overlong encoding of '/'
    ASSERT_FALSE(IsValidUtf8("\xc0\xaf"));
    // UTF-16 surrogate
    ASSERT_FALSE(IsValidUtf8("\xed\xa0\x80"));
    // beyond U+10FFFF
    ASSERT_FALSE(IsValidUtf8("\xf4\x90\x80\x80"));
    // Latin-1 text
    ASSERT_FALSE(IsValidUtf8("gr\xfc\xdf"));
}

TEST(Range, CalculateLocalRange) {
    size_t global_size = 1000;
    for (size_t p = 1; p <= 13; ++p) {
        size_t next_begin = 0;
        for (size_t i = 0; i < p; ++i) {
            Range r = CalculateLocalRange(global_size, p, i);
            ASSERT_EQ(next_begin, r.begin);
            ASSERT_LE(r.begin, r.end);
            next_begin = r.end;
        }
        ASSERT_EQ(global_size, next_begin);
    }

    Range r = CalculateLocalRange(0, 4, 3);
    ASSERT_EQ(r.begin, r.end);
}

/******************************************************************************/
