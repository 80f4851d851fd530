/*******************************************************************************
 * polarity/common/string.hpp
 *
 * Some string helper functions
 *
 * Part of Project Polarity
 *
 * Copyright (C) 2015 Timo Bingmann <tb@panthema.net>
 *
 * All rights reserved. Published under the BSD-2 license in the LICENSE file.
 ******************************************************************************/

#pragma once
#ifndef POLARITY_COMMON_STRING_HEADER
#define POLARITY_COMMON_STRING_HEADER

#include <tlx/define.hpp>

#include <cstdarg>
#include <cstdio>
#include <string>
#include <vector>

namespace polarity {
namespace common {

//! ASCII whitespace as used by the tokenizer and the word list trimmer.
static constexpr const char* kWhitespace = " \t\n\r\v\f";

/*!
 * Helper for using sprintf to format into std::string.
 *
 * \param max_size maximum length of output string, longer ones are truncated.
 * \param fmt printf format and additional parameters
 */
std::string str_snprintf(size_t max_size, const char* fmt, ...)
TLX_ATTRIBUTE_FORMAT_PRINTF(2, 3);

//! Format a floating point value with exactly two decimal digits.
std::string FormatFixed2(double value);

//! Returns true if [data, data + size) is a well-formed UTF-8 byte sequence:
//! no overlong forms, no surrogates, no code points beyond U+10FFFF.
bool IsValidUtf8(const char* data, size_t size);

//! Returns true if str is a well-formed UTF-8 byte sequence.
static inline
bool IsValidUtf8(const std::string& str) {
    return IsValidUtf8(str.data(), str.size());
}

} // namespace common
} // namespace polarity

#endif // !POLARITY_COMMON_STRING_HEADER

/******************************************************************************/
