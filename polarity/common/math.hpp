/*******************************************************************************
 * polarity/common/math.hpp
 *
 * Part of Project Polarity
 *
 * Copyright (C) 2013-2015 Timo Bingmann <tb@panthema.net>
 *
 * All rights reserved. Published under the BSD-2 license in the LICENSE file.
 ******************************************************************************/

#pragma once
#ifndef POLARITY_COMMON_MATH_HEADER
#define POLARITY_COMMON_MATH_HEADER

#include <cstddef>
#include <ostream>

namespace polarity {
namespace common {

//! half-open byte or index range [begin,end) assigned to one worker
struct Range {
    Range() = default;
    Range(size_t begin, size_t end) : begin(begin), end(end) { }

    size_t begin = 0;
    size_t end = 0;

    friend std::ostream& operator << (std::ostream& os, const Range& r) {
        return os << '[' << r.begin << ',' << r.end << ')';
    }
};

//! Split [0,global_size) into p nearly equal parts and return part i, with
//! 0 <= i < p. The parts are contiguous and cover the whole range.
static inline Range CalculateLocalRange(
    size_t global_size, size_t p, size_t i) {
    return Range((i * global_size + p - 1) / p,
                 ((i + 1) * global_size + p - 1) / p);
}

} // namespace common
} // namespace polarity

#endif // !POLARITY_COMMON_MATH_HEADER

/******************************************************************************/
