/*******************************************************************************
 * polarity/common/logger.hpp
 *
 * Thread naming for the tlx LOG and sLOG macros.
 *
 * Part of Project Polarity
 *
 * Copyright (C) 2015 Timo Bingmann <tb@panthema.net>
 *
 * All rights reserved. Published under the BSD-2 license in the LICENSE file.
 ******************************************************************************/

#pragma once
#ifndef POLARITY_COMMON_LOGGER_HEADER
#define POLARITY_COMMON_LOGGER_HEADER

#include <tlx/logger.hpp>

#include <string>

namespace polarity {
namespace common {

//! Defines a name for the current thread, resets its message counter.
void NameThisThread(const std::string& name);

//! Returns the name of the current thread or 'unknown [id]'
std::string GetNameForThisThread();

/******************************************************************************/

/*!

\brief LOG and sLOG for development and debugging

All components log through the tlx macros \ref LOG and \ref sLOG. Lines are
only printed if the boolean **debug** found in the scope of the macro is true:

\code
class WordSet
{
    static constexpr bool debug = false;

    void Load()
    {
        LOG << "loaded " << size() << " words";

        LOG1 << "This is always printed.";
    }
};
\endcode

Every line is prefixed with the name of the emitting thread (see
NameThisThread()) and a per-thread message counter, such that output of
concurrently running workers can be told apart:

\code
[worker 3 000012] classified 1024 lines
\endcode

Core components never log errors, they throw. Only the pipeline driver and the
command line tool report failures.

 */

} // namespace common
} // namespace polarity

#endif // !POLARITY_COMMON_LOGGER_HEADER

/******************************************************************************/
