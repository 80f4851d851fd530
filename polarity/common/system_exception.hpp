/*******************************************************************************
 * polarity/common/system_exception.hpp
 *
 * Part of Project Polarity
 *
 * Copyright (C) 2015 Timo Bingmann <tb@panthema.net>
 *
 * All rights reserved. Published under the BSD-2 license in the LICENSE file.
 ******************************************************************************/

#pragma once
#ifndef POLARITY_COMMON_SYSTEM_EXCEPTION_HEADER
#define POLARITY_COMMON_SYSTEM_EXCEPTION_HEADER

#include <cerrno>
#include <cstring>
#include <stdexcept>
#include <string>

namespace polarity {
namespace common {

/*!
 * An Exception which is thrown on system errors.
 */
class SystemException : public std::runtime_error
{
public:
    explicit SystemException(const std::string& what)
        : std::runtime_error(what) { }
};

/*!
 * An Exception which is thrown on system errors and contains errno information.
 */
class ErrnoException : public SystemException
{
public:
    ErrnoException(const std::string& what, int _errno)
        : SystemException(
              what + ": [" + std::to_string(_errno) + "] " + strerror(_errno))
    { }

    explicit ErrnoException(const std::string& what)
        : ErrnoException(what, errno) { }
};

/*!
 * Thrown when a word list cannot be opened, read, or decoded. Fatal to the
 * pipeline run which needed the list, never retried.
 */
class ResourceError : public SystemException
{
public:
    ResourceError(const std::string& path, const std::string& reason)
        : SystemException("Cannot load word list " + path + ": " + reason),
          path_(path) { }

    //! path of the word list which failed to load
    const std::string& path() const { return path_; }

private:
    std::string path_;
};

/*!
 * Thrown on invalid configuration values, e.g. a malformed environment
 * variable.
 */
class ConfigError : public std::runtime_error
{
public:
    explicit ConfigError(const std::string& what)
        : std::runtime_error(what) { }
};

} // namespace common
} // namespace polarity

#endif // !POLARITY_COMMON_SYSTEM_EXCEPTION_HEADER

/******************************************************************************/
