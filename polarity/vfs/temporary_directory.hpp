/*******************************************************************************
 * polarity/vfs/temporary_directory.hpp
 *
 * Part of Project Polarity
 *
 * Copyright (C) 2015 Alexander Noe <aleexnoe@gmail.com>
 * Copyright (C) 2015-2016 Timo Bingmann <tb@panthema.net>
 *
 * All rights reserved. Published under the BSD-2 license in the LICENSE file.
 ******************************************************************************/

#pragma once
#ifndef POLARITY_VFS_TEMPORARY_DIRECTORY_HEADER
#define POLARITY_VFS_TEMPORARY_DIRECTORY_HEADER

#include <string>
#include <vector>

namespace polarity {
namespace vfs {

/*!
 * A class which creates a temporary directory in the current directory and
 * returns it via get(). When the object is destroyed the temporary directory
 * and everything in it is removed.
 */
class TemporaryDirectory
{
public:
    //! Create a temporary directory, returns its name without trailing /.
    static std::string make_directory(const char* sample = "polarity-testsuite-");

    TemporaryDirectory()
        : dir_(make_directory())
    { }

    ~TemporaryDirectory();

    //! non-copyable: delete copy-constructor
    TemporaryDirectory(const TemporaryDirectory&) = delete;
    //! non-copyable: delete assignment operator
    TemporaryDirectory& operator = (const TemporaryDirectory&) = delete;

    //! return the temporary directory name
    const std::string& get() const { return dir_; }

    //! return path of name inside the temporary directory
    std::string path(const std::string& name) const {
        return dir_ + "/" + name;
    }

    //! write a file with the given lines into the directory, returns its path.
    std::string WriteFile(const std::string& name,
                          const std::vector<std::string>& lines) const;

private:
    std::string dir_;
};

} // namespace vfs
} // namespace polarity

#endif // !POLARITY_VFS_TEMPORARY_DIRECTORY_HEADER

/******************************************************************************/
