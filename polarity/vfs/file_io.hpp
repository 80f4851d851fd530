/*******************************************************************************
 * polarity/vfs/file_io.hpp
 *
 * File listing and directory helpers for input and output paths
 *
 * Part of Project Polarity
 *
 * Copyright (C) 2015 Alexander Noe <aleexnoe@gmail.com>
 * Copyright (C) 2015-2016 Timo Bingmann <tb@panthema.net>
 *
 * All rights reserved. Published under the BSD-2 license in the LICENSE file.
 ******************************************************************************/

#pragma once
#ifndef POLARITY_VFS_FILE_IO_HEADER
#define POLARITY_VFS_FILE_IO_HEADER

#include <polarity/common/system_exception.hpp>

#include <cstdint>
#include <string>
#include <vector>

namespace polarity {
namespace vfs {

/******************************************************************************/

//! General information of a file.
struct FileInfo {
    //! path to file
    std::string path;
    //! size of file.
    uint64_t    size;
    //! exclusive prefix sum of file sizes.
    uint64_t    size_ex_psum;

    //! inclusive prefix sum of file sizes.
    uint64_t    size_inc_psum() const { return size_ex_psum + size; }
};

//! List of file info and additional overall info.
struct FileList : public std::vector<FileInfo>{
    //! total size of files
    uint64_t total_size = 0;

    //! exclusive prefix sum of file sizes with total_size as sentinel
    uint64_t size_ex_psum(size_t i) const
    { return i < size() ? operator [] (i).size_ex_psum : total_size; }
};

/*!
 * Reads a glob path list and delivers a file list, sizes, and prefixsums (in
 * bytes) for all matching regular files. A directory matched by a glob
 * contributes all regular files inside it, except hidden files and those
 * starting with '_'.
 */
FileList Glob(const std::vector<std::string>& globlist);

//! Glob a single path pattern, see above.
FileList Glob(const std::string& glob);

/******************************************************************************/

//! Returns true if something (file, directory, ...) exists at path.
bool PathExists(const std::string& path);

//! Remove the file or the whole directory tree at path. Missing paths are
//! ignored, all other failures throw common::ErrnoException.
void RemoveAll(const std::string& path);

//! Create a single directory, throws common::ErrnoException on failure.
void MakeDirectory(const std::string& path);

//! Read the whole contents of a file, throws common::ErrnoException.
std::string ReadFileContents(const std::string& path);

//! Create or truncate the file at path and write each line followed by '\n'.
void WriteLines(const std::string& path, const std::vector<std::string>& lines);

} // namespace vfs
} // namespace polarity

#endif // !POLARITY_VFS_FILE_IO_HEADER

/******************************************************************************/
