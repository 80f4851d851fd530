/*******************************************************************************
 * polarity/vfs/sys_file.hpp
 *
 * Part of Project Polarity
 *
 * Copyright (C) 2015 Alexander Noe <aleexnoe@gmail.com>
 * Copyright (C) 2015-2016 Timo Bingmann <tb@panthema.net>
 *
 * All rights reserved. Published under the BSD-2 license in the LICENSE file.
 ******************************************************************************/

#pragma once
#ifndef POLARITY_VFS_SYS_FILE_HEADER
#define POLARITY_VFS_SYS_FILE_HEADER

#include <sys/types.h>

#include <cassert>
#include <string>

namespace polarity {
namespace vfs {

/*!
 * Represents a POSIX system file via its file descriptor.
 */
class SysFile
{
    static constexpr bool debug = false;

public:
    //! default constructor
    SysFile() : fd_(-1) { }

    //! constructor: use OpenForRead or OpenForWrite.
    explicit SysFile(int fd) noexcept
        : fd_(fd) { }

    //! non-copyable: delete copy-constructor
    SysFile(const SysFile&) = delete;
    //! non-copyable: delete assignment operator
    SysFile& operator = (const SysFile&) = delete;
    //! move-constructor
    SysFile(SysFile&& f) noexcept
        : fd_(f.fd_) {
        f.fd_ = -1;
    }
    //! move-assignment
    SysFile& operator = (SysFile&& f) {
        close();
        fd_ = f.fd_;
        f.fd_ = -1;
        return *this;
    }

    ~SysFile() {
        close();
    }

    //! Open file for reading, throws common::ErrnoException on failure.
    static SysFile OpenForRead(const std::string& path);

    //! Create or truncate file for writing, throws common::ErrnoException.
    static SysFile OpenForWrite(const std::string& path);

    //! POSIX write function.
    ssize_t write(const void* data, size_t count);

    //! POSIX read function.
    ssize_t read(void* data, size_t count);

    //! POSIX lseek function from the beginning of the file.
    off_t seek(off_t offset);

    //! Write the whole buffer, retrying partial writes, or throw.
    void write_all(const void* data, size_t count);

    //! close the file descriptor
    void close();

private:
    //! file descriptor
    int fd_ = -1;
};

} // namespace vfs
} // namespace polarity

#endif // !POLARITY_VFS_SYS_FILE_HEADER

/******************************************************************************/
