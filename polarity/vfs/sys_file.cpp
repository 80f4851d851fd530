/*******************************************************************************
 * polarity/vfs/sys_file.cpp
 *
 * Part of Project Polarity
 *
 * Copyright (C) 2015 Alexander Noe <aleexnoe@gmail.com>
 * Copyright (C) 2015 Timo Bingmann <tb@panthema.net>
 *
 * All rights reserved. Published under the BSD-2 license in the LICENSE file.
 ******************************************************************************/

#include <polarity/vfs/sys_file.hpp>

#include <polarity/common/logger.hpp>
#include <polarity/common/system_exception.hpp>

#include <fcntl.h>
#include <sys/stat.h>
#include <unistd.h>

#include <cerrno>
#include <cstring>
#include <string>

namespace polarity {
namespace vfs {

SysFile SysFile::OpenForRead(const std::string& path) {
    int fd = ::open(path.c_str(), O_RDONLY | O_CLOEXEC, 0);
    if (fd < 0) {
        throw common::ErrnoException("Cannot open file " + path);
    }

    // directories can be opened, but not read.
    struct stat st;
    if (::fstat(fd, &st) != 0) {
        int err = errno;
        ::close(fd);
        throw common::ErrnoException("Cannot stat file " + path, err);
    }
    if (S_ISDIR(st.st_mode)) {
        ::close(fd);
        throw common::ErrnoException("Cannot read file " + path, EISDIR);
    }

    sLOG << "SysFile::OpenForRead(): path" << path << "fd" << fd;
    return SysFile(fd);
}

SysFile SysFile::OpenForWrite(const std::string& path) {
    int fd = ::open(path.c_str(),
                    O_CREAT | O_WRONLY | O_TRUNC | O_CLOEXEC, 0666);
    if (fd < 0) {
        throw common::ErrnoException("Cannot create file " + path);
    }

    sLOG << "SysFile::OpenForWrite(): path" << path << "fd" << fd;
    return SysFile(fd);
}

ssize_t SysFile::write(const void* data, size_t count) {
    assert(fd_ >= 0);
    return ::write(fd_, data, count);
}

ssize_t SysFile::read(void* data, size_t count) {
    assert(fd_ >= 0);
    ssize_t r;
    do {
        r = ::read(fd_, data, count);
    } while (r < 0 && errno == EINTR);
    return r;
}

off_t SysFile::seek(off_t offset) {
    assert(fd_ >= 0);
    return ::lseek(fd_, offset, SEEK_SET);
}

void SysFile::write_all(const void* data, size_t count) {
    const char* cdata = static_cast<const char*>(data);
    while (count > 0) {
        ssize_t w = write(cdata, count);
        if (w < 0) {
            if (errno == EINTR) continue;
            throw common::ErrnoException("Write error");
        }
        cdata += w;
        count -= static_cast<size_t>(w);
    }
}

void SysFile::close() {
    if (fd_ >= 0) {
        sLOG << "SysFile::close(): fd" << fd_;
        if (::close(fd_) != 0)
        {
            LOG1 << "SysFile::close()"
                 << " fd_=" << fd_
                 << " errno=" << errno
                 << " error=" << strerror(errno);
        }
        fd_ = -1;
    }
}

} // namespace vfs
} // namespace polarity

/******************************************************************************/
