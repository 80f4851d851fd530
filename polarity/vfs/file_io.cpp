/*******************************************************************************
 * polarity/vfs/file_io.cpp
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

#include <polarity/vfs/file_io.hpp>

#include <polarity/common/logger.hpp>
#include <polarity/vfs/sys_file.hpp>

#include <dirent.h>
#include <glob.h>
#include <sys/stat.h>
#include <unistd.h>

#include <algorithm>
#include <cerrno>
#include <string>
#include <vector>

namespace polarity {
namespace vfs {

static constexpr bool debug = false;

/******************************************************************************/

//! list regular files of a directory, skipping hidden and '_' files.
static void SysListDirectory(const std::string& dir, FileList& filelist) {
    DIR* d = opendir(dir.c_str());
    if (d == nullptr) {
        throw common::ErrnoException("Could not open directory " + dir);
    }

    std::vector<std::string> names;
    struct dirent* de;
    errno = 0;
    while ((de = readdir(d)) != nullptr) {
        if (de->d_name[0] == '.' || de->d_name[0] == '_') continue;
        names.emplace_back(de->d_name);
    }
    int err = errno;
    closedir(d);
    if (err != 0) {
        throw common::ErrnoException("Could not read directory " + dir, err);
    }

    std::sort(names.begin(), names.end());

    for (const std::string& name : names) {
        std::string path = dir + "/" + name;
        struct stat st;
        if (::stat(path.c_str(), &st) != 0) {
            throw common::ErrnoException("Could not stat() file " + path);
        }
        if (!S_ISREG(st.st_mode)) continue;

        FileInfo fi;
        fi.path = path;
        fi.size = static_cast<uint64_t>(st.st_size);
        filelist.emplace_back(fi);
    }
}

//! glob a path and augment the FileList with matching files.
static void SysGlob(const std::string& path, FileList& filelist) {
    glob_t glob_result;
    int r = glob(path.c_str(), GLOB_TILDE, nullptr, &glob_result);

    if (r == GLOB_NOMATCH) {
        globfree(&glob_result);
        return;
    }
    if (r != 0) {
        globfree(&glob_result);
        throw common::ErrnoException("Could not glob path " + path);
    }

    std::vector<std::string> matches;
    for (size_t i = 0; i < glob_result.gl_pathc; ++i)
        matches.emplace_back(glob_result.gl_pathv[i]);
    globfree(&glob_result);

    std::sort(matches.begin(), matches.end());

    for (const std::string& match : matches) {
        struct stat st;
        if (::stat(match.c_str(), &st) != 0) {
            throw common::ErrnoException("Could not stat() file " + match);
        }

        if (S_ISDIR(st.st_mode)) {
            SysListDirectory(match, filelist);
        }
        else if (S_ISREG(st.st_mode)) {
            FileInfo fi;
            fi.path = match;
            fi.size = static_cast<uint64_t>(st.st_size);
            filelist.emplace_back(fi);
        }
    }
}

FileList Glob(const std::vector<std::string>& globlist) {
    FileList filelist;

    // run through globs and collect files. SysGlob() must only fill in the
    // fields "path" and "size" of FileInfo, overall stats are calculated
    // afterwards.
    for (const std::string& path : globlist) {
        if (path.compare(0, 7, "file://") == 0)
            SysGlob(path.substr(7), filelist);
        else
            SysGlob(path, filelist);
    }

    // calculate exclusive prefix sum and overall stats

    filelist.total_size = 0;
    uint64_t size_ex_psum = 0;

    for (FileInfo& fi : filelist) {
        fi.size_ex_psum = size_ex_psum;
        size_ex_psum += fi.size;
    }
    filelist.total_size = size_ex_psum;

    sLOG << "Glob: found" << filelist.size() << "files with"
         << filelist.total_size << "bytes";

    return filelist;
}

FileList Glob(const std::string& glob) {
    return Glob(std::vector<std::string>{ glob });
}

/******************************************************************************/

bool PathExists(const std::string& path) {
    struct stat st;
    return ::lstat(path.c_str(), &st) == 0;
}

void RemoveAll(const std::string& path) {
    struct stat st;
    if (::lstat(path.c_str(), &st) != 0) {
        if (errno == ENOENT) return;
        throw common::ErrnoException("Could not stat() path " + path);
    }

    if (!S_ISDIR(st.st_mode)) {
        if (::unlink(path.c_str()) != 0)
            throw common::ErrnoException("Could not unlink file " + path);
        return;
    }

    DIR* d = opendir(path.c_str());
    if (d == nullptr) {
        throw common::ErrnoException("Could not open directory " + path);
    }

    std::vector<std::string> entries;
    struct dirent* de;
    while ((de = readdir(d)) != nullptr) {
        std::string name = de->d_name;
        if (name == "." || name == "..") continue;
        entries.emplace_back(path + "/" + name);
    }
    closedir(d);

    for (const std::string& entry : entries)
        RemoveAll(entry);

    if (::rmdir(path.c_str()) != 0) {
        throw common::ErrnoException("Could not remove directory " + path);
    }

    sLOG << "RemoveAll: removed" << path;
}

void MakeDirectory(const std::string& path) {
    if (::mkdir(path.c_str(), 0777) != 0) {
        throw common::ErrnoException("Could not create directory " + path);
    }
}

std::string ReadFileContents(const std::string& path) {
    SysFile file = SysFile::OpenForRead(path);

    std::string contents;
    char buffer[64 * 1024];

    while (true) {
        ssize_t rb = file.read(buffer, sizeof(buffer));
        if (rb < 0) {
            throw common::ErrnoException("Read error on " + path);
        }
        if (rb == 0) break;
        contents.append(buffer, static_cast<size_t>(rb));
    }

    return contents;
}

void WriteLines(const std::string& path, const std::vector<std::string>& lines) {
    SysFile file = SysFile::OpenForWrite(path);

    std::string buffer;
    for (const std::string& line : lines) {
        buffer += line;
        buffer += '\n';
    }
    file.write_all(buffer.data(), buffer.size());
}

} // namespace vfs
} // namespace polarity

/******************************************************************************/
