/*******************************************************************************
 * polarity/vfs/temporary_directory.cpp
 *
 * Part of Project Polarity
 *
 * Copyright (C) 2015 Alexander Noe <aleexnoe@gmail.com>
 * Copyright (C) 2015-2016 Timo Bingmann <tb@panthema.net>
 *
 * All rights reserved. Published under the BSD-2 license in the LICENSE file.
 ******************************************************************************/

#include <polarity/vfs/temporary_directory.hpp>

#include <polarity/common/logger.hpp>
#include <polarity/common/system_exception.hpp>
#include <polarity/vfs/file_io.hpp>

#include <stdlib.h>

#include <string>
#include <vector>

namespace polarity {
namespace vfs {

std::string TemporaryDirectory::make_directory(const char* sample) {

    std::string tmp_dir = std::string(sample) + "XXXXXX";
    // mkdtemp replaces the XXXXXX with something unique. it also mkdirs.
    std::vector<char> buf(tmp_dir.begin(), tmp_dir.end());
    buf.push_back(0);
    char* p = mkdtemp(buf.data());

    if (p == nullptr) {
        throw common::ErrnoException(
                  "Could not create temporary directory " + tmp_dir);
    }

    return std::string(p);
}

TemporaryDirectory::~TemporaryDirectory() {
    try {
        RemoveAll(dir_);
    }
    catch (const common::SystemException& e) {
        LOG1 << "Could not remove temporary directory " << dir_
             << ": " << e.what();
    }
}

std::string TemporaryDirectory::WriteFile(
    const std::string& name, const std::vector<std::string>& lines) const {
    std::string file = path(name);
    WriteLines(file, lines);
    return file;
}

} // namespace vfs
} // namespace polarity

/******************************************************************************/
