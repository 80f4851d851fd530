/*******************************************************************************
 * polarity/vfs/line_reader.cpp
 *
 * Reads the lines of one byte range of a FileList.
 *
 * Part of Project Polarity
 *
 * Copyright (C) 2015 Alexander Noe <aleexnoe@gmail.com>
 * Copyright (C) 2016 Timo Bingmann <tb@panthema.net>
 *
 * All rights reserved. Published under the BSD-2 license in the LICENSE file.
 ******************************************************************************/

#include <polarity/vfs/line_reader.hpp>

#include <polarity/common/logger.hpp>
#include <polarity/common/system_exception.hpp>

#include <cassert>
#include <string>

namespace polarity {
namespace vfs {

LineReader::LineReader(const FileList& files, const common::Range& range)
    : files_(files), range_(range) {

    if (range_.begin >= range_.end) {
        file_nr_ = files_.size();
        return;
    }

    // skip all files before the range
    while (file_nr_ < files_.size() &&
           files_[file_nr_].size_inc_psum() <= range_.begin) {
        file_nr_++;
    }
    if (file_nr_ >= files_.size()) return;

    size_t offset = range_.begin - files_.size_ex_psum(file_nr_);

    sLOG << "LineReader: opening file" << file_nr_
         << "range" << range_ << "offset" << offset;

    if (offset == 0) {
        OpenFile(0);
        return;
    }

    // start one byte earlier and discard everything up to and including the
    // next line end: the line containing byte offset - 1 belongs to the
    // previous range. A '\n' following a '\r' is skipped by HasNext().
    OpenFile(offset - 1);

    while (true) {
        while (current_ < size_) {
            char c = buffer_[current_++];
            if (c == '\n') return;
            if (c == '\r') {
                skip_lf_ = true;
                return;
            }
        }
        if (!ReadBlock()) return;
    }
}

void LineReader::OpenFile(size_t offset) {
    file_ = SysFile::OpenForRead(files_[file_nr_].path);
    if (offset != 0 && file_.seek(static_cast<off_t>(offset)) < 0) {
        throw common::ErrnoException(
                  "Cannot seek in file " + files_[file_nr_].path);
    }
    offset_ = offset;
    current_ = size_ = 0;
    ReadBlock();
}

bool LineReader::ReadBlock() {
    offset_ += size_;
    current_ = size_ = 0;

    buffer_.resize(read_size);
    ssize_t bytes = file_.read(buffer_.data(), read_size);
    if (bytes < 0) {
        throw common::ErrnoException(
                  "Read error on file " + files_[file_nr_].path);
    }
    size_ = static_cast<size_t>(bytes);
    total_bytes_ += size_;

    LOG << "LineReader: read block containing " << bytes << " bytes.";
    return bytes > 0;
}

bool LineReader::HasNext() {
    while (file_nr_ < files_.size()) {
        // complete a "\r\n" line end, the next line starts after the '\n'
        if (skip_lf_) {
            skip_lf_ = false;
            if ((current_ < size_ || ReadBlock()) && buffer_[current_] == '\n')
                current_++;
        }

        size_t global_index = files_.size_ex_psum(file_nr_) + FilePosition();
        if (global_index >= range_.end)
            return false;

        if (FilePosition() < files_[file_nr_].size) {
            // the file may have been truncated since listing it
            if (current_ < size_ || ReadBlock())
                return true;
        }

        // no more data in this file: continue at start of next one
        file_.close();
        if (++file_nr_ >= files_.size()) break;

        LOG << "LineReader: opening next file " << files_[file_nr_].path;
        if (files_[file_nr_].size == 0) {
            offset_ = current_ = size_ = 0;
            continue;
        }
        OpenFile(0);
    }
    return false;
}

const std::string& LineReader::Next() {
    assert(file_nr_ < files_.size());
    data_.clear();
    while (true) {
        while (current_ < size_) {
            char c = buffer_[current_++];
            if (c == '\n') return data_;
            if (c == '\r') {
                skip_lf_ = true;
                return data_;
            }
            data_.push_back(c);
        }
        if (!ReadBlock()) {
            // EOF = newline per definition
            return data_;
        }
    }
}

} // namespace vfs
} // namespace polarity

/******************************************************************************/
