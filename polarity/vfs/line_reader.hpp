/*******************************************************************************
 * polarity/vfs/line_reader.hpp
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

#pragma once
#ifndef POLARITY_VFS_LINE_READER_HEADER
#define POLARITY_VFS_LINE_READER_HEADER

#include <polarity/common/math.hpp>
#include <polarity/vfs/file_io.hpp>
#include <polarity/vfs/sys_file.hpp>

#include <string>
#include <vector>

namespace polarity {
namespace vfs {

/*!
 * LineReader delivers the lines of a concatenated list of files, restricted to
 * a byte range [begin,end) of the concatenation. A line belongs to the range
 * if its first byte lies within it. Splitting the total size of a FileList into
 * disjoint ranges hence assigns every line to exactly one reader.
 *
 * Lines end at "\n", "\r\n" or a lone "\r". Each file starts a new line, a
 * missing line end at the end of a file is implied. The separators are not
 * part of the delivered lines.
 *
\code
LineReader reader(files, common::Range(0, files.total_size));
while (reader.HasNext()) {
    const std::string& line = reader.Next();
}
\endcode
 */
class LineReader
{
    static constexpr bool debug = false;

public:
    //! Block read size
    static constexpr size_t read_size = 2 * 1024 * 1024;

    LineReader(const FileList& files, const common::Range& range);

    //! non-copyable: delete copy-constructor
    LineReader(const LineReader&) = delete;
    //! non-copyable: delete assignment operator
    LineReader& operator = (const LineReader&) = delete;
    //! move-constructor: default
    LineReader(LineReader&&) = default;

    //! returns true, if another line starts within the range.
    bool HasNext();

    //! returns the next line, valid until the next call. Call only if
    //! HasNext() is true.
    const std::string& Next();

    //! number of bytes read from files
    size_t total_bytes() const { return total_bytes_; }

private:
    //! Input files with size prefixsum.
    const FileList& files_;
    //! [begin,end) of the global byte range
    common::Range range_;

    //! Index of current file in files_
    size_t file_nr_ = 0;
    //! File handle to files_[file_nr_]
    SysFile file_;
    //! Offset of the current buffer in file_
    size_t offset_ = 0;

    //! Byte buffer of the current block.
    std::vector<char> buffer_;
    //! Start of next element in current buffer.
    size_t current_ = 0;
    //! Number of valid bytes in buffer.
    size_t size_ = 0;

    //! String, which Next() references to
    std::string data_;

    //! last line ended with '\r', a following '\n' belongs to its line end
    bool skip_lf_ = false;

    size_t total_bytes_ = 0;

    //! open file_nr_ and position buffer at byte offset of that file.
    void OpenFile(size_t offset);

    //! read the next block into the buffer, returns false on EOF.
    bool ReadBlock();

    //! position within current file of the next unread byte
    size_t FilePosition() const { return offset_ + current_; }
};

} // namespace vfs
} // namespace polarity

#endif // !POLARITY_VFS_LINE_READER_HEADER

/******************************************************************************/
