/*******************************************************************************
 * tests/vfs/file_io_test.cpp
 *
 * Part of Project Polarity
 *
 * Copyright (C) 2015 Alexander Noe <aleexnoe@gmail.com>
 * Copyright (C) 2016 Timo Bingmann <tb@panthema.net>
 *
 * All rights reserved. Published under the BSD-2 license in the LICENSE file.
 ******************************************************************************/

#include <polarity/common/math.hpp>
#include <polarity/common/system_exception.hpp>
#include <polarity/vfs/file_io.hpp>
#include <polarity/vfs/line_reader.hpp>
#include <polarity/vfs/temporary_directory.hpp>
#include <gtest/gtest.h>

#include <string>
#include <vector>

using namespace polarity;

TEST(FileIO, GlobDirectoryAndPatterns) {
    vfs::TemporaryDirectory tmpdir;

    tmpdir.WriteFile("b.txt", { "bravo" });
    tmpdir.WriteFile("a.txt", { "alpha", "alpha" });
    tmpdir.WriteFile(".hidden", { "hidden" });
    tmpdir.WriteFile("_SUCCESS", { });

    // directory expands to its sorted regular files
    vfs::FileList files = vfs::Glob(tmpdir.get());
    ASSERT_EQ(2u, files.size());
    ASSERT_EQ(tmpdir.path("a.txt"), files[0].path);
    ASSERT_EQ(tmpdir.path("b.txt"), files[1].path);
    ASSERT_EQ(12u, files[0].size);
    ASSERT_EQ(6u, files[1].size);
    ASSERT_EQ(0u, files[0].size_ex_psum);
    ASSERT_EQ(12u, files[1].size_ex_psum);
    ASSERT_EQ(18u, files.total_size);
    ASSERT_EQ(18u, files.size_ex_psum(2));

    files = vfs::Glob(tmpdir.path("b*"));
    ASSERT_EQ(1u, files.size());

    files = vfs::Glob("file://" + tmpdir.path("a.txt"));
    ASSERT_EQ(1u, files.size());

    files = vfs::Glob(tmpdir.path("nothing-*"));
    ASSERT_EQ(0u, files.size());
    ASSERT_EQ(0u, files.total_size);
}

TEST(FileIO, RemoveAllAndMakeDirectory) {
    vfs::TemporaryDirectory tmpdir;

    std::string out = tmpdir.path("out");
    vfs::MakeDirectory(out);
    vfs::MakeDirectory(out + "/sub");
    vfs::WriteLines(out + "/sub/file", { "x" });
    vfs::WriteLines(out + "/file", { "y" });

    ASSERT_TRUE(vfs::PathExists(out + "/sub/file"));
    ASSERT_THROW(vfs::MakeDirectory(out), common::ErrnoException);

    vfs::RemoveAll(out);
    ASSERT_FALSE(vfs::PathExists(out));

    // missing paths are ignored
    vfs::RemoveAll(out);
}

TEST(FileIO, ReadFileContents) {
    vfs::TemporaryDirectory tmpdir;

    std::string path = tmpdir.WriteFile("lines", { "one", "two" });
    ASSERT_EQ("one\ntwo\n", vfs::ReadFileContents(path));

    ASSERT_THROW(vfs::ReadFileContents(tmpdir.path("missing")),
                 common::ErrnoException);
    ASSERT_THROW(vfs::ReadFileContents(tmpdir.get()),
                 common::ErrnoException);
}

/******************************************************************************/

static std::vector<std::string> ReadAllRanges(
    const vfs::FileList& files, size_t parts) {
    std::vector<std::string> lines;
    for (size_t i = 0; i < parts; ++i) {
        vfs::LineReader reader(
            files, common::CalculateLocalRange(files.total_size, parts, i));
        while (reader.HasNext())
            lines.push_back(reader.Next());
    }
    return lines;
}

TEST(LineReader, EveryLineExactlyOnce) {
    vfs::TemporaryDirectory tmpdir;

    std::vector<std::string> expected;
    for (size_t f = 0; f < 3; ++f) {
        std::vector<std::string> lines;
        for (size_t i = 0; i < 50 + 17 * f; ++i) {
            std::string line = "file" + std::to_string(f) + " line" +
                               std::to_string(i) + std::string(i % 7, 'x');
            // some empty lines, they are records too
            if (i % 13 == 5) line.clear();
            lines.push_back(line);
        }
        expected.insert(expected.end(), lines.begin(), lines.end());
        tmpdir.WriteFile("part-" + std::to_string(f), lines);
    }
    // an empty file in the middle
    tmpdir.WriteFile("part-1a", { });

    vfs::FileList files = vfs::Glob(tmpdir.get());
    ASSERT_EQ(4u, files.size());

    for (size_t parts = 1; parts <= 16; ++parts) {
        ASSERT_EQ(expected, ReadAllRanges(files, parts)) << "parts " << parts;
    }
}

TEST(LineReader, MissingFinalNewline) {
    vfs::TemporaryDirectory tmpdir;

    vfs::WriteLines(tmpdir.path("a"), { "alpha", "beta" });
    {
        // write "gamma\ndelta" without trailing newline
        vfs::SysFile f = vfs::SysFile::OpenForWrite(tmpdir.path("b"));
        std::string data = "gamma\ndelta";
        f.write_all(data.data(), data.size());
    }
    vfs::WriteLines(tmpdir.path("c"), { "epsilon" });

    vfs::FileList files = vfs::Glob(tmpdir.get());

    std::vector<std::string> expected = {
        "alpha", "beta", "gamma", "delta", "epsilon"
    };

    for (size_t parts = 1; parts <= 30; ++parts) {
        ASSERT_EQ(expected, ReadAllRanges(files, parts)) << "parts " << parts;
    }
}

TEST(LineReader, EmptyRange) {
    vfs::TemporaryDirectory tmpdir;
    tmpdir.WriteFile("a", { "alpha" });

    vfs::FileList files = vfs::Glob(tmpdir.get());
    vfs::LineReader reader(files, common::Range(3, 3));
    ASSERT_FALSE(reader.HasNext());
    ASSERT_EQ(0u, reader.total_bytes());
}

TEST(LineReader, CarriageReturnLineEnds) {
    vfs::TemporaryDirectory tmpdir;
    {
        vfs::SysFile f = vfs::SysFile::OpenForWrite(tmpdir.path("a"));
        std::string data = "alpha\r\nbeta\rgamma\r\r\ndelta\n\repsilon\r";
        f.write_all(data.data(), data.size());
    }
    {
        vfs::SysFile f = vfs::SysFile::OpenForWrite(tmpdir.path("b"));
        std::string data = "\nzeta\r";
        f.write_all(data.data(), data.size());
    }

    vfs::FileList files = vfs::Glob(tmpdir.get());

    std::vector<std::string> expected = {
        "alpha", "beta", "gamma", "", "delta", "", "epsilon", "", "zeta"
    };

    for (size_t parts = 1; parts <= 50; ++parts) {
        ASSERT_EQ(expected, ReadAllRanges(files, parts)) << "parts " << parts;
    }
}

/******************************************************************************/
