/*******************************************************************************
 * polarity/core/word_set.cpp
 *
 * Part of Project Polarity
 *
 * All rights reserved. Published under the BSD-2 license in the LICENSE file.
 ******************************************************************************/

#include <polarity/core/word_set.hpp>

#include <polarity/common/logger.hpp>
#include <polarity/common/string.hpp>
#include <polarity/common/system_exception.hpp>
#include <polarity/vfs/file_io.hpp>

#include <tlx/string/replace.hpp>
#include <tlx/string/split.hpp>
#include <tlx/string/to_lower.hpp>
#include <tlx/string/trim.hpp>

#include <string>
#include <vector>

namespace polarity {
namespace core {

std::string WordSet::Normalize(const std::string& line) {
    return tlx::to_lower(tlx::trim(line, common::kWhitespace));
}

void WordSet::AddLine(const std::string& line) {
    std::string word = Normalize(line);
    if (IsWord(word))
        words_.emplace(std::move(word));
}

WordSet WordSet::FromLines(const std::vector<std::string>& lines) {
    WordSet set;
    for (const std::string& line : lines)
        set.AddLine(line);

    LOG << "WordSet: built " << set.size() << " words from "
        << lines.size() << " lines";
    return set;
}

WordSet WordSet::FromFile(const std::string& path) {
    std::string contents;
    try {
        contents = vfs::ReadFileContents(path);
    }
    catch (const common::SystemException& e) {
        throw common::ResourceError(path, e.what());
    }

    if (!common::IsValidUtf8(contents))
        throw common::ResourceError(path, "invalid UTF-8 encoding");

    // lines end at "\n", "\r\n" or a lone "\r"
    tlx::replace_all(contents, "\r\n", "\n");
    tlx::replace_all(contents, "\r", "\n");
    WordSet set = FromLines(tlx::split('\n', contents));

    sLOG << "WordSet: loaded" << set.size() << "words from" << path;
    return set;
}

} // namespace core
} // namespace polarity

/******************************************************************************/
