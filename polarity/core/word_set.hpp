/*******************************************************************************
 * polarity/core/word_set.hpp
 *
 * Immutable set of normalized words defining one sentiment polarity.
 *
 * Part of Project Polarity
 *
 * All rights reserved. Published under the BSD-2 license in the LICENSE file.
 ******************************************************************************/

#pragma once
#ifndef POLARITY_CORE_WORD_SET_HEADER
#define POLARITY_CORE_WORD_SET_HEADER

#include <string>
#include <unordered_set>
#include <vector>

namespace polarity {
namespace core {

/*!
 * A set of lowercase, trimmed words. Built once from the lines of a word list
 * and read-only afterwards, hence it may be shared by any number of
 * concurrently classifying workers without locking.
 *
 * Lines which are empty after trimming or start with "//" are skipped,
 * duplicates collapse silently.
 */
class WordSet
{
    static constexpr bool debug = false;

public:
    //! empty word set
    WordSet() = default;

    //! Build the set from raw word list lines.
    static WordSet FromLines(const std::vector<std::string>& lines);

    //! Build the set from a UTF-8 word list file. Throws common::ResourceError
    //! if the file cannot be opened, read, or decoded.
    static WordSet FromFile(const std::string& path);

    //! Normalize one word list line: trim ASCII whitespace and lowercase.
    static std::string Normalize(const std::string& line);

    //! Whether a normalized line is a word, not a comment or empty.
    static bool IsWord(const std::string& normalized) {
        return !normalized.empty() && normalized.compare(0, 2, "//") != 0;
    }

    //! test membership of an already normalized token
    bool Contains(const std::string& word) const {
        return words_.find(word) != words_.end();
    }

    //! number of distinct words
    size_t size() const { return words_.size(); }

    //! whether there are no words at all
    bool empty() const { return words_.empty(); }

private:
    std::unordered_set<std::string> words_;

    //! insert one raw line
    void AddLine(const std::string& line);
};

} // namespace core
} // namespace polarity

#endif // !POLARITY_CORE_WORD_SET_HEADER

/******************************************************************************/
