//
//  pronunciation_dictionary.hpp
//  NarrateForge
//
//  Created by Till Toenshoff on 1/19/26.
//  Copyright © 2026 Till Toenshoff. All rights reserved.
//

#pragma once

#include <cstddef>
#include <string>
#include <string_view>
#include <vector>

#include "status.hpp"

namespace narrateforge {

/**
 * @brief Whole-word spelling overrides applied to chapter text before chunking.
 *
 * Words match case-insensitively (ASCII) and only between non-word characters, so "SQL" never
 * touches "SQLite". When several entries match at one position the longest wins. Replacement
 * text is not scanned again, and inline annotation markers are copied unchanged.
 */
class PronunciationDictionary {
public:
    // Adds or replaces the override for `word` (case-insensitive key). Empty words are ignored.
    void add(const std::string &word, const std::string &pronunciation);
    bool remove(const std::string &word);

    size_t size() const { return entries_.size(); }
    bool empty() const { return entries_.empty(); }

    // Common proper nouns and acronyms that engines tend to mispronounce.
    void load_defaults();

    // `word,pronunciation` lines; blank lines and lines starting with '#' are skipped.
    // Returns the number of entries added.
    size_t parse_csv(std::string_view csv);
    Status load_csv(const std::string &path);

    std::string apply(std::string_view text) const;

private:
    struct Entry {
        std::string key;  // lower-cased word
        std::string pronunciation;
    };

    std::vector<Entry> entries_;
};

}  // namespace narrateforge
