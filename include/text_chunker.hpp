//
//  text_chunker.hpp
//  NarrateForge
//
//  Created by Till Toenshoff on 1/14/26.
//  Copyright © 2026 Till Toenshoff. All rights reserved.
//

#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

namespace narrateforge {

/// @ingroup api
/// One bounded unit of text submitted to the inference engine in a single call.
struct TextChunk {
    uint32_t chapter_id = 0;    ///< Chapter this chunk belongs to
    uint32_t index = 0;         ///< 0-based, contiguous within the chapter
    uint32_t global_index = 0;  ///< 0-based, contiguous across the whole book
    std::string text;           ///< Verbatim slice of the chapter text (markers preserved)
    uint32_t word_count = 0;    ///< Words, inline markers excluded
    uint32_t char_count = 0;    ///< UTF-8 code points, inline marker bytes excluded
};

/// @ingroup api
/// Clean chapter text as delivered by the document collaborator.
struct ChapterText {
    std::string title;
    std::string text;
};

struct TextMeasure {
    uint32_t words = 0;
    uint32_t chars = 0;
};

// Length of an inline annotation marker (`<laugh>`, `[pause]`) starting at pos, 0 if none.
size_t marker_length_at(std::string_view text, size_t pos);

// Word/char counts with inline markers excluded.
TextMeasure measure_text(std::string_view text);

/**
 * @brief Split chapter text into ordered chunks bounded by both max_words and max_chars.
 *
 * Sentences are packed greedily; a sentence that does not fit on its own is split at clause
 * boundaries and then at word boundaries. Inline markers are never split and do not count
 * toward either limit. A single lexeme longer than max_chars becomes its own chunk. Empty input
 * yields no chunks.
 */
std::vector<TextChunk> chunk_text(std::string_view text, uint32_t max_words, uint32_t max_chars,
                                  uint32_t chapter_id = 0);

// Chunk every chapter and number the chunks contiguously across the book.
std::vector<TextChunk> chunk_chapters(const std::vector<ChapterText> &chapters,
                                      uint32_t max_words, uint32_t max_chars);

#ifdef NARRATEFORGE_TESTING
namespace testing {
std::vector<std::string> split_sentences_for_test(const std::string &text);
std::vector<std::string> split_clauses_for_test(const std::string &text);
}  // namespace testing
#endif

}  // namespace narrateforge
