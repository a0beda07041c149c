//
//  text_chunker.cpp
//  NarrateForge
//
//  Created by Till Toenshoff on 1/14/26.
//  Copyright © 2026 Till Toenshoff. All rights reserved.
//

#include "text_chunker.hpp"

#include <algorithm>

#include "logging.hpp"

namespace narrateforge {

namespace {

constexpr size_t kMaxMarkerLength = 64;

enum class SplitLevel { Sentence, Clause, Word };

struct Span {
    size_t begin = 0;
    size_t end = 0;
};

bool is_space(char c) {
    return c == ' ' || c == '\t' || c == '\n' || c == '\r' || c == '\f' || c == '\v';
}

bool is_sentence_terminal(char c) { return c == '.' || c == '!' || c == '?'; }

bool is_clause_terminal(char c) { return c == ',' || c == ';' || c == ':'; }

bool is_ascii_alpha(char c) { return (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z'); }

// Skip closing quotes/parens (ASCII and UTF-8 right quotes) that trail a terminal mark.
size_t skip_closers(std::string_view text, size_t pos, size_t end) {
    while (pos < end) {
        const char c = text[pos];
        if (c == '"' || c == '\'' || c == ')' || is_sentence_terminal(c)) {
            ++pos;
            continue;
        }
        if (pos + 3 <= end && text[pos] == '\xE2' && text[pos + 1] == '\x80' &&
            (text[pos + 2] == '\x9D' || text[pos + 2] == '\x99')) {
            pos += 3;
            continue;
        }
        break;
    }
    return pos;
}

// A newline followed by more whitespace containing another newline is a paragraph break.
bool is_paragraph_break(std::string_view text, size_t pos, size_t end) {
    if (text[pos] != '\n') {
        return false;
    }
    for (size_t k = pos + 1; k < end && is_space(text[k]); ++k) {
        if (text[k] == '\n') {
            return true;
        }
    }
    return false;
}

// Position where the current unit ends if a boundary of `level` occurs at pos, npos otherwise.
size_t boundary_at(std::string_view text, size_t pos, size_t end, SplitLevel level) {
    const char c = text[pos];
    switch (level) {
    case SplitLevel::Word:
        return is_space(c) ? pos : std::string_view::npos;
    case SplitLevel::Clause:
        if (is_clause_terminal(c) && pos + 1 < end && is_space(text[pos + 1])) {
            return pos + 1;
        }
        return std::string_view::npos;
    case SplitLevel::Sentence:
        if (is_sentence_terminal(c)) {
            const size_t after = skip_closers(text, pos + 1, end);
            if (after < end && is_space(text[after])) {
                return after;
            }
            return std::string_view::npos;
        }
        return is_paragraph_break(text, pos, end) ? pos : std::string_view::npos;
    }
    return std::string_view::npos;
}

Span trim(std::string_view text, Span s) {
    while (s.begin < s.end && is_space(text[s.begin])) {
        ++s.begin;
    }
    while (s.end > s.begin && is_space(text[s.end - 1])) {
        --s.end;
    }
    return s;
}

// Trimmed, non-empty sub-spans of `span` cut at `level` boundaries. Markers are atomic.
std::vector<Span> split_units(std::string_view text, Span span, SplitLevel level) {
    std::vector<Span> units;
    const std::string_view bounded = text.substr(0, span.end);
    auto push = [&](size_t b, size_t e) {
        Span t = trim(text, Span{b, e});
        if (t.begin < t.end) {
            units.push_back(t);
        }
    };
    size_t unit_begin = span.begin;
    size_t i = span.begin;
    while (i < span.end) {
        const size_t mlen = marker_length_at(bounded, i);
        if (mlen > 0) {
            i += mlen;
            continue;
        }
        const size_t cut = boundary_at(bounded, i, span.end, level);
        if (cut == std::string_view::npos) {
            ++i;
            continue;
        }
        push(unit_begin, cut);
        unit_begin = cut;
        i = std::max(cut, i + 1);
    }
    push(unit_begin, span.end);
    return units;
}

class ChunkAccumulator {
public:
    ChunkAccumulator(std::string_view text, uint32_t max_words, uint32_t max_chars,
                     uint32_t chapter_id, std::vector<TextChunk> &out)
        : text_(text), max_words_(std::max<uint32_t>(1, max_words)),
          max_chars_(std::max<uint32_t>(1, max_chars)), chapter_id_(chapter_id), out_(out) {}

    void add(Span unit, SplitLevel level) {
        const TextMeasure um = measure_text(view(unit));
        if (open_) {
            const TextMeasure gap =
                measure_text(text_.substr(current_.end, unit.begin - current_.end));
            const TextMeasure combined{measure_.words + gap.words + um.words,
                                       measure_.chars + gap.chars + um.chars};
            if (fits(combined)) {
                current_.end = unit.end;
                measure_ = combined;
                return;
            }
        }
        if (fits(um)) {
            flush();
            start(unit, um);
            return;
        }
        if (level != SplitLevel::Word) {
            // Pieces of an oversized unit never join the text before it.
            flush();
            const SplitLevel next =
                level == SplitLevel::Sentence ? SplitLevel::Clause : SplitLevel::Word;
            for (const Span &part : split_units(text_, unit, next)) {
                add(part, next);
            }
            return;
        }
        // Unsplittable lexeme over the limit: emit alone rather than cut the token.
        NF_LOG("debug", "chunker: oversized lexeme (" << um.chars << " chars) kept whole in chapter "
                                                      << chapter_id_);
        flush();
        start(unit, um);
        flush();
    }

    void flush() {
        if (!open_) {
            return;
        }
        TextChunk chunk;
        chunk.chapter_id = chapter_id_;
        chunk.index = next_index_++;
        chunk.text = std::string(view(current_));
        chunk.word_count = measure_.words;
        chunk.char_count = measure_.chars;
        out_.push_back(std::move(chunk));
        open_ = false;
    }

private:
    bool fits(const TextMeasure &m) const { return m.words <= max_words_ && m.chars <= max_chars_; }

    std::string_view view(Span s) const { return text_.substr(s.begin, s.end - s.begin); }

    void start(Span unit, const TextMeasure &m) {
        current_ = unit;
        measure_ = m;
        open_ = true;
    }

    std::string_view text_;
    uint32_t max_words_;
    uint32_t max_chars_;
    uint32_t chapter_id_;
    std::vector<TextChunk> &out_;

    bool open_ = false;
    Span current_;
    TextMeasure measure_;
    uint32_t next_index_ = 0;
};

#ifdef NARRATEFORGE_TESTING
std::vector<std::string> to_strings(std::string_view text, const std::vector<Span> &spans) {
    std::vector<std::string> out;
    out.reserve(spans.size());
    for (const auto &s : spans) {
        out.emplace_back(text.substr(s.begin, s.end - s.begin));
    }
    return out;
}
#endif

}  // namespace

size_t marker_length_at(std::string_view text, size_t pos) {
    if (pos >= text.size()) {
        return 0;
    }
    const char open = text[pos];
    char close = 0;
    if (open == '<') {
        close = '>';
    } else if (open == '[') {
        close = ']';
    } else {
        return 0;
    }
    // Annotation names start with a letter; "x < 5 and y > 3" is prose.
    if (pos + 1 >= text.size() || !is_ascii_alpha(text[pos + 1])) {
        return 0;
    }
    const size_t limit = std::min(text.size(), pos + kMaxMarkerLength);
    for (size_t i = pos + 1; i < limit; ++i) {
        const char c = text[i];
        if (c == close) {
            return i > pos + 1 ? i - pos + 1 : 0;
        }
        if (c == '<' || c == '>' || c == '[' || c == ']' || c == '\n') {
            return 0;
        }
    }
    return 0;
}

TextMeasure measure_text(std::string_view text) {
    TextMeasure m;
    bool in_word = false;
    size_t i = 0;
    while (i < text.size()) {
        const size_t mlen = marker_length_at(text, i);
        if (mlen > 0) {
            i += mlen;
            continue;
        }
        const char c = text[i];
        if (is_space(c)) {
            in_word = false;
        } else if (!in_word) {
            in_word = true;
            ++m.words;
        }
        // Count code points, not UTF-8 continuation bytes.
        if ((static_cast<unsigned char>(c) & 0xC0) != 0x80) {
            ++m.chars;
        }
        ++i;
    }
    return m;
}

std::vector<TextChunk> chunk_text(std::string_view text, uint32_t max_words, uint32_t max_chars,
                                  uint32_t chapter_id) {
    std::vector<TextChunk> chunks;
    if (text.empty()) {
        return chunks;
    }
    ChunkAccumulator acc(text, max_words, max_chars, chapter_id, chunks);
    for (const Span &sentence : split_units(text, Span{0, text.size()}, SplitLevel::Sentence)) {
        acc.add(sentence, SplitLevel::Sentence);
    }
    acc.flush();
    NF_LOG("debug", "chunker: chapter " << chapter_id << " -> " << chunks.size()
                                        << " chunks (max_words=" << max_words
                                        << " max_chars=" << max_chars << ")");
    return chunks;
}

std::vector<TextChunk> chunk_chapters(const std::vector<ChapterText> &chapters,
                                      uint32_t max_words, uint32_t max_chars) {
    std::vector<TextChunk> all;
    uint32_t global = 0;
    for (size_t c = 0; c < chapters.size(); ++c) {
        auto chunks = chunk_text(chapters[c].text, max_words, max_chars, static_cast<uint32_t>(c));
        for (auto &chunk : chunks) {
            chunk.global_index = global++;
            all.push_back(std::move(chunk));
        }
    }
    return all;
}

#ifdef NARRATEFORGE_TESTING
namespace testing {
std::vector<std::string> split_sentences_for_test(const std::string &text) {
    return to_strings(text, split_units(text, Span{0, text.size()}, SplitLevel::Sentence));
}
std::vector<std::string> split_clauses_for_test(const std::string &text) {
    return to_strings(text, split_units(text, Span{0, text.size()}, SplitLevel::Clause));
}
}  // namespace testing
#endif

}  // namespace narrateforge
