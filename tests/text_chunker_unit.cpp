// Chunker coverage: word preservation, size limits, split levels, markers and edge cases.
#include <cstdint>
#include <iostream>
#include <string>
#include <vector>

#include "logging.hpp"
#include "test_utils.hpp"
#include "text_chunker.hpp"

using namespace narrateforge;
using test_utils::words_of;

namespace {

bool check(bool cond, const std::string &msg) {
    if (!cond) {
        std::cerr << "[text_chunker_unit] FAIL: " << msg << "\n";
    }
    return cond;
}

std::string repeat_words(const std::string &word, size_t n) {
    std::string out;
    for (size_t i = 0; i < n; ++i) {
        if (i > 0) {
            out += " ";
        }
        out += word;
    }
    return out;
}

std::vector<std::string> chunk_words(const std::vector<TextChunk> &chunks) {
    std::vector<std::string> all;
    for (const auto &c : chunks) {
        auto w = words_of(c.text);
        all.insert(all.end(), w.begin(), w.end());
    }
    return all;
}

bool within_limits(const std::vector<TextChunk> &chunks, uint32_t max_words, uint32_t max_chars,
                   const std::string &label) {
    bool ok = true;
    for (const auto &c : chunks) {
        const bool lone_lexeme = c.word_count == 1;
        ok &= check(c.word_count <= max_words, label + ": word limit in \"" + c.text + "\"");
        ok &= check(c.char_count <= max_chars || lone_lexeme,
                    label + ": char limit in \"" + c.text + "\"");
        const TextMeasure m = measure_text(c.text);
        ok &= check(m.words == c.word_count && m.chars == c.char_count,
                    label + ": stored counts match text");
    }
    return ok;
}

bool test_measure() {
    bool ok = true;
    TextMeasure m = measure_text("Hello <laugh> there");
    ok &= check(m.words == 2 && m.chars == 12, "markers excluded from counts");
    m = measure_text("caf\xC3\xA9 ok");
    ok &= check(m.words == 2 && m.chars == 7, "UTF-8 counted in code points");
    ok &= check(marker_length_at("[pause] x", 0) == 7, "bracket marker length");
    ok &= check(marker_length_at("<>", 0) == 0, "empty marker rejected");
    ok &= check(marker_length_at("a < b and c > d", 2) == 0, "comparison in prose is no marker");
    ok &= check(marker_length_at("x<5 and y>3", 1) == 0, "marker name must start with a letter");
    ok &= check(marker_length_at("<sigh softly> ok", 0) == 13, "multi-word marker accepted");
    m = measure_text("if x < 5 and y > 3");
    ok &= check(m.words == 8 && m.chars == 18, "comparison operators counted as text");
    ok &= check(marker_length_at("<a\nb>", 0) == 0, "marker may not span lines");
    ok &= check(marker_length_at("<unterminated", 0) == 0, "unterminated marker rejected");
    return ok;
}

bool test_sentence_and_clause_split() {
    using testing::split_clauses_for_test;
    using testing::split_sentences_for_test;
    bool ok = true;
    auto s = split_sentences_for_test("One. Two! \"Three?\" Four");
    ok &= check(s == std::vector<std::string>{"One.", "Two!", "\"Three?\"", "Four"},
                "sentences split on terminal punctuation with closers");
    s = split_sentences_for_test("First line\n\nSecond line");
    ok &= check(s == std::vector<std::string>{"First line", "Second line"},
                "paragraph break ends a sentence");
    s = split_sentences_for_test("Pi is 3.14 today. Done.");
    ok &= check(s.size() == 2 && s[0] == "Pi is 3.14 today.", "decimal point is not a boundary");
    auto c = split_clauses_for_test("a, b; c: d");
    ok &= check(c == std::vector<std::string>{"a,", "b;", "c:", "d"}, "clause split");
    return ok;
}

// Short sentence then an 80-word sentence under 70 words / 300 chars.
bool test_long_sentence_is_split() {
    const std::string a = repeat_words("alpha", 30) + ".";
    const std::string b = repeat_words("bravo", 80) + ".";
    const std::string text = a + " " + b;
    const auto chunks = chunk_text(text, 70, 300);
    bool ok = check(chunks.size() >= 3, "A alone plus at least two pieces of B");
    if (!ok) {
        return false;
    }
    ok &= check(chunks[0].text == a, "first chunk is sentence A");
    size_t b_pieces = 0;
    for (size_t i = 1; i < chunks.size(); ++i) {
        b_pieces += chunks[i].text.find("bravo") != std::string::npos ? 1 : 0;
    }
    ok &= check(b_pieces >= 2, "sentence B split into >= 2 chunks");
    ok &= within_limits(chunks, 70, 300, "A/B");
    ok &= check(chunk_words(chunks) == words_of(text), "A/B words preserved");
    for (size_t i = 0; i < chunks.size(); ++i) {
        ok &= check(chunks[i].index == i && chunks[i].chapter_id == 0, "indices sequential");
    }
    return ok;
}

bool test_clause_split_preferred() {
    const std::string text = repeat_words("x", 6) + ", " + repeat_words("y", 6) + "; " +
                             repeat_words("z", 6) + ".";
    const auto chunks = chunk_text(text, 8, 300);
    bool ok = check(chunks.size() == 3, "three clause chunks");
    if (chunks.size() == 3) {
        ok &= check(chunks[0].text == repeat_words("x", 6) + ",", "first clause kept whole");
        ok &= check(chunks[2].text == repeat_words("z", 6) + ".", "last clause kept whole");
    }
    return ok;
}

bool test_markers_never_split() {
    const std::string text = "one two <laugh softly> three four [long pause] five six";
    const auto chunks = chunk_text(text, 2, 300);
    bool ok = check(chunk_words(chunks) == words_of(text), "marker text preserved");
    size_t laugh = 0;
    size_t pause = 0;
    for (const auto &c : chunks) {
        laugh += c.text.find("<laugh softly>") != std::string::npos ? 1 : 0;
        pause += c.text.find("[long pause]") != std::string::npos ? 1 : 0;
        size_t opens = 0;
        size_t closes = 0;
        for (char ch : c.text) {
            opens += (ch == '<' || ch == '[') ? 1 : 0;
            closes += (ch == '>' || ch == ']') ? 1 : 0;
        }
        ok &= check(opens == closes, "no marker cut at a chunk edge: \"" + c.text + "\"");
    }
    ok &= check(laugh == 1 && pause == 1, "each marker appears intact exactly once");
    ok &= within_limits(chunks, 2, 300, "markers");
    return ok;
}

bool test_oversized_lexeme() {
    const std::string longword = "supercalifragilisticexpialidocious";
    const auto chunks = chunk_text("short " + longword + " word", 5, 10);
    bool ok = check(chunks.size() == 3, "lexeme emitted alone");
    if (chunks.size() == 3) {
        ok &= check(chunks[0].text == "short", "text before lexeme");
        ok &= check(chunks[1].text == longword && chunks[1].char_count > 10,
                    "lexeme kept whole over the char limit");
        ok &= check(chunks[2].text == "word", "text after lexeme");
    }
    return ok;
}

bool test_empty_input() {
    bool ok = check(chunk_text("", 70, 300).empty(), "empty text -> no chunks");
    ok &= check(chunk_text("  \n\t ", 70, 300).empty(), "whitespace-only text -> no chunks");
    const auto zero_limits = chunk_text("a b c", 0, 0);
    ok &= check(zero_limits.size() == 3, "zero limits clamp to one word per chunk");
    return ok;
}

bool test_chapters_get_global_indices() {
    std::vector<ChapterText> chapters = {
        {"One", "First sentence here. Second sentence here."},
        {"Empty", ""},
        {"Three", "Third chapter text. More of it."},
    };
    const auto chunks = chunk_chapters(chapters, 3, 300);
    bool ok = check(chunks.size() == 4, "two chunks per non-empty chapter");
    for (size_t i = 0; i < chunks.size(); ++i) {
        ok &= check(chunks[i].global_index == i, "global index contiguous");
    }
    if (chunks.size() == 4) {
        ok &= check(chunks[1].chapter_id == 0 && chunks[1].index == 1, "chapter 0 second chunk");
        ok &= check(chunks[2].chapter_id == 2 && chunks[2].index == 0,
                    "per-chapter index restarts after empty chapter");
    }
    return ok;
}

// Deterministic pseudo-random prose over a fixed alphabet of punctuation.
bool test_random_texts_respect_limits() {
    uint32_t state = 12345;
    auto next = [&state]() {
        state = state * 1103515245u + 12345u;
        return (state >> 16) & 0x7FFF;
    };
    const char *punct[] = {"", "", "", "", ",", ".", "!", "?", ";"};
    bool ok = true;
    for (int round = 0; round < 40; ++round) {
        std::string text;
        const int words = 1 + static_cast<int>(next() % 400);
        for (int w = 0; w < words; ++w) {
            if (w > 0) {
                text += (next() % 23 == 0) ? "\n\n" : " ";
            }
            if (next() % 31 == 0) {
                text += "<breath>";
                continue;
            }
            const int len = 1 + static_cast<int>(next() % 14);
            for (int k = 0; k < len; ++k) {
                text.push_back(static_cast<char>('a' + next() % 26));
            }
            text += punct[next() % 9];
        }
        const uint32_t max_words = 1 + next() % 80;
        const uint32_t max_chars = 8 + next() % 400;
        const auto chunks = chunk_text(text, max_words, max_chars);
        const std::string label = "round " + std::to_string(round);
        ok &= check(chunk_words(chunks) == words_of(text), label + ": words preserved");
        ok &= within_limits(chunks, max_words, max_chars, label);
    }
    return ok;
}

}  // namespace

int main() {
    set_log_verbosity(LogVerbosity::Warn);
    bool ok = true;
    ok &= test_measure();
    ok &= test_sentence_and_clause_split();
    ok &= test_long_sentence_is_split();
    ok &= test_clause_split_preferred();
    ok &= test_markers_never_split();
    ok &= test_oversized_lexeme();
    ok &= test_empty_input();
    ok &= test_chapters_get_global_indices();
    ok &= test_random_texts_respect_limits();
    if (ok) {
        std::cout << "text_chunker_unit OK\n";
    }
    return ok ? 0 : 1;
}
