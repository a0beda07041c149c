//
//  pronunciation_dictionary.cpp
//  NarrateForge
//
//  Created by Till Toenshoff on 1/19/26.
//  Copyright © 2026 Till Toenshoff. All rights reserved.
//

#include "pronunciation_dictionary.hpp"

#include <algorithm>
#include <cerrno>
#include <fstream>
#include <sstream>
#include <system_error>

#include "logging.hpp"
#include "text_chunker.hpp"

namespace narrateforge {

namespace {

char lower(char c) { return (c >= 'A' && c <= 'Z') ? static_cast<char>(c - 'A' + 'a') : c; }

std::string to_lower(std::string_view s) {
    std::string out(s);
    std::transform(out.begin(), out.end(), out.begin(), lower);
    return out;
}

// UTF-8 lead/continuation bytes count as word characters.
bool is_word_char(char c) {
    const auto u = static_cast<unsigned char>(c);
    return u >= 0x80 || (c >= '0' && c <= '9') || (c >= 'a' && c <= 'z') ||
           (c >= 'A' && c <= 'Z') || c == '_';
}

std::string_view strip(std::string_view s) {
    const auto first = s.find_first_not_of(" \t\r\n");
    if (first == std::string_view::npos) {
        return {};
    }
    const auto last = s.find_last_not_of(" \t\r\n");
    return s.substr(first, last - first + 1);
}

bool matches_at(std::string_view text, size_t pos, const std::string &key) {
    if (pos + key.size() > text.size()) {
        return false;
    }
    for (size_t i = 0; i < key.size(); ++i) {
        if (lower(text[pos + i]) != key[i]) {
            return false;
        }
    }
    const size_t end = pos + key.size();
    return end == text.size() || !is_word_char(text[end]);
}

}  // namespace

void PronunciationDictionary::add(const std::string &word, const std::string &pronunciation) {
    const std::string key = to_lower(strip(word));
    if (key.empty()) {
        return;
    }
    for (auto &e : entries_) {
        if (e.key == key) {
            e.pronunciation = pronunciation;
            return;
        }
    }
    entries_.push_back(Entry{key, pronunciation});
    NF_LOG("debug", "pronunciation: " << word << " -> " << pronunciation);
}

bool PronunciationDictionary::remove(const std::string &word) {
    const std::string key = to_lower(strip(word));
    const auto it = std::find_if(entries_.begin(), entries_.end(),
                                 [&key](const Entry &e) { return e.key == key; });
    if (it == entries_.end()) {
        return false;
    }
    entries_.erase(it);
    return true;
}

void PronunciationDictionary::load_defaults() {
    static const std::pair<const char *, const char *> kDefaults[] = {
        {"Hermione", "Her-my-oh-nee"}, {"Yosemite", "Yoh-sem-it-ee"}, {"Nguyen", "Win"},
        {"Tucson", "Too-sawn"},        {"SQL", "sequel"},             {"NGINX", "engine-ex"},
        {"JPEG", "jay-peg"},           {"GIF", "jif"},                {"Porsche", "Por-shuh"},
        {"Nike", "Ny-kee"},
    };
    for (const auto &[word, pronunciation] : kDefaults) {
        add(word, pronunciation);
    }
}

size_t PronunciationDictionary::parse_csv(std::string_view csv) {
    size_t added = 0;
    size_t pos = 0;
    while (pos < csv.size()) {
        size_t eol = csv.find('\n', pos);
        if (eol == std::string_view::npos) {
            eol = csv.size();
        }
        const std::string_view line = strip(csv.substr(pos, eol - pos));
        pos = eol + 1;
        if (line.empty() || line.front() == '#') {
            continue;
        }
        const size_t comma = line.find(',');
        if (comma == std::string_view::npos) {
            NF_LOG("warn", "pronunciation: skipping line without a comma: " << line);
            continue;
        }
        const std::string_view word = strip(line.substr(0, comma));
        const std::string_view pronunciation = strip(line.substr(comma + 1));
        if (word.empty() || pronunciation.empty()) {
            continue;
        }
        add(std::string(word), std::string(pronunciation));
        ++added;
    }
    return added;
}

Status PronunciationDictionary::load_csv(const std::string &path) {
    std::ifstream f(path);
    if (!f.is_open()) {
        NF_LOG("error", "open failed for " << path << " errno=" << errno << " ("
                                           << std::generic_category().message(errno) << ")");
        return make_status(false, "Failed to open pronunciation dictionary " + path);
    }
    std::stringstream buffer;
    buffer << f.rdbuf();
    const size_t added = parse_csv(buffer.str());
    NF_LOG("info", "loaded " << added << " pronunciations from " << path);
    return make_status(true);
}

std::string PronunciationDictionary::apply(std::string_view text) const {
    if (entries_.empty()) {
        return std::string(text);
    }
    std::string out;
    out.reserve(text.size());
    size_t i = 0;
    while (i < text.size()) {
        const size_t mlen = marker_length_at(text, i);
        if (mlen > 0) {
            out.append(text.substr(i, mlen));
            i += mlen;
            continue;
        }
        const bool at_boundary = i == 0 || !is_word_char(text[i - 1]);
        const Entry *best = nullptr;
        if (at_boundary) {
            for (const auto &e : entries_) {
                if ((!best || e.key.size() > best->key.size()) && matches_at(text, i, e.key)) {
                    best = &e;
                }
            }
        }
        if (best) {
            out += best->pronunciation;
            i += best->key.size();
            continue;
        }
        out.push_back(text[i]);
        ++i;
    }
    return out;
}

}  // namespace narrateforge
