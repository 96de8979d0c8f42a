//
//  text_utils.hpp
//  SlideSync
//
//  Created by the SlideSync authors on 12/9/25.
//  Copyright © 2025 The SlideSync Authors. All rights reserved.
//

#pragma once

#include <cctype>
#include <cstddef>
#include <string>
#include <string_view>
#include <vector>

inline std::string trim_copy(std::string_view s) {
    size_t b = 0;
    size_t e = s.size();
    while (b < e && std::isspace(static_cast<unsigned char>(s[b]))) {
        ++b;
    }
    while (e > b && std::isspace(static_cast<unsigned char>(s[e - 1]))) {
        --e;
    }
    return std::string(s.substr(b, e - b));
}

// Whitespace-separated token count (ASCII whitespace only).
inline size_t count_words(std::string_view s) {
    size_t words = 0;
    bool in_word = false;
    for (char c : s) {
        const bool space = std::isspace(static_cast<unsigned char>(c)) != 0;
        if (!space && !in_word) {
            ++words;
        }
        in_word = !space;
    }
    return words;
}

// First max_chars code points of a UTF-8 string. Continuation bytes never start a character, so
// a character is only counted when its lead byte is seen.
inline std::string truncate_utf8(std::string_view s, size_t max_chars) {
    size_t chars = 0;
    size_t i = 0;
    for (; i < s.size(); ++i) {
        const auto c = static_cast<unsigned char>(s[i]);
        if ((c & 0xC0) != 0x80) {
            if (chars == max_chars) {
                break;
            }
            ++chars;
        }
    }
    return std::string(s.substr(0, i));
}

inline std::string join_with_space(const std::vector<std::string> &parts) {
    std::string out;
    for (size_t i = 0; i < parts.size(); ++i) {
        if (i != 0) {
            out.push_back(' ');
        }
        out += parts[i];
    }
    return out;
}
