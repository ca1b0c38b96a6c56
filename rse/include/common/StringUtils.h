#pragma once

#include <string>
#include <vector>

namespace RSE {

/**
 * @brief Length in bytes of the UTF-8 sequence starting with the given lead byte
 *
 * Invalid lead bytes count as a single byte so iteration always advances.
 */
inline size_t utf8SequenceLength(unsigned char lead) {
    if (lead < 0x80) {
        return 1;
    }
    if ((lead & 0xE0) == 0xC0) {
        return 2;
    }
    if ((lead & 0xF0) == 0xE0) {
        return 3;
    }
    if ((lead & 0xF8) == 0xF0) {
        return 4;
    }
    return 1;
}

/**
 * @brief Split text into characters (UTF-8 code point sequences)
 */
inline std::vector<std::string> splitCharacters(const std::string &text) {
    std::vector<std::string> characters;
    size_t pos = 0;
    while (pos < text.size()) {
        size_t length = utf8SequenceLength(static_cast<unsigned char>(text[pos]));
        if (pos + length > text.size()) {
            length = text.size() - pos;
        }
        characters.push_back(text.substr(pos, length));
        pos += length;
    }
    return characters;
}

inline size_t characterCount(const std::string &text) {
    size_t count = 0;
    size_t pos = 0;
    while (pos < text.size()) {
        pos += utf8SequenceLength(static_cast<unsigned char>(text[pos]));
        count++;
    }
    return count;
}

inline std::string trimWhitespace(const std::string &text, const std::string &characters = " \t\n\r\f\v") {
    size_t start = text.find_first_not_of(characters);
    if (start == std::string::npos) {
        return "";
    }
    size_t end = text.find_last_not_of(characters);
    return text.substr(start, end - start + 1);
}

}  // namespace RSE
