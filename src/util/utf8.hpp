#ifndef TOKENVAULT_UTIL_UTF8_HPP
#define TOKENVAULT_UTIL_UTF8_HPP

#include <cstdint>
#include <stdexcept>
#include <string>

/**
 * @file utf8.hpp
 * @brief UTF-8 helpers for offset conversion.
 *
 * The engine addresses text by byte offset. Detection services written in
 * other runtimes usually report code point offsets, so the remote detector
 * converts them with codepointToByteOffset() before building entities.
 */

namespace tokenvault {
namespace util {
namespace utf8 {

/**
 * @brief Length of the UTF-8 sequence introduced by a lead byte.
 *        Invalid lead bytes count as a single byte.
 */
inline size_t sequenceLength(unsigned char lead)
{
    if (lead < 0x80) return 1;
    if ((lead & 0xE0) == 0xC0) return 2;
    if ((lead & 0xF0) == 0xE0) return 3;
    if ((lead & 0xF8) == 0xF0) return 4;
    return 1;
}

/**
 * @brief Convert a code point offset to a byte offset in @p text.
 * @throw std::out_of_range if the offset lies past the end of the text.
 */
inline size_t codepointToByteOffset(const std::string &text, size_t codepointOffset)
{
    size_t bytePos = 0;
    size_t cp = 0;
    while (cp < codepointOffset) {
        if (bytePos >= text.size()) {
            throw std::out_of_range("utf8: code point offset " + std::to_string(codepointOffset) +
                                    " is past the end of the text");
        }
        bytePos += sequenceLength(static_cast<unsigned char>(text[bytePos]));
        ++cp;
    }
    if (bytePos > text.size()) {
        throw std::out_of_range("utf8: truncated sequence at end of text");
    }
    return bytePos;
}

/**
 * @brief Append code point @p cp to @p out as UTF-8.
 */
inline void appendCodepoint(std::string &out, uint32_t cp)
{
    if (cp < 0x80) {
        out.push_back(static_cast<char>(cp));
    } else if (cp < 0x800) {
        out.push_back(static_cast<char>(0xC0 | (cp >> 6)));
        out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
    } else if (cp < 0x10000) {
        out.push_back(static_cast<char>(0xE0 | (cp >> 12)));
        out.push_back(static_cast<char>(0x80 | ((cp >> 6) & 0x3F)));
        out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
    } else {
        out.push_back(static_cast<char>(0xF0 | (cp >> 18)));
        out.push_back(static_cast<char>(0x80 | ((cp >> 12) & 0x3F)));
        out.push_back(static_cast<char>(0x80 | ((cp >> 6) & 0x3F)));
        out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
    }
}

} // namespace utf8
} // namespace util
} // namespace tokenvault

#endif // TOKENVAULT_UTIL_UTF8_HPP
