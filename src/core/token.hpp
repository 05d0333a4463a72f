#ifndef TOKENVAULT_CORE_TOKEN_HPP
#define TOKENVAULT_CORE_TOKEN_HPP

#include <cctype>
#include <cstdint>
#include <optional>
#include <stdexcept>
#include <string>
#include "core/entity.hpp"

/**
 * @file token.hpp
 * @brief Placeholder token syntax: <TypeName_N>
 *
 *   - TypeName matches [A-Za-z][A-Za-z0-9_]*
 *   - N is a positive decimal number without leading zeros
 *   - The type/number split is at the last underscore, so <Email_Address_2>
 *     is ("Email_Address", 2)
 *
 * USAGE:
 *   @code
 *   std::string t = formatToken("Person", 1);      // "<Person_1>"
 *   auto parts = parseToken("<EmailAddress_12>");   // {"EmailAddress", 12}
 *   @endcode
 */

namespace tokenvault {
namespace core {

/// Upper bound on the identifier part of a token; longer runs are not tokens.
constexpr size_t kMaxTokenBodyLength = 128;

/// Keeps N well inside uint64_t.
constexpr size_t kMaxTokenDigits = 18;

struct TokenParts
{
    std::string type;
    uint64_t number = 0;
};

/**
 * @brief Build "<type_n>".
 * @throw std::invalid_argument if the type is not token-safe or n is zero.
 */
inline std::string formatToken(const std::string &type, uint64_t n)
{
    if (!isTokenSafeTypeName(type)) {
        throw std::invalid_argument("formatToken: entity type '" + type + "' is not token-safe");
    }
    if (n == 0) {
        throw std::invalid_argument("formatToken: sequence numbers start at 1");
    }
    return "<" + type + "_" + std::to_string(n) + ">";
}

/**
 * @brief Length of the well-formed token starting at text[pos], or 0.
 *
 * Only the token grammar is checked; whether a mapping knows the token is
 * the caller's concern.
 */
inline size_t matchTokenAt(const std::string &text, size_t pos)
{
    if (pos >= text.size() || text[pos] != '<') {
        return 0;
    }
    size_t i = pos + 1;
    if (i >= text.size() || !std::isalpha(static_cast<unsigned char>(text[i]))) {
        return 0;
    }

    size_t lastUnderscore = std::string::npos;
    while (i < text.size() && i - pos - 1 <= kMaxTokenBodyLength) {
        unsigned char c = static_cast<unsigned char>(text[i]);
        if (c == '>') {
            break;
        }
        if (c == '_') {
            lastUnderscore = i;
        }
        else if (!std::isalnum(c)) {
            return 0;
        }
        ++i;
    }
    if (i >= text.size() || text[i] != '>' || lastUnderscore == std::string::npos) {
        return 0;
    }

    // digits after the last underscore: 1..kMaxTokenDigits, no leading zero
    size_t digitsBegin = lastUnderscore + 1;
    size_t digitCount = i - digitsBegin;
    if (digitCount == 0 || digitCount > kMaxTokenDigits || text[digitsBegin] == '0') {
        return 0;
    }
    for (size_t d = digitsBegin; d < i; ++d) {
        if (!std::isdigit(static_cast<unsigned char>(text[d]))) {
            return 0;
        }
    }
    // the type needs at least one character before the underscore
    if (lastUnderscore == pos + 1) {
        return 0;
    }
    return i - pos + 1;
}

/**
 * @brief Split a token into type and number.
 * @return std::nullopt unless the whole string is one well-formed token.
 */
inline std::optional<TokenParts> parseToken(const std::string &token)
{
    if (matchTokenAt(token, 0) != token.size() || token.empty()) {
        return std::nullopt;
    }
    size_t underscore = token.rfind('_');
    TokenParts parts;
    parts.type = token.substr(1, underscore - 1);
    parts.number = std::stoull(token.substr(underscore + 1, token.size() - underscore - 2));
    return parts;
}

inline bool isWellFormedToken(const std::string &token)
{
    return parseToken(token).has_value();
}

} // namespace core
} // namespace tokenvault

#endif // TOKENVAULT_CORE_TOKEN_HPP
