#ifndef TOKENVAULT_CORE_MAPPING_HPP
#define TOKENVAULT_CORE_MAPPING_HPP

#include <map>
#include <optional>
#include <string>
#include <unordered_map>
#include <utility>
#include "core/errors.hpp"
#include "core/token.hpp"

/**
 * @file mapping.hpp
 * @brief A set of (token, real value) pairs used to reverse a tokenization.
 *
 * Keys are unique: a token is bound to exactly one value for the lifetime of
 * the mapping. The same value may appear under several tokens when mappings
 * from independent calls are merged (per-call numbering differs between
 * calls); findToken() then returns the first binding that was inserted.
 */

namespace tokenvault {
namespace core {

class Mapping
{
public:
    using const_iterator = std::map<std::string, std::string>::const_iterator;

    Mapping() = default;

    /**
     * @brief Bind token -> value. Re-inserting an identical pair is a no-op.
     * @throw MappingError if the token is malformed or already bound to another value.
     */
    void insert(const std::string &token, const std::string &value)
    {
        if (!isWellFormedToken(token)) {
            throw MappingError("Mapping: malformed token '" + token + "'");
        }
        auto it = byToken_.find(token);
        if (it != byToken_.end()) {
            if (it->second != value) {
                throw MappingError("Mapping: token " + token + " is already bound to a different value");
            }
            return;
        }
        byToken_.emplace(token, value);
        byValue_.emplace(value, token);
    }

    /**
     * @brief Merge every pair of @p other into this mapping (ConversationState
     *        update). All-or-nothing: on conflict nothing is inserted.
     * @throw MappingError on a conflicting token.
     */
    void update(const Mapping &other)
    {
        if (&other == this) {
            return;
        }
        for (const auto &pair : other.byToken_) {
            auto it = byToken_.find(pair.first);
            if (it != byToken_.end() && it->second != pair.second) {
                throw MappingError("Mapping: cannot merge, token " + pair.first +
                                   " is bound to a different value");
            }
        }
        for (const auto &pair : other.byToken_) {
            if (byToken_.emplace(pair.first, pair.second).second) {
                byValue_.emplace(pair.second, pair.first);
            }
        }
    }

    std::optional<std::string> findValue(const std::string &token) const
    {
        auto it = byToken_.find(token);
        if (it == byToken_.end()) {
            return std::nullopt;
        }
        return it->second;
    }

    std::optional<std::string> findToken(const std::string &value) const
    {
        auto it = byValue_.find(value);
        if (it == byValue_.end()) {
            return std::nullopt;
        }
        return it->second;
    }

    bool contains(const std::string &token) const { return byToken_.count(token) > 0; }

    size_t size() const { return byToken_.size(); }
    bool empty() const { return byToken_.empty(); }

    const_iterator begin() const { return byToken_.begin(); }
    const_iterator end() const { return byToken_.end(); }

    /// Token -> value view, ordered by token text.
    const std::map<std::string, std::string>& entries() const { return byToken_; }

private:
    std::map<std::string, std::string> byToken_;
    std::unordered_map<std::string, std::string> byValue_;
};

inline bool operator==(const Mapping &a, const Mapping &b)
{
    return a.entries() == b.entries();
}

inline bool operator!=(const Mapping &a, const Mapping &b)
{
    return !(a == b);
}

} // namespace core
} // namespace tokenvault

#endif // TOKENVAULT_CORE_MAPPING_HPP
