#ifndef TOKENVAULT_REGISTRY_TOKEN_REGISTRY_HPP
#define TOKENVAULT_REGISTRY_TOKEN_REGISTRY_HPP

#include <algorithm>
#include <cstdint>
#include <functional>
#include <map>
#include <mutex>
#include <optional>
#include <shared_mutex>
#include <string>
#include <unordered_map>
#include <unordered_set>
#include <utility>
#include <vector>
#include "core/errors.hpp"
#include "core/mapping.hpp"
#include "core/token.hpp"
#include "util/hashing.hpp"
#include "util/logger.hpp"

/**
 * @file token_registry.hpp
 * @brief The long-lived store of real value <-> token pairs that makes
 *        tokenization consistent across documents and calls.
 *
 * Invariants:
 *  1. getOrCreate(v, t) returns the same token for v once it exists.
 *  2. A token is never bound to two different values.
 *  3. forward (value -> token) and reverse (token -> value) are exact inverses.
 *  4. nextSequence(type) is greater than every sequence number in use for
 *     that type, so a rehydrated registry never re-issues a token.
 *
 * Concurrency: lookups take a shared lock; every mutation, including the
 * "check existence, else allocate and insert" step, runs under the exclusive
 * lock, so two callers registering the same new value get the same token.
 * No detector call is ever made while a lock is held: callers detect first
 * and register afterwards.
 *
 * Identity is the exact byte string of the value. "Marie" and "Marie Dupont"
 * are different identities; the first entity type seen for a value wins.
 *
 * Usage Example:
 *   tokenvault::registry::TokenRegistry registry;
 *   auto t1 = registry.getOrCreate("Marie Dupont", "Person"); // "<Person_1>"
 *   auto t2 = registry.getOrCreate("Marie Dupont", "Person"); // "<Person_1>"
 */

namespace tokenvault {
namespace registry {

/**
 * @struct RegistryEntry
 * @brief One registered value with its token and the parts of that token.
 */
struct RegistryEntry
{
    std::string token;
    std::string value;
    std::string type;
    uint64_t sequence = 0;
};

/**
 * @struct RegistrySnapshot
 * @brief Everything needed to rehydrate a registry: entries and counters.
 */
struct RegistrySnapshot
{
    std::vector<RegistryEntry> entries;          ///< Sorted by (type, sequence)
    std::map<std::string, uint64_t> nextSequence; ///< type -> next number to allocate
};

/**
 * @class TokenRegistry
 * @brief Thread-safe, injectable registry. Not a global: each engine or
 *        session decides which registry instance it shares.
 */
class TokenRegistry
{
public:
    /// Returns true for tokens that must not be allocated (e.g. they occur literally in the text).
    using ReservedPredicate = std::function<bool(const std::string &)>;

    TokenRegistry() = default;
    ~TokenRegistry() = default;

    TokenRegistry(const TokenRegistry&) = delete;
    TokenRegistry& operator=(const TokenRegistry&) = delete;

    /**
     * @brief Return the token for @p value, allocating "<type_N>" on first sight.
     *
     * Reserved tokens are never returned: new values skip them, and a value
     * already bound to a reserved token is refused.
     *
     * @throw std::invalid_argument for an empty value or a type that is not token-safe.
     * @throw core::MappingError if the existing token of @p value is reserved.
     */
    inline std::string getOrCreate(const std::string &value, const std::string &type,
                                   const ReservedPredicate &reserved = nullptr)
    {
        checkInput(value, type);
        {
            std::shared_lock<std::shared_mutex> lock(mutex_);
            auto it = forward_.find(value);
            if (it != forward_.end()) {
                checkNotReserved(value, it->second, reserved);
                return it->second;
            }
        }
        std::unique_lock<std::shared_mutex> lock(mutex_);
        auto it = forward_.find(value);
        if (it != forward_.end()) {
            checkNotReserved(value, it->second, reserved);
        }
        return findOrAllocateLocked(value, type, reserved);
    }

    /**
     * @brief Register every (value, type) of one document atomically.
     *
     * Either all values get a token or, if an input is invalid, nothing is
     * registered. Returned tokens are in input order.
     *
     * @throw std::invalid_argument if any value is empty or any type is not token-safe.
     * @throw core::MappingError if a value is already bound to a reserved token.
     */
    inline std::vector<std::string> registerValues(
        const std::vector<std::pair<std::string, std::string>> &valuesAndTypes,
        const ReservedPredicate &reserved = nullptr)
    {
        for (const auto &vt : valuesAndTypes) {
            checkInput(vt.first, vt.second);
        }

        std::vector<std::string> tokens;
        tokens.reserve(valuesAndTypes.size());

        std::unique_lock<std::shared_mutex> lock(mutex_);
        for (const auto &vt : valuesAndTypes) {
            auto it = forward_.find(vt.first);
            if (it != forward_.end()) {
                checkNotReserved(vt.first, it->second, reserved);
            }
        }
        for (const auto &vt : valuesAndTypes) {
            tokens.push_back(findOrAllocateLocked(vt.first, vt.second, reserved));
        }
        return tokens;
    }

    inline std::optional<std::string> lookupToken(const std::string &value) const
    {
        std::shared_lock<std::shared_mutex> lock(mutex_);
        auto it = forward_.find(value);
        if (it == forward_.end()) {
            return std::nullopt;
        }
        return it->second;
    }

    inline std::optional<std::string> lookupValue(const std::string &token) const
    {
        std::shared_lock<std::shared_mutex> lock(mutex_);
        auto it = reverse_.find(token);
        if (it == reverse_.end()) {
            return std::nullopt;
        }
        return it->second.value;
    }

    /**
     * @brief Import the pairs of a mapping as registry entries.
     *
     * All-or-nothing. A pair is a conflict when its token is bound to another
     * value, or its value is already registered under another token.
     *
     * @throw core::RegistryError on conflict.
     */
    inline void merge(const core::Mapping &mapping)
    {
        std::vector<RegistryEntry> entries;
        entries.reserve(mapping.size());
        for (const auto &pair : mapping) {
            auto parts = core::parseToken(pair.first);
            // Mapping only admits well-formed tokens
            RegistryEntry e;
            e.token = pair.first;
            e.value = pair.second;
            e.type = parts->type;
            e.sequence = parts->number;
            entries.push_back(std::move(e));
        }
        std::unique_lock<std::shared_mutex> lock(mutex_);
        mergeLocked(entries, {});
    }

    /**
     * @brief Import every entry and counter of another registry.
     * @throw core::RegistryError on conflict (nothing is imported).
     */
    inline void merge(const TokenRegistry &other)
    {
        if (&other == this) {
            return;
        }
        // snapshot first so the two locks are never held together
        RegistrySnapshot snap = other.snapshot();
        std::unique_lock<std::shared_mutex> lock(mutex_);
        mergeLocked(snap.entries, snap.nextSequence);
    }

    /**
     * @brief The registry as a detokenization mapping.
     */
    inline core::Mapping toMapping() const
    {
        std::shared_lock<std::shared_mutex> lock(mutex_);
        core::Mapping m;
        for (const auto &pair : reverse_) {
            m.insert(pair.first, pair.second.value);
        }
        return m;
    }

    inline RegistrySnapshot snapshot() const
    {
        RegistrySnapshot snap;
        {
            std::shared_lock<std::shared_mutex> lock(mutex_);
            snap.entries.reserve(reverse_.size());
            for (const auto &pair : reverse_) {
                snap.entries.push_back(pair.second);
            }
            snap.nextSequence.insert(nextSeq_.begin(), nextSeq_.end());
        }
        std::sort(snap.entries.begin(), snap.entries.end(),
                  [](const RegistryEntry &a, const RegistryEntry &b) {
                      return a.type != b.type ? a.type < b.type : a.sequence < b.sequence;
                  });
        return snap;
    }

    /**
     * @brief Replace the whole content with a snapshot (rehydration).
     *
     * Missing counters are derived from the entries; a counter that does not
     * exceed the largest sequence in use for its type is rejected.
     *
     * @throw core::RegistryError if the snapshot is inconsistent. The registry
     *        is left untouched in that case.
     */
    inline void restore(const RegistrySnapshot &snap)
    {
        std::unordered_map<std::string, std::string> forward;
        std::unordered_map<std::string, RegistryEntry> reverse;
        std::unordered_map<std::string, uint64_t> nextSeq(snap.nextSequence.begin(),
                                                          snap.nextSequence.end());

        for (const auto &e : snap.entries) {
            validateEntry(e);
            if (!reverse.emplace(e.token, e).second) {
                throw core::RegistryError("TokenRegistry: duplicate token in snapshot: " + e.token);
            }
            if (!forward.emplace(e.value, e.token).second) {
                throw core::RegistryError("TokenRegistry: value " + util::hashing::fingerprint(e.value) +
                                          " appears under two tokens in snapshot");
            }
        }

        std::unordered_map<std::string, uint64_t> maxSeq;
        for (const auto &e : snap.entries) {
            maxSeq[e.type] = std::max(maxSeq[e.type], e.sequence);
        }
        for (const auto &pair : maxSeq) {
            auto it = nextSeq.find(pair.first);
            if (it == nextSeq.end()) {
                nextSeq[pair.first] = pair.second + 1;
            }
            else if (it->second <= pair.second) {
                throw core::RegistryError("TokenRegistry: counter for " + pair.first + " is " +
                                          std::to_string(it->second) + " but sequence " +
                                          std::to_string(pair.second) + " is in use");
            }
        }

        std::unique_lock<std::shared_mutex> lock(mutex_);
        forward_.swap(forward);
        reverse_.swap(reverse);
        nextSeq_.swap(nextSeq);
        util::logger::info("TokenRegistry: restored " + std::to_string(reverse_.size()) + " entries");
    }

    inline size_t size() const
    {
        std::shared_lock<std::shared_mutex> lock(mutex_);
        return reverse_.size();
    }

    /**
     * @brief Next number that will be considered for @p type (1 for an unseen type).
     */
    inline uint64_t nextSequence(const std::string &type) const
    {
        std::shared_lock<std::shared_mutex> lock(mutex_);
        auto it = nextSeq_.find(type);
        return it == nextSeq_.end() ? 1 : it->second;
    }

private:
    inline static void checkInput(const std::string &value, const std::string &type)
    {
        if (value.empty()) {
            throw std::invalid_argument("TokenRegistry: cannot register an empty value");
        }
        if (!core::isTokenSafeTypeName(type)) {
            throw std::invalid_argument("TokenRegistry: entity type '" + type + "' is not token-safe");
        }
    }

    // An existing binding cannot be renumbered, so a reserved one is refused.
    inline static void checkNotReserved(const std::string &value, const std::string &token,
                                        const ReservedPredicate &reserved)
    {
        if (reserved && reserved(token)) {
            throw core::MappingError("TokenRegistry: value " + util::hashing::fingerprint(value) +
                                     " is bound to " + token + ", which also occurs literally in the text");
        }
    }

    inline static void validateEntry(const RegistryEntry &e)
    {
        if (e.value.empty() || !core::isTokenSafeTypeName(e.type) || e.sequence == 0 ||
            core::formatToken(e.type, e.sequence) != e.token)
        {
            throw core::RegistryError("TokenRegistry: inconsistent entry for token '" + e.token + "'");
        }
    }

    // Caller holds the exclusive lock.
    inline std::string findOrAllocateLocked(const std::string &value, const std::string &type,
                                            const ReservedPredicate &reserved)
    {
        auto it = forward_.find(value);
        if (it != forward_.end()) {
            return it->second;
        }

        uint64_t &next = nextSeq_.emplace(type, 1).first->second;
        uint64_t n = next;
        std::string token = core::formatToken(type, n);
        while (reverse_.count(token) > 0 || (reserved && reserved(token))) {
            token = core::formatToken(type, ++n);
        }
        next = n + 1;

        RegistryEntry entry;
        entry.token = token;
        entry.value = value;
        entry.type = type;
        entry.sequence = n;
        reverse_.emplace(token, std::move(entry));
        forward_.emplace(value, token);

        util::logger::debug("TokenRegistry: " + util::hashing::fingerprint(value) + " -> " + token);
        return token;
    }

    // Caller holds the exclusive lock.
    inline void mergeLocked(const std::vector<RegistryEntry> &entries,
                            const std::map<std::string, uint64_t> &counters)
    {
        std::unordered_set<std::string> incomingTokens;
        std::unordered_set<std::string> incomingValues;
        for (const auto &e : entries) {
            validateEntry(e);
            auto byToken = reverse_.find(e.token);
            if (byToken != reverse_.end() && byToken->second.value != e.value) {
                throw core::RegistryError("TokenRegistry: merge conflict, " + e.token +
                                          " is bound to a different value");
            }
            auto byValue = forward_.find(e.value);
            if (byValue != forward_.end() && byValue->second != e.token) {
                throw core::RegistryError("TokenRegistry: merge conflict, value " +
                                          util::hashing::fingerprint(e.value) + " is already " +
                                          byValue->second + ", not " + e.token);
            }
            if (!incomingTokens.insert(e.token).second || !incomingValues.insert(e.value).second) {
                throw core::RegistryError("TokenRegistry: merge input binds " + e.token +
                                          " or its value more than once");
            }
        }

        size_t added = 0;
        for (const auto &e : entries) {
            if (reverse_.emplace(e.token, e).second) {
                forward_.emplace(e.value, e.token);
                ++added;
            }
            uint64_t &next = nextSeq_.emplace(e.type, 1).first->second;
            next = std::max(next, e.sequence + 1);
        }
        for (const auto &pair : counters) {
            uint64_t &next = nextSeq_.emplace(pair.first, 1).first->second;
            next = std::max(next, pair.second);
        }
        util::logger::info("TokenRegistry: merged " + std::to_string(added) + " new entries");
    }

    mutable std::shared_mutex mutex_;
    std::unordered_map<std::string, std::string> forward_;    ///< value -> token
    std::unordered_map<std::string, RegistryEntry> reverse_;  ///< token -> entry
    std::unordered_map<std::string, uint64_t> nextSeq_;       ///< type -> next sequence
};

} // namespace registry
} // namespace tokenvault

#endif // TOKENVAULT_REGISTRY_TOKEN_REGISTRY_HPP
