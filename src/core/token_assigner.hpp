#ifndef TOKENVAULT_CORE_TOKEN_ASSIGNER_HPP
#define TOKENVAULT_CORE_TOKEN_ASSIGNER_HPP

#include <cstdint>
#include <set>
#include <stdexcept>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>
#include "core/entity.hpp"
#include "core/token.hpp"
#include "registry/token_registry.hpp"

/**
 * @file token_assigner.hpp
 * @brief Maps a real value (and its entity type) to a placeholder token.
 *
 * Two scopes:
 *   - PerCall: counters start at 1 for each type and live for one call. A
 *     value seen twice in the same call gets the same token; separate calls
 *     number independently.
 *   - Registry: tokens come from a shared TokenRegistry and are stable across
 *     calls and documents.
 *
 * The assigner trusts the entity type it is given; it never re-classifies.
 * Tokens listed as reserved (literal token text already present in the
 * source) are never allocated.
 */

namespace tokenvault {
namespace core {

enum class TokenScope {
    PerCall,
    Registry
};

inline const char *scopeName(TokenScope scope)
{
    return scope == TokenScope::PerCall ? "per-call" : "registry";
}

/**
 * @class TokenAssigner
 * @brief Interface used by the engine: prepare() once per document with the
 *        spans to substitute, then assign() for each of them in text order.
 */
class TokenAssigner
{
public:
    virtual ~TokenAssigner() = default;

    /// Called before any assign(). Registry scope registers all values here, atomically.
    virtual void prepare(const std::vector<Entity> &entities) { (void)entities; }

    virtual std::string assign(const Entity &entity) = 0;
};

/**
 * @class CallScopeAssigner
 * @brief Per-call numbering: first occurrence wins, later identical values reuse it.
 */
class CallScopeAssigner : public TokenAssigner
{
public:
    explicit CallScopeAssigner(std::set<std::string> reserved = {})
        : reserved_(std::move(reserved))
    {
    }

    std::string assign(const Entity &entity) override
    {
        auto it = byValue_.find(entity.text);
        if (it != byValue_.end()) {
            return it->second;
        }

        uint64_t &next = nextSeq_.emplace(entity.type, 1).first->second;
        std::string token = formatToken(entity.type, next++);
        while (reserved_.count(token) > 0) {
            token = formatToken(entity.type, next++);
        }
        byValue_.emplace(entity.text, token);
        return token;
    }

private:
    std::set<std::string> reserved_;
    std::unordered_map<std::string, std::string> byValue_;
    std::unordered_map<std::string, uint64_t> nextSeq_;
};

/**
 * @class RegistryScopeAssigner
 * @brief Draws tokens from a shared registry.
 *
 * prepare() registers every value of the document in one registry write, so
 * either all of them are registered or none is.
 */
class RegistryScopeAssigner : public TokenAssigner
{
public:
    RegistryScopeAssigner(registry::TokenRegistry &tokenRegistry, std::set<std::string> reserved = {})
        : registry_(tokenRegistry),
          reserved_(std::move(reserved))
    {
    }

    void prepare(const std::vector<Entity> &entities) override
    {
        std::vector<std::pair<std::string, std::string>> valuesAndTypes;
        valuesAndTypes.reserve(entities.size());
        for (const auto &e : entities) {
            valuesAndTypes.emplace_back(e.text, e.type);
        }

        const std::set<std::string> &reserved = reserved_;
        std::vector<std::string> tokens = registry_.registerValues(
            valuesAndTypes, [&reserved](const std::string &token) { return reserved.count(token) > 0; });

        for (size_t i = 0; i < entities.size(); ++i) {
            byValue_[entities[i].text] = tokens[i];
        }
    }

    std::string assign(const Entity &entity) override
    {
        auto it = byValue_.find(entity.text);
        if (it != byValue_.end()) {
            return it->second;
        }
        // not part of prepare(): single registration
        std::string token = registry_.getOrCreate(entity.text, entity.type,
            [this](const std::string &t) { return reserved_.count(t) > 0; });
        byValue_.emplace(entity.text, token);
        return token;
    }

private:
    registry::TokenRegistry &registry_;
    std::set<std::string> reserved_;
    std::unordered_map<std::string, std::string> byValue_;
};

} // namespace core
} // namespace tokenvault

#endif // TOKENVAULT_CORE_TOKEN_ASSIGNER_HPP
