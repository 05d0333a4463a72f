#ifndef TOKENVAULT_CORE_RESULTS_HPP
#define TOKENVAULT_CORE_RESULTS_HPP

#include <string>
#include <vector>
#include "core/entity.hpp"
#include "core/mapping.hpp"

/**
 * @file results.hpp
 * @brief Values returned by the engine. Created per call and owned by the caller.
 */

namespace tokenvault {
namespace core {

/**
 * @struct TokenizeResult
 * @brief Tokenized text, the mapping that reverses it, and the entities that
 *        were acted upon (ordered by start offset).
 *
 * Overlap losers appear in @c entities but have no token in the text; see
 * @c substituted for the subset that was replaced.
 */
struct TokenizeResult
{
    std::string text;
    Mapping mapping;
    std::vector<Entity> entities;
    std::vector<Entity> substituted;

    size_t entitiesCount() const { return entities.size(); }
};

/**
 * @struct RedactResult
 * @brief One-way transformation: no mapping is kept.
 */
struct RedactResult
{
    std::string text;
    std::vector<Entity> entities;

    size_t entitiesCount() const { return entities.size(); }
};

/**
 * @struct DetokenizeResult
 * @brief Restored text plus a report of what could not be restored.
 */
struct DetokenizeResult
{
    std::string text;
    size_t replaced = 0;                 ///< Token occurrences substituted
    std::vector<std::string> unresolved; ///< Well-formed tokens absent from the mapping, in order of occurrence

    bool complete() const { return unresolved.empty(); }
};

} // namespace core
} // namespace tokenvault

#endif // TOKENVAULT_CORE_RESULTS_HPP
