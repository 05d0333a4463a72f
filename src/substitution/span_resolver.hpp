#ifndef TOKENVAULT_SUBSTITUTION_SPAN_RESOLVER_HPP
#define TOKENVAULT_SUBSTITUTION_SPAN_RESOLVER_HPP

#include <algorithm>
#include <iterator>
#include <map>
#include <set>
#include <string>
#include <tuple>
#include <vector>
#include "core/entity.hpp"

/**
 * @file span_resolver.hpp
 * @brief Decides which detected spans are substituted when spans overlap.
 *
 * Precedence, highest first:
 *   1. higher confidence
 *   2. longer span
 *   3. earlier start
 *   4. type name, then text (only to make the order total)
 *
 * Spans are accepted greedily in that order; a span overlapping an accepted
 * one is dropped from substitution but stays in the reported list.
 */

namespace tokenvault {
namespace substitution {

/**
 * @struct SpanResolution
 * @brief Output of resolveOverlaps(). All three lists are ordered by start offset.
 */
struct SpanResolution
{
    std::vector<core::Entity> reported; ///< Every distinct entity
    std::vector<core::Entity> winners;  ///< Non-overlapping spans to substitute
    std::vector<core::Entity> dropped;  ///< Spans that lost an overlap
};

inline bool byStartOffset(const core::Entity &a, const core::Entity &b)
{
    if (a.start != b.start) return a.start < b.start;
    if (a.end != b.end) return a.end < b.end;
    return a.type < b.type;
}

inline bool byPrecedence(const core::Entity &a, const core::Entity &b)
{
    if (a.confidence != b.confidence) return a.confidence > b.confidence;
    if (a.length() != b.length()) return a.length() > b.length();
    if (a.start != b.start) return a.start < b.start;
    if (a.type != b.type) return a.type < b.type;
    return a.text < b.text;
}

/**
 * @brief Resolve overlapping spans deterministically.
 *
 * Entities reported twice with the same type and span are collapsed into the
 * one with the highest confidence.
 */
inline SpanResolution resolveOverlaps(std::vector<core::Entity> entities)
{
    SpanResolution out;

    std::sort(entities.begin(), entities.end(), byPrecedence);

    // duplicates: the first one in precedence order has the best confidence
    std::vector<core::Entity> distinct;
    distinct.reserve(entities.size());
    std::set<std::tuple<size_t, size_t, std::string>> seen;
    for (auto &e : entities) {
        if (seen.emplace(e.start, e.end, e.type).second) {
            distinct.push_back(std::move(e));
        }
    }

    std::map<size_t, size_t> accepted; // start -> end of accepted spans
    for (const auto &e : distinct) {
        bool clash = false;
        auto next = accepted.lower_bound(e.start);
        if (next != accepted.end() && next->first < e.end) {
            clash = true;
        }
        if (!clash && next != accepted.begin()) {
            auto prev = std::prev(next);
            if (prev->second > e.start) {
                clash = true;
            }
        }

        if (clash) {
            out.dropped.push_back(e);
        } else {
            accepted.emplace(e.start, e.end);
            out.winners.push_back(e);
        }
        out.reported.push_back(e);
    }

    std::sort(out.reported.begin(), out.reported.end(), byStartOffset);
    std::sort(out.winners.begin(), out.winners.end(), byStartOffset);
    std::sort(out.dropped.begin(), out.dropped.end(), byStartOffset);
    return out;
}

} // namespace substitution
} // namespace tokenvault

#endif // TOKENVAULT_SUBSTITUTION_SPAN_RESOLVER_HPP
