#ifndef TOKENVAULT_POLICY_POLICY_RESOLVER_HPP
#define TOKENVAULT_POLICY_POLICY_RESOLVER_HPP

#include <set>
#include <string>
#include <utility>
#include <vector>
#include "config/policy_table.hpp"
#include "core/entity.hpp"
#include "core/errors.hpp"
#include "util/logger.hpp"

/**
 * @file policy_resolver.hpp
 * @brief Turns a policy name or an explicit entity-type list into the set of
 *        types a request acts upon.
 *
 * RULES:
 *   - An explicit type list overrides the policy name.
 *   - Named policies come from the closed table in config/policy_table.hpp.
 *   - An unknown name is a PolicyError, raised before any detection call.
 *   - A request naming neither uses the resolver's default policy.
 *   - The region tag is carried through untouched; it only routes detection.
 *
 * USAGE EXAMPLE:
 *   @code
 *   PolicyResolver resolver("basic");
 *   auto p = resolver.resolve(PolicySelection::named("gdpr_eu", "eu"));
 *   auto kept = p.filter(detectedEntities);
 *   @endcode
 */

namespace tokenvault {
namespace policy {

/**
 * @struct PolicySelection
 * @brief What a caller asks for: a policy name, or explicit types, plus a region.
 */
struct PolicySelection
{
    std::string policyName;
    std::vector<std::string> entityTypes;
    std::string region;

    static PolicySelection named(const std::string &name, const std::string &region = "")
    {
        PolicySelection s;
        s.policyName = name;
        s.region = region;
        return s;
    }

    static PolicySelection types(const std::vector<std::string> &types, const std::string &region = "")
    {
        PolicySelection s;
        s.entityTypes = types;
        s.region = region;
        return s;
    }
};

/**
 * @struct ResolvedPolicy
 * @brief The filter applied to detector output before tokenization or redaction.
 */
struct ResolvedPolicy
{
    std::string name;            ///< Policy name, or "custom" for an explicit list
    bool allTypes = false;       ///< True for "strict"
    std::set<std::string> types; ///< Canonical types (empty when allTypes)
    std::string region;

    bool admits(const std::string &type) const
    {
        return allTypes || types.count(type) > 0;
    }

    /// Types handed to the detector; empty means "everything".
    std::vector<std::string> detectorFilter() const
    {
        return allTypes ? std::vector<std::string>() : std::vector<std::string>(types.begin(), types.end());
    }

    /// Entities of excluded types are removed; they pass through the text untouched.
    std::vector<core::Entity> filter(const std::vector<core::Entity> &entities) const
    {
        std::vector<core::Entity> kept;
        kept.reserve(entities.size());
        for (const auto &e : entities) {
            if (admits(e.type)) {
                kept.push_back(e);
            }
        }
        return kept;
    }
};

/**
 * @class PolicyResolver
 * @brief Stateless after construction; safe to share between threads.
 */
class PolicyResolver
{
public:
    /**
     * @throw core::PolicyError if @p defaultPolicy is not a built-in policy.
     */
    explicit PolicyResolver(const std::string &defaultPolicy = "basic",
                            const std::string &defaultRegion = "")
        : table_(config::getBuiltinPolicies()),
          defaultPolicy_(defaultPolicy),
          defaultRegion_(defaultRegion)
    {
        findPolicy(defaultPolicy_);
    }

    /**
     * @throw core::PolicyError for an unknown policy name or a malformed type.
     */
    ResolvedPolicy resolve(const PolicySelection &selection) const
    {
        ResolvedPolicy resolved;
        resolved.region = selection.region.empty() ? defaultRegion_ : selection.region;

        if (!selection.entityTypes.empty()) {
            resolved.name = "custom";
            for (const auto &t : selection.entityTypes) {
                resolved.types.insert(core::canonicalEntityType(t));
            }
            if (!selection.policyName.empty()) {
                util::logger::debug("PolicyResolver: explicit entity list overrides policy '" +
                                    selection.policyName + "'");
            }
            return resolved;
        }

        const std::string &name = selection.policyName.empty() ? defaultPolicy_ : selection.policyName;
        const config::PolicyDefinition &def = findPolicy(name);
        resolved.name = def.name;
        resolved.allTypes = def.allTypes;
        resolved.types.insert(def.entityTypes.begin(), def.entityTypes.end());
        return resolved;
    }

    ResolvedPolicy resolve(const std::string &policyName, const std::string &region = "") const
    {
        return resolve(PolicySelection::named(policyName, region));
    }

    std::vector<std::string> policyNames() const
    {
        std::vector<std::string> names;
        names.reserve(table_.size());
        for (const auto &p : table_) {
            names.push_back(p.name);
        }
        return names;
    }

    const std::string &defaultPolicy() const { return defaultPolicy_; }

private:
    const config::PolicyDefinition &findPolicy(const std::string &name) const
    {
        for (const auto &p : table_) {
            if (p.name == name) {
                return p;
            }
        }
        throw core::PolicyError("PolicyResolver: unknown policy '" + name + "'");
    }

    std::vector<config::PolicyDefinition> table_;
    std::string defaultPolicy_;
    std::string defaultRegion_;
};

} // namespace policy
} // namespace tokenvault

#endif // TOKENVAULT_POLICY_POLICY_RESOLVER_HPP
