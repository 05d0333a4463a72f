#ifndef TOKENVAULT_ENGINE_TOKENIZATION_ENGINE_HPP
#define TOKENVAULT_ENGINE_TOKENIZATION_ENGINE_HPP

#include <memory>
#include <set>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>
#include "core/entity.hpp"
#include "core/errors.hpp"
#include "core/mapping.hpp"
#include "core/results.hpp"
#include "core/token_assigner.hpp"
#include "detection/entity_detector.hpp"
#include "policy/policy_resolver.hpp"
#include "registry/token_registry.hpp"
#include "substitution/span_resolver.hpp"
#include "substitution/substitution_engine.hpp"
#include "util/logger.hpp"

/**
 * @file tokenization_engine.hpp
 * @brief The exposed operations: tokenize, detokenize, redact, and applying
 *        known values to text that was never scanned.
 *
 * FLOW (tokenize):
 *   1. resolve the policy (unknown name -> PolicyError, before detection)
 *   2. detect through the router, with no lock held
 *   3. keep entities admitted by the policy, validate their spans
 *   4. resolve overlapping spans
 *   5. assign tokens (per-call counters, or one atomic registry write)
 *   6. rewrite the text in a single offset-anchored pass
 *
 * Steps 1-4 form prepare(), which touches no shared state; the batch
 * coordinator runs it on worker threads and calls finishTokenize() /
 * finishRedact() in document order.
 *
 * A detection failure surfaces as DetectionError before step 5, so a failed
 * document never registers anything.
 *
 * USAGE EXAMPLE:
 *   @code
 *   detection::PatternDetector detector;
 *   detection::DetectorRouter router(&detector);
 *   registry::TokenRegistry registry;
 *   TokenizationEngine engine(&router, policy::PolicyResolver("basic"), &registry);
 *
 *   auto r = engine.tokenize(text, policy::PolicySelection::named("strict"),
 *                            core::TokenScope::Registry);
 *   auto back = engine.detokenize(r.text, r.mapping); // back.text == text
 *   @endcode
 */

namespace tokenvault {
namespace engine {

/**
 * @struct PreparedDocument
 * @brief A document after detection, filtering and overlap resolution.
 */
struct PreparedDocument
{
    std::string text;
    substitution::SpanResolution spans;
};

class TokenizationEngine
{
public:
    /**
     * @param router Detector routing; may be null when only explicit entity
     *        lists are used. Not owned.
     * @param tokenRegistry Shared registry for TokenScope::Registry; may be null. Not owned.
     */
    explicit TokenizationEngine(detection::DetectorRouter *router,
                                policy::PolicyResolver resolver = policy::PolicyResolver(),
                                registry::TokenRegistry *tokenRegistry = nullptr,
                                bool valueSearchWordBoundary = true)
        : router_(router),
          resolver_(std::move(resolver)),
          registry_(tokenRegistry),
          substitution_(valueSearchWordBoundary)
    {
    }

    void SetRegistry(registry::TokenRegistry *tokenRegistry) { registry_ = tokenRegistry; }
    registry::TokenRegistry *GetRegistry() const { return registry_; }

    const policy::PolicyResolver &resolver() const { return resolver_; }

    // -------------------------------------------------------------------------
    // Tokenization
    // -------------------------------------------------------------------------

    /**
     * @brief Detect with @p selection and tokenize.
     * @throw core::PolicyError, core::DetectionError, core::EntityError,
     *        std::logic_error (registry scope without a registry).
     */
    core::TokenizeResult tokenize(const std::string &text,
                                  const policy::PolicySelection &selection,
                                  core::TokenScope scope = core::TokenScope::PerCall)
    {
        requireRegistryFor(scope);
        policy::ResolvedPolicy resolved = resolver_.resolve(selection);
        return finishTokenize(prepare(text, resolved), scope);
    }

    /**
     * @brief Tokenize using entities supplied by the caller (no detection, no policy filter).
     */
    core::TokenizeResult tokenize(const std::string &text,
                                  const std::vector<core::Entity> &entities,
                                  core::TokenScope scope = core::TokenScope::PerCall)
    {
        requireRegistryFor(scope);
        return finishTokenize(prepareEntities(text, entities), scope);
    }

    /**
     * @brief Tokenize against a registry other than the engine's own, e.g. a
     *        conversation-scoped one.
     */
    core::TokenizeResult tokenize(const std::string &text,
                                  const policy::PolicySelection &selection,
                                  registry::TokenRegistry &target)
    {
        policy::ResolvedPolicy resolved = resolver_.resolve(selection);
        PreparedDocument doc = prepare(text, resolved);
        core::RegistryScopeAssigner assigner(target, substitution::SubstitutionEngine::findTokenLiterals(doc.text));
        return substitute(std::move(doc), assigner);
    }

    /**
     * @brief Steps 5-6 for a prepared document.
     */
    core::TokenizeResult finishTokenize(PreparedDocument doc, core::TokenScope scope)
    {
        std::set<std::string> literals = substitution::SubstitutionEngine::findTokenLiterals(doc.text);
        if (scope == core::TokenScope::Registry) {
            requireRegistryFor(scope);
            core::RegistryScopeAssigner assigner(*registry_, std::move(literals));
            return substitute(std::move(doc), assigner);
        }
        core::CallScopeAssigner assigner(std::move(literals));
        return substitute(std::move(doc), assigner);
    }

    // -------------------------------------------------------------------------
    // Detokenization
    // -------------------------------------------------------------------------

    /**
     * @brief Restore real values. Independent of the registry: only @p mapping is used.
     *        Tokens missing from the mapping stay verbatim and are listed in
     *        DetokenizeResult::unresolved.
     */
    core::DetokenizeResult detokenize(const std::string &text, const core::Mapping &mapping) const
    {
        core::DetokenizeResult result = substitution_.restore(text, mapping);
        if (!result.unresolved.empty()) {
            util::logger::warn("TokenizationEngine: " + std::to_string(result.unresolved.size()) +
                               " token(s) left unresolved during detokenization");
        }
        return result;
    }

    // -------------------------------------------------------------------------
    // Redaction
    // -------------------------------------------------------------------------

    core::RedactResult redact(const std::string &text, const policy::PolicySelection &selection)
    {
        policy::ResolvedPolicy resolved = resolver_.resolve(selection);
        return finishRedact(prepare(text, resolved));
    }

    core::RedactResult redact(const std::string &text, const std::vector<core::Entity> &entities)
    {
        return finishRedact(prepareEntities(text, entities));
    }

    core::RedactResult finishRedact(PreparedDocument doc) const
    {
        core::RedactResult result;
        result.text = substitution_.apply(doc.text, doc.spans.winners, [](const core::Entity &e) {
            return substitution::SubstitutionEngine::redactionMarker(e.type);
        });
        result.entities = std::move(doc.spans.reported);
        return result;
    }

    // -------------------------------------------------------------------------
    // Value search: known pairs applied to fresh text
    // -------------------------------------------------------------------------

    /**
     * @brief Replace every value known to @p mapping by its token (longest
     *        value first), without detection. The result mapping holds the
     *        pairs that were applied.
     * @throw core::MappingError if an applied token also occurs literally in
     *        @p text, since restoring would rewrite that literal too.
     */
    core::TokenizeResult applyKnownValues(const std::string &text, const core::Mapping &mapping) const
    {
        std::vector<std::pair<std::string, std::string>> known;
        known.reserve(mapping.size());
        for (const auto &pair : mapping) {
            known.emplace_back(pair.second, pair.first);
        }
        core::TokenizeResult result;
        result.text = substitution_.replaceKnownValues(text, known, &result.mapping);
        std::set<std::string> literals = substitution::SubstitutionEngine::findTokenLiterals(text);
        for (const auto &pair : result.mapping) {
            if (literals.count(pair.first) != 0) {
                throw core::MappingError("TokenizationEngine: " + pair.first +
                                         " occurs literally in the text and also replaces a known value");
            }
        }
        return result;
    }

    /**
     * @brief applyKnownValues() with the engine's registry.
     * @throw std::logic_error if no registry is attached.
     */
    core::TokenizeResult applyRegistry(const std::string &text) const
    {
        requireRegistryFor(core::TokenScope::Registry);
        return applyKnownValues(text, registry_->toMapping());
    }

    // -------------------------------------------------------------------------
    // Building blocks shared with the batch coordinator
    // -------------------------------------------------------------------------

    policy::ResolvedPolicy resolvePolicy(const policy::PolicySelection &selection) const
    {
        return resolver_.resolve(selection);
    }

    /**
     * @brief Steps 2-4. Touches no shared mutable state.
     */
    PreparedDocument prepare(const std::string &text, const policy::ResolvedPolicy &resolved) const
    {
        std::vector<core::Entity> detected = detect(text, resolved);
        return prepareEntities(text, resolved.filter(canonicalTypes(std::move(detected))));
    }

    void requireRegistryFor(core::TokenScope scope) const
    {
        if (scope == core::TokenScope::Registry && registry_ == nullptr) {
            throw std::logic_error("TokenizationEngine: registry scope requested but no registry attached");
        }
    }

private:
    std::vector<core::Entity> detect(const std::string &text, const policy::ResolvedPolicy &resolved) const
    {
        if (!router_) {
            throw core::DetectionError("TokenizationEngine: no detector configured");
        }
        detection::EntityDetector &detector = router_->route(resolved.region);
        try {
            return detector.detect(text, resolved.detectorFilter());
        }
        catch (const core::DetectionError &) {
            throw;
        }
        catch (const std::exception &ex) {
            throw core::DetectionError("TokenizationEngine: detector '" + detector.name() +
                                       "' failed: " + ex.what());
        }
    }

    static std::vector<core::Entity> canonicalTypes(std::vector<core::Entity> entities)
    {
        for (auto &e : entities) {
            try {
                e.type = core::canonicalEntityType(e.type);
            }
            catch (const core::PolicyError &ex) {
                throw core::EntityError(ex.what());
            }
        }
        return entities;
    }

    PreparedDocument prepareEntities(const std::string &text, std::vector<core::Entity> entities) const
    {
        entities = canonicalTypes(std::move(entities));
        for (auto &e : entities) {
            core::validateEntity(text, e);
        }
        PreparedDocument doc;
        doc.text = text;
        doc.spans = substitution::resolveOverlaps(std::move(entities));
        if (!doc.spans.dropped.empty()) {
            util::logger::debug("TokenizationEngine: " + std::to_string(doc.spans.dropped.size()) +
                                " overlapping span(s) not substituted");
        }
        return doc;
    }

    core::TokenizeResult substitute(PreparedDocument doc, core::TokenAssigner &assigner) const
    {
        core::TokenizeResult result;
        assigner.prepare(doc.spans.winners);
        result.text = substitution_.apply(doc.text, doc.spans.winners, [&](const core::Entity &e) {
            std::string token = assigner.assign(e);
            result.mapping.insert(token, e.text);
            return token;
        });
        result.entities = std::move(doc.spans.reported);
        result.substituted = std::move(doc.spans.winners);
        return result;
    }

    detection::DetectorRouter *router_;
    policy::PolicyResolver resolver_;
    registry::TokenRegistry *registry_;
    substitution::SubstitutionEngine substitution_;
};

} // namespace engine
} // namespace tokenvault

#endif // TOKENVAULT_ENGINE_TOKENIZATION_ENGINE_HPP
