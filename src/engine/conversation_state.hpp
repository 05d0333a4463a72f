#ifndef TOKENVAULT_ENGINE_CONVERSATION_STATE_HPP
#define TOKENVAULT_ENGINE_CONVERSATION_STATE_HPP

#include <string>
#include <utility>
#include "core/mapping.hpp"
#include "core/results.hpp"
#include "engine/tokenization_engine.hpp"
#include "policy/policy_resolver.hpp"
#include "registry/token_registry.hpp"

/**
 * @file conversation_state.hpp
 * @brief Accumulates the mapping of a multi-turn exchange so that replies
 *        referring to earlier turns can be detokenized.
 *
 * Turns tokenized through tokenizeTurn() draw from a session registry, so a
 * value seen in turn 1 keeps its token in turn 5 and two different values
 * never share a token within the conversation.
 */

namespace tokenvault {
namespace engine {

class ConversationState
{
public:
    ConversationState() = default;

    ConversationState(const ConversationState&) = delete;
    ConversationState& operator=(const ConversationState&) = delete;

    /**
     * @brief Tokenize one turn against the session registry and absorb its mapping.
     */
    core::TokenizeResult tokenizeTurn(TokenizationEngine &engine,
                                      const std::string &text,
                                      const policy::PolicySelection &selection)
    {
        core::TokenizeResult result = engine.tokenize(text, selection, session_);
        absorb(result);
        return result;
    }

    /**
     * @brief Merge the mapping of a result produced elsewhere.
     * @throw core::MappingError if a token is already bound to another value,
     *        core::RegistryError if a value already has another token in this
     *        conversation. The state is unchanged in both cases.
     */
    void absorb(const core::TokenizeResult &result)
    {
        core::Mapping merged = mapping_;
        merged.update(result.mapping);
        session_.merge(result.mapping);
        mapping_ = std::move(merged);
        ++turns_;
    }

    core::DetokenizeResult detokenize(const TokenizationEngine &engine, const std::string &text) const
    {
        return engine.detokenize(text, mapping_);
    }

    const core::Mapping &mapping() const { return mapping_; }
    size_t turns() const { return turns_; }

private:
    core::Mapping mapping_;
    registry::TokenRegistry session_;
    size_t turns_ = 0;
};

} // namespace engine
} // namespace tokenvault

#endif // TOKENVAULT_ENGINE_CONVERSATION_STATE_HPP
