#ifndef TOKENVAULT_ENGINE_BATCH_COORDINATOR_HPP
#define TOKENVAULT_ENGINE_BATCH_COORDINATOR_HPP

#include <exception>
#include <future>
#include <string>
#include <utility>
#include <vector>
#include "core/results.hpp"
#include "core/token_assigner.hpp"
#include "engine/tokenization_engine.hpp"
#include "policy/policy_resolver.hpp"
#include "util/logger.hpp"
#include "util/thread_pool.hpp"

/**
 * @file batch_coordinator.hpp
 * @brief Tokenizes or redacts many documents with one shared registry.
 *
 * Detection, filtering and overlap resolution run on the worker pool.
 * Registration and substitution then run in input order on the calling
 * thread, so token numbers do not depend on worker scheduling.
 *
 * A document whose detection fails is reported in its BatchItem and never
 * touches the registry; the other documents are unaffected.
 */

namespace tokenvault {
namespace engine {

template <typename Result>
struct BatchItem
{
    size_t index = 0;
    bool ok = false;
    Result result;
    std::string error; ///< Set when !ok
};

using TokenizeBatchItem = BatchItem<core::TokenizeResult>;
using RedactBatchItem = BatchItem<core::RedactResult>;

class BatchCoordinator
{
public:
    /**
     * @param engine Not owned; must outlive the coordinator.
     * @param threads Worker count, 0 for hardware concurrency.
     */
    explicit BatchCoordinator(TokenizationEngine &engine, size_t threads = 0)
        : engine_(engine),
          pool_(threads)
    {
    }

    /**
     * @throw core::PolicyError for an unknown policy, before any detection.
     * @throw std::logic_error for registry scope without a registry.
     */
    std::vector<TokenizeBatchItem> tokenizeBatch(const std::vector<std::string> &documents,
                                                 const policy::PolicySelection &selection,
                                                 core::TokenScope scope = core::TokenScope::Registry)
    {
        engine_.requireRegistryFor(scope);
        policy::ResolvedPolicy resolved = engine_.resolvePolicy(selection);
        util::logger::info("BatchCoordinator: tokenizing " + std::to_string(documents.size()) +
                           " document(s), policy=" + resolved.name + ", scope=" + core::scopeName(scope));

        return run<core::TokenizeResult>(documents, resolved, [this, scope](PreparedDocument doc) {
            return engine_.finishTokenize(std::move(doc), scope);
        });
    }

    std::vector<RedactBatchItem> redactBatch(const std::vector<std::string> &documents,
                                             const policy::PolicySelection &selection)
    {
        policy::ResolvedPolicy resolved = engine_.resolvePolicy(selection);
        util::logger::info("BatchCoordinator: redacting " + std::to_string(documents.size()) +
                           " document(s), policy=" + resolved.name);

        return run<core::RedactResult>(documents, resolved, [this](PreparedDocument doc) {
            return engine_.finishRedact(std::move(doc));
        });
    }

    size_t threadCount() const { return pool_.threadCount(); }

private:
    template <typename Result, typename Finish>
    std::vector<BatchItem<Result>> run(const std::vector<std::string> &documents,
                                       const policy::ResolvedPolicy &resolved,
                                       Finish finish)
    {
        std::vector<std::future<PreparedDocument>> pending;
        pending.reserve(documents.size());
        // Queued tasks reference documents and resolved; wait for them on every exit path.
        PendingGuard guard{pending};
        for (const auto &doc : documents) {
            const std::string *text = &doc;
            pending.push_back(pool_.enqueue([this, text, &resolved] {
                return engine_.prepare(*text, resolved);
            }));
        }

        std::vector<BatchItem<Result>> items(documents.size());
        size_t failures = 0;
        for (size_t i = 0; i < pending.size(); ++i) {
            items[i].index = i;
            try {
                items[i].result = finish(pending[i].get());
                items[i].ok = true;
            }
            catch (const std::exception &ex) {
                items[i].error = ex.what();
                ++failures;
                util::logger::warn("BatchCoordinator: document " + std::to_string(i) + " failed: " + ex.what());
            }
        }

        if (failures > 0) {
            util::logger::warn("BatchCoordinator: " + std::to_string(failures) + " of " +
                               std::to_string(documents.size()) + " document(s) failed");
        }
        return items;
    }

    struct PendingGuard
    {
        std::vector<std::future<PreparedDocument>> &futures;

        ~PendingGuard()
        {
            for (auto &f : futures) {
                if (f.valid()) {
                    f.wait();
                }
            }
        }
    };

    TokenizationEngine &engine_;
    util::ThreadPool pool_;
};

} // namespace engine
} // namespace tokenvault

#endif // TOKENVAULT_ENGINE_BATCH_COORDINATOR_HPP
