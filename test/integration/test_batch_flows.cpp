// test/integration/test_batch_flows.cpp
// -----------------------------------------------------------
// Multi-document tokenization and redaction through BatchCoordinator.

#include <gtest/gtest.h>
#include <string>
#include <vector>

#include "core/errors.hpp"
#include "detection/entity_detector.hpp"
#include "engine/batch_coordinator.hpp"
#include "engine/tokenization_engine.hpp"
#include "fake_detector.hpp"
#include "registry/token_registry.hpp"

using namespace tokenvault;
using tokenvault::core::TokenScope;
using tokenvault::engine::BatchCoordinator;
using tokenvault::engine::TokenizationEngine;
using tokenvault::policy::PolicyResolver;
using tokenvault::policy::PolicySelection;

namespace {

class BatchFlowTest : public ::testing::Test {
  protected:
    BatchFlowTest()
        : detector(test::defaultGazetteer()),
          router(&detector),
          engine(&router, PolicyResolver("basic"), &tokenRegistry) {}

    test::FakeDetector detector;
    detection::DetectorRouter router;
    registry::TokenRegistry tokenRegistry;
    TokenizationEngine engine;
};

} // namespace

TEST_F(BatchFlowTest, SameValueSameTokenAcrossDocuments) {
    BatchCoordinator coordinator(engine, 4);
    std::vector<std::string> docs = {"Marie Dupont opened the account.",
                                     "Hans Mueller called Marie Dupont.",
                                     "Letter from Marie Dupont."};
    auto items = coordinator.tokenizeBatch(docs, PolicySelection());
    ASSERT_EQ(items.size(), 3u);
    for (const auto& item : items) {
        ASSERT_TRUE(item.ok) << item.error;
        EXPECT_EQ(item.result.mapping.findToken("Marie Dupont").value_or(""), "<Person_1>");
    }
    EXPECT_EQ(items[1].result.text, "<Person_2> called <Person_1>.");
    for (size_t i = 0; i < docs.size(); ++i) {
        EXPECT_EQ(items[i].index, i);
        EXPECT_EQ(engine.detokenize(items[i].result.text, items[i].result.mapping).text, docs[i]);
    }
}

// Numbers follow document order whatever the worker scheduling.
TEST_F(BatchFlowTest, NumberingFollowsInputOrder) {
    std::vector<std::string> docs = {"Anna Schmidt", "Bob Jones", "Anna Schmidt and Bob Jones"};
    for (int round = 0; round < 10; ++round) {
        registry::TokenRegistry fresh;
        engine.SetRegistry(&fresh);
        BatchCoordinator coordinator(engine, 8);
        auto items = coordinator.tokenizeBatch(docs, PolicySelection());
        ASSERT_TRUE(items[2].ok);
        EXPECT_EQ(items[0].result.text, "<Person_1>");
        EXPECT_EQ(items[1].result.text, "<Person_2>");
        EXPECT_EQ(items[2].result.text, "<Person_1> and <Person_2>");
    }
    engine.SetRegistry(&tokenRegistry);
}

TEST_F(BatchFlowTest, FailedDocumentIsReportedAndRegistersNothing) {
    BatchCoordinator coordinator(engine, 2);
    std::vector<std::string> docs = {"Marie Dupont signed.", "FAIL: Zoë Müller", "Hans Mueller and Marie Dupont"};
    auto items = coordinator.tokenizeBatch(docs, PolicySelection());
    ASSERT_EQ(items.size(), 3u);

    EXPECT_TRUE(items[0].ok);
    EXPECT_FALSE(items[1].ok);
    EXPECT_EQ(items[1].index, 1u);
    EXPECT_NE(items[1].error.find("service unavailable"), std::string::npos);
    EXPECT_TRUE(items[2].ok);
    EXPECT_EQ(items[2].result.text, "<Person_2> and <Person_1>");

    EXPECT_FALSE(tokenRegistry.lookupToken("Zoë Müller").has_value());
    EXPECT_EQ(tokenRegistry.size(), 2u);
}

TEST_F(BatchFlowTest, LiteralRegistryTokenFailsOnlyItsDocument) {
    BatchCoordinator coordinator(engine, 2);
    std::vector<std::string> docs = {"Marie Dupont signed.", "Copy of <Person_1> for Marie Dupont.",
                                     "Hans Mueller"};
    auto items = coordinator.tokenizeBatch(docs, PolicySelection());
    ASSERT_EQ(items.size(), 3u);

    EXPECT_TRUE(items[0].ok);
    EXPECT_FALSE(items[1].ok);
    EXPECT_EQ(items[1].index, 1u);
    EXPECT_NE(items[1].error.find("<Person_1>"), std::string::npos);
    ASSERT_TRUE(items[2].ok) << items[2].error;
    EXPECT_EQ(items[2].result.text, "<Person_2>");
    EXPECT_EQ(tokenRegistry.size(), 2u);
}

TEST_F(BatchFlowTest, CoordinatorIsReusableAfterFailedBatch) {
    BatchCoordinator coordinator(engine, 4);
    std::vector<std::string> failing(16, "FAIL Marie Dupont");
    auto failed = coordinator.tokenizeBatch(failing, PolicySelection());
    ASSERT_EQ(failed.size(), failing.size());
    for (const auto& item : failed) {
        EXPECT_FALSE(item.ok);
    }
    EXPECT_EQ(tokenRegistry.size(), 0u);

    auto items = coordinator.tokenizeBatch({"Marie Dupont", "Hans Mueller"}, PolicySelection());
    ASSERT_TRUE(items[0].ok && items[1].ok);
    EXPECT_EQ(items[1].result.text, "<Person_2>");
    EXPECT_EQ(detector.calls(), 18);
}

TEST_F(BatchFlowTest, PerCallScopeNumbersEachDocumentIndependently) {
    BatchCoordinator coordinator(engine, 2);
    auto items = coordinator.tokenizeBatch({"Hans Mueller", "Marie Dupont"}, PolicySelection(),
                                           TokenScope::PerCall);
    EXPECT_EQ(items[0].result.text, "<Person_1>");
    EXPECT_EQ(items[1].result.text, "<Person_1>");
    EXPECT_EQ(tokenRegistry.size(), 0u);
}

TEST_F(BatchFlowTest, UnknownPolicyFailsWholeBatchBeforeDetection) {
    BatchCoordinator coordinator(engine, 2);
    EXPECT_THROW(coordinator.tokenizeBatch({"Hans Mueller"}, PolicySelection::named("none")),
                 core::PolicyError);
    EXPECT_THROW(coordinator.redactBatch({"Hans Mueller"}, PolicySelection::named("none")),
                 core::PolicyError);
    EXPECT_EQ(detector.calls(), 0);
}

TEST_F(BatchFlowTest, RedactBatch) {
    BatchCoordinator coordinator(engine, 3);
    auto items = coordinator.redactBatch({"Hans Mueller wrote.", "FAIL", "Mail marie@example.fr"},
                                         PolicySelection());
    ASSERT_EQ(items.size(), 3u);
    EXPECT_EQ(items[0].result.text, "[REDACTED-Person] wrote.");
    EXPECT_FALSE(items[1].ok);
    EXPECT_EQ(items[2].result.text, "Mail [REDACTED-EmailAddress]");
    EXPECT_EQ(tokenRegistry.size(), 0u);
}

TEST_F(BatchFlowTest, EmptyBatch) {
    BatchCoordinator coordinator(engine, 1);
    EXPECT_TRUE(coordinator.tokenizeBatch({}, PolicySelection()).empty());
    EXPECT_EQ(coordinator.threadCount(), 1u);
}
