// test/integration/test_tokenization_flows.cpp
// -----------------------------------------------------------
// End-to-end tokenize / detokenize / redact through TokenizationEngine.

#include <gtest/gtest.h>
#include <stdexcept>
#include <string>
#include <vector>

#include "core/errors.hpp"
#include "detection/entity_detector.hpp"
#include "engine/tokenization_engine.hpp"
#include "fake_detector.hpp"
#include "registry/token_registry.hpp"

using namespace tokenvault;
using tokenvault::core::TokenScope;
using tokenvault::engine::TokenizationEngine;
using tokenvault::policy::PolicyResolver;
using tokenvault::policy::PolicySelection;

namespace {

class TokenizationFlowTest : public ::testing::Test {
  protected:
    TokenizationFlowTest()
        : detector(test::defaultGazetteer()),
          router(&detector),
          engine(&router, PolicyResolver("basic"), &tokenRegistry) {}

    test::FakeDetector detector;
    detection::DetectorRouter router;
    registry::TokenRegistry tokenRegistry;
    TokenizationEngine engine;
};

} // namespace

TEST_F(TokenizationFlowTest, TokenizesPersonAndEmail) {
    const std::string text = "Hans Mueller (hans.mueller@example.de) called about invoice 123.";
    core::TokenizeResult r = engine.tokenize(text, PolicySelection::named("basic"));

    EXPECT_EQ(r.text, "<Person_1> (<EmailAddress_1>) called about invoice 123.");
    EXPECT_EQ(r.mapping.size(), 2u);
    EXPECT_EQ(r.mapping.findValue("<Person_1>").value_or(""), "Hans Mueller");
    EXPECT_EQ(r.mapping.findValue("<EmailAddress_1>").value_or(""), "hans.mueller@example.de");
    EXPECT_EQ(r.entitiesCount(), 2u);

    core::DetokenizeResult back = engine.detokenize(r.text, r.mapping);
    EXPECT_EQ(back.text, text);
    EXPECT_TRUE(back.complete());
    EXPECT_EQ(back.replaced, 2u);
}

TEST_F(TokenizationFlowTest, RepeatedValueSharesOneToken) {
    core::TokenizeResult r =
        engine.tokenize("Marie Dupont met Hans Mueller, then Marie Dupont left.", PolicySelection());
    EXPECT_EQ(r.text, "<Person_1> met <Person_2>, then <Person_1> left.");
    EXPECT_EQ(r.mapping.size(), 2u);
}

TEST_F(TokenizationFlowTest, PolicyFiltersTypes) {
    const std::string text = "Pay DE89370400440532013000 for Marie Dupont.";
    core::TokenizeResult basic = engine.tokenize(text, PolicySelection::named("basic"));
    EXPECT_EQ(basic.text, "Pay DE89370400440532013000 for <Person_1>.");

    core::TokenizeResult gdpr = engine.tokenize(text, PolicySelection::named("gdpr_eu"));
    EXPECT_EQ(gdpr.text, "Pay <IBAN_1> for <Person_1>.");

    core::TokenizeResult custom = engine.tokenize(text, PolicySelection::types({"iban"}));
    EXPECT_EQ(custom.text, "Pay <IBAN_1> for Marie Dupont.");
}

TEST_F(TokenizationFlowTest, UnknownPolicyFailsBeforeDetection) {
    EXPECT_THROW(engine.tokenize("Hans Mueller", PolicySelection::named("unknown")), core::PolicyError);
    EXPECT_THROW(engine.redact("Hans Mueller", PolicySelection::named("unknown")), core::PolicyError);
    EXPECT_EQ(detector.calls(), 0);
}

TEST_F(TokenizationFlowTest, OverlapLosersAreReportedNotSubstituted) {
    core::TokenizeResult r = engine.tokenize("Marie Dupont", PolicySelection::named("strict"));
    EXPECT_EQ(r.text, "<Person_1>");
    EXPECT_EQ(r.entitiesCount(), 3u); // Marie Dupont, Marie, Dupont
    ASSERT_EQ(r.substituted.size(), 1u);
    EXPECT_EQ(r.substituted[0].text, "Marie Dupont");
}

TEST_F(TokenizationFlowTest, LiteralTokensInSourceSurviveRoundTrip) {
    const std::string text = "User typed <Person_1> before Marie Dupont arrived.";
    core::TokenizeResult r = engine.tokenize(text, PolicySelection());
    EXPECT_EQ(r.text, "User typed <Person_1> before <Person_2> arrived.");

    core::DetokenizeResult back = engine.detokenize(r.text, r.mapping);
    EXPECT_EQ(back.text, text);
    ASSERT_EQ(back.unresolved.size(), 1u);
    EXPECT_EQ(back.unresolved[0], "<Person_1>");
}

TEST_F(TokenizationFlowTest, RoundTripWithMultibyteText) {
    const std::string text = "Zoë Müller schrieb an marie@example.fr.";
    core::TokenizeResult r = engine.tokenize(text, PolicySelection::named("strict"));
    EXPECT_EQ(r.text, "<Person_1> schrieb an <EmailAddress_1>.");
    EXPECT_EQ(engine.detokenize(r.text, r.mapping).text, text);
}

TEST_F(TokenizationFlowTest, RedactionIsIdempotent) {
    const std::string text = "Hans Mueller (hans.mueller@example.de) called.";
    core::RedactResult once = engine.redact(text, PolicySelection());
    EXPECT_EQ(once.text, "[REDACTED-Person] ([REDACTED-EmailAddress]) called.");
    EXPECT_EQ(once.entitiesCount(), 2u);

    core::RedactResult twice = engine.redact(once.text, PolicySelection());
    EXPECT_EQ(twice.text, once.text);
    EXPECT_EQ(twice.entitiesCount(), 0u);
}

TEST_F(TokenizationFlowTest, ExplicitEntitiesSkipDetection) {
    const std::string text = "Hans Mueller (hans.mueller@example.de) called.";
    std::vector<core::Entity> entities = {{"email address", "", 14, 37, 1.0}};
    core::TokenizeResult r = engine.tokenize(text, entities);
    EXPECT_EQ(r.text, "Hans Mueller (<EmailAddress_1>) called.");
    EXPECT_EQ(detector.calls(), 0);

    std::vector<core::Entity> bad = {{"Person", "Hans", 0, 4, 1.0}, {"Person", "", 40, 90, 1.0}};
    EXPECT_THROW(engine.tokenize(text, bad), core::EntityError);
    EXPECT_THROW(engine.redact(text, bad), core::EntityError);
}

TEST_F(TokenizationFlowTest, RegistryScopeIsConsistentAcrossCalls) {
    core::TokenizeResult first = engine.tokenize("Marie Dupont wrote.", PolicySelection(), TokenScope::Registry);
    core::TokenizeResult second =
        engine.tokenize("Hans Mueller answered Marie Dupont.", PolicySelection(), TokenScope::Registry);
    EXPECT_EQ(first.text, "<Person_1> wrote.");
    EXPECT_EQ(second.text, "<Person_2> answered <Person_1>.");
    EXPECT_EQ(tokenRegistry.size(), 2u);
}

// A registry token that also appears literally cannot be reused without
// corrupting the restore, so the document is refused and nothing is registered.
TEST_F(TokenizationFlowTest, LiteralOfExistingRegistryTokenIsRefused) {
    engine.tokenize("Marie Dupont wrote.", PolicySelection(), TokenScope::Registry);
    ASSERT_EQ(tokenRegistry.lookupToken("Marie Dupont").value_or(""), "<Person_1>");

    EXPECT_THROW(engine.tokenize("Ticket from Bob Jones mentions <Person_1> and Marie Dupont.",
                                 PolicySelection(), TokenScope::Registry),
                 core::MappingError);
    EXPECT_EQ(tokenRegistry.size(), 1u);
    EXPECT_FALSE(tokenRegistry.lookupToken("Bob Jones").has_value());

    registry::TokenRegistry other;
    other.getOrCreate("Marie Dupont", "Person");
    EXPECT_THROW(engine.tokenize("See <Person_1> and Marie Dupont.", PolicySelection(), other),
                 core::MappingError);
    EXPECT_EQ(other.size(), 1u);

    EXPECT_THROW(engine.applyRegistry("See <Person_1> and Marie Dupont."), core::MappingError);

    // A literal that matches no detected value still round-trips.
    const std::string text = "See <Person_1> and Hans Mueller.";
    core::TokenizeResult r = engine.tokenize(text, PolicySelection(), TokenScope::Registry);
    EXPECT_EQ(r.text, "See <Person_1> and <Person_2>.");
    EXPECT_EQ(engine.detokenize(r.text, tokenRegistry.toMapping()).text, "See Marie Dupont and Hans Mueller.");
    EXPECT_EQ(engine.detokenize(r.text, r.mapping).text, text);
}

TEST_F(TokenizationFlowTest, SubstringValueGetsItsOwnToken) {
    core::TokenizeResult full = engine.tokenize("Marie Dupont called.", PolicySelection(), TokenScope::Registry);
    core::TokenizeResult part = engine.tokenize("Marie called back.", PolicySelection(), TokenScope::Registry);
    EXPECT_EQ(full.text, "<Person_1> called.");
    EXPECT_EQ(part.text, "<Person_2> called back.");
    EXPECT_EQ(tokenRegistry.lookupValue("<Person_2>").value_or(""), "Marie");
}

TEST_F(TokenizationFlowTest, RegistryScopeRequiresRegistry) {
    TokenizationEngine bare(&router);
    EXPECT_THROW(bare.tokenize("Hans Mueller", PolicySelection(), TokenScope::Registry), std::logic_error);
    EXPECT_THROW(bare.applyRegistry("Hans Mueller"), std::logic_error);
    EXPECT_EQ(detector.calls(), 0);
}

TEST_F(TokenizationFlowTest, DetectorFailureLeavesRegistryUntouched) {
    EXPECT_THROW(engine.tokenize("FAIL Marie Dupont", PolicySelection(), TokenScope::Registry),
                 core::DetectionError);
    EXPECT_EQ(tokenRegistry.size(), 0u);
    EXPECT_THROW(engine.redact("FAIL Marie Dupont", PolicySelection()), core::DetectionError);
}

TEST_F(TokenizationFlowTest, KnownValuesAppliedToFreshQuery) {
    engine.tokenize("Marie Dupont wrote to Hans Mueller.", PolicySelection(), TokenScope::Registry);
    core::TokenizeResult q = engine.applyRegistry("Did Marie Dupont answer Marie?");
    EXPECT_EQ(q.text, "Did <Person_1> answer Marie?");
    EXPECT_EQ(q.mapping.size(), 1u);
    EXPECT_EQ(detector.calls(), 1);
}

TEST_F(TokenizationFlowTest, TokenizeAgainstExplicitRegistry) {
    registry::TokenRegistry other;
    other.getOrCreate("someone@else.org", "Person");
    core::TokenizeResult r = engine.tokenize("Marie Dupont", PolicySelection(), other);
    EXPECT_EQ(r.text, "<Person_2>");
    EXPECT_EQ(tokenRegistry.size(), 0u);
    EXPECT_EQ(other.size(), 2u);
}

TEST_F(TokenizationFlowTest, ScenarioWithCallerSuppliedEntities) {
    const std::string text = "Hans Mueller (hans.mueller@example.de) called about invoice 123.";
    std::vector<core::Entity> entities = {{"Person", "Hans Mueller", 0, 12, 0.9},
                                          {"EmailAddress", "hans.mueller@example.de", 14, 37, 0.9}};
    core::TokenizeResult r = engine.tokenize(text, entities);
    EXPECT_EQ(r.text, "<Person_1> (<EmailAddress_1>) called about invoice 123.");
    EXPECT_EQ(r.mapping.findValue("<EmailAddress_1>").value_or(""), "hans.mueller@example.de");
    EXPECT_EQ(engine.detokenize(r.text, r.mapping).text, text);
}

TEST_F(TokenizationFlowTest, PrefixValuesSubstituteAtTheirOwnOffsets) {
    const std::string text = "Marie met Marie Dupont, not Marie.";
    std::vector<core::Entity> entities = {{"Person", "Marie Dupont", 10, 22, 0.9},
                                          {"Person", "Marie", 0, 5, 0.9},
                                          {"Person", "Marie", 28, 33, 0.9}};
    core::TokenizeResult r = engine.tokenize(text, entities);
    EXPECT_EQ(r.text, "<Person_1> met <Person_2>, not <Person_1>.");
    EXPECT_EQ(engine.detokenize(r.text, r.mapping).text, text);
}
