// test/unit/test_token_registry.cpp
// -----------------------------------------------------------
// TokenRegistry: consistency, concurrency, merging and snapshots.

#include <atomic>
#include <gtest/gtest.h>
#include <set>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

#include "core/errors.hpp"
#include "core/mapping.hpp"
#include "registry/token_registry.hpp"

using namespace tokenvault;
using tokenvault::registry::RegistrySnapshot;
using tokenvault::registry::TokenRegistry;

TEST(TokenRegistryTest, SameValueSameToken) {
    TokenRegistry reg;
    EXPECT_EQ(reg.getOrCreate("Marie Dupont", "Person"), "<Person_1>");
    EXPECT_EQ(reg.getOrCreate("Hans Mueller", "Person"), "<Person_2>");
    EXPECT_EQ(reg.getOrCreate("Marie Dupont", "Person"), "<Person_1>");
    EXPECT_EQ(reg.getOrCreate("marie@example.fr", "EmailAddress"), "<EmailAddress_1>");
    EXPECT_EQ(reg.size(), 3u);
    EXPECT_EQ(reg.nextSequence("Person"), 3u);
    EXPECT_EQ(reg.nextSequence("IBAN"), 1u);
}

TEST(TokenRegistryTest, FirstTypeWins) {
    TokenRegistry reg;
    std::string first = reg.getOrCreate("Jordan", "Person");
    EXPECT_EQ(reg.getOrCreate("Jordan", "Location"), first);
}

TEST(TokenRegistryTest, SubstringValuesAreDistinctIdentities) {
    TokenRegistry reg;
    std::string full = reg.getOrCreate("Marie Dupont", "Person");
    std::string part = reg.getOrCreate("Marie", "Person");
    EXPECT_NE(full, part);
    EXPECT_EQ(reg.lookupValue(part).value_or(""), "Marie");
}

TEST(TokenRegistryTest, LookupsAreInverse) {
    TokenRegistry reg;
    std::string token = reg.getOrCreate("DE89370400440532013000", "IBAN");
    EXPECT_EQ(reg.lookupToken("DE89370400440532013000").value_or(""), token);
    EXPECT_EQ(reg.lookupValue(token).value_or(""), "DE89370400440532013000");
    EXPECT_FALSE(reg.lookupToken("unknown").has_value());
    EXPECT_FALSE(reg.lookupValue("<IBAN_9>").has_value());
}

TEST(TokenRegistryTest, RejectsInvalidInput) {
    TokenRegistry reg;
    EXPECT_THROW(reg.getOrCreate("", "Person"), std::invalid_argument);
    EXPECT_THROW(reg.getOrCreate("x", "Bad Type"), std::invalid_argument);
    EXPECT_EQ(reg.size(), 0u);
}

TEST(TokenRegistryTest, ReservedTokensAreSkipped) {
    TokenRegistry reg;
    auto reserved = [](const std::string& t) { return t == "<Person_1>"; };
    EXPECT_EQ(reg.getOrCreate("Marie Dupont", "Person", reserved), "<Person_2>");
    EXPECT_EQ(reg.getOrCreate("Hans Mueller", "Person"), "<Person_3>");
}

TEST(TokenRegistryTest, ExistingBindingToReservedTokenIsRefused) {
    TokenRegistry reg;
    EXPECT_EQ(reg.getOrCreate("Alice", "Person"), "<Person_1>");
    auto reserved = [](const std::string& t) { return t == "<Person_1>"; };

    EXPECT_THROW(reg.getOrCreate("Alice", "Person", reserved), core::MappingError);

    std::vector<std::pair<std::string, std::string>> doc = {
        {"Bob Jones", "Person"}, {"Alice", "Person"}};
    EXPECT_THROW(reg.registerValues(doc, reserved), core::MappingError);
    EXPECT_EQ(reg.size(), 1u);
    EXPECT_FALSE(reg.lookupToken("Bob Jones").has_value());
    EXPECT_EQ(reg.nextSequence("Person"), 2u);

    // Without the literal, the existing binding is returned as usual.
    EXPECT_EQ(reg.getOrCreate("Alice", "Person"), "<Person_1>");
}

TEST(TokenRegistryTest, RegisterValuesIsAtomic) {
    TokenRegistry reg;
    std::vector<std::pair<std::string, std::string>> bad = {
        {"Marie Dupont", "Person"}, {"", "Person"}};
    EXPECT_THROW(reg.registerValues(bad), std::invalid_argument);
    EXPECT_EQ(reg.size(), 0u);

    std::vector<std::pair<std::string, std::string>> good = {
        {"Marie Dupont", "Person"}, {"Hans Mueller", "Person"}, {"Marie Dupont", "Person"}};
    auto tokens = reg.registerValues(good);
    ASSERT_EQ(tokens.size(), 3u);
    EXPECT_EQ(tokens[0], "<Person_1>");
    EXPECT_EQ(tokens[1], "<Person_2>");
    EXPECT_EQ(tokens[2], "<Person_1>");
}

// Many threads racing on the same new values must converge on one token each.
TEST(TokenRegistryTest, ConcurrentGetOrCreateIsConsistent) {
    TokenRegistry reg;
    const int threadCount = 8;
    const int valueCount = 50;
    std::vector<std::vector<std::string>> seen(threadCount);
    std::atomic<bool> go{false};

    std::vector<std::thread> threads;
    for (int t = 0; t < threadCount; ++t) {
        threads.emplace_back([&, t] {
            while (!go.load()) {
                std::this_thread::yield();
            }
            for (int v = 0; v < valueCount; ++v) {
                seen[t].push_back(reg.getOrCreate("person-" + std::to_string(v), "Person"));
            }
        });
    }
    go = true;
    for (auto& th : threads) {
        th.join();
    }

    EXPECT_EQ(reg.size(), static_cast<size_t>(valueCount));
    std::set<std::string> distinct(seen[0].begin(), seen[0].end());
    EXPECT_EQ(distinct.size(), static_cast<size_t>(valueCount));
    for (int t = 1; t < threadCount; ++t) {
        EXPECT_EQ(seen[t], seen[0]);
    }
    EXPECT_EQ(reg.nextSequence("Person"), static_cast<uint64_t>(valueCount + 1));
}

TEST(TokenRegistryTest, MergeMappingAdvancesCounters) {
    TokenRegistry reg;
    core::Mapping m;
    m.insert("<Person_7>", "Marie Dupont");
    reg.merge(m);
    EXPECT_EQ(reg.lookupToken("Marie Dupont").value_or(""), "<Person_7>");
    EXPECT_EQ(reg.getOrCreate("Hans Mueller", "Person"), "<Person_8>");
}

TEST(TokenRegistryTest, MergeConflictsLeaveRegistryUntouched) {
    TokenRegistry reg;
    reg.getOrCreate("Marie Dupont", "Person"); // <Person_1>

    core::Mapping tokenClash;
    tokenClash.insert("<EmailAddress_1>", "a@b.c");
    tokenClash.insert("<Person_1>", "Hans Mueller");
    EXPECT_THROW(reg.merge(tokenClash), core::RegistryError);

    core::Mapping valueClash;
    valueClash.insert("<Person_5>", "Marie Dupont");
    EXPECT_THROW(reg.merge(valueClash), core::RegistryError);

    EXPECT_EQ(reg.size(), 1u);
    EXPECT_FALSE(reg.lookupToken("a@b.c").has_value());
}

TEST(TokenRegistryTest, MergeRegistries) {
    TokenRegistry a;
    TokenRegistry b;
    a.getOrCreate("Marie Dupont", "Person");
    b.getOrCreate("Marie Dupont", "Person");
    b.getOrCreate("Hans Mueller", "Person");
    a.merge(b);
    EXPECT_EQ(a.size(), 2u);
    EXPECT_EQ(a.nextSequence("Person"), 3u);
}

TEST(TokenRegistryTest, SnapshotRestoreRoundTrip) {
    TokenRegistry reg;
    reg.getOrCreate("Marie Dupont", "Person");
    reg.getOrCreate("marie@example.fr", "EmailAddress");
    RegistrySnapshot snap = reg.snapshot();
    ASSERT_EQ(snap.entries.size(), 2u);
    EXPECT_EQ(snap.entries[0].type, "EmailAddress");

    TokenRegistry copy;
    copy.restore(snap);
    EXPECT_EQ(copy.toMapping(), reg.toMapping());
    EXPECT_EQ(copy.getOrCreate("Hans Mueller", "Person"), "<Person_2>");
}

TEST(TokenRegistryTest, RestoreRejectsInconsistentSnapshots) {
    TokenRegistry reg;
    reg.getOrCreate("kept", "Person");

    RegistrySnapshot dupValue;
    dupValue.entries.push_back({"<Person_1>", "Marie", "Person", 1});
    dupValue.entries.push_back({"<Person_2>", "Marie", "Person", 2});
    EXPECT_THROW(reg.restore(dupValue), core::RegistryError);

    RegistrySnapshot lowCounter;
    lowCounter.entries.push_back({"<Person_4>", "Marie", "Person", 4});
    lowCounter.nextSequence["Person"] = 3;
    EXPECT_THROW(reg.restore(lowCounter), core::RegistryError);

    RegistrySnapshot badToken;
    badToken.entries.push_back({"<Person_2>", "Marie", "Person", 1});
    EXPECT_THROW(reg.restore(badToken), core::RegistryError);

    EXPECT_EQ(reg.lookupToken("kept").value_or(""), "<Person_1>");
}
