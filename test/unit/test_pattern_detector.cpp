// test/unit/test_pattern_detector.cpp
// -----------------------------------------------------------
// Local regex detector and its checksum validators.

#include <gtest/gtest.h>
#include <string>
#include <vector>

#include "core/entity.hpp"
#include "detection/entity_detector.hpp"
#include "detection/pattern_detector.hpp"

using tokenvault::core::Entity;
using tokenvault::detection::DetectorRouter;
using tokenvault::detection::PatternDetector;

namespace {

const Entity* findType(const std::vector<Entity>& entities, const std::string& type) {
    for (const auto& e : entities) {
        if (e.type == type) {
            return &e;
        }
    }
    return nullptr;
}

} // namespace

TEST(PatternDetectorTest, DetectsEmailWithByteOffsets) {
    PatternDetector detector;
    const std::string text = "Hans Mueller (hans.mueller@example.de) called.";
    auto found = detector.detect(text, {});
    const Entity* email = findType(found, "EmailAddress");
    ASSERT_NE(email, nullptr);
    EXPECT_EQ(email->text, "hans.mueller@example.de");
    EXPECT_EQ(email->start, 14u);
    EXPECT_EQ(email->end, 37u);
    EXPECT_EQ(text.substr(email->start, email->length()), email->text);
}

TEST(PatternDetectorTest, TypeFilterLimitsOutput) {
    PatternDetector detector;
    const std::string text = "mail a@b.io or call +49 30 1234567";
    auto onlyPhone = detector.detect(text, {"PhoneNumber"});
    ASSERT_EQ(onlyPhone.size(), 1u);
    EXPECT_EQ(onlyPhone[0].type, "PhoneNumber");
    EXPECT_EQ(onlyPhone[0].text, "+49 30 1234567");
}

TEST(PatternDetectorTest, ChecksumsFilterFalsePositives) {
    PatternDetector detector;
    auto good = detector.detect("card 4111 1111 1111 1111", {"CreditCardNumber"});
    EXPECT_EQ(good.size(), 1u);
    auto bad = detector.detect("card 4111 1111 1111 1112", {"CreditCardNumber"});
    EXPECT_TRUE(bad.empty());

    auto iban = detector.detect("IBAN DE89 3704 0044 0532 0130 00.", {"IBAN"});
    ASSERT_EQ(iban.size(), 1u);
    EXPECT_EQ(iban[0].text, "DE89 3704 0044 0532 0130 00");
}

TEST(PatternDetectorTest, SsnAndIp) {
    PatternDetector detector;
    auto found = detector.detect("SSN 123-45-6789 from 192.168.1.20", {});
    EXPECT_NE(findType(found, "SocialSecurityNumber"), nullptr);
    EXPECT_NE(findType(found, "IPAddress"), nullptr);
}

TEST(PatternDetectorTest, Validators) {
    EXPECT_TRUE(PatternDetector::luhnValid("4111111111111111"));
    EXPECT_FALSE(PatternDetector::luhnValid("4111111111111112"));
    EXPECT_FALSE(PatternDetector::luhnValid("0"));
    EXPECT_TRUE(PatternDetector::ibanValid("DE89370400440532013000"));
    EXPECT_TRUE(PatternDetector::ibanValid("GB82 WEST 1234 5698 7654 32"));
    EXPECT_FALSE(PatternDetector::ibanValid("DE89370400440532013001"));
}

TEST(DetectorRouterTest, FallsBackToDefault) {
    PatternDetector eu;
    PatternDetector fallback;
    DetectorRouter router(&fallback);
    router.addRegion("eu", &eu);
    EXPECT_EQ(&router.route("eu"), &eu);
    EXPECT_EQ(&router.route("us"), &fallback);

    DetectorRouter empty;
    EXPECT_THROW(empty.route("eu"), tokenvault::core::DetectionError);
}
