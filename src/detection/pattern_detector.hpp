#ifndef TOKENVAULT_DETECTION_PATTERN_DETECTOR_HPP
#define TOKENVAULT_DETECTION_PATTERN_DETECTOR_HPP

#include <algorithm>
#include <cctype>
#include <functional>
#include <regex>
#include <string>
#include <vector>
#include "detection/entity_detector.hpp"
#include "util/logger.hpp"

/**
 * @file pattern_detector.hpp
 * @brief Offline detector for structured identifiers, built on std::regex.
 *
 * DESIGN GOALS:
 *   - Works without a detection service: emails, phone numbers, SSNs,
 *     credit cards (Luhn-checked), IBANs (mod-97-checked) and IPv4 addresses.
 *   - Reports byte offsets of each match, never rewrites the text itself.
 *   - Names, addresses and other free-text entities need an NLP service;
 *     use a RemoteDetector for those.
 *
 * USAGE EXAMPLE:
 *   @code
 *   PatternDetector detector;
 *   auto entities = detector.detect("Mail hans@example.de", {});
 *   // entities[0].type == "EmailAddress", start == 5, end == 20
 *   @endcode
 */

namespace tokenvault {
namespace detection {

/**
 * @class PatternDetector
 * @brief Regex-based EntityDetector. Stateless, safe to call from several threads.
 */
class PatternDetector : public EntityDetector
{
public:
    PatternDetector() = default;

    std::vector<core::Entity> detect(const std::string &text,
                                     const std::vector<std::string> &types) override
    {
        std::vector<core::Entity> found;
        for (const auto &pattern : patterns()) {
            if (!types.empty() && std::find(types.begin(), types.end(), pattern.type) == types.end()) {
                continue;
            }
            auto begin = std::sregex_iterator(text.begin(), text.end(), pattern.regex);
            for (auto it = begin; it != std::sregex_iterator(); ++it) {
                const std::smatch &m = *it;
                std::string value = m.str(0);
                if (pattern.check && !pattern.check(value)) {
                    continue;
                }
                core::Entity e;
                e.type = pattern.type;
                e.text = value;
                e.start = static_cast<size_t>(m.position(0));
                e.end = e.start + value.size();
                e.confidence = pattern.confidence;
                found.push_back(std::move(e));
            }
        }
        util::logger::debug("PatternDetector: " + std::to_string(found.size()) + " candidate entities");
        return found;
    }

    std::string name() const override { return "pattern"; }

    /**
     * @brief Luhn checksum over the digits of @p number.
     */
    static bool luhnValid(const std::string &number)
    {
        int sum = 0;
        int digits = 0;
        bool doubleIt = false;
        for (auto it = number.rbegin(); it != number.rend(); ++it) {
            if (!std::isdigit(static_cast<unsigned char>(*it))) {
                continue;
            }
            int d = *it - '0';
            if (doubleIt) {
                d *= 2;
                if (d > 9) d -= 9;
            }
            sum += d;
            doubleIt = !doubleIt;
            ++digits;
        }
        return digits >= 13 && sum % 10 == 0;
    }

    /**
     * @brief ISO 13616 mod-97 check (spaces ignored).
     */
    static bool ibanValid(const std::string &iban)
    {
        std::string compact;
        for (char c : iban) {
            if (c != ' ') compact.push_back(c);
        }
        if (compact.size() < 15 || compact.size() > 34) {
            return false;
        }
        std::string rearranged = compact.substr(4) + compact.substr(0, 4);
        int remainder = 0;
        for (char c : rearranged) {
            unsigned char uc = static_cast<unsigned char>(c);
            if (std::isdigit(uc)) {
                remainder = (remainder * 10 + (c - '0')) % 97;
            } else if (std::isupper(uc)) {
                int v = c - 'A' + 10;
                remainder = (remainder * 100 + v) % 97;
            } else {
                return false;
            }
        }
        return remainder == 1;
    }

private:
    struct Pattern
    {
        std::string type;
        std::regex regex;
        double confidence;
        std::function<bool(const std::string &)> check;
    };

    static const std::vector<Pattern> &patterns()
    {
        static const std::vector<Pattern> table = {
            {"EmailAddress",
             std::regex(R"([A-Za-z0-9._%+\-]+@[A-Za-z0-9\-]+(?:\.[A-Za-z0-9\-]+)*\.[A-Za-z]{2,})"),
             0.95, nullptr},
            {"SocialSecurityNumber",
             std::regex(R"(\b\d{3}-\d{2}-\d{4}\b)"),
             0.9, nullptr},
            {"CreditCardNumber",
             std::regex(R"(\b(?:\d{4}[ \-]?){3}\d{4}\b)"),
             0.9, luhnValid},
            {"IBAN",
             std::regex(R"(\b[A-Z]{2}\d{2}(?: ?[A-Z0-9]{4}){2,7}(?: ?[A-Z0-9]{1,3})?\b)"),
             0.9, ibanValid},
            {"PhoneNumber",
             std::regex(R"(\+\d{1,3}(?:[ .\-]?\d{1,4}){2,5}|(?:\(\d{3}\) ?|\b\d{3}[.\-])\d{3}[.\-]\d{4}\b)"),
             0.85, nullptr},
            {"IPAddress",
             std::regex(R"(\b(?:(?:25[0-5]|2[0-4]\d|1?\d?\d)\.){3}(?:25[0-5]|2[0-4]\d|1?\d?\d)\b)"),
             0.8, nullptr},
        };
        return table;
    }
};

} // namespace detection
} // namespace tokenvault

#endif // TOKENVAULT_DETECTION_PATTERN_DETECTOR_HPP
