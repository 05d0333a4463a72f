#ifndef TOKENVAULT_CORE_ENTITY_HPP
#define TOKENVAULT_CORE_ENTITY_HPP

#include <cctype>
#include <string>
#include <unordered_map>
#include <vector>
#include "core/errors.hpp"

/**
 * @file entity.hpp
 * @brief The canonical representation of a detected sensitive span.
 *
 * DESIGN GOALS:
 *   - Entities are produced by an external detector and are plain data.
 *   - Offsets are byte offsets into the exact text the detector scanned,
 *     half-open: [start, end).
 *   - Entity types form an open, string-keyed enumeration. Names reported by
 *     detection services ("email address") are canonicalised to token-safe
 *     identifiers ("EmailAddress") so they can appear inside <Type_N>.
 */

namespace tokenvault {
namespace core {

/**
 * @struct Entity
 * @brief One detected span: type, covered text, [start, end) and confidence.
 */
struct Entity
{
    std::string type;        ///< Canonical entity type, e.g. "Person"
    std::string text;        ///< The bytes text[start, end)
    size_t start = 0;        ///< First byte of the span
    size_t end = 0;          ///< One past the last byte of the span
    double confidence = 1.0; ///< Detector score in [0, 1]

    size_t length() const { return end - start; }

    bool overlaps(const Entity &other) const
    {
        return start < other.end && other.start < end;
    }
};

inline bool operator==(const Entity &a, const Entity &b)
{
    return a.type == b.type && a.text == b.text && a.start == b.start &&
           a.end == b.end && a.confidence == b.confidence;
}

inline bool operator!=(const Entity &a, const Entity &b)
{
    return !(a == b);
}

/**
 * @brief True for names usable inside a token: [A-Za-z][A-Za-z0-9_]*
 */
inline bool isTokenSafeTypeName(const std::string &name)
{
    if (name.empty() || !std::isalpha(static_cast<unsigned char>(name[0]))) {
        return false;
    }
    for (char c : name) {
        unsigned char uc = static_cast<unsigned char>(c);
        if (!(std::isalnum(uc) || c == '_')) {
            return false;
        }
    }
    return true;
}

/**
 * @brief Map a type name as written by people or detection services to its
 *        canonical form.
 *
 * Known aliases ("ssn", "email address", "date of birth") map through a fixed
 * table. Anything else is CamelCased word by word ("license plate" ->
 * "LicensePlate"); names that are already CamelCase pass through unchanged.
 *
 * @throw PolicyError if the name has no letters to build an identifier from.
 */
inline std::string canonicalEntityType(const std::string &name)
{
    // lowercase, '_' and '-' as spaces, single spaces, trimmed
    std::string key;
    key.reserve(name.size());
    for (char c : name) {
        char mapped = (c == '_' || c == '-') ? ' ' : static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
        if (mapped == ' ' && (key.empty() || key.back() == ' ')) {
            continue;
        }
        key.push_back(mapped);
    }
    if (!key.empty() && key.back() == ' ') {
        key.pop_back();
    }

    static const std::unordered_map<std::string, std::string> aliases = {
        {"person", "Person"},
        {"name", "Person"},
        {"full name", "Person"},
        {"email", "EmailAddress"},
        {"email address", "EmailAddress"},
        {"emailaddress", "EmailAddress"},
        {"phone", "PhoneNumber"},
        {"phone number", "PhoneNumber"},
        {"phonenumber", "PhoneNumber"},
        {"telephone", "PhoneNumber"},
        {"ssn", "SocialSecurityNumber"},
        {"social security number", "SocialSecurityNumber"},
        {"credit card", "CreditCardNumber"},
        {"credit card number", "CreditCardNumber"},
        {"iban", "IBAN"},
        {"dob", "DateOfBirth"},
        {"date of birth", "DateOfBirth"},
        {"address", "Address"},
        {"street address", "Address"},
        {"ip", "IPAddress"},
        {"ip address", "IPAddress"},
        {"ipaddress", "IPAddress"},
        {"url", "Url"},
        {"mrn", "MedicalRecordNumber"},
        {"medical record number", "MedicalRecordNumber"},
        {"health insurance number", "HealthInsuranceNumber"},
        {"passport", "PassportNumber"},
        {"passport number", "PassportNumber"},
        {"national id", "NationalId"},
        {"tax id", "TaxId"},
        {"drivers license", "DriversLicenseNumber"},
        {"driver's license number", "DriversLicenseNumber"},
        {"drivers license number", "DriversLicenseNumber"},
    };
    auto it = aliases.find(key);
    if (it != aliases.end()) {
        return it->second;
    }

    std::string canonical;
    bool wordStart = true;
    for (char c : name) {
        unsigned char uc = static_cast<unsigned char>(c);
        if (!std::isalnum(uc)) {
            wordStart = true;
            continue;
        }
        canonical.push_back(wordStart ? static_cast<char>(std::toupper(uc)) : c);
        wordStart = false;
    }
    if (!isTokenSafeTypeName(canonical)) {
        throw PolicyError("canonicalEntityType: cannot form an entity type from '" + name + "'");
    }
    return canonical;
}

/**
 * @brief Check an entity against the text it was detected in.
 *
 * Fills entity.text from the span when the detector left it empty.
 *
 * @throw EntityError if the span is empty, reaches past the text, the
 *        confidence is outside [0, 1], the type is not token-safe, or the
 *        reported text differs from the bytes at the span.
 */
inline void validateEntity(const std::string &text, Entity &entity)
{
    if (entity.start >= entity.end) {
        throw EntityError("validateEntity: empty or inverted span [" + std::to_string(entity.start) +
                          ", " + std::to_string(entity.end) + ")");
    }
    if (entity.end > text.size()) {
        throw EntityError("validateEntity: span [" + std::to_string(entity.start) + ", " +
                          std::to_string(entity.end) + ") exceeds text length " +
                          std::to_string(text.size()));
    }
    if (!(entity.confidence >= 0.0 && entity.confidence <= 1.0)) {
        throw EntityError("validateEntity: confidence out of range for span at " +
                          std::to_string(entity.start));
    }
    if (!isTokenSafeTypeName(entity.type)) {
        throw EntityError("validateEntity: entity type '" + entity.type + "' is not canonical");
    }
    if (entity.text.empty()) {
        entity.text = text.substr(entity.start, entity.length());
    }
    else if (text.compare(entity.start, entity.length(), entity.text) != 0) {
        throw EntityError("validateEntity: entity text does not match the span [" +
                          std::to_string(entity.start) + ", " + std::to_string(entity.end) + ")");
    }
}

} // namespace core
} // namespace tokenvault

#endif // TOKENVAULT_CORE_ENTITY_HPP
