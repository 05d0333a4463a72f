#ifndef TOKENVAULT_CONFIG_POLICY_TABLE_HPP
#define TOKENVAULT_CONFIG_POLICY_TABLE_HPP

#include <string>
#include <vector>

/**
 * @file policy_table.hpp
 * @brief The closed table of built-in named policies.
 *
 * Each policy resolves to a set of canonical entity types. "strict" is the
 * only open-ended one: it covers every type a detector can report,
 * including types added after a registry was created.
 *
 * Example usage:
 *  @code
 *    auto p = tokenvault::config::getGdprEuPolicy();
 *    for (const auto &t : p.entityTypes) { ... }
 *  @endcode
 */

namespace tokenvault {
namespace config {

/**
 * @struct PolicyDefinition
 * @brief One named policy: the entity types it acts upon.
 */
struct PolicyDefinition
{
    // Name used by callers: "strict", "basic", "gdpr_eu", "hipaa_us".
    std::string name;

    std::string description;

    // True when the policy acts on every entity type (entityTypes is then empty).
    bool allTypes = false;

    // Canonical entity type names.
    std::vector<std::string> entityTypes;
};

/**
 * @brief Every entity type, present and future.
 */
inline PolicyDefinition getStrictPolicy()
{
    PolicyDefinition p;
    p.name        = "strict";
    p.description = "All entity types";
    p.allTypes    = true;
    return p;
}

/**
 * @brief Direct contact identifiers only.
 */
inline PolicyDefinition getBasicPolicy()
{
    PolicyDefinition p;
    p.name        = "basic";
    p.description = "Names and direct contact details";
    p.entityTypes = {
        "Person",
        "EmailAddress",
        "PhoneNumber",
        "CreditCardNumber",
    };
    return p;
}

/**
 * @brief Personal data in the sense of the EU GDPR.
 */
inline PolicyDefinition getGdprEuPolicy()
{
    PolicyDefinition p;
    p.name        = "gdpr_eu";
    p.description = "EU personal data (GDPR)";
    p.entityTypes = {
        "Person",
        "EmailAddress",
        "PhoneNumber",
        "Address",
        "DateOfBirth",
        "IBAN",
        "CreditCardNumber",
        "IPAddress",
        "NationalId",
        "PassportNumber",
        "TaxId",
    };
    return p;
}

/**
 * @brief HIPAA Safe Harbor style identifiers for US health data.
 */
inline PolicyDefinition getHipaaUsPolicy()
{
    PolicyDefinition p;
    p.name        = "hipaa_us";
    p.description = "US protected health information (HIPAA)";
    p.entityTypes = {
        "Person",
        "EmailAddress",
        "PhoneNumber",
        "Address",
        "DateOfBirth",
        "SocialSecurityNumber",
        "MedicalRecordNumber",
        "HealthInsuranceNumber",
        "IPAddress",
        "Url",
        "DriversLicenseNumber",
    };
    return p;
}

/**
 * @brief The full built-in table, in lookup order.
 */
inline std::vector<PolicyDefinition> getBuiltinPolicies()
{
    return { getStrictPolicy(), getBasicPolicy(), getGdprEuPolicy(), getHipaaUsPolicy() };
}

} // namespace config
} // namespace tokenvault

#endif // TOKENVAULT_CONFIG_POLICY_TABLE_HPP
