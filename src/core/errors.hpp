#ifndef TOKENVAULT_CORE_ERRORS_HPP
#define TOKENVAULT_CORE_ERRORS_HPP

#include <stdexcept>
#include <string>

/**
 * @file errors.hpp
 * @brief Exception types raised by TokenVault components.
 *
 * Messages are prefixed with the raising component ("PolicyResolver: ...")
 * and never contain a real sensitive value.
 */

namespace tokenvault {
namespace core {

/// Unknown policy name or malformed entity type: a configuration error.
class PolicyError : public std::runtime_error
{
public:
    explicit PolicyError(const std::string &msg) : std::runtime_error(msg) {}
};

/// The external detector failed or was cancelled.
class DetectionError : public std::runtime_error
{
public:
    explicit DetectionError(const std::string &msg) : std::runtime_error(msg) {}
};

/// An entity whose span does not fit the text it claims to describe.
class EntityError : public std::invalid_argument
{
public:
    explicit EntityError(const std::string &msg) : std::invalid_argument(msg) {}
};

/// A mapping that would bind one token to two values, or holds a malformed token.
class MappingError : public std::runtime_error
{
public:
    explicit MappingError(const std::string &msg) : std::runtime_error(msg) {}
};

/// Registry merge conflicts, inconsistent snapshots and persistence failures.
class RegistryError : public std::runtime_error
{
public:
    explicit RegistryError(const std::string &msg) : std::runtime_error(msg) {}
};

} // namespace core
} // namespace tokenvault

#endif // TOKENVAULT_CORE_ERRORS_HPP
