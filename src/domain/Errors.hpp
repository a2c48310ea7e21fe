/**
 * @file Errors.hpp
 * @brief Hard failures of the attestation pipeline.
 */

#pragma once
#include <stdexcept>
#include <string>

namespace medoracle::domain {

/**
 * @brief A second commit under an existing key with a different digest.
 *
 * Means the append-only guarantee was already broken; never recovered locally.
 */
class StoreCorruptionError : public std::logic_error {
public:
    explicit StoreCorruptionError(const std::string& message) : std::logic_error(message) {}
};

/** @brief The upstream entity extractor could not produce tokens. */
class ExtractionUnavailableError : public std::runtime_error {
public:
    explicit ExtractionUnavailableError(const std::string& message) : std::runtime_error(message) {}
};

/** @brief Malformed or invalid configuration. */
class ConfigError : public std::runtime_error {
public:
    explicit ConfigError(const std::string& message) : std::runtime_error(message) {}
};

} // namespace medoracle::domain
