/**
 * @file ValidationPackage.hpp
 * @brief Output of one validator invocation and the signed attestation around it.
 */

#pragma once
#include <string>
#include <vector>
#include "ValidatedEntity.hpp"
#include "Digest.hpp"

namespace medoracle::domain {

/**
 * @brief Package status values.
 */
namespace package_status {
inline constexpr const char* Validated = "validated";
inline constexpr const char* NoValidEntities = "no_valid_entities";
} // namespace package_status

/**
 * @struct ValidationPackage
 * @brief Entities found by one node plus the metadata that is hashed with them.
 */
struct ValidationPackage {
    std::vector<ValidatedEntity> entities; ///< In token order.
    std::string timestamp;                 ///< ISO-8601 UTC, set when the package is built.
    std::string sourceNodeId;
    std::string status = package_status::Validated;
    std::string source;                    ///< Upstream module name, e.g. "NLP Module".
    std::string institution;               ///< Optional; omitted from serialization when empty.
    std::string patientId;                 ///< Optional; omitted from serialization when empty.

    bool isEmpty() const { return entities.empty(); }
};

/**
 * @struct NodeAttestation
 * @brief A package bound to its node by digest and signature.
 *
 * Invariant: digest == SHA-256 of the canonical serialization of package.
 */
struct NodeAttestation {
    std::string nodeId;
    ValidationPackage package;
    Digest digest{};
    Signature signature;
};

} // namespace medoracle::domain
