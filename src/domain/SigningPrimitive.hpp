/**
 * @file SigningPrimitive.hpp
 * @brief Pluggable primitive binding a digest to a node identity.
 */

#pragma once
#include <string>
#include "Digest.hpp"

namespace medoracle::domain {

/**
 * @class SigningPrimitive
 * @brief Signs digests with node key material and verifies them by public identity.
 *
 * Contract: two different keys never produce the same signature for the same
 * digest (with overwhelming probability).
 */
class SigningPrimitive {
public:
    virtual ~SigningPrimitive() = default;

    virtual Signature Sign(const Digest& digest, const std::string& key) const = 0;

    /**
     * @brief Checks a signature against the identity that claims to have produced it.
     * @param publicId Node identity, e.g. "Oracle_A".
     */
    virtual bool Verify(const Digest& digest, const Signature& signature, const std::string& publicId) const = 0;
};

} // namespace medoracle::domain
