/**
 * @file HmacSigner.hpp
 * @brief HMAC-SHA256 implementation of the signing primitive.
 */

#pragma once
#include <map>
#include <string>
#include "domain/SigningPrimitive.hpp"

namespace medoracle::infrastructure {

/**
 * @class HmacSigner
 * @brief Signs with the node secret; verifies through a keyring of node id to secret.
 *
 * HMAC is symmetric, so the "public identity" resolves to the shared secret
 * registered for that node.
 */
class HmacSigner : public domain::SigningPrimitive {
public:
    HmacSigner() = default;
    explicit HmacSigner(std::map<std::string, std::string> keyring);

    void registerNode(const std::string& nodeId, const std::string& secret);

    domain::Signature Sign(const domain::Digest& digest, const std::string& key) const override;
    bool Verify(const domain::Digest& digest, const domain::Signature& signature, const std::string& publicId) const override;

private:
    std::map<std::string, std::string> m_keyring;
};

} // namespace medoracle::infrastructure
