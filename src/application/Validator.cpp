/**
 * @file Validator.cpp
 * @brief Implementation of Validator.
 */

#include "application/Validator.hpp"
#include "infrastructure/CanonicalSerializer.hpp"
#include "infrastructure/TimeUtils.hpp"

#include <algorithm>
#include <cctype>
#include <iostream>
#include <stdexcept>

namespace medoracle::application {

namespace {

std::string Normalize(const std::string& input) {
    std::string out;
    out.reserve(input.size());
    for (unsigned char c : input) {
        out.push_back(static_cast<char>(std::tolower(c)));
    }
    return out;
}

bool ContainsAny(const std::string& normalized, const std::vector<std::string>& needles) {
    for (const auto& needle : needles) {
        if (!needle.empty() && normalized.find(Normalize(needle)) != std::string::npos) return true;
    }
    return false;
}

} // namespace

Validator::Validator(std::string nodeId,
                     std::string secret,
                     std::shared_ptr<const domain::SigningPrimitive> signer,
                     ValidatorSettings settings)
    : m_nodeId(std::move(nodeId)),
      m_secret(std::move(secret)),
      m_signer(std::move(signer)),
      m_settings(std::move(settings)) {
    if (m_nodeId.empty()) {
        throw std::invalid_argument("Validator: node id cannot be empty.");
    }
    if (!m_signer) {
        throw std::invalid_argument("Validator: signing primitive is required.");
    }
}

std::optional<domain::ValidatedEntity> Validator::classify(const domain::AnnotatedToken& token,
                                                           const domain::Vocabulary& vocab) const {
    if (!infrastructure::CanonicalSerializer::IsEncodable(token.text)) {
        std::cerr << "[Validator] " << m_nodeId << ": dropping token at position " << token.position
                  << " (not valid UTF-8)." << std::endl;
        return std::nullopt;
    }
    const std::string lowered = Normalize(token.text);

    domain::ValidatedEntity entity;
    entity.text = token.text;
    if (ContainsAny(lowered, vocab.drugs)) {
        entity.label = domain::labels::Drug;
        entity.confidence = ValidatorSettings::DrugConfidence;
    } else if (ContainsAny(lowered, vocab.symptoms)) {
        entity.label = domain::labels::Symptom;
        entity.confidence = ValidatorSettings::SymptomConfidence;
    } else if (token.recognizedLabel && !token.recognizedLabel->empty()
               && infrastructure::CanonicalSerializer::IsEncodable(*token.recognizedLabel)) {
        entity.label = *token.recognizedLabel;
        entity.confidence = ValidatorSettings::ExtractorConfidence;
    } else {
        return std::nullopt;
    }

    if (entity.confidence < m_settings.confidenceThreshold) {
        return std::nullopt;
    }
    return entity;
}

domain::ValidationPackage Validator::Validate(const std::vector<domain::AnnotatedToken>& tokens,
                                              const domain::Vocabulary& vocab) const {
    // Stable ordering by token position regardless of how the extractor emitted them.
    std::vector<const domain::AnnotatedToken*> ordered;
    ordered.reserve(tokens.size());
    for (const auto& t : tokens) ordered.push_back(&t);
    std::stable_sort(ordered.begin(), ordered.end(),
        [](const auto* a, const auto* b) { return a->position < b->position; });

    domain::ValidationPackage package;
    for (const auto* token : ordered) {
        if (auto entity = classify(*token, vocab)) {
            package.entities.push_back(std::move(*entity));
        }
    }

    package.timestamp = infrastructure::TimeUtils::NowIso8601();
    package.sourceNodeId = m_nodeId;
    package.source = m_settings.source;
    package.institution = m_settings.institution;
    package.patientId = m_settings.patientId;
    package.status = package.entities.empty() ? domain::package_status::NoValidEntities
                                              : domain::package_status::Validated;
    return package;
}

domain::NodeAttestation Validator::Sign(const domain::ValidationPackage& package) const {
    domain::NodeAttestation attestation;
    attestation.nodeId = m_nodeId;
    attestation.package = package;
    attestation.digest = infrastructure::CanonicalSerializer::DigestOf(package);
    attestation.signature = m_signer->Sign(attestation.digest, m_secret);
    return attestation;
}

std::optional<domain::NodeAttestation> Validator::Attest(const std::vector<domain::AnnotatedToken>& tokens,
                                                         const domain::Vocabulary& vocab) const {
    try {
        std::cout << "[Validator] " << m_nodeId << " validating " << tokens.size() << " tokens..." << std::endl;

        domain::ValidationPackage package = Validate(tokens, vocab);
        if (package.isEmpty()) {
            std::cout << "[Validator] " << m_nodeId << ": no valid entities found." << std::endl;
            return std::nullopt;
        }

        domain::NodeAttestation attestation = Sign(package);
        std::cout << "[Validator] " << m_nodeId << ": " << package.entities.size()
                  << " entities validated, digest " << domain::ToHex(attestation.digest).substr(0, 16) << "..." << std::endl;
        return attestation;
    } catch (const std::exception& e) {
        std::cerr << "[Validator] " << m_nodeId << " failed: " << e.what() << std::endl;
        return std::nullopt;
    } catch (...) {
        std::cerr << "[Validator] " << m_nodeId << " failed with a non-standard exception." << std::endl;
        return std::nullopt;
    }
}

} // namespace medoracle::application
