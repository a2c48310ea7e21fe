/**
 * @file Validator.hpp
 * @brief One oracle node: classifies tokens, packages, digests and signs them.
 */

#pragma once
#include <memory>
#include <optional>
#include <string>
#include <vector>
#include "domain/AnnotatedToken.hpp"
#include "domain/SigningPrimitive.hpp"
#include "domain/ValidationPackage.hpp"
#include "domain/Vocabulary.hpp"

namespace medoracle::application {

/**
 * @struct ValidatorSettings
 * @brief Per-network classification policy shared by all nodes.
 */
struct ValidatorSettings {
    static constexpr double DrugConfidence = 0.95;
    static constexpr double SymptomConfidence = 0.90;
    static constexpr double ExtractorConfidence = 0.85;

    double confidenceThreshold = 0.7;
    std::string source = "NLP Module";
    std::string institution;
    std::string patientId;
};

/**
 * @class Validator
 * @brief Wraps a node identity and its key material.
 *
 * Stateless across calls; several validators may run concurrently over the
 * same token vector.
 */
class Validator {
public:
    Validator(std::string nodeId,
              std::string secret,
              std::shared_ptr<const domain::SigningPrimitive> signer,
              ValidatorSettings settings = {});

    /**
     * @brief Classifies tokens against the vocabularies and the extractor labels.
     *
     * Priority per token: drug term, then symptom term, then extractor label.
     * Vocabulary matching is a case-insensitive substring test. Candidates
     * below the confidence threshold are dropped, as are tokens whose text is
     * not valid UTF-8.
     * @return Package with status "no_valid_entities" when nothing was retained.
     */
    domain::ValidationPackage Validate(const std::vector<domain::AnnotatedToken>& tokens,
                                       const domain::Vocabulary& vocab) const;

    /** @brief Digests the package canonically and signs the digest with the node secret. */
    domain::NodeAttestation Sign(const domain::ValidationPackage& package) const;

    /**
     * @brief Full node step: validate then sign.
     * @return nullopt when the node abstains or fails internally.
     */
    std::optional<domain::NodeAttestation> Attest(const std::vector<domain::AnnotatedToken>& tokens,
                                                  const domain::Vocabulary& vocab) const;

    const std::string& getNodeId() const { return m_nodeId; }

private:
    std::optional<domain::ValidatedEntity> classify(const domain::AnnotatedToken& token,
                                                    const domain::Vocabulary& vocab) const;

    std::string m_nodeId;
    std::string m_secret;
    std::shared_ptr<const domain::SigningPrimitive> m_signer;
    ValidatorSettings m_settings;
};

} // namespace medoracle::application
