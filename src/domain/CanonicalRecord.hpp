/**
 * @file CanonicalRecord.hpp
 * @brief The single record of a round that is eligible for ledger commitment.
 */

#pragma once
#include <stdexcept>
#include <string>
#include <vector>
#include "ValidationPackage.hpp"

namespace medoracle::domain {

/**
 * @enum Provenance
 * @brief Who produced the canonical record.
 */
enum class Provenance {
    Consensus,          ///< Approved by the node network.
    ConsensusPlurality, ///< Approved by a plurality, with dissenting nodes.
    Human               ///< Produced by human arbitration after consensus failure.
};

inline std::string ProvenanceToString(Provenance p) {
    switch (p) {
        case Provenance::Consensus: return "consensus";
        case Provenance::ConsensusPlurality: return "consensus_plurality";
        case Provenance::Human: return "human";
    }
    return "consensus";
}

inline Provenance ProvenanceFromString(const std::string& s) {
    if (s == "consensus") return Provenance::Consensus;
    if (s == "consensus_plurality") return Provenance::ConsensusPlurality;
    if (s == "human") return Provenance::Human;
    throw std::invalid_argument("Unknown provenance: " + s);
}

/**
 * @struct CorrectedRecord
 * @brief Authoritative human correction. Replaces all oracle output of the round.
 */
struct CorrectedRecord {
    std::vector<ValidatedEntity> entities;
    std::string correctionReason;
    std::string validatorId; ///< Always in the HITL_ namespace.
    std::string timestamp;
};

/**
 * @struct CanonicalRecord
 * @brief Approved package or CorrectedRecord, flattened and tagged with provenance.
 *
 * Only the fields belonging to the provenance are populated; the others stay
 * empty and are left out of the canonical serialization.
 */
struct CanonicalRecord {
    Provenance provenance = Provenance::Consensus;
    std::vector<ValidatedEntity> entities;
    std::string timestamp;

    // Consensus fields
    std::string nodeId;
    std::string source;
    std::string status;
    std::string institution;
    std::string patientId;

    // Human fields
    std::string correctionReason;
    std::string validatorId;

    static CanonicalRecord FromConsensus(const ValidationPackage& package, Provenance provenance) {
        CanonicalRecord record;
        record.provenance = provenance;
        record.entities = package.entities;
        record.timestamp = package.timestamp;
        record.nodeId = package.sourceNodeId;
        record.source = package.source;
        record.status = package.status;
        record.institution = package.institution;
        record.patientId = package.patientId;
        return record;
    }

    static CanonicalRecord FromCorrection(const CorrectedRecord& corrected) {
        CanonicalRecord record;
        record.provenance = Provenance::Human;
        record.entities = corrected.entities;
        record.timestamp = corrected.timestamp;
        record.correctionReason = corrected.correctionReason;
        record.validatorId = corrected.validatorId;
        return record;
    }
};

} // namespace medoracle::domain
