/**
 * @file Verdict.hpp
 * @brief Terminal, externally visible result of one admission run.
 */

#pragma once
#include <string>
#include <optional>
#include <chrono>
#include "domain/Classification.hpp"
#include "domain/ScanOutcome.hpp"
#include "domain/DisarmResult.hpp"
#include "domain/ArchiveManifest.hpp"

namespace filegate::domain {

enum class Decision {
    Admitted,
    Blocked,
    Quarantined
};

enum class ReasonCode {
    Admitted,
    ValidationError,
    ClassificationUnknown,
    ArchiveBomb,
    ArchiveMalformed,
    ScannerUnavailable,
    MalwareDetected,
    DisarmFailed,
    InternalError,
    Cancelled
};

inline std::string DecisionToString(Decision d) {
    switch (d) {
        case Decision::Admitted: return "admitted";
        case Decision::Blocked: return "blocked";
        case Decision::Quarantined: return "quarantined";
    }
    return "blocked";
}

inline std::string ReasonToString(ReasonCode r) {
    switch (r) {
        case ReasonCode::Admitted: return "Admitted";
        case ReasonCode::ValidationError: return "ValidationError";
        case ReasonCode::ClassificationUnknown: return "ClassificationUnknown";
        case ReasonCode::ArchiveBomb: return "ArchiveBomb";
        case ReasonCode::ArchiveMalformed: return "ArchiveMalformed";
        case ReasonCode::ScannerUnavailable: return "ScannerUnavailable";
        case ReasonCode::MalwareDetected: return "MalwareDetected";
        case ReasonCode::DisarmFailed: return "DisarmFailed";
        case ReasonCode::InternalError: return "InternalError";
        case ReasonCode::Cancelled: return "Cancelled";
    }
    return "InternalError";
}

/** @brief Opaque reference to a quarantined file. Never the original location. */
struct QuarantineHandle {
    std::string id;        ///< Hex SHA-256 of the original path.
    std::string location;  ///< Path inside the quarantine store.
};

/**
 * @struct Verdict
 * @brief Everything needed to reconstruct why a file was admitted, blocked or quarantined.
 */
struct Verdict {
    Decision decision = Decision::Blocked;
    ReasonCode reason = ReasonCode::InternalError;
    std::string detail;

    std::string candidateName;
    Classification classification;
    std::optional<ArchiveManifest> archive;
    std::optional<ScanOutcome> preScan;
    std::optional<ScanOutcome> postScan;
    std::optional<DisarmResult> disarm;
    std::optional<QuarantineHandle> quarantined;

    /// File the storage layer should persist; set only when admitted.
    std::optional<std::string> storedArtifact;

    /// True when any scan was unavailable and the fail-open policy let the run continue.
    bool scannerUnavailable = false;

    std::chrono::system_clock::time_point decidedAt;

    bool admitted() const { return decision == Decision::Admitted; }
};

} // namespace filegate::domain
