/**
 * @file AdmissionPipeline.cpp
 * @brief Implementation of AdmissionPipeline.
 */

#include "application/AdmissionPipeline.hpp"
#include "application/ScanCoordinator.hpp"
#include "infrastructure/FormatClassifier.hpp"
#include "infrastructure/ZipArchiveInspector.hpp"
#include "infrastructure/DisarmEngine.hpp"
#include "infrastructure/QuarantineStore.hpp"
#include "infrastructure/ScopedWorkArea.hpp"
#include <algorithm>
#include <filesystem>
#include <iostream>

namespace fs = std::filesystem;

namespace filegate::application {

using domain::Decision;
using domain::ReasonCode;
using domain::Verdict;

namespace {

Verdict Finish(Verdict v, Decision decision, ReasonCode reason, std::string detail) {
    v.decision = decision;
    v.reason = reason;
    v.detail = std::move(detail);
    v.decidedAt = std::chrono::system_clock::now();
    std::cout << "[AdmissionPipeline] " << v.candidateName << ": " << domain::DecisionToString(decision)
              << " (" << domain::ReasonToString(reason) << ")";
    if (!v.detail.empty()) std::cout << " " << v.detail;
    std::cout << std::endl;
    return v;
}

Verdict Cancelled(Verdict v) {
    return Finish(std::move(v), Decision::Blocked, ReasonCode::Cancelled, "Run cancelled by caller");
}

} // namespace

AdmissionPipeline::AdmissionPipeline(std::shared_ptr<domain::SignatureScanner> scanner)
    : m_scanner(std::move(scanner)) {}

domain::Verdict AdmissionPipeline::scanAndDisarm(const domain::CandidateFile& candidate,
                                                 const domain::ScanConfig& config,
                                                 const domain::CancellationToken& cancel) const {
    try {
        return run(candidate, config, cancel);
    } catch (const std::exception& e) {
        std::cerr << "[AdmissionPipeline] Internal error for " << candidate.claimedName << ": " << e.what() << std::endl;
        Verdict v;
        v.candidateName = candidate.claimedName;
        return Finish(std::move(v), Decision::Blocked, ReasonCode::InternalError, "Internal error during admission");
    }
}

domain::Verdict AdmissionPipeline::run(const domain::CandidateFile& candidate,
                                       const domain::ScanConfig& config,
                                       const domain::CancellationToken& cancel) const {
    Verdict v;
    v.candidateName = candidate.claimedName;

    // Validated
    if (config.allowedExtensions.count(candidate.claimedExtension) == 0) {
        return Finish(std::move(v), Decision::Blocked, ReasonCode::ValidationError,
                      "Extension '." + candidate.claimedExtension + "' is not accepted");
    }
    std::error_code ec;
    auto actualSize = fs::file_size(candidate.path, ec);
    if (ec) {
        return Finish(std::move(v), Decision::Blocked, ReasonCode::ValidationError, "Candidate cannot be opened");
    }
    std::uint64_t size = std::max<std::uint64_t>(candidate.declaredSize, actualSize);
    if (size > config.maxDeclaredSize) {
        return Finish(std::move(v), Decision::Blocked, ReasonCode::ValidationError,
                      "Size " + std::to_string(size) + " exceeds " + std::to_string(config.maxDeclaredSize));
    }
    auto prefix = infrastructure::FormatClassifier::ReadPrefix(candidate.path, config.classifierWindowBytes);
    if (!prefix) {
        return Finish(std::move(v), Decision::Blocked, ReasonCode::ValidationError, "Candidate cannot be opened");
    }

    // Classified
    v.classification = infrastructure::FormatClassifier::Classify(*prefix, candidate.claimedExtension,
                                                                  candidate.declaredMimeType, config);
    const domain::FileFormat format = v.classification.detectedFormat;
    if (format == domain::FileFormat::Unknown) {
        return Finish(std::move(v), Decision::Blocked, ReasonCode::ClassificationUnknown,
                      "Content matches no known format");
    }
    if (!v.classification.extensionMatch) {
        return Finish(std::move(v), Decision::Blocked, ReasonCode::ValidationError,
                      "Content is " + domain::FormatToString(format) + " but the name claims '." +
                      candidate.claimedExtension + "'");
    }
    if (cancel.isCancelled()) return Cancelled(std::move(v));

    // Inspected
    if (domain::IsInspectedContainer(format)) {
        auto inspection = infrastructure::ZipArchiveInspector::Inspect(candidate.path, config.archive);
        if (inspection.error) {
            const auto& err = *inspection.error;
            return Finish(std::move(v), Decision::Blocked,
                          err.isBomb() ? ReasonCode::ArchiveBomb : ReasonCode::ArchiveMalformed,
                          domain::ArchiveError::KindToString(err.kind) + ": " + err.detail);
        }
        v.archive = std::move(inspection.manifest);
    }
    if (cancel.isCancelled()) return Cancelled(std::move(v));

    // PreScanned
    ScanCoordinator scanner(m_scanner, config.scanner);
    const bool failClosed = config.scanner.unavailablePolicy == domain::UnavailablePolicy::FailClosed;

    domain::ScanOutcome pre = scanner.scan(candidate.path);
    v.preScan = pre;
    if (auto* infected = std::get_if<domain::scan::Infected>(&pre)) {
        return Finish(std::move(v), Decision::Blocked, ReasonCode::MalwareDetected, infected->signatureName);
    }
    if (auto* unavailable = std::get_if<domain::scan::ScanUnavailable>(&pre)) {
        if (failClosed) {
            return Finish(std::move(v), Decision::Blocked, ReasonCode::ScannerUnavailable, unavailable->reason);
        }
        std::cerr << "[AdmissionPipeline] Scanner unavailable for " << v.candidateName
                  << ", continuing under fail-open: " << unavailable->reason << std::endl;
        v.scannerUnavailable = true;
    }
    if (cancel.isCancelled()) return Cancelled(std::move(v));

    if (domain::ClassifyForDisarm(format) == domain::DisarmClass::PassThrough) {
        v.storedArtifact = candidate.path;
        return Finish(std::move(v), Decision::Admitted, ReasonCode::Admitted, "");
    }

    // Disarmed
    infrastructure::DisarmEngine engine(config, cancel);
    domain::DisarmResult disarm = engine.neutralize(candidate.path, format);
    infrastructure::ScopedArtifact artifact;
    if (disarm.neutralizedArtifact) {
        artifact = infrastructure::ScopedArtifact(*disarm.neutralizedArtifact);
    }
    v.disarm = disarm;
    if (cancel.isCancelled()) return Cancelled(std::move(v));

    if (!disarm.success) {
        infrastructure::QuarantineStore quarantine(config.paths.quarantineDir);
        auto handle = quarantine.quarantine(candidate, ReasonCode::DisarmFailed, disarm.detail);
        if (!handle) {
            return Finish(std::move(v), Decision::Blocked, ReasonCode::InternalError,
                          "Disarm failed and the candidate could not be quarantined: " + disarm.detail);
        }
        v.quarantined = *handle;
        return Finish(std::move(v), Decision::Quarantined, ReasonCode::DisarmFailed, disarm.detail);
    }

    if (artifact.empty()) {
        v.storedArtifact = candidate.path;
        return Finish(std::move(v), Decision::Admitted, ReasonCode::Admitted, "Nothing to neutralize");
    }

    // PostScanned
    domain::ScanOutcome post = scanner.scan(artifact.path());
    v.postScan = post;
    if (auto* infected = std::get_if<domain::scan::Infected>(&post)) {
        return Finish(std::move(v), Decision::Blocked, ReasonCode::MalwareDetected,
                      "Neutralized artifact: " + infected->signatureName);
    }
    if (auto* unavailable = std::get_if<domain::scan::ScanUnavailable>(&post)) {
        if (failClosed) {
            return Finish(std::move(v), Decision::Blocked, ReasonCode::ScannerUnavailable, unavailable->reason);
        }
        v.scannerUnavailable = true;
    }
    if (cancel.isCancelled()) return Cancelled(std::move(v));

    v.storedArtifact = artifact.release();
    return Finish(std::move(v), Decision::Admitted, ReasonCode::Admitted, "");
}

} // namespace filegate::application
