/**
 * @file UploadIngestionService.hpp
 * @brief Runs the admission pipeline over every pending upload in the inbox.
 */

#pragma once
#include <memory>
#include <vector>
#include <string>
#include <functional>
#include <mutex>
#include "domain/ArtifactSink.hpp"
#include "domain/CancellationToken.hpp"
#include "application/AdmissionPipeline.hpp"
#include "infrastructure/FileSystemArtifactScanner.hpp"
#include "infrastructure/AuditTrail.hpp"

namespace filegate::application {

/**
 * @class UploadIngestionService
 * @brief Orchestrates the batch from inbox listing to storage and audit.
 */
class UploadIngestionService {
public:
    UploadIngestionService(std::unique_ptr<infrastructure::FileSystemArtifactScanner> scanner,
                           std::shared_ptr<AdmissionPipeline> pipeline,
                           std::shared_ptr<domain::ArtifactSink> sink,
                           std::shared_ptr<infrastructure::AuditTrail> audit);

    /**
     * @brief Result of an ingestion pass.
     */
    struct IngestionResult {
        int detected = 0;
        int admitted = 0;
        int blocked = 0;
        int quarantined = 0;
        std::vector<std::string> errors;
    };

    /**
     * @brief Decides about all pending uploads, up to config.ingestParallelism at a time.
     * @param statusCallback Progress feedback; may be called from worker threads.
     * @return Summary of the pass.
     */
    IngestionResult ingestPending(const domain::ScanConfig& config,
                                  const domain::CancellationToken& cancel = domain::CancellationToken(),
                                  std::function<void(std::string)> statusCallback = nullptr);

    /**
     * @brief True if the inbox copy should be kept for a later pass.
     *
     * Transient outcomes (scanner outage, internal error, cancellation) are retried;
     * every other blocked upload is removed once its verdict is audited.
     */
    static bool KeepForRetry(const domain::Verdict& verdict);

private:
    void settle(const domain::CandidateFile& candidate, domain::Verdict verdict, IngestionResult& result,
                std::mutex& resultMutex);

    std::unique_ptr<infrastructure::FileSystemArtifactScanner> m_scanner;
    std::shared_ptr<AdmissionPipeline> m_pipeline;
    std::shared_ptr<domain::ArtifactSink> m_sink;
    std::shared_ptr<infrastructure::AuditTrail> m_audit;
};

} // namespace filegate::application
