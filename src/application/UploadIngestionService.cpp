/**
 * @file UploadIngestionService.cpp
 * @brief Implementation of UploadIngestionService.
 */

#include "application/UploadIngestionService.hpp"
#include <algorithm>
#include <atomic>
#include <filesystem>
#include <iostream>
#include <mutex>
#include <thread>

namespace fs = std::filesystem;

namespace filegate::application {

using domain::Decision;
using domain::ReasonCode;

UploadIngestionService::UploadIngestionService(std::unique_ptr<infrastructure::FileSystemArtifactScanner> scanner,
                                               std::shared_ptr<AdmissionPipeline> pipeline,
                                               std::shared_ptr<domain::ArtifactSink> sink,
                                               std::shared_ptr<infrastructure::AuditTrail> audit)
    : m_scanner(std::move(scanner)), m_pipeline(std::move(pipeline)), m_sink(std::move(sink)),
      m_audit(std::move(audit)) {}

bool UploadIngestionService::KeepForRetry(const domain::Verdict& verdict) {
    if (verdict.decision != Decision::Blocked) return false;
    return verdict.reason == ReasonCode::ScannerUnavailable || verdict.reason == ReasonCode::InternalError ||
           verdict.reason == ReasonCode::Cancelled;
}

UploadIngestionService::IngestionResult UploadIngestionService::ingestPending(
    const domain::ScanConfig& config, const domain::CancellationToken& cancel,
    std::function<void(std::string)> statusCallback) {
    IngestionResult result;

    if (statusCallback) statusCallback("Scanning inbox...");
    auto candidates = m_scanner->scan();
    result.detected = static_cast<int>(candidates.size());
    if (candidates.empty()) return result;

    std::mutex resultMutex;
    std::atomic<std::size_t> next{0};
    auto worker = [&]() {
        while (!cancel.isCancelled()) {
            std::size_t index = next.fetch_add(1);
            if (index >= candidates.size()) return;
            const auto& candidate = candidates[index];

            if (statusCallback) statusCallback("Processing: " + candidate.claimedName);
            domain::Verdict verdict = m_pipeline->scanAndDisarm(candidate, config, cancel);
            settle(candidate, std::move(verdict), result, resultMutex);
        }
    };

    std::size_t threads = static_cast<std::size_t>(std::max(1, config.ingestParallelism));
    threads = std::min(threads, candidates.size());
    std::vector<std::thread> pool;
    pool.reserve(threads);
    for (std::size_t i = 0; i < threads; ++i) {
        pool.emplace_back(worker);
    }
    for (auto& t : pool) {
        t.join();
    }

    if (cancel.isCancelled()) {
        std::lock_guard<std::mutex> lock(resultMutex);
        result.errors.push_back("Ingestion cancelled before the inbox was drained");
    }
    return result;
}

void UploadIngestionService::settle(const domain::CandidateFile& candidate, domain::Verdict verdict,
                                    IngestionResult& result, std::mutex& resultMutex) {
    std::string error;

    if (verdict.admitted() && verdict.storedArtifact) {
        const std::string artifact = *verdict.storedArtifact;
        auto stored = m_sink ? m_sink->store(artifact, verdict) : std::nullopt;
        if (stored) {
            verdict.storedArtifact = *stored;
            if (artifact != candidate.path) {
                std::error_code ec;
                fs::remove(candidate.path, ec);
            }
        } else {
            error = "Storage failed for " + candidate.claimedName;
            if (artifact != candidate.path) {
                std::error_code ec;
                fs::remove(artifact, ec);
            }
            verdict.storedArtifact.reset();
        }
    } else if (verdict.decision == Decision::Blocked && !KeepForRetry(verdict)) {
        std::error_code ec;
        fs::remove(candidate.path, ec);
        if (ec) {
            std::cerr << "[UploadIngestionService] Cannot remove blocked " << candidate.path << ": " << ec.message() << std::endl;
        }
    }

    if (m_audit) {
        m_audit->record(verdict, candidate.path);
    }

    std::lock_guard<std::mutex> lock(resultMutex);
    switch (verdict.decision) {
        case Decision::Admitted: result.admitted++; break;
        case Decision::Blocked: result.blocked++; break;
        case Decision::Quarantined: result.quarantined++; break;
    }
    if (!error.empty()) {
        result.errors.push_back(error);
    }
}

} // namespace filegate::application
