/**
 * @file AdmissionPipeline.hpp
 * @brief Orchestrates validation, classification, inspection, scanning and disarm for one upload.
 */

#pragma once
#include <memory>
#include "domain/CandidateFile.hpp"
#include "domain/ScanConfig.hpp"
#include "domain/Verdict.hpp"
#include "domain/SignatureScanner.hpp"
#include "domain/CancellationToken.hpp"

namespace filegate::application {

/**
 * @class AdmissionPipeline
 * @brief The only component that decides a verdict.
 *
 * A run moves through Validated, Classified, Inspected, PreScanned, Disarmed
 * and PostScanned; every failure short-circuits to a terminal verdict. Runs
 * share nothing but the scanner, so one pipeline may serve many threads.
 */
class AdmissionPipeline {
public:
    explicit AdmissionPipeline(std::shared_ptr<domain::SignatureScanner> scanner);

    /**
     * @brief Decides whether @p candidate may enter the platform.
     *
     * Never throws. On Admitted the verdict names the file to persist; on
     * Quarantined the candidate has been moved into the quarantine store.
     * Every other temporary file is gone when this returns.
     */
    domain::Verdict scanAndDisarm(const domain::CandidateFile& candidate,
                                  const domain::ScanConfig& config,
                                  const domain::CancellationToken& cancel = domain::CancellationToken()) const;

private:
    domain::Verdict run(const domain::CandidateFile& candidate,
                        const domain::ScanConfig& config,
                        const domain::CancellationToken& cancel) const;

    std::shared_ptr<domain::SignatureScanner> m_scanner;
};

} // namespace filegate::application
