/**
 * @file AppServices.hpp
 * @brief Container for application-level services to facilitate dependency injection.
 */

#pragma once

#include <memory>
#include "domain/SignatureScanner.hpp"
#include "domain/ArtifactSink.hpp"
#include "application/AdmissionPipeline.hpp"
#include "application/UploadIngestionService.hpp"
#include "infrastructure/AuditTrail.hpp"

namespace filegate::application {

struct AppServices {
    std::shared_ptr<domain::SignatureScanner> scanner;
    std::shared_ptr<AdmissionPipeline> pipeline;
    std::shared_ptr<domain::ArtifactSink> artifactSink;
    std::shared_ptr<infrastructure::AuditTrail> auditTrail;
    std::unique_ptr<UploadIngestionService> ingestionService;
};

} // namespace filegate::application
