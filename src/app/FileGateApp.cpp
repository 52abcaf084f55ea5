/**
 * @file FileGateApp.cpp
 * @brief Implementation of the FileGateApp class.
 */
#include "app/FileGateApp.hpp"

#include <filesystem>
#include <iostream>
#include "infrastructure/ConfigLoader.hpp"
#include "infrastructure/PathUtils.hpp"
#include "infrastructure/HttpScannerClient.hpp"
#include "infrastructure/FileSystemArtifactScanner.hpp"
#include "infrastructure/FileSystemArtifactStore.hpp"
#include "infrastructure/VerdictJson.hpp"

namespace filegate::app {

void FileGateApp::PrintUsage() {
    std::cerr << "Usage:\n"
              << "  filegate scan <file> [--name N] [--mime M] [--config C] [--fail-closed|--fail-open]\n"
              << "  filegate ingest <inbox> [--config C]\n"
              << "  filegate verify-audit [--config C]\n";
}

bool FileGateApp::ParseArgs(const std::vector<std::string>& args, Options& options, std::string& error) {
    if (args.empty()) {
        error = "No command given";
        return false;
    }
    options.command = args[0];

    for (std::size_t i = 1; i < args.size(); ++i) {
        const std::string& arg = args[i];
        auto value = [&](std::string& out) {
            if (i + 1 >= args.size()) {
                error = arg + " needs a value";
                return false;
            }
            out = args[++i];
            return true;
        };

        if (arg == "--name") {
            if (!value(options.claimedName)) return false;
        } else if (arg == "--mime") {
            if (!value(options.mimeType)) return false;
        } else if (arg == "--config") {
            if (!value(options.configPath)) return false;
        } else if (arg == "--fail-closed" || arg == "--fail-open") {
            options.policyOverride = arg.substr(2);
        } else if (!arg.empty() && arg[0] == '-') {
            error = "Unknown option " + arg;
            return false;
        } else if (options.target.empty()) {
            options.target = arg;
        } else {
            error = "Unexpected argument " + arg;
            return false;
        }
    }

    if (options.command == "scan" || options.command == "ingest") {
        if (options.target.empty()) {
            error = options.command + " needs a path";
            return false;
        }
    } else if (options.command != "verify-audit") {
        error = "Unknown command " + options.command;
        return false;
    }
    return true;
}

int FileGateApp::Run(const std::vector<std::string>& args) {
    Options options;
    std::string error;
    if (!ParseArgs(args, options, error)) {
        std::cerr << "[FileGate] " << error << std::endl;
        PrintUsage();
        return kExitUsage;
    }
    if (!Init(options)) {
        return kExitUsage;
    }

    int code = kExitUsage;
    if (options.command == "scan") {
        code = RunScan(options);
    } else if (options.command == "ingest") {
        code = RunIngest(options);
    } else {
        code = RunVerifyAudit();
    }
    Shutdown();
    return code;
}

bool FileGateApp::Init(const Options& options) {
    std::string configPath = options.configPath;
    if (configPath.empty()) {
        auto defaultPath = infrastructure::PathUtils::GetSettingsFile();
        if (std::filesystem::exists(defaultPath)) configPath = defaultPath.string();
    }

    if (configPath.empty()) {
        m_config = infrastructure::ConfigLoader::DefaultConfig();
    } else {
        auto loaded = infrastructure::ConfigLoader::Load(configPath);
        if (!loaded) {
            std::cerr << "[FileGate] Invalid configuration: " << configPath << std::endl;
            return false;
        }
        m_config = *loaded;
    }

    if (!options.policyOverride.empty()) {
        m_config.scanner.unavailablePolicy = *infrastructure::ConfigLoader::ParsePolicy(options.policyOverride);
    }

    m_services.scanner = std::make_shared<infrastructure::HttpScannerClient>(m_config.scanner);
    m_services.pipeline = std::make_shared<application::AdmissionPipeline>(m_services.scanner);
    m_services.artifactSink = std::make_shared<infrastructure::FileSystemArtifactStore>(m_config.paths.storageDir);
    if (options.command != "verify-audit") {
        m_services.auditTrail = std::make_shared<infrastructure::AuditTrail>(m_config.paths.auditLog, m_config.auditHmacKey);
    }
    if (options.command == "ingest") {
        m_services.ingestionService = std::make_unique<application::UploadIngestionService>(
            std::make_unique<infrastructure::FileSystemArtifactScanner>(options.target),
            m_services.pipeline, m_services.artifactSink, m_services.auditTrail);
    }
    return true;
}

void FileGateApp::Shutdown() {
    if (m_services.auditTrail) {
        m_services.auditTrail->stop();
    }
}

int FileGateApp::RunScan(const Options& options) {
    if (!std::filesystem::is_regular_file(options.target)) {
        std::cerr << "[FileGate] Not a regular file: " << options.target << std::endl;
        return kExitUsage;
    }

    auto candidate = domain::CandidateFile::FromPath(options.target, options.claimedName);
    candidate.declaredMimeType = options.mimeType;

    domain::Verdict verdict = m_services.pipeline->scanAndDisarm(candidate, m_config);
    m_services.auditTrail->record(verdict, candidate.path);

    std::cout << infrastructure::VerdictToJson(verdict).dump(2) << std::endl;
    switch (verdict.decision) {
        case domain::Decision::Admitted: return kExitAdmitted;
        case domain::Decision::Blocked: return kExitBlocked;
        case domain::Decision::Quarantined: return kExitQuarantined;
    }
    return kExitBlocked;
}

int FileGateApp::RunIngest(const Options& options) {
    auto result = m_services.ingestionService->ingestPending(m_config, domain::CancellationToken(),
                                                             [](const std::string& status) {
                                                                 std::cout << "[Ingest] " << status << std::endl;
                                                             });

    nlohmann::json summary = {
        {"inbox", options.target},
        {"detected", result.detected},
        {"admitted", result.admitted},
        {"blocked", result.blocked},
        {"quarantined", result.quarantined},
        {"errors", result.errors}
    };
    std::cout << summary.dump(2) << std::endl;
    return result.errors.empty() ? 0 : kExitBlocked;
}

int FileGateApp::RunVerifyAudit() {
    auto report = infrastructure::AuditTrail::Verify(m_config.paths.auditLog, m_config.auditHmacKey);
    if (report.intact) {
        std::cout << "[FileGate] Audit trail intact: " << report.records << " records" << std::endl;
        return 0;
    }
    std::cout << "[FileGate] Audit trail broken";
    if (report.brokenAtLine) std::cout << " at line " << *report.brokenAtLine;
    std::cout << ": " << report.problem << std::endl;
    return kExitBlocked;
}

} // namespace filegate::app
