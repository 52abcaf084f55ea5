/**
 * @file ConfigLoader.cpp
 * @brief Implementation of ConfigLoader.
 */

#include "infrastructure/ConfigLoader.hpp"
#include "infrastructure/PathUtils.hpp"
#include <filesystem>
#include <fstream>
#include <nlohmann/json.hpp>
#include <iostream>
#include <stdexcept>

namespace filegate::infrastructure {

using domain::FileFormat;

domain::ScanConfig ConfigLoader::DefaultConfig() {
    domain::ScanConfig config = domain::ScanConfig::Defaults();
    config.paths.quarantineDir = PathUtils::GetQuarantineDir().string();
    config.paths.artifactDir = PathUtils::GetArtifactDir().string();
    config.paths.storageDir = PathUtils::GetStorageDir().string();
    config.paths.workDir = PathUtils::GetWorkDir().string();
    config.paths.auditLog = PathUtils::GetAuditLog().string();
    return config;
}

std::optional<domain::UnavailablePolicy> ConfigLoader::ParsePolicy(const std::string& value) {
    if (value == "fail-open") return domain::UnavailablePolicy::FailOpen;
    if (value == "fail-closed") return domain::UnavailablePolicy::FailClosed;
    return std::nullopt;
}

void ConfigLoader::Apply(const nlohmann::json& j, domain::ScanConfig& config) {
    if (j.contains("allowed_extensions")) {
        config.allowedExtensions.clear();
        for (const auto& ext : j.at("allowed_extensions")) {
            config.allowedExtensions.insert(ext.get<std::string>());
        }
    }
    if (j.contains("expected_formats")) {
        for (const auto& item : j.at("expected_formats").items()) {
            const std::string& ext = item.key();
            std::set<FileFormat> formats;
            for (const auto& name : item.value()) {
                auto format = domain::FormatFromString(name.get<std::string>());
                if (!format) {
                    throw std::invalid_argument("Unknown format '" + name.get<std::string>() + "' for ." + ext);
                }
                formats.insert(*format);
            }
            config.expectedFormats[ext] = std::move(formats);
        }
    }
    if (j.contains("max_declared_size")) config.maxDeclaredSize = j.at("max_declared_size").get<std::uint64_t>();
    if (j.contains("classifier_window_bytes")) config.classifierWindowBytes = j.at("classifier_window_bytes").get<std::size_t>();

    if (j.contains("archive")) {
        const auto& a = j.at("archive");
        if (a.contains("max_entries")) config.archive.maxEntries = a.at("max_entries").get<std::size_t>();
        if (a.contains("max_total_uncompressed")) config.archive.maxTotalUncompressed = a.at("max_total_uncompressed").get<std::uint64_t>();
        if (a.contains("max_expansion_ratio")) config.archive.maxExpansionRatio = a.at("max_expansion_ratio").get<double>();
        if (a.contains("max_nesting_depth")) config.archive.maxNestingDepth = a.at("max_nesting_depth").get<int>();
    }

    if (j.contains("scanner")) {
        const auto& s = j.at("scanner");
        if (s.contains("host")) config.scanner.host = s.at("host").get<std::string>();
        if (s.contains("port")) config.scanner.port = s.at("port").get<int>();
        if (s.contains("path")) config.scanner.path = s.at("path").get<std::string>();
        if (s.contains("timeout_ms")) config.scanner.timeout = std::chrono::milliseconds(s.at("timeout_ms").get<long long>());
        if (s.contains("retry_timeout_ms")) config.scanner.retryTimeout = std::chrono::milliseconds(s.at("retry_timeout_ms").get<long long>());
        if (s.contains("unavailable_policy")) {
            auto policy = ParsePolicy(s.at("unavailable_policy").get<std::string>());
            if (!policy) throw std::invalid_argument("unavailable_policy must be fail-open or fail-closed");
            config.scanner.unavailablePolicy = *policy;
        }
    }

    if (j.contains("pdf") && j.at("pdf").contains("normalize_with_qpdf")) {
        config.normalizePdfWithQpdf = j.at("pdf").at("normalize_with_qpdf").get<bool>();
    }

    if (j.contains("paths")) {
        const auto& p = j.at("paths");
        if (p.contains("quarantine_dir")) config.paths.quarantineDir = p.at("quarantine_dir").get<std::string>();
        if (p.contains("artifact_dir")) config.paths.artifactDir = p.at("artifact_dir").get<std::string>();
        if (p.contains("work_dir")) config.paths.workDir = p.at("work_dir").get<std::string>();
        if (p.contains("storage_dir")) config.paths.storageDir = p.at("storage_dir").get<std::string>();
        if (p.contains("audit_log")) config.paths.auditLog = p.at("audit_log").get<std::string>();
    }

    if (j.contains("audit") && j.at("audit").contains("hmac_key")) {
        config.auditHmacKey = j.at("audit").at("hmac_key").get<std::string>();
    }
    if (j.contains("ingest") && j.at("ingest").contains("parallelism")) {
        config.ingestParallelism = j.at("ingest").at("parallelism").get<int>();
    }
}

std::optional<domain::ScanConfig> ConfigLoader::Load(const std::string& path) {
    if (!std::filesystem::exists(path)) {
        std::cerr << "[ConfigLoader] Settings file not found: " << path << std::endl;
        return std::nullopt;
    }

    try {
        std::ifstream f(path);
        nlohmann::json j;
        f >> j;

        domain::ScanConfig config = DefaultConfig();
        Apply(j, config);
        if (config.scanner.retryTimeout > config.scanner.timeout) {
            std::cerr << "[ConfigLoader] retry_timeout_ms exceeds timeout_ms; clamping." << std::endl;
            config.scanner.retryTimeout = config.scanner.timeout;
        }
        return config;
    } catch (const std::exception& e) {
        std::cerr << "[ConfigLoader] Error reading " << path << ": " << e.what() << std::endl;
    }

    return std::nullopt;
}

} // namespace filegate::infrastructure
