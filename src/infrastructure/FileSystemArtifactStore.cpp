/**
 * @file FileSystemArtifactStore.cpp
 * @brief Implementation of FileSystemArtifactStore.
 */

#include "infrastructure/FileSystemArtifactStore.hpp"
#include "infrastructure/Digest.hpp"
#include "infrastructure/ScopedWorkArea.hpp"
#include "infrastructure/VerdictJson.hpp"
#include <filesystem>
#include <fstream>
#include <iostream>

namespace fs = std::filesystem;

namespace filegate::infrastructure {

FileSystemArtifactStore::FileSystemArtifactStore(std::string storageDir)
    : m_storageDir(std::move(storageDir)) {}

std::optional<std::string> FileSystemArtifactStore::store(const std::string& artifactPath,
                                                          const domain::Verdict& verdict) {
    if (!verdict.admitted()) {
        std::cerr << "[FileSystemArtifactStore] Refusing to store non-admitted " << verdict.candidateName << std::endl;
        return std::nullopt;
    }

    std::error_code ec;
    fs::create_directories(m_storageDir, ec);
    if (ec) {
        std::cerr << "[FileSystemArtifactStore] Cannot create " << m_storageDir << ": " << ec.message() << std::endl;
        return std::nullopt;
    }

    auto hash = Digest::Sha256FileHex(artifactPath);
    if (!hash) {
        std::cerr << "[FileSystemArtifactStore] Cannot read " << artifactPath << std::endl;
        return std::nullopt;
    }

    // The stored name keeps the claimed extension so downstream consumers pick the right reader.
    std::string ext = fs::path(verdict.candidateName).extension().string();
    fs::path target = fs::path(m_storageDir) / (*hash + ext);

    std::string error;
    if (!MoveFile(artifactPath, target, error)) {
        std::cerr << "[FileSystemArtifactStore] Move failed: " << error << std::endl;
        return std::nullopt;
    }

    nlohmann::json sidecar = VerdictToJson(verdict);
    sidecar["stored_as"] = target.filename().string();
    sidecar["sha256"] = *hash;
    std::ofstream out(fs::path(m_storageDir) / (*hash + ".verdict.json"), std::ios::trunc);
    out << sidecar.dump(2);
    if (!out) {
        std::cerr << "[FileSystemArtifactStore] Verdict sidecar write failed for " << *hash << std::endl;
    }

    return target.string();
}

} // namespace filegate::infrastructure
