/**
 * @file FileSystemArtifactStore.hpp
 * @brief ArtifactSink writing admitted files into the storage directory.
 */

#pragma once
#include <string>
#include "domain/ArtifactSink.hpp"

namespace filegate::infrastructure {

/**
 * @class FileSystemArtifactStore
 * @brief Stores each artifact under its content hash with the verdict JSON beside it.
 */
class FileSystemArtifactStore : public domain::ArtifactSink {
public:
    explicit FileSystemArtifactStore(std::string storageDir);

    std::optional<std::string> store(const std::string& artifactPath, const domain::Verdict& verdict) override;

private:
    std::string m_storageDir;
};

} // namespace filegate::infrastructure
