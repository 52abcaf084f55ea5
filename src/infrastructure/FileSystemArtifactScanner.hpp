/**
 * @file FileSystemArtifactScanner.hpp
 * @brief Scanner for detecting pending uploads in the inbox.
 */

#pragma once
#include <vector>
#include <string>
#include "domain/CandidateFile.hpp"

namespace filegate::infrastructure {

/**
 * @class FileSystemArtifactScanner
 * @brief Infrastructure adapter listing the regular files of an inbox directory.
 *
 * Nothing is filtered here: the admission pipeline decides about every file,
 * including the ones with names it does not accept.
 */
class FileSystemArtifactScanner {
public:
    explicit FileSystemArtifactScanner(const std::string& inboxPath);

    /**
     * @brief Lists pending uploads, oldest first.
     * @return One CandidateFile per regular file, with size and name taken from the file system.
     */
    std::vector<domain::CandidateFile> scan() const;

    const std::string& inboxPath() const { return m_inboxPath; }

private:
    std::string m_inboxPath;
};

} // namespace filegate::infrastructure
