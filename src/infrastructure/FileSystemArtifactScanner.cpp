/**
 * @file FileSystemArtifactScanner.cpp
 * @brief Implementation of the FileSystemArtifactScanner.
 */

#include "infrastructure/FileSystemArtifactScanner.hpp"
#include <algorithm>
#include <filesystem>
#include <iostream>
#include <utility>

namespace fs = std::filesystem;

namespace filegate::infrastructure {

FileSystemArtifactScanner::FileSystemArtifactScanner(const std::string& inboxPath)
    : m_inboxPath(inboxPath) {}

std::vector<domain::CandidateFile> FileSystemArtifactScanner::scan() const {
    std::vector<std::pair<fs::file_time_type, domain::CandidateFile>> found;

    std::error_code ec;
    if (!fs::exists(m_inboxPath, ec)) {
        return {};
    }

    for (const auto& entry : fs::directory_iterator(m_inboxPath, ec)) {
        // Symlinks are not followed; a link could point anywhere on the host.
        if (!entry.is_regular_file(ec) || entry.is_symlink(ec)) {
            continue;
        }
        // Partially written uploads and sidecars are not candidates.
        std::string name = entry.path().filename().string();
        if (name.empty() || name.front() == '.' || entry.path().extension() == ".partial") {
            continue;
        }

        domain::CandidateFile candidate;
        candidate.path = entry.path().string();
        candidate.claimedName = name;
        candidate.claimedExtension = domain::CandidateFile::ExtensionOf(name);
        candidate.declaredSize = static_cast<std::uint64_t>(entry.file_size(ec));
        if (ec) {
            std::cerr << "[FileSystemArtifactScanner] Cannot stat " << candidate.path << ": " << ec.message() << std::endl;
            continue;
        }

        found.emplace_back(entry.last_write_time(ec), std::move(candidate));
    }
    if (ec) {
        std::cerr << "[FileSystemArtifactScanner] Listing " << m_inboxPath << " stopped: " << ec.message() << std::endl;
    }

    std::stable_sort(found.begin(), found.end(),
                     [](const auto& a, const auto& b) { return a.first < b.first; });

    std::vector<domain::CandidateFile> candidates;
    candidates.reserve(found.size());
    for (auto& item : found) {
        candidates.push_back(std::move(item.second));
    }
    return candidates;
}

} // namespace filegate::infrastructure
