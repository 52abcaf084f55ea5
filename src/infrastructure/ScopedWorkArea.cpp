/**
 * @file ScopedWorkArea.cpp
 * @brief Implementation of ScopedWorkArea and ScopedArtifact.
 */

#include "infrastructure/ScopedWorkArea.hpp"
#include <atomic>
#include <chrono>
#include <iostream>
#include <thread>
#include <functional>

namespace fs = std::filesystem;

namespace filegate::infrastructure {

namespace {
std::atomic<unsigned long> g_sequence{0};
}

fs::path UniquePath(const fs::path& dir, const std::string& stem, const std::string& suffix) {
    auto now = std::chrono::high_resolution_clock::now().time_since_epoch().count();
    auto thread = std::hash<std::thread::id>{}(std::this_thread::get_id()) & 0xFFFF;
    std::string name = stem + "_" + std::to_string(now) + "_" + std::to_string(thread) + "_" +
                       std::to_string(g_sequence.fetch_add(1)) + suffix;
    return dir / name;
}

// Same-filesystem moves are atomic; across devices the copy is completed before the source goes away.
bool MoveFile(const fs::path& from, const fs::path& to, std::string& error) {
    std::error_code ec;
    fs::rename(from, to, ec);
    if (!ec) return true;
    if (ec != std::errc::cross_device_link) {
        error = ec.message();
        return false;
    }

    fs::path staging = to;
    staging += ".partial";
    fs::copy_file(from, staging, fs::copy_options::overwrite_existing, ec);
    if (!ec) fs::rename(staging, to, ec);
    if (ec) {
        error = ec.message();
        std::error_code ignored;
        fs::remove(staging, ignored);
        return false;
    }
    fs::remove(from, ec);
    if (ec) {
        std::cerr << "[MoveFile] Copied but could not remove original " << from << ": " << ec.message() << std::endl;
    }
    return true;
}

ScopedWorkArea::ScopedWorkArea(const std::string& baseDir, const std::string& tag) {
    std::error_code ec;
    fs::path base = baseDir.empty() ? fs::temp_directory_path(ec) : fs::path(baseDir);
    if (ec) {
        std::cerr << "[ScopedWorkArea] No temp directory: " << ec.message() << std::endl;
        return;
    }
    fs::create_directories(base, ec);

    fs::path candidate = UniquePath(base, "filegate_" + tag, "");
    if (!fs::create_directory(candidate, ec) || ec) {
        std::cerr << "[ScopedWorkArea] Cannot create " << candidate << ": " << ec.message() << std::endl;
        return;
    }
    fs::permissions(candidate, fs::perms::owner_all, fs::perm_options::replace, ec);
    m_path = candidate;
}

ScopedWorkArea::~ScopedWorkArea() {
    if (m_path.empty()) return;
    std::error_code ec;
    fs::remove_all(m_path, ec);
    if (ec) {
        std::cerr << "[ScopedWorkArea] Cleanup of " << m_path << " failed: " << ec.message() << std::endl;
    }
}

fs::path ScopedWorkArea::file(const std::string& suffix) {
    return m_path / ("entry_" + std::to_string(m_counter++) + suffix);
}

ScopedArtifact& ScopedArtifact::operator=(ScopedArtifact&& other) noexcept {
    if (this != &other) {
        reset();
        m_path = std::move(other.m_path);
        other.m_path.clear();
    }
    return *this;
}

std::string ScopedArtifact::release() {
    std::string p = std::move(m_path);
    m_path.clear();
    return p;
}

void ScopedArtifact::reset() {
    if (m_path.empty()) return;
    std::error_code ec;
    fs::remove(m_path, ec);
    if (ec) {
        std::cerr << "[ScopedArtifact] Cannot remove " << m_path << ": " << ec.message() << std::endl;
    }
    m_path.clear();
}

} // namespace filegate::infrastructure
