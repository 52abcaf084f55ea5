/**
 * @file QuarantineStore.cpp
 * @brief Implementation of QuarantineStore.
 */

#include "infrastructure/QuarantineStore.hpp"
#include "infrastructure/Digest.hpp"
#include "infrastructure/VerdictJson.hpp"
#include "infrastructure/ScopedWorkArea.hpp"
#include <nlohmann/json.hpp>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <mutex>

namespace filegate::infrastructure {

namespace fs = std::filesystem;

namespace {
// Serializes slot selection across stores sharing one directory.
std::mutex g_slotMutex;
}

QuarantineStore::QuarantineStore(std::string directory) : m_directory(std::move(directory)) {}

std::string QuarantineStore::KeyFor(const std::string& originalPath) {
    return Digest::Sha256Hex(originalPath);
}

std::optional<std::string> QuarantineStore::NextFreeKey(const std::string& key) const {
    const fs::path dir(m_directory);
    for (int sequence = 0; sequence < kMaxSlotsPerKey; ++sequence) {
        std::string candidate = sequence == 0 ? key : key + "-" + std::to_string(sequence);
        std::error_code ec;
        bool taken = fs::exists(dir / (candidate + ".bin"), ec) || fs::exists(dir / (candidate + ".json"), ec);
        if (ec) return std::nullopt;
        if (!taken) return candidate;
    }
    return std::nullopt;
}

std::optional<domain::QuarantineHandle> QuarantineStore::quarantine(const domain::CandidateFile& candidate,
                                                                    domain::ReasonCode reason,
                                                                    const std::string& detail) {
    std::error_code ec;
    fs::create_directories(m_directory, ec);
    if (ec) {
        std::cerr << "[QuarantineStore] Cannot create " << m_directory << ": " << ec.message() << std::endl;
        return std::nullopt;
    }
    fs::permissions(m_directory, fs::perms::owner_all, fs::perm_options::replace, ec);

    domain::QuarantineHandle handle;
    fs::path target;
    {
        std::lock_guard<std::mutex> lock(g_slotMutex);
        auto slot = NextFreeKey(KeyFor(candidate.path));
        if (!slot) {
            std::cerr << "[QuarantineStore] No free slot for " << candidate.path << std::endl;
            return std::nullopt;
        }
        handle.id = *slot;
        target = fs::path(m_directory) / (handle.id + ".bin");
        handle.location = target.string();

        std::string error;
        if (!MoveFile(candidate.path, target, error)) {
            std::cerr << "[QuarantineStore] Move failed for " << candidate.path << ": " << error << std::endl;
            return std::nullopt;
        }
    }
    fs::permissions(target, fs::perms::owner_read | fs::perms::owner_write, fs::perm_options::replace, ec);

    nlohmann::json sidecar;
    sidecar["id"] = handle.id;
    sidecar["original_path"] = candidate.path;
    sidecar["claimed_name"] = candidate.claimedName;
    sidecar["reason"] = domain::ReasonToString(reason);
    sidecar["detail"] = detail;
    sidecar["quarantined_at"] = FormatTimestamp(std::chrono::system_clock::now());

    try {
        std::ofstream out(fs::path(m_directory) / (handle.id + ".json"), std::ios::trunc);
        out << sidecar.dump(2);
        if (!out) {
            std::cerr << "[QuarantineStore] Sidecar write failed for " << handle.id << std::endl;
        }
    } catch (const std::exception& e) {
        std::cerr << "[QuarantineStore] Sidecar error: " << e.what() << std::endl;
    }

    std::cout << "[QuarantineStore] Isolated " << candidate.claimedName << " as " << handle.id << std::endl;
    return handle;
}

} // namespace filegate::infrastructure
