/**
 * @file AuditTrail.cpp
 * @brief Implementation of AuditTrail.
 */

#include "infrastructure/AuditTrail.hpp"
#include "infrastructure/Digest.hpp"
#include "infrastructure/VerdictJson.hpp"
#include <filesystem>
#include <fstream>
#include <iostream>

namespace filegate::infrastructure {

namespace fs = std::filesystem;
using json = nlohmann::json;

const std::string AuditTrail::kGenesisHash(64, '0');

AuditTrail::AuditTrail(std::string logPath, std::string hmacKey)
    : m_logPath(std::move(logPath)), m_hmacKey(std::move(hmacKey)), m_running(true) {
    if (m_hmacKey.empty()) {
        std::cerr << "[AuditTrail] No HMAC key configured; records are chained but not authenticated." << std::endl;
    }
    m_lastHash = LastHashOf(m_logPath);
    m_worker = std::thread(&AuditTrail::workerLoop, this);
}

AuditTrail::~AuditTrail() {
    stop();
}

void AuditTrail::stop() {
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        if (!m_running) return;
        m_running = false;
    }
    m_cv.notify_all();

    if (m_worker.joinable()) {
        m_worker.join();
    }
}

void AuditTrail::record(const domain::Verdict& verdict, const std::string& candidatePath) {
    json body = VerdictToJson(verdict);
    body["candidate_path"] = candidatePath;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        if (!m_running) {
            std::cerr << "[AuditTrail] Record after stop() dropped for " << verdict.candidateName << std::endl;
            return;
        }
        m_queue.push(std::move(body));
    }
    m_cv.notify_one();
}

void AuditTrail::workerLoop() {
    while (true) {
        json body;

        {
            std::unique_lock<std::mutex> lock(m_mutex);
            m_cv.wait(lock, [this] {
                return !m_queue.empty() || !m_running;
            });

            if (!m_running && m_queue.empty()) {
                return;
            }

            if (m_queue.empty()) {
                continue;
            }

            body = std::move(m_queue.front());
            m_queue.pop();
        }

        appendLine(body);
    }
}

json AuditTrail::Seal(json body, const std::string& previousHash, const std::string& hmacKey) {
    std::string canonical = body.dump();
    std::string signature = Digest::HmacSha256Hex(hmacKey, canonical + previousHash);
    body["previous_hash"] = previousHash;
    body["signature"] = signature;
    body["hash"] = Digest::Sha256Hex(signature + previousHash);
    return body;
}

void AuditTrail::appendLine(const json& body) {
    fs::path path(m_logPath);
    try {
        if (path.has_parent_path() && !fs::exists(path.parent_path())) {
            fs::create_directories(path.parent_path());
        }

        json sealed = Seal(body, m_lastHash, m_hmacKey);
        std::ofstream out(path, std::ios::app);
        if (!out.is_open()) {
            std::cerr << "[AuditTrail] Failed to open log: " << m_logPath << std::endl;
            return;
        }
        out << sealed.dump() << '\n';
        out.flush();
        if (out.fail()) {
            std::cerr << "[AuditTrail] Write failed: " << m_logPath << std::endl;
            return;
        }
        m_lastHash = sealed["hash"].get<std::string>();
    } catch (const std::exception& e) {
        std::cerr << "[AuditTrail] Error appending record: " << e.what() << std::endl;
    }
}

std::string AuditTrail::LastHashOf(const std::string& logPath) {
    std::ifstream in(logPath);
    if (!in.is_open()) return kGenesisHash;

    std::string line, last;
    while (std::getline(in, line)) {
        if (!line.empty()) last = line;
    }
    if (last.empty()) return kGenesisHash;

    try {
        return json::parse(last).at("hash").get<std::string>();
    } catch (const std::exception& e) {
        std::cerr << "[AuditTrail] Existing log tail is unreadable (" << e.what()
                  << "); new records will not verify against it." << std::endl;
        return kGenesisHash;
    }
}

AuditTrail::VerifyReport AuditTrail::Verify(const std::string& logPath, const std::string& hmacKey) {
    VerifyReport report;
    std::ifstream in(logPath);
    if (!in.is_open()) {
        report.intact = false;
        report.problem = "Cannot open " + logPath;
        return report;
    }

    std::string expectedPrevious = kGenesisHash;
    std::string line;
    std::size_t lineNo = 0;
    auto broken = [&report, &lineNo](const std::string& why) {
        report.intact = false;
        report.brokenAtLine = lineNo;
        report.problem = why;
        return report;
    };

    while (std::getline(in, line)) {
        ++lineNo;
        if (line.empty()) continue;

        json sealed;
        try {
            sealed = json::parse(line);
        } catch (const std::exception& e) {
            return broken(std::string("Unparseable record: ") + e.what());
        }
        if (!sealed.is_object()) {
            return broken("Record lacks chain fields");
        }
        for (const char* field : {"previous_hash", "signature", "hash"}) {
            auto it = sealed.find(field);
            if (it == sealed.end() || !it->is_string()) {
                return broken("Record lacks chain fields");
            }
        }

        std::string previous = sealed["previous_hash"].get<std::string>();
        std::string signature = sealed["signature"].get<std::string>();
        std::string hash = sealed["hash"].get<std::string>();
        if (previous != expectedPrevious) {
            return broken("previous_hash does not match the preceding record");
        }

        json body = sealed;
        body.erase("previous_hash");
        body.erase("signature");
        body.erase("hash");
        json resealed = Seal(body, previous, hmacKey);
        if (resealed["signature"] != signature) {
            return broken("Signature mismatch");
        }
        if (resealed["hash"] != hash) {
            return broken("Hash mismatch");
        }

        expectedPrevious = hash;
        ++report.records;
    }
    return report;
}

} // namespace filegate::infrastructure
