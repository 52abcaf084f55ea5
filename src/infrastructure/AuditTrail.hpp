/**
 * @file AuditTrail.hpp
 * @brief Append-only, HMAC-chained log of every verdict.
 */

#pragma once
#include <string>
#include <queue>
#include <mutex>
#include <condition_variable>
#include <thread>
#include <atomic>
#include <optional>
#include <nlohmann/json.hpp>
#include "domain/Verdict.hpp"

namespace filegate::infrastructure {

/**
 * @class AuditTrail
 * @brief Manages a background thread that appends signed verdict records sequentially.
 *
 * Each JSON line carries `previous_hash`, an HMAC-SHA-256 `signature` over the
 * record body and the previous hash, and `hash = sha256(signature + previous_hash)`.
 * Removing, reordering or editing any line breaks the chain from that point.
 */
class AuditTrail {
public:
    /// previous_hash of the first record.
    static const std::string kGenesisHash;

    AuditTrail(std::string logPath, std::string hmacKey);
    ~AuditTrail();

    AuditTrail(const AuditTrail&) = delete;
    AuditTrail& operator=(const AuditTrail&) = delete;

    /**
     * @brief Queues the record for @p verdict.
     * @param candidatePath Where the candidate was read from.
     */
    void record(const domain::Verdict& verdict, const std::string& candidatePath);

    /**
     * @brief Stops the worker thread after every queued record is written.
     */
    void stop();

    /**
     * @struct VerifyReport
     * @brief Result of re-reading the log.
     */
    struct VerifyReport {
        bool intact = true;
        std::size_t records = 0;
        std::optional<std::size_t> brokenAtLine;  ///< 1-based.
        std::string problem;
    };

    static VerifyReport Verify(const std::string& logPath, const std::string& hmacKey);

    /** @brief Signs @p body chained to @p previousHash, adding the chain fields. */
    static nlohmann::json Seal(nlohmann::json body, const std::string& previousHash, const std::string& hmacKey);

private:
    void workerLoop();
    void appendLine(const nlohmann::json& body);
    static std::string LastHashOf(const std::string& logPath);

    std::string m_logPath;
    std::string m_hmacKey;
    std::string m_lastHash;

    std::queue<nlohmann::json> m_queue;
    std::mutex m_mutex;
    std::condition_variable m_cv;

    std::thread m_worker;
    std::atomic<bool> m_running;
};

} // namespace filegate::infrastructure
