/**
 * @file SignatureScanner.hpp
 * @brief Interface for the external malware-signature engine.
 */

#pragma once
#include <string>
#include <chrono>

namespace filegate::domain {

/**
 * @struct ScannerResponse
 * @brief Raw answer of one scanner call, before any retry policy is applied.
 */
struct ScannerResponse {
    enum class Status { Completed, Timeout, TransportError };

    Status status = Status::TransportError;
    bool infected = false;
    std::string signatureName;
    std::string detail;

    static ScannerResponse Clean() {
        ScannerResponse r;
        r.status = Status::Completed;
        return r;
    }

    static ScannerResponse Infected(const std::string& signature) {
        ScannerResponse r;
        r.status = Status::Completed;
        r.infected = true;
        r.signatureName = signature;
        return r;
    }

    static ScannerResponse Failed(Status status, const std::string& detail) {
        ScannerResponse r;
        r.status = status;
        r.detail = detail;
        return r;
    }
};

/**
 * @class SignatureScanner
 * @brief Abstract capability boundary. Implementations must be safe for concurrent calls.
 */
class SignatureScanner {
public:
    virtual ~SignatureScanner() = default;

    /**
     * @brief Scans the file at @p path.
     * @param path File to submit.
     * @param timeout Upper bound for the whole call.
     * @return Completed with a finding, or the transport-level failure.
     */
    virtual ScannerResponse scan(const std::string& path, std::chrono::milliseconds timeout) = 0;
};

} // namespace filegate::domain
