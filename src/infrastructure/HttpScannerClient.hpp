/**
 * @file HttpScannerClient.hpp
 * @brief SignatureScanner adapter for an HTTP scanning daemon.
 */

#pragma once

#include <string>
#include "domain/SignatureScanner.hpp"
#include "domain/ScanConfig.hpp"

namespace filegate::infrastructure {

/**
 * @class HttpScannerClient
 * @brief Streams a file as `POST {path}` and reads `{"infected": bool, "signature": string|null}`.
 *
 * Holds only connection settings; each call opens its own client, so one
 * instance serves any number of concurrent runs.
 */
class HttpScannerClient : public domain::SignatureScanner {
public:
    explicit HttpScannerClient(const domain::ScannerSettings& settings);
    HttpScannerClient(const std::string& host, int port, const std::string& path = "/scan");

    domain::ScannerResponse scan(const std::string& path, std::chrono::milliseconds timeout) override;

    /** @brief Interprets a 200 response body. Unparseable bodies are transport errors. */
    static domain::ScannerResponse ParseResponse(const std::string& body);

private:
    std::string m_host;
    int m_port;
    std::string m_path;
};

} // namespace filegate::infrastructure
