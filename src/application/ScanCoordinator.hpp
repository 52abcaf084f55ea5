/**
 * @file ScanCoordinator.hpp
 * @brief Retry policy around the signature scanner.
 */

#pragma once
#include <memory>
#include <string>
#include "domain/SignatureScanner.hpp"
#include "domain/ScanOutcome.hpp"
#include "domain/ScanConfig.hpp"

namespace filegate::application {

/**
 * @class ScanCoordinator
 * @brief Turns raw scanner responses into a ScanOutcome.
 *
 * A timeout is retried exactly once with the shorter retry timeout. A second
 * timeout or any transport error yields ScanUnavailable, never Clean.
 */
class ScanCoordinator {
public:
    ScanCoordinator(std::shared_ptr<domain::SignatureScanner> scanner, domain::ScannerSettings settings);

    domain::ScanOutcome scan(const std::string& path) const;

private:
    std::shared_ptr<domain::SignatureScanner> m_scanner;
    domain::ScannerSettings m_settings;
};

} // namespace filegate::application
