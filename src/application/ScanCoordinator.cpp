/**
 * @file ScanCoordinator.cpp
 * @brief Implementation of ScanCoordinator.
 */

#include "application/ScanCoordinator.hpp"
#include <iostream>

namespace filegate::application {

using domain::ScannerResponse;

ScanCoordinator::ScanCoordinator(std::shared_ptr<domain::SignatureScanner> scanner, domain::ScannerSettings settings)
    : m_scanner(std::move(scanner)), m_settings(std::move(settings)) {}

domain::ScanOutcome ScanCoordinator::scan(const std::string& path) const {
    if (!m_scanner) {
        return domain::scan::ScanUnavailable{"No scanner configured"};
    }

    ScannerResponse response = m_scanner->scan(path, m_settings.timeout);
    if (response.status == ScannerResponse::Status::Timeout) {
        std::cerr << "[ScanCoordinator] Scanner timed out after " << m_settings.timeout.count()
                  << " ms; retrying with " << m_settings.retryTimeout.count() << " ms" << std::endl;
        response = m_scanner->scan(path, m_settings.retryTimeout);
    }

    switch (response.status) {
        case ScannerResponse::Status::Completed:
            if (response.infected) {
                return domain::scan::Infected{response.signatureName};
            }
            return domain::scan::Clean{};
        case ScannerResponse::Status::Timeout:
            return domain::scan::ScanUnavailable{"Scanner timed out twice: " + response.detail};
        case ScannerResponse::Status::TransportError:
            return domain::scan::ScanUnavailable{"Scanner unreachable: " + response.detail};
    }
    return domain::scan::ScanUnavailable{"Unrecognized scanner status"};
}

} // namespace filegate::application
