/**
 * @file FileGateApp.hpp
 * @brief Command-line front end of FileGate.
 */

#pragma once

#include <string>
#include <vector>
#include "domain/ScanConfig.hpp"
#include "application/AppServices.hpp"

namespace filegate::app {

/**
 * @class FileGateApp
 * @brief Parses the command line, wires the services and runs one command.
 *
 * Commands:
 * - `scan <file> [--name N] [--mime M] [--config C] [--fail-closed|--fail-open]`
 * - `ingest <inbox> [--config C]`
 * - `verify-audit [--config C]`
 */
class FileGateApp {
public:
    /// Exit codes of `scan`.
    static constexpr int kExitAdmitted = 0;
    static constexpr int kExitUsage = 1;
    static constexpr int kExitBlocked = 2;
    static constexpr int kExitQuarantined = 3;

    /**
     * @brief Runs the command named by @p args (without the program name).
     * @return Process exit code.
     */
    int Run(const std::vector<std::string>& args);

private:
    struct Options {
        std::string command;
        std::string target;
        std::string claimedName;
        std::string mimeType;
        std::string configPath;
        std::string policyOverride;
    };

    static bool ParseArgs(const std::vector<std::string>& args, Options& options, std::string& error);
    static void PrintUsage();

    /**
     * @brief Loads the config and builds the services.
     * @return True if initialization succeeded.
     */
    bool Init(const Options& options);

    /**
     * @brief Flushes the audit trail.
     */
    void Shutdown();

    int RunScan(const Options& options);
    int RunIngest(const Options& options);
    int RunVerifyAudit();

    domain::ScanConfig m_config;
    application::AppServices m_services;
};

} // namespace filegate::app
