#include <iostream>
#include <cassert>
#include <cstdlib>
#include <nlohmann/json.hpp>
#include "infrastructure/ConfigLoader.hpp"
#include "infrastructure/PathUtils.hpp"
#include "infrastructure/VerdictJson.hpp"
#include "TestSupport.hpp"

using namespace filegate;
using infrastructure::ConfigLoader;
using infrastructure::PathUtils;

int main() {
    std::cout << "[Test] Starting ConfigLoader Test..." << std::endl;
    test::TempDir dir("config");

    // XDG locations.
    setenv("XDG_DATA_HOME", (dir / "data").c_str(), 1);
    setenv("XDG_CONFIG_HOME", (dir / "config").c_str(), 1);
    setenv("XDG_CACHE_HOME", (dir / "cache").c_str(), 1);
    assert(PathUtils::GetSettingsFile() == dir / "config" / "FileGate" / "settings.json");
    assert(PathUtils::GetQuarantineDir() == dir / "data" / "FileGate" / "quarantine");
    assert(PathUtils::GetWorkDir() == dir / "cache" / "FileGate" / "work");
    auto defaults = ConfigLoader::DefaultConfig();
    assert(defaults.paths.auditLog == (dir / "data" / "FileGate" / "audit.jsonl").string());
    assert(defaults.scanner.unavailablePolicy == domain::UnavailablePolicy::FailOpen);
    assert(defaults.allowedExtensions.count("pdf") == 1);
    test::Pass("default paths");

    // Every section overrides its defaults; absent keys keep them.
    {
        auto path = dir / "settings.json";
        test::WriteFile(path, R"({
            "allowed_extensions": ["pdf", "txt", "bin"],
            "expected_formats": {"bin": ["png", "jpeg"]},
            "max_declared_size": 1048576,
            "archive": {"max_entries": 10, "max_nesting_depth": 1},
            "scanner": {"host": "scanner.internal", "port": 8080, "timeout_ms": 5000,
                        "retry_timeout_ms": 2000, "unavailable_policy": "fail-closed"},
            "pdf": {"normalize_with_qpdf": false},
            "paths": {"quarantine_dir": "/srv/q"},
            "audit": {"hmac_key": "k"},
            "ingest": {"parallelism": 2}
        })");
        auto config = ConfigLoader::Load(path.string());
        assert(config);
        assert(config->allowedExtensions.size() == 3);
        assert(config->expectedFormats.at("bin").count(domain::FileFormat::Png) == 1);
        assert(config->expectedFormats.count("pdf") == 1);
        assert(config->maxDeclaredSize == 1048576);
        assert(config->archive.maxEntries == 10);
        assert(config->archive.maxNestingDepth == 1);
        assert(config->archive.maxExpansionRatio == defaults.archive.maxExpansionRatio);
        assert(config->scanner.host == "scanner.internal");
        assert(config->scanner.port == 8080);
        assert(config->scanner.path == "/scan");
        assert(config->scanner.timeout == std::chrono::milliseconds(5000));
        assert(config->scanner.retryTimeout == std::chrono::milliseconds(2000));
        assert(config->scanner.unavailablePolicy == domain::UnavailablePolicy::FailClosed);
        assert(!config->normalizePdfWithQpdf);
        assert(config->paths.quarantineDir == "/srv/q");
        assert(config->paths.storageDir == defaults.paths.storageDir);
        assert(config->auditHmacKey == "k");
        assert(config->ingestParallelism == 2);
        test::Pass("full settings file");
    }

    // The retry never waits longer than the first attempt.
    {
        auto path = dir / "clamp.json";
        test::WriteFile(path, R"({"scanner": {"timeout_ms": 1000, "retry_timeout_ms": 4000}})");
        auto config = ConfigLoader::Load(path.string());
        assert(config && config->scanner.retryTimeout == std::chrono::milliseconds(1000));
        test::Pass("retry timeout clamped");
    }

    // Bad input is rejected as a whole.
    {
        auto policy = dir / "policy.json";
        test::WriteFile(policy, R"({"scanner": {"unavailable_policy": "sometimes"}})");
        assert(!ConfigLoader::Load(policy.string()));

        auto format = dir / "format.json";
        test::WriteFile(format, R"({"expected_formats": {"x": ["flash"]}})");
        assert(!ConfigLoader::Load(format.string()));

        auto type = dir / "type.json";
        test::WriteFile(type, R"({"max_declared_size": "big"})");
        assert(!ConfigLoader::Load(type.string()));

        auto syntax = dir / "syntax.json";
        test::WriteFile(syntax, "{ not json");
        assert(!ConfigLoader::Load(syntax.string()));

        assert(!ConfigLoader::Load((dir / "absent.json").string()));
        assert(!ConfigLoader::ParsePolicy("open"));
        test::Pass("invalid settings rejected");
    }

    // Verdict serialization used by the CLI and the audit trail.
    {
        domain::Verdict v;
        v.decision = domain::Decision::Quarantined;
        v.reason = domain::ReasonCode::DisarmFailed;
        v.candidateName = "legacy.doc";
        v.preScan = domain::scan::Clean{};
        v.disarm = domain::DisarmResult::Failed("/in/legacy.doc", "VBA");
        v.quarantined = domain::QuarantineHandle{"abc", "/q/abc.bin"};
        v.decidedAt = std::chrono::system_clock::time_point(std::chrono::seconds(0));
        auto j = infrastructure::VerdictToJson(v);
        assert(j["decision"] == "quarantined");
        assert(j["reason"] == "DisarmFailed");
        assert(j["decided_at"] == "1970-01-01T00:00:00Z");
        assert(j["pre_scan"]["status"] == "clean");
        assert(j["post_scan"].is_null());
        assert(j["disarm"]["success"] == false);
        assert(j["quarantine"]["id"] == "abc");
        assert(j["stored_artifact"].is_null());
        assert(j["archive"].is_null());
        test::Pass("verdict json");
    }

    std::cout << "[Test] ConfigLoader Test PASSED." << std::endl;
    return 0;
}
