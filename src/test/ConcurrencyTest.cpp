#include <iostream>
#include <thread>
#include <vector>
#include <chrono>
#include <atomic>
#include <cassert>
#include "application/AdmissionPipeline.hpp"
#include "application/UploadIngestionService.hpp"
#include "infrastructure/AuditTrail.hpp"
#include "infrastructure/FileSystemArtifactScanner.hpp"
#include "infrastructure/FileSystemArtifactStore.hpp"
#include "TestSupport.hpp"

using namespace filegate;

int main() {
    std::cout << "[Test] Starting Concurrency Stress Test..." << std::endl;
    test::TempDir dir("concurrency");
    const auto config = test::TestConfig(dir);

    // Slow scanner so runs genuinely overlap.
    auto scanner = std::make_shared<test::MockScanner>([](const std::string& path, int) {
        std::this_thread::sleep_for(std::chrono::milliseconds(5));
        if (test::ReadFile(path).find("EICAR") != std::string::npos) {
            return domain::ScannerResponse::Infected("Test.Marker");
        }
        return domain::ScannerResponse::Clean();
    });
    auto pipeline = std::make_shared<application::AdmissionPipeline>(scanner);

    // Stress Test: one pipeline, many threads, per-run policies.
    const int NUM_RUNS = 40;
    std::vector<std::thread> threads;
    std::atomic<int> admitted{0};
    std::atomic<int> blocked{0};

    std::cout << "[Test] Spawning " << NUM_RUNS << " concurrent admission runs..." << std::endl;
    auto startTime = std::chrono::steady_clock::now();

    for (int i = 0; i < NUM_RUNS; ++i) {
        threads.emplace_back([&, i]() {
            auto src = dir / "runs" / ("file" + std::to_string(i));
            fs::create_directories(src);
            fs::path file;
            domain::ScanConfig runConfig = config;
            if (i % 4 == 0) {
                file = src / "form.pdf";
                test::WriteFile(file, test::ScriptedPdf());
            } else if (i % 4 == 1) {
                file = src / "notes.txt";
                test::WriteFile(file, test::TextBytes() + "EICAR");
            } else if (i % 4 == 2) {
                // Same content, but this run forbids the extension.
                file = src / "photo.png";
                test::WriteFile(file, test::PngBytes());
                runConfig.allowedExtensions.erase("png");
            } else {
                file = src / "bundle.zip";
                assert(test::BuildZip(file, {{"a.txt", test::TextBytes()}, {"run.bin", test::ElfBytes()}}));
            }

            auto verdict = pipeline->scanAndDisarm(domain::CandidateFile::FromPath(file.string()), runConfig);
            if (i % 4 == 0 || i % 4 == 3) {
                assert(verdict.decision == domain::Decision::Admitted);
                assert(verdict.storedArtifact && fs::exists(*verdict.storedArtifact));
                fs::remove(*verdict.storedArtifact);
                admitted++;
            } else {
                assert(verdict.decision == domain::Decision::Blocked);
                assert(verdict.reason == (i % 4 == 1 ? domain::ReasonCode::MalwareDetected
                                                     : domain::ReasonCode::ValidationError));
                blocked++;
            }
        });
    }
    for (auto& t : threads) {
        if (t.joinable()) t.join();
    }

    auto duration = std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() - startTime).count();
    std::cout << "[Test] Runs completed in " << duration << "ms" << std::endl;
    assert(admitted == NUM_RUNS / 2);
    assert(blocked == NUM_RUNS / 2);
    assert(test::CountFiles(config.paths.artifactDir) == 0);
    assert(test::CountFiles(config.paths.workDir) == 0);
    test::Pass("parallel runs are independent");

    // Inbox ingestion with a worker pool.
    {
        auto inbox = dir / "inbox";
        fs::create_directories(inbox);
        for (int i = 0; i < 6; ++i) {
            test::WriteFile(inbox / ("clean" + std::to_string(i) + ".txt"), test::TextBytes() + std::to_string(i));
        }
        test::WriteFile(inbox / "infected.txt", test::TextBytes() + "EICAR");
        test::WriteFile(inbox / "tool.exe", test::ElfBytes());
        test::WriteFile(inbox / "form.pdf", test::ScriptedPdf());
        assert(test::BuildZip(inbox / "nested.zip", {{"logs.gz", std::string("\x1F\x8B\x08\x00", 4) + std::string(64, '\x01')}}));
        test::WriteFile(inbox / ".hidden.txt", test::TextBytes());
        test::WriteFile(inbox / "upload.partial", test::TextBytes());

        auto audit = std::make_shared<infrastructure::AuditTrail>(config.paths.auditLog, config.auditHmacKey);
        application::UploadIngestionService service(
            std::make_unique<infrastructure::FileSystemArtifactScanner>(inbox.string()), pipeline,
            std::make_shared<infrastructure::FileSystemArtifactStore>(config.paths.storageDir), audit);

        auto ingestConfig = config;
        ingestConfig.ingestParallelism = 3;
        std::atomic<int> statusUpdates{0};
        auto result = service.ingestPending(ingestConfig, domain::CancellationToken(),
                                            [&statusUpdates](const std::string&) { statusUpdates++; });
        audit->stop();

        assert(result.detected == 10);
        assert(result.admitted == 7);
        assert(result.blocked == 2);
        assert(result.quarantined == 1);
        assert(result.errors.empty());
        assert(statusUpdates > 0);

        // Only the skipped files remain in the inbox.
        assert(test::CountFiles(inbox) == 2);
        assert(fs::exists(inbox / ".hidden.txt"));
        // Seven artifacts plus their verdict sidecars.
        assert(test::CountFiles(config.paths.storageDir) == 14);
        assert(test::CountFiles(config.paths.quarantineDir) == 2);

        auto report = infrastructure::AuditTrail::Verify(config.paths.auditLog, config.auditHmacKey);
        assert(report.intact);
        assert(report.records == 10);
        test::Pass("inbox ingestion");
    }

    // Transient outages leave the file in the inbox for the next pass.
    {
        auto inbox = dir / "retry-inbox";
        fs::create_directories(inbox);
        test::WriteFile(inbox / "later.txt", test::TextBytes());

        auto failClosed = config;
        failClosed.scanner.unavailablePolicy = domain::UnavailablePolicy::FailClosed;
        application::UploadIngestionService service(
            std::make_unique<infrastructure::FileSystemArtifactScanner>(inbox.string()),
            std::make_shared<application::AdmissionPipeline>(test::MockScanner::Unreachable()),
            std::make_shared<infrastructure::FileSystemArtifactStore>(config.paths.storageDir), nullptr);
        auto result = service.ingestPending(failClosed);
        assert(result.blocked == 1);
        assert(fs::exists(inbox / "later.txt"));
        test::Pass("retryable block keeps the upload");
    }

    std::cout << "[Test] Concurrency Stress Test PASSED." << std::endl;
    return 0;
}
