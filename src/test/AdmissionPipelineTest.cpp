#include <iostream>
#include <cassert>
#include "application/AdmissionPipeline.hpp"
#include "infrastructure/PdfDisarmer.hpp"
#include "TestSupport.hpp"

using namespace filegate;
using application::AdmissionPipeline;
using domain::Decision;
using domain::ReasonCode;
using domain::ScannerResponse;

namespace {

domain::CandidateFile Candidate(const fs::path& path, const std::string& name = "") {
    return domain::CandidateFile::FromPath(path.string(), name);
}

} // namespace

int main() {
    std::cout << "[Test] Starting AdmissionPipeline Test..." << std::endl;
    test::TempDir dir("pipeline");
    const auto config = test::TestConfig(dir);
    const fs::path artifacts = config.paths.artifactDir;
    const fs::path quarantineDir = config.paths.quarantineDir;

    // Inert media is admitted as-is after a clean scan.
    {
        auto scanner = test::MockScanner::AlwaysClean();
        AdmissionPipeline pipeline(scanner);
        auto png = dir / "photo.png";
        test::WriteFile(png, test::PngBytes());
        auto v = pipeline.scanAndDisarm(Candidate(png), config);
        assert(v.decision == Decision::Admitted);
        assert(v.reason == ReasonCode::Admitted);
        assert(v.storedArtifact && *v.storedArtifact == png.string());
        assert(v.preScan && domain::IsClean(*v.preScan));
        assert(!v.disarm && !v.quarantined);
        assert(scanner->calls() == 1);
        test::Pass("clean media admitted");
    }

    // Validation: allow-list, size, unreadable.
    {
        auto scanner = test::MockScanner::AlwaysClean();
        AdmissionPipeline pipeline(scanner);
        auto exe = dir / "setup.exe";
        test::WriteFile(exe, test::ElfBytes());
        auto v1 = pipeline.scanAndDisarm(Candidate(exe), config);
        assert(v1.decision == Decision::Blocked && v1.reason == ReasonCode::ValidationError);

        auto big = dir / "big.txt";
        test::WriteFile(big, test::TextBytes());
        auto claimed = Candidate(big);
        claimed.declaredSize = config.maxDeclaredSize + 1;
        auto v2 = pipeline.scanAndDisarm(claimed, config);
        assert(v2.decision == Decision::Blocked && v2.reason == ReasonCode::ValidationError);

        auto missing = Candidate(dir / "missing.txt");
        auto v3 = pipeline.scanAndDisarm(missing, config);
        assert(v3.decision == Decision::Blocked && v3.reason == ReasonCode::ValidationError);

        assert(scanner->calls() == 0);
        test::Pass("validation errors block before scanning");
    }

    // Content decides the format; the name must agree with it.
    {
        auto scanner = test::MockScanner::AlwaysClean();
        AdmissionPipeline pipeline(scanner);
        auto disguised = dir / "invoice.pdf";
        test::WriteFile(disguised, test::ElfBytes());
        auto v1 = pipeline.scanAndDisarm(Candidate(disguised), config);
        assert(v1.decision == Decision::Blocked && v1.reason == ReasonCode::ValidationError);
        assert(v1.classification.detectedFormat == domain::FileFormat::Executable);

        auto noise = dir / "noise.txt";
        test::WriteFile(noise, std::string("\x01\x02\x00\x7F\x80\x81\x00\x03", 8));
        auto v2 = pipeline.scanAndDisarm(Candidate(noise), config);
        assert(v2.decision == Decision::Blocked && v2.reason == ReasonCode::ClassificationUnknown);

        auto png = dir / "scan.png";
        test::WriteFile(png, test::PngBytes());
        auto asTxt = Candidate(png, "scan.txt");
        auto v3 = pipeline.scanAndDisarm(asTxt, config);
        assert(v3.decision == Decision::Blocked && v3.reason == ReasonCode::ValidationError);
        assert(scanner->calls() == 0);
        test::Pass("classification gate");
    }

    // Bombs and broken archives never reach the scanner.
    {
        auto scanner = test::MockScanner::AlwaysClean();
        AdmissionPipeline pipeline(scanner);
        auto bomb = dir / "bomb.zip";
        assert(test::BuildZip(bomb, {{"zeros.bin", std::string(5 * 1024 * 1024, '\0')}}));
        auto v1 = pipeline.scanAndDisarm(Candidate(bomb), config);
        assert(v1.decision == Decision::Blocked && v1.reason == ReasonCode::ArchiveBomb);

        auto broken = dir / "broken.zip";
        test::WriteFile(broken, std::string("PK\x03\x04", 4) + std::string(200, '\x07'));
        auto v2 = pipeline.scanAndDisarm(Candidate(broken), config);
        assert(v2.decision == Decision::Blocked && v2.reason == ReasonCode::ArchiveMalformed);
        assert(scanner->calls() == 0);
        test::Pass("archive inspection precedes scanning");
    }

    // Malware on the way in.
    {
        auto scanner = test::MockScanner::InfectedWhenContains("EICAR");
        AdmissionPipeline pipeline(scanner);
        auto txt = dir / "notes.txt";
        test::WriteFile(txt, test::TextBytes() + "EICAR");
        auto v = pipeline.scanAndDisarm(Candidate(txt), config);
        assert(v.decision == Decision::Blocked && v.reason == ReasonCode::MalwareDetected);
        assert(v.detail == "Test.Marker");
        assert(!v.storedArtifact);
        test::Pass("infected candidate blocked");
    }

    // Scanner outage under each policy.
    {
        auto scanner = test::MockScanner::AlwaysTimeout();
        AdmissionPipeline pipeline(scanner);
        auto txt = dir / "outage.txt";
        test::WriteFile(txt, test::TextBytes());

        auto open = config;
        open.scanner.unavailablePolicy = domain::UnavailablePolicy::FailOpen;
        auto v1 = pipeline.scanAndDisarm(Candidate(txt), open);
        assert(v1.decision == Decision::Admitted);
        assert(v1.scannerUnavailable);
        assert(v1.preScan && domain::IsUnavailable(*v1.preScan));

        auto closed = config;
        closed.scanner.unavailablePolicy = domain::UnavailablePolicy::FailClosed;
        auto v2 = pipeline.scanAndDisarm(Candidate(txt), closed);
        assert(v2.decision == Decision::Blocked && v2.reason == ReasonCode::ScannerUnavailable);
        assert(!v2.storedArtifact);
        test::Pass("fail-open and fail-closed");
    }

    // Active content is stripped and the result scanned again.
    {
        auto scanner = test::MockScanner::AlwaysClean();
        AdmissionPipeline pipeline(scanner);
        auto pdf = dir / "form.pdf";
        test::WriteFile(pdf, test::ScriptedPdf());
        auto v = pipeline.scanAndDisarm(Candidate(pdf), config);
        assert(v.decision == Decision::Admitted);
        assert(v.disarm && v.disarm->success);
        assert(v.postScan && domain::IsClean(*v.postScan));
        assert(v.storedArtifact && *v.storedArtifact != pdf.string());
        assert(scanner->calls() == 2);
        assert(scanner->paths()[1] == *v.storedArtifact);

        std::string stored = test::ReadFile(*v.storedArtifact);
        assert(infrastructure::PdfDisarmer::Inspect(stored, 1ULL << 20).clean());
        assert(test::ReadFile(pdf) == test::ScriptedPdf());

        // Submitting the admitted artifact again changes nothing further.
        auto again = dir / "form2.pdf";
        test::WriteFile(again, stored);
        auto v2 = pipeline.scanAndDisarm(Candidate(again), config);
        assert(v2.decision == Decision::Admitted);
        assert(v2.storedArtifact && *v2.storedArtifact == again.string());
        assert(v2.disarm && v2.disarm->actions.empty());
        assert(test::ReadFile(again) == stored);
        fs::remove(*v.storedArtifact);
        test::Pass("pdf disarmed, post-scanned and stable");
    }

    // Infected after disarm: blocked and the artifact discarded.
    {
        auto scanner = std::make_shared<test::MockScanner>([](const std::string&, int call) {
            if (call == 1) return ScannerResponse::Infected("Post.Only");
            return ScannerResponse::Clean();
        });
        AdmissionPipeline pipeline(scanner);
        auto docm = dir / "macro.docm";
        assert(test::BuildZip(docm, test::MacroDocmEntries()));
        auto v = pipeline.scanAndDisarm(Candidate(docm), config);
        assert(v.decision == Decision::Blocked && v.reason == ReasonCode::MalwareDetected);
        assert(!v.storedArtifact);
        assert(v.disarm && v.disarm->neutralizedArtifact);
        assert(!fs::exists(*v.disarm->neutralizedArtifact));
        assert(test::CountFiles(artifacts) == 0);
        test::Pass("post-scan detection");
    }

    // Disarm failure quarantines the candidate.
    {
        auto scanner = test::MockScanner::AlwaysClean();
        AdmissionPipeline pipeline(scanner);
        auto nestedGz = dir / "legacy.zip";
        assert(test::BuildZip(nestedGz, {{"payload.gz", std::string("\x1F\x8B\x08\x00", 4) + std::string(64, '\x01')}}));
        auto v = pipeline.scanAndDisarm(Candidate(nestedGz), config);
        assert(v.decision == Decision::Quarantined && v.reason == ReasonCode::DisarmFailed);
        assert(v.quarantined);
        assert(v.quarantined->location.rfind(quarantineDir.string(), 0) == 0);
        assert(fs::exists(v.quarantined->location));
        assert(!fs::exists(nestedGz));
        assert(!v.storedArtifact);
        assert(test::CountFiles(artifacts) == 0);
        test::Pass("disarm failure quarantined");
    }

    // Cancellation between stages leaves no trace.
    {
        domain::CancellationToken token;
        auto scanner = std::make_shared<test::MockScanner>([token](const std::string&, int call) mutable {
            if (call == 1) token.cancel();
            return ScannerResponse::Clean();
        });
        AdmissionPipeline pipeline(scanner);
        auto pdf = dir / "cancel.pdf";
        test::WriteFile(pdf, test::ScriptedPdf());
        auto v = pipeline.scanAndDisarm(Candidate(pdf), config, token);
        assert(v.decision == Decision::Blocked && v.reason == ReasonCode::Cancelled);
        assert(!v.storedArtifact);
        assert(fs::exists(pdf));
        assert(test::CountFiles(artifacts) == 0);
        assert(test::CountFiles(config.paths.workDir) == 0);

        domain::CancellationToken early;
        early.cancel();
        auto v2 = pipeline.scanAndDisarm(Candidate(pdf), config, early);
        assert(v2.reason == ReasonCode::Cancelled);
        test::Pass("cancellation");
    }

    // Every verdict carries a single decision and a timestamp.
    {
        AdmissionPipeline pipeline(test::MockScanner::AlwaysClean());
        auto txt = dir / "stamp.txt";
        test::WriteFile(txt, test::TextBytes());
        auto v = pipeline.scanAndDisarm(Candidate(txt), config);
        assert(v.decidedAt.time_since_epoch().count() != 0);
        assert((v.decision == Decision::Admitted) == (v.reason == ReasonCode::Admitted));
        assert(v.admitted() == v.storedArtifact.has_value());
        test::Pass("verdict shape");
    }

    std::cout << "[Test] AdmissionPipeline Test PASSED." << std::endl;
    return 0;
}
