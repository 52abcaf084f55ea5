#include <iostream>
#include <cassert>
#include "infrastructure/DisarmEngine.hpp"
#include "infrastructure/PdfDisarmer.hpp"
#include "TestSupport.hpp"

using namespace filegate;
using infrastructure::DisarmEngine;
using domain::FileFormat;
using domain::NeutralizationAction;

namespace {

// Wraps a text file in @p levels of ZIP archives and returns the outermost bytes.
std::string NestedZip(const test::TempDir& dir, int levels) {
    std::string data = test::TextBytes();
    std::string name = "a.txt";
    for (int i = 0; i < levels; ++i) {
        auto path = dir / ("level" + std::to_string(levels) + "_" + std::to_string(i) + ".zip");
        assert(test::BuildZip(path, {{name, data}}));
        data = test::ReadFile(path);
        name = "level" + std::to_string(i) + ".zip";
        fs::remove(path);
    }
    return data;
}

} // namespace

int main() {
    std::cout << "[Test] Starting ArchiveDisarm Test..." << std::endl;
    test::TempDir dir("archive");
    auto config = test::TestConfig(dir);
    const fs::path workDir = config.paths.workDir;
    const fs::path artifactDir = config.paths.artifactDir;

    // Strategy table.
    assert(DisarmEngine::StrategyName(DisarmEngine::SelectStrategy(FileFormat::Pdf)) == "pdf-rewrite");
    assert(DisarmEngine::StrategyName(DisarmEngine::SelectStrategy(FileFormat::Zip)) == "archive-repack");
    assert(DisarmEngine::StrategyName(DisarmEngine::SelectStrategy(FileFormat::Png)) == "pass-through");
    assert(DisarmEngine::StrategyName(DisarmEngine::SelectStrategy(FileFormat::SevenZip)) == "refuse");
    test::Pass("strategy selection");

    // Executables, links and escaping paths are dropped; ordinary entries stay.
    {
        auto in = dir / "mixed.zip";
        assert(test::BuildZip(in, {{"readme.txt", test::TextBytes()},
                                   {"tools/run.bin", test::ElfBytes()},
                                   {"shortcut", "/etc/passwd", true},
                                   {"../evil.txt", test::TextBytes()}}));
        DisarmEngine engine(config, domain::CancellationToken());
        auto result = engine.neutralize(in.string(), FileFormat::Zip);
        assert(result.success);
        assert(result.neutralizedArtifact);
        assert(result.actions.count(NeutralizationAction::RemovedExecutableEntry));
        assert(result.actions.count(NeutralizationAction::RemovedSymlinkEntry));
        assert(result.actions.count(NeutralizationAction::RemovedUnsafeEntryPath));

        auto names = test::ZipEntryNames(*result.neutralizedArtifact);
        assert(names.size() == 1);
        assert(names[0] == "readme.txt");
        assert(test::ZipEntryData(*result.neutralizedArtifact, "readme.txt") == test::TextBytes());
        assert(test::ZipEntryNames(in).size() == 4);
        fs::remove(*result.neutralizedArtifact);
        test::Pass("unsafe entries removed");
    }

    // Documents inside archives go through their own strategy.
    {
        auto inner = dir / "inner.zip";
        assert(test::BuildZip(inner, {{"payload.exe", test::ElfBytes()}, {"ok.txt", test::TextBytes()}}));
        auto in = dir / "outer.zip";
        assert(test::BuildZip(in, {{"inner.zip", test::ReadFile(inner)},
                                   {"form.pdf", test::ScriptedPdf()},
                                   {"photo.png", test::PngBytes()}}));

        DisarmEngine engine(config, domain::CancellationToken());
        auto result = engine.neutralize(in.string(), FileFormat::Zip);
        assert(result.success && result.neutralizedArtifact);
        assert(result.actions.count(NeutralizationAction::DisarmedNestedEntry));
        assert(result.actions.count(NeutralizationAction::RemovedExecutableEntry));
        assert(result.actions.count(NeutralizationAction::RemovedJavaScript));

        std::string pdf = test::ZipEntryData(*result.neutralizedArtifact, "form.pdf");
        auto inspection = infrastructure::PdfDisarmer::Inspect(pdf, 1ULL << 20);
        assert(inspection.clean());

        auto repacked = dir / "inner.out.zip";
        test::WriteFile(repacked, test::ZipEntryData(*result.neutralizedArtifact, "inner.zip"));
        auto innerNames = test::ZipEntryNames(repacked);
        assert(innerNames.size() == 1 && innerNames[0] == "ok.txt");
        assert(test::ZipEntryData(*result.neutralizedArtifact, "photo.png") == test::PngBytes());
        fs::remove(*result.neutralizedArtifact);
        test::Pass("nested entries disarmed recursively");
    }

    // Nesting is bounded: depth 3 is allowed, depth 4 is not.
    {
        auto allowed = dir / "deep3.zip";
        test::WriteFile(allowed, NestedZip(dir, 4));
        DisarmEngine engine(config, domain::CancellationToken());
        auto ok = engine.neutralize(allowed.string(), FileFormat::Zip);
        assert(ok.success);
        assert(!ok.neutralizedArtifact);

        auto tooDeep = dir / "deep4.zip";
        test::WriteFile(tooDeep, NestedZip(dir, 5));
        auto refused = engine.neutralize(tooDeep.string(), FileFormat::Zip);
        assert(!refused.success);
        assert(refused.detail.find("nesting") != std::string::npos);
        test::Pass("nesting depth");
    }

    // Extraction shares one byte budget across all entries.
    {
        auto small = config;
        small.archive.maxTotalUncompressed = 1000;
        auto in = dir / "budget.zip";
        assert(test::BuildZip(in, {{"a.txt", std::string(600, 'a')}, {"b.txt", std::string(600, 'b')}}));
        DisarmEngine engine(small, domain::CancellationToken());
        auto result = engine.neutralize(in.string(), FileFormat::Zip);
        assert(!result.success);
        test::Pass("extraction budget");
    }

    // Unsupported containers inside a ZIP cannot be vouched for.
    {
        auto in = dir / "gz.zip";
        assert(test::BuildZip(in, {{"logs.gz", std::string("\x1F\x8B\x08\x00", 4) + std::string(64, '\x01')}}));
        DisarmEngine engine(config, domain::CancellationToken());
        auto result = engine.neutralize(in.string(), FileFormat::Zip);
        assert(!result.success);
        test::Pass("nested gzip refused");
    }

    // A cancelled run produces nothing.
    {
        auto in = dir / "cancel.zip";
        assert(test::BuildZip(in, {{"tools/run.bin", test::ElfBytes()}}));
        domain::CancellationToken token;
        token.cancel();
        DisarmEngine engine(config, token);
        auto result = engine.neutralize(in.string(), FileFormat::Zip);
        assert(!result.success);
        assert(!result.neutralizedArtifact);
        test::Pass("cancelled run");
    }

    // Nothing is left behind in the work and artifact areas.
    assert(test::CountFiles(workDir) == 0);
    assert(test::CountFiles(artifactDir) == 0);
    test::Pass("no leftovers");

    std::cout << "[Test] ArchiveDisarm Test PASSED." << std::endl;
    return 0;
}
