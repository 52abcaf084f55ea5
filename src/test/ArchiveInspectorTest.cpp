#include <iostream>
#include <cassert>
#include "infrastructure/ZipArchiveInspector.hpp"
#include "TestSupport.hpp"

using namespace filegate;
using infrastructure::ZipArchiveInspector;
using domain::ArchiveError;

int main() {
    std::cout << "[Test] Starting ArchiveInspector Test..." << std::endl;
    test::TempDir dir("inspector");
    domain::ArchiveLimits limits;

    // Ordinary archive: manifest with sizes and kinds.
    {
        auto path = dir / "ok.zip";
        assert(test::BuildZip(path, {{"a.txt", test::TextBytes()},
                                     {"img/b.png", test::PngBytes()},
                                     {"link", "a.txt", true}}));
        auto result = ZipArchiveInspector::Inspect(path.string(), limits);
        assert(result.ok());
        assert(result.manifest->entryCount() == 3);
        assert(result.manifest->totalUncompressed == test::TextBytes().size() + test::PngBytes().size() + 5);
        assert(result.manifest->entries[2].kind == domain::EntryKind::Symlink);
        test::Pass("manifest of a benign archive");
    }

    // Entry count is rejected before any size is looked at.
    {
        auto path = dir / "many.zip";
        std::vector<test::ZipEntrySpec> entries;
        for (int i = 0; i < 5000; ++i) {
            entries.push_back({"f" + std::to_string(i) + ".txt", "x"});
        }
        assert(test::BuildZip(path, entries));
        auto result = ZipArchiveInspector::Inspect(path.string(), limits);
        assert(!result.ok());
        assert(result.error->kind == ArchiveError::Kind::TooManyEntries);
        assert(result.error->isBomb());
        test::Pass("5000 entries against a limit of 1000");
    }

    // Declared sizes: one entry alone, then the running total.
    {
        domain::ArchiveLimits small = limits;
        small.maxTotalUncompressed = 1000;
        small.maxExpansionRatio = 1e9;

        auto single = dir / "single.zip";
        assert(test::BuildZip(single, {{"big.bin", std::string(2000, 'z')}}));
        auto r1 = ZipArchiveInspector::Inspect(single.string(), small);
        assert(!r1.ok() && r1.error->kind == ArchiveError::Kind::EntrySizeExceeded);

        auto total = dir / "total.zip";
        assert(test::BuildZip(total, {{"a.bin", std::string(600, 'a')}, {"b.bin", std::string(600, 'b')}}));
        auto r2 = ZipArchiveInspector::Inspect(total.string(), small);
        assert(!r2.ok() && r2.error->kind == ArchiveError::Kind::TotalSizeExceeded);
        test::Pass("entry and total size ceilings");
    }

    // Highly compressible payload trips the ratio check.
    {
        auto path = dir / "ratio.zip";
        assert(test::BuildZip(path, {{"zeros.bin", std::string(5 * 1024 * 1024, '\0')}}));
        auto result = ZipArchiveInspector::Inspect(path.string(), limits);
        assert(!result.ok());
        assert(result.error->kind == ArchiveError::Kind::ExpansionRatioExceeded);
        test::Pass("expansion ratio");
    }

    // Garbage with a ZIP signature is malformed, not a bomb.
    {
        auto path = dir / "broken.zip";
        test::WriteFile(path, std::string("PK\x03\x04", 4) + std::string(200, '\x07'));
        auto result = ZipArchiveInspector::Inspect(path.string(), limits);
        assert(!result.ok());
        assert(result.error->kind == ArchiveError::Kind::Malformed);
        assert(!result.error->isBomb());
        test::Pass("malformed archive");
    }

    std::cout << "[Test] ArchiveInspector Test PASSED." << std::endl;
    return 0;
}
