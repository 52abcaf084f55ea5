/**
 * @file DisarmEngine.cpp
 * @brief Implementation of DisarmEngine.
 */

#include "infrastructure/DisarmEngine.hpp"
#include "infrastructure/PdfDisarmer.hpp"
#include "infrastructure/OfficeDisarmer.hpp"
#include "infrastructure/ScopedWorkArea.hpp"
#include <filesystem>
#include <iostream>

namespace fs = std::filesystem;

namespace filegate::infrastructure {

using domain::DisarmResult;
using domain::FileFormat;

namespace {

std::string SuffixFor(FileFormat format) {
    switch (format) {
        case FileFormat::Pdf: return ".pdf";
        case FileFormat::Zip: return ".zip";
        case FileFormat::OfficeOpenXml: return ".ooxml";
        default: return ".bin";
    }
}

} // namespace

struct StrategyRunner {
    DisarmEngine& engine;
    const std::string& path;
    FileFormat format;
    const std::string& outputPath;
    int depth;
    ArchiveDisarmer::Budget& budget;

    DisarmResult operator()(const strategy::PdfRewrite&) const {
        PdfDisarmer::Options options;
        options.normalizeWithQpdf = engine.m_config.normalizePdfWithQpdf;
        options.workDir = engine.m_config.paths.workDir;
        return PdfDisarmer::Disarm(path, outputPath, options);
    }

    DisarmResult operator()(const strategy::OpenXmlRepackage&) const {
        return OfficeDisarmer::DisarmOpenXml(path, outputPath, engine.m_config.archive);
    }

    DisarmResult operator()(const strategy::CompoundDocumentCheck&) const {
        return OfficeDisarmer::DisarmCompound(path);
    }

    DisarmResult operator()(const strategy::ArchiveRepack&) const {
        DisarmEngine& self = engine;
        ArchiveDisarmer::NestedDisarm nested =
            [&self, this](const std::string& entryPath, FileFormat entryFormat,
                          const std::string& entryOutput, int entryDepth) {
                return self.neutralizeInto(entryPath, entryFormat, entryOutput, entryDepth, budget);
            };
        return ArchiveDisarmer::Disarm(path, outputPath, engine.m_config.archive, engine.m_config.paths.workDir,
                                       depth, budget, nested, engine.m_cancel);
    }

    DisarmResult operator()(const strategy::PassThrough&) const {
        return DisarmResult::PassThrough(path);
    }

    DisarmResult operator()(const strategy::Refuse&) const {
        return DisarmResult::Failed(path, "No neutralization strategy for " + domain::FormatToString(format));
    }
};

DisarmEngine::DisarmEngine(domain::ScanConfig config, domain::CancellationToken cancel)
    : m_config(std::move(config)), m_cancel(std::move(cancel)) {}

DisarmStrategy DisarmEngine::SelectStrategy(FileFormat format) {
    switch (format) {
        case FileFormat::Pdf: return strategy::PdfRewrite{};
        case FileFormat::OfficeOpenXml: return strategy::OpenXmlRepackage{};
        case FileFormat::CompoundDocument: return strategy::CompoundDocumentCheck{};
        case FileFormat::Zip: return strategy::ArchiveRepack{};
        default: break;
    }
    switch (domain::ClassifyForDisarm(format)) {
        case domain::DisarmClass::PassThrough: return strategy::PassThrough{};
        case domain::DisarmClass::Neutralize:
        case domain::DisarmClass::Unsupported: break;
    }
    return strategy::Refuse{};
}

std::string DisarmEngine::StrategyName(const DisarmStrategy& s) {
    static const char* const names[] = {"pdf-rewrite", "openxml-repackage", "compound-document-check",
                                        "archive-repack", "pass-through", "refuse"};
    return names[s.index()];
}

DisarmResult DisarmEngine::neutralize(const std::string& path, FileFormat format) {
    std::string outDir = m_config.paths.artifactDir.empty() ? fs::temp_directory_path().string()
                                                            : m_config.paths.artifactDir;
    std::error_code ec;
    fs::create_directories(outDir, ec);
    if (ec) {
        return DisarmResult::Failed(path, "Cannot create artifact directory: " + ec.message());
    }

    std::string outputPath = UniquePath(outDir, "disarmed", SuffixFor(format)).string();
    ArchiveDisarmer::Budget budget = ArchiveDisarmer::Budget::FromLimits(m_config.archive);
    DisarmResult result = neutralizeInto(path, format, outputPath, 0, budget);

    // Strategies that fail may leave a partial output behind.
    if (!result.success || !result.neutralizedArtifact) {
        fs::remove(outputPath, ec);
    }
    return result;
}

DisarmResult DisarmEngine::neutralizeInto(const std::string& path, FileFormat format,
                                          const std::string& outputPath, int depth,
                                          ArchiveDisarmer::Budget& budget) {
    if (m_cancel.isCancelled()) {
        return DisarmResult::Failed(path, "Cancelled");
    }
    DisarmStrategy selected = SelectStrategy(format);
    std::cout << "[DisarmEngine] " << domain::FormatToString(format) << " -> " << StrategyName(selected)
              << " (depth " << depth << ")" << std::endl;
    return std::visit(StrategyRunner{*this, path, format, outputPath, depth, budget}, selected);
}

} // namespace filegate::infrastructure
