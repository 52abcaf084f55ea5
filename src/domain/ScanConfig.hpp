/**
 * @file ScanConfig.hpp
 * @brief Immutable policy passed into every admission run.
 */

#pragma once
#include <string>
#include <set>
#include <map>
#include <cstdint>
#include <chrono>
#include "domain/FileFormat.hpp"

namespace filegate::domain {

enum class UnavailablePolicy {
    FailOpen,   ///< Record the outage and keep going.
    FailClosed  ///< Block the candidate.
};

struct ArchiveLimits {
    std::size_t maxEntries = 1000;
    std::uint64_t maxTotalUncompressed = 1ULL << 30;
    double maxExpansionRatio = 100.0;
    int maxNestingDepth = 3;
};

struct ScannerSettings {
    std::string host = "127.0.0.1";
    int port = 3311;
    std::string path = "/scan";
    std::chrono::milliseconds timeout{30000};
    std::chrono::milliseconds retryTimeout{10000};
    UnavailablePolicy unavailablePolicy = UnavailablePolicy::FailOpen;
};

struct StoragePaths {
    std::string quarantineDir;
    std::string artifactDir;
    std::string workDir;
    std::string storageDir;
    std::string auditLog;
};

/**
 * @struct ScanConfig
 * @brief Allow-lists, ceilings and collaborator settings for one run.
 *
 * Copied by value into each run; nothing in the pipeline reads process-wide settings.
 */
struct ScanConfig {
    std::set<std::string> allowedExtensions;
    std::map<std::string, std::set<FileFormat>> expectedFormats;
    std::uint64_t maxDeclaredSize = 500ULL * 1024 * 1024;
    std::size_t classifierWindowBytes = 8192;
    ArchiveLimits archive;
    ScannerSettings scanner;
    bool normalizePdfWithQpdf = true;
    StoragePaths paths;
    std::string auditHmacKey;
    int ingestParallelism = 4;

    /** @brief Upload catalogue of the platform: media, transcripts and office documents. */
    static ScanConfig Defaults() {
        ScanConfig c;
        auto expect = [&c](const std::string& ext, std::set<FileFormat> formats) {
            c.allowedExtensions.insert(ext);
            c.expectedFormats[ext] = std::move(formats);
        };

        expect("mp3", {FileFormat::Mp3});
        expect("m4a", {FileFormat::Mp4});
        expect("aac", {FileFormat::Aac, FileFormat::Mp4});
        expect("wav", {FileFormat::Wav});
        expect("ogg", {FileFormat::Ogg});
        expect("flac", {FileFormat::Flac});
        expect("mp4", {FileFormat::Mp4});
        expect("mov", {FileFormat::Mp4});
        expect("webm", {FileFormat::Webm});

        expect("jpg", {FileFormat::Jpeg});
        expect("jpeg", {FileFormat::Jpeg});
        expect("png", {FileFormat::Png});
        expect("gif", {FileFormat::Gif});
        expect("webp", {FileFormat::Webp});

        expect("txt", {FileFormat::PlainText});
        expect("md", {FileFormat::PlainText});
        expect("csv", {FileFormat::PlainText});
        expect("json", {FileFormat::PlainText});
        expect("vtt", {FileFormat::PlainText});
        expect("srt", {FileFormat::PlainText});

        expect("pdf", {FileFormat::Pdf});
        expect("docx", {FileFormat::OfficeOpenXml});
        expect("docm", {FileFormat::OfficeOpenXml});
        expect("xlsx", {FileFormat::OfficeOpenXml});
        expect("xlsm", {FileFormat::OfficeOpenXml});
        expect("pptx", {FileFormat::OfficeOpenXml});
        expect("pptm", {FileFormat::OfficeOpenXml});
        expect("doc", {FileFormat::CompoundDocument});
        expect("xls", {FileFormat::CompoundDocument});
        expect("ppt", {FileFormat::CompoundDocument});

        expect("zip", {FileFormat::Zip});
        return c;
    }
};

} // namespace filegate::domain
