/**
 * @file FileFormat.hpp
 * @brief Canonical content formats recognized by the classifier.
 */

#pragma once
#include <string>
#include <optional>

namespace filegate::domain {

/**
 * @enum FileFormat
 * @brief True content type, derived from bytes and never from the filename.
 */
enum class FileFormat {
    Unknown,
    PlainText,
    Pdf,
    Zip,
    OfficeOpenXml,
    CompoundDocument,
    Png,
    Jpeg,
    Gif,
    Webp,
    Mp3,
    Aac,
    Mp4,
    Wav,
    Webm,
    Ogg,
    Flac,
    Gzip,
    SevenZip,
    Rar,
    Executable
};

/**
 * @enum DisarmClass
 * @brief How the pipeline treats a format once it has passed pre-scan.
 */
enum class DisarmClass {
    PassThrough,   ///< Inert media/text: admitted as-is.
    Neutralize,    ///< Has an active-content or nested-structure surface.
    Unsupported    ///< Cannot be disarmed safely: quarantine.
};

inline std::string FormatToString(FileFormat f) {
    switch (f) {
        case FileFormat::Unknown: return "unknown";
        case FileFormat::PlainText: return "text";
        case FileFormat::Pdf: return "pdf";
        case FileFormat::Zip: return "zip";
        case FileFormat::OfficeOpenXml: return "ooxml";
        case FileFormat::CompoundDocument: return "ole2";
        case FileFormat::Png: return "png";
        case FileFormat::Jpeg: return "jpeg";
        case FileFormat::Gif: return "gif";
        case FileFormat::Webp: return "webp";
        case FileFormat::Mp3: return "mp3";
        case FileFormat::Aac: return "aac";
        case FileFormat::Mp4: return "mp4";
        case FileFormat::Wav: return "wav";
        case FileFormat::Webm: return "webm";
        case FileFormat::Ogg: return "ogg";
        case FileFormat::Flac: return "flac";
        case FileFormat::Gzip: return "gzip";
        case FileFormat::SevenZip: return "7z";
        case FileFormat::Rar: return "rar";
        case FileFormat::Executable: return "executable";
    }
    return "unknown";
}

inline std::optional<FileFormat> FormatFromString(const std::string& s) {
    static const FileFormat all[] = {
        FileFormat::Unknown, FileFormat::PlainText, FileFormat::Pdf, FileFormat::Zip,
        FileFormat::OfficeOpenXml, FileFormat::CompoundDocument, FileFormat::Png,
        FileFormat::Jpeg, FileFormat::Gif, FileFormat::Webp, FileFormat::Mp3,
        FileFormat::Aac, FileFormat::Mp4, FileFormat::Wav, FileFormat::Webm,
        FileFormat::Ogg, FileFormat::Flac, FileFormat::Gzip, FileFormat::SevenZip,
        FileFormat::Rar, FileFormat::Executable
    };
    for (auto f : all) {
        if (FormatToString(f) == s) return f;
    }
    return std::nullopt;
}

/** @brief Canonical MIME type, used only to flag a mismatching declared type. */
inline std::string CanonicalMimeType(FileFormat f) {
    switch (f) {
        case FileFormat::PlainText: return "text/plain";
        case FileFormat::Pdf: return "application/pdf";
        case FileFormat::Zip: return "application/zip";
        case FileFormat::OfficeOpenXml: return "application/vnd.openxmlformats-officedocument";
        case FileFormat::CompoundDocument: return "application/x-ole-storage";
        case FileFormat::Png: return "image/png";
        case FileFormat::Jpeg: return "image/jpeg";
        case FileFormat::Gif: return "image/gif";
        case FileFormat::Webp: return "image/webp";
        case FileFormat::Mp3: return "audio/mpeg";
        case FileFormat::Aac: return "audio/aac";
        case FileFormat::Mp4: return "video/mp4";
        case FileFormat::Wav: return "audio/wav";
        case FileFormat::Webm: return "video/webm";
        case FileFormat::Ogg: return "audio/ogg";
        case FileFormat::Flac: return "audio/flac";
        case FileFormat::Gzip: return "application/gzip";
        case FileFormat::SevenZip: return "application/x-7z-compressed";
        case FileFormat::Rar: return "application/vnd.rar";
        case FileFormat::Executable: return "application/octet-stream";
        case FileFormat::Unknown: return "application/octet-stream";
    }
    return "application/octet-stream";
}

/** @brief Containers whose index must pass structural inspection before scanning. */
inline bool IsInspectedContainer(FileFormat f) {
    return f == FileFormat::Zip || f == FileFormat::OfficeOpenXml;
}

inline DisarmClass ClassifyForDisarm(FileFormat f) {
    switch (f) {
        case FileFormat::PlainText:
        case FileFormat::Png:
        case FileFormat::Jpeg:
        case FileFormat::Gif:
        case FileFormat::Webp:
        case FileFormat::Mp3:
        case FileFormat::Aac:
        case FileFormat::Mp4:
        case FileFormat::Wav:
        case FileFormat::Webm:
        case FileFormat::Ogg:
        case FileFormat::Flac:
            return DisarmClass::PassThrough;
        case FileFormat::Pdf:
        case FileFormat::Zip:
        case FileFormat::OfficeOpenXml:
        case FileFormat::CompoundDocument:
            return DisarmClass::Neutralize;
        case FileFormat::Gzip:
        case FileFormat::SevenZip:
        case FileFormat::Rar:
        case FileFormat::Executable:
        case FileFormat::Unknown:
            return DisarmClass::Unsupported;
    }
    return DisarmClass::Unsupported;
}

} // namespace filegate::domain
