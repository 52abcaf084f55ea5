/**
 * @file FormatClassifier.cpp
 * @brief Implementation of FormatClassifier.
 */

#include "infrastructure/FormatClassifier.hpp"
#include <fstream>
#include <iostream>
#include <algorithm>
#include <cstring>
#include <vector>

namespace filegate::infrastructure {

using domain::FileFormat;

namespace {

struct MagicRule {
    std::size_t offset;
    std::string bytes;
    FileFormat format;
    double confidence;
};

// Longest, most specific signatures first.
const std::vector<MagicRule>& MagicTable() {
    static const std::vector<MagicRule> table = {
        {0, std::string("\x89PNG\r\n\x1A\n", 8), FileFormat::Png, 0.98},
        {0, std::string("\xD0\xCF\x11\xE0\xA1\xB1\x1A\xE1", 8), FileFormat::CompoundDocument, 0.98},
        {0, std::string("7z\xBC\xAF\x27\x1C", 6), FileFormat::SevenZip, 0.97},
        {0, std::string("Rar!\x1A\x07", 6), FileFormat::Rar, 0.97},
        {0, "GIF87a", FileFormat::Gif, 0.97},
        {0, "GIF89a", FileFormat::Gif, 0.97},
        {0, std::string("\x1A\x45\xDF\xA3", 4), FileFormat::Webm, 0.9},
        {0, std::string("\x7F" "ELF", 4), FileFormat::Executable, 0.97},
        {0, std::string("\xFE\xED\xFA\xCE", 4), FileFormat::Executable, 0.95},
        {0, std::string("\xFE\xED\xFA\xCF", 4), FileFormat::Executable, 0.95},
        {0, std::string("\xCE\xFA\xED\xFE", 4), FileFormat::Executable, 0.95},
        {0, std::string("\xCF\xFA\xED\xFE", 4), FileFormat::Executable, 0.95},
        {0, std::string("\xCA\xFE\xBA\xBE", 4), FileFormat::Executable, 0.9},
        {0, "OggS", FileFormat::Ogg, 0.95},
        {0, "fLaC", FileFormat::Flac, 0.95},
        {0, std::string("PK\x03\x04", 4), FileFormat::Zip, 0.95},
        {0, std::string("PK\x05\x06", 4), FileFormat::Zip, 0.9},
        {4, "ftyp", FileFormat::Mp4, 0.9},
        {0, std::string("\xFF\xD8\xFF", 3), FileFormat::Jpeg, 0.9},
        {0, "ID3", FileFormat::Mp3, 0.85},
        {0, std::string("\x1F\x8B", 2), FileFormat::Gzip, 0.8},
        {0, "MZ", FileFormat::Executable, 0.8},
        {0, "#!", FileFormat::Executable, 0.7},
    };
    return table;
}

bool HasAt(const std::string& data, std::size_t offset, const std::string& bytes) {
    return data.size() >= offset + bytes.size() && data.compare(offset, bytes.size(), bytes) == 0;
}

std::string ToLower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c){ return std::tolower(c); });
    return s;
}

} // namespace

std::optional<std::string> FormatClassifier::ReadPrefix(const std::string& path, std::size_t windowBytes) {
    std::ifstream file(path, std::ios::binary);
    if (!file.is_open()) {
        std::cerr << "[FormatClassifier] Cannot open " << path << std::endl;
        return std::nullopt;
    }
    std::string buffer(windowBytes, '\0');
    file.read(&buffer[0], static_cast<std::streamsize>(windowBytes));
    buffer.resize(static_cast<std::size_t>(file.gcount()));
    return buffer;
}

FileFormat FormatClassifier::Detect(const std::string& prefix, double* confidence) {
    auto report = [confidence](FileFormat f, double c) {
        if (confidence) *confidence = c;
        return f;
    };

    if (prefix.empty()) return report(FileFormat::Unknown, 0.0);

    // RIFF containers share a header; the form type decides.
    if (HasAt(prefix, 0, "RIFF") && prefix.size() >= 12) {
        if (HasAt(prefix, 8, "WAVE")) return report(FileFormat::Wav, 0.95);
        if (HasAt(prefix, 8, "WEBP")) return report(FileFormat::Webp, 0.95);
        return report(FileFormat::Unknown, 0.0);
    }

    for (const auto& rule : MagicTable()) {
        if (!HasAt(prefix, rule.offset, rule.bytes)) continue;
        if (rule.format == FileFormat::Zip && LooksLikeOfficeOpenXml(prefix)) {
            return report(FileFormat::OfficeOpenXml, 0.9);
        }
        return report(rule.format, rule.confidence);
    }

    if (prefix.size() >= 2) {
        auto b0 = static_cast<unsigned char>(prefix[0]);
        auto b1 = static_cast<unsigned char>(prefix[1]);
        // ADTS: sync word with layer bits 00. MPEG audio: sync with a non-reserved layer.
        if (b0 == 0xFF && (b1 & 0xF6) == 0xF0) return report(FileFormat::Aac, 0.6);
        if (b0 == 0xFF && (b1 & 0xE0) == 0xE0 && (b1 & 0x06) != 0) return report(FileFormat::Mp3, 0.5);
    }

    // Readers accept leading garbage before the PDF header.
    auto pdfAt = prefix.find("%PDF-");
    if (pdfAt != std::string::npos && pdfAt < 1024) {
        return report(FileFormat::Pdf, pdfAt == 0 ? 0.95 : 0.7);
    }

    if (LooksLikeText(prefix)) return report(FileFormat::PlainText, 0.6);

    return report(FileFormat::Unknown, 0.0);
}

domain::Classification FormatClassifier::Classify(const std::string& prefix,
                                                  const std::string& claimedExtension,
                                                  const std::string& declaredMimeType,
                                                  const domain::ScanConfig& config) {
    domain::Classification result;
    result.detectedFormat = Detect(prefix, &result.confidence);

    auto it = config.expectedFormats.find(ToLower(claimedExtension));
    if (it != config.expectedFormats.end() && result.detectedFormat != FileFormat::Unknown) {
        result.extensionMatch = it->second.count(result.detectedFormat) > 0;
    }

    if (!declaredMimeType.empty()) {
        std::string canonical = domain::CanonicalMimeType(result.detectedFormat);
        std::string declared = ToLower(declaredMimeType);
        result.mimeMismatch = declared.compare(0, canonical.size(), canonical) != 0;
        if (result.mimeMismatch) {
            std::cout << "[FormatClassifier] Declared MIME '" << declaredMimeType
                      << "' disagrees with detected " << domain::FormatToString(result.detectedFormat) << std::endl;
        }
    }
    return result;
}

bool FormatClassifier::LooksLikeText(const std::string& prefix) {
    std::size_t i = 0;
    if (HasAt(prefix, 0, "\xEF\xBB\xBF")) i = 3;

    std::size_t control = 0;
    std::size_t total = 0;
    while (i < prefix.size()) {
        auto c = static_cast<unsigned char>(prefix[i]);
        if (c == 0) return false;

        std::size_t len = 1;
        if (c >= 0x80) {
            if ((c & 0xE0) == 0xC0) len = 2;
            else if ((c & 0xF0) == 0xE0) len = 3;
            else if ((c & 0xF8) == 0xF0) len = 4;
            else return false;

            // A sequence cut by the window boundary is not evidence of binary data.
            if (i + len > prefix.size()) break;
            for (std::size_t k = 1; k < len; ++k) {
                if ((static_cast<unsigned char>(prefix[i + k]) & 0xC0) != 0x80) return false;
            }
        } else if (c < 0x20 && c != '\t' && c != '\n' && c != '\r' && c != '\f') {
            ++control;
        }
        ++total;
        i += len;
    }
    return total > 0 && control * 20 <= total;
}

bool FormatClassifier::LooksLikeOfficeOpenXml(const std::string& prefix) {
    if (prefix.find("[Content_Types].xml") != std::string::npos) return true;

    // First local header: name length at 26, name at 30.
    if (prefix.size() < 30) return false;
    auto nameLen = static_cast<std::size_t>(static_cast<unsigned char>(prefix[26])) |
                   (static_cast<std::size_t>(static_cast<unsigned char>(prefix[27])) << 8);
    if (prefix.size() < 30 + nameLen) return false;
    std::string firstName = prefix.substr(30, nameLen);
    for (const char* root : {"word/", "xl/", "ppt/"}) {
        if (firstName.rfind(root, 0) == 0) return true;
    }
    return false;
}

} // namespace filegate::infrastructure
