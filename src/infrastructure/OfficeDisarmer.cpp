/**
 * @file OfficeDisarmer.cpp
 * @brief Implementation of OfficeDisarmer.
 */

#include "infrastructure/OfficeDisarmer.hpp"
#include "infrastructure/FormatClassifier.hpp"
#include "infrastructure/ScopedWorkArea.hpp"
#include "infrastructure/ZipHandle.hpp"
#include <algorithm>
#include <cctype>
#include <cstdint>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <map>
#include <memory>
#include <optional>
#include <set>

namespace fs = std::filesystem;

namespace filegate::infrastructure {

using domain::DisarmResult;
using domain::NeutralizationAction;

namespace {

constexpr std::uint64_t kMaxXmlPartBytes = 16ULL * 1024 * 1024;
constexpr std::size_t kPrefixWindow = 8192;

std::string ToLower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c){ return std::tolower(c); });
    return s;
}

bool EndsWith(const std::string& s, const std::string& suffix) {
    return s.size() >= suffix.size() && s.compare(s.size() - suffix.size(), suffix.size(), suffix) == 0;
}

const std::map<std::string, std::string>& MacroContentTypes() {
    static const std::map<std::string, std::string> types = {
        {"application/vnd.ms-word.document.macroEnabled.main+xml",
         "application/vnd.openxmlformats-officedocument.wordprocessingml.document.main+xml"},
        {"application/vnd.ms-word.template.macroEnabledTemplate.main+xml",
         "application/vnd.openxmlformats-officedocument.wordprocessingml.template.main+xml"},
        {"application/vnd.ms-excel.sheet.macroEnabled.main+xml",
         "application/vnd.openxmlformats-officedocument.spreadsheetml.sheet.main+xml"},
        {"application/vnd.ms-excel.template.macroEnabled.main+xml",
         "application/vnd.openxmlformats-officedocument.spreadsheetml.template.main+xml"},
        {"application/vnd.ms-powerpoint.presentation.macroEnabled.main+xml",
         "application/vnd.openxmlformats-officedocument.presentationml.presentation.main+xml"},
        {"application/vnd.ms-powerpoint.slideshow.macroEnabled.main+xml",
         "application/vnd.openxmlformats-officedocument.presentationml.slideshow.main+xml"},
    };
    return types;
}

bool IsActiveContentType(const std::string& contentType) {
    std::string lower = ToLower(contentType);
    return lower.find("vbaproject") != std::string::npos || lower.find("vbadata") != std::string::npos ||
           lower.find("activex") != std::string::npos || lower.find("oleobject") != std::string::npos;
}

// Little-endian readers for the compound-file header and directory.
std::uint16_t U16(const std::string& b, std::size_t off) {
    return static_cast<std::uint16_t>(static_cast<unsigned char>(b[off]) |
                                      (static_cast<unsigned char>(b[off + 1]) << 8));
}

std::uint32_t U32(const std::string& b, std::size_t off) {
    return static_cast<std::uint32_t>(static_cast<unsigned char>(b[off])) |
           (static_cast<std::uint32_t>(static_cast<unsigned char>(b[off + 1])) << 8) |
           (static_cast<std::uint32_t>(static_cast<unsigned char>(b[off + 2])) << 16) |
           (static_cast<std::uint32_t>(static_cast<unsigned char>(b[off + 3])) << 24);
}

constexpr std::uint32_t kEndOfChain = 0xFFFFFFFE;
constexpr std::uint32_t kMaxRegularSector = 0xFFFFFFFA;
constexpr std::uint64_t kMaxWorkbookBytes = 64ULL * 1024 * 1024;

struct DirectoryEntry {
    std::string name;
    unsigned char type = 0;
    std::uint32_t start = 0;
    std::uint64_t size = 0;
};

enum class WorkbookScan { Clean, MacroSheet, Encrypted, Truncated };

// Walks the BIFF records of the workbook globals up to their EOF record.
// BOUNDSHEET sheet type 1 is an Excel 4.0 macro sheet, 6 a VBA module sheet.
WorkbookScan ScanWorkbookGlobals(const std::string& stream) {
    constexpr std::uint16_t kEof = 0x000A;
    constexpr std::uint16_t kFilePass = 0x002F;
    constexpr std::uint16_t kBoundSheet = 0x0085;

    std::size_t pos = 0;
    while (pos + 4 <= stream.size()) {
        std::uint16_t type = U16(stream, pos);
        std::uint16_t length = U16(stream, pos + 2);
        std::size_t data = pos + 4;
        if (data + length > stream.size()) return WorkbookScan::Truncated;
        if (type == kEof) return WorkbookScan::Clean;
        if (type == kFilePass) return WorkbookScan::Encrypted;
        if (type == kBoundSheet && length >= 6) {
            auto sheetType = static_cast<unsigned char>(stream[data + 5]);
            if (sheetType == 0x01 || sheetType == 0x06) return WorkbookScan::MacroSheet;
        }
        pos = data + length;
    }
    return WorkbookScan::Truncated;
}

} // namespace

bool OfficeDisarmer::IsMacroPart(const std::string& partName) {
    std::string base = ToLower(fs::path(partName).filename().string());
    return base == "vbaproject.bin" || base == "vbadata.xml" ||
           (base.rfind("vbaprojectsignature", 0) == 0 && EndsWith(base, ".bin"));
}

std::string OfficeDisarmer::AttributeOf(const std::string& element, const std::string& name) {
    std::size_t pos = 0;
    while ((pos = element.find(name, pos)) != std::string::npos) {
        bool boundary = pos > 0 && std::isspace(static_cast<unsigned char>(element[pos - 1]));
        std::size_t eq = pos + name.size();
        while (eq < element.size() && std::isspace(static_cast<unsigned char>(element[eq]))) ++eq;
        if (boundary && eq < element.size() && element[eq] == '=') {
            std::size_t q = eq + 1;
            while (q < element.size() && std::isspace(static_cast<unsigned char>(element[q]))) ++q;
            if (q < element.size() && (element[q] == '"' || element[q] == '\'')) {
                std::size_t end = element.find(element[q], q + 1);
                if (end != std::string::npos) return element.substr(q + 1, end - q - 1);
            }
            return "";
        }
        pos += name.size();
    }
    return "";
}

std::string OfficeDisarmer::ResolveTarget(const std::string& relsPath, const std::string& target) {
    fs::path resolved;
    if (!target.empty() && target.front() == '/') {
        resolved = fs::path(target.substr(1));
    } else {
        // "word/_rels/document.xml.rels" describes "word/document.xml".
        fs::path owner = fs::path(relsPath).parent_path().parent_path();
        resolved = owner / target;
    }
    fs::path normal;
    for (const auto& part : resolved.lexically_normal()) {
        if (part == "..") {
            normal = normal.parent_path();
        } else if (part != ".") {
            normal /= part;
        }
    }
    return normal.generic_string();
}

domain::DisarmResult OfficeDisarmer::DisarmOpenXml(const std::string& inputPath, const std::string& outputPath,
                                                   const domain::ArchiveLimits& limits) {
    std::error_code ec;
    fs::copy_file(inputPath, outputPath, fs::copy_options::overwrite_existing, ec);
    if (ec) {
        return DisarmResult::Failed(inputPath, "Cannot stage package copy: " + ec.message());
    }
    ScopedArtifact staged(outputPath);

    std::string error;
    ZipHandle package = ZipHandle::Open(outputPath, 0, error);
    if (!package) {
        return DisarmResult::Failed(inputPath, "Cannot open package: " + error);
    }
    zip_int64_t count = zip_get_num_entries(package.get(), 0);
    if (count < 0 || static_cast<std::uint64_t>(count) > limits.maxEntries) {
        return DisarmResult::Failed(inputPath, "Package entry count outside limits");
    }

    std::set<NeutralizationAction> actions;
    std::set<std::string> removedParts;
    std::vector<zip_uint64_t> toDelete;
    std::vector<std::pair<zip_uint64_t, std::string>> xmlParts;

    for (zip_int64_t i = 0; i < count; ++i) {
        auto index = static_cast<zip_uint64_t>(i);
        const char* raw = zip_get_name(package.get(), index, 0);
        if (!raw) {
            return DisarmResult::Failed(inputPath, "Unreadable package entry name");
        }
        std::string name = raw;
        std::string lower = ToLower(name);

        std::optional<NeutralizationAction> removal;
        if (IsMacroPart(name)) {
            removal = NeutralizationAction::RemovedMacroProject;
        } else if (lower.find("activex/") != std::string::npos) {
            removal = NeutralizationAction::RemovedActiveXControl;
        } else if (lower.find("embeddings/") != std::string::npos) {
            removal = NeutralizationAction::RemovedEmbeddedObject;
        } else if (!name.empty() && name.back() != '/') {
            std::string prefix;
            if (!ZipHandle::ReadPrefix(package.get(), index, kPrefixWindow, prefix, error)) {
                return DisarmResult::Failed(inputPath, "Cannot read part '" + name + "': " + error);
            }
            if (FormatClassifier::IsExecutable(FormatClassifier::Detect(prefix))) {
                removal = NeutralizationAction::RemovedExecutableEntry;
            }
        }

        if (removal) {
            actions.insert(*removal);
            removedParts.insert(lower);
            toDelete.push_back(index);
        } else if (name == "[Content_Types].xml" || EndsWith(lower, ".rels")) {
            xmlParts.emplace_back(index, name);
        }
    }

    // Buffers handed to libzip must outlive commit().
    std::vector<std::unique_ptr<std::string>> replacements;
    for (const auto& [index, name] : xmlParts) {
        std::string xml;
        if (ZipHandle::ReadEntry(package.get(), index, kMaxXmlPartBytes, xml, error) != ZipHandle::ReadStatus::Ok) {
            return DisarmResult::Failed(inputPath, "Cannot read '" + name + "': " + error);
        }

        int changes = 0;
        if (name == "[Content_Types].xml") {
            changes += RemoveElements(xml, "Override", "PartName", [&removedParts](const std::string& part) {
                std::string p = ToLower(part);
                if (!p.empty() && p.front() == '/') p.erase(0, 1);
                return removedParts.count(p) > 0;
            });
            if (!removedParts.empty()) {
                changes += RemoveElements(xml, "Default", "ContentType", IsActiveContentType);
            }
            for (const auto& [macroType, plainType] : MacroContentTypes()) {
                std::size_t pos = 0;
                while ((pos = xml.find(macroType, pos)) != std::string::npos) {
                    xml.replace(pos, macroType.size(), plainType);
                    pos += plainType.size();
                    actions.insert(NeutralizationAction::DowngradedMacroContentType);
                    ++changes;
                }
            }
        } else if (!removedParts.empty()) {
            std::string relsPath = name;
            changes += RemoveElements(xml, "Relationship", "Target", [&](const std::string& target) {
                return removedParts.count(ToLower(ResolveTarget(relsPath, target))) > 0;
            });
        }

        if (changes > 0) {
            replacements.push_back(std::make_unique<std::string>(std::move(xml)));
            const std::string& data = *replacements.back();
            zip_source_t* source = zip_source_buffer(package.get(), data.data(), data.size(), 0);
            if (!source) {
                return DisarmResult::Failed(inputPath, "Cannot stage rewritten '" + name + "'");
            }
            if (zip_file_replace(package.get(), index, source, ZIP_FL_ENC_UTF_8) != 0) {
                zip_source_free(source);
                return DisarmResult::Failed(inputPath, "Cannot replace '" + name + "': " + zip_strerror(package.get()));
            }
        }
    }

    for (zip_uint64_t index : toDelete) {
        if (zip_delete(package.get(), index) != 0) {
            return DisarmResult::Failed(inputPath, "Cannot remove part: " + std::string(zip_strerror(package.get())));
        }
    }

    if (actions.empty()) {
        return DisarmResult::PassThrough(inputPath);
    }

    if (!package.commit(error)) {
        return DisarmResult::Failed(inputPath, "Repackaging failed: " + error);
    }

    // The rewritten package must be free of macro parts before it is reported clean.
    ZipHandle check = ZipHandle::Open(outputPath, ZIP_RDONLY, error);
    if (!check) {
        return DisarmResult::Failed(inputPath, "Rewritten package unreadable: " + error);
    }
    zip_int64_t remaining = zip_get_num_entries(check.get(), 0);
    for (zip_int64_t i = 0; i < remaining; ++i) {
        const char* raw = zip_get_name(check.get(), static_cast<zip_uint64_t>(i), 0);
        if (!raw || IsMacroPart(raw)) {
            return DisarmResult::Failed(inputPath, "Macro part survived repackaging");
        }
    }

    DisarmResult result;
    result.originalRef = inputPath;
    result.neutralizedArtifact = staged.release();
    result.actions = std::move(actions);
    result.success = true;
    std::cout << "[OfficeDisarmer] Removed " << toDelete.size() << " parts from " << inputPath << std::endl;
    return result;
}

OfficeDisarmer::CompoundInspection OfficeDisarmer::InspectCompound(const std::string& path) {
    CompoundInspection inspection;
    std::ifstream file(path, std::ios::binary);
    if (!file.is_open()) {
        inspection.problem = "Cannot open compound file";
        return inspection;
    }
    std::error_code ec;
    auto fileSize = fs::file_size(path, ec);
    if (ec || fileSize < 512) {
        inspection.problem = "Compound file too small";
        return inspection;
    }

    std::string header(512, '\0');
    file.read(&header[0], 512);
    if (header.compare(0, 8, std::string("\xD0\xCF\x11\xE0\xA1\xB1\x1A\xE1", 8)) != 0) {
        inspection.problem = "Missing compound file signature";
        return inspection;
    }

    std::uint16_t shift = U16(header, 0x1E);
    if (shift != 9 && shift != 12) {
        inspection.problem = "Unsupported sector size";
        return inspection;
    }
    const std::size_t sectorSize = std::size_t{1} << shift;
    const std::uint64_t sectorCount = (fileSize - 512 + sectorSize - 1) / sectorSize + 1;

    auto readSector = [&](std::uint32_t id, std::string& out) {
        if (id > kMaxRegularSector || id >= sectorCount) return false;
        std::uint64_t offset = (static_cast<std::uint64_t>(id) + 1) * sectorSize;
        if (offset + sectorSize > fileSize) return false;
        out.assign(sectorSize, '\0');
        file.clear();
        file.seekg(static_cast<std::streamoff>(offset));
        file.read(&out[0], static_cast<std::streamsize>(sectorSize));
        return static_cast<bool>(file);
    };

    std::uint32_t fatSectors = U32(header, 0x2C);
    std::uint32_t firstDirSector = U32(header, 0x30);
    std::uint32_t difatSector = U32(header, 0x44);
    std::uint32_t difatCount = U32(header, 0x48);
    if (fatSectors == 0 || fatSectors > sectorCount || difatCount > sectorCount) {
        inspection.problem = "Implausible FAT geometry";
        return inspection;
    }

    std::vector<std::uint32_t> fatIds;
    for (std::uint32_t k = 0; k < 109 && fatIds.size() < fatSectors; ++k) {
        fatIds.push_back(U32(header, 0x4C + k * 4));
    }
    std::string sector;
    for (std::uint32_t d = 0; d < difatCount && fatIds.size() < fatSectors; ++d) {
        if (!readSector(difatSector, sector)) {
            inspection.problem = "Broken DIFAT chain";
            return inspection;
        }
        std::size_t perSector = sectorSize / 4 - 1;
        for (std::size_t k = 0; k < perSector && fatIds.size() < fatSectors; ++k) {
            fatIds.push_back(U32(sector, k * 4));
        }
        difatSector = U32(sector, perSector * 4);
    }

    std::vector<std::uint32_t> fat;
    fat.reserve(fatIds.size() * (sectorSize / 4));
    for (std::uint32_t id : fatIds) {
        if (!readSector(id, sector)) {
            inspection.problem = "Unreadable FAT sector";
            return inspection;
        }
        for (std::size_t k = 0; k < sectorSize / 4; ++k) fat.push_back(U32(sector, k * 4));
    }

    std::vector<DirectoryEntry> entries;
    std::uint32_t current = firstDirSector;
    std::size_t steps = 0;
    while (current != kEndOfChain) {
        if (++steps > fat.size() || current >= fat.size()) {
            inspection.problem = "Directory chain loops or leaves the FAT";
            return inspection;
        }
        if (!readSector(current, sector)) {
            inspection.problem = "Unreadable directory sector";
            return inspection;
        }
        for (std::size_t off = 0; off + 128 <= sectorSize; off += 128) {
            std::uint16_t nameBytes = U16(sector, off + 64);
            auto type = static_cast<unsigned char>(sector[off + 66]);
            if (type == 0 || nameBytes < 2 || nameBytes > 64) continue;

            std::string name;
            for (std::size_t c = 0; c + 2 < nameBytes; c += 2) {
                std::uint16_t ch = U16(sector, off + c);
                name += ch < 128 ? static_cast<char>(ch) : '?';
            }
            inspection.entryNames.push_back(name);

            std::string lower = ToLower(name);
            if (lower == "vba" || lower == "macros" || lower == "_vba_project" || lower == "_vba_project_cur") {
                inspection.hasMacros = true;
            }

            DirectoryEntry entry;
            entry.name = name;
            entry.type = type;
            entry.start = U32(sector, off + 116);
            entry.size = U32(sector, off + 120);
            if (shift == 12) entry.size |= static_cast<std::uint64_t>(U32(sector, off + 124)) << 32;
            entries.push_back(entry);
        }
        current = fat[current];
    }

    // Follows a FAT chain until @p size bytes are collected.
    auto readChain = [&](std::uint32_t start, std::uint64_t size, std::string& out) {
        out.clear();
        std::string block;
        std::uint32_t id = start;
        std::size_t chainSteps = 0;
        while (out.size() < size) {
            if (id == kEndOfChain || ++chainSteps > fat.size() || id >= fat.size()) return false;
            if (!readSector(id, block)) return false;
            out += block;
            id = fat[id];
        }
        out.resize(static_cast<std::size_t>(size));
        return true;
    };

    const DirectoryEntry* root = nullptr;
    for (const auto& entry : entries) {
        if (entry.type == 5) {
            root = &entry;
            break;
        }
    }

    auto readStream = [&](const DirectoryEntry& entry, std::string& out) {
        if (entry.size > kMaxWorkbookBytes) return false;
        if (entry.size >= U32(header, 0x38)) {
            return readChain(entry.start, entry.size, out);
        }

        // Small streams live in 64-byte sectors inside the root entry's mini stream.
        const std::uint16_t miniShift = U16(header, 0x20);
        std::uint32_t miniFatStart = U32(header, 0x3C);
        std::uint32_t miniFatSectors = U32(header, 0x40);
        if (!root || root->size > kMaxWorkbookBytes || miniFatSectors > sectorCount || miniShift > shift) {
            return false;
        }
        const std::size_t miniSize = std::size_t{1} << miniShift;
        std::string miniFat, container;
        if (!readChain(miniFatStart, static_cast<std::uint64_t>(miniFatSectors) * sectorSize, miniFat) ||
            !readChain(root->start, root->size, container)) {
            return false;
        }
        const std::size_t miniEntries = miniFat.size() / 4;
        out.clear();
        std::uint32_t id = entry.start;
        std::size_t chainSteps = 0;
        while (out.size() < entry.size) {
            if (id == kEndOfChain || ++chainSteps > miniEntries || id >= miniEntries) return false;
            std::size_t offset = static_cast<std::size_t>(id) * miniSize;
            if (offset + miniSize > container.size()) return false;
            out.append(container, offset, miniSize);
            id = U32(miniFat, static_cast<std::size_t>(id) * 4);
        }
        out.resize(static_cast<std::size_t>(entry.size));
        return true;
    };

    for (const auto& entry : entries) {
        std::string lower = ToLower(entry.name);
        if (entry.type != 2 || (lower != "workbook" && lower != "book")) continue;

        std::string stream;
        if (!readStream(entry, stream)) {
            inspection.problem = "Unreadable workbook stream";
            return inspection;
        }
        switch (ScanWorkbookGlobals(stream)) {
            case WorkbookScan::Clean:
                break;
            case WorkbookScan::MacroSheet:
                inspection.hasMacroSheets = true;
                break;
            case WorkbookScan::Encrypted:
                inspection.problem = "Encrypted workbook cannot be inspected";
                return inspection;
            case WorkbookScan::Truncated:
                inspection.problem = "Truncated workbook globals";
                return inspection;
        }
    }

    inspection.wellFormed = true;
    return inspection;
}

domain::DisarmResult OfficeDisarmer::DisarmCompound(const std::string& inputPath) {
    auto inspection = InspectCompound(inputPath);
    if (!inspection.wellFormed) {
        return DisarmResult::Failed(inputPath, "Malformed compound document: " + inspection.problem);
    }
    if (inspection.hasMacros) {
        return DisarmResult::Failed(inputPath, "Legacy document carries a VBA project; binary rewrite is not attempted");
    }
    if (inspection.hasMacroSheets) {
        return DisarmResult::Failed(inputPath, "Workbook declares Excel 4.0 macro sheets; binary rewrite is not attempted");
    }
    return DisarmResult::PassThrough(inputPath);
}

} // namespace filegate::infrastructure
