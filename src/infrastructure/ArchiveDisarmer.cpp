/**
 * @file ArchiveDisarmer.cpp
 * @brief Implementation of ArchiveDisarmer.
 */

#include "infrastructure/ArchiveDisarmer.hpp"
#include "infrastructure/FormatClassifier.hpp"
#include "infrastructure/ScopedWorkArea.hpp"
#include "infrastructure/ZipHandle.hpp"
#include <filesystem>
#include <iostream>
#include <optional>
#include <set>

namespace fs = std::filesystem;

namespace filegate::infrastructure {

using domain::DisarmResult;
using domain::FileFormat;
using domain::NeutralizationAction;

namespace {
constexpr std::size_t kPrefixWindow = 8192;
}

domain::DisarmResult ArchiveDisarmer::Disarm(const std::string& inputPath, const std::string& outputPath,
                                             const domain::ArchiveLimits& limits, const std::string& workDir,
                                             int depth, Budget& budget, const NestedDisarm& nested,
                                             const domain::CancellationToken& cancel) {
    if (depth > limits.maxNestingDepth) {
        return DisarmResult::Failed(inputPath, "Archive nesting deeper than " + std::to_string(limits.maxNestingDepth));
    }

    ScopedWorkArea area(workDir, "zip");
    if (!area.valid()) {
        return DisarmResult::Failed(inputPath, "Cannot create extraction area");
    }

    std::error_code ec;
    fs::copy_file(inputPath, outputPath, fs::copy_options::overwrite_existing, ec);
    if (ec) {
        return DisarmResult::Failed(inputPath, "Cannot stage archive copy: " + ec.message());
    }
    ScopedArtifact staged(outputPath);

    std::string error;
    ZipHandle archive = ZipHandle::Open(outputPath, 0, error);
    if (!archive) {
        return DisarmResult::Failed(inputPath, "Cannot open archive: " + error);
    }

    zip_int64_t count = zip_get_num_entries(archive.get(), 0);
    if (count < 0) {
        return DisarmResult::Failed(inputPath, "Unreadable central directory");
    }
    if (static_cast<std::uint64_t>(count) > budget.remainingEntries) {
        return DisarmResult::Failed(inputPath, "Entry ceiling exceeded during extraction");
    }
    budget.remainingEntries -= static_cast<std::size_t>(count);

    std::set<NeutralizationAction> actions;
    for (zip_int64_t i = 0; i < count; ++i) {
        if (cancel.isCancelled()) {
            return DisarmResult::Failed(inputPath, "Cancelled");
        }
        auto index = static_cast<zip_uint64_t>(i);

        zip_stat_t st;
        zip_stat_init(&st);
        if (zip_stat_index(archive.get(), index, 0, &st) != 0 || !(st.valid & ZIP_STAT_NAME)) {
            return DisarmResult::Failed(inputPath, "Cannot stat entry " + std::to_string(i));
        }
        std::string name = st.name;

        if ((st.valid & ZIP_STAT_ENCRYPTION_METHOD) && st.encryption_method != ZIP_EM_NONE) {
            return DisarmResult::Failed(inputPath, "Encrypted entry '" + name + "' cannot be inspected");
        }

        std::optional<NeutralizationAction> removal;
        auto kind = ZipHandle::EntryKindAt(archive.get(), index, name);
        if (kind == domain::EntryKind::Symlink) {
            removal = NeutralizationAction::RemovedSymlinkEntry;
        } else if (ZipHandle::IsUnsafeEntryName(name)) {
            removal = NeutralizationAction::RemovedUnsafeEntryPath;
        } else if (kind == domain::EntryKind::Directory) {
            continue;
        }

        if (!removal) {
            std::string entryPath = area.file(".bin").string();
            std::uint64_t written = 0;
            auto status = ZipHandle::ExtractEntry(archive.get(), index, budget.remainingBytes, entryPath, written, error);
            if (status == ZipHandle::ReadStatus::LimitExceeded) {
                return DisarmResult::Failed(inputPath, "Extraction ceiling exceeded: " + error);
            }
            if (status != ZipHandle::ReadStatus::Ok) {
                return DisarmResult::Failed(inputPath, "Cannot extract '" + name + "': " + error);
            }
            budget.remainingBytes -= written;

            auto prefix = FormatClassifier::ReadPrefix(entryPath, kPrefixWindow);
            if (!prefix) {
                return DisarmResult::Failed(inputPath, "Cannot classify extracted '" + name + "'");
            }
            FileFormat format = FormatClassifier::Detect(*prefix);

            if (FormatClassifier::IsExecutable(format)) {
                removal = NeutralizationAction::RemovedExecutableEntry;
            } else {
                switch (domain::ClassifyForDisarm(format)) {
                    case domain::DisarmClass::PassThrough:
                        break;
                    case domain::DisarmClass::Unsupported:
                        if (format != FileFormat::Unknown) {
                            return DisarmResult::Failed(inputPath, "Nested " + domain::FormatToString(format) +
                                                        " entry '" + name + "' cannot be inspected");
                        }
                        break;
                    case domain::DisarmClass::Neutralize: {
                        std::string nestedOut = area.file(".out").string();
                        DisarmResult inner = nested(entryPath, format, nestedOut, depth + 1);
                        if (!inner.success) {
                            return DisarmResult::Failed(inputPath, "Nested entry '" + name + "': " + inner.detail);
                        }
                        if (inner.neutralizedArtifact) {
                            zip_source_t* source = zip_source_file(archive.get(), inner.neutralizedArtifact->c_str(), 0, -1);
                            if (!source) {
                                return DisarmResult::Failed(inputPath, "Cannot stage disarmed '" + name + "'");
                            }
                            if (zip_file_replace(archive.get(), index, source, 0) != 0) {
                                zip_source_free(source);
                                return DisarmResult::Failed(inputPath, "Cannot replace '" + name + "': " +
                                                            zip_strerror(archive.get()));
                            }
                            actions.insert(NeutralizationAction::DisarmedNestedEntry);
                            actions.insert(inner.actions.begin(), inner.actions.end());
                        }
                        break;
                    }
                }
            }
        }

        if (removal) {
            if (zip_delete(archive.get(), index) != 0) {
                return DisarmResult::Failed(inputPath, "Cannot remove '" + name + "': " + zip_strerror(archive.get()));
            }
            actions.insert(*removal);
            std::cout << "[ArchiveDisarmer] Dropping '" << name << "' (" << domain::ActionToString(*removal) << ")" << std::endl;
        }
    }

    if (actions.empty()) {
        return DisarmResult::PassThrough(inputPath);
    }

    // zip_close reads staged replacement files, so the work area is still alive here.
    if (!archive.commit(error)) {
        return DisarmResult::Failed(inputPath, "Repacking failed: " + error);
    }

    DisarmResult result;
    result.originalRef = inputPath;
    result.neutralizedArtifact = staged.release();
    result.actions = std::move(actions);
    result.success = true;
    return result;
}

} // namespace filegate::infrastructure
