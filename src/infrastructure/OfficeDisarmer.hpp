/**
 * @file OfficeDisarmer.hpp
 * @brief Macro removal for Office Open XML packages and macro detection for OLE2 documents.
 */

#pragma once
#include <string>
#include <vector>
#include "domain/DisarmResult.hpp"
#include "domain/ScanConfig.hpp"

namespace filegate::infrastructure {

/**
 * @class OfficeDisarmer
 * @brief Removes macro-bearing parts from office documents and repackages the rest.
 */
class OfficeDisarmer {
public:
    /**
     * @brief Strips VBA projects, ActiveX controls, embedded OLE objects and
     *        executable parts from an OOXML package, writing the result to @p outputPath.
     */
    static domain::DisarmResult DisarmOpenXml(const std::string& inputPath, const std::string& outputPath,
                                              const domain::ArchiveLimits& limits);

    /**
     * @struct CompoundInspection
     * @brief Directory listing of an OLE2 compound file.
     */
    struct CompoundInspection {
        bool wellFormed = false;
        std::string problem;
        std::vector<std::string> entryNames;
        bool hasMacros = false;        ///< VBA project storages present.
        bool hasMacroSheets = false;   ///< Workbook globals declare XLM macro or module sheets.
    };

    /**
     * @brief Walks the compound-file directory with bounded sector chains and
     *        reads the sheet list of a Workbook or Book stream.
     */
    static CompoundInspection InspectCompound(const std::string& path);

    /**
     * @brief Legacy binary documents are never rewritten: macro-free files pass
     *        through, macro-bearing or malformed ones fail.
     */
    static domain::DisarmResult DisarmCompound(const std::string& inputPath);

    /** @brief True if @p partName (any case) names a VBA project part. */
    static bool IsMacroPart(const std::string& partName);

    /**
     * @brief Removes every <tag .../> element of @p xml whose @p attribute satisfies @p drop.
     * @return Number of elements removed.
     */
    template <typename Predicate>
    static int RemoveElements(std::string& xml, const std::string& tag, const std::string& attribute, Predicate drop);

    /** @brief Value of @p name inside a single XML start tag, or empty. */
    static std::string AttributeOf(const std::string& element, const std::string& name);

    /** @brief Resolves a relationship target relative to the part owning @p relsPath. */
    static std::string ResolveTarget(const std::string& relsPath, const std::string& target);
};

template <typename Predicate>
int OfficeDisarmer::RemoveElements(std::string& xml, const std::string& tag, const std::string& attribute,
                                   Predicate drop) {
    int removed = 0;
    const std::string open = "<" + tag;
    std::size_t pos = 0;
    while ((pos = xml.find(open, pos)) != std::string::npos) {
        std::size_t after = pos + open.size();
        if (after >= xml.size() || (xml[after] != ' ' && xml[after] != '\t' && xml[after] != '\n' &&
                                    xml[after] != '\r' && xml[after] != '/' && xml[after] != '>')) {
            pos = after;
            continue;
        }
        std::size_t close = xml.find('>', after);
        if (close == std::string::npos) break;

        std::size_t end = close + 1;
        if (xml[close - 1] != '/') {
            std::size_t closing = xml.find("</" + tag + ">", close);
            if (closing != std::string::npos) end = closing + tag.size() + 3;
        }

        std::string element = xml.substr(pos, close - pos + 1);
        if (drop(AttributeOf(element, attribute))) {
            xml.erase(pos, end - pos);
            ++removed;
        } else {
            pos = end;
        }
    }
    return removed;
}

} // namespace filegate::infrastructure
