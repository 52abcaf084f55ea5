/**
 * @file DisarmEngine.hpp
 * @brief Selects and runs the neutralization strategy for a detected format.
 */

#pragma once
#include <string>
#include <variant>
#include "domain/DisarmResult.hpp"
#include "domain/FileFormat.hpp"
#include "domain/ScanConfig.hpp"
#include "domain/CancellationToken.hpp"
#include "infrastructure/ArchiveDisarmer.hpp"

namespace filegate::infrastructure {

namespace strategy {
struct PdfRewrite {};
struct OpenXmlRepackage {};
struct CompoundDocumentCheck {};
struct ArchiveRepack {};
struct PassThrough {};
struct Refuse {};
} // namespace strategy

/// Closed set of strategies. Adding an alternative breaks every visitor until it is handled.
using DisarmStrategy = std::variant<strategy::PdfRewrite,
                                    strategy::OpenXmlRepackage,
                                    strategy::CompoundDocumentCheck,
                                    strategy::ArchiveRepack,
                                    strategy::PassThrough,
                                    strategy::Refuse>;

/**
 * @class DisarmEngine
 * @brief Produces neutralized copies under the configured artifact directory.
 *
 * One engine serves one run. Nested archive entries come back through
 * @ref neutralizeInto with a growing depth and a shared extraction budget.
 */
class DisarmEngine {
public:
    DisarmEngine(domain::ScanConfig config, domain::CancellationToken cancel);

    static DisarmStrategy SelectStrategy(domain::FileFormat format);
    static std::string StrategyName(const DisarmStrategy& strategy);

    /**
     * @brief Neutralizes the file at @p path detected as @p format.
     *
     * The input is never modified. A produced artifact is owned by the caller.
     */
    domain::DisarmResult neutralize(const std::string& path, domain::FileFormat format);

private:
    friend struct StrategyRunner;

    domain::DisarmResult neutralizeInto(const std::string& path, domain::FileFormat format,
                                        const std::string& outputPath, int depth,
                                        ArchiveDisarmer::Budget& budget);

    domain::ScanConfig m_config;
    domain::CancellationToken m_cancel;
};

} // namespace filegate::infrastructure
