/**
 * @file ExternalTool.hpp
 * @brief Helpers for invoking optional command-line rewrite tools.
 */

#pragma once
#include <string>
#include <vector>

namespace filegate::infrastructure {

class ExternalTool {
public:
    /** @brief True if @p tool resolves on PATH. */
    static bool HasTool(const std::string& tool);

    /**
     * @brief Runs @p program with @p args, every argument single-quoted for the shell.
     * @return The exit status, or -1 if the process could not be started or was killed.
     */
    static int Run(const std::string& program, const std::vector<std::string>& args);

    /** @brief Quotes @p arg so the shell passes it through verbatim. */
    static std::string ShellQuote(const std::string& arg);
};

} // namespace filegate::infrastructure
