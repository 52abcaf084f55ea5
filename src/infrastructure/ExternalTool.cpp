/**
 * @file ExternalTool.cpp
 * @brief Implementation of ExternalTool.
 */

#include "infrastructure/ExternalTool.hpp"
#include <cstdlib>
#include <iostream>
#include <sys/wait.h>

namespace filegate::infrastructure {

bool ExternalTool::HasTool(const std::string& tool) {
    std::string cmd = "command -v " + ShellQuote(tool) + " >/dev/null 2>&1";
    int result = std::system(cmd.c_str());
    return result != -1 && WIFEXITED(result) && WEXITSTATUS(result) == 0;
}

int ExternalTool::Run(const std::string& program, const std::vector<std::string>& args) {
    std::string cmd = ShellQuote(program);
    for (const auto& arg : args) {
        cmd += " " + ShellQuote(arg);
    }
    cmd += " >/dev/null 2>&1";

    int status = std::system(cmd.c_str());
    if (status == -1 || !WIFEXITED(status)) {
        std::cerr << "[ExternalTool] " << program << " did not run to completion." << std::endl;
        return -1;
    }
    return WEXITSTATUS(status);
}

std::string ExternalTool::ShellQuote(const std::string& arg) {
    std::string quoted = "'";
    for (char c : arg) {
        if (c == '\'') {
            quoted += "'\\''";
        } else {
            quoted += c;
        }
    }
    quoted += "'";
    return quoted;
}

} // namespace filegate::infrastructure
