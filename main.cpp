/**
 * @file main.cpp
 * @brief Entry point of the filegate command.
 */
#include "app/FileGateApp.hpp"

#include <string>
#include <vector>

int main(int argc, char** argv) {
    std::vector<std::string> args(argv + 1, argv + argc);
    filegate::app::FileGateApp app;
    return app.Run(args);
}
