#include <iostream>
#include <string>
#include <vector>

#include "application/NotesCommandRunner.hpp"
#include "infrastructure/PathUtils.hpp"

using namespace notestamp;

int main(int argc, char** argv) {
    std::vector<std::string> args(argv + 1, argv + argc);
    std::string configDir = infrastructure::PathUtils::GetAppConfigDir().string();

    if (args.size() >= 2 && args[0] == "--config") {
        configDir = args[1];
        args.erase(args.begin(), args.begin() + 2);
    }
    if (!args.empty() && (args[0] == "-h" || args[0] == "--help")) {
        application::NotesCommandRunner::PrintUsage(std::cerr);
        return 0;
    }

    application::NotesCommandRunner runner(configDir);
    return runner.run(args, std::cin, std::cout);
}
