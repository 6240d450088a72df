#include "iwscan/cli_options.hpp"

namespace iwscan {

std::string parseArguments(int argc, const char* const argv[], CliOptions& options) {
    for (int i = 1; i < argc; ++i) {
        std::string arg(argv[i]);
        if (arg == "-h" || arg == "--help") {
            options.showHelp = true;
            return "";
        } else if (arg == "-t" || arg == "--table") {
            options.useTable = true;
        } else if (arg == "-j" || arg == "--json") {
            options.useTable = false;
        } else if (arg == "-l" || arg == "--list") {
            options.listInterfaces = true;
        } else if (arg == "-v" || arg == "--verbose") {
            options.verbose = true;
        } else if (arg == "-i" || arg == "--interface" || arg == "--tool") {
            if (i + 1 >= argc) {
                return "Missing value for option: " + arg;
            }
            if (arg == "--tool") {
                options.config.tool = argv[++i];
            } else {
                options.interface = argv[++i];
            }
        } else {
            return "Unknown option: " + arg;
        }
    }
    return "";
}

} // namespace iwscan
