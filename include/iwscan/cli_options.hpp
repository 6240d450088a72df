#ifndef IWSCAN_CLI_OPTIONS_HPP
#define IWSCAN_CLI_OPTIONS_HPP

#include "iwscan/scan_invoker.hpp"

#include <string>

namespace iwscan {

struct CliOptions {
    bool showHelp = false;
    bool listInterfaces = false;
    bool useTable = false;
    bool verbose = false;
    std::string interface;
    ScanConfig config;
};

// Returns an error message for the user, empty on success.
std::string parseArguments(int argc, const char* const argv[], CliOptions& options);

} // namespace iwscan

#endif // IWSCAN_CLI_OPTIONS_HPP
