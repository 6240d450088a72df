#include "iwscan/wifi_scanner.hpp"

#include <utility>

namespace iwscan {

WifiScanner::WifiScanner(ProcessRunner& runner, ScanConfig config)
    : invoker_(runner, std::move(config)) {}

WifiScanner::~WifiScanner() {}

ScanResult WifiScanner::scanNetwork(const std::string& interface) {
    std::string output = invoker_.run(interface);
    return parser_.parse(output);
}

} // namespace iwscan
