#ifndef IWSCAN_WIFI_SCANNER_HPP
#define IWSCAN_WIFI_SCANNER_HPP

#include "iwscan/network.hpp"
#include "iwscan/process_runner.hpp"
#include "iwscan/scan_invoker.hpp"
#include "iwscan/scan_parser.hpp"

#include <string>

namespace iwscan {

class WifiScanner {
public:
    explicit WifiScanner(ProcessRunner& runner, ScanConfig config = ScanConfig());
    ~WifiScanner();

    ScanResult scanNetwork(const std::string& interface);

private:
    ScanInvoker invoker_;
    ScanParser parser_;
};

} // namespace iwscan

#endif // IWSCAN_WIFI_SCANNER_HPP
