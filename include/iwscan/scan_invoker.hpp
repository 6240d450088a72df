#ifndef IWSCAN_SCAN_INVOKER_HPP
#define IWSCAN_SCAN_INVOKER_HPP

#include "iwscan/process_runner.hpp"

#include <string>
#include <vector>

namespace iwscan {

struct ScanConfig {
    std::string tool = "iwlist";
    std::vector<std::string> scanArguments = {"scan"};
};

class ScanInvoker {
public:
    explicit ScanInvoker(ProcessRunner& runner, ScanConfig config = ScanConfig());

    // Returns the tool's stdout; throws a ScanError subclass on failure.
    std::string run(const std::string& interface);

    std::vector<std::string> commandLine(const std::string& interface) const;
    const ScanConfig& config() const { return config_; }

private:
    ProcessRunner& runner_;
    ScanConfig config_;
};

bool isValidInterfaceName(const std::string& name);

} // namespace iwscan

#endif // IWSCAN_SCAN_INVOKER_HPP
