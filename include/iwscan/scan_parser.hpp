#ifndef IWSCAN_SCAN_PARSER_HPP
#define IWSCAN_SCAN_PARSER_HPP

#include "iwscan/network.hpp"

#include <string>
#include <vector>

namespace iwscan {

/**
 * Parser for wireless-tools `iwlist <iface> scan` output.
 *
 * Each "Cell NN - Address: xx:xx:xx:xx:xx:xx" line opens a block that
 * runs to the next header. A block with missing fields is never
 * rejected: no ESSID means a hidden network, no encryption field means
 * an open one. Throws MalformedOutput when no block header is found,
 * unless the tool explicitly reported "No scan results".
 */
class ScanParser {
public:
    ScanResult parse(const std::string& text) const;

private:
    NetworkRecord parseBlock(const std::string& bssid,
                             const std::vector<std::string>& lines) const;
};

// Helpers exposed for tests.
std::optional<std::string> decodeEssid(const std::string& value);
std::optional<uint32_t> parseFrequencyMhz(const std::string& value);

} // namespace iwscan

#endif // IWSCAN_SCAN_PARSER_HPP
