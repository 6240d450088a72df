#ifndef IWSCAN_INTERFACE_LOCATOR_HPP
#define IWSCAN_INTERFACE_LOCATOR_HPP

#include <string>
#include <vector>
#include <cstdint>

namespace iwscan {

struct WirelessInterface {
    std::string name;
    uint32_t ifindex = 0;
    uint32_t wiphy = 0;
};

class InterfaceLocator {
public:
    // Wireless interfaces as reported by nl80211. Empty when nl80211 is
    // unavailable; the reason is printed to stderr.
    std::vector<WirelessInterface> listWireless() const;

    // First nl80211 interface, else a name-heuristic match from
    // getifaddrs(), else "wlan0".
    std::string findDefault() const;
};

bool looksWireless(const std::string& name);

} // namespace iwscan

#endif // IWSCAN_INTERFACE_LOCATOR_HPP
