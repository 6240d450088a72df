#ifndef IWSCAN_NETWORK_HPP
#define IWSCAN_NETWORK_HPP

#include <string>
#include <vector>
#include <optional>
#include <cstdint>

namespace iwscan {

// Ordered weakest to strongest; the parser keeps the maximum.
enum class Encryption {
    Open,
    WEP,
    WPA,
    WPA2,
    WPA3
};

enum class WirelessMode {
    Auto,
    AdHoc,
    Managed,
    Master,
    Repeater,
    Secondary,
    Monitor
};

std::string toString(Encryption encryption);
std::string toString(WirelessMode mode);

struct NetworkRecord {
    std::string bssid;
    std::optional<std::string> essid;   // absent for hidden networks
    Encryption encryption = Encryption::Open;

    std::optional<int> channel;
    std::optional<uint32_t> frequencyMhz;
    std::optional<int> signalDbm;
    std::optional<int> quality;
    std::optional<int> qualityMax;
    std::optional<double> maxBitrateMbps;
    std::optional<WirelessMode> mode;

    std::string groupCipher;
    std::vector<std::string> pairwiseCiphers;
    std::vector<std::string> authSuites;

    int signalPercent() const;
    std::string toJson() const;
};

struct ScanResult {
    std::vector<NetworkRecord> networks;

    bool empty() const { return networks.empty(); }
    size_t size() const { return networks.size(); }
};

} // namespace iwscan

#endif // IWSCAN_NETWORK_HPP
