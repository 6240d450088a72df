#include "iwscan/network.hpp"

#include <sstream>
#include <iomanip>

namespace iwscan {

static std::string jsonEscape(const std::string& in) {
    std::ostringstream out;
    for (unsigned char c : in) {
        switch (c) {
        case '"':  out << "\\\""; break;
        case '\\': out << "\\\\"; break;
        case '\n': out << "\\n";  break;
        case '\r': out << "\\r";  break;
        case '\t': out << "\\t";  break;
        default:
            if (c < 0x20) {
                out << "\\u" << std::hex << std::setw(4) << std::setfill('0')
                    << static_cast<int>(c) << std::dec << std::setfill(' ');
            } else {
                out << c;
            }
        }
    }
    return out.str();
}

static std::string jsonArray(const std::vector<std::string>& values) {
    std::ostringstream out;
    out << "[";
    for (size_t i = 0; i < values.size(); ++i) {
        if (i > 0) out << ",";
        out << "\"" << jsonEscape(values[i]) << "\"";
    }
    out << "]";
    return out.str();
}

std::string toString(Encryption encryption) {
    switch (encryption) {
    case Encryption::Open: return "Open";
    case Encryption::WEP:  return "WEP";
    case Encryption::WPA:  return "WPA";
    case Encryption::WPA2: return "WPA2";
    case Encryption::WPA3: return "WPA3";
    }
    return "Unknown";
}

std::string toString(WirelessMode mode) {
    switch (mode) {
    case WirelessMode::Auto:      return "Auto";
    case WirelessMode::AdHoc:     return "Ad-Hoc";
    case WirelessMode::Managed:   return "Managed";
    case WirelessMode::Master:    return "Master";
    case WirelessMode::Repeater:  return "Repeater";
    case WirelessMode::Secondary: return "Secondary";
    case WirelessMode::Monitor:   return "Monitor";
    }
    return "Unknown";
}

int NetworkRecord::signalPercent() const {
    if (signalDbm) {
        int dbm = *signalDbm;
        if (dbm <= -100) return 0;
        if (dbm >= -50) return 100;
        return 2 * (dbm + 100);
    }
    if (quality && qualityMax && *qualityMax > 0) {
        int percent = (*quality * 100) / *qualityMax;
        return percent > 100 ? 100 : (percent < 0 ? 0 : percent);
    }
    return 0;
}

std::string NetworkRecord::toJson() const {
    std::ostringstream json;
    json << "{";
    json << "\"bssid\":\"" << jsonEscape(bssid) << "\",";
    if (essid) {
        json << "\"essid\":\"" << jsonEscape(*essid) << "\",";
    } else {
        json << "\"essid\":null,";
    }
    json << "\"encryption\":\"" << toString(encryption) << "\"";
    if (channel) json << ",\"channel\":" << *channel;
    if (frequencyMhz) json << ",\"frequency\":" << *frequencyMhz;
    if (signalDbm) json << ",\"signal_dbm\":" << *signalDbm;
    if (signalDbm || (quality && qualityMax)) {
        json << ",\"signal_percent\":" << signalPercent();
    }
    if (maxBitrateMbps) json << ",\"max_bitrate_mbps\":" << *maxBitrateMbps;
    if (mode) json << ",\"mode\":\"" << toString(*mode) << "\"";
    if (!groupCipher.empty()) {
        json << ",\"group_cipher\":\"" << jsonEscape(groupCipher) << "\"";
    }
    if (!pairwiseCiphers.empty()) {
        json << ",\"pairwise_ciphers\":" << jsonArray(pairwiseCiphers);
    }
    if (!authSuites.empty()) {
        json << ",\"auth_suites\":" << jsonArray(authSuites);
    }
    json << "}";
    return json.str();
}

} // namespace iwscan
