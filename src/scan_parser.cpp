#include "iwscan/scan_parser.hpp"
#include "iwscan/scan_error.hpp"

#include <cctype>
#include <cmath>
#include <cstdlib>
#include <sstream>

namespace iwscan {

namespace {

enum class IeKind { Rsn, Wpa, Other };

struct InformationElement {
    IeKind kind = IeKind::Other;
    std::string groupCipher;
    std::vector<std::string> pairwiseCiphers;
    std::vector<std::string> authSuites;
};

std::string trim(const std::string& s) {
    size_t begin = s.find_first_not_of(" \t\r\n");
    if (begin == std::string::npos) return "";
    size_t end = s.find_last_not_of(" \t\r\n");
    return s.substr(begin, end - begin + 1);
}

bool startsWith(const std::string& s, const std::string& prefix) {
    return s.compare(0, prefix.size(), prefix) == 0;
}

std::vector<std::string> splitLines(const std::string& text) {
    std::vector<std::string> lines;
    std::istringstream in(text);
    std::string line;
    while (std::getline(in, line)) {
        lines.push_back(line);
    }
    return lines;
}

// "Cell 01 - Address: 00:11:22:33:44:55" -> true, bssid filled in.
bool parseCellHeader(const std::string& line, std::string& bssid) {
    std::string trimmed = trim(line);
    if (!startsWith(trimmed, "Cell ")) return false;

    size_t pos = trimmed.find(" - Address:");
    if (pos == std::string::npos) return false;

    bssid = trim(trimmed.substr(pos + 11));
    return true;
}

// Value after the first ':' or '=' following label.
std::string valueAfter(const std::string& line, const std::string& label) {
    size_t pos = line.find(label);
    if (pos == std::string::npos) return "";
    pos += label.size();
    if (pos < line.size() && (line[pos] == ':' || line[pos] == '=')) {
        pos++;
    }
    return trim(line.substr(pos));
}

// "Pairwise Ciphers (2) : CCMP TKIP" -> "CCMP TKIP"
std::string suiteList(const std::string& line) {
    size_t pos = line.find(" : ");
    if (pos == std::string::npos) {
        pos = line.find(':');
        if (pos == std::string::npos) return "";
        return trim(line.substr(pos + 1));
    }
    return trim(line.substr(pos + 3));
}

// Splits on spaces but keeps "unknown (8)" together.
std::vector<std::string> splitSuites(const std::string& list) {
    std::vector<std::string> suites;
    std::istringstream in(list);
    std::string token;
    while (in >> token) {
        if (!suites.empty() && token[0] == '(') {
            suites.back() += " " + token;
        } else {
            suites.push_back(token);
        }
    }
    return suites;
}

std::optional<int> parseInt(const std::string& s) {
    const char* begin = s.c_str();
    char* end = nullptr;
    long value = std::strtol(begin, &end, 10);
    if (end == begin) return std::nullopt;
    return static_cast<int>(value);
}

// "70/70" -> (70, 70)
bool parseFraction(const std::string& s, int& numerator, int& denominator) {
    size_t slash = s.find('/');
    if (slash == std::string::npos) return false;

    auto num = parseInt(s.substr(0, slash));
    auto den = parseInt(s.substr(slash + 1));
    if (!num || !den) return false;

    numerator = *num;
    denominator = *den;
    return true;
}

void parseQualityLine(const std::string& line, NetworkRecord& network) {
    std::string quality = valueAfter(line, "Quality");
    int num = 0;
    int den = 0;
    if (!quality.empty() && parseFraction(quality, num, den)) {
        network.quality = num;
        network.qualityMax = den;
    }

    // Relative levels ("Signal level=45/100") are not dBm and are ignored.
    std::string level = valueAfter(line, "Signal level");
    if (level.empty()) return;
    std::string number = level.substr(0, level.find_first_of(" \t"));
    if (number.find('/') != std::string::npos) return;
    if (level.find("dBm") == std::string::npos) return;

    auto dbm = parseInt(number);
    if (dbm) {
        network.signalDbm = *dbm;
    }
}

// "1 Mb/s; 2 Mb/s; 5.5 Mb/s" -> maximum rate.
void parseBitRates(const std::string& list, NetworkRecord& network) {
    std::istringstream in(list);
    std::string item;
    while (std::getline(in, item, ';')) {
        std::string rate = trim(item);
        const char* begin = rate.c_str();
        char* end = nullptr;
        double value = std::strtod(begin, &end);
        if (end == begin || !std::isfinite(value)) continue;

        std::string unit = trim(std::string(end));
        if (startsWith(unit, "kb/s")) {
            value /= 1000.0;
        } else if (startsWith(unit, "Gb/s")) {
            value *= 1000.0;
        }
        if (!network.maxBitrateMbps || value > *network.maxBitrateMbps) {
            network.maxBitrateMbps = value;
        }
    }
}

std::optional<WirelessMode> parseMode(const std::string& value) {
    if (value == "Auto") return WirelessMode::Auto;
    if (value == "Ad-Hoc") return WirelessMode::AdHoc;
    if (value == "Managed") return WirelessMode::Managed;
    if (value == "Master") return WirelessMode::Master;
    if (value == "Repeater") return WirelessMode::Repeater;
    if (value == "Secondary") return WirelessMode::Secondary;
    if (value == "Monitor") return WirelessMode::Monitor;
    return std::nullopt;
}

bool advertisesSae(const InformationElement& ie) {
    for (const auto& suite : ie.authSuites) {
        if (suite.find("SAE") != std::string::npos || suite == "unknown (8)") {
            return true;
        }
    }
    return false;
}

// Strongest scheme wins: WPA3 > WPA2 > WPA > WEP > Open.
void resolveEncryption(const std::vector<InformationElement>& elements,
                       bool keyEnabled,
                       NetworkRecord& network) {
    const InformationElement* decisive = nullptr;
    Encryption best = keyEnabled ? Encryption::WEP : Encryption::Open;

    for (const auto& ie : elements) {
        Encryption candidate;
        if (ie.kind == IeKind::Rsn) {
            candidate = advertisesSae(ie) ? Encryption::WPA3 : Encryption::WPA2;
        } else if (ie.kind == IeKind::Wpa) {
            candidate = Encryption::WPA;
        } else {
            continue;
        }
        if (decisive == nullptr || candidate > best) {
            best = candidate;
            decisive = &ie;
        }
    }

    network.encryption = best;
    if (decisive) {
        network.groupCipher = decisive->groupCipher;
        network.pairwiseCiphers = decisive->pairwiseCiphers;
        network.authSuites = decisive->authSuites;
    }
}

} // namespace

std::optional<std::string> decodeEssid(const std::string& value) {
    std::string raw = trim(value);
    if (raw.empty() || raw == "off/any") {
        return std::nullopt;
    }
    if (raw.size() >= 2 && raw.front() == '"' && raw.back() == '"') {
        raw = raw.substr(1, raw.size() - 2);
    }

    std::string decoded;
    for (size_t i = 0; i < raw.size(); i++) {
        if (raw[i] == '\\' && i + 3 < raw.size() && raw[i + 1] == 'x' &&
            std::isxdigit(static_cast<unsigned char>(raw[i + 2])) &&
            std::isxdigit(static_cast<unsigned char>(raw[i + 3]))) {
            std::string hex = raw.substr(i + 2, 2);
            decoded.push_back(static_cast<char>(std::strtol(hex.c_str(), nullptr, 16)));
            i += 3;
            continue;
        }
        decoded.push_back(raw[i]);
    }

    if (decoded.find_first_not_of('\0') == std::string::npos) {
        return std::nullopt;
    }
    return decoded;
}

std::optional<uint32_t> parseFrequencyMhz(const std::string& value) {
    const char* begin = value.c_str();
    char* end = nullptr;
    double number = std::strtod(begin, &end);
    if (end == begin || !std::isfinite(number) || number <= 0) return std::nullopt;

    std::string unit = trim(std::string(end));
    if (startsWith(unit, "GHz")) {
        number *= 1000.0;
    } else if (startsWith(unit, "kHz")) {
        number /= 1000.0;
    } else if (!startsWith(unit, "MHz") && number < 100.0) {
        // Bare numbers below 100 are GHz values.
        number *= 1000.0;
    }
    return static_cast<uint32_t>(std::lround(number));
}

ScanResult ScanParser::parse(const std::string& text) const {
    if (trim(text).empty()) {
        throw MalformedOutput("empty output");
    }

    ScanResult result;
    std::vector<std::string> lines = splitLines(text);

    std::string bssid;
    std::vector<std::string> block;
    bool inBlock = false;

    for (const auto& line : lines) {
        std::string header;
        if (parseCellHeader(line, header)) {
            if (inBlock) {
                result.networks.push_back(parseBlock(bssid, block));
            }
            bssid = header;
            block.clear();
            inBlock = true;
        } else if (inBlock) {
            block.push_back(line);
        }
    }

    if (inBlock) {
        result.networks.push_back(parseBlock(bssid, block));
        return result;
    }

    // "wlan0     No scan results" is a valid, empty scan.
    if (text.find("No scan results") != std::string::npos) {
        return result;
    }
    throw MalformedOutput("no network blocks found");
}

NetworkRecord ScanParser::parseBlock(const std::string& bssid,
                                     const std::vector<std::string>& lines) const {
    NetworkRecord network;
    network.bssid = bssid;

    std::vector<InformationElement> elements;
    bool keyEnabled = false;

    for (const auto& raw : lines) {
        std::string line = trim(raw);
        if (line.empty()) continue;

        if (startsWith(line, "ESSID:")) {
            network.essid = decodeEssid(line.substr(6));
        } else if (startsWith(line, "Encryption key:")) {
            keyEnabled = trim(line.substr(15)) == "on";
        } else if (startsWith(line, "Channel:")) {
            auto channel = parseInt(line.substr(8));
            if (channel) network.channel = *channel;
        } else if (startsWith(line, "Frequency:")) {
            std::string value = line.substr(10);
            network.frequencyMhz = parseFrequencyMhz(value);

            size_t pos = value.find("(Channel ");
            if (pos != std::string::npos && !network.channel) {
                auto channel = parseInt(value.substr(pos + 9));
                if (channel) network.channel = *channel;
            }
        } else if (startsWith(line, "Quality") || startsWith(line, "Signal level")) {
            parseQualityLine(line, network);
        } else if (startsWith(line, "Bit Rates:")) {
            parseBitRates(line.substr(10), network);
        } else if (startsWith(line, "Mode:")) {
            network.mode = parseMode(trim(line.substr(5)));
        } else if (startsWith(line, "IE:")) {
            InformationElement ie;
            std::string name = trim(line.substr(3));
            if (name.find("802.11i/WPA2") != std::string::npos) {
                ie.kind = IeKind::Rsn;
            } else if (startsWith(name, "WPA Version")) {
                ie.kind = IeKind::Wpa;
            }
            elements.push_back(ie);
        } else if (!elements.empty() && startsWith(line, "Group Cipher")) {
            elements.back().groupCipher = suiteList(line);
        } else if (!elements.empty() && startsWith(line, "Pairwise Ciphers")) {
            elements.back().pairwiseCiphers = splitSuites(suiteList(line));
        } else if (!elements.empty() && startsWith(line, "Authentication Suites")) {
            elements.back().authSuites = splitSuites(suiteList(line));
        } else if (line.find("b/s") != std::string::npos &&
                   line.find(':') == std::string::npos) {
            // Continuation of a wrapped "Bit Rates:" list.
            parseBitRates(line, network);
        }
    }

    resolveEncryption(elements, keyEnabled, network);
    return network;
}

} // namespace iwscan
