#include "iwscan/cli_options.hpp"
#include "iwscan/interface_locator.hpp"
#include "iwscan/wifi_scanner.hpp"

#include <iostream>
#include <iomanip>
#include <sstream>
#include <unistd.h>

using iwscan::NetworkRecord;

void printHelp(const char* programName) {
    std::cout << "Usage: " << programName << " [options]\n";
    std::cout << "Options:\n";
    std::cout << "  -h, --help             Show this help message\n";
    std::cout << "  -i, --interface IFACE  Wireless interface to scan (default: auto-detect)\n";
    std::cout << "  -j, --json             Output as JSON (default)\n";
    std::cout << "  -t, --table            Output as formatted table\n";
    std::cout << "  -l, --list             List wireless interfaces and exit\n";
    std::cout << "      --tool PATH        Scan tool to run (default: iwlist)\n";
    std::cout << "  -v, --verbose          Print the command being run\n";
    std::cout << "\nNote: scanning usually requires root privileges.\n";
    std::cout << "Run with: sudo " << programName << "\n";
}

static std::string optionalText(const std::optional<int>& value, const std::string& suffix) {
    return value ? std::to_string(*value) + suffix : "-";
}

void printAsTable(const iwscan::ScanResult& result) {
    if (result.empty()) {
        std::cout << "No networks found.\n";
        return;
    }

    std::cout << std::left
              << std::setw(32) << "ESSID"
              << std::setw(20) << "BSSID"
              << std::setw(10) << "Signal"
              << std::setw(10) << "Strength"
              << std::setw(10) << "Freq(MHz)"
              << std::setw(6)  << "CH"
              << std::setw(15) << "Encryption"
              << "\n";

    std::cout << std::string(103, '-') << "\n";

    for (const auto& net : result.networks) {
        std::string frequency = net.frequencyMhz ? std::to_string(*net.frequencyMhz) : "-";

        std::cout << std::left
                  << std::setw(32) << net.essid.value_or("<hidden>")
                  << std::setw(20) << net.bssid
                  << std::setw(10) << optionalText(net.signalDbm, " dBm")
                  << std::setw(10) << (std::to_string(net.signalPercent()) + "%")
                  << std::setw(10) << frequency
                  << std::setw(6)  << optionalText(net.channel, "")
                  << std::setw(15) << iwscan::toString(net.encryption)
                  << "\n";
    }

    std::cout << "\nTotal networks found: " << result.size() << "\n";
}

void printAsJson(const iwscan::ScanResult& result) {
    std::cout << "[";
    for (size_t i = 0; i < result.networks.size(); ++i) {
        std::cout << result.networks[i].toJson();
        if (i < result.networks.size() - 1) {
            std::cout << ",";
        }
    }
    std::cout << "]\n";
}

int listInterfaces() {
    iwscan::InterfaceLocator locator;
    auto interfaces = locator.listWireless();
    if (interfaces.empty()) {
        std::cout << "No wireless interfaces found.\n";
        return 1;
    }
    for (const auto& iface : interfaces) {
        std::cout << iface.name << " (ifindex " << iface.ifindex
                  << ", phy#" << iface.wiphy << ")\n";
    }
    return 0;
}

int main(int argc, char* argv[]) {
    iwscan::CliOptions options;
    std::string error = iwscan::parseArguments(argc, argv, options);
    if (!error.empty()) {
        std::cerr << error << "\n";
        printHelp(argv[0]);
        return 1;
    }
    if (options.showHelp) {
        printHelp(argv[0]);
        return 0;
    }
    if (options.listInterfaces) {
        return listInterfaces();
    }

    bool useTable = options.useTable;
    std::string interface = options.interface;
    const iwscan::ScanConfig& config = options.config;

    if (geteuid() != 0) {
        std::cerr << "Warning: not running as root; the scan may fail or return cached results.\n";
    }

    try {
        if (interface.empty()) {
            interface = iwscan::InterfaceLocator().findDefault();
            std::cerr << "Using wireless interface: " << interface << std::endl;
        }

        iwscan::PosixProcessRunner runner;
        iwscan::WifiScanner scanner(runner, config);

        if (options.verbose) {
            std::ostringstream command;
            for (const auto& part : iwscan::ScanInvoker(runner, config).commandLine(interface)) {
                command << part << " ";
            }
            std::cerr << "Running: " << command.str() << std::endl;
        }

        if (useTable) {
            std::cout << "Scanning for WiFi networks...\n\n";
        }

        auto result = scanner.scanNetwork(interface);

        if (useTable) {
            printAsTable(result);
        } else {
            printAsJson(result);
        }

        return 0;

    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }
}
