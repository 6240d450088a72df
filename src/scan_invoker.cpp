#include "iwscan/scan_invoker.hpp"
#include "iwscan/scan_error.hpp"

#include <algorithm>
#include <cctype>
#include <cerrno>
#include <cstring>
#include <utility>
#include <net/if.h>

namespace iwscan {

static std::string lowercase(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return std::tolower(c); });
    return s;
}

static std::string trim(const std::string& s) {
    size_t begin = s.find_first_not_of(" \t\r\n");
    if (begin == std::string::npos) return "";
    size_t end = s.find_last_not_of(" \t\r\n");
    return s.substr(begin, end - begin + 1);
}

static bool mentionsMissingInterface(const std::string& text) {
    return text.find("no such device") != std::string::npos ||
           text.find("no such interface") != std::string::npos ||
           text.find("doesn't exist") != std::string::npos;
}

static bool mentionsPermission(const std::string& text) {
    return text.find("operation not permitted") != std::string::npos ||
           text.find("permission denied") != std::string::npos;
}

bool isValidInterfaceName(const std::string& name) {
    if (name.empty() || name.size() >= IFNAMSIZ) return false;
    if (name == "." || name == "..") return false;
    for (unsigned char c : name) {
        if (c == '/' || std::isspace(c) || !std::isprint(c)) return false;
    }
    return true;
}

ScanInvoker::ScanInvoker(ProcessRunner& runner, ScanConfig config)
    : runner_(runner), config_(std::move(config)) {}

std::vector<std::string> ScanInvoker::commandLine(const std::string& interface) const {
    std::vector<std::string> argv;
    argv.push_back(config_.tool);
    argv.push_back(interface);
    argv.insert(argv.end(), config_.scanArguments.begin(), config_.scanArguments.end());
    return argv;
}

std::string ScanInvoker::run(const std::string& interface) {
    if (interface.empty()) {
        throw InterfaceNotFound("''");
    }

    ProcessOutput output = runner_.run(commandLine(interface));

    if (output.spawnError != 0) {
        if (output.spawnError == ENOENT || output.spawnError == ENOTDIR) {
            throw ToolNotFound(config_.tool);
        }
        if (output.spawnError == EACCES || output.spawnError == EPERM) {
            throw PermissionDenied("cannot execute " + config_.tool);
        }
        throw ProcessError(-1, std::strerror(output.spawnError));
    }

    // 127 is what a shell wrapper reports for a command it cannot find.
    if (output.exitCode == 127) {
        throw ToolNotFound(config_.tool);
    }

    std::string stderrText = trim(output.standardError);
    bool failed = output.exitCode != 0 || trim(output.standardOutput).empty();

    if (failed) {
        std::string lowered = lowercase(stderrText);
        if (mentionsMissingInterface(lowered)) {
            throw InterfaceNotFound(interface);
        }
        if (mentionsPermission(lowered)) {
            throw PermissionDenied(stderrText);
        }
        // iwlist only says "Interface doesn't support scanning." when it
        // cannot read range info, so ask the kernel whether the name exists.
        if (!isValidInterfaceName(interface) || if_nametoindex(interface.c_str()) == 0) {
            throw InterfaceNotFound(interface);
        }
    }
    if (output.exitCode != 0) {
        throw ProcessError(output.exitCode, stderrText);
    }

    return output.standardOutput;
}

} // namespace iwscan
