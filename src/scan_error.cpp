#include "iwscan/scan_error.hpp"

namespace iwscan {

std::string toString(ScanErrorKind kind) {
    switch (kind) {
    case ScanErrorKind::ToolNotFound:      return "ToolNotFound";
    case ScanErrorKind::PermissionDenied:  return "PermissionDenied";
    case ScanErrorKind::InterfaceNotFound: return "InterfaceNotFound";
    case ScanErrorKind::ProcessError:      return "ProcessError";
    case ScanErrorKind::MalformedOutput:   return "MalformedOutput";
    }
    return "Unknown";
}

ScanError::ScanError(ScanErrorKind kind, const std::string& message)
    : std::runtime_error(message), kind_(kind) {}

ToolNotFound::ToolNotFound(const std::string& tool)
    : ScanError(ScanErrorKind::ToolNotFound,
                "Scan tool not found: " + tool) {}

PermissionDenied::PermissionDenied(const std::string& detail)
    : ScanError(ScanErrorKind::PermissionDenied,
                "Permission denied: " + detail +
                " (wireless scanning usually requires root privileges)") {}

InterfaceNotFound::InterfaceNotFound(const std::string& interface)
    : ScanError(ScanErrorKind::InterfaceNotFound,
                "Wireless interface " + interface + " not found") {}

static std::string processMessage(int exitCode, const std::string& standardError) {
    std::string message = "Scan tool failed with exit code " + std::to_string(exitCode);
    if (!standardError.empty()) {
        message += ": " + standardError;
    }
    return message;
}

ProcessError::ProcessError(int exitCode, const std::string& standardError)
    : ScanError(ScanErrorKind::ProcessError, processMessage(exitCode, standardError)),
      exitCode_(exitCode),
      standardError_(standardError) {}

MalformedOutput::MalformedOutput(const std::string& detail)
    : ScanError(ScanErrorKind::MalformedOutput,
                "Malformed scan output: " + detail) {}

} // namespace iwscan
