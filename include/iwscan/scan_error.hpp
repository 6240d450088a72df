#ifndef IWSCAN_SCAN_ERROR_HPP
#define IWSCAN_SCAN_ERROR_HPP

#include <stdexcept>
#include <string>

namespace iwscan {

enum class ScanErrorKind {
    ToolNotFound,
    PermissionDenied,
    InterfaceNotFound,
    ProcessError,
    MalformedOutput
};

std::string toString(ScanErrorKind kind);

class ScanError : public std::runtime_error {
public:
    ScanError(ScanErrorKind kind, const std::string& message);

    ScanErrorKind kind() const { return kind_; }

private:
    ScanErrorKind kind_;
};

class ToolNotFound : public ScanError {
public:
    explicit ToolNotFound(const std::string& tool);
};

class PermissionDenied : public ScanError {
public:
    explicit PermissionDenied(const std::string& detail);
};

class InterfaceNotFound : public ScanError {
public:
    explicit InterfaceNotFound(const std::string& interface);
};

class ProcessError : public ScanError {
public:
    ProcessError(int exitCode, const std::string& standardError);

    int exitCode() const { return exitCode_; }
    const std::string& standardError() const { return standardError_; }

private:
    int exitCode_;
    std::string standardError_;
};

class MalformedOutput : public ScanError {
public:
    explicit MalformedOutput(const std::string& detail);
};

} // namespace iwscan

#endif // IWSCAN_SCAN_ERROR_HPP
