/**
 * @file errors.hpp
 * @brief Error taxonomy for sandboxed execution
 *
 * Every failure that escapes the engine is one of the exception types below.
 * A deadline overrun is not an exception: it is reported through
 * ExecutionResult with the standard timeout exit code.
 *
 * @date 2025
 */

#pragma once

#include <stdexcept>
#include <string>

namespace flashvm {
namespace core {

/**
 * @enum ErrorKind
 * @brief Failure category carried by every FlashVmError
 */
enum class ErrorKind {
    IMAGE_RESOLUTION,     ///< Bad or unreachable reference, malformed layout
    VM_CONFIGURATION,     ///< Invalid limits, empty package list, bad workdir
    EXECUTION,            ///< External tool failed or returned non-zero
    IO,                   ///< Filesystem failure
    MISSING_DEPENDENCY    ///< Required tool or hardware feature absent
};

/**
 * @brief Stable name of an error kind ("ImageResolution", "IO", ...)
 */
const char* ErrorKindName(ErrorKind kind);

/**
 * @class FlashVmError
 * @brief Base class of all engine errors
 */
class FlashVmError : public std::runtime_error {
public:
    FlashVmError(ErrorKind kind, const std::string& message);

    ErrorKind Kind() const { return kind_; }
    const char* KindName() const { return ErrorKindName(kind_); }

private:
    ErrorKind kind_;
};

class ImageResolutionError : public FlashVmError {
public:
    explicit ImageResolutionError(const std::string& message)
        : FlashVmError(ErrorKind::IMAGE_RESOLUTION, message) {}
};

class VmConfigurationError : public FlashVmError {
public:
    explicit VmConfigurationError(const std::string& message)
        : FlashVmError(ErrorKind::VM_CONFIGURATION, message) {}
};

class ExecutionError : public FlashVmError {
public:
    explicit ExecutionError(const std::string& message)
        : FlashVmError(ErrorKind::EXECUTION, message) {}
};

class IoError : public FlashVmError {
public:
    explicit IoError(const std::string& message)
        : FlashVmError(ErrorKind::IO, message) {}
};

class MissingDependencyError : public FlashVmError {
public:
    explicit MissingDependencyError(const std::string& message)
        : FlashVmError(ErrorKind::MISSING_DEPENDENCY, message) {}
};

} // namespace core
} // namespace flashvm
