/**
 * @file errors.cpp
 * @brief Stable kind names for the flashvm error hierarchy
 *
 * @date 2025
 */

#include "flashvm/core/errors.hpp"

namespace flashvm {
namespace core {

const char* ErrorKindName(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::IMAGE_RESOLUTION: return "ImageResolution";
        case ErrorKind::VM_CONFIGURATION: return "VMConfiguration";
        case ErrorKind::EXECUTION: return "Execution";
        case ErrorKind::IO: return "IO";
        case ErrorKind::MISSING_DEPENDENCY: return "MissingDependency";
    }
    return "Unknown";
}

FlashVmError::FlashVmError(ErrorKind kind, const std::string& message)
    : std::runtime_error(message)
    , kind_(kind) {
}

} // namespace core
} // namespace flashvm
