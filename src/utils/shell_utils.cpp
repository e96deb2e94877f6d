/**
 * @file shell_utils.cpp
 * @brief POSIX shell quoting for generated control scripts
 *
 * @date 2025
 */

#include "flashvm/utils/shell_utils.hpp"

#include <cstring>

namespace flashvm {
namespace utils {

namespace {

bool IsShellSafe(char c) {
    if ((c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') || (c >= '0' && c <= '9')) {
        return true;
    }
    return c != '\0' && std::strchr("/-_.:@+,", c) != nullptr;
}

} // anonymous namespace

std::string ShellQuote(const std::string& value) {
    bool safe = !value.empty();
    for (char c : value) {
        if (!IsShellSafe(c)) {
            safe = false;
            break;
        }
    }
    if (safe) {
        return value;
    }

    std::string quoted;
    quoted.reserve(value.size() + 2);
    quoted.push_back('\'');
    for (char c : value) {
        if (c == '\'') {
            quoted += "'\\''";
        } else {
            quoted.push_back(c);
        }
    }
    quoted.push_back('\'');
    return quoted;
}

std::string ShellJoin(const std::vector<std::string>& argv) {
    std::string joined;
    for (const auto& arg : argv) {
        if (!joined.empty()) {
            joined.push_back(' ');
        }
        joined += ShellQuote(arg);
    }
    return joined;
}

} // namespace utils
} // namespace flashvm
