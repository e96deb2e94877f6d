/**
 * @file shell_utils.hpp
 * @brief The one place where strings are quoted for /bin/sh
 *
 * External tools are invoked with argument vectors. A nested shell is only
 * used where a multi-step script is unavoidable (the VM control script and
 * commands run inside build containers); every interpolated value in such a
 * script goes through ShellQuote().
 *
 * @date 2025
 */

#pragma once

#include <string>
#include <vector>

namespace flashvm {
namespace utils {

/**
 * @brief Quote @p value so that POSIX sh reads it back as exactly one word
 *
 * Values made only of [A-Za-z0-9] and "/-_.:@+," are returned unchanged.
 * Everything else, including the empty string, is wrapped in single quotes
 * with embedded quotes written as '\''. Any byte except NUL round-trips.
 */
std::string ShellQuote(const std::string& value);

/**
 * @brief Quote every element and join with single spaces
 */
std::string ShellJoin(const std::vector<std::string>& argv);

} // namespace utils
} // namespace flashvm
