/**
 * @file string_utils.hpp
 * @brief String helpers shared by the image and VM layers
 *
 * Parsing of tool output (line splitting, trimming), prefix handling for
 * image references, base64 for JSON transport of artifact bytes and repair
 * of captured process output that is not valid UTF-8.
 *
 * @date 2025
 */

#pragma once

#include <cstdint>
#include <string>
#include <vector>

namespace flashvm {
namespace utils {

/**
 * @class StringUtils
 * @brief Stateless string utilities
 *
 * All methods are static - no instantiation required.
 */
class StringUtils {
public:
    /**
     * @brief Remove leading and trailing whitespace
     */
    static std::string Trim(const std::string& str);

    /**
     * @brief Split on a delimiter, keeping empty fields
     */
    static std::vector<std::string> Split(const std::string& str, char delimiter);

    /**
     * @brief Split tool output into trimmed, non-empty lines
     */
    static std::vector<std::string> SplitLines(const std::string& str);

    static std::string Join(const std::vector<std::string>& strings,
                            const std::string& delimiter);

    static bool StartsWith(const std::string& str, const std::string& prefix);

    /**
     * @brief Encode bytes as standard base64 with padding
     */
    static std::string ToBase64(const std::vector<std::uint8_t>& data);

    /**
     * @brief Replace every invalid UTF-8 sequence with U+FFFD
     *
     * Valid input is returned unchanged byte for byte. Applied once to a
     * complete capture buffer, so read chunk boundaries never split a
     * character.
     */
    static std::string ToValidUtf8(const std::string& bytes);
};

} // namespace utils
} // namespace flashvm
