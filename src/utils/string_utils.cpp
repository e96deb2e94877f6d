/**
 * @file string_utils.cpp
 * @brief Implementation of string helpers
 *
 * @date 2025
 */

#include "flashvm/utils/string_utils.hpp"

#include <algorithm>
#include <cctype>
#include <sstream>

namespace flashvm {
namespace utils {

// ============================================================================
// BASIC MANIPULATION
// ============================================================================

std::string StringUtils::Trim(const std::string& str) {
    auto start = std::find_if_not(str.begin(), str.end(),
        [](unsigned char c) { return std::isspace(c); });
    auto end = std::find_if_not(str.rbegin(), str.rend(),
        [](unsigned char c) { return std::isspace(c); }).base();

    return (start < end) ? std::string(start, end) : std::string();
}

std::vector<std::string> StringUtils::Split(const std::string& str, char delimiter) {
    std::vector<std::string> tokens;
    std::string token;
    std::istringstream stream(str);

    while (std::getline(stream, token, delimiter)) {
        tokens.push_back(token);
    }
    if (!str.empty() && str.back() == delimiter) {
        tokens.emplace_back();
    }

    return tokens;
}

std::vector<std::string> StringUtils::SplitLines(const std::string& str) {
    std::vector<std::string> lines;
    for (const auto& line : Split(str, '\n')) {
        auto trimmed = Trim(line);
        if (!trimmed.empty()) {
            lines.push_back(std::move(trimmed));
        }
    }
    return lines;
}

std::string StringUtils::Join(const std::vector<std::string>& strings,
                              const std::string& delimiter) {
    std::string result;
    for (std::size_t i = 0; i < strings.size(); ++i) {
        if (i > 0) {
            result += delimiter;
        }
        result += strings[i];
    }
    return result;
}

bool StringUtils::StartsWith(const std::string& str, const std::string& prefix) {
    return str.size() >= prefix.size() &&
           str.compare(0, prefix.size(), prefix) == 0;
}

// ============================================================================
// ENCODING
// ============================================================================

std::string StringUtils::ToBase64(const std::vector<std::uint8_t>& data) {
    static const char base64_chars[] =
        "ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz0123456789+/";

    std::string result;
    result.reserve(((data.size() + 2) / 3) * 4);

    int val = 0;
    int valb = -6;

    for (std::uint8_t c : data) {
        val = ((val << 8) + c) & 0xFFFFFF;
        valb += 8;

        while (valb >= 0) {
            result.push_back(base64_chars[(val >> valb) & 0x3F]);
            valb -= 6;
        }
    }

    if (valb > -6) {
        result.push_back(base64_chars[((val << 8) >> (valb + 8)) & 0x3F]);
    }

    while (result.size() % 4) {
        result.push_back('=');
    }

    return result;
}

std::string StringUtils::ToValidUtf8(const std::string& bytes) {
    static const std::string replacement = "\xEF\xBF\xBD";

    std::string out;
    out.reserve(bytes.size());

    std::size_t i = 0;
    const std::size_t n = bytes.size();

    while (i < n) {
        auto c = static_cast<unsigned char>(bytes[i]);

        std::size_t length = 0;
        unsigned char lo = 0x80;
        unsigned char hi = 0xBF;

        if (c < 0x80) {
            out.push_back(static_cast<char>(c));
            ++i;
            continue;
        } else if (c >= 0xC2 && c <= 0xDF) {
            length = 2;
        } else if (c >= 0xE0 && c <= 0xEF) {
            length = 3;
            if (c == 0xE0) lo = 0xA0;   // overlong
            if (c == 0xED) hi = 0x9F;   // surrogates
        } else if (c >= 0xF0 && c <= 0xF4) {
            length = 4;
            if (c == 0xF0) lo = 0x90;
            if (c == 0xF4) hi = 0x8F;
        } else {
            out += replacement;
            ++i;
            continue;
        }

        // Maximal subpart: consume the valid prefix of the sequence, then
        // emit one replacement for it
        std::size_t j = 1;
        bool valid = true;
        while (j < length) {
            if (i + j >= n) {
                valid = false;
                break;
            }
            auto cc = static_cast<unsigned char>(bytes[i + j]);
            unsigned char min = (j == 1) ? lo : 0x80;
            unsigned char max = (j == 1) ? hi : 0xBF;
            if (cc < min || cc > max) {
                valid = false;
                break;
            }
            ++j;
        }

        if (valid) {
            out.append(bytes, i, length);
            i += length;
        } else {
            out += replacement;
            i += j;
        }
    }

    return out;
}

} // namespace utils
} // namespace flashvm
