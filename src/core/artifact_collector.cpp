/**
 * @file artifact_collector.cpp
 * @brief Collection of declared output files from the workspace out/ directory
 *
 * @date 2025
 */

#include "flashvm/core/artifact_collector.hpp"
#include "flashvm/core/errors.hpp"
#include "flashvm/utils/string_utils.hpp"

#include <spdlog/spdlog.h>

#include <fstream>
#include <iterator>
#include <set>
#include <system_error>

#include <fnmatch.h>

namespace flashvm {
namespace core {

namespace fs = std::filesystem;

namespace {

using utils::StringUtils;

std::vector<std::string> Segments(const std::string& path) {
    std::vector<std::string> segments;
    for (const auto& part : StringUtils::Split(path, '/')) {
        if (!part.empty() && part != ".") {
            segments.push_back(part);
        }
    }
    return segments;
}

bool MatchSegments(const std::vector<std::string>& pattern, std::size_t pi,
                   const std::vector<std::string>& path, std::size_t si) {
    if (pi == pattern.size()) {
        return si == path.size();
    }

    if (pattern[pi] == "**") {
        // Zero directories, or consume one and stay on "**"
        if (MatchSegments(pattern, pi + 1, path, si)) {
            return true;
        }
        return si < path.size() && MatchSegments(pattern, pi, path, si + 1);
    }

    if (si == path.size()) {
        return false;
    }
    if (::fnmatch(pattern[pi].c_str(), path[si].c_str(), 0) != 0) {
        return false;
    }
    return MatchSegments(pattern, pi + 1, path, si + 1);
}

std::string NormalizePattern(const std::string& raw) {
    std::string pattern = StringUtils::Trim(raw);

    if (pattern.empty()) {
        throw VmConfigurationError("Output pattern cannot be empty");
    }
    if (pattern.front() == '/') {
        throw VmConfigurationError("Output pattern must be relative to out/: " + raw);
    }

    auto segments = Segments(pattern);
    for (const auto& segment : segments) {
        if (segment == "..") {
            throw VmConfigurationError("Output pattern escapes out/: " + raw);
        }
    }
    if (!segments.empty() && segments.front() == "out") {
        segments.erase(segments.begin());
    }
    if (segments.empty()) {
        throw VmConfigurationError("Output pattern matches no files: " + raw);
    }
    return StringUtils::Join(segments, "/");
}

std::vector<std::uint8_t> ReadContent(const fs::path& path) {
    std::ifstream file(path, std::ios::binary);
    if (!file) {
        throw IoError("Failed to open artifact " + path.string());
    }
    std::vector<std::uint8_t> content((std::istreambuf_iterator<char>(file)),
                                      std::istreambuf_iterator<char>());
    if (file.bad()) {
        throw IoError("Failed to read artifact " + path.string());
    }
    return content;
}

} // anonymous namespace

ArtifactCollector::ArtifactCollector(fs::path output_dir, std::uint64_t max_bytes_inline)
    : output_dir_(std::move(output_dir)), max_bytes_inline_(max_bytes_inline) {
}

bool ArtifactCollector::Matches(const std::string& pattern, const std::string& relative_path) {
    return MatchSegments(Segments(pattern), 0, Segments(relative_path), 0);
}

void ArtifactCollector::ValidatePatterns(const std::vector<FileOutputSpec>& specs) {
    for (const auto& spec : specs) {
        NormalizePattern(spec.pattern);
    }
}

std::vector<Artifact> ArtifactCollector::Collect(const std::vector<FileOutputSpec>& specs) const {
    std::vector<Artifact> artifacts;
    if (specs.empty()) {
        return artifacts;
    }

    std::vector<std::string> patterns;
    for (const auto& spec : specs) {
        patterns.push_back(NormalizePattern(spec.pattern));
    }

    // Relative paths, ordered
    std::set<std::string> matched;

    std::error_code ec;
    fs::recursive_directory_iterator it(output_dir_, ec);
    if (ec) {
        throw IoError("Failed to scan " + output_dir_.string() + ": " + ec.message());
    }

    for (const fs::recursive_directory_iterator end; it != end; it.increment(ec)) {
        if (ec) {
            throw IoError("Failed to scan " + output_dir_.string() + ": " + ec.message());
        }

        auto status = it->symlink_status(ec);
        if (ec || !fs::is_regular_file(status)) {
            ec.clear();
            continue;
        }

        std::string relative = it->path().lexically_relative(output_dir_).generic_string();
        for (const auto& pattern : patterns) {
            if (Matches(pattern, relative)) {
                matched.insert(relative);
                break;
            }
        }
    }
    if (ec) {
        throw IoError("Failed to scan " + output_dir_.string() + ": " + ec.message());
    }

    for (const auto& relative : matched) {
        Artifact artifact;
        artifact.guest_path = "out/" + relative;
        artifact.host_path = output_dir_ / relative;

        artifact.size_bytes = fs::file_size(artifact.host_path, ec);
        if (ec) {
            throw IoError("Failed to stat artifact " + artifact.host_path.string() + ": " + ec.message());
        }

        if (artifact.size_bytes <= max_bytes_inline_) {
            artifact.content = ReadContent(artifact.host_path);
        }

        spdlog::debug("Artifact collected: {} ({} bytes{})", artifact.guest_path,
                      artifact.size_bytes, artifact.content ? ", inline" : "");
        artifacts.push_back(std::move(artifact));
    }

    return artifacts;
}

} // namespace core
} // namespace flashvm
