/**
 * @file artifact_collector.hpp
 * @brief Glob matching of guest output files after execution
 *
 * Patterns are evaluated relative to the workspace `out/` directory. Each
 * `/`-separated segment is matched with fnmatch(3); a `**` segment matches
 * zero or more directories. A leading `out/` in the pattern is accepted and
 * ignored, so "out/*.csv" and "*.csv" are equivalent.
 *
 * @date 2025
 */

#pragma once

#include "flashvm/core/types.hpp"

#include <cstdint>
#include <filesystem>
#include <string>
#include <vector>

namespace flashvm {
namespace core {

/**
 * @class ArtifactCollector
 * @brief Builds the artifact list of an ExecutionResult
 */
class ArtifactCollector {
public:
    ArtifactCollector(std::filesystem::path output_dir, std::uint64_t max_bytes_inline);

    /**
     * @brief Regular files matching any of @p specs, sorted and de-duplicated
     *
     * Content is read for files of at most max_bytes_inline bytes. Symbolic
     * links are never followed.
     *
     * @throws VmConfigurationError for absolute patterns or ".." segments
     * @throws IoError if the output tree or a small file cannot be read
     */
    std::vector<Artifact> Collect(const std::vector<FileOutputSpec>& specs) const;

    /**
     * @brief Match a relative file path against a pattern (both `/`-separated)
     */
    static bool Matches(const std::string& pattern, const std::string& relative_path);

    /**
     * @brief Reject malformed patterns before anything is executed
     * @throws VmConfigurationError
     */
    static void ValidatePatterns(const std::vector<FileOutputSpec>& specs);

private:
    std::filesystem::path output_dir_;
    std::uint64_t max_bytes_inline_;
};

} // namespace core
} // namespace flashvm
