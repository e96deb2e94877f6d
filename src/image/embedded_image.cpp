/**
 * @file embedded_image.cpp
 * @brief Lookup and layout checks of the embedded OCI image
 *
 * @date 2025
 */

#include "flashvm/image/embedded_image.hpp"

#include <spdlog/spdlog.h>

#include <cstdlib>
#include <system_error>

#ifndef FLASHVM_DATA_DIR
#define FLASHVM_DATA_DIR ""
#endif

namespace flashvm {
namespace image {

namespace fs = std::filesystem;

std::vector<std::string> EmbeddedImage::MissingLayoutMembers(const fs::path& dir) {
    std::error_code ec;
    std::vector<std::string> missing;

    if (!fs::is_regular_file(dir / "oci-layout", ec)) {
        missing.push_back("oci-layout");
    }
    if (!fs::is_regular_file(dir / "index.json", ec)) {
        missing.push_back("index.json");
    }
    if (!fs::is_directory(dir / "blobs" / "sha256", ec)) {
        missing.push_back("blobs/sha256");
    }
    return missing;
}

std::vector<fs::path> EmbeddedImage::SearchPaths() {
    std::vector<fs::path> paths;

    const char* env_dir = std::getenv("FLASHVM_DATA_DIR");
    if (env_dir && *env_dir) {
        paths.push_back(fs::path(env_dir) / "oci");
    }

    std::string install_dir = FLASHVM_DATA_DIR;
    if (!install_dir.empty()) {
        paths.push_back(fs::path(install_dir) / "oci");
    }

    paths.push_back(fs::path("data") / "oci");
    return paths;
}

std::optional<fs::path> EmbeddedImage::Locate() {
    for (const auto& candidate : SearchPaths()) {
        if (MissingLayoutMembers(candidate).empty()) {
            spdlog::debug("Embedded image layout found at {}", candidate.string());
            return candidate;
        }
        spdlog::debug("No complete OCI layout at {}", candidate.string());
    }
    return std::nullopt;
}

std::string EmbeddedImage::SourceReference(const fs::path& dir) {
    return "oci:" + dir.string() + ":" + kEmbeddedTag;
}

} // namespace image
} // namespace flashvm
