/**
 * @file embedded_image.hpp
 * @brief Location and validation of the bundled default OCI layout
 *
 * The default Python image ships with flashvm as an OCI layout directory
 * under the data directory. An OCI layout is usable only when all three
 * members are present:
 * ```
 * <dir>/oci-layout        layout marker
 * <dir>/index.json        image index
 * <dir>/blobs/sha256/     content-addressed blobs
 * ```
 *
 * @date 2025
 */

#pragma once

#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace flashvm {
namespace image {

/// Tag of the default image inside the embedded layout
constexpr const char* kEmbeddedTag = "python-basic";

/// Repository all flashvm-built images are stored under
constexpr const char* kImageRepository = "localhost/flashvm";

/// Store name of the imported default image
constexpr const char* kCanonicalImage = "localhost/flashvm:python-basic";

/**
 * @class EmbeddedImage
 * @brief Static helpers for the bundled OCI layout
 */
class EmbeddedImage {
public:
    /**
     * @brief Names of the required OCI layout members absent from @p dir
     *
     * Empty result means the layout is complete. A missing or non-directory
     * @p dir reports all three members.
     */
    static std::vector<std::string> MissingLayoutMembers(const std::filesystem::path& dir);

    /**
     * @brief Candidate directories, in lookup order
     *
     * `$FLASHVM_DATA_DIR/oci`, the install data directory, then `./data/oci`.
     */
    static std::vector<std::filesystem::path> SearchPaths();

    /**
     * @brief First search path that holds a complete OCI layout
     */
    static std::optional<std::filesystem::path> Locate();

    /// `oci:<dir>:python-basic`
    static std::string SourceReference(const std::filesystem::path& dir);
};

} // namespace image
} // namespace flashvm
