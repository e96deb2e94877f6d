/**
 * @file image_reference.hpp
 * @brief Transport-tagged image references
 *
 * Recognised forms:
 * ```
 * docker://<name>                 remote registry
 * containers-storage:<name>       local store (already concrete)
 * oci:<path>[:<tag>]              OCI layout directory
 * oci-archive:<path>[:<tag>]      OCI archive (tarball)
 * dir:<path>                      plain directory image (no tag)
 * <anything else>                 bare registry-style name
 * ```
 *
 * @date 2025
 */

#pragma once

#include <string>

namespace flashvm {
namespace image {

/**
 * @enum Transport
 * @brief Where an image reference points
 */
enum class Transport {
    REMOTE_REGISTRY,    ///< docker://
    LOCAL_STORE,        ///< containers-storage:
    OCI_LAYOUT,         ///< oci:
    OCI_ARCHIVE,        ///< oci-archive:
    PLAIN_DIRECTORY,    ///< dir:
    BARE_NAME           ///< No recognised scheme
};

constexpr const char* kDockerPrefix = "docker://";
constexpr const char* kStoragePrefix = "containers-storage:";
constexpr const char* kOciPrefix = "oci:";
constexpr const char* kOciArchivePrefix = "oci-archive:";
constexpr const char* kDirPrefix = "dir:";

/// Tag assumed when a path-based reference carries none
constexpr const char* kDefaultTag = "latest";

/**
 * @struct ImageReference
 * @brief Parsed image reference
 *
 * For oci: and oci-archive: `target` is the filesystem path and `tag` the
 * optional suffix after the last colon. For dir: `target` is everything after
 * the scheme and `tag` is empty. For name transports `target` is the image
 * name without the scheme and `tag` is empty.
 */
struct ImageReference {
    Transport transport{Transport::BARE_NAME};
    std::string raw;       ///< Reference exactly as supplied
    std::string target;    ///< Name or path with the scheme removed
    std::string tag;       ///< oci: and oci-archive: only (defaults to "latest")

    /**
     * @brief Split a reference into transport, target and tag (no I/O)
     */
    static ImageReference Parse(const std::string& reference);

    /// True for oci:, oci-archive: and dir:
    bool IsPathBased() const;
};

const char* TransportName(Transport transport);

} // namespace image
} // namespace flashvm
