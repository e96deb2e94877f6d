/**
 * @file image_cache.hpp
 * @brief Idempotent default-image import and package-layered image builds
 *
 * The local store is shared by every flashvm process on the host. Nothing
 * here takes a lock: store membership is checked before any import, imports
 * converge on one correctly tagged image even when raced, and the sentinel is
 * replaced atomically via rename.
 *
 * **Default import**:
 * ```
 * buildah images ── canonical name present? ── yes ──> done (sentinel refreshed if absent)
 *                                          └── no ──> locate embedded layout
 *                                                     → skopeo copy | buildah from/commit/rm
 *                                                     → write sentinel
 * ```
 *
 * @date 2025
 */

#pragma once

#include "flashvm/utils/container_utils.hpp"

#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace flashvm {
namespace image {

/**
 * @struct CacheConfig
 * @brief On-disk locations used by the image cache
 */
struct CacheConfig {
    std::filesystem::path cache_dir;                    ///< Root of flashvm's host-side state
    std::optional<std::filesystem::path> embedded_dir;  ///< Override for the embedded layout lookup

    /**
     * @brief `$FLASHVM_CACHE_DIR`, else `$HOME/.cache/flashvm`, else `/tmp/flashvm-cache`
     */
    static CacheConfig FromEnvironment();

    std::filesystem::path StateDir() const { return cache_dir / "state"; }
    std::filesystem::path SentinelPath() const { return StateDir() / "embedded_import.json"; }
};

/**
 * @struct CacheSentinel
 * @brief Record written after the default image was imported
 */
struct CacheSentinel {
    std::string image_name;
    std::string source_path;
    std::string tool_version;
};

/**
 * @struct PipInstallRequest
 * @brief Parameters of PipInstallIntoImage()
 */
struct PipInstallRequest {
    std::optional<std::string> base;             ///< Base image (unset = default image)
    std::vector<std::string> packages;           ///< Requirement specifiers, at least one
    std::optional<std::string> tag;              ///< Target tag (unset = derived from packages)
    std::optional<std::string> index_url;
    std::optional<std::string> extra_index_url;
};

/**
 * @class ImageCache
 * @brief Owns the default image and images derived from it
 */
class ImageCache {
public:
    ImageCache(std::shared_ptr<utils::ContainerUtils> containers, CacheConfig config);

    /**
     * @brief Import the embedded default image unless the store already has it
     * @return Canonical store name (`localhost/flashvm:python-basic`)
     * @throws core::ImageResolutionError if the embedded layout is missing or incomplete
     * @throws core::ExecutionError if both import strategies fail
     */
    std::string EnsureDefaultImported();

    /// Store membership of the canonical name
    bool IsDefaultImported();

    /**
     * @brief Embedded layout directory (CacheConfig override or search paths)
     */
    std::optional<std::filesystem::path> EmbeddedLayout() const;

    std::optional<CacheSentinel> ReadSentinel() const;

    /**
     * @brief Layer pip packages onto a base image and commit the result
     * @return `containers-storage:localhost/flashvm:<tag>`
     * @throws core::VmConfigurationError on an empty package list
     * @throws core::ExecutionError if from/install/commit fails
     */
    std::string PipInstallIntoImage(const PipInstallRequest& request);

    /**
     * @brief `python-pip-<16 hex>` from the sorted, de-duplicated package list
     */
    static std::string DeterministicTag(const std::vector<std::string>& packages);

    /**
     * @brief Import @p source under a unique `localhost/flashvm:imported-<hex>` name
     */
    std::string ImportThrowaway(const std::string& source);

    /// Store names under `localhost/flashvm`
    std::vector<std::string> ListCachedImages();

    /**
     * @brief Remove flashvm images and the state directory
     * @return true if every removal succeeded
     */
    bool ClearCache();

    const CacheConfig& Config() const { return config_; }
    utils::ContainerUtils& Containers() { return *containers_; }

private:
    void WriteSentinel(const CacheSentinel& sentinel);

    std::shared_ptr<utils::ContainerUtils> containers_;
    CacheConfig config_;
};

} // namespace image
} // namespace flashvm
