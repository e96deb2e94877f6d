/**
 * @file image_resolver.hpp
 * @brief Turns a user-supplied image reference into a concrete one
 *
 * Resolution performs only filesystem existence checks. Remote references are
 * validated, not pulled; the default image is the only case that causes
 * import work (through ImageCache).
 *
 * @date 2025
 */

#pragma once

#include "flashvm/image/image_cache.hpp"
#include "flashvm/image/image_reference.hpp"

#include <optional>
#include <string>

namespace flashvm {
namespace image {

/**
 * @class ImageResolver
 * @brief Validates references and supplies the default image
 */
class ImageResolver {
public:
    explicit ImageResolver(ImageCache& cache);

    /**
     * @brief Resolve @p reference, or the default image when unset
     * @return A reference krunvm or buildah can consume
     * @throws core::ImageResolutionError on malformed or missing references
     */
    std::string Resolve(const std::optional<std::string>& reference);

    /**
     * @brief Transport-specific validation without touching the store
     * @throws core::ImageResolutionError
     */
    static ImageReference ValidateReference(const std::string& reference);

private:
    ImageCache& cache_;
};

} // namespace image
} // namespace flashvm
