/**
 * @file image_resolver.cpp
 * @brief Filesystem-only validation of image references
 *
 * @date 2025
 */

#include "flashvm/image/image_resolver.hpp"
#include "flashvm/image/embedded_image.hpp"
#include "flashvm/utils/string_utils.hpp"
#include "flashvm/core/errors.hpp"

#include <spdlog/spdlog.h>

#include <filesystem>
#include <system_error>

namespace flashvm {
namespace image {

namespace fs = std::filesystem;

ImageResolver::ImageResolver(ImageCache& cache)
    : cache_(cache) {
}

std::string ImageResolver::Resolve(const std::optional<std::string>& reference) {
    if (!reference) {
        return cache_.EnsureDefaultImported();
    }

    spdlog::info("Validating image reference: {}", *reference);
    return ValidateReference(*reference).raw;
}

ImageReference ImageResolver::ValidateReference(const std::string& reference) {
    auto ref = ImageReference::Parse(reference);
    std::error_code ec;

    switch (ref.transport) {
        case Transport::REMOTE_REGISTRY:
            if (ref.target.empty()) {
                throw core::ImageResolutionError("Registry image name cannot be empty: " + reference);
            }
            break;

        case Transport::LOCAL_STORE:
            if (ref.target.empty()) {
                throw core::ImageResolutionError("Local store image name cannot be empty: " + reference);
            }
            break;

        case Transport::OCI_LAYOUT: {
            if (!fs::exists(ref.target, ec)) {
                throw core::ImageResolutionError("OCI path does not exist: " + ref.target);
            }
            auto missing = EmbeddedImage::MissingLayoutMembers(ref.target);
            if (!missing.empty()) {
                throw core::ImageResolutionError(
                    "Invalid OCI layout in " + ref.target + ": missing " +
                    utils::StringUtils::Join(missing, ", "));
            }
            break;
        }

        case Transport::OCI_ARCHIVE:
        case Transport::PLAIN_DIRECTORY:
            if (!fs::exists(ref.target, ec)) {
                throw core::ImageResolutionError("Could not resolve image reference: " + reference);
            }
            break;

        case Transport::BARE_NAME:
            if (ref.target.empty()) {
                throw core::ImageResolutionError("Image reference cannot be empty");
            }
            spdlog::debug("Treating '{}' as a registry name", reference);
            break;
    }

    spdlog::debug("Image reference accepted ({}): {}", TransportName(ref.transport), reference);
    return ref;
}

} // namespace image
} // namespace flashvm
