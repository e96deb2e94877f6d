/**
 * @file image_cache.cpp
 * @brief Default-image import, sentinel bookkeeping and pip-layered builds
 *
 * @date 2025
 */

#include "flashvm/image/image_cache.hpp"
#include "flashvm/image/embedded_image.hpp"
#include "flashvm/image/image_resolver.hpp"
#include "flashvm/utils/hash_utils.hpp"
#include "flashvm/utils/string_utils.hpp"
#include "flashvm/core/errors.hpp"

#include <spdlog/spdlog.h>
#include <nlohmann/json.hpp>

#include <algorithm>
#include <cstdlib>
#include <fstream>
#include <set>
#include <system_error>

#ifndef FLASHVM_VERSION
#define FLASHVM_VERSION "0.0.0"
#endif

using json = nlohmann::json;

namespace flashvm {
namespace image {

namespace fs = std::filesystem;

namespace {

constexpr const char* kStorageTransport = "containers-storage:";

// Makes python3/pip usable as root; failures are tolerated
constexpr const char* kPipBootstrapScript =
    "command -v python3 >/dev/null 2>&1 || true; "
    "command -v pip3 >/dev/null 2>&1 || python3 -m ensurepip --upgrade >/dev/null 2>&1 || true; "
    "[ -x /usr/bin/python3 ] || ln -sf $(command -v python3) /usr/bin/python3 || true";

} // anonymous namespace

// ============================================================================
// CACHE CONFIG
// ============================================================================

CacheConfig CacheConfig::FromEnvironment() {
    CacheConfig config;

    const char* cache_env = std::getenv("FLASHVM_CACHE_DIR");
    const char* home = std::getenv("HOME");

    if (cache_env && *cache_env) {
        config.cache_dir = cache_env;
    } else if (home && *home) {
        config.cache_dir = fs::path(home) / ".cache" / "flashvm";
    } else {
        config.cache_dir = "/tmp/flashvm-cache";
    }
    return config;
}

// ============================================================================
// CONSTRUCTOR
// ============================================================================

ImageCache::ImageCache(std::shared_ptr<utils::ContainerUtils> containers, CacheConfig config)
    : containers_(std::move(containers)), config_(std::move(config)) {
    spdlog::debug("Image cache at {}", config_.cache_dir.string());
}

// ============================================================================
// DEFAULT IMAGE
// ============================================================================

std::string ImageCache::EnsureDefaultImported() {
    if (containers_->ImageExists(kCanonicalImage)) {
        spdlog::debug("Image already present in local store: {}", kCanonicalImage);

        std::error_code ec;
        if (!fs::exists(config_.SentinelPath(), ec)) {
            auto layout = EmbeddedLayout();
            try {
                WriteSentinel({kCanonicalImage, layout ? layout->string() : "", FLASHVM_VERSION});
            } catch (const core::IoError& e) {
                spdlog::warn("Could not refresh sentinel: {}", e.what());
            }
        }
        return kCanonicalImage;
    }

    auto layout = EmbeddedLayout();
    if (!layout) {
        std::vector<std::string> searched;
        for (const auto& path : EmbeddedImage::SearchPaths()) {
            searched.push_back(path.string());
        }
        throw core::ImageResolutionError("Embedded OCI image not found (searched: " +
                                         utils::StringUtils::Join(searched, ", ") + ")");
    }

    auto missing = EmbeddedImage::MissingLayoutMembers(*layout);
    if (!missing.empty()) {
        throw core::ImageResolutionError("Invalid OCI layout in " + layout->string() +
                                         ": missing " + utils::StringUtils::Join(missing, ", "));
    }

    spdlog::info("Importing embedded image {} into local store", kCanonicalImage);
    containers_->ImportImage(EmbeddedImage::SourceReference(*layout), kCanonicalImage);

    WriteSentinel({kCanonicalImage, layout->string(), FLASHVM_VERSION});
    spdlog::info("Embedded image imported: {}", kCanonicalImage);

    return kCanonicalImage;
}

bool ImageCache::IsDefaultImported() {
    return containers_->ImageExists(kCanonicalImage);
}

std::optional<fs::path> ImageCache::EmbeddedLayout() const {
    if (config_.embedded_dir) {
        return config_.embedded_dir;
    }
    return EmbeddedImage::Locate();
}

// ============================================================================
// SENTINEL
// ============================================================================

std::optional<CacheSentinel> ImageCache::ReadSentinel() const {
    std::ifstream file(config_.SentinelPath());
    if (!file) {
        return std::nullopt;
    }

    try {
        json j = json::parse(file);
        CacheSentinel sentinel;
        sentinel.image_name = j.value("image", "");
        sentinel.source_path = j.value("oci_path", "");
        sentinel.tool_version = j.value("version", "");
        return sentinel;
    } catch (const json::exception& e) {
        spdlog::warn("Ignoring unreadable sentinel {}: {}", config_.SentinelPath().string(), e.what());
        return std::nullopt;
    }
}

void ImageCache::WriteSentinel(const CacheSentinel& sentinel) {
    json j;
    j["image"] = sentinel.image_name;
    j["oci_path"] = sentinel.source_path;
    j["version"] = sentinel.tool_version;

    std::error_code ec;
    fs::create_directories(config_.StateDir(), ec);
    if (ec) {
        throw core::IoError("Failed to create " + config_.StateDir().string() + ": " + ec.message());
    }

    // Concurrent writers each rename their own temp file over the target
    auto target = config_.SentinelPath();
    auto temp = target;
    temp += ".tmp-" + utils::HashUtils::RandomHex(8);

    {
        std::ofstream file(temp, std::ios::trunc);
        if (!file) {
            throw core::IoError("Failed to write " + temp.string());
        }
        file << j.dump(2) << '\n';
        if (!file) {
            throw core::IoError("Failed to write " + temp.string());
        }
    }

    fs::rename(temp, target, ec);
    if (ec) {
        fs::remove(temp, ec);
        throw core::IoError("Failed to replace " + target.string());
    }
    spdlog::debug("Sentinel written: {}", target.string());
}

// ============================================================================
// PIP-LAYERED IMAGES
// ============================================================================

std::string ImageCache::DeterministicTag(const std::vector<std::string>& packages) {
    std::set<std::string> unique(packages.begin(), packages.end());
    std::vector<std::string> sorted(unique.begin(), unique.end());

    auto digest = utils::HashUtils::ComputeSHA256(utils::StringUtils::Join(sorted, "\n"));
    return "python-pip-" + digest.substr(0, 16);
}

std::string ImageCache::PipInstallIntoImage(const PipInstallRequest& request) {
    if (request.packages.empty()) {
        throw core::VmConfigurationError("packages list cannot be empty");
    }

    std::string base_ref;
    if (request.base) {
        ImageResolver::ValidateReference(*request.base);
        base_ref = *request.base;
    } else {
        base_ref = std::string(kStorageTransport) + EnsureDefaultImported();
    }

    std::string tag = request.tag ? *request.tag : DeterministicTag(request.packages);
    std::string target_name = std::string(kImageRepository) + ":" + tag;

    spdlog::info("Building {} from {} with {} package(s)",
                 target_name, base_ref, request.packages.size());

    utils::ScopedContainer container(*containers_, containers_->FromImage(base_ref));

    auto bootstrap = containers_->RunInContainer(
        container.Name(), {"sh", "-lc", kPipBootstrapScript}, true);
    if (!bootstrap.success) {
        spdlog::warn("pip bootstrap reported exit {}: {}", bootstrap.exit_code, bootstrap.stderr_output);
    }

    std::vector<std::string> pip_command{
        "env", "PIP_CONFIG_FILE=/dev/null", "PIP_ROOT_USER_ACTION=ignore",
        "python3", "-m", "pip", "install",
        "--no-cache-dir", "--no-user", "--disable-pip-version-check", "--break-system-packages"
    };
    if (request.index_url) {
        pip_command.push_back("--index-url");
        pip_command.push_back(*request.index_url);
    }
    if (request.extra_index_url) {
        pip_command.push_back("--extra-index-url");
        pip_command.push_back(*request.extra_index_url);
    }
    pip_command.insert(pip_command.end(), request.packages.begin(), request.packages.end());

    auto install = containers_->RunInContainer(container.Name(), pip_command, true);
    if (!install.success) {
        spdlog::error("pip install failed: {}", install.stderr_output);
        throw core::ExecutionError("pip install failed inside buildah run: " + install.stderr_output);
    }

    containers_->Commit(container.Name(), target_name);

    return std::string(kStorageTransport) + target_name;
}

// ============================================================================
// THROWAWAY IMPORTS
// ============================================================================

std::string ImageCache::ImportThrowaway(const std::string& source) {
    std::string name = std::string(kImageRepository) + ":imported-" + utils::HashUtils::RandomHex(8);
    containers_->ImportImage(source, name);
    return name;
}

// ============================================================================
// LISTING / CLEARING
// ============================================================================

std::vector<std::string> ImageCache::ListCachedImages() {
    std::string prefix = std::string(kImageRepository) + ":";

    std::vector<std::string> images;
    for (const auto& image : containers_->ListImages()) {
        if (utils::StringUtils::StartsWith(image, prefix)) {
            images.push_back(image);
        }
    }
    return images;
}

bool ImageCache::ClearCache() {
    bool all_removed = true;

    for (const auto& image : ListCachedImages()) {
        if (!containers_->RemoveImage(image)) {
            all_removed = false;
        }
    }

    std::error_code ec;
    fs::remove_all(config_.StateDir(), ec);
    if (ec) {
        spdlog::warn("Failed to remove {}: {}", config_.StateDir().string(), ec.message());
        all_removed = false;
    }

    spdlog::info("Cache cleared{}", all_removed ? "" : " (with errors)");
    return all_removed;
}

} // namespace image
} // namespace flashvm
