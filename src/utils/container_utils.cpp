/**
 * @file container_utils.cpp
 * @brief buildah/skopeo invocations for the rootless local store
 *
 * All tools run as `buildah unshare <tool> ...` so that the user namespace
 * and storage configuration match what krunvm sees when it later boots the
 * image. Arguments always travel as argv; only RunScript() goes through a
 * shell.
 *
 * @date 2025
 */

#include "flashvm/utils/container_utils.hpp"
#include "flashvm/utils/string_utils.hpp"
#include "flashvm/core/errors.hpp"

#include <spdlog/spdlog.h>

namespace flashvm {
namespace utils {

ContainerUtils::ContainerUtils(std::shared_ptr<CommandRunner> runner)
    : runner_(std::move(runner)) {
}

// ============================================================================
// TOOL AVAILABILITY
// ============================================================================

bool ContainerUtils::IsBuildahAvailable() const {
    return runner_->CommandExists("buildah");
}

bool ContainerUtils::IsSkopeoAvailable() const {
    return runner_->CommandExists("skopeo");
}

// ============================================================================
// STORE QUERIES
// ============================================================================

std::vector<std::string> ContainerUtils::ListImages() {
    auto result = ExecuteBuildahCommand({"images", "--format", "{{.Name}}:{{.Tag}}"});
    if (!result.success) {
        spdlog::error("Failed to list images: {}", result.stderr_output);
        throw core::ExecutionError("buildah images failed: " + result.stderr_output);
    }
    return StringUtils::SplitLines(result.stdout_output);
}

bool ContainerUtils::ImageExists(const std::string& name) {
    for (const auto& image : ListImages()) {
        if (image == name) {
            return true;
        }
    }
    return false;
}

// ============================================================================
// WORKING CONTAINERS
// ============================================================================

std::string ContainerUtils::FromImage(const std::string& image) {
    spdlog::info("Creating working container from {}", image);

    auto result = ExecuteBuildahCommand({"from", image});
    if (!result.success) {
        spdlog::error("buildah from {} failed: {}", image, result.stderr_output);
        throw core::ExecutionError("buildah from failed: " + result.stderr_output);
    }

    // buildah may print pull progress before the name; the name is the last line
    auto lines = StringUtils::SplitLines(result.stdout_output);
    if (lines.empty()) {
        throw core::ExecutionError("buildah from did not return a container name");
    }
    return lines.back();
}

CommandResult ContainerUtils::RunInContainer(const std::string& container,
                                             const std::vector<std::string>& command,
                                             bool as_root) {
    std::vector<std::string> args{"run"};
    if (as_root) {
        args.push_back("--user");
        args.push_back("root");
    }
    args.push_back(container);
    args.push_back("--");
    args.insert(args.end(), command.begin(), command.end());

    return ExecuteBuildahCommand(args);
}

void ContainerUtils::Commit(const std::string& container, const std::string& image_name) {
    spdlog::info("Committing {} as {}", container, image_name);

    auto result = ExecuteBuildahCommand({"commit", container, image_name});
    if (!result.success) {
        spdlog::error("buildah commit failed: {}", result.stderr_output);
        throw core::ExecutionError("buildah commit failed: " + result.stderr_output);
    }
}

bool ContainerUtils::RemoveContainer(const std::string& container) {
    try {
        auto result = ExecuteBuildahCommand({"rm", container});
        if (result.success) {
            spdlog::debug("Working container removed: {}", container);
            return true;
        }
        spdlog::warn("Failed to remove container {}: {}", container, result.stderr_output);
    } catch (const core::FlashVmError& e) {
        spdlog::warn("Failed to remove container {}: {}", container, e.what());
    }
    return false;
}

bool ContainerUtils::RemoveImage(const std::string& image) {
    try {
        auto result = ExecuteBuildahCommand({"rmi", "-f", image});
        if (result.success) {
            spdlog::info("Image removed: {}", image);
            return true;
        }
        spdlog::warn("Failed to remove image {}: {}", image, result.stderr_output);
    } catch (const core::FlashVmError& e) {
        spdlog::warn("Failed to remove image {}: {}", image, e.what());
    }
    return false;
}

// ============================================================================
// IMAGE TRANSFER
// ============================================================================

bool ContainerUtils::CopyImage(const std::string& source, const std::string& name) {
    if (!IsSkopeoAvailable()) {
        spdlog::debug("skopeo not installed, skipping fast copy");
        return false;
    }

    spdlog::info("Importing with skopeo: {} -> containers-storage:{}", source, name);

    auto result = runner_->Run(Unshare({"skopeo", "copy", "--insecure-policy",
                                        source, "containers-storage:" + name}));
    if (!result.success) {
        spdlog::warn("skopeo copy failed, falling back to buildah: {}", result.stderr_output);
        return false;
    }
    return true;
}

void ContainerUtils::ImportImage(const std::string& source, const std::string& name) {
    if (CopyImage(source, name)) {
        return;
    }

    spdlog::info("Importing via buildah from {}", source);
    ScopedContainer container(*this, FromImage(source));
    Commit(container.Name(), name);
}

// ============================================================================
// SHELL SCRIPTS
// ============================================================================

CommandResult ContainerUtils::RunScript(const std::string& script,
                                        const CommandOptions& options) {
    return runner_->Run(Unshare({"sh", "-c", script}), options);
}

// ============================================================================
// HELPERS
// ============================================================================

std::vector<std::string> ContainerUtils::Unshare(const std::vector<std::string>& argv) const {
    std::vector<std::string> wrapped{"buildah", "unshare"};
    wrapped.insert(wrapped.end(), argv.begin(), argv.end());
    return wrapped;
}

CommandResult ContainerUtils::ExecuteBuildahCommand(const std::vector<std::string>& args) {
    std::vector<std::string> argv{"buildah"};
    argv.insert(argv.end(), args.begin(), args.end());
    return runner_->Run(Unshare(argv));
}

// ============================================================================
// SCOPED CONTAINER
// ============================================================================

ScopedContainer::ScopedContainer(ContainerUtils& utils, std::string name)
    : utils_(utils), name_(std::move(name)) {
}

ScopedContainer::~ScopedContainer() {
    utils_.RemoveContainer(name_);
}

} // namespace utils
} // namespace flashvm
