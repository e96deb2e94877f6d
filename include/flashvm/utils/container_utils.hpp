/**
 * @file container_utils.hpp
 * @brief Local image store management through buildah and skopeo
 *
 * Wraps the image-management collaborators used to populate the local
 * containers-storage store that krunvm boots from. Every invocation runs
 * inside buildah's unprivileged user namespace (`buildah unshare ...`) so the
 * rootless store is addressed consistently by buildah, skopeo and krunvm.
 *
 * **Import strategy**:
 * ```
 * skopeo copy <source> containers-storage:<name>      (fast path, if installed)
 *    └─ on failure: buildah from <source> → buildah commit → buildah rm
 * ```
 *
 * @date 2025
 */

#pragma once

#include "flashvm/utils/command_runner.hpp"

#include <memory>
#include <string>
#include <vector>

namespace flashvm {
namespace utils {

/**
 * @class ContainerUtils
 * @brief buildah/skopeo operations on the rootless local store
 *
 * Methods that the caller depends on throw core::ExecutionError carrying the
 * tool's stderr. Removal methods are best-effort: they log and return false.
 */
class ContainerUtils {
public:
    explicit ContainerUtils(std::shared_ptr<CommandRunner> runner);

    // ========================================================================
    // Tool availability
    // ========================================================================

    bool IsBuildahAvailable() const;
    bool IsSkopeoAvailable() const;

    // ========================================================================
    // Store queries
    // ========================================================================

    /**
     * @brief List "name:tag" of every image in the local store
     * @throws core::ExecutionError if `buildah images` fails
     */
    std::vector<std::string> ListImages();

    /**
     * @brief Exact-match membership test against ListImages()
     */
    bool ImageExists(const std::string& name);

    // ========================================================================
    // Working containers
    // ========================================================================

    /**
     * @brief Instantiate a working container from @p image
     * @return Container name printed by `buildah from`
     * @throws core::ExecutionError on failure or empty output
     */
    std::string FromImage(const std::string& image);

    /**
     * @brief Run a command inside a working container
     * @param as_root Pass `--user root`
     *
     * Returns the captured result; the caller decides whether failure is fatal.
     */
    CommandResult RunInContainer(const std::string& container,
                                 const std::vector<std::string>& command,
                                 bool as_root = false);

    /**
     * @brief Commit a working container as @p image_name
     * @throws core::ExecutionError on failure
     */
    void Commit(const std::string& container, const std::string& image_name);

    bool RemoveContainer(const std::string& container);
    bool RemoveImage(const std::string& image);

    // ========================================================================
    // Image transfer
    // ========================================================================

    /**
     * @brief `skopeo copy --insecure-policy <source> containers-storage:<name>`
     * @return false if skopeo is missing or the copy failed
     */
    bool CopyImage(const std::string& source, const std::string& name);

    /**
     * @brief Import @p source into the store as @p name
     *
     * Tries CopyImage() first and falls back to from/commit/rm.
     * @throws core::ExecutionError when both strategies fail
     */
    void ImportImage(const std::string& source, const std::string& name);

    // ========================================================================
    // Shell scripts
    // ========================================================================

    /**
     * @brief `buildah unshare sh -c <script>` under the given supervision options
     */
    CommandResult RunScript(const std::string& script,
                            const CommandOptions& options = CommandOptions{});


private:
    std::vector<std::string> Unshare(const std::vector<std::string>& argv) const;
    CommandResult ExecuteBuildahCommand(const std::vector<std::string>& args);

    std::shared_ptr<CommandRunner> runner_;
};

/**
 * @class ScopedContainer
 * @brief Removes a buildah working container when it goes out of scope
 */
class ScopedContainer {
public:
    ScopedContainer(ContainerUtils& utils, std::string name);
    ~ScopedContainer();

    ScopedContainer(const ScopedContainer&) = delete;
    ScopedContainer& operator=(const ScopedContainer&) = delete;

    const std::string& Name() const { return name_; }

private:
    ContainerUtils& utils_;
    std::string name_;
};

} // namespace utils
} // namespace flashvm
