/**
 * @file sandbox_engine.hpp
 * @brief Public entry point: run Python code inside a disposable microVM
 *
 * SandboxEngine wires the image layer (resolver, cache/builder) to the
 * execution layer (workspace, supervisor, artifact collector) and exposes the
 * complete call contract of flashvm.
 *
 * **Execution Workflow**:
 * ```
 * 1. Validate RunConfig and output patterns   (VmConfigurationError)
 * 2. Check krunvm, buildah and /dev/kvm       (MissingDependencyError)
 * 3. Resolve image (default → import once)    (ImageResolutionError)
 * 4. Create workspace, stage inputs, write main.py and launcher
 * 5. Supervise the VM under timeout + grace
 * 6. Collect artifacts from out/, back-fill stderr
 * 7. Workspace removed on scope exit
 * ```
 * Steps 1 and 2 allocate nothing, so configuration and dependency errors
 * leave no trace on the host.
 *
 * **Usage Example**:
 * @code
 * flashvm::core::SandboxEngine engine;
 *
 * flashvm::core::RunConfig config;
 * config.timeout = std::chrono::seconds(5);
 *
 * auto result = engine.Execute("print('hi')", config);
 * std::cout << result.stdout_output;   // "hi\n"
 * @endcode
 *
 * @date 2025
 */

#pragma once

#include "flashvm/core/types.hpp"
#include "flashvm/core/vm_supervisor.hpp"
#include "flashvm/image/image_cache.hpp"
#include "flashvm/image/image_resolver.hpp"
#include "flashvm/utils/command_runner.hpp"
#include "flashvm/utils/container_utils.hpp"

#include <nlohmann/json_fwd.hpp>

#include <filesystem>
#include <future>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace flashvm {
namespace core {

/**
 * @struct EngineConfig
 * @brief Host-side settings of a SandboxEngine
 */
struct EngineConfig {
    image::CacheConfig cache{image::CacheConfig::FromEnvironment()};  ///< Cache and sentinel locations
    SupervisorOptions supervisor;                                     ///< Retry/poll/grace constants
    std::filesystem::path kvm_device{"/dev/kvm"};                     ///< Hardware virtualization node
    std::optional<std::filesystem::path> workspace_parent;            ///< Unset = system temp dir
};

/**
 * @struct DoctorReport
 * @brief Host readiness summary
 */
struct DoctorReport {
    bool krunvm{false};
    bool buildah{false};
    bool skopeo{false};
    bool kvm{false};
    bool embedded_image{false};     ///< Complete OCI layout found
    std::string embedded_path;      ///< Where it was found (empty if not)
    bool offline_mode{false};       ///< Default image usable without a registry
    bool ready{false};              ///< krunvm && buildah && kvm
};

void to_json(nlohmann::json& j, const DoctorReport& report);

/**
 * @class SandboxEngine
 * @brief Sandboxed Python execution in krunvm microVMs
 *
 * Independent Execute() calls may run concurrently from different threads;
 * they share only the local image store, whose updates are idempotent.
 */
class SandboxEngine {
public:
    explicit SandboxEngine(EngineConfig config = EngineConfig{},
                           std::shared_ptr<utils::CommandRunner> runner =
                               std::make_shared<utils::ProcessRunner>());
    ~SandboxEngine();

    SandboxEngine(const SandboxEngine&) = delete;
    SandboxEngine& operator=(const SandboxEngine&) = delete;

    // ========================================================================
    // Execution
    // ========================================================================

    /**
     * @brief Run @p code as scripts/main.py inside a fresh microVM
     * @param inputs Files copied to `<workdir>/in/`
     * @param outputs Glob patterns collected from `<workdir>/out/`
     *
     * A timeout is not an error: the result has exit_code 124 and timed_out set.
     * @throws VmConfigurationError, MissingDependencyError, ImageResolutionError,
     *         ExecutionError, IoError
     */
    ExecutionResult Execute(const std::string& code,
                            const RunConfig& config = RunConfig{},
                            const std::vector<FileInput>& inputs = {},
                            const std::vector<FileOutputSpec>& outputs = {});

    /**
     * @brief Execute() on a background thread
     */
    std::future<ExecutionResult> ExecuteAsync(std::string code,
                                              RunConfig config = RunConfig{},
                                              std::vector<FileInput> inputs = {},
                                              std::vector<FileOutputSpec> outputs = {});

    // ========================================================================
    // Images
    // ========================================================================

    /**
     * @brief Materialize an image ahead of the first execution
     *
     * Without a reference, imports the embedded default image.
     * @throws VmConfigurationError if the VM runtime rejects the image
     */
    bool PrepareImage(const std::optional<std::string>& reference = std::nullopt);

    /**
     * @brief Derive an image with extra pip packages
     * @return `containers-storage:localhost/flashvm:<tag>`
     */
    std::string PipInstallIntoImage(const image::PipInstallRequest& request);

    std::vector<std::string> ListCachedImages();
    bool ClearCache();

    bool EmbeddedIsImported();
    void ImportEmbeddedNow();

    // ========================================================================
    // Host checks
    // ========================================================================

    /**
     * @brief Tool and hardware availability; never throws
     */
    DoctorReport Doctor();

    /**
     * @throws MissingDependencyError naming every missing requirement
     */
    void CheckDependencies() const;

    const EngineConfig& GetConfig() const { return config_; }

private:
    EngineConfig config_;
    std::shared_ptr<utils::CommandRunner> runner_;
    std::shared_ptr<utils::ContainerUtils> containers_;
    std::unique_ptr<image::ImageCache> cache_;
    std::unique_ptr<image::ImageResolver> resolver_;
    std::unique_ptr<VmSupervisor> supervisor_;
};

} // namespace core
} // namespace flashvm
