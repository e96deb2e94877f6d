/**
 * @file sandbox_engine.cpp
 * @brief Orchestration of image resolution, workspace and microVM supervision
 *
 * **Failure ordering**:
 * - Configuration and dependency errors are raised before any workspace,
 *   image import or child process exists.
 * - Once the workspace exists, every error path unwinds through its
 *   destructor, so no temporary tree outlives the call.
 * - A deadline kill is a result, not an exception.
 *
 * @date 2025
 */

#include "flashvm/core/sandbox_engine.hpp"
#include "flashvm/core/artifact_collector.hpp"
#include "flashvm/core/errors.hpp"
#include "flashvm/core/workspace.hpp"
#include "flashvm/image/embedded_image.hpp"
#include "flashvm/utils/string_utils.hpp"

#include <spdlog/spdlog.h>
#include <nlohmann/json.hpp>

#include <system_error>

namespace flashvm {
namespace core {

namespace fs = std::filesystem;

void to_json(nlohmann::json& j, const DoctorReport& report) {
    j = nlohmann::json{
        {"krunvm", report.krunvm},
        {"buildah", report.buildah},
        {"skopeo", report.skopeo},
        {"kvm", report.kvm},
        {"embedded_image", report.embedded_image},
        {"embedded_path", report.embedded_path},
        {"offline_mode", report.offline_mode},
        {"ready", report.ready}
    };
}

// Constructor
SandboxEngine::SandboxEngine(EngineConfig config, std::shared_ptr<utils::CommandRunner> runner)
    : config_(std::move(config))
    , runner_(std::move(runner)) {

    containers_ = std::make_shared<utils::ContainerUtils>(runner_);
    cache_ = std::make_unique<image::ImageCache>(containers_, config_.cache);
    resolver_ = std::make_unique<image::ImageResolver>(*cache_);
    supervisor_ = std::make_unique<KrunvmSupervisor>(*cache_, config_.supervisor);

    spdlog::debug("Sandbox engine initialized (cache {}, kvm {})",
                  config_.cache.cache_dir.string(), config_.kvm_device.string());
}

SandboxEngine::~SandboxEngine() = default;

// ============================================================================
// EXECUTION
// ============================================================================

ExecutionResult SandboxEngine::Execute(const std::string& code,
                                       const RunConfig& config,
                                       const std::vector<FileInput>& inputs,
                                       const std::vector<FileOutputSpec>& outputs) {
    auto start = std::chrono::steady_clock::now();

    config.Validate();
    ArtifactCollector::ValidatePatterns(outputs);
    CheckDependencies();

    auto image = resolver_->Resolve(config.image);

    Workspace workspace(config_.workspace_parent ? *config_.workspace_parent
                                                 : fs::temp_directory_path());
    workspace.StageInputs(inputs);
    workspace.WriteEntrypoint(code);
    workspace.WriteLauncher(config);

    auto outcome = supervisor_->Run(image, config, workspace);

    ExecutionResult result;
    result.stdout_output = std::move(outcome.stdout_output);
    result.stderr_output = std::move(outcome.stderr_output);
    result.exit_code = outcome.exit_code;
    result.timed_out = outcome.timed_out;
    result.image_used = image;

    ArtifactCollector collector(workspace.OutputDir(), config.max_bytes_inline);
    result.artifacts = collector.Collect(outputs);

    result.BackfillStderr();
    result.wall_time = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - start);

    spdlog::info("Execution finished: exit={} timed_out={} artifacts={} wall={}ms",
                 result.exit_code, result.timed_out, result.artifacts.size(),
                 result.wall_time.count());
    return result;
}

std::future<ExecutionResult> SandboxEngine::ExecuteAsync(std::string code,
                                                         RunConfig config,
                                                         std::vector<FileInput> inputs,
                                                         std::vector<FileOutputSpec> outputs) {
    return std::async(std::launch::async,
                      [this, code = std::move(code), config = std::move(config),
                       inputs = std::move(inputs), outputs = std::move(outputs)]() {
                          return Execute(code, config, inputs, outputs);
                      });
}

// ============================================================================
// IMAGES
// ============================================================================

bool SandboxEngine::PrepareImage(const std::optional<std::string>& reference) {
    if (!reference) {
        cache_->EnsureDefaultImported();
        return true;
    }

    CheckDependencies();
    auto image = resolver_->Resolve(reference);
    supervisor_->Prepare(image);
    return true;
}

std::string SandboxEngine::PipInstallIntoImage(const image::PipInstallRequest& request) {
    return cache_->PipInstallIntoImage(request);
}

std::vector<std::string> SandboxEngine::ListCachedImages() {
    return cache_->ListCachedImages();
}

bool SandboxEngine::ClearCache() {
    return cache_->ClearCache();
}

bool SandboxEngine::EmbeddedIsImported() {
    return cache_->IsDefaultImported();
}

void SandboxEngine::ImportEmbeddedNow() {
    cache_->EnsureDefaultImported();
}

// ============================================================================
// HOST CHECKS
// ============================================================================

DoctorReport SandboxEngine::Doctor() {
    DoctorReport report;
    std::error_code ec;

    report.krunvm = runner_->CommandExists("krunvm");
    report.buildah = containers_->IsBuildahAvailable();
    report.skopeo = containers_->IsSkopeoAvailable();
    report.kvm = fs::exists(config_.kvm_device, ec);

    auto layout = cache_->EmbeddedLayout();
    if (layout && image::EmbeddedImage::MissingLayoutMembers(*layout).empty()) {
        report.embedded_image = true;
        report.embedded_path = layout->string();
    }
    report.offline_mode = report.embedded_image;
    report.ready = report.krunvm && report.buildah && report.kvm;

    return report;
}

void SandboxEngine::CheckDependencies() const {
    std::vector<std::string> missing;
    std::error_code ec;

    if (!runner_->CommandExists("krunvm")) {
        missing.push_back("krunvm not found on PATH");
    }
    if (!containers_->IsBuildahAvailable()) {
        missing.push_back("buildah not found on PATH (required for rootless image storage)");
    }
    if (!fs::exists(config_.kvm_device, ec)) {
        missing.push_back(config_.kvm_device.string() + " not available (hardware virtualization)");
    }

    if (!missing.empty()) {
        auto message = utils::StringUtils::Join(missing, "; ");
        spdlog::error("Missing dependencies: {}", message);
        throw MissingDependencyError(message);
    }
}

} // namespace core
} // namespace flashvm
