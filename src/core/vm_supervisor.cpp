/**
 * @file vm_supervisor.cpp
 * @brief krunvm control script generation and supervised execution
 *
 * @date 2025
 */

#include "flashvm/core/vm_supervisor.hpp"
#include "flashvm/core/errors.hpp"
#include "flashvm/image/image_reference.hpp"
#include "flashvm/utils/hash_utils.hpp"
#include "flashvm/utils/shell_utils.hpp"
#include "flashvm/utils/string_utils.hpp"

#include <spdlog/spdlog.h>

#include <iomanip>
#include <sstream>
#include <system_error>

namespace flashvm {
namespace core {

namespace fs = std::filesystem;

using utils::ShellQuote;

namespace {

constexpr std::uint32_t kPrepareCpus = 1;
constexpr std::uint32_t kPrepareMemoryMb = 256;

std::string FormatSeconds(std::chrono::milliseconds duration) {
    std::ostringstream oss;
    oss << std::fixed << std::setprecision(3) << static_cast<double>(duration.count()) / 1000.0;
    return oss.str();
}

void Transition(VmRunOutcome& outcome, VmState state) {
    outcome.history.push_back(state);
    spdlog::debug("VM {} -> {}", outcome.vm_name, VmStateName(state));
}

} // anonymous namespace

const char* VmStateName(VmState state) {
    switch (state) {
        case VmState::CREATED: return "created";
        case VmState::STARTING: return "starting";
        case VmState::RUNNING: return "running";
        case VmState::COMPLETED: return "completed";
        case VmState::TIMED_OUT: return "timed_out";
        case VmState::FAILED: return "failed";
        case VmState::DELETED: return "deleted";
    }
    return "unknown";
}

KrunvmSupervisor::KrunvmSupervisor(image::ImageCache& cache, SupervisorOptions options)
    : cache_(cache), options_(options) {
}

// ============================================================================
// IMAGE NORMALIZATION
// ============================================================================

std::string KrunvmSupervisor::NormalizeImage(const std::string& image, bool& throwaway) {
    throwaway = false;
    auto ref = image::ImageReference::Parse(image);

    switch (ref.transport) {
        case image::Transport::LOCAL_STORE:
        case image::Transport::REMOTE_REGISTRY:
            return ref.target;

        case image::Transport::OCI_LAYOUT:
        case image::Transport::OCI_ARCHIVE:
        case image::Transport::PLAIN_DIRECTORY: {
            auto name = cache_.ImportThrowaway(image);
            spdlog::info("Imported {} as {}", image, name);
            throwaway = true;
            return name;
        }

        case image::Transport::BARE_NAME:
            break;
    }
    return image;
}

// ============================================================================
// CONTROL SCRIPT
// ============================================================================

std::string KrunvmSupervisor::DeleteCommand(const std::string& vm_name) {
    auto name = ShellQuote(vm_name);
    return "krunvm delete -f " + name + " >/dev/null 2>&1 || krunvm delete " + name +
           " >/dev/null 2>&1 || true";
}

std::string KrunvmSupervisor::NewInstanceName() {
    return "flashvm-" + utils::HashUtils::RandomHex(8);
}

std::string KrunvmSupervisor::BuildControlScript(const std::string& vm_name,
                                                 const std::string& image,
                                                 const RunConfig& config,
                                                 const Workspace& workspace) const {
    auto name = ShellQuote(vm_name);
    auto workdir = ShellQuote(config.workdir);
    auto marker = ShellQuote(workspace.StartedMarker().string());

    std::ostringstream create;
    create << "krunvm create --cpus " << config.cpus
           << " --mem " << config.memory_mb
           << " --workdir " << workdir
           << " --name " << name
           << " --volume " << ShellQuote(workspace.Root().string() + ":" + config.workdir);
    if (config.network) {
        for (const auto& port : config.ports) {
            create << " --port " << port.host_port << ":" << port.guest_port;
        }
    }
    create << " " << ShellQuote(image) << " >/dev/null";

    std::string start = "krunvm start " + name + " /usr/bin/env python3 " +
                        ShellQuote(Workspace::GuestLauncherPath(config.workdir));

    std::ostringstream script;
    script << "set -e\n"
           << create.str() << "\n"
           << "set +e\n"
           << "tries=0\n"
           << "ec=1\n"
           << "while [ $tries -lt " << options_.start_attempts << " ]; do\n"
           << "  " << start << "\n"
           << "  ec=$?\n"
           << "  [ $ec -eq 0 ] && break\n"
           << "  [ -e " << marker << " ] && break\n"
           << "  tries=$((tries+1))\n"
           << "  [ $tries -lt " << options_.start_attempts << " ] && sleep "
           << FormatSeconds(options_.start_backoff) << "\n"
           << "done\n"
           << DeleteCommand(vm_name) << "\n"
           << "exit $ec\n";
    return script.str();
}

// ============================================================================
// EXECUTION
// ============================================================================

VmRunOutcome KrunvmSupervisor::Run(const std::string& image, const RunConfig& config,
                                   const Workspace& workspace) {
    bool throwaway = false;
    std::string runtime_image = NormalizeImage(image, throwaway);

    VmRunOutcome outcome;
    outcome.vm_name = NewInstanceName();
    outcome.image = runtime_image;
    Transition(outcome, VmState::CREATED);

    if (!config.network && !config.ports.empty()) {
        spdlog::debug("Networking disabled, ignoring {} port forward(s)", config.ports.size());
    }

    auto script = BuildControlScript(outcome.vm_name, runtime_image, config, workspace);

    utils::CommandOptions options;
    options.deadline = config.timeout + options_.teardown_grace;
    options.poll_interval = options_.poll_interval;
    options.drain_grace = options_.teardown_grace;

    spdlog::info("Starting VM {} (image {}, {} vCPU, {} MB, timeout {} ms)",
                 outcome.vm_name, runtime_image, config.cpus, config.memory_mb,
                 config.timeout.count());
    Transition(outcome, VmState::STARTING);

    utils::CommandResult result;
    try {
        result = cache_.Containers().RunScript(script, options);
    } catch (const FlashVmError&) {
        if (throwaway) {
            cache_.Containers().RemoveImage(runtime_image);
        }
        throw;
    }

    outcome.stdout_output = std::move(result.stdout_output);
    outcome.stderr_output = std::move(result.stderr_output);
    outcome.exit_code = result.exit_code;
    outcome.timed_out = result.timed_out;
    outcome.duration = result.duration;

    std::error_code ec;
    bool reached_guest = fs::exists(workspace.StartedMarker(), ec);
    if (reached_guest) {
        Transition(outcome, VmState::RUNNING);
    }

    if (result.timed_out) {
        spdlog::warn("VM {} exceeded its deadline and was killed", outcome.vm_name);
        Transition(outcome, VmState::TIMED_OUT);
    } else if (result.success || reached_guest) {
        Transition(outcome, VmState::COMPLETED);
    } else {
        spdlog::error("VM {} failed before reaching user code (exit {}): {}",
                      outcome.vm_name, result.exit_code, outcome.stderr_output);
        Transition(outcome, VmState::FAILED);
    }

    if (result.timed_out || !result.success) {
        ForceDelete(outcome.vm_name);
    }
    Transition(outcome, VmState::DELETED);

    if (throwaway) {
        cache_.Containers().RemoveImage(runtime_image);
    }

    spdlog::info("VM {} finished: exit={} state={} duration={}ms", outcome.vm_name,
                 outcome.exit_code, VmStateName(outcome.history[outcome.history.size() - 2]),
                 outcome.duration.count());
    return outcome;
}

std::string KrunvmSupervisor::Prepare(const std::string& image) {
    bool throwaway = false;
    std::string runtime_image = NormalizeImage(image, throwaway);
    std::string vm_name = NewInstanceName();

    std::ostringstream script;
    script << "set -e\n"
           << "krunvm create --cpus " << kPrepareCpus << " --mem " << kPrepareMemoryMb
           << " --workdir /work --name " << ShellQuote(vm_name) << " "
           << ShellQuote(runtime_image) << " >/dev/null\n"
           << DeleteCommand(vm_name) << "\n";

    spdlog::info("Pre-pulling image {}", runtime_image);

    auto result = cache_.Containers().RunScript(script.str());
    if (!result.success) {
        ForceDelete(vm_name);
        spdlog::error("Failed to prepare image {}: {}", runtime_image, result.stderr_output);
        throw VmConfigurationError("Failed to prepare image " + runtime_image + ": " +
                                   result.stderr_output);
    }

    spdlog::info("Image ready: {}{}", runtime_image, throwaway ? " (imported)" : "");
    return runtime_image;
}

void KrunvmSupervisor::ForceDelete(const std::string& vm_name) {
    try {
        auto result = cache_.Containers().RunScript(DeleteCommand(vm_name));
        if (!result.success) {
            spdlog::warn("Cleanup of VM {} exited with {}", vm_name, result.exit_code);
        }
    } catch (const FlashVmError& e) {
        spdlog::warn("Cleanup of VM {} failed: {}", vm_name, e.what());
    }
}

} // namespace core
} // namespace flashvm
