/**
 * @file vm_supervisor.hpp
 * @brief MicroVM lifecycle: create, start with retries, delete, under a deadline
 *
 * **Instance state machine** (one per execution):
 * ```
 * CREATED → STARTING ─(retry ≤ N)→ RUNNING → COMPLETED | TIMED_OUT | FAILED → DELETED
 * ```
 *
 * KrunvmSupervisor drives the krunvm CLI through a single shell control
 * script executed inside `buildah unshare`:
 * ```
 * set -e
 * krunvm create --cpus C --mem M --workdir W --name N --volume WS:W [--port H:G]... IMAGE
 * set +e
 * retry: krunvm start N /usr/bin/env python3 W/scripts/run.py
 * krunvm delete -f N || krunvm delete N || true
 * exit $ec
 * ```
 * A start is retried only while the guest launcher has not yet dropped its
 * start marker into the workspace, so failing user code never runs twice.
 *
 * The script runs with a hard deadline of timeout + teardown grace. On
 * timeout or failure an extra forced delete is issued in case the kill
 * landed before the in-script cleanup.
 *
 * @date 2025
 */

#pragma once

#include "flashvm/core/types.hpp"
#include "flashvm/core/workspace.hpp"
#include "flashvm/image/image_cache.hpp"

#include <chrono>
#include <string>
#include <vector>

namespace flashvm {
namespace core {

/**
 * @enum VmState
 * @brief Lifecycle states of one microVM instance
 */
enum class VmState {
    CREATED,     ///< Control script built, instance name assigned
    STARTING,    ///< create/start in progress
    RUNNING,     ///< Guest launcher reached user code
    COMPLETED,   ///< Guest exited on its own (any exit code)
    TIMED_OUT,   ///< Killed at the deadline
    FAILED,      ///< Instance never reached user code
    DELETED      ///< Cleanup issued
};

const char* VmStateName(VmState state);

/**
 * @struct SupervisorOptions
 * @brief Tunable supervision constants
 */
struct SupervisorOptions {
    int start_attempts{3};                                            ///< krunvm start tries
    std::chrono::milliseconds start_backoff{150};                     ///< Pause between tries
    std::chrono::milliseconds poll_interval{25};                      ///< Exit polling period
    std::chrono::milliseconds teardown_grace{std::chrono::seconds(2)};  ///< Added to the run timeout
};

/**
 * @struct VmRunOutcome
 * @brief Raw result of one supervised instance
 */
struct VmRunOutcome {
    std::string stdout_output;
    std::string stderr_output;
    int exit_code{-1};
    bool timed_out{false};
    std::chrono::milliseconds duration{0};
    std::string vm_name;
    std::string image;                 ///< Name handed to the VM runtime
    std::vector<VmState> history;      ///< States passed through, in order

    VmState FinalState() const { return history.empty() ? VmState::CREATED : history.back(); }
};

/**
 * @class VmSupervisor
 * @brief Backend-neutral contract: image + resources in, outcome out
 */
class VmSupervisor {
public:
    virtual ~VmSupervisor() = default;

    /**
     * @brief Boot @p image with @p workspace mounted at config.workdir and run the launcher
     *
     * Timeouts are reported through the outcome, never thrown.
     * @throws ExecutionError if the control script cannot be started
     */
    virtual VmRunOutcome Run(const std::string& image, const RunConfig& config,
                             const Workspace& workspace) = 0;

    /**
     * @brief Materialize @p image in the runtime ahead of the first run
     * @return Name the runtime knows the image by
     * @throws VmConfigurationError if the runtime rejects the image
     */
    virtual std::string Prepare(const std::string& image) = 0;
};

/**
 * @class KrunvmSupervisor
 * @brief VmSupervisor backed by the krunvm CLI
 */
class KrunvmSupervisor : public VmSupervisor {
public:
    KrunvmSupervisor(image::ImageCache& cache, SupervisorOptions options = SupervisorOptions{});

    VmRunOutcome Run(const std::string& image, const RunConfig& config,
                     const Workspace& workspace) override;

    std::string Prepare(const std::string& image) override;

    /**
     * @brief Strip transport prefixes krunvm does not understand
     *
     * `containers-storage:` and `docker://` are removed; path transports are
     * imported under a throwaway `localhost/flashvm:imported-<hex>` name and
     * @p throwaway is set.
     */
    std::string NormalizeImage(const std::string& image, bool& throwaway);

    /**
     * @brief Full create/start/delete script for one execution
     */
    std::string BuildControlScript(const std::string& vm_name, const std::string& image,
                                   const RunConfig& config, const Workspace& workspace) const;

    /// Forced delete falling back to plain delete, errors swallowed
    static std::string DeleteCommand(const std::string& vm_name);

    static std::string NewInstanceName();

    const SupervisorOptions& Options() const { return options_; }

private:
    void ForceDelete(const std::string& vm_name);

    image::ImageCache& cache_;
    SupervisorOptions options_;
};

} // namespace core
} // namespace flashvm
