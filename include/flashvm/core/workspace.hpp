/**
 * @file workspace.hpp
 * @brief Per-execution host directory shared with the guest
 *
 * **Layout** (mounted at the configured workdir inside the guest):
 * ```
 * flashvm-XXXXXX/
 * ├── in/          staged FileInputs
 * ├── out/         guest writes artifacts here
 * ├── tmp/         scratch (also holds the launcher's start marker)
 * └── scripts/
 *     ├── main.py      submitted code
 *     ├── run.py       launcher: applies env, runs python3 <args> main.py
 *     └── launch.json  env and interpreter args read by run.py
 * ```
 * The whole tree is removed when the Workspace is destroyed, on success and
 * on every error path.
 *
 * @date 2025
 */

#pragma once

#include "flashvm/core/types.hpp"

#include <filesystem>
#include <string>
#include <vector>

namespace flashvm {
namespace core {

/**
 * @class Workspace
 * @brief Exclusively owned temporary directory tree (RAII)
 */
class Workspace {
public:
    /// Created by run.py inside tmp/ before the user code starts
    static constexpr const char* kStartedMarker = ".flashvm-started";

    /**
     * @brief Create a fresh `flashvm-XXXXXX` tree under @p parent
     * @throws IoError if the directories cannot be created
     */
    explicit Workspace(const std::filesystem::path& parent = std::filesystem::temp_directory_path());
    ~Workspace();

    Workspace(const Workspace&) = delete;
    Workspace& operator=(const Workspace&) = delete;

    const std::filesystem::path& Root() const { return root_; }
    std::filesystem::path InputDir() const { return root_ / "in"; }
    std::filesystem::path OutputDir() const { return root_ / "out"; }
    std::filesystem::path ScratchDir() const { return root_ / "tmp"; }
    std::filesystem::path ScriptsDir() const { return root_ / "scripts"; }
    std::filesystem::path StartedMarker() const { return ScratchDir() / kStartedMarker; }

    /**
     * @brief Copy each input to `in/<guest_path>`, creating parent directories
     * @throws IoError if a host file is missing or the copy fails
     * @throws VmConfigurationError if a guest path escapes `in/`
     */
    void StageInputs(const std::vector<FileInput>& inputs);

    /**
     * @brief Write @p code to scratch, then copy it to `scripts/main.py`
     * @return Host path of `scripts/main.py`
     */
    std::filesystem::path WriteEntrypoint(const std::string& code);

    /**
     * @brief Write `scripts/run.py` and `scripts/launch.json`
     * @return Host path of `scripts/run.py`
     */
    std::filesystem::path WriteLauncher(const RunConfig& config);

    /// `<workdir>/scripts/run.py`
    static std::string GuestLauncherPath(const std::string& workdir);

    /**
     * @brief True for a non-empty relative path without ".." segments
     */
    static bool IsContainedRelativePath(const std::string& path);

private:
    std::filesystem::path root_;
};

} // namespace core
} // namespace flashvm
