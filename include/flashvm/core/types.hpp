/**
 * @file types.hpp
 * @brief Run configuration, file manifests and execution results
 *
 * Plain data exchanged across the public call contract. RunConfig carries
 * its own validation so that malformed limits are rejected before the engine
 * allocates a workspace or spawns any process.
 *
 * @date 2025
 */

#pragma once

#include <nlohmann/json_fwd.hpp>

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <map>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace flashvm {
namespace core {

/// Exit code reported when the deadline kills an execution (coreutils timeout convention)
constexpr int kTimeoutExitCode = 124;

/// Smallest guest memory accepted by RunConfig::Validate()
constexpr std::uint32_t kMinMemoryMb = 128;

/// Longest timeout accepted by RunConfig::Validate() (24 hours)
constexpr std::chrono::milliseconds kMaxTimeout{24LL * 60 * 60 * 1000};

/**
 * @struct PortForward
 * @brief Host port to guest port mapping (only honoured with networking on)
 */
struct PortForward {
    std::uint16_t host_port{0};
    std::uint16_t guest_port{0};

    bool operator==(const PortForward& other) const {
        return host_port == other.host_port && guest_port == other.guest_port;
    }
};

/**
 * @struct RunConfig
 * @brief Resource limits and guest environment for one execution
 *
 * **Usage Example**:
 * @code
 * RunConfig config;
 * config.memory_mb = 1024;
 * config.timeout = std::chrono::seconds(10);
 * config.env["MODE"] = "batch";
 * config.Validate();   // throws VmConfigurationError
 * @endcode
 */
struct RunConfig {
    std::optional<std::string> image;              ///< Image reference (unset = embedded default)
    std::uint32_t cpus{1};                         ///< Virtual CPUs
    std::uint32_t memory_mb{512};                  ///< Guest memory (MB)
    std::map<std::string, std::string> env;        ///< Guest environment variables
    std::string workdir{"/work"};                  ///< Guest mount point, one segment below /
    std::chrono::milliseconds timeout{std::chrono::seconds(30)};  ///< Wall-clock budget for the code
    bool network{false};                           ///< Enable guest networking
    std::vector<PortForward> ports;                ///< Port forwards (network only)
    std::vector<std::string> python_args{"-u"};    ///< Extra interpreter arguments
    std::uint64_t max_bytes_inline{1024 * 1024};   ///< Inline artifact threshold (bytes)

    /**
     * @brief Check limits and workdir shape
     * @throws VmConfigurationError describing the first violation found
     */
    void Validate() const;

    /**
     * @brief True if @p workdir is an absolute path exactly one segment below /
     *
     * "/work" and "/work/" are accepted; "/", "work", "/work/sub" and paths
     * containing "." or ".." segments are not.
     */
    static bool IsTopLevelWorkdir(const std::string& workdir);
};

/**
 * @struct FileInput
 * @brief Host file copied into the workspace input directory
 */
struct FileInput {
    std::filesystem::path host_path;  ///< Source on the host (must exist)
    std::string guest_path;           ///< Destination relative to <workdir>/in/
};

/**
 * @struct FileOutputSpec
 * @brief Glob pattern evaluated against the workspace output directory
 */
struct FileOutputSpec {
    std::string pattern;  ///< e.g. "*.csv", "reports/**/*.json" or "out/*.txt"
};

/**
 * @struct Artifact
 * @brief Output file collected after execution
 */
struct Artifact {
    std::string guest_path;                           ///< "out/<relative path>"
    std::filesystem::path host_path;                  ///< Location inside the workspace
    std::uint64_t size_bytes{0};                      ///< File size
    std::optional<std::vector<std::uint8_t>> content; ///< Present iff size <= inline threshold
};

/**
 * @struct ExecutionResult
 * @brief Outcome of one sandboxed execution
 */
struct ExecutionResult {
    std::string stdout_output;
    std::string stderr_output;
    int exit_code{0};
    bool timed_out{false};
    std::chrono::milliseconds wall_time{0};
    std::vector<Artifact> artifacts;
    std::string image_used;

    /**
     * @brief Copy stdout into stderr when a failing run reported nothing on stderr
     *
     * Some runtimes merge both guest streams into one. When exit_code != 0,
     * stderr is empty and stdout is not, stderr becomes a copy of stdout.
     */
    void BackfillStderr();
};

// JSON mapping (nlohmann ADL hooks)
void to_json(nlohmann::json& j, const PortForward& port);
void from_json(const nlohmann::json& j, PortForward& port);
void to_json(nlohmann::json& j, const RunConfig& config);
void from_json(const nlohmann::json& j, RunConfig& config);
void to_json(nlohmann::json& j, const Artifact& artifact);
void to_json(nlohmann::json& j, const ExecutionResult& result);

/**
 * @brief Convert a timeout in (fractional) seconds to milliseconds
 * @throws VmConfigurationError if @p seconds is not finite, negative or above kMaxTimeout
 */
std::chrono::milliseconds TimeoutFromSeconds(double seconds);

/**
 * @brief Parse a RunConfig from JSON text
 * @throws VmConfigurationError on malformed JSON or wrongly typed keys
 */
RunConfig ParseRunConfig(const std::string& json_text);

} // namespace core
} // namespace flashvm
