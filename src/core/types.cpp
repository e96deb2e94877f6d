/**
 * @file types.cpp
 * @brief RunConfig validation and JSON mapping of the public data model
 *
 * @date 2025
 */

#include "flashvm/core/types.hpp"
#include "flashvm/core/errors.hpp"
#include "flashvm/utils/string_utils.hpp"

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

#include <cmath>
#include <limits>

using json = nlohmann::json;

namespace flashvm {
namespace core {

// ============================================================================
// VALIDATION
// ============================================================================

bool RunConfig::IsTopLevelWorkdir(const std::string& workdir) {
    if (workdir.size() < 2 || workdir.front() != '/') {
        return false;
    }

    std::string segment = workdir.substr(1);
    if (!segment.empty() && segment.back() == '/') {
        segment.pop_back();
    }

    if (segment.empty() || segment == "." || segment == "..") {
        return false;
    }
    return segment.find('/') == std::string::npos;
}

void RunConfig::Validate() const {
    if (cpus == 0) {
        throw VmConfigurationError("cpus must be at least 1");
    }

    if (memory_mb < kMinMemoryMb) {
        throw VmConfigurationError("memory_mb must be at least " +
                                   std::to_string(kMinMemoryMb) + " (got " +
                                   std::to_string(memory_mb) + ")");
    }

    if (timeout.count() <= 0) {
        throw VmConfigurationError("timeout must be positive");
    }
    if (timeout > kMaxTimeout) {
        throw VmConfigurationError("timeout must not exceed " +
                                   std::to_string(kMaxTimeout.count() / 1000) + " seconds");
    }

    if (!IsTopLevelWorkdir(workdir)) {
        throw VmConfigurationError("workdir must be a single top-level absolute path "
                                   "such as /work (got '" + workdir + "')");
    }

    for (const auto& [key, value] : env) {
        if (key.empty() || key.find('=') != std::string::npos ||
            key.find('\0') != std::string::npos) {
            throw VmConfigurationError("invalid environment variable name: '" + key + "'");
        }
    }

    if (!network && !ports.empty()) {
        spdlog::debug("Port forwards ignored: networking is disabled");
    }
}

void ExecutionResult::BackfillStderr() {
    if (exit_code != 0 && stderr_output.empty() && !stdout_output.empty()) {
        stderr_output = stdout_output;
    }
}

std::chrono::milliseconds TimeoutFromSeconds(double seconds) {
    if (!std::isfinite(seconds) || seconds < 0.0) {
        throw VmConfigurationError("timeout must be a finite, non-negative number of seconds");
    }
    double max_seconds = static_cast<double>(kMaxTimeout.count()) / 1000.0;
    if (seconds > max_seconds) {
        throw VmConfigurationError("timeout must not exceed " +
                                   std::to_string(kMaxTimeout.count() / 1000) + " seconds");
    }
    return std::chrono::milliseconds(static_cast<std::int64_t>(seconds * 1000.0));
}

// ============================================================================
// JSON MAPPING
// ============================================================================

namespace {

// Reads a non-negative integer that fits T; nlohmann would otherwise wrap -1 to T's max
template <typename T>
T GetUnsigned(const json& value, const char* name) {
    if (value.is_number_integer() && !value.is_number_unsigned()) {
        throw VmConfigurationError(std::string(name) + " must not be negative");
    }
    if (!value.is_number_unsigned()) {
        throw VmConfigurationError(std::string(name) + " must be a non-negative integer");
    }
    auto raw = value.get<std::uint64_t>();
    if (raw > std::numeric_limits<T>::max()) {
        throw VmConfigurationError(std::string(name) + " is out of range (got " +
                                   std::to_string(raw) + ")");
    }
    return static_cast<T>(raw);
}

} // anonymous namespace

void to_json(json& j, const PortForward& port) {
    j = json::array({port.host_port, port.guest_port});
}

void from_json(const json& j, PortForward& port) {
    if (j.is_array() && j.size() == 2) {
        port.host_port = GetUnsigned<std::uint16_t>(j.at(0), "host port");
        port.guest_port = GetUnsigned<std::uint16_t>(j.at(1), "guest port");
    } else if (j.is_object()) {
        port.host_port = GetUnsigned<std::uint16_t>(j.at("host"), "host port");
        port.guest_port = GetUnsigned<std::uint16_t>(j.at("guest"), "guest port");
    } else {
        throw VmConfigurationError("port forward must be [host, guest] or {\"host\", \"guest\"}");
    }
}

void to_json(json& j, const RunConfig& config) {
    j = json{
        {"cpus", config.cpus},
        {"memory_mb", config.memory_mb},
        {"env", config.env},
        {"workdir", config.workdir},
        {"timeout_seconds", static_cast<double>(config.timeout.count()) / 1000.0},
        {"network", config.network},
        {"ports", config.ports},
        {"python_args", config.python_args},
        {"max_bytes_inline", config.max_bytes_inline}
    };
    if (config.image) {
        j["image"] = *config.image;
    } else {
        j["image"] = nullptr;
    }
}

void from_json(const json& j, RunConfig& config) {
    if (!j.is_object()) {
        throw VmConfigurationError("run configuration must be a JSON object");
    }

    if (j.contains("image") && !j["image"].is_null()) {
        config.image = j["image"].get<std::string>();
    }
    if (j.contains("cpus")) {
        config.cpus = GetUnsigned<std::uint32_t>(j["cpus"], "cpus");
    }
    if (j.contains("memory_mb")) {
        config.memory_mb = GetUnsigned<std::uint32_t>(j["memory_mb"], "memory_mb");
    }
    if (j.contains("env")) {
        config.env = j["env"].get<std::map<std::string, std::string>>();
    }
    if (j.contains("workdir")) {
        config.workdir = j["workdir"].get<std::string>();
    }
    if (j.contains("timeout_seconds")) {
        config.timeout = TimeoutFromSeconds(j["timeout_seconds"].get<double>());
    }
    if (j.contains("network")) {
        config.network = j["network"].get<bool>();
    }
    if (j.contains("ports")) {
        config.ports = j["ports"].get<std::vector<PortForward>>();
    }
    if (j.contains("python_args")) {
        config.python_args = j["python_args"].get<std::vector<std::string>>();
    }
    if (j.contains("max_bytes_inline")) {
        config.max_bytes_inline = GetUnsigned<std::uint64_t>(j["max_bytes_inline"], "max_bytes_inline");
    }
}

void to_json(json& j, const Artifact& artifact) {
    j = json{
        {"guest_path", artifact.guest_path},
        {"host_path", artifact.host_path.string()},
        {"size_bytes", artifact.size_bytes}
    };
    if (artifact.content) {
        j["content_base64"] = utils::StringUtils::ToBase64(*artifact.content);
    } else {
        j["content_base64"] = nullptr;
    }
}

void to_json(json& j, const ExecutionResult& result) {
    j = json{
        {"stdout", result.stdout_output},
        {"stderr", result.stderr_output},
        {"exit_code", result.exit_code},
        {"timed_out", result.timed_out},
        {"execution_time_ms", result.wall_time.count()},
        {"artifacts", result.artifacts},
        {"image_used", result.image_used}
    };
}

RunConfig ParseRunConfig(const std::string& json_text) {
    try {
        return json::parse(json_text).get<RunConfig>();
    }
    catch (const json::exception& e) {
        throw VmConfigurationError(std::string("invalid run configuration: ") + e.what());
    }
}

} // namespace core
} // namespace flashvm
