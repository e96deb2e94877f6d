/**
 * @file main.cpp
 * @brief flashvm - Command-line interface
 *
 * Exposes the SandboxEngine call contract for manual use and smoke tests:
 * ```
 * flashvm run script.py --timeout 10 --output '*.csv'
 * flashvm doctor
 * flashvm images | clear-cache | prepare <REF>
 * flashvm pip-install numpy pandas --tag data
 * ```
 * Log lines go to stderr so guest output on stdout stays machine-readable.
 *
 * @date 2025
 */

#include <CLI/CLI.hpp>
#include <spdlog/spdlog.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <nlohmann/json.hpp>

#include "flashvm/core/errors.hpp"
#include "flashvm/core/sandbox_engine.hpp"

#include <fstream>
#include <iostream>
#include <iterator>
#include <sstream>

using json = nlohmann::json;

namespace {

/*******************************************************************************
 * Argument Parsing Helpers
 ******************************************************************************/

std::string ReadSource(const std::string& path) {
    if (path == "-") {
        return std::string((std::istreambuf_iterator<char>(std::cin)),
                           std::istreambuf_iterator<char>());
    }

    std::ifstream file(path, std::ios::binary);
    if (!file) {
        throw flashvm::core::IoError("Cannot read " + path);
    }
    std::ostringstream oss;
    oss << file.rdbuf();
    return oss.str();
}

std::pair<std::string, std::string> SplitOnce(const std::string& value, char delimiter,
                                              bool from_right, const std::string& what,
                                              bool allow_empty_value = false) {
    auto pos = from_right ? value.rfind(delimiter) : value.find(delimiter);
    if (pos == std::string::npos || pos == 0 ||
        (pos + 1 == value.size() && !allow_empty_value)) {
        throw flashvm::core::VmConfigurationError("Invalid " + what + ": '" + value + "'");
    }
    return {value.substr(0, pos), value.substr(pos + 1)};
}

std::uint16_t ParsePort(const std::string& value) {
    try {
        std::size_t consumed = 0;
        unsigned long port = std::stoul(value, &consumed);
        if (consumed == value.size() && port > 0 && port <= 65535) {
            return static_cast<std::uint16_t>(port);
        }
    } catch (const std::exception&) {
    }
    throw flashvm::core::VmConfigurationError("Invalid port: '" + value + "'");
}

/*******************************************************************************
 * Output
 ******************************************************************************/

void PrintArtifacts(const flashvm::core::ExecutionResult& result) {
    for (const auto& artifact : result.artifacts) {
        spdlog::info("[ARTIFACT] {} ({} bytes{})", artifact.guest_path, artifact.size_bytes,
                     artifact.content ? "" : ", not inlined");
    }
}

} // anonymous namespace

/*******************************************************************************
 * Main Application Entry Point
 ******************************************************************************/

int main(int argc, char** argv) {
    CLI::App app{"flashvm - run Python code in disposable microVMs"};
    app.require_subcommand(1);

    bool verbose = false;
    app.add_flag("-v,--verbose", verbose, "Enable verbose logging");

    // run
    auto* run_cmd = app.add_subcommand("run", "Execute a Python script in a fresh microVM");
    std::string script_path;
    std::string config_path;
    std::string image_ref;
    std::uint32_t cpus = 0;
    std::uint32_t memory_mb = 0;
    double timeout_seconds = 0;
    std::string workdir;
    bool network = false;
    bool json_output = false;
    std::vector<std::string> env_pairs;
    std::vector<std::string> port_pairs;
    std::vector<std::string> input_pairs;
    std::vector<std::string> output_patterns;

    run_cmd->add_option("script", script_path, "Python file to run ('-' for stdin)")->required();
    run_cmd->add_option("--config", config_path, "RunConfig JSON file")->check(CLI::ExistingFile);
    auto* image_opt = run_cmd->add_option("--image", image_ref, "Image reference (default: embedded)");
    auto* cpus_opt = run_cmd->add_option("--cpus", cpus, "Virtual CPUs");
    auto* memory_opt = run_cmd->add_option("--memory", memory_mb, "Guest memory in MB");
    auto* timeout_opt = run_cmd->add_option("--timeout", timeout_seconds, "Timeout in seconds");
    auto* workdir_opt = run_cmd->add_option("--workdir", workdir, "Guest mount point (e.g. /work)");
    auto* network_opt = run_cmd->add_flag("--network", network, "Enable guest networking");
    run_cmd->add_option("--env", env_pairs, "Environment variable K=V");
    run_cmd->add_option("--port", port_pairs, "Port forward HOST:GUEST (requires --network)");
    run_cmd->add_option("--input", input_pairs, "Input file HOST_PATH:GUEST_PATH");
    run_cmd->add_option("--output", output_patterns, "Output glob under out/");
    run_cmd->add_flag("--json", json_output, "Print the full result as JSON");

    // doctor / images / clear-cache
    auto* doctor_cmd = app.add_subcommand("doctor", "Check host readiness");
    auto* images_cmd = app.add_subcommand("images", "List cached flashvm images");
    auto* clear_cmd = app.add_subcommand("clear-cache", "Remove cached images and state");

    // prepare
    auto* prepare_cmd = app.add_subcommand("prepare", "Materialize an image ahead of time");
    std::string prepare_ref;
    prepare_cmd->add_option("reference", prepare_ref, "Image reference (default: embedded)");

    // pip-install
    auto* pip_cmd = app.add_subcommand("pip-install", "Build an image with extra pip packages");
    std::vector<std::string> packages;
    std::string base_ref;
    std::string tag;
    std::string index_url;
    std::string extra_index_url;
    pip_cmd->add_option("packages", packages, "Requirement specifiers")->required();
    pip_cmd->add_option("--base", base_ref, "Base image (default: embedded)");
    pip_cmd->add_option("--tag", tag, "Target tag (default: derived from packages)");
    pip_cmd->add_option("--index-url", index_url, "pip --index-url");
    pip_cmd->add_option("--extra-index-url", extra_index_url, "pip --extra-index-url");

    CLI11_PARSE(app, argc, argv);

    // Configure logging level and format
    spdlog::set_default_logger(spdlog::stderr_color_mt("flashvm"));
    if (verbose) {
        spdlog::set_level(spdlog::level::debug);
        spdlog::debug("Verbose logging enabled");
    } else {
        spdlog::set_level(spdlog::level::info);
    }
    spdlog::set_pattern("[%H:%M:%S] [%^%l%$] %v");

    try {
        flashvm::core::SandboxEngine engine;

        if (*run_cmd) {
            flashvm::core::RunConfig config;
            if (!config_path.empty()) {
                config = flashvm::core::ParseRunConfig(ReadSource(config_path));
            }

            if (*image_opt) config.image = image_ref;
            if (*cpus_opt) config.cpus = cpus;
            if (*memory_opt) config.memory_mb = memory_mb;
            if (*timeout_opt) {
                config.timeout = flashvm::core::TimeoutFromSeconds(timeout_seconds);
            }
            if (*workdir_opt) config.workdir = workdir;
            if (*network_opt) config.network = network;

            for (const auto& pair : env_pairs) {
                auto kv = SplitOnce(pair, '=', false, "environment variable", true);
                config.env[kv.first] = kv.second;
            }
            for (const auto& pair : port_pairs) {
                auto hg = SplitOnce(pair, ':', false, "port forward");
                config.ports.push_back({ParsePort(hg.first), ParsePort(hg.second)});
            }

            std::vector<flashvm::core::FileInput> inputs;
            for (const auto& pair : input_pairs) {
                auto hg = SplitOnce(pair, ':', true, "input");
                inputs.push_back({hg.first, hg.second});
            }

            std::vector<flashvm::core::FileOutputSpec> outputs;
            for (const auto& pattern : output_patterns) {
                outputs.push_back({pattern});
            }

            auto result = engine.Execute(ReadSource(script_path), config, inputs, outputs);

            if (json_output) {
                std::cout << json(result).dump(2) << std::endl;
            } else {
                std::cout << result.stdout_output << std::flush;
                std::cerr << result.stderr_output << std::flush;
                PrintArtifacts(result);
                if (result.timed_out) {
                    spdlog::warn("[TIMEOUT] Execution exceeded {} ms", config.timeout.count());
                }
            }
            return result.exit_code;
        }

        if (*doctor_cmd) {
            auto report = engine.Doctor();
            std::cout << json(report).dump(2) << std::endl;
            return report.ready ? 0 : 1;
        }

        if (*images_cmd) {
            for (const auto& name : engine.ListCachedImages()) {
                std::cout << name << "\n";
            }
            return 0;
        }

        if (*clear_cmd) {
            return engine.ClearCache() ? 0 : 1;
        }

        if (*prepare_cmd) {
            std::optional<std::string> reference;
            if (!prepare_ref.empty()) {
                reference = prepare_ref;
            }
            engine.PrepareImage(reference);
            spdlog::info("[DONE] Image prepared");
            return 0;
        }

        if (*pip_cmd) {
            flashvm::image::PipInstallRequest request;
            request.packages = packages;
            if (!base_ref.empty()) request.base = base_ref;
            if (!tag.empty()) request.tag = tag;
            if (!index_url.empty()) request.index_url = index_url;
            if (!extra_index_url.empty()) request.extra_index_url = extra_index_url;

            std::cout << engine.PipInstallIntoImage(request) << std::endl;
            return 0;
        }

        return 1;

    } catch (const flashvm::core::FlashVmError& e) {
        spdlog::error("[{}] {}", e.KindName(), e.what());
        return 1;
    } catch (const std::filesystem::filesystem_error& e) {
        spdlog::error("[ERROR] Filesystem error: {}", e.what());
        return 1;
    } catch (const std::exception& e) {
        spdlog::error("[ERROR] Fatal error: {}", e.what());
        return 1;
    }
}
