/**
 * @file workspace.cpp
 * @brief Per-run host workspace: layout, input staging and guest scripts
 *
 * @date 2025
 */

#include "flashvm/core/workspace.hpp"
#include "flashvm/core/errors.hpp"

#include <spdlog/spdlog.h>
#include <nlohmann/json.hpp>

#include <cerrno>
#include <cstdlib>
#include <cstring>
#include <fstream>
#include <system_error>

using json = nlohmann::json;

namespace flashvm {
namespace core {

namespace fs = std::filesystem;

namespace {

// Applies launch.json, touches the start marker, then runs main.py.
// A child killed by signal N is reported as 128+N.
constexpr const char* kLauncherScript = R"PY(#!/usr/bin/env python3
import json, os, subprocess, sys

HERE = os.path.dirname(os.path.abspath(__file__))
ROOT = os.path.dirname(HERE)

try:
    open(os.path.join(ROOT, "tmp", ".flashvm-started"), "w").close()
except OSError:
    pass

with open(os.path.join(HERE, "launch.json")) as f:
    CONFIG = json.load(f)

os.environ.update({k: str(v) for k, v in CONFIG["env"].items()})
cmd = ["/usr/bin/env", "python3"] + CONFIG["python_args"] + [os.path.join(HERE, "main.py")]
rc = subprocess.run(cmd).returncode
sys.exit(128 - rc if rc < 0 else rc)
)PY";

void WriteFile(const fs::path& path, const std::string& content) {
    std::ofstream file(path, std::ios::binary | std::ios::trunc);
    if (!file) {
        throw IoError("Failed to open " + path.string() + " for writing");
    }
    file.write(content.data(), static_cast<std::streamsize>(content.size()));
    if (!file) {
        throw IoError("Failed to write " + path.string());
    }
}

} // anonymous namespace

// ============================================================================
// LIFECYCLE
// ============================================================================

Workspace::Workspace(const fs::path& parent) {
    std::string pattern = (parent / "flashvm-XXXXXX").string();
    std::vector<char> buffer(pattern.begin(), pattern.end());
    buffer.push_back('\0');

    if (::mkdtemp(buffer.data()) == nullptr) {
        throw IoError("Failed to create workspace under " + parent.string() + ": " +
                      std::strerror(errno));
    }
    root_ = buffer.data();

    try {
        fs::create_directories(InputDir());
        fs::create_directories(OutputDir());
        fs::create_directories(ScratchDir());
        fs::create_directories(ScriptsDir());
    } catch (const fs::filesystem_error& e) {
        std::error_code ec;
        fs::remove_all(root_, ec);
        throw IoError("Failed to create workspace layout in " + root_.string() + ": " + e.what());
    }

    spdlog::debug("Workspace created: {}", root_.string());
}

Workspace::~Workspace() {
    std::error_code ec;
    fs::remove_all(root_, ec);
    if (ec) {
        spdlog::warn("Failed to remove workspace {}: {}", root_.string(), ec.message());
    } else {
        spdlog::debug("Workspace removed: {}", root_.string());
    }
}

// ============================================================================
// STAGING
// ============================================================================

void Workspace::StageInputs(const std::vector<FileInput>& inputs) {
    for (const auto& input : inputs) {
        if (!IsContainedRelativePath(input.guest_path)) {
            throw VmConfigurationError("Invalid guest path for input " +
                                       input.host_path.string() + ": '" + input.guest_path + "'");
        }

        std::error_code ec;
        if (!fs::is_regular_file(input.host_path, ec)) {
            throw IoError("Input file not found: " + input.host_path.string());
        }

        fs::path target = InputDir() / input.guest_path;
        try {
            fs::create_directories(target.parent_path());
            fs::copy_file(input.host_path, target, fs::copy_options::overwrite_existing);
        } catch (const fs::filesystem_error& e) {
            throw IoError("Failed to copy " + input.host_path.string() + " to " +
                          target.string() + ": " + e.what());
        }

        spdlog::debug("Input staged: {} -> {}", input.host_path.string(), target.string());
    }
}

fs::path Workspace::WriteEntrypoint(const std::string& code) {
    fs::path scratch = ScratchDir() / "main.py.src";
    fs::path entrypoint = ScriptsDir() / "main.py";

    WriteFile(scratch, code);

    std::error_code ec;
    fs::copy_file(scratch, entrypoint, fs::copy_options::overwrite_existing, ec);
    if (ec || !fs::exists(entrypoint)) {
        throw IoError("Script was not copied to " + entrypoint.string() +
                      (ec ? ": " + ec.message() : std::string()));
    }
    return entrypoint;
}

fs::path Workspace::WriteLauncher(const RunConfig& config) {
    json launch;
    launch["env"] = config.env;
    launch["python_args"] = config.python_args;

    WriteFile(ScriptsDir() / "launch.json", launch.dump());

    fs::path launcher = ScriptsDir() / "run.py";
    WriteFile(launcher, kLauncherScript);

    std::error_code ec;
    fs::permissions(launcher, fs::perms::owner_exec | fs::perms::group_exec | fs::perms::others_exec,
                    fs::perm_options::add, ec);
    if (ec) {
        spdlog::warn("Could not mark {} executable: {}", launcher.string(), ec.message());
    }
    return launcher;
}

// ============================================================================
// PATH HELPERS
// ============================================================================

std::string Workspace::GuestLauncherPath(const std::string& workdir) {
    std::string base = workdir;
    while (base.size() > 1 && base.back() == '/') {
        base.pop_back();
    }
    return base + "/scripts/run.py";
}

bool Workspace::IsContainedRelativePath(const std::string& path) {
    if (path.empty()) {
        return false;
    }

    fs::path p(path);
    if (p.is_absolute() || p.has_root_name() || p.has_root_directory()) {
        return false;
    }
    for (const auto& part : p) {
        if (part == "..") {
            return false;
        }
    }
    return true;
}

} // namespace core
} // namespace flashvm
