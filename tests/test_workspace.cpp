#include "test_support.hpp"

#include "flashvm/core/errors.hpp"
#include "flashvm/core/workspace.hpp"

#include <nlohmann/json.hpp>

#include <filesystem>
#include <fstream>
#include <memory>
#include <sstream>

using flashvm::core::FileInput;
using flashvm::core::RunConfig;
using flashvm::core::Workspace;
using flashvm::testing::TempDir;

namespace fs = std::filesystem;

namespace {

std::string ReadAll(const fs::path& path) {
    std::ifstream file(path, std::ios::binary);
    std::stringstream buffer;
    buffer << file.rdbuf();
    return buffer.str();
}

} // anonymous namespace

// ── lifecycle ───────────────────────────────────────────────

TEST(Workspace, CreatesLayoutAndRemovesItOnDestruction) {
    TempDir parent;
    fs::path root;
    {
        Workspace workspace(parent.Path());
        root = workspace.Root();

        EXPECT_EQ(root.parent_path(), parent.Path());
        EXPECT_EQ(root.filename().string().rfind("flashvm-", 0), 0u);
        EXPECT_TRUE(fs::is_directory(workspace.InputDir()));
        EXPECT_TRUE(fs::is_directory(workspace.OutputDir()));
        EXPECT_TRUE(fs::is_directory(workspace.ScratchDir()));
        EXPECT_TRUE(fs::is_directory(workspace.ScriptsDir()));
        EXPECT_EQ(workspace.StartedMarker(), root / "tmp" / ".flashvm-started");

        std::ofstream(workspace.OutputDir() / "left-behind.txt") << "x";
    }
    EXPECT_FALSE(fs::exists(root));
    EXPECT_TRUE(parent.IsEmpty());
}

TEST(Workspace, RemovedWhenAnExceptionUnwinds) {
    TempDir parent;
    try {
        Workspace workspace(parent.Path());
        workspace.StageInputs({{parent.Path() / "missing.csv", "data.csv"}});
        FAIL() << "expected IoError";
    } catch (const flashvm::core::IoError&) {
    }
    EXPECT_TRUE(parent.IsEmpty());
}

TEST(Workspace, UnwritableParentIsAnIoError) {
    EXPECT_THROW(Workspace("/nonexistent/flashvm-parent"), flashvm::core::IoError);
}

// ── inputs ──────────────────────────────────────────────────

TEST(Workspace, StagesInputsIntoNestedDirectories) {
    TempDir temp;
    auto csv = temp.Write("host/data.csv", "a,b\n1,2\n");
    auto bin = temp.Write("host/model.bin", std::string("\x00\x01\x02", 3));

    Workspace workspace(temp.Path());
    workspace.StageInputs({{csv, "data.csv"}, {bin, "models/v1/model.bin"}});

    EXPECT_EQ(ReadAll(workspace.InputDir() / "data.csv"), "a,b\n1,2\n");
    EXPECT_EQ(ReadAll(workspace.InputDir() / "models" / "v1" / "model.bin"), std::string("\x00\x01\x02", 3));
}

TEST(Workspace, EscapingGuestPathsRejected) {
    TempDir temp;
    auto csv = temp.Write("data.csv", "x");

    Workspace workspace(temp.Path());
    EXPECT_THROW(workspace.StageInputs({{csv, "../x"}}), flashvm::core::VmConfigurationError);
    EXPECT_THROW(workspace.StageInputs({{csv, "a/../../x"}}), flashvm::core::VmConfigurationError);
    EXPECT_THROW(workspace.StageInputs({{csv, "/etc/passwd"}}), flashvm::core::VmConfigurationError);
    EXPECT_THROW(workspace.StageInputs({{csv, ""}}), flashvm::core::VmConfigurationError);
}

TEST(Workspace, ContainedRelativePaths) {
    EXPECT_TRUE(Workspace::IsContainedRelativePath("a.txt"));
    EXPECT_TRUE(Workspace::IsContainedRelativePath("dir/a.txt"));
    EXPECT_TRUE(Workspace::IsContainedRelativePath("./a.txt"));
    EXPECT_FALSE(Workspace::IsContainedRelativePath(".."));
    EXPECT_FALSE(Workspace::IsContainedRelativePath("/abs"));
}

// ── scripts ─────────────────────────────────────────────────

TEST(Workspace, EntrypointHoldsSubmittedCode) {
    TempDir temp;
    Workspace workspace(temp.Path());

    std::string code = "print('h\xC3\xA9llo')\nimport sys; sys.exit(0)\n";
    auto main = workspace.WriteEntrypoint(code);

    EXPECT_EQ(main, workspace.ScriptsDir() / "main.py");
    EXPECT_EQ(ReadAll(main), code);
}

TEST(Workspace, LauncherCarriesEnvironmentAndArguments) {
    TempDir temp;
    Workspace workspace(temp.Path());

    RunConfig config;
    config.env["GREETING"] = "it's \"quoted\"";
    config.python_args = {"-u", "-B"};
    auto launcher = workspace.WriteLauncher(config);

    EXPECT_EQ(launcher, workspace.ScriptsDir() / "run.py");
    auto script = ReadAll(launcher);
    EXPECT_NE(script.find(".flashvm-started"), std::string::npos);
    EXPECT_NE(script.find("launch.json"), std::string::npos);
    EXPECT_NE(fs::status(launcher).permissions() & fs::perms::owner_exec, fs::perms::none);

    auto launch = nlohmann::json::parse(ReadAll(workspace.ScriptsDir() / "launch.json"));
    EXPECT_EQ(launch["env"]["GREETING"], "it's \"quoted\"");
    EXPECT_EQ(launch["python_args"], nlohmann::json({"-u", "-B"}));
}

TEST(Workspace, GuestLauncherPathFollowsWorkdir) {
    EXPECT_EQ(Workspace::GuestLauncherPath("/work"), "/work/scripts/run.py");
    EXPECT_EQ(Workspace::GuestLauncherPath("/job/"), "/job/scripts/run.py");
}

// The launcher itself, run with the host's python3 where one exists
class LauncherTest : public ::testing::Test {
protected:
    void SetUp() override {
        if (!runner_.CommandExists("python3")) {
            GTEST_SKIP() << "python3 not installed";
        }
        workspace_ = std::make_unique<Workspace>(temp_.Path());
    }

    flashvm::utils::CommandResult Launch(const std::string& code, const RunConfig& config) {
        workspace_->WriteEntrypoint(code);
        auto launcher = workspace_->WriteLauncher(config);
        return runner_.Run({"python3", launcher.string()});
    }

    TempDir temp_;
    flashvm::utils::ProcessRunner runner_;
    std::unique_ptr<Workspace> workspace_;
};

TEST_F(LauncherTest, AppliesEnvironmentAndPropagatesExitCode) {
    RunConfig config;
    config.env["MODE"] = "batch";

    auto result = Launch("import os, sys\nprint(os.environ['MODE'])\nsys.exit(3)\n", config);

    EXPECT_EQ(result.exit_code, 3);
    EXPECT_EQ(result.stdout_output, "batch\n");
    EXPECT_TRUE(fs::exists(workspace_->StartedMarker()));
}

TEST_F(LauncherTest, SignalDeathBecomes128PlusSignal) {
    auto result = Launch("import os, signal\nos.kill(os.getpid(), signal.SIGKILL)\n", RunConfig{});
    EXPECT_EQ(result.exit_code, 137);
}

TEST_F(LauncherTest, UncaughtExceptionGoesToStderr) {
    auto result = Launch("raise ValueError('boom')\n", RunConfig{});
    EXPECT_EQ(result.exit_code, 1);
    EXPECT_NE(result.stderr_output.find("ValueError: boom"), std::string::npos);
}
