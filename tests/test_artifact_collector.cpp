#include "test_support.hpp"

#include "flashvm/core/artifact_collector.hpp"
#include "flashvm/core/errors.hpp"

#include <filesystem>
#include <string>
#include <vector>

using flashvm::core::Artifact;
using flashvm::core::ArtifactCollector;
using flashvm::core::FileOutputSpec;
using flashvm::testing::TempDir;

namespace fs = std::filesystem;

namespace {

std::vector<std::string> GuestPaths(const std::vector<Artifact>& artifacts) {
    std::vector<std::string> paths;
    for (const auto& artifact : artifacts) {
        paths.push_back(artifact.guest_path);
    }
    return paths;
}

} // anonymous namespace

// ── matching ────────────────────────────────────────────────

TEST(ArtifactMatching, SingleSegmentWildcards) {
    EXPECT_TRUE(ArtifactCollector::Matches("*.csv", "result.csv"));
    EXPECT_FALSE(ArtifactCollector::Matches("*.csv", "nested/result.csv"));
    EXPECT_TRUE(ArtifactCollector::Matches("report-?.txt", "report-1.txt"));
    EXPECT_TRUE(ArtifactCollector::Matches("data[0-9].bin", "data7.bin"));
}

TEST(ArtifactMatching, DoubleStarMatchesZeroOrMoreDirectories) {
    EXPECT_TRUE(ArtifactCollector::Matches("**/*.json", "a.json"));
    EXPECT_TRUE(ArtifactCollector::Matches("**/*.json", "x/a.json"));
    EXPECT_TRUE(ArtifactCollector::Matches("**/*.json", "x/y/z/a.json"));
    EXPECT_TRUE(ArtifactCollector::Matches("reports/**/summary.txt", "reports/summary.txt"));
    EXPECT_TRUE(ArtifactCollector::Matches("reports/**/summary.txt", "reports/2025/q1/summary.txt"));
    EXPECT_FALSE(ArtifactCollector::Matches("reports/**/summary.txt", "other/summary.txt"));
    EXPECT_TRUE(ArtifactCollector::Matches("**", "any/depth/file"));
}

// ── collection ──────────────────────────────────────────────

class ArtifactCollectorTest : public ::testing::Test {
protected:
    fs::path Out() const { return temp_.Path() / "out"; }

    void Put(const std::string& relative, const std::string& content) {
        temp_.Write("out/" + relative, content);
    }

    std::vector<Artifact> Collect(const std::vector<std::string>& patterns, std::uint64_t threshold = 1024) {
        std::vector<FileOutputSpec> specs;
        for (const auto& pattern : patterns) {
            specs.push_back({pattern});
        }
        return ArtifactCollector(Out(), threshold).Collect(specs);
    }

    void SetUp() override {
        fs::create_directories(Out());
    }

    TempDir temp_;
};

TEST_F(ArtifactCollectorTest, NoPatternsCollectNothing) {
    Put("a.txt", "a");
    EXPECT_TRUE(Collect({}).empty());
}

TEST_F(ArtifactCollectorTest, ContentInlinedUpToTheThreshold) {
    Put("exact.bin", std::string(16, 'x'));
    Put("over.bin", std::string(17, 'y'));

    auto artifacts = Collect({"*.bin"}, 16);
    ASSERT_EQ(artifacts.size(), 2u);

    EXPECT_EQ(artifacts[0].guest_path, "out/exact.bin");
    EXPECT_EQ(artifacts[0].size_bytes, 16u);
    ASSERT_TRUE(artifacts[0].content.has_value());
    EXPECT_EQ(artifacts[0].content->size(), 16u);

    EXPECT_EQ(artifacts[1].guest_path, "out/over.bin");
    EXPECT_EQ(artifacts[1].size_bytes, 17u);
    EXPECT_FALSE(artifacts[1].content.has_value());
    EXPECT_EQ(artifacts[1].host_path, Out() / "over.bin");
}

TEST_F(ArtifactCollectorTest, LeadingOutSegmentIsOptional) {
    Put("a.txt", "a");
    Put("b.csv", "b");
    EXPECT_EQ(GuestPaths(Collect({"out/*.txt"})), std::vector<std::string>{"out/a.txt"});
    EXPECT_EQ(GuestPaths(Collect({"*.txt"})), std::vector<std::string>{"out/a.txt"});
}

TEST_F(ArtifactCollectorTest, RecursivePatternsAndSortedOutput) {
    Put("z.json", "{}");
    Put("deep/er/b.json", "{}");
    Put("deep/a.json", "{}");
    Put("deep/skip.txt", "");

    EXPECT_EQ(GuestPaths(Collect({"**/*.json"})),
              (std::vector<std::string>{"out/deep/a.json", "out/deep/er/b.json", "out/z.json"}));
}

TEST_F(ArtifactCollectorTest, OverlappingPatternsAreDeduplicated) {
    Put("result.csv", "1");
    auto artifacts = Collect({"*.csv", "result.*", "**/*"});
    EXPECT_EQ(GuestPaths(artifacts), std::vector<std::string>{"out/result.csv"});
}

TEST_F(ArtifactCollectorTest, UnmatchedPatternIsNotAnError) {
    Put("a.txt", "a");
    EXPECT_TRUE(Collect({"*.parquet"}).empty());
}

TEST_F(ArtifactCollectorTest, EmptyFileHasEmptyContent) {
    Put("empty.txt", "");
    auto artifacts = Collect({"*.txt"});
    ASSERT_EQ(artifacts.size(), 1u);
    ASSERT_TRUE(artifacts[0].content.has_value());
    EXPECT_TRUE(artifacts[0].content->empty());
}

TEST_F(ArtifactCollectorTest, SymlinksAndDirectoriesAreSkipped) {
    Put("real.txt", "real");
    auto secret = temp_.Write("secret.txt", "host secret");
    fs::create_symlink(secret, Out() / "link.txt");
    fs::create_directories(Out() / "dir.txt");

    EXPECT_EQ(GuestPaths(Collect({"*.txt"})), std::vector<std::string>{"out/real.txt"});
}

TEST_F(ArtifactCollectorTest, MalformedPatternsRejected) {
    for (const char* bad : {"/etc/*", "../*.txt", "out/../../x", "", "   ", "out", "out/"}) {
        EXPECT_THROW(Collect({bad}), flashvm::core::VmConfigurationError) << "'" << bad << "'";
        EXPECT_THROW(ArtifactCollector::ValidatePatterns({{bad}}), flashvm::core::VmConfigurationError)
            << "'" << bad << "'";
    }
    EXPECT_NO_THROW(ArtifactCollector::ValidatePatterns({{"*.csv"}, {"out/**/*.json"}}));
}

TEST_F(ArtifactCollectorTest, MissingOutputDirectoryIsAnIoError) {
    ArtifactCollector collector(temp_.Path() / "gone", 1024);
    EXPECT_THROW(collector.Collect({{"*.txt"}}), flashvm::core::IoError);
}
