#include "test_support.hpp"

#include "flashvm/core/errors.hpp"
#include "flashvm/image/embedded_image.hpp"
#include "flashvm/image/image_cache.hpp"

#include <filesystem>
#include <memory>
#include <set>
#include <string>

using flashvm::image::CacheConfig;
using flashvm::image::ImageCache;
using flashvm::image::PipInstallRequest;
using flashvm::image::kCanonicalImage;
using flashvm::testing::FakeCommandRunner;
using flashvm::testing::TempDir;

class ImageCacheTest : public ::testing::Test {
protected:
    void SetUp() override {
        runner_ = std::make_shared<FakeCommandRunner>();
        flashvm::testing::InstallFakeStore(*runner_, store_);

        config_.cache_dir = temp_.Path() / "cache";
        config_.embedded_dir = temp_.MakeOciLayout("oci");
        containers_ = std::make_shared<flashvm::utils::ContainerUtils>(runner_);
    }

    ImageCache MakeCache() {
        return ImageCache(containers_, config_);
    }

    TempDir temp_;
    std::set<std::string> store_;
    CacheConfig config_;
    std::shared_ptr<FakeCommandRunner> runner_;
    std::shared_ptr<flashvm::utils::ContainerUtils> containers_;
};

// ── default import ──────────────────────────────────────────

TEST_F(ImageCacheTest, ImportsOnceAcrossCalls) {
    auto cache = MakeCache();

    EXPECT_EQ(cache.EnsureDefaultImported(), kCanonicalImage);
    EXPECT_EQ(cache.EnsureDefaultImported(), kCanonicalImage);

    // A second cache over the same store behaves like a fresh process
    auto again = MakeCache();
    EXPECT_EQ(again.EnsureDefaultImported(), kCanonicalImage);

    EXPECT_EQ(runner_->CountCalls("skopeo copy"), 1);
    EXPECT_EQ(store_.count(kCanonicalImage), 1u);
    EXPECT_TRUE(cache.IsDefaultImported());
}

TEST_F(ImageCacheTest, CopiesFromTheEmbeddedLayoutWithItsTag) {
    auto cache = MakeCache();
    cache.EnsureDefaultImported();

    int index = runner_->IndexOf("skopeo copy");
    ASSERT_GE(index, 0);
    const auto& argv = runner_->calls[index];
    EXPECT_EQ(argv[0], "buildah");
    EXPECT_EQ(argv[1], "unshare");
    EXPECT_EQ(argv[argv.size() - 2], "oci:" + config_.embedded_dir->string() + ":python-basic");
    EXPECT_EQ(argv.back(), std::string("containers-storage:") + kCanonicalImage);
}

TEST_F(ImageCacheTest, WritesSentinelAfterImport) {
    auto cache = MakeCache();
    EXPECT_FALSE(cache.ReadSentinel().has_value());

    cache.EnsureDefaultImported();

    auto sentinel = cache.ReadSentinel();
    ASSERT_TRUE(sentinel.has_value());
    EXPECT_EQ(sentinel->image_name, kCanonicalImage);
    EXPECT_EQ(sentinel->source_path, config_.embedded_dir->string());
    EXPECT_FALSE(sentinel->tool_version.empty());
    EXPECT_TRUE(std::filesystem::exists(config_.SentinelPath()));
}

TEST_F(ImageCacheTest, PresentImageSkipsImportButRecordsSentinel) {
    store_.insert(kCanonicalImage);
    auto cache = MakeCache();

    EXPECT_EQ(cache.EnsureDefaultImported(), kCanonicalImage);

    EXPECT_EQ(runner_->CountCalls("skopeo copy"), 0);
    EXPECT_EQ(runner_->CountCalls("buildah from"), 0);
    EXPECT_TRUE(cache.ReadSentinel().has_value());
}

TEST_F(ImageCacheTest, FallsBackToBuildahWhenSkopeoFails) {
    runner_->On("skopeo copy", FakeCommandRunner::Fail(1, "copy denied"));
    auto cache = MakeCache();

    EXPECT_EQ(cache.EnsureDefaultImported(), kCanonicalImage);

    int from = runner_->IndexOf("buildah from");
    int commit = runner_->IndexOf("buildah commit");
    int rm = runner_->IndexOf("buildah rm working-container");
    ASSERT_GE(from, 0);
    EXPECT_LT(from, commit);
    EXPECT_LT(commit, rm);
    EXPECT_EQ(store_.count(kCanonicalImage), 1u);
}

TEST_F(ImageCacheTest, FallsBackToBuildahWhenSkopeoMissing) {
    runner_->available.erase("skopeo");
    auto cache = MakeCache();

    cache.EnsureDefaultImported();

    EXPECT_EQ(runner_->CountCalls("skopeo"), 0);
    EXPECT_EQ(runner_->CountCalls("buildah commit"), 1);
    EXPECT_EQ(store_.count(kCanonicalImage), 1u);
}

TEST_F(ImageCacheTest, BothImportStrategiesFailing) {
    runner_->On("skopeo copy", FakeCommandRunner::Fail(1, "copy denied"));
    runner_->On("buildah from", FakeCommandRunner::Fail(125, "no such image"));
    auto cache = MakeCache();

    EXPECT_THROW(cache.EnsureDefaultImported(), flashvm::core::ExecutionError);
    EXPECT_FALSE(cache.ReadSentinel().has_value());
}

TEST_F(ImageCacheTest, MissingEmbeddedLayoutIsAResolutionError) {
    config_.embedded_dir = temp_.Path() / "no-such-layout";
    auto cache = MakeCache();

    EXPECT_THROW(cache.EnsureDefaultImported(), flashvm::core::ImageResolutionError);
    EXPECT_EQ(runner_->CountCalls("skopeo copy"), 0);
}

TEST_F(ImageCacheTest, IncompleteEmbeddedLayoutNamesTheMissingMember) {
    config_.embedded_dir = temp_.MakeOciLayout("partial", true, true, false);
    auto cache = MakeCache();

    try {
        cache.EnsureDefaultImported();
        FAIL() << "expected ImageResolutionError";
    } catch (const flashvm::core::ImageResolutionError& e) {
        std::string message = e.what();
        EXPECT_NE(message.find("blobs/sha256"), std::string::npos) << message;
        EXPECT_EQ(message.find("index.json"), std::string::npos) << message;
    }
}

// ── deterministic tag ───────────────────────────────────────

TEST(ImageCacheTag, StableAcrossOrderAndDuplicates) {
    auto tag = ImageCache::DeterministicTag({"requests==2.32.0", "numpy"});
    EXPECT_EQ(tag, "python-pip-86c107a18cb3a58b");
    EXPECT_EQ(ImageCache::DeterministicTag({"numpy", "requests==2.32.0", "numpy"}), tag);
    EXPECT_NE(ImageCache::DeterministicTag({"numpy"}), tag);
}

// ── pip-layered images ──────────────────────────────────────

TEST_F(ImageCacheTest, EmptyPackageListRejected) {
    auto cache = MakeCache();
    PipInstallRequest request;
    EXPECT_THROW(cache.PipInstallIntoImage(request), flashvm::core::VmConfigurationError);
    EXPECT_TRUE(runner_->calls.empty());
}

TEST_F(ImageCacheTest, PipInstallCommitsDerivedImage) {
    auto cache = MakeCache();
    PipInstallRequest request;
    request.packages = {"requests==2.32.0", "numpy"};
    request.index_url = "https://pypi.example/simple";

    auto image = cache.PipInstallIntoImage(request);

    EXPECT_EQ(image, "containers-storage:localhost/flashvm:python-pip-86c107a18cb3a58b");
    EXPECT_EQ(store_.count("localhost/flashvm:python-pip-86c107a18cb3a58b"), 1u);

    int from = runner_->IndexOf("buildah from");
    ASSERT_GE(from, 0);
    EXPECT_EQ(runner_->calls[from].back(), std::string("containers-storage:") + kCanonicalImage);

    int pip = runner_->IndexOf("-m pip install");
    ASSERT_GE(pip, 0);
    auto joined = flashvm::utils::StringUtils::Join(runner_->calls[pip], " ");
    EXPECT_NE(joined.find("run --user root working-container --"), std::string::npos) << joined;
    EXPECT_NE(joined.find("PIP_CONFIG_FILE=/dev/null"), std::string::npos);
    EXPECT_NE(joined.find("--no-cache-dir"), std::string::npos);
    EXPECT_NE(joined.find("--break-system-packages"), std::string::npos);
    EXPECT_NE(joined.find("--index-url https://pypi.example/simple"), std::string::npos);
    EXPECT_EQ(joined.find("--extra-index-url"), std::string::npos);

    int commit = runner_->IndexOf("buildah commit");
    int rm = runner_->IndexOf("buildah rm working-container");
    EXPECT_LT(pip, commit);
    EXPECT_LT(commit, rm);
}

TEST_F(ImageCacheTest, PipInstallHonoursExplicitBaseAndTag) {
    auto cache = MakeCache();
    PipInstallRequest request;
    request.base = "docker://python:3.12-slim";
    request.packages = {"rich"};
    request.tag = "custom";

    EXPECT_EQ(cache.PipInstallIntoImage(request), "containers-storage:localhost/flashvm:custom");

    EXPECT_EQ(runner_->CountCalls("skopeo copy"), 0);
    int from = runner_->IndexOf("buildah from");
    ASSERT_GE(from, 0);
    EXPECT_EQ(runner_->calls[from].back(), "docker://python:3.12-slim");
}

TEST_F(ImageCacheTest, PipInstallRejectsInvalidBase) {
    auto cache = MakeCache();
    PipInstallRequest request;
    request.base = "oci:/nonexistent/layout";
    request.packages = {"rich"};

    EXPECT_THROW(cache.PipInstallIntoImage(request), flashvm::core::ImageResolutionError);
    EXPECT_EQ(runner_->CountCalls("buildah from"), 0);
}

TEST_F(ImageCacheTest, FailedInstallStillRemovesWorkingContainer) {
    runner_->On("-m pip install", FakeCommandRunner::Fail(1, "No matching distribution"));
    auto cache = MakeCache();
    PipInstallRequest request;
    request.packages = {"does-not-exist"};

    try {
        cache.PipInstallIntoImage(request);
        FAIL() << "expected ExecutionError";
    } catch (const flashvm::core::ExecutionError& e) {
        EXPECT_NE(std::string(e.what()).find("No matching distribution"), std::string::npos);
    }

    EXPECT_EQ(runner_->CountCalls("buildah commit"), 0);
    EXPECT_EQ(runner_->CountCalls("buildah rm working-container"), 1);
}

// ── throwaway imports / listing / clearing ──────────────────

TEST_F(ImageCacheTest, ThrowawayImportsGetUniqueNames) {
    auto cache = MakeCache();
    auto a = cache.ImportThrowaway("oci:/images/a:latest");
    auto b = cache.ImportThrowaway("oci:/images/a:latest");

    EXPECT_TRUE(flashvm::utils::StringUtils::StartsWith(a, "localhost/flashvm:imported-"));
    EXPECT_EQ(a.size(), std::string("localhost/flashvm:imported-").size() + 8);
    EXPECT_NE(a, b);
    EXPECT_EQ(store_.count(a), 1u);
}

TEST_F(ImageCacheTest, ListCachedImagesFiltersRepository) {
    store_ = {kCanonicalImage, "localhost/flashvm:python-pip-0123456789abcdef",
              "docker.io/library/python:3.12", "localhost/flashvmx:other"};
    auto cache = MakeCache();

    auto images = cache.ListCachedImages();
    EXPECT_EQ(images, (std::vector<std::string>{
        kCanonicalImage, "localhost/flashvm:python-pip-0123456789abcdef"}));
}

TEST_F(ImageCacheTest, ClearCacheRemovesImagesAndState) {
    auto cache = MakeCache();
    cache.EnsureDefaultImported();
    store_.insert("localhost/flashvm:custom");
    store_.insert("docker.io/library/python:3.12");
    ASSERT_TRUE(std::filesystem::exists(config_.StateDir()));

    EXPECT_TRUE(cache.ClearCache());

    EXPECT_EQ(store_, (std::set<std::string>{"docker.io/library/python:3.12"}));
    EXPECT_FALSE(std::filesystem::exists(config_.StateDir()));
    EXPECT_EQ(runner_->CountCalls("rmi -f"), 2);
}

TEST_F(ImageCacheTest, ClearCacheReportsFailedRemoval) {
    store_.insert("localhost/flashvm:custom");
    runner_->On("buildah rmi", FakeCommandRunner::Fail(1, "image in use"));
    auto cache = MakeCache();

    EXPECT_FALSE(cache.ClearCache());
}
