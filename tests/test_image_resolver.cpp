#include "test_support.hpp"

#include "flashvm/core/errors.hpp"
#include "flashvm/image/embedded_image.hpp"
#include "flashvm/image/image_cache.hpp"
#include "flashvm/image/image_reference.hpp"
#include "flashvm/image/image_resolver.hpp"

#include <memory>
#include <set>
#include <string>

using flashvm::core::ImageResolutionError;
using flashvm::image::ImageReference;
using flashvm::image::ImageResolver;
using flashvm::image::Transport;
using flashvm::testing::FakeCommandRunner;
using flashvm::testing::TempDir;

namespace {

std::string ErrorOf(const std::string& reference) {
    try {
        ImageResolver::ValidateReference(reference);
    } catch (const ImageResolutionError& e) {
        return e.what();
    }
    return "";
}

} // anonymous namespace

// ── parsing ─────────────────────────────────────────────────

TEST(ImageReference, RecognisesTransports) {
    EXPECT_EQ(ImageReference::Parse("docker://python:3.12").transport, Transport::REMOTE_REGISTRY);
    EXPECT_EQ(ImageReference::Parse("containers-storage:localhost/x:y").transport, Transport::LOCAL_STORE);
    EXPECT_EQ(ImageReference::Parse("oci:/images/py").transport, Transport::OCI_LAYOUT);
    EXPECT_EQ(ImageReference::Parse("oci-archive:/images/py.tar").transport, Transport::OCI_ARCHIVE);
    EXPECT_EQ(ImageReference::Parse("dir:/images/plain").transport, Transport::PLAIN_DIRECTORY);
    EXPECT_EQ(ImageReference::Parse("python:3.12-slim").transport, Transport::BARE_NAME);
}

TEST(ImageReference, PathTransportsSplitOnLastColon) {
    auto ref = ImageReference::Parse("oci:/images/py:python-basic");
    EXPECT_EQ(ref.target, "/images/py");
    EXPECT_EQ(ref.tag, "python-basic");
    EXPECT_TRUE(ref.IsPathBased());

    auto untagged = ImageReference::Parse("oci-archive:/images/py.tar");
    EXPECT_EQ(untagged.target, "/images/py.tar");
    EXPECT_EQ(untagged.tag, "latest");
}

TEST(ImageReference, DirectoryPathKeepsColons) {
    auto ref = ImageReference::Parse("dir:/imgs/a:b");
    EXPECT_EQ(ref.transport, flashvm::image::Transport::PLAIN_DIRECTORY);
    EXPECT_EQ(ref.target, "/imgs/a:b");
    EXPECT_TRUE(ref.tag.empty());
    EXPECT_TRUE(ref.IsPathBased());
}

TEST(ImageReference, NameTransportsKeepTheirTag) {
    auto ref = ImageReference::Parse("docker://python:3.12");
    EXPECT_EQ(ref.target, "python:3.12");
    EXPECT_TRUE(ref.tag.empty());
    EXPECT_FALSE(ref.IsPathBased());
}

// ── validation ──────────────────────────────────────────────

TEST(ImageResolver, OciLayoutMissingMembersAreNamed) {
    TempDir temp;
    auto dir = temp.MakeOciLayout("img", true, false, false);

    auto message = ErrorOf("oci:" + dir.string());
    EXPECT_NE(message.find("Invalid OCI layout"), std::string::npos) << message;
    EXPECT_NE(message.find("index.json"), std::string::npos) << message;
    EXPECT_NE(message.find("blobs/sha256"), std::string::npos) << message;
    EXPECT_EQ(message.find("oci-layout,"), std::string::npos) << message;
}

TEST(ImageResolver, CompleteOciLayoutIsAccepted) {
    TempDir temp;
    auto dir = temp.MakeOciLayout("img");

    auto ref = ImageResolver::ValidateReference("oci:" + dir.string() + ":python-basic");
    EXPECT_EQ(ref.transport, Transport::OCI_LAYOUT);
    EXPECT_EQ(ref.target, dir.string());
    EXPECT_EQ(ref.tag, "python-basic");
}

TEST(ImageResolver, MissingOciPathIsRejected) {
    auto message = ErrorOf("oci:/nonexistent/flashvm/layout");
    EXPECT_NE(message.find("does not exist"), std::string::npos) << message;
}

TEST(ImageResolver, MissingArchiveOrDirectoryIsRejected) {
    EXPECT_THROW(ImageResolver::ValidateReference("oci-archive:/nonexistent/a.tar"), ImageResolutionError);
    EXPECT_THROW(ImageResolver::ValidateReference("dir:/nonexistent/plain"), ImageResolutionError);
}

TEST(ImageResolver, ExistingDirectoryIsAccepted) {
    TempDir temp;
    temp.Write("plain/manifest.json", "{}");
    EXPECT_NO_THROW(ImageResolver::ValidateReference("dir:" + (temp.Path() / "plain").string()));
}

TEST(ImageResolver, DirectoryWithColonValidatesTheWholePath) {
    TempDir temp;
    temp.Write("plain:v1/manifest.json", "{}");
    temp.Write("other/manifest.json", "{}");

    EXPECT_NO_THROW(ImageResolver::ValidateReference("dir:" + (temp.Path() / "plain:v1").string()));
    // Only "other" exists, so "other:v1" must not pass by validating "other"
    EXPECT_THROW(ImageResolver::ValidateReference("dir:" + (temp.Path() / "other:v1").string()),
                 ImageResolutionError);
}

TEST(ImageResolver, EmptyNamesAreRejected) {
    EXPECT_THROW(ImageResolver::ValidateReference("docker://"), ImageResolutionError);
    EXPECT_THROW(ImageResolver::ValidateReference("containers-storage:"), ImageResolutionError);
    EXPECT_THROW(ImageResolver::ValidateReference(""), ImageResolutionError);
}

// ── resolution ──────────────────────────────────────────────

class ImageResolverTest : public ::testing::Test {
protected:
    void SetUp() override {
        runner_ = std::make_shared<FakeCommandRunner>();
        flashvm::testing::InstallFakeStore(*runner_, store_);

        flashvm::image::CacheConfig config;
        config.cache_dir = temp_.Path() / "cache";
        config.embedded_dir = temp_.MakeOciLayout("oci");

        auto containers = std::make_shared<flashvm::utils::ContainerUtils>(runner_);
        cache_ = std::make_unique<flashvm::image::ImageCache>(containers, config);
    }

    TempDir temp_;
    std::set<std::string> store_;
    std::shared_ptr<FakeCommandRunner> runner_;
    std::unique_ptr<flashvm::image::ImageCache> cache_;
};

TEST_F(ImageResolverTest, RemoteReferencePassesThroughUnchanged) {
    ImageResolver resolver(*cache_);
    EXPECT_EQ(resolver.Resolve(std::string("docker://python:3.12")), "docker://python:3.12");
    EXPECT_TRUE(runner_->calls.empty());
}

TEST_F(ImageResolverTest, LocalStoreAndBareNamesPassThrough) {
    ImageResolver resolver(*cache_);
    EXPECT_EQ(resolver.Resolve(std::string("containers-storage:localhost/flashvm:python-pip-abc")),
              "containers-storage:localhost/flashvm:python-pip-abc");
    EXPECT_EQ(resolver.Resolve(std::string("python:3.12-slim")), "python:3.12-slim");
}

TEST_F(ImageResolverTest, UnsetReferenceImportsTheDefaultImage) {
    ImageResolver resolver(*cache_);

    auto resolved = resolver.Resolve(std::nullopt);

    EXPECT_EQ(resolved, flashvm::image::kCanonicalImage);
    EXPECT_EQ(store_.count(flashvm::image::kCanonicalImage), 1u);
    EXPECT_EQ(runner_->CountCalls("skopeo copy"), 1);
}
