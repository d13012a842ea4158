#include <modelpull/transfer/transfer_manager.hpp>

#include "../../support/fake_http_adapter.hpp"
#include "../../support/temp_dir_scope.hpp"

#include <gtest/gtest.h>


using namespace modelpull;
using namespace modelpull::transfer;
using namespace std::chrono_literals;
using modelpull::test_support::FakeHttpAdapter;
using modelpull::test_support::TempDirScope;

namespace {

ArtifactDescriptor make(std::optional<std::string> url, std::optional<std::string> dest) {
    ArtifactDescriptor d;
    d.remoteUrl = std::move(url);
    d.destinationPath = std::move(dest);
    return d;
}

class BatchTest : public ::testing::Test {
protected:
    void SetUp() override {
        http = std::make_shared<FakeHttpAdapter>(std::string(512, 'b'));
        TransferManagerConfig cfg;
        cfg.probeTimeout = 100ms;
        manager = std::make_unique<TransferManager>(cfg, http);
    }

    TempDirScope tmp = TempDirScope::unique_under("modelpull-batch");
    std::shared_ptr<FakeHttpAdapter> http;
    std::unique_ptr<TransferManager> manager;
};

} // namespace

TEST_F(BatchTest, ProviderTokensAreRequired) {
    std::vector<ArtifactDescriptor> items{
        make("https://huggingface.co/org/m/resolve/main/w.safetensors", "${BASE_DIR}/models/w"),
        make("https://civitai.com/api/download/models/12", "${BASE_DIR}/loras/l"),
    };
    auto results = manager->submitBatch(items, tmp.path());

    ASSERT_EQ(results.size(), 2u);
    EXPECT_FALSE(results[0].ok);
    EXPECT_EQ(results[0].message.value_or(""), "HuggingFace token required for this download");
    EXPECT_FALSE(results[1].ok);
    EXPECT_EQ(results[1].message.value_or(""), "CivitAI token required for this download");
    EXPECT_EQ(http->fetchCalls.load(), 0);
    EXPECT_EQ(manager->registry().size(), 0u);
}

TEST_F(BatchTest, TokensPresentAllowSubmission) {
    ProviderCredentials creds;
    creds.huggingFace = "hf_abc";
    std::vector<ArtifactDescriptor> items{
        make("https://huggingface.co/org/m/resolve/main/w.safetensors", "${BASE_DIR}/models/w")};

    auto results = manager->submitBatch(items, tmp.path(), creds);
    manager->drain();

    ASSERT_EQ(results.size(), 1u);
    EXPECT_TRUE(results[0].ok);
    EXPECT_FALSE(results[0].message.has_value());
    EXPECT_EQ(manager->getProgress("${BASE_DIR}/models/w").status, TransferStatus::Done);
    EXPECT_EQ(std::filesystem::file_size(tmp.path() / "models" / "w"), 512u);
}

TEST_F(BatchTest, DuplicateDestinationInOneBatchIsReported) {
    std::vector<ArtifactDescriptor> items{
        make("https://host/a.bin", "${BASE_DIR}/models/a.bin"),
        make("https://mirror/a.bin", "${BASE_DIR}/models/a.bin"),
    };
    auto results = manager->submitBatch(items, tmp.path());
    manager->drain();

    ASSERT_EQ(results.size(), 2u);
    EXPECT_TRUE(results[0].ok);
    EXPECT_TRUE(results[1].ok);
    EXPECT_EQ(results[1].message.value_or(""), "Already downloading");
    EXPECT_EQ(http->fetchCalls.load(), 1);
}

TEST_F(BatchTest, InvalidEntriesDoNotStopTheBatch) {
    std::vector<ArtifactDescriptor> items{
        make(std::nullopt, "${BASE_DIR}/models/none"),
        make("https://host/b.bin", "${BASE_DIR}/models/b.bin"),
    };
    auto results = manager->submitBatch(items, tmp.path());
    manager->drain();

    ASSERT_EQ(results.size(), 2u);
    EXPECT_FALSE(results[0].ok);
    EXPECT_EQ(results[0].message.value_or(""), "Artifact needs a remote URL or a git URL");
    EXPECT_TRUE(results[1].ok);
    EXPECT_TRUE(std::filesystem::exists(tmp.path() / "models" / "b.bin"));
}

TEST_F(BatchTest, ParentDirectoriesAreCreatedBeforeSubmit) {
    std::vector<ArtifactDescriptor> items{
        make("https://host/c.bin", "${BASE_DIR}/deep/nested/dir/c.bin")};
    auto results = manager->submitBatch(items, tmp.path());
    ASSERT_EQ(results.size(), 1u);
    EXPECT_TRUE(results[0].ok);
    EXPECT_TRUE(std::filesystem::is_directory(tmp.path() / "deep" / "nested" / "dir"));
    manager->drain();
}

TEST_F(BatchTest, DeleteReportsEachOutcome) {
    auto file = tmp.write("models/x.bin", "weights");
    tmp.write("custom_nodes/repo/.git/HEAD", "ref");
    auto dir = tmp.path() / "custom_nodes" / "repo";

    std::vector<ArtifactDescriptor> items{
        make(std::nullopt, std::nullopt),
        make(std::nullopt, "${BASE_DIR}/models/x.bin"),
        make(std::nullopt, "${BASE_DIR}/models/x.bin"),
        make(std::nullopt, "${BASE_DIR}/models/missing.bin"),
        make(std::nullopt, "${BASE_DIR}/custom_nodes/repo"),
    };
    auto results = manager->deleteArtifacts(items, tmp.path());

    ASSERT_EQ(results.size(), 5u);
    EXPECT_FALSE(results[0].ok);
    EXPECT_EQ(results[0].message.value_or(""), "No destination path provided");

    EXPECT_TRUE(results[1].ok);
    EXPECT_FALSE(results[1].message.has_value());
    EXPECT_FALSE(std::filesystem::exists(file));

    EXPECT_TRUE(results[2].ok);
    EXPECT_EQ(results[2].message.value_or(""), "Already deleted");

    EXPECT_FALSE(results[3].ok);
    EXPECT_EQ(results[3].message.value_or(""),
              "File not found: " + (tmp.path() / "models" / "missing.bin").string());

    EXPECT_TRUE(results[4].ok);
    EXPECT_FALSE(std::filesystem::exists(dir));
}
