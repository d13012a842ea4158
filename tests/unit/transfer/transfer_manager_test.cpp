#include <modelpull/transfer/transfer_manager.hpp>

#include "../../support/fake_git.hpp"
#include "../../support/fake_http_adapter.hpp"
#include "../../support/temp_dir_scope.hpp"

#include <gtest/gtest.h>

#include <atomic>
#include <chrono>
#include <functional>
#include <future>
#include <stdexcept>
#include <thread>

using namespace modelpull;
using namespace modelpull::transfer;
using namespace std::chrono_literals;
using modelpull::test_support::FakeHttpAdapter;
using modelpull::test_support::TempDirScope;

namespace {

using StrategyBody = std::function<Result<TransferStatus>(
    const TransferJob&, std::stop_token, const ProgressReporter&)>;

// Strategy double: counts executions in a counter the test keeps after ownership moves.
class CountingStrategy final : public ITransferStrategy {
public:
    CountingStrategy(std::shared_ptr<std::atomic<int>> calls, StrategyBody body)
        : calls_(std::move(calls)), body_(std::move(body)) {}

    Result<TransferStatus> execute(const TransferJob& job, std::stop_token cancel,
                                   const ProgressReporter& report) override {
        ++*calls_;
        return body_(job, std::move(cancel), report);
    }

private:
    std::shared_ptr<std::atomic<int>> calls_;
    StrategyBody body_;
};

Result<TransferStatus> succeed(const TransferJob&, std::stop_token, const ProgressReporter& r) {
    r(50);
    return TransferStatus::Done;
}

class TransferManagerTest : public ::testing::Test {
protected:
    TransferManagerConfig fastConfig() {
        TransferManagerConfig cfg;
        cfg.probeTimeout = 100ms;
        cfg.gitPollInterval = 20ms;
        return cfg;
    }

    std::unique_ptr<TransferManager>
    makeManager(std::shared_ptr<FakeHttpAdapter> http, StrategyBody httpBody = {},
                StrategyBody gitBody = {}) {
        std::unique_ptr<ITransferStrategy> httpStrategy;
        std::unique_ptr<ITransferStrategy> gitStrategy;
        if (httpBody)
            httpStrategy = std::make_unique<CountingStrategy>(httpCalls, std::move(httpBody));
        if (gitBody)
            gitStrategy = std::make_unique<CountingStrategy>(gitCalls, std::move(gitBody));
        return std::make_unique<TransferManager>(fastConfig(), std::move(http),
                                                 std::move(httpStrategy), std::move(gitStrategy));
    }

    ArtifactDescriptor httpArtifact(const std::string& dest) {
        ArtifactDescriptor d;
        d.remoteUrl = "https://host/file.bin";
        d.destinationPath = dest;
        return d;
    }

    ArtifactDescriptor gitArtifact(const std::string& dest) {
        ArtifactDescriptor d;
        d.gitUrl = "https://github.com/example/nodes.git";
        d.destinationPath = dest;
        return d;
    }

    TempDirScope tmp = TempDirScope::unique_under("modelpull-manager");
    std::shared_ptr<std::atomic<int>> httpCalls = std::make_shared<std::atomic<int>>(0);
    std::shared_ptr<std::atomic<int>> gitCalls = std::make_shared<std::atomic<int>>(0);
};

} // namespace

TEST_F(TransferManagerTest, KeyIsDestinationElseGitUrl) {
    ArtifactDescriptor d;
    d.gitUrl = "https://github.com/x/y.git";
    EXPECT_EQ(TransferManager::keyFor(d), "https://github.com/x/y.git");
    d.destinationPath = "${BASE_DIR}/custom_nodes/y";
    EXPECT_EQ(TransferManager::keyFor(d), "${BASE_DIR}/custom_nodes/y");
    EXPECT_FALSE(TransferManager::keyFor(ArtifactDescriptor{}).has_value());
}

TEST_F(TransferManagerTest, DescriptorWithoutUrlIsRejectedWithoutState) {
    auto http = std::make_shared<FakeHttpAdapter>();
    auto manager = makeManager(http, succeed, succeed);

    ArtifactDescriptor d;
    d.destinationPath = "${BASE_DIR}/models/x.bin";
    auto result = manager->submit(d, tmp.path());

    ASSERT_FALSE(result);
    EXPECT_EQ(result.error().code, ErrorCode::InvalidDescriptor);
    EXPECT_EQ(manager->registry().size(), 0u);
    EXPECT_FALSE(manager->registry().pending("${BASE_DIR}/models/x.bin").has_value());
    EXPECT_EQ(http->probeCalls.load(), 0);
    EXPECT_EQ(httpCalls->load(), 0);
}

TEST_F(TransferManagerTest, DescriptorWithBothUrlsOrNoDestinationIsRejected) {
    auto manager = makeManager(std::make_shared<FakeHttpAdapter>(), succeed, succeed);

    auto both = httpArtifact("a.bin");
    both.gitUrl = "https://github.com/x/y.git";
    auto r1 = manager->submit(both, tmp.path());
    ASSERT_FALSE(r1);
    EXPECT_EQ(r1.error().code, ErrorCode::InvalidDescriptor);

    ArtifactDescriptor noDest;
    noDest.remoteUrl = "https://host/file.bin";
    auto r2 = manager->submit(noDest, tmp.path());
    ASSERT_FALSE(r2);
    EXPECT_EQ(r2.error().code, ErrorCode::InvalidDescriptor);
    EXPECT_EQ(manager->registry().size(), 0u);
}

TEST_F(TransferManagerTest, PreflightMatchShortCircuitsTransfer) {
    tmp.write("models/a.bin", std::string(1024, 'm'));
    auto http = std::make_shared<FakeHttpAdapter>();
    http->probeSize = 1024;
    auto manager = makeManager(http, succeed);

    auto result = manager->submit(httpArtifact("${BASE_DIR}/models/a.bin"), tmp.path());

    ASSERT_TRUE(result) << result.error().message;
    EXPECT_EQ(result.value().status, TransferStatus::Done);
    EXPECT_EQ(result.value().progressPercent, 100);
    EXPECT_TRUE(result.value().finishedAt.has_value());
    EXPECT_EQ(httpCalls->load(), 0);
    EXPECT_EQ(http->fetchCalls.load(), 0);
    EXPECT_EQ(manager->getProgress("${BASE_DIR}/models/a.bin").status, TransferStatus::Done);
}

TEST_F(TransferManagerTest, DownloadThenResubmitIsServedByPreflight) {
    std::string body(1024, 'q');
    auto http = std::make_shared<FakeHttpAdapter>(body);
    http->chunkSize = 128;
    auto manager = makeManager(http);

    auto dest = (tmp.path() / "a.bin").string();
    auto first = manager->submit(httpArtifact(dest), tmp.path(), {}, false);
    ASSERT_TRUE(first);
    EXPECT_EQ(first.value().status, TransferStatus::Done);
    EXPECT_EQ(first.value().progressPercent, 100);
    EXPECT_EQ(http->fetchCalls.load(), 1);
    EXPECT_EQ(std::filesystem::file_size(dest), 1024u);

    auto second = manager->submit(httpArtifact(dest), tmp.path(), {}, false);
    ASSERT_TRUE(second);
    EXPECT_EQ(second.value().status, TransferStatus::Done);
    EXPECT_EQ(second.value().progressPercent, 100);
    EXPECT_EQ(http->fetchCalls.load(), 1);
    EXPECT_EQ(http->bytesServed.load(), 1024u);
}

TEST_F(TransferManagerTest, SynchronousSubmitReturnsTerminalRecord) {
    auto manager = makeManager(std::make_shared<FakeHttpAdapter>(), succeed);
    auto result = manager->submit(httpArtifact("sync.bin"), tmp.path(), {}, false);

    ASSERT_TRUE(result);
    const auto& rec = result.value();
    EXPECT_EQ(rec.status, TransferStatus::Done);
    EXPECT_EQ(rec.progressPercent, 100);
    EXPECT_TRUE(rec.startedAt.has_value());
    EXPECT_TRUE(rec.finishedAt.has_value());
    ASSERT_TRUE(rec.destinationPath.has_value());
    EXPECT_EQ(*rec.destinationPath, std::filesystem::path("sync.bin"));
    EXPECT_FALSE(manager->registry().pending("sync.bin").has_value());
}

TEST_F(TransferManagerTest, BackgroundSubmitReturnsDownloadingSnapshot) {
    std::promise<void> release;
    auto gate = release.get_future().share();
    auto manager = makeManager(std::make_shared<FakeHttpAdapter>(),
                               [gate](const TransferJob&, std::stop_token, const ProgressReporter&)
                                   -> Result<TransferStatus> {
                                   gate.wait();
                                   return TransferStatus::Done;
                               });

    auto result = manager->submit(httpArtifact("bg.bin"), tmp.path());
    ASSERT_TRUE(result);
    EXPECT_EQ(result.value().status, TransferStatus::Downloading);
    EXPECT_EQ(result.value().progressPercent, 0);
    EXPECT_TRUE(result.value().startedAt.has_value());
    EXPECT_EQ(manager->getProgress("bg.bin").status, TransferStatus::Downloading);

    release.set_value();
    manager->drain();
    EXPECT_EQ(manager->getProgress("bg.bin").status, TransferStatus::Done);
    EXPECT_EQ(manager->getProgress("bg.bin").progressPercent, 100);
}

TEST_F(TransferManagerTest, ConcurrentDuplicateSubmitsRunOnce) {
    std::promise<void> release;
    auto gate = release.get_future().share();
    StrategyBody clone = [gate](const TransferJob&, std::stop_token,
                                const ProgressReporter& r) -> Result<TransferStatus> {
        r(30);
        gate.wait();
        return TransferStatus::Done;
    };
    auto manager = makeManager(std::make_shared<FakeHttpAdapter>(), {}, clone);

    auto desc = gitArtifact("${BASE_DIR}/custom_nodes/nodes");
    auto first = std::async(std::launch::async,
                            [&] { return manager->submit(desc, tmp.path(), {}, false); });

    // Wait until the first caller owns the key
    for (int i = 0; i < 200 && !manager->registry().pending(*TransferManager::keyFor(desc)); ++i)
        std::this_thread::sleep_for(5ms);
    ASSERT_TRUE(manager->registry().pending(*TransferManager::keyFor(desc)).has_value());

    auto second = std::async(std::launch::async,
                             [&] { return manager->submit(desc, tmp.path(), {}, true); });
    EXPECT_EQ(second.wait_for(100ms), std::future_status::timeout);

    release.set_value();
    auto r1 = first.get();
    auto r2 = second.get();

    ASSERT_TRUE(r1);
    ASSERT_TRUE(r2);
    EXPECT_EQ(gitCalls->load(), 1);
    EXPECT_EQ(r1.value().status, TransferStatus::Done);
    EXPECT_EQ(r2.value().status, TransferStatus::Done);
    EXPECT_EQ(r1.value().finishedAt, r2.value().finishedAt);
    EXPECT_EQ(r1.value().progressPercent, r2.value().progressPercent);
}

TEST_F(TransferManagerTest, StrategyExceptionBecomesErrorRecord) {
    auto manager = makeManager(std::make_shared<FakeHttpAdapter>(),
                               [](const TransferJob&, std::stop_token,
                                  const ProgressReporter&) -> Result<TransferStatus> {
                                   throw std::runtime_error("disk on fire");
                               });

    auto bg = manager->submit(httpArtifact("boom.bin"), tmp.path());
    ASSERT_TRUE(bg);
    manager->drain();

    auto rec = manager->getProgress("boom.bin");
    EXPECT_EQ(rec.status, TransferStatus::Error);
    ASSERT_TRUE(rec.errorMessage.has_value());
    EXPECT_EQ(*rec.errorMessage, "disk on fire");
    EXPECT_TRUE(rec.finishedAt.has_value());

    auto sync = manager->submit(httpArtifact("boom2.bin"), tmp.path(), {}, false);
    ASSERT_TRUE(sync);
    EXPECT_EQ(sync.value().status, TransferStatus::Error);
}

TEST_F(TransferManagerTest, StrategyErrorIsRecorded) {
    auto manager = makeManager(std::make_shared<FakeHttpAdapter>(),
                               [](const TransferJob&, std::stop_token,
                                  const ProgressReporter&) -> Result<TransferStatus> {
                                   return Error{ErrorCode::NetworkError, "HTTP request error: 503"};
                               });
    auto result = manager->submit(httpArtifact("e.bin"), tmp.path(), {}, false);
    ASSERT_TRUE(result);
    EXPECT_EQ(result.value().status, TransferStatus::Error);
    EXPECT_EQ(result.value().errorMessage.value_or(""), "HTTP request error: 503");
}

TEST_F(TransferManagerTest, CancelUnknownKeyReturnsFalse) {
    auto manager = makeManager(std::make_shared<FakeHttpAdapter>(), succeed);
    EXPECT_FALSE(manager->cancel("never-submitted"));

    ASSERT_TRUE(manager->submit(httpArtifact("done.bin"), tmp.path(), {}, false));
    EXPECT_FALSE(manager->cancel("done.bin"));
}

TEST_F(TransferManagerTest, CancelStopsInFlightHttpTransfer) {
    std::string body(8192, 'z');
    auto http = std::make_shared<FakeHttpAdapter>(body);
    http->chunkSize = 1024;
    http->pauseAfterFirstChunk = true;
    http->probeSize = std::nullopt;
    auto manager = makeManager(http);

    auto dest = tmp.path() / "models" / "c.bin";
    auto result = manager->submit(httpArtifact(dest.string()), tmp.path());
    ASSERT_TRUE(result);
    ASSERT_TRUE(http->waitUntilPaused(5s));
    EXPECT_EQ(manager->getProgress(dest.string()).progressPercent, 12);

    EXPECT_TRUE(manager->cancel(dest.string()));
    http->resume();
    manager->drain();

    auto rec = manager->getProgress(dest.string());
    EXPECT_EQ(rec.status, TransferStatus::Stopped);
    EXPECT_FALSE(std::filesystem::exists(dest));
}

TEST_F(TransferManagerTest, CancelStopsInFlightGitClone) {
    auto git = test_support::write_fake_git(tmp.path(), test_support::kSlowClone);
    auto cfg = fastConfig();
    cfg.gitExecutable = git.string();
    TransferManager manager{cfg, std::make_shared<FakeHttpAdapter>()};

    auto dest = tmp.path() / "custom_nodes" / "slow";
    auto result = manager.submit(gitArtifact(dest.string()), tmp.path());
    ASSERT_TRUE(result);

    for (int i = 0; i < 250 && !std::filesystem::exists(dest / "HEAD"); ++i)
        std::this_thread::sleep_for(20ms);
    ASSERT_TRUE(std::filesystem::exists(dest / "HEAD"));

    EXPECT_TRUE(manager.cancel(dest.string()));
    manager.drain();

    EXPECT_EQ(manager.getProgress(dest.string()).status, TransferStatus::Stopped);
    EXPECT_FALSE(std::filesystem::exists(dest));
}

TEST_F(TransferManagerTest, ListingOmitsDoneRecords) {
    auto manager = makeManager(
        std::make_shared<FakeHttpAdapter>(),
        [](const TransferJob& job, std::stop_token, const ProgressReporter&)
            -> Result<TransferStatus> {
            if (job.key == "bad.bin")
                return Error{ErrorCode::NetworkError, "nope"};
            if (job.key == "stop.bin")
                return TransferStatus::Stopped;
            return TransferStatus::Done;
        });

    ASSERT_TRUE(manager->submit(httpArtifact("ok.bin"), tmp.path(), {}, false));
    ASSERT_TRUE(manager->submit(httpArtifact("bad.bin"), tmp.path(), {}, false));
    ASSERT_TRUE(manager->submit(httpArtifact("stop.bin"), tmp.path(), {}, false));

    auto listed = manager->listActiveOrRecent();
    ASSERT_EQ(listed.size(), 2u);
    for (const auto& entry : listed) {
        EXPECT_NE(entry.record.status, TransferStatus::Done);
        EXPECT_NE(entry.key, "ok.bin");
    }
    EXPECT_EQ(manager->getProgress("ok.bin").status, TransferStatus::Done);
}

TEST_F(TransferManagerTest, ReapUsesConfiguredRetention) {
    TransferRecord old;
    old.status = TransferStatus::Done;
    auto registry = std::make_shared<TransferRegistry>();
    old.finishedAt = registry->now() - 31s;
    registry->put("old", old);

    TransferManager manager{fastConfig(), std::make_shared<FakeHttpAdapter>(),
                            std::make_unique<CountingStrategy>(httpCalls, succeed), nullptr,
                            registry};
    EXPECT_EQ(manager.reapFinished(), 1u);
    EXPECT_EQ(manager.getProgress("old").status, TransferStatus::Idle);
}

TEST_F(TransferManagerTest, DestructorStopsRunningWorkers) {
    std::atomic<bool> observedStop{false};
    {
        auto manager = makeManager(std::make_shared<FakeHttpAdapter>(),
                                   [&](const TransferJob&, std::stop_token stop,
                                       const ProgressReporter&) -> Result<TransferStatus> {
                                       while (!stop.stop_requested())
                                           std::this_thread::sleep_for(5ms);
                                       observedStop = true;
                                       return TransferStatus::Stopped;
                                   });
        ASSERT_TRUE(manager->submit(httpArtifact("loop.bin"), tmp.path()));
    }
    EXPECT_TRUE(observedStop.load());
}

TEST_F(TransferManagerTest, StalledDownloadEndsInErrorAndReleasesKey) {
    auto http = std::make_shared<FakeHttpAdapter>(std::string(4096, 's'));
    http->chunkSize = 512;
    http->probeSize = std::nullopt;
    http->stallAfterChunks = 1;
    auto cfg = fastConfig();
    cfg.fetch.readTimeout = 1s;
    TransferManager manager{cfg, http};

    ASSERT_TRUE(manager.submit(httpArtifact("stalled.bin"), tmp.path()));
    manager.drain();

    auto rec = manager.getProgress("stalled.bin");
    EXPECT_EQ(rec.status, TransferStatus::Error);
    EXPECT_EQ(rec.errorMessage.value_or(""), "HTTP request error: fetch(GET): Timeout was reached");

    // The key is free again: a resubmission starts a new transfer
    http->stallAfterChunks.reset();
    auto retry = manager.submit(httpArtifact("stalled.bin"), tmp.path(), {}, false);
    ASSERT_TRUE(retry);
    EXPECT_EQ(retry.value().status, TransferStatus::Done);
    EXPECT_EQ(http->fetchCalls.load(), 2);
}
