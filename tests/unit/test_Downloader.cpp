#include "transfer/Downloader.hpp"
#include "concurrency/ThreadPool.hpp"
#include "fakes.hpp"

#include <gtest/gtest.h>

using namespace aax;
using namespace aax::transfer;
using namespace aax::test;
using aax::error::Error;
using aax::error::Code;

class DownloaderTest : public ::testing::Test {
protected:
    TempDir tmp;
    config::StorageConfig storageCfg;
    config::TransferConfig transferCfg;
    std::shared_ptr<FakeTransport> transport = std::make_shared<FakeTransport>();
    std::shared_ptr<FakeProbe> probe = std::make_shared<FakeProbe>();

    boost::asio::io_context ioc;
    std::unique_ptr<concurrency::ThreadPool> pool;
    std::unique_ptr<Downloader> downloader;

    std::optional<error::Expected<fs::path>> result;

    void SetUp() override {
        storageCfg.data_dir = tmp.path() / "data";
        storageCfg.transient_dir = tmp.path() / "cache";
        transferCfg.progress_interval = std::chrono::milliseconds(0);

        storage::Layout layout(storageCfg);
        layout.ensureDirectories();

        pool = std::make_unique<concurrency::ThreadPool>(2);
        downloader = std::make_unique<Downloader>(ioc, *pool, transport, probe, layout, storageCfg, transferCfg);
    }

    void TearDown() override {
        downloader->cancelAllDownloads();
        pool->stop();
    }

    void start(const std::string& itemId, ProgressCallback onProgress = {}) {
        downloader->downloadFile(itemId, "https://cdn.example/" + itemId + ".aax", itemId,
                                 [this](error::Expected<fs::path> r) { result = std::move(r); },
                                 std::move(onProgress));
    }

    bool waitForResult() { return runUntil(ioc, [&] { return result.has_value(); }); }

    const Error& resultError() const { return std::get<Error>(*result); }

    std::vector<fs::path> partialsFor(const std::string& itemId) const {
        std::vector<fs::path> out;
        for (const auto& f : storage::Layout::filesContaining(downloader->layout().transientDir(), itemId))
            if (f.extension() == storage::Layout::PARTIAL_EXTENSION) out.push_back(f);
        return out;
    }
};

TEST_F(DownloaderTest, MovesFinishedPayloadIntoRawArea) {
    std::vector<double> progress;
    start("B00ITEM", [&](const double p) { progress.push_back(p); });
    EXPECT_TRUE(downloader->isDownloading("B00ITEM"));

    ASSERT_TRUE(waitForResult());
    ASSERT_FALSE(error::failed(*result)) << resultError().what();

    const auto path = std::get<fs::path>(*result);
    EXPECT_EQ(path, downloader->layout().rawFile("B00ITEM"));
    EXPECT_TRUE(fs::exists(path));
    EXPECT_TRUE(partialsFor("B00ITEM").empty());

    ASSERT_FALSE(progress.empty());
    EXPECT_DOUBLE_EQ(progress.back(), 1.0);
    EXPECT_TRUE(std::ranges::is_sorted(progress));

    EXPECT_FALSE(downloader->isDownloading("B00ITEM"));
    EXPECT_EQ(downloader->activeCount(), 0u);
}

TEST_F(DownloaderTest, RejectsWhenEstimatePlusMarginDoesNotFit) {
    probe->estimate = 500 * MB;
    probe->available = 300 * MB;

    start("B00ITEM");
    ASSERT_TRUE(waitForResult());
    ASSERT_TRUE(error::failed(*result));

    const auto& e = resultError();
    EXPECT_EQ(e.code(), Code::InsufficientStorage);
    EXPECT_DOUBLE_EQ(e.requiredMB(), 600.0);
    EXPECT_DOUBLE_EQ(e.availableMB(), 300.0);
    EXPECT_EQ(transport->calls.load(), 0);
}

TEST_F(DownloaderTest, UnknownSizeRequiresFallbackSpace) {
    probe->estimate = std::nullopt;
    probe->available = 250 * MB;

    start("B00ITEM");
    ASSERT_TRUE(waitForResult());
    ASSERT_TRUE(error::failed(*result));
    EXPECT_EQ(resultError().code(), Code::InsufficientStorage);
    EXPECT_DOUBLE_EQ(resultError().requiredMB(), 300.0);
    EXPECT_EQ(transport->calls.load(), 0);
}

TEST_F(DownloaderTest, UnknownSizeProceedsWithEnoughSpace) {
    probe->estimate = std::nullopt;
    probe->available = 400 * MB;

    start("B00ITEM");
    ASSERT_TRUE(waitForResult());
    EXPECT_FALSE(error::failed(*result));
    EXPECT_EQ(transport->calls.load(), 1);
}

TEST_F(DownloaderTest, SecondRequestForSameItemIsRejected) {
    transport->block = true;
    start("B00ITEM");

    std::optional<error::Expected<fs::path>> second;
    downloader->downloadFile("B00ITEM", "https://cdn.example/other", "B00ITEM",
                             [&](error::Expected<fs::path> r) { second = std::move(r); });

    ASSERT_TRUE(runUntil(ioc, [&] { return second.has_value(); }));
    ASSERT_TRUE(error::failed(*second));
    EXPECT_EQ(std::get<Error>(*second).code(), Code::AlreadyInProgress);
    EXPECT_TRUE(downloader->isDownloading("B00ITEM"));
    EXPECT_FALSE(result.has_value());
}

TEST_F(DownloaderTest, CancelResolvesImmediately) {
    transport->block = true;
    start("B00ITEM");
    ASSERT_TRUE(runUntil(ioc, [&] { return transport->started.load(); }));

    downloader->cancelDownload("B00ITEM");

    ASSERT_TRUE(result.has_value());
    ASSERT_TRUE(error::failed(*result));
    EXPECT_EQ(resultError().code(), Code::Cancelled);
    EXPECT_FALSE(downloader->isDownloading("B00ITEM"));

    // The worker's own abort report arrives later and is dropped
    result.reset();
    ioc.restart();
    ioc.run_for(std::chrono::milliseconds(100));
    EXPECT_FALSE(result.has_value());
    EXPECT_FALSE(fs::exists(downloader->layout().rawFile("B00ITEM")));
}

TEST_F(DownloaderTest, RestartAfterCancelDoesNotShareTheTransientFile) {
    transport->block = true;
    start("B00ITEM");
    ASSERT_TRUE(runUntil(ioc, [&] { return transport->started.load(); }));
    const auto firstPartials = partialsFor("B00ITEM");
    ASSERT_EQ(firstPartials.size(), 1u);

    // The first worker is still unwinding its abort while the second runs
    transport->block = false;
    downloader->cancelDownload("B00ITEM");
    ASSERT_TRUE(error::failed(*result));
    result.reset();

    transport->bytes = 4 * MB;
    start("B00ITEM");
    ASSERT_TRUE(waitForResult());
    ASSERT_FALSE(error::failed(*result)) << resultError().what();

    const auto path = std::get<fs::path>(*result);
    EXPECT_EQ(path, downloader->layout().rawFile("B00ITEM"));
    EXPECT_EQ(fs::file_size(path), 4 * MB);
    EXPECT_EQ(transport->calls.load(), 2);
    EXPECT_FALSE(fs::exists(firstPartials.front()));
}

TEST_F(DownloaderTest, CancelAllResolvesEveryJob) {
    transport->block = true;
    int cancelled = 0;
    for (const auto* id : {"B00ONE", "B00TWO"})
        downloader->downloadFile(id, "https://cdn.example/x", id, [&](error::Expected<fs::path> r) {
            if (error::failed(r) && std::get<Error>(r).isCancelled()) ++cancelled;
        });

    EXPECT_EQ(downloader->activeCount(), 2u);
    downloader->cancelAllDownloads();
    EXPECT_EQ(cancelled, 2);
    EXPECT_EQ(downloader->activeCount(), 0u);
}

TEST_F(DownloaderTest, MissingPayloadIsAMoveFailure) {
    transport->writeAs = "B00ITEM.voucher";

    start("B00ITEM");
    ASSERT_TRUE(waitForResult());
    ASSERT_TRUE(error::failed(*result));
    EXPECT_EQ(resultError().code(), Code::FileMoveFailed);
    EXPECT_EQ(resultError().category(), error::Category::Storage);
    EXPECT_FALSE(resultError().retryable());
}

TEST_F(DownloaderTest, CompanionFilesMoveWithThePayload) {
    makeFile(downloader->layout().transientDir() / "B00ITEM.voucher", 16);

    start("B00ITEM");
    ASSERT_TRUE(waitForResult());
    ASSERT_FALSE(error::failed(*result));
    EXPECT_TRUE(fs::exists(downloader->layout().rawDir() / "B00ITEM.voucher"));
}

TEST_F(DownloaderTest, MoveNeedsReserveSpace) {
    const auto rawDir = downloader->layout().rawDir();
    probe->availableFor = [rawDir](const fs::path& p) { return p == rawDir ? 10 * MB : 400 * MB; };
    transport->bytes = 1024;

    start("B00ITEM");

    ASSERT_TRUE(waitForResult());
    ASSERT_TRUE(error::failed(*result));
    EXPECT_EQ(resultError().code(), Code::InsufficientStorage);
    EXPECT_DOUBLE_EQ(resultError().requiredMB(), 50.0);
}

TEST_F(DownloaderTest, LocalWriteFailureMapsToInsufficientStorage) {
    transport->failWith = TransferError(TransferError::Kind::LocalWrite, "write failed", ENOSPC);

    start("B00ITEM");
    ASSERT_TRUE(waitForResult());
    ASSERT_TRUE(error::failed(*result));
    EXPECT_EQ(resultError().code(), Code::InsufficientStorage);
    EXPECT_DOUBLE_EQ(resultError().requiredMB(), 300.0);
}

TEST_F(DownloaderTest, NetworkFailureIsUnknownError) {
    transport->failWith = TransferError(TransferError::Kind::Http, "HTTP 500");

    start("B00ITEM");
    ASSERT_TRUE(waitForResult());
    ASSERT_TRUE(error::failed(*result));
    EXPECT_EQ(resultError().code(), Code::UnknownError);
    EXPECT_TRUE(resultError().retryable());
}

TEST_F(DownloaderTest, LookupsForUnknownItems) {
    EXPECT_FALSE(downloader->isDownloading("nope"));
    EXPECT_DOUBLE_EQ(downloader->getDownloadProgress("nope"), 0.0);
    EXPECT_EQ(downloader->getDownloadStatus("nope"), DownloadStatus::Completed);
}

TEST_F(DownloaderTest, StorageInfoSumsActiveEstimates) {
    transport->block = true;
    probe->available = 2048 * MB;
    start("B00ITEM");
    ASSERT_TRUE(runUntil(ioc, [&] { return downloader->getStorageInfo().totalActiveMB > 0.0; }));

    const auto info = downloader->getStorageInfo();
    EXPECT_DOUBLE_EQ(info.availableMB, 2048.0);
    EXPECT_DOUBLE_EQ(info.totalActiveMB, 200.0);
}

TEST_F(DownloaderTest, DeleteAllFilesClearsEveryArea) {
    const auto& layout = downloader->layout();
    makeFile(layout.rawFile("B00OLD"), 16);
    makeFile(layout.convertedFile("B00OLD"), 16);
    makeFile(layout.transientDir() / "B00OLD.part", 16);

    downloader->deleteAllFiles();

    EXPECT_FALSE(fs::exists(layout.rawFile("B00OLD")));
    EXPECT_FALSE(fs::exists(layout.convertedFile("B00OLD")));
    EXPECT_FALSE(fs::exists(layout.transientDir() / "B00OLD.part"));
}

TEST_F(DownloaderTest, CleanupSparesActiveDownloads) {
    transport->block = true;
    start("B00LIVE");
    ASSERT_TRUE(runUntil(ioc, [&] { return transport->started.load(); }));

    const auto& layout = downloader->layout();
    makeFile(layout.transientDir() / "B00STALE.part", 16);

    downloader->cleanupCache();

    EXPECT_FALSE(fs::exists(layout.transientDir() / "B00STALE.part"));
    EXPECT_EQ(partialsFor("B00LIVE").size(), 1u);
}
