#pragma once

#include "transfer/DownloadJob.hpp"
#include "transfer/Transport.hpp"
#include "storage/Layout.hpp"
#include "config/Config.hpp"

#include <boost/asio/io_context.hpp>
#include <memory>
#include <unordered_map>

namespace aax::concurrency { class ThreadPool; }
namespace aax::storage { class Probe; }

namespace aax::transfer {

struct StorageInfo {
    double availableMB = 0.0;
    double totalActiveMB = 0.0;   // sum of the estimates of in-flight downloads
};

// One download per item. All public methods must be called on the io_context
// thread; completions and progress callbacks are invoked there as well.
class Downloader {
public:
    Downloader(boost::asio::io_context& ioc,
               concurrency::ThreadPool& pool,
               std::shared_ptr<Transport> transport,
               std::shared_ptr<storage::Probe> probe,
               storage::Layout layout,
               config::StorageConfig storageCfg,
               config::TransferConfig transferCfg);

    // Resolves with the path of the .aax in the raw area, or an error. A second
    // request for an item that is already downloading fails with AlreadyInProgress.
    void downloadFile(const std::string& id,
                      const std::string& url,
                      const std::string& itemId,
                      DownloadCompletion completion,
                      ProgressCallback onProgress = {});

    // Resolves the pending completion with Cancelled before returning.
    void cancelDownload(const std::string& itemId);
    void cancelAllDownloads();

    [[nodiscard]] bool isDownloading(const std::string& itemId) const;
    [[nodiscard]] double getDownloadProgress(const std::string& itemId) const;
    [[nodiscard]] DownloadStatus getDownloadStatus(const std::string& itemId) const;
    [[nodiscard]] size_t activeCount() const { return jobs_.size(); }

    [[nodiscard]] StorageInfo getStorageInfo() const;

    // Cancels everything, then removes the raw and converted areas and empties the transient one.
    void deleteAllFiles();
    void cleanupCache();

    [[nodiscard]] const storage::Layout& layout() const { return layout_; }

private:
    boost::asio::io_context& ioc_;
    concurrency::ThreadPool& pool_;
    std::shared_ptr<Transport> transport_;
    std::shared_ptr<storage::Probe> probe_;
    storage::Layout layout_;
    config::StorageConfig storageCfg_;
    config::TransferConfig transferCfg_;

    std::unordered_map<std::string, std::shared_ptr<DownloadJob>> jobs_;
    uint64_t nextSeq_ = 1;

    // Worker side
    void run(const std::shared_ptr<DownloadJob>& job);
    std::optional<uint64_t> preflight(const std::shared_ptr<DownloadJob>& job);
    std::filesystem::path moveToStable(const std::shared_ptr<DownloadJob>& job) const;
    error::Error mapTransferError(const std::shared_ptr<DownloadJob>& job, const TransferError& e,
                                  const std::optional<uint64_t>& estimate) const;

    // io side
    template <typename Fn>
    void dispatch(Fn&& fn);
    [[nodiscard]] bool isCurrent(const std::shared_ptr<DownloadJob>& job) const;
    void setStatus(const std::shared_ptr<DownloadJob>& job, DownloadStatus status);
    void pushProgress(const std::shared_ptr<DownloadJob>& job, double progress);
    void finish(const std::shared_ptr<DownloadJob>& job, error::Expected<std::filesystem::path> result);

    void removePartials(const std::string& itemId) const;
};

}
