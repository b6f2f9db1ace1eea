#pragma once

#include "transfer/UploadJob.hpp"
#include "config/Config.hpp"

#include <boost/asio/io_context.hpp>
#include <memory>
#include <unordered_map>

namespace aax::concurrency { class ThreadPool; }
namespace aax::cloud { class ObjectStore; }

namespace aax::transfer {

// One upload per id, mirroring the Downloader's threading contract.
class Uploader {
public:
    Uploader(boost::asio::io_context& ioc,
             concurrency::ThreadPool& pool,
             std::shared_ptr<cloud::ObjectStore> store,
             config::TransferConfig cfg);

    void uploadFile(const std::string& id,
                    const std::filesystem::path& file,
                    const std::string& destPath,
                    UploadCompletion completion,
                    ProgressCallback onProgress = {});

    void cancelUpload(const std::string& id);
    void cancelAllUploads();

    [[nodiscard]] bool isUploading(const std::string& id) const;
    [[nodiscard]] double getUploadProgress(const std::string& id) const;
    [[nodiscard]] UploadStatus getUploadStatus(const std::string& id) const;
    [[nodiscard]] size_t activeCount() const { return jobs_.size(); }

private:
    boost::asio::io_context& ioc_;
    concurrency::ThreadPool& pool_;
    std::shared_ptr<cloud::ObjectStore> store_;
    config::TransferConfig cfg_;

    std::unordered_map<std::string, std::shared_ptr<UploadJob>> jobs_;

    void run(const std::shared_ptr<UploadJob>& job);

    template <typename Fn>
    void dispatch(Fn&& fn);
    [[nodiscard]] bool isCurrent(const std::shared_ptr<UploadJob>& job) const;
    void pushProgress(const std::shared_ptr<UploadJob>& job, double progress);
    void finish(const std::shared_ptr<UploadJob>& job, error::Expected<std::string> result);
};

}
