#include "transfer/Uploader.hpp"
#include "transfer/ProgressThrottle.hpp"
#include "cloud/ObjectStore.hpp"
#include "concurrency/ThreadPool.hpp"
#include "log/Registry.hpp"

#include <boost/asio/executor_work_guard.hpp>
#include <boost/asio/post.hpp>
#include <algorithm>
#include <ranges>

using namespace aax::transfer;
using namespace aax::error;
using namespace aax::log;
using namespace aax::concurrency;

std::string aax::transfer::to_string(const UploadStatus s) {
    switch (s) {
        case UploadStatus::Waiting: return "waiting";
        case UploadStatus::Uploading: return "uploading";
        case UploadStatus::Completed: return "completed";
        case UploadStatus::Failed: return "failed";
        case UploadStatus::Cancelled: return "cancelled";
    }
    return "unknown";
}

Uploader::Uploader(boost::asio::io_context& ioc,
                   ThreadPool& pool,
                   std::shared_ptr<cloud::ObjectStore> store,
                   config::TransferConfig cfg)
    : ioc_(ioc), pool_(pool), store_(std::move(store)), cfg_(std::move(cfg)) {
    if (!store_) throw std::invalid_argument("Uploader requires an object store");
}

template <typename Fn>
void Uploader::dispatch(Fn&& fn) {
    boost::asio::post(ioc_, [fn = std::forward<Fn>(fn), guard = boost::asio::make_work_guard(ioc_)]() mutable {
        fn();
    });
}

void Uploader::uploadFile(const std::string& id,
                          const std::filesystem::path& file,
                          const std::string& destPath,
                          UploadCompletion completion,
                          ProgressCallback onProgress) {
    if (jobs_.contains(id)) {
        Registry::transfer()->warn("[Uploader] Upload already in progress for {}", id);
        boost::asio::post(ioc_, [completion = std::move(completion), id] {
            completion(Error::alreadyInProgress("Upload for " + id));
        });
        return;
    }

    auto job = std::make_shared<UploadJob>(id, file, destPath, std::move(completion), std::move(onProgress));
    jobs_.emplace(id, job);

    Registry::transfer()->info("[Uploader] Queued upload {} -> {}", file.string(), destPath);

    pool_.submit(std::make_shared<FunctionTask>("upload:" + id, [this, job] { run(job); }));
}

void Uploader::run(const std::shared_ptr<UploadJob>& job) {
    if (job->cancelRequested.load()) return;

    dispatch([this, job] {
        if (isCurrent(job)) job->status = UploadStatus::Uploading;
    });

    ProgressThrottle throttle(cfg_.progress_interval);
    const cloud::ObjectStore::ProgressFn onBytes = [&](const uint64_t sent, const uint64_t total) {
        if (total == 0 || !throttle.admit(sent, total)) return;
        const double p = std::min(1.0, static_cast<double>(sent) / static_cast<double>(total));
        dispatch([this, job, p] { pushProgress(job, p); });
    };

    try {
        auto url = store_->put(job->destPath, job->sourceFile, onBytes, job->cancelRequested);
        dispatch([this, job, url = std::move(url)]() mutable { finish(job, std::move(url)); });
    } catch (const std::exception& e) {
        if (job->cancelRequested.load()) return;   // already resolved by cancelUpload
        dispatch([this, job, msg = std::string(e.what())] { finish(job, Error::uploadFailed(msg)); });
    }
}

bool Uploader::isCurrent(const std::shared_ptr<UploadJob>& job) const {
    const auto it = jobs_.find(job->id);
    return it != jobs_.end() && it->second == job;
}

void Uploader::pushProgress(const std::shared_ptr<UploadJob>& job, const double progress) {
    if (!isCurrent(job)) return;
    job->progress = std::max(job->progress, std::clamp(progress, 0.0, 1.0));
    if (job->onProgress) job->onProgress(job->progress);
}

void Uploader::finish(const std::shared_ptr<UploadJob>& job, Expected<std::string> result) {
    if (!isCurrent(job)) {
        Registry::transfer()->debug("[Uploader] Dropping late result for {}", job->id);
        return;
    }

    jobs_.erase(job->id);

    if (const auto* err = std::get_if<Error>(&result)) {
        job->status = UploadStatus::Failed;
        Registry::transfer()->error("[Uploader] Upload {} failed: {}", job->id, err->what());
    } else {
        job->status = UploadStatus::Completed;
        job->progress = 1.0;
        job->remoteUrl = std::get<std::string>(result);
        if (job->onProgress) job->onProgress(1.0);
        Registry::transfer()->info("[Uploader] Upload {} completed: {}", job->id, job->remoteUrl);
    }

    if (job->completion) job->completion(std::move(result));
}

void Uploader::cancelUpload(const std::string& id) {
    const auto it = jobs_.find(id);
    if (it == jobs_.end()) return;

    const auto job = it->second;
    job->cancelRequested.store(true);
    job->status = UploadStatus::Cancelled;
    jobs_.erase(it);

    Registry::transfer()->info("[Uploader] Cancelled upload {}", id);

    if (job->completion) job->completion(Error::cancelled("Upload for " + id));
}

void Uploader::cancelAllUploads() {
    std::vector<std::string> ids;
    ids.reserve(jobs_.size());
    for (const auto& id : jobs_ | std::views::keys) ids.push_back(id);
    for (const auto& id : ids) cancelUpload(id);
}

bool Uploader::isUploading(const std::string& id) const {
    return jobs_.contains(id);
}

double Uploader::getUploadProgress(const std::string& id) const {
    const auto it = jobs_.find(id);
    return it == jobs_.end() ? 0.0 : it->second->progress;
}

UploadStatus Uploader::getUploadStatus(const std::string& id) const {
    const auto it = jobs_.find(id);
    return it == jobs_.end() ? UploadStatus::Completed : it->second->status;
}
