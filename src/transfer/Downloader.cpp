#include "transfer/Downloader.hpp"
#include "transfer/ProgressThrottle.hpp"
#include "storage/Probe.hpp"
#include "concurrency/ThreadPool.hpp"
#include "log/Registry.hpp"

#include <boost/asio/executor_work_guard.hpp>
#include <boost/asio/post.hpp>
#include <algorithm>
#include <cerrno>
#include <ranges>

using namespace aax::transfer;
using namespace aax::error;
using namespace aax::log;
using namespace aax::concurrency;
namespace fs = std::filesystem;

namespace {

double toMB(const uint64_t bytes) { return static_cast<double>(bytes) / static_cast<double>(aax::config::MB); }

bool isStorageErrno(const int err) {
    return err == ENOSPC || err == ENOENT || err == EMFILE || err == ENFILE || err == EDQUOT || err == EROFS;
}

}

std::string aax::transfer::to_string(const DownloadStatus s) {
    switch (s) {
        case DownloadStatus::Waiting: return "waiting";
        case DownloadStatus::Downloading: return "downloading";
        case DownloadStatus::Moving: return "moving";
        case DownloadStatus::Completed: return "completed";
        case DownloadStatus::Failed: return "failed";
        case DownloadStatus::Cancelled: return "cancelled";
    }
    return "unknown";
}

Downloader::Downloader(boost::asio::io_context& ioc,
                       ThreadPool& pool,
                       std::shared_ptr<Transport> transport,
                       std::shared_ptr<storage::Probe> probe,
                       storage::Layout layout,
                       config::StorageConfig storageCfg,
                       config::TransferConfig transferCfg)
    : ioc_(ioc), pool_(pool), transport_(std::move(transport)), probe_(std::move(probe)),
      layout_(std::move(layout)), storageCfg_(std::move(storageCfg)), transferCfg_(std::move(transferCfg)) {
    if (!transport_ || !probe_) throw std::invalid_argument("Downloader requires a transport and a storage probe");
}

template <typename Fn>
void Downloader::dispatch(Fn&& fn) {
    boost::asio::post(ioc_, [fn = std::forward<Fn>(fn), guard = boost::asio::make_work_guard(ioc_)]() mutable {
        fn();
    });
}

void Downloader::downloadFile(const std::string& id,
                              const std::string& url,
                              const std::string& itemId,
                              DownloadCompletion completion,
                              ProgressCallback onProgress) {
    if (jobs_.contains(itemId)) {
        Registry::transfer()->warn("[Downloader] Download already in progress for {}", itemId);
        boost::asio::post(ioc_, [completion = std::move(completion), itemId] {
            completion(Error::alreadyInProgress("Download for " + itemId));
        });
        return;
    }

    auto job = std::make_shared<DownloadJob>(id, itemId, url, layout_.transientDir(),
                                             layout_.transientFile(itemId, nextSeq_++),
                                             std::move(completion), std::move(onProgress));
    jobs_.emplace(itemId, job);

    Registry::transfer()->info("[Downloader] Queued download {} for item {}", id, itemId);

    pool_.submit(std::make_shared<FunctionTask>("download:" + itemId, [this, job] { run(job); }));
}

void Downloader::run(const std::shared_ptr<DownloadJob>& job) {
    std::optional<uint64_t> estimate;
    try {
        estimate = preflight(job);
        if (job->cancelRequested.load()) return;

        dispatch([this, job] { setStatus(job, DownloadStatus::Downloading); });

        ProgressThrottle throttle(transferCfg_.progress_interval);
        const ByteProgress onBytes = [&](const uint64_t done, const uint64_t total) {
            if (!throttle.admit(done, total)) return;
            const auto denom = total > 0 ? total : estimate.value_or(0);
            if (denom == 0) return;
            const double p = std::min(1.0, static_cast<double>(done) / static_cast<double>(denom));
            dispatch([this, job, p] { pushProgress(job, p); });
        };

        transport_->fetch(job->sourceUrl, job->destFile, onBytes, job->cancelRequested);

        dispatch([this, job] {
            pushProgress(job, 1.0);
            setStatus(job, DownloadStatus::Moving);
        });

        auto moved = moveToStable(job);
        dispatch([this, job, moved = std::move(moved)]() mutable { finish(job, std::move(moved)); });
    } catch (const Error& e) {
        if (e.isCancelled()) {
            std::error_code ec;
            fs::remove(job->destFile, ec);
        }
        dispatch([this, job, e] { finish(job, e); });
    } catch (const TransferError& e) {
        if (e.kind() == TransferError::Kind::Aborted) {
            std::error_code ec;
            fs::remove(job->destFile, ec);
            dispatch([this, job] { finish(job, Error::cancelled("Download for " + job->itemId)); });
            return;
        }
        auto mapped = mapTransferError(job, e, estimate);
        dispatch([this, job, mapped = std::move(mapped)] { finish(job, mapped); });
    } catch (const std::exception& e) {
        dispatch([this, job, msg = std::string(e.what())] { finish(job, Error::unknown(msg)); });
    }
}

std::optional<uint64_t> Downloader::preflight(const std::shared_ptr<DownloadJob>& job) {
    fs::create_directories(job->destDir);

    const auto estimate = probe_->estimateRemoteSize(job->sourceUrl);
    const auto availableMB = toMB(probe_->availableBytes(job->destDir));

    if (estimate) {
        const double requiredMB = toMB(*estimate) + static_cast<double>(storageCfg_.download_margin_mb);
        if (availableMB < requiredMB) throw Error::insufficientStorage(requiredMB, availableMB);
    } else {
        const auto requiredMB = static_cast<double>(storageCfg_.fallback_required_mb);
        if (availableMB < requiredMB) throw Error::insufficientStorage(requiredMB, availableMB);
    }

    dispatch([this, job, estimate] {
        if (isCurrent(job)) job->estimatedSizeBytes = estimate;
    });

    return estimate;
}

fs::path Downloader::moveToStable(const std::shared_ptr<DownloadJob>& job) const {
    if (job->cancelRequested.load()) throw Error::cancelled("Download for " + job->itemId);

    const auto& rawDir = layout_.rawDir();
    fs::create_directories(rawDir);

    const auto availableMB = toMB(probe_->availableBytes(rawDir));
    const auto reserveMB = static_cast<double>(storageCfg_.move_reserve_mb);
    if (availableMB < reserveMB) throw Error::insufficientStorage(reserveMB, availableMB);

    const auto move = [](const fs::path& src, const fs::path& dst) {
        std::error_code ec;
        fs::remove(dst, ec);
        fs::rename(src, dst, ec);
        if (ec == std::errc::cross_device_link) {
            ec.clear();
            fs::copy_file(src, dst, fs::copy_options::overwrite_existing, ec);
            if (!ec) fs::remove(src, ec);
        }
        if (ec) throw Error::fileMoveFailed(src.filename().string() + ": " + ec.message());
        Registry::storage()->debug("[Downloader] Moved {} -> {}", src.string(), dst.string());
    };

    std::optional<fs::path> payload;
    std::error_code ec;
    if (fs::is_regular_file(job->destFile, ec)) {
        payload = layout_.rawFile(job->itemId);
        move(job->destFile, *payload);
    }

    // Companion files; in-flight .part files belong to other attempts
    for (const auto& src : storage::Layout::filesContaining(job->destDir, job->itemId)) {
        if (src.extension() == storage::Layout::PARTIAL_EXTENSION) continue;
        const auto dst = rawDir / src.filename();
        move(src, dst);
        if (!payload && dst.extension() == storage::Layout::RAW_EXTENSION) payload = dst;
    }

    if (!payload) throw Error::fileMoveFailed("no " + std::string(storage::Layout::RAW_EXTENSION) + " file found for " + job->itemId);
    return *payload;
}

Error Downloader::mapTransferError(const std::shared_ptr<DownloadJob>& job, const TransferError& e,
                                   const std::optional<uint64_t>& estimate) const {
    if (e.kind() == TransferError::Kind::LocalWrite && (e.sysErrno() == 0 || isStorageErrno(e.sysErrno()))) {
        double availableMB = 0.0;
        try {
            availableMB = toMB(probe_->availableBytes(job->destDir));
        } catch (const std::exception& probeErr) {
            Registry::storage()->warn("[Downloader] Could not re-check free space: {}", probeErr.what());
        }
        const double requiredMB = estimate
            ? toMB(*estimate) + static_cast<double>(storageCfg_.download_margin_mb)
            : static_cast<double>(storageCfg_.fallback_required_mb);
        return Error::insufficientStorage(requiredMB, availableMB);
    }
    return Error::unknown(e.what());
}

bool Downloader::isCurrent(const std::shared_ptr<DownloadJob>& job) const {
    const auto it = jobs_.find(job->itemId);
    return it != jobs_.end() && it->second == job;
}

void Downloader::setStatus(const std::shared_ptr<DownloadJob>& job, const DownloadStatus status) {
    if (!isCurrent(job)) return;
    job->status = status;
    Registry::transfer()->debug("[Downloader] {} -> {}", job->itemId, to_string(status));
}

void Downloader::pushProgress(const std::shared_ptr<DownloadJob>& job, const double progress) {
    if (!isCurrent(job)) return;
    job->progress = std::max(job->progress, std::clamp(progress, 0.0, 1.0));
    if (job->onProgress) job->onProgress(job->progress);
}

void Downloader::finish(const std::shared_ptr<DownloadJob>& job, Expected<fs::path> result) {
    // Cancelled jobs were already resolved and removed; anything the worker
    // produced afterwards is stale.
    if (!isCurrent(job)) {
        Registry::transfer()->debug("[Downloader] Dropping late result for {}", job->itemId);
        return;
    }

    jobs_.erase(job->itemId);

    if (const auto* err = std::get_if<Error>(&result)) {
        job->status = err->isCancelled() ? DownloadStatus::Cancelled : DownloadStatus::Failed;
        Registry::transfer()->error("[Downloader] Download {} for {} failed: {}", job->id, job->itemId, err->what());
        removePartials(job->itemId);
    } else {
        job->status = DownloadStatus::Completed;
        job->progress = 1.0;
        Registry::transfer()->info("[Downloader] Download {} for {} completed: {}",
                                   job->id, job->itemId, std::get<fs::path>(result).string());
    }

    if (job->completion) job->completion(std::move(result));
}

void Downloader::cancelDownload(const std::string& itemId) {
    const auto it = jobs_.find(itemId);
    if (it == jobs_.end()) return;

    const auto job = it->second;
    job->cancelRequested.store(true);
    job->status = DownloadStatus::Cancelled;
    jobs_.erase(it);

    Registry::transfer()->info("[Downloader] Cancelled download {} for {}", job->id, itemId);

    removePartials(itemId);
    if (job->completion) job->completion(Error::cancelled("Download for " + itemId));
}

void Downloader::cancelAllDownloads() {
    std::vector<std::string> ids;
    ids.reserve(jobs_.size());
    for (const auto& id : jobs_ | std::views::keys) ids.push_back(id);
    for (const auto& id : ids) cancelDownload(id);
}

bool Downloader::isDownloading(const std::string& itemId) const {
    return jobs_.contains(itemId);
}

double Downloader::getDownloadProgress(const std::string& itemId) const {
    const auto it = jobs_.find(itemId);
    return it == jobs_.end() ? 0.0 : it->second->progress;
}

DownloadStatus Downloader::getDownloadStatus(const std::string& itemId) const {
    const auto it = jobs_.find(itemId);
    return it == jobs_.end() ? DownloadStatus::Completed : it->second->status;
}

StorageInfo Downloader::getStorageInfo() const {
    StorageInfo info;
    try {
        info.availableMB = toMB(probe_->availableBytes(layout_.dataDir()));
    } catch (const std::exception& e) {
        Registry::storage()->warn("[Downloader] Free space query failed: {}", e.what());
    }
    for (const auto& job : jobs_ | std::views::values)
        if (job->estimatedSizeBytes) info.totalActiveMB += toMB(*job->estimatedSizeBytes);
    return info;
}

void Downloader::deleteAllFiles() {
    cancelAllDownloads();

    std::error_code ec;
    for (const auto& dir : {layout_.rawDir(), layout_.convertedDir()}) {
        const auto removed = fs::remove_all(dir, ec);
        if (ec) Registry::storage()->error("[Downloader] Failed to remove {}: {}", dir.string(), ec.message());
        else Registry::storage()->info("[Downloader] Removed {} ({} entries)", dir.string(), removed);
        ec.clear();
    }

    cleanupCache();
}

void Downloader::cleanupCache() {
    std::error_code ec;
    const auto& dir = layout_.transientDir();
    if (!fs::is_directory(dir, ec)) return;

    for (const auto& entry : fs::directory_iterator(dir, ec)) {
        // Leave files of downloads that are still running alone
        const auto name = entry.path().filename().string();
        if (std::ranges::any_of(jobs_ | std::views::keys, [&](const auto& id) { return name.find(id) != std::string::npos; }))
            continue;
        std::error_code rmEc;
        fs::remove_all(entry.path(), rmEc);
        if (rmEc) Registry::storage()->warn("[Downloader] Could not remove {}: {}", entry.path().string(), rmEc.message());
    }
}

void Downloader::removePartials(const std::string& itemId) const {
    for (const auto& f : storage::Layout::filesContaining(layout_.transientDir(), itemId)) {
        std::error_code ec;
        fs::remove(f, ec);
        if (ec) Registry::storage()->warn("[Downloader] Could not remove partial {}: {}", f.string(), ec.message());
    }
}
