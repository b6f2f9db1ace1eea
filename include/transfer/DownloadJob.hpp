#pragma once

#include "error/Error.hpp"

#include <atomic>
#include <cstdint>
#include <filesystem>
#include <functional>
#include <optional>
#include <string>

namespace aax::transfer {

enum class DownloadStatus { Waiting, Downloading, Moving, Completed, Failed, Cancelled };

std::string to_string(DownloadStatus s);

using DownloadCompletion = std::function<void(error::Expected<std::filesystem::path>)>;
using ProgressCallback = std::function<void(double)>;

// Everything except cancelRequested is owned by the io_context thread. Workers
// only read the immutable request fields and poll the flag.
struct DownloadJob {
    const std::string id;
    const std::string itemId;
    const std::string sourceUrl;
    const std::filesystem::path destDir;
    const std::filesystem::path destFile;

    std::optional<uint64_t> estimatedSizeBytes;
    double progress = 0.0;
    DownloadStatus status = DownloadStatus::Waiting;
    std::atomic<bool> cancelRequested{false};

    DownloadCompletion completion;
    ProgressCallback onProgress;

    DownloadJob(std::string id, std::string itemId, std::string url,
                std::filesystem::path destDir, std::filesystem::path destFile,
                DownloadCompletion completion, ProgressCallback onProgress)
        : id(std::move(id)), itemId(std::move(itemId)), sourceUrl(std::move(url)),
          destDir(std::move(destDir)), destFile(std::move(destFile)),
          completion(std::move(completion)), onProgress(std::move(onProgress)) {}
};

}
