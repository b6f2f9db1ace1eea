#pragma once

#include "error/Error.hpp"
#include "transfer/DownloadJob.hpp"

#include <atomic>
#include <filesystem>
#include <functional>
#include <string>

namespace aax::transfer {

enum class UploadStatus { Waiting, Uploading, Completed, Failed, Cancelled };

std::string to_string(UploadStatus s);

// Resolves with the remote URL of the stored object.
using UploadCompletion = std::function<void(error::Expected<std::string>)>;

struct UploadJob {
    const std::string id;
    const std::filesystem::path sourceFile;
    const std::string destPath;

    double progress = 0.0;
    UploadStatus status = UploadStatus::Waiting;
    std::string remoteUrl;
    std::atomic<bool> cancelRequested{false};

    UploadCompletion completion;
    ProgressCallback onProgress;

    UploadJob(std::string id, std::filesystem::path sourceFile, std::string destPath,
              UploadCompletion completion, ProgressCallback onProgress)
        : id(std::move(id)), sourceFile(std::move(sourceFile)), destPath(std::move(destPath)),
          completion(std::move(completion)), onProgress(std::move(onProgress)) {}
};

}
