#pragma once

#include <chrono>
#include <optional>
#include <string>

namespace aax::pipeline {

enum class Stage { Waiting, Downloading, Converting, Uploading, Completed };

std::string to_string(Stage s);

struct TaskSnapshot {
    std::string taskId;
    std::string itemId;
    Stage stage = Stage::Waiting;
    double overallProgress = 0.0;
    std::optional<std::string> downloadId;
};

// Progress and stage of one processing task.
//
// overall = needsUpload ? 0.5 * download + 0.5 * upload : download
//
// Both components only ever grow and stay within [0, 1], so overall does too.
// needsUpload may be decided once, before any progress is recorded; once the
// task is completed every mutator throws std::logic_error.
class TaskState {
public:
    using Clock = std::chrono::system_clock;

    TaskState(std::string id, std::string itemId);

    [[nodiscard]] const std::string& id() const { return id_; }
    [[nodiscard]] const std::string& itemId() const { return itemId_; }
    [[nodiscard]] Stage stage() const { return stage_; }
    [[nodiscard]] double downloadProgress() const { return download_; }
    [[nodiscard]] double uploadProgress() const { return upload_; }
    [[nodiscard]] double overallProgress() const;
    [[nodiscard]] bool needsUpload() const { return needsUpload_; }
    [[nodiscard]] bool isActive() const;
    [[nodiscard]] bool isCompleted() const { return stage_ == Stage::Completed; }
    [[nodiscard]] Clock::time_point startedAt() const { return startedAt_; }
    [[nodiscard]] std::optional<Clock::time_point> completedAt() const { return completedAt_; }
    [[nodiscard]] const std::optional<std::string>& downloadId() const { return downloadId_; }

    void setNeedsUpload(bool needsUpload);
    void setDownloadId(std::string downloadId);

    void setDownloadProgress(double p);
    void setDownloadCompleted();          // also used when the download is skipped
    void setConverting();
    void setUploadProgress(double p);
    void setUploadCompleted();
    void setCompleted();

    [[nodiscard]] TaskSnapshot snapshot() const;

private:
    std::string id_, itemId_;
    Stage stage_ = Stage::Waiting;
    double download_ = 0.0, upload_ = 0.0;
    bool needsUpload_ = false;
    bool needsUploadDecided_ = false;
    bool progressRecorded_ = false;
    Clock::time_point startedAt_;
    std::optional<Clock::time_point> completedAt_;
    std::optional<std::string> downloadId_;

    void ensureMutable(const char* op) const;
    static double advance(double current, double next);
};

}
