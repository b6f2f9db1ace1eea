#include "pipeline/TaskState.hpp"

#include <algorithm>
#include <stdexcept>

using namespace aax::pipeline;

std::string aax::pipeline::to_string(const Stage s) {
    switch (s) {
        case Stage::Waiting: return "waiting";
        case Stage::Downloading: return "downloading";
        case Stage::Converting: return "converting";
        case Stage::Uploading: return "uploading";
        case Stage::Completed: return "completed";
    }
    return "unknown";
}

TaskState::TaskState(std::string id, std::string itemId)
    : id_(std::move(id)), itemId_(std::move(itemId)), startedAt_(Clock::now()) {}

double TaskState::overallProgress() const {
    if (stage_ == Stage::Completed) return 1.0;
    const double overall = needsUpload_ ? 0.5 * download_ + 0.5 * upload_ : download_;
    return std::clamp(overall, 0.0, 1.0);
}

bool TaskState::isActive() const {
    return stage_ == Stage::Downloading || stage_ == Stage::Converting || stage_ == Stage::Uploading;
}

void TaskState::ensureMutable(const char* op) const {
    if (stage_ == Stage::Completed)
        throw std::logic_error(std::string("TaskState::") + op + " called on completed task " + id_);
}

double TaskState::advance(const double current, const double next) {
    return std::max(current, std::clamp(next, 0.0, 1.0));
}

void TaskState::setNeedsUpload(const bool needsUpload) {
    ensureMutable("setNeedsUpload");
    if (needsUploadDecided_) throw std::logic_error("needsUpload already decided for task " + id_);
    if (progressRecorded_) throw std::logic_error("needsUpload must be decided before progress for task " + id_);
    needsUpload_ = needsUpload;
    needsUploadDecided_ = true;
}

void TaskState::setDownloadId(std::string downloadId) {
    ensureMutable("setDownloadId");
    downloadId_ = std::move(downloadId);
}

void TaskState::setDownloadProgress(const double p) {
    ensureMutable("setDownloadProgress");
    progressRecorded_ = true;
    stage_ = Stage::Downloading;
    download_ = advance(download_, p);
}

void TaskState::setDownloadCompleted() {
    ensureMutable("setDownloadCompleted");
    progressRecorded_ = true;
    download_ = 1.0;
}

void TaskState::setConverting() {
    ensureMutable("setConverting");
    progressRecorded_ = true;
    download_ = 1.0;
    stage_ = Stage::Converting;
}

void TaskState::setUploadProgress(const double p) {
    ensureMutable("setUploadProgress");
    progressRecorded_ = true;
    download_ = 1.0;
    stage_ = Stage::Uploading;
    upload_ = advance(upload_, p);
}

void TaskState::setUploadCompleted() {
    ensureMutable("setUploadCompleted");
    progressRecorded_ = true;
    upload_ = 1.0;
}

void TaskState::setCompleted() {
    ensureMutable("setCompleted");
    progressRecorded_ = true;
    download_ = 1.0;
    upload_ = 1.0;
    stage_ = Stage::Completed;
    completedAt_ = Clock::now();
}

TaskSnapshot TaskState::snapshot() const {
    return {id_, itemId_, stage_, overallProgress(), downloadId_};
}
