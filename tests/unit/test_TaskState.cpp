#include "pipeline/TaskState.hpp"

#include <gtest/gtest.h>
#include <stdexcept>

using namespace aax::pipeline;

class TaskStateTest : public ::testing::Test {
protected:
    TaskState task{"task-1", "B00ITEM"};
};

TEST_F(TaskStateTest, StartsWaitingWithNoProgress) {
    EXPECT_EQ(task.stage(), Stage::Waiting);
    EXPECT_DOUBLE_EQ(task.overallProgress(), 0.0);
    EXPECT_FALSE(task.isActive());
    EXPECT_FALSE(task.isCompleted());
    EXPECT_FALSE(task.completedAt().has_value());
}

TEST_F(TaskStateTest, DownloadOnlyWhenNoUploadIsNeeded) {
    task.setNeedsUpload(false);
    task.setDownloadProgress(0.4);
    EXPECT_DOUBLE_EQ(task.overallProgress(), 0.4);
    EXPECT_EQ(task.stage(), Stage::Downloading);
    EXPECT_TRUE(task.isActive());
}

TEST_F(TaskStateTest, BlendsDownloadAndUploadHalves) {
    task.setNeedsUpload(true);
    task.setDownloadProgress(0.5);
    EXPECT_DOUBLE_EQ(task.overallProgress(), 0.25);

    task.setDownloadCompleted();
    EXPECT_DOUBLE_EQ(task.overallProgress(), 0.5);

    task.setUploadProgress(0.5);
    EXPECT_DOUBLE_EQ(task.overallProgress(), 0.75);
    EXPECT_EQ(task.stage(), Stage::Uploading);
}

TEST_F(TaskStateTest, ProgressNeverMovesBackwards) {
    task.setNeedsUpload(false);
    task.setDownloadProgress(0.6);
    task.setDownloadProgress(0.3);
    EXPECT_DOUBLE_EQ(task.downloadProgress(), 0.6);
    EXPECT_DOUBLE_EQ(task.overallProgress(), 0.6);
}

TEST_F(TaskStateTest, ProgressIsClampedToUnitRange) {
    task.setNeedsUpload(true);
    task.setDownloadProgress(1.7);
    task.setUploadProgress(-2.0);
    EXPECT_DOUBLE_EQ(task.downloadProgress(), 1.0);
    EXPECT_DOUBLE_EQ(task.uploadProgress(), 0.0);
    EXPECT_LE(task.overallProgress(), 1.0);
}

TEST_F(TaskStateTest, ConvertingPinsDownloadAtFull) {
    task.setNeedsUpload(true);
    task.setConverting();
    EXPECT_EQ(task.stage(), Stage::Converting);
    EXPECT_DOUBLE_EQ(task.overallProgress(), 0.5);
}

TEST_F(TaskStateTest, NeedsUploadCanOnlyBeDecidedOnce) {
    task.setNeedsUpload(true);
    EXPECT_THROW(task.setNeedsUpload(false), std::logic_error);
    EXPECT_TRUE(task.needsUpload());
}

TEST_F(TaskStateTest, NeedsUploadMustPrecedeProgress) {
    task.setDownloadProgress(0.1);
    EXPECT_THROW(task.setNeedsUpload(true), std::logic_error);
}

TEST_F(TaskStateTest, CompletedIsTerminal) {
    task.setNeedsUpload(true);
    task.setDownloadProgress(0.2);
    task.setCompleted();

    EXPECT_TRUE(task.isCompleted());
    EXPECT_FALSE(task.isActive());
    EXPECT_DOUBLE_EQ(task.overallProgress(), 1.0);
    ASSERT_TRUE(task.completedAt().has_value());
    EXPECT_GE(*task.completedAt(), task.startedAt());

    EXPECT_THROW(task.setDownloadProgress(0.9), std::logic_error);
    EXPECT_THROW(task.setUploadProgress(0.9), std::logic_error);
    EXPECT_THROW(task.setConverting(), std::logic_error);
    EXPECT_THROW(task.setCompleted(), std::logic_error);
}

TEST_F(TaskStateTest, SnapshotCarriesIdentity) {
    task.setNeedsUpload(false);
    task.setDownloadId("B00ITEM");
    task.setDownloadProgress(0.5);

    const auto snap = task.snapshot();
    EXPECT_EQ(snap.taskId, "task-1");
    EXPECT_EQ(snap.itemId, "B00ITEM");
    EXPECT_EQ(snap.stage, Stage::Downloading);
    EXPECT_DOUBLE_EQ(snap.overallProgress, 0.5);
    ASSERT_TRUE(snap.downloadId.has_value());
    EXPECT_EQ(*snap.downloadId, "B00ITEM");
}
