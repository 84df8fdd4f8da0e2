#include <gtest/gtest.h>

#include <string>
#include <chrono>
#include <fstream>
#include <stdexcept>

#include "job_status.h"
#include "ioutil.h"
#include "test_util.h"

using recsvc::JobStatusStore;
using recsvc::JobStatus;
using recsvc::JobState;
using recsvc::test::TempDir;

namespace {
    JobStatus makeStatus(const std::string &id, JobState state, double progress,
                         const std::string &message) {
        JobStatus status;
        status.job_id = id;
        status.status = state;
        status.progress = progress;
        status.message = message;
        status.updated_at = recsvc::Clock::now();
        return status;
    }
}

class JobStatusStoreTest : public ::testing::Test {
protected:
    TempDir tmp;
};

TEST_F(JobStatusStoreTest, UnknownJobIsNotFound) {
    JobStatusStore store(tmp.file("jobs"), std::chrono::hours(1));
    JobStatus status = store.get("retrain_missing");

    EXPECT_EQ(status.status, JobState::NotFound);
    EXPECT_EQ(status.message, "Job retrain_missing not found");
}

TEST_F(JobStatusStoreTest, LatestUpdateWins) {
    JobStatusStore store(tmp.file("jobs"), std::chrono::hours(1));
    store.put(makeStatus("job-1", JobState::Running, 0.2, "Starting model training"));
    store.put(makeStatus("job-1", JobState::Running, 0.55, "Epoch 5/10, Loss: 0.8123"));

    JobStatus status = store.get("job-1");
    EXPECT_EQ(status.status, JobState::Running);
    EXPECT_DOUBLE_EQ(status.progress, 0.55);
    EXPECT_EQ(status.message, "Epoch 5/10, Loss: 0.8123");
}

TEST_F(JobStatusStoreTest, StatusSurvivesNewStoreInstance) {
    {
        JobStatusStore store(tmp.file("jobs"), std::chrono::hours(1));
        JobStatus failed = makeStatus("job_2", JobState::Failed, 0.1, "no interactions found for training");
        failed.error = "no interactions found for training";
        store.put(failed);
    }
    JobStatusStore reopened(tmp.file("jobs"), std::chrono::hours(1));
    JobStatus status = reopened.get("job_2");

    EXPECT_EQ(status.status, JobState::Failed);
    EXPECT_EQ(status.error, "no interactions found for training");
}

TEST_F(JobStatusStoreTest, ExpiredStatusIsNotFoundAndPurged) {
    JobStatusStore store(tmp.file("jobs"), std::chrono::seconds(-10));
    store.put(makeStatus("old", JobState::Completed, 1.0, "Model training complete"));

    EXPECT_EQ(store.get("old").status, JobState::NotFound);
    EXPECT_EQ(store.purgeExpired(), 1u);
    EXPECT_EQ(store.purgeExpired(), 0u);
}

TEST_F(JobStatusStoreTest, MalformedDocumentIsNotFound) {
    JobStatusStore store(tmp.file("jobs"), std::chrono::hours(1));
    std::ofstream(recsvc::IOUtil::joinPath(tmp.file("jobs"), "broken.json")) << "not json";

    EXPECT_EQ(store.get("broken").status, JobState::NotFound);
}

TEST_F(JobStatusStoreTest, RejectsUnsafeJobIds) {
    JobStatusStore store(tmp.file("jobs"), std::chrono::hours(1));

    EXPECT_FALSE(JobStatusStore::isValidJobId(""));
    EXPECT_FALSE(JobStatusStore::isValidJobId("../etc/passwd"));
    EXPECT_TRUE(JobStatusStore::isValidJobId("retrain_0b9d-AZ"));
    EXPECT_THROW(store.put(makeStatus("a/b", JobState::Pending, 0, "")), std::invalid_argument);
    EXPECT_EQ(store.get("a/b").status, JobState::NotFound);
}

TEST(JobStateTest, NamesRoundTrip) {
    for (JobState state : {JobState::Pending, JobState::Running, JobState::Completed,
                           JobState::Failed, JobState::Skipped, JobState::NotFound}) {
        EXPECT_EQ(recsvc::parseJobState(recsvc::jobStateName(state)), state);
    }
    EXPECT_THROW(recsvc::parseJobState("error"), std::invalid_argument);
}
