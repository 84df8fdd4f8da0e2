/**
 * Durable status of training jobs, keyed by job id.
 *
 * Every job is one small JSON document in the status directory, rewritten on each
 * update (write to a temporary file, rename into place). Documents carry an expiry
 * time; expired documents read as "not found" and are removed by purgeExpired().
 * The directory is the only source of truth, so status survives restarts.
 */
#ifndef __RECSVC_JOB_STATUS_H
#define __RECSVC_JOB_STATUS_H

#include <string>
#include <chrono>
#include <mutex>
#include <cstddef>

#include "rec_types.h"

namespace recsvc {
    enum class JobState { Pending, Running, Completed, Failed, Skipped, NotFound };

    const char* jobStateName(JobState state);
    /* Throws std::invalid_argument for an unknown name */
    JobState parseJobState(const std::string &name);

    struct JobStatus {
        std::string job_id;
        JobState status;
        /* In [0, 1] */
        double progress;
        std::string message;
        std::string error;
        TimePoint updated_at;
    };

    class JobStatusStore {
    public:
        JobStatusStore(const std::string &dir, std::chrono::seconds ttl);

        /*
         * Create or replace the status of a job and extend its expiry.
         * Throws std::invalid_argument for ids that are not [A-Za-z0-9_-]+ and
         * std::runtime_error on I/O failure.
         */
        void put(const JobStatus &status);

        /* Status of `jobId`; status is JobState::NotFound if unknown or expired */
        JobStatus get(const std::string &jobId) const;

        /* Remove expired documents, returns how many were removed */
        size_t purgeExpired();

        static bool isValidJobId(const std::string &jobId);

    private:
        std::string m_dir;
        std::chrono::seconds m_ttl;
        mutable std::mutex m_mutex;

        std::string fileFor(const std::string &jobId) const;
    };
}

#endif
