/**
 * Implementation file for job_status.h
 */
#include <cstdio>       // std::remove
#include <stdexcept>

#include <json/json.h>
#include <spdlog/spdlog.h>

#include "job_status.h"
#include "ioutil.h"

using std::string;
using recsvc::JobState;
using recsvc::JobStatus;
using recsvc::IOUtil;

namespace {
    const char *const STATUS_SUFFIX = ".json";

    int64_t toUnix(const recsvc::TimePoint &tp) {
        return static_cast<int64_t>(recsvc::Clock::to_time_t(tp));
    }

    JobStatus notFound(const string &jobId) {
        JobStatus status;
        status.job_id = jobId;
        status.status = JobState::NotFound;
        status.progress = 0;
        status.message = "Job " + jobId + " not found";
        status.updated_at = recsvc::Clock::now();
        return status;
    }
}

const char* recsvc::jobStateName(JobState state) {
    switch (state) {
        case JobState::Pending:   return "pending";
        case JobState::Running:   return "running";
        case JobState::Completed: return "completed";
        case JobState::Failed:    return "failed";
        case JobState::Skipped:   return "skipped";
        case JobState::NotFound:  return "not_found";
    }
    return "not_found";
}

JobState recsvc::parseJobState(const string &name) {
    if (name == "pending")   return JobState::Pending;
    if (name == "running")   return JobState::Running;
    if (name == "completed") return JobState::Completed;
    if (name == "failed")    return JobState::Failed;
    if (name == "skipped")   return JobState::Skipped;
    if (name == "not_found") return JobState::NotFound;
    throw std::invalid_argument("unknown job state '" + name + "'");
}

recsvc::JobStatusStore::JobStatusStore(const string &dir, std::chrono::seconds ttl)
    : m_dir(dir), m_ttl(ttl)
{
    IOUtil::makeDirs(m_dir);
}

bool recsvc::JobStatusStore::isValidJobId(const string &jobId) {
    if (jobId.empty()) return false;
    for (char c : jobId) {
        bool ok = (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') ||
                  (c >= '0' && c <= '9') || c == '_' || c == '-';
        if (!ok) return false;
    }
    return true;
}

string recsvc::JobStatusStore::fileFor(const string &jobId) const {
    return IOUtil::joinPath(m_dir, jobId + STATUS_SUFFIX);
}

void recsvc::JobStatusStore::put(const JobStatus &status) {
    if (!isValidJobId(status.job_id)) {
        throw std::invalid_argument("invalid job id '" + status.job_id + "'");
    }
    Json::Value doc(Json::objectValue);
    doc["job_id"] = status.job_id;
    doc["status"] = jobStateName(status.status);
    doc["progress"] = status.progress;
    doc["message"] = status.message;
    doc["error"] = status.error;
    doc["updated_at"] = toIsoString(status.updated_at);
    doc["expires_at"] = static_cast<Json::Int64>(toUnix(Clock::now() + m_ttl));

    std::lock_guard<std::mutex> lock(m_mutex);
    IOUtil::writeJson(fileFor(status.job_id), doc);
}

JobStatus recsvc::JobStatusStore::get(const string &jobId) const {
    if (!isValidJobId(jobId)) {
        return notFound(jobId);
    }
    Json::Value doc;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        const string file = fileFor(jobId);
        if (!IOUtil::exists(file)) {
            return notFound(jobId);
        }
        try {
            doc = IOUtil::readJson(file);
        } catch (const std::runtime_error &e) {
            spdlog::warn("Unreadable status document for job {}: {}", jobId, e.what());
            return notFound(jobId);
        }
    }
    if (doc.get("expires_at", Json::Value(0)).asInt64() < toUnix(Clock::now())) {
        return notFound(jobId);
    }

    JobStatus status;
    status.job_id = jobId;
    try {
        status.status = parseJobState(doc.get("status", Json::Value("")).asString());
        status.updated_at = parseIsoString(doc.get("updated_at", Json::Value("")).asString());
    } catch (const std::exception &e) {
        spdlog::warn("Malformed status document for job {}: {}", jobId, e.what());
        return notFound(jobId);
    }
    status.progress = doc.get("progress", Json::Value(0.0)).asDouble();
    status.message = doc.get("message", Json::Value("")).asString();
    status.error = doc.get("error", Json::Value("")).asString();
    return status;
}

size_t recsvc::JobStatusStore::purgeExpired() {
    const int64_t nowUnix = toUnix(Clock::now());
    size_t removed = 0;

    std::lock_guard<std::mutex> lock(m_mutex);
    for (const string &entry : IOUtil::listDirectory(m_dir)) {
        if (entry.size() <= 5 || entry.compare(entry.size() - 5, 5, STATUS_SUFFIX) != 0) {
            continue;
        }
        const string file = IOUtil::joinPath(m_dir, entry);
        bool expired = false;
        try {
            Json::Value doc = IOUtil::readJson(file);
            expired = doc.get("expires_at", Json::Value(0)).asInt64() < nowUnix;
        } catch (const std::runtime_error &e) {
            spdlog::warn("Removing unreadable status document {}: {}", file, e.what());
            expired = true;
        }
        if (expired && std::remove(file.c_str()) == 0) {
            removed++;
        }
    }
    return removed;
}
