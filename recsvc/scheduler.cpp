/**
 * Implementation file for scheduler.h
 */
#include <ctime>        // localtime_r
#include <system_error>

#include <spdlog/spdlog.h>

#include "scheduler.h"
#include "ioutil.h"

using std::string;
using recsvc::RetrainingScheduler;
using recsvc::TriggerResponse;
using recsvc::TrainingResult;
using recsvc::JobStatus;
using recsvc::JobState;

recsvc::RetrainingScheduler::RetrainingScheduler(const SchedulerConfig &config,
                                                 TrainingRunner &runner,
                                                 RetrainingState &state,
                                                 InteractionCounter &counter,
                                                 ModelRepository &repository,
                                                 JobStatusStore *statusStore)
    : m_config(config), m_runner(runner), m_state(state), m_counter(counter),
      m_repository(repository), m_statusStore(statusStore), m_clock(&Clock::now),
      m_stop(false), m_cancel(false), m_running(false)
{ }

recsvc::RetrainingScheduler::~RetrainingScheduler() {
    stop();
}

void recsvc::RetrainingScheduler::start() {
    std::lock_guard<std::mutex> lock(m_threadMutex);
    if (m_running.load()) {
        return;
    }
    if (m_worker.joinable()) {
        m_worker.join();
    }
    m_stop.store(false);
    m_cancel.store(false);
    m_running.store(true);
    m_worker = std::thread(&RetrainingScheduler::loop, this);
}

void recsvc::RetrainingScheduler::stop() {
    {
        std::lock_guard<std::mutex> lock(m_stopMutex);
        m_stop.store(true);
        m_cancel.store(true);
    }
    m_stopCond.notify_all();

    std::lock_guard<std::mutex> lock(m_threadMutex);
    if (m_worker.joinable()) {
        m_worker.join();
    }
    if (m_manual.joinable()) {
        m_manual.join();
    }
    m_running.store(false);
}

bool recsvc::RetrainingScheduler::waitOrStop(std::chrono::seconds period) {
    std::unique_lock<std::mutex> lock(m_stopMutex);
    return m_stopCond.wait_for(lock, period, [this] { return m_stop.load(); });
}

void recsvc::RetrainingScheduler::loop() {
    spdlog::info("Starting model retraining scheduler (interval: {} hours)", m_config.interval_hours);
    while (!m_stop.load()) {
        std::chrono::seconds wait = m_config.tick;
        try {
            runOnce();
        } catch (const std::exception &e) {
            spdlog::error("Error in scheduler loop: {}", e.what());
            wait = m_config.error_backoff;
        }
        if (waitOrStop(wait)) {
            break;
        }
    }
    spdlog::info("Model retraining scheduler stopped");
}

bool recsvc::RetrainingScheduler::isWithinTimeWindow(int hour) const {
    const int start = m_config.window_start_hour;
    const int end = m_config.window_end_hour;
    if (!m_config.window_enabled || start == end) {
        return true;
    }
    if (start < end) {
        return hour >= start && hour < end;
    }
    return hour >= start || hour < end;
}

int recsvc::RetrainingScheduler::currentHour() const {
    std::time_t t = Clock::to_time_t(m_clock());
    std::tm local;
    localtime_r(&t, &local);
    return local.tm_hour;
}

bool recsvc::RetrainingScheduler::shouldRetrain() const {
    const string dir = m_repository.currentDir();
    if (dir.empty()) {
        spdlog::info("No current model, retraining needed");
        return true;
    }

    TimePoint last;
    if (!m_state.lastRetrainingTime(last)) {
        try {
            last = m_repository.readMetadata(dir).trained_at;
        } catch (const ModelArtifactError &e) {
            spdlog::warn("Current model is unreadable, retraining needed: {}", e.what());
            return true;
        }
    }

    std::chrono::duration<double, std::ratio<3600> > sinceLast = m_clock() - last;
    if (sinceLast.count() < m_config.interval_hours) {
        return false;
    }

    const int64_t count = m_counter.get();
    if (count >= m_config.interaction_threshold) {
        spdlog::info("Retraining needed: {} new interactions (threshold {})",
                     count, m_config.interaction_threshold);
        return true;
    }
    return false;
}

bool recsvc::RetrainingScheduler::runOnce() {
    if (!m_config.enable_auto_retraining || m_state.isRetraining()) {
        return false;
    }
    if (!isWithinTimeWindow(currentHour())) {
        return false;
    }
    if (!shouldRetrain()) {
        return false;
    }
    if (!m_state.tryBeginRetraining()) {
        return false;
    }
    RetrainingGuard guard(m_state);

    const string jobId = "auto_" + generateUuid();
    spdlog::info("Starting model retraining (job {})", jobId);
    TrainingResult result = m_runner.runTraining(true, m_config.defaults, jobId, &m_cancel);
    if (result.success) {
        spdlog::info("Model retraining completed successfully: {}", result.version_id);
    } else {
        spdlog::error("Model retraining failed: {}", result.error.empty() ? result.message : result.error);
    }
    return true;
}

string recsvc::RetrainingScheduler::newJobId() {
    return "retrain_" + generateUuid();
}

TriggerResponse recsvc::RetrainingScheduler::triggerManual(const TriggerRequest &request) {
    TriggerResponse response;
    response.success = false;
    if (m_stop.load()) {
        response.message = "Scheduler is shutting down";
        return response;
    }
    if (!m_state.tryBeginRetraining()) {
        response.message = "Another retraining job is already in progress";
        return response;
    }

    const string jobId = newJobId();
    if (m_statusStore != nullptr) {
        JobStatus pending;
        pending.job_id = jobId;
        pending.status = JobState::Pending;
        pending.progress = 0;
        pending.message = "Model retraining started in the background";
        pending.updated_at = m_clock();
        try {
            m_statusStore->put(pending);
        } catch (const std::exception &e) {
            spdlog::warn("Could not store status of job {}: {}", jobId, e.what());
        }
    }

    std::lock_guard<std::mutex> lock(m_threadMutex);
    if (m_manual.joinable()) {
        m_manual.join();
    }
    try {
        m_manual = std::thread([this, request, jobId]() {
            RetrainingGuard guard(m_state);
            TrainingResult result = m_runner.runTraining(request.force, request.overrides,
                                                         jobId, &m_cancel);
            spdlog::info("Manual retraining {} finished: {}", jobId, jobStateName(result.status));
        });
    } catch (const std::system_error &e) {
        m_state.endRetraining();
        spdlog::error("Could not start retraining thread: {}", e.what());
        response.message = string("Could not start retraining: ") + e.what();
        return response;
    }

    response.success = true;
    response.message = "Model retraining started in the background";
    response.job_id = jobId;
    return response;
}

JobStatus recsvc::RetrainingScheduler::jobStatus(const string &jobId) const {
    if (m_statusStore != nullptr) {
        return m_statusStore->get(jobId);
    }
    JobStatus status;
    status.job_id = jobId;
    status.status = JobState::NotFound;
    status.progress = 0;
    status.message = "Job " + jobId + " not found";
    status.updated_at = m_clock();
    return status;
}
