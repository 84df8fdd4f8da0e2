/**
 * Background retraining scheduler.
 *
 * A single worker thread wakes up every `tick` and, unless a run is already in
 * progress, decides whether the model should be retrained:
 *      1. no current model                          -> retrain
 *      2. last run less than interval_hours ago     -> wait
 *      3. new interactions >= interaction_threshold -> retrain
 * Automatic runs are further restricted to the daily time window, if one is set.
 * Manual triggers bypass the policy but never run concurrently with another run.
 */
#ifndef __RECSVC_SCHEDULER_H
#define __RECSVC_SCHEDULER_H

#include <string>
#include <thread>
#include <mutex>
#include <condition_variable>
#include <atomic>
#include <chrono>
#include <functional>
#include <cstdint>

#include "rec_types.h"
#include "trainer.h"
#include "retraining_state.h"
#include "interaction_store.h"
#include "model_repository.h"
#include "job_status.h"

namespace recsvc {
    struct SchedulerConfig {
        double interval_hours;
        int64_t interaction_threshold;
        bool enable_auto_retraining;
        /* Daily window [window_start_hour, window_end_hour) in local time; may wrap
         * past midnight. Disabled, or equal bounds, means always open. */
        bool window_enabled;
        int window_start_hour;
        int window_end_hour;
        std::chrono::seconds tick;
        std::chrono::seconds error_backoff;
        /* Overrides applied to automatic runs */
        TrainingOverrides defaults;

        SchedulerConfig()
            : interval_hours(12), interaction_threshold(50), enable_auto_retraining(true),
              window_enabled(false), window_start_hour(0), window_end_hour(0),
              tick(60), error_backoff(300) {}
    };

    struct TriggerRequest {
        bool force;
        /* Apply to this run only */
        TrainingOverrides overrides;

        TriggerRequest() : force(false) {}
    };

    struct TriggerResponse {
        bool success;
        std::string message;
        /* Empty when the trigger was rejected */
        std::string job_id;
    };

    class RetrainingScheduler {
    public:
        typedef std::function<TimePoint()> ClockFunction;

        /* `statusStore` may be null; jobStatus() then only knows "not found" */
        RetrainingScheduler(const SchedulerConfig &config,
                            TrainingRunner &runner,
                            RetrainingState &state,
                            InteractionCounter &counter,
                            ModelRepository &repository,
                            JobStatusStore *statusStore = nullptr);
        ~RetrainingScheduler();

        RetrainingScheduler(const RetrainingScheduler&) = delete;
        RetrainingScheduler& operator=(const RetrainingScheduler&) = delete;

        /* Start the worker thread. Calling start() on a running scheduler does nothing. */
        void start();

        /*
         * Stop ticking, request cancellation of an in-flight run (it is abandoned
         * between epochs, before anything is saved) and join all threads.
         */
        void stop();

        bool isRunning() const { return m_running.load(); }

        bool shouldRetrain() const;
        bool isWithinTimeWindow(int hour) const;

        /*
         * One evaluation of the automatic policy, as performed on every tick.
         * Returns true if a training run was started (and has finished).
         */
        bool runOnce();

        /* Start a training run in the background. Rejected if a run is active or
         * the scheduler was stopped. */
        TriggerResponse triggerManual(const TriggerRequest &request);

        JobStatus jobStatus(const std::string &jobId) const;

        void setClock(const ClockFunction &clock) { m_clock = clock; }

    private:
        SchedulerConfig m_config;
        TrainingRunner &m_runner;
        RetrainingState &m_state;
        InteractionCounter &m_counter;
        ModelRepository &m_repository;
        JobStatusStore *m_statusStore;
        ClockFunction m_clock;

        std::thread m_worker;
        std::thread m_manual;
        std::mutex m_threadMutex;
        std::mutex m_stopMutex;
        std::condition_variable m_stopCond;
        std::atomic<bool> m_stop;
        std::atomic<bool> m_cancel;
        std::atomic<bool> m_running;

        void loop();
        /* Wait for `period` or until stop() is called; returns true on stop */
        bool waitOrStop(std::chrono::seconds period);
        int currentHour() const;
        static std::string newJobId();
    };
}

#endif
