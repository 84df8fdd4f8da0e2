/**
 * Training pipeline: load recent interactions, fit encoders and a fresh
 * factorization model, persist it as a new version and promote that version.
 *
 * Job progress is published to the status store as the run advances:
 *      loading 0.1, training 0.2 -> 0.9 (by epoch), saving 0.9, done 1.0
 */
#ifndef __RECSVC_TRAINER_H
#define __RECSVC_TRAINER_H

#include <string>
#include <vector>
#include <map>
#include <atomic>
#include <functional>
#include <stdexcept>

#include "rec_types.h"
#include "interaction_store.h"
#include "model_repository.h"
#include "retraining_state.h"
#include "job_status.h"

namespace recsvc {
    /* The interaction source returned no data to train on */
    class DataUnavailableError : public std::runtime_error {
    public:
        explicit DataUnavailableError(const std::string &what) : std::runtime_error(what) {}
    };

    /* Per-run overrides. Empty or zero fields keep the configured value. */
    struct TrainingOverrides {
        std::string dataset;
        int epochs;
        int batch_size;

        TrainingOverrides() : epochs(0), batch_size(0) {}
    };

    struct TrainingResult {
        bool success;
        JobState status;
        std::string message;
        std::string error;
        std::string version_id;
        std::vector<double> loss_history;
        double train_rmse;

        TrainingResult() : success(false), status(JobState::Pending), train_rmse(0) {}
    };

    struct TrainerConfig {
        /* Upper bound on the number of (most recent) interactions used */
        size_t max_interactions;
        /* A model trained less than this many hours ago is fresh */
        double freshness_hours;
        /* Wall clock bound on the epoch loop, 0 disables it */
        double timeout_minutes;
        std::string default_dataset;
        /* Model hyperparameters, see mf_model.h */
        Settings settings;
    };

    /* Anything able to run a training job; the scheduler depends on this only */
    class TrainingRunner {
    public:
        virtual ~TrainingRunner() {}

        /*
         * Run one training job to completion. Never throws: failures are returned
         * as a failed result. `cancel`, if given, is polled between epochs.
         */
        virtual TrainingResult runTraining(bool force,
                                           const TrainingOverrides &overrides,
                                           const std::string &jobId,
                                           const std::atomic<bool> *cancel = nullptr) = 0;
    };

    class Trainer : public TrainingRunner {
    public:
        typedef std::function<TimePoint()> ClockFunction;

        /* `statusStore` may be null, in which case progress is only logged */
        Trainer(const TrainerConfig &config,
                InteractionCounter &counter,
                ModelRepository &repository,
                RetrainingState &state,
                JobStatusStore *statusStore = nullptr);

        /* Make `source` selectable by name; the first registered source is used
         * when the configured default dataset is not registered */
        void registerDataset(const std::string &name, InteractionSource &source);

        TrainingResult runTraining(bool force,
                                   const TrainingOverrides &overrides,
                                   const std::string &jobId,
                                   const std::atomic<bool> *cancel = nullptr) override;

        /*
         * True if the last successful run, or the trained_at of the current version
         * when no run happened in this process, lies within the freshness window.
         */
        bool recentlyTrained() const;

        void setClock(const ClockFunction &clock) { m_clock = clock; }

        const TrainerConfig& config() const { return m_config; }

    private:
        TrainerConfig m_config;
        InteractionCounter &m_counter;
        ModelRepository &m_repository;
        RetrainingState &m_state;
        JobStatusStore *m_statusStore;
        std::map<std::string, InteractionSource*> m_datasets;
        std::string m_firstDataset;
        ClockFunction m_clock;

        InteractionSource& selectDataset(const std::string &name, std::string &resolved) const;
        std::string train(const TrainingOverrides &overrides, const std::string &jobId,
                          const std::atomic<bool> *cancel, TrainingResult &result);
        void publish(const std::string &jobId, JobState state, double progress,
                     const std::string &message, const std::string &error = "");
    };
}

#endif
