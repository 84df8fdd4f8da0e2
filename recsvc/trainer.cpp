/**
 * Implementation file for trainer.h
 */
#include <chrono>
#include <memory>
#include <stdexcept>

#include <spdlog/spdlog.h>
#include <spdlog/fmt/fmt.h>

#include "trainer.h"
#include "feature_encoder.h"
#include "mf_model.h"
#include "recommender_model.h"
#include "evaluation.h"
#include "ioutil.h"

using std::string;
using std::vector;
using recsvc::Trainer;
using recsvc::TrainingResult;
using recsvc::TrainingOverrides;
using recsvc::TrainingSample;
using recsvc::Interaction;
using recsvc::InteractionSource;
using recsvc::FeatureEncoder;
using recsvc::FactorizationModel;
using recsvc::RecommenderModel;
using recsvc::ModelVersion;
using recsvc::JobState;
using recsvc::Settings;

namespace {
    const double PROGRESS_LOADING  = 0.1;
    const double PROGRESS_TRAINING = 0.2;
    const double PROGRESS_SAVING   = 0.9;
    const double PROGRESS_DONE     = 1.0;
}

recsvc::Trainer::Trainer(const TrainerConfig &config,
                         InteractionCounter &counter,
                         ModelRepository &repository,
                         RetrainingState &state,
                         JobStatusStore *statusStore)
    : m_config(config), m_counter(counter), m_repository(repository),
      m_state(state), m_statusStore(statusStore), m_clock(&Clock::now)
{ }

void recsvc::Trainer::registerDataset(const string &name, InteractionSource &source) {
    if (m_datasets.empty()) {
        m_firstDataset = name;
    }
    m_datasets[name] = &source;
}

InteractionSource& recsvc::Trainer::selectDataset(const string &name, string &resolved) const {
    string wanted = name.empty() ? m_config.default_dataset : name;
    auto search = m_datasets.find(wanted);
    if (search != m_datasets.end()) {
        resolved = wanted;
        return *search->second;
    }
    if (name.empty() && !m_firstDataset.empty()) {
        resolved = m_firstDataset;
        return *m_datasets.at(m_firstDataset);
    }
    throw std::invalid_argument("unknown dataset '" + wanted + "'");
}

void recsvc::Trainer::publish(const string &jobId, JobState state, double progress,
                              const string &message, const string &error)
{
    if (m_statusStore == nullptr || jobId.empty()) {
        return;
    }
    JobStatus status;
    status.job_id = jobId;
    status.status = state;
    status.progress = progress;
    status.message = message;
    status.error = error;
    status.updated_at = m_clock();
    try {
        m_statusStore->put(status);
    } catch (const std::exception &e) {
        spdlog::warn("Could not store status of job {}: {}", jobId, e.what());
    }
}

bool recsvc::Trainer::recentlyTrained() const {
    TimePoint last;
    if (!m_state.lastRetrainingTime(last)) {
        string dir = m_repository.currentDir();
        if (dir.empty()) {
            return false;
        }
        try {
            last = m_repository.readMetadata(dir).trained_at;
        } catch (const ModelArtifactError &e) {
            spdlog::warn("Cannot read the current model metadata: {}", e.what());
            return false;
        }
    }
    std::chrono::duration<double, std::ratio<3600> > age = m_clock() - last;
    return age.count() < m_config.freshness_hours;
}

TrainingResult recsvc::Trainer::runTraining(bool force,
                                            const TrainingOverrides &overrides,
                                            const string &jobId,
                                            const std::atomic<bool> *cancel)
{
    TrainingResult result;

    if (!force && recentlyTrained()) {
        const string message = "Model was recently trained, skipping training";
        spdlog::info(message);
        publish(jobId, JobState::Skipped, PROGRESS_DONE, message);
        result.success = true;
        result.status = JobState::Skipped;
        result.message = message;
        return result;
    }

    try {
        result.version_id = train(overrides, jobId, cancel, result);
        result.success = true;
        result.status = JobState::Completed;
        result.message = "Model training complete";
        publish(jobId, JobState::Completed, PROGRESS_DONE, result.message);
    } catch (const DataUnavailableError &e) {
        spdlog::error(e.what());
        result.status = JobState::Failed;
        result.message = e.what();
        result.error = e.what();
        publish(jobId, JobState::Failed, PROGRESS_LOADING, result.message, result.error);
    } catch (const std::exception &e) {
        spdlog::error("Error in training pipeline: {}", e.what());
        result.status = JobState::Failed;
        result.message = "Training pipeline failed";
        result.error = string("Error in training pipeline: ") + e.what();
        publish(jobId, JobState::Failed, 0.0, result.message, result.error);
    }
    return result;
}

string recsvc::Trainer::train(const TrainingOverrides &overrides, const string &jobId,
                              const std::atomic<bool> *cancel, TrainingResult &result)
{
    publish(jobId, JobState::Running, PROGRESS_LOADING, "Loading interaction data");
    string dataset;
    InteractionSource &source = selectDataset(overrides.dataset, dataset);
    vector<Interaction> interactions = source.queryRecent(m_config.max_interactions);
    if (interactions.empty()) {
        throw DataUnavailableError("no interactions found for training");
    }
    spdlog::info("Loaded {} interactions for training", interactions.size());

    vector<string> userIds;
    vector<string> contentIds;
    userIds.reserve(interactions.size());
    contentIds.reserve(interactions.size());
    for (const Interaction &interaction : interactions) {
        userIds.push_back(interaction.user_id);
        contentIds.push_back(interaction.content_id);
    }
    FeatureEncoder users = FeatureEncoder::fit(userIds);
    FeatureEncoder items = FeatureEncoder::fit(contentIds);

    vector<TrainingSample> samples;
    samples.reserve(interactions.size());
    for (const Interaction &interaction : interactions) {
        TrainingSample s;
        s.user = users.encode(interaction.user_id);
        s.item = items.encode(interaction.content_id);
        s.value = interaction.value;
        samples.push_back(s);
    }

    Settings settings = m_config.settings;
    if (overrides.epochs > 0) {
        settings["max_iter"] = static_cast<dtype>(overrides.epochs);
    }
    if (overrides.batch_size > 0) {
        settings["batch_size"] = static_cast<dtype>(overrides.batch_size);
    }

    publish(jobId, JobState::Running, PROGRESS_TRAINING, "Starting model training");
    auto start = std::chrono::high_resolution_clock::now();
    const double timeoutMs = m_config.timeout_minutes * 60 * 1000;
    auto onEpoch = [&](int epoch, int epochs, double loss) {
        if (cancel != nullptr && cancel->load()) {
            spdlog::warn("Training cancelled after epoch {}", epoch);
            return false;
        }
        if (timeoutMs > 0 && elapsed(start) > timeoutMs) {
            spdlog::warn("Training exceeded {} minutes, aborting", m_config.timeout_minutes);
            return false;
        }
        double progress = PROGRESS_TRAINING + (PROGRESS_SAVING - PROGRESS_TRAINING) * epoch / epochs;
        publish(jobId, JobState::Running, progress,
                fmt::format("Epoch {}/{}, Loss: {:.4f}", epoch, epochs, loss));
        return true;
    };

    FactorizationModel model(static_cast<int>(settings.at("num_factors")));
    result.loss_history = model.train(samples, users.size(), items.size(), settings, onEpoch);
    result.train_rmse = rmse(model, samples);
    spdlog::info("Training finished in {:.1f} ms, train RMSE {:.4f}", elapsed(start), result.train_rmse);

    publish(jobId, JobState::Running, PROGRESS_SAVING, "Saving model");
    ModelVersion version;
    version.version_id = generateUuid();
    version.trained_at = m_clock();
    version.dataset = dataset;
    version.n_interactions = static_cast<int>(interactions.size());
    version.train_rmse = result.train_rmse;
    version.final_loss = result.loss_history.empty() ? 0.0 : result.loss_history.back();
    RecommenderModel recommender(version, users, items, model);

    const string dir = m_repository.save(recommender);
    m_repository.promote(dir);
    m_state.markRetrained(version.trained_at);
    m_counter.reset();
    return version.version_id;
}
