/**  main.cpp
 * Command line front end of the recommendation service.
 *
 * - "train":     trains a model on an interactions CSV file and promotes it
 * - "recommend": prints the recommendations of a user from the current model
 * - "serve":     runs the retraining scheduler on an interactions CSV file until
 *                SIGINT or SIGTERM
 * - "status":    prints the current model version, or the status of one job
 *
 * A JSON configuration file can be given with "--config <file>" before the command
 * (see service_config.h).
 */

#include <string>
#include <iostream>
#include <stdexcept>
#include <vector>
#include <memory>
#include <csignal>
#include <chrono>

#include <pthread.h>
#include <spdlog/spdlog.h>

#include "rec_types.h"
#include "ioutil.h"
#include "logging.h"
#include "service_config.h"
#include "interaction_store.h"
#include "model_repository.h"
#include "retraining_state.h"
#include "job_status.h"
#include "trainer.h"
#include "scheduler.h"
#include "recommendation_server.h"

using recsvc::ServiceConfig;
using recsvc::IOUtil;
using recsvc::ModelRepository;
using recsvc::ModelVersion;
using recsvc::MemoryInteractionStore;
using recsvc::MemoryInteractionCounter;
using recsvc::MemoryContentCatalog;
using recsvc::RetrainingState;
using recsvc::RetrainingScheduler;
using recsvc::JobStatusStore;
using recsvc::JobStatus;
using recsvc::Trainer;
using recsvc::TrainingOverrides;
using recsvc::TrainingResult;
using recsvc::RecommendationServer;
using recsvc::RecommendationList;
using recsvc::Recommendation;

const static size_t DEFAULT_LIMIT = 10;

/**
 * Returns a string explaining the program's command line arguments
 */
std::string usageString();

int runTrain(const ServiceConfig &config, const std::string &interactionsFile);
int runRecommend(const ServiceConfig &config, const std::string &userId, size_t limit);
int runServe(const ServiceConfig &config, const std::string &interactionsFile);
int runStatus(const ServiceConfig &config, const std::string &jobId);


/**** IMPLEMENTATION ****/


std::string usageString() {
    return "Usage: recsvc [--config <file.json>] <command>\n"
           "  train <interactions.csv>\n"
           "  recommend <user_id> [limit]\n"
           "  serve <interactions.csv>\n"
           "  status [job_id]";
}

std::chrono::seconds statusTtl(const ServiceConfig &config) {
    return std::chrono::seconds(static_cast<long long>(config.status_ttl_hours * 3600));
}

int runTrain(const ServiceConfig &config, const std::string &interactionsFile) {
    MemoryInteractionCounter counter;
    MemoryInteractionStore store;
    store.recordAll(IOUtil::readInteractions(interactionsFile));

    ModelRepository repository(config.model_dir);
    RetrainingState state;
    JobStatusStore statusStore(config.status_dir, statusTtl(config));
    Trainer trainer(config.trainer, counter, repository, state, &statusStore);
    trainer.registerDataset(config.trainer.default_dataset, store);

    TrainingResult result = trainer.runTraining(true, TrainingOverrides(), "cli_" + recsvc::generateUuid());
    if (!result.success) {
        std::cerr << result.message << ": " << result.error << "\n";
        return 1;
    }
    std::cout << "version " << result.version_id << "\n";
    std::cout << "train rmse " << result.train_rmse << "\n";
    return 0;
}

int runRecommend(const ServiceConfig &config, const std::string &userId, size_t limit) {
    MemoryContentCatalog catalog;
    if (!config.catalog_file.empty()) {
        for (const recsvc::ContentItem &item : IOUtil::readCatalog(config.catalog_file)) {
            catalog.add(item);
        }
    }
    MemoryInteractionStore store;
    if (!config.interactions_file.empty()) {
        store.recordAll(IOUtil::readInteractions(config.interactions_file));
    }

    ModelRepository repository(config.model_dir);
    RecommendationServer server(repository, catalog, store, config.num_threads);
    RecommendationList list = server.getRecommendations(userId, limit);
    if (!list.personalized) {
        std::cout << "# popular content (no model for user " << userId << ")\n";
    } else {
        std::cout << "# model " << list.version_id << "\n";
    }
    for (const Recommendation &r : list.items) {
        std::cout << r.content_id << "," << r.score << "\n";
    }
    return 0;
}

int runServe(const ServiceConfig &config, const std::string &interactionsFile) {
    // Block the termination signals in every thread, they are received with sigwait below
    sigset_t signals;
    sigemptyset(&signals);
    sigaddset(&signals, SIGINT);
    sigaddset(&signals, SIGTERM);
    pthread_sigmask(SIG_BLOCK, &signals, nullptr);

    MemoryInteractionCounter counter;
    MemoryInteractionStore store(&counter);
    store.recordAll(IOUtil::readInteractions(interactionsFile));

    ModelRepository repository(config.model_dir);
    RetrainingState state;
    JobStatusStore statusStore(config.status_dir, statusTtl(config));
    Trainer trainer(config.trainer, counter, repository, state, &statusStore);
    trainer.registerDataset(config.trainer.default_dataset, store);

    RetrainingScheduler scheduler(config.scheduler, trainer, state, counter, repository, &statusStore);
    scheduler.start();

    int sig = 0;
    sigwait(&signals, &sig);
    spdlog::info("Received signal {}, shutting down", sig);
    scheduler.stop();
    size_t purged = statusStore.purgeExpired();
    if (purged > 0) {
        spdlog::info("Removed {} expired job status documents", purged);
    }
    return 0;
}

int runStatus(const ServiceConfig &config, const std::string &jobId) {
    if (!jobId.empty()) {
        JobStatusStore statusStore(config.status_dir, statusTtl(config));
        JobStatus status = statusStore.get(jobId);
        std::cout << jobId << ": " << recsvc::jobStateName(status.status)
                  << " (" << status.progress << ") " << status.message << "\n";
        if (!status.error.empty()) {
            std::cout << "error: " << status.error << "\n";
        }
        return 0;
    }

    ModelRepository repository(config.model_dir);
    const std::string dir = repository.currentDir();
    if (dir.empty()) {
        std::cout << "no current model\n";
    } else {
        ModelVersion version = repository.readMetadata(dir);
        std::cout << "current " << version.version_id << "\n"
                  << "  trained_at   " << recsvc::toIsoString(version.trained_at) << "\n"
                  << "  dataset      " << version.dataset << "\n"
                  << "  users/items  " << version.n_users << "/" << version.n_items << "\n"
                  << "  dim          " << version.embedding_dim << "\n"
                  << "  train rmse   " << version.train_rmse << "\n";
    }
    for (const std::string &id : repository.listVersions()) {
        std::cout << id << "\n";
    }
    return 0;
}


int main(int argc, char** argv) {
    std::vector<std::string> args(argv + 1, argv + argc);

    std::string configFile;
    if (args.size() >= 2 && args[0] == "--config") {
        configFile = args[1];
        args.erase(args.begin(), args.begin() + 2);
    }
    if (args.empty()) {
        std::cout << usageString() << "\n";
        return 1;
    }

    try {
        ServiceConfig config = configFile.empty() ? ServiceConfig() : ServiceConfig::fromFile(configFile);
        config.applyEnvironment();
        recsvc::initLogging(config.log_level, config.log_file);

        const std::string &command = args[0];
        if (command == "train" && args.size() == 2) {
            return runTrain(config, args[1]);
        }
        else if (command == "recommend" && (args.size() == 2 || args.size() == 3)) {
            size_t limit = args.size() == 3 ? std::stoul(args[2]) : DEFAULT_LIMIT;
            return runRecommend(config, args[1], limit);
        }
        else if (command == "serve" && args.size() == 2) {
            return runServe(config, args[1]);
        }
        else if (command == "status" && args.size() <= 2) {
            return runStatus(config, args.size() == 2 ? args[1] : "");
        }
        else {
            std::cout << "Command " << command << " is not implemented\n";
            std::cout << usageString() << "\n";
            return 1;
        }
    }
    catch (const std::exception &e) {
        std::cerr << e.what() << "\n";
        std::cerr << "Aborting\n";
        return 1;
    }
}
