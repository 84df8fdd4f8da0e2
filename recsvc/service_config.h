/**
 * Configuration of the service.
 *
 * Model hyperparameters are kept as a Settings map, starting from DEFAULT_SETTINGS.
 * Everything else lives in ServiceConfig, read from an optional JSON file:
 *
 *  {
 *      "model_dir": "models",
 *      "status_dir": "models/jobs",
 *      "status_ttl_hours": 24,
 *      "log_level": "info",
 *      "log_file": "",
 *      "interactions_file": "interactions.csv",
 *      "catalog_file": "",
 *      "trainer":   { "max_interactions": 50000, "freshness_hours": 24,
 *                     "timeout_minutes": 0, "dataset": "movielens-small" },
 *      "scheduler": { "interval_hours": 12, "interaction_threshold": 50,
 *                     "enable_auto_retraining": true,
 *                     "window_start_hour": 2, "window_end_hour": 5,
 *                     "tick_seconds": 60, "error_backoff_seconds": 300,
 *                     "epochs": 10, "batch_size": 64 },
 *      "settings":  { "num_factors": 50, "lrate": 0.005, ... }
 *  }
 *
 * Missing keys keep their defaults. Environment variables override the file:
 * OMP_NUM_THREADS, RECSVC_MODEL_DIR, RECSVC_LOG_LEVEL, RECSVC_INTERACTION_THRESHOLD,
 * RECSVC_RETRAINING_INTERVAL_HOURS.
 */
#ifndef __RECSVC_SERVICE_CONFIG_H
#define __RECSVC_SERVICE_CONFIG_H

#include <string>

#include <json/json.h>

#include "rec_types.h"
#include "trainer.h"
#include "scheduler.h"

namespace recsvc {

    const Settings DEFAULT_SETTINGS = {
        {"num_factors", 50},
        {"lrate", 0.005},
        {"regl", 0.02},
        {"lrate_reduction", 1.0},
        {"max_iter", 20},
        {"batch_size", 1000},
        {"init_stdev", 0.1},
        {"seed", 42},
        {"num_threads", 1},
    };

    struct ServiceConfig {
        std::string model_dir;
        std::string status_dir;
        double status_ttl_hours;
        std::string log_level;
        std::string log_file;
        std::string interactions_file;
        std::string catalog_file;
        int num_threads;
        TrainerConfig trainer;
        SchedulerConfig scheduler;

        ServiceConfig();

        /* Throws std::runtime_error if the file is unreadable or a value has the wrong type */
        static ServiceConfig fromFile(const std::string &fileName);
        static ServiceConfig fromJson(const Json::Value &doc);

        /* Apply the environment overrides listed above */
        void applyEnvironment();
    };
}

#endif
