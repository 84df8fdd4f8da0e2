/**
 * Implementation file for service_config.h
 */
#include <cstdlib>      // getenv
#include <stdexcept>

#include <spdlog/spdlog.h>

#include "service_config.h"
#include "ioutil.h"

using std::string;
using recsvc::ServiceConfig;

namespace {
    const char *const DEFAULT_DATASET = "movielens-small";

    void readString(const Json::Value &doc, const char *key, string &out) {
        if (!doc.isMember(key)) return;
        if (!doc[key].isString()) {
            throw std::runtime_error(string("Configuration key '") + key + "' must be a string");
        }
        out = doc[key].asString();
    }

    template <typename T>
    void readNumber(const Json::Value &doc, const char *key, T &out) {
        if (!doc.isMember(key)) return;
        if (!doc[key].isNumeric()) {
            throw std::runtime_error(string("Configuration key '") + key + "' must be a number");
        }
        out = static_cast<T>(doc[key].asDouble());
    }

    void readBool(const Json::Value &doc, const char *key, bool &out) {
        if (!doc.isMember(key)) return;
        if (!doc[key].isBool()) {
            throw std::runtime_error(string("Configuration key '") + key + "' must be a boolean");
        }
        out = doc[key].asBool();
    }

    /* Integer value of an environment variable, or false if unset or malformed */
    bool envInt(const char *name, long long &out) {
        const char *env_p = std::getenv(name);
        if (env_p == nullptr) return false;
        try {
            out = std::stoll(env_p);
            return true;
        } catch (const std::logic_error &e) {
            spdlog::warn("Ignoring {}={}: {}", name, env_p, e.what());
            return false;
        }
    }
}

recsvc::ServiceConfig::ServiceConfig()
    : model_dir("models"), status_dir("models/jobs"), status_ttl_hours(24),
      log_level("info"), num_threads(1)
{
    trainer.max_interactions = 50000;
    trainer.freshness_hours = 24;
    trainer.timeout_minutes = 0;
    trainer.default_dataset = DEFAULT_DATASET;
    trainer.settings = Settings(DEFAULT_SETTINGS);

    scheduler.defaults.dataset = DEFAULT_DATASET;
    scheduler.defaults.epochs = 10;
    scheduler.defaults.batch_size = 64;
}

ServiceConfig recsvc::ServiceConfig::fromFile(const string &fileName) {
    return fromJson(IOUtil::readJson(fileName));
}

ServiceConfig recsvc::ServiceConfig::fromJson(const Json::Value &doc) {
    if (!doc.isObject()) {
        throw std::runtime_error("Configuration must be a JSON object");
    }
    ServiceConfig config;
    readString(doc, "model_dir", config.model_dir);
    if (doc.isMember("model_dir") && !doc.isMember("status_dir")) {
        config.status_dir = IOUtil::joinPath(config.model_dir, "jobs");
    }
    readString(doc, "status_dir", config.status_dir);
    readNumber(doc, "status_ttl_hours", config.status_ttl_hours);
    readString(doc, "log_level", config.log_level);
    readString(doc, "log_file", config.log_file);
    readString(doc, "interactions_file", config.interactions_file);
    readString(doc, "catalog_file", config.catalog_file);

    if (doc.isMember("trainer")) {
        const Json::Value &t = doc["trainer"];
        readNumber(t, "max_interactions", config.trainer.max_interactions);
        readNumber(t, "freshness_hours", config.trainer.freshness_hours);
        readNumber(t, "timeout_minutes", config.trainer.timeout_minutes);
        readString(t, "dataset", config.trainer.default_dataset);
    }

    if (doc.isMember("scheduler")) {
        const Json::Value &s = doc["scheduler"];
        SchedulerConfig &sc = config.scheduler;
        readNumber(s, "interval_hours", sc.interval_hours);
        readNumber(s, "interaction_threshold", sc.interaction_threshold);
        readBool(s, "enable_auto_retraining", sc.enable_auto_retraining);
        if (s.isMember("window_start_hour") || s.isMember("window_end_hour")) {
            readNumber(s, "window_start_hour", sc.window_start_hour);
            readNumber(s, "window_end_hour", sc.window_end_hour);
            if (sc.window_start_hour < 0 || sc.window_start_hour > 23 ||
                sc.window_end_hour < 0 || sc.window_end_hour > 23) {
                throw std::runtime_error("Time window hours must be in [0, 23]");
            }
            sc.window_enabled = true;
        }
        long long seconds = sc.tick.count();
        readNumber(s, "tick_seconds", seconds);
        sc.tick = std::chrono::seconds(seconds);
        seconds = sc.error_backoff.count();
        readNumber(s, "error_backoff_seconds", seconds);
        sc.error_backoff = std::chrono::seconds(seconds);
        readString(s, "dataset", sc.defaults.dataset);
        readNumber(s, "epochs", sc.defaults.epochs);
        readNumber(s, "batch_size", sc.defaults.batch_size);
    }

    if (doc.isMember("settings")) {
        const Json::Value &settings = doc["settings"];
        if (!settings.isObject()) {
            throw std::runtime_error("Configuration key 'settings' must be an object");
        }
        for (const string &name : settings.getMemberNames()) {
            dtype value = 0;
            readNumber(settings, name.c_str(), value);
            config.trainer.settings[name] = value;
        }
    }
    return config;
}

void recsvc::ServiceConfig::applyEnvironment() {
    long long value = 0;
    if (envInt("OMP_NUM_THREADS", value) && value > 0) {
        num_threads = static_cast<int>(value);
    }
    trainer.settings["num_threads"] = static_cast<dtype>(num_threads);

    if (const char *env_p = std::getenv("RECSVC_MODEL_DIR")) {
        model_dir = env_p;
        status_dir = IOUtil::joinPath(model_dir, "jobs");
    }
    if (const char *env_p = std::getenv("RECSVC_LOG_LEVEL")) {
        log_level = env_p;
    }
    if (envInt("RECSVC_INTERACTION_THRESHOLD", value)) {
        scheduler.interaction_threshold = value;
    }
    if (envInt("RECSVC_RETRAINING_INTERVAL_HOURS", value)) {
        scheduler.interval_hours = static_cast<double>(value);
    }
}
