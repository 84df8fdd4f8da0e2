#include <gtest/gtest.h>

#include <string>
#include <fstream>
#include <cstdlib>      // setenv, unsetenv
#include <stdexcept>
#include <memory>

#include <json/json.h>

#include "service_config.h"
#include "ioutil.h"
#include "test_util.h"

using recsvc::ServiceConfig;
using recsvc::IOUtil;
using recsvc::test::TempDir;

namespace {
    Json::Value parse(const std::string &text) {
        Json::CharReaderBuilder builder;
        std::unique_ptr<Json::CharReader> reader(builder.newCharReader());
        Json::Value doc;
        std::string errors;
        if (!reader->parse(text.data(), text.data() + text.size(), &doc, &errors)) {
            throw std::runtime_error(errors);
        }
        return doc;
    }
}

TEST(ServiceConfigTest, DefaultsMatchDocumentedValues) {
    ServiceConfig config;

    EXPECT_EQ(config.model_dir, "models");
    EXPECT_EQ(config.trainer.max_interactions, 50000u);
    EXPECT_DOUBLE_EQ(config.trainer.freshness_hours, 24);
    EXPECT_EQ(config.trainer.default_dataset, "movielens-small");
    EXPECT_DOUBLE_EQ(config.scheduler.interval_hours, 12);
    EXPECT_EQ(config.scheduler.interaction_threshold, 50);
    EXPECT_FALSE(config.scheduler.window_enabled);
    EXPECT_EQ(config.scheduler.defaults.epochs, 10);
    EXPECT_EQ(config.scheduler.defaults.batch_size, 64);
    EXPECT_FLOAT_EQ(config.trainer.settings.at("lrate"), 0.005f);
    EXPECT_FLOAT_EQ(config.trainer.settings.at("num_factors"), 50);
}

TEST(ServiceConfigTest, JsonOverridesOnlyGivenKeys) {
    ServiceConfig config = ServiceConfig::fromJson(parse(
        "{ \"model_dir\": \"/srv/models\","
        "  \"scheduler\": { \"interaction_threshold\": 200,"
        "                   \"window_start_hour\": 22, \"window_end_hour\": 4,"
        "                   \"tick_seconds\": 5 },"
        "  \"settings\": { \"num_factors\": 16 } }"));

    EXPECT_EQ(config.model_dir, "/srv/models");
    EXPECT_EQ(config.status_dir, "/srv/models/jobs");
    EXPECT_EQ(config.scheduler.interaction_threshold, 200);
    EXPECT_TRUE(config.scheduler.window_enabled);
    EXPECT_EQ(config.scheduler.window_start_hour, 22);
    EXPECT_EQ(config.scheduler.window_end_hour, 4);
    EXPECT_EQ(config.scheduler.tick.count(), 5);
    EXPECT_DOUBLE_EQ(config.scheduler.interval_hours, 12);
    EXPECT_FLOAT_EQ(config.trainer.settings.at("num_factors"), 16);
    EXPECT_FLOAT_EQ(config.trainer.settings.at("regl"), 0.02f);
}

TEST(ServiceConfigTest, RejectsWrongTypes) {
    EXPECT_THROW(ServiceConfig::fromJson(parse("[]")), std::runtime_error);
    EXPECT_THROW(ServiceConfig::fromJson(parse("{\"model_dir\": 3}")), std::runtime_error);
    EXPECT_THROW(ServiceConfig::fromJson(parse("{\"scheduler\": {\"window_start_hour\": 30}}")),
                 std::runtime_error);
    EXPECT_THROW(ServiceConfig::fromJson(parse("{\"settings\": {\"lrate\": \"fast\"}}")),
                 std::runtime_error);
}

TEST(ServiceConfigTest, ReadsFileAndEnvironment) {
    TempDir tmp;
    std::ofstream(tmp.file("config.json")) << "{ \"log_level\": \"warn\" }";

    setenv("RECSVC_INTERACTION_THRESHOLD", "7", 1);
    setenv("OMP_NUM_THREADS", "3", 1);
    ServiceConfig config = ServiceConfig::fromFile(tmp.file("config.json"));
    config.applyEnvironment();
    unsetenv("RECSVC_INTERACTION_THRESHOLD");
    unsetenv("OMP_NUM_THREADS");

    EXPECT_EQ(config.log_level, "warn");
    EXPECT_EQ(config.scheduler.interaction_threshold, 7);
    EXPECT_EQ(config.num_threads, 3);
    EXPECT_FLOAT_EQ(config.trainer.settings.at("num_threads"), 3);
}

TEST(ServiceConfigTest, MissingFileIsReported) {
    EXPECT_THROW(ServiceConfig::fromFile("/nonexistent/recsvc.json"), std::runtime_error);
}
