#include <gtest/gtest.h>

#include <string>
#include <vector>
#include <memory>
#include <fstream>
#include <cstdio>
#include <cstdint>
#include <climits>      // PATH_MAX

#include <unistd.h>     // getcwd, chdir

#include "model_repository.h"
#include "recommender_model.h"
#include "feature_encoder.h"
#include "mf_model.h"
#include "ioutil.h"
#include "test_util.h"

using recsvc::ModelRepository;
using recsvc::ModelArtifactError;
using recsvc::RecommenderModel;
using recsvc::ModelVersion;
using recsvc::FeatureEncoder;
using recsvc::FactorizationModel;
using recsvc::TrainingSample;
using recsvc::IOUtil;
using recsvc::test::TempDir;

namespace {
    /* Changes the working directory for the lifetime of the object */
    class ScopedChdir {
    public:
        explicit ScopedChdir(const std::string &dir) {
            char buf[PATH_MAX];
            if (::getcwd(buf, sizeof(buf)) == nullptr || ::chdir(dir.c_str()) != 0) {
                throw std::runtime_error("cannot change directory to " + dir);
            }
            m_previous = buf;
        }
        ~ScopedChdir() {
            if (::chdir(m_previous.c_str()) != 0) {
                ADD_FAILURE() << "cannot return to " << m_previous;
            }
        }

    private:
        std::string m_previous;
    };
}

class ModelRepositoryTest : public ::testing::Test {
protected:
    void SetUp() override {
        repository.reset(new ModelRepository(tmp.file("models")));
    }

    /* A small trained model with the given version id */
    RecommenderModel makeModel(const std::string &versionId) {
        FeatureEncoder users = FeatureEncoder::fit({"u1", "u2", "u3"});
        FeatureEncoder items = FeatureEncoder::fit({"i1", "i2"});
        std::vector<TrainingSample> samples;
        for (int u = 0; u < 3; ++u) {
            for (int i = 0; i < 2; ++i) {
                TrainingSample s;
                s.user = u;
                s.item = i;
                s.value = static_cast<recsvc::dtype>(1 + u + 2 * i);
                samples.push_back(s);
            }
        }
        FactorizationModel model(3);
        model.train(samples, 3, 2, recsvc::test::smallSettings(3));

        ModelVersion version;
        version.version_id = versionId;
        version.trained_at = recsvc::parseIsoString("2024-05-01T12:00:00Z");
        version.dataset = "unit";
        version.n_interactions = static_cast<int>(samples.size());
        version.train_rmse = 0.5;
        version.final_loss = 0.25;
        return RecommenderModel(version, users, items, model);
    }

    TempDir tmp;
    std::unique_ptr<ModelRepository> repository;
};

TEST_F(ModelRepositoryTest, NoCurrentBeforeFirstPromotion) {
    EXPECT_FALSE(repository->hasCurrent());
    EXPECT_EQ(repository->currentDir(), "");
    EXPECT_EQ(repository->currentVersionId(), "");
    EXPECT_TRUE(repository->current() == nullptr);
}

TEST_F(ModelRepositoryTest, SaveAndLoadPreservesPredictions) {
    RecommenderModel model = makeModel("v1");
    std::string dir = repository->save(model);
    EXPECT_EQ(model.version().path, dir);
    EXPECT_TRUE(ModelRepository::isCompleteVersion(dir));

    std::shared_ptr<RecommenderModel> loaded = repository->load(dir);
    ASSERT_TRUE(loaded != nullptr);
    EXPECT_EQ(loaded->version().version_id, "v1");
    EXPECT_EQ(loaded->version().embedding_dim, 3);
    EXPECT_EQ(loaded->version().n_users, 3);
    EXPECT_EQ(loaded->version().n_items, 2);
    EXPECT_EQ(loaded->version().dataset, "unit");
    EXPECT_EQ(loaded->version().trained_at, model.version().trained_at);
    EXPECT_EQ(loaded->users().ids(), model.users().ids());
    EXPECT_EQ(loaded->items().ids(), model.items().ids());
    EXPECT_FLOAT_EQ(loaded->model().globalBias(), model.model().globalBias());
    EXPECT_TRUE(loaded->model().itemVecs().isApprox(model.model().itemVecs()));

    for (const std::string &u : {"u1", "u2", "u3", "cold"}) {
        for (const std::string &i : {"i1", "i2", "new"}) {
            EXPECT_FLOAT_EQ(loaded->predict(u, i), model.predict(u, i));
        }
    }
}

TEST_F(ModelRepositoryTest, SaveRefusesExistingDirectory) {
    RecommenderModel model = makeModel("v1");
    repository->save(model);
    RecommenderModel again = makeModel("v1");
    EXPECT_THROW(repository->save(again), std::runtime_error);
}

TEST_F(ModelRepositoryTest, PromoteMovesCurrentPointer) {
    RecommenderModel first = makeModel("v1");
    RecommenderModel second = makeModel("v2");
    std::string dir1 = repository->save(first);
    std::string dir2 = repository->save(second);

    repository->promote(dir1);
    EXPECT_EQ(repository->currentVersionId(), "v1");
    EXPECT_EQ(repository->current()->version().version_id, "v1");

    repository->promote(dir2);
    EXPECT_EQ(repository->currentVersionId(), "v2");
    EXPECT_EQ(repository->current()->version().version_id, "v2");

    // Superseded versions are kept
    EXPECT_EQ(repository->listVersions(), std::vector<std::string>({"v1", "v2"}));
}

TEST_F(ModelRepositoryTest, PromoteRejectsIncompleteVersion) {
    std::string dir = repository->versionDir("partial");
    IOUtil::makeDirs(dir);
    std::ofstream(IOUtil::joinPath(dir, ModelRepository::METADATA_FILE)) << "{}";

    EXPECT_THROW(repository->promote(dir), ModelArtifactError);
    EXPECT_FALSE(repository->hasCurrent());
    EXPECT_TRUE(repository->listVersions().empty());
}

TEST_F(ModelRepositoryTest, PromoteResolvesRelativePaths) {
    ScopedChdir cwd(tmp.path());
    ModelRepository relative("models");

    // Outside the repository root: linked by absolute path
    RecommenderModel outside = makeModel("v1");
    relative.save(outside, "other/v1");
    relative.promote("other/v1");
    EXPECT_TRUE(ModelRepository::isCompleteVersion(relative.currentDir()));
    EXPECT_EQ(relative.currentVersionId(), "v1");
    ASSERT_TRUE(relative.current() != nullptr);
    EXPECT_EQ(relative.current()->version().version_id, "v1");

    // Another spelling of a version inside the root: linked by name
    RecommenderModel inside = makeModel("v2");
    relative.save(inside, "./models/v2");
    relative.promote("./models/v2");
    EXPECT_EQ(relative.currentDir(), "models/v2");
    ASSERT_TRUE(relative.current() != nullptr);
    EXPECT_EQ(relative.current()->version().version_id, "v2");
}

TEST_F(ModelRepositoryTest, PromoteRejectsMissingDirectory) {
    RecommenderModel model = makeModel("v1");
    repository->promote(repository->save(model));

    EXPECT_THROW(repository->promote(repository->versionDir("nowhere")), ModelArtifactError);
    EXPECT_EQ(repository->currentVersionId(), "v1");
}

TEST_F(ModelRepositoryTest, ForeignByteOrderIsReported) {
    RecommenderModel model = makeModel("v1");
    std::string dir = repository->save(model);

    // The byte-order mark follows the magic and the format version
    std::fstream fs(IOUtil::joinPath(dir, ModelRepository::EMBEDDINGS_FILE),
                    std::fstream::in | std::fstream::out | std::fstream::binary);
    ASSERT_TRUE(fs.is_open());
    const uint32_t swapped = 0x04030201;
    fs.seekp(12);
    fs.write(reinterpret_cast<const char *>(&swapped), sizeof(swapped));
    fs.close();

    EXPECT_THROW(repository->load(dir), ModelArtifactError);
}

TEST_F(ModelRepositoryTest, SyncPathNeedsAnExistingPath) {
    RecommenderModel model = makeModel("v1");
    std::string dir = repository->save(model);

    EXPECT_NO_THROW(IOUtil::syncPath(dir));
    EXPECT_NO_THROW(IOUtil::syncPath(IOUtil::joinPath(dir, ModelRepository::EMBEDDINGS_FILE)));
    EXPECT_THROW(IOUtil::syncPath(tmp.file("missing")), std::runtime_error);
}

TEST_F(ModelRepositoryTest, MissingArtifactIsReported) {
    RecommenderModel model = makeModel("v1");
    std::string dir = repository->save(model);
    std::remove(IOUtil::joinPath(dir, ModelRepository::ENCODERS_FILE).c_str());

    EXPECT_THROW(repository->load(dir), ModelArtifactError);
}

TEST_F(ModelRepositoryTest, TruncatedEmbeddingsAreReported) {
    RecommenderModel model = makeModel("v1");
    std::string dir = repository->save(model);
    std::ofstream(IOUtil::joinPath(dir, ModelRepository::EMBEDDINGS_FILE),
                  std::ofstream::out | std::ofstream::binary | std::ofstream::trunc) << "RSVCEMB1";

    EXPECT_THROW(repository->load(dir), ModelArtifactError);
}

TEST_F(ModelRepositoryTest, InconsistentEncodersAreReported) {
    RecommenderModel model = makeModel("v1");
    std::string dir = repository->save(model);

    Json::Value encoders = IOUtil::readJson(IOUtil::joinPath(dir, ModelRepository::ENCODERS_FILE));
    encoders["users"].append("u4");
    IOUtil::writeJson(IOUtil::joinPath(dir, ModelRepository::ENCODERS_FILE), encoders);

    EXPECT_THROW(repository->load(dir), ModelArtifactError);
}

TEST_F(ModelRepositoryTest, CorruptMetadataIsReported) {
    RecommenderModel model = makeModel("v1");
    std::string dir = repository->save(model);
    std::ofstream(IOUtil::joinPath(dir, ModelRepository::METADATA_FILE),
                  std::ofstream::out | std::ofstream::trunc) << "{\"version_id\": 3";

    EXPECT_THROW(repository->load(dir), ModelArtifactError);
    EXPECT_THROW(repository->readMetadata(dir), ModelArtifactError);
}

TEST_F(ModelRepositoryTest, ReadMetadataWithoutArrays) {
    RecommenderModel model = makeModel("v7");
    std::string dir = repository->save(model);
    std::remove(IOUtil::joinPath(dir, ModelRepository::EMBEDDINGS_FILE).c_str());

    ModelVersion version = repository->readMetadata(dir);
    EXPECT_EQ(version.version_id, "v7");
    EXPECT_EQ(version.n_interactions, 6);
    EXPECT_DOUBLE_EQ(version.train_rmse, 0.5);
    EXPECT_EQ(recsvc::toIsoString(version.trained_at), "2024-05-01T12:00:00Z");
}
