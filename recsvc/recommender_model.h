/**
 * A trained model version as it is persisted and served: the factorization model
 * together with the encoders it was trained with and its metadata.
 */
#ifndef __RECSVC_RECOMMENDER_MODEL_H
#define __RECSVC_RECOMMENDER_MODEL_H

#include <string>

#include "rec_types.h"
#include "feature_encoder.h"
#include "mf_model.h"

namespace recsvc {
    /* Metadata of a model version. Immutable once the version is written. */
    struct ModelVersion {
        std::string version_id;
        int embedding_dim;
        int n_users;
        int n_items;
        TimePoint trained_at;
        /* Directory the version was loaded from (empty before it is saved) */
        std::string path;
        /* Added information, not needed to restore the model */
        std::string dataset;
        int n_interactions;
        double train_rmse;
        double final_loss;
    };

    class RecommenderModel {
    public:
        /* Throws std::invalid_argument if the encoder sizes do not match the model arrays */
        RecommenderModel(const ModelVersion &version,
                         const FeatureEncoder &users,
                         const FeatureEncoder &items,
                         const FactorizationModel &model);

        /*
         * Predicted interaction value for a (user, content) pair.
         * Unknown identifiers fall back to the global bias.
         */
        dtype predict(const std::string &userId, const std::string &contentId) const;

        const ModelVersion& version() const { return m_version; }
        const FeatureEncoder& users() const { return m_users; }
        const FeatureEncoder& items() const { return m_items; }
        const FactorizationModel& model() const { return m_model; }

        /* Set once the version is written to or loaded from a directory */
        void setPath(const std::string &path) { m_version.path = path; }

    private:
        ModelVersion m_version;
        FeatureEncoder m_users;
        FeatureEncoder m_items;
        FactorizationModel m_model;
    };
}

#endif
