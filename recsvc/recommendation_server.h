/**
 * Serves ranked content for a user from the current model version, falling back
 * to a popularity ranking when there is no usable model or the user is unknown.
 *
 * The loaded model is cached and reloaded only when the repository's current
 * pointer changes, so serving never waits for training.
 */
#ifndef __RECSVC_RECOMMENDATION_SERVER_H
#define __RECSVC_RECOMMENDATION_SERVER_H

#include <string>
#include <vector>
#include <memory>
#include <mutex>
#include <functional>

#include "rec_types.h"
#include "interaction_store.h"
#include "model_repository.h"
#include "recommender_model.h"

namespace recsvc {
    struct Recommendation {
        std::string content_id;
        double score;
    };

    struct RecommendationList {
        std::vector<Recommendation> items;
        /* False when the popularity fallback produced the list */
        bool personalized;
        /* Version that scored the list, empty for the fallback */
        std::string version_id;
    };

    /* Candidate filter, returns true for content ids that may be recommended */
    typedef std::function<bool(const std::string&)> CandidateFilter;

    class RecommendationServer {
    public:
        RecommendationServer(ModelRepository &repository,
                             const ContentCatalog &catalog,
                             const InteractionSource &interactions,
                             int numThreads = 1);

        /*
         * At most `limit` recommendations, best first. Ties keep the candidate
         * order (catalog order, or model order for an empty catalog).
         * Content the user already interacted with is left out when `excludeSeen`.
         */
        RecommendationList getRecommendations(const std::string &userId, size_t limit,
                                              const CandidateFilter &filter = CandidateFilter(),
                                              bool excludeSeen = true);

        /* Popular catalog items, ties in catalog order */
        std::vector<Recommendation> popular(size_t limit,
                                            const CandidateFilter &filter = CandidateFilter()) const;

        /* Model currently served, reloading it if the current pointer moved. May be null. */
        std::shared_ptr<RecommenderModel> currentModel();

    private:
        ModelRepository &m_repository;
        const ContentCatalog &m_catalog;
        const InteractionSource &m_interactions;
        int m_numThreads;

        std::mutex m_modelMutex;
        std::shared_ptr<RecommenderModel> m_model;
        std::string m_modelDir;
    };
}

#endif
