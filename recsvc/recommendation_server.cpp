/**
 * Implementation file for recommendation_server.h
 */
#include <algorithm>    // stable_sort, min
#include <unordered_set>

#include <spdlog/spdlog.h>

#include "recommendation_server.h"

using std::string;
using std::vector;
using recsvc::Recommendation;
using recsvc::RecommendationList;
using recsvc::RecommenderModel;
using recsvc::ContentItem;

namespace {
    void sortAndTruncate(vector<Recommendation> &ranked, size_t limit) {
        std::stable_sort(ranked.begin(), ranked.end(),
                         [](const Recommendation &a, const Recommendation &b) {
                             return a.score > b.score;
                         });
        if (ranked.size() > limit) {
            ranked.resize(limit);
        }
    }
}

recsvc::RecommendationServer::RecommendationServer(ModelRepository &repository,
                                                   const ContentCatalog &catalog,
                                                   const InteractionSource &interactions,
                                                   int numThreads)
    : m_repository(repository), m_catalog(catalog), m_interactions(interactions),
      m_numThreads(std::max(1, numThreads))
{ }

std::shared_ptr<RecommenderModel> recsvc::RecommendationServer::currentModel() {
    const string dir = m_repository.currentDir();

    std::lock_guard<std::mutex> lock(m_modelMutex);
    if (dir == m_modelDir) {
        return m_model;
    }
    m_modelDir = dir;
    m_model.reset();
    if (dir.empty()) {
        return m_model;
    }
    try {
        m_model = m_repository.load(dir);
        spdlog::info("Serving model version {}", m_model->version().version_id);
    } catch (const ModelArtifactError &e) {
        spdlog::error("Cannot load current model, serving popular content: {}", e.what());
    }
    return m_model;
}

vector<Recommendation> recsvc::RecommendationServer::popular(size_t limit,
                                                             const CandidateFilter &filter) const
{
    vector<Recommendation> ranked;
    for (const ContentItem &item : m_catalog.items()) {
        if (filter && !filter(item.content_id)) {
            continue;
        }
        Recommendation r;
        r.content_id = item.content_id;
        r.score = item.popularity_score;
        ranked.push_back(r);
    }
    sortAndTruncate(ranked, limit);
    return ranked;
}

RecommendationList recsvc::RecommendationServer::getRecommendations(const string &userId, size_t limit,
                                                                    const CandidateFilter &filter,
                                                                    bool excludeSeen)
{
    RecommendationList result;
    result.personalized = false;

    std::shared_ptr<RecommenderModel> model = currentModel();
    if (!model || !model->users().contains(userId)) {
        result.items = popular(limit, filter);
        return result;
    }

    vector<string> candidates;
    const vector<ContentItem> catalog = m_catalog.items();
    if (catalog.empty()) {
        candidates = model->items().ids();
    } else {
        candidates.reserve(catalog.size());
        for (const ContentItem &item : catalog) {
            candidates.push_back(item.content_id);
        }
    }

    std::unordered_set<string> seen;
    if (excludeSeen) {
        for (const string &contentId : m_interactions.contentForUser(userId)) {
            seen.insert(contentId);
        }
    }
    vector<string> eligible;
    eligible.reserve(candidates.size());
    for (const string &contentId : candidates) {
        if (seen.count(contentId) > 0 || (filter && !filter(contentId))) {
            continue;
        }
        eligible.push_back(contentId);
    }

    const int userIndex = model->users().encode(userId);
    const FeatureEncoder &items = model->items();
    const FactorizationModel &mf = model->model();
    const int n = static_cast<int>(eligible.size());
    vector<Recommendation> ranked(n);
    #pragma omp parallel for num_threads(m_numThreads) schedule(static)
    for (int k = 0; k < n; ++k) {
        ranked[k].content_id = eligible[k];
        ranked[k].score = mf.predict(userIndex, items.encode(eligible[k]));
    }
    sortAndTruncate(ranked, limit);

    result.items = ranked;
    result.personalized = true;
    result.version_id = model->version().version_id;
    return result;
}
