/**
 * Implementation file for recommender_model.h
 */
#include <stdexcept>

#include "recommender_model.h"

recsvc::RecommenderModel::RecommenderModel(const ModelVersion &version,
                                           const FeatureEncoder &users,
                                           const FeatureEncoder &items,
                                           const FactorizationModel &model)
    : m_version(version), m_users(users), m_items(items), m_model(model)
{
    if (!model.isTrained()) {
        throw std::invalid_argument("cannot build a recommender from an untrained model");
    }
    if (users.size() != model.numUsers() || items.size() != model.numItems()) {
        throw std::invalid_argument("encoder class counts (" + std::to_string(users.size()) + ", " +
                                    std::to_string(items.size()) + ") do not match model arrays (" +
                                    std::to_string(model.numUsers()) + ", " +
                                    std::to_string(model.numItems()) + ")");
    }
    m_version.embedding_dim = model.numFactors();
    m_version.n_users = model.numUsers();
    m_version.n_items = model.numItems();
}

recsvc::dtype recsvc::RecommenderModel::predict(const std::string &userId,
                                                const std::string &contentId) const
{
    return m_model.predict(m_users.encode(userId), m_items.encode(contentId));
}
