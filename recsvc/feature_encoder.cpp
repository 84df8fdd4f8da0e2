/**
 * Implementation file for feature_encoder.h
 */
#include <stdexcept>

#include "feature_encoder.h"

using std::string;
using recsvc::FeatureEncoder;

const int FeatureEncoder::UNKNOWN_INDEX;

int recsvc::FeatureEncoder::add(const string &id) {
    auto search = m_index.find(id);
    if (search != m_index.end()) {
        return search->second;
    }
    int i = static_cast<int>(m_ids.size());
    m_index.emplace(id, i);
    m_ids.push_back(id);
    return i;
}

FeatureEncoder recsvc::FeatureEncoder::fit(const std::vector<string> &ids) {
    FeatureEncoder encoder;
    for (const string &id : ids) {
        encoder.add(id);
    }
    return encoder;
}

int recsvc::FeatureEncoder::encode(const string &id) const {
    auto search = m_index.find(id);
    if (search == m_index.end()) {
        return UNKNOWN_INDEX;
    }
    return search->second;
}

const string& recsvc::FeatureEncoder::inverse(int index) const {
    if (index < 0 || index >= size()) {
        throw std::out_of_range("encoded index " + std::to_string(index) +
                                " out of range [0, " + std::to_string(size()) + ")");
    }
    return m_ids[index];
}

Json::Value recsvc::FeatureEncoder::toJson() const {
    Json::Value doc(Json::arrayValue);
    for (const string &id : m_ids) {
        doc.append(id);
    }
    return doc;
}

FeatureEncoder recsvc::FeatureEncoder::fromJson(const Json::Value &doc) {
    if (!doc.isArray()) {
        throw std::runtime_error("encoder document is not a list");
    }
    FeatureEncoder encoder;
    for (Json::ArrayIndex k = 0; k < doc.size(); ++k) {
        if (!doc[k].isString()) {
            throw std::runtime_error("encoder entry " + std::to_string(k) + " is not a string");
        }
        // A repeated id would silently shift every later index
        if (encoder.add(doc[k].asString()) != static_cast<int>(k)) {
            throw std::runtime_error("duplicate encoder entry '" + doc[k].asString() + "'");
        }
    }
    return encoder;
}
