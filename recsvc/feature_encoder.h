/**
 * Bidirectional mapping between opaque string identifiers (user ids, content ids)
 * and dense integer indices usable as rows of the embedding matrices.
 *
 * Indices are assigned in first-seen order. An encoder is built once per training run
 * and is never extended afterwards: it is the only valid encoder for the model version
 * trained with it.
 */
#ifndef __RECSVC_FEATURE_ENCODER_H
#define __RECSVC_FEATURE_ENCODER_H

#include <string>
#include <vector>
#include <unordered_map>

#include <json/json.h>

namespace recsvc {
    class FeatureEncoder {
    public:
        /* Returned by encode() for identifiers not seen during fit() */
        static const int UNKNOWN_INDEX = -1;

        FeatureEncoder() {}

        /* Build the mapping. Duplicates keep the index of their first occurrence. */
        static FeatureEncoder fit(const std::vector<std::string> &ids);

        /*
         * Index of `id`, or UNKNOWN_INDEX if `id` was not part of the fitted data.
         * Never throws, so inference on cold-start identifiers does not fail.
         */
        int encode(const std::string &id) const;

        /* Original identifier of an index. Throws std::out_of_range for a bad index. */
        const std::string& inverse(int index) const;

        bool contains(const std::string &id) const {
            return m_index.count(id) > 0;
        }

        int size() const {
            return static_cast<int>(m_ids.size());
        }

        const std::vector<std::string>& ids() const {
            return m_ids;
        }

        Json::Value toJson() const;
        /* Throws std::runtime_error if the document is not a list of unique strings */
        static FeatureEncoder fromJson(const Json::Value &doc);

    private:
        std::vector<std::string> m_ids;
        std::unordered_map<std::string, int> m_index;

        int add(const std::string &id);
    };
}

#endif
