/**
 * Common type definitions used elsewhere in the project.
 */
#ifndef __RECSVC_REC_TYPES_H
#define __RECSVC_REC_TYPES_H

#include <unordered_map>   // settings hashmap
#include <cstdint>         // int64_t
#include <utility>         // pair
#include <string>
#include <chrono>

#include <Eigen/Dense>

namespace recsvc {
    /* Main data type used to represent parameters and predictions.
     * Defined as float because double is slower and does not give better results */
    typedef float dtype;
    /* Dynamically sized matrix of floating point (one embedding per row) */
    typedef Eigen::Matrix<dtype, Eigen::Dynamic, Eigen::Dynamic, Eigen::RowMajor> MatrixD;
    /* Useful vectors */
    typedef Eigen::Matrix<dtype,  1, Eigen::Dynamic> RowVectorD;
    typedef Eigen::Matrix<dtype,  Eigen::Dynamic, 1> ColVectorD;
    /* Settings are a hashmap from setting names to setting values */
    typedef std::unordered_map<std::string, dtype> Settings;
    typedef std::pair<std::string, dtype> SettingsEntry;
    /* Wall clock time, used for model timestamps and scheduling decisions */
    typedef std::chrono::system_clock Clock;
    typedef Clock::time_point TimePoint;

    /* Rating range used to clip predictions */
    const dtype MIN_RATING = 1.0f;
    const dtype MAX_RATING = 5.0f;

    /**
     * One recorded user-content interaction (a rating, a like, a view).
     * `timestamp` is in unix seconds.
     */
    struct Interaction {
        std::string user_id;
        std::string content_id;
        dtype value;
        int64_t timestamp;
    };

    /**
     * An interaction after the user and content ids were replaced by
     * their encoded indices.
     */
    struct TrainingSample {
        int user;
        int item;
        dtype value;
    };

    /* A content item known to the catalog, with its popularity score */
    struct ContentItem {
        std::string content_id;
        double popularity_score;
    };
}

#endif
