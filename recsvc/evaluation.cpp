/**
 * Implementation file for evaluation.h
 */
#include <cmath>        // sqrt

#include "evaluation.h"

double recsvc::rmse(const FactorizationModel &model, const std::vector<TrainingSample> &samples)
{
    if (samples.empty()) {
        return 0;
    }
    double running = 0;
    for (const TrainingSample &s : samples) {
        double diff = model.predict(s.user, s.item) - s.value;
        running += diff * diff;
    }
    running /= samples.size();
    return std::sqrt(running);
}
