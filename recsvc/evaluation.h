/**
 * Helper functions related to evaluation of trained models.
 */
#ifndef __RECSVC_EVALUATION_H
#define __RECSVC_EVALUATION_H
#include <vector>

#include "mf_model.h"
#include "rec_types.h"

namespace recsvc {

    /*
     * Root mean squared error of the (clipped) model predictions on the given samples.
     * Returns 0 for an empty sample set.
     */
    double rmse(const FactorizationModel &model, const std::vector<TrainingSample> &samples);

}
#endif
