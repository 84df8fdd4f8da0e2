/**
 * Matrix factorization model for collaborative filtering, trained with
 * stochastic gradient descent over mini-batches of interactions.
 *
 * The model predicts the interaction value of a (user, item) pair as
 *      global_bias + user_bias[u] + item_bias[i] + <user_vec[u], item_vec[i]>
 * clipped to the rating range.
 *
 * A model starts Untrained and becomes Trained either through train() or by being
 * restored from persisted arrays. The transition is one-way: a new training run
 * creates a new model instance.
 *
 * Used settings:
 * - lrate: learning rate
 * - regl: L2 regularization of vectors and biases
 * - max_iter: number of epochs
 * - batch_size: number of samples per batch
 * - init_stdev: standard deviation of the initial vectors
 * - lrate_reduction: learning rate multiplier applied after every epoch
 * - seed: random seed for initialization and shuffling
 * - num_threads: threads used for the batch forward pass
 */
#ifndef __RECSVC_MF_MODEL_H
#define __RECSVC_MF_MODEL_H

#include <vector>
#include <string>
#include <functional>
#include <stdexcept>

#include <Eigen/Dense>

#include "rec_types.h"

namespace recsvc {
    /**
     * Called after every epoch with the (1-based) epoch number, the total number of
     * epochs and the epoch loss. Returning false aborts training.
     */
    typedef std::function<bool(int, int, double)> EpochCallback;

    /* Thrown by FactorizationModel::train when the epoch callback requests an abort */
    class TrainingAborted : public std::runtime_error {
    public:
        explicit TrainingAborted(const std::string &what) : std::runtime_error(what) {}
    };

    class FactorizationModel {
    public:
        explicit FactorizationModel(int numFactors);

        /**
         * Restore a trained model from its parameter arrays.
         * Throws std::invalid_argument if the array dimensions are inconsistent.
         */
        FactorizationModel(dtype globalBias,
                           const MatrixD &userVecs, const MatrixD &itemVecs,
                           const ColVectorD &userBias, const ColVectorD &itemBias);

        /**
         * Fit the model on encoded samples and return the per-epoch MSE loss.
         *
         * Within a batch the residuals are computed for all samples first. The updates
         * are then applied one sample at a time, so later samples in a batch update
         * parameters that earlier samples already modified.
         */
        std::vector<double> train(const std::vector<TrainingSample> &samples,
                                  int nusers, int nitems,
                                  const Settings &settings,
                                  const EpochCallback &callback = EpochCallback());

        /**
         * Clipped prediction. Untrained models and indices outside the fitted range
         * (including FeatureEncoder::UNKNOWN_INDEX) fall back to the global bias.
         */
        dtype predict(int u, int i) const;

        bool isTrained() const { return m_trained; }
        int numFactors() const { return m_numFactors; }
        int numUsers() const { return static_cast<int>(m_userVecs.rows()); }
        int numItems() const { return static_cast<int>(m_itemVecs.rows()); }

        dtype globalBias() const { return m_globalBias; }
        const MatrixD& userVecs() const { return m_userVecs; }
        const MatrixD& itemVecs() const { return m_itemVecs; }
        const ColVectorD& userBias() const { return m_userBias; }
        const ColVectorD& itemBias() const { return m_itemBias; }

    protected:
        void initData(const std::vector<TrainingSample> &samples, int nusers, int nitems);

        /* Unclipped prediction, used for the training residuals */
        dtype predictRaw(int u, int i) const;

        void predictUpdate(const TrainingSample &sample, dtype err);

        /* Learning rate decay at the end of an epoch */
        void postIter();

        dtype getSetting(const std::string &s) const;
        int getIntSetting(const std::string &s) const {
            return static_cast<int>(getSetting(s));
        }

    private:
        Settings m_settings;
        int m_numFactors;
        bool m_trained;

        MatrixD m_userVecs;
        MatrixD m_itemVecs;
        ColVectorD m_userBias;
        ColVectorD m_itemBias;
        dtype m_globalBias;

        dtype m_lrate;
    };
}

#endif
