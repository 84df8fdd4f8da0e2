/**
 * Implementation file for mf_model.h
 */
#include <cmath>
#include <random>
#include <numeric>      // iota
#include <algorithm>    // shuffle, min, max

#include <Eigen/Dense>
#include <spdlog/spdlog.h>

#include "mf_model.h"

using recsvc::FactorizationModel;
using recsvc::TrainingSample;
using recsvc::dtype;
using recsvc::MatrixD;
using recsvc::ColVectorD;
using recsvc::RowVectorD;


recsvc::FactorizationModel::FactorizationModel(int numFactors)
    : m_numFactors(numFactors), m_trained(false), m_globalBias(0), m_lrate(0)
{
    if (numFactors <= 0) {
        throw std::invalid_argument("num_factors must be positive");
    }
}

recsvc::FactorizationModel::FactorizationModel(dtype globalBias,
                                               const MatrixD &userVecs, const MatrixD &itemVecs,
                                               const ColVectorD &userBias, const ColVectorD &itemBias)
    : m_numFactors(static_cast<int>(userVecs.cols())), m_trained(true),
      m_userVecs(userVecs), m_itemVecs(itemVecs),
      m_userBias(userBias), m_itemBias(itemBias),
      m_globalBias(globalBias), m_lrate(0)
{
    if (m_numFactors <= 0 || itemVecs.cols() != userVecs.cols()) {
        throw std::invalid_argument("user and item vectors must share a positive dimension");
    }
    if (userBias.size() != userVecs.rows() || itemBias.size() != itemVecs.rows()) {
        throw std::invalid_argument("bias length does not match the number of vectors");
    }
}

dtype recsvc::FactorizationModel::getSetting(const std::string &s) const {
    auto it = m_settings.find(s);
    if (it == m_settings.end()) {
        throw std::invalid_argument("missing training setting '" + s + "'");
    }
    return it->second;
}

void recsvc::FactorizationModel::initData(const std::vector<TrainingSample> &samples,
                                          int nusers, int nitems)
{
    std::mt19937 rng(static_cast<unsigned>(getIntSetting("seed")));
    std::normal_distribution<dtype> nd(0, getSetting("init_stdev"));
    auto stdSample = [&rng, &nd](dtype) { return nd(rng); };

    m_userVecs = MatrixD::Zero(nusers, m_numFactors).unaryExpr(stdSample);
    m_itemVecs = MatrixD::Zero(nitems, m_numFactors).unaryExpr(stdSample);
    m_userBias = ColVectorD::Zero(nusers);
    m_itemBias = ColVectorD::Zero(nitems);

    // Global bias is the mean of all interaction values.
    double sum = 0;
    for (const TrainingSample &s : samples) {
        sum += s.value;
    }
    m_globalBias = static_cast<dtype>(sum / samples.size());
    m_lrate = getSetting("lrate");
}

dtype recsvc::FactorizationModel::predictRaw(int u, int i) const {
    dtype prediction = m_globalBias + m_userBias(u) + m_itemBias(i) +
                 m_userVecs.row(u).dot(m_itemVecs.row(i));
    return prediction;
}

dtype recsvc::FactorizationModel::predict(int u, int i) const {
    if (!m_trained) {
        return m_globalBias;
    }
    if (u < 0 || u >= numUsers() || i < 0 || i >= numItems()) {
        return m_globalBias;
    }
    return std::max(MIN_RATING, std::min(MAX_RATING, predictRaw(u, i)));
}

void recsvc::FactorizationModel::predictUpdate(const TrainingSample &sample, dtype err) {
    const int u = sample.user;
    const int i = sample.item;
    const dtype regl = getSetting("regl");

    // Both gradients are taken at the parameters before this update.
    RowVectorD userGrad = -err * m_itemVecs.row(i) + regl * m_userVecs.row(u);
    RowVectorD itemGrad = -err * m_userVecs.row(u) + regl * m_itemVecs.row(i);
    m_userVecs.row(u) -= m_lrate * userGrad;
    m_itemVecs.row(i) -= m_lrate * itemGrad;

    m_userBias(u) -= m_lrate * (-err + regl * m_userBias(u));
    m_itemBias(i) -= m_lrate * (-err + regl * m_itemBias(i));
}

void recsvc::FactorizationModel::postIter() {
    m_lrate *= getSetting("lrate_reduction");
}

std::vector<double> recsvc::FactorizationModel::train(const std::vector<TrainingSample> &samples,
                                                      int nusers, int nitems,
                                                      const Settings &settings,
                                                      const EpochCallback &callback)
{
    if (m_trained) {
        throw std::logic_error("model is already trained; create a new instance to retrain");
    }
    if (samples.empty()) {
        throw std::invalid_argument("cannot train on an empty sample set");
    }
    for (const TrainingSample &s : samples) {
        if (s.user < 0 || s.user >= nusers || s.item < 0 || s.item >= nitems) {
            throw std::invalid_argument("training sample index out of range");
        }
    }
    m_settings = settings;

    const int maxIter = getIntSetting("max_iter");
    const int batchSize = std::max(1, getIntSetting("batch_size"));
    const int nt = std::max(1, getIntSetting("num_threads"));
    const size_t n = samples.size();

    initData(samples, nusers, nitems);

    std::mt19937 rng(static_cast<unsigned>(getIntSetting("seed")) + 1);
    std::vector<size_t> order(n);
    std::iota(order.begin(), order.end(), 0);

    std::vector<double> history;
    history.reserve(maxIter);
    std::vector<dtype> errs(batchSize);

    for (int epoch = 1; epoch <= maxIter; ++epoch) {
        std::shuffle(order.begin(), order.end(), rng);
        double epochLoss = 0;

        for (size_t start = 0; start < n; start += batchSize) {
            const int len = static_cast<int>(std::min(n - start, static_cast<size_t>(batchSize)));

            // Forward pass for the whole batch
            double sqErr = 0;
            #pragma omp parallel for num_threads(nt) schedule(static) reduction(+:sqErr)
            for (int k = 0; k < len; ++k) {
                const TrainingSample &s = samples[order[start + k]];
                errs[k] = s.value - predictRaw(s.user, s.item);
                sqErr += static_cast<double>(errs[k]) * errs[k];
            }
            double batchLoss = sqErr / len;
            epochLoss += batchLoss * len / n;

            // Sequential per-sample updates
            for (int k = 0; k < len; ++k) {
                predictUpdate(samples[order[start + k]], errs[k]);
            }
        }

        if (std::isnan(epochLoss)) {
            throw std::runtime_error("training diverged (NaN loss) at epoch " + std::to_string(epoch));
        }
        history.push_back(epochLoss);
        spdlog::info("Epoch {}/{}, Loss: {:.4f}", epoch, maxIter, epochLoss);

        if (callback && !callback(epoch, maxIter, epochLoss)) {
            throw TrainingAborted("training aborted after epoch " + std::to_string(epoch));
        }
        postIter();
    }

    m_trained = true;
    return history;
}
