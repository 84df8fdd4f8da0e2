/**
 * Implementation file for retraining_state.h
 */
#include "retraining_state.h"

bool recsvc::RetrainingState::tryBeginRetraining() {
    std::lock_guard<std::mutex> lock(m_mutex);
    if (m_training) {
        return false;
    }
    m_training = true;
    return true;
}

void recsvc::RetrainingState::endRetraining() {
    std::lock_guard<std::mutex> lock(m_mutex);
    m_training = false;
}

bool recsvc::RetrainingState::isRetraining() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_training;
}

bool recsvc::RetrainingState::lastRetrainingTime(TimePoint &out) const {
    std::lock_guard<std::mutex> lock(m_mutex);
    if (!m_hasLastRetraining) {
        return false;
    }
    out = m_lastRetraining;
    return true;
}

void recsvc::RetrainingState::markRetrained(const TimePoint &when) {
    std::lock_guard<std::mutex> lock(m_mutex);
    m_lastRetraining = when;
    m_hasLastRetraining = true;
}
