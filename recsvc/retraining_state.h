/**
 * Process-wide retraining state shared by the scheduler loop and manual triggers:
 * whether a training run is in progress and when the last successful run finished.
 */
#ifndef __RECSVC_RETRAINING_STATE_H
#define __RECSVC_RETRAINING_STATE_H

#include <mutex>

#include "rec_types.h"

namespace recsvc {
    class RetrainingState {
    public:
        RetrainingState() : m_training(false), m_hasLastRetraining(false) {}

        /*
         * Idle -> Training. Returns false, and changes nothing, if a run is
         * already in progress.
         */
        bool tryBeginRetraining();
        void endRetraining();
        bool isRetraining() const;

        /* Returns false if no run succeeded since the process started */
        bool lastRetrainingTime(TimePoint &out) const;
        void markRetrained(const TimePoint &when);

    private:
        mutable std::mutex m_mutex;
        bool m_training;
        bool m_hasLastRetraining;
        TimePoint m_lastRetraining;
    };

    /* Ends the run started by a successful tryBeginRetraining() when it goes out of scope */
    class RetrainingGuard {
    public:
        explicit RetrainingGuard(RetrainingState &state) : m_state(state) {}
        ~RetrainingGuard() { m_state.endRetraining(); }

        RetrainingGuard(const RetrainingGuard&) = delete;
        RetrainingGuard& operator=(const RetrainingGuard&) = delete;

    private:
        RetrainingState &m_state;
    };
}

#endif
