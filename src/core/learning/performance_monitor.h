#pragma once

#include "core/learning/learning_types.h"

#include <QJsonObject>
#include <QVector>

#include <mutex>

namespace ci {

// Running feedback statistics. Counters only grow; a model rollback never
// touches them.
class PerformanceMonitor {
public:
    PerformanceMonitor(double positiveThreshold, int maxHistoryLength);

    // Counts a processed batch and appends one accuracy sample.
    void record(const QVector<FeedbackEvent>& batch);

    // Notes a flush cycle whose snapshot could not be persisted.
    void recordPersistFailure(const QString& reason);

    PerformanceSnapshot snapshot() const;
    QJsonObject toJson() const;

    double positiveThreshold() const { return m_positiveThreshold; }
    int maxHistoryLength() const { return m_maxHistoryLength; }

private:
    const double m_positiveThreshold;
    const int m_maxHistoryLength;  // 0 = unbounded

    mutable std::mutex m_mutex;
    PerformanceSnapshot m_state;
};

} // namespace ci
