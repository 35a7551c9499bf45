#include "core/learning/performance_monitor.h"

#include <QDateTime>
#include <QJsonArray>

#include <algorithm>

namespace ci {

PerformanceMonitor::PerformanceMonitor(double positiveThreshold, int maxHistoryLength)
    : m_positiveThreshold(std::clamp(positiveThreshold, 0.0, 1.0))
    , m_maxHistoryLength(std::max(0, maxHistoryLength))
{
}

void PerformanceMonitor::record(const QVector<FeedbackEvent>& batch)
{
    if (batch.isEmpty()) {
        return;
    }

    int positives = 0;
    for (const FeedbackEvent& event : batch) {
        if (event.relevanceScore >= m_positiveThreshold) {
            ++positives;
        }
    }

    std::lock_guard<std::mutex> lock(m_mutex);
    m_state.totalFeedback += batch.size();
    m_state.positiveFeedback += positives;
    m_state.negativeFeedback += batch.size() - positives;
    m_state.modelAccuracy = static_cast<double>(m_state.positiveFeedback)
        / static_cast<double>(m_state.totalFeedback);
    ++m_state.batchesProcessed;
    m_state.lastBatchSize = static_cast<int>(batch.size());

    PerformanceSample sample;
    sample.timestamp = QDateTime::currentDateTimeUtc();
    sample.accuracy = m_state.modelAccuracy;
    sample.feedbackCount = m_state.totalFeedback;
    m_state.performanceHistory.push_back(sample);

    if (m_maxHistoryLength > 0 && m_state.performanceHistory.size() > m_maxHistoryLength) {
        m_state.performanceHistory.remove(
            0, m_state.performanceHistory.size() - m_maxHistoryLength);
    }
}

void PerformanceMonitor::recordPersistFailure(const QString& reason)
{
    std::lock_guard<std::mutex> lock(m_mutex);
    ++m_state.persistFailures;
    m_state.lastPersistError = reason;
}

PerformanceSnapshot PerformanceMonitor::snapshot() const
{
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_state;
}

QJsonObject PerformanceMonitor::toJson() const
{
    const PerformanceSnapshot state = snapshot();

    QJsonArray history;
    for (const PerformanceSample& sample : state.performanceHistory) {
        QJsonObject entry;
        entry[QStringLiteral("timestamp")] = sample.timestamp.toString(Qt::ISODateWithMs);
        entry[QStringLiteral("accuracy")] = sample.accuracy;
        entry[QStringLiteral("feedbackCount")] = static_cast<qint64>(sample.feedbackCount);
        history.append(entry);
    }

    QJsonObject json;
    json[QStringLiteral("totalFeedback")] = static_cast<qint64>(state.totalFeedback);
    json[QStringLiteral("positiveFeedback")] = static_cast<qint64>(state.positiveFeedback);
    json[QStringLiteral("negativeFeedback")] = static_cast<qint64>(state.negativeFeedback);
    json[QStringLiteral("modelAccuracy")] = state.modelAccuracy;
    json[QStringLiteral("batchesProcessed")] = static_cast<qint64>(state.batchesProcessed);
    json[QStringLiteral("persistFailures")] = static_cast<qint64>(state.persistFailures);
    json[QStringLiteral("lastBatchSize")] = state.lastBatchSize;
    json[QStringLiteral("lastPersistError")] = state.lastPersistError;
    json[QStringLiteral("performanceHistory")] = history;
    json[QStringLiteral("maxHistoryLength")] = m_maxHistoryLength;
    return json;
}

} // namespace ci
