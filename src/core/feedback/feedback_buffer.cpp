#include "core/feedback/feedback_buffer.h"
#include "core/shared/logging.h"

#include <algorithm>
#include <utility>

namespace ci {

FeedbackBuffer::FeedbackBuffer(int batchThreshold)
    : m_batchThreshold(std::max(1, batchThreshold))
{
    m_events.reserve(m_batchThreshold);
}

std::optional<QVector<FeedbackEvent>> FeedbackBuffer::collect(FeedbackEvent event)
{
    std::lock_guard<std::mutex> lock(m_mutex);

    m_events.push_back(std::move(event));
    if (m_events.size() < m_batchThreshold) {
        return std::nullopt;
    }

    QVector<FeedbackEvent> batch;
    batch.reserve(m_batchThreshold);
    batch.swap(m_events);

    LOG_DEBUG(ciLearning, "FeedbackBuffer threshold reached (batch=%d)",
              static_cast<int>(batch.size()));
    return batch;
}

QVector<FeedbackEvent> FeedbackBuffer::flush()
{
    std::lock_guard<std::mutex> lock(m_mutex);
    QVector<FeedbackEvent> batch;
    batch.swap(m_events);
    m_events.reserve(m_batchThreshold);
    return batch;
}

int FeedbackBuffer::size() const
{
    std::lock_guard<std::mutex> lock(m_mutex);
    return static_cast<int>(m_events.size());
}

int FeedbackBuffer::batchThreshold() const
{
    return m_batchThreshold;
}

} // namespace ci
