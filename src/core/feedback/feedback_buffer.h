#pragma once

#include "core/learning/learning_types.h"

#include <QVector>

#include <mutex>
#include <optional>

namespace ci {

// FeedbackBuffer -- thread-safe accumulation of feedback events.
//
// collect() appends, checks the threshold and detaches the batch inside one
// critical section, so two producers can never both observe the threshold
// and no event straddles a flush boundary.
class FeedbackBuffer {
public:
    static constexpr int DEFAULT_BATCH_THRESHOLD = 10;

    explicit FeedbackBuffer(int batchThreshold = DEFAULT_BATCH_THRESHOLD);

    // Non-copyable, non-movable
    FeedbackBuffer(const FeedbackBuffer&) = delete;
    FeedbackBuffer& operator=(const FeedbackBuffer&) = delete;
    FeedbackBuffer(FeedbackBuffer&&) = delete;
    FeedbackBuffer& operator=(FeedbackBuffer&&) = delete;

    // Append an event. Returns the detached batch when this append brought
    // the buffer to the threshold; the buffer is empty again afterwards.
    std::optional<QVector<FeedbackEvent>> collect(FeedbackEvent event);

    // Detach whatever is buffered, possibly nothing.
    QVector<FeedbackEvent> flush();

    int size() const;
    int batchThreshold() const;

private:
    const int m_batchThreshold;

    mutable std::mutex m_mutex;
    QVector<FeedbackEvent> m_events;
};

} // namespace ci
