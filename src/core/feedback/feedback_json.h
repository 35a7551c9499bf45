#pragma once

#include "core/learning/learning_types.h"

#include <QByteArray>
#include <QJsonObject>
#include <QString>

#include <optional>

namespace ci {

// JSON form of a FeedbackEvent, one object per line in replay files:
//   {"query": "...", "resultId": "...", "relevance": 0.8,
//    "timestamp": "2026-01-01T00:00:00.000Z", "userId": "..."}
// timestamp and userId are optional; a missing timestamp means "now".
QJsonObject feedbackEventToJson(const FeedbackEvent& event);
std::optional<FeedbackEvent> feedbackEventFromJson(const QJsonObject& json,
                                                   QString* errorOut = nullptr);

// Parses one JSON-lines record. Range checks are left to
// LearningService::validateFeedback.
std::optional<FeedbackEvent> parseFeedbackLine(const QByteArray& line,
                                               QString* errorOut = nullptr);

} // namespace ci
