#include "core/feedback/feedback_json.h"

#include <QDateTime>
#include <QJsonDocument>
#include <QJsonParseError>
#include <QJsonValue>

namespace ci {

namespace {

std::optional<FeedbackEvent> fail(QString* errorOut, const QString& reason)
{
    if (errorOut) {
        *errorOut = reason;
    }
    return std::nullopt;
}

} // namespace

QJsonObject feedbackEventToJson(const FeedbackEvent& event)
{
    QJsonObject json;
    json[QStringLiteral("query")] = event.query;
    json[QStringLiteral("resultId")] = event.resultId;
    json[QStringLiteral("relevance")] = event.relevanceScore;
    json[QStringLiteral("timestamp")] = event.timestamp.toUTC().toString(Qt::ISODateWithMs);
    if (!event.userId.isEmpty()) {
        json[QStringLiteral("userId")] = event.userId;
    }
    return json;
}

std::optional<FeedbackEvent> feedbackEventFromJson(const QJsonObject& json, QString* errorOut)
{
    const QJsonValue relevance = json.value(QStringLiteral("relevance"));
    if (!relevance.isDouble()) {
        return fail(errorOut, QStringLiteral("relevance is missing or not a number"));
    }

    FeedbackEvent event;
    event.query = json.value(QStringLiteral("query")).toString();
    event.resultId = json.value(QStringLiteral("resultId")).toString();
    event.relevanceScore = relevance.toDouble();
    event.userId = json.value(QStringLiteral("userId")).toString();

    const QString timestamp = json.value(QStringLiteral("timestamp")).toString();
    if (timestamp.isEmpty()) {
        event.timestamp = QDateTime::currentDateTimeUtc();
    } else {
        event.timestamp = QDateTime::fromString(timestamp, Qt::ISODateWithMs);
        if (!event.timestamp.isValid()) {
            return fail(errorOut, QStringLiteral("unparsable timestamp '%1'").arg(timestamp));
        }
    }
    return event;
}

std::optional<FeedbackEvent> parseFeedbackLine(const QByteArray& line, QString* errorOut)
{
    QJsonParseError parseError;
    const QJsonDocument doc = QJsonDocument::fromJson(line, &parseError);
    if (parseError.error != QJsonParseError::NoError) {
        return fail(errorOut, parseError.errorString());
    }
    if (!doc.isObject()) {
        return fail(errorOut, QStringLiteral("feedback record is not a JSON object"));
    }
    return feedbackEventFromJson(doc.object(), errorOut);
}

} // namespace ci
