#include "core/shared/settings_manager.h"
#include "core/shared/logging.h"

#include <QDir>
#include <QFile>
#include <QFileInfo>
#include <QJsonArray>
#include <QJsonDocument>
#include <QJsonParseError>
#include <QProcessEnvironment>
#include <QSaveFile>
#include <QStandardPaths>

#include <algorithm>

namespace ci {

namespace {

// Empty object when the file is absent; nullopt when it exists but cannot be
// read as a JSON object.
std::optional<QJsonObject> readSettingsObject(const QString& filePath, bool* presentOut)
{
    QFile file(filePath);
    *presentOut = file.exists();
    if (!*presentOut) {
        return QJsonObject();
    }
    if (!file.open(QIODevice::ReadOnly)) {
        LOG_WARN(ciCore, "Settings file unreadable: %s (%s)",
                 qUtf8Printable(filePath), qUtf8Printable(file.errorString()));
        return std::nullopt;
    }

    QJsonParseError parseError;
    const QJsonDocument doc = QJsonDocument::fromJson(file.readAll(), &parseError);
    if (parseError.error != QJsonParseError::NoError || !doc.isObject()) {
        LOG_WARN(ciCore, "Settings file %s is not a JSON object: %s",
                 qUtf8Printable(filePath), qUtf8Printable(parseError.errorString()));
        return std::nullopt;
    }
    return doc.object();
}

// Readers never observe a half-written file: the payload lands in a sibling
// temp file that replaces filePath on commit.
bool writeSettingsObject(const QJsonObject& json, const QString& filePath)
{
    const QString parentDir = QFileInfo(filePath).absolutePath();
    if (!QDir().mkpath(parentDir)) {
        LOG_ERROR(ciCore, "Cannot create settings directory %s", qUtf8Printable(parentDir));
        return false;
    }

    QSaveFile out(filePath);
    if (!out.open(QIODevice::WriteOnly | QIODevice::Truncate)) {
        LOG_ERROR(ciCore, "Cannot stage settings file %s (%s)",
                  qUtf8Printable(filePath), qUtf8Printable(out.errorString()));
        return false;
    }
    const QByteArray payload = QJsonDocument(json).toJson(QJsonDocument::Indented);
    if (out.write(payload) != payload.size()) {
        LOG_ERROR(ciCore, "Short write staging settings file %s", qUtf8Printable(filePath));
        out.cancelWriting();
        return false;
    }
    if (!out.commit()) {
        LOG_ERROR(ciCore, "Cannot replace settings file %s (%s)",
                  qUtf8Printable(filePath), qUtf8Printable(out.errorString()));
        return false;
    }
    return true;
}

} // namespace

std::optional<LearningSettings> SettingsManager::load(const QString& filePath)
{
    bool present = false;
    const std::optional<QJsonObject> json = readSettingsObject(filePath, &present);
    if (!present || !json.has_value()) {
        return std::nullopt;
    }
    return fromJson(json.value());
}

bool SettingsManager::save(const LearningSettings& settings, const QString& filePath)
{
    if (!writeSettingsObject(toJson(settings), filePath)) {
        return false;
    }
    LOG_DEBUG(ciCore, "Learning settings written to %s", qUtf8Printable(filePath));
    return true;
}

QString SettingsManager::settingsFilePath()
{
    const QString envPath = QProcessEnvironment::systemEnvironment().value(
        QStringLiteral("CODEINDEX_SETTINGS_PATH"));
    if (!envPath.isEmpty()) {
        return QDir::cleanPath(envPath);
    }
    const QString basePath = QStandardPaths::writableLocation(QStandardPaths::GenericDataLocation);
    return basePath + QStringLiteral("/codeindex/learning.json");
}

QString SettingsManager::defaultDbPath()
{
    return QFileInfo(settingsFilePath()).absolutePath() + QStringLiteral("/learning_models.db");
}

QJsonObject SettingsManager::toJson(const LearningSettings& settings)
{
    QJsonArray weights;
    for (const FeatureWeightDefault& weight : settings.defaultWeights) {
        QJsonObject entry;
        entry.insert(QStringLiteral("name"), weight.name);
        entry.insert(QStringLiteral("value"), weight.value);
        entry.insert(QStringLiteral("confidence"), weight.confidence);
        weights.append(entry);
    }

    QJsonObject json;
    json.insert(QStringLiteral("dbPath"), settings.dbPath);
    json.insert(QStringLiteral("batchThreshold"), settings.batchThreshold);
    json.insert(QStringLiteral("flushIntervalMs"), static_cast<qint64>(settings.flushIntervalMs));
    json.insert(QStringLiteral("positiveThreshold"), settings.positiveThreshold);
    json.insert(QStringLiteral("maxHistoryLength"), settings.maxHistoryLength);
    json.insert(QStringLiteral("algorithm"), settings.algorithm);
    json.insert(QStringLiteral("emaAlpha"), settings.emaAlpha);
    json.insert(QStringLiteral("regretLearningRate"), settings.regretLearningRate);
    json.insert(QStringLiteral("checkpointEveryBatch"), settings.checkpointEveryBatch);
    json.insert(QStringLiteral("restoreOnStart"), settings.restoreOnStart);
    json.insert(QStringLiteral("defaultWeights"), weights);
    return json;
}

LearningSettings SettingsManager::fromJson(const QJsonObject& json)
{
    LearningSettings settings;

    settings.dbPath = json.value(QStringLiteral("dbPath")).toString(settings.dbPath);

    if (json.contains(QStringLiteral("batchThreshold"))) {
        settings.batchThreshold = std::max(
            1, json.value(QStringLiteral("batchThreshold")).toInt(settings.batchThreshold));
    }

    if (json.contains(QStringLiteral("flushIntervalMs"))) {
        settings.flushIntervalMs = std::max<qint64>(
            0, json.value(QStringLiteral("flushIntervalMs")).toVariant().toLongLong());
    }

    settings.positiveThreshold = std::clamp(
        json.value(QStringLiteral("positiveThreshold")).toDouble(settings.positiveThreshold),
        0.0, 1.0);

    if (json.contains(QStringLiteral("maxHistoryLength"))) {
        settings.maxHistoryLength = std::max(
            0, json.value(QStringLiteral("maxHistoryLength")).toInt(settings.maxHistoryLength));
    }

    settings.algorithm = json.value(QStringLiteral("algorithm")).toString(settings.algorithm);

    // alpha must stay in (0,1]; a zero alpha would freeze every weight.
    const double alpha = json.value(QStringLiteral("emaAlpha")).toDouble(settings.emaAlpha);
    if (alpha > 0.0 && alpha <= 1.0) {
        settings.emaAlpha = alpha;
    } else {
        LOG_WARN(ciCore, "Ignoring emaAlpha=%f outside (0,1]", alpha);
    }

    settings.regretLearningRate = std::clamp(
        json.value(QStringLiteral("regretLearningRate")).toDouble(settings.regretLearningRate),
        0.0, 1.0);

    settings.checkpointEveryBatch = json.value(QStringLiteral("checkpointEveryBatch"))
                                        .toBool(settings.checkpointEveryBatch);
    settings.restoreOnStart = json.value(QStringLiteral("restoreOnStart"))
                                  .toBool(settings.restoreOnStart);

    const QJsonArray weightsArray = json.value(QStringLiteral("defaultWeights")).toArray();
    if (!weightsArray.isEmpty()) {
        QVector<FeatureWeightDefault> parsed;
        parsed.reserve(weightsArray.size());
        for (const QJsonValue& value : weightsArray) {
            const QJsonObject entry = value.toObject();
            FeatureWeightDefault weight;
            weight.name = entry.value(QStringLiteral("name")).toString().trimmed();
            if (weight.name.isEmpty()) {
                continue;
            }
            weight.value = std::clamp(entry.value(QStringLiteral("value")).toDouble(0.0), 0.0, 1.0);
            weight.confidence = std::clamp(
                entry.value(QStringLiteral("confidence")).toDouble(0.5), 0.0, 1.0);
            parsed.push_back(weight);
        }
        // An empty key set is not a valid model; keep the built-in features.
        if (!parsed.isEmpty()) {
            settings.defaultWeights = std::move(parsed);
        }
    }

    return settings;
}

} // namespace ci
