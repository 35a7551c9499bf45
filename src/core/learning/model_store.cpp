#include "core/learning/model_store.h"
#include "core/shared/logging.h"

#include <QJsonDocument>
#include <QJsonObject>
#include <QJsonParseError>
#include <QStringList>
#include <QTimeZone>

#include <cmath>
#include <utility>

namespace ci {

namespace {

constexpr const char* kInitialVersion = "1.0.0";

QDateTime fromEpochSeconds(double seconds)
{
    return QDateTime::fromMSecsSinceEpoch(static_cast<qint64>(std::llround(seconds * 1000.0)),
                                          QTimeZone::UTC);
}

} // namespace

ModelStore::ModelStore(std::unique_ptr<SnapshotBackend> backend, AdaptiveWeights defaults)
    : m_backend(std::move(backend))
    , m_defaults(std::move(defaults))
{
}

QByteArray ModelStore::encode(const ModelVersion& version)
{
    QJsonObject weights;
    for (auto it = version.weights.cbegin(); it != version.weights.cend(); ++it) {
        QJsonObject entry;
        entry[QStringLiteral("value")] = it->value;
        entry[QStringLiteral("confidence")] = it->confidence;
        entry[QStringLiteral("lastUpdated")] = it->lastUpdated.toUTC().toString(Qt::ISODateWithMs);
        weights[it.key()] = entry;
    }

    QJsonObject root;
    root[QStringLiteral("version")] = version.versionId;
    root[QStringLiteral("createdAt")] = version.createdAt.toUTC().toString(Qt::ISODateWithMs);
    root[QStringLiteral("weights")] = weights;
    return QJsonDocument(root).toJson(QJsonDocument::Compact);
}

std::optional<ModelVersion> ModelStore::decode(const QByteArray& payload, QString* errorOut)
{
    auto fail = [errorOut](const QString& reason) -> std::optional<ModelVersion> {
        if (errorOut) {
            *errorOut = reason;
        }
        return std::nullopt;
    };

    QJsonParseError parseError;
    const QJsonDocument doc = QJsonDocument::fromJson(payload, &parseError);
    if (parseError.error != QJsonParseError::NoError || !doc.isObject()) {
        return fail(QStringLiteral("invalid snapshot json: %1").arg(parseError.errorString()));
    }

    const QJsonObject root = doc.object();
    ModelVersion version;
    version.versionId = root.value(QStringLiteral("version")).toString();
    if (version.versionId.isEmpty()) {
        return fail(QStringLiteral("snapshot has no version id"));
    }
    version.createdAt = QDateTime::fromString(root.value(QStringLiteral("createdAt")).toString(),
                                              Qt::ISODateWithMs);

    const QJsonObject weights = root.value(QStringLiteral("weights")).toObject();
    if (weights.isEmpty()) {
        return fail(QStringLiteral("snapshot %1 has no weights").arg(version.versionId));
    }

    for (auto it = weights.constBegin(); it != weights.constEnd(); ++it) {
        const QJsonObject entry = it.value().toObject();
        const QJsonValue value = entry.value(QStringLiteral("value"));
        if (!value.isDouble() || !std::isfinite(value.toDouble())) {
            return fail(QStringLiteral("snapshot %1 weight '%2' has no numeric value")
                            .arg(version.versionId, it.key()));
        }

        if (value.toDouble() < 0.0 || value.toDouble() > 1.0) {
            return fail(QStringLiteral("snapshot %1 weight '%2' value %3 outside [0,1]")
                            .arg(version.versionId, it.key())
                            .arg(value.toDouble()));
        }
        const double confidence = entry.value(QStringLiteral("confidence")).toDouble(0.0);
        if (!std::isfinite(confidence) || confidence < 0.0 || confidence > 1.0) {
            return fail(QStringLiteral("snapshot %1 weight '%2' confidence %3 outside [0,1]")
                            .arg(version.versionId, it.key())
                            .arg(confidence));
        }

        AdaptiveWeight weight;
        weight.name = it.key();
        weight.value = value.toDouble();
        weight.confidence = confidence;
        weight.lastUpdated = QDateTime::fromString(
            entry.value(QStringLiteral("lastUpdated")).toString(), Qt::ISODateWithMs);
        version.weights.insert(weight.name, weight);
    }

    return version;
}

QString ModelStore::nextVersionId(const QString& latestId)
{
    if (latestId.isEmpty()) {
        return QString::fromLatin1(kInitialVersion);
    }

    const QStringList parts = latestId.split(QLatin1Char('.'));
    if (parts.size() != 3) {
        return QString();
    }

    bool okMajor = false;
    bool okMinor = false;
    bool okPatch = false;
    const int major = parts.at(0).toInt(&okMajor);
    const int minor = parts.at(1).toInt(&okMinor);
    const int patch = parts.at(2).toInt(&okPatch);
    if (!okMajor || !okMinor || !okPatch || major < 0 || minor < 0 || patch < 0) {
        return QString();
    }
    return QStringLiteral("%1.%2.%3").arg(major).arg(minor).arg(patch + 1);
}

AdaptiveWeights ModelStore::conformToDefaults(const AdaptiveWeights& stored) const
{
    AdaptiveWeights conformed = m_defaults;
    int missing = 0;
    for (auto it = conformed.begin(); it != conformed.end(); ++it) {
        const auto storedIt = stored.constFind(it.key());
        if (storedIt == stored.cend()) {
            ++missing;
            continue;
        }
        it.value() = storedIt.value();
        it.value().name = it.key();
    }

    int dropped = 0;
    for (auto it = stored.cbegin(); it != stored.cend(); ++it) {
        if (!m_defaults.contains(it.key())) {
            ++dropped;
        }
    }
    if (missing > 0 || dropped > 0) {
        LOG_WARN(ciStore, "Snapshot feature set differs from model (missing=%d dropped=%d)",
                 missing, dropped);
    }
    return conformed;
}

std::optional<ModelVersion> ModelStore::save(const AdaptiveWeights& weights, LearningError* errorOut)
{
    std::lock_guard<std::mutex> lock(m_mutex);

    QString backendError;
    const std::optional<QVector<SnapshotRecord>> records = m_backend->listVersions(&backendError);
    if (!records.has_value()) {
        setLearningError(errorOut, LearningErrorKind::StorageUnavailable, backendError);
        LOG_WARN(ciStore, "ModelStore::save could not list versions: %s", qUtf8Printable(backendError));
        return std::nullopt;
    }

    const QString latestId = records->isEmpty() ? QString() : records->constLast().versionId;
    const int64_t nextSequence = records->isEmpty() ? 0 : records->constLast().sequence + 1;

    ModelVersion version;
    version.versionId = nextVersionId(latestId);
    if (version.versionId.isEmpty()) {
        setLearningError(errorOut, LearningErrorKind::CorruptState,
                         QStringLiteral("latest version id '%1' is not major.minor.patch").arg(latestId));
        LOG_ERROR(ciStore, "ModelStore::save cannot bump version id '%s'", qUtf8Printable(latestId));
        return std::nullopt;
    }
    version.weights = weights;
    version.createdAt = QDateTime::currentDateTimeUtc();

    SnapshotRecord record;
    record.versionId = version.versionId;
    record.sequence = nextSequence;
    record.createdAt = static_cast<double>(version.createdAt.toMSecsSinceEpoch()) / 1000.0;
    record.payload = encode(version);

    if (!m_backend->append(record, true, &backendError)) {
        setLearningError(errorOut, LearningErrorKind::StorageUnavailable, backendError);
        LOG_WARN(ciStore, "ModelStore::save failed for %s: %s",
                 qUtf8Printable(version.versionId), qUtf8Printable(backendError));
        return std::nullopt;
    }

    LOG_INFO(ciStore, "Model snapshot saved version=%s weights=%d",
             qUtf8Printable(version.versionId), static_cast<int>(weights.size()));
    setLearningError(errorOut, LearningErrorKind::None, QString());
    return version;
}

std::optional<ModelVersion> ModelStore::readVersionUnlocked(const QString& versionId,
                                                            LearningError* errorOut) const
{
    QString backendError;
    const std::optional<SnapshotRecord> record = m_backend->read(versionId, &backendError);
    if (!record.has_value()) {
        setLearningError(errorOut, LearningErrorKind::StorageUnavailable, backendError);
        return std::nullopt;
    }

    QString decodeError;
    std::optional<ModelVersion> version = decode(record->payload, &decodeError);
    if (!version.has_value()) {
        setLearningError(errorOut, LearningErrorKind::CorruptState, decodeError);
        LOG_ERROR(ciStore, "Snapshot %s is corrupt: %s",
                  qUtf8Printable(versionId), qUtf8Printable(decodeError));
        return std::nullopt;
    }
    if (version->versionId != versionId) {
        setLearningError(errorOut, LearningErrorKind::CorruptState,
                         QStringLiteral("snapshot row %1 carries version %2")
                             .arg(versionId, version->versionId));
        return std::nullopt;
    }
    return version;
}

std::optional<AdaptiveWeights> ModelStore::load(LearningError* errorOut) const
{
    std::lock_guard<std::mutex> lock(m_mutex);

    QString backendError;
    const std::optional<QVector<SnapshotRecord>> records = m_backend->listVersions(&backendError);
    const std::optional<QString> current = records.has_value()
        ? m_backend->current(&backendError)
        : std::nullopt;
    if (!records.has_value() || !current.has_value()) {
        setLearningError(errorOut, LearningErrorKind::StorageUnavailable, backendError);
        LOG_WARN(ciStore, "ModelStore::load backend unavailable: %s", qUtf8Printable(backendError));
        return std::nullopt;
    }

    if (records->isEmpty()) {
        setLearningError(errorOut, LearningErrorKind::None, QString());
        return m_defaults;
    }

    QString targetId = current.value();
    if (targetId.isEmpty()) {
        targetId = records->constLast().versionId;
    }

    bool known = false;
    for (const SnapshotRecord& record : records.value()) {
        if (record.versionId == targetId) {
            known = true;
            break;
        }
    }
    if (!known) {
        setLearningError(errorOut, LearningErrorKind::CorruptState,
                         QStringLiteral("current version %1 is not in history").arg(targetId));
        LOG_ERROR(ciStore, "ModelStore::load current pointer %s is dangling", qUtf8Printable(targetId));
        return std::nullopt;
    }

    const std::optional<ModelVersion> version = readVersionUnlocked(targetId, errorOut);
    if (!version.has_value()) {
        return std::nullopt;
    }

    setLearningError(errorOut, LearningErrorKind::None, QString());
    return conformToDefaults(version->weights);
}

bool ModelStore::rollback(const QString& versionId,
                          AdaptiveWeights* restoredOut,
                          LearningError* errorOut)
{
    std::lock_guard<std::mutex> lock(m_mutex);

    QString backendError;
    const std::optional<QVector<SnapshotRecord>> records = m_backend->listVersions(&backendError);
    if (!records.has_value()) {
        setLearningError(errorOut, LearningErrorKind::StorageUnavailable, backendError);
        return false;
    }

    bool known = false;
    for (const SnapshotRecord& record : records.value()) {
        if (record.versionId == versionId) {
            known = true;
            break;
        }
    }
    if (!known) {
        setLearningError(errorOut, LearningErrorKind::VersionNotFound,
                         QStringLiteral("version %1 not found").arg(versionId));
        return false;
    }

    const std::optional<ModelVersion> version = readVersionUnlocked(versionId, errorOut);
    if (!version.has_value()) {
        return false;
    }

    if (!m_backend->setCurrent(versionId, &backendError)) {
        setLearningError(errorOut, LearningErrorKind::StorageUnavailable, backendError);
        return false;
    }

    if (restoredOut) {
        *restoredOut = conformToDefaults(version->weights);
    }
    setLearningError(errorOut, LearningErrorKind::None, QString());
    return true;
}

std::optional<QVector<ModelVersion>> ModelStore::history(LearningError* errorOut) const
{
    std::lock_guard<std::mutex> lock(m_mutex);

    QString backendError;
    const std::optional<QVector<SnapshotRecord>> records = m_backend->listVersions(&backendError);
    if (!records.has_value()) {
        setLearningError(errorOut, LearningErrorKind::StorageUnavailable, backendError);
        return std::nullopt;
    }

    QVector<ModelVersion> versions;
    versions.reserve(records->size());
    for (const SnapshotRecord& record : records.value()) {
        ModelVersion version;
        version.versionId = record.versionId;
        version.createdAt = fromEpochSeconds(record.createdAt);
        versions.push_back(std::move(version));
    }
    return versions;
}

QString ModelStore::currentVersionId(LearningError* errorOut) const
{
    std::lock_guard<std::mutex> lock(m_mutex);

    QString backendError;
    const std::optional<QString> current = m_backend->current(&backendError);
    if (!current.has_value()) {
        setLearningError(errorOut, LearningErrorKind::StorageUnavailable, backendError);
        return QString();
    }
    return current.value();
}

} // namespace ci
