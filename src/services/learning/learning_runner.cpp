#include "learning_runner.h"

#include "core/feedback/feedback_json.h"
#include "core/learning/learning_service.h"
#include "core/learning/model_store.h"
#include "core/learning/sqlite_snapshot_backend.h"
#include "core/shared/logging.h"
#include "core/shared/settings_manager.h"

#include <QFile>
#include <QJsonDocument>
#include <QTextStream>

#include <cstdio>
#include <memory>

namespace ci {

int LearningRunner::run(const QStringList& arguments)
{
    if (!parseArguments(arguments)) {
        QTextStream err(stderr);
        err << "usage: codeindex-learning [--settings <file>] [--db <path>] [--save]"
               " [--rollback <version>] <feedback.jsonl>\n";
        return 2;
    }

    const QString settingsPath = m_settingsPath.isEmpty()
        ? SettingsManager::settingsFilePath()
        : m_settingsPath;
    std::optional<LearningSettings> loaded = SettingsManager::load(settingsPath);
    if (!loaded.has_value()) {
        LOG_INFO(ciCore, "No usable settings at %s, using defaults", qUtf8Printable(settingsPath));
    }
    LearningSettings settings = loaded.value_or(LearningSettings{});
    if (!m_dbPath.isEmpty()) {
        settings.dbPath = m_dbPath;
    }
    if (settings.dbPath.isEmpty()) {
        settings.dbPath = SettingsManager::defaultDbPath();
    }
    return replay(settings);
}

bool LearningRunner::parseArguments(const QStringList& arguments)
{
    for (int i = 1; i < arguments.size(); ++i) {
        const QString& arg = arguments.at(i);
        if (arg == QLatin1String("--save")) {
            m_saveAtEnd = true;
        } else if (arg == QLatin1String("--settings") && i + 1 < arguments.size()) {
            m_settingsPath = arguments.at(++i);
        } else if (arg == QLatin1String("--db") && i + 1 < arguments.size()) {
            m_dbPath = arguments.at(++i);
        } else if (arg == QLatin1String("--rollback") && i + 1 < arguments.size()) {
            m_rollbackVersion = arguments.at(++i);
        } else if (!arg.startsWith(QLatin1String("--")) && m_feedbackPath.isEmpty()) {
            m_feedbackPath = arg;
        } else {
            LOG_WARN(ciCore, "Unrecognized argument: %s", qUtf8Printable(arg));
            return false;
        }
    }
    return !m_feedbackPath.isEmpty() || !m_rollbackVersion.isEmpty();
}

int LearningRunner::replay(LearningSettings settings)
{
    QString openError;
    std::unique_ptr<SqliteSnapshotBackend> backend =
        SqliteSnapshotBackend::open(settings.dbPath, &openError);
    if (!backend) {
        LOG_ERROR(ciCore, "Cannot open snapshot database %s: %s",
                  qUtf8Printable(settings.dbPath), qUtf8Printable(openError));
        return 1;
    }

    auto store = std::make_unique<ModelStore>(std::move(backend),
                                              LearningService::defaultWeights(settings));
    LearningService service(settings, std::move(store));

    LearningError error;
    if (!service.initialize(&error) && error.kind != LearningErrorKind::None) {
        LOG_ERROR(ciCore, "LearningService failed to start: %s", qUtf8Printable(error.message));
        return 1;
    }

    if (!m_rollbackVersion.isEmpty() && !service.rollbackToVersion(m_rollbackVersion, &error)) {
        LOG_ERROR(ciCore, "Rollback to %s failed (%s)",
                  qUtf8Printable(m_rollbackVersion),
                  qUtf8Printable(learningErrorKindToString(error.kind)));
        service.shutdown();
        return 1;
    }

    int accepted = 0;
    int rejected = 0;
    if (!m_feedbackPath.isEmpty()) {
        QFile file(m_feedbackPath);
        if (!file.open(QIODevice::ReadOnly | QIODevice::Text)) {
            LOG_ERROR(ciCore, "Cannot open feedback file %s", qUtf8Printable(m_feedbackPath));
            service.shutdown();
            return 1;
        }

        int lineNumber = 0;
        while (!file.atEnd()) {
            const QByteArray line = file.readLine().trimmed();
            ++lineNumber;
            if (line.isEmpty() || line.startsWith('#')) {
                continue;
            }

            QString parseError;
            const std::optional<FeedbackEvent> event = parseFeedbackLine(line, &parseError);
            if (!event.has_value()) {
                LOG_WARN(ciCore, "Skipping feedback line %d: %s",
                         lineNumber, qUtf8Printable(parseError));
                ++rejected;
                continue;
            }
            if (service.collectFeedback(event.value())) {
                ++accepted;
            } else {
                ++rejected;
            }
        }
    }

    service.flushFeedbackBuffer();
    LOG_INFO(ciCore, "Feedback replay done accepted=%d rejected=%d", accepted, rejected);

    if (m_saveAtEnd) {
        const std::optional<ModelVersion> saved = service.saveModel(&error);
        if (!saved.has_value()) {
            LOG_WARN(ciCore, "Final model save failed: %s", qUtf8Printable(error.message));
        }
    }

    QJsonObject health = service.healthSnapshot();
    health[QStringLiteral("accepted")] = accepted;
    health[QStringLiteral("rejected")] = rejected;
    service.shutdown();

    QTextStream out(stdout);
    out << QJsonDocument(health).toJson(QJsonDocument::Indented);
    out.flush();
    return 0;
}

} // namespace ci
