#pragma once

#include "core/shared/settings.h"

#include <QString>
#include <QStringList>

namespace ci {

// LearningRunner -- bootstraps one LearningService for offline use.
//
// Usage:
//   codeindex-learning [--settings <file>] [--db <path>] [--save]
//                      [--rollback <version>] <feedback.jsonl>
//
// Replays every line of the feedback file through collectFeedback(),
// flushes the remainder, optionally saves a final snapshot, and prints the
// health snapshot as JSON on stdout.
class LearningRunner {
public:
    int run(const QStringList& arguments);

private:
    bool parseArguments(const QStringList& arguments);
    int replay(LearningSettings settings);

    QString m_settingsPath;
    QString m_dbPath;
    QString m_feedbackPath;
    QString m_rollbackVersion;
    bool m_saveAtEnd = false;
};

} // namespace ci
