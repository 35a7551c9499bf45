#include "learning_runner.h"
#include <QCoreApplication>

int main(int argc, char* argv[])
{
    QCoreApplication app(argc, argv);
    app.setApplicationName(QStringLiteral("codeindex-learning"));
    app.setApplicationVersion(QStringLiteral("0.1.0"));

    ci::LearningRunner runner;
    return runner.run(app.arguments());
}
