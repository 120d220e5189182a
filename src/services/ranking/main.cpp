#include "ranking_service.h"
#include "core/shared/settings_manager.h"

#include <QCommandLineParser>
#include <QCoreApplication>

int main(int argc, char* argv[])
{
    QCoreApplication app(argc, argv);
    app.setApplicationName(QStringLiteral("newsrank-service"));
    app.setApplicationVersion(QStringLiteral("0.1.0"));

    QCommandLineParser parser;
    parser.setApplicationDescription(QStringLiteral("News ranking, diversity and experimentation service"));
    parser.addHelpOption();
    parser.addVersionOption();
    const QCommandLineOption configOption(
        QStringList{QStringLiteral("c"), QStringLiteral("config")},
        QStringLiteral("Settings file (JSON)."), QStringLiteral("file"),
        nr::SettingsManager::defaultSettingsPath());
    const QCommandLineOption socketOption(
        QStringList{QStringLiteral("s"), QStringLiteral("socket")},
        QStringLiteral("Listen on this socket path instead of the default."),
        QStringLiteral("path"));
    parser.addOption(configOption);
    parser.addOption(socketOption);
    parser.process(app);

    nr::RankingService service(nr::SettingsManager::loadOrDefault(parser.value(configOption)));
    return service.run(parser.value(socketOption));
}
