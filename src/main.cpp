#include <QApplication>
#include <QCommandLineParser>
#include <QDebug>
#include <QDir>

#include "common/Constants.h"
#include "core/Config.h"
#include "ui/MainWindow.h"

int main(int argc, char *argv[])
{
    qSetMessagePattern(QStringLiteral(
        "%{time hh:mm:ss.zzz} %{if-debug}D%{endif}%{if-info}I%{endif}"
        "%{if-warning}W%{endif}%{if-critical}C%{endif}%{if-fatal}F%{endif} %{message}"));

    QApplication app(argc, argv);

    QApplication::setApplicationName("Kido");
    QApplication::setOrganizationName("Kido");
    QApplication::setQuitOnLastWindowClosed(true);

    QCommandLineParser parser;
    parser.setApplicationDescription(
        QStringLiteral("Hand-gesture orbit/zoom control for 3D viewports"));
    parser.addHelpOption();
    QCommandLineOption configOpt(
        {"c", "config"},
        QStringLiteral("Configuration file (default: %1).").arg(DEFAULT_CONFIG_FILE),
        QStringLiteral("path"));
    parser.addOption(configOpt);
    parser.process(app);

    QString configPath;
    if (parser.isSet(configOpt))
    {
        configPath = QDir::current().absoluteFilePath(parser.value(configOpt));
    }
    else
    {
        configPath = Config::resolvePath(QString::fromLatin1(DEFAULT_CONFIG_FILE));
        if (configPath.isEmpty())
            configPath = QDir::current().absoluteFilePath(DEFAULT_CONFIG_FILE);
    }
    qInfo() << "[main] config file:" << configPath;

    MainWindow w(configPath);
    w.show();

    return app.exec();
}
