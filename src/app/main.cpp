#include <memory>
#include <iostream>

#include <QGuiApplication>
#include <QQmlApplicationEngine>
#include <QQmlContext>
#include <QSettings>
#include <QStandardPaths>

#include "AppEngine.h"
#include "logging.h"

using namespace std;

int main(int argc, char *argv[])
{
    QGuiApplication app(argc, argv);

    QCoreApplication::setOrganizationName("QScribe");
    QCoreApplication::setApplicationName("QScribe");
    QCoreApplication::setApplicationVersion(APP_VERSION);

    QSettings settings;
    if (!settings.contains("models/path")) {
        settings.setValue("models/path",
                          QStandardPaths::writableLocation(QStandardPaths::AppLocalDataLocation) + "/models");
    }

    AppEngine::initLogging();

    LOG_INFO << "Starting QScribe " << APP_VERSION;
    LOG_INFO << "Configuration from '" << settings.fileName() << "'";

    AppEngine app_engine;

    QQmlApplicationEngine qml_engine;
    qml_engine.rootContext()->setContextProperty("appEngine", &app_engine);

    QObject::connect(
        &qml_engine,
        &QQmlApplicationEngine::objectCreationFailed,
        &app,
        []() { QCoreApplication::exit(-1); },
        Qt::QueuedConnection);

    qml_engine.load(QUrl(QStringLiteral("qrc:/QScribe/qml/Main.qml")));

    return app.exec();
}
