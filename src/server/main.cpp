#include <QCommandLineParser>
#include <QGuiApplication>
#include "server_app.h"

int main(int argc, char* argv[]) {
    QGuiApplication app(argc, argv);
    app.setApplicationName("cliphist");
    app.setQuitOnLastWindowClosed(false);

    QCommandLineParser parser;
    parser.setApplicationDescription("Clipboard history daemon");
    parser.addHelpOption();
    QCommandLineOption dataDirOption(QStringList() << "d" << "data-dir",
                                     "Data directory", "dir");
    parser.addOption(dataDirOption);
    parser.process(app);

    cliphist::ServerApp server;
    if (!server.initialize(parser.value(dataDirOption))) {
        return 1;
    }

    QObject::connect(&app, &QCoreApplication::aboutToQuit, &server, &cliphist::ServerApp::shutdown);

    return app.exec();
}
