#include <QApplication>
#include <QCommandLineOption>
#include <QCommandLineParser>
#include <QDebug>
#include <QFont>
#include "contactfile.h"
#include "contactstore.h"
#include "contactwindow.h"

int main(int argc, char* argv[]) {
#if QT_VERSION >= QT_VERSION_CHECK(6, 0, 0)
    QGuiApplication::setHighDpiScaleFactorRoundingPolicy(
        Qt::HighDpiScaleFactorRoundingPolicy::PassThrough);
#else
    QApplication::setAttribute(Qt::AA_EnableHighDpiScaling);
    QApplication::setAttribute(Qt::AA_UseHighDpiPixmaps);
#endif

    QApplication app(argc, argv);
    QApplication::setApplicationName("contactbook");
    QApplication::setApplicationVersion("1.0");

    QCommandLineParser parser;
    parser.setApplicationDescription("Contact Manager");
    parser.addHelpOption();
    parser.addVersionOption();
    QCommandLineOption dataOpt(QStringList{ "d", "data" },
                               "JSON file holding the contacts (default: contacts.json).",
                               "file", QString::fromLatin1(ContactFile::kDefaultFileName));
    parser.addOption(dataOpt);
    parser.process(app);

    const QString dataFile = parser.value(dataOpt);
    qDebug() << "[contactbook] archivo de datos =" << dataFile;

#ifdef Q_OS_WIN
    // Estilo estable (evita rarezas de tema claro/oscuro del SO)
    QApplication::setStyle("Fusion");
    qApp->setFont(QFont("Segoe UI", 9));
#endif

    ContactStore store(dataFile);
    ContactWindow w(store);
    w.resize(900, 560);
    w.show();
    w.loadContacts();
    return app.exec();
}
