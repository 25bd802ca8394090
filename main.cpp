#include "src/ui/EditorWindow.hpp"
#include "src/completion/CompletionConfig.hpp"
#include "src/completion/CompletionLog.hpp"
#include <QApplication>
#include <QCommandLineParser>
#include <QLoggingCategory>
#include <QSettings>
#include <memory>

int main(int argc, char *argv[]) {
    QApplication app(argc, argv);
    QApplication::setOrganizationName("InkAssist");
    QApplication::setApplicationName("inkassist");
    QApplication::setApplicationVersion("0.3.0");

    QCommandLineParser parser;
    parser.setApplicationDescription("Text editor with assisted completion");
    parser.addHelpOption();
    parser.addVersionOption();
    QCommandLineOption configOpt("config", "Read settings from <file> (INI).", "file");
    QCommandLineOption modeOpt("mode", "Completion mode: disabled, manual or auto.", "mode");
    QCommandLineOption providerOpt("provider", "Provider kind: process or http.", "kind");
    QCommandLineOption commandOpt("command", "Command run by the process provider.", "program");
    QCommandLineOption endpointOpt("endpoint", "URL used by the http provider.", "url");
    parser.addOptions({configOpt, modeOpt, providerOpt, commandOpt, endpointOpt});
    parser.process(app);

    std::unique_ptr<QSettings> settings;
    if (parser.isSet(configOpt))
        settings = std::make_unique<QSettings>(parser.value(configOpt), QSettings::IniFormat);
    else
        settings = std::make_unique<QSettings>(QSettings::IniFormat, QSettings::UserScope,
                                               QApplication::organizationName(), QApplication::applicationName());

    CompletionConfig config = CompletionConfig::load(*settings);

    if (parser.isSet(modeOpt) && !parseCompletionMode(parser.value(modeOpt), &config.mode))
        qCWarning(lcUi) << "ignoring unknown --mode" << parser.value(modeOpt);
    if (parser.isSet(providerOpt)) config.provider.kind = parser.value(providerOpt).trimmed().toLower();
    if (parser.isSet(commandOpt)) config.provider.command = parser.value(commandOpt);
    if (parser.isSet(endpointOpt)) config.provider.endpoint = parser.value(endpointOpt);
    for (const QString &w : config.normalize())
        qCWarning(lcUi) << "command line:" << w;

    if (!config.loggingRules.isEmpty())
        QLoggingCategory::setFilterRules(QString(config.loggingRules).replace(';', '\n'));

    EditorWindow window(config, settings.get());
    window.show();

    qApp->setStyleSheet(R"(
        QMainWindow, QWidget {
            background: #1e1e2e;
            color: #cdd6f4;
            font-family: "Segoe UI", "Calibri", sans-serif;
        }
        QMenuBar {
            background: #2a2a3a;
            color: #cdd6f4;
            border-bottom: 1px solid #444;
        }
        QMenuBar::item {
            background: transparent;
            padding: 8px 12px;
            border-radius: 6px;
        }
        QMenuBar::item:selected {
            background: rgba(100, 140, 255, 80);
        }
        QToolBar {
            spacing: 0px;
            padding: 4px;
            background: qlineargradient(x1:0, y1:0, x2:0, y2:1, stop:0 #2d2d3d, stop:1 #22222e);
            border-bottom: 1px solid #444;
        }
        QToolButton {
            background: transparent;
            border: 2px solid transparent;
            border-radius: 8px;
            margin: 2px;
            padding: 6px;
        }
        QToolButton:hover, QToolButton:checked {
            background: rgba(100, 140, 255, 60);
            border: 2px solid rgba(100, 140, 255, 120);
        }
        QStatusBar {
            background: #2a2a3a;
            color: #cdd6f4;
            border-top: 1px solid #444;
        }
        QPlainTextEdit, QTextEdit, QSplitter {
            background: #222230;
            border: 1px solid #444;
            border-radius: 4px;
        }
        QPlainTextEdit {
            font-family: "Georgia", serif;
            font-size: 14px;
        }
    )");
    return app.exec();
}
