// src/ui/EditorWindow.hpp
#pragma once
#include <QMainWindow>
#include "../completion/CompletionConfig.hpp"
#include "../completion/CompletionTypes.hpp"

class CompletionOrchestrator;
class CompletionProvider;
class QAction;
class QActionGroup;
class QLabel;
class QSettings;
class QTextEdit;
class QToolBar;
class TextEditor;

class EditorWindow : public QMainWindow {
    Q_OBJECT

public:
    EditorWindow(const CompletionConfig &config, QSettings *settings, QWidget *parent = nullptr);
    ~EditorWindow() override;

    void appendConsole(const QString &line);

private slots:
    void onModeChanged(CompletionMode mode);
    void onStatusChanged(CompletionStatus status, CompletionError error, const QString &message);
    void onShowStatistics();

private:
    void setupUI();
    void setupActions();
    void setupStatusBar();
    void showMode(CompletionMode mode);

    CompletionConfig m_config;
    QSettings *m_settings = nullptr;

    TextEditor *m_editor = nullptr;
    CompletionProvider *m_provider = nullptr;
    CompletionOrchestrator *m_orchestrator = nullptr;

    QToolBar *m_toolbar = nullptr;
    QTextEdit *m_console = nullptr;
    QLabel *m_statusLabel = nullptr;
    QLabel *m_modeLabel = nullptr;
    QActionGroup *m_modeGroup = nullptr;
};
