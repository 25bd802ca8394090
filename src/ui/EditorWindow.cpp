// src/ui/EditorWindow.cpp
#include "EditorWindow.hpp"
#include "TextEditor.hpp"
#include "../completion/CompletionLog.hpp"
#include "../completion/CompletionOrchestrator.hpp"
#include "../providers/ProviderFactory.hpp"
#include "../completion/CompletionProvider.hpp"
#include <QAction>
#include <QActionGroup>
#include <QLabel>
#include <QMenuBar>
#include <QPointer>
#include <QSettings>
#include <QSplitter>
#include <QStatusBar>
#include <QTextEdit>
#include <QTime>
#include <QToolBar>
#include <QVBoxLayout>

namespace {

QPointer<EditorWindow> g_consoleWindow;
QtMessageHandler g_previousHandler = nullptr;

// Mirrors log output into the console pane; may be called from any thread.
void consoleMessageHandler(QtMsgType type, const QMessageLogContext &context, const QString &msg) {
    if (g_previousHandler) g_previousHandler(type, context, msg);
    EditorWindow *window = g_consoleWindow.data();
    if (!window) return;
    const QString line = QString("[%1] %2: %3")
        .arg(QTime::currentTime().toString("HH:mm:ss.zzz"),
             QString::fromLatin1(context.category ? context.category : "default"), msg);
    QMetaObject::invokeMethod(window, [window, line] { window->appendConsole(line); }, Qt::QueuedConnection);
}

QString statusText(CompletionStatus status, CompletionError error, const QString &message) {
    switch (status) {
    case CompletionStatus::Idle: return "ИИ: готов";
    case CompletionStatus::Requesting: return "ИИ: думает…";
    case CompletionStatus::SuggestionReady: return "ИИ: подсказка готова (Tab принять, Esc отклонить)";
    case CompletionStatus::Error:
        return QString("ИИ: ошибка %1%2").arg(toString(error), message.isEmpty() ? QString() : ": " + message);
    }
    return QString();
}

}

// === Реализация EditorWindow ===

EditorWindow::EditorWindow(const CompletionConfig &config, QSettings *settings, QWidget *parent)
    : QMainWindow(parent), m_config(config), m_settings(settings) {
    setWindowTitle("InkAssist");
    resize(1100, 760);
    setupUI();

    QString error;
    m_provider = createProvider(m_config.provider, this, &error);
    if (!m_provider)
        qCWarning(lcUi) << "completion provider unavailable:" << error;

    m_orchestrator = new CompletionOrchestrator(m_editor, m_provider, m_config, this);
    m_orchestrator->installDefaultChannels(m_editor, m_editor);
    m_editor->setOrchestrator(m_orchestrator);
    m_editor->setManualShortcut(QKeySequence(m_config.manualShortcut));

    connect(m_orchestrator, &CompletionOrchestrator::statusChanged, this, &EditorWindow::onStatusChanged);
    connect(m_orchestrator, &CompletionOrchestrator::modeChanged, this, &EditorWindow::onModeChanged);
    connect(m_orchestrator, &CompletionOrchestrator::suggestionAccepted, this, [this](const QString &text) {
        appendConsole(QString("Принято: %1 симв.").arg(text.size()));
    });

    setupActions();
    setupStatusBar();
    showMode(m_orchestrator->mode());

    g_consoleWindow = this;
    g_previousHandler = qInstallMessageHandler(consoleMessageHandler);

    appendConsole("InkAssist запущен.");
    appendConsole("Провайдер: " + (m_provider ? m_provider->name() : QString("нет")));
}

EditorWindow::~EditorWindow() {
    qInstallMessageHandler(g_previousHandler);
    g_previousHandler = nullptr;
    g_consoleWindow = nullptr;
    m_editor->setOrchestrator(nullptr);
}

void EditorWindow::setupUI() {
    auto central = new QWidget(this);
    auto layout = new QVBoxLayout(central);
    layout->setContentsMargins(0, 0, 0, 0);
    layout->setSpacing(0);

    m_toolbar = new QToolBar(this);
    layout->addWidget(m_toolbar);

    auto splitter = new QSplitter(Qt::Vertical);
    m_editor = new TextEditor();
    m_editor->setFocusPolicy(Qt::StrongFocus);
    splitter->addWidget(m_editor);

    m_console = new QTextEdit();
    m_console->setReadOnly(true);
    m_console->setFontFamily("Monospace");
    m_console->setStyleSheet("background:#0f1218; color:#d0d0d0; padding:8px;");
    splitter->addWidget(m_console);
    splitter->setStretchFactor(0, 4);
    splitter->setStretchFactor(1, 1);

    layout->addWidget(splitter);
    setCentralWidget(central);
    m_editor->setFocus();
}

void EditorWindow::setupActions() {
    auto aiMenu = menuBar()->addMenu("ИИ");
    m_modeGroup = new QActionGroup(this);
    m_modeGroup->setExclusive(true);
    auto addMode = [this, aiMenu](const QString &text, CompletionMode mode) {
        QAction *action = aiMenu->addAction(text);
        action->setCheckable(true);
        action->setData(int(mode));
        m_modeGroup->addAction(action);
        m_toolbar->addAction(action);
        connect(action, &QAction::triggered, this, [this, mode] { m_orchestrator->setMode(mode); });
    };
    addMode("Выключено", CompletionMode::Disabled);
    addMode("Вручную", CompletionMode::ManualOnly);
    addMode("Авто", CompletionMode::AutoAssist);
    aiMenu->addSeparator();
    m_toolbar->addSeparator();

    // The editor handles the shortcut itself, so the menu entry only shows it.
    auto triggerAct = aiMenu->addAction("Подсказать");
    triggerAct->setShortcut(QKeySequence(m_config.manualShortcut));
    triggerAct->setShortcutContext(Qt::WidgetShortcut);
    connect(triggerAct, &QAction::triggered, this, [this] { m_orchestrator->notifyManualTrigger(); });
    auto acceptAct = aiMenu->addAction("Принять", this, [this] { m_orchestrator->accept(); });
    auto rejectAct = aiMenu->addAction("Отклонить", this, [this] { m_orchestrator->reject(); });
    aiMenu->addAction("Отменить запрос", this, [this] { m_orchestrator->cancel(); });
    m_toolbar->addAction(triggerAct);
    m_toolbar->addAction(acceptAct);
    m_toolbar->addAction(rejectAct);

    aiMenu->addSeparator();
    aiMenu->addAction("Статистика таймаутов", this, &EditorWindow::onShowStatistics);
    aiMenu->addAction("Сбросить историю таймаутов", this, [this] {
        m_orchestrator->timeoutEstimator().reset();
        appendConsole("История таймаутов очищена.");
    });
}

void EditorWindow::setupStatusBar() {
    m_statusLabel = new QLabel(statusText(CompletionStatus::Idle, CompletionError::None, QString()));
    m_modeLabel = new QLabel();
    statusBar()->addWidget(m_statusLabel, 1);
    statusBar()->addPermanentWidget(m_modeLabel);
}

void EditorWindow::appendConsole(const QString &line) {
    if (m_console) m_console->append(line);
}

// === Режим и статус ===

void EditorWindow::showMode(CompletionMode mode) {
    for (QAction *action : m_modeGroup->actions())
        action->setChecked(action->data().toInt() == int(mode));
    m_modeLabel->setText("Режим: " + toString(mode));
}

void EditorWindow::onModeChanged(CompletionMode mode) {
    showMode(mode);
    if (m_settings) {
        m_settings->setValue("completion/mode", toString(mode));
        m_settings->sync();
        if (m_settings->status() != QSettings::NoError)
            qCWarning(lcUi) << "could not persist completion mode to" << m_settings->fileName();
    }
}

void EditorWindow::onStatusChanged(CompletionStatus status, CompletionError error, const QString &message) {
    m_statusLabel->setText(statusText(status, error, status == CompletionStatus::Error ? message : QString()));
    m_statusLabel->setStyleSheet(status == CompletionStatus::Error ? "color:#f38ba8;" : QString());
    if (status == CompletionStatus::Requesting)
        m_statusLabel->setText(m_statusLabel->text()
                               + QString(" (до %1 мс)").arg(m_orchestrator->currentDeadlineMs()));
}

void EditorWindow::onShowStatistics() {
    const TimeoutEstimator::Statistics s = m_orchestrator->timeoutEstimator().statistics();
    appendConsole(QString("Запросов: %1, успешных: %2 (%3%), таймаутов: %4")
        .arg(s.totalRequests).arg(s.successfulRequests)
        .arg(s.successRate, 0, 'f', 1).arg(s.timedOutRequests));
    appendConsole(QString("Длительность: сред. %1 мс, мин. %2 мс, макс. %3 мс, исторический таймаут %4 мс")
        .arg(s.avgDurationMs).arg(s.minDurationMs).arg(s.maxDurationMs).arg(s.historicalTimeoutMs));
}
