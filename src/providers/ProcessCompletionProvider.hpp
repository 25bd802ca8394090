// src/providers/ProcessCompletionProvider.hpp
#pragma once
#include <QProcess>
#include "../completion/CompletionConfig.hpp"
#include "../completion/CompletionProvider.hpp"

// Runs an external command per request. The request goes to stdin as
// compact JSON; stdout is either the completion itself or {"text": ...}.
class ProcessCompletionProvider : public CompletionProvider {
    Q_OBJECT
public:
    explicit ProcessCompletionProvider(const ProviderConfig &config, QObject *parent = nullptr);

    QString name() const override { return QStringLiteral("process"); }
    void complete(const CompletionRequest &request) override;

    int runningCount() const { return m_running; }

    static bool parseOutput(const QByteArray &output, QString *text, QString *error);

private:
    void finish(QProcess *proc, quint64 sequence, int exitCode, QProcess::ExitStatus status);

    QString m_program;
    QStringList m_arguments;
    int m_running = 0;
};
