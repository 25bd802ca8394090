// src/providers/ProcessCompletionProvider.cpp
#include "ProcessCompletionProvider.hpp"
#include "../completion/CompletionLog.hpp"
#include <QJsonDocument>
#include <QJsonObject>

ProcessCompletionProvider::ProcessCompletionProvider(const ProviderConfig &config, QObject *parent)
    : CompletionProvider(parent), m_program(config.command), m_arguments(config.arguments) {}

void ProcessCompletionProvider::complete(const CompletionRequest &request) {
    const quint64 sequence = request.sequence;
    if (m_program.isEmpty()) {
        QMetaObject::invokeMethod(this, [this, sequence] {
            emit failed(sequence, tr("no completion command configured"));
        }, Qt::QueuedConnection);
        return;
    }

    auto *proc = new QProcess(this);
    ++m_running;
    connect(proc, &QProcess::finished, this, [this, proc, sequence](int exitCode, QProcess::ExitStatus status) {
        finish(proc, sequence, exitCode, status);
    });
    connect(proc, &QProcess::errorOccurred, this, [this, proc, sequence](QProcess::ProcessError error) {
        // Everything but a failed start is followed by finished().
        if (error != QProcess::FailedToStart) return;
        qCWarning(lcProvider) << "could not start" << m_program << ":" << proc->errorString();
        --m_running;
        emit failed(sequence, proc->errorString());
        proc->deleteLater();
    });

    qCDebug(lcProvider) << "request" << sequence << "->" << m_program << m_arguments;
    proc->start(m_program, m_arguments);
    proc->write(QJsonDocument(requestToJson(request)).toJson(QJsonDocument::Compact));
    proc->closeWriteChannel();
}

void ProcessCompletionProvider::finish(QProcess *proc, quint64 sequence, int exitCode, QProcess::ExitStatus status) {
    --m_running;
    proc->deleteLater();

    if (status != QProcess::NormalExit || exitCode != 0) {
        const QString err = QString::fromUtf8(proc->readAllStandardError()).trimmed();
        qCWarning(lcProvider) << "request" << sequence << "command exited with" << exitCode << err;
        emit failed(sequence, err.isEmpty() ? tr("command exited with code %1").arg(exitCode) : err);
        return;
    }

    QString text, error;
    if (!parseOutput(proc->readAllStandardOutput(), &text, &error)) {
        emit failed(sequence, error);
        return;
    }
    qCDebug(lcProvider) << "request" << sequence << "answered with" << text.size() << "chars";
    emit completed(sequence, text);
}

bool ProcessCompletionProvider::parseOutput(const QByteArray &output, QString *text, QString *error) {
    QString raw = QString::fromUtf8(output);
    while (!raw.isEmpty() && raw.back().isSpace()) raw.chop(1);

    if (raw.trimmed().startsWith(QLatin1Char('{'))) {
        QJsonParseError parseError;
        const QJsonDocument doc = QJsonDocument::fromJson(raw.toUtf8(), &parseError);
        if (parseError.error == QJsonParseError::NoError && doc.isObject()) {
            const QJsonObject obj = doc.object();
            if (obj.contains("error")) {
                if (error) *error = obj.value("error").toString();
                return false;
            }
            raw = obj.value("text").toString();
        }
    }

    if (raw.trimmed().isEmpty()) {
        if (error) *error = QStringLiteral("empty output");
        return false;
    }
    if (text) *text = raw;
    return true;
}
