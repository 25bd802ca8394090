// src/providers/HttpCompletionProvider.cpp
#include "HttpCompletionProvider.hpp"
#include "../completion/CompletionLog.hpp"
#include <QElapsedTimer>
#include <QJsonArray>
#include <QJsonDocument>
#include <QNetworkAccessManager>
#include <QNetworkReply>
#include <QNetworkRequest>

namespace {

const char *kDefaultSystemPrompt =
    "You continue the user's text. Reply with the continuation only, "
    "without repeating the text before the cursor and without commentary.";

}

HttpCompletionProvider::HttpCompletionProvider(const ProviderConfig &config, QObject *parent)
    : CompletionProvider(parent), m_config(config), m_network(new QNetworkAccessManager(this)) {}

QString HttpCompletionProvider::buildPrompt(const CompletionRequest &request) {
    QString prompt;
    if (!request.references.isEmpty())
        prompt += QStringLiteral("Reference notes:\n%1\n\n").arg(request.references.join('\n'));
    prompt += QStringLiteral("Continue the text at <cursor>.\n\n%1<cursor>%2")
                  .arg(request.textBeforeCursor, request.textAfterCursor);
    return prompt;
}

QJsonObject HttpCompletionProvider::buildPayload(const ProviderConfig &config, const CompletionRequest &request) {
    const QString system = config.systemPrompt.isEmpty() ? QString::fromUtf8(kDefaultSystemPrompt)
                                                         : config.systemPrompt;
    QJsonArray messages{
        QJsonObject{{"role", "system"}, {"content", system}},
        QJsonObject{{"role", "user"}, {"content", buildPrompt(request)}},
    };
    QJsonObject payload{
        {"messages", messages},
        {"max_tokens", config.maxTokens},
        {"temperature", config.temperature},
        {"stream", false},
    };
    if (!config.model.isEmpty()) payload["model"] = config.model;
    return payload;
}

bool HttpCompletionProvider::parseResponse(const QByteArray &body, QString *text, QString *error) {
    QJsonParseError parseError;
    const QJsonDocument doc = QJsonDocument::fromJson(body, &parseError);
    if (parseError.error != QJsonParseError::NoError || !doc.isObject()) {
        if (error) *error = QStringLiteral("malformed response: %1").arg(parseError.errorString());
        return false;
    }
    const QJsonObject obj = doc.object();
    if (obj.value("error").isObject()) {
        if (error) *error = obj.value("error").toObject().value("message").toString();
        return false;
    }
    const QJsonArray choices = obj.value("choices").toArray();
    if (choices.isEmpty()) {
        if (error) *error = QStringLiteral("response has no choices");
        return false;
    }
    const QJsonObject first = choices.first().toObject();
    QString content = first.value("message").toObject().value("content").toString();
    if (content.isEmpty()) content = first.value("text").toString();
    if (content.trimmed().isEmpty()) {
        if (error) *error = QStringLiteral("empty completion");
        return false;
    }
    if (text) *text = content;
    return true;
}

void HttpCompletionProvider::complete(const CompletionRequest &request) {
    const quint64 sequence = request.sequence;
    const QJsonDocument doc(buildPayload(m_config, request));

    QNetworkRequest req{QUrl(m_config.endpoint)};
    req.setHeader(QNetworkRequest::ContentTypeHeader, "application/json");
    if (!m_config.apiKey.isEmpty())
        req.setRawHeader("Authorization", "Bearer " + m_config.apiKey.toUtf8());

    qCInfo(lcProvider) << "request" << sequence << "POST" << m_config.endpoint;
    qCDebug(lcProvider).noquote() << "payload:\n" << doc.toJson();

    QElapsedTimer replyTimer;
    replyTimer.start();
    QNetworkReply *reply = m_network->post(req, doc.toJson(QJsonDocument::Compact));
    connect(reply, &QNetworkReply::finished, this, [this, reply, sequence, replyTimer] {
        reply->deleteLater();
        qCInfo(lcProvider) << "request" << sequence << "reply after" << replyTimer.elapsed() << "ms";
        if (reply->error() != QNetworkReply::NoError) {
            qCWarning(lcProvider) << "request" << sequence << "failed:" << reply->errorString();
            emit failed(sequence, reply->errorString());
            return;
        }
        QString text, error;
        if (!parseResponse(reply->readAll(), &text, &error)) {
            qCWarning(lcProvider) << "request" << sequence << error;
            emit failed(sequence, error);
            return;
        }
        emit completed(sequence, text);
    });
}
