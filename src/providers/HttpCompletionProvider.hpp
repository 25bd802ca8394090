// src/providers/HttpCompletionProvider.hpp
#pragma once
#include <QJsonObject>
#include "../completion/CompletionConfig.hpp"
#include "../completion/CompletionProvider.hpp"

class QNetworkAccessManager;

// OpenAI-compatible chat/completions endpoint.
class HttpCompletionProvider : public CompletionProvider {
    Q_OBJECT
public:
    explicit HttpCompletionProvider(const ProviderConfig &config, QObject *parent = nullptr);

    QString name() const override { return QStringLiteral("http"); }
    void complete(const CompletionRequest &request) override;

    static QString buildPrompt(const CompletionRequest &request);
    static QJsonObject buildPayload(const ProviderConfig &config, const CompletionRequest &request);
    static bool parseResponse(const QByteArray &body, QString *text, QString *error);

private:
    ProviderConfig m_config;
    QNetworkAccessManager *m_network = nullptr;
};
