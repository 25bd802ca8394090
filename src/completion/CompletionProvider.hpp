// src/completion/CompletionProvider.hpp
#pragma once
#include <QJsonObject>
#include <QObject>
#include "CompletionTypes.hpp"

// Asynchronous source of completions. complete() must return immediately;
// the answer arrives later through completed() or failed(), tagged with the
// request's sequence number, at most once per request.
class CompletionProvider : public QObject {
    Q_OBJECT
public:
    explicit CompletionProvider(QObject *parent = nullptr) : QObject(parent) {}

    virtual QString name() const = 0;
    virtual void complete(const CompletionRequest &request) = 0;

signals:
    void completed(quint64 sequence, const QString &text);
    void failed(quint64 sequence, const QString &error);
};

QJsonObject requestToJson(const CompletionRequest &request);
