// src/providers/FunctionCompletionProvider.cpp
#include "FunctionCompletionProvider.hpp"
#include "../completion/CompletionLog.hpp"
#include <utility>

FunctionCompletionProvider::FunctionCompletionProvider(Function function, QObject *parent)
    : CompletionProvider(parent), m_function(std::move(function)) {
    m_pool.setMaxThreadCount(1);
}

FunctionCompletionProvider::~FunctionCompletionProvider() {
    m_pool.waitForDone();
}

void FunctionCompletionProvider::complete(const CompletionRequest &request) {
    if (!m_function) {
        const quint64 sequence = request.sequence;
        QMetaObject::invokeMethod(this, [this, sequence] {
            emit failed(sequence, tr("no completion function set"));
        }, Qt::QueuedConnection);
        return;
    }
    const Function function = m_function;
    m_pool.start([this, function, request] {
        QString text, error;
        const bool ok = function(request, &text, &error);
        const quint64 sequence = request.sequence;
        // Posted to the owner's thread; the pool is drained before this dies.
        QMetaObject::invokeMethod(this, [this, ok, sequence, text, error] {
            if (ok) emit completed(sequence, text);
            else emit failed(sequence, error);
        }, Qt::QueuedConnection);
    });
    qCDebug(lcProvider) << "request" << request.sequence << "queued on worker";
}
