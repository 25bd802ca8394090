// src/providers/FunctionCompletionProvider.hpp
#pragma once
#include <QThreadPool>
#include <functional>
#include "../completion/CompletionProvider.hpp"

// Runs a blocking callable on a worker thread and reports back on the
// thread that owns the provider.
class FunctionCompletionProvider : public CompletionProvider {
    Q_OBJECT
public:
    using Function = std::function<bool(const CompletionRequest &request, QString *text, QString *error)>;

    explicit FunctionCompletionProvider(Function function, QObject *parent = nullptr);
    ~FunctionCompletionProvider() override;

    QString name() const override { return QStringLiteral("function"); }
    void complete(const CompletionRequest &request) override;

    bool waitForIdle(int msecs = -1) { return m_pool.waitForDone(msecs); }

private:
    Function m_function;
    QThreadPool m_pool;
};
