// src/providers/ProviderFactory.cpp
#include "ProviderFactory.hpp"
#include "HttpCompletionProvider.hpp"
#include "ProcessCompletionProvider.hpp"
#include "../completion/CompletionLog.hpp"

CompletionProvider *createProvider(const ProviderConfig &config, QObject *parent, QString *error) {
    if (config.kind == QLatin1String("process")) {
        if (config.command.isEmpty()) {
            if (error) *error = QStringLiteral("provider/command is not set");
            return nullptr;
        }
        qCInfo(lcProvider) << "using process provider:" << config.command;
        return new ProcessCompletionProvider(config, parent);
    }
    if (config.kind == QLatin1String("http")) {
        if (config.endpoint.isEmpty()) {
            if (error) *error = QStringLiteral("provider/endpoint is not set");
            return nullptr;
        }
        qCInfo(lcProvider) << "using http provider:" << config.endpoint;
        return new HttpCompletionProvider(config, parent);
    }
    if (error) *error = QStringLiteral("unknown provider kind '%1'").arg(config.kind);
    return nullptr;
}
