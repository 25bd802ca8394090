// src/completion/CompletionProvider.cpp
#include "CompletionProvider.hpp"
#include <QJsonArray>

QJsonObject requestToJson(const CompletionRequest &request) {
    return QJsonObject{
        {"sequence", QString::number(request.sequence)},
        {"before", request.textBeforeCursor},
        {"after", request.textAfterCursor},
        {"cursor", request.cursorOffset},
        {"trigger", toString(request.trigger)},
        {"references", QJsonArray::fromStringList(request.references)},
    };
}
