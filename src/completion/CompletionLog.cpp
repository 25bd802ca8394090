// src/completion/CompletionLog.cpp
#include "CompletionLog.hpp"

Q_LOGGING_CATEGORY(lcCompletion, "inkassist.completion", QtInfoMsg)
Q_LOGGING_CATEGORY(lcTimeout, "inkassist.timeout", QtInfoMsg)
Q_LOGGING_CATEGORY(lcDisplay, "inkassist.display", QtInfoMsg)
Q_LOGGING_CATEGORY(lcProvider, "inkassist.provider", QtInfoMsg)
Q_LOGGING_CATEGORY(lcUi, "inkassist.ui", QtInfoMsg)
