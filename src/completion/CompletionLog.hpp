// src/completion/CompletionLog.hpp
#pragma once
#include <QLoggingCategory>

Q_DECLARE_LOGGING_CATEGORY(lcCompletion)
Q_DECLARE_LOGGING_CATEGORY(lcTimeout)
Q_DECLARE_LOGGING_CATEGORY(lcDisplay)
Q_DECLARE_LOGGING_CATEGORY(lcProvider)
Q_DECLARE_LOGGING_CATEGORY(lcUi)
