// src/providers/ProviderFactory.hpp
#pragma once
#include <QString>
#include "../completion/CompletionConfig.hpp"

class CompletionProvider;
class QObject;

// nullptr with *error set when the kind is unknown or its settings are incomplete.
CompletionProvider *createProvider(const ProviderConfig &config, QObject *parent, QString *error = nullptr);
