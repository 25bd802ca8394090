// src/completion/SuggestionBuffer.hpp
#pragma once
#include <QString>
#include <optional>
#include "CompletionTypes.hpp"
#include "DisplayChannel.hpp"

class BufferAccessor;
struct CompletionConfig;

// Owns the single pending suggestion and everything it put on screen or
// into the buffer. Every operation either completes or leaves the buffer
// as it found it.
class SuggestionBuffer {
public:
    struct Settings {
        int minOverlap = 5;
        int maxChars = 200;
        int contextChars = 500;
    };

    SuggestionBuffer(BufferAccessor *buffer, DisplayChannelChain *chain);
    SuggestionBuffer(BufferAccessor *buffer, DisplayChannelChain *chain, const Settings &settings);

    static Settings settingsFrom(const CompletionConfig &config);

    // The part of suggestion that is not already typed. An overlap shorter
    // than minOverlap only counts when it spans all of typedBefore.
    static QString incrementalRemainder(const QString &typedBefore, const QString &suggestion,
                                        int minOverlap);
    static QString normalize(const QString &suggestion, int maxChars);

    // Returns the stored remainder, or an empty string when nothing is shown.
    QString show(const QString &text, int anchor, qint64 nowMs, CompletionError *error = nullptr);
    bool accept(CompletionError *error = nullptr);
    bool reject();

    bool hasPending() const { return m_pending.has_value(); }
    const PendingSuggestion *pending() const { return m_pending ? &*m_pending : nullptr; }
    ChannelHandle handle() const { return m_handle; }
    bool isStale() const;

private:
    void reset();

    BufferAccessor *m_buffer = nullptr;
    DisplayChannelChain *m_chain = nullptr;
    Settings m_settings;
    std::optional<PendingSuggestion> m_pending;
    ChannelHandle m_handle;
};
