// src/completion/SuggestionBuffer.cpp
#include "SuggestionBuffer.hpp"
#include "BufferAccessor.hpp"
#include "CompletionConfig.hpp"
#include "CompletionLog.hpp"
#include <QStringView>
#include <algorithm>

namespace {

constexpr int kEchoWindow = 20;

bool isBlank(QChar c) { return c == QLatin1Char(' ') || c == QLatin1Char('\t'); }

}

SuggestionBuffer::SuggestionBuffer(BufferAccessor *buffer, DisplayChannelChain *chain)
    : SuggestionBuffer(buffer, chain, Settings()) {}

SuggestionBuffer::SuggestionBuffer(BufferAccessor *buffer, DisplayChannelChain *chain, const Settings &settings)
    : m_buffer(buffer), m_chain(chain), m_settings(settings) {}

SuggestionBuffer::Settings SuggestionBuffer::settingsFrom(const CompletionConfig &config) {
    Settings s;
    s.minOverlap = config.minOverlapChars;
    s.maxChars = config.maxSuggestionChars;
    s.contextChars = config.contextBeforeChars;
    return s;
}

QString SuggestionBuffer::incrementalRemainder(const QString &typedBefore, const QString &suggestion,
                                               int minOverlap) {
    const int maxOverlap = std::min(typedBefore.size(), suggestion.size());
    for (int k = maxOverlap; k > 0; --k) {
        if (k < minOverlap && k != typedBefore.size()) break;
        if (typedBefore.endsWith(QStringView(suggestion).left(k)))
            return suggestion.mid(k);
    }

    // The model sometimes echoes the tail of the context somewhere inside
    // its answer; continue after the echo.
    if (typedBefore.size() > kEchoWindow) {
        const QString tail = typedBefore.right(kEchoWindow);
        const int pos = suggestion.indexOf(tail);
        if (pos >= 0 && pos + tail.size() < suggestion.size())
            return suggestion.mid(pos + tail.size());
    }
    return suggestion;
}

QString SuggestionBuffer::normalize(const QString &suggestion, int maxChars) {
    QString s = suggestion;
    while (!s.isEmpty() && s.back().isSpace()) s.chop(1);
    if (maxChars <= 0 || s.size() <= maxChars) return s;

    const int window = maxChars * 3 / 4;
    const int minCut = maxChars / 2;
    const QString head = s.left(window);
    static const QString breaks = QStringLiteral(".!?;,\n。！？，；");
    int cut = -1;
    for (QChar c : breaks)
        cut = std::max(cut, int(head.lastIndexOf(c)));
    return cut > minCut ? s.left(cut + 1) : head;
}

QString SuggestionBuffer::show(const QString &text, int anchor, qint64 nowMs, CompletionError *error) {
    if (error) *error = CompletionError::None;

    Q_ASSERT_X(!m_pending, "SuggestionBuffer::show", "a pending suggestion already exists");
    if (m_pending) {
        qCCritical(lcCompletion) << "invariant violated: second pending suggestion, rolling back the first";
        reject();
    }

    if (!m_buffer || !m_chain || anchor < 0) {
        if (error) *error = CompletionError::NoSuggestion;
        return QString();
    }

    // Diff against the full answer first; capping it earlier can cut away
    // everything but the echoed context.
    const QString typed = m_buffer->textRange(std::max(0, anchor - m_settings.contextChars), anchor);
    QString remainder = incrementalRemainder(typed, text, m_settings.minOverlap);
    if (typed.isEmpty() || isBlank(typed.back())) {
        int lead = 0;
        while (lead < remainder.size() && isBlank(remainder.at(lead))) ++lead;
        remainder.remove(0, lead);
    }
    remainder = normalize(remainder, m_settings.maxChars);
    if (remainder.isEmpty()) {
        qCDebug(lcCompletion) << "suggestion fully typed already, nothing to show";
        if (error) *error = CompletionError::NoSuggestion;
        return QString();
    }

    PendingSuggestion suggestion;
    suggestion.anchorOffset = anchor;
    suggestion.suggestedText = remainder;
    suggestion.createdAtMs = nowMs;

    const ChannelHandle handle = m_chain->activate(suggestion);
    if (!handle.isValid()) {
        if (error) *error = CompletionError::ChannelUnavailable;
        return QString();
    }
    suggestion.activeChannel = handle.channelName;
    suggestion.occupiesBuffer = handle.occupiesBuffer;
    suggestion.bufferVersion = m_buffer->version();

    m_pending = suggestion;
    m_handle = handle;
    return remainder;
}

bool SuggestionBuffer::accept(CompletionError *error) {
    if (error) *error = CompletionError::None;
    if (!m_pending) {
        if (error) *error = CompletionError::NoSuggestion;
        return false;
    }
    if (isStale()) {
        qCInfo(lcCompletion) << "buffer changed under the suggestion, rolling it back";
        if (error) *error = CompletionError::AnchorMismatch;
        reject();
        return false;
    }

    const PendingSuggestion p = *m_pending;
    m_chain->deactivate(m_handle);

    if (!p.occupiesBuffer) {
        BufferTransaction tx(m_buffer);
        if (!tx.insert(p.anchorOffset, p.suggestedText)) {
            qCWarning(lcCompletion) << "buffer refused insertion at" << p.anchorOffset;
            if (error) *error = CompletionError::AnchorMismatch;
            reset();
            return false;
        }
        tx.commit();
    }
    m_buffer->setCursorOffset(p.anchorOffset + p.suggestedText.size());
    reset();
    return true;
}

bool SuggestionBuffer::reject() {
    if (!m_pending) return false;

    const PendingSuggestion p = *m_pending;
    m_chain->deactivate(m_handle);

    // Inserted text is removed as long as it is intact, even when the user
    // typed around it; edits elsewhere survive the removal.
    if (p.occupiesBuffer) {
        const bool stale = isStale();
        const int end = p.anchorOffset + p.suggestedText.size();
        if (m_buffer->textRange(p.anchorOffset, end) == p.suggestedText) {
            BufferTransaction tx(m_buffer);
            if (tx.remove(p.anchorOffset, end)) {
                tx.commit();
                if (!stale) m_buffer->setCursorOffset(p.anchorOffset);
            } else {
                qCWarning(lcCompletion) << "buffer refused to remove the inserted suggestion at" << p.anchorOffset;
            }
        } else {
            qCInfo(lcCompletion) << "inserted suggestion was edited, leaving it in place";
        }
    }
    reset();
    return true;
}

bool SuggestionBuffer::isStale() const {
    return m_pending && m_buffer && m_buffer->version() != m_pending->bufferVersion;
}

void SuggestionBuffer::reset() {
    m_pending.reset();
    m_handle = ChannelHandle();
}
