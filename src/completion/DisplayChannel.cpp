// src/completion/DisplayChannel.cpp
#include "DisplayChannel.hpp"
#include "BufferAccessor.hpp"
#include "CompletionLog.hpp"
#include <utility>

// === Ghost overlay ===

bool GhostOverlayChannel::isAvailable(const PendingSuggestion &suggestion) const {
    return m_host && m_host->canShowOverlay(suggestion.anchorOffset, suggestion.suggestedText);
}

bool GhostOverlayChannel::activate(const PendingSuggestion &suggestion) {
    if (!m_host) return false;
    m_shown = m_host->showOverlay(suggestion.anchorOffset, suggestion.suggestedText);
    return m_shown;
}

void GhostOverlayChannel::deactivate() {
    if (!m_shown || !m_host) return;
    m_host->hideOverlay();
    m_shown = false;
}

// === Popup ===

bool PopupChannel::isAvailable(const PendingSuggestion &suggestion) const {
    return m_host && m_host->canShowPopup(suggestion.anchorOffset);
}

bool PopupChannel::activate(const PendingSuggestion &suggestion) {
    if (!m_host) return false;
    m_shown = m_host->showPopup(suggestion.anchorOffset, suggestion.suggestedText);
    return m_shown;
}

void PopupChannel::deactivate() {
    if (!m_shown || !m_host) return;
    m_host->hidePopup();
    m_shown = false;
}

// === Literal insertion ===

bool LiteralInsertChannel::activate(const PendingSuggestion &suggestion) {
    BufferTransaction tx(m_buffer);
    if (!tx.insert(suggestion.anchorOffset, suggestion.suggestedText)) {
        qCWarning(lcDisplay) << "literal insertion rejected by buffer at" << suggestion.anchorOffset;
        return false;
    }
    tx.commit();
    m_buffer->setCursorOffset(suggestion.anchorOffset + suggestion.suggestedText.size());
    return true;
}

// === Chain ===

void DisplayChannelChain::addChannel(std::unique_ptr<DisplayChannel> channel) {
    if (channel) m_channels.push_back(std::move(channel));
}

void DisplayChannelChain::clear() {
    deactivate(m_active);
    m_channels.clear();
}

DisplayChannel *DisplayChannelChain::channelAt(int index) const {
    if (index < 0 || index >= channelCount()) return nullptr;
    return m_channels[static_cast<size_t>(index)].get();
}

ChannelHandle DisplayChannelChain::activate(const PendingSuggestion &suggestion) {
    if (m_active.isValid()) deactivate(m_active);

    for (int i = 0; i < channelCount(); ++i) {
        DisplayChannel *channel = m_channels[static_cast<size_t>(i)].get();
        if (!channel->isAvailable(suggestion)) {
            qCDebug(lcDisplay) << "channel" << channel->name() << "unavailable, falling back";
            continue;
        }
        if (!channel->activate(suggestion)) {
            qCWarning(lcDisplay) << "channel" << channel->name() << "failed to activate, falling back";
            channel->deactivate();
            continue;
        }
        m_active.index = i;
        m_active.generation = ++m_generation;
        m_active.channelName = channel->name();
        m_active.occupiesBuffer = channel->occupiesBuffer();
        qCInfo(lcDisplay) << "suggestion shown via" << m_active.channelName << "at" << suggestion.anchorOffset;
        return m_active;
    }

    qCWarning(lcDisplay) << "no display channel could show the suggestion";
    return ChannelHandle();
}

void DisplayChannelChain::deactivate(const ChannelHandle &handle) {
    if (!handle.isValid() || !m_active.isValid() || handle.generation != m_active.generation)
        return;
    if (DisplayChannel *channel = channelAt(m_active.index))
        channel->deactivate();
    qCDebug(lcDisplay) << "channel" << m_active.channelName << "deactivated";
    m_active = ChannelHandle();
}
