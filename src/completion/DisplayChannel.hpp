// src/completion/DisplayChannel.hpp
#pragma once
#include <QString>
#include <memory>
#include <vector>
#include "CompletionTypes.hpp"

class BufferAccessor;

// Host capability used by the in-buffer ghost overlay.
class OverlayHost {
public:
    virtual ~OverlayHost() = default;
    virtual bool canShowOverlay(int anchor, const QString &text) const = 0;
    virtual bool showOverlay(int anchor, const QString &text) = 0;
    virtual void hideOverlay() = 0;
};

// Host capability used by the transient popup.
class PopupHost {
public:
    virtual ~PopupHost() = default;
    virtual bool canShowPopup(int anchor) const = 0;
    virtual bool showPopup(int anchor, const QString &text) = 0;
    virtual void hidePopup() = 0;
};

class DisplayChannel {
public:
    virtual ~DisplayChannel() = default;

    virtual QString name() const = 0;
    // Precondition check, called before activate().
    virtual bool isAvailable(const PendingSuggestion &suggestion) const = 0;
    virtual bool activate(const PendingSuggestion &suggestion) = 0;
    // Must be safe to call when nothing is shown.
    virtual void deactivate() = 0;
    // True when activate() puts the text into the buffer itself.
    virtual bool occupiesBuffer() const { return false; }
};

class GhostOverlayChannel : public DisplayChannel {
public:
    explicit GhostOverlayChannel(OverlayHost *host) : m_host(host) {}
    QString name() const override { return QStringLiteral("overlay"); }
    bool isAvailable(const PendingSuggestion &suggestion) const override;
    bool activate(const PendingSuggestion &suggestion) override;
    void deactivate() override;
private:
    OverlayHost *m_host = nullptr;
    bool m_shown = false;
};

class PopupChannel : public DisplayChannel {
public:
    explicit PopupChannel(PopupHost *host) : m_host(host) {}
    QString name() const override { return QStringLiteral("popup"); }
    bool isAvailable(const PendingSuggestion &suggestion) const override;
    bool activate(const PendingSuggestion &suggestion) override;
    void deactivate() override;
private:
    PopupHost *m_host = nullptr;
    bool m_shown = false;
};

// Last resort: writes the suggestion straight into the buffer. Rolling the
// text back out again is the suggestion buffer's job, not the channel's.
class LiteralInsertChannel : public DisplayChannel {
public:
    explicit LiteralInsertChannel(BufferAccessor *buffer) : m_buffer(buffer) {}
    QString name() const override { return QStringLiteral("literal"); }
    bool isAvailable(const PendingSuggestion &) const override { return m_buffer != nullptr; }
    bool activate(const PendingSuggestion &suggestion) override;
    void deactivate() override {}
    bool occupiesBuffer() const override { return true; }
private:
    BufferAccessor *m_buffer = nullptr;
};

struct ChannelHandle {
    int index = -1;
    quint64 generation = 0;
    QString channelName;
    bool occupiesBuffer = false;

    bool isValid() const { return index >= 0; }
};

class DisplayChannelChain {
public:
    DisplayChannelChain() = default;
    DisplayChannelChain(const DisplayChannelChain &) = delete;
    DisplayChannelChain &operator=(const DisplayChannelChain &) = delete;

    // Channels are tried in the order they were added.
    void addChannel(std::unique_ptr<DisplayChannel> channel);
    void clear();

    ChannelHandle activate(const PendingSuggestion &suggestion);
    void deactivate(const ChannelHandle &handle);

    ChannelHandle activeHandle() const { return m_active; }
    int channelCount() const { return static_cast<int>(m_channels.size()); }
    DisplayChannel *channelAt(int index) const;

private:
    std::vector<std::unique_ptr<DisplayChannel>> m_channels;
    ChannelHandle m_active;
    quint64 m_generation = 0;
};
