// src/completion/BufferAccessor.hpp
#pragma once
#include <QList>
#include <QString>
#include <QtGlobal>

struct TextContext {
    QString before;
    QString after;
};

// Narrow view of the host's text buffer. Offsets are in QChar units.
// version() must change on every mutation, including the ones made
// through this interface.
class BufferAccessor {
public:
    virtual ~BufferAccessor() = default;

    virtual int cursorOffset() const = 0;
    virtual void setCursorOffset(int offset) = 0;
    virtual TextContext textAround(int before, int after) const = 0;
    virtual QString textRange(int start, int end) const = 0;
    virtual bool insertAt(int offset, const QString &text) = 0;
    virtual bool removeRange(int start, int end) = 0;
    virtual quint64 version() const = 0;
};

// Groups buffer edits; anything not committed is undone in reverse order
// when the transaction goes out of scope, and the cursor is put back.
class BufferTransaction {
public:
    explicit BufferTransaction(BufferAccessor *buffer);
    ~BufferTransaction();

    BufferTransaction(const BufferTransaction &) = delete;
    BufferTransaction &operator=(const BufferTransaction &) = delete;

    bool insert(int offset, const QString &text);
    bool remove(int start, int end);
    void commit();
    void rollback();

    bool isEmpty() const { return m_steps.isEmpty(); }

private:
    struct Step {
        bool inserted = false;
        int offset = 0;
        QString text;
    };

    BufferAccessor *m_buffer = nullptr;
    QList<Step> m_steps;
    int m_cursor = 0;
    bool m_done = false;
};
