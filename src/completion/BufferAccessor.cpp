// src/completion/BufferAccessor.cpp
#include "BufferAccessor.hpp"
#include "CompletionLog.hpp"

BufferTransaction::BufferTransaction(BufferAccessor *buffer)
    : m_buffer(buffer), m_cursor(buffer ? buffer->cursorOffset() : 0) {}

BufferTransaction::~BufferTransaction() {
    if (!m_done) rollback();
}

bool BufferTransaction::insert(int offset, const QString &text) {
    if (!m_buffer || m_done) return false;
    if (text.isEmpty()) return true;
    if (!m_buffer->insertAt(offset, text)) return false;
    m_steps.append({true, offset, text});
    return true;
}

bool BufferTransaction::remove(int start, int end) {
    if (!m_buffer || m_done || start > end) return false;
    if (start == end) return true;
    const QString removed = m_buffer->textRange(start, end);
    if (removed.size() != end - start) return false;
    if (!m_buffer->removeRange(start, end)) return false;
    m_steps.append({false, start, removed});
    return true;
}

void BufferTransaction::commit() {
    m_done = true;
    m_steps.clear();
}

void BufferTransaction::rollback() {
    if (m_done) return;
    m_done = true;
    if (!m_buffer) return;
    for (int i = m_steps.size() - 1; i >= 0; --i) {
        const Step &step = m_steps.at(i);
        const bool ok = step.inserted
            ? m_buffer->removeRange(step.offset, step.offset + step.text.size())
            : m_buffer->insertAt(step.offset, step.text);
        if (!ok)
            qCCritical(lcCompletion) << "buffer rollback failed at offset" << step.offset;
    }
    if (!m_steps.isEmpty()) m_buffer->setCursorOffset(m_cursor);
    m_steps.clear();
}
