// src/ui/TextEditor.cpp
#include "TextEditor.hpp"
#include "../completion/CompletionLog.hpp"
#include "../completion/CompletionOrchestrator.hpp"
#include <QKeyEvent>
#include <QLabel>
#include <QPainter>
#include <QScopedValueRollback>
#include <QTextBlock>
#include <QTextCursor>
#include <QTextDocument>
#include <algorithm>

TextEditor::TextEditor(QWidget *parent) : QPlainTextEdit(parent) {
    lineNumberArea = new LineNumberArea(this);
    connect(this, &TextEditor::blockCountChanged, this, &TextEditor::updateLineNumberAreaWidth);
    connect(this, &TextEditor::updateRequest, this, &TextEditor::updateLineNumberArea);
    connect(this, &TextEditor::cursorPositionChanged, this, &TextEditor::highlightCurrentLine);
    connect(this, &TextEditor::cursorPositionChanged, this, &TextEditor::onCursorPositionChanged);
    connect(document(), &QTextDocument::contentsChange, this, &TextEditor::onContentsChange);

    m_popup = new QLabel(this, Qt::ToolTip);
    m_popup->setStyleSheet("background:#2a2a3a; color:#9aa0b8; border:1px solid #5a5aff; padding:4px;");
    m_popup->setWordWrap(true);
    m_popup->setMaximumWidth(480);
    m_popup->hide();

    setTabChangesFocus(false);
    updateLineNumberAreaWidth(0);
    highlightCurrentLine();
}

TextEditor::~TextEditor() {
    // The document outlives this part of the object; keep it from calling back.
    disconnect(document(), nullptr, this, nullptr);
    m_orchestrator = nullptr;
}

void TextEditor::setOrchestrator(CompletionOrchestrator *orchestrator) {
    m_orchestrator = orchestrator;
}

// === Буфер ===

int TextEditor::maxOffset() const {
    return std::max(0, document()->characterCount() - 1);
}

int TextEditor::cursorOffset() const {
    return textCursor().position();
}

void TextEditor::setCursorOffset(int offset) {
    QTextCursor c = textCursor();
    c.setPosition(std::clamp(offset, 0, maxOffset()));
    setTextCursor(c);
}

QString TextEditor::textRange(int start, int end) const {
    start = std::clamp(start, 0, maxOffset());
    end = std::clamp(end, start, maxOffset());
    if (start == end) return QString();
    QTextCursor c(document());
    c.setPosition(start);
    c.setPosition(end, QTextCursor::KeepAnchor);
    QString text = c.selectedText();
    text.replace(QChar::ParagraphSeparator, QLatin1Char('\n'));
    text.replace(QChar::LineSeparator, QLatin1Char('\n'));
    return text;
}

TextContext TextEditor::textAround(int before, int after) const {
    const int pos = cursorOffset();
    return {textRange(pos - before, pos), textRange(pos, pos + after)};
}

bool TextEditor::insertAt(int offset, const QString &text) {
    if (offset < 0 || offset > maxOffset()) return false;
    QTextCursor c(document());
    c.setPosition(offset);
    c.insertText(text);
    return true;
}

bool TextEditor::removeRange(int start, int end) {
    if (start < 0 || end < start || end > maxOffset()) return false;
    QTextCursor c(document());
    c.setPosition(start);
    c.setPosition(end, QTextCursor::KeepAnchor);
    c.removeSelectedText();
    return true;
}

// Edits made by a key press are reported once the key is handled, through
// notifyKeystroke and notifyCursorMoved.
void TextEditor::onContentsChange(int, int, int) {
    ++m_version;
    if (m_orchestrator && !m_handlingKey) m_orchestrator->notifyBufferChanged();
}

void TextEditor::onCursorPositionChanged() {
    if (m_orchestrator && !m_handlingKey) m_orchestrator->notifyCursorMoved();
}

// === Подсказка поверх текста ===

bool TextEditor::canShowOverlay(int anchor, const QString &text) const {
    if (anchor != cursorOffset()) return false;
    QTextCursor c(document());
    c.setPosition(anchor);
    // Painted text would cover whatever follows on the line.
    if (!c.atBlockEnd()) return false;
    return !text.contains(QLatin1Char('\n')) || c.atEnd();
}

bool TextEditor::showOverlay(int anchor, const QString &text) {
    m_ghostAnchor = anchor;
    m_ghostText = text;
    viewport()->update();
    return true;
}

void TextEditor::hideOverlay() {
    if (m_ghostText.isEmpty()) return;
    m_ghostText.clear();
    m_ghostAnchor = -1;
    viewport()->update();
}

void TextEditor::paintEvent(QPaintEvent *event) {
    QPlainTextEdit::paintEvent(event);
    if (m_ghostText.isEmpty() || m_ghostAnchor < 0) return;

    QPainter painter(viewport());
    painter.setFont(font());
    painter.setPen(QColor("#6c7086"));

    QTextCursor c(document());
    c.setPosition(std::min(m_ghostAnchor, maxOffset()));
    const QRect r = cursorRect(c);
    const QFontMetrics fm(font());
    const int left = int(contentOffset().x() + document()->documentMargin());

    const QStringList lines = m_ghostText.split(QLatin1Char('\n'));
    for (int i = 0; i < lines.size(); ++i) {
        const int x = i == 0 ? r.left() : left;
        const int baseline = r.top() + fm.ascent() + i * fm.lineSpacing();
        painter.drawText(QPoint(x, baseline), lines.at(i));
    }
}

// === Всплывающая подсказка ===

bool TextEditor::canShowPopup(int anchor) const {
    return isVisible() && anchor == cursorOffset();
}

bool TextEditor::showPopup(int anchor, const QString &text) {
    QTextCursor c(document());
    c.setPosition(std::min(anchor, maxOffset()));
    m_popup->setText(text);
    m_popup->adjustSize();
    m_popup->move(viewport()->mapToGlobal(cursorRect(c).bottomLeft() + QPoint(0, 4)));
    m_popup->show();
    return m_popup->isVisible();
}

void TextEditor::hidePopup() {
    m_popup->hide();
}

// === Клавиатура ===

void TextEditor::keyPressEvent(QKeyEvent *event) {
    if (m_orchestrator) {
        if (m_orchestrator->hasPendingSuggestion()) {
            if (event->key() == Qt::Key_Tab && event->modifiers() == Qt::NoModifier) {
                m_orchestrator->accept();
                return;
            }
            if (event->key() == Qt::Key_Escape) {
                m_orchestrator->reject();
                return;
            }
        } else if (event->key() == Qt::Key_Escape && m_orchestrator->isRequesting()) {
            m_orchestrator->cancel();
            return;
        }
        if (!m_manualShortcut.isEmpty() && QKeySequence(event->keyCombination()) == m_manualShortcut) {
            qCDebug(lcUi) << "manual trigger" << m_manualShortcut.toString();
            m_orchestrator->notifyManualTrigger();
            return;
        }
    }

    {
        QScopedValueRollback<bool> guard(m_handlingKey, true);
        QPlainTextEdit::keyPressEvent(event);
    }
    if (m_orchestrator) {
        m_orchestrator->notifyKeystroke(event->text());
        m_orchestrator->notifyCursorMoved();
    }
}

void TextEditor::focusOutEvent(QFocusEvent *event) {
    hidePopup();
    QPlainTextEdit::focusOutEvent(event);
}

// === Номера строк ===

int TextEditor::lineNumberAreaWidth() {
    int digits = 1;
    int max = qMax(1, blockCount());
    while (max >= 10) {
        max /= 10;
        ++digits;
    }
    return 8 + fontMetrics().horizontalAdvance(QLatin1Char('9')) * digits;
}

void TextEditor::updateLineNumberAreaWidth(int) {
    setViewportMargins(lineNumberAreaWidth(), 0, 0, 0);
}

void TextEditor::updateLineNumberArea(const QRect &rect, int dy) {
    if (dy)
        lineNumberArea->scroll(0, dy);
    else
        lineNumberArea->update(0, rect.y(), lineNumberArea->width(), rect.height());

    if (rect.contains(viewport()->rect()))
        updateLineNumberAreaWidth(0);
}

void TextEditor::resizeEvent(QResizeEvent *e) {
    QPlainTextEdit::resizeEvent(e);
    QRect cr = contentsRect();
    lineNumberArea->setGeometry(QRect(cr.left(), cr.top(), lineNumberAreaWidth(), cr.height()));
}

void TextEditor::highlightCurrentLine() {
    QList<QTextEdit::ExtraSelection> extraSelections;

    if (!isReadOnly()) {
        QTextEdit::ExtraSelection selection;
        selection.format.setBackground(QColor("#2a2a3a"));
        selection.format.setProperty(QTextFormat::FullWidthSelection, true);
        selection.cursor = textCursor();
        selection.cursor.clearSelection();
        extraSelections.append(selection);
    }

    setExtraSelections(extraSelections);
}

void TextEditor::lineNumberAreaPaintEvent(QPaintEvent *event) {
    QPainter painter(lineNumberArea);
    painter.fillRect(event->rect(), QColor("#22222e"));

    QTextBlock block = firstVisibleBlock();
    int blockNumber = block.blockNumber();
    int top = qRound(blockBoundingGeometry(block).translated(contentOffset()).top());
    int bottom = top + qRound(blockBoundingRect(block).height());

    while (block.isValid() && top <= event->rect().bottom()) {
        if (block.isVisible() && bottom >= event->rect().top()) {
            painter.setPen(QColor("#6c7086"));
            painter.drawText(0, top, lineNumberArea->width() - 5, fontMetrics().height(),
                             Qt::AlignRight, QString::number(blockNumber + 1));
        }
        block = block.next();
        top = bottom;
        bottom = top + qRound(blockBoundingRect(block).height());
        ++blockNumber;
    }
}
