// src/ui/TextEditor.hpp
#pragma once
#include <QKeySequence>
#include <QPaintEvent>
#include <QPlainTextEdit>
#include <QPointer>
#include <QSize>
#include <QWidget>
#include "../completion/BufferAccessor.hpp"
#include "../completion/DisplayChannel.hpp"

class CompletionOrchestrator;
class QLabel;

class TextEditor : public QPlainTextEdit, public BufferAccessor, public OverlayHost, public PopupHost {
    Q_OBJECT

public:
    explicit TextEditor(QWidget *parent = nullptr);
    ~TextEditor() override;

    void setOrchestrator(CompletionOrchestrator *orchestrator);
    void setManualShortcut(const QKeySequence &shortcut) { m_manualShortcut = shortcut; }

    void lineNumberAreaPaintEvent(QPaintEvent *event);
    int lineNumberAreaWidth();

    // BufferAccessor
    int cursorOffset() const override;
    void setCursorOffset(int offset) override;
    TextContext textAround(int before, int after) const override;
    QString textRange(int start, int end) const override;
    bool insertAt(int offset, const QString &text) override;
    bool removeRange(int start, int end) override;
    quint64 version() const override { return m_version; }

    // OverlayHost
    bool canShowOverlay(int anchor, const QString &text) const override;
    bool showOverlay(int anchor, const QString &text) override;
    void hideOverlay() override;

    // PopupHost
    bool canShowPopup(int anchor) const override;
    bool showPopup(int anchor, const QString &text) override;
    void hidePopup() override;

protected:
    void resizeEvent(QResizeEvent *event) override;
    void keyPressEvent(QKeyEvent *event) override;
    void paintEvent(QPaintEvent *event) override;
    void focusOutEvent(QFocusEvent *event) override;

private slots:
    void updateLineNumberAreaWidth(int newBlockCount);
    void highlightCurrentLine();
    void updateLineNumberArea(const QRect &, int);
    void onContentsChange(int position, int charsRemoved, int charsAdded);
    void onCursorPositionChanged();

private:
    class LineNumberArea : public QWidget {
    public:
        explicit LineNumberArea(TextEditor *editor) : QWidget(editor), m_editor(editor) {}
        QSize sizeHint() const override { return QSize(m_editor->lineNumberAreaWidth(), 0); }
    protected:
        void paintEvent(QPaintEvent *event) override { m_editor->lineNumberAreaPaintEvent(event); }
    private:
        TextEditor *m_editor;
    };

    int maxOffset() const;

    LineNumberArea *lineNumberArea = nullptr;
    QPointer<CompletionOrchestrator> m_orchestrator;
    QKeySequence m_manualShortcut{QStringLiteral("Ctrl+Space")};
    quint64 m_version = 0;
    bool m_handlingKey = false;

    QString m_ghostText;
    int m_ghostAnchor = -1;
    QLabel *m_popup = nullptr;
};
