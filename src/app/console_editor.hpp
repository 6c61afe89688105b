#pragma once

#include "session/document_sync.hpp"
#include <QObject>
#include <QString>

namespace duet::app {

/**
 * ConsoleEditor - Plain-text document for the console harness.
 *
 * Behaves like a text widget: every content change, local or
 * programmatic, emits documentChanged().
 */
class ConsoleEditor : public QObject, public session::EditorSurface {
    Q_OBJECT

public:
    explicit ConsoleEditor(QString initial_text = {}, QObject* parent = nullptr);

    [[nodiscard]] QString documentText() const override { return text_; }
    void replaceDocumentText(const QString& text) override;

    [[nodiscard]] session::Caret caret() const override { return caret_; }
    void setCaret(const session::Caret& caret) override { caret_ = caret; }

    void setReadOnly(bool read_only) override;
    [[nodiscard]] bool isReadOnly() const { return read_only_; }

    /**
     * User edits. Return false (and emit editAttemptedWhileReadOnly())
     * when the editor is read-only.
     */
    bool setText(const QString& text);
    bool appendText(const QString& text);

signals:
    void documentChanged();
    void editAttemptedWhileReadOnly();
    void readOnlyChanged(bool read_only);

private:
    QString text_;
    session::Caret caret_;
    bool read_only_ = false;
};

/**
 * FixedApprover - Answers every control request the same way.
 */
class FixedApprover : public session::ControlApprover {
public:
    explicit FixedApprover(bool approve) : approve_(approve) {}
    bool approveControlRequest(const QString& peer) override;

private:
    bool approve_;
};

} // namespace duet::app
