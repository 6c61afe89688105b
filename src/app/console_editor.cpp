#include "app/console_editor.hpp"
#include "core/logging.hpp"

namespace duet::app {

ConsoleEditor::ConsoleEditor(QString initial_text, QObject* parent)
    : QObject(parent)
    , text_(std::move(initial_text))
{
    caret_.position = static_cast<int>(text_.size());
    caret_.anchor = caret_.position;
}

void ConsoleEditor::replaceDocumentText(const QString& text) {
    if (text == text_) {
        return;
    }
    text_ = text;
    // A replaced document puts the caret at the start, like QTextDocument::setPlainText.
    caret_ = session::Caret{};
    emit documentChanged();
}

void ConsoleEditor::setReadOnly(bool read_only) {
    if (read_only_ == read_only) {
        return;
    }
    read_only_ = read_only;
    emit readOnlyChanged(read_only_);
}

bool ConsoleEditor::setText(const QString& text) {
    if (read_only_) {
        emit editAttemptedWhileReadOnly();
        return false;
    }
    if (text == text_) {
        return true;
    }
    text_ = text;
    caret_.position = static_cast<int>(text_.size());
    caret_.anchor = caret_.position;
    emit documentChanged();
    return true;
}

bool ConsoleEditor::appendText(const QString& text) {
    return setText(text_ + text);
}

bool FixedApprover::approveControlRequest(const QString& peer) {
    qCInfo(sessionLog) << (approve_ ? "auto-approving" : "auto-declining")
                       << "control request from" << peer;
    return approve_;
}

} // namespace duet::app
