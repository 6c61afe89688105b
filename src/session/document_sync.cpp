#include "session/document_sync.hpp"

#include <algorithm>

namespace duet::session {

namespace {

class ScopedFlag {
public:
    explicit ScopedFlag(bool& flag) : flag_(flag) { flag_ = true; }
    ~ScopedFlag() { flag_ = false; }
    ScopedFlag(const ScopedFlag&) = delete;
    ScopedFlag& operator=(const ScopedFlag&) = delete;

private:
    bool& flag_;
};

int clamp_offset(int offset, qsizetype length) {
    return std::clamp(offset, 0, static_cast<int>(length));
}

} // namespace

std::optional<protocol::Message> DocumentSync::onLocalChange(const SessionState& state) {
    if (applying_remote_ || editor_ == nullptr) {
        return std::nullopt;
    }
    if (!state.isConnected() || !state.hasControl()) {
        return std::nullopt;
    }

    auto text = editor_->documentText();
    if (last_synced_ && *last_synced_ == text) {
        return std::nullopt;
    }
    last_synced_ = text;
    return protocol::Message::textUpdate(std::move(text));
}

std::optional<protocol::Message> DocumentSync::snapshot() {
    if (editor_ == nullptr) {
        return std::nullopt;
    }
    auto text = editor_->documentText();
    last_synced_ = text;
    return protocol::Message::textUpdate(std::move(text));
}

ApplyOutcome DocumentSync::applyRemote(const SessionState& state, const QString& text) {
    if (state.hasControl()) {
        return ApplyOutcome::IgnoredWhileWriter;
    }
    if (editor_ == nullptr) {
        return ApplyOutcome::NoEditor;
    }

    last_synced_ = text;
    if (editor_->documentText() == text) {
        return ApplyOutcome::Unchanged;
    }

    ScopedFlag guard(applying_remote_);
    const auto caret = editor_->caret();
    const auto scroll = editor_->scrollOffset();

    editor_->replaceDocumentText(text);
    editor_->setCaret(Caret{clamp_offset(caret.position, text.size()),
                            clamp_offset(caret.anchor, text.size())});
    if (scroll) {
        editor_->setScrollOffset(*scroll);
    }
    return ApplyOutcome::Applied;
}

const char* to_string(ApplyOutcome outcome) noexcept {
    switch (outcome) {
        case ApplyOutcome::Applied: return "Applied";
        case ApplyOutcome::Unchanged: return "Unchanged";
        case ApplyOutcome::IgnoredWhileWriter: return "IgnoredWhileWriter";
        case ApplyOutcome::NoEditor: return "NoEditor";
    }
    return "?";
}

} // namespace duet::session
