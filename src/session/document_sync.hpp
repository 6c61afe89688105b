#pragma once

#include "protocol/message.hpp"
#include "session/session_state.hpp"

#include <QString>
#include <optional>

namespace duet::session {

struct Caret {
    int position = 0;
    int anchor = 0;    // equals position when nothing is selected
};

struct ScrollOffset {
    int horizontal = 0;
    int vertical = 0;
};

/**
 * EditorSurface - The text editor the sync core drives.
 *
 * The editor owns the document. It reports local edits through
 * SessionManager::onLocalDocumentChanged() and attempted edits while
 * read-only through SessionManager::onUserRequestedReclaim().
 */
class EditorSurface {
public:
    virtual ~EditorSurface() = default;

    [[nodiscard]] virtual QString documentText() const = 0;
    virtual void replaceDocumentText(const QString& text) = 0;

    [[nodiscard]] virtual Caret caret() const = 0;
    virtual void setCaret(const Caret& caret) = 0;

    // Editors without scrolling keep the defaults.
    [[nodiscard]] virtual std::optional<ScrollOffset> scrollOffset() const { return std::nullopt; }
    virtual void setScrollOffset(const ScrollOffset&) {}

    virtual void setReadOnly(bool read_only) = 0;
};

/**
 * ControlApprover - Yes/no decision when the peer asks for control.
 *
 * Without an approver, SessionManager emits controlRequestReceived()
 * and waits for resolveControlRequest().
 */
class ControlApprover {
public:
    virtual ~ControlApprover() = default;
    [[nodiscard]] virtual bool approveControlRequest(const QString& peer) = 0;
};

enum class ApplyOutcome {
    Applied,
    Unchanged,          // incoming text equals the current document
    IgnoredWhileWriter, // local side holds control
    NoEditor
};

/**
 * DocumentSync - When local edits go out and inbound text comes in.
 *
 * Outbound: only while Connected, holding control, and not in the middle
 * of applying a remote update. Inbound: only while not holding control.
 * A local change whose text equals the last text sent or applied is a
 * no-op and produces nothing.
 */
class DocumentSync {
public:
    explicit DocumentSync(EditorSurface* editor = nullptr) : editor_(editor) {}

    void setEditor(EditorSurface* editor) { editor_ = editor; }
    [[nodiscard]] EditorSurface* editor() const { return editor_; }

    [[nodiscard]] std::optional<protocol::Message> onLocalChange(const SessionState& state);

    /**
     * Full document for the initial push to a newly accepted peer.
     */
    [[nodiscard]] std::optional<protocol::Message> snapshot();

    ApplyOutcome applyRemote(const SessionState& state, const QString& text);

    [[nodiscard]] bool isApplyingRemote() const noexcept { return applying_remote_; }

    /**
     * Forget the last synced text (new peer, or session ended).
     */
    void reset() { last_synced_.reset(); }

private:
    EditorSurface* editor_ = nullptr;
    bool applying_remote_ = false;
    std::optional<QString> last_synced_;
};

[[nodiscard]] const char* to_string(ApplyOutcome outcome) noexcept;

} // namespace duet::session
