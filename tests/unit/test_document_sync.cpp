#include <catch2/catch_test_macros.hpp>
#include "session/document_sync.hpp"

#include <functional>
#include <vector>

using namespace duet::session;
using duet::protocol::MessageKind;

namespace {

class FakeEditor : public EditorSurface {
public:
    QString text;
    Caret caret_value;
    std::optional<ScrollOffset> scroll;
    bool read_only = false;
    int replacements = 0;
    std::function<void()> on_change;

    QString documentText() const override { return text; }
    void replaceDocumentText(const QString& t) override {
        text = t;
        caret_value = Caret{};
        scroll = scroll ? std::optional<ScrollOffset>(ScrollOffset{}) : std::nullopt;
        ++replacements;
        if (on_change) on_change();
    }
    Caret caret() const override { return caret_value; }
    void setCaret(const Caret& c) override { caret_value = c; }
    std::optional<ScrollOffset> scrollOffset() const override { return scroll; }
    void setScrollOffset(const ScrollOffset& s) override { scroll = s; }
    void setReadOnly(bool ro) override { read_only = ro; }
};

SessionState connected(Role role, bool has_control) {
    SessionState state;
    state.toConnected(role);
    state.setHasControl(has_control);
    return state;
}

} // namespace

TEST_CASE("Writer sends the full document on local change", "[document_sync]") {
    FakeEditor editor;
    editor.text = QStringLiteral("print(2)");
    DocumentSync sync(&editor);

    auto msg = sync.onLocalChange(connected(Role::Host, true));
    REQUIRE(msg.has_value());
    REQUIRE(msg->kind == MessageKind::TextUpdate);
    REQUIRE(msg->content == QStringLiteral("print(2)"));
}

TEST_CASE("Viewer never sends local changes", "[document_sync]") {
    FakeEditor editor;
    editor.text = QStringLiteral("typed");
    DocumentSync sync(&editor);

    REQUIRE_FALSE(sync.onLocalChange(connected(Role::Client, false)).has_value());
    REQUIRE_FALSE(sync.onLocalChange(connected(Role::Host, false)).has_value());
}

TEST_CASE("Nothing is sent outside a connected session", "[document_sync]") {
    FakeEditor editor;
    editor.text = QStringLiteral("x");
    DocumentSync sync(&editor);

    SessionState listening;
    listening.toListening(1234);
    REQUIRE_FALSE(sync.onLocalChange(SessionState{}).has_value());
    REQUIRE_FALSE(sync.onLocalChange(listening).has_value());
}

TEST_CASE("Unchanged text is not re-sent", "[document_sync]") {
    FakeEditor editor;
    editor.text = QStringLiteral("a");
    DocumentSync sync(&editor);
    const auto writer = connected(Role::Host, true);

    REQUIRE(sync.onLocalChange(writer).has_value());
    REQUIRE_FALSE(sync.onLocalChange(writer).has_value());

    editor.text = QStringLiteral("ab");
    REQUIRE(sync.onLocalChange(writer).has_value());
}

TEST_CASE("Text whose send failed is offered again after reset", "[document_sync]") {
    FakeEditor editor;
    editor.text = QStringLiteral("lost");
    DocumentSync sync(&editor);
    const auto writer = connected(Role::Host, true);

    REQUIRE(sync.onLocalChange(writer).has_value());
    sync.reset();

    auto retry = sync.onLocalChange(writer);
    REQUIRE(retry.has_value());
    REQUIRE(retry->content == QStringLiteral("lost"));
}

TEST_CASE("Applying a remote update does not echo", "[document_sync]") {
    FakeEditor editor;
    DocumentSync sync(&editor);
    const auto viewer = connected(Role::Client, false);

    std::vector<std::optional<duet::protocol::Message>> echoes;
    editor.on_change = [&]() {
        REQUIRE(sync.isApplyingRemote());
        echoes.push_back(sync.onLocalChange(viewer));
    };

    REQUIRE(sync.applyRemote(viewer, QStringLiteral("print(1)")) == ApplyOutcome::Applied);
    REQUIRE(editor.text == QStringLiteral("print(1)"));
    REQUIRE(echoes.size() == 1);
    REQUIRE_FALSE(echoes.front().has_value());
    REQUIRE_FALSE(sync.isApplyingRemote());
}

TEST_CASE("Remote text received as viewer is not sent back after gaining control", "[document_sync]") {
    FakeEditor editor;
    DocumentSync sync(&editor);

    sync.applyRemote(connected(Role::Client, false), QStringLiteral("shared"));
    REQUIRE_FALSE(sync.onLocalChange(connected(Role::Client, true)).has_value());
}

TEST_CASE("Writer ignores inbound updates", "[document_sync]") {
    FakeEditor editor;
    editor.text = QStringLiteral("mine");
    DocumentSync sync(&editor);

    REQUIRE(sync.applyRemote(connected(Role::Host, true), QStringLiteral("theirs"))
            == ApplyOutcome::IgnoredWhileWriter);
    REQUIRE(editor.text == QStringLiteral("mine"));
    REQUIRE(editor.replacements == 0);
}

TEST_CASE("Identical inbound text leaves the editor alone", "[document_sync]") {
    FakeEditor editor;
    editor.text = QStringLiteral("same");
    DocumentSync sync(&editor);

    REQUIRE(sync.applyRemote(connected(Role::Client, false), QStringLiteral("same"))
            == ApplyOutcome::Unchanged);
    REQUIRE(editor.replacements == 0);
}

TEST_CASE("Caret and selection are clamped to the new length", "[document_sync]") {
    FakeEditor editor;
    editor.text = QStringLiteral("0123456789");
    editor.caret_value = Caret{8, 3};
    DocumentSync sync(&editor);

    sync.applyRemote(connected(Role::Client, false), QStringLiteral("01234"));
    REQUIRE(editor.caret_value.position == 5);
    REQUIRE(editor.caret_value.anchor == 3);

    editor.caret_value = Caret{2, 2};
    sync.applyRemote(connected(Role::Client, false), QStringLiteral("abcdefgh"));
    REQUIRE(editor.caret_value.position == 2);
    REQUIRE(editor.caret_value.anchor == 2);
}

TEST_CASE("Scroll offset is restored when the editor has one", "[document_sync]") {
    FakeEditor editor;
    editor.text = QStringLiteral("old");
    editor.scroll = ScrollOffset{3, 40};
    DocumentSync sync(&editor);

    sync.applyRemote(connected(Role::Client, false), QStringLiteral("new"));
    REQUIRE(editor.scroll.has_value());
    REQUIRE(editor.scroll->horizontal == 3);
    REQUIRE(editor.scroll->vertical == 40);
}

TEST_CASE("Missing editor is reported", "[document_sync]") {
    DocumentSync sync;

    REQUIRE(sync.applyRemote(connected(Role::Client, false), QStringLiteral("x"))
            == ApplyOutcome::NoEditor);
    REQUIRE_FALSE(sync.snapshot().has_value());
    REQUIRE_FALSE(sync.onLocalChange(connected(Role::Host, true)).has_value());
}

TEST_CASE("Snapshot carries the current document", "[document_sync]") {
    FakeEditor editor;
    editor.text = QStringLiteral("print(1)");
    DocumentSync sync(&editor);

    auto snapshot = sync.snapshot();
    REQUIRE(snapshot.has_value());
    REQUIRE(snapshot->content == QStringLiteral("print(1)"));
    // Already pushed, so an immediate change notification has nothing new.
    REQUIRE_FALSE(sync.onLocalChange(connected(Role::Host, true)).has_value());
}
