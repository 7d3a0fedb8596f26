#include <catch2/catch_test_macros.hpp>

#include "storage/page_codec.hpp"
#include "ui/models/HistoryJournal.hpp"

using namespace pagetree;
using namespace pagetree::ui;

namespace {

PageList pages_with_comment(const std::string& comment) {
    return PageList{make_page(0, BoardField{"v115@x"}, comment)};
}

PagesSnapshot snapshot_of(const std::string& comment, int index = 0) {
    return PagesSnapshot{.pages = storage::pages_to_json(pages_with_comment(comment)), .current_index = index};
}

HistoryTask task(const std::string& from, const std::string& to) {
    return HistoryTask{.revert = snapshot_of(from), .replay = snapshot_of(to), .fixed = false};
}

} // namespace

TEST_CASE("HistoryJournal: empty history has nothing to undo", "[ui][history]") {
    HistoryJournal journal;

    auto undone = journal.undo();
    REQUIRE(undone.is_ok());
    REQUIRE_FALSE(undone.unwrap().has_value());

    auto redone = journal.redo();
    REQUIRE(redone.is_ok());
    REQUIRE_FALSE(redone.unwrap().has_value());
}

TEST_CASE("HistoryJournal: undo and redo return the recorded snapshots", "[ui][history]") {
    HistoryJournal journal;
    REQUIRE(journal.registerTask(task("a", "b"), {}) == 1);
    REQUIRE(journal.registerTask(task("b", "c"), {}) == 2);
    REQUIRE_FALSE(journal.lastApplied().has_value());

    auto first = journal.undo().unwrap();
    REQUIRE(first);
    REQUIRE(first->pages == pages_with_comment("b"));
    REQUIRE(first->undo_count == 1);
    REQUIRE(first->redo_count == 1);
    REQUIRE(journal.lastApplied() == snapshot_of("b"));

    auto second = journal.undo().unwrap();
    REQUIRE(second->pages == pages_with_comment("a"));
    REQUIRE_FALSE(journal.canUndo());

    auto again = journal.redo().unwrap();
    REQUIRE(again->pages == pages_with_comment("b"));
    REQUIRE(journal.undoCount() == 1);
    REQUIRE(journal.redoCount() == 1);
}

TEST_CASE("HistoryJournal: new tasks drop the redo branch", "[ui][history]") {
    HistoryJournal journal;
    journal.registerTask(task("a", "b"), {});
    journal.registerTask(task("b", "c"), {});
    REQUIRE(journal.undo().unwrap());

    journal.registerTask(task("b", "d"), {});

    REQUIRE(journal.undoCount() == 2);
    REQUIRE(journal.redoCount() == 0);
}

TEST_CASE("HistoryJournal: tasks with the same key merge", "[ui][history]") {
    HistoryJournal journal;
    const auto key = QStringLiteral("comment/0");

    REQUIRE(journal.registerTask(task("a", "ab"), key) == 1);
    REQUIRE(journal.registerTask(task("ab", "abc"), key) == 1);
    REQUIRE(journal.registerTask(task("abc", "x"), QStringLiteral("comment/1")) == 2);

    REQUIRE(journal.undo().unwrap()->pages == pages_with_comment("abc"));
    REQUIRE(journal.undo().unwrap()->pages == pages_with_comment("a"));
    REQUIRE(journal.redo().unwrap()->pages == pages_with_comment("abc"));
}

TEST_CASE("HistoryJournal: sealed and fixed tasks do not merge", "[ui][history]") {
    HistoryJournal journal;
    const auto key = QStringLiteral("comment/0");

    journal.registerTask(task("a", "ab"), key);
    journal.sealTop();
    REQUIRE(journal.registerTask(task("ab", "abc"), key) == 2);

    // A fixed task still joins the open top task but closes it.
    auto fixed = task("abc", "abcd");
    fixed.fixed = true;
    REQUIRE(journal.registerTask(fixed, key) == 2);
    REQUIRE(journal.registerTask(task("abcd", "abcde"), key) == 3);
    REQUIRE(journal.undo().unwrap()->pages == pages_with_comment("abcd"));
    REQUIRE(journal.undo().unwrap()->pages == pages_with_comment("ab"));
}

TEST_CASE("HistoryJournal: undecodable snapshots leave history alone", "[ui][history]") {
    HistoryJournal journal;
    journal.registerTask(HistoryTask{.revert = PagesSnapshot{.pages = "not json", .current_index = 0},
                                     .replay = snapshot_of("b"),
                                     .fixed = false},
                         {});

    auto undone = journal.undo();

    REQUIRE(undone.is_err());
    REQUIRE(undone.unwrap_err().code == ErrorCode::Malformed);
    REQUIRE(journal.undoCount() == 1);
    REQUIRE(journal.redoCount() == 0);
}

TEST_CASE("HistoryJournal: undo limit drops the oldest tasks", "[ui][history]") {
    HistoryJournal journal(2);
    journal.registerTask(task("a", "b"), {});
    journal.registerTask(task("b", "c"), {});
    journal.registerTask(task("c", "d"), {});

    REQUIRE(journal.undoLimit() == 2);
    REQUIRE(journal.undoCount() == 2);
    REQUIRE(journal.undo().unwrap()->pages == pages_with_comment("c"));
    REQUIRE(journal.undo().unwrap()->pages == pages_with_comment("b"));
    REQUIRE_FALSE(journal.undo().unwrap());
}

TEST_CASE("HistoryJournal: a new undo limit applies to later tasks", "[ui][history]") {
    HistoryJournal journal;
    journal.registerTask(task("a", "b"), {});
    journal.registerTask(task("b", "c"), {});

    journal.setUndoLimit(journal.undoLimit());
    REQUIRE(journal.undoCount() == 2);

    journal.setUndoLimit(1);
    REQUIRE(journal.undoLimit() == 1);
    REQUIRE(journal.undoCount() == 0);

    journal.registerTask(task("c", "d"), {});
    journal.registerTask(task("d", "e"), {});
    REQUIRE(journal.undoCount() == 1);
    REQUIRE(journal.undo().unwrap()->pages == pages_with_comment("d"));

    journal.setUndoLimit(-3);
    REQUIRE(journal.undoLimit() == 0);
}

TEST_CASE("HistoryJournal: clear empties both stacks", "[ui][history]") {
    HistoryJournal journal;
    int notified = 0;
    QObject::connect(&journal, &HistoryJournal::countsChanged, [&] { ++notified; });

    journal.registerTask(task("a", "b"), {});
    REQUIRE(journal.undo().unwrap());
    journal.clear();

    REQUIRE(journal.undoCount() == 0);
    REQUIRE(journal.redoCount() == 0);
    REQUIRE_FALSE(journal.lastApplied());
    REQUIRE(notified == 3);
}
