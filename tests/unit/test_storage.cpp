#include <catch2/catch_test_macros.hpp>
#include "storage/database.hpp"
#include "storage/document_repository.hpp"
#include "storage/migrations.hpp"

using namespace pagetree;
using namespace pagetree::storage;

TEST_CASE("Database basic operations", "[storage]") {
    auto db_result = Database::open_memory();
    REQUIRE(db_result.is_ok());
    auto db = std::move(db_result).unwrap();

    SECTION("Prepare and step") {
        REQUIRE(db.execute("CREATE TABLE test (id INTEGER, name TEXT);").is_ok());
        REQUIRE(db.execute("INSERT INTO test VALUES (1, 'Alice'), (2, 'Bob');").is_ok());

        auto stmt = db.prepare("SELECT * FROM test ORDER BY id;").unwrap();

        REQUIRE(stmt.step().unwrap() == true);
        REQUIRE(stmt.column_int(0) == 1);
        REQUIRE(stmt.column_text(1) == "Alice");
        REQUIRE(stmt.step().unwrap() == true);
        REQUIRE(stmt.column_text(1) == "Bob");
        REQUIRE(stmt.step().unwrap() == false);
    }

    SECTION("Bad SQL is an error") {
        REQUIRE(db.execute("CREATE TABEL nope;").is_err());
        REQUIRE(db.prepare("SELECT * FROM missing;").is_err());
    }

    SECTION("Transaction rollback on error") {
        REQUIRE(db.execute("CREATE TABLE test (id INTEGER);").is_ok());
        REQUIRE(db.execute("INSERT INTO test VALUES (1);").is_ok());

        auto result = db.transaction([&]() -> Result<void, Error> {
            auto inserted = db.execute("INSERT INTO test VALUES (2);");
            if (inserted.is_err()) return inserted;
            return Result<void, Error>::err(Error{"forced error"});
        });
        REQUIRE(result.is_err());

        auto stmt = db.prepare("SELECT COUNT(*) FROM test;").unwrap();
        REQUIRE(stmt.step().unwrap());
        REQUIRE(stmt.column_int(0) == 1);
    }
}

TEST_CASE("Migrations", "[storage]") {
    auto db = Database::open_memory().unwrap();
    MigrationRunner runner(db);

    SECTION("Initial version is 0") {
        REQUIRE(runner.current_version().unwrap() == 0);
    }

    SECTION("Migrate is idempotent") {
        REQUIRE(runner.migrate().is_ok());
        REQUIRE(runner.migrate().is_ok());
        REQUIRE(runner.current_version().unwrap() == MigrationRunner::latest_version());
    }

    SECTION("Rollback drops newer versions") {
        REQUIRE(runner.migrate().is_ok());
        REQUIRE(runner.rollback_to(0).is_ok());
        REQUIRE(runner.current_version().unwrap() == 0);
        REQUIRE(db.prepare("SELECT * FROM documents;").is_err());
    }
}

TEST_CASE("DocumentRepository", "[storage]") {
    auto db = Database::open_memory().unwrap();
    REQUIRE(initialize_database(db).is_ok());
    DocumentRepository repo(db);

    const PageList pages{
        make_page(0, BoardField{"v115@a"}, "intro"),
        Page{.index = 1, .field = PageRef{0}, .comment = PageRef{0}, .flags = PageFlags{.quiz = true}},
        make_page(2, BoardField{}, ""),
    };

    const auto id = repo.create("Openers").unwrap();

    SECTION("New documents are empty") {
        auto loaded = repo.load(id).unwrap();
        REQUIRE(loaded);
        REQUIRE(loaded->title == "Openers");
        REQUIRE(loaded->pages.empty());
        REQUIRE(loaded->current_index == 0);
    }

    SECTION("Save and load keep values and references") {
        REQUIRE(repo.save_pages(id, pages, 2).is_ok());

        auto loaded = repo.load(id).unwrap();
        REQUIRE(loaded);
        REQUIRE(loaded->pages == pages);
        REQUIRE(loaded->current_index == 2);
    }

    SECTION("Saving replaces the previous pages") {
        REQUIRE(repo.save_pages(id, pages, 0).is_ok());
        REQUIRE(repo.save_pages(id, PageList{pages.front()}, 0).is_ok());

        REQUIRE(repo.load(id).unwrap()->pages.size() == 1);
    }

    SECTION("Saving rewrites page indices to positions") {
        PageList shifted{make_page(7, BoardField{"x"})};
        REQUIRE(repo.save_pages(id, shifted, 0).is_ok());

        REQUIRE(repo.load(id).unwrap()->pages.front().index == 0);
    }

    SECTION("Unknown documents") {
        REQUIRE_FALSE(repo.load(id + 100).unwrap());

        auto saved = repo.save_pages(id + 100, pages, 0);
        REQUIRE(saved.is_err());
        REQUIRE(saved.unwrap_err().code == SQLITE_NOTFOUND);
        REQUIRE(repo.rename(id + 100, "x").is_err());
    }

    SECTION("List reports page counts") {
        REQUIRE(repo.save_pages(id, pages, 0).is_ok());
        const auto other = repo.create("Endgames").unwrap();

        const auto documents = repo.list().unwrap();
        REQUIRE(documents.size() == 2);
        for (const auto& doc : documents) {
            REQUIRE(doc.page_count == (doc.id == other ? 0 : 3));
        }
    }

    SECTION("Rename and remove") {
        REQUIRE(repo.save_pages(id, pages, 0).is_ok());
        REQUIRE(repo.rename(id, "Renamed").is_ok());
        REQUIRE(repo.load(id).unwrap()->title == "Renamed");

        REQUIRE(repo.remove(id).is_ok());
        REQUIRE_FALSE(repo.load(id).unwrap());

        auto stmt = db.prepare("SELECT COUNT(*) FROM document_pages;").unwrap();
        REQUIRE(stmt.step().unwrap());
        REQUIRE(stmt.column_int(0) == 0);
    }
}
