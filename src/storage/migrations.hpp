#pragma once

#include "core/result.hpp"
#include "storage/database.hpp"

#include <string>
#include <vector>

namespace pagetree::storage {

struct Migration {
    int version;
    std::string name;
    std::string up_sql;
    std::string down_sql;
};

/**
 * Schema history, oldest first. The page store keeps flat page rows only; a
 * document's tree travels inside the comment of its first page.
 */
inline const std::vector<Migration> ALL_MIGRATIONS = {
    {
        .version = 1,
        .name = "documents_and_pages",
        .up_sql = R"SQL(
            CREATE TABLE IF NOT EXISTS documents (
                id INTEGER PRIMARY KEY AUTOINCREMENT,
                title TEXT NOT NULL DEFAULT '',
                current_index INTEGER NOT NULL DEFAULT 0,
                created_at INTEGER NOT NULL,
                updated_at INTEGER NOT NULL
            );

            CREATE TABLE IF NOT EXISTS document_pages (
                document_id INTEGER NOT NULL REFERENCES documents(id) ON DELETE CASCADE,
                position INTEGER NOT NULL,
                field_ref INTEGER,
                field_data TEXT,
                comment_ref INTEGER,
                comment_text TEXT,
                colorize INTEGER NOT NULL DEFAULT 1,
                lock INTEGER NOT NULL DEFAULT 1,
                mirror INTEGER NOT NULL DEFAULT 0,
                rise INTEGER NOT NULL DEFAULT 0,
                quiz INTEGER NOT NULL DEFAULT 0,
                PRIMARY KEY (document_id, position)
            );
        )SQL",
        .down_sql = R"SQL(
            DROP TABLE IF EXISTS document_pages;
            DROP TABLE IF EXISTS documents;
        )SQL"
    },
    {
        .version = 2,
        .name = "documents_by_update",
        .up_sql = R"SQL(
            CREATE INDEX IF NOT EXISTS idx_documents_updated ON documents(updated_at);
        )SQL",
        .down_sql = R"SQL(
            DROP INDEX IF EXISTS idx_documents_updated;
        )SQL"
    }
};

/**
 * MigrationRunner - brings a database to a schema version.
 */
class MigrationRunner {
public:
    explicit MigrationRunner(Database& db) : db_(db) {}

    [[nodiscard]] Result<void, Error> migrate();
    [[nodiscard]] Result<void, Error> migrate_to(int target_version);

    /** Undo migrations newer than `target_version`. */
    [[nodiscard]] Result<void, Error> rollback_to(int target_version);

    [[nodiscard]] Result<int, Error> current_version();

    [[nodiscard]] static int latest_version() {
        return ALL_MIGRATIONS.empty() ? 0 : ALL_MIGRATIONS.back().version;
    }

private:
    Database& db_;

    [[nodiscard]] Result<void, Error> ensure_migrations_table();
    [[nodiscard]] Result<void, Error> run_migration(const Migration& m);
    [[nodiscard]] Result<void, Error> run_rollback(const Migration& m);
};

[[nodiscard]] inline Result<void, Error> initialize_database(Database& db) {
    MigrationRunner runner(db);
    return runner.migrate();
}

} // namespace pagetree::storage
