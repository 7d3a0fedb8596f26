#include "storage/document_repository.hpp"

#include <chrono>

namespace pagetree::storage {
namespace {

int64_t now_ms() {
    return std::chrono::duration_cast<std::chrono::milliseconds>(
               std::chrono::system_clock::now().time_since_epoch())
        .count();
}

Result<void, Error> not_found(DocumentId id) {
    return Result<void, Error>::err(Error{"Document " + std::to_string(id) + " not found", SQLITE_NOTFOUND});
}

} // namespace

Page DocumentRepository::row_to_page(const Statement& stmt) {
    Page page;
    page.index = stmt.column_int(0);
    if (!stmt.column_is_null(1)) {
        page.field = PageRef{stmt.column_int(1)};
    } else {
        page.field = BoardField{stmt.column_text(2)};
    }
    if (!stmt.column_is_null(3)) {
        page.comment = PageRef{stmt.column_int(3)};
    } else {
        page.comment = stmt.column_text(4);
    }
    page.flags = PageFlags{
        .colorize = stmt.column_int(5) != 0,
        .lock = stmt.column_int(6) != 0,
        .mirror = stmt.column_int(7) != 0,
        .rise = stmt.column_int(8) != 0,
        .quiz = stmt.column_int(9) != 0,
    };
    return page;
}

Result<DocumentId, Error> DocumentRepository::create(const std::string& title) {
    auto stmt_result = db_.prepare(
        "INSERT INTO documents (title, current_index, created_at, updated_at) VALUES (?, 0, ?, ?);");
    if (stmt_result.is_err()) {
        return Result<DocumentId, Error>::err(stmt_result.unwrap_err());
    }

    auto stmt = std::move(stmt_result).unwrap();
    const auto now = now_ms();
    auto bound = all_bound({stmt.bind_text(1, title), stmt.bind_int64(2, now), stmt.bind_int64(3, now)});
    if (bound.is_err()) {
        return Result<DocumentId, Error>::err(bound.unwrap_err());
    }

    auto step_result = stmt.step();
    if (step_result.is_err()) {
        return Result<DocumentId, Error>::err(step_result.unwrap_err());
    }
    return Result<DocumentId, Error>::ok(db_.last_insert_rowid());
}

Result<void, Error> DocumentRepository::insert_page(DocumentId id, const Page& page) {
    auto stmt_result = db_.prepare(R"SQL(
        INSERT INTO document_pages (document_id, position, field_ref, field_data,
                                    comment_ref, comment_text,
                                    colorize, lock, mirror, rise, quiz)
        VALUES (?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?);
    )SQL");
    if (stmt_result.is_err()) {
        return Result<void, Error>::err(stmt_result.unwrap_err());
    }

    auto stmt = std::move(stmt_result).unwrap();
    const auto* field_ref = std::get_if<PageRef>(&page.field);
    const auto* field = std::get_if<BoardField>(&page.field);
    const auto* comment_ref = std::get_if<PageRef>(&page.comment);
    const auto* comment = std::get_if<std::string>(&page.comment);

    auto bound = all_bound({
        stmt.bind_int64(1, id),
        stmt.bind_int(2, page.index),
        field_ref ? stmt.bind_int(3, field_ref->index) : stmt.bind_null(3),
        field ? stmt.bind_text(4, field->encoded()) : stmt.bind_null(4),
        comment_ref ? stmt.bind_int(5, comment_ref->index) : stmt.bind_null(5),
        comment ? stmt.bind_text(6, *comment) : stmt.bind_null(6),
        stmt.bind_int(7, page.flags.colorize ? 1 : 0),
        stmt.bind_int(8, page.flags.lock ? 1 : 0),
        stmt.bind_int(9, page.flags.mirror ? 1 : 0),
        stmt.bind_int(10, page.flags.rise ? 1 : 0),
        stmt.bind_int(11, page.flags.quiz ? 1 : 0),
    });
    if (bound.is_err()) return bound;

    auto step_result = stmt.step();
    if (step_result.is_err()) {
        return Result<void, Error>::err(step_result.unwrap_err());
    }
    return Result<void, Error>::ok();
}

Result<void, Error> DocumentRepository::save_pages(DocumentId id, const PageList& pages, int current_index) {
    return db_.transaction([&]() -> Result<void, Error> {
        auto update = db_.prepare("UPDATE documents SET current_index = ?, updated_at = ? WHERE id = ?;");
        if (update.is_err()) {
            return Result<void, Error>::err(update.unwrap_err());
        }
        auto stmt = std::move(update).unwrap();
        auto bound = all_bound({stmt.bind_int(1, current_index), stmt.bind_int64(2, now_ms()), stmt.bind_int64(3, id)});
        if (bound.is_err()) return bound;
        auto step_result = stmt.step();
        if (step_result.is_err()) {
            return Result<void, Error>::err(step_result.unwrap_err());
        }
        if (db_.changes() == 0) return not_found(id);

        auto cleared = db_.prepare("DELETE FROM document_pages WHERE document_id = ?;");
        if (cleared.is_err()) {
            return Result<void, Error>::err(cleared.unwrap_err());
        }
        auto clear_stmt = std::move(cleared).unwrap();
        auto clear_bound = clear_stmt.bind_int64(1, id);
        if (clear_bound.is_err()) return clear_bound;
        auto clear_step = clear_stmt.step();
        if (clear_step.is_err()) {
            return Result<void, Error>::err(clear_step.unwrap_err());
        }

        for (size_t i = 0; i < pages.size(); ++i) {
            Page row = pages[i];
            row.index = static_cast<int>(i);
            auto inserted = insert_page(id, row);
            if (inserted.is_err()) return inserted;
        }
        return Result<void, Error>::ok();
    });
}

Result<std::optional<StoredDocument>, Error> DocumentRepository::load(DocumentId id) {
    using LoadResult = Result<std::optional<StoredDocument>, Error>;

    auto header = db_.prepare("SELECT title, current_index FROM documents WHERE id = ?;");
    if (header.is_err()) {
        return LoadResult::err(header.unwrap_err());
    }
    auto header_stmt = std::move(header).unwrap();
    auto bound = header_stmt.bind_int64(1, id);
    if (bound.is_err()) {
        return LoadResult::err(bound.unwrap_err());
    }
    auto header_row = header_stmt.step();
    if (header_row.is_err()) {
        return LoadResult::err(header_row.unwrap_err());
    }
    if (!header_row.unwrap()) {
        return LoadResult::ok(std::nullopt);
    }

    StoredDocument doc;
    doc.id = id;
    doc.title = header_stmt.column_text(0);
    doc.current_index = header_stmt.column_int(1);

    auto rows = db_.prepare(R"SQL(
        SELECT position, field_ref, field_data, comment_ref, comment_text,
               colorize, lock, mirror, rise, quiz
        FROM document_pages WHERE document_id = ? ORDER BY position;
    )SQL");
    if (rows.is_err()) {
        return LoadResult::err(rows.unwrap_err());
    }
    auto stmt = std::move(rows).unwrap();
    auto rows_bound = stmt.bind_int64(1, id);
    if (rows_bound.is_err()) {
        return LoadResult::err(rows_bound.unwrap_err());
    }

    while (true) {
        auto step_result = stmt.step();
        if (step_result.is_err()) {
            return LoadResult::err(step_result.unwrap_err());
        }
        if (!step_result.unwrap()) break;
        doc.pages.push_back(row_to_page(stmt));
    }

    return LoadResult::ok(std::move(doc));
}

Result<std::vector<DocumentSummary>, Error> DocumentRepository::list() {
    using ListResult = Result<std::vector<DocumentSummary>, Error>;
    std::vector<DocumentSummary> documents;

    auto query = db_.query(R"SQL(
        SELECT d.id, d.title, COUNT(p.position), d.updated_at
        FROM documents d LEFT JOIN document_pages p ON p.document_id = d.id
        GROUP BY d.id ORDER BY d.updated_at DESC, d.id DESC;
    )SQL",
                           [&](const Statement& stmt) {
                               documents.push_back(DocumentSummary{
                                   .id = stmt.column_int64(0),
                                   .title = stmt.column_text(1),
                                   .page_count = stmt.column_int(2),
                                   .updated_at = stmt.column_int64(3),
                               });
                           });
    if (query.is_err()) {
        return ListResult::err(query.unwrap_err());
    }
    return ListResult::ok(std::move(documents));
}

Result<void, Error> DocumentRepository::rename(DocumentId id, const std::string& title) {
    auto stmt_result = db_.prepare("UPDATE documents SET title = ?, updated_at = ? WHERE id = ?;");
    if (stmt_result.is_err()) {
        return Result<void, Error>::err(stmt_result.unwrap_err());
    }
    auto stmt = std::move(stmt_result).unwrap();
    auto bound = all_bound({stmt.bind_text(1, title), stmt.bind_int64(2, now_ms()), stmt.bind_int64(3, id)});
    if (bound.is_err()) return bound;

    auto step_result = stmt.step();
    if (step_result.is_err()) {
        return Result<void, Error>::err(step_result.unwrap_err());
    }
    if (db_.changes() == 0) return not_found(id);
    return Result<void, Error>::ok();
}

Result<void, Error> DocumentRepository::remove(DocumentId id) {
    auto stmt_result = db_.prepare("DELETE FROM documents WHERE id = ?;");
    if (stmt_result.is_err()) {
        return Result<void, Error>::err(stmt_result.unwrap_err());
    }
    auto stmt = std::move(stmt_result).unwrap();
    auto bound = stmt.bind_int64(1, id);
    if (bound.is_err()) return bound;

    auto step_result = stmt.step();
    if (step_result.is_err()) {
        return Result<void, Error>::err(step_result.unwrap_err());
    }
    return Result<void, Error>::ok();
}

} // namespace pagetree::storage
