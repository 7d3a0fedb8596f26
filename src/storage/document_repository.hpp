#pragma once

#include "core/page.hpp"
#include "core/result.hpp"
#include "storage/database.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace pagetree::storage {

using DocumentId = int64_t;

struct StoredDocument {
    DocumentId id{0};
    std::string title;
    PageList pages;
    int current_index{0};
};

struct DocumentSummary {
    DocumentId id{0};
    std::string title;
    int page_count{0};
    int64_t updated_at{0};
};

/**
 * DocumentRepository - flat page lists per document.
 *
 * Pages are stored one row each, in position order. Field and comment keep
 * their value-or-reference shape; a reference is the position it points at.
 */
class DocumentRepository {
public:
    explicit DocumentRepository(Database& db) : db_(db) {}

    [[nodiscard]] Result<DocumentId, Error> create(const std::string& title);

    /** Replace the stored page list and cursor of `id` in one transaction. */
    [[nodiscard]] Result<void, Error> save_pages(DocumentId id, const PageList& pages, int current_index);

    [[nodiscard]] Result<std::optional<StoredDocument>, Error> load(DocumentId id);

    /** Most recently updated first. */
    [[nodiscard]] Result<std::vector<DocumentSummary>, Error> list();

    [[nodiscard]] Result<void, Error> rename(DocumentId id, const std::string& title);
    [[nodiscard]] Result<void, Error> remove(DocumentId id);

private:
    Database& db_;

    [[nodiscard]] Result<void, Error> insert_page(DocumentId id, const Page& page);
    [[nodiscard]] static Page row_to_page(const Statement& stmt);
};

} // namespace pagetree::storage
