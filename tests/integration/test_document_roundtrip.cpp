#include <catch2/catch_test_macros.hpp>
#include "core/linearizer.hpp"
#include "core/tree_mutations.hpp"
#include "storage/database.hpp"
#include "storage/document_repository.hpp"
#include "storage/migrations.hpp"
#include "storage/tree_codec.hpp"

#include <QJsonDocument>
#include <QJsonObject>
#include <QTemporaryDir>

using namespace pagetree;
using namespace pagetree::storage;

namespace {

struct BranchedDocument {
    Tree tree;
    PageList pages;
};

// Root page 0 with a linear main line 1, 2 plus a branch (page 3) and an
// inserted variation (page 4) that lands in front of the main line.
BranchedDocument branched_document() {
    PageList pages{
        make_page(0, BoardField{"v115@start"}, "start"),
        make_page(1, BoardField{"v115@b"}),
        make_page(2, BoardField{"v115@c"}, "main line"),
    };
    auto tree = create_tree_from_pages(pages);

    auto branch = add_branch_node(tree, 1, 3);
    pages.push_back(make_child_page(pages, 0, 3));
    auto inserted = insert_node(branch.tree, 1, 4);
    pages.push_back(make_child_page(pages, 0, 4));

    return {inserted.tree, pages};
}

} // namespace

TEST_CASE("Document round-trip: tree survives the page store", "[integration][storage]") {
    QTemporaryDir tmp;
    REQUIRE(tmp.isValid());
    const auto path = tmp.filePath(QStringLiteral("documents.db")).toStdString();

    const auto document = branched_document();
    const auto normalized = normalize_tree_and_pages(document.tree, document.pages);
    REQUIRE(normalized.changed);
    REQUIRE(flatten_tree_to_page_indices(normalized.tree) == std::vector<int>{0, 1, 2, 3, 4});

    DocumentId id = 0;
    {
        auto db = Database::open(path).unwrap();
        REQUIRE(initialize_database(db).is_ok());
        DocumentRepository repo(db);
        id = repo.create("Variations").unwrap();

        const auto stored = embed_tree_in_pages(normalized.pages, &normalized.tree, true);
        REQUIRE(repo.save_pages(id, stored, 3).is_ok());
    }

    auto db = Database::open(path).unwrap();
    REQUIRE(initialize_database(db).is_ok());
    DocumentRepository repo(db);

    auto loaded = repo.load(id).unwrap();
    REQUIRE(loaded);
    REQUIRE(loaded->current_index == 3);

    const auto extracted = extract_tree_from_pages(loaded->pages);
    REQUIRE(extracted.status == TreeParseStatus::Parsed);
    REQUIRE(*extracted.tree == normalized.tree);
    REQUIRE(extracted.cleaned_pages == normalized.pages);
    REQUIRE(resolve_comment(extracted.cleaned_pages, 0) == "start");
}

TEST_CASE("Document round-trip: untreed documents load as plain pages", "[integration][storage]") {
    auto db = Database::open_memory().unwrap();
    REQUIRE(initialize_database(db).is_ok());
    DocumentRepository repo(db);

    const auto document = branched_document();
    const auto id = repo.create("Plain").unwrap();
    REQUIRE(repo.save_pages(id, embed_tree_in_pages(document.pages, &document.tree, false), 0).is_ok());

    const auto extracted = extract_tree_from_pages(repo.load(id).unwrap()->pages);

    REQUIRE(extracted.status == TreeParseStatus::NoMarker);
    REQUIRE_FALSE(extracted.tree);
    REQUIRE(extracted.cleaned_pages == document.pages);
}

TEST_CASE("Document round-trip: markers from newer versions are kept", "[integration][storage]") {
    auto db = Database::open_memory().unwrap();
    REQUIRE(initialize_database(db).is_ok());
    DocumentRepository repo(db);

    QJsonObject payload;
    payload.insert(QStringLiteral("version"), kTreeSchemaVersion + 1);
    const auto marker = std::string(kTreeMarker) +
                        QJsonDocument(payload).toJson(QJsonDocument::Compact).toBase64().toStdString();
    const PageList pages{make_page(0, BoardField{"v115@x"}, "notes\n" + marker)};

    const auto id = repo.create("Future").unwrap();
    REQUIRE(repo.save_pages(id, pages, 0).is_ok());

    const auto extracted = extract_tree_from_pages(repo.load(id).unwrap()->pages);

    REQUIRE(extracted.status == TreeParseStatus::UnsupportedVersion);
    REQUIRE(extracted.cleaned_pages == pages);
}
