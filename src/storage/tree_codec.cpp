#include "storage/tree_codec.hpp"

#include "core/tree_validation.hpp"

#include <QByteArray>
#include <QJsonArray>
#include <QJsonDocument>
#include <QJsonObject>
#include <QJsonParseError>
#include <QJsonValue>
#include <QString>
#include <QStringList>

#include <cmath>
#include <limits>
#include <set>

namespace pagetree::storage {
namespace {

TreeParseResult failure(TreeParseStatus status, std::string message) {
    TreeParseResult result;
    result.status = status;
    result.errors.push_back(std::move(message));
    return result;
}

std::optional<qint64> integer_value(const QJsonValue& value) {
    if (!value.isDouble()) return std::nullopt;
    const double d = value.toDouble();
    if (!std::isfinite(d) || d != std::floor(d)) return std::nullopt;
    return static_cast<qint64>(d);
}

std::optional<NodeId> node_id_value(const QJsonValue& value) {
    const auto n = integer_value(value);
    if (!n || *n < 0 || *n > kMaxNodeId) return std::nullopt;
    return static_cast<NodeId>(*n);
}

QJsonObject node_to_json(const Node& node) {
    QJsonObject obj;
    obj.insert(QStringLiteral("id"), static_cast<qint64>(node.id));
    obj.insert(QStringLiteral("pageIndex"), node.page_index);
    obj.insert(QStringLiteral("parentId"),
               node.parent_id ? QJsonValue(static_cast<qint64>(*node.parent_id)) : QJsonValue(QJsonValue::Null));
    QJsonArray children;
    for (const auto child : node.children_ids) {
        children.append(static_cast<qint64>(child));
    }
    obj.insert(QStringLiteral("childrenIds"), children);
    return obj;
}

TreeParseResult parse_json_payload(const QByteArray& decoded) {
    QJsonParseError err{};
    const auto doc = QJsonDocument::fromJson(decoded, &err);
    if (err.error != QJsonParseError::NoError || !doc.isObject()) {
        return failure(TreeParseStatus::Malformed, "Tree payload is not a JSON object");
    }

    const auto obj = doc.object();
    const auto version = integer_value(obj.value(QStringLiteral("version")));
    if (!version || *version < 1) {
        return failure(TreeParseStatus::Malformed, "Tree payload has no valid version");
    }
    if (*version > kTreeSchemaVersion) {
        return failure(TreeParseStatus::UnsupportedVersion,
                       "Tree payload version " + std::to_string(*version) + " is newer than " +
                           std::to_string(kTreeSchemaVersion));
    }

    const auto nodes = obj.value(QStringLiteral("nodes"));
    if (!nodes.isArray()) {
        return failure(TreeParseStatus::Malformed, "Tree payload has no node list");
    }

    Tree tree;
    tree.set_version(static_cast<int>(*version));
    for (const auto& entry : nodes.toArray()) {
        if (!entry.isObject()) {
            return failure(TreeParseStatus::Malformed, "Tree node is not an object");
        }
        const auto node_obj = entry.toObject();

        const auto id = node_id_value(node_obj.value(QStringLiteral("id")));
        const auto page_index = integer_value(node_obj.value(QStringLiteral("pageIndex")));
        if (!id || !page_index || *page_index < std::numeric_limits<int>::min() ||
            *page_index > std::numeric_limits<int>::max()) {
            return failure(TreeParseStatus::Malformed, "Tree node has no valid id or page index");
        }
        if (tree.contains(*id)) {
            return failure(TreeParseStatus::Malformed, "Duplicate tree node id " + std::to_string(*id));
        }

        Node node;
        node.id = *id;
        node.page_index = static_cast<int>(*page_index);

        const auto parent = node_obj.value(QStringLiteral("parentId"));
        if (!parent.isNull() && !parent.isUndefined()) {
            node.parent_id = node_id_value(parent);
            if (!node.parent_id) {
                return failure(TreeParseStatus::Malformed, "Tree node " + std::to_string(*id) + " has a bad parent id");
            }
        }

        for (const auto& child : node_obj.value(QStringLiteral("childrenIds")).toArray()) {
            const auto child_id = node_id_value(child);
            if (!child_id) {
                return failure(TreeParseStatus::Malformed, "Tree node " + std::to_string(*id) + " has a bad child id");
            }
            node.children_ids.push_back(*child_id);
        }
        tree.put(std::move(node));
    }

    const auto root = obj.value(QStringLiteral("rootId"));
    if (!root.isNull() && !root.isUndefined()) {
        const auto root_id = node_id_value(root);
        if (!root_id) {
            return failure(TreeParseStatus::Malformed, "Tree payload has a bad root id");
        }
        tree.set_root_id(root_id);
    }

    TreeParseResult result;
    result.status = TreeParseStatus::Parsed;
    result.tree = std::move(tree);
    return result;
}

// "root;page,parent,child,...;..." with nodes addressed by position.
TreeParseResult parse_compact_payload(const QByteArray& decoded) {
    const auto parts = QString::fromLatin1(decoded).split(QLatin1Char(';'));
    if (parts.size() < 2) {
        return failure(TreeParseStatus::Malformed, "Compact tree has no nodes");
    }

    const auto count = static_cast<int>(parts.size()) - 1;
    bool ok = false;
    const int root_index = parts.front().toInt(&ok);
    if (!ok || root_index < 0 || root_index >= count) {
        return failure(TreeParseStatus::Malformed, "Compact tree has a bad root index");
    }

    auto id_at = [](int position) { return static_cast<NodeId>(position + 1); };

    Tree tree;
    for (int i = 0; i < count; ++i) {
        const auto values = parts[i + 1].split(QLatin1Char(','));
        std::vector<int> numbers;
        for (const auto& value : values) {
            const int n = value.toInt(&ok);
            if (!ok) {
                return failure(TreeParseStatus::Malformed, "Compact tree node " + std::to_string(i) + " is not numeric");
            }
            numbers.push_back(n);
        }
        if (numbers.size() < 2) {
            return failure(TreeParseStatus::Malformed, "Compact tree node " + std::to_string(i) + " is truncated");
        }

        Node node;
        node.id = id_at(i);
        node.page_index = numbers[0];
        if (numbers[1] >= count) {
            return failure(TreeParseStatus::Malformed, "Compact tree node " + std::to_string(i) + " has a bad parent");
        }
        if (numbers[1] >= 0) node.parent_id = id_at(numbers[1]);
        for (size_t c = 2; c < numbers.size(); ++c) {
            if (numbers[c] < 0) continue;
            if (numbers[c] >= count) {
                return failure(TreeParseStatus::Malformed, "Compact tree node " + std::to_string(i) + " has a bad child");
            }
            node.children_ids.push_back(id_at(numbers[c]));
        }
        tree.put(std::move(node));
    }
    tree.set_root_id(id_at(root_index));

    TreeParseResult result;
    result.status = TreeParseStatus::Parsed;
    result.tree = std::move(tree);
    return result;
}

bool looks_compact(const QByteArray& decoded) {
    qsizetype i = 0;
    while (i < decoded.size() && decoded[i] >= '0' && decoded[i] <= '9') ++i;
    return i > 0 && i < decoded.size() && decoded[i] == ';';
}

} // namespace

std::string serialize_tree_to_comment(const Tree& tree) {
    const auto root = tree.root_id();
    if (tree.empty() || !root) return {};

    QJsonArray nodes;
    tree.for_each([&](const Node& node) { nodes.append(node_to_json(node)); });

    QJsonObject obj;
    obj.insert(QStringLiteral("version"), tree.version());
    obj.insert(QStringLiteral("rootId"), static_cast<qint64>(*root));
    obj.insert(QStringLiteral("nodes"), nodes);

    const auto payload = QJsonDocument(obj).toJson(QJsonDocument::Compact).toBase64();
    return std::string(kTreeMarker) + payload.toStdString();
}

TreeParseResult parse_tree_from_comment(std::string_view comment) {
    const auto marker = comment.find(kTreeMarker);
    if (marker == std::string_view::npos) return {};

    const auto start = marker + kTreeMarker.size();
    const auto end = comment.find('\n', start);
    auto encoded = comment.substr(start, end == std::string_view::npos ? std::string_view::npos : end - start);
    while (!encoded.empty() && (encoded.back() == '\r' || encoded.back() == ' ')) {
        encoded.remove_suffix(1);
    }

    const auto decoded = QByteArray::fromBase64Encoding(
        QByteArray(encoded.data(), static_cast<qsizetype>(encoded.size())),
        QByteArray::AbortOnBase64DecodingErrors);
    if (!decoded || decoded.decoded.isEmpty()) {
        return failure(TreeParseStatus::Malformed, "Tree marker payload is not valid base64");
    }

    TreeParseResult result;
    if (decoded.decoded.startsWith('{')) {
        result = parse_json_payload(decoded.decoded);
    } else if (looks_compact(decoded.decoded)) {
        result = parse_compact_payload(decoded.decoded);
    } else {
        return failure(TreeParseStatus::Malformed, "Tree marker payload has an unknown format");
    }
    if (result.status != TreeParseStatus::Parsed) return result;

    // Older saves may carry several top-level nodes.
    result.tree = ensure_virtual_root(*result.tree);
    auto validation = validate_tree(*result.tree);
    if (!validation.valid) {
        result.status = TreeParseStatus::InvalidTree;
        result.tree.reset();
        result.errors = std::move(validation.errors);
    }
    return result;
}

std::string remove_tree_from_comment(std::string comment) {
    const auto marker = comment.find(kTreeMarker);
    if (marker == std::string::npos) return comment;

    const auto end = comment.find('\n', marker + kTreeMarker.size());
    if (end != std::string::npos) {
        comment.erase(marker, end - marker + 1);
        return comment;
    }

    auto from = marker;
    if (from > 0 && comment[from - 1] == '\n') --from;
    comment.erase(from);
    return comment;
}

std::string append_tree_to_comment(const std::string& comment, const Tree& tree) {
    auto clean = remove_tree_from_comment(comment);
    const auto data = serialize_tree_to_comment(tree);
    if (data.empty()) return clean;
    if (clean.empty()) return data;
    return clean + "\n" + data;
}

PageList embed_tree_in_pages(const PageList& pages, const Tree* tree, bool enabled) {
    if (!enabled || !tree || tree->empty() || pages.empty()) return pages;

    PageList out = pages;
    out.front().comment = append_tree_to_comment(resolve_comment(pages, 0), *tree);
    return out;
}

TreeExtraction extract_tree_from_pages(const PageList& pages) {
    TreeExtraction extraction;
    extraction.cleaned_pages = pages;
    if (pages.empty()) return extraction;

    const auto comment = resolve_comment(pages, 0);
    auto parsed = parse_tree_from_comment(comment);
    extraction.status = parsed.status;
    extraction.errors = std::move(parsed.errors);
    if (parsed.status != TreeParseStatus::Parsed) return extraction;

    extraction.tree = std::move(parsed.tree);
    extraction.cleaned_pages.front().comment = remove_tree_from_comment(comment);
    return extraction;
}

const char* to_string(TreeParseStatus status) {
    switch (status) {
        case TreeParseStatus::NoMarker:
            return "no marker";
        case TreeParseStatus::Parsed:
            return "parsed";
        case TreeParseStatus::Malformed:
            return "malformed";
        case TreeParseStatus::UnsupportedVersion:
            return "unsupported version";
        case TreeParseStatus::InvalidTree:
            return "invalid tree";
    }
    return "unknown";
}

} // namespace pagetree::storage
