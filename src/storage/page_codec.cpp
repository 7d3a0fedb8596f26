#include "storage/page_codec.hpp"

#include <QJsonArray>
#include <QJsonDocument>
#include <QJsonObject>
#include <QJsonParseError>
#include <QString>

#include <limits>

namespace pagetree::storage {
namespace {

Result<PageList, Error> malformed(int position, const char* what) {
    return Result<PageList, Error>::err(
        Error{"Page " + std::to_string(position) + ": " + what, ErrorCode::Malformed});
}

QJsonObject ref_object(const PageRef& ref) {
    QJsonObject obj;
    obj.insert(QStringLiteral("ref"), ref.index);
    return obj;
}

// Returns -1 when `obj` holds no usable reference.
int read_ref(const QJsonObject& obj) {
    const auto value = obj.value(QStringLiteral("ref"));
    if (!value.isDouble()) return -1;
    const double d = value.toDouble();
    if (d < 0 || d > std::numeric_limits<int>::max()) return -1;
    const int n = static_cast<int>(d);
    return static_cast<double>(n) == d ? n : -1;
}

} // namespace

QByteArray pages_to_json(const PageList& pages) {
    QJsonArray array;
    for (const auto& page : pages) {
        QJsonObject field;
        if (const auto* ref = std::get_if<PageRef>(&page.field)) {
            field = ref_object(*ref);
        } else {
            field.insert(QStringLiteral("obj"),
                         QString::fromStdString(std::get<BoardField>(page.field).encoded()));
        }

        QJsonObject comment;
        if (const auto* ref = std::get_if<PageRef>(&page.comment)) {
            comment = ref_object(*ref);
        } else {
            comment.insert(QStringLiteral("text"), QString::fromStdString(std::get<std::string>(page.comment)));
        }

        QJsonObject flags;
        flags.insert(QStringLiteral("colorize"), page.flags.colorize);
        flags.insert(QStringLiteral("lock"), page.flags.lock);
        flags.insert(QStringLiteral("mirror"), page.flags.mirror);
        flags.insert(QStringLiteral("rise"), page.flags.rise);
        flags.insert(QStringLiteral("quiz"), page.flags.quiz);

        QJsonObject obj;
        obj.insert(QStringLiteral("field"), field);
        obj.insert(QStringLiteral("comment"), comment);
        obj.insert(QStringLiteral("flags"), flags);
        array.append(obj);
    }
    return QJsonDocument(array).toJson(QJsonDocument::Compact);
}

Result<PageList, Error> pages_from_json(const QByteArray& bytes) {
    QJsonParseError err{};
    const auto doc = QJsonDocument::fromJson(bytes, &err);
    if (err.error != QJsonParseError::NoError || !doc.isArray()) {
        return Result<PageList, Error>::err(
            Error{"Page snapshot is not a JSON array: " + err.errorString().toStdString(), ErrorCode::Malformed});
    }

    PageList pages;
    const auto array = doc.array();
    pages.reserve(static_cast<size_t>(array.size()));
    for (int i = 0; i < array.size(); ++i) {
        if (!array.at(i).isObject()) return malformed(i, "not an object");
        const auto obj = array.at(i).toObject();

        Page page;
        page.index = i;

        const auto field = obj.value(QStringLiteral("field")).toObject();
        if (field.contains(QStringLiteral("ref"))) {
            const int ref = read_ref(field);
            if (ref < 0 || ref >= i) return malformed(i, "field reference does not point backward");
            page.field = PageRef{ref};
        } else if (field.value(QStringLiteral("obj")).isString()) {
            page.field = BoardField{field.value(QStringLiteral("obj")).toString().toStdString()};
        } else {
            return malformed(i, "missing field");
        }

        const auto comment = obj.value(QStringLiteral("comment")).toObject();
        if (comment.contains(QStringLiteral("ref"))) {
            const int ref = read_ref(comment);
            if (ref < 0 || ref >= i) return malformed(i, "comment reference does not point backward");
            page.comment = PageRef{ref};
        } else {
            page.comment = comment.value(QStringLiteral("text")).toString().toStdString();
        }

        const auto flags = obj.value(QStringLiteral("flags")).toObject();
        page.flags = PageFlags{
            .colorize = flags.value(QStringLiteral("colorize")).toBool(true),
            .lock = flags.value(QStringLiteral("lock")).toBool(true),
            .mirror = flags.value(QStringLiteral("mirror")).toBool(false),
            .rise = flags.value(QStringLiteral("rise")).toBool(false),
            .quiz = flags.value(QStringLiteral("quiz")).toBool(false),
        };
        pages.push_back(std::move(page));
    }
    return Result<PageList, Error>::ok(std::move(pages));
}

} // namespace pagetree::storage
