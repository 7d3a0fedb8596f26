#pragma once

#include "core/page.hpp"
#include "core/result.hpp"

#include <QByteArray>

namespace pagetree::storage {

/**
 * Primitive form of a page list: a JSON array of
 * {"field":{"obj":".."}|{"ref":n}, "comment":{"text":".."}|{"ref":n},
 *  "flags":{"colorize","lock","mirror","rise","quiz"}}.
 * Page indices are positional and not written.
 */
[[nodiscard]] QByteArray pages_to_json(const PageList& pages);

/**
 * Decode pages_to_json() output. Fails on malformed JSON or on a reference
 * that does not point to an earlier page.
 */
[[nodiscard]] Result<PageList, Error> pages_from_json(const QByteArray& bytes);

} // namespace pagetree::storage
