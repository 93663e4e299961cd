#pragma once
#ifndef GUTEX_MIRROR_LIST_H
#define GUTEX_MIRROR_LIST_H

#include "mirror/mirror.h"

#include <string>
#include <vector>

namespace gutex {

/**
 * @brief Parse a MIRRORS.ALL table.
 *
 * The table is pipe separated: `continent | nation | location | provider |
 * url | note`. Header, separator, footer and malformed rows are skipped and
 * only http(s) mirrors are kept. HTTPS mirrors come first, then mirrors
 * whose note advertises "high speed"; otherwise file order is kept.
 */
std::vector<Mirror> parseMirrorList(const std::string &content);

/**
 * @brief Build the URL of @p resourceId on a mirror.
 * @param pathTemplate Path with `{id}` placeholders, e.g.
 *        `/cache/epub/{id}/pg{id}.txt`.
 */
std::string buildResourceUrl(const std::string &baseUrl,
                             const std::string &pathTemplate,
                             const std::string &resourceId);

} // namespace gutex

#endif // GUTEX_MIRROR_LIST_H
