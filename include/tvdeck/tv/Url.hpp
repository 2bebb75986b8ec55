#pragma once

#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace tvdeck::tv {

/**
 * @brief Minimal URI split sufficient for deep-link grammars.
 *
 * Hierarchical URIs (`scheme://host/a/b?q#f`) fill host, segments, query.
 * Custom-scheme URIs without an authority (`spotify:search:x`) keep the rest
 * in `opaque`. Scheme and host are lowercased; segments are not decoded.
 */
struct UrlParts {
    std::string scheme;
    std::string host;
    std::vector<std::string> segments;
    std::vector<std::pair<std::string, std::string>> queryParams;
    std::string fragment;
    std::string opaque;
    bool hierarchical = false;

    bool isWeb() const { return scheme == "http" || scheme == "https"; }

    /// Host with a leading "www." removed.
    std::string bareHost() const;

    /// Recompose; query parameters are written back in their original order.
    std::string toString() const;
};

/// nullopt when @p text is not a URI (no scheme, whitespace inside, web URL without host).
std::optional<UrlParts> parseUrl(std::string_view text);

/// Percent-encode everything outside RFC 3986 unreserved characters.
std::string percentEncode(std::string_view text);

/// Decode %XX escapes and '+' as space.
std::string percentDecode(std::string_view text);

/// Drop utm_*, fbclid, gclid, si, trackId, ref and similar share-sheet parameters.
void stripTrackingParameters(UrlParts& url);

bool isUuid(std::string_view text);

std::string toLower(std::string_view text);
std::string_view trimView(std::string_view text);

} // namespace tvdeck::tv
