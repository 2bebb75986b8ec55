#pragma once

#include "tvdeck/core/Expected.hpp"
#include "tvdeck/tv/AppCatalog.hpp"

#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace tvdeck::tv {

/**
 * @brief Resolved launch target for one play request.
 *
 * `fallbackReason` is non-empty when content was requested but the app can
 * only be opened on its home screen; callers surface it instead of
 * pretending the content was found.
 */
struct LaunchIntent {
    std::string appId;              ///< Catalog id; empty for a generic launch.
    std::string appName;
    std::string package;            ///< Empty only for a package-less VIEW of an unknown URL.
    std::string component;          ///< "package/activity" when an explicit launch is needed.
    std::optional<std::string> uri;
    std::string query;              ///< Normalized query or URL that produced this intent.
    LinkStrategy strategy = LinkStrategy::LaunchOnly;
    bool inAppSearch = false;       ///< Open, then SEARCH, type query, ENTER.
    bool wakeFirst = false;
    bool clearTask = false;
    bool selectAfterLaunch = false;
    std::string fallbackReason;

    bool deepLinked() const { return uri.has_value(); }
    bool isGeneric() const { return !fallbackReason.empty(); }

    /// Same app, package, component and URI; flags and query text are not compared.
    bool sameTarget(const LaunchIntent& other) const;

    std::string describe() const;
};

/**
 * @brief Maps (app name or alias, query or URL) to a LaunchIntent.
 *
 * Pure: the result depends only on the arguments and the catalog. A URL that
 * is already in its app's canonical form resolves to itself, so feeding an
 * intent's URI back in yields the same target.
 */
class AppResolver {
public:
    explicit AppResolver(const AppCatalog& catalog = AppCatalog::builtin());

    expected<LaunchIntent> resolve(std::string_view app, std::string_view queryOrUrl) const;

    /// Same, preferring packages present in @p installed (a device inventory).
    expected<LaunchIntent> resolve(std::string_view app, std::string_view queryOrUrl,
                                   const std::vector<std::string>& installed) const;

    /// Best-effort search text recovered from an unrecognised content URL.
    static std::string queryFromUrl(const UrlParts& url);

    const AppCatalog& catalog() const { return catalog_; }

private:
    expected<LaunchIntent> resolveImpl(std::string_view app, std::string_view input,
                                       const std::vector<std::string>* installed) const;

    LaunchIntent forProfile(const AppProfile& profile, std::string_view input,
                            const std::optional<UrlParts>& url,
                            const std::vector<std::string>* installed,
                            std::string_view requestedPackage) const;

    const AppCatalog& catalog_;
};

} // namespace tvdeck::tv
