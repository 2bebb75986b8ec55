#pragma once

#include "tvdeck/tv/Url.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace tvdeck::tv {

/**
 * @brief How an app turns (query or URL) into a launch URI.
 *
 * - DirectPassthrough: content URLs are handed to the app verbatim.
 * - QueryTemplate: free-text queries are substituted into a URI template.
 * - SharedLinkTemplate: share-sheet URLs are reduced to a content id and
 *   rebuilt in the one form the app's intent filter accepts.
 * - LaunchOnly: no grammar; the app is opened on its launcher activity.
 */
enum class LinkStrategy : std::uint8_t {
    DirectPassthrough,
    QueryTemplate,
    SharedLinkTemplate,
    LaunchOnly
};

const char* toString(LinkStrategy strategy);

struct AppPackage {
    std::string id;
    std::string activity;   ///< Non-empty forces an explicit `-n id/activity` launch.
};

/// Reduces a shared link to its canonical deep link; nullopt when the path is not recognised.
using LinkCanonicalizer = std::optional<std::string> (*)(const UrlParts& url);

struct AppProfile {
    std::string id;
    std::string displayName;
    std::vector<std::string> aliases;       ///< Already in normalizeName() form.
    std::vector<AppPackage> packages;       ///< Preferred first.
    std::vector<std::string> packageHints;  ///< Substrings that identify a sideloaded variant.
    std::vector<std::string> hosts;         ///< Bare hosts (no "www.").
    std::vector<std::string> schemes;       ///< Custom URI schemes owned by the app.
    LinkStrategy strategy = LinkStrategy::LaunchOnly;
    std::string searchTemplate;             ///< "{query}" is replaced with the encoded query.
    LinkCanonicalizer canonicalize = nullptr;
    std::optional<std::string> icon;
    std::optional<std::string> color;
    bool wakeFirst = false;
    bool clearTask = false;
    bool selectAfterDeepLink = false;
    bool selectAfterSearch = false;
    bool inAppSearch = false;

    bool ownsUrl(const UrlParts& url) const;
    bool hasPackage(std::string_view packageId) const;

    /**
     * @brief Package to launch on a device.
     *
     * With an inventory, the first candidate that is installed wins, then any
     * installed package matching a hint. Without one, the first candidate.
     */
    AppPackage preferredPackage(const std::vector<std::string>* installed) const;
};

/**
 * @brief Static table of streaming apps the resolver and inventory know about.
 *
 * Adding an app is a table entry in AppCatalog.cpp plus, for shared-link
 * apps, one canonicalizer.
 */
class AppCatalog {
public:
    explicit AppCatalog(std::vector<AppProfile> profiles);

    /// Built-in catalog, constructed once.
    static const AppCatalog& builtin();

    /// Match canonical id, alias, display name or any candidate package id.
    const AppProfile* findByName(std::string_view nameOrPackage) const;
    const AppProfile* findByUrl(const UrlParts& url) const;
    const AppProfile* findByPackage(std::string_view packageId) const;

    const std::vector<AppProfile>& profiles() const { return profiles_; }

    /// Lowercase, '+' spelled "plus", everything but letters and digits dropped.
    static std::string normalizeName(std::string_view name);

    /// Package substrings that mark an uncatalogued package as a streaming app.
    static const std::vector<std::string>& streamingKeywords();

private:
    std::vector<AppProfile> profiles_;
};

} // namespace tvdeck::tv
