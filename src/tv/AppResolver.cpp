#include "tvdeck/tv/AppResolver.hpp"

#include "tvdeck/log/Log.hpp"

#include <algorithm>
#include <cctype>
#include <sstream>

namespace tvdeck::tv {

namespace {

bool looksLikePackageId(std::string_view text) {
    if (text.find('.') == std::string_view::npos) return false;
    if (text.front() == '.' || text.back() == '.') return false;
    return std::all_of(text.begin(), text.end(), [](unsigned char c) {
        return std::isalnum(c) || c == '.' || c == '_';
    });
}

// Accept "www.netflix.com/title/123" typed without a scheme.
std::optional<UrlParts> parseContentUrl(std::string_view input) {
    if (auto url = parseUrl(input)) {
        return url;
    }
    const auto slash = input.find('/');
    if (slash == std::string_view::npos || slash == 0) return std::nullopt;
    const auto host = input.substr(0, slash);
    if (host.find('.') == std::string_view::npos) return std::nullopt;
    return parseUrl("https://" + std::string(input));
}

bool isIdentifierSegment(std::string_view segment) {
    if (isUuid(segment)) return true;
    if (segment.rfind("urn:", 0) == 0 || segment.rfind("umc.", 0) == 0) return true;
    return std::all_of(segment.begin(), segment.end(),
                       [](unsigned char c) { return std::isdigit(c); });
}

std::string expandTemplate(const std::string& pattern, std::string_view query) {
    static constexpr std::string_view PLACEHOLDER = "{query}";
    std::string out = pattern;
    const auto pos = out.find(PLACEHOLDER);
    if (pos != std::string::npos) {
        out.replace(pos, PLACEHOLDER.size(), percentEncode(query));
    }
    return out;
}

} // namespace

bool LaunchIntent::sameTarget(const LaunchIntent& other) const {
    return appId == other.appId
        && package == other.package
        && component == other.component
        && uri == other.uri;
}

std::string LaunchIntent::describe() const {
    std::ostringstream out;
    out << (appName.empty() ? std::string("generic") : appName)
        << " [" << toString(strategy) << "]";
    if (!package.empty()) out << " package=" << package;
    if (!component.empty()) out << " component=" << component;
    if (uri) out << " uri=" << *uri;
    if (inAppSearch) out << " search=\"" << query << "\"";
    if (!fallbackReason.empty()) out << " fallback: " << fallbackReason;
    return out.str();
}

AppResolver::AppResolver(const AppCatalog& catalog)
: catalog_(catalog) {}

expected<LaunchIntent> AppResolver::resolve(std::string_view app,
                                            std::string_view queryOrUrl) const {
    return resolveImpl(app, queryOrUrl, nullptr);
}

expected<LaunchIntent> AppResolver::resolve(std::string_view app,
                                            std::string_view queryOrUrl,
                                            const std::vector<std::string>& installed) const {
    return resolveImpl(app, queryOrUrl, &installed);
}

expected<LaunchIntent> AppResolver::resolveImpl(std::string_view app,
                                                std::string_view input,
                                                const std::vector<std::string>* installed) const {
    const auto appName = trimView(app);
    input = trimView(input);

    auto url = parseContentUrl(input);
    // "Mission:Impossible" is a title; only schemes an app owns are opaque URIs.
    if (url && !url->hierarchical && catalog_.findByUrl(*url) == nullptr) {
        url.reset();
    }
    const AppProfile* urlOwner = url ? catalog_.findByUrl(*url) : nullptr;

    if (appName.empty()) {
        if (urlOwner != nullptr) {
            return forProfile(*urlOwner, input, url, installed, {});
        }
        if (!url) {
            return fail(core::ErrorKind::Resolution,
                        input.empty() ? "nothing to launch: no app and no URL"
                                      : "no app given and '" + std::string(input) + "' is not a URL");
        }
        LaunchIntent intent;
        intent.uri = std::string(input);
        intent.query = std::string(input);
        intent.strategy = LinkStrategy::DirectPassthrough;
        return intent;
    }

    const AppProfile* profile = catalog_.findByName(appName);
    if (profile != nullptr && urlOwner != nullptr && urlOwner != profile) {
        logWarning("[AppResolver] URL belongs to ", urlOwner->displayName,
                   ", not ", profile->displayName, "; launching ", urlOwner->displayName, "\n");
        profile = urlOwner;
    }
    if (profile == nullptr) {
        profile = urlOwner;
    }
    if (profile != nullptr) {
        const std::string_view requested = profile->hasPackage(appName) ? appName : std::string_view{};
        return forProfile(*profile, input, url, installed, requested);
    }

    // Unrecognised app: open it without deep content when a package can be named.
    std::string package;
    if (looksLikePackageId(appName)) {
        package = std::string(appName);
    } else if (installed != nullptr) {
        const auto key = AppCatalog::normalizeName(appName);
        for (const auto& pkg : *installed) {
            if (!key.empty() && AppCatalog::normalizeName(pkg).find(key) != std::string::npos) {
                package = pkg;
                break;
            }
        }
    }
    if (package.empty()) {
        return fail(core::ErrorKind::Resolution,
                    "unknown app '" + std::string(appName) + "' and no installed package matches");
    }

    LaunchIntent intent;
    intent.appName = std::string(appName);
    intent.package = std::move(package);
    intent.query = std::string(input);
    if (!input.empty()) {
        intent.fallbackReason = "no deep-link support for unrecognised app";
    }
    return intent;
}

LaunchIntent AppResolver::forProfile(const AppProfile& profile,
                                     std::string_view input,
                                     const std::optional<UrlParts>& url,
                                     const std::vector<std::string>* installed,
                                     std::string_view requestedPackage) const {
    LaunchIntent intent;
    intent.appId = profile.id;
    intent.appName = profile.displayName;
    intent.strategy = profile.strategy;
    intent.wakeFirst = profile.wakeFirst;
    intent.clearTask = profile.clearTask;

    AppPackage pkg = profile.preferredPackage(installed);
    if (!requestedPackage.empty()) {
        for (const auto& candidate : profile.packages) {
            if (candidate.id == requestedPackage) pkg = candidate;
        }
    }
    intent.package = pkg.id;
    if (!pkg.activity.empty()) {
        intent.component = pkg.id + "/" + pkg.activity;
    }

    if (input.empty()) {
        return intent;
    }

    std::string searchText;
    if (url && profile.ownsUrl(*url)) {
        switch (profile.strategy) {
            case LinkStrategy::DirectPassthrough:
                intent.uri = std::string(input);
                intent.query = std::string(input);
                intent.selectAfterLaunch = profile.selectAfterDeepLink;
                return intent;
            case LinkStrategy::QueryTemplate: {
                UrlParts cleaned = *url;
                stripTrackingParameters(cleaned);
                intent.uri = cleaned.toString();
                intent.query = *intent.uri;
                intent.selectAfterLaunch = profile.selectAfterDeepLink;
                return intent;
            }
            case LinkStrategy::SharedLinkTemplate:
                if (profile.canonicalize != nullptr) {
                    if (auto canonical = profile.canonicalize(*url)) {
                        intent.uri = *canonical;
                        intent.query = *canonical;
                        intent.selectAfterLaunch = profile.selectAfterDeepLink;
                        return intent;
                    }
                }
                searchText = queryFromUrl(*url);
                logWarning("[AppResolver] unrecognised ", profile.displayName,
                           " link, searching for \"", searchText, "\" instead\n");
                break;
            case LinkStrategy::LaunchOnly:
                intent.query = std::string(input);
                intent.fallbackReason = profile.displayName + " has no deep-link support";
                return intent;
        }
    } else if (url) {
        searchText = queryFromUrl(*url);
        logWarning("[AppResolver] URL is not a ", profile.displayName,
                   " link, searching for \"", searchText, "\" instead\n");
    } else {
        searchText = std::string(input);
    }

    intent.query = searchText;
    if (!profile.searchTemplate.empty()) {
        intent.uri = expandTemplate(profile.searchTemplate, searchText);
        intent.selectAfterLaunch = profile.selectAfterSearch;
    } else if (profile.inAppSearch) {
        intent.inAppSearch = true;
        intent.selectAfterLaunch = profile.selectAfterSearch;
    } else {
        intent.fallbackReason = profile.displayName + " has no search support";
    }
    return intent;
}

std::string AppResolver::queryFromUrl(const UrlParts& url) {
    for (auto it = url.segments.rbegin(); it != url.segments.rend(); ++it) {
        if (it->empty() || isIdentifierSegment(*it)) continue;
        std::string text = percentDecode(*it);
        std::replace(text.begin(), text.end(), '-', ' ');
        std::replace(text.begin(), text.end(), '_', ' ');
        const auto trimmed = trimView(text);
        if (!trimmed.empty()) return std::string(trimmed);
    }
    for (const auto& [key, value] : url.queryParams) {
        if (key == "q" || key == "query" || key == "search_query" || key == "phrase") {
            return percentDecode(value);
        }
    }
    if (!url.opaque.empty()) {
        return percentDecode(url.opaque);
    }
    return url.bareHost();
}

} // namespace tvdeck::tv
