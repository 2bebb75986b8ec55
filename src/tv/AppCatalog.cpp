#include "tvdeck/tv/AppCatalog.hpp"

#include <algorithm>
#include <cctype>

namespace tvdeck::tv {

namespace {

constexpr const char* ICON_BASE = "https://cdn.simpleicons.org/";

std::string icon(const char* slug, const char* tint) {
    return std::string(ICON_BASE) + slug + "/" + tint;
}

bool isDigits(std::string_view text) {
    return !text.empty() && std::all_of(text.begin(), text.end(),
                                         [](unsigned char c) { return std::isdigit(c); });
}

bool isCountryCode(std::string_view text) {
    return text.size() == 2 && std::all_of(text.begin(), text.end(),
                                           [](unsigned char c) { return std::isalpha(c); });
}

// Custom-scheme links put the first path element in the authority slot
// (netflix://title/123); fold it back so both shapes read the same.
std::vector<std::string> pathOf(const UrlParts& url) {
    if (url.isWeb() || !url.hierarchical) {
        return url.segments;
    }
    std::vector<std::string> path;
    if (!url.host.empty()) path.push_back(url.host);
    path.insert(path.end(), url.segments.begin(), url.segments.end());
    return path;
}

// netflix.com/[cc/]title/ID, netflix.com/watch/ID, netflix://title/ID, nflx://watch/ID
std::optional<std::string> canonicalNetflix(const UrlParts& url) {
    const auto path = pathOf(url);
    for (std::size_t i = 0; i + 1 < path.size(); ++i) {
        const auto kind = toLower(path[i]);
        if ((kind == "title" || kind == "watch") && isDigits(path[i + 1])) {
            return "http://www.netflix.com/watch/" + path[i + 1];
        }
    }
    return std::nullopt;
}

// hbomax.com/movies/<slug>/<uuid>, hbomax.com/series/urn:hbo:series:<uuid>,
// play.max.com/show/<uuid>
std::optional<std::string> canonicalMax(const UrlParts& url) {
    const auto& path = url.segments;
    if (path.empty()) return std::nullopt;

    const auto section = toLower(path[0]);
    std::string kind;
    if (section == "movie" || section == "movies") {
        kind = "movie";
    } else if (section == "series" || section == "show" || section == "shows") {
        kind = "show";
    } else {
        return std::nullopt;
    }

    for (std::size_t i = 1; i < path.size(); ++i) {
        std::string_view segment = path[i];
        if (segment.rfind("urn:hbo:", 0) == 0) {
            segment = segment.substr(segment.rfind(':') + 1);
        }
        if (isUuid(segment)) {
            return "https://play.max.com/" + kind + "/" + toLower(segment);
        }
    }
    return std::nullopt;
}

// tv.apple.com/[cc/]show/[slug/]umc.cmc.X
std::optional<std::string> canonicalAppleTv(const UrlParts& url) {
    const auto& path = url.segments;
    std::size_t i = 0;
    if (i < path.size() && isCountryCode(path[i])) ++i;
    if (i >= path.size()) return std::nullopt;

    const auto kind = toLower(path[i]);
    if (kind != "show" && kind != "movie") return std::nullopt;

    for (++i; i < path.size(); ++i) {
        if (path[i].rfind("umc.cmc.", 0) == 0 && path[i].size() > 8) {
            return "https://tv.apple.com/" + kind + "/" + path[i];
        }
    }
    return std::nullopt;
}

AppProfile launchOnly(std::string id, std::string name, std::vector<std::string> aliases,
                      std::vector<std::string> packages,
                      std::optional<std::string> iconUrl,
                      std::optional<std::string> color = std::nullopt) {
    AppProfile p;
    p.id = std::move(id);
    p.displayName = std::move(name);
    p.aliases = std::move(aliases);
    for (auto& pkg : packages) {
        p.packages.push_back(AppPackage{std::move(pkg), {}});
    }
    p.icon = std::move(iconUrl);
    p.color = std::move(color);
    return p;
}

std::vector<AppProfile> builtinProfiles() {
    std::vector<AppProfile> table;

    {
        AppProfile p;
        p.id = "netflix";
        p.displayName = "Netflix";
        p.aliases = {"netflix", "nflx"};
        p.packages = {{"com.netflix.ninja", {}}, {"com.netflix.mediaclient", {}}};
        p.packageHints = {"netflix"};
        p.hosts = {"netflix.com"};
        p.schemes = {"netflix", "nflx"};
        p.strategy = LinkStrategy::SharedLinkTemplate;
        p.canonicalize = &canonicalNetflix;
        p.icon = icon("netflix", "E50914");
        p.wakeFirst = true;
        p.clearTask = true;
        p.selectAfterDeepLink = true;
        p.selectAfterSearch = true;
        p.inAppSearch = true;
        table.push_back(std::move(p));
    }
    {
        AppProfile p;
        p.id = "youtube";
        p.displayName = "YouTube";
        p.aliases = {"youtube", "yt"};
        p.packages = {{"com.google.android.youtube.tv", {}},
                      {"com.amazon.firetv.youtube", "dev.cobalt.app.MainActivity"}};
        p.packageHints = {"youtube.tv", "firetv.youtube"};
        p.hosts = {"youtube.com", "m.youtube.com", "youtu.be"};
        p.schemes = {"vnd.youtube"};
        p.strategy = LinkStrategy::DirectPassthrough;
        p.searchTemplate = "https://www.youtube.com/results?search_query={query}";
        p.icon = icon("youtube", "FF0000");
        p.selectAfterSearch = true;
        table.push_back(std::move(p));
    }
    table.push_back(launchOnly("youtube-kids", "YT Kids", {"youtubekids", "ytkids"},
                               {"com.google.android.youtube.tvkids"},
                               icon("youtubekids", "FF0000")));
    {
        AppProfile p;
        p.id = "disney";
        p.displayName = "Disney+";
        p.aliases = {"disney", "disneyplus"};
        p.packages = {{"com.disney.disneyplus", {}}};
        p.packageHints = {"disney"};
        p.hosts = {"disneyplus.com"};
        p.strategy = LinkStrategy::QueryTemplate;
        p.searchTemplate = "https://www.disneyplus.com/search?q={query}";
        p.icon = icon("disneyplus", "113CCF");
        p.selectAfterSearch = true;
        table.push_back(std::move(p));
    }
    {
        AppProfile p;
        p.id = "prime";
        p.displayName = "Prime";
        p.aliases = {"prime", "primevideo", "amazonprime", "amazonprimevideo", "amazonvideo"};
        p.packages = {{"com.amazon.avod.thirdpartyclient", {}}, {"com.amazon.avod", {}}};
        p.packageHints = {"amazonvideo", "avod", "prime"};
        p.hosts = {"primevideo.com", "app.primevideo.com"};
        p.strategy = LinkStrategy::QueryTemplate;
        p.searchTemplate = "https://app.primevideo.com/search?phrase={query}";
        p.icon = icon("primevideo", "00A8E1");
        p.selectAfterSearch = true;
        table.push_back(std::move(p));
    }
    {
        AppProfile p;
        p.id = "hulu";
        p.displayName = "Hulu";
        p.aliases = {"hulu"};
        p.packages = {{"com.hulu.livingroomplus", {}}, {"com.hulu.plus", {}}};
        p.packageHints = {"hulu"};
        p.hosts = {"hulu.com"};
        p.strategy = LinkStrategy::QueryTemplate;
        p.searchTemplate = "https://www.hulu.com/search?q={query}";
        p.color = std::string("#1CE783");
        p.selectAfterSearch = true;
        table.push_back(std::move(p));
    }
    {
        AppProfile p;
        p.id = "appletv";
        p.displayName = "Apple TV";
        p.aliases = {"appletv", "appletvplus", "apple"};
        p.packages = {{"com.apple.atve.amazon.appletv", ".MainActivity"},
                      {"com.apple.atve.androidtv.appletv", ".MainActivity"}};
        p.packageHints = {"appletv"};
        p.hosts = {"tv.apple.com"};
        p.strategy = LinkStrategy::SharedLinkTemplate;
        p.canonicalize = &canonicalAppleTv;
        p.icon = icon("appletv", "ffffff");
        p.wakeFirst = true;
        p.selectAfterDeepLink = true;
        p.selectAfterSearch = true;
        p.inAppSearch = true;
        table.push_back(std::move(p));
    }
    {
        AppProfile p;
        p.id = "max";
        p.displayName = "Max";
        p.aliases = {"max", "hbomax", "hbo"};
        p.packages = {{"com.wbd.stream", {}}, {"com.hbo.hbonow", {}}};
        p.packageHints = {"wbd.stream", "hbo"};
        p.hosts = {"hbomax.com", "max.com", "play.max.com", "play.hbomax.com"};
        p.strategy = LinkStrategy::SharedLinkTemplate;
        p.canonicalize = &canonicalMax;
        p.icon = icon("hbo", "ffffff");
        p.wakeFirst = true;
        p.selectAfterDeepLink = true;
        p.selectAfterSearch = true;
        p.inAppSearch = true;
        table.push_back(std::move(p));
    }
    table.push_back(launchOnly("peacock", "Peacock", {"peacock", "peacocktv"},
                               {"com.peacocktv.peacockandroid", "com.peacock.peacockfiretv"},
                               std::nullopt, std::string("#000000")));
    table.push_back(launchOnly("paramount", "Paramount+", {"paramount", "paramountplus", "cbs"},
                               {"com.cbs.ott", "com.cbs.app"},
                               icon("paramountplus", "0064FF")));
    table.push_back(launchOnly("plex", "Plex", {"plex"}, {"com.plexapp.android"},
                               icon("plex", "E5A00D")));
    {
        AppProfile p;
        p.id = "spotify";
        p.displayName = "Spotify";
        p.aliases = {"spotify"};
        p.packages = {{"com.spotify.tv.android", {}}};
        p.packageHints = {"spotify"};
        p.hosts = {"open.spotify.com"};
        p.schemes = {"spotify"};
        p.strategy = LinkStrategy::QueryTemplate;
        p.searchTemplate = "spotify:search:{query}";
        p.icon = icon("spotify", "1DB954");
        table.push_back(std::move(p));
    }
    table.push_back(launchOnly("tubi", "Tubi", {"tubi", "tubitv"}, {"com.tubitv"},
                               icon("tubi", "FA382F")));
    table.push_back(launchOnly("crunchyroll", "Crunchyroll", {"crunchyroll"},
                               {"com.crunchyroll.crunchyroid"},
                               icon("crunchyroll", "F47521")));
    table.push_back(launchOnly("twitch", "Twitch", {"twitch"}, {"tv.twitch.android.app"},
                               icon("twitch", "9146FF")));
    table.push_back(launchOnly("espn", "ESPN", {"espn"}, {"com.espn.score_center"},
                               icon("espn", "FF0033")));
    table.push_back(launchOnly("foxsports", "Fox Sports", {"foxsports", "fox"},
                               {"com.foxsports.videogo"}, icon("fox", "ffffff")));
    table.push_back(launchOnly("directv", "DirecTV", {"directv", "atttv"}, {"com.att.tv"},
                               std::nullopt, std::string("#00A8E1")));
    table.push_back(launchOnly("sling", "Sling", {"sling", "slingtv"}, {"com.sling"},
                               icon("sling", "0095D5")));
    table.push_back(launchOnly("vudu", "Vudu", {"vudu", "fandango", "fandangoathome"},
                               {"com.vudu.air"}, icon("vudu", "3399FF")));
    table.push_back(launchOnly("plutotv", "Pluto TV", {"pluto", "plutotv"},
                               {"tv.pluto.android"}, icon("plutotv", "000000")));
    return table;
}

} // namespace

const char* toString(LinkStrategy strategy) {
    switch (strategy) {
        case LinkStrategy::DirectPassthrough:  return "direct";
        case LinkStrategy::QueryTemplate:      return "query-template";
        case LinkStrategy::SharedLinkTemplate: return "shared-link";
        case LinkStrategy::LaunchOnly:         return "launch-only";
    }
    return "unknown";
}

bool AppProfile::ownsUrl(const UrlParts& url) const {
    if (std::find(schemes.begin(), schemes.end(), url.scheme) != schemes.end()) {
        return true;
    }
    if (!url.isWeb()) return false;
    const auto host = url.bareHost();
    return std::find(hosts.begin(), hosts.end(), host) != hosts.end();
}

bool AppProfile::hasPackage(std::string_view packageId) const {
    return std::any_of(packages.begin(), packages.end(),
                       [&](const AppPackage& p) { return p.id == packageId; });
}

AppPackage AppProfile::preferredPackage(const std::vector<std::string>* installed) const {
    if (installed != nullptr && !installed->empty()) {
        for (const auto& candidate : packages) {
            if (std::find(installed->begin(), installed->end(), candidate.id) != installed->end()) {
                return candidate;
            }
        }
        for (const auto& hint : packageHints) {
            for (const auto& pkg : *installed) {
                if (toLower(pkg).find(hint) == std::string::npos) continue;
                // A build variant launches through the same activity as its catalogued sibling.
                for (const auto& candidate : packages) {
                    if (!candidate.activity.empty() && toLower(candidate.id).find(hint) != std::string::npos) {
                        return AppPackage{pkg, candidate.activity};
                    }
                }
                return AppPackage{pkg, {}};
            }
        }
    }
    if (packages.empty()) return AppPackage{};
    return packages.front();
}

AppCatalog::AppCatalog(std::vector<AppProfile> profiles)
: profiles_(std::move(profiles)) {}

const AppCatalog& AppCatalog::builtin() {
    static const AppCatalog catalog(builtinProfiles());
    return catalog;
}

const AppProfile* AppCatalog::findByName(std::string_view nameOrPackage) const {
    const auto trimmed = trimView(nameOrPackage);
    if (trimmed.empty()) return nullptr;

    if (const auto* byPackage = findByPackage(trimmed)) {
        return byPackage;
    }

    const auto key = normalizeName(trimmed);
    if (key.empty()) return nullptr;
    for (const auto& profile : profiles_) {
        if (normalizeName(profile.id) == key || normalizeName(profile.displayName) == key) {
            return &profile;
        }
        if (std::find(profile.aliases.begin(), profile.aliases.end(), key) != profile.aliases.end()) {
            return &profile;
        }
    }
    return nullptr;
}

const AppProfile* AppCatalog::findByUrl(const UrlParts& url) const {
    for (const auto& profile : profiles_) {
        if (profile.ownsUrl(url)) return &profile;
    }
    return nullptr;
}

const AppProfile* AppCatalog::findByPackage(std::string_view packageId) const {
    for (const auto& profile : profiles_) {
        if (profile.hasPackage(packageId)) return &profile;
    }
    return nullptr;
}

std::string AppCatalog::normalizeName(std::string_view name) {
    std::string out;
    out.reserve(name.size());
    for (unsigned char c : name) {
        if (std::isalnum(c)) {
            out += static_cast<char>(std::tolower(c));
        } else if (c == '+') {
            out += "plus";
        }
    }
    return out;
}

const std::vector<std::string>& AppCatalog::streamingKeywords() {
    static const std::vector<std::string> keywords{
        "youtube", "netflix", "prime", "amazonvideo", "hulu", "disney", "hbo",
        "peacock", "paramount", "apple.tv", "plex", "kodi", "spotify", "pandora",
        "tidal", "twitch", "crunchyroll",
    };
    return keywords;
}

} // namespace tvdeck::tv
