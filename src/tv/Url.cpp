#include "tvdeck/tv/Url.hpp"

#include <algorithm>
#include <array>
#include <cctype>

namespace tvdeck::tv {

namespace {

constexpr std::array<std::string_view, 9> TRACKING_PARAMETERS{
    "fbclid", "gclid", "si", "trackid", "ref", "ref_", "igshid", "mc_cid", "mc_eid",
};

bool isSchemeChar(char c, bool first) {
    if (std::isalpha(static_cast<unsigned char>(c))) return true;
    if (first) return false;
    return std::isdigit(static_cast<unsigned char>(c)) || c == '+' || c == '-' || c == '.';
}

std::vector<std::string> split(std::string_view text, char sep) {
    std::vector<std::string> parts;
    std::size_t start = 0;
    while (start <= text.size()) {
        auto end = text.find(sep, start);
        if (end == std::string_view::npos) end = text.size();
        if (end > start) parts.emplace_back(text.substr(start, end - start));
        start = end + 1;
    }
    return parts;
}

int hexDigit(char c) {
    if (c >= '0' && c <= '9') return c - '0';
    if (c >= 'a' && c <= 'f') return c - 'a' + 10;
    if (c >= 'A' && c <= 'F') return c - 'A' + 10;
    return -1;
}

} // namespace

std::string toLower(std::string_view text) {
    std::string out(text);
    std::transform(out.begin(), out.end(), out.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return out;
}

std::string_view trimView(std::string_view text) {
    while (!text.empty() && std::isspace(static_cast<unsigned char>(text.front()))) text.remove_prefix(1);
    while (!text.empty() && std::isspace(static_cast<unsigned char>(text.back()))) text.remove_suffix(1);
    return text;
}

std::string UrlParts::bareHost() const {
    if (host.rfind("www.", 0) == 0) return host.substr(4);
    return host;
}

std::string UrlParts::toString() const {
    std::string out = scheme + ":";
    if (!hierarchical) {
        return out + opaque;
    }
    out += "//" + host;
    for (const auto& segment : segments) {
        out += "/" + segment;
    }
    if (!queryParams.empty()) {
        char sep = '?';
        for (const auto& [key, value] : queryParams) {
            out += sep;
            out += key;
            if (!value.empty()) out += "=" + value;
            sep = '&';
        }
    }
    if (!fragment.empty()) {
        out += "#" + fragment;
    }
    return out;
}

std::optional<UrlParts> parseUrl(std::string_view text) {
    text = trimView(text);
    if (text.empty()) return std::nullopt;
    if (std::any_of(text.begin(), text.end(),
                    [](unsigned char c) { return std::isspace(c) || c < 0x20; })) {
        return std::nullopt;
    }

    std::size_t colon = 0;
    while (colon < text.size() && isSchemeChar(text[colon], colon == 0)) ++colon;
    if (colon == 0 || colon >= text.size() || text[colon] != ':') {
        return std::nullopt;
    }

    UrlParts url;
    url.scheme = toLower(text.substr(0, colon));
    std::string_view rest = text.substr(colon + 1);

    if (auto hash = rest.find('#'); hash != std::string_view::npos) {
        url.fragment = std::string(rest.substr(hash + 1));
        rest = rest.substr(0, hash);
    }

    if (rest.substr(0, 2) != "//") {
        if (url.isWeb() || rest.empty()) return std::nullopt;
        url.opaque = std::string(rest);
        return url;
    }

    url.hierarchical = true;
    rest.remove_prefix(2);

    std::string_view query;
    if (auto q = rest.find('?'); q != std::string_view::npos) {
        query = rest.substr(q + 1);
        rest = rest.substr(0, q);
    }

    auto slash = rest.find('/');
    std::string_view authority = rest.substr(0, slash);
    if (auto at = authority.rfind('@'); at != std::string_view::npos) {
        authority.remove_prefix(at + 1);
    }
    if (auto port = authority.find(':'); port != std::string_view::npos) {
        authority = authority.substr(0, port);
    }
    url.host = toLower(authority);
    if (url.isWeb() && url.host.empty()) return std::nullopt;

    if (slash != std::string_view::npos) {
        url.segments = split(rest.substr(slash), '/');
    }
    for (const auto& pair : split(query, '&')) {
        auto eq = pair.find('=');
        if (eq == std::string::npos) {
            url.queryParams.emplace_back(pair, std::string{});
        } else {
            url.queryParams.emplace_back(pair.substr(0, eq), pair.substr(eq + 1));
        }
    }
    return url;
}

std::string percentEncode(std::string_view text) {
    static constexpr char HEX[] = "0123456789ABCDEF";
    std::string out;
    out.reserve(text.size() * 3);
    for (unsigned char c : text) {
        if (std::isalnum(c) || c == '-' || c == '_' || c == '.' || c == '~') {
            out += static_cast<char>(c);
        } else {
            out += '%';
            out += HEX[c >> 4];
            out += HEX[c & 0x0F];
        }
    }
    return out;
}

std::string percentDecode(std::string_view text) {
    std::string out;
    out.reserve(text.size());
    for (std::size_t i = 0; i < text.size(); ++i) {
        const char c = text[i];
        if (c == '+') {
            out += ' ';
        } else if (c == '%' && i + 2 < text.size()
                   && hexDigit(text[i + 1]) >= 0 && hexDigit(text[i + 2]) >= 0) {
            out += static_cast<char>(hexDigit(text[i + 1]) * 16 + hexDigit(text[i + 2]));
            i += 2;
        } else {
            out += c;
        }
    }
    return out;
}

void stripTrackingParameters(UrlParts& url) {
    auto& params = url.queryParams;
    params.erase(std::remove_if(params.begin(), params.end(), [](const auto& param) {
        const auto key = toLower(param.first);
        if (key.rfind("utm_", 0) == 0) return true;
        return std::find(TRACKING_PARAMETERS.begin(), TRACKING_PARAMETERS.end(), key)
            != TRACKING_PARAMETERS.end();
    }), params.end());
}

bool isUuid(std::string_view text) {
    if (text.size() != 36) return false;
    for (std::size_t i = 0; i < text.size(); ++i) {
        const char c = text[i];
        if (i == 8 || i == 13 || i == 18 || i == 23) {
            if (c != '-') return false;
        } else if (hexDigit(c) < 0) {
            return false;
        }
    }
    return true;
}

} // namespace tvdeck::tv
