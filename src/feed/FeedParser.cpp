#include "FeedParser.hpp"
#include "TagScanner.hpp"
#include "../helpers/Extensions.hpp"
#include "../helpers/MiscFunctions.hpp"
#include "../net/HttpClient.hpp"
#include "../debug/Log.hpp"

#include <array>
#include <algorithm>
#include <format>
#include <unordered_map>

#include <hyprutils/string/String.hpp>

using namespace Markup;
using namespace Hyprutils::String;
using namespace std::string_view_literals;

CFeedParser::CFeedParser(IFetcher& fetcher) : m_fetcher(fetcher) {
    ;
}

bool CFeedParser::looksLikeXML(std::string_view body) {
    if (body.starts_with("\xEF\xBB\xBF"))
        body.remove_prefix(3);

    const auto FIRST = body.find_first_not_of(" \t\r\n");
    if (FIRST == std::string_view::npos)
        return false;

    body.remove_prefix(FIRST);

    if (toLower(body.substr(0, 5)) == "<?xml")
        return true;

    // the first element decides
    CTagScanner scanner(body);
    const auto  TAG = scanner.next();

    return TAG && !TAG->closing && (TAG->name == "rss" || TAG->name == "feed" || TAG->name == "rdf:rdf");
}

bool CFeedParser::looksLikeHTML(std::string_view body) {
    CTagScanner scanner(body);
    while (const auto TAG = scanner.next()) {
        if (TAG->name == "html" || TAG->name == "head" || TAG->name == "body" || TAG->name == "link")
            return true;
    }
    return false;
}

std::optional<std::string> CFeedParser::discoverFeedLink(std::string_view html) {
    CTagScanner scanner(html);
    while (const auto TAG = scanner.next()) {
        if (TAG->closing || TAG->name != "link")
            continue;

        const auto REL  = TAG->attr("rel");
        const auto TYPE = TAG->attr("type");
        const auto HREF = TAG->attr("href");

        if (!REL || !TYPE || !HREF || HREF->empty())
            continue;

        if (!toLower(*REL).contains("alternate"))
            continue;

        const auto LTYPE = toLower(trim(*TYPE));
        if (LTYPE != "application/rss+xml" && LTYPE != "application/atom+xml")
            continue;

        return trim(*HREF);
    }

    return std::nullopt;
}

std::string CFeedParser::resolveURL(const std::string& base, const std::string& href) {
    if (href.contains("://"))
        return href;

    const auto SCHEME_END = base.find("://");
    if (SCHEME_END == std::string::npos)
        return href;

    if (href.starts_with("//"))
        return base.substr(0, SCHEME_END + 1) + href;

    const auto PATH_START = base.find_first_of("/?#", SCHEME_END + 3);
    const auto ORIGIN     = base.substr(0, PATH_START);

    if (href.starts_with('/'))
        return ORIGIN + href;

    if (PATH_START == std::string::npos || base[PATH_START] != '/')
        return ORIGIN + "/" + href;

    auto       path      = base.substr(PATH_START);
    const auto QUERY_POS = path.find_first_of("?#");
    if (QUERY_POS != std::string::npos)
        path = path.substr(0, QUERY_POS);

    return ORIGIN + path.substr(0, path.find_last_of('/') + 1) + href;
}

std::vector<std::string_view> CFeedParser::splitEntries(std::string_view body) {
    std::vector<size_t> starts;
    std::string         entryName;

    CTagScanner         scanner(body);
    while (const auto TAG = scanner.next()) {
        if (TAG->closing)
            continue;

        if (entryName.empty() && (TAG->name == "item" || TAG->name == "entry"))
            entryName = TAG->name;

        if (!entryName.empty() && TAG->name == entryName)
            starts.emplace_back(TAG->begin);
    }

    std::vector<std::string_view> result;
    for (size_t i = 0; i < starts.size(); ++i) {
        const auto END = i + 1 < starts.size() ? starts[i + 1] : body.size();
        result.emplace_back(body.substr(starts[i], END - starts[i]));
    }

    return result;
}

static bool isImageType(const std::optional<std::string>& type) {
    return type && toLower(trim(*type)).starts_with("image/");
}

std::optional<std::string> CFeedParser::extractImageURL(std::string_view entry) {
    // <link rel="enclosure" href="..." type="image/...">, type optional
    {
        CTagScanner scanner(entry);
        while (const auto TAG = scanner.next()) {
            if (TAG->closing || TAG->name != "link")
                continue;

            const auto REL  = TAG->attr("rel");
            const auto HREF = TAG->attr("href");
            const auto TYPE = TAG->attr("type");

            if (!REL || toLower(trim(*REL)) != "enclosure" || !HREF || trim(*HREF).empty())
                continue;

            if (TYPE && !isImageType(TYPE))
                continue;

            return trim(*HREF);
        }
    }

    // <media:content url="...">
    {
        CTagScanner scanner(entry);
        while (const auto TAG = scanner.next()) {
            if (TAG->closing || TAG->name != "media:content")
                continue;

            const auto URL = TAG->attr("url");
            if (URL && !trim(*URL).empty())
                return trim(*URL);
        }
    }

    // <enclosure url="..." type="image/...">
    {
        CTagScanner scanner(entry);
        while (const auto TAG = scanner.next()) {
            if (TAG->closing || TAG->name != "enclosure")
                continue;

            const auto URL = TAG->attr("url");
            if (URL && !trim(*URL).empty() && isImageType(TAG->attr("type")))
                return trim(*URL);
        }
    }

    // <url>...jpg</url>
    if (const auto TEXT = elementText(entry, "url"); TEXT) {
        const auto URL = trim(decodeHTMLEntities(*TEXT));
        if (Extensions::isImage(Extensions::extensionOfURL(URL)))
            return URL;
    }

    // first <img src="..."> of the (escaped) html in <description>
    if (const auto TEXT = elementText(entry, "description"); TEXT) {
        const auto HTML = decodeHTMLEntities(*TEXT);
        if (const auto IMG = findTag(HTML, "img"); IMG) {
            const auto SRC = IMG->attr("src");
            if (SRC && !trim(*SRC).empty())
                return trim(*SRC);
        }
    }

    return std::nullopt;
}

std::string CFeedParser::extractID(std::string_view entry, const std::string& imageURL) {
    for (const auto NAME : {"id"sv, "guid"sv, "link"sv}) {
        const auto TEXT = elementText(entry, NAME);
        if (!TEXT)
            continue;

        const auto ID = trim(decodeHTMLEntities(*TEXT));
        if (!ID.empty())
            return ID;
    }

    return imageURL;
}

std::expected<SFeedDocument, std::string> CFeedParser::parse(const std::string& body, const std::string& url) {
    return parseAt(body, url, 0);
}

std::expected<SFeedDocument, std::string> CFeedParser::parseAt(const std::string& body, const std::string& url, int depth) {
    if (!looksLikeXML(body)) {
        if (!looksLikeHTML(body))
            return std::unexpected(std::format("{} is neither a feed nor a web page", url));

        const auto LINK = discoverFeedLink(body);
        if (!LINK)
            return std::unexpected(std::format("{} is a web page without an RSS or Atom link", url));

        if (depth >= MAX_DISCOVERY_DEPTH)
            return std::unexpected(std::format("gave up following feed links at {}", url));

        const auto FEED_URL = resolveURL(url, *LINK);
        Debug::log(LOG, "{} is a web page, following its feed link to {}", url, FEED_URL);

        const auto FEED_BODY = m_fetcher.get(FEED_URL);
        if (!FEED_BODY)
            return std::unexpected(FEED_BODY.error());

        return parseAt(*FEED_BODY, FEED_URL, depth + 1);
    }

    SFeedDocument                                doc;
    std::unordered_map<std::string, std::string> urlForID;

    const auto                                   ENTRIES = splitEntries(body);

    for (const auto& entry : ENTRIES) {
        const auto IMAGE = extractImageURL(entry);
        if (!IMAGE) {
            Debug::log(TRACE, "Feed entry without an image, skipping");
            continue;
        }

        auto       id       = extractID(entry, *IMAGE);
        const auto EXISTING = urlForID.find(id);

        if (EXISTING != urlForID.end()) {
            if (EXISTING->second != *IMAGE) {
                auto warning = std::format("feed {} has two images for id {}: keeping {}, ignoring {}", url, id, EXISTING->second, *IMAGE);
                Debug::log(WARN, "{}", warning);
                doc.warnings.emplace_back(std::move(warning));
            }
            continue;
        }

        urlForID.emplace(id, *IMAGE);
        doc.items.emplace_back(SFeedItem{.url = *IMAGE, .id = std::move(id)});
    }

    Debug::log(LOG, "Feed {}: {} entr{}, {} image(s)", url, ENTRIES.size(), ENTRIES.size() == 1 ? "y" : "ies", doc.items.size());

    return doc;
}
