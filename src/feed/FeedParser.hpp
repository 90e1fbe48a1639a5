#pragma once

#include <expected>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

class IFetcher;

struct SFeedItem {
    std::string url;
    std::string id;

    bool        operator==(const SFeedItem&) const = default;
};

struct SFeedDocument {
    std::vector<SFeedItem>   items;
    std::vector<std::string> warnings;
};

class CFeedParser {
  public:
    // fetcher is only used to follow HTML autodiscovery links
    explicit CFeedParser(IFetcher& fetcher);
    ~CFeedParser() = default;

    CFeedParser(const CFeedParser&) = delete;
    CFeedParser(CFeedParser&)       = delete;
    CFeedParser(CFeedParser&&)      = delete;

    // items in document order, deduplicated by id. url is where body came from.
    std::expected<SFeedDocument, std::string> parse(const std::string& body, const std::string& url);

    static bool                               looksLikeXML(std::string_view body);
    static bool                               looksLikeHTML(std::string_view body);

    // href of a <link rel="alternate"> pointing at an RSS or Atom feed
    static std::optional<std::string>         discoverFeedLink(std::string_view html);
    static std::string                        resolveURL(const std::string& base, const std::string& href);

    // one fragment per <item> or <entry>, whichever the document uses first
    static std::vector<std::string_view>      splitEntries(std::string_view body);

    static std::optional<std::string>         extractImageURL(std::string_view entry);
    static std::string                        extractID(std::string_view entry, const std::string& imageURL);

    constexpr static int                      MAX_DISCOVERY_DEPTH = 3;

  private:
    std::expected<SFeedDocument, std::string> parseAt(const std::string& body, const std::string& url, int depth);

    IFetcher&                                 m_fetcher;
};
