#pragma once

#include <chrono>
#include <expected>
#include <optional>
#include <set>
#include <string>
#include <vector>

#include "FeedParser.hpp"

class IFetcher;

struct SFeedMirrorOptions {
    std::string          stateDir;
    std::chrono::seconds ttl       = std::chrono::hours{3};
    bool                 forcePoll = false;
};

// Keeps <stateDir>/feeds/<hash of url> in sync with the images a feed
// currently lists. The directory's .timestamp marker is locked for the whole
// sync, so concurrent runs on one feed poll it once.
class CFeedMirror {
  public:
    CFeedMirror(IFetcher& fetcher, const SFeedMirrorOptions& options);
    ~CFeedMirror() = default;

    CFeedMirror(const CFeedMirror&) = delete;
    CFeedMirror(CFeedMirror&)       = delete;
    CFeedMirror(CFeedMirror&&)      = delete;

    // returns the local directory holding the feed's images
    std::expected<std::string, std::string> sync(const std::string& url);

    static std::string                      directoryFor(const std::string& stateDir, const std::string& url);

    // local file name for an item, nullopt if its url has no usable extension
    static std::optional<std::string>       localNameFor(const SFeedItem& item);

    // asks photo hosts for their large variant instead of a thumbnail
    static std::string                      rewriteImageURL(const std::string& url);

    // what the last sync() recovered from: parser complaints and polls that were ignored
    const std::vector<std::string>&         warnings() const;

    constexpr static const char*            MARKER_NAME = ".timestamp";

  private:
    struct SPollResult {
        std::set<std::string> refreshed;
        std::string           error;
    };

    SPollResult        poll(const std::string& url, const std::string& dir);

    IFetcher&                m_fetcher;
    SFeedMirrorOptions       m_options;
    std::vector<std::string> m_warnings;
};
