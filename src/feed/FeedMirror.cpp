#include "FeedMirror.hpp"
#include "../cache/FileLock.hpp"
#include "../helpers/Extensions.hpp"
#include "../helpers/MiscFunctions.hpp"
#include "../net/HttpClient.hpp"
#include "../debug/Log.hpp"

#include <cerrno>
#include <cstring>
#include <filesystem>
#include <format>
#include <sys/stat.h>
#include <vector>

CFeedMirror::CFeedMirror(IFetcher& fetcher, const SFeedMirrorOptions& options) : m_fetcher(fetcher), m_options(options) {
    ;
}

std::string CFeedMirror::directoryFor(const std::string& stateDir, const std::string& url) {
    return stateDir + "/feeds/" + hashName(url);
}

std::optional<std::string> CFeedMirror::localNameFor(const SFeedItem& item) {
    const auto EXT = Extensions::extensionOfURL(item.url);
    if (EXT.empty() || !Extensions::isImage(EXT))
        return std::nullopt;

    return hashName(item.id) + "." + EXT;
}

std::string CFeedMirror::rewriteImageURL(const std::string& url) {
    const auto SCHEME = url.find("://");
    if (SCHEME == std::string::npos)
        return url;

    const auto HOST_END = url.find('/', SCHEME + 3);
    if (HOST_END == std::string::npos)
        return url;

    const auto HOST = toLower(std::string_view{url}.substr(SCHEME + 3, HOST_END - SCHEME - 3));
    if (HOST != "flickr.com" && !HOST.ends_with(".flickr.com") && !HOST.ends_with(".staticflickr.com") && HOST != "staticflickr.com")
        return url;

    // .../1234_abcd_m.jpg -> .../1234_abcd_b.jpg
    const auto PATH_END = url.find_first_of("?#", HOST_END);
    const auto DOT      = url.find_last_of('.', PATH_END == std::string::npos ? std::string::npos : PATH_END - 1);

    if (DOT == std::string::npos || DOT < HOST_END + 3 || url[DOT - 2] != '_')
        return url;

    const char SIZE = url[DOT - 1];
    if (SIZE != 's' && SIZE != 't' && SIZE != 'm' && SIZE != 'q' && SIZE != 'n')
        return url;

    auto rewritten     = url;
    rewritten[DOT - 1] = 'b';
    return rewritten;
}

// the images in the feed directory. The marker and leftover partial downloads don't count.
static std::vector<std::string> listCachedFiles(const std::string& dir) {
    std::vector<std::string> names;
    std::error_code          ec;

    for (auto it = std::filesystem::directory_iterator(dir, ec); !ec && it != std::filesystem::directory_iterator(); it.increment(ec)) {
        auto name = it->path().filename().string();
        if (name.starts_with('.') || !Extensions::hasImageExtension(name))
            continue;
        names.emplace_back(std::move(name));
    }

    if (ec)
        Debug::log(WARN, "Error listing {}: {}", dir, ec.message());

    return names;
}

CFeedMirror::SPollResult CFeedMirror::poll(const std::string& url, const std::string& dir) {
    SPollResult result;

    const auto  BODY = m_fetcher.get(url);
    if (!BODY) {
        result.error = BODY.error();
        Debug::log(WARN, "Couldn't fetch feed {}: {}", url, result.error);
        return result;
    }

    CFeedParser parser(m_fetcher);
    const auto  DOC = parser.parse(*BODY, url);
    if (!DOC) {
        result.error = DOC.error();
        Debug::log(WARN, "Couldn't parse feed {}: {}", url, result.error);
        return result;
    }

    m_warnings.insert(m_warnings.end(), DOC->warnings.begin(), DOC->warnings.end());

    size_t downloaded = 0;

    for (const auto& item : DOC->items) {
        const auto NAME = localNameFor(item);
        if (!NAME) {
            Debug::log(TRACE, "Skipping {}: not a supported image type", item.url);
            continue;
        }

        const auto      PATH = dir + "/" + *NAME;

        std::error_code ec;
        if (std::filesystem::exists(PATH, ec)) {
            result.refreshed.emplace(*NAME);
            continue;
        }

        const auto SOURCE = rewriteImageURL(item.url);
        if (SOURCE != item.url)
            Debug::log(TRACE, "Fetching {} instead of {}", SOURCE, item.url);

        const auto DOWNLOADED = m_fetcher.download(SOURCE, PATH);
        if (!DOWNLOADED) {
            Debug::log(TRACE, "Couldn't download {}: {}", SOURCE, DOWNLOADED.error());
            continue;
        }

        downloaded++;
        result.refreshed.emplace(*NAME);
    }

    if (result.refreshed.empty() && result.error.empty())
        result.error = std::format("feed {} lists no usable images", url);

    Debug::log(LOG, "Polled {}: {} item(s), {} image(s) current, {} new", url, DOC->items.size(), result.refreshed.size(), downloaded);

    return result;
}

const std::vector<std::string>& CFeedMirror::warnings() const {
    return m_warnings;
}

std::expected<std::string, std::string> CFeedMirror::sync(const std::string& url) {
    m_warnings.clear();

    const auto      DIR = directoryFor(m_options.stateDir, url);

    std::error_code ec;
    std::filesystem::create_directories(DIR, ec);
    if (ec)
        return std::unexpected(std::format("couldn't create {}: {}", DIR, ec.message()));

    auto marker = CFileLock::acquire(DIR + "/" + MARKER_NAME);
    if (!marker)
        return std::unexpected(marker.error());

    struct stat st;
    if (fstat(marker->fd(), &st) != 0)
        return std::unexpected(std::format("couldn't stat {}: {}", marker->path(), strerror(errno)));

    const auto AGE    = std::chrono::system_clock::now() - std::chrono::system_clock::from_time_t(st.st_mtime);
    const auto CACHED = listCachedFiles(DIR);

    const bool STALE = AGE > m_options.ttl;
    if (!m_options.forcePoll && !STALE && !CACHED.empty()) {
        Debug::log(LOG, "Feed {} was polled {}s ago, using {} cached image(s)", url, std::chrono::duration_cast<std::chrono::seconds>(AGE).count(), CACHED.size());
        return DIR;
    }

    Debug::log(LOG, "Polling feed {} ({})", url, m_options.forcePoll ? "forced" : (CACHED.empty() ? "nothing cached" : "stale"));

    const auto RESULT = poll(url, DIR);

    if (RESULT.refreshed.empty()) {
        if (!CACHED.empty()) {
            auto warning = std::format("feed {} gave no images this time ({}), keeping {} cached image(s)", url, RESULT.error, CACHED.size());
            Debug::log(WARN, "{}", warning);
            m_warnings.emplace_back(std::move(warning));
        }
    } else {
        for (const auto& name : CACHED) {
            if (RESULT.refreshed.contains(name))
                continue;

            std::filesystem::remove(DIR + "/" + name, ec);
            if (ec)
                Debug::log(WARN, "Couldn't remove stale {}/{}: {}", DIR, name, ec.message());
            else
                Debug::log(TRACE, "Removed stale {}/{}", DIR, name);
        }
    }

    // the marker counts as one survivor
    const auto SURVIVORS = 1 + listCachedFiles(DIR).size();
    if (SURVIVORS <= 1)
        return std::unexpected(std::format("no images available from {}: {}", url, RESULT.error));

    // a failed poll leaves the marker stale so the next run tries again
    if (!RESULT.refreshed.empty() && futimens(marker->fd(), nullptr) != 0)
        return std::unexpected(std::format("couldn't touch {}: {}", marker->path(), strerror(errno)));

    return DIR;
}
