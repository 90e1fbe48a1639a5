#include "Randpaper.hpp"
#include "cache/FileListCache.hpp"
#include "feed/FeedMirror.hpp"
#include "helpers/Extensions.hpp"
#include "helpers/MiscFunctions.hpp"
#include "scan/DirectoryScanner.hpp"
#include "scan/LocateQuery.hpp"

#include <filesystem>
#include <format>

CRandpaper::CRandpaper(const CConfigManager::SSettings& settings, const SRunOptions& options) : m_settings(settings), m_options(options) {
    m_ownFetcher = makeUnique<CHttpClient>(SHttpOptions{.timeout = settings.httpTimeout, .userAgent = settings.userAgent});
    m_fetcher    = m_ownFetcher.get();

    Debug::log(TRACE, "Random seed {}", m_rng.seed());
}

CRandpaper::CRandpaper(const CConfigManager::SSettings& settings, const SRunOptions& options, IFetcher& fetcher) :
    m_settings(settings), m_options(options), m_fetcher(&fetcher) {
    ;
}

std::string CRandpaper::normalizeTarget(const std::string& target) {
    if (toLower(target.substr(0, 7)) == "feed://")
        return "http://" + target.substr(7);
    return target;
}

bool CRandpaper::isURL(const std::string& target) {
    const auto LOWER = toLower(target.substr(0, 8));
    return LOWER.starts_with("http://") || LOWER.starts_with("https://");
}

SPickOptions CRandpaper::pickOptions() const {
    return SPickOptions{.minWidth = m_settings.minWidth, .minHeight = m_settings.minHeight, .maxAttempts = m_settings.maxAttempts};
}

std::expected<std::string, std::string> CRandpaper::pick(const std::string& target) {
    if (target.empty())
        return std::unexpected("no directory, file or feed given");

    const auto NORMALIZED = normalizeTarget(target);

    if (isURL(NORMALIZED))
        return pickFromFeed(NORMALIZED);

    std::error_code ec;
    const auto      PATH = std::filesystem::canonical(expandHome(NORMALIZED), ec);
    if (ec)
        return std::unexpected(std::format("{}: {}", target, ec.message()));

    const auto STATUS = std::filesystem::status(PATH, ec);
    if (ec)
        return std::unexpected(std::format("{}: {}", PATH.string(), ec.message()));

    if (std::filesystem::is_regular_file(STATUS)) {
        if (!Extensions::hasImageExtension(PATH.string()))
            return std::unexpected(std::format("{} is not a supported image", PATH.string()));
        return PATH.string();
    }

    if (!std::filesystem::is_directory(STATUS))
        return std::unexpected(std::format("{} is neither a file nor a directory", PATH.string()));

    return pickFromDirectory(PATH.string());
}

std::expected<std::string, std::string> CRandpaper::pickFromFeed(const std::string& url) {
    CFeedMirror mirror(*m_fetcher, SFeedMirrorOptions{.stateDir = m_settings.stateDir, .ttl = m_settings.feedTTL, .forcePoll = !m_options.useCache});

    const auto  DIR = mirror.sync(url);
    if (!DIR)
        return std::unexpected(DIR.error());

    const auto FILES = DirectoryScanner::scan(*DIR);
    if (!FILES)
        return std::unexpected(FILES.error());

    return pickRandomImage(*FILES, pickOptions(), m_rng);
}

std::expected<std::vector<std::string>, std::string> CRandpaper::enumerate(const std::string& dir) {
    if (m_options.useLocate) {
        auto located = LocateQuery::query(dir);
        if (located && !located->empty())
            return located;

        if (!located)
            Debug::log(LOG, "locate failed ({}), walking {} instead", located.error(), dir);
        else
            Debug::log(LOG, "locate knows no images under {}, walking it instead", dir);
    }

    return DirectoryScanner::scan(dir);
}

std::expected<std::string, std::string> CRandpaper::pickFromDirectory(const std::string& dir) {
    // held until we return, see CFileListCache
    auto cache = CFileListCache::open(m_settings.stateDir, dir, m_settings.listTTL);
    if (!cache)
        return std::unexpected(cache.error());

    std::optional<std::vector<std::string>> files;

    if (m_options.useCache)
        files = (*cache)->load();

    if (!files) {
        auto scanned = enumerate(dir);
        if (!scanned)
            return std::unexpected(scanned.error());

        files = std::move(*scanned);

        if (!files->empty()) {
            const auto STORED = (*cache)->store(*files);
            if (!STORED)
                return std::unexpected(STORED.error());
        }
    }

    auto picked = pickRandomImage(*files, pickOptions(), m_rng);

    if (!picked) {
        // the list may be stale, make the next run look again
        const auto INVALIDATED = (*cache)->invalidate();
        if (!INVALIDATED)
            Debug::log(ERR, "{}", INVALIDATED.error());
        return std::unexpected(std::format("{}: {}", dir, picked.error()));
    }

    return picked;
}
