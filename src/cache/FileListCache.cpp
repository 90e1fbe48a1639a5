#include "FileListCache.hpp"
#include "../helpers/MiscFunctions.hpp"
#include "../debug/Log.hpp"

#include <cerrno>
#include <charconv>
#include <cstring>
#include <filesystem>
#include <format>
#include <fstream>
#include <unistd.h>

CFileListCache::CFileListCache(CFileLock&& lock, std::string directory, std::string recordPath, std::chrono::seconds ttl) :
    m_lock(std::move(lock)), m_directory(std::move(directory)), m_recordPath(std::move(recordPath)), m_ttl(ttl) {
    ;
}

std::expected<UP<CFileListCache>, std::string> CFileListCache::open(const std::string& stateDir, const std::string& directory, std::chrono::seconds ttl) {
    const auto      LISTS_DIR = stateDir + "/lists";

    std::error_code ec;
    std::filesystem::create_directories(LISTS_DIR, ec);
    if (ec)
        return std::unexpected(std::format("couldn't create {}: {}", LISTS_DIR, ec.message()));

    // one record per directory, so different trees never wait on each other
    const auto RECORD = LISTS_DIR + "/" + hashName(directory) + ".list";

    auto       lock = CFileLock::acquire(RECORD + ".lock");
    if (!lock)
        return std::unexpected(lock.error());

    return makeUnique<CFileListCache>(std::move(*lock), directory, RECORD, ttl);
}

static std::string relativePrefix(const std::string& dir) {
    return dir.ends_with('/') ? dir : dir + "/";
}

std::optional<std::vector<std::string>> CFileListCache::load() {
    std::ifstream ifs(m_recordPath);

    if (!ifs.good()) {
        Debug::log(TRACE, "No file list at {}", m_recordPath);
        return std::nullopt;
    }

    std::string magic, stamp, dir;
    if (!std::getline(ifs, magic) || !std::getline(ifs, stamp) || !std::getline(ifs, dir) || magic != RECORD_MAGIC) {
        Debug::log(WARN, "File list {} is malformed, ignoring it", m_recordPath);
        return std::nullopt;
    }

    if (dir != m_directory) {
        Debug::log(TRACE, "File list {} belongs to {}, not {}", m_recordPath, dir, m_directory);
        return std::nullopt;
    }

    int64_t    written = 0;
    const auto [ptr, err] = std::from_chars(stamp.data(), stamp.data() + stamp.size(), written);
    if (err != std::errc{} || ptr != stamp.data() + stamp.size()) {
        Debug::log(WARN, "File list {} has a bad timestamp, ignoring it", m_recordPath);
        return std::nullopt;
    }

    const auto NOW = std::chrono::duration_cast<std::chrono::seconds>(std::chrono::system_clock::now().time_since_epoch()).count();
    const auto AGE = NOW - written;

    if (AGE < 0 || AGE >= m_ttl.count()) {
        Debug::log(TRACE, "File list for {} is {}s old (ttl {}s), rescanning", m_directory, AGE, m_ttl.count());
        return std::nullopt;
    }

    const auto               PREFIX = relativePrefix(m_directory);

    std::vector<std::string> files;
    std::string              line;
    while (std::getline(ifs, line)) {
        if (line.empty())
            continue;
        files.emplace_back(PREFIX + line);
    }

    if (ifs.bad()) {
        Debug::log(WARN, "Error reading file list {}, ignoring it", m_recordPath);
        return std::nullopt;
    }

    Debug::log(LOG, "Using cached file list for {} ({} file(s), {}s old)", m_directory, files.size(), AGE);

    m_loaded = true;
    return files;
}

std::expected<void, std::string> CFileListCache::store(const std::vector<std::string>& files) {
    if (m_loaded) {
        Debug::log(TRACE, "File list for {} was read this run, not rewriting it", m_directory);
        return {};
    }

    const auto PREFIX = relativePrefix(m_directory);
    const auto TMP    = std::format("{}.tmp.{}", m_recordPath, getpid());

    {
        std::ofstream ofs(TMP, std::ios::trunc);
        if (!ofs.good())
            return std::unexpected(std::format("couldn't write {}: {}", TMP, strerror(errno)));

        const auto NOW = std::chrono::duration_cast<std::chrono::seconds>(std::chrono::system_clock::now().time_since_epoch()).count();

        ofs << RECORD_MAGIC << '\n' << NOW << '\n' << m_directory << '\n';

        size_t skipped = 0;
        for (const auto& f : files) {
            if (!f.starts_with(PREFIX) || f.contains('\n')) {
                skipped++;
                continue;
            }
            ofs << std::string_view{f}.substr(PREFIX.size()) << '\n';
        }

        if (skipped)
            Debug::log(TRACE, "Left {} path(s) out of the file list for {}", skipped, m_directory);

        ofs.flush();
        if (!ofs.good()) {
            std::error_code ec;
            std::filesystem::remove(TMP, ec);
            return std::unexpected(std::format("couldn't write {}", TMP));
        }
    }

    std::error_code ec;
    std::filesystem::rename(TMP, m_recordPath, ec);
    if (ec) {
        std::error_code ec2;
        std::filesystem::remove(TMP, ec2);
        return std::unexpected(std::format("couldn't replace {}: {}", m_recordPath, ec.message()));
    }

    Debug::log(LOG, "Stored file list for {} ({} file(s))", m_directory, files.size());

    return {};
}

std::expected<void, std::string> CFileListCache::invalidate() {
    std::error_code ec;
    std::filesystem::remove(m_recordPath, ec);

    if (ec)
        return std::unexpected(std::format("couldn't remove {}: {}", m_recordPath, ec.message()));

    m_loaded = false;

    Debug::log(LOG, "Invalidated file list for {}", m_directory);

    return {};
}

const std::string& CFileListCache::recordPath() const {
    return m_recordPath;
}
