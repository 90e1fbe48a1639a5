#pragma once

#include <chrono>
#include <expected>
#include <optional>
#include <string>
#include <vector>

#include "FileLock.hpp"
#include "../helpers/Memory.hpp"

// The remembered image list of one directory. Opening it takes an exclusive
// lock that is held until the object is destroyed, so a second process asking
// about the same directory waits and then reads what the first one stored.
class CFileListCache {
  public:
    // use open(), which takes the lock first
    CFileListCache(CFileLock&& lock, std::string directory, std::string recordPath, std::chrono::seconds ttl);
    ~CFileListCache() = default;

    CFileListCache(const CFileListCache&) = delete;
    CFileListCache(CFileListCache&)       = delete;
    CFileListCache(CFileListCache&&)      = delete;

    static std::expected<UP<CFileListCache>, std::string> open(const std::string& stateDir, const std::string& directory, std::chrono::seconds ttl);

    // absolute paths, only if the record names exactly our directory and is younger than the ttl
    std::optional<std::vector<std::string>> load();

    // no-op if load() succeeded during this run
    std::expected<void, std::string> store(const std::vector<std::string>& files);

    // drop the record so the next run walks the tree again
    std::expected<void, std::string> invalidate();

    const std::string&               recordPath() const;

    constexpr static const char*     RECORD_MAGIC = "randpaper-filelist 1";

  private:
    CFileLock            m_lock;
    std::string          m_directory;
    std::string          m_recordPath;
    std::chrono::seconds m_ttl;

    bool                 m_loaded = false;
};
