#pragma once

#include <expected>
#include <string>

#include <hyprutils/os/FileDescriptor.hpp>

// Exclusive flock(2) on a file, created if needed. Blocks until granted and is
// released when the object dies, on every path out of the owning scope.
class CFileLock {
  public:
    ~CFileLock();

    CFileLock(const CFileLock&)            = delete;
    CFileLock& operator=(const CFileLock&) = delete;
    CFileLock(CFileLock&&)                 = default;
    CFileLock& operator=(CFileLock&&)      = default;

    static std::expected<CFileLock, std::string> acquire(const std::string& path);

    const std::string&                           path() const;
    int                                          fd() const;

  private:
    CFileLock(std::string path, Hyprutils::OS::CFileDescriptor&& fd);

    std::string                    m_path;
    Hyprutils::OS::CFileDescriptor m_fd;
};
