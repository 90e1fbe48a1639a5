#include "FileLock.hpp"
#include "../debug/Log.hpp"

#include <cerrno>
#include <cstring>
#include <fcntl.h>
#include <format>
#include <sys/file.h>
#include <unistd.h>

using namespace Hyprutils::OS;

CFileLock::CFileLock(std::string path, CFileDescriptor&& fd) : m_path(std::move(path)), m_fd(std::move(fd)) {
    ;
}

CFileLock::~CFileLock() {
    if (!m_fd.isValid())
        return;

    if (flock(m_fd.get(), LOCK_UN) != 0)
        Debug::log(WARN, "Couldn't unlock {}: {}", m_path, strerror(errno));
    else
        Debug::log(TRACE, "Unlocked {}", m_path);
}

std::expected<CFileLock, std::string> CFileLock::acquire(const std::string& path) {
    CFileDescriptor fd{open(path.c_str(), O_RDWR | O_CREAT | O_CLOEXEC, 0644)};

    if (!fd.isValid())
        return std::unexpected(std::format("couldn't open lock file {}: {}", path, strerror(errno)));

    Debug::log(TRACE, "Locking {}", path);

    while (flock(fd.get(), LOCK_EX) != 0) {
        if (errno == EINTR)
            continue;
        return std::unexpected(std::format("couldn't lock {}: {}", path, strerror(errno)));
    }

    Debug::log(TRACE, "Locked {}", path);

    return CFileLock(path, std::move(fd));
}

const std::string& CFileLock::path() const {
    return m_path;
}

int CFileLock::fd() const {
    return m_fd.get();
}
