/**
 * @file RunLock.cpp
 * @brief Implementation of RunLock.
 */

#include "infrastructure/RunLock.hpp"
#include "domain/PipelineErrors.hpp"

#include <cerrno>
#include <cstring>
#include <filesystem>

#include <fcntl.h>
#include <sys/file.h>
#include <unistd.h>

namespace fs = std::filesystem;

namespace adaharvest::infrastructure {

RunLock::RunLock(const std::string& root) {
    fs::path dir = fs::path(root) / "run";
    std::error_code ec;
    fs::create_directories(dir, ec);
    if (ec) {
        throw domain::StorageError("cannot create " + dir.string() + ": " + ec.message());
    }

    fs::path lockPath = dir / "lock";
    m_fd = ::open(lockPath.c_str(), O_RDWR | O_CREAT | O_CLOEXEC, 0644);
    if (m_fd < 0) {
        throw domain::StorageError("cannot open " + lockPath.string() + ": " + std::strerror(errno));
    }
    if (::flock(m_fd, LOCK_EX | LOCK_NB) != 0) {
        int err = errno;
        ::close(m_fd);
        m_fd = -1;
        if (err == EWOULDBLOCK) {
            throw domain::StorageError("another run is using " + root);
        }
        throw domain::StorageError("cannot lock " + lockPath.string() + ": " + std::strerror(err));
    }
}

RunLock::~RunLock() {
    if (m_fd >= 0) {
        ::flock(m_fd, LOCK_UN);
        ::close(m_fd);
    }
}

} // namespace adaharvest::infrastructure
