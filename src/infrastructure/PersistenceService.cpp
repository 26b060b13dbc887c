/**
 * @file PersistenceService.cpp
 * @brief Implementation of PersistenceService.
 */

#include "infrastructure/PersistenceService.hpp"
#include "domain/PipelineErrors.hpp"
#include "infrastructure/Log.hpp"

#include <cerrno>
#include <chrono>
#include <cstring>
#include <filesystem>

#include <fcntl.h>
#include <unistd.h>

namespace adaharvest::infrastructure {

namespace fs = std::filesystem;

namespace {

std::string ErrnoMessage(const std::string& what, const fs::path& path) {
    return what + " " + path.string() + ": " + std::strerror(errno);
}

void WriteAll(int fd, const std::string& content, const fs::path& path) {
    const char* data = content.data();
    size_t remaining = content.size();
    while (remaining > 0) {
        ssize_t n = ::write(fd, data, remaining);
        if (n < 0) {
            if (errno == EINTR) continue;
            throw domain::StorageError(ErrnoMessage("write failed for", path));
        }
        data += n;
        remaining -= static_cast<size_t>(n);
    }
}

void SyncDirectory(const fs::path& dir) {
    int fd = ::open(dir.c_str(), O_RDONLY | O_DIRECTORY);
    if (fd < 0) {
        throw domain::StorageError(ErrnoMessage("cannot open directory", dir));
    }
    int rc = ::fsync(fd);
    ::close(fd);
    if (rc != 0) {
        throw domain::StorageError(ErrnoMessage("fsync failed for directory", dir));
    }
}

} // namespace

PersistenceService::PersistenceService() : m_running(true) {
    m_worker = std::thread(&PersistenceService::workerLoop, this);
}

PersistenceService::~PersistenceService() {
    stop();
}

void PersistenceService::stop() {
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        if (!m_running) return;
        m_running = false;
    }
    m_cv.notify_all();

    if (m_worker.joinable()) {
        m_worker.join();
    }
}

void PersistenceService::writeAtomic(const std::string& filename, const std::string& content) {
    fs::path finalPath = filename;

    // Unique temp path: filename.<pid>.<counter>.tmp
    fs::path tempPath = finalPath;
    tempPath += "." + std::to_string(::getpid()) + "." + std::to_string(m_tempCounter++) + ".tmp";

    // 1. Ensure directory exists
    std::error_code ec;
    if (finalPath.has_parent_path()) {
        fs::create_directories(finalPath.parent_path(), ec);
        if (ec) {
            throw domain::StorageError("cannot create directory " + finalPath.parent_path().string() + ": " + ec.message());
        }
    }

    // 2. Write and sync the temp file
    int fd = ::open(tempPath.c_str(), O_WRONLY | O_CREAT | O_TRUNC | O_CLOEXEC, 0644);
    if (fd < 0) {
        throw domain::StorageError(ErrnoMessage("cannot create", tempPath));
    }
    try {
        WriteAll(fd, content, tempPath);
        if (::fsync(fd) != 0) {
            throw domain::StorageError(ErrnoMessage("fsync failed for", tempPath));
        }
    } catch (...) {
        ::close(fd);
        fs::remove(tempPath, ec);
        throw;
    }
    if (::close(fd) != 0) {
        fs::remove(tempPath, ec);
        throw domain::StorageError(ErrnoMessage("close failed for", tempPath));
    }

    // 3. Atomic rename, then make the rename itself durable
    fs::rename(tempPath, finalPath, ec);
    if (ec) {
        fs::remove(tempPath, ec);
        throw domain::StorageError("rename to " + finalPath.string() + " failed");
    }
    SyncDirectory(finalPath.has_parent_path() ? finalPath.parent_path() : fs::current_path());
}

void PersistenceService::saveTextAsync(const std::string& filename, const std::string& content) {
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_queue.push(SaveTask{filename, content});
    }
    m_cv.notify_one();
}

void PersistenceService::flush() {
    std::unique_lock<std::mutex> lock(m_mutex);
    m_drained.wait(lock, [this] { return (m_queue.empty() && !m_busy) || !m_running; });
}

void PersistenceService::workerLoop() {
    while (true) {
        SaveTask task;

        {
            std::unique_lock<std::mutex> lock(m_mutex);
            m_cv.wait(lock, [this] {
                return !m_queue.empty() || !m_running;
            });

            if (!m_running && m_queue.empty()) {
                m_drained.notify_all();
                return; // Exit point
            }

            if (m_queue.empty()) {
                continue; // Spurious wake up
            }

            task = std::move(m_queue.front());
            m_queue.pop();
            m_busy = true;
        }

        // Process outside lock
        try {
            writeAtomic(task.filename, task.content);
        } catch (const std::exception& e) {
            Log::Warn("PersistenceService", std::string("deferred write failed: ") + e.what());
        }

        {
            std::lock_guard<std::mutex> lock(m_mutex);
            m_busy = false;
        }
        m_drained.notify_all();
    }
}

} // namespace adaharvest::infrastructure
