/**
 * @file RunLock.hpp
 * @brief Exclusive advisory lock on an output root, held for the lifetime of a run.
 */

#pragma once

#include <string>

namespace adaharvest::infrastructure {

/**
 * @class RunLock
 * @brief flock(2) on <root>/run/lock. Released by the destructor or by process exit,
 *        so a crashed run never leaves a stale lock behind.
 */
class RunLock {
public:
    /** @throws domain::StorageError when the lock file cannot be opened or another process holds it. */
    explicit RunLock(const std::string& root);
    ~RunLock();

    RunLock(const RunLock&) = delete;
    RunLock& operator=(const RunLock&) = delete;

private:
    int m_fd = -1;
};

} // namespace adaharvest::infrastructure
