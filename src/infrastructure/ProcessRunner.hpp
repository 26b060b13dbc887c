/**
 * @file ProcessRunner.hpp
 * @brief Runs external tools with captured output, a deadline and cancellation.
 */

#pragma once

#include <chrono>
#include <string>
#include <vector>
#include "domain/CancellationToken.hpp"

namespace adaharvest::infrastructure {

class ProcessRunner {
public:
    struct Result {
        int exitCode = -1;
        bool timedOut = false;
        std::string out;
        std::string err;

        bool ok() const { return exitCode == 0 && !timedOut; }
    };

    /**
     * @brief Runs @p argv (no shell) in its own process group.
     *
     * The whole group is terminated when @p token fires or @p timeout elapses.
     * @throws domain::CancelledError when cancelled.
     * @throws std::runtime_error when the process cannot be started or its output
     *         cannot be waited on; the process group is killed first.
     */
    static Result Run(const std::vector<std::string>& argv,
                      const domain::CancellationToken& token,
                      std::chrono::seconds timeout);

    /** @brief True when @p tool resolves on PATH. */
    static bool HasTool(const std::string& tool);
};

} // namespace adaharvest::infrastructure
