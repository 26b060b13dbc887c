/**
 * @file Log.hpp
 * @brief Component-tagged console lines, written whole so worker threads never interleave.
 */

#pragma once

#include <atomic>
#include <iostream>
#include <string>

namespace adaharvest::infrastructure {

class Log {
public:
    /** @brief Quiet mode drops Info lines. Warnings and errors are always printed. */
    static void SetQuiet(bool quiet) { QuietFlag() = quiet; }

    static void Info(const std::string& component, const std::string& message) {
        if (QuietFlag()) return;
        std::cout << ("[" + component + "] " + message + "\n") << std::flush;
    }

    static void Warn(const std::string& component, const std::string& message) {
        std::cerr << ("[" + component + "] " + message + "\n");
    }

private:
    static std::atomic<bool>& QuietFlag() {
        static std::atomic<bool> quiet{false};
        return quiet;
    }
};

} // namespace adaharvest::infrastructure
