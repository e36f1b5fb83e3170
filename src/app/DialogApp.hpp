/**
 * @file DialogApp.hpp
 * @brief Command-line front end over the storage core.
 */

#pragma once

#include <memory>
#include <string>
#include <vector>
#include "application/StorageContext.hpp"

namespace dialog::app {

/**
 * @class DialogApp
 * @brief Opens the storage in the current directory, runs one command and shuts down cleanly.
 */
class DialogApp {
public:
    /**
     * @brief Runs a single command.
     * @param args Command followed by its arguments (program name excluded).
     * @return Exit code (0 for success).
     */
    int Run(const std::vector<std::string>& args);

private:
    /**
     * @brief Creates the storage context and runs the startup sequence.
     * @return True if initialization succeeded.
     */
    bool Init();

    /** @brief Flushes and releases the storage context. */
    void Shutdown();

    int Dispatch(const std::vector<std::string>& args);
    int PrintUsage() const;

    std::unique_ptr<application::StorageContext> m_storage; ///< Storage for the current directory.
};

} // namespace dialog::app
