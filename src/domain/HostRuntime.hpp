/**
 * @file HostRuntime.hpp
 * @brief Interface to the process-boundary primitives the storage core relies on.
 */

#pragma once
#include <optional>
#include <string>
#include <vector>
#include "domain/NoteRecord.hpp"

namespace dialog::domain {

/**
 * @class HostRuntime
 * @brief File I/O, working directory, id and clock primitives provided by the host.
 *
 * Implementations must tolerate calls from the persistence worker and the
 * metadata debounce thread in addition to the UI thread.
 */
class HostRuntime {
public:
    virtual ~HostRuntime() = default;

    /**
     * @brief Reads a whole text file.
     * @return File contents, or nullopt if it is missing or unreadable.
     */
    virtual std::optional<std::string> readFile(const std::string& path) = 0;

    /**
     * @brief Writes a whole text file, creating parent directories as needed.
     * @return False on failure.
     */
    virtual bool writeFile(const std::string& path, const std::string& text) = 0;

    /** @brief Removes a file. @return False if it could not be removed. */
    /** @brief Removes a file. A file that is already gone counts as success. */
    virtual bool deleteFile(const std::string& path) = 0;

    /** @brief Names (not paths) of the regular files in a directory. Empty if it does not exist. */
    virtual std::vector<std::string> listFiles(const std::string& directory) = 0;

    virtual std::string currentDirectory() = 0;

    virtual std::string newUniqueId() = 0;

    /** @brief Wall clock in milliseconds since the epoch. */
    virtual Timestamp now() = 0;
};

} // namespace dialog::domain
