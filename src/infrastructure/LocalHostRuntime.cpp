/**
 * @file LocalHostRuntime.cpp
 * @brief Implementation of LocalHostRuntime.
 */

#include "infrastructure/LocalHostRuntime.hpp"
#include <chrono>
#include <cstdint>
#include <cstdio>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <sstream>

namespace dialog::infrastructure {

namespace fs = std::filesystem;

LocalHostRuntime::LocalHostRuntime() : m_rng(std::random_device{}()) {}

std::optional<std::string> LocalHostRuntime::readFile(const std::string& path) {
    std::ifstream in(path, std::ios::binary);
    if (!in.is_open()) {
        return std::nullopt;
    }
    std::stringstream buffer;
    buffer << in.rdbuf();
    if (in.bad()) {
        std::cerr << "[LocalHostRuntime] Read failed: " << path << std::endl;
        return std::nullopt;
    }
    return buffer.str();
}

bool LocalHostRuntime::writeFile(const std::string& path, const std::string& text) {
    fs::path finalPath = path;

    // Unique temp path: <file>.<ticks>.tmp
    auto ticks = std::chrono::steady_clock::now().time_since_epoch().count();
    fs::path tempPath = finalPath;
    tempPath += "." + std::to_string(ticks) + ".tmp";

    std::error_code ec;
    if (finalPath.has_parent_path()) {
        fs::create_directories(finalPath.parent_path(), ec);
        if (ec) {
            std::cerr << "[LocalHostRuntime] Error creating directories for " << path << ": " << ec.message() << std::endl;
            return false;
        }
    }

    {
        std::ofstream ofs(tempPath, std::ios::binary | std::ios::trunc);
        if (!ofs.is_open()) {
            std::cerr << "[LocalHostRuntime] Failed to open temp file: " << tempPath << std::endl;
            return false;
        }
        ofs << text;
        ofs.flush();
        if (ofs.fail()) {
            std::cerr << "[LocalHostRuntime] Write failed during output: " << tempPath << std::endl;
            ofs.close();
            fs::remove(tempPath, ec);
            return false;
        }
    }

    fs::rename(tempPath, finalPath, ec);
    if (ec) {
        std::cerr << "[LocalHostRuntime] Rename failed: " << ec.message() << std::endl;
        std::error_code cleanup;
        fs::remove(tempPath, cleanup);
        return false;
    }
    return true;
}

bool LocalHostRuntime::deleteFile(const std::string& path) {
    std::error_code ec;
    fs::remove(path, ec);
    if (ec) {
        std::cerr << "[LocalHostRuntime] Delete failed: " << path << ": " << ec.message() << std::endl;
        return false;
    }
    return true;
}

std::vector<std::string> LocalHostRuntime::listFiles(const std::string& directory) {
    std::vector<std::string> names;
    std::error_code ec;
    if (!fs::is_directory(directory, ec)) {
        return names;
    }
    for (const auto& entry : fs::directory_iterator(directory, ec)) {
        if (entry.is_regular_file()) {
            names.push_back(entry.path().filename().string());
        }
    }
    if (ec) {
        std::cerr << "[LocalHostRuntime] Listing failed: " << directory << ": " << ec.message() << std::endl;
    }
    return names;
}

std::string LocalHostRuntime::currentDirectory() {
    std::error_code ec;
    fs::path cwd = fs::current_path(ec);
    if (ec) {
        std::cerr << "[LocalHostRuntime] Cannot read working directory: " << ec.message() << std::endl;
        return ".";
    }
    return cwd.string();
}

std::string LocalHostRuntime::newUniqueId() {
    std::uint64_t hi;
    std::uint64_t lo;
    {
        std::lock_guard<std::mutex> lock(m_rngMutex);
        hi = m_rng();
        lo = m_rng();
    }
    hi = (hi & 0xFFFFFFFFFFFF0FFFULL) | 0x0000000000004000ULL; // version 4
    lo = (lo & 0x3FFFFFFFFFFFFFFFULL) | 0x8000000000000000ULL; // RFC 4122 variant

    char buf[37];
    std::snprintf(buf, sizeof(buf), "%08x-%04x-%04x-%04x-%012llx",
                  static_cast<unsigned>(hi >> 32),
                  static_cast<unsigned>((hi >> 16) & 0xFFFF),
                  static_cast<unsigned>(hi & 0xFFFF),
                  static_cast<unsigned>(lo >> 48),
                  static_cast<unsigned long long>(lo & 0xFFFFFFFFFFFFULL));
    return buf;
}

domain::Timestamp LocalHostRuntime::now() {
    return std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::system_clock::now().time_since_epoch()).count();
}

} // namespace dialog::infrastructure
