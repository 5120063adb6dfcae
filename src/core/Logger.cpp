/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

// Only compile this file for release builds - debug builds log to stdout inline
#ifndef DEBUG

#include "core/Logger.hpp"

#include <SDL3/SDL.h>

#include <algorithm>
#include <chrono>
#include <filesystem>
#include <format>
#include <fstream>
#include <vector>

#ifndef SWARM_APP_NAME
#define SWARM_APP_NAME "SwarmForge"
#endif

namespace SwarmForge {
namespace {

constexpr size_t KEEP_LOG_FILES = 5;
constexpr size_t FLUSH_EVERY = 50;

// File sink for release builds. Only CRITICAL and ERROR reach it.
class FileLogger {
public:
    static FileLogger& Instance() {
        static FileLogger instance;
        return instance;
    }

    void write(LogLevel level, const char* system, const char* message) {
        std::lock_guard<std::mutex> lock(m_fileMutex);

        if (!m_opened) {
            open();
        }
        if (!m_fileStream.is_open()) {
            return;
        }

        const auto now = std::chrono::floor<std::chrono::milliseconds>(
            std::chrono::system_clock::now());
        m_fileStream << std::format("{:%Y-%m-%d %H:%M:%S} [{}] [{}] {}\n", now,
                                    Logger::getLevelString(level), system,
                                    message);

        if (level == LogLevel::CRITICAL || ++m_pending >= FLUSH_EVERY) {
            m_fileStream.flush();
            m_pending = 0;
        }
    }

    FileLogger(const FileLogger&) = delete;
    FileLogger& operator=(const FileLogger&) = delete;

private:
    FileLogger() = default;

    ~FileLogger() {
        if (m_fileStream.is_open()) {
            m_fileStream.flush();
        }
    }

    void open() {
        m_opened = true;

        char* prefPath = SDL_GetPrefPath("HammerForged", SWARM_APP_NAME);
        if (prefPath == nullptr) {
            return;
        }

        namespace fs = std::filesystem;
        const fs::path logDir = fs::path(prefPath) / "logs";
        SDL_free(prefPath);

        std::error_code ec;
        fs::create_directories(logDir, ec);
        if (ec) {
            return;
        }

        rotate(logDir);

        const auto now = std::chrono::floor<std::chrono::seconds>(
            std::chrono::system_clock::now());
        const fs::path logPath =
            logDir / std::format("swarmforge_{:%Y%m%d_%H%M%S}.log", now);
        m_fileStream.open(logPath, std::ios::out | std::ios::app);

        if (m_fileStream.is_open()) {
            m_fileStream << std::format("=== {} Log ===\nStarted: {:%Y-%m-%d %H:%M:%S}\n\n",
                                        SWARM_APP_NAME, now);
            m_fileStream.flush();
        }
    }

    // Keep the newest KEEP_LOG_FILES - 1 logs so the new one makes KEEP_LOG_FILES
    static void rotate(const std::filesystem::path& logDir) {
        namespace fs = std::filesystem;

        std::vector<fs::directory_entry> logFiles;
        std::error_code ec;
        for (const auto& entry : fs::directory_iterator(logDir, ec)) {
            if (entry.path().extension() == ".log" &&
                entry.path().filename().string().starts_with("swarmforge_")) {
                logFiles.push_back(entry);
            }
        }

        if (logFiles.size() < KEEP_LOG_FILES) {
            return;
        }

        std::sort(logFiles.begin(), logFiles.end(),
                  [](const fs::directory_entry& a, const fs::directory_entry& b) {
                      return a.last_write_time() < b.last_write_time();
                  });

        const size_t toRemove = logFiles.size() - (KEEP_LOG_FILES - 1);
        for (size_t i = 0; i < toRemove; ++i) {
            fs::remove(logFiles[i].path(), ec);
        }
    }

    std::mutex m_fileMutex;
    std::ofstream m_fileStream;
    bool m_opened{false};
    size_t m_pending{0};
};

} // anonymous namespace

void Logger::Log(LogLevel level, const char* system, const std::string& message) {
    Log(level, system, message.c_str());
}

void Logger::Log(LogLevel level, const char* system, const char* message) {
    if (s_benchmarkMode.load(std::memory_order_relaxed)) {
        return;
    }
    FileLogger::Instance().write(level, system, message);
}

} // namespace SwarmForge

#endif // ifndef DEBUG
