/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef LOG_FILE_HPP
#define LOG_FILE_HPP

#include <cstddef>
#include <ctime>
#include <filesystem>
#include <fstream>
#include <string>

namespace HexCrawl {

/**
 * @brief One session log file inside a rotating log directory
 *
 * Files are named hexcrawl_YYYYMMDD_HHMMSS.log, with a _N suffix when a
 * file for the same second already exists. Opening prunes the oldest
 * session files so that, with the new file, at most keepCount remain.
 *
 * Lines are buffered and flushed every FLUSH_INTERVAL writes, or at once
 * for CRITICAL. Not thread-safe; the release Logger serializes access.
 */
class LogFile {
public:
  static constexpr size_t DEFAULT_KEEP_COUNT = 5;
  static constexpr size_t FLUSH_INTERVAL = 50;

  explicit LogFile(std::filesystem::path directory,
                   size_t keepCount = DEFAULT_KEEP_COUNT);
  ~LogFile();

  LogFile(const LogFile &) = delete;
  LogFile &operator=(const LogFile &) = delete;

  /**
   * @brief Create the directory, prune old sessions and open a new file
   * @return false when the directory or file cannot be created
   */
  bool open();

  bool isOpen() const { return m_stream.is_open(); }
  const std::filesystem::path &getPath() const { return m_path; }
  size_t getPendingLines() const { return m_pendingLines; }

  void write(const char *level, const char *system, const char *message);
  void flush();

  // YYYY-MM-DD HH:MM:SS.mmm [LEVEL] [SYSTEM] message
  static std::string formatLine(const std::tm &time, int millis,
                                const char *level, const char *system,
                                const char *message);

  static bool isSessionLog(const std::filesystem::path &path);

  /**
   * @brief Delete the oldest session logs, leaving keepCount - 1 of them
   * @return Number of files removed
   *
   * Other files in the directory are left alone. keepCount 0 is treated as 1.
   */
  static size_t pruneOldLogs(const std::filesystem::path &directory,
                             size_t keepCount);

private:
  std::filesystem::path m_directory;
  std::filesystem::path m_path;
  std::ofstream m_stream;
  size_t m_keepCount;
  size_t m_pendingLines{0};
};

} // namespace HexCrawl

#endif // LOG_FILE_HPP
