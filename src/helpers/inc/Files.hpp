#ifndef OPSSETUP_HELPERS_FILES_HPP
#define OPSSETUP_HELPERS_FILES_HPP
/**
 * @file Files.hpp
 * @brief File I/O and path utilities.
 *
 * Uses C-style I/O (open/read/write/close) and stat()/opendir() so that
 * failures map to plain boolean results without exceptions.
 */

#include <dirent.h>   // opendir, readdir, closedir
#include <fcntl.h>    // open, O_RDONLY, O_CLOEXEC
#include <limits.h>   // PATH_MAX
#include <sys/stat.h> // stat, S_ISDIR
#include <unistd.h>   // read, write, close, readlink

#include <algorithm>
#include <cerrno>
#include <cstddef>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace opssetup {
namespace helpers {
namespace files {

/* ----------------------------- Constants ----------------------------- */

/// Chunk size for file reads.
inline constexpr std::size_t FILE_READ_CHUNK_SIZE = 4096;

/* ----------------------------- Path Utilities ----------------------------- */

/**
 * @brief Check if path exists (file, directory, socket, ...).
 * @param path Path to check.
 * @return true if path exists.
 */
[[nodiscard]] inline bool pathExists(const std::string& path) noexcept {
  if (path.empty()) {
    return false;
  }
  struct stat st{};
  return ::stat(path.c_str(), &st) == 0;
}

/**
 * @brief Check if path is a directory.
 * @param path Path to check.
 * @return true if path exists and is a directory.
 */
[[nodiscard]] inline bool isDirectory(const std::string& path) noexcept {
  if (path.empty()) {
    return false;
  }
  struct stat st{};
  if (::stat(path.c_str(), &st) != 0) {
    return false;
  }
  return S_ISDIR(st.st_mode);
}

/**
 * @brief Directory portion of a path ("." when there is none).
 */
[[nodiscard]] inline std::string dirName(std::string_view path) {
  const std::size_t POS = path.rfind('/');
  if (POS == std::string_view::npos) {
    return ".";
  }
  if (POS == 0) {
    return "/";
  }
  return std::string(path.substr(0, POS));
}

/**
 * @brief Directory containing the running executable.
 * @return Absolute directory, or "." if /proc/self/exe cannot be read.
 */
[[nodiscard]] inline std::string executableDirectory() {
  char buf[PATH_MAX];
  const ssize_t LEN = ::readlink("/proc/self/exe", buf, sizeof(buf) - 1);
  if (LEN <= 0) {
    return ".";
  }
  buf[LEN] = '\0';
  return dirName(std::string_view(buf, static_cast<std::size_t>(LEN)));
}

/* ----------------------------- File Reading ----------------------------- */

/**
 * @brief Read an entire file into a string.
 * @param path File path to read.
 * @param out Destination (replaced on success).
 * @return true on success, false if the file cannot be opened or read.
 */
[[nodiscard]] inline bool readFileToString(const std::string& path, std::string& out) {
  const int FD = ::open(path.c_str(), O_RDONLY | O_CLOEXEC);
  if (FD < 0) {
    return false;
  }

  std::string content;
  char buf[FILE_READ_CHUNK_SIZE];
  for (;;) {
    const ssize_t N = ::read(FD, buf, sizeof(buf));
    if (N < 0) {
      if (errno == EINTR) {
        continue;
      }
      ::close(FD);
      return false;
    }
    if (N == 0) {
      break;
    }
    content.append(buf, static_cast<std::size_t>(N));
  }

  ::close(FD);
  out = std::move(content);
  return true;
}

/**
 * @brief List directory entries (excluding dot entries), sorted by name.
 * @param path Directory to enumerate.
 * @param out Destination (replaced on success).
 * @return true on success, false if the directory cannot be opened.
 */
[[nodiscard]] inline bool listDirectory(const std::string& path, std::vector<std::string>& out) {
  DIR* dir = ::opendir(path.c_str());
  if (dir == nullptr) {
    return false;
  }

  std::vector<std::string> names;
  struct dirent* entry = nullptr;
  while ((entry = ::readdir(dir)) != nullptr) {
    // Skip . and .. (and hidden entries)
    if (entry->d_name[0] == '.') {
      continue;
    }
    names.emplace_back(entry->d_name);
  }

  ::closedir(dir);
  std::sort(names.begin(), names.end());
  out = std::move(names);
  return true;
}

/* ----------------------------- File Writing ----------------------------- */

/**
 * @brief Write content to a file, truncating it.
 * @param path File path to write.
 * @param content Bytes to write.
 * @return true if every byte was written.
 */
[[nodiscard]] inline bool writeFile(const std::string& path, std::string_view content) noexcept {
  const int FD = ::open(path.c_str(), O_WRONLY | O_CREAT | O_TRUNC | O_CLOEXEC, 0644);
  if (FD < 0) {
    return false;
  }

  std::size_t written = 0;
  while (written < content.size()) {
    const ssize_t N = ::write(FD, content.data() + written, content.size() - written);
    if (N < 0) {
      if (errno == EINTR) {
        continue;
      }
      ::close(FD);
      return false;
    }
    written += static_cast<std::size_t>(N);
  }

  return ::close(FD) == 0;
}

/**
 * @brief Create an empty file if it does not exist (like `touch`).
 * @param path File path.
 * @return true if the file exists afterwards.
 */
[[nodiscard]] inline bool touchFile(const std::string& path) noexcept {
  const int FD = ::open(path.c_str(), O_WRONLY | O_CREAT | O_CLOEXEC, 0644);
  if (FD < 0) {
    return false;
  }
  return ::close(FD) == 0;
}

} // namespace files
} // namespace helpers
} // namespace opssetup

#endif // OPSSETUP_HELPERS_FILES_HPP
