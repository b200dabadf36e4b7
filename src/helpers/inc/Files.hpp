#ifndef WARDEN_HELPERS_FILES_HPP
#define WARDEN_HELPERS_FILES_HPP
/**
 * @file Files.hpp
 * @brief File I/O and path utilities for procfs and the audit log.
 *
 * Uses C-style I/O (open/read/close) throughout so that a file that vanishes
 * mid-read (a process exiting under /proc) is reported as a plain failure.
 */

#include <dirent.h>   // opendir, readdir, closedir
#include <fcntl.h>    // open, O_RDONLY, O_CLOEXEC
#include <unistd.h>   // read, close, readlink

#include <array>
#include <cerrno>
#include <cstddef>
#include <string>
#include <vector>

namespace warden {
namespace helpers {
namespace files {

/* ----------------------------- Constants ----------------------------- */

/// Chunk size for whole-file reads.
inline constexpr std::size_t FILE_READ_CHUNK_SIZE = 4096;

/// Upper bound on whole-file reads (procfs files are small).
inline constexpr std::size_t FILE_READ_MAX_BYTES = 1U << 20;

/* ----------------------------- File Reading ----------------------------- */

/**
 * @brief Read an entire file into a string.
 * @param path File path to read.
 * @param out Output; cleared first.
 * @return true if the file was opened and read without error (may be empty).
 *
 * Reads at most FILE_READ_MAX_BYTES. Content is returned verbatim (procfs
 * cmdline keeps its NUL separators).
 */
[[nodiscard]] inline bool readFileToString(const char* path, std::string& out) {
  out.clear();
  if (path == nullptr) {
    return false;
  }

  const int FD = ::open(path, O_RDONLY | O_CLOEXEC);
  if (FD < 0) {
    return false;
  }

  std::array<char, FILE_READ_CHUNK_SIZE> chunk{};
  bool ok = true;
  while (out.size() < FILE_READ_MAX_BYTES) {
    const ssize_t N = ::read(FD, chunk.data(), chunk.size());
    if (N < 0) {
      if (errno == EINTR) {
        continue;
      }
      ok = false;
      break;
    }
    if (N == 0) {
      break;
    }
    out.append(chunk.data(), static_cast<std::size_t>(N));
  }

  ::close(FD);
  return ok;
}

/**
 * @brief Read an entire file into a string.
 * @param path File path to read.
 * @param out Output; cleared first.
 * @return true on success.
 */
[[nodiscard]] inline bool readFileToString(const std::string& path, std::string& out) {
  return readFileToString(path.c_str(), out);
}

/**
 * @brief Read the target of a symbolic link.
 * @param path Link path.
 * @param out Output; cleared first.
 * @return false if the link cannot be read (missing, not a link, no permission).
 */
[[nodiscard]] inline bool readLink(const std::string& path, std::string& out) {
  out.clear();
  std::array<char, 4096> buf{};
  const ssize_t N = ::readlink(path.c_str(), buf.data(), buf.size());
  if (N <= 0 || static_cast<std::size_t>(N) >= buf.size()) {
    return false;
  }
  out.assign(buf.data(), static_cast<std::size_t>(N));
  return true;
}

/* ----------------------------- Directories ----------------------------- */

/**
 * @brief List entry names in a directory (excluding "." and "..").
 * @param path Directory path.
 * @return Names in readdir order; empty on error.
 */
[[nodiscard]] inline std::vector<std::string> listDirectory(const char* path) {
  std::vector<std::string> out;
  if (path == nullptr) {
    return out;
  }
  DIR* dir = ::opendir(path);
  if (dir == nullptr) {
    return out;
  }
  while (const dirent* ent = ::readdir(dir)) {
    const std::string NAME = ent->d_name;
    if (NAME == "." || NAME == "..") {
      continue;
    }
    out.push_back(NAME);
  }
  ::closedir(dir);
  return out;
}

} // namespace files
} // namespace helpers
} // namespace warden

#endif // WARDEN_HELPERS_FILES_HPP
