#include "hawk_file_utils.h"
#include "logger.h"
#include <fstream>
#include <sstream>
#include <cstdio>
#include <cstring>
#include <cerrno>
#include <sys/stat.h>
#include <fcntl.h>
#include <unistd.h>

namespace hawk {

bool FileExists(const std::string& path) {
  struct stat st;
  return stat(path.c_str(), &st) == 0;
}

bool CreateDirectoryIfNeeded(const std::string& dir_path) {
  if (dir_path.empty()) {
    return true;
  }

  struct stat st;
  if (stat(dir_path.c_str(), &st) == 0) {
    return S_ISDIR(st.st_mode);
  }

  size_t slash = dir_path.find_last_of('/');
  if (slash != std::string::npos && slash > 0) {
    if (!CreateDirectoryIfNeeded(dir_path.substr(0, slash))) {
      return false;
    }
  }

  if (mkdir(dir_path.c_str(), 0755) != 0 && errno != EEXIST) {
    LOG_ERROR("FileUtils", "mkdir failed for " + dir_path + ": " + std::strerror(errno));
    return false;
  }
  return true;
}

bool EnsureParentDirectory(const std::string& file_path) {
  size_t slash = file_path.find_last_of('/');
  if (slash == std::string::npos || slash == 0) {
    return true;
  }
  return CreateDirectoryIfNeeded(file_path.substr(0, slash));
}

bool ReadFileToString(const std::string& path, std::string* content) {
  std::ifstream in(path, std::ios::binary);
  if (!in.is_open()) {
    return false;
  }
  std::ostringstream buffer;
  buffer << in.rdbuf();
  *content = buffer.str();
  return true;
}

bool WriteFileAtomic(const std::string& path, const std::string& content) {
  if (!EnsureParentDirectory(path)) {
    return false;
  }

  std::string tmp_path = path + ".tmp";
  {
    std::ofstream out(tmp_path, std::ios::binary | std::ios::trunc);
    if (!out.is_open()) {
      LOG_ERROR("FileUtils", "Cannot open " + tmp_path + " for writing");
      return false;
    }
    out << content;
    out.flush();
    if (!out) {
      LOG_ERROR("FileUtils", "Write failed for " + tmp_path);
      std::remove(tmp_path.c_str());
      return false;
    }
  }

  if (std::rename(tmp_path.c_str(), path.c_str()) != 0) {
    LOG_ERROR("FileUtils", "rename " + tmp_path + " -> " + path + " failed: " +
              std::strerror(errno));
    std::remove(tmp_path.c_str());
    return false;
  }
  return true;
}

bool AppendToFile(const std::string& path, const std::string& content) {
  if (!EnsureParentDirectory(path)) {
    return false;
  }

  int fd = open(path.c_str(), O_WRONLY | O_CREAT | O_APPEND, 0644);
  if (fd < 0) {
    LOG_ERROR("FileUtils", "Cannot open " + path + " for append: " + std::strerror(errno));
    return false;
  }

  size_t total = 0;
  while (total < content.size()) {
    ssize_t written = write(fd, content.data() + total, content.size() - total);
    if (written < 0) {
      if (errno == EINTR) continue;
      LOG_ERROR("FileUtils", "Append to " + path + " failed: " + std::strerror(errno));
      close(fd);
      return false;
    }
    total += static_cast<size_t>(written);
  }
  close(fd);
  return true;
}

std::string JoinPath(const std::string& dir, const std::string& name) {
  if (dir.empty()) return name;
  if (dir.back() == '/') return dir + name;
  return dir + "/" + name;
}

}  // namespace hawk
