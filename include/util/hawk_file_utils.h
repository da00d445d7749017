#pragma once

#include <string>

namespace hawk {

bool FileExists(const std::string& path);

// mkdir -p for every missing component of dir_path
bool CreateDirectoryIfNeeded(const std::string& dir_path);

// Creates the directory that will hold file_path
bool EnsureParentDirectory(const std::string& file_path);

bool ReadFileToString(const std::string& path, std::string* content);

// Writes to "<path>.tmp" then renames over path, so readers only ever see
// the previous or the new content
bool WriteFileAtomic(const std::string& path, const std::string& content);

// Appends with O_APPEND; the parent directory is created if missing
bool AppendToFile(const std::string& path, const std::string& content);

std::string JoinPath(const std::string& dir, const std::string& name);

}  // namespace hawk
