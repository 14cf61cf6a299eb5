#ifndef CODEJUDGE_UTILS_H_
#define CODEJUDGE_UTILS_H_

#include <string>
#include <filesystem>

#include <codejudge/utils.h>

namespace fs = std::filesystem;

constexpr fs::perms kPerm666 =
    fs::perms::owner_read | fs::perms::owner_write |
    fs::perms::group_read | fs::perms::group_write |
    fs::perms::others_read | fs::perms::others_write;

bool CreateDirs(const fs::path&, fs::perms = fs::perms::unknown);
bool RemoveAll(const fs::path&);
bool WriteFile(const fs::path&, const std::string& content, fs::perms = fs::perms::unknown);
// read at most max_bytes; empty string if the file does not exist
std::string ReadFileHead(const fs::path&, size_t max_bytes);

// Removes a directory tree when going out of scope.
class ScopedDir {
  fs::path path_;
 public:
  explicit ScopedDir(fs::path path) : path_(std::move(path)) {}
  ~ScopedDir() { RemoveAll(path_); }
  ScopedDir(const ScopedDir&) = delete;
  ScopedDir& operator=(const ScopedDir&) = delete;
  const fs::path& Path() const { return path_; }
};

#endif  // CODEJUDGE_UTILS_H_
