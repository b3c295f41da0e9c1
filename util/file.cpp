#include "util/file.hpp"

#include <errno.h>
#include <stdint.h>
#include <stdio.h>
#include <stdlib.h>
#include <string.h>

#include <algorithm>
#include <memory>

#include <dirent.h>
#include <fcntl.h>
#include <ftw.h>
#include <sys/stat.h>
#include <unistd.h>

namespace {

static const constexpr char* kPathSeparators = "/";

bool MkDir(const std::string& dir) {
  return mkdir(dir.c_str(), S_IRWXU | S_IRWXG | S_IRWXO) != -1 ||
         errno == EEXIST;
}

bool OsRemoveTree(const std::string& path) {
  return nftw(path.c_str(),
              [](const char* fpath, const struct stat* sb, int typeflags,
                 struct FTW* ftwbuf) { return remove(fpath); },
              64, FTW_DEPTH | FTW_PHYS | FTW_MOUNT) != -1;
}

std::string OsTempDir(const std::string& path) {
  std::string tmp = util::File::JoinPath(path, "XXXXXX");
  std::unique_ptr<char, decltype(&free)> data{strdup(tmp.c_str()), &free};
  if (mkdtemp(data.get()) == nullptr) {
    return "";
  }
  return data.get();
}

// Mode that open(2) with 0666 would give under the current umask. mkostemp
// always creates files with mode 0600.
mode_t DefaultFileMode() {
  mode_t mask = umask(0);
  umask(mask);
  return (S_IRUSR | S_IWUSR | S_IRGRP | S_IWGRP | S_IROTH | S_IWOTH) & ~mask;
}

int OsTempFile(const std::string& path, std::string* tmp) {
  *tmp = path + ".XXXXXX";
  std::unique_ptr<char, decltype(&free)> data{strdup(tmp->c_str()), &free};
  int fd = mkostemp(data.get(), O_CLOEXEC);
  *tmp = data.get();
  return fd;
}

// Returns errno, or 0 on success.
int OsWrite(const std::string& path, const std::string& contents) {
  std::string temp_file;
  int fd = OsTempFile(path, &temp_file);
  if (fd == -1) return errno;
  if (fchmod(fd, DefaultFileMode()) == -1) {
    int error = errno;
    close(fd);
    remove(temp_file.c_str());
    return error;
  }
  size_t pos = 0;
  while (pos < contents.size()) {
    ssize_t written = write(fd, contents.c_str() + pos, contents.size() - pos);
    if (written == -1 && errno == EINTR) continue;
    if (written == -1) {
      int error = errno;
      close(fd);
      remove(temp_file.c_str());
      return error;
    }
    pos += written;
  }
  if (close(fd) == -1) {
    int error = errno;
    remove(temp_file.c_str());
    return error;
  }
  if (rename(temp_file.c_str(), path.c_str()) == -1) {
    int error = errno;
    remove(temp_file.c_str());
    return error;
  }
  return 0;
}

bool OsStat(const std::string& path, struct stat* buffer) {
  return stat(path.c_str(), buffer) == 0;
}

}  // namespace

namespace util {

void File::Write(const std::string& path, const std::string& contents) {
  MakeDirs(BaseDir(path));
  int err = OsWrite(path, contents);
  if (err) {
    throw std::system_error(err, std::system_category(), "Write " + path);
  }
}

void File::MakeDirs(const std::string& path) {
  uint64_t pos = 0;
  while (pos != std::string::npos) {
    pos = path.find_first_of(kPathSeparators, pos + 1);
    if (!MkDir(path.substr(0, pos))) {
      throw std::system_error(errno, std::system_category(),
                              "mkdir " + path.substr(0, pos));
    }
  }
  if (!IsDirectory(path)) {
    throw std::system_error(ENOTDIR, std::system_category(), "mkdir " + path);
  }
}

std::vector<std::string> File::ListDir(const std::string& path) {
  DIR* dir = opendir(path.c_str());
  if (dir == nullptr) {
    if (errno == ENOENT) throw file_not_found("opendir " + path);
    throw std::system_error(errno, std::system_category(), "opendir " + path);
  }
  std::vector<std::string> names;
  errno = 0;
  while (struct dirent* entry = readdir(dir)) {
    std::string name = entry->d_name;
    if (name != "." && name != "..") names.push_back(std::move(name));
    errno = 0;
  }
  int error = errno;
  closedir(dir);
  if (error) {
    throw std::system_error(error, std::system_category(), "readdir " + path);
  }
  std::sort(names.begin(), names.end());
  return names;
}

bool File::IsRegularFile(const std::string& path) {
  struct stat buffer {};
  return OsStat(path, &buffer) && S_ISREG(buffer.st_mode);
}

bool File::IsDirectory(const std::string& path) {
  struct stat buffer {};
  return OsStat(path, &buffer) && S_ISDIR(buffer.st_mode);
}

void File::RemoveTree(const std::string& path) {
  if (!OsRemoveTree(path))
    throw std::system_error(errno, std::system_category(),
                            "removetree " + path);
}

std::string File::JoinPath(const std::string& first,
                           const std::string& second) {
  if (second.empty()) return first;
  if (strchr(kPathSeparators, second[0])) return second;
  if (!first.empty() && first.back() == kPathSeparators[0]) {
    return first + second;
  }
  return first + kPathSeparators[0] + second;
}

std::string File::BaseDir(const std::string& path) {
  size_t pos = path.find_last_of(kPathSeparators);
  if (pos == std::string::npos) return ".";
  if (pos == 0) return "/";
  return path.substr(0, pos);
}

std::string File::Absolute(const std::string& path) {
  if (!path.empty() && path[0] == kPathSeparators[0]) return path;
  std::unique_ptr<char, decltype(&free)> cwd{getcwd(nullptr, 0), &free};
  if (cwd == nullptr) {
    throw std::system_error(errno, std::system_category(), "getcwd");
  }
  return JoinPath(cwd.get(), path);
}

TempDir::TempDir(const std::string& base) {
  File::MakeDirs(base);
  path_ = OsTempDir(base);
  if (path_ == "")
    throw std::system_error(errno, std::system_category(), "mkdtemp");
}
const std::string& TempDir::Path() const { return path_; }
TempDir::~TempDir() {
  if (!path_.empty()) {
    try {
      File::RemoveTree(path_);
    } catch (const std::system_error& e) {
      fprintf(stderr, "%s\n", e.what());
    }
  }
}

}  // namespace util
