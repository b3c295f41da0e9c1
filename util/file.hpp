#ifndef UTIL_FILE_HPP
#define UTIL_FILE_HPP
#include <string>
#include <system_error>
#include <vector>

namespace util {

class file_not_found : public std::system_error {
 public:
  explicit file_not_found(const std::string& msg)
      : std::system_error(ENOENT, std::system_category(), msg) {}
};

class File {
 public:
  // Writes contents to path, replacing it if it exists. The data is first
  // written to a temporary file in the same directory, which is then renamed
  // over path. The file gets mode 0666 minus the umask.
  static void Write(const std::string& path, const std::string& contents);

  // Creates path and all its missing parents, with mode 0777 minus the
  // umask.
  static void MakeDirs(const std::string& path);

  // Lists the names of the entries of a directory, excluding "." and "..",
  // sorted in ascending byte-wise order.
  static std::vector<std::string> ListDir(const std::string& path);

  // True if path refers (possibly through symlinks) to a regular file.
  static bool IsRegularFile(const std::string& path);

  // True if path refers (possibly through symlinks) to a directory.
  static bool IsDirectory(const std::string& path);

  // Recursively removes a tree.
  static void RemoveTree(const std::string& path);

  // Joins two paths.
  static std::string JoinPath(const std::string& first,
                              const std::string& second);

  // Computes the directory name for a path
  static std::string BaseDir(const std::string& path);

  // Makes a relative path absolute by prefixing the current directory.
  static std::string Absolute(const std::string& path);
};

class TempDir {
 public:
  explicit TempDir(const std::string& base);
  const std::string& Path() const;
  ~TempDir();

  TempDir(TempDir&&) = default;
  TempDir& operator=(TempDir&&) = default;
  TempDir(const TempDir&) = delete;
  TempDir& operator=(const TempDir&) = delete;

 private:
  std::string path_;
};

}  // namespace util

#endif
