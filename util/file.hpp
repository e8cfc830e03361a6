#ifndef UTIL_FILE_HPP
#define UTIL_FILE_HPP

#include <stdint.h>

#include <string>
#include <system_error>

namespace util {

class file_exists : public std::system_error {
 public:
  explicit file_exists(const std::string& msg)
      : std::system_error(EEXIST, std::system_category(), msg) {}
};

class file_not_found : public std::system_error {
 public:
  explicit file_not_found(const std::string& msg)
      : std::system_error(ENOENT, std::system_category(), msg) {}
};

class File {
 public:
  // Reads the whole file specified by path.
  static std::string Read(const std::string& path);

  // Writes content to path. The file is replaced atomically: readers see
  // either the old or the new content.
  static void Write(const std::string& path, const std::string& content,
                    bool overwrite = true);

  // Creates all the folders in path, including the last component.
  static void MakeDirs(const std::string& path);

  // Removes a file.
  static void Remove(const std::string& path);

  // Recursively removes a tree.
  static void RemoveTree(const std::string& path);

  // Joins two paths. An absolute second path is returned unchanged.
  static std::string JoinPath(const std::string& first,
                              const std::string& second);

  // Computes the directory name for a path
  static std::string BaseDir(const std::string& path);

  // Computes a file's size. Returns a negative number in case of errors.
  static int64_t Size(const std::string& path);

  static bool Exists(const std::string& path);

  // Lexically normalizes a path: collapses separators, drops "." and
  // resolves "..". Leading ".." components of a relative path are kept.
  static std::string Normalize(const std::string& path);

  // Resolves path, interpreted relative to root even if it starts with a
  // separator, and stores the result in resolved. Returns false if the result
  // would escape root, either lexically or through a symbolic link.
  static bool ResolveWithin(const std::string& root, const std::string& path,
                            std::string* resolved);
};

class TempDir {
 public:
  // Creates a fresh directory named prefix + random suffix inside base,
  // creating base if needed.
  explicit TempDir(const std::string& base, const std::string& prefix = "");
  const std::string& Path() const;
  void Keep();
  ~TempDir();

  TempDir(TempDir&&) = default;
  TempDir& operator=(TempDir&&) = default;
  TempDir(const TempDir&) = delete;
  TempDir& operator=(const TempDir&) = delete;

 private:
  std::string path_;
  bool keep_ = false;
};

}  // namespace util

#endif
