#include "util/file.hpp"

#include <fcntl.h>
#include <ftw.h>
#include <limits.h>
#include <stdlib.h>
#include <string.h>
#include <sys/stat.h>
#include <unistd.h>

#include <vector>

#include "absl/strings/str_join.h"
#include "absl/strings/str_split.h"
#include "glog/logging.h"

namespace {

static const constexpr char* kPathSeparators = "/";
static const constexpr size_t kReadBufSize = 32 * 1024;

bool MkDir(const std::string& dir) {
  return mkdir(dir.c_str(), S_IRWXU | S_IRWXG | S_IXOTH) != -1 ||
         errno == EEXIST;
}

bool OsRemoveTree(const std::string& path) {
  return nftw(path.c_str(),
              [](const char* fpath, const struct stat* sb, int typeflags,
                 struct FTW* ftwbuf) { return remove(fpath); },
              64, FTW_DEPTH | FTW_PHYS | FTW_MOUNT) != -1;
}

std::string OsTempDir(const std::string& path, const std::string& prefix) {
  std::string tmp = util::File::JoinPath(path, prefix + "XXXXXX");
  std::vector<char> data(tmp.begin(), tmp.end());
  data.push_back('\0');
  if (mkdtemp(data.data()) == nullptr) {
    return "";
  }
  return data.data();
}

int OsTempFile(const std::string& path, std::string* tmp) {
  *tmp = path + ".XXXXXX";
  std::vector<char> data(tmp->begin(), tmp->end());
  data.push_back('\0');
  int fd = mkostemp(data.data(), O_CLOEXEC);
  *tmp = data.data();
  return fd;
}

// Returns errno, or 0 on success.
int OsAtomicMove(const std::string& src, const std::string& dst,
                 bool overwrite) {
  if (overwrite) {
    if (rename(src.c_str(), dst.c_str()) == -1) return errno;
    return 0;
  }
  if (link(src.c_str(), dst.c_str()) == -1) return errno;
  return remove(src.c_str()) != -1 ? 0 : errno;
}

int OsRead(const std::string& path, std::string* content) {
  int fd = open(path.c_str(), O_CLOEXEC | O_RDONLY);
  if (fd == -1) return errno;
  char buf[kReadBufSize];
  ssize_t amount;
  while ((amount = read(fd, buf, kReadBufSize))) {
    if (amount == -1 && errno == EINTR) continue;
    if (amount == -1) break;
    content->append(buf, amount);
  }
  if (amount == -1) {
    int error = errno;
    close(fd);
    return error;
  }
  return close(fd) == -1 ? errno : 0;
}

int OsWrite(const std::string& path, const std::string& content,
            bool overwrite) {
  std::string temp_file;
  int fd = OsTempFile(path, &temp_file);
  if (fd == -1) return errno;
  size_t pos = 0;
  while (pos < content.size()) {
    ssize_t written = write(fd, content.data() + pos, content.size() - pos);
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
  int error = OsAtomicMove(temp_file, path, overwrite);
  if (error) remove(temp_file.c_str());
  return error;
}

// Returns the canonical form of the deepest existing ancestor of path
// (path itself included), or an empty string.
std::string RealExistingPrefix(std::string path) {
  while (true) {
    char buf[PATH_MAX] = {};
    if (realpath(path.c_str(), buf) != nullptr) return buf;
    if (errno != ENOENT && errno != ENOTDIR) return "";
    std::string parent = util::File::BaseDir(path);
    if (parent == path || parent.empty()) return "";
    path = parent;
  }
}

bool IsWithin(const std::string& root, const std::string& path) {
  if (path == root) return true;
  if (root == "/") return true;
  return path.size() > root.size() && path.compare(0, root.size(), root) == 0 &&
         path[root.size()] == '/';
}

}  // namespace

namespace util {

std::string File::Read(const std::string& path) {
  std::string content;
  int err = OsRead(path, &content);
  if (err == ENOENT) throw file_not_found("Read " + path);
  if (err) throw std::system_error(err, std::system_category(), "Read " + path);
  return content;
}

void File::Write(const std::string& path, const std::string& content,
                 bool overwrite) {
  MakeDirs(BaseDir(path));
  if (!overwrite && Size(path) >= 0) throw file_exists("Write " + path);
  int err = OsWrite(path, content, overwrite);
  if (err == EEXIST) throw file_exists("Write " + path);
  if (err) {
    throw std::system_error(err, std::system_category(), "Write " + path);
  }
}

void File::MakeDirs(const std::string& path) {
  if (path.empty()) return;
  size_t pos = 0;
  while (pos != std::string::npos) {
    pos = path.find_first_of(kPathSeparators, pos + 1);
    if (!MkDir(path.substr(0, pos))) {
      throw std::system_error(errno, std::system_category(), "mkdir " + path);
    }
  }
}

void File::Remove(const std::string& path) {
  if (remove(path.c_str()) == -1)
    throw std::system_error(errno, std::system_category(), "remove " + path);
}

void File::RemoveTree(const std::string& path) {
  if (!OsRemoveTree(path))
    throw std::system_error(errno, std::system_category(),
                            "removetree " + path);
}

std::string File::JoinPath(const std::string& first,
                           const std::string& second) {
  if (second.empty()) return first;
  if (first.empty() || strchr(kPathSeparators, second[0])) return second;
  if (first.back() == kPathSeparators[0]) return first + second;
  return first + kPathSeparators[0] + second;
}

std::string File::BaseDir(const std::string& path) {
  size_t pos = path.find_last_of(kPathSeparators);
  if (pos == std::string::npos) return "";
  if (pos == 0) return kPathSeparators;
  return path.substr(0, pos);
}

int64_t File::Size(const std::string& path) {
  struct stat buffer {};
  if (stat(path.c_str(), &buffer) == -1) return -1;
  return buffer.st_size;
}

bool File::Exists(const std::string& path) {
  struct stat buffer {};
  return stat(path.c_str(), &buffer) == 0;
}

std::string File::Normalize(const std::string& path) {
  bool absolute = !path.empty() && path[0] == kPathSeparators[0];
  std::vector<std::string> parts;
  for (absl::string_view part :
       absl::StrSplit(path, kPathSeparators[0], absl::SkipEmpty())) {
    if (part == ".") continue;
    if (part == "..") {
      if (!parts.empty() && parts.back() != "..") {
        parts.pop_back();
      } else if (!absolute) {
        parts.emplace_back("..");
      }
      continue;
    }
    parts.emplace_back(part);
  }
  std::string joined = absl::StrJoin(parts, kPathSeparators);
  if (absolute) return kPathSeparators + joined;
  return joined.empty() ? "." : joined;
}

bool File::ResolveWithin(const std::string& root, const std::string& path,
                         std::string* resolved) {
  std::string base = Normalize(root);
  size_t start = path.find_first_not_of(kPathSeparators);
  std::string relative =
      start == std::string::npos ? "" : Normalize(path.substr(start));
  if (relative == "..") return false;
  if (relative.compare(0, 3, "../") == 0) return false;
  std::string candidate =
      relative == "." || relative.empty() ? base : JoinPath(base, relative);
  if (!IsWithin(base, candidate)) return false;

  // Symbolic links may point anywhere: compare canonical forms.
  std::string real_root = RealExistingPrefix(base);
  std::string real_candidate = RealExistingPrefix(candidate);
  if (real_root.empty() || real_candidate.empty()) return false;
  if (!IsWithin(real_root, real_candidate)) return false;
  *resolved = candidate;
  return true;
}

TempDir::TempDir(const std::string& base, const std::string& prefix) {
  File::MakeDirs(base);
  path_ = OsTempDir(base, prefix);
  if (path_ == "")
    throw std::system_error(errno, std::system_category(), "mkdtemp");
}
void TempDir::Keep() { keep_ = true; }
const std::string& TempDir::Path() const { return path_; }
TempDir::~TempDir() {
  if (keep_ || path_.empty()) return;
  try {
    File::RemoveTree(path_);
  } catch (const std::system_error& e) {
    LOG(WARNING) << "Failed to remove " << path_ << ": " << e.what();
  }
}

}  // namespace util
