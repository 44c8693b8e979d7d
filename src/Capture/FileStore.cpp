#include "Capture/FileStore.hpp"

#include <cerrno>
#include <cstring>
#include <filesystem>
#include <system_error>
#include <utility>

#include "TaskManager/errors.hpp"
#include "utils/logger.hpp"

namespace streamcap {

FileStore::FileStore(std::string dataDir) : dataDir_(std::move(dataDir)) {}

void FileStore::ensureDirectory() const {
  std::error_code ec;
  std::filesystem::create_directories(dataDir_, ec);
  if (ec) {
    throw IOFailure("failed to create data directory " + dataDir_ + ": " +
                    ec.message());
  }
}

std::string FileStore::pathFor(const std::string& fileName) const {
  return (std::filesystem::path(dataDir_) / fileName).string();
}

FilePtr FileStore::createExclusive(const std::string& path) const {
  // "x" 对应 O_EXCL
  FilePtr file(std::fopen(path.c_str(), "wbx"));
  if (!file) {
    int err = errno;
    throw IOFailure("failed to create file " + path + ": " +
                    std::strerror(err));
  }
  return file;
}

void FileStore::append(std::FILE* file, const char* data, size_t size,
                       const std::string& path) {
  if (size == 0) return;
  size_t written = std::fwrite(data, 1, size, file);
  if (written != size) {
    int err = errno;
    throw IOFailure("failed to write file " + path + ": " +
                    std::strerror(err));
  }
}

bool FileStore::remove(const std::string& path) const {
  std::error_code ec;
  bool removed = std::filesystem::remove(path, ec);
  if (ec && ec != std::errc::no_such_file_or_directory) {
    throw IOFailure("failed to remove file " + path + ": " + ec.message());
  }
  if (removed) {
    LOG(INFO) << "Removed file " << path;
  }
  return removed;
}

}  // namespace streamcap
