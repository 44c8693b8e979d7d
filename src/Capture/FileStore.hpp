#ifndef STREAMCAP_FILE_STORE_HPP_
#define STREAMCAP_FILE_STORE_HPP_

#include <cstddef>
#include <cstdio>
#include <memory>
#include <string>

namespace streamcap {

struct FileCloser {
  void operator()(std::FILE* file) const {
    if (file) std::fclose(file);
  }
};
using FilePtr = std::unique_ptr<std::FILE, FileCloser>;

// 录制文件所在的数据目录。失败均以 IOFailure 抛出。
class FileStore {
 public:
  explicit FileStore(std::string dataDir);

  const std::string& dataDir() const { return dataDir_; }

  // 目录不存在时递归创建
  void ensureDirectory() const;

  std::string pathFor(const std::string& fileName) const;

  // 独占创建：文件已存在时失败
  FilePtr createExclusive(const std::string& path) const;

  static void append(std::FILE* file, const char* data, size_t size,
                     const std::string& path);

  // 文件不存在不算错误；返回是否真正删除了文件
  bool remove(const std::string& path) const;

 private:
  std::string dataDir_;
};

}  // namespace streamcap

#endif  // STREAMCAP_FILE_STORE_HPP_
