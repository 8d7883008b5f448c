#pragma once

#include <atomic>
#include <filesystem>
#include <fstream>
#include <string>
#include <string_view>

#include <fmt/format.h>
#include <unistd.h>

#include "cookd/utils/canonical_path.hpp"

namespace cookd::test {

// Scratch directory under the system temp path, removed on destruction.
class TempWorkspace {
 public:
  TempWorkspace() {
    static std::atomic<int> counter{0};
    root_ = std::filesystem::temp_directory_path() /
            fmt::format("cookd_test_{}_{}", ::getpid(), counter++);
    std::filesystem::create_directories(root_);
  }

  ~TempWorkspace() {
    std::error_code ec;
    std::filesystem::remove_all(root_, ec);
  }

  TempWorkspace(const TempWorkspace&) = delete;
  auto operator=(const TempWorkspace&) -> TempWorkspace& = delete;
  TempWorkspace(TempWorkspace&&) = delete;
  auto operator=(TempWorkspace&&) -> TempWorkspace& = delete;

  // Creates parent directories as needed. Returns the absolute path.
  auto WriteFile(std::string_view relative, std::string_view content)
      -> std::filesystem::path {
    auto path = root_ / relative;
    std::filesystem::create_directories(path.parent_path());
    std::ofstream file(path, std::ios::binary);
    file << content;
    return path;
  }

  void RemoveFile(std::string_view relative) {
    std::filesystem::remove(root_ / relative);
  }

  [[nodiscard]] auto Root() const -> CanonicalPath {
    return CanonicalPath(root_);
  }

  [[nodiscard]] auto Uri() const -> std::string {
    return Root().ToUri();
  }

 private:
  std::filesystem::path root_;
};

}  // namespace cookd::test
