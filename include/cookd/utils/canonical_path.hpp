#pragma once

#include <filesystem>
#include <string>
#include <string_view>

#include <fmt/format.h>

namespace cookd {

// Normalized filesystem path used for workspace, config and alias files.
class CanonicalPath {
 public:
  CanonicalPath() = default;

  explicit CanonicalPath(std::filesystem::path path);

  static auto FromUri(std::string_view uri) -> CanonicalPath;

  [[nodiscard]] auto ToUri() const -> std::string;

  [[nodiscard]] auto Path() const -> const std::filesystem::path&;
  [[nodiscard]] auto String() const -> const std::string&;

  [[nodiscard]] auto Empty() const -> bool;

  friend auto operator==(const CanonicalPath& lhs, const CanonicalPath& rhs)
      -> bool {
    return lhs.String() == rhs.String();
  }

  auto operator/(const std::filesystem::path& rhs) const -> CanonicalPath;

 private:
  std::filesystem::path path_;
  std::string string_;
};

}  // namespace cookd

template <>
struct fmt::formatter<cookd::CanonicalPath> : fmt::formatter<std::string> {
  template <typename FormatContext>
  auto format(const cookd::CanonicalPath& p, FormatContext& ctx) const {
    return fmt::formatter<std::string>::format(p.String(), ctx);
  }
};

template <>
struct std::hash<cookd::CanonicalPath> {
  auto operator()(const cookd::CanonicalPath& path) const noexcept
      -> std::size_t {
    return std::hash<std::string>{}(path.String());
  }
};
