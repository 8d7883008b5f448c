#include "cookd/utils/path_utils.hpp"

#include <algorithm>
#include <cctype>
#include <regex>

#include <fmt/format.h>

namespace cookd {

namespace {

auto HasExtension(
    const std::filesystem::path& path,
    std::initializer_list<std::string_view> exts) -> bool {
  std::string ext = path.extension().string();
  if (ext.empty()) {
    return false;
  }
  std::ranges::transform(ext, ext.begin(), [](unsigned char c) {
    return static_cast<char>(std::tolower(c));
  });
  return std::ranges::find(exts, ext) != exts.end();
}

}  // namespace

auto IsRecipeFile(const std::filesystem::path& path) -> bool {
  return HasExtension(path, {".cook"});
}

auto IsConfigFile(const std::filesystem::path& path) -> bool {
  return path.filename() == ".cookd";
}

auto IsAliasFile(const std::filesystem::path& path) -> bool {
  return path.filename() == "aisle.conf";
}

auto UriToPath(std::string_view uri) -> std::filesystem::path {
  if (!uri.starts_with("file://")) {
    return {uri};
  }

  std::string path(uri.substr(7));

  // file:///C:/path -> C:/path
  if (path.size() >= 3 && path[0] == '/' && path[2] == ':') {
    path = path.substr(1);
  }

  static const std::regex kEscapeRegex("%([0-9A-Fa-f]{2})");

  std::string result;
  std::regex_iterator<std::string::iterator> it(
      path.begin(), path.end(), kEscapeRegex);
  std::regex_iterator<std::string::iterator> end;

  std::size_t last_pos = 0;
  while (it != end) {
    result.append(path, last_pos, it->position() - last_pos);
    auto hex = (*it)[1].str();
    result += static_cast<char>(std::stoi(hex, nullptr, 16));
    last_pos = it->position() + it->length();
    ++it;
  }

  result.append(path, last_pos, path.length() - last_pos);
  return NormalizePath(result);
}

auto PathToUri(const std::filesystem::path& path) -> std::string {
  std::string result = "file://";

  auto raw = path.string();
  if (raw.size() >= 2 && raw[1] == ':') {
    result += '/';
  }

  for (char c : raw) {
    if (c == ' ' || c == '%' || c == '#' || c == '?' ||
        static_cast<unsigned char>(c) > 127 ||
        static_cast<unsigned char>(c) < 32) {
      result += fmt::format("%{:02X}", static_cast<unsigned char>(c));
    } else {
      result += c;
    }
  }

  return result;
}

auto NormalizePath(std::filesystem::path path) -> std::filesystem::path {
  // Only existing files can be canonicalized; unsaved buffers keep their path
  std::error_code ec;
  if (std::filesystem::exists(path, ec)) {
    auto canonical = std::filesystem::canonical(path, ec);
    if (!ec) {
      return canonical;
    }
  }
  return path;
}

}  // namespace cookd
