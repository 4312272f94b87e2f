#include "delim_cleanse/path_utils.hpp"
#include <system_error>

namespace dc {

bool is_stdio_path(std::string_view path) noexcept { return path == "-"; }

std::string display_name(std::string_view path, bool output) {
  if (is_stdio_path(path)) return output ? "<stdout>" : "<stdin>";
  return std::string(path);
}

bool ensure_parent_dirs(const std::filesystem::path& p) {
  std::error_code ec;
  auto parent = p.parent_path();
  if (parent.empty()) return true;
  if (std::filesystem::exists(parent, ec)) return true;
  return std::filesystem::create_directories(parent, ec) || !ec;
}

}
