#pragma once
#include <filesystem>
#include <string>
#include <string_view>

namespace dc {

// "-" names standard input or standard output.
bool is_stdio_path(std::string_view path) noexcept;

// Human-facing name for logs: "<stdin>"/"<stdout>" or the path itself.
std::string display_name(std::string_view path, bool output);

// Ensure parent directories exist; returns false on error.
bool ensure_parent_dirs(const std::filesystem::path& p);

}
