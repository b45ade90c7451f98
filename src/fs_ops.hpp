#pragma once

#include <filesystem>
#include <string>
#include <string_view>

namespace dotsmith {

// All functions throw located_exception (error_kind::io) located at the
// path they operate on.

// Creates `dir` (not its parents). An existing directory is not an error;
// mkdir alone decides whether it already exists.
void ensure_directory(const std::filesystem::path& dir);

std::string read_text_file(const std::filesystem::path& path);

// Creates or truncates `path` and writes `contents` to it.
void write_file(const std::filesystem::path& path, std::string_view contents);

// root / relative, except that an empty relative path yields root itself
// rather than root with a trailing separator.
std::filesystem::path join_relative(const std::filesystem::path& root,
                                    const std::filesystem::path& relative);

// True if the file name ends with ".tpl".
bool has_template_extension(const std::filesystem::path& path);

} // namespace dotsmith
