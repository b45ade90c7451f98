#include "fs_ops.hpp"
#include "error.hpp"
#include "template_engine.hpp"
#include <cerrno>
#include <fstream>
#include <iterator>
#include <system_error>

namespace dotsmith {

namespace fs = std::filesystem;

static located_exception last_io_error(const fs::path& path) {
    int err = errno;
    return located_exception(io_error(path, std::error_code(err ? err : EIO, std::generic_category())));
}

void ensure_directory(const fs::path& dir) {
    std::error_code ec;
    fs::create_directory(dir, ec);
    if (ec) throw located_exception(io_error(dir, ec));
}

std::string read_text_file(const fs::path& path) {
    errno = 0;
    std::ifstream file(path, std::ios::binary);
    if (!file) throw last_io_error(path);

    std::string contents{std::istreambuf_iterator<char>(file), std::istreambuf_iterator<char>()};
    if (file.bad()) throw last_io_error(path);
    return contents;
}

void write_file(const fs::path& path, std::string_view contents) {
    errno = 0;
    std::ofstream file(path, std::ios::binary | std::ios::trunc);
    if (!file) throw last_io_error(path);

    file.write(contents.data(), static_cast<std::streamsize>(contents.size()));
    file.close();
    if (file.fail()) throw last_io_error(path);
}

fs::path join_relative(const fs::path& root, const fs::path& relative) {
    return relative.empty() ? root : root / relative;
}

bool has_template_extension(const fs::path& path) {
    auto ext = path.extension().string();
    return ext.size() == template_extension.size() + 1 && ext[0] == '.'
        && std::string_view(ext).substr(1) == template_extension;
}

} // namespace dotsmith
