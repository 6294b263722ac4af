#include "path_ops.hpp"
#include <filesystem>
#include <system_error>

namespace fs = std::filesystem;

std::string posix_basename(const std::string& path) {
    auto slash = path.rfind('/');
    if (slash == std::string::npos) return path;
    return path.substr(slash + 1);
}

std::string posix_join(const std::string& a, const std::string& b) {
    if (!b.empty() && b.front() == '/') return b;
    if (a.empty()) return b;
    if (b.empty()) return a.back() == '/' ? a : a + "/";
    if (a.back() == '/') return a + b;
    return a + "/" + b;
}

std::string LocalPathOps::abspath(const std::string& path) {
    std::error_code ec;
    auto abs = fs::absolute(path, ec);
    if (ec) return path;
    return abs.lexically_normal().string();
}

std::string LocalPathOps::basename(const std::string& path) {
    return posix_basename(path);
}

Result<std::uint32_t> LocalPathOps::stat_mode(const std::string& path) {
    std::error_code ec;
    auto st = fs::status(path, ec);
    if (ec) return Result<std::uint32_t>::Err("Cannot stat " + path + ": " + ec.message());
    if (st.type() == fs::file_type::not_found)
        return Result<std::uint32_t>::Err("No such file: " + path);
    return Result<std::uint32_t>::Ok(static_cast<std::uint32_t>(st.permissions() & fs::perms::mask));
}

Result<void> LocalPathOps::chmod(const std::string& path, std::uint32_t mode) {
    std::error_code ec;
    fs::permissions(path, static_cast<fs::perms>(mode) & fs::perms::mask,
                    fs::perm_options::replace, ec);
    if (ec) return Result<void>::Err("Cannot chmod " + path + ": " + ec.message());
    return Result<void>::Ok();
}
