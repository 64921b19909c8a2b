#include "infrastructure/PathUtils.hpp"
#include <cerrno>
#include <cstdio>
#include <cstdlib>
#include <fcntl.h>
#include <filesystem>
#include <iostream>

namespace sortwell::infrastructure {

namespace fs = std::filesystem;

fs::path PathUtils::GetDataHome() {
    const char* xdgDataHome = std::getenv("XDG_DATA_HOME");
    if (xdgDataHome && *xdgDataHome) {
        return fs::path(xdgDataHome);
    }
    const char* home = std::getenv("HOME");
    if (home && *home) {
        return fs::path(home) / ".local" / "share";
    }
    return fs::current_path(); // Fallback
}

fs::path PathUtils::GetConfigHome() {
    const char* xdgConfigHome = std::getenv("XDG_CONFIG_HOME");
    if (xdgConfigHome && *xdgConfigHome) {
        return fs::path(xdgConfigHome);
    }
    const char* home = std::getenv("HOME");
    if (home && *home) {
        return fs::path(home) / ".config";
    }
    return fs::current_path();
}

fs::path PathUtils::GetArtifactsDir() {
    fs::path base = GetDataHome() / "sortwell" / "artifacts";
    std::error_code ec;
    fs::create_directories(base, ec);
    if (ec) {
        std::cerr << "[PathUtils] Could not create " << base.string() << ": " << ec.message() << std::endl;
    }
    return base;
}

fs::path PathUtils::Normalize(const fs::path& path) {
    std::error_code ec;
    fs::path abs = fs::absolute(path, ec);
    if (ec) abs = path;
    fs::path normal = abs.lexically_normal();
    // "/a/b/" normalizes to "/a/b/" with an empty filename; drop it.
    if (!normal.has_filename() && normal.has_parent_path() && normal != normal.root_path()) {
        normal = normal.parent_path();
    }
    return normal;
}

bool PathUtils::IsSameOrInside(const fs::path& path, const fs::path& ancestor) {
    std::string p = Normalize(path).generic_string();
    std::string a = Normalize(ancestor).generic_string();
    if (p == a) return true;
    if (!a.empty() && a.back() != '/') a += '/';
    return p.size() > a.size() && p.compare(0, a.size(), a) == 0;
}

std::string PathUtils::RelativeTo(const fs::path& target, const fs::path& base) {
    fs::path nt = Normalize(target);
    if (!IsSameOrInside(nt, base)) {
        return nt.generic_string();
    }
    fs::path rel = nt.lexically_relative(Normalize(base));
    std::string s = rel.generic_string();
    return s.empty() ? "." : s;
}

std::error_code PathUtils::RenameNoReplace(const fs::path& from, const fs::path& to) {
#if defined(__linux__) && defined(RENAME_NOREPLACE)
    if (::renameat2(AT_FDCWD, from.c_str(), AT_FDCWD, to.c_str(), RENAME_NOREPLACE) == 0) {
        return {};
    }
    int err = errno;
    // EINVAL: the filesystem does not support the flag. ENOSYS: the kernel lacks renameat2.
    if (err != EINVAL && err != ENOSYS) {
        return std::error_code(err, std::generic_category());
    }
#endif
    std::error_code ec;
    if (fs::exists(fs::symlink_status(to, ec))) {
        return std::make_error_code(std::errc::file_exists);
    }
    fs::rename(from, to, ec);
    return ec;
}

} // namespace sortwell::infrastructure
