#include "util/temp_dir.hpp"
#include <spdlog/spdlog.h>

#include <cerrno>
#include <cstdlib>
#include <cstring>
#include <filesystem>
#include <fstream>
#include <stdexcept>
#include <vector>

namespace fs = std::filesystem;

namespace codebox::util {

TempDir::TempDir(const std::string& prefix) {
    std::string tmpl = (fs::temp_directory_path() / (prefix + "XXXXXX")).string();
    std::vector<char> buf(tmpl.begin(), tmpl.end());
    buf.push_back('\0');

    if (mkdtemp(buf.data()) == nullptr) {
        throw std::runtime_error(std::string("mkdtemp failed: ") + strerror(errno));
    }
    path_ = buf.data();

    // Readable by the unprivileged sandbox user
    std::error_code ec;
    fs::permissions(path_, fs::perms::owner_all | fs::perms::group_read | fs::perms::group_exec |
                           fs::perms::others_read | fs::perms::others_exec, ec);
    if (ec) {
        spdlog::warn("Cannot relax permissions on {}: {}", path_, ec.message());
    }
}

TempDir::~TempDir() {
    std::error_code ec;
    fs::remove_all(path_, ec);
    if (ec) {
        spdlog::warn("Failed to remove temp dir {}: {}", path_, ec.message());
    }
}

std::string TempDir::write_file(const std::string& name, const std::string& content) const {
    fs::path file = fs::path(path_) / name;
    std::ofstream ofs(file, std::ios::binary);
    if (!ofs.is_open()) {
        throw std::runtime_error("cannot create " + file.string());
    }
    ofs << content;
    ofs.close();
    if (!ofs) {
        throw std::runtime_error("cannot write " + file.string());
    }
    return file.string();
}

} // namespace codebox::util
