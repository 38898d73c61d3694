#include "fileio.hpp"
#include <filesystem>
#include <fstream>

namespace fs = std::filesystem;

// true when path lies strictly below base, both lexically normal
static bool is_inside(const fs::path &base, const fs::path &path) {
    fs::path rel = path.lexically_relative(base);
    if (rel.empty() || rel == ".") {
        return false;
    }
    return *rel.begin() != "..";
}

ResolveStatus resolve_path(const std::string &root, const std::string &name, std::string &out) {
    std::error_code ec;
    fs::path base = fs::absolute(root, ec);
    if (ec) {
        return RESOLVE_INVALID_PATH;
    }
    base = base.lexically_normal();
    if (!base.has_filename()) {
        // drop trailing separator so lexically_relative lines up
        base = base.parent_path();
    }
    fs::path requested = (base / fs::path(name)).lexically_normal();
    if (!is_inside(base, requested)) {
        return RESOLVE_INVALID_PATH;
    }
    if (!fs::is_regular_file(requested, ec)) {
        return RESOLVE_NOT_FOUND;
    }
    // symlinks must not lead out of the root either
    fs::path real_base = fs::canonical(base, ec);
    if (ec) {
        return RESOLVE_NOT_FOUND;
    }
    fs::path real = fs::canonical(requested, ec);
    if (ec) {
        return RESOLVE_NOT_FOUND;
    }
    if (!is_inside(real_base, real)) {
        return RESOLVE_INVALID_PATH;
    }
    out = requested.string();
    return RESOLVE_OK;
}

int64_t file_size(const std::string &path) {
    std::error_code ec;
    uintmax_t size = fs::file_size(path, ec);
    if (ec) {
        return -1;
    }
    return (int64_t)size;
}

bool file_exists(const std::string &path) {
    std::error_code ec;
    return fs::exists(path, ec);
}

int write_file(const std::string &path, const std::vector<uint8_t> &data) {
    std::error_code ec;
    fs::path parent = fs::path(path).parent_path();
    if (!parent.empty()) {
        fs::create_directories(parent, ec);
        if (ec) {
            return -1;
        }
    }
    std::ofstream out(path, std::ios::binary | std::ios::trunc);
    if (!out) {
        return -1;
    }
    out.write(reinterpret_cast<const char *>(data.data()), data.size());
    out.close();
    if (out.fail()) {
        return -1;
    }
    return 0;
}
