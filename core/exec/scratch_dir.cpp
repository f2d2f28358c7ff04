#include "exec/scratch_dir.hpp"
#include "util/log.hpp"

#include <cerrno>
#include <cstring>
#include <filesystem>
#include <fstream>
#include <stdexcept>
#include <system_error>
#include <vector>

#include <stdlib.h>

namespace fs = std::filesystem;

namespace codegym {

ScratchDir::ScratchDir(const std::string& prefix) {
    std::error_code ec;
    fs::path base = fs::temp_directory_path(ec);
    if (ec) base = "/tmp";

    std::string templ = (base / (prefix + "-XXXXXX")).string();
    std::vector<char> buf(templ.begin(), templ.end());
    buf.push_back('\0');

    if (!mkdtemp(buf.data())) {
        throw std::runtime_error("Cannot create scratch directory under " +
                                 base.string() + ": " + std::strerror(errno));
    }
    path_ = buf.data();
}

ScratchDir::~ScratchDir() {
    release();
}

ScratchDir::ScratchDir(ScratchDir&& other) noexcept
    : path_(std::move(other.path_)) {
    other.path_.clear();
}

ScratchDir& ScratchDir::operator=(ScratchDir&& other) noexcept {
    if (this != &other) {
        release();
        path_ = std::move(other.path_);
        other.path_.clear();
    }
    return *this;
}

std::string ScratchDir::writeFile(const std::string& name, const std::string& content) const {
    fs::path target = fs::path(path_) / name;
    std::ofstream out(target, std::ios::binary | std::ios::trunc);
    if (!out) {
        throw std::runtime_error("Cannot open " + target.string() + " for writing");
    }
    out << content;
    out.close();
    if (!out) {
        throw std::runtime_error("Failed writing " + target.string());
    }
    return target.string();
}

void ScratchDir::release() {
    if (path_.empty()) return;
    std::error_code ec;
    fs::remove_all(path_, ec);
    if (ec) {
        CODEGYM_LOG_WARN("Failed to remove scratch directory " << path_ << ": " << ec.message());
    }
    path_.clear();
}

} // namespace codegym
