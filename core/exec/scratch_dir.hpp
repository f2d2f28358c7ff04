#pragma once

#include <string>

namespace codegym {

// ─── Scratch Directory ─────────────────────────────────────────
// A uniquely named directory under the system temp dir that exists
// for the lifetime of the object. The whole tree is removed in the
// destructor, whatever path the owner leaves by.

class ScratchDir {
public:
    /// Create the directory. Throws std::runtime_error on failure.
    explicit ScratchDir(const std::string& prefix = "codegym");
    ~ScratchDir();

    ScratchDir(const ScratchDir&) = delete;
    ScratchDir& operator=(const ScratchDir&) = delete;
    ScratchDir(ScratchDir&& other) noexcept;
    ScratchDir& operator=(ScratchDir&& other) noexcept;

    const std::string& path() const { return path_; }

    /// Write (or overwrite) a file relative to the directory.
    /// Returns the absolute path. Throws std::runtime_error on I/O failure.
    std::string writeFile(const std::string& name, const std::string& content) const;

private:
    std::string path_;

    void release();
};

} // namespace codegym
