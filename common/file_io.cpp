// ============================================================
// file_io.cpp -- Memory-mapped file I/O implementation
// ============================================================

#include "file_io.hpp"
#include <vector>
#include <cstring>
#include <stdexcept>
#include <string>
#include <system_error>
#include <filesystem>

#include <sys/mman.h>
#include <sys/stat.h>
#include <fcntl.h>
#include <unistd.h>
#include <time.h>

namespace fs = std::filesystem;
using namespace file_io;

static constexpr size_t MAX_SANITIZED_LEN = 200;

static std::string errno_str() {
    return socket_error_str(errno);
}

// ============================================================
// MmapReader
// ============================================================

MmapReader::MmapReader(const std::string& path) {
    fd_ = ::open(path.c_str(), O_RDONLY);
    if (fd_ < 0) {
        throw StorageError("Cannot open file: " + path + ": " + errno_str());
    }

    struct stat st{};
    if (fstat(fd_, &st) != 0) {
        std::string err = errno_str();
        ::close(fd_);
        fd_ = -1;
        throw StorageError("fstat failed: " + path + ": " + err);
    }
    if (!S_ISREG(st.st_mode)) {
        ::close(fd_);
        fd_ = -1;
        throw StorageError("Not a regular file: " + path);
    }
    size_ = (u64)st.st_size;

    if (size_ == 0) {
        data_ = nullptr;
        return;
    }

    void* p = mmap(nullptr, (size_t)size_, PROT_READ, MAP_SHARED, fd_, 0);
    if (p == MAP_FAILED) {
        std::string err = errno_str();
        ::close(fd_);
        fd_ = -1;
        throw StorageError("mmap failed: " + path + ": " + err);
    }
    madvise(p, (size_t)size_, MADV_SEQUENTIAL);
    data_ = static_cast<const char*>(p);
}

MmapReader::~MmapReader() {
    close();
}

void MmapReader::close() {
    if (data_ && size_ > 0) { munmap((void*)data_, (size_t)size_); data_ = nullptr; }
    if (fd_ >= 0) { ::close(fd_); fd_ = -1; }
    size_ = 0;
}

// ============================================================
// MmapWriter
// ============================================================

MmapWriter::~MmapWriter() {
    abandon();
}

void MmapWriter::open(const std::string& file_path, u64 size) {
    if (is_open()) abandon();
    path_ = file_path;
    size_ = size;

    try {
        ensure_parent_dirs(file_path);
    } catch (const fs::filesystem_error& e) {
        throw StorageError(std::string("Cannot create parent directory: ") + e.what());
    }

    // Exclusive: a file someone else is writing is never truncated or mapped twice
    fd_ = ::open(file_path.c_str(), O_RDWR | O_CREAT | O_EXCL, 0644);
    if (fd_ < 0) {
        throw StorageError("Cannot create file: " + file_path + ": " + errno_str());
    }

    if (size == 0) {
        data_ = nullptr;
        return;
    }

    // posix_fallocate surfaces ENOSPC up front instead of SIGBUS mid-copy
    int rc = posix_fallocate(fd_, 0, (off_t)size);
    if (rc != 0 && rc != EOPNOTSUPP && rc != EINVAL) {
        abandon();
        ::unlink(file_path.c_str());
        throw StorageError("posix_fallocate failed: " + file_path + ": " + socket_error_str(rc));
    }
    if (rc != 0 && ftruncate(fd_, (off_t)size) != 0) {
        std::string err = errno_str();
        abandon();
        ::unlink(file_path.c_str());
        throw StorageError("ftruncate failed: " + file_path + ": " + err);
    }

    void* p = mmap(nullptr, (size_t)size, PROT_WRITE, MAP_SHARED, fd_, 0);
    if (p == MAP_FAILED) {
        std::string err = errno_str();
        abandon();
        ::unlink(file_path.c_str());
        throw StorageError("mmap(write) failed: " + path_ + ": " + err);
    }
    data_ = static_cast<char*>(p);
}

void MmapWriter::write_at(u64 offset, const void* data, size_t len) {
    if (len == 0) return;
    if (!data_ || offset + len > size_) {
        throw StorageError("MmapWriter::write_at out of bounds: " + path_);
    }
    std::memcpy(data_ + offset, data, len);
}

void MmapWriter::close(u64 mtime_ns) {
    if (!is_open()) return;
    std::string failure;
    if (data_ && size_ > 0) {
        if (msync(data_, (size_t)size_, MS_SYNC) != 0) failure = "msync: " + errno_str();
        munmap(data_, (size_t)size_);
        data_ = nullptr;
    }
    if (failure.empty() && ::fsync(fd_) != 0) failure = "fsync: " + errno_str();
    if (::close(fd_) != 0 && failure.empty()) failure = "close: " + errno_str();
    fd_ = -1;
    size_ = 0;
    if (!failure.empty()) {
        throw StorageError("Flush failed for " + path_ + ": " + failure);
    }
    if (mtime_ns > 0) {
        set_mtime(path_, mtime_ns);
    }
}

void MmapWriter::abandon() {
    if (data_ && size_ > 0) {
        munmap(data_, (size_t)size_);
    }
    data_ = nullptr;
    if (fd_ >= 0) {
        ::close(fd_);
        fd_ = -1;
    }
    size_ = 0;
}

// ============================================================
// Utility functions
// ============================================================

void file_io::set_mtime(const std::string& path, u64 mtime_ns) {
    struct timespec ts[2];
    ts[0].tv_sec  = (time_t)(mtime_ns / 1000000000ULL);
    ts[0].tv_nsec = (long)(mtime_ns % 1000000000ULL);
    ts[1] = ts[0];
    if (utimensat(AT_FDCWD, path.c_str(), ts, 0) != 0) {
        throw StorageError("utimensat failed: " + path + ": " + errno_str());
    }
}

std::string file_io::sanitize_filename(const std::string& name) {
    std::string out;
    out.reserve(name.size());
    for (unsigned char c : name) {
        if (c == '/' || c == '\\' || c == ':' || c < 0x20 || c == 0x7F) {
            out.push_back('_');
        } else {
            out.push_back((char)c);
        }
    }

    // Drop every ".." so no traversal token survives
    size_t pos;
    while ((pos = out.find("..")) != std::string::npos) {
        out.erase(pos, 2);
    }

    // No hidden files and no "." component
    size_t first = out.find_first_not_of('.');
    out = (first == std::string::npos) ? std::string() : out.substr(first);

    size_t last = out.find_last_not_of(' ');
    out = (last == std::string::npos) ? std::string() : out.substr(0, last + 1);

    if (out.size() > MAX_SANITIZED_LEN) {
        // Keep the extension if it is short
        auto dot = out.rfind('.');
        std::string ext = (dot != std::string::npos && out.size() - dot <= 16)
                              ? out.substr(dot) : std::string();
        out = out.substr(0, MAX_SANITIZED_LEN - ext.size()) + ext;
    }

    if (out.empty()) out = "unnamed";
    return out;
}

fs::path file_io::resolve_in_dir(const fs::path& root_dir, const std::string& component) {
    if (component.empty() || component == "." || component == ".." ||
        component.find('/') != std::string::npos || component.find('\\') != std::string::npos) {
        throw StorageError("Unsafe storage name rejected: " + component);
    }

    // "dir/" and "dir" must compare equal
    fs::path root = (root_dir / "").lexically_normal().parent_path();
    fs::path full = (root / component).lexically_normal();

    if (full.parent_path() != root || full.filename() != fs::path(component)) {
        throw StorageError("Path escapes storage directory: " + component);
    }
    return full;
}

void file_io::write_file_atomic(const fs::path& path, const void* data, size_t len, u64 mtime_ns) {
    const std::string final_path = path.string();
    const std::string part_path  = final_path + ".part";

    MmapWriter writer;
    // Fails if the part file exists; it belongs to another writer then
    writer.open(part_path, (u64)len);
    try {
        writer.write_at(0, data, len);
        writer.close(mtime_ns);
    } catch (const StorageError&) {
        writer.abandon();
        std::error_code ec;
        fs::remove(part_path, ec);
        throw;
    }

    std::error_code ec;
    fs::rename(part_path, final_path, ec);
    if (ec) {
        std::error_code rm_ec;
        fs::remove(part_path, rm_ec);
        throw StorageError("rename " + part_path + " -> " + final_path + " failed: " + ec.message());
    }
}

void file_io::ensure_parent_dirs(const std::string& path) {
    fs::path p(path);
    auto parent = p.parent_path();
    if (!parent.empty()) {
        fs::create_directories(parent);
    }
}

std::vector<u8> file_io::read_file(const std::string& path) {
    MmapReader reader(path);
    const u8* p = reinterpret_cast<const u8*>(reader.data());
    return std::vector<u8>(p, p + reader.size());
}
