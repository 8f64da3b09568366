#pragma once

// ============================================================
// file_io.hpp -- Memory-mapped file I/O and storage paths
// ============================================================

#include "platform.hpp"
#include <string>
#include <vector>
#include <stdexcept>
#include <cstdint>
#include <filesystem>

namespace fs = std::filesystem;

// Persistence failure: open/map/flush/rename of a storage file
class StorageError : public std::runtime_error {
public:
    explicit StorageError(const std::string& what) : std::runtime_error(what) {}
};

namespace file_io {

// ---- MmapReader: zero-copy read via mmap ----
class MmapReader {
public:
    explicit MmapReader(const std::string& path);
    ~MmapReader();

    MmapReader(const MmapReader&) = delete;
    MmapReader& operator=(const MmapReader&) = delete;

    const char* data() const { return data_; }
    u64 size() const { return size_; }

    void close();

private:
    const char* data_{nullptr};
    u64 size_{0};
    int fd_{-1};
};

// ---- MmapWriter: write a file of known size via mmap ----
class MmapWriter {
public:
    MmapWriter() = default;
    ~MmapWriter();

    MmapWriter(const MmapWriter&) = delete;
    MmapWriter& operator=(const MmapWriter&) = delete;

    // Create a new file (never an existing one), size it, then mmap.
    // Throws StorageError; a file it created is removed again on failure.
    void open(const std::string& path, u64 size);

    // Write data at given offset
    void write_at(u64 offset, const void* data, size_t len);

    // msync + fsync + close; optionally set modification time.
    // Throws StorageError if the data could not be flushed.
    void close(u64 mtime_ns = 0);

    // Unmap and close without flushing (error paths)
    void abandon();

    bool is_open() const { return fd_ >= 0; }
    u64 size() const { return size_; }

private:
    char* data_{nullptr};
    u64   size_{0};
    int   fd_{-1};
    std::string path_;
};

// ---- Utility functions ----

// Set file modification time (nanoseconds since epoch); throws StorageError
void set_mtime(const std::string& path, u64 mtime_ns);

// Make an untrusted display name safe to use as a single path component:
// separators and control characters become '_', ".." sequences and
// leading dots are removed, length is capped, empty becomes "unnamed".
std::string sanitize_filename(const std::string& name);

// Join root_dir with a single sanitized component and verify the result
// stays directly under root_dir. Throws StorageError otherwise.
fs::path resolve_in_dir(const fs::path& root_dir, const std::string& component);

// Write a buffer to 'path' durably: write <path>.part, flush, rename.
// A partially written file is never left at 'path'. Throws StorageError,
// also when <path>.part already exists.
void write_file_atomic(const fs::path& path, const void* data, size_t len, u64 mtime_ns = 0);

// Create parent directories if they don't exist
void ensure_parent_dirs(const std::string& path);

// Read an entire file into memory; throws StorageError
std::vector<u8> read_file(const std::string& path);

} // namespace file_io
