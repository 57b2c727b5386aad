// ZPROOF - Filesystem Utilities
// Copyright (c) 2024 ZPROOF Developers
// MIT License
//
// POSIX filesystem helpers used by the parameter search and the daemon:
// - Path manipulation
// - Non-throwing status queries that report errno
// - Temporary directories for tests
// - SHA-256 file checksums

#ifndef ZPROOF_UTIL_FS_H
#define ZPROOF_UTIL_FS_H

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace zproof {
namespace util {
namespace fs {

// ============================================================================
// Path Type
// ============================================================================

class Path {
public:
    Path() = default;
    Path(const std::string& path) : path_(path) {}
    Path(const char* path) : path_(path ? path : "") {}
    
    const std::string& String() const { return path_; }
    const char* CStr() const { return path_.c_str(); }
    bool Empty() const { return path_.empty(); }
    
    bool IsAbsolute() const { return !path_.empty() && path_[0] == '/'; }
    
    /// True for "/"
    bool IsRoot() const;
    
    /// Containing directory. "/" for a top-level entry, empty when there is
    /// no separator.
    Path Parent() const;
    
    /// Last component ("" for "/")
    std::string Filename() const;
    
    /// Lexically resolve "." and ".." and collapse repeated separators
    Path Normalize() const;
    
    Path operator/(const Path& other) const;
    Path& operator/=(const Path& other);
    
    bool operator==(const Path& other) const { return path_ == other.path_; }
    bool operator!=(const Path& other) const { return path_ != other.path_; }
    bool operator<(const Path& other) const { return path_ < other.path_; }

private:
    std::string path_;
};

// ============================================================================
// File Status
// ============================================================================

enum class FileType {
    None,       // Not found or not accessible
    Regular,
    Directory,
    Other
};

struct FileStatus {
    FileType type{FileType::None};
    uint64_t size{0};
    uint32_t mode{0};
    int error{0};           // errno from stat(), 0 on success
    
    bool Exists() const { return type != FileType::None; }
    bool IsFile() const { return type == FileType::Regular; }
    bool IsDirectory() const { return type == FileType::Directory; }
    
    /// stat() failed for a reason other than the entry not existing
    bool IsError() const;
};

/// stat() the path. Never throws; failures are reported in FileStatus::error.
FileStatus Status(const Path& path);

bool Exists(const Path& path);
bool IsFile(const Path& path);
bool IsDirectory(const Path& path);

/// access(R_OK) for the current process
bool IsReadable(const Path& path);

/// Size in bytes, 0 if the file cannot be stat'ed
uint64_t FileSize(const Path& path);

// ============================================================================
// Locations
// ============================================================================

/// getcwd(), empty on failure
Path CurrentPath();

/// $HOME, falling back to the passwd entry
Path HomeDirectory();

/// Resolved /proc/self/exe, empty when unavailable
Path ExecutablePath();

/// $TMPDIR or /tmp
Path TempDirectoryPath();

/// Prefix relative paths with the working directory
Path AbsolutePath(const Path& path);

// ============================================================================
// File Operations
// ============================================================================

bool CreateDirectory(const Path& path);
bool CreateDirectories(const Path& path);
bool RemoveFile(const Path& path);

/// Recursively remove a file or directory tree
bool RemoveAll(const Path& path);

/// Set file length, creating the file if needed
bool ResizeFile(const Path& path, uint64_t newSize);

bool WriteFile(const Path& path, const std::string& content);

/// Whole file contents, nullopt if it cannot be read
std::optional<std::string> ReadFileToString(const Path& path);

/// chmod(), used by tests to simulate unreadable entries
bool SetPermissions(const Path& path, uint32_t mode);

// ============================================================================
// Temporary Directory
// ============================================================================

/// Creates a unique directory under TempDirectoryPath() and removes it on destruction
class TempDirectory {
public:
    TempDirectory();
    explicit TempDirectory(const std::string& prefix);
    ~TempDirectory();
    
    TempDirectory(const TempDirectory&) = delete;
    TempDirectory& operator=(const TempDirectory&) = delete;
    TempDirectory(TempDirectory&& other) noexcept;
    TempDirectory& operator=(TempDirectory&& other) noexcept;
    
    const Path& GetPath() const { return path_; }
    bool IsValid() const { return !path_.Empty(); }

private:
    Path path_;
};

// ============================================================================
// Checksums
// ============================================================================

/// Lower-case hex SHA-256 of the file contents, empty string on I/O error
std::string FileChecksum(const Path& path);

} // namespace fs
} // namespace util
} // namespace zproof

#endif // ZPROOF_UTIL_FS_H
