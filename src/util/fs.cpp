// ZPROOF - Filesystem Utilities Implementation
// Copyright (c) 2024 ZPROOF Developers
// MIT License

#include "zproof/util/fs.h"

#include <cerrno>
#include <climits>
#include <cstdio>
#include <cstdlib>
#include <fstream>
#include <iterator>
#include <memory>
#include <random>
#include <sstream>

#include <dirent.h>
#include <pwd.h>
#include <sys/stat.h>
#include <sys/types.h>
#include <unistd.h>

#include <openssl/evp.h>

namespace zproof {
namespace util {
namespace fs {

// ============================================================================
// Path Implementation
// ============================================================================

bool Path::IsRoot() const {
    return path_.find_first_not_of('/') == std::string::npos && !path_.empty();
}

Path Path::Parent() const {
    if (path_.empty() || IsRoot()) {
        return Path();
    }
    
    // Ignore trailing separators ("a/b/" has parent "a")
    size_t end = path_.find_last_not_of('/');
    size_t pos = path_.find_last_of('/', end);
    if (pos == std::string::npos) {
        return Path();
    }
    size_t parentEnd = path_.find_last_not_of('/', pos);
    if (parentEnd == std::string::npos) {
        return Path("/");
    }
    return Path(path_.substr(0, parentEnd + 1));
}

std::string Path::Filename() const {
    size_t end = path_.find_last_not_of('/');
    if (end == std::string::npos) {
        return "";
    }
    size_t pos = path_.find_last_of('/', end);
    size_t start = (pos == std::string::npos) ? 0 : pos + 1;
    return path_.substr(start, end - start + 1);
}

Path Path::Normalize() const {
    if (path_.empty()) {
        return Path();
    }
    
    std::vector<std::string> parts;
    std::istringstream iss(path_);
    std::string part;
    bool absolute = IsAbsolute();
    
    while (std::getline(iss, part, '/')) {
        if (part.empty() || part == ".") {
            continue;
        }
        if (part == "..") {
            if (!parts.empty() && parts.back() != "..") {
                parts.pop_back();
            } else if (!absolute) {
                parts.push_back("..");
            }
            continue;
        }
        parts.push_back(part);
    }
    
    if (parts.empty()) {
        return absolute ? Path("/") : Path(".");
    }
    
    std::string out = absolute ? "/" : "";
    for (size_t i = 0; i < parts.size(); ++i) {
        if (i > 0) {
            out += '/';
        }
        out += parts[i];
    }
    return Path(out);
}

Path Path::operator/(const Path& other) const {
    Path result(*this);
    result /= other;
    return result;
}

Path& Path::operator/=(const Path& other) {
    if (other.Empty()) {
        return *this;
    }
    if (path_.empty() || other.IsAbsolute()) {
        path_ = other.path_;
        return *this;
    }
    if (path_.back() != '/') {
        path_ += '/';
    }
    path_ += other.path_;
    return *this;
}

// ============================================================================
// File Status
// ============================================================================

bool FileStatus::IsError() const {
    return error != 0 && error != ENOENT && error != ENOTDIR;
}

FileStatus Status(const Path& path) {
    FileStatus status;
    if (path.Empty()) {
        status.error = ENOENT;
        return status;
    }
    
    struct stat st;
    if (stat(path.CStr(), &st) != 0) {
        status.error = errno;
        return status;
    }
    
    if (S_ISREG(st.st_mode)) {
        status.type = FileType::Regular;
    } else if (S_ISDIR(st.st_mode)) {
        status.type = FileType::Directory;
    } else {
        status.type = FileType::Other;
    }
    status.size = static_cast<uint64_t>(st.st_size);
    status.mode = static_cast<uint32_t>(st.st_mode & 07777);
    return status;
}

bool Exists(const Path& path) {
    return Status(path).Exists();
}

bool IsFile(const Path& path) {
    return Status(path).IsFile();
}

bool IsDirectory(const Path& path) {
    return Status(path).IsDirectory();
}

bool IsReadable(const Path& path) {
    return !path.Empty() && access(path.CStr(), R_OK) == 0;
}

uint64_t FileSize(const Path& path) {
    return Status(path).size;
}

// ============================================================================
// Locations
// ============================================================================

Path CurrentPath() {
    char buf[PATH_MAX];
    if (getcwd(buf, sizeof(buf)) == nullptr) {
        return Path();
    }
    return Path(buf);
}

Path HomeDirectory() {
    const char* home = std::getenv("HOME");
    if (home && *home) {
        return Path(home);
    }
    struct passwd* pw = getpwuid(getuid());
    if (pw && pw->pw_dir) {
        return Path(pw->pw_dir);
    }
    return Path();
}

Path ExecutablePath() {
    char buf[PATH_MAX];
    ssize_t len = readlink("/proc/self/exe", buf, sizeof(buf) - 1);
    if (len <= 0) {
        return Path();
    }
    buf[len] = '\0';
    return Path(buf);
}

Path TempDirectoryPath() {
    const char* tmpdir = std::getenv("TMPDIR");
    if (tmpdir && *tmpdir) {
        return Path(tmpdir);
    }
    return Path("/tmp");
}

Path AbsolutePath(const Path& path) {
    if (path.IsAbsolute()) {
        return path;
    }
    return CurrentPath() / path;
}

// ============================================================================
// File Operations
// ============================================================================

bool CreateDirectory(const Path& path) {
    return mkdir(path.CStr(), 0755) == 0;
}

bool CreateDirectories(const Path& path) {
    if (path.Empty()) {
        return false;
    }
    FileStatus status = Status(path);
    if (status.Exists()) {
        return status.IsDirectory();
    }
    
    Path parent = path.Parent();
    if (!parent.Empty() && !Exists(parent) && !CreateDirectories(parent)) {
        return false;
    }
    return CreateDirectory(path) || IsDirectory(path);
}

bool RemoveFile(const Path& path) {
    return unlink(path.CStr()) == 0;
}

bool RemoveAll(const Path& path) {
    struct stat st;
    if (lstat(path.CStr(), &st) != 0) {
        return errno == ENOENT;
    }
    
    if (!S_ISDIR(st.st_mode)) {
        return RemoveFile(path);
    }
    
    std::unique_ptr<DIR, int (*)(DIR*)> dir(opendir(path.CStr()), &closedir);
    if (!dir) {
        return false;
    }
    
    bool ok = true;
    while (struct dirent* entry = readdir(dir.get())) {
        std::string name = entry->d_name;
        if (name == "." || name == "..") {
            continue;
        }
        ok = RemoveAll(path / name) && ok;
    }
    dir.reset();
    
    return rmdir(path.CStr()) == 0 && ok;
}

bool ResizeFile(const Path& path, uint64_t newSize) {
    if (!Exists(path) && !WriteFile(path, "")) {
        return false;
    }
    return truncate(path.CStr(), static_cast<off_t>(newSize)) == 0;
}

bool WriteFile(const Path& path, const std::string& content) {
    std::ofstream file(path.String(), std::ios::binary | std::ios::trunc);
    if (!file) {
        return false;
    }
    file.write(content.data(), static_cast<std::streamsize>(content.size()));
    return static_cast<bool>(file);
}

std::optional<std::string> ReadFileToString(const Path& path) {
    std::ifstream file(path.String(), std::ios::binary);
    if (!file) {
        return std::nullopt;
    }
    std::string content((std::istreambuf_iterator<char>(file)),
                        std::istreambuf_iterator<char>());
    if (file.bad()) {
        return std::nullopt;
    }
    return content;
}

bool SetPermissions(const Path& path, uint32_t mode) {
    return chmod(path.CStr(), static_cast<mode_t>(mode)) == 0;
}

// ============================================================================
// Temporary Directory
// ============================================================================

namespace {

std::string RandomSuffix(size_t length) {
    static const char chars[] = "abcdefghijklmnopqrstuvwxyz0123456789";
    thread_local std::mt19937 gen{std::random_device{}()};
    std::uniform_int_distribution<size_t> dist(0, sizeof(chars) - 2);
    
    std::string out;
    out.reserve(length);
    for (size_t i = 0; i < length; ++i) {
        out += chars[dist(gen)];
    }
    return out;
}

Path MakeTempDirectory(const std::string& prefix) {
    Path base = TempDirectoryPath();
    for (int attempt = 0; attempt < 100; ++attempt) {
        Path candidate = base / (prefix + RandomSuffix(10));
        if (CreateDirectory(candidate)) {
            return candidate;
        }
        if (errno != EEXIST) {
            break;
        }
    }
    return Path();
}

} // namespace

TempDirectory::TempDirectory() : TempDirectory("zproof_") {}

TempDirectory::TempDirectory(const std::string& prefix)
    : path_(MakeTempDirectory(prefix)) {}

TempDirectory::~TempDirectory() {
    if (!path_.Empty()) {
        RemoveAll(path_);
    }
}

TempDirectory::TempDirectory(TempDirectory&& other) noexcept
    : path_(std::move(other.path_)) {
    other.path_ = Path();
}

TempDirectory& TempDirectory::operator=(TempDirectory&& other) noexcept {
    if (this != &other) {
        if (!path_.Empty()) {
            RemoveAll(path_);
        }
        path_ = std::move(other.path_);
        other.path_ = Path();
    }
    return *this;
}

// ============================================================================
// Checksums
// ============================================================================

std::string FileChecksum(const Path& path) {
    std::ifstream file(path.String(), std::ios::binary);
    if (!file) {
        return "";
    }
    
    std::unique_ptr<EVP_MD_CTX, void (*)(EVP_MD_CTX*)> ctx(EVP_MD_CTX_new(),
                                                          &EVP_MD_CTX_free);
    if (!ctx || EVP_DigestInit_ex(ctx.get(), EVP_sha256(), nullptr) != 1) {
        return "";
    }
    
    std::vector<char> buffer(1 << 20);
    while (file) {
        file.read(buffer.data(), static_cast<std::streamsize>(buffer.size()));
        std::streamsize got = file.gcount();
        if (got > 0 &&
            EVP_DigestUpdate(ctx.get(), buffer.data(), static_cast<size_t>(got)) != 1) {
            return "";
        }
    }
    if (file.bad()) {
        return "";
    }
    
    unsigned char digest[EVP_MAX_MD_SIZE];
    unsigned int digestLen = 0;
    if (EVP_DigestFinal_ex(ctx.get(), digest, &digestLen) != 1) {
        return "";
    }
    
    static const char hex[] = "0123456789abcdef";
    std::string out;
    out.reserve(digestLen * 2);
    for (unsigned int i = 0; i < digestLen; ++i) {
        out += hex[digest[i] >> 4];
        out += hex[digest[i] & 0x0f];
    }
    return out;
}

} // namespace fs
} // namespace util
} // namespace zproof
