#include "refresh_lock.hpp"
#include "oauth2_error.hpp"
#include "tokenward_tracing.hpp"

#include <cerrno>
#include <cstdlib>
#include <cstring>

#ifdef _WIN32
#ifndef NOMINMAX
#define NOMINMAX
#endif
#include <windows.h>
#else
#include <fcntl.h>
#include <sys/file.h>
#include <sys/stat.h>
#include <unistd.h>
#endif

namespace tokenward {

namespace {

OAuthError LockError(const std::string& message, const std::filesystem::path& path, int error_number) {
    ErrorContext ctx;
    ctx.Set("path", path.string()).Set("errno", std::strerror(error_number));
    return ctx.Error(OAuthErrorKind::STORAGE, message);
}

std::string UserSuffix() {
#ifdef _WIN32
    const char* user = std::getenv("USERNAME");
    return user ? std::string(user) : std::string("unknown");
#else
    return std::to_string(static_cast<unsigned long>(getuid()));
#endif
}

} // namespace

// ===== RefreshLock =====

#ifdef _WIN32

RefreshLock::RefreshLock(void* handle, std::filesystem::path path)
    : handle(handle), path(std::move(path)) {
}

RefreshLock::RefreshLock(RefreshLock&& other) noexcept
    : handle(other.handle), path(std::move(other.path)) {
    other.handle = nullptr;
}

RefreshLock& RefreshLock::operator=(RefreshLock&& other) noexcept {
    if (this != &other) {
        Release();
        handle = other.handle;
        path = std::move(other.path);
        other.handle = nullptr;
    }
    return *this;
}

bool RefreshLock::IsHeld() const {
    return handle != nullptr;
}

void RefreshLock::Release() {
    if (handle == nullptr) {
        return;
    }
    OVERLAPPED overlapped = {};
    UnlockFileEx(static_cast<HANDLE>(handle), 0, MAXDWORD, MAXDWORD, &overlapped);
    CloseHandle(static_cast<HANDLE>(handle));
    handle = nullptr;

    // Fails while another process still has the file open, which is fine
    std::error_code ec;
    std::filesystem::remove(path, ec);
    TOKENWARD_TRACE_DEBUG("REFRESH_LOCK", "Released lock: " + path.string());
}

#else

RefreshLock::RefreshLock(int fd, std::filesystem::path path)
    : fd(fd), path(std::move(path)) {
}

RefreshLock::RefreshLock(RefreshLock&& other) noexcept
    : fd(other.fd), path(std::move(other.path)) {
    other.fd = -1;
}

RefreshLock& RefreshLock::operator=(RefreshLock&& other) noexcept {
    if (this != &other) {
        Release();
        fd = other.fd;
        path = std::move(other.path);
        other.fd = -1;
    }
    return *this;
}

bool RefreshLock::IsHeld() const {
    return fd >= 0;
}

void RefreshLock::Release() {
    if (fd < 0) {
        return;
    }
    // Unlink while still holding the lock; waiters on this inode re-validate and retry
    if (::unlink(path.c_str()) != 0 && errno != ENOENT) {
        TOKENWARD_TRACE_DEBUG("REFRESH_LOCK", "Could not remove lock file " + path.string() + ": " +
                              std::strerror(errno));
    }
    ::flock(fd, LOCK_UN);
    ::close(fd);
    fd = -1;
    TOKENWARD_TRACE_DEBUG("REFRESH_LOCK", "Released lock: " + path.string());
}

#endif

RefreshLock::~RefreshLock() {
    Release();
}

// ===== RefreshLockManager =====

RefreshLockManager::RefreshLockManager(std::filesystem::path lock_dir)
    : lock_dir(std::move(lock_dir)) {
}

RefreshLockManager RefreshLockManager::WithDefaultDir() {
    return RefreshLockManager(DefaultLockDir());
}

RefreshLockManager RefreshLockManager::ForApp(const std::string& app_name) {
    return RefreshLockManager(DefaultLockDir(app_name));
}

std::filesystem::path RefreshLockManager::DefaultLockDir(const std::optional<std::string>& app_name) {
    std::filesystem::path dir;

    const char* runtime_dir = std::getenv("XDG_RUNTIME_DIR");
    if (runtime_dir && *runtime_dir) {
        dir = std::filesystem::path(runtime_dir) / "tokenward-locks";
    } else {
        dir = std::filesystem::temp_directory_path() / ("tokenward-locks-" + UserSuffix());
    }

    if (app_name.has_value() && !app_name->empty()) {
        dir /= SanitizeKey(*app_name);
    }
    return dir;
}

std::string RefreshLockManager::SanitizeKey(const std::string& key) {
    std::string sanitized = key;
    for (auto& c : sanitized) {
        switch (c) {
            case '/':
            case '\\':
            case ':':
            case '*':
            case '?':
            case '"':
            case '<':
            case '>':
            case '|':
                c = '_';
                break;
            default:
                break;
        }
    }
    return sanitized;
}

std::filesystem::path RefreshLockManager::LockPath(const std::string& key) const {
    return lock_dir / (SanitizeKey(key) + ".lock");
}

void RefreshLockManager::EnsureLockDir() const {
    // Concurrent creation by other processes is fine, only a missing directory afterwards is an error
    std::error_code ec;
    std::filesystem::create_directories(lock_dir, ec);
    if (ec && !std::filesystem::is_directory(lock_dir)) {
        ErrorContext ctx;
        ctx.Set("path", lock_dir.string()).Set("error", ec.message());
        throw ctx.Error(OAuthErrorKind::STORAGE, "Failed to create lock directory");
    }
}

RefreshLock RefreshLockManager::AcquireLock(const std::string& key) const {
    auto lock = Acquire(key, true);
    if (!lock.has_value()) {
        // Blocking acquisition only returns without a lock on error, which throws
        throw OAuthError(OAuthErrorKind::STORAGE, "Failed to acquire lock for key: " + key);
    }
    return std::move(*lock);
}

std::optional<RefreshLock> RefreshLockManager::TryAcquireLock(const std::string& key) const {
    return Acquire(key, false);
}

#ifdef _WIN32

std::optional<RefreshLock> RefreshLockManager::Acquire(const std::string& key, bool blocking) const {
    EnsureLockDir();
    auto path = LockPath(key);

    HANDLE handle = CreateFileW(path.c_str(), GENERIC_READ | GENERIC_WRITE,
                                FILE_SHARE_READ | FILE_SHARE_WRITE, nullptr, OPEN_ALWAYS,
                                FILE_ATTRIBUTE_NORMAL, nullptr);
    if (handle == INVALID_HANDLE_VALUE) {
        throw LockError("Failed to open lock file", path, EACCES);
    }

    DWORD flags = LOCKFILE_EXCLUSIVE_LOCK;
    if (!blocking) {
        flags |= LOCKFILE_FAIL_IMMEDIATELY;
    }
    OVERLAPPED overlapped = {};
    if (!LockFileEx(handle, flags, 0, MAXDWORD, MAXDWORD, &overlapped)) {
        auto error = GetLastError();
        CloseHandle(handle);
        if (!blocking && error == ERROR_LOCK_VIOLATION) {
            return std::nullopt;
        }
        throw LockError("Failed to lock file", path, EIO);
    }

    TOKENWARD_TRACE_DEBUG("REFRESH_LOCK", "Acquired lock: " + path.string());
    return RefreshLock(handle, path);
}

#else

std::optional<RefreshLock> RefreshLockManager::Acquire(const std::string& key, bool blocking) const {
    EnsureLockDir();
    auto path = LockPath(key);

    while (true) {
        int fd = ::open(path.c_str(), O_RDWR | O_CREAT | O_CLOEXEC, 0600);
        if (fd < 0) {
            if (errno == EINTR) {
                continue;
            }
            throw LockError("Failed to open lock file", path, errno);
        }

        int operation = blocking ? LOCK_EX : (LOCK_EX | LOCK_NB);
        int rc;
        do {
            rc = ::flock(fd, operation);
        } while (rc != 0 && errno == EINTR);

        if (rc != 0) {
            int error_number = errno;
            ::close(fd);
            if (!blocking && error_number == EWOULDBLOCK) {
                TOKENWARD_TRACE_DEBUG("REFRESH_LOCK", "Lock is held elsewhere: " + path.string());
                return std::nullopt;
            }
            throw LockError("Failed to lock file", path, error_number);
        }

        // The previous holder may have unlinked the file while we waited on it
        struct stat fd_stat;
        struct stat path_stat;
        if (::fstat(fd, &fd_stat) != 0) {
            int error_number = errno;
            ::close(fd);
            throw LockError("Failed to stat lock file", path, error_number);
        }
        if (::stat(path.c_str(), &path_stat) != 0 ||
            fd_stat.st_dev != path_stat.st_dev || fd_stat.st_ino != path_stat.st_ino) {
            ::close(fd);
            TOKENWARD_TRACE_TRACE("REFRESH_LOCK", "Lock file replaced while waiting, retrying: " + path.string());
            continue;
        }

        TOKENWARD_TRACE_DEBUG("REFRESH_LOCK", "Acquired lock: " + path.string());
        return RefreshLock(fd, path);
    }
}

#endif

} // namespace tokenward
