#pragma once

#include <filesystem>
#include <optional>
#include <string>

namespace tokenward {

/**
 * Exclusive OS-level lock on a file inside the lock directory.
 *
 * Holding the object means holding the lock. Destruction (or Release())
 * deletes the backing file while still locked and then unlocks it. Waiters
 * that were blocked on the deleted inode notice the replacement when they
 * validate the path and retry, so at most one holder exists per path.
 */
class RefreshLock {
public:
    RefreshLock(RefreshLock&& other) noexcept;
    RefreshLock& operator=(RefreshLock&& other) noexcept;
    RefreshLock(const RefreshLock&) = delete;
    RefreshLock& operator=(const RefreshLock&) = delete;
    ~RefreshLock();

    const std::filesystem::path& Path() const { return path; }
    bool IsHeld() const;

    // Unlocks early; the destructor then does nothing
    void Release();

private:
    friend class RefreshLockManager;

#ifdef _WIN32
    RefreshLock(void* handle, std::filesystem::path path);
    void* handle;
#else
    RefreshLock(int fd, std::filesystem::path path);
    int fd;
#endif
    std::filesystem::path path;
};

class RefreshLockManager {
public:
    explicit RefreshLockManager(std::filesystem::path lock_dir);

    // $XDG_RUNTIME_DIR/tokenward-locks, else <temp>/tokenward-locks-<uid>
    static RefreshLockManager WithDefaultDir();
    // Same as WithDefaultDir with a per-application subdirectory
    static RefreshLockManager ForApp(const std::string& app_name);
    static std::filesystem::path DefaultLockDir(const std::optional<std::string>& app_name = std::nullopt);

    // Replaces / \ : * ? " < > | with '_'
    static std::string SanitizeKey(const std::string& key);

    std::filesystem::path LockPath(const std::string& key) const;
    const std::filesystem::path& LockDir() const { return lock_dir; }

    // Blocks until the lock is held. Throws OAuthError(STORAGE) on I/O failure.
    RefreshLock AcquireLock(const std::string& key) const;

    // Returns std::nullopt when another holder has the lock
    std::optional<RefreshLock> TryAcquireLock(const std::string& key) const;

    // Runs fn while holding the lock for key
    template <typename Fn>
    auto WithLock(const std::string& key, Fn&& fn) const -> decltype(fn()) {
        auto lock = AcquireLock(key);
        return fn();
    }

private:
    std::optional<RefreshLock> Acquire(const std::string& key, bool blocking) const;
    void EnsureLockDir() const;

    std::filesystem::path lock_dir;
};

} // namespace tokenward
