#pragma once

#include <filesystem>
#include <map>
#include <mutex>
#include <optional>
#include <shared_mutex>
#include <string>

#include "oauth2_types.hpp"
#include "refresh_lock.hpp"

namespace tokenward {

// Storage capability for sessions and tokens. Implementations must be safe for
// concurrent use and throw OAuthError(STORAGE) when the backing store fails.
class CredentialStore {
public:
    virtual ~CredentialStore() = default;

    virtual void SaveSession(const std::string& state, const Session& session) = 0;
    virtual std::optional<Session> GetSession(const std::string& state) = 0;
    virtual void DeleteSession(const std::string& state) = 0;

    virtual void SaveToken(const std::string& key, const Token& token) = 0;
    virtual std::optional<Token> GetToken(const std::string& key) = 0;
    virtual void DeleteToken(const std::string& key) = 0;
};

class MemoryCredentialStore : public CredentialStore {
public:
    MemoryCredentialStore() = default;

    void SaveSession(const std::string& state, const Session& session) override;
    std::optional<Session> GetSession(const std::string& state) override;
    void DeleteSession(const std::string& state) override;

    void SaveToken(const std::string& key, const Token& token) override;
    std::optional<Token> GetToken(const std::string& key) override;
    void DeleteToken(const std::string& key) override;

private:
    std::map<std::string, Session> sessions;
    std::map<std::string, Token> tokens;
    std::shared_mutex mutex;
};

/**
 * JSON files grouped by domain inside one directory:
 *   tokens_<domain>.json   { "<key>": { "access_token": ..., ... } }
 *   sessions_<domain>.json { "<state>": { "state": ..., ... } }
 *
 * The token domain is the part of the key before the first ':'. Each file is
 * rewritten through a temp file and rename under a lock from RefreshLockManager,
 * so several processes may share the directory.
 */
class FileCredentialStore : public CredentialStore {
public:
    explicit FileCredentialStore(std::filesystem::path base_dir);

    // $XDG_DATA_HOME/<app>, else $HOME/.local/share/<app>
    static FileCredentialStore ForApp(const std::string& app_name);
    static std::filesystem::path DefaultDataDir(const std::string& app_name);

    void SaveSession(const std::string& state, const Session& session) override;
    std::optional<Session> GetSession(const std::string& state) override;
    void DeleteSession(const std::string& state) override;

    void SaveToken(const std::string& key, const Token& token) override;
    std::optional<Token> GetToken(const std::string& key) override;
    void DeleteToken(const std::string& key) override;

    const std::filesystem::path& BaseDir() const { return base_dir; }

    static std::string DomainFromKey(const std::string& key);

private:
    std::filesystem::path TokensFile(const std::string& domain) const;
    std::filesystem::path SessionsFile(const std::string& domain) const;

    std::map<std::string, Token> ReadTokens(const std::filesystem::path& file) const;
    void WriteTokens(const std::filesystem::path& file, const std::map<std::string, Token>& tokens) const;
    std::map<std::string, Session> ReadSessions(const std::filesystem::path& file) const;
    void WriteSessions(const std::filesystem::path& file, const std::map<std::string, Session>& sessions) const;

    std::filesystem::path base_dir;
    RefreshLockManager file_locks;
    std::mutex mutex;
};

} // namespace tokenward
