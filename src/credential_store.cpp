#include "credential_store.hpp"
#include "oauth2_error.hpp"
#include "pkce.hpp"
#include "tokenward_tracing.hpp"

#include <yyjson.h>

#include <cstdlib>
#include <fstream>
#include <memory>
#include <sstream>

namespace tokenward {

// ===== MemoryCredentialStore =====

void MemoryCredentialStore::SaveSession(const std::string& state, const Session& session) {
    std::unique_lock<std::shared_mutex> lock(mutex);
    sessions[state] = session;
}

std::optional<Session> MemoryCredentialStore::GetSession(const std::string& state) {
    std::shared_lock<std::shared_mutex> lock(mutex);
    auto it = sessions.find(state);
    if (it == sessions.end()) {
        return std::nullopt;
    }
    return it->second;
}

void MemoryCredentialStore::DeleteSession(const std::string& state) {
    std::unique_lock<std::shared_mutex> lock(mutex);
    sessions.erase(state);
}

void MemoryCredentialStore::SaveToken(const std::string& key, const Token& token) {
    std::unique_lock<std::shared_mutex> lock(mutex);
    tokens[key] = token;
}

std::optional<Token> MemoryCredentialStore::GetToken(const std::string& key) {
    std::shared_lock<std::shared_mutex> lock(mutex);
    auto it = tokens.find(key);
    if (it == tokens.end()) {
        return std::nullopt;
    }
    return it->second;
}

void MemoryCredentialStore::DeleteToken(const std::string& key) {
    std::unique_lock<std::shared_mutex> lock(mutex);
    tokens.erase(key);
}

// ===== FileCredentialStore =====

namespace {

const char* DEFAULT_DOMAIN = "default";
const char* SESSIONS_PREFIX = "sessions_";
const char* JSON_SUFFIX = ".json";

using JsonDoc = std::shared_ptr<yyjson_doc>;
using MutJsonDoc = std::shared_ptr<yyjson_mut_doc>;

std::string SanitizeDomain(const std::string& domain) {
    std::string sanitized = domain;
    for (auto& c : sanitized) {
        if (c == '/' || c == '\\' || c == ':') {
            c = '_';
        }
    }
    return sanitized;
}

OAuthError StoreError(const std::string& message, const std::filesystem::path& file) {
    ErrorContext ctx;
    ctx.Set("file", file.string());
    return ctx.Error(OAuthErrorKind::STORAGE, message);
}

// Missing files read as an empty document
JsonDoc ReadJsonFile(const std::filesystem::path& file) {
    std::ifstream in(file, std::ios::binary);
    if (!in.is_open()) {
        return nullptr;
    }
    std::stringstream buffer;
    buffer << in.rdbuf();
    auto content = buffer.str();
    if (content.empty()) {
        return nullptr;
    }

    auto doc = JsonDoc(yyjson_read(content.c_str(), content.size(), 0), yyjson_doc_free);
    if (!doc || !yyjson_is_obj(yyjson_doc_get_root(doc.get()))) {
        throw StoreError("Credential file is not a JSON object", file);
    }
    return doc;
}

void WriteJsonFileAtomically(const std::filesystem::path& file, yyjson_mut_doc* doc) {
    size_t length = 0;
    char* json = yyjson_mut_write(doc, YYJSON_WRITE_PRETTY, &length);
    if (!json) {
        throw StoreError("Failed to serialize credentials", file);
    }
    std::unique_ptr<char, decltype(&std::free)> json_holder(json, &std::free);

    auto tmp = file;
    tmp += ".tmp." + GenerateState().substr(0, 8);
    {
        std::ofstream out(tmp, std::ios::binary | std::ios::trunc);
        if (!out.is_open()) {
            throw StoreError("Failed to open temporary credential file", tmp);
        }
        out.write(json, static_cast<std::streamsize>(length));
        out.flush();
        if (!out) {
            out.close();
            std::error_code ignored;
            std::filesystem::remove(tmp, ignored);
            throw StoreError("Failed to write temporary credential file", tmp);
        }
    }

    std::error_code ec;
    std::filesystem::permissions(tmp, std::filesystem::perms::owner_read | std::filesystem::perms::owner_write,
                                 std::filesystem::perm_options::replace, ec);
    std::filesystem::rename(tmp, file, ec);
    if (ec) {
        std::error_code ignored;
        std::filesystem::remove(tmp, ignored);
        throw StoreError("Failed to replace credential file: " + ec.message(), file);
    }
}

std::optional<std::string> OptString(yyjson_val* obj, const char* name) {
    auto val = yyjson_obj_get(obj, name);
    if (val && yyjson_is_str(val)) {
        return std::string(yyjson_get_str(val));
    }
    return std::nullopt;
}

std::optional<int64_t> OptInt(yyjson_val* obj, const char* name) {
    auto val = yyjson_obj_get(obj, name);
    if (val && yyjson_is_int(val)) {
        return static_cast<int64_t>(yyjson_get_sint(val));
    }
    return std::nullopt;
}

void AddOptString(yyjson_mut_doc* doc, yyjson_mut_val* obj, const char* name, const std::optional<std::string>& value) {
    if (value.has_value()) {
        yyjson_mut_obj_add_strncpy(doc, obj, name, value->c_str(), value->size());
    } else {
        yyjson_mut_obj_add_null(doc, obj, name);
    }
}

void AddOptInt(yyjson_mut_doc* doc, yyjson_mut_val* obj, const char* name, const std::optional<int64_t>& value) {
    if (value.has_value()) {
        yyjson_mut_obj_add_int(doc, obj, name, *value);
    } else {
        yyjson_mut_obj_add_null(doc, obj, name);
    }
}

Token TokenFromJson(yyjson_val* obj, const std::filesystem::path& file) {
    auto access_token = OptString(obj, "access_token");
    if (!yyjson_is_obj(obj) || !access_token.has_value()) {
        throw StoreError("Stored token lacks access_token", file);
    }
    Token token;
    token.access_token = *access_token;
    token.refresh_token = OptString(obj, "refresh_token");
    token.token_type = OptString(obj, "token_type").value_or("Bearer");
    token.expires_in = OptInt(obj, "expires_in");
    token.expires_at = OptInt(obj, "expires_at");
    token.scope = OptString(obj, "scope");
    return token;
}

yyjson_mut_val* TokenToJson(yyjson_mut_doc* doc, const Token& token) {
    auto obj = yyjson_mut_obj(doc);
    yyjson_mut_obj_add_strncpy(doc, obj, "access_token", token.access_token.c_str(), token.access_token.size());
    AddOptString(doc, obj, "refresh_token", token.refresh_token);
    yyjson_mut_obj_add_strncpy(doc, obj, "token_type", token.token_type.c_str(), token.token_type.size());
    AddOptInt(doc, obj, "expires_in", token.expires_in);
    AddOptInt(doc, obj, "expires_at", token.expires_at);
    AddOptString(doc, obj, "scope", token.scope);
    return obj;
}

Session SessionFromJson(yyjson_val* obj, const std::filesystem::path& file) {
    auto state = OptString(obj, "state");
    auto code_verifier = OptString(obj, "code_verifier");
    if (!yyjson_is_obj(obj) || !state.has_value() || !code_verifier.has_value()) {
        throw StoreError("Stored session lacks state or code_verifier", file);
    }
    Session session;
    session.state = *state;
    session.code_verifier = *code_verifier;
    session.created_at = OptInt(obj, "created_at").value_or(0);
    session.domain = OptString(obj, "domain");
    return session;
}

yyjson_mut_val* SessionToJson(yyjson_mut_doc* doc, const Session& session) {
    auto obj = yyjson_mut_obj(doc);
    yyjson_mut_obj_add_strncpy(doc, obj, "state", session.state.c_str(), session.state.size());
    yyjson_mut_obj_add_strncpy(doc, obj, "code_verifier", session.code_verifier.c_str(), session.code_verifier.size());
    yyjson_mut_obj_add_int(doc, obj, "created_at", session.created_at);
    AddOptString(doc, obj, "domain", session.domain);
    return obj;
}

template <typename T, typename FromJson>
std::map<std::string, T> ReadEntries(const std::filesystem::path& file, FromJson from_json) {
    std::map<std::string, T> entries;
    auto doc = ReadJsonFile(file);
    if (!doc) {
        return entries;
    }

    auto root = yyjson_doc_get_root(doc.get());
    size_t idx, max;
    yyjson_val *key, *val;
    yyjson_obj_foreach(root, idx, max, key, val) {
        entries.emplace(yyjson_get_str(key), from_json(val, file));
    }
    return entries;
}

template <typename T, typename ToJson>
void WriteEntries(const std::filesystem::path& file, const std::map<std::string, T>& entries, ToJson to_json) {
    auto doc = MutJsonDoc(yyjson_mut_doc_new(nullptr), yyjson_mut_doc_free);
    if (!doc) {
        throw StoreError("Failed to allocate JSON document", file);
    }
    auto root = yyjson_mut_obj(doc.get());
    yyjson_mut_doc_set_root(doc.get(), root);

    for (const auto& entry : entries) {
        auto key = yyjson_mut_strncpy(doc.get(), entry.first.c_str(), entry.first.size());
        yyjson_mut_obj_add(root, key, to_json(doc.get(), entry.second));
    }
    WriteJsonFileAtomically(file, doc.get());
}

} // namespace

FileCredentialStore::FileCredentialStore(std::filesystem::path base_dir)
    : base_dir(base_dir), file_locks(base_dir) {
    std::error_code ec;
    std::filesystem::create_directories(this->base_dir, ec);
    if (ec && !std::filesystem::is_directory(this->base_dir)) {
        throw StoreError("Failed to create credential directory: " + ec.message(), this->base_dir);
    }
}

FileCredentialStore FileCredentialStore::ForApp(const std::string& app_name) {
    return FileCredentialStore(DefaultDataDir(app_name));
}

std::filesystem::path FileCredentialStore::DefaultDataDir(const std::string& app_name) {
    const char* data_home = std::getenv("XDG_DATA_HOME");
    if (data_home && *data_home) {
        return std::filesystem::path(data_home) / app_name;
    }
    const char* home = std::getenv("HOME");
    if (!home || !*home) {
        throw OAuthError(OAuthErrorKind::CONFIGURATION, "Neither XDG_DATA_HOME nor HOME is set");
    }
    return std::filesystem::path(home) / ".local" / "share" / app_name;
}

std::string FileCredentialStore::DomainFromKey(const std::string& key) {
    auto colon = key.find(':');
    if (colon == std::string::npos || colon == 0) {
        return DEFAULT_DOMAIN;
    }
    return key.substr(0, colon);
}

std::filesystem::path FileCredentialStore::TokensFile(const std::string& domain) const {
    return base_dir / ("tokens_" + SanitizeDomain(domain) + JSON_SUFFIX);
}

std::filesystem::path FileCredentialStore::SessionsFile(const std::string& domain) const {
    return base_dir / (SESSIONS_PREFIX + SanitizeDomain(domain) + JSON_SUFFIX);
}

std::map<std::string, Token> FileCredentialStore::ReadTokens(const std::filesystem::path& file) const {
    return ReadEntries<Token>(file, TokenFromJson);
}

void FileCredentialStore::WriteTokens(const std::filesystem::path& file, const std::map<std::string, Token>& tokens) const {
    WriteEntries(file, tokens, TokenToJson);
}

std::map<std::string, Session> FileCredentialStore::ReadSessions(const std::filesystem::path& file) const {
    return ReadEntries<Session>(file, SessionFromJson);
}

void FileCredentialStore::WriteSessions(const std::filesystem::path& file, const std::map<std::string, Session>& sessions) const {
    WriteEntries(file, sessions, SessionToJson);
}

void FileCredentialStore::SaveSession(const std::string& state, const Session& session) {
    auto file = SessionsFile(session.domain.value_or(DEFAULT_DOMAIN));

    std::lock_guard<std::mutex> guard(mutex);
    auto lock = file_locks.AcquireLock(file.filename().string());
    auto sessions = ReadSessions(file);
    sessions[state] = session;
    WriteSessions(file, sessions);
}

std::optional<Session> FileCredentialStore::GetSession(const std::string& state) {
    auto default_file = SessionsFile(DEFAULT_DOMAIN);
    auto sessions = ReadSessions(default_file);
    auto it = sessions.find(state);
    if (it != sessions.end()) {
        return it->second;
    }

    std::error_code ec;
    for (const auto& entry : std::filesystem::directory_iterator(base_dir, ec)) {
        auto name = entry.path().filename().string();
        if (entry.path() == default_file || name.rfind(SESSIONS_PREFIX, 0) != 0 ||
            entry.path().extension() != JSON_SUFFIX) {
            continue;
        }
        auto domain_sessions = ReadSessions(entry.path());
        auto found = domain_sessions.find(state);
        if (found != domain_sessions.end()) {
            return found->second;
        }
    }
    if (ec) {
        throw StoreError("Failed to list credential directory: " + ec.message(), base_dir);
    }
    return std::nullopt;
}

void FileCredentialStore::DeleteSession(const std::string& state) {
    auto session = GetSession(state);
    if (!session.has_value()) {
        return;
    }
    auto file = SessionsFile(session->domain.value_or(DEFAULT_DOMAIN));

    std::lock_guard<std::mutex> guard(mutex);
    auto lock = file_locks.AcquireLock(file.filename().string());
    auto sessions = ReadSessions(file);
    if (sessions.erase(state) > 0) {
        WriteSessions(file, sessions);
    }
}

void FileCredentialStore::SaveToken(const std::string& key, const Token& token) {
    auto file = TokensFile(DomainFromKey(key));

    std::lock_guard<std::mutex> guard(mutex);
    auto lock = file_locks.AcquireLock(file.filename().string());
    auto tokens = ReadTokens(file);
    tokens[key] = token;
    WriteTokens(file, tokens);
    TOKENWARD_TRACE_DEBUG("CREDENTIAL_STORE", "Saved token for key: " + key);
}

std::optional<Token> FileCredentialStore::GetToken(const std::string& key) {
    auto tokens = ReadTokens(TokensFile(DomainFromKey(key)));
    auto it = tokens.find(key);
    if (it == tokens.end()) {
        return std::nullopt;
    }
    return it->second;
}

void FileCredentialStore::DeleteToken(const std::string& key) {
    auto file = TokensFile(DomainFromKey(key));

    std::lock_guard<std::mutex> guard(mutex);
    auto lock = file_locks.AcquireLock(file.filename().string());
    auto tokens = ReadTokens(file);
    if (tokens.erase(key) > 0) {
        WriteTokens(file, tokens);
        TOKENWARD_TRACE_DEBUG("CREDENTIAL_STORE", "Deleted token for key: " + key);
    }
}

} // namespace tokenward
