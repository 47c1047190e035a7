#include "catch2/catch.hpp"
#include "credential_store.hpp"
#include "oauth2_error.hpp"
#include "test_helpers.hpp"

#include <atomic>
#include <cstdlib>
#include <fstream>
#include <thread>
#include <vector>

#ifndef _WIN32
#include <sys/stat.h>
#endif

using namespace tokenward;
using namespace tokenward::testing;

namespace {

// Behavior every CredentialStore implementation shares
void CheckStoreContract(CredentialStore& store) {
    SECTION("Sessions round trip and delete") {
        REQUIRE_FALSE(store.GetSession("state-1").has_value());

        Session session("state-1", "verifier-1");
        store.SaveSession("state-1", session);

        auto loaded = store.GetSession("state-1");
        REQUIRE(loaded.has_value());
        REQUIRE(loaded->state == "state-1");
        REQUIRE(loaded->code_verifier == "verifier-1");
        REQUIRE(loaded->created_at == session.created_at);

        store.DeleteSession("state-1");
        REQUIRE_FALSE(store.GetSession("state-1").has_value());
        store.DeleteSession("state-1");
    }

    SECTION("Tokens are replaced on save") {
        store.SaveToken("github.com:me", MakeToken("first", std::string("rt"), 3600, 3600));
        store.SaveToken("github.com:me", MakeToken("second", std::nullopt, std::nullopt, std::nullopt));

        auto loaded = store.GetToken("github.com:me");
        REQUIRE(loaded.has_value());
        REQUIRE(loaded->access_token == "second");
        REQUIRE_FALSE(loaded->refresh_token.has_value());
        REQUIRE_FALSE(loaded->expires_at.has_value());

        store.DeleteToken("github.com:me");
        REQUIRE_FALSE(store.GetToken("github.com:me").has_value());
    }

    SECTION("All token fields are kept") {
        auto token = MakeToken("at", std::string("rt"), 3600, 1800);
        token.token_type = "bearer";
        token.scope = "repo user";
        store.SaveToken("key", token);
        REQUIRE(store.GetToken("key") == std::optional<Token>(token));
    }
}

} // namespace

TEST_CASE("Memory credential store", "[credential_store]") {
    MemoryCredentialStore store;
    CheckStoreContract(store);
}

TEST_CASE("Memory credential store under concurrent use", "[credential_store]") {
    MemoryCredentialStore store;
    std::atomic<int> misses{0};
    std::vector<std::thread> threads;
    for (int i = 0; i < 8; i++) {
        threads.emplace_back([&store, &misses, i]() {
            auto key = "key-" + std::to_string(i);
            for (int j = 0; j < 100; j++) {
                store.SaveToken(key, MakeToken("at-" + std::to_string(j), std::nullopt, std::nullopt, std::nullopt));
                if (!store.GetToken(key).has_value()) {
                    misses++;
                }
            }
        });
    }
    for (auto& thread : threads) {
        thread.join();
    }
    REQUIRE(misses.load() == 0);
    REQUIRE(store.GetToken("key-7")->access_token == "at-99");
}

TEST_CASE("File credential store", "[credential_store]") {
    TempDir dir;
    FileCredentialStore store(dir.Path() / "store");
    REQUIRE(std::filesystem::is_directory(store.BaseDir()));
    CheckStoreContract(store);
}

TEST_CASE("File credential store groups by domain", "[credential_store]") {
    TempDir dir;
    FileCredentialStore store(dir.Path());

    REQUIRE(FileCredentialStore::DomainFromKey("github.com:octocat") == "github.com");
    REQUIRE(FileCredentialStore::DomainFromKey("no-domain") == "default");
    REQUIRE(FileCredentialStore::DomainFromKey(":leading") == "default");

    store.SaveToken("github.com:octocat", MakeToken("gh", std::nullopt, std::nullopt, std::nullopt));
    store.SaveToken("gitlab.com:octocat", MakeToken("gl", std::nullopt, std::nullopt, std::nullopt));
    store.SaveToken("plain", MakeToken("plain", std::nullopt, std::nullopt, std::nullopt));

    REQUIRE(std::filesystem::exists(dir.Path() / "tokens_github.com.json"));
    REQUIRE(std::filesystem::exists(dir.Path() / "tokens_gitlab.com.json"));
    REQUIRE(std::filesystem::exists(dir.Path() / "tokens_default.json"));

    SECTION("Sessions with a domain are found by state alone") {
        store.SaveSession("s1", Session("s1", "v1", "github.com"));
        REQUIRE(std::filesystem::exists(dir.Path() / "sessions_github.com.json"));

        auto loaded = store.GetSession("s1");
        REQUIRE(loaded.has_value());
        REQUIRE(loaded->domain == std::optional<std::string>("github.com"));

        store.DeleteSession("s1");
        REQUIRE_FALSE(store.GetSession("s1").has_value());
    }

    SECTION("A second store on the same directory sees the data") {
        FileCredentialStore other(dir.Path());
        REQUIRE(other.GetToken("gitlab.com:octocat")->access_token == "gl");
    }
}

#ifndef _WIN32
TEST_CASE("File credential store writes owner-only files", "[credential_store]") {
    TempDir dir;
    FileCredentialStore store(dir.Path());
    store.SaveToken("github.com:me", MakeToken("at", std::nullopt, std::nullopt, std::nullopt));

    struct stat file_stat;
    REQUIRE(::stat((dir.Path() / "tokens_github.com.json").c_str(), &file_stat) == 0);
    REQUIRE((file_stat.st_mode & 0777) == 0600);
}
#endif

TEST_CASE("Corrupt credential files are storage errors", "[credential_store]") {
    TempDir dir;
    {
        std::ofstream out(dir.Path() / "tokens_github.com.json");
        out << "{ not json";
    }
    FileCredentialStore store(dir.Path());

    try {
        store.GetToken("github.com:me");
        FAIL("Expected an OAuthError");
    } catch (const OAuthError& e) {
        REQUIRE(e.Kind() == OAuthErrorKind::STORAGE);
    }
}

TEST_CASE("Default data directory", "[credential_store]") {
#ifndef _WIN32
    const char* old_xdg = std::getenv("XDG_DATA_HOME");
    std::string saved = old_xdg ? old_xdg : "";

    setenv("XDG_DATA_HOME", "/var/tmp/xdg-data", 1);
    REQUIRE(FileCredentialStore::DefaultDataDir("tokenward") == std::filesystem::path("/var/tmp/xdg-data/tokenward"));

    if (old_xdg) {
        setenv("XDG_DATA_HOME", saved.c_str(), 1);
    } else {
        unsetenv("XDG_DATA_HOME");
    }
#endif
}

TEST_CASE("Concurrent writers to one file store keep every key", "[credential_store]") {
    TempDir dir;
    FileCredentialStore first(dir.Path());
    FileCredentialStore second(dir.Path());

    std::vector<std::thread> threads;
    for (int i = 0; i < 4; i++) {
        threads.emplace_back([&first, &second, i]() {
            auto& store = (i % 2 == 0) ? static_cast<CredentialStore&>(first) : static_cast<CredentialStore&>(second);
            for (int j = 0; j < 10; j++) {
                auto key = "example.com:user-" + std::to_string(i) + "-" + std::to_string(j);
                store.SaveToken(key, MakeToken("at", std::nullopt, std::nullopt, std::nullopt));
            }
        });
    }
    for (auto& thread : threads) {
        thread.join();
    }

    for (int i = 0; i < 4; i++) {
        for (int j = 0; j < 10; j++) {
            REQUIRE(first.GetToken("example.com:user-" + std::to_string(i) + "-" + std::to_string(j)).has_value());
        }
    }
}
