#include "tokenward.hpp"

#include <cstdlib>
#include <iostream>
#include <memory>
#include <string>

using namespace tokenward;

namespace {

void PrintUsage(const char* program) {
    std::cerr << "Usage: " << program << " <github|google|microsoft|tuist> <client_id> [scopes] [key]" << std::endl;
    std::cerr << "Runs the device authorization flow and stores the token in the application data directory." << std::endl;
}

OAuthConfig ConfigForProvider(const std::string& provider, const std::string& client_id,
                              const std::optional<std::string>& scopes) {
    if (provider == "github") {
        return OAuthConfig::GitHub(client_id, scopes);
    } else if (provider == "google") {
        return OAuthConfig::Google(client_id, scopes);
    } else if (provider == "microsoft") {
        return OAuthConfig::Microsoft(client_id, "common", scopes);
    } else if (provider == "tuist") {
        return OAuthConfig::Tuist(client_id, scopes);
    }
    throw OAuthError(OAuthErrorKind::CONFIGURATION, "Unknown provider: " + provider);
}

} // namespace

int main(int argc, char* argv[]) {
    if (argc < 3) {
        PrintUsage(argv[0]);
        return 2;
    }

    TokenwardTracer::Instance().ConfigureFromEnvironment();

    const std::string provider = argv[1];
    const std::string client_id = argv[2];
    std::optional<std::string> scopes;
    if (argc > 3) {
        scopes = std::string(argv[3]);
    }
    const std::string key = argc > 4 ? argv[4] : provider + ":default";

    try {
        auto config = ConfigForProvider(provider, client_id, scopes);
        auto store = std::make_shared<FileCredentialStore>(FileCredentialStore::DefaultDataDir("tokenward"));
        OAuthClient client(config, store);

        auto token = client.AuthorizeDevice();
        client.SaveToken(key, token);

        std::cout << "\nAuthorized. Token stored under key '" << key << "' in " << store->BaseDir().string() << std::endl;
        if (token.expires_at.has_value()) {
            std::cout << "Access token expires in " << (*token.expires_at - NowEpochSeconds()) << " seconds" << std::endl;
        }
        return 0;
    } catch (const OAuthError& e) {
        std::cerr << "Authorization failed (" << OAuthErrorKindToString(e.Kind()) << "): " << e.what() << std::endl;
        return 1;
    }
}
