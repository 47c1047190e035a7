#include "tokenward.hpp"

#include <iostream>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

using namespace tokenward;

// Fetches a valid token for a key stored by device_login, refreshing it when
// more than the given share of its lifetime has elapsed. Several copies of this
// program may run at once; only one of them calls the token endpoint.
int main(int argc, char* argv[]) {
    if (argc < 4) {
        std::cerr << "Usage: " << argv[0] << " <token_endpoint> <client_id> <key> [threshold] [threads]" << std::endl;
        return 2;
    }

    TokenwardTracer::Instance().ConfigureFromEnvironment();

    OAuthConfig config;
    config.token_endpoint = argv[1];
    config.client_id = argv[2];
    const std::string key = argv[3];
    const double threshold = argc > 4 ? std::stod(argv[4]) : 0.8;
    const int thread_count = argc > 5 ? std::stoi(argv[5]) : 4;

    try {
        auto store = std::make_shared<FileCredentialStore>(FileCredentialStore::DefaultDataDir("tokenward"));
        auto client = std::make_shared<OAuthClient>(config, store);
        auto refresher = TokenRefresher::WithFileLocking(client, "tokenward");

        std::vector<std::thread> threads;
        std::mutex output_mutex;
        for (int i = 0; i < thread_count; i++) {
            threads.emplace_back([&, i]() {
                std::string line;
                try {
                    auto token = refresher->GetValidTokenWithThreshold(key, threshold);
                    line = "thread " + std::to_string(i) + ": " + TruncateSecret(token.access_token);
                } catch (const OAuthError& e) {
                    line = "thread " + std::to_string(i) + " failed: " + e.what();
                }
                std::lock_guard<std::mutex> lock(output_mutex);
                std::cout << line << std::endl;
            });
        }
        for (auto& thread : threads) {
            thread.join();
        }
        return 0;
    } catch (const OAuthError& e) {
        std::cerr << "Token refresh failed (" << OAuthErrorKindToString(e.Kind()) << "): " << e.what() << std::endl;
        return 1;
    }
}
