#pragma once

#include <string>

namespace tokenward {

class BrowserLauncher {
public:
    // Hands the URL to the platform's default browser without waiting for it.
    // Returns false when no launcher could be started.
    static bool OpenUrl(const std::string& url);

private:
    static bool OpenUrlWindows(const std::string& url);
    static bool OpenUrlWithCommand(const char* command, const std::string& url);
};

} // namespace tokenward
