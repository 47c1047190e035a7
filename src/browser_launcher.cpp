#include "browser_launcher.hpp"
#include "tokenward_tracing.hpp"

#include <cstdlib>

#ifdef _WIN32
#include <windows.h>
#include <shellapi.h>
#else
#include <sys/wait.h>
#include <unistd.h>
#endif

namespace tokenward {

bool BrowserLauncher::OpenUrl(const std::string& url) {
    TOKENWARD_TRACE_DEBUG("BROWSER", "Opening browser for: " + url);
#ifdef _WIN32
    return OpenUrlWindows(url);
#elif defined(__APPLE__)
    return OpenUrlWithCommand("open", url);
#else
    return OpenUrlWithCommand("xdg-open", url);
#endif
}

bool BrowserLauncher::OpenUrlWindows(const std::string& url) {
#ifdef _WIN32
    HINSTANCE result = ShellExecuteA(NULL, "open", url.c_str(), NULL, NULL, SW_SHOWNORMAL);
    return result > (HINSTANCE)32;
#else
    (void)url;
    return false;
#endif
}

bool BrowserLauncher::OpenUrlWithCommand(const char* command, const std::string& url) {
#ifndef _WIN32
    // Double fork so the launcher is reparented and never left as a zombie
    pid_t pid = fork();
    if (pid == 0) {
        pid_t grandchild = fork();
        if (grandchild == 0) {
            execlp(command, command, url.c_str(), static_cast<char*>(nullptr));
            _exit(127);
        }
        _exit(grandchild > 0 ? 0 : 1);
    } else if (pid > 0) {
        int status = 0;
        if (waitpid(pid, &status, 0) < 0) {
            return false;
        }
        return WIFEXITED(status) && WEXITSTATUS(status) == 0;
    }
    TOKENWARD_TRACE_WARN("BROWSER", std::string("Failed to fork process for ") + command);
    return false;
#else
    (void)command;
    (void)url;
    return false;
#endif
}

} // namespace tokenward
