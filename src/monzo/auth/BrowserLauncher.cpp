//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: src/monzo/auth/BrowserLauncher.cpp
// Purpose: Platform browser launch (double fork + exec on POSIX, ShellExecute on Windows)
//==========================================================================================================

#include "monzo/auth/BrowserLauncher.hpp"
#include "env/EnvVars.h"
#include "logging/Logger.h"

#ifdef _WIN32
#include <windows.h>
#include <shellapi.h>
#else
#include <cerrno>
#include <cstring>
#include <fcntl.h>
#include <sys/wait.h>
#include <unistd.h>
#endif

namespace monzo::auth {

std::string SystemBrowserLauncher::OpenerCommand() {
    std::string fromEnv = GetEnvOrDefault("BROWSER", "");
    if (!fromEnv.empty()) {
        return fromEnv;
    }
#ifdef _WIN32
    return "default";
#elif defined(__APPLE__)
    return "open";
#else
    return "xdg-open";
#endif
}

bool SystemBrowserLauncher::Open(const std::string& url) {
#ifdef _WIN32
    HINSTANCE result = ShellExecuteA(NULL, "open", url.c_str(), NULL, NULL, SW_SHOWNORMAL);
    if (reinterpret_cast<INT_PTR>(result) <= 32) {
        LOG_WARN("ShellExecute failed to open browser");
        return false;
    }
    return true;
#else
    const std::string command = OpenerCommand();
    // CLOEXEC pipe: EOF means exec succeeded, an int payload is the exec errno
    int fds[2];
    if (::pipe(fds) != 0) {
        LOG_WARN("Failed to create pipe for browser opener: {}", std::strerror(errno));
        return false;
    }
    ::fcntl(fds[0], F_SETFD, FD_CLOEXEC);
    ::fcntl(fds[1], F_SETFD, FD_CLOEXEC);
    pid_t pid = ::fork();
    if (pid < 0) {
        LOG_WARN("Failed to fork browser opener: {}", std::strerror(errno));
        ::close(fds[0]);
        ::close(fds[1]);
        return false;
    }
    if (pid == 0) {
        // Intermediate child: detach the opener so it is reparented and never left as a zombie
        ::close(fds[0]);
        pid_t grandchild = ::fork();
        if (grandchild != 0) {
            ::_exit(grandchild < 0 ? 1 : 0);
        }
        int devnull = ::open("/dev/null", O_RDWR);
        if (devnull >= 0) {
            ::dup2(devnull, STDIN_FILENO);
            ::dup2(devnull, STDOUT_FILENO);
            ::dup2(devnull, STDERR_FILENO);
            if (devnull > STDERR_FILENO) ::close(devnull);
        }
        ::execlp(command.c_str(), command.c_str(), url.c_str(), static_cast<char*>(nullptr));
        int err = errno;
        ssize_t ignored = ::write(fds[1], &err, sizeof(err));
        (void)ignored;
        ::_exit(127);
    }
    ::close(fds[1]);
    int status = 0;
    while (::waitpid(pid, &status, 0) < 0 && errno == EINTR) {
    }
    int execErr = 0;
    ssize_t n = 0;
    do {
        n = ::read(fds[0], &execErr, sizeof(execErr));
    } while (n < 0 && errno == EINTR);
    ::close(fds[0]);

    if (!WIFEXITED(status) || WEXITSTATUS(status) != 0) {
        LOG_WARN("Browser opener '{}' could not be started", command);
        return false;
    }
    if (n == static_cast<ssize_t>(sizeof(execErr))) {
        LOG_WARN("Browser opener '{}' failed to start: {}", command, std::strerror(execErr));
        return false;
    }
    LOG_DEBUG("Started browser opener '{}'", command);
    return true;
#endif
}

} // namespace monzo::auth
