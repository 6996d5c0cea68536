//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: tests/test_browser_launcher.cpp
// Purpose: GoogleTests for the system browser launcher using the BROWSER override
//==========================================================================================================

#include <gtest/gtest.h>

#include <cstdlib>
#include <string>

#include "monzo/auth/BrowserLauncher.hpp"

namespace {

struct ScopedBrowser {
    explicit ScopedBrowser(const char* value) { ::setenv("BROWSER", value, 1); }
    ~ScopedBrowser() { ::unsetenv("BROWSER"); }
};

} // namespace

#ifndef _WIN32
TEST(BrowserLauncher, HonoursBrowserVariable) {
    ScopedBrowser env("my-browser");
    EXPECT_EQ(monzo::auth::SystemBrowserLauncher::OpenerCommand(), "my-browser");
}

TEST(BrowserLauncher, StartsOpener) {
    // `true` ignores its argument and exits 0
    ScopedBrowser env("true");
    monzo::auth::SystemBrowserLauncher launcher;
    EXPECT_TRUE(launcher.Open("https://auth.monzo.com/?state=x"));
}

TEST(BrowserLauncher, MissingOpenerReportsFailure) {
    ScopedBrowser env("monzo-cpp-no-such-browser-binary");
    monzo::auth::SystemBrowserLauncher launcher;
    EXPECT_FALSE(launcher.Open("https://auth.monzo.com/"));
}
#endif
