//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: include/monzo/auth/BrowserLauncher.hpp
// Purpose: Opens the authorization URL in the user's browser
//==========================================================================================================
#pragma once

#include <string>

namespace monzo::auth {

class IBrowserLauncher {
public:
    virtual ~IBrowserLauncher() = default;

    // Fire-and-forget. Returns false when no opener could be started.
    virtual bool Open(const std::string& url) = 0;
};

//==========================================================================================================
// SystemBrowserLauncher
// Purpose: Starts the platform URL opener detached from the caller: $BROWSER when set, otherwise
//          xdg-open (Linux), open (macOS) or ShellExecute (Windows).
//==========================================================================================================
class SystemBrowserLauncher : public IBrowserLauncher {
public:
    bool Open(const std::string& url) override;

    // Command that would be used on this platform, honoring $BROWSER.
    static std::string OpenerCommand();
};

} // namespace monzo::auth
