//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: main.cpp
// Purpose: Browser login example; prints the whoami identity on success
//==========================================================================================================

#include <csignal>
#include <iostream>
#include <optional>
#include <string>
#include <thread>
#include <utility>

#include <boost/asio.hpp>

#include "logging/Logger.h"
#include "monzo/Client.h"
#include "monzo/errors/Errors.h"

using namespace monzo;

//==========================================================================================================
// getArgValue
// Purpose: Parses key=value style CLI options.
// Args:
//   argc: Argument count
//   argv: Argument vector
//   key: Key string including leading dashes (e.g., "--config")
// Returns:
//   Optional string containing the value when present
//==========================================================================================================
static std::optional<std::string> getArgValue(int argc, char** argv, const std::string& key) {
    for (size_t i = 1; i < static_cast<size_t>(argc); ++i) {
        std::string a = argv[i];
        auto eq = a.find('=');
        if (eq != std::string::npos && a.substr(0, eq) == key) {
            return a.substr(eq + 1);
        }
    }
    return std::nullopt;
}

int main(int argc, char** argv) {
    FUNC_SCOPE();

    ClientOptions opts;
    try {
        if (auto cfg = getArgValue(argc, argv, "--options")) {
            opts = parseClientOptions(*cfg);
        }
        if (auto file = getArgValue(argc, argv, "--credentials")) {
            opts = clientOptionsFromFile(*file, opts);
        }
        opts = clientOptionsFromEnv(opts);
    } catch (const errors::MonzoError& e) {
        LOG_ERROR("Configuration error: {}", e.what());
        return 2;
    }
    if (opts.clientId.empty() || opts.clientSecret.empty()) {
        std::cerr << "usage: monzo_login [--credentials=file.json] [--options=\"key=value; ...\"]\n"
                  << "       (or set MONZO_CLIENT_ID and MONZO_CLIENT_SECRET)\n";
        return 2;
    }

    Client client(opts);

    // Ctrl-C cancels the pending login
    boost::asio::io_context signalIo;
    boost::asio::signal_set signals(signalIo, SIGINT, SIGTERM);
    signals.async_wait([&client](const boost::system::error_code& ec, int) {
        if (!ec) {
            LOG_INFO("Signal received; cancelling login");
            client.CancelAuthentication();
        }
    });
    std::thread signalThread([&signalIo]() { signalIo.run(); });

    int rc = 0;
    try {
        LOG_INFO("Opening browser; redirect URI must be registered as {}", client.RedirectUri());
        client.Authenticate();
        WhoAmI who = client.GetWhoAmI();
        std::cout << "user_id=" << who.userId << " client_id=" << who.clientId
                  << " authenticated=" << (who.authenticated ? "true" : "false") << std::endl;
    } catch (const errors::MonzoError& e) {
        LOG_ERROR("Login failed ({}): {}", errors::errorKindName(e.kind()), e.what());
        rc = 1;
    }

    signals.cancel();
    signalIo.stop();
    signalThread.join();
    return rc;
}
